#pragma once
/**
 * @file report_writer.hpp
 * @brief Render a DiagnosticReport for humans (aligned text) or tools (YAML).
 */

#include <ostream>
#include <string>
#include <string_view>

#include "converge/compat/expected.hpp"
#include "converge/report/diagnostic_report.hpp"

namespace converge::report {

enum class ReportFormat : std::uint8_t { Text, Yaml };

/// "text" / "yaml" → format; error text otherwise.
converge_detail::expected<ReportFormat, std::string> parse_format(std::string_view name);

void write_text(const DiagnosticReport& report, std::ostream& out);
void write_yaml(const DiagnosticReport& report, std::ostream& out);

/// Dispatch on format.
void write(const DiagnosticReport& report, ReportFormat format, std::ostream& out);

} // namespace converge::report
