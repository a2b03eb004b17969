/**
 * @file report_writer.cpp
 * @brief Text rendering via fmt, YAML rendering via yaml-cpp's emitter.
 */
#include "converge/report/report_writer.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <yaml-cpp/yaml.h>

namespace converge::report {

namespace {

std::string health_line(const health::HealthCheckResult& h) {
    std::string line = fmt::format("{:<16} {:<6} {:<10} attempts={:<3} {}ms",
                                   h.target, model::to_string(h.scope), health::to_string(h.status),
                                   h.attempts, h.elapsed.count());
    if (h.empty_response) line += "  (empty response)";
    if (h.failure != health::HealthFailure::None) {
        line += fmt::format("  {}: {}", health::to_string(h.failure), h.last_error);
    }
    return line;
}

void emit_health(YAML::Emitter& y, const char* key, const std::vector<health::HealthCheckResult>& rs) {
    y << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& h : rs) {
        y << YAML::BeginMap;
        y << YAML::Key << "target"         << YAML::Value << h.target;
        y << YAML::Key << "scope"          << YAML::Value << std::string(model::to_string(h.scope));
        y << YAML::Key << "probe"          << YAML::Value << std::string(model::to_string(h.kind));
        y << YAML::Key << "status"         << YAML::Value << std::string(health::to_string(h.status));
        y << YAML::Key << "failure"        << YAML::Value << std::string(health::to_string(h.failure));
        y << YAML::Key << "attempts"       << YAML::Value << h.attempts;
        y << YAML::Key << "empty_response" << YAML::Value << h.empty_response;
        y << YAML::Key << "last_status"    << YAML::Value << h.last_status;
        y << YAML::Key << "last_error"     << YAML::Value << h.last_error;
        y << YAML::Key << "elapsed_ms"     << YAML::Value << static_cast<long long>(h.elapsed.count());
        y << YAML::EndMap;
    }
    y << YAML::EndSeq;
}

void emit_inventory(YAML::Emitter& y, const char* key, const runtime::Inventory& inv) {
    y << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& rec : inv) {
        y << YAML::Flow << YAML::BeginMap;
        y << YAML::Key << "kind"    << YAML::Value << std::string(runtime::to_string(rec.kind));
        y << YAML::Key << "name"    << YAML::Value << rec.name;
        y << YAML::Key << "state"   << YAML::Value << std::string(runtime::to_string(rec.state));
        if (!rec.service.empty()) y << YAML::Key << "service" << YAML::Value << rec.service;
        if (!rec.reason.empty())  y << YAML::Key << "reason"  << YAML::Value << rec.reason;
        y << YAML::EndMap;
    }
    y << YAML::EndSeq;
}

} // namespace

converge_detail::expected<ReportFormat, std::string> parse_format(std::string_view name) {
    if (name == "text") return ReportFormat::Text;
    if (name == "yaml") return ReportFormat::Yaml;
    return converge_detail::unexpected("unknown report format \"" + std::string(name) + "\" (text|yaml)");
}

void write_text(const DiagnosticReport& r, std::ostream& out) {
    fmt::print(out, "converge run {} project={}{}\n", r.run_id, r.project, r.dry_run ? " (dry run)" : "");
    for (const auto& s : r.stages) {
        fmt::print(out, "  {:<10} {:<8} {:>6}ms  {}\n", s.name, to_string(s.status), s.elapsed.count(), s.summary);
    }

    if (r.inventory_after) {
        fmt::print(out, "after execution: {}\n", summarize(*r.inventory_after));
        for (const auto& rec : *r.inventory_after) {
            if (rec.state == runtime::LifecycleState::Running) continue;
            fmt::print(out, "  {:<9} {} {}{}\n", runtime::to_string(rec.state), runtime::to_string(rec.kind),
                       rec.name, rec.reason.empty() ? std::string{} : "  (" + rec.reason + ")");
        }
    }
    if (!r.plan.empty()) {
        fmt::print(out, "plan:\n");
        for (const auto& a : r.plan) {
            fmt::print(out, "  [{:>2}] {}\n", a.rank, a.label());
        }
    }
    if (!r.actions.empty()) {
        fmt::print(out, "actions:\n");
        for (const auto& a : r.actions) {
            fmt::print(out, "  {:<9} {}{}\n", plan::to_string(a.outcome), a.action.label(),
                       a.error.empty() ? std::string{} : "  (" + a.error + ")");
        }
    }
    if (!r.gates.empty()) {
        fmt::print(out, "readiness:\n");
        for (const auto& h : r.gates) fmt::print(out, "  {}\n", health_line(h));
    }
    if (!r.health.empty()) {
        fmt::print(out, "health:\n");
        for (const auto& h : r.health) fmt::print(out, "  {}\n", health_line(h));
    }
    for (const auto& e : r.errors) fmt::print(out, "error: {}\n", e);
    fmt::print(out, "verdict: {}\n", to_string(r.verdict));
}

void write_yaml(const DiagnosticReport& r, std::ostream& out) {
    YAML::Emitter y;
    y << YAML::BeginMap;
    y << YAML::Key << "run_id"  << YAML::Value << r.run_id;
    y << YAML::Key << "project" << YAML::Value << r.project;
    y << YAML::Key << "dry_run" << YAML::Value << r.dry_run;
    y << YAML::Key << "verdict" << YAML::Value << std::string(to_string(r.verdict));

    y << YAML::Key << "stages" << YAML::Value << YAML::BeginSeq;
    for (const auto& s : r.stages) {
        y << YAML::BeginMap;
        y << YAML::Key << "name"       << YAML::Value << s.name;
        y << YAML::Key << "status"     << YAML::Value << std::string(to_string(s.status));
        y << YAML::Key << "summary"    << YAML::Value << s.summary;
        y << YAML::Key << "elapsed_ms" << YAML::Value << static_cast<long long>(s.elapsed.count());
        y << YAML::EndMap;
    }
    y << YAML::EndSeq;

    y << YAML::Key << "errors" << YAML::Value << YAML::BeginSeq;
    for (const auto& e : r.errors) y << e;
    y << YAML::EndSeq;

    // "inventory" is the state the plan was made from
    emit_inventory(y, "inventory", r.inventory);
    if (r.inventory_after) emit_inventory(y, "inventory_after", *r.inventory_after);

    y << YAML::Key << "actions" << YAML::Value << YAML::BeginSeq;
    if (r.actions.empty()) {
        // dry run or nothing executed: list the plan instead
        for (const auto& a : r.plan) {
            y << YAML::Flow << YAML::BeginMap;
            y << YAML::Key << "rank"    << YAML::Value << a.rank;
            y << YAML::Key << "action"  << YAML::Value << a.label();
            y << YAML::Key << "outcome" << YAML::Value << "planned";
            y << YAML::EndMap;
        }
    }
    for (const auto& a : r.actions) {
        y << YAML::Flow << YAML::BeginMap;
        y << YAML::Key << "rank"        << YAML::Value << a.action.rank;
        y << YAML::Key << "action"      << YAML::Value << a.action.label();
        y << YAML::Key << "outcome"     << YAML::Value << std::string(plan::to_string(a.outcome));
        if (!a.error.empty()) y << YAML::Key << "error" << YAML::Value << a.error;
        y << YAML::Key << "duration_ms" << YAML::Value << static_cast<long long>(a.duration.count());
        y << YAML::EndMap;
    }
    y << YAML::EndSeq;

    emit_health(y, "readiness", r.gates);
    emit_health(y, "health", r.health);
    y << YAML::EndMap;

    out << y.c_str() << "\n";
}

void write(const DiagnosticReport& report, ReportFormat format, std::ostream& out) {
    if (format == ReportFormat::Yaml) write_yaml(report, out);
    else write_text(report, out);
}

} // namespace converge::report
