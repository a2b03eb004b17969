/**
 * @file probe.cpp
 * @brief Outcome judgement, URL handling and NetworkProber dispatch.
 */

#include "converge/health/probe.hpp"
#include "converge/config/constants.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace converge::health {
using namespace converge::config::constants;

namespace {

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool valid_port(std::string_view p) noexcept {
  unsigned v = 0;
  const auto [ptr, ec] = std::from_chars(p.data(), p.data() + p.size(), v);
  return ec == std::errc{} && ptr == p.data() + p.size() && v >= 1 && v <= 65535;
}

} // namespace

Judgement judge(const model::HealthCheckDescriptor& check, const ProbeOutcome& outcome) {
  if (outcome.cancelled) return {false, false, "cancelled"};
  if (!outcome.connected) {
    return {false, false, outcome.error.empty() ? std::string("unreachable") : outcome.error};
  }
  if (check.kind == model::ProbeKind::Tcp) return {true, false, {}};

  if (outcome.status < check.status_min || outcome.status > check.status_max) {
    return {false, false,
            "HTTP " + std::to_string(outcome.status) + " outside accepted range " +
                std::to_string(check.status_min) + "-" + std::to_string(check.status_max)};
  }
  if (!check.expect_body.empty() && outcome.body.find(check.expect_body) == std::string::npos) {
    return {false, false,
            (outcome.body.empty() ? "empty response, expected \"" : "response does not contain \"") +
                check.expect_body + "\""};
  }
  // Reachable and accepted. An empty body is still healthy but reported as such.
  return {true, outcome.body.empty(), {}};
}

converge_detail::expected<HttpTarget, std::string> parse_url(std::string_view url) {
  HttpTarget t;
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) {
    return converge_detail::unexpected("missing scheme in \"" + std::string(url) + "\"");
  }
  const auto scheme = lower(url.substr(0, scheme_end));
  if (scheme == "http") {
    t.tls = false;
  } else if (scheme == "https") {
    t.tls = true;
  } else {
    return converge_detail::unexpected("unsupported scheme \"" + scheme + "\"");
  }

  std::string_view rest = url.substr(scheme_end + 3);
  const auto auth_end = rest.find_first_of("/?#");
  std::string_view authority = rest.substr(0, auth_end);
  std::string_view tail = auth_end == std::string_view::npos ? std::string_view{} : rest.substr(auth_end);

  if (const auto at = authority.rfind('@'); at != std::string_view::npos) authority.remove_prefix(at + 1);

  std::string_view port;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return converge_detail::unexpected("unterminated IPv6 literal in \"" + std::string(url) + "\"");
    }
    t.host = std::string(authority.substr(1, close - 1));
    const auto after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') return converge_detail::unexpected("malformed authority in \"" + std::string(url) + "\"");
      port = after.substr(1);
    }
  } else {
    const auto colon = authority.rfind(':');
    t.host = std::string(authority.substr(0, colon));
    if (colon != std::string_view::npos) port = authority.substr(colon + 1);
  }
  if (t.host.empty()) return converge_detail::unexpected("missing host in \"" + std::string(url) + "\"");

  if (port.empty()) {
    t.port = t.tls ? "443" : "80";
  } else if (valid_port(port)) {
    t.port = std::string(port);
  } else {
    return converge_detail::unexpected("invalid port \"" + std::string(port) + "\"");
  }

  if (const auto hash = tail.find('#'); hash != std::string_view::npos) tail = tail.substr(0, hash);
  if (tail.empty()) {
    t.target = "/";
  } else if (tail.front() == '?') {
    t.target = "/" + std::string(tail);
  } else {
    t.target = std::string(tail);
  }
  return t;
}

std::string host_header(const HttpTarget& target) {
  std::string out = target.host.find(':') != std::string::npos ? "[" + target.host + "]" : target.host;
  if (target.port != (target.tls ? "443" : "80")) out += ":" + target.port;
  return out;
}

std::string url_for(const model::HealthCheckDescriptor& check) {
  if (!check.url.empty()) return check.url;
  std::string host = check.host.empty() ? std::string(HEALTH_DEFAULT_HOST) : check.host;
  if (host.find(':') != std::string::npos) host = "[" + host + "]";
  std::string path = check.path.empty() ? std::string(HEALTH_DEFAULT_PATH) : check.path;
  if (path.front() != '/') path.insert(path.begin(), '/');
  return "http://" + host + ":" + std::to_string(check.port) + path;
}

ProbeOutcome NetworkProber::probe(const model::HealthCheckDescriptor& check,
                                  std::chrono::milliseconds budget,
                                  std::stop_token stop) {
  if (check.kind == model::ProbeKind::Tcp) {
    const std::string host = check.host.empty() ? std::string(HEALTH_DEFAULT_HOST) : check.host;
    return tcp_probe(host, check.port, budget, std::move(stop));
  }

  auto target = parse_url(url_for(check));
  if (!target) {
    ProbeOutcome out;
    out.error = target.error();
    return out;
  }
  return http_probe(*target, budget, std::move(stop), tls_verify_);
}

} // namespace converge::health
