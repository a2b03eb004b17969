/**
 * @file http_probe.cpp
 * @brief HTTP(S) GET probe over Boost.Beast.
 *
 * Each step (resolve, connect, handshake, write, read) is started asynchronously
 * and the io_context is driven with run_for() in PROBE_SLICE_MS slices, checking
 * the deadline and the stop_token between slices.
 */

#include "converge/health/probe.hpp"
#include "converge/config/constants.hpp"
#include "converge/version.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <type_traits>

namespace converge::health {
using namespace converge::config::constants;

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
namespace ssl   = asio::ssl;
using tcp       = asio::ip::tcp;

namespace {

enum class StepEnd : std::uint8_t { Done, TimedOut, Cancelled };

using Clock = std::chrono::steady_clock;

/**
 * @brief Start one async operation and pump the io_context until it completes.
 *
 * `start` receives a completion flag setter; the handler it installs must call it.
 */
template <class Start>
StepEnd pump(asio::io_context& ioc, Start&& start, Clock::time_point deadline,
             const std::stop_token& stop) {
  bool done = false;
  ioc.restart();
  start([&done] { done = true; });

  const auto slice = std::chrono::milliseconds(PROBE_SLICE_MS);
  while (!done) {
    if (stop.stop_requested()) return StepEnd::Cancelled;
    const auto now = Clock::now();
    if (now >= deadline) return StepEnd::TimedOut;
    ioc.run_for(std::min<Clock::duration>(slice, deadline - now));
    if (ioc.stopped() && !done) ioc.restart();
  }
  return StepEnd::Done;
}

/// Apply a step result to the outcome; true when the probe should stop here.
bool failed_step(StepEnd end, const beast::error_code& ec, std::string_view what, ProbeOutcome& out) {
  switch (end) {
    case StepEnd::Cancelled:
      out.cancelled = true;
      out.error = "cancelled";
      return true;
    case StepEnd::TimedOut:
      out.error = std::string(what) + ": timed out";
      return true;
    case StepEnd::Done:
      break;
  }
  if (ec) {
    out.error = std::string(what) + ": " + ec.message();
    return true;
  }
  return false;
}

template <class Stream>
ProbeOutcome exchange(asio::io_context& ioc, Stream& stream, const HttpTarget& t,
                      Clock::time_point deadline, const std::stop_token& stop) {
  constexpr bool kTls = !std::is_same_v<Stream, beast::tcp_stream>;
  ProbeOutcome out;
  beast::error_code ec;

  tcp::resolver resolver(ioc);
  tcp::resolver::results_type endpoints;
  auto end = pump(ioc, [&](auto finish) {
    resolver.async_resolve(t.host, t.port,
        [&, finish](beast::error_code e, tcp::resolver::results_type r) { ec = e; endpoints = r; finish(); });
  }, deadline, stop);
  if (failed_step(end, ec, "resolve " + t.host, out)) return out;

  end = pump(ioc, [&](auto finish) {
    beast::get_lowest_layer(stream).async_connect(endpoints,
        [&, finish](beast::error_code e, const tcp::endpoint&) { ec = e; finish(); });
  }, deadline, stop);
  if (failed_step(end, ec, "connect " + t.host + ":" + t.port, out)) return out;

  if constexpr (kTls) {
    end = pump(ioc, [&](auto finish) {
      stream.async_handshake(ssl::stream_base::client,
          [&, finish](beast::error_code e) { ec = e; finish(); });
    }, deadline, stop);
    if (failed_step(end, ec, "tls handshake " + t.host, out)) return out;
  }

  http::request<http::empty_body> req{http::verb::get, t.target, 11};
  req.set(http::field::host, host_header(t));
  req.set(http::field::user_agent, std::string("converge-probe/") + converge::version_string);
  req.set(http::field::connection, "close");

  end = pump(ioc, [&](auto finish) {
    http::async_write(stream, req, [&, finish](beast::error_code e, std::size_t) { ec = e; finish(); });
  }, deadline, stop);
  if (failed_step(end, ec, "send " + t.target, out)) return out;

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  end = pump(ioc, [&](auto finish) {
    http::async_read(stream, buffer, res, [&, finish](beast::error_code e, std::size_t) { ec = e; finish(); });
  }, deadline, stop);
  if (failed_step(end, ec, "read response", out)) return out;

  out.connected = true;
  out.status = static_cast<int>(res.result_int());
  out.body = std::move(res.body());
  return out;
}

} // namespace

ProbeOutcome http_probe(const HttpTarget& target, std::chrono::milliseconds budget,
                        std::stop_token stop, bool tls_verify) {
  const auto deadline = Clock::now() + budget;
  asio::io_context ioc;

  if (!target.tls) {
    beast::tcp_stream stream(ioc);
    return exchange(ioc, stream, target, deadline, stop);
  }

  // Asio's TLS setup reports failures by throwing; convert at this boundary.
  try {
    ssl::context ctx{ssl::context::tls_client};
    ctx.set_default_verify_paths();
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (tls_verify) {
      stream.set_verify_mode(ssl::verify_peer);
      stream.set_verify_callback(ssl::host_name_verification(target.host));
    } else {
      stream.set_verify_mode(ssl::verify_none);
    }
    if (!SSL_set_tlsext_host_name(stream.native_handle(), target.host.c_str())) {
      ProbeOutcome out;
      out.error = "tls: cannot set SNI host name " + target.host;
      return out;
    }
    return exchange(ioc, stream, target, deadline, stop);
  } catch (const boost::system::system_error& ex) {
    ProbeOutcome out;
    out.error = std::string("tls setup: ") + ex.what();
    return out;
  }
}

} // namespace converge::health
