// ============================================================================
// session.cpp — implementation for session.hpp
// ============================================================================

#include "p100link/session.hpp"
#include "p100link/transport/transport_serial.hpp"
#include "p100link/transport/transport_tcp.hpp"

#include <utility>

namespace p100link {

std::unique_ptr<transport::ITransport> make_transport(const Config& cfg) {
  if (cfg.transport == TransportKind::Serial)
    return std::make_unique<transport::SerialTransport>(cfg.serial_device, cfg.baud);
  return std::make_unique<transport::TcpTransport>(cfg.host, cfg.port, cfg.connect_timeout_ms);
}

static SupervisorOptions supervisor_options(const Config& cfg) {
  SupervisorOptions o;
  o.reconnect_base_ms   = cfg.reconnect_base_ms;
  o.reconnect_max_ms    = cfg.reconnect_max_ms;
  o.reconnect_stable_ms = cfg.reconnect_stable_ms;
  o.command_timeout_ms  = cfg.command_timeout_ms;
  o.feedback_level      = cfg.feedback_level;
  return o;
}

Session::Session(Config cfg)
: cfg_(std::move(cfg)),
  correlator_(cache_),
  queue_(correlator_),
  supervisor_(correlator_, [this] { return make_transport(cfg_); }, supervisor_options(cfg_)) {}

Session::Session(Config cfg, TransportFactory factory)
: cfg_(std::move(cfg)),
  correlator_(cache_),
  queue_(correlator_),
  supervisor_(correlator_, std::move(factory), supervisor_options(cfg_)) {}

Session::~Session() {
  supervisor_.stop();
}

bool Session::connect(Error& err) {
  return supervisor_.start(err);
}

void Session::disconnect() {
  supervisor_.stop();
}

bool Session::execute(const Command& cmd, Response& resp, Error& err, const CancelToken* cancel) {
  return queue_.execute(cmd, resp, err, cancel);
}

bool Session::query(const Command& cmd, StatusLine& line, Error& err, const CancelToken* cancel) {
  Response resp;
  if (!execute(cmd, resp, err, cancel)) return false;
  if (resp.empty()) {
    err.set(ErrorCode::MalformedFrame, "no reply line for " + cmd.text);
    return false;
  }
  line = resp.lines.front();
  return true;
}

} // namespace p100link
