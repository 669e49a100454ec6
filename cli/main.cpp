/**
 * @file main.cpp
 * @brief p100ctl — one-shot control and live monitor for a P100 processor.
 *
 * Responsibilities:
 *  - Parse CLI options and subcommands (CLI11).
 *  - Resolve configuration: defaults, then the JSON config file
 *    ($XDG_CONFIG_HOME/p100link/config.json or --config), then flags.
 *  - Open a p100link::Session, run exactly one subcommand through a facade,
 *    print `key=value` lines on stdout.
 *  - On failure print `status=error reason=<token> detail="..."` on stderr and
 *    exit with the code for that failure class.
 *
 * Exit codes:
 *   0 ok, 1 connection, 2 usage/argument/config, 3 timeout,
 *   4 not found/ambiguous, 5 cancelled (SIGINT during a command)
 *
 * Examples:
 *   p100ctl --host 192.168.1.40 on
 *   p100ctl --host p100.local volume set -- -35.5
 *   p100ctl --serial /dev/ttyUSB0 source select "dvd"
 *   p100ctl --host p100.local monitor --feedback 2 --duration 30
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "CLI/CLI11.hpp"

#include "p100link/config.hpp"
#include "p100link/controls/audio_mode.hpp"
#include "p100link/controls/power.hpp"
#include "p100link/controls/source.hpp"
#include "p100link/controls/volume.hpp"
#include "p100link/error.hpp"
#include "p100link/log.hpp"
#include "p100link/serial_io.hpp"
#include "p100link/session.hpp"

namespace fs = std::filesystem;
using namespace p100link;

// ---------- signals ----------

static CancelToken g_cancel;   // lock-free atomic underneath; safe from a handler

static void on_signal(int) { g_cancel.cancel(); }

// ---------- small utilities ----------

static int exit_code_for(const Error& e) {
  switch (e.code) {
    case ErrorCode::None:            return 0;
    case ErrorCode::InvalidArgument:
    case ErrorCode::Config:          return 2;
    case ErrorCode::Timeout:         return 3;
    case ErrorCode::NotFound:
    case ErrorCode::Ambiguous:       return 4;
    case ErrorCode::Cancelled:       return 5;
    case ErrorCode::ConnectionLost:
    case ErrorCode::NotConnected:
    case ErrorCode::Busy:
    case ErrorCode::MalformedFrame:  return 1;
  }
  return 1;
}

static int fail(const Error& e) {
  std::cerr << "status=error reason=" << e.reason();
  if (!e.detail.empty()) std::cerr << " detail=\"" << e.detail << "\"";
  std::cerr << "\n";
  return exit_code_for(e);
}

static std::string quoted(const std::string& s) { return "\"" + s + "\""; }

static const char* power_word(PowerState p) { return p == PowerState::On ? "on" : "off"; }

// Wall-clock "HH:MM:SS.mmm" for monitor lines.
static std::string timestamp() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t t = system_clock::to_time_t(now);
  const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  ::localtime_r(&t, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
  return os.str();
}

// ---------- configuration ----------

struct GlobalOpts {
  std::string host;
  int         port{0};
  std::string serial;
  int         baud{0};
  std::string config_path;
  int         timeout_ms{0};
  bool        debug{false};
};

// Defaults < config file < flags. The default file is optional; an explicit
// --config must exist.
static bool resolve_config(const GlobalOpts& g, Config& cfg, Error& err) {
  if (!g.config_path.empty()) {
    if (!load_config_file(g.config_path, cfg, err)) return false;
  } else {
    const std::string def = default_config_path();
    std::error_code ec;
    if (fs::exists(def, ec) && !load_config_file(def, cfg, err)) return false;
  }

  if (!g.host.empty())   { cfg.host = g.host; cfg.transport = TransportKind::Tcp; }
  if (g.port > 0)        cfg.port = static_cast<uint16_t>(g.port);
  if (!g.serial.empty()) { cfg.serial_device = g.serial; cfg.transport = TransportKind::Serial; }
  if (g.baud > 0)        cfg.baud = g.baud;
  if (g.timeout_ms > 0)  cfg.command_timeout_ms = g.timeout_ms;

  return validate_config(cfg, err);
}

// ---------- subcommand bodies ----------

static int do_power(Session& s, Zone z, const std::string& action) {
  PowerControl pc(s, z);
  Error err;
  if (action == "on" || action == "off") {
    const bool ok = action == "on" ? pc.on(err, &g_cancel) : pc.off(err, &g_cancel);
    if (!ok) return fail(err);
    std::cout << "status=ok zone=" << zone_name(z) << " power=" << action << "\n";
    return 0;
  }
  if (action == "toggle") {
    PowerState now;
    if (!pc.toggle(now, err, &g_cancel)) return fail(err);
    std::cout << "status=ok zone=" << zone_name(z) << " power=" << power_word(now) << "\n";
    return 0;
  }
  PowerState p;
  if (!pc.status(p, err, &g_cancel)) return fail(err);
  std::cout << "status=ok zone=" << zone_name(z) << " power=" << power_word(p) << "\n";
  return 0;
}

static int do_volume(Session& s, const std::string& action, const std::string& value) {
  VolumeControl vc(s, Zone::Main);
  Error err;

  if (action == "set") {
    int tenths = 0;
    if (!parse_db(value, tenths)) {
      err.set(ErrorCode::InvalidArgument, "bad dB value " + quoted(value));
      return fail(err);
    }
    if (!vc.set(tenths, err, &g_cancel)) return fail(err);
    std::cout << "status=ok volume_db=" << format_db(tenths) << "\n";
    return 0;
  }
  if (action == "up" || action == "down") {
    int step = VOLUME_STEP_TENTHS;
    if (!value.empty() && !parse_db(value, step)) {
      err.set(ErrorCode::InvalidArgument, "bad dB step " + quoted(value));
      return fail(err);
    }
    const bool ok = action == "up" ? vc.up(err, step, &g_cancel) : vc.down(err, step, &g_cancel);
    if (!ok) return fail(err);
    std::cout << "status=ok volume_step_db=" << (action == "up" ? "+" : "-") << format_db(step) << "\n";
    return 0;
  }

  int tenths = 0;
  if (!vc.get(tenths, err, &g_cancel)) return fail(err);
  std::cout << "status=ok volume_db=" << format_db(tenths) << "\n";
  return 0;
}

static int do_mute(Session& s, const std::string& action) {
  VolumeControl vc(s, Zone::Main);
  Error err;
  bool ok = true;
  if      (action == "on")     ok = vc.mute(err, &g_cancel);
  else if (action == "off")    ok = vc.unmute(err, &g_cancel);
  else if (action == "toggle") ok = vc.toggle_mute(err, &g_cancel);
  else {
    bool muted = false;
    if (!vc.is_muted(muted, err, &g_cancel)) return fail(err);
    std::cout << "status=ok mute=" << (muted ? "on" : "off") << "\n";
    return 0;
  }
  if (!ok) return fail(err);
  std::cout << "status=ok mute=" << action << "\n";
  return 0;
}

static void print_entries(const char* what, const std::vector<NamedEntry>& entries) {
  for (const auto& e : entries)
    std::cout << what << " index=" << e.index << " name=" << quoted(e.name) << "\n";
  std::cout << "status=ok count=" << entries.size() << "\n";
}

static int do_source(Session& s, const std::string& action, const std::string& value) {
  SourceControl sc(s);
  Error err;
  NamedEntry e;

  if (action == "list") {
    std::vector<NamedEntry> entries;
    if (!sc.list(entries, err, true, &g_cancel)) return fail(err);
    print_entries("source", entries);
    return 0;
  }
  bool ok;
  if      (action == "select") ok = sc.select_by_name(value, e, err, &g_cancel);
  else if (action == "next")   ok = sc.next(e, err, &g_cancel);
  else if (action == "prev")   ok = sc.previous(e, err, &g_cancel);
  else                         ok = sc.current(e, err, &g_cancel);
  if (!ok) return fail(err);
  std::cout << "status=ok source_index=" << e.index << " source_name=" << quoted(e.name) << "\n";
  return 0;
}

static int do_mode(Session& s, const std::string& action, const std::string& value) {
  AudioModeControl mc(s);
  Error err;
  NamedEntry e;

  if (action == "list") {
    std::vector<NamedEntry> entries;
    if (!mc.list(entries, err, true, &g_cancel)) return fail(err);
    print_entries("mode", entries);
    return 0;
  }
  if (action == "type") {
    std::string type;
    if (!mc.audio_type(type, err, &g_cancel)) return fail(err);
    std::cout << "status=ok audio_type=" << quoted(type) << "\n";
    return 0;
  }
  if (action == "next" || action == "prev") {
    const bool ok = action == "next" ? mc.next(err, &g_cancel) : mc.previous(err, &g_cancel);
    if (!ok) return fail(err);
    std::cout << "status=ok mode_step=" << action << "\n";
    return 0;
  }
  const bool ok = action == "select" ? mc.select_by_name(value, e, err, &g_cancel)
                                     : mc.current(e, err, &g_cancel);
  if (!ok) return fail(err);
  std::cout << "status=ok mode_index=" << e.index << " mode_name=" << quoted(e.name) << "\n";
  return 0;
}

// monitor: print every line in both directions until the duration ends or a
// signal arrives. Connection state changes are printed as events.
static int do_monitor(Session& s, double duration_s) {
  std::mutex out_mu;
  s.set_monitor([&](Direction d, const std::string& line) {
    std::lock_guard<std::mutex> lk(out_mu);
    std::cout << "ts=" << timestamp() << " dir=" << (d == Direction::Tx ? "tx" : "rx")
              << " line=" << quoted(line) << std::endl;
  });
  s.set_connection_listener([&](ConnectionState st) {
    std::lock_guard<std::mutex> lk(out_mu);
    std::cout << "ts=" << timestamp() << " event=state state=" << connection_state_name(st)
              << std::endl;
  });

  const auto start = std::chrono::steady_clock::now();
  const auto limit = std::chrono::duration<double>(duration_s);
  while (!g_cancel.cancelled()) {
    if (duration_s > 0 && std::chrono::steady_clock::now() - start >= limit) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  s.set_monitor(nullptr);
  s.set_connection_listener(nullptr);
  std::cout << "status=ok monitor=stopped\n";
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  GlobalOpts g;

  CLI::App app{"p100ctl: control a Steinway Lyngdorf P100 processor"};
  app.require_subcommand(1);

  app.add_option("--host", g.host, "Processor host name or address (TCP)");
  app.add_option("--port", g.port, "TCP control port (default 84)")->check(CLI::Range(1, 65535));
  app.add_option("--serial", g.serial, "Serial device, e.g. /dev/ttyUSB0");
  app.add_option("--baud", g.baud, "Serial baud rate (default 115200)")
      ->check(CLI::IsMember(supported_baud_rates()));
  app.add_option("--config", g.config_path, "Config file (default $XDG_CONFIG_HOME/p100link/config.json)");
  app.add_option("--timeout", g.timeout_ms, "Command timeout in ms")->check(CLI::PositiveNumber);
  app.add_flag("--debug", g.debug, "Log debug diagnostics to stderr");

  // power
  auto* on     = app.add_subcommand("on", "Power on the main zone");
  auto* off    = app.add_subcommand("off", "Power off the main zone");
  auto* toggle = app.add_subcommand("toggle", "Toggle main zone power");
  auto* status = app.add_subcommand("status", "Query main zone power");

  std::string zone2_action = "status";
  auto* zone2 = app.add_subcommand("zone2", "Zone 2 power");
  zone2->add_option("action", zone2_action, "on|off|status")
      ->check(CLI::IsMember({"on", "off", "status"}));

  // volume / mute
  std::string vol_action = "get", vol_value;
  auto* volume = app.add_subcommand("volume", "Main zone volume in dB (negative values after --)");
  volume->add_option("action", vol_action, "get|set|up|down")
      ->check(CLI::IsMember({"get", "set", "up", "down"}));
  volume->add_option("value", vol_value, "dB for set, step in dB for up/down");

  std::string mute_action = "status";
  auto* mute = app.add_subcommand("mute", "Main zone mute");
  mute->add_option("action", mute_action, "on|off|toggle|status")
      ->check(CLI::IsMember({"on", "off", "toggle", "status"}));

  // source / mode
  std::string src_action = "get", src_value;
  auto* source = app.add_subcommand("source", "Input source");
  source->add_option("action", src_action, "list|get|select|next|prev")
      ->check(CLI::IsMember({"list", "get", "select", "next", "prev"}));
  source->add_option("selector", src_value, "Index or (partial) name for select");

  std::string mode_action = "get", mode_value;
  auto* mode = app.add_subcommand("mode", "Audio mode");
  mode->add_option("action", mode_action, "list|get|select|next|prev|type")
      ->check(CLI::IsMember({"list", "get", "select", "next", "prev", "type"}));
  mode->add_option("selector", mode_value, "Index or (partial) name for select");

  // monitor
  double mon_duration = 0;
  int mon_feedback = -1;
  auto* monitor = app.add_subcommand("monitor", "Print device traffic until SIGINT");
  monitor->add_option("--duration", mon_duration, "Stop after this many seconds (0 = no limit)")
      ->check(CLI::NonNegativeNumber);
  monitor->add_option("--feedback", mon_feedback, "Feedback level 0|1|2 for this session")
      ->check(CLI::Range(0, 2));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    const int rc = app.exit(e);
    return rc == 0 ? 0 : 2;
  }

  log::set_level(g.debug ? log::Level::Debug : log::Level::Warn);

  Config cfg;
  Error err;
  if (!resolve_config(g, cfg, err)) return fail(err);

  if (monitor->parsed() && mon_feedback >= 0)
    cfg.feedback_level = static_cast<FeedbackLevel>(mon_feedback);

  if ((source->parsed() && src_action == "select" && src_value.empty()) ||
      (mode->parsed() && mode_action == "select" && mode_value.empty()) ||
      (volume->parsed() && vol_action == "set" && vol_value.empty())) {
    err.set(ErrorCode::InvalidArgument, "missing value");
    return fail(err);
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  Session session(cfg);
  if (!session.connect(err)) return fail(err);

  int rc = 0;
  if      (on->parsed())      rc = do_power(session, Zone::Main, "on");
  else if (off->parsed())     rc = do_power(session, Zone::Main, "off");
  else if (toggle->parsed())  rc = do_power(session, Zone::Main, "toggle");
  else if (status->parsed())  rc = do_power(session, Zone::Main, "status");
  else if (zone2->parsed())   rc = do_power(session, Zone::Zone2, zone2_action);
  else if (volume->parsed())  rc = do_volume(session, vol_action, vol_value);
  else if (mute->parsed())    rc = do_mute(session, mute_action);
  else if (source->parsed())  rc = do_source(session, src_action, src_value);
  else if (mode->parsed())    rc = do_mode(session, mode_action, mode_value);
  else if (monitor->parsed()) rc = do_monitor(session, mon_duration);

  session.disconnect();
  return rc;
}
