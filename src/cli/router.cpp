#include "cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "core/string_utils.hpp"
#include "engine/camera_engine.hpp"
#include "engine/camera_registry.hpp"
#include "isapi/capabilities.hpp"
#include "sensors/file_sensor_hub.hpp"
#include "transport/httplib_transport.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace isapisync::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitDeviceUnreachable =
    core::errors::ToInt(core::errors::ExitCode::kDeviceUnreachable);
constexpr int kExitSettingRejected = core::errors::ToInt(core::errors::ExitCode::kSettingRejected);

constexpr std::chrono::milliseconds kSensorPollInterval{1000};
constexpr std::chrono::milliseconds kRunLoopSleep{200};

std::atomic<bool> g_stop_requested{false};

void HandleStopSignal(int) {
  g_stop_requested.store(true);
}

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  isapisync settings --config <file> --camera <id> [--log-level <level>]\n"
      << "  isapisync put --config <file> --camera <id> --key <key> --value <value> "
         "[--log-level <level>]\n"
      << "  isapisync refetch --config <file> --camera <id> "
         "--subsystem <motion|streams|audio|time|osd|ptz|info> [--log-level <level>]\n"
      << "  isapisync duplicate-overlays --config <file> --camera <id> --from <id> "
         "[--log-level <level>]\n"
      << "  isapisync run --config <file> [--duration-ms <n>] [--log-level <level>]\n"
      << "  isapisync version\n"
      << "levels: " << core::logging::ExpectedLogLevelList() << '\n';
}

struct CommandOptions {
  std::string config_path;
  std::string camera_id;
  std::string key;
  std::optional<std::string> value;
  std::string subsystem;
  std::string from_camera_id;
  std::optional<std::chrono::milliseconds> duration;
  std::optional<core::logging::LogLevel> log_level;
};

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string& out,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  out = std::string(args[i + 1]);
  ++i;
  return true;
}

bool ParseCommandOptions(const std::vector<std::string_view>& args, CommandOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--config") {
      if (!TakeValue(args, i, options.config_path, error)) {
        return false;
      }
      continue;
    }
    if (token == "--camera") {
      if (!TakeValue(args, i, options.camera_id, error)) {
        return false;
      }
      continue;
    }
    if (token == "--key") {
      if (!TakeValue(args, i, options.key, error)) {
        return false;
      }
      continue;
    }
    if (token == "--value") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.value = value;
      continue;
    }
    if (token == "--subsystem") {
      if (!TakeValue(args, i, options.subsystem, error)) {
        return false;
      }
      continue;
    }
    if (token == "--from") {
      if (!TakeValue(args, i, options.from_camera_id, error)) {
        return false;
      }
      continue;
    }
    if (token == "--duration-ms") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      std::int64_t parsed = 0;
      if (!core::ParseInt64(value, parsed) || parsed <= 0) {
        error = "--duration-ms expects a positive integer, got '" + value + "'";
        return false;
      }
      options.duration = std::chrono::milliseconds(parsed);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }

  if (options.config_path.empty()) {
    error = "missing required option --config <file>";
    return false;
  }
  return true;
}

bool RequireOption(const std::string& value, std::string_view flag, std::string& error) {
  if (value.empty()) {
    error = "missing required option " + std::string(flag);
    return false;
  }
  return true;
}

// Everything one command needs: parsed config, logger, sensors and the
// engines it built.
struct Session {
  config::AppConfig config;
  std::unique_ptr<core::logging::Logger> logger;
  std::unique_ptr<sensors::FileSensorHub> hub;
  engine::CameraRegistry registry;

  ~Session() {
    registry.ShutdownAll();
  }
};

int OpenSession(const CommandOptions& options, Session& session) {
  std::string error;
  if (!config::LoadAppConfig(options.config_path, session.config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  session.logger = std::make_unique<core::logging::Logger>(
      options.log_level.value_or(session.config.log_level), std::cerr);
  session.hub = std::make_unique<sensors::FileSensorHub>(session.config.sensors, *session.logger);
  return kExitSuccess;
}

// Builds, initializes and registers one engine. Returns an exit code.
int StartCamera(Session& session, const std::string& camera_id, const TransportFactory& factory,
                std::shared_ptr<engine::CameraEngine>& out) {
  const config::CameraConfig* camera = session.config.FindCamera(camera_id);
  if (camera == nullptr) {
    std::cerr << "error: camera '" << camera_id << "' is not defined in the config\n";
    return kExitConfigInvalid;
  }

  std::string error;
  std::unique_ptr<transport::IHttpTransport> transport = factory(*camera, error);
  if (!transport) {
    std::cerr << "error: camera '" << camera_id << "': " << error << '\n';
    return kExitConfigInvalid;
  }

  auto camera_engine = std::make_shared<engine::CameraEngine>(
      *camera, std::move(transport), config::SettingsPathFor(session.config, camera->id),
      *session.hub, *session.hub, *session.logger);
  if (!camera_engine->Initialize(error)) {
    std::cerr << "error: " << error << '\n';
    return kExitDeviceUnreachable;
  }
  if (!session.registry.Register(camera_engine, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  out = std::move(camera_engine);
  return kExitSuccess;
}

void PrintSettings(const std::vector<settings::SettingView>& views, std::ostream& out) {
  std::string subgroup;
  for (const settings::SettingView& view : views) {
    if (view.subgroup != subgroup) {
      subgroup = view.subgroup;
      out << '[' << subgroup << "]\n";
    }
    out << "  " << view.key << " = " << view.value << "  (" << settings::ToString(view.kind)
        << (view.readonly ? ", readonly" : "") << ") " << view.title << '\n';
    if (!view.choices.empty()) {
      out << "    choices:";
      for (const std::string& choice : view.choices) {
        out << ' ' << choice;
      }
      out << '\n';
    }
  }
}

int CommandSettings(const std::vector<std::string_view>& args, const TransportFactory& factory) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions(args, options, error) ||
      !RequireOption(options.camera_id, "--camera <id>", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  Session session;
  if (const int code = OpenSession(options, session); code != kExitSuccess) {
    return code;
  }
  std::shared_ptr<engine::CameraEngine> camera;
  if (const int code = StartCamera(session, options.camera_id, factory, camera);
      code != kExitSuccess) {
    return code;
  }
  PrintSettings(camera->GetSettings(), std::cout);
  return kExitSuccess;
}

int CommandPut(const std::vector<std::string_view>& args, const TransportFactory& factory) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions(args, options, error) ||
      !RequireOption(options.camera_id, "--camera <id>", error) ||
      !RequireOption(options.key, "--key <key>", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (!options.value.has_value()) {
    std::cerr << "error: missing required option --value <value>\n";
    return kExitUsage;
  }

  Session session;
  if (const int code = OpenSession(options, session); code != kExitSuccess) {
    return code;
  }
  std::shared_ptr<engine::CameraEngine> camera;
  if (const int code = StartCamera(session, options.camera_id, factory, camera);
      code != kExitSuccess) {
    return code;
  }
  if (!camera->PutSetting(options.key, *options.value, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitSettingRejected;
  }
  std::cout << "applied: " << options.key << " = " << *options.value << '\n';
  return kExitSuccess;
}

int CommandRefetch(const std::vector<std::string_view>& args, const TransportFactory& factory) {
  CommandOptions options;
  std::string error;
  isapi::Subsystem subsystem = isapi::Subsystem::kMotion;
  if (!ParseCommandOptions(args, options, error) ||
      !RequireOption(options.camera_id, "--camera <id>", error) ||
      !RequireOption(options.subsystem, "--subsystem <name>", error) ||
      !isapi::ParseSubsystem(options.subsystem, subsystem, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  Session session;
  if (const int code = OpenSession(options, session); code != kExitSuccess) {
    return code;
  }
  std::shared_ptr<engine::CameraEngine> camera;
  if (const int code = StartCamera(session, options.camera_id, factory, camera);
      code != kExitSuccess) {
    return code;
  }
  if (!camera->Refetch(subsystem, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitDeviceUnreachable;
  }
  std::cout << "refetched: " << isapi::ToString(subsystem) << '\n';
  return kExitSuccess;
}

int CommandDuplicateOverlays(const std::vector<std::string_view>& args,
                             const TransportFactory& factory) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions(args, options, error) ||
      !RequireOption(options.camera_id, "--camera <id>", error) ||
      !RequireOption(options.from_camera_id, "--from <id>", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (options.camera_id == options.from_camera_id) {
    std::cerr << "error: --from must name a different camera than --camera\n";
    return kExitUsage;
  }

  Session session;
  if (const int code = OpenSession(options, session); code != kExitSuccess) {
    return code;
  }
  std::shared_ptr<engine::CameraEngine> source;
  std::shared_ptr<engine::CameraEngine> target;
  if (const int code = StartCamera(session, options.from_camera_id, factory, source);
      code != kExitSuccess) {
    return code;
  }
  if (const int code = StartCamera(session, options.camera_id, factory, target);
      code != kExitSuccess) {
    return code;
  }
  if (!target->DuplicateOverlaysFrom(*source, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  std::cout << "overlays duplicated: " << source->id() << " -> " << target->id() << '\n';
  return kExitSuccess;
}

int CommandRun(const std::vector<std::string_view>& args, const TransportFactory& factory) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  Session session;
  if (const int code = OpenSession(options, session); code != kExitSuccess) {
    return code;
  }

  int started = 0;
  for (const config::CameraConfig& camera : session.config.cameras) {
    std::shared_ptr<engine::CameraEngine> camera_engine;
    if (StartCamera(session, camera.id, factory, camera_engine) != kExitSuccess) {
      session.logger->Warn("camera skipped", {{"camera", camera.id}});
      continue;
    }
    camera_engine->StartOverlaySync(session.config.overlay_interval);
    ++started;
  }
  if (started == 0) {
    std::cerr << "error: no camera could be initialized\n";
    return kExitDeviceUnreachable;
  }
  session.logger->Info("overlay sync running", {{"cameras", std::to_string(started)}});

  g_stop_requested.store(false);
  const auto previous_int = std::signal(SIGINT, HandleStopSignal);
  const auto previous_term = std::signal(SIGTERM, HandleStopSignal);

  const auto started_at = std::chrono::steady_clock::now();
  auto next_poll = started_at;
  while (!g_stop_requested.load()) {
    const auto now = std::chrono::steady_clock::now();
    if (options.duration.has_value() && now - started_at >= *options.duration) {
      break;
    }
    if (now >= next_poll) {
      session.hub->PollOnce();
      next_poll = now + kSensorPollInterval;
    }
    std::this_thread::sleep_for(kRunLoopSleep);
  }

  if (previous_int != SIG_ERR) {
    std::signal(SIGINT, previous_int);
  }
  if (previous_term != SIG_ERR) {
    std::signal(SIGTERM, previous_term);
  }
  session.logger->Info("overlay sync stopping");
  session.registry.ShutdownAll();
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "isapisync 0.1.0\n";
  return kExitSuccess;
}

} // namespace

TransportFactory DefaultTransportFactory() {
  return [](const config::CameraConfig& camera,
            std::string& error) -> std::unique_ptr<transport::IHttpTransport> {
    transport::HttpEndpointConfig endpoint;
    endpoint.host = camera.host;
    endpoint.port = camera.http_port;
    endpoint.use_https = camera.use_https;
    endpoint.username = camera.username;
    endpoint.password = camera.password;
    endpoint.timeout = camera.timeout;
    if (!transport::ParseAuthScheme(camera.auth, endpoint.auth, error)) {
      return nullptr;
    }
    return std::make_unique<transport::HttplibTransport>(std::move(endpoint));
  };
}

int DispatchArgs(const std::vector<std::string_view>& args, const TransportFactory& factory) {
  if (args.empty()) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command = args.front();
  const std::vector<std::string_view> rest(args.begin() + 1, args.end());

  if (command == "settings") {
    return CommandSettings(rest, factory);
  }
  if (command == "put") {
    return CommandPut(rest, factory);
  }
  if (command == "refetch") {
    return CommandRefetch(rest, factory);
  }
  if (command == "duplicate-overlays") {
    return CommandDuplicateOverlays(rest, factory);
  }
  if (command == "run") {
    return CommandRun(rest, factory);
  }
  if (command == "version") {
    return CommandVersion(rest);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  const std::vector<std::string_view> args(argv + 1, argv + argc);
  return DispatchArgs(args, DefaultTransportFactory());
}

} // namespace isapisync::cli
