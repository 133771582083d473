#pragma once

#include "config/app_config.hpp"
#include "transport/http_transport.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace isapisync::cli {

// Builds the transport for one configured camera. The default factory uses
// cpp-httplib; tests substitute scripted transports.
using TransportFactory = std::function<std::unique_ptr<transport::IHttpTransport>(
    const config::CameraConfig& camera, std::string& error)>;

TransportFactory DefaultTransportFactory();

// Routes `isapisync` subcommands with a stable exit-code contract:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => config file missing or invalid
//   20 => camera unreachable or refetch failed
//   30 => setting rejected
int Dispatch(int argc, char** argv);

// Same as `Dispatch` with the subcommand in `args[0]`, for in-process callers.
int DispatchArgs(const std::vector<std::string_view>& args, const TransportFactory& factory);

} // namespace isapisync::cli
