#ifndef ISAPISYNC_TESTS_COMMON_CLI_DISPATCH_HPP_
#define ISAPISYNC_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace isapisync::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return isapisync::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

struct CapturedRun {
  int exit_code = 0;
  std::string out;
  std::string err;
};

// Runs the router in-process with a substitute transport factory and
// captures stdout and stderr.
inline CapturedRun DispatchCaptured(const std::vector<std::string>& args,
                                    const isapisync::cli::TransportFactory& factory) {
  const std::vector<std::string_view> views(args.begin(), args.end());
  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
  CapturedRun run;
  run.exit_code = isapisync::cli::DispatchArgs(views, factory);
  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);
  run.out = captured_out.str();
  run.err = captured_err.str();
  return run;
}

} // namespace isapisync::tests::common

#endif // ISAPISYNC_TESTS_COMMON_CLI_DISPATCH_HPP_
