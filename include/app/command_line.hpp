// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Command surface

   rdvp [global flags] <subcommand> [flags...]

 Flags accept -name, --name, --name=value and --name value; boolean flags
 given bare mean true. Every flag has an environment mirror RDVP_<NAME>
 (upper-cased, '-' replaced by '_') used only when the flag is absent from
 the command line.

 Parse failures throw util::Error: HelpRequested for -h/--help,
 InvalidArgument for everything else. main maps both to exit status 2.
*/

#include "app/serve.hpp"
#include "util/logging.hpp"
#include <csignal>
#include <exception>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace rdvp {
namespace app {

constexpr const char *ENV_PREFIX = "RDVP_";

enum class Subcommand { None, Serve, GenKey };

struct GlobalOptions {
  bool debug = false;
  std::string logfile;
};

struct CommandLine {
  GlobalOptions global;
  Subcommand command = Subcommand::None;
  ServeConfig serve;
};

// Returns the value of an environment variable, nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

// getenv-backed lookup
EnvLookup ProcessEnvironment();

/**
 * Parse arguments (without argv[0])
 * @throws util::Error HelpRequested or InvalidArgument
 */
CommandLine ParseCommandLine(const std::vector<std::string> &args,
                             const EnvLookup &env = ProcessEnvironment());

/**
 * Logging setup from global flags and the verbosity switches
 * RDVP_DEBUG_APP, RDVP_DEBUG_P2P and RDVP_DEBUG_STORE
 */
util::LogConfig BuildLogConfig(const GlobalOptions &global,
                               const EnvLookup &env = ProcessEnvironment());

std::string Usage(const std::string &program);

// genkey: one base64 key line
void RunGenKey(std::ostream &out);

/**
 * serve: supervise Serve() together with a signal watcher
 * @return first fatal error, nullptr on success or clean interrupt
 */
std::exception_ptr RunServe(const ServeConfig &config,
                            const ServeDeps &deps = DefaultServeDeps(),
                            std::vector<int> signals = {SIGINT, SIGTERM});

} // namespace app
} // namespace rdvp
