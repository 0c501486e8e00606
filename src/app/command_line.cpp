// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/command_line.hpp"
#include "app/supervisor.hpp"
#include "crypto/identity.hpp"
#include "network/address_resolver.hpp"
#include "util/error.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <set>
#include <sstream>

namespace rdvp {
namespace app {

using util::Error;
using util::ErrorCode;

namespace {

/**
 * Minimal flag set with Go flag package syntax
 */
class FlagSet {
public:
  using Apply = std::function<void(const std::string &value)>;

  explicit FlagSet(std::string name) : name_(std::move(name)) {}

  void String(const std::string &flag, Apply apply) {
    flags_[flag] = Flag{false, std::move(apply)};
  }

  void Bool(const std::string &flag, std::function<void(bool)> apply) {
    flags_[flag] = Flag{true, [flag, apply](const std::string &value) {
                          auto parsed = util::ParseBool(value);
                          if (!parsed) {
                            throw Error(ErrorCode::InvalidArgument,
                                        "invalid boolean value \"" + value +
                                            "\" for flag -" + flag);
                          }
                          apply(*parsed);
                        }};
  }

  /**
   * Consume flags from args starting at pos; stops at the first positional
   * argument or after "--". Returns the index of the first unconsumed arg.
   */
  size_t Parse(const std::vector<std::string> &args, size_t pos) {
    while (pos < args.size()) {
      const std::string &arg = args[pos];
      if (arg.size() < 2 || arg[0] != '-') {
        break;
      }
      ++pos;
      if (arg == "--") {
        break;
      }

      std::string body = arg.substr(arg[1] == '-' ? 2 : 1);
      if (body.empty() || body[0] == '-' || body[0] == '=') {
        throw Error(ErrorCode::InvalidArgument, "bad flag syntax: " + arg);
      }

      std::string flag = body;
      std::optional<std::string> value;
      size_t eq = body.find('=');
      if (eq != std::string::npos) {
        flag = body.substr(0, eq);
        value = body.substr(eq + 1);
      }

      auto it = flags_.find(flag);
      if (it == flags_.end()) {
        if (flag == "h" || flag == "help") {
          throw Error(ErrorCode::HelpRequested, "help requested");
        }
        throw Error(ErrorCode::InvalidArgument,
                    name_ + ": flag provided but not defined: -" + flag);
      }

      if (!value) {
        if (it->second.is_bool) {
          value = "true";
        } else if (pos < args.size()) {
          value = args[pos++];
        } else {
          throw Error(ErrorCode::InvalidArgument,
                      name_ + ": flag needs an argument: -" + flag);
        }
      }
      it->second.apply(*value);
      set_.insert(flag);
    }
    return pos;
  }

  // Fill flags not given on the command line from RDVP_<NAME>
  void ApplyEnvironment(const EnvLookup &env) {
    for (const auto &[flag, spec] : flags_) {
      if (set_.count(flag)) {
        continue;
      }
      std::string var = EnvName(flag);
      auto value = env(var);
      if (!value) {
        continue;
      }
      try {
        spec.apply(*value);
      } catch (const Error &e) {
        throw Error(ErrorCode::InvalidArgument,
                    "environment " + var + ": " + e.message());
      }
    }
  }

  static std::string EnvName(const std::string &flag) {
    std::string var = ENV_PREFIX;
    for (char c : flag) {
      var += c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return var;
  }

private:
  struct Flag {
    bool is_bool = false;
    Apply apply;
  };

  std::string name_;
  std::map<std::string, Flag> flags_;
  std::set<std::string> set_;
};

bool SwitchEnabled(const EnvLookup &env, const std::string &var) {
  auto value = env(var);
  if (!value) {
    return false;
  }
  auto parsed = util::ParseBool(*value);
  return parsed && *parsed;
}

} // anonymous namespace

EnvLookup ProcessEnvironment() {
  return [](const std::string &name) -> std::optional<std::string> {
    const char *value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

CommandLine ParseCommandLine(const std::vector<std::string> &args,
                             const EnvLookup &env) {
  CommandLine cmd;

  FlagSet global("rdvp");
  global.Bool("debug", [&](bool v) { cmd.global.debug = v; });
  global.String("logfile", [&](const std::string &v) { cmd.global.logfile = v; });

  size_t pos = global.Parse(args, 0);
  global.ApplyEnvironment(env);

  if (pos >= args.size()) {
    throw Error(ErrorCode::InvalidArgument, "no command given");
  }

  const std::string &name = args[pos++];
  if (name == "help") {
    throw Error(ErrorCode::HelpRequested, "help requested");
  }

  if (name == "genkey") {
    cmd.command = Subcommand::GenKey;
    FlagSet genkey("genkey");
    pos = genkey.Parse(args, pos);
  } else if (name == "serve") {
    cmd.command = Subcommand::Serve;
    ServeConfig &serve = cmd.serve;
    FlagSet flags("serve");
    flags.String("db", [&](const std::string &v) { serve.db = v; });
    flags.String("l", [&](const std::string &v) {
      serve.listen = network::SplitAddressList(v);
    });
    flags.String("pk", [&](const std::string &v) { serve.private_key = v; });
    flags.Bool("relay-hop", [&](bool v) { serve.enable_relay_hop = v; });
    flags.Bool("nat-service", [&](bool v) { serve.enable_nat_service = v; });
    pos = flags.Parse(args, pos);
    flags.ApplyEnvironment(env);
  } else {
    throw Error(ErrorCode::InvalidArgument, "unknown command \"" + name + "\"");
  }

  if (pos < args.size()) {
    throw Error(ErrorCode::InvalidArgument,
                "unexpected argument \"" + args[pos] + "\"");
  }
  return cmd;
}

util::LogConfig BuildLogConfig(const GlobalOptions &global, const EnvLookup &env) {
  util::LogConfig config;
  config.file = global.logfile;
  if (global.debug) {
    config.level = "debug";
  }

  if (SwitchEnabled(env, "RDVP_DEBUG_APP")) {
    config.level = "debug";
    config.component_levels["app"] = "debug";
  }
  if (SwitchEnabled(env, "RDVP_DEBUG_P2P")) {
    config.level = "debug";
    config.component_levels["network"] = "trace";
  }
  if (SwitchEnabled(env, "RDVP_DEBUG_STORE")) {
    config.level = "debug";
    config.component_levels["storage"] = "debug";
    config.component_levels["rendezvous"] = "debug";
  }
  return config;
}

std::string Usage(const std::string &program) {
  std::ostringstream out;
  out << GetFullVersionString() << " - rendezvous point\n"
      << "\n"
      << "Usage: " << program << " [global options] <command> [options]\n"
      << "\n"
      << "Commands:\n"
      << "  serve                  Run the rendezvous point\n"
      << "  genkey                 Generate a private key (base64) on stdout\n"
      << "\n"
      << "Global options:\n"
      << "  --debug                Debug logging               [$RDVP_DEBUG]\n"
      << "  --logfile <path>       JSON log lines to <path>    [$RDVP_LOGFILE]\n"
      << "  -h, --help             Show this help message\n"
      << "\n"
      << "Serve options:\n"
      << "  --db <urn>             Registration store, " << rendezvous::MEMORY_URN
      << " or a file path\n"
      << "                         (default: " << rendezvous::MEMORY_URN << ")  [$RDVP_DB]\n"
      << "  -l <addrs>             Comma-separated listen addresses  [$RDVP_L]\n"
      << "                         (default: /ip4/0.0.0.0/tcp/4040,/ip4/0.0.0.0/udp/4141/quic)\n"
      << "  --pk <key>             Base64 private key (default: generate)  [$RDVP_PK]\n"
      << "  --relay-hop <bool>     Relay hop service (default: true)  [$RDVP_RELAY_HOP]\n"
      << "  --nat-service <bool>   UPnP port mapping (default: true)  [$RDVP_NAT_SERVICE]\n"
      << "\n"
      << "Verbosity switches (environment):\n"
      << "  RDVP_DEBUG_APP, RDVP_DEBUG_P2P, RDVP_DEBUG_STORE\n"
      << "\n"
      << GetCopyrightString() << "\n";
  return out.str();
}

void RunGenKey(std::ostream &out) {
  crypto::PrivateKey key = crypto::GenerateKey();
  out << crypto::SerializeKey(key) << std::endl;
}

std::exception_ptr RunServe(const ServeConfig &config, const ServeDeps &deps,
                            std::vector<int> signals) {
  Supervisor supervisor;
  CancellationScope &scope = supervisor.scope();

  SignalWatcher watcher(scope, std::move(signals));
  watcher.AddTo(supervisor);

  supervisor.Add(
      "serve", [&]() { Serve(config, scope, deps); },
      [&]() { scope.Cancel(); });

  return supervisor.Run();
}

} // namespace app
} // namespace rdvp
