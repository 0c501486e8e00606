#include <catch2/catch_test_macros.hpp>
#include "app/command_line.hpp"
#include "crypto/identity.hpp"
#include "util/error.hpp"
#include <map>
#include <sstream>

using namespace rdvp::app;
using rdvp::util::Error;
using rdvp::util::ErrorCode;

namespace {

EnvLookup FakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

const EnvLookup kEmptyEnv = FakeEnv({});

// Parse and return the error code, or nullopt on success
std::optional<ErrorCode> ParseFailure(const std::vector<std::string>& args,
                                      const EnvLookup& env = kEmptyEnv) {
    try {
        ParseCommandLine(args, env);
    } catch (const Error& e) {
        return e.code();
    }
    return std::nullopt;
}

std::string ParseMessage(const std::vector<std::string>& args,
                         const EnvLookup& env = kEmptyEnv) {
    try {
        ParseCommandLine(args, env);
    } catch (const Error& e) {
        return e.message();
    }
    return "";
}

} // namespace

TEST_CASE("Command line subcommands", "[app][cli]") {
    SECTION("serve with defaults") {
        auto cmd = ParseCommandLine({"serve"}, kEmptyEnv);
        REQUIRE(cmd.command == Subcommand::Serve);
        REQUIRE_FALSE(cmd.global.debug);
        REQUIRE(cmd.global.logfile.empty());

        ServeConfig defaults;
        REQUIRE(cmd.serve.listen == defaults.listen);
        REQUIRE(cmd.serve.db == ":memory:");
        REQUIRE(cmd.serve.private_key.empty());
        REQUIRE(cmd.serve.enable_relay_hop);
        REQUIRE(cmd.serve.enable_nat_service);
    }

    SECTION("genkey") {
        auto cmd = ParseCommandLine({"genkey"}, kEmptyEnv);
        REQUIRE(cmd.command == Subcommand::GenKey);
    }

    SECTION("no command") {
        REQUIRE(ParseFailure({}) == ErrorCode::InvalidArgument);
        REQUIRE(ParseFailure({"--debug"}) == ErrorCode::InvalidArgument);
        REQUIRE(ParseMessage({}) == "no command given");
    }

    SECTION("unknown command") {
        REQUIRE(ParseFailure({"dial"}) == ErrorCode::InvalidArgument);
        REQUIRE(ParseMessage({"dial"}) == "unknown command \"dial\"");
    }

    SECTION("help requests") {
        REQUIRE(ParseFailure({"help"}) == ErrorCode::HelpRequested);
        REQUIRE(ParseFailure({"-h"}) == ErrorCode::HelpRequested);
        REQUIRE(ParseFailure({"--help"}) == ErrorCode::HelpRequested);
        REQUIRE(ParseFailure({"serve", "-h"}) == ErrorCode::HelpRequested);
        REQUIRE(ParseFailure({"genkey", "--help"}) == ErrorCode::HelpRequested);
    }

    SECTION("trailing positional arguments are rejected") {
        REQUIRE(ParseFailure({"serve", "extra"}) == ErrorCode::InvalidArgument);
        REQUIRE(ParseMessage({"genkey", "extra"}) == "unexpected argument \"extra\"");
    }

    SECTION("genkey takes no flags") {
        REQUIRE(ParseFailure({"genkey", "--db", "x"}) == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Command line flag syntax", "[app][cli]") {
    SECTION("global flags precede the command") {
        auto cmd = ParseCommandLine({"--debug", "--logfile", "/tmp/rdvp.log", "serve"}, kEmptyEnv);
        REQUIRE(cmd.global.debug);
        REQUIRE(cmd.global.logfile == "/tmp/rdvp.log");
    }

    SECTION("single dash, double dash and equals forms") {
        auto cmd = ParseCommandLine(
            {"serve", "-db", "/tmp/a.json", "--pk=abc", "-l=/ip4/127.0.0.1/tcp/1"}, kEmptyEnv);
        REQUIRE(cmd.serve.db == "/tmp/a.json");
        REQUIRE(cmd.serve.private_key == "abc");
        REQUIRE(cmd.serve.listen == std::vector<std::string>{"/ip4/127.0.0.1/tcp/1"});
    }

    SECTION("listen addresses are comma separated") {
        auto cmd = ParseCommandLine(
            {"serve", "-l", "/ip4/0.0.0.0/tcp/4040,127.0.0.1:5000"}, kEmptyEnv);
        REQUIRE(cmd.serve.listen ==
                std::vector<std::string>{"/ip4/0.0.0.0/tcp/4040", "127.0.0.1:5000"});
    }

    SECTION("bare boolean means true, explicit values parse") {
        auto cmd = ParseCommandLine({"serve", "--relay-hop=false", "--nat-service=0"}, kEmptyEnv);
        REQUIRE_FALSE(cmd.serve.enable_relay_hop);
        REQUIRE_FALSE(cmd.serve.enable_nat_service);

        cmd = ParseCommandLine({"serve", "--relay-hop=false", "--relay-hop"}, kEmptyEnv);
        REQUIRE(cmd.serve.enable_relay_hop);
    }

    SECTION("invalid boolean value") {
        REQUIRE(ParseFailure({"serve", "--relay-hop=maybe"}) == ErrorCode::InvalidArgument);
        REQUIRE(ParseMessage({"serve", "--relay-hop=maybe"}) ==
                "invalid boolean value \"maybe\" for flag -relay-hop");
    }

    SECTION("unknown flag") {
        REQUIRE(ParseMessage({"serve", "--port", "1"}) ==
                "serve: flag provided but not defined: -port");
        REQUIRE(ParseFailure({"--db", "x", "serve"}) == ErrorCode::InvalidArgument);
    }

    SECTION("missing value") {
        REQUIRE(ParseMessage({"serve", "--db"}) == "serve: flag needs an argument: -db");
    }

    SECTION("bad syntax") {
        REQUIRE(ParseFailure({"serve", "---db", "x"}) == ErrorCode::InvalidArgument);
        REQUIRE(ParseFailure({"serve", "-=x"}) == ErrorCode::InvalidArgument);
    }

    SECTION("double dash ends flags") {
        REQUIRE(ParseFailure({"serve", "--", "--db"}) == ErrorCode::InvalidArgument);
        REQUIRE(ParseMessage({"serve", "--", "--db"}) == "unexpected argument \"--db\"");
    }
}

TEST_CASE("Command line environment mirrors", "[app][cli]") {
    SECTION("environment fills absent flags") {
        auto env = FakeEnv({{"RDVP_DB", "/var/lib/rdvp.json"},
                            {"RDVP_L", "/ip4/127.0.0.1/tcp/9000"},
                            {"RDVP_PK", "key"},
                            {"RDVP_RELAY_HOP", "false"},
                            {"RDVP_NAT_SERVICE", "F"},
                            {"RDVP_DEBUG", "true"},
                            {"RDVP_LOGFILE", "/tmp/x.log"}});
        auto cmd = ParseCommandLine({"serve"}, env);
        REQUIRE(cmd.serve.db == "/var/lib/rdvp.json");
        REQUIRE(cmd.serve.listen == std::vector<std::string>{"/ip4/127.0.0.1/tcp/9000"});
        REQUIRE(cmd.serve.private_key == "key");
        REQUIRE_FALSE(cmd.serve.enable_relay_hop);
        REQUIRE_FALSE(cmd.serve.enable_nat_service);
        REQUIRE(cmd.global.debug);
        REQUIRE(cmd.global.logfile == "/tmp/x.log");
    }

    SECTION("command line beats environment") {
        auto env = FakeEnv({{"RDVP_DB", "/from/env.json"}, {"RDVP_RELAY_HOP", "false"}});
        auto cmd = ParseCommandLine({"serve", "--db", "/from/flag.json", "--relay-hop"}, env);
        REQUIRE(cmd.serve.db == "/from/flag.json");
        REQUIRE(cmd.serve.enable_relay_hop);
    }

    SECTION("invalid environment value names the variable") {
        auto env = FakeEnv({{"RDVP_NAT_SERVICE", "sometimes"}});
        REQUIRE(ParseFailure({"serve"}, env) == ErrorCode::InvalidArgument);
        auto message = ParseMessage({"serve"}, env);
        REQUIRE(message.rfind("environment RDVP_NAT_SERVICE: ", 0) == 0);
    }

    SECTION("serve mirrors do not apply to genkey") {
        auto env = FakeEnv({{"RDVP_DB", "/from/env.json"}});
        auto cmd = ParseCommandLine({"genkey"}, env);
        REQUIRE(cmd.command == Subcommand::GenKey);
    }
}

TEST_CASE("Log configuration from switches", "[app][cli][logging]") {
    GlobalOptions global;

    SECTION("defaults") {
        auto config = BuildLogConfig(global, kEmptyEnv);
        REQUIRE(config.level == "info");
        REQUIRE(config.file.empty());
        REQUIRE(config.component_levels.empty());
    }

    SECTION("debug flag and logfile") {
        global.debug = true;
        global.logfile = "/tmp/rdvp.log";
        auto config = BuildLogConfig(global, kEmptyEnv);
        REQUIRE(config.level == "debug");
        REQUIRE(config.file == "/tmp/rdvp.log");
    }

    SECTION("verbosity switches raise components") {
        auto config = BuildLogConfig(global, FakeEnv({{"RDVP_DEBUG_P2P", "1"}}));
        REQUIRE(config.level == "debug");
        REQUIRE(config.component_levels.at("network") == "trace");
        REQUIRE(config.component_levels.count("app") == 0);

        config = BuildLogConfig(global, FakeEnv({{"RDVP_DEBUG_STORE", "true"},
                                                 {"RDVP_DEBUG_APP", "true"}}));
        REQUIRE(config.component_levels.at("storage") == "debug");
        REQUIRE(config.component_levels.at("rendezvous") == "debug");
        REQUIRE(config.component_levels.at("app") == "debug");
    }

    SECTION("disabled switches are ignored") {
        auto config = BuildLogConfig(global, FakeEnv({{"RDVP_DEBUG_APP", "false"},
                                                      {"RDVP_DEBUG_P2P", "junk"}}));
        REQUIRE(config.level == "info");
        REQUIRE(config.component_levels.empty());
    }
}

TEST_CASE("genkey output", "[app][cli][identity]") {
    std::ostringstream out;
    RunGenKey(out);

    std::string text = out.str();
    REQUIRE_FALSE(text.empty());
    REQUIRE(text.back() == '\n');

    std::string line = text.substr(0, text.size() - 1);
    REQUIRE(line.find('\n') == std::string::npos);

    auto key = rdvp::crypto::LoadKey(line);
    REQUIRE(key.type() == rdvp::crypto::KeyType::RSA);
    REQUIRE(key.bits() == rdvp::crypto::DEFAULT_RSA_BITS);
    REQUIRE(rdvp::crypto::SerializeKey(key) == line);
}

TEST_CASE("genkey produces a fresh key each run", "[app][cli][identity]") {
    std::ostringstream first;
    std::ostringstream second;
    RunGenKey(first);
    RunGenKey(second);
    REQUIRE(first.str() != second.str());
}

TEST_CASE("Usage text", "[app][cli]") {
    auto text = Usage("rdvp");
    REQUIRE(text.find("Usage: rdvp") != std::string::npos);
    REQUIRE(text.find("serve") != std::string::npos);
    REQUIRE(text.find("genkey") != std::string::npos);
    REQUIRE(text.find("$RDVP_DB") != std::string::npos);
    REQUIRE(text.find("RDVP_DEBUG_P2P") != std::string::npos);
}
