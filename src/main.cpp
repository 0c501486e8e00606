// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/command_line.hpp"
#include "util/error.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // Usage, genkey output and errors before the logger exists

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FATAL = 1;
constexpr int EXIT_USAGE = 2;

} // anonymous namespace

int main(int argc, char *argv[]) {
  const std::string program = argc > 0 ? argv[0] : "rdvp";

  rdvp::app::CommandLine cmd;
  try {
    cmd = rdvp::app::ParseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const rdvp::util::Error &e) {
    if (e.code() != rdvp::util::ErrorCode::HelpRequested) {
      std::cerr << "Error: " << e.message() << "\n\n";
    }
    std::cerr << rdvp::app::Usage(program);
    return EXIT_USAGE;
  }

  try {
    if (cmd.command == rdvp::app::Subcommand::GenKey) {
      rdvp::app::RunGenKey(std::cout);
      return EXIT_OK;
    }

    rdvp::util::LogManager::Initialize(rdvp::app::BuildLogConfig(cmd.global));
    LOG_INFO("{} starting", rdvp::GetFullVersionString());

    std::exception_ptr error = rdvp::app::RunServe(cmd.serve);

    int status = EXIT_OK;
    if (error) {
      LOG_ERROR("fatal: {}", rdvp::util::DescribeError(error));
      status = EXIT_FATAL;
    } else {
      LOG_INFO("shutdown complete");
    }

    // Every task thread has been joined; nothing logs after this point
    rdvp::util::LogManager::Shutdown();
    return status;

  } catch (const std::exception &e) {
    // Logger may not be usable here
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    rdvp::util::LogManager::Shutdown();
    return EXIT_FATAL;
  }
}
