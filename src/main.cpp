/**
 * @file main.cpp
 * @brief Entry point of the tickbar demo program.
 *
 * Parses the command line, configures logging and runs the selected demo
 * command. Any error escaping a command is logged and turned into a non-zero
 * exit status.
 */

#include "commands/Command.hpp"
#include "version.h"

#include <csignal>
#include <iostream>

int main(int argc, char*argv[]) {
    signal(SIGSEGV, signal_handler);
    signal(SIGABRT, signal_handler);

    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // should be before init_log()
    logger->set_dedup_limit(program.get<int>("--log-dedup-limit"));
    if( program.is_used("--log") ){
        init_log(program.get<std::string>("--log"));
    }

    for (const auto& [name, cmd] : Command::registry()) {
        if (program.is_subcommand_used(name)) {
            if( cmd->parser().is_used("--log") ){
                init_log(cmd->parser().get<std::string>("--log"));
            }
            // warning: only use if all your loggers are thread-safe ("_mt" loggers)
            spdlog::flush_every(std::chrono::seconds(5));

            try {
                return cmd->run();
            } catch (const std::exception& e) {
                logger->critical("{}: {}", name, e.what());
                return 1;
            }
        }
    }

    std::cout << program;
    return 0;
}
