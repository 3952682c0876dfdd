/**
 * @file cli.cpp
 * @brief Command line plumbing shared by all demo commands.
 *
 * Global argument parser, verbosity and log file handling, the "-O name=value"
 * progress bar overrides, and the crash handler that prints a backtrace.
 */

#include "cli.hpp"
#include "version.h"
#include "core/errors.hpp"

#include <cstdlib>

int verbosity = 0;

argparse::ArgumentParser program(APP_NAME, APP_VERSION, argparse::default_arguments::help);

// begin stack trace generation on error
#include <backtrace.h>

/**
 * @brief Backtrace error callback for logging libbacktrace errors.
 */
static void backtrace_error_cb(void *, const char *msg, int errnum) {
    logger->critical("Error: {} (Error number: {})", msg, errnum);
}

static int backtrace_full_cb(void *, uintptr_t pc, const char *filename, int lineno, const char *function) {
    logger->critical("     {} {}:{} ({})", (void *)pc, filename ? filename : "??", lineno, function ? function : "??");
    return 0;  // Continue processing the backtrace
}

void signal_handler(int sig) {
    logger->critical("Signal {} received, printing backtrace...", sig);

    backtrace_state *state = backtrace_create_state(NULL, 0, backtrace_error_cb, NULL);
    backtrace_full(state, 0, backtrace_full_cb, backtrace_error_cb, NULL);

    exit(1);
}
// end stack trace generation on error

/**
 * @brief Attaches the log file given on the command line, once.
 *
 * An explicitly requested log file that cannot be opened is fatal.
 */
void init_log(const std::filesystem::path& log_fname){
    static bool inited = false;
    if( inited ){
        return;
    }
    inited = true;

    if( !logger->add_file(log_fname) ){
        logger->critical("explicit log pathname is set, refusing to continue without log");
        exit(1);
    }
    logger->start();
}

void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity")
        .action([&](const auto &) { ++verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-q", "--quiet")
        .help("decrease verbosity")
        .action([&](const auto &) { --verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-L", "--log")
        .help("log pathname [default: console only]");
    parser.add_argument("--log-dedup-limit")
        .default_value(100)
        .scan<'i', int>()
        .help("limit duplicate log messages, 0 = no limit");
}

void register_bar_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-O", "--option")
        .help("progress bar option as name=value, e.g. width=60, show-count=1, saucer=#")
        .default_value(std::vector<std::string>{})
        .append();
}

/**
 * @brief Applies every "-O name=value" of the parser to the options.
 * @throws Tickbar::InvalidConfiguration On malformed pairs, unknown names or bad values.
 */
void apply_option_overrides(Tickbar::Options& opts, const argparse::ArgumentParser& parser){
    for( const auto& pair : parser.get<std::vector<std::string>>("--option") ){
        const size_t eq = pair.find('=');
        if( eq == std::string::npos ){
            throw Tickbar::InvalidConfiguration("expected name=value, got: " + pair);
        }
        opts.set(pair.substr(0, eq), pair.substr(eq + 1));
        logger->debug("option {} = \"{}\"", pair.substr(0, eq), pair.substr(eq + 1));
    }
}

void register_program_args(argparse::ArgumentParser &parser) {
    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", APP_VERSION);
            exit(0);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);
}
