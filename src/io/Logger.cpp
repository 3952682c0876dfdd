/**
 * @file Logger.cpp
 * @brief Implementation of the Logger wrapper around spdlog.
 *
 * Adds verbosity mapping, an optional file sink, session banner and
 * deduplication of repeated warnings on top of a plain spdlog logger.
 */

#include "Logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/fmt/ranges.h> // for fmt::join()
#include <fstream>

/**
 * @brief Sets the logging verbosity level.
 *
 * Maps integer verbosity to spdlog levels:
 * -4 or less: off, -3: critical, -2: error, -1: warn, 0: info, 1: debug, 2+: trace
 *
 * @param verbosity Integer verbosity level.
 */
void Logger::set_verbosity(int verbosity){
    if( verbosity <= -4 ){
        m_logger->set_level(spdlog::level::off);
        return;
    }
    switch( verbosity ){
        case -3:
            m_logger->set_level(spdlog::level::critical);
            break;
        case -2:
            m_logger->set_level(spdlog::level::err);
            break;
        case -1:
            m_logger->set_level(spdlog::level::warn);
            break;
        case 0: // default level
            m_logger->set_level(spdlog::level::info);
            break;
        case 1:
            m_logger->set_level(spdlog::level::debug);
            break;
        default:
            m_logger->set_level(spdlog::level::trace);
            break;
    }
}

void Logger::set_arguments(int argc, char* argv[]){
    m_arguments.clear();
    for( int i = 0; i < argc; ++i ){
        m_arguments.push_back(argv[i]);
    }
}

void Logger::set_arguments(const std::vector<std::string>& args){
    m_arguments = args;
}

/**
 * @brief Applies the dedup limit to a warning or error format string.
 *
 * The message that hits the limit exactly is replaced by a single
 * "suppressing" notice; everything after it is dropped.
 *
 * @return True if the message should be emitted.
 */
bool Logger::should_log(fmt::string_view format){
    if( m_dedup_limit <= 0 ){
        return true;
    }

    std::lock_guard<std::mutex> lock(m_mtx);
    int n = m_logged_messages[format]++;
    if( n < m_dedup_limit ){
        return true;
    }
    if( n == m_dedup_limit ){
        m_logger->warn("\"{}\" [repeated {} times. suppressing]", format, m_dedup_limit);
    }
    return false;
}

/**
 * @brief Quotes an argument string if it contains spaces.
 * @note Not a comprehensive shell-escape function.
 */
static std::string quote_if_needed(const std::string& arg) {
    if (arg.find(' ') != std::string::npos) {
        return "\"" + arg + "\"";
    }
    return arg;
}

static std::vector<std::string> quote_if_needed(const std::vector<std::string>& args) {
    std::vector<std::string> quoted_args;
    quoted_args.reserve(args.size());
    for (const auto& arg : args) {
        quoted_args.push_back(quote_if_needed(arg));
    }
    return quoted_args;
}

/**
 * @brief Adds a file sink to the logger.
 *
 * The file sink records DEBUG or higher; the console keeps its own level. If
 * a file is already attached, the call is ignored. The file is opened in
 * append mode.
 *
 * @param fname Path to the log file.
 * @return True if file sink was added, false if already logging to a file or on error.
 */
bool Logger::add_file(const std::filesystem::path& fname) {
    if( !m_fname.empty() ){
        // already logging to a file, ignore
        return false;
    }

    std::ofstream file(fname, std::ios::app);
    if( !file.is_open() ){
        m_logger->error("Failed to open log file {}, no log will be saved!", fname);
        return false;
    }
    if( file.tellp() != 0 ){
        file.write("\n\n", 2); // visual sessions separator
    }
    file.close();

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fname.string());

    // if current logger level is DEBUG or TRACE => file level just inherits it
    // otherwise, file level is DEBUG
    if( m_logger->level() != spdlog::level::debug && m_logger->level() != spdlog::level::trace ){
        file_sink->set_level(spdlog::level::debug);
        set_console_level(m_logger->level()); // move current level to console sink
        m_logger->set_level(spdlog::level::debug);
    }

    m_logger->sinks().push_back(file_sink);
    m_fname = fname;
    return true;
}

/**
 * @brief Logs session start information including banner and arguments.
 */
void Logger::start(){
    if( !m_banner.empty() ){
        m_logger->info("==============================================================");
        m_logger->info("{}", m_banner);
        m_logger->info("==============================================================");
    }

    m_logger->info("started as {}", fmt::join(quote_if_needed(m_arguments), " "));
    m_logger->info("logging to {}", m_fname.empty() ? "console only" : m_fname.string());
}

/**
 * @brief Sets the console sink logging level independently from file.
 */
void Logger::set_console_level(spdlog::level::level_enum level) {
    m_logger->sinks().front()->set_level(level); // XXX assuming that first sink is console
}

spdlog::level::level_enum Logger::console_level() const {
    return m_logger->sinks().front()->level();
}
