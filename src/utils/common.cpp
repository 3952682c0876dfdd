/**
 * @file common.cpp
 * @brief Implementation of common utilities and global variables.
 *
 * Holds the process-wide logger instance and the small text parsers shared by
 * the option table and the command line front-end.
 */

#include "common.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

/**
 * @brief Creates the library logger.
 *
 * Diagnostics go to stderr so they never interleave with a progress line
 * drawn on stdout. Only warnings and above are shown until the verbosity is
 * raised.
 */
static std::shared_ptr<spdlog::logger> make_default_logger(){
    auto existing = spdlog::get(APP_NAME);
    if( existing ){
        return existing;
    }
    auto l = spdlog::stderr_color_mt(APP_NAME);
    l->set_level(spdlog::level::warn);
    l->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    return l;
}

std::shared_ptr<Logger> logger = std::make_shared<Logger>(make_default_logger());

bool parse_bool(const std::string& value){
    if( value == "1" || value == "true" || value == "yes" ){
        return true;
    }
    if( value == "0" || value == "false" || value == "no" ){
        return false;
    }
    throw std::runtime_error("Invalid boolean value: " + value);
}

/**
 * @brief Parses a signed decimal integer, rejecting trailing garbage.
 * @throws std::runtime_error If the string is not a complete integer.
 */
int64_t parse_int(const std::string& value){
    size_t pos = 0;
    long long result = 0;
    try {
        result = std::stoll(value, &pos, 10);
    } catch( const std::logic_error& ){
        throw std::runtime_error("Invalid integer value: " + value);
    }
    if( pos != value.size() ){
        throw std::runtime_error("Invalid integer value: " + value);
    }
    return result;
}
