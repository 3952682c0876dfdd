#pragma once
#include "io/Logger.hpp"
#include "units.hpp"

#include <string>
#include <memory>
#include <cstdint>

#define APP_NAME "tickbar"

#define ANSI_CLEAR_LINE    "\x1b[2K"

extern std::shared_ptr<Logger> logger;

bool parse_bool(const std::string& value);
int64_t parse_int(const std::string& value);
