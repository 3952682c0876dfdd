#pragma once
#include <cstdint>
#include <string>
#include <utility>

// value and unit suffix (" B", " KB", ...) kept apart so callers can share one suffix
std::pair<std::string, std::string> humanize_bytes(double size);
std::string bytes2human(double size);

std::string seconds2human(int64_t seconds);
