#pragma once
#include <optional>
#include <string>
#include <string_view>

// columns of the terminal attached to stdout (or stderr), empty if neither is a terminal
std::optional<int> terminal_width();

// on-screen columns of a UTF-8 string; escape sequences are NOT skipped
size_t display_width(std::string_view str);

std::string strip_ansi(const std::string& str);

// translates "[red]", "[_blue_]", "[bold]", "[reset]" ... markup into SGR escapes
std::string colorize(const std::string& str);
