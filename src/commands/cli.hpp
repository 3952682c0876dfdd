#pragma once
#include "utils/common.hpp"
#include "core/Options.hpp"

#include <filesystem>
#include <argparse/argparse.hpp>

extern argparse::ArgumentParser program;
extern int verbosity;

void init_log(const std::filesystem::path& log_fname);
void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);
void register_bar_args(argparse::ArgumentParser &parser);
void apply_option_overrides(Tickbar::Options& opts, const argparse::ArgumentParser& parser);
void signal_handler(int sig);
