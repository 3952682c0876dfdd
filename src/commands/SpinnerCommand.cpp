/**
 * @file SpinnerCommand.cpp
 * @brief Unknown-length mode: a spinner with byte counter and throughput.
 */

#include "SpinnerCommand.hpp"
#include "core/ProgressBar.hpp"

#include <thread>

REGISTER_COMMAND(SpinnerCommand);

SpinnerCommand::SpinnerCommand(bool reg) : Command(reg, "spinner", "spinner for work of unknown length") {
    m_parser.add_argument("-n", "--count").help("number of updates before stopping").scan<'i', int64_t>().default_value(int64_t{100});
    m_parser.add_argument("-s", "--step").help("bytes added per update").scan<'i', int64_t>().default_value(int64_t{4096});
    m_parser.add_argument("-d", "--delay").help("delay between updates, ms").scan<'i', int>().default_value(50);
    m_parser.add_argument("-t", "--type").help("spinner style, 0..75").scan<'i', int>().default_value(9);
}

int SpinnerCommand::run() {
    const int64_t count = m_parser.get<int64_t>("count");
    const int64_t step = m_parser.get<int64_t>("step");
    const auto delay = std::chrono::milliseconds(m_parser.get<int>("delay"));

    Tickbar::Options opts;
    opts.spinner_type = m_parser.get<int>("type");
    opts.description = "working";
    opts.show_bytes = true;
    opts.show_count = true;
    opts.use_ansi_codes = true;
    opts.clear_on_finish = true;

    Tickbar::ProgressBar bar(-1, bar_options(std::move(opts)));
    for( int64_t i = 0; i < count; i++ ){
        bar.add64(step);
        std::this_thread::sleep_for(delay);
    }
    bar.halt();
    fmt::print("\n{} processed\n", bytes2human(bar.current_bytes()));
    return 0;
}
