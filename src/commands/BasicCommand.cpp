/**
 * @file BasicCommand.cpp
 * @brief Drives a progress bar with the recommended defaults over a fixed
 *        number of steps.
 */

#include "BasicCommand.hpp"
#include "core/ProgressBar.hpp"

#include <thread>

REGISTER_COMMAND(BasicCommand);

BasicCommand::BasicCommand(bool reg) : Command(reg, "basic", "default progress bar on stderr") {
    m_parser.add_argument("-n", "--count").help("number of steps").scan<'i', int64_t>().default_value(int64_t{50});
    m_parser.add_argument("-d", "--delay").help("delay between steps, ms").scan<'i', int>().default_value(40);
    m_parser.add_argument("-D", "--description").help("text shown in front of the bar").default_value(std::string{});
}

int BasicCommand::run() {
    const int64_t count = m_parser.get<int64_t>("count");
    const auto delay = std::chrono::milliseconds(m_parser.get<int>("delay"));

    Tickbar::ProgressBar bar(count, bar_options(Tickbar::ProgressBar::default_options(m_parser.get("--description"))));
    for( int64_t i = 0; i < count; i++ ){
        bar.add(1);
        std::this_thread::sleep_for(delay);
    }
    logger->info("done: {}", bar.str());
    return 0;
}
