/**
 * @file PacmanCommand.cpp
 * @brief Colored, animated bar fed from a worker thread.
 *
 * The main thread only waits for the completion callback, which is invoked
 * on the worker's thread of control.
 */

#include "PacmanCommand.hpp"
#include "core/ProgressBar.hpp"
#include "core/errors.hpp"

#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>

REGISTER_COMMAND(PacmanCommand);

PacmanCommand::PacmanCommand(bool reg) : Command(reg, "pacman", "colored bar with an animated head, updated from a worker thread") {
    m_parser.add_argument("-n", "--count").help("number of steps").scan<'i', int64_t>().default_value(int64_t{1000});
    m_parser.add_argument("-d", "--delay").help("delay between steps, ms").scan<'i', int>().default_value(10);
}

int PacmanCommand::run() {
    const int64_t count = m_parser.get<int64_t>("count");
    const auto delay = std::chrono::milliseconds(m_parser.get<int>("delay"));
    if( count <= 0 ){
        // the wait below ends on completion only
        throw Tickbar::InvalidConfiguration(fmt::format("count must be greater than 0, got {}", count));
    }

    std::mutex mtx;
    std::condition_variable cv;
    bool done = false;

    Tickbar::Options opts;
    opts.color_codes = true;
    opts.width = 50;
    opts.theme = Tickbar::Theme {
        " ",                  // saucer
        "[yellow]<[reset]",   // alt saucer head
        "[yellow]-[reset]",   // saucer head
        "[white]•",           // padding
        "[blue]|[reset]",     // bar start
        "[blue]|[reset]",     // bar end
    };
    opts.on_completion = [&](){
        std::lock_guard<std::mutex> lock(mtx);
        done = true;
        cv.notify_one();
    };

    Tickbar::ProgressBar bar(count, bar_options(std::move(opts)));

    std::exception_ptr error;
    std::thread worker([&](){
        try {
            for( int64_t i = 0; i < count; i++ ){
                bar.add(1);
                std::this_thread::sleep_for(delay);
            }
        } catch( ... ){
            error = std::current_exception();
            std::lock_guard<std::mutex> lock(mtx);
            done = true;
            cv.notify_one();
        }
    });

    {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [&]{ return done; });
    }
    worker.join();
    if( error ){
        std::rethrow_exception(error);
    }

    std::cout << "\n ===== progress bar completed ===== \n" << std::endl;
    return 0;
}
