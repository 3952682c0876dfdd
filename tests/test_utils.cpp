#include "test_utils.hpp"
#include "io/Sink.hpp"

std::string capture_stderr(const std::function<void()>& func) {
    testing::internal::CaptureStderr();
    func();
    return testing::internal::GetCapturedStderr();
}

size_t count_occurrences(const std::string& str, const std::string& sub) {
    size_t count = 0;
    for( size_t pos = str.find(sub); pos != std::string::npos; pos = str.find(sub, pos + sub.size()) ){
        count++;
    }
    return count;
}

std::vector<std::string> split(const std::string& str, const char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(str);

    while (std::getline(tokenStream, token, delimiter)) {
        tokens.push_back(token);
    }

    return tokens;
}

Tickbar::Options test_options(std::ostringstream& out, FakeClock& clock) {
    Tickbar::Options opts;
    opts.sink = std::make_shared<Tickbar::StreamSink>(out);
    opts.clock = clock.fn();
    opts.term_width = [] { return std::optional<int>(); };
    opts.width = 10;
    return opts;
}
