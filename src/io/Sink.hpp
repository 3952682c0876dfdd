#pragma once
#include <memory>
#include <ostream>
#include <string_view>

namespace Tickbar {

// destination of the rendered progress line
class Sink {
    public:
    virtual ~Sink() {}

    // throws WriteFailure
    virtual void write(std::string_view str) = 0;

    // best effort, never throws
    virtual void sync() {}
};

// writes to a raw file descriptor, does not own it
class FdSink : public Sink {
    public:
    explicit FdSink(int fd) : m_fd(fd) {}

    void write(std::string_view str) override;
    void sync() override;

    int fd() const { return m_fd; }

    static std::shared_ptr<FdSink> stdout_sink();
    static std::shared_ptr<FdSink> stderr_sink();

    private:
    int m_fd;
};

// writes to a std::ostream owned by the caller
class StreamSink : public Sink {
    public:
    explicit StreamSink(std::ostream& os) : m_os(os) {}

    void write(std::string_view str) override;
    void sync() override;

    private:
    std::ostream& m_os;
};

} // namespace Tickbar
