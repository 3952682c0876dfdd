/**
 * @file Sink.cpp
 * @brief Output sinks for the progress line.
 *
 * FdSink writes straight to a file descriptor, retrying interrupted writes
 * and short writes until the whole line is out. StreamSink adapts any
 * std::ostream, which is what the tests capture output with.
 */

#include "Sink.hpp"
#include "core/errors.hpp"
#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace Tickbar {

/**
 * @brief Writes the whole string to the descriptor.
 *
 * Retries on EINTR and continues after partial writes.
 *
 * @throws WriteFailure On write error or if write returns 0 bytes.
 */
void FdSink::write(std::string_view str) {
    const char* ptr = str.data();
    size_t remaining = str.size();

    while (remaining > 0) {
        ssize_t nwritten = ::write(m_fd, ptr, remaining);
        if (nwritten == -1) {
            if (errno == EINTR) {
                continue; // Retry on signal interruption
            }
            throw WriteFailure(fmt::format("FdSink: write({}, {}): {}", m_fd, remaining, strerror(errno)));
        }
        if (nwritten == 0) {
            throw WriteFailure(fmt::format("FdSink: write({}, {}): write returned 0 bytes", m_fd, remaining));
        }

        ptr += nwritten;
        remaining -= nwritten;
    }
}

void FdSink::sync() {
    // ttys and pipes refuse fsync() on some systems, the result is irrelevant
    (void)fsync(m_fd);
}

std::shared_ptr<FdSink> FdSink::stdout_sink() {
    static std::shared_ptr<FdSink> sink = std::make_shared<FdSink>(STDOUT_FILENO);
    return sink;
}

std::shared_ptr<FdSink> FdSink::stderr_sink() {
    static std::shared_ptr<FdSink> sink = std::make_shared<FdSink>(STDERR_FILENO);
    return sink;
}

void StreamSink::write(std::string_view str) {
    m_os.write(str.data(), str.size());
    if (!m_os) {
        throw WriteFailure("StreamSink: stream is in a failed state");
    }
}

void StreamSink::sync() {
    m_os.flush();
}

} // namespace Tickbar
