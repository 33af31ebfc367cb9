#include "toolhost/transport/stdio_transport.hpp"
#include "toolhost/error.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace toolhost {

// ---------- FdChunkSource ----------

FdChunkSource::FdChunkSource()
    : FdChunkSource(STDIN_FILENO, false) {
}

FdChunkSource::FdChunkSource(int fd, bool owns_fd, size_t chunk_size)
    : fd_(fd), owns_fd_(owns_fd), chunk_size_(chunk_size == 0 ? 4096 : chunk_size) {
    if (pipe(wakeup_pipe_) < 0) {
        throw TransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    int flags = fcntl(wakeup_pipe_[1], F_GETFL, 0);
    fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

FdChunkSource::~FdChunkSource() {
    if (owns_fd_ && fd_ >= 0) ::close(fd_);
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

std::optional<std::string> FdChunkSource::next() {
    std::vector<char> chunk(chunk_size_);

    while (!interrupted_) {
        struct pollfd fds[2];
        fds[0].fd = fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("poll failed: ") + strerror(errno));
        }

        if (fds[1].revents & POLLIN) break;

        // POLLHUP without POLLIN still needs a read() to observe EOF.
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(fd_, chunk.data(), chunk.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw TransportError(std::string("Read error: ") + strerror(errno));
        }
        if (n == 0) {
            return std::nullopt;
        }
        return std::string(chunk.data(), static_cast<size_t>(n));
    }
    return std::nullopt;
}

void FdChunkSource::interrupt() {
    if (interrupted_.exchange(true)) return;
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        // Best effort: the flag alone is enough once poll() returns.
        (void)::write(wakeup_pipe_[1], &b, 1);
    }
}

// ---------- FdFrameSink ----------

FdFrameSink::FdFrameSink()
    : FdFrameSink(STDOUT_FILENO, false) {
}

FdFrameSink::FdFrameSink(int fd, bool owns_fd)
    : fd_(fd), owns_fd_(owns_fd) {
}

FdFrameSink::~FdFrameSink() {
    if (owns_fd_ && fd_ >= 0) ::close(fd_);
}

void FdFrameSink::write_frame(std::string_view frame) {
    std::string line;
    line.reserve(frame.size() + 1);
    line.append(frame.data(), frame.size());
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    const char* data = line.data();
    size_t remaining = line.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("Write error: ") + strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

} // namespace toolhost
