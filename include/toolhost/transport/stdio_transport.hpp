#pragma once
#include "transport.hpp"
#include <atomic>
#include <mutex>

namespace toolhost {

/// Reads chunks from a file descriptor (stdin by default).
/// Uses poll() with a wakeup pipe so interrupt() can cut a blocking read short.
class FdChunkSource : public ChunkSource {
public:
    /// Read from STDIN_FILENO.
    FdChunkSource();

    /// Read from fd. The descriptor is closed on destruction if owns_fd is set.
    explicit FdChunkSource(int fd, bool owns_fd = false, size_t chunk_size = 4096);

    ~FdChunkSource() override;

    FdChunkSource(const FdChunkSource&) = delete;
    FdChunkSource& operator=(const FdChunkSource&) = delete;

    std::optional<std::string> next() override;
    void interrupt() override;

private:
    int fd_;
    bool owns_fd_;
    size_t chunk_size_;
    int wakeup_pipe_[2]{-1, -1};
    std::atomic<bool> interrupted_{false};
};

/// Writes newline-terminated frames to a file descriptor (stdout by default).
class FdFrameSink : public FrameSink {
public:
    FdFrameSink();
    explicit FdFrameSink(int fd, bool owns_fd = false);
    ~FdFrameSink() override;

    FdFrameSink(const FdFrameSink&) = delete;
    FdFrameSink& operator=(const FdFrameSink&) = delete;

    void write_frame(std::string_view frame) override;

private:
    int fd_;
    bool owns_fd_;
    std::mutex write_mutex_;
};

} // namespace toolhost
