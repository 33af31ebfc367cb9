#pragma once
#include "registry.hpp"
#include "types.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace toolhost {

enum class SessionState {
    Active,
    Closed
};

/// Writes responses in the order they were pushed, whatever order they
/// complete in. A single writer thread waits on the oldest pending response.
class ResponseSequencer {
public:
    /// on_failure runs once, on the writer thread, after an output fault.
    explicit ResponseSequencer(FrameSink& sink, std::function<void()> on_failure = nullptr);
    ~ResponseSequencer();

    ResponseSequencer(const ResponseSequencer&) = delete;
    ResponseSequencer& operator=(const ResponseSequencer&) = delete;

    void push(std::future<std::string> response);

    /// Stop accepting responses and wait until every queued one is written.
    /// Rethrows the output fault, if any.
    void close();

    [[nodiscard]] bool failed() const { return failed_; }
    [[nodiscard]] size_t written() const { return written_; }

private:
    void write_loop();

    FrameSink& sink_;
    std::function<void()> on_failure_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::future<std::string>> queue_;
    bool closed_{false};

    std::atomic<bool> failed_{false};
    std::atomic<size_t> written_{0};
    std::exception_ptr failure_;
    std::thread writer_;
};

/// One protocol session: reads frames until end of stream, answers each
/// one, and returns once every response has been written.
class Session {
public:
    struct Options {
        Implementation server_info;
        std::string protocol_version = std::string(PROTOCOL_VERSION);
        int worker_threads = 4;
    };

    Session(Options opts, const ToolRegistry& registry);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Serve until the input reaches end of stream.
    /// Throws TransportError on an input or output fault.
    void run(ChunkSource& in, FrameSink& out);

    [[nodiscard]] SessionState state() const { return state_; }

    /// Frames answered so far.
    [[nodiscard]] size_t frames_processed() const { return frames_; }

private:
    Options opts_;
    const ToolRegistry& registry_;
    std::atomic<SessionState> state_{SessionState::Active};
    std::atomic<size_t> frames_{0};
};

} // namespace toolhost
