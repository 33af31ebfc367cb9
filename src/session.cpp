#include "toolhost/session.hpp"
#include "toolhost/codec.hpp"
#include "toolhost/dispatcher.hpp"
#include "toolhost/error.hpp"
#include "toolhost/frame_reader.hpp"
#include "toolhost/logging.hpp"
#include "toolhost/protocol_handler.hpp"
#include "toolhost/worker_pool.hpp"

namespace toolhost {

// ----------- ResponseSequencer -----------

ResponseSequencer::ResponseSequencer(FrameSink& sink, std::function<void()> on_failure)
    : sink_(sink), on_failure_(std::move(on_failure)) {
    writer_ = std::thread([this] { write_loop(); });
}

ResponseSequencer::~ResponseSequencer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
    if (writer_.joinable()) writer_.join();
}

void ResponseSequencer::push(std::future<std::string> response) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw std::logic_error("ResponseSequencer is closed");
        }
        queue_.push_back(std::move(response));
    }
    cv_.notify_one();
}

void ResponseSequencer::write_loop() {
    while (true) {
        std::future<std::string> next;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
            if (queue_.empty()) return;
            next = std::move(queue_.front());
            queue_.pop_front();
        }

        // Once the sink is broken the remaining responses are only drained.
        std::string frame;
        try {
            frame = next.get();
        } catch (const std::exception& e) {
            logging::get()->error("Response could not be produced: {}", e.what());
            frame = Codec::serialize(make_error(std::nullopt, error::InternalError, e.what()));
        }
        if (failed_) continue;

        try {
            sink_.write_frame(frame);
            ++written_;
        } catch (const TransportError& e) {
            logging::get()->error("Output stream failed: {}", e.what());
            failure_ = std::current_exception();
            failed_ = true;
            if (on_failure_) on_failure_();
        }
    }
}

void ResponseSequencer::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
    if (writer_.joinable()) writer_.join();
    if (failure_) std::rethrow_exception(failure_);
}

// ----------- Session -----------

Session::Session(Options opts, const ToolRegistry& registry)
    : opts_(std::move(opts)), registry_(registry) {
}

void Session::run(ChunkSource& in, FrameSink& out) {
    auto log = logging::get();
    log->info("{} {} serving {} tool(s)", opts_.server_info.name,
              opts_.server_info.version, registry_.size());
    state_ = SessionState::Active;

    WorkerPool pool(static_cast<size_t>(opts_.worker_threads > 0 ? opts_.worker_threads : 1));
    ToolDispatcher dispatcher(registry_, pool);
    ProtocolHandler handler(ProtocolHandler::Options{opts_.server_info, opts_.protocol_version},
                            registry_, dispatcher);
    ResponseSequencer sequencer(out, [&in] { in.interrupt(); });
    FrameReader reader;

    std::exception_ptr input_failure;
    try {
        while (auto chunk = in.next()) {
            for (auto& frame : reader.feed(*chunk)) {
                sequencer.push(handler.handle_frame(frame));
                ++frames_;
            }
            if (sequencer.failed()) break;
        }
    } catch (const TransportError& e) {
        log->error("Input stream failed: {}", e.what());
        input_failure = std::current_exception();
    }

    if (!reader.pending().empty()) {
        log->debug("Discarding {} byte(s) of unterminated input", reader.pending().size());
    }

    // Write everything already accepted before tearing down the workers.
    try {
        sequencer.close();
    } catch (...) {
        pool.stop();
        state_ = SessionState::Closed;
        throw;
    }
    pool.stop();
    state_ = SessionState::Closed;
    log->info("Session closed after {} frame(s)", frames_.load());

    if (input_failure) std::rethrow_exception(input_failure);
}

} // namespace toolhost
