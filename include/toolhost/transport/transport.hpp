#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace toolhost {

/// Pull-based input: yields raw chunks in arrival order.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    /// Block until the next chunk arrives. std::nullopt means end of stream
    /// (or interrupt()). Throws TransportError on a read failure.
    [[nodiscard]] virtual std::optional<std::string> next() = 0;

    /// Make a blocked or future next() return end of stream. Thread-safe.
    virtual void interrupt() = 0;
};

/// Serialized output: each write_frame is one atomic "frame + '\n'" append.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    /// Throws TransportError if the frame could not be fully written.
    virtual void write_frame(std::string_view frame) = 0;
};

} // namespace toolhost
