#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace toolhost {

/// Reassembles newline-delimited frames from arbitrarily sized chunks.
///
/// A frame is emitted only once its terminating '\n' has arrived; the
/// unterminated tail stays buffered until more input comes. Empty and
/// whitespace-only frames are dropped. The output does not depend on how
/// the input was chunked.
class FrameReader {
public:
    /// Append a chunk and return the frames it completed, in order.
    [[nodiscard]] std::vector<std::string> feed(std::string_view chunk);

    /// The buffered, still unterminated tail.
    [[nodiscard]] const std::string& pending() const { return buffer_; }

    void reset() { buffer_.clear(); }

private:
    std::string buffer_;
};

/// True if s contains only JSON whitespace (space, tab, CR, LF) or is empty.
[[nodiscard]] bool is_blank(std::string_view s);

} // namespace toolhost
