#include "toolhost/frame_reader.hpp"

namespace toolhost {

bool is_blank(std::string_view s) {
    for (char c : s) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != '\f' && c != '\v') {
            return false;
        }
    }
    return true;
}

std::vector<std::string> FrameReader::feed(std::string_view chunk) {
    std::vector<std::string> frames;

    // Only the new bytes can contain newlines not yet seen.
    size_t search_from = buffer_.size();
    buffer_.append(chunk.data(), chunk.size());

    size_t pos = 0;
    while (true) {
        size_t nl = buffer_.find('\n', search_from);
        if (nl == std::string::npos) break;

        std::string_view line(buffer_.data() + pos, nl - pos);
        if (!is_blank(line)) {
            frames.emplace_back(line);
        }
        pos = nl + 1;
        search_from = pos;
    }

    if (pos > 0) {
        buffer_.erase(0, pos);
    }
    return frames;
}

} // namespace toolhost
