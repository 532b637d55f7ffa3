#include "transport/sse_parser.hpp"

#include <utility>

namespace agentrun::transport {

namespace {

constexpr const char* kEndMarker = "[DONE]";

std::string field_value(const std::string& line, const std::size_t colon) {
    if (colon == std::string::npos) {
        return "";
    }
    std::size_t start = colon + 1;
    if (start < line.size() && line[start] == ' ') {
        ++start;
    }
    return line.substr(start);
}

}  // namespace

void SseParser::feed(const std::string_view chunk) {
    // CRLF, LF and a lone CR all end a line; each becomes one LF. A CR at
    // the end of a chunk may pair with an LF at the start of the next one.
    buffer_.reserve(buffer_.size() + chunk.size());
    for (const char c : chunk) {
        if (pending_cr_) {
            pending_cr_ = false;
            if (c == '\n') {
                continue;
            }
        }
        if (c == '\r') {
            buffer_.push_back('\n');
            pending_cr_ = true;
        } else {
            buffer_.push_back(c);
        }
    }

    std::size_t boundary = buffer_.find("\n\n");
    while (boundary != std::string::npos) {
        consume_block(buffer_.substr(0, boundary));
        buffer_.erase(0, boundary + 2);
        boundary = buffer_.find("\n\n");
    }
}

void SseParser::finish() {
    if (buffer_.empty()) {
        return;
    }
    std::string tail = std::move(buffer_);
    buffer_.clear();
    while (!tail.empty() && tail.back() == '\n') {
        tail.pop_back();
    }
    if (!tail.empty()) {
        consume_block(tail);
    }
}

void SseParser::consume_block(const std::string& block) {
    Frame frame;
    frame.raw = block;
    bool has_data = false;
    bool has_event = false;

    std::size_t line_start = 0;
    while (line_start <= block.size()) {
        std::size_t line_end = block.find('\n', line_start);
        if (line_end == std::string::npos) {
            line_end = block.size();
        }
        const std::string line = block.substr(line_start, line_end - line_start);
        line_start = line_end + 1;

        if (line.empty() || line.front() == ':') {
            continue;  // comment / keep-alive
        }
        const std::size_t colon = line.find(':');
        const std::string name = line.substr(0, colon);
        const std::string value = field_value(line, colon);
        if (name == "data") {
            if (has_data) {
                frame.data.push_back('\n');
            }
            frame.data += value;
            has_data = true;
        } else if (name == "event") {
            frame.event = value;
            has_event = true;
        } else if (name == "id") {
            frame.id = value;
        }
        // "retry" and unknown fields are ignored.
    }

    if (has_data || has_event) {
        ready_.push_back(std::move(frame));
    }
}

std::optional<Frame> SseParser::pop() {
    if (ready_.empty()) {
        return std::nullopt;
    }
    Frame frame = std::move(ready_.front());
    ready_.pop_front();
    return frame;
}

void SseParser::reset() {
    buffer_.clear();
    pending_cr_ = false;
    ready_.clear();
}

bool SseParser::is_end_marker(const Frame& frame) {
    return frame.data == kEndMarker;
}

}  // namespace agentrun::transport
