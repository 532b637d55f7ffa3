#pragma once

#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include "transport/frame_source.hpp"

namespace agentrun::transport {

// Incremental Server-Sent Events splitter. Bytes go in as they arrive; one
// Frame comes out per blank-line-terminated block.
class SseParser {
public:
    void feed(std::string_view chunk);

    // Flushes a trailing block that was not blank-line terminated.
    void finish();

    std::optional<Frame> pop();
    bool has_frame() const { return !ready_.empty(); }

    void reset();

    static bool is_end_marker(const Frame& frame);

private:
    void consume_block(const std::string& block);

    std::string buffer_;
    std::deque<Frame> ready_;
    bool pending_cr_ = false;
};

}  // namespace agentrun::transport
