#pragma once

#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/event_contract.hpp"
#include "transport/frame_source.hpp"

namespace agentrun::decoder {

// Maps one SSE frame to one typed Event. Pure and stateless: the result
// depends only on the frame. Unknown event names become Status{"unknown"};
// unparseable frames become a Decode error carrying the raw frame in `hint`.
class EventDecoder {
public:
    core::errors::Result<protocol::Event> decode(const transport::Frame& frame) const;
};

}  // namespace agentrun::decoder
