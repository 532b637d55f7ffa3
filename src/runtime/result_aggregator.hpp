#pragma once

#include "protocol/run_execution_contract.hpp"
#include "protocol/run_log.hpp"
#include "runtime/conversation_state_machine.hpp"

namespace agentrun::runtime {

// Builds the immutable RunResult from a terminal snapshot. Pure: no I/O.
// Partial answer text and every attempted tool call survive failed runs.
protocol::RunResult aggregate(const ConversationSnapshot& snapshot,
                              const protocol::RunLog& log);

// Rebuilds a RunResult from a persisted log alone by driving a fresh state
// machine through its entries. A log that neither ends in a terminal entry
// nor records an abandoned connection is treated as a closed stream.
protocol::RunResult replay(const protocol::RunLog& log);

}  // namespace agentrun::runtime
