#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_log.hpp"
#include "runtime/conversation_state_machine.hpp"

namespace {

using agentrun::core::errors::ErrorCategory;
using agentrun::protocol::ContentKind;
using agentrun::protocol::DecodePolicy;
using agentrun::protocol::DroppedFrame;
using agentrun::protocol::ErrorEvent;
using agentrun::protocol::Event;
using agentrun::protocol::FinalEvent;
using agentrun::protocol::Role;
using agentrun::protocol::StatusEvent;
using agentrun::protocol::StreamEnd;
using agentrun::protocol::StreamEndCause;
using agentrun::protocol::TextDeltaEvent;
using agentrun::protocol::ToolCallResultEvent;
using agentrun::protocol::ToolCallStartEvent;
using agentrun::protocol::ToolCallState;
using agentrun::runtime::ConversationStateMachine;
using agentrun::runtime::MachineState;
using nlohmann::json;

ToolCallStartEvent tool_start(const std::string& id, const std::string& name = "search") {
    return ToolCallStartEvent{id, name, json::object()};
}

ToolCallResultEvent tool_result(const std::string& id, json payload, bool failed = false) {
    return ToolCallResultEvent{id, std::move(payload), failed};
}

void feed(ConversationStateMachine& machine, const std::vector<Event>& events) {
    for (const auto& event : events) {
        machine.on_event(event);
    }
}

TEST(ConversationStateMachineTest, StartsIdleAndStreamsOnFirstEvent) {
    ConversationStateMachine machine;
    EXPECT_EQ(machine.state(), MachineState::Idle);
    EXPECT_FALSE(machine.has_observed_event());

    machine.on_event(StatusEvent{"thinking"});
    EXPECT_EQ(machine.state(), MachineState::Streaming);
    EXPECT_TRUE(machine.has_observed_event());
    EXPECT_EQ(machine.snapshot().last_phase.value(), "thinking");
}

TEST(ConversationStateMachineTest, PlainAnswerCompletes) {
    ConversationStateMachine machine;
    feed(machine, {TextDeltaEvent{"Sales "}, TextDeltaEvent{"up 5%"}, FinalEvent{}});

    const auto& snapshot = machine.snapshot();
    EXPECT_EQ(snapshot.state, MachineState::Completed);
    EXPECT_EQ(snapshot.answer, "Sales up 5%");
    EXPECT_TRUE(snapshot.tool_calls.empty());
    EXPECT_FALSE(snapshot.error.has_value());
    EXPECT_EQ(snapshot.events.size(), 3u);
}

TEST(ConversationStateMachineTest, ToolCallRoundTripCompletes) {
    ConversationStateMachine machine;
    feed(machine, {tool_start("1"), TextDeltaEvent{"Checking..."},
                   tool_result("1", json{{"hits", 3}}),
                   TextDeltaEvent{" Found 3 matches."}, FinalEvent{}});

    const auto& snapshot = machine.snapshot();
    EXPECT_EQ(snapshot.state, MachineState::Completed);
    EXPECT_EQ(snapshot.answer, "Checking... Found 3 matches.");
    ASSERT_EQ(snapshot.tool_calls.size(), 1u);
    EXPECT_EQ(snapshot.tool_calls[0].id, "1");
    EXPECT_EQ(snapshot.tool_calls[0].name, "search");
    EXPECT_EQ(snapshot.tool_calls[0].state, ToolCallState::Completed);
    EXPECT_EQ(snapshot.tool_calls[0].result, json({{"hits", 3}}));
}

TEST(ConversationStateMachineTest, FinalWithOpenToolCallIsIncomplete) {
    ConversationStateMachine machine;
    feed(machine, {tool_start("1"), FinalEvent{}});

    const auto& snapshot = machine.snapshot();
    EXPECT_EQ(snapshot.state, MachineState::Failed);
    ASSERT_TRUE(snapshot.error.has_value());
    EXPECT_EQ(snapshot.error->category, ErrorCategory::IncompleteToolCall);
    ASSERT_EQ(snapshot.tool_calls.size(), 1u);
    EXPECT_EQ(snapshot.tool_calls[0].state, ToolCallState::Started);
}

TEST(ConversationStateMachineTest, ClosedStreamKeepsPartialAnswer) {
    ConversationStateMachine machine;
    machine.on_event(TextDeltaEvent{"partial"});
    machine.on_stream_end(StreamEnd{StreamEndCause::Closed, ""});

    const auto& snapshot = machine.snapshot();
    EXPECT_EQ(snapshot.state, MachineState::Failed);
    ASSERT_TRUE(snapshot.error.has_value());
    EXPECT_EQ(snapshot.error->category, ErrorCategory::UnexpectedEndOfStream);
    EXPECT_EQ(snapshot.answer, "partial");
}

TEST(ConversationStateMachineTest, DeadlineTimesOut) {
    ConversationStateMachine machine;
    machine.on_event(TextDeltaEvent{"slow"});
    machine.on_stream_end(StreamEnd{StreamEndCause::DeadlineExceeded, ""});

    EXPECT_EQ(machine.state(), MachineState::TimedOut);
    ASSERT_TRUE(machine.snapshot().error.has_value());
    EXPECT_EQ(machine.snapshot().error->category, ErrorCategory::Timeout);
    EXPECT_EQ(machine.snapshot().answer, "slow");
}

TEST(ConversationStateMachineTest, DeadlineBeforeAnyEventTimesOut) {
    ConversationStateMachine machine;
    machine.on_stream_end(StreamEnd{StreamEndCause::DeadlineExceeded, ""});
    EXPECT_EQ(machine.state(), MachineState::TimedOut);
}

TEST(ConversationStateMachineTest, DuplicateStartIsProtocolError) {
    ConversationStateMachine machine;
    feed(machine, {tool_start("1"), tool_start("1", "analyst")});

    EXPECT_EQ(machine.state(), MachineState::Failed);
    EXPECT_EQ(machine.snapshot().error->category, ErrorCategory::Protocol);
    EXPECT_EQ(machine.snapshot().error->code, "duplicate_tool_call_id");
}

TEST(ConversationStateMachineTest, ResultForUnknownIdIsProtocolError) {
    ConversationStateMachine machine;
    feed(machine, {tool_start("1"), tool_result("2", json{{"hits", 0}})});

    EXPECT_EQ(machine.state(), MachineState::Failed);
    EXPECT_EQ(machine.snapshot().error->category, ErrorCategory::Protocol);
    EXPECT_EQ(machine.snapshot().error->code, "unknown_tool_call_id");
}

TEST(ConversationStateMachineTest, SecondResultForSameIdIsProtocolError) {
    ConversationStateMachine machine;
    feed(machine, {tool_start("1"), tool_result("1", json(1)), tool_result("1", json(2))});

    EXPECT_EQ(machine.state(), MachineState::Failed);
    EXPECT_EQ(machine.snapshot().error->code, "duplicate_tool_call_result");
    EXPECT_EQ(machine.snapshot().tool_calls[0].result, json(1));
}

TEST(ConversationStateMachineTest, ToolReportedErrorMarksCallFailedButRunCompletes) {
    ConversationStateMachine machine;
    feed(machine, {tool_start("1"), tool_result("1", json("timeout"), true),
                   TextDeltaEvent{"The search failed."}, FinalEvent{}});

    EXPECT_EQ(machine.state(), MachineState::Completed);
    EXPECT_EQ(machine.snapshot().tool_calls[0].state, ToolCallState::Failed);
    EXPECT_EQ(machine.open_tool_calls(), 0u);
}

TEST(ConversationStateMachineTest, AgentErrorFailsRunWithRemoteKind) {
    ConversationStateMachine machine;
    feed(machine, {TextDeltaEvent{"Hal"}, ErrorEvent{"overloaded", "try later"}});

    EXPECT_EQ(machine.state(), MachineState::Failed);
    EXPECT_EQ(machine.snapshot().error->category, ErrorCategory::Remote);
    EXPECT_EQ(machine.snapshot().error->code, "overloaded");
    EXPECT_EQ(machine.snapshot().error->message, "try later");
    EXPECT_EQ(machine.snapshot().answer, "Hal");
}

TEST(ConversationStateMachineTest, IgnoresInputAfterTerminalState) {
    ConversationStateMachine machine;
    feed(machine, {TextDeltaEvent{"done"}, FinalEvent{}, TextDeltaEvent{" more"},
                   ErrorEvent{"late", "ignored"}});
    machine.on_stream_end(StreamEnd{StreamEndCause::Closed, ""});

    EXPECT_EQ(machine.state(), MachineState::Completed);
    EXPECT_EQ(machine.snapshot().answer, "done");
    EXPECT_EQ(machine.snapshot().events.size(), 2u);
    EXPECT_FALSE(machine.snapshot().error.has_value());
}

TEST(ConversationStateMachineTest, DroppedFramesAreCountedWhenLenient) {
    ConversationStateMachine machine;
    machine.on_event(TextDeltaEvent{"a"});
    machine.on_dropped_frame(DroppedFrame{"data: {", "data is not valid JSON"});
    machine.on_event(FinalEvent{});

    EXPECT_EQ(machine.state(), MachineState::Completed);
    EXPECT_EQ(machine.snapshot().dropped_frames, 1u);
}

TEST(ConversationStateMachineTest, DroppedFrameFailsRunInStrictMode) {
    ConversationStateMachine machine(DecodePolicy{true});
    machine.on_event(TextDeltaEvent{"a"});
    machine.on_dropped_frame(DroppedFrame{"data: {", "data is not valid JSON"});

    EXPECT_EQ(machine.state(), MachineState::Failed);
    EXPECT_EQ(machine.snapshot().error->category, ErrorCategory::Decode);
    EXPECT_EQ(machine.snapshot().error->hint, "data: {");
}

TEST(ConversationStateMachineTest, StrictModeHintIsValidUtf8) {
    ConversationStateMachine machine(DecodePolicy{true});
    machine.on_dropped_frame(DroppedFrame{"data: {\"text\":\"\xff\"}", "data is not valid JSON"});

    ASSERT_EQ(machine.state(), MachineState::Failed);
    EXPECT_EQ(machine.snapshot().error->hint, "data: {\"text\":\"\xEF\xBF\xBD\"}");
}

TEST(ConversationStateMachineTest, AnswerIsConcatenationInArrivalOrder) {
    const std::vector<std::string> pieces = {"a", "", "bc", " ", "d\n", "\xE2\x80\xA6", "e"};
    ConversationStateMachine machine;
    std::string expected;
    for (std::size_t i = 0; i < pieces.size(); ++i) {
        machine.on_event(TextDeltaEvent{pieces[i]});
        expected += pieces[i];
        if (i == 2) {
            machine.on_event(StatusEvent{"searching"});
        }
    }
    machine.on_event(FinalEvent{});
    EXPECT_EQ(machine.snapshot().answer, expected);
}

TEST(ConversationStateMachineTest, CompletedRunsHaveNoOpenToolCalls) {
    const std::vector<std::vector<Event>> runs = {
        {tool_start("a"), tool_start("b"), tool_result("b", json(1)), tool_result("a", json(2)), FinalEvent{}},
        {tool_start("a"), tool_result("a", json(1)), tool_start("b"), FinalEvent{}},
        {TextDeltaEvent{"x"}, tool_start("a"), tool_start("b"), tool_result("a", json(1)), FinalEvent{}},
    };
    for (const auto& events : runs) {
        ConversationStateMachine machine;
        feed(machine, events);
        if (machine.state() == MachineState::Completed) {
            for (const auto& call : machine.snapshot().tool_calls) {
                EXPECT_NE(call.state, ToolCallState::Started);
            }
        } else {
            ASSERT_EQ(machine.snapshot().error->category, ErrorCategory::IncompleteToolCall);
            EXPECT_GT(machine.open_tool_calls(), 0u);
        }
    }
}

TEST(ConversationStateMachineTest, BuildsTranscriptMessages) {
    ConversationStateMachine machine;
    feed(machine, {TextDeltaEvent{"Let me "}, TextDeltaEvent{"check."}, tool_start("1"),
                   tool_result("1", json{{"hits", 3}}), TextDeltaEvent{"Three hits."},
                   FinalEvent{}});

    const auto& messages = machine.snapshot().streamed_messages;
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].role, Role::Agent);
    ASSERT_EQ(messages[0].parts.size(), 1u);
    EXPECT_EQ(messages[0].parts[0].text, "Let me check.");
    EXPECT_EQ(messages[1].role, Role::Tool);
    EXPECT_EQ(messages[1].parts[0].kind, ContentKind::ToolResult);
    EXPECT_EQ(messages[1].parts[0].tool_call_id, "1");
    EXPECT_EQ(messages[2].parts[0].text, "Three hits.");
}

TEST(ConversationStateMachineTest, TerminalTimestampComesFromEndingEntry) {
    ConversationStateMachine machine;
    agentrun::protocol::LogEntry first{0, 1000, Event{TextDeltaEvent{"x"}}};
    agentrun::protocol::LogEntry last{1, 1250, Event{FinalEvent{}}};
    machine.consume(first);
    EXPECT_FALSE(machine.snapshot().terminal_ts_unix_ms.has_value());
    machine.consume(last);
    ASSERT_TRUE(machine.snapshot().terminal_ts_unix_ms.has_value());
    EXPECT_EQ(machine.snapshot().terminal_ts_unix_ms.value(), 1250);
}

} // namespace
