/**
 * @file test_voice_session.cpp
 * @brief Tests for the per-connection session state machine
 */

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "rey/session/rey_session.h"
#include "test_fakes.h"

using namespace rey;
using namespace rey::test;
using namespace std::chrono;

namespace {

struct Harness {
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    std::shared_ptr<ScriptedBackend> backend;
    FixedTranscriber* transcriber = nullptr;
    std::unique_ptr<VoiceSession> session;

    Harness(BackendReply reply, const std::string& transcript, SessionConfig config,
            milliseconds backend_delay = milliseconds(0), bool with_transcriber = true,
            std::unique_ptr<SynthesisChain> synthesis = nullptr) {
        backend = std::make_shared<ScriptedBackend>(std::move(reply), backend_delay);

        SessionComponents components;
        components.classifier = std::make_unique<LoudnessClassifier>();
        if (with_transcriber) {
            auto stt = std::make_unique<FixedTranscriber>(transcript);
            transcriber = stt.get();
            components.transcriber = std::move(stt);
        }
        components.synthesis = synthesis ? std::move(synthesis) : audio_chain();
        components.backend = backend;

        session = std::make_unique<VoiceSession>("test-session", sink, std::move(components),
                                                 config);
        session->start();
    }

    Harness(BackendReply reply, const std::string& transcript)
        : Harness(std::move(reply), transcript, fast_session_config()) {}

    void control(const std::string& type) {
        session->handle_control(std::string("{\"type\":\"") + type + "\"}");
    }

    void feed(const AudioFrame& frame, int count) {
        for (int i = 0; i < count; ++i) {
            session->handle_audio(frame);
        }
    }

    bool idle() { return session->wait_until_idle(milliseconds(3000)); }
};

}  // namespace

// =============================================================================
// LIFECYCLE
// =============================================================================

TEST(VoiceSession, StartAnnouncesReady) {
    Harness h(BackendReply::ok("hi"), "hello there");
    auto states = h.sink->messages_of_type("state");
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0]["state"], "waiting");
    EXPECT_EQ(states[0]["message"], "Ready");
    EXPECT_EQ(h.session->state(), SessionState::WaitingForWake);
}

TEST(VoiceSession, GeneratedIdsDiffer) {
    EXPECT_NE(VoiceSession::generate_id(), VoiceSession::generate_id());
}

// =============================================================================
// TURN FLOW
// =============================================================================

TEST(VoiceSession, SilenceAloneNeverWakes) {
    Harness h(BackendReply::ok("hi"), "hello there");
    h.feed(silent_frame(), 100);
    EXPECT_EQ(h.session->state(), SessionState::WaitingForWake);
    EXPECT_EQ(h.session->buffered_frames(), 0u);
}

TEST(VoiceSession, WakeWordStartsListening) {
    Harness h(BackendReply::ok("hi"), "hello there");
    h.feed(silent_frame(), 5);
    h.feed(loud_frame(), 1);
    EXPECT_EQ(h.session->state(), SessionState::Listening);
    // The frame that carried the wake word is not part of the turn
    EXPECT_EQ(h.session->buffered_frames(), 0u);

    auto states = h.sink->messages_of_type("state");
    ASSERT_EQ(states.size(), 2u);
    EXPECT_EQ(states[1]["state"], "listening");
    EXPECT_EQ(states[1]["message"], "I'm listening...");
}

TEST(VoiceSession, EndOfTurnAfterSilenceRun) {
    Harness h(BackendReply::ok("Sure thing!"), "what time is it");

    // 20 silent frames: no wake
    h.feed(silent_frame(), 20);
    EXPECT_EQ(h.session->state(), SessionState::WaitingForWake);

    h.control("wake-trigger");
    ASSERT_EQ(h.session->state(), SessionState::Listening);

    // 10 loud + 30 silent: silence run equals, but does not exceed, the threshold
    h.feed(loud_frame(), 10);
    h.feed(silent_frame(), 30);
    EXPECT_EQ(h.session->state(), SessionState::Listening);
    EXPECT_EQ(h.session->buffered_frames(), 40u);

    // Frame 41 of the turn ends it
    h.feed(silent_frame(), 1);
    EXPECT_NE(h.session->state(), SessionState::Listening);

    // Remaining frames are dropped while the turn is in flight
    h.feed(silent_frame(), 9);

    ASSERT_TRUE(h.idle());
    EXPECT_EQ(h.transcriber->last_samples(), 41u * DEFAULT_FRAME_SAMPLES);

    auto states = h.sink->states();
    ASSERT_EQ(states.size(), 5u);
    EXPECT_EQ(states[0], "waiting");
    EXPECT_EQ(states[1], "listening");
    EXPECT_EQ(states[2], "processing");
    EXPECT_EQ(states[3], "speaking");
    EXPECT_EQ(states[4], "waiting");

    auto responses = h.sink->messages_of_type("response");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0]["user_text"], "what time is it");
    EXPECT_EQ(responses[0]["rey_text"], "Sure thing!");
    EXPECT_EQ(responses[0]["expression"], "happy");
    EXPECT_EQ(h.sink->binary_count(), 1u);
    EXPECT_EQ(h.backend->calls.load(), 1);
    EXPECT_TRUE(h.session->cooldown_active());
}

TEST(VoiceSession, ClientChunksAreCutIntoFrames) {
    Harness h(BackendReply::ok("Sure thing!"), "what time is it");
    h.control("wake-trigger");
    ASSERT_EQ(h.session->state(), SessionState::Listening);

    // 4 x 1280 loud samples are exactly 10 frames
    h.feed(loud_frame(1280), 4);
    EXPECT_EQ(h.session->buffered_frames(), 10u);

    // 15 x 1000 silent samples are 29 frames with 152 samples left over
    h.feed(silent_frame(1000), 15);
    EXPECT_EQ(h.session->state(), SessionState::Listening);
    EXPECT_EQ(h.session->buffered_frames(), 39u);

    // The next chunk completes frames 40 and 41; the 31st silent frame ends the turn
    h.feed(silent_frame(1000), 1);
    EXPECT_NE(h.session->state(), SessionState::Listening);

    ASSERT_TRUE(h.idle());
    EXPECT_EQ(h.transcriber->last_samples(), 41u * DEFAULT_FRAME_SAMPLES);
    EXPECT_EQ(h.backend->calls.load(), 1);
}

TEST(VoiceSession, PartialFrameWaitsForMoreAudio) {
    Harness h(BackendReply::ok("ok"), "hello there");
    h.control("wake-trigger");

    h.feed(loud_frame(DEFAULT_FRAME_SAMPLES - 1), 1);
    EXPECT_EQ(h.session->buffered_frames(), 0u);
    h.feed(loud_frame(1), 1);
    EXPECT_EQ(h.session->buffered_frames(), 1u);

    h.feed(loud_frame(4096), 1);
    EXPECT_EQ(h.session->buffered_frames(), 9u);
    EXPECT_EQ(h.session->state(), SessionState::Listening);
}

TEST(VoiceSession, ProcessingMessageSaysThinking) {
    Harness h(BackendReply::ok("ok"), "hello there");
    h.control("start-listening");
    h.feed(loud_frame(), 3);
    h.control("stop-listening");
    ASSERT_TRUE(h.idle());

    auto states = h.sink->messages_of_type("state");
    ASSERT_GE(states.size(), 3u);
    EXPECT_EQ(states[2]["state"], "processing");
    EXPECT_EQ(states[2]["message"], "Thinking...");
}

TEST(VoiceSession, ListeningTimeout) {
    SessionConfig config = fast_session_config();
    config.thresholds.max_listen_frames = 20;
    Harness h(BackendReply::ok("ok"), "hello there", config);

    h.control("start-listening");
    h.feed(loud_frame(), 20);
    EXPECT_EQ(h.session->state(), SessionState::Listening);
    h.feed(loud_frame(), 1);
    ASSERT_TRUE(h.idle());
    EXPECT_EQ(h.transcriber->last_samples(), 21u * DEFAULT_FRAME_SAMPLES);
}

TEST(VoiceSession, SpeakingPreviewIsTruncated) {
    const std::string reply(80, 'x');
    Harness h(BackendReply::ok(reply), "hello there");
    h.control("start-listening");
    h.feed(loud_frame(), 3);
    h.control("stop-listening");
    ASSERT_TRUE(h.idle());

    for (const auto& m : h.sink->messages_of_type("state")) {
        if (m["state"] == "speaking") {
            EXPECT_EQ(m["message"], std::string(50, 'x') + "...");
            return;
        }
    }
    FAIL() << "no speaking state";
}

// =============================================================================
// DEGRADED TURNS
// =============================================================================

TEST(VoiceSession, QuietAudioSkipsTranscription) {
    Harness h(BackendReply::ok("hi"), "hello there");
    h.control("start-listening");
    h.feed(AudioFrame(512, 0.002f), 10);
    h.control("stop-listening");
    ASSERT_TRUE(h.idle());

    EXPECT_EQ(h.transcriber->last_samples(), 0u);
    EXPECT_EQ(h.backend->calls.load(), 0);
    auto states = h.sink->messages_of_type("state");
    EXPECT_EQ(states.back()["state"], "waiting");
    EXPECT_EQ(states.back()["message"], "Didn't hear anything");
}

TEST(VoiceSession, ShortTranscriptIsDiscarded) {
    Harness h(BackendReply::ok("hi"), "  a ");
    h.control("start-listening");
    h.feed(loud_frame(), 10);
    h.control("stop-listening");
    ASSERT_TRUE(h.idle());

    EXPECT_EQ(h.backend->calls.load(), 0);
    auto states = h.sink->messages_of_type("state");
    EXPECT_EQ(states.back()["message"], "Didn't catch that");
    EXPECT_TRUE(h.sink->messages_of_type("response").empty());
}

TEST(VoiceSession, MissingTranscriberIsShortTranscript) {
    Harness h(BackendReply::ok("hi"), "", fast_session_config(), milliseconds(0), false);
    h.control("start-listening");
    h.feed(loud_frame(), 10);
    h.control("stop-listening");
    ASSERT_TRUE(h.idle());

    EXPECT_EQ(h.backend->calls.load(), 0);
    EXPECT_EQ(h.sink->messages_of_type("state").back()["message"], "Didn't catch that");
}

TEST(VoiceSession, BackendFailureReportsErrorAndReturnsToWaiting) {
    Harness h(BackendReply::failure(ErrorCode::BackendError, "connection refused"),
              "what's the weather");
    h.control("start-listening");
    h.feed(loud_frame(), 10);
    h.control("stop-listening");
    ASSERT_TRUE(h.idle());

    auto errors = h.sink->messages_of_type("error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["message"], "connection refused");
    EXPECT_EQ(errors[0]["code"], -600);
    EXPECT_EQ(errors[0]["category"], "Backend");

    EXPECT_EQ(h.session->state(), SessionState::WaitingForWake);
    EXPECT_TRUE(h.session->cooldown_active());
    EXPECT_TRUE(h.sink->messages_of_type("response").empty());
    EXPECT_EQ(h.sink->binary_count(), 0u);
}

TEST(VoiceSession, CooldownBlocksImmediateRewake) {
    Harness h(BackendReply::ok("ok"), "hello there");
    h.control("start-listening");
    h.feed(loud_frame(), 3);
    h.control("stop-listening");
    ASSERT_TRUE(h.idle());

    // 2 s cooldown = 62.5 frames of 512 samples
    h.feed(loud_frame(), 62);
    EXPECT_EQ(h.session->state(), SessionState::WaitingForWake);
    h.feed(loud_frame(), 1);  // consumes the tail of the cooldown
    h.feed(loud_frame(), 1);
    EXPECT_EQ(h.session->state(), SessionState::Listening);
}

TEST(VoiceSession, KeepalivesDuringSlowBackend) {
    SessionConfig config = fast_session_config();
    config.query.keepalive_interval = milliseconds(30);
    Harness h(BackendReply::ok("done"), "hello there", config, milliseconds(200));

    h.control("start-listening");
    h.feed(loud_frame(), 3);
    h.control("stop-listening");
    ASSERT_TRUE(h.idle());

    auto keepalives = h.sink->messages_of_type("keepalive");
    EXPECT_GE(keepalives.size(), 3u);
    for (const auto& k : keepalives) {
        EXPECT_EQ(k["status"], "thinking");
    }
}

// =============================================================================
// CONTROL MESSAGES
// =============================================================================

TEST(VoiceSession, PingPong) {
    Harness h(BackendReply::ok("hi"), "hello there");
    h.control("ping");
    EXPECT_EQ(h.sink->messages_of_type("pong").size(), 1u);
}

TEST(VoiceSession, MalformedAndUnknownControlIgnored) {
    Harness h(BackendReply::ok("hi"), "hello there");
    const size_t before = h.sink->text_count();
    h.session->handle_control("{not json");
    h.session->handle_control("[1,2,3]");
    h.session->handle_control("{\"type\":42}");
    h.control("dance");
    EXPECT_EQ(h.sink->text_count(), before);
    EXPECT_EQ(h.session->state(), SessionState::WaitingForWake);
}

TEST(VoiceSession, PushToTalkToggles) {
    Harness h(BackendReply::ok("ok"), "hello there");
    h.control("push_to_talk");
    EXPECT_EQ(h.session->state(), SessionState::Listening);
    h.feed(loud_frame(), 5);
    h.control("push_to_talk");
    ASSERT_TRUE(h.idle());
    EXPECT_EQ(h.transcriber->last_samples(), 5u * DEFAULT_FRAME_SAMPLES);
}

TEST(VoiceSession, PushToTalkAliases) {
    Harness h(BackendReply::ok("ok"), "hello there");
    h.control("push_to_talk_start");
    EXPECT_EQ(h.session->state(), SessionState::Listening);
    h.feed(loud_frame(), 2);
    h.control("push_to_talk_stop");
    ASSERT_TRUE(h.idle());

    h.control("push_to_wake");
    EXPECT_EQ(h.session->state(), SessionState::Listening);
}

TEST(VoiceSession, StopListeningOutsideListeningIsIgnored) {
    Harness h(BackendReply::ok("ok"), "hello there");
    h.control("stop-listening");
    EXPECT_EQ(h.session->state(), SessionState::WaitingForWake);
    EXPECT_EQ(h.sink->states().size(), 1u);
}

TEST(VoiceSession, FramesDroppedWhileProcessing) {
    Harness h(BackendReply::ok("ok"), "hello there", fast_session_config(), milliseconds(200));
    h.control("start-listening");
    h.feed(loud_frame(), 3);
    h.control("stop-listening");

    h.feed(loud_frame(), 10);
    EXPECT_EQ(h.session->buffered_frames(), 0u);
    h.control("start-listening");
    EXPECT_NE(h.session->state(), SessionState::Listening);
    ASSERT_TRUE(h.idle());
}

TEST(VoiceSession, CloseCancelsInFlightTurn) {
    Harness h(BackendReply::ok("too late"), "hello there", fast_session_config(),
              milliseconds(2000));
    h.control("start-listening");
    h.feed(loud_frame(), 3);
    h.control("stop-listening");
    std::this_thread::sleep_for(milliseconds(30));

    const auto start = steady_clock::now();
    h.session->close();
    const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);

    EXPECT_LT(elapsed.count(), 1000);
    EXPECT_TRUE(h.session->is_closed());
    EXPECT_TRUE(h.sink->messages_of_type("response").empty());
    EXPECT_TRUE(h.sink->messages_of_type("error").empty());
    EXPECT_EQ(h.sink->binary_count(), 0u);

    // Input after close is ignored
    h.feed(loud_frame(), 5);
    EXPECT_EQ(h.session->buffered_frames(), 0u);
}

TEST(VoiceSession, CloseWhileSpeakingStopsSynthesis) {
    auto chain = std::make_unique<SynthesisChain>();
    chain->set_cancel_poll(milliseconds(5));
    auto first = std::make_shared<ProviderCounters>();
    auto second = std::make_shared<ProviderCounters>();
    chain->add_provider(std::make_unique<FakeProvider>("SlowA", FakeProvider::Mode::Empty, first,
                                                       true, 0, milliseconds(800)));
    chain->add_provider(std::make_unique<FakeProvider>("SlowB", FakeProvider::Mode::Empty, second,
                                                       true, 0, milliseconds(800)));
    Harness h(BackendReply::ok("a long answer"), "hello there", fast_session_config(),
              milliseconds(0), true, std::move(chain));

    h.control("start-listening");
    h.feed(loud_frame(), 3);
    h.control("stop-listening");
    ASSERT_TRUE(h.sink->wait_for_type("state", 4));
    EXPECT_EQ(h.sink->states().back(), "speaking");
    for (int i = 0; i < 300 && first->calls.load() == 0; ++i) {
        std::this_thread::sleep_for(milliseconds(1));
    }
    ASSERT_EQ(first->calls.load(), 1);

    const auto start = steady_clock::now();
    h.session->close();
    const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);

    EXPECT_LT(elapsed.count(), 300);
    EXPECT_EQ(second->calls.load(), 0);
    EXPECT_EQ(h.sink->binary_count(), 0u);
}

TEST(VoiceSession, CloseAbortsTranscription) {
    auto sink = std::make_shared<RecordingSink>();
    auto backend = std::make_shared<ScriptedBackend>(BackendReply::ok("never"));
    auto stt = std::make_unique<StallingTranscriber>(milliseconds(2000));
    StallingTranscriber* transcriber = stt.get();

    SessionComponents components;
    components.classifier = std::make_unique<LoudnessClassifier>();
    components.transcriber = std::move(stt);
    components.synthesis = audio_chain();
    components.backend = backend;
    VoiceSession session("abort-session", sink, std::move(components), fast_session_config());
    session.start();

    session.handle_control(R"({"type":"start-listening"})");
    for (int i = 0; i < 3; ++i) {
        session.handle_audio(loud_frame());
    }
    session.handle_control(R"({"type":"stop-listening"})");
    for (int i = 0; i < 500 && !transcriber->started.load(); ++i) {
        std::this_thread::sleep_for(milliseconds(1));
    }
    ASSERT_TRUE(transcriber->started.load());

    const auto start = steady_clock::now();
    session.close();
    const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);

    EXPECT_LT(elapsed.count(), 300);
    EXPECT_TRUE(transcriber->aborted.load());
    EXPECT_EQ(backend->calls.load(), 0);
    EXPECT_TRUE(sink->messages_of_type("response").empty());
}

// =============================================================================
// NOTIFICATIONS
// =============================================================================

TEST(VoiceSession, IdleNotificationIsSpoken) {
    Harness h(BackendReply::ok("hi"), "hello there");

    Notification n;
    n.title = "Calendar";
    n.message = "Standup in 5 minutes";
    NotificationOutcome outcome = h.session->deliver_notification(n);

    EXPECT_TRUE(outcome.delivered);
    EXPECT_TRUE(outcome.spoken);
    EXPECT_EQ(h.sink->binary_count(), 1u);

    auto notes = h.sink->messages_of_type("notification");
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(notes[0]["title"], "Calendar");
    EXPECT_EQ(notes[0]["message"], "Standup in 5 minutes");
    EXPECT_EQ(notes[0]["priority"], "normal");
    EXPECT_EQ(notes[0]["speak"], true);

    EXPECT_EQ(h.session->state(), SessionState::WaitingForWake);
    auto states = h.sink->states();
    ASSERT_GE(states.size(), 3u);
    EXPECT_EQ(states[states.size() - 2], "speaking");
    EXPECT_EQ(states.back(), "waiting");
}

TEST(VoiceSession, SilentNotificationNotSpoken) {
    Harness h(BackendReply::ok("hi"), "hello there");

    Notification n;
    n.message = "FYI";
    n.speak = false;
    NotificationOutcome outcome = h.session->deliver_notification(n);

    EXPECT_TRUE(outcome.delivered);
    EXPECT_FALSE(outcome.spoken);
    EXPECT_EQ(h.sink->binary_count(), 0u);
    auto notes = h.sink->messages_of_type("notification");
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_TRUE(notes[0]["title"].is_null());
}

TEST(VoiceSession, BusyNotificationNotSpoken) {
    Harness h(BackendReply::ok("hi"), "hello there");
    h.control("start-listening");

    Notification n;
    n.message = "Package delivered";
    NotificationOutcome outcome = h.session->deliver_notification(n);

    EXPECT_TRUE(outcome.delivered);
    EXPECT_FALSE(outcome.spoken);
    EXPECT_EQ(h.sink->binary_count(), 0u);
    EXPECT_EQ(h.session->state(), SessionState::Listening);
}

TEST(VoiceSession, NotificationToDeadSinkNotDelivered) {
    Harness h(BackendReply::ok("hi"), "hello there");
    h.sink->set_fail(true);

    Notification n;
    n.message = "hello";
    NotificationOutcome outcome = h.session->deliver_notification(n);
    EXPECT_FALSE(outcome.delivered);
    EXPECT_FALSE(outcome.spoken);
}

TEST(Notification, Announcement) {
    Notification n;
    n.message = "Dinner is ready";
    EXPECT_EQ(n.announcement(), "Dinner is ready");
    n.title = "Kitchen";
    EXPECT_EQ(n.announcement(), "Kitchen: Dinner is ready");
}
