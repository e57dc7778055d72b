#include "control_loop.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>
#include <memory>

static const CardId A = parse_card_id("0a0a0a0a");
static const CardId B = parse_card_id("0b0b0b0b");

class ControlLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        a1 = dir.touch("a/1.mp3");
        a2 = dir.touch("a/2.mp3");
        b1 = dir.touch("b.mp3");

        MappingTable table;
        table[A] = "a";
        table[B] = "b.mp3";
        resolver = std::make_unique<ContentResolver>(table, dir.path());
        controller = std::make_unique<SessionController>(*resolver, backend);

        config.removal_dwell = 2;
        config.failure_threshold = 3;
        config.poll_interval_ms = 1;
        loop = std::make_unique<ControlLoop>(reader, *controller, config);
    }

    void run_script() {
        while (reader.remaining() > 0) loop->tick();
    }

    TempDir dir;
    std::string a1, a2, b1;
    std::unique_ptr<ContentResolver> resolver;
    FakeBackend backend;
    std::unique_ptr<SessionController> controller;
    ScriptedReader reader;
    PlayerConfig config;
    std::unique_ptr<ControlLoop> loop;
};

TEST_F(ControlLoopTest, CardRestingOnReaderPlaysOnce) {
    reader.empty(2).card(A, 20);
    run_script();

    EXPECT_EQ(backend.played(), (std::vector<std::string>{a1}));
    EXPECT_EQ(controller->session().play_state, PlayState::Playing);
}

TEST_F(ControlLoopTest, FlickerDoesNotRestartPlayback) {
    reader.card(A, 3).empty(1).card(A, 3).empty(1).card(A);
    run_script();

    EXPECT_EQ(backend.calls, (std::vector<std::string>{"play " + a1}));
}

TEST_F(ControlLoopTest, RemovalStopsAfterDwell) {
    reader.card(A, 2).empty(1);
    run_script();
    EXPECT_EQ(controller->session().play_state, PlayState::Playing);

    reader.empty(1);
    run_script();
    EXPECT_TRUE(controller->session().idle());
    EXPECT_EQ(backend.calls.back(), "stop");
}

TEST_F(ControlLoopTest, SwapStartsOtherCard) {
    reader.card(A, 2).card(B, 2);
    run_script();

    EXPECT_EQ(backend.calls, (std::vector<std::string>{"play " + a1, "stop", "play " + b1}));
    EXPECT_EQ(*controller->session().active_card, B);
}

TEST_F(ControlLoopTest, ReadFailuresAreNotRemovals) {
    reader.card(A).failure(5).card(A);
    run_script();

    EXPECT_EQ(controller->session().play_state, PlayState::Playing);
    EXPECT_EQ(backend.played().size(), 1u);
    EXPECT_EQ(loop->consecutive_failures(), 0);
}

TEST_F(ControlLoopTest, FailuresAreCountedUntilRecovery) {
    reader.failure(7);
    run_script();
    EXPECT_EQ(loop->consecutive_failures(), 7);

    reader.empty();
    run_script();
    EXPECT_EQ(loop->consecutive_failures(), 0);
}

static int count_lines(const std::string& text, const std::string& needle) {
    int n = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        n++;
    }
    return n;
}

TEST_F(ControlLoopTest, FailuresReportedEveryThresholdAndLoopKeepsRunning) {
    reader.failure(7);
    testing::internal::CaptureStderr();
    run_script();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(count_lines(err, "ERROR | Card reader failed 3 times in a row"), 1);
    EXPECT_EQ(count_lines(err, "ERROR | Card reader failed 6 times in a row"), 1);
    EXPECT_EQ(count_lines(err, "ERROR | Card reader failed"), 2);

    reader.card(A);
    run_script();
    EXPECT_EQ(loop->consecutive_failures(), 0);
    EXPECT_EQ(controller->session().play_state, PlayState::Playing);
    EXPECT_EQ(backend.played(), (std::vector<std::string>{a1}));
}

TEST_F(ControlLoopTest, FinishedTrackAdvancesOnTick) {
    reader.card(A, 2);
    run_script();

    backend.finish_track();
    loop->tick();
    EXPECT_EQ(backend.current, a2);
    EXPECT_EQ(controller->session().content->cursor(), 1u);
}

TEST_F(ControlLoopTest, RunStopsPlaybackOnShutdown) {
    reader.card(A, 2);
    run_script();

    std::atomic<bool> stop{true};
    loop->run(stop);

    EXPECT_TRUE(controller->session().idle());
    EXPECT_EQ(backend.calls.back(), "stop");
}
