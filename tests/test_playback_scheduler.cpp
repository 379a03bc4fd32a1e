#include <gtest/gtest.h>
#include "valtime/core/animation_store.hpp"
#include "valtime/core/playback_scheduler.hpp"
#include "valtime/core/text.hpp"
#include "valtime/core/truck_sprite.hpp"
#include "valtime/core/wire_format.hpp"
#include "recording_input_sink.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace valtime;
using namespace std::chrono_literals;

// ============================================================================
// Frame selection
// ============================================================================

TEST(SelectPlaybackIndicesTest, StrideDividesEvenly) {
    // 11 frames, stride 5: 0, 5, 10 (10 is already last)
    EXPECT_EQ(selectPlaybackIndices(11, 5), (std::vector<size_t>{0, 5, 10}));
}

TEST(SelectPlaybackIndicesTest, LastFrameAppended) {
    EXPECT_EQ(selectPlaybackIndices(53, 5),
              (std::vector<size_t>{0, 5, 10, 15, 20, 25, 30, 35, 40, 45, 50, 52}));
}

TEST(SelectPlaybackIndicesTest, LastFrameAppearsExactlyOnce) {
    for (size_t count = 1; count <= 20; ++count) {
        for (int stride = 1; stride <= 7; ++stride) {
            auto indices = selectPlaybackIndices(count, stride);
            ASSERT_FALSE(indices.empty());
            EXPECT_EQ(indices.front(), 0u);
            EXPECT_EQ(indices.back(), count - 1);
            EXPECT_EQ(std::count(indices.begin(), indices.end(), count - 1), 1)
                << "count=" << count << " stride=" << stride;
        }
    }
}

TEST(SelectPlaybackIndicesTest, EdgeCases) {
    EXPECT_TRUE(selectPlaybackIndices(0, 5).empty());
    EXPECT_EQ(selectPlaybackIndices(1, 5), std::vector<size_t>{0});
    EXPECT_EQ(selectPlaybackIndices(3, 1), (std::vector<size_t>{0, 1, 2}));
    EXPECT_EQ(selectPlaybackIndices(3, 0), (std::vector<size_t>{0, 1, 2}));
    EXPECT_EQ(selectPlaybackIndices(4, 100), (std::vector<size_t>{0, 3}));
}

// ============================================================================
// PlaybackScheduler
// ============================================================================

class PlaybackSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        scheduler = std::make_unique<PlaybackScheduler>(injector, &events);
    }

    void TearDown() override {
        scheduler->stop();
    }

    static Animation makeAnimation(const std::string& name, FrameSequence frames,
                                   int stride, Seconds delay) {
        Animation animation;
        animation.name = name;
        animation.frames = std::make_shared<const FrameSequence>(std::move(frames));
        animation.settings = AnimationSettings{stride, delay};
        return animation;
    }

    /// Collect events until `id` finishes. Returns everything collected.
    std::vector<PlaybackEvent> waitForFinished(uint64_t id, std::chrono::milliseconds timeout = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            while (auto event = events.tryPop()) {
                collected.push_back(*event);
                if (event->type == PlaybackEventType::Finished && event->requestId == id) {
                    return collected;
                }
            }
            std::this_thread::sleep_for(1ms);
        }
        ADD_FAILURE() << "request " << id << " did not finish";
        return collected;
    }

    /// Block until `id` has emitted at least `played` steps
    bool waitForProgress(uint64_t id, size_t played, std::chrono::milliseconds timeout = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            while (auto event = events.tryPop()) {
                collected.push_back(*event);
                if (event->requestId == id && event->played >= played) {
                    return true;
                }
            }
            std::this_thread::sleep_for(1ms);
        }
        return false;
    }

    size_t finishedCount(uint64_t id) const {
        size_t count = 0;
        for (const auto& e : collected) {
            if (e.type == PlaybackEventType::Finished && e.requestId == id) {
                ++count;
            }
        }
        return count;
    }

    const PlaybackEvent* finishedEvent(uint64_t id) const {
        for (const auto& e : collected) {
            if (e.type == PlaybackEventType::Finished && e.requestId == id) {
                return &e;
            }
        }
        return nullptr;
    }

    RecordingInputSink sink;
    InputInjector injector{sink};
    PlaybackEventQueue events;
    std::unique_ptr<PlaybackScheduler> scheduler;
    std::vector<PlaybackEvent> collected;
};

TEST_F(PlaybackSchedulerTest, TruckPlaysStrideSampledFrames) {
    auto configPath = std::filesystem::temp_directory_path() / "valtime_playback_truck.json";
    {
        std::ofstream out(configPath);
        out << R"({"Truck": {"skip_frames": 5, "frame_delay": 0.5}})";
    }
    AnimationStore store(configPath);
    ASSERT_TRUE(store.load());
    std::filesystem::remove(configPath);

    Animation truck = store.get(std::string(TRUCK_ANIMATION_NAME));
    ASSERT_EQ(truck.frameCount(), 53u);
    ASSERT_EQ(truck.settings.skipStride, 5);
    truck.settings.frameDelay = Seconds(0.001);  // keep the test fast

    scheduler->start();
    uint64_t id = scheduler->play(truck);
    waitForFinished(id);

    std::vector<std::string> expected;
    for (size_t index : {0, 5, 10, 15, 20, 25, 30, 35, 40, 45, 50, 52}) {
        expected.push_back(utf32ToUtf8(formatPayload((*truck.frames)[index])));
    }
    EXPECT_EQ(sink.clipboardWrites(), expected);

    const PlaybackEvent* done = finishedEvent(id);
    ASSERT_NE(done, nullptr);
    EXPECT_EQ(done->outcome, PlaybackOutcome::Completed);
    EXPECT_EQ(done->played, 12u);
    EXPECT_EQ(done->total, 12u);
    EXPECT_EQ(finishedCount(id), 1u);
}

TEST_F(PlaybackSchedulerTest, FramesUseConfiguredWidth) {
    Animation anim = makeAnimation("Tiny", {Frame{{U"ab", U"cd"}}}, 1, Seconds(0.001));
    scheduler->start();
    uint64_t id = scheduler->play(anim, 2);
    waitForFinished(id);

    EXPECT_EQ(sink.clipboardWrites(), std::vector<std::string>{"ab cd"});
    EXPECT_EQ(sink.events(), InputInjector::encodeFrame("ab cd"));
}

TEST_F(PlaybackSchedulerTest, ProgressEventsCountUp) {
    Animation anim = makeAnimation("Three", {Frame{{U"a"}}, Frame{{U"b"}}, Frame{{U"c"}}},
                                   1, Seconds(0.001));
    scheduler->start();
    uint64_t id = scheduler->play(anim);
    auto all = waitForFinished(id);

    std::vector<size_t> played;
    for (const auto& e : all) {
        if (e.type == PlaybackEventType::FrameProgress) {
            EXPECT_EQ(e.total, 3u);
            EXPECT_EQ(e.label, "Three");
            played.push_back(e.played);
        }
    }
    EXPECT_EQ(played, (std::vector<size_t>{1, 2, 3}));
}

TEST_F(PlaybackSchedulerTest, BlankFramesAreCountedButNotSent) {
    Animation anim = makeAnimation("Gap", {Frame{{U"x"}}, Frame{{U"   "}}, Frame{{U"y"}}},
                                   1, Seconds(0.001));
    scheduler->start();
    uint64_t id = scheduler->play(anim);
    waitForFinished(id);

    EXPECT_EQ(sink.clipboardWrites(), (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(finishedEvent(id)->played, 3u);
}

TEST_F(PlaybackSchedulerTest, OneShotSendsSequence) {
    scheduler->start();
    uint64_t id = scheduler->submit(
        PlaybackRequest::oneShot("Message", InputInjector::encodeFreeText("gg"), 0ms));
    waitForFinished(id);

    EXPECT_EQ(sink.events(), InputInjector::encodeFreeText("gg"));
    EXPECT_EQ(finishedEvent(id)->outcome, PlaybackOutcome::Completed);
    EXPECT_TRUE(scheduler->waitUntilIdle(1000ms));
    EXPECT_TRUE(scheduler->isIdle());
}

TEST_F(PlaybackSchedulerTest, CancelStopsBetweenFrames) {
    Animation anim = makeAnimation("Slow", {Frame{{U"a"}}, Frame{{U"b"}}, Frame{{U"c"}}},
                                   1, Seconds(10.0));
    scheduler->start();
    uint64_t id = scheduler->play(anim);
    ASSERT_TRUE(waitForProgress(id, 1));

    scheduler->cancel();
    waitForFinished(id, 2000ms);

    const PlaybackEvent* done = finishedEvent(id);
    ASSERT_NE(done, nullptr);
    EXPECT_EQ(done->outcome, PlaybackOutcome::Cancelled);
    EXPECT_EQ(done->played, 1u);
    EXPECT_EQ(sink.clipboardWrites(), std::vector<std::string>{"a"});
}

TEST_F(PlaybackSchedulerTest, LatestRequestWins) {
    Animation slow = makeAnimation("Slow", {Frame{{U"a"}}, Frame{{U"b"}}}, 1, Seconds(10.0));
    Animation quick = makeAnimation("Quick", {Frame{{U"q"}}}, 1, Seconds(0.001));

    scheduler->start();
    uint64_t first = scheduler->play(slow);
    ASSERT_TRUE(waitForProgress(first, 1));

    uint64_t second = scheduler->play(quick);
    EXPECT_GT(second, first);
    waitForFinished(second, 2000ms);

    ASSERT_NE(finishedEvent(first), nullptr);
    EXPECT_EQ(finishedEvent(first)->outcome, PlaybackOutcome::Cancelled);
    EXPECT_EQ(finishedEvent(second)->outcome, PlaybackOutcome::Completed);
    EXPECT_EQ(finishedCount(first), 1u);
    EXPECT_EQ(finishedCount(second), 1u);
    EXPECT_EQ(sink.clipboardWrites(), (std::vector<std::string>{"a", "q"}));
}

TEST_F(PlaybackSchedulerTest, QueuedRequestSupersededBeforeStarting) {
    Animation a = makeAnimation("A", {Frame{{U"a"}}}, 1, Seconds(0.001));
    Animation b = makeAnimation("B", {Frame{{U"b"}}}, 1, Seconds(0.001));

    // Both queued before the worker exists
    uint64_t first = scheduler->play(a);
    uint64_t second = scheduler->play(b);
    scheduler->start();
    waitForFinished(second);

    ASSERT_NE(finishedEvent(first), nullptr);
    EXPECT_EQ(finishedEvent(first)->outcome, PlaybackOutcome::Cancelled);
    EXPECT_EQ(finishedEvent(first)->played, 0u);
    EXPECT_EQ(sink.clipboardWrites(), std::vector<std::string>{"b"});
}

TEST_F(PlaybackSchedulerTest, InjectionFailureReportsFailed) {
    sink.failAfter(0);
    Animation anim = makeAnimation("Broken", {Frame{{U"a"}}, Frame{{U"b"}}}, 1, Seconds(0.001));

    scheduler->start();
    uint64_t id = scheduler->play(anim);
    waitForFinished(id);

    const PlaybackEvent* done = finishedEvent(id);
    ASSERT_NE(done, nullptr);
    EXPECT_EQ(done->outcome, PlaybackOutcome::Failed);
    EXPECT_EQ(done->played, 0u);
    EXPECT_FALSE(done->error.empty());
    EXPECT_EQ(finishedCount(id), 1u);

    // The worker survives a failed request
    sink.failAfter(1000);
    uint64_t next = scheduler->submit(
        PlaybackRequest::oneShot("Retry", InputInjector::encodeVoiceWheel(1, 1), 0ms));
    waitForFinished(next);
    EXPECT_EQ(finishedEvent(next)->outcome, PlaybackOutcome::Completed);
}

TEST_F(PlaybackSchedulerTest, StopFinishesPendingRequestsAsCancelled) {
    Animation anim = makeAnimation("Never", {Frame{{U"a"}}}, 1, Seconds(0.001));
    uint64_t id = scheduler->play(anim);
    scheduler->stop();

    waitForFinished(id, 1000ms);
    EXPECT_EQ(finishedEvent(id)->outcome, PlaybackOutcome::Cancelled);
    EXPECT_TRUE(scheduler->isIdle());
    EXPECT_TRUE(sink.events().empty());

    // Stopped for good
    uint64_t late = scheduler->play(anim);
    waitForFinished(late, 1000ms);
    EXPECT_EQ(finishedEvent(late)->outcome, PlaybackOutcome::Cancelled);
    EXPECT_FALSE(scheduler->isRunning());
}

TEST(PlaybackRequestTest, AnimationRequestSharesFrames) {
    Animation anim;
    anim.name = "Shared";
    anim.frames = std::make_shared<const FrameSequence>(FrameSequence(7, Frame{{U"x"}}));
    anim.settings = AnimationSettings{3, Seconds(0.25)};

    PlaybackRequest request = PlaybackRequest::animation(anim, 10);
    EXPECT_EQ(request.frames.get(), anim.frames.get());
    EXPECT_EQ(request.frameIndices, (std::vector<size_t>{0, 3, 6}));
    EXPECT_EQ(request.stepCount(), 3u);
    EXPECT_EQ(request.screenWidth, 10u);
    EXPECT_EQ(request.leadIn, InjectionTiming::ANIMATION_LEAD_IN);
    EXPECT_DOUBLE_EQ(request.stepDelay.count(), 0.25);
}

TEST(PlaybackRequestTest, OutcomeNames) {
    EXPECT_STREQ(outcomeName(PlaybackOutcome::Completed), "completed");
    EXPECT_STREQ(outcomeName(PlaybackOutcome::Cancelled), "cancelled");
    EXPECT_STREQ(outcomeName(PlaybackOutcome::Failed), "failed");
}
