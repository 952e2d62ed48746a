#include "CaptureController/CaptureController.hpp"
#include "TranscriptionPipeline/TranscriptionPipeline.hpp"
#include "common/Errors.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <memory>
#include <vector>

using namespace chunkscribe;
using namespace std::chrono_literals;

class CaptureControllerTest : public ::testing::Test {
protected:
    CaptureControllerTest()
        : client(io)
        , pipeline(client)
        , stats(std::make_shared<test_utils::DecoderStats>()) {
    }

    // 16 kHz mono, сегмент каждые 100 мс = 1600 кадров
    std::unique_ptr<CaptureController> MakeController(std::chrono::milliseconds debounce = 20ms) {
        CaptureSettings settings;
        settings.segmentInterval = 100ms;
        settings.debounceWindow = debounce;

        auto stats = this->stats;
        auto controller = std::make_unique<CaptureController>(io, device, pipeline, settings, [stats]() {
            return std::make_unique<test_utils::CountingDecoder>(stats);
        });
        controller->SetStateCallback([this](CaptureController::State state) {
            states.push_back(state);
        });
        return controller;
    }

    boost::asio::io_context io;
    test_utils::FakeCaptureDevice device;
    test_utils::FakeTranscriptionClient client;
    TranscriptionPipeline pipeline;
    std::shared_ptr<test_utils::DecoderStats> stats;
    std::vector<CaptureController::State> states;
};

TEST_F(CaptureControllerTest, StartsIdle) {
    auto controller = MakeController();
    EXPECT_EQ(controller->GetState(), CaptureController::State::Idle);
    EXPECT_FALSE(controller->IsDecoderCreated());
    EXPECT_STREQ(CaptureController::GetStateName(controller->GetState()), "Idle");
}

TEST_F(CaptureControllerTest, StartThenStop) {
    auto controller = MakeController();

    controller->Start();
    EXPECT_EQ(controller->GetState(), CaptureController::State::Capturing);
    EXPECT_TRUE(device.IsRunning());

    controller->Stop();
    EXPECT_EQ(controller->GetState(), CaptureController::State::Stopped);
    EXPECT_FALSE(device.IsRunning());

    EXPECT_EQ(states, (std::vector<CaptureController::State>{
        CaptureController::State::Capturing, CaptureController::State::Stopped}));
}

TEST_F(CaptureControllerTest, StartWhileCapturingIsNoOp) {
    auto controller = MakeController();
    controller->Start();
    controller->Start();

    EXPECT_EQ(device.startCalls, 1);
    EXPECT_EQ(states.size(), 1u);
}

TEST_F(CaptureControllerTest, DeniedPermissionLeavesIdle) {
    device.denyAccess = true;
    auto controller = MakeController();

    EXPECT_THROW(controller->Start(), PermissionError);
    EXPECT_EQ(controller->GetState(), CaptureController::State::Idle);
    EXPECT_TRUE(states.empty());
}

TEST_F(CaptureControllerTest, StopWithoutStartIsNoOp) {
    auto controller = MakeController();
    controller->Stop();

    EXPECT_EQ(controller->GetState(), CaptureController::State::Idle);
    EXPECT_EQ(device.stopCalls, 0);
}

TEST_F(CaptureControllerTest, SecondStopIsNoOp) {
    auto controller = MakeController();
    controller->Start();
    controller->Stop();
    controller->Stop();

    EXPECT_EQ(device.stopCalls, 1);
    EXPECT_EQ(states.size(), 2u);
}

TEST_F(CaptureControllerTest, EmitsSegmentPerInterval) {
    auto controller = MakeController();
    controller->Start();

    device.Feed(std::vector<int16_t>(1600 * 3 + 100, 500));
    ASSERT_TRUE(test_utils::RunUntil(io, [&]() { return controller->GetEmittedSegments() == 3; }));

    // Три сегмента подряд укладываются в одно окно: отправляется последний
    ASSERT_TRUE(test_utils::RunUntil(io, [&]() { return pipeline.GetProcessedCount() == 1; }));
    test_utils::RunFor(io, 60ms);
    EXPECT_EQ(client.requests.size(), 1u);
    EXPECT_EQ(client.requests[0].GetSampleCount(), 1600u);
}

TEST_F(CaptureControllerTest, SegmentsAccumulateAcrossBuffers) {
    auto controller = MakeController();
    controller->Start();

    for (int i = 0; i < 16; ++i) {
        device.Feed(std::vector<int16_t>(100, 1));
        test_utils::RunFor(io, 1ms);
    }
    ASSERT_TRUE(test_utils::RunUntil(io, [&]() { return controller->GetEmittedSegments() == 1; }));
}

TEST_F(CaptureControllerTest, NoSegmentsAfterStop) {
    auto controller = MakeController();
    controller->Start();

    // Сегмент уже поставлен в очередь, но Stop() случился раньше
    device.Feed(std::vector<int16_t>(1600, 500));
    controller->Stop();
    device.Feed(std::vector<int16_t>(1600, 500));

    test_utils::RunFor(io, 100ms);
    EXPECT_EQ(controller->GetEmittedSegments(), 0u);
    EXPECT_TRUE(client.requests.empty());
}

TEST_F(CaptureControllerTest, PartialSegmentIsUploadedOnStop) {
    auto controller = MakeController();
    controller->Start();
    device.Feed(std::vector<int16_t>(1000, 500));
    controller->Stop();

    // Хвост короче интервала отправляется последним сегментом
    EXPECT_EQ(controller->GetEmittedSegments(), 1u);
    EXPECT_TRUE(controller->HasPendingDispatch());

    ASSERT_TRUE(test_utils::RunUntil(io, [&]() { return client.requests.size() == 1; }));
    EXPECT_EQ(client.requests[0].GetSampleCount(), 1000u);
}

TEST_F(CaptureControllerTest, PartialSegmentIsCancelledOnShutdown) {
    auto controller = MakeController();
    controller->Start();
    device.Feed(std::vector<int16_t>(1000, 500));
    controller->Shutdown();

    EXPECT_FALSE(controller->HasPendingDispatch());
    test_utils::RunFor(io, 100ms);
    EXPECT_TRUE(client.requests.empty());
}

TEST_F(CaptureControllerTest, TailDoesNotLeakIntoNextSession) {
    auto controller = MakeController();
    controller->Start();
    device.Feed(std::vector<int16_t>(1000, 500));
    controller->Stop();

    controller->Start();
    device.Feed(std::vector<int16_t>(600, 500));
    test_utils::RunFor(io, 50ms);
    EXPECT_EQ(controller->GetEmittedSegments(), 1u);

    device.Feed(std::vector<int16_t>(1000, 500));
    ASSERT_TRUE(test_utils::RunUntil(io, [&]() { return controller->GetEmittedSegments() == 2; }));
}

TEST_F(CaptureControllerTest, RestartAfterStop) {
    auto controller = MakeController();
    controller->Start();
    controller->Stop();
    controller->Start();

    EXPECT_EQ(controller->GetState(), CaptureController::State::Capturing);
    EXPECT_EQ(device.startCalls, 2);

    device.Feed(std::vector<int16_t>(1600, 500));
    ASSERT_TRUE(test_utils::RunUntil(io, [&]() { return client.requests.size() == 1; }));
}

TEST_F(CaptureControllerTest, DecoderCreatedOnFirstDispatchAndReused) {
    auto controller = MakeController();
    controller->Start();
    EXPECT_FALSE(controller->IsDecoderCreated());

    device.Feed(std::vector<int16_t>(1600, 500));
    ASSERT_TRUE(test_utils::RunUntil(io, [&]() { return client.requests.size() == 1; }));
    EXPECT_TRUE(controller->IsDecoderCreated());

    device.Feed(std::vector<int16_t>(1600, 500));
    ASSERT_TRUE(test_utils::RunUntil(io, [&]() { return client.requests.size() == 2; }));

    EXPECT_EQ(stats->created, 1);
    EXPECT_EQ(stats->decodes, 2);
}

TEST_F(CaptureControllerTest, ShutdownReleasesEverythingEvenIfStopFails) {
    auto controller = MakeController(200ms);
    controller->Start();

    device.Feed(std::vector<int16_t>(1600, 500));
    ASSERT_TRUE(test_utils::RunUntil(io, [&]() { return client.requests.size() == 1; }));

    device.Feed(std::vector<int16_t>(1600, 500));
    ASSERT_TRUE(test_utils::RunUntil(io, [&]() { return controller->HasPendingDispatch(); }));

    device.failOnStop = true;
    EXPECT_NO_THROW(controller->Shutdown());

    EXPECT_EQ(controller->GetState(), CaptureController::State::Stopped);
    EXPECT_FALSE(controller->IsDecoderCreated());
    EXPECT_FALSE(controller->HasPendingDispatch());
    EXPECT_EQ(stats->closes, 1);

    test_utils::RunFor(io, 300ms);
    EXPECT_EQ(client.requests.size(), 1u);
}

TEST_F(CaptureControllerTest, ShutdownIsIdempotent) {
    auto controller = MakeController();
    controller->Start();
    controller->Shutdown();
    controller->Shutdown();
    controller.reset();

    EXPECT_EQ(device.stopCalls, 1);
    EXPECT_EQ(stats->closes, 0);
}
