#include "TestSupport.h"

#include "gtest/gtest.h"

#include <chrono>
#include <thread>
#include <vector>

using namespace pickcal;
using namespace std::chrono_literals;
using pickcal::test::MockRig;

class CameraSourceManagerTest : public ::testing::Test {
protected:
    MockRig rig;
    std::unique_ptr<CameraSourceManager> cameras;

    void SetUp() override
    {
        cameras = std::make_unique<CameraSourceManager>(MockRig::poweredSlots(), rig.factory());
    }
};

TEST_F(CameraSourceManagerTest, SelectsEachValidSource)
{
    EXPECT_EQ(cameras->activeSource(), -1);
    for (int id = 0; id < CameraSourceManager::kSlotCount; ++id) {
        const auto result = cameras->select(id);
        EXPECT_TRUE(result.success) << result.message.toStdString();
        EXPECT_EQ(cameras->activeSource(), id);
        const auto info = cameras->slotInfo(id);
        ASSERT_TRUE(info.has_value());
        EXPECT_TRUE(info->active);
        EXPECT_TRUE(info->open);
    }
}

TEST_F(CameraSourceManagerTest, RejectsSourceOutOfRange)
{
    ASSERT_TRUE(cameras->select(1).success);

    const auto result = cameras->select(3);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::InvalidSource);
    EXPECT_EQ(cameras->activeSource(), 1);

    EXPECT_EQ(cameras->select(-1).error, ErrorCode::InvalidSource);
    EXPECT_EQ(cameras->setPower(7, true).error, ErrorCode::InvalidSource);
    EXPECT_FALSE(cameras->slotInfo(3).has_value());
}

TEST_F(CameraSourceManagerTest, SwitchingSourcesClosesThePreviousDevice)
{
    ASSERT_TRUE(cameras->select(0).success);
    ASSERT_TRUE(cameras->select(2).success);

    EXPECT_EQ(rig.states[0]->closes.load(), 1);
    EXPECT_FALSE(cameras->slotInfo(0)->open);
    EXPECT_TRUE(cameras->slotInfo(2)->open);
}

TEST_F(CameraSourceManagerTest, CaptureDeliversFramesFromActiveSource)
{
    EXPECT_EQ(cameras->captureFrame(50ms).error, ErrorCode::NoSignal);

    ASSERT_TRUE(cameras->select(0).success);
    const auto first = cameras->captureFrame(100ms);
    ASSERT_TRUE(first.success) << first.message.toStdString();
    EXPECT_FALSE(first.cached);
    EXPECT_EQ(first.frame.sourceId, 0);
    EXPECT_EQ(first.frame.image.size(), cv::Size(320, 240));

    const auto second = cameras->captureFrame(100ms);
    ASSERT_TRUE(second.success);
    EXPECT_GT(second.frame.sequence, first.frame.sequence);
    EXPECT_EQ(cameras->slotInfo(0)->framesCaptured, 2u);
}

TEST_F(CameraSourceManagerTest, PowerIsIdempotent)
{
    ASSERT_TRUE(cameras->select(0).success);
    const int opens = rig.states[0]->opens.load();

    const auto again = cameras->setPower(0, true);
    EXPECT_TRUE(again.success);
    EXPECT_EQ(rig.states[0]->opens.load(), opens);

    ASSERT_TRUE(cameras->setPower(0, false).success);
    const auto offAgain = cameras->setPower(0, false);
    EXPECT_TRUE(offAgain.success);
    EXPECT_EQ(rig.states[0]->closes.load(), 1);
}

TEST_F(CameraSourceManagerTest, PowerOffReleasesHandleAndStopsReads)
{
    ASSERT_TRUE(cameras->select(0).success);
    ASSERT_TRUE(cameras->captureFrame(100ms).success);
    const int reads = rig.states[0]->reads.load();

    ASSERT_TRUE(cameras->setPower(0, false).success);
    EXPECT_EQ(rig.states[0]->closes.load(), 1);
    const auto info = cameras->slotInfo(0);
    EXPECT_FALSE(info->powered);
    EXPECT_FALSE(info->open);
    EXPECT_TRUE(info->active);

    const auto result = cameras->captureFrame(100ms);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::NoSignal);
    EXPECT_EQ(rig.states[0]->reads.load(), reads);

    ASSERT_TRUE(cameras->setPower(0, true).success);
    EXPECT_TRUE(cameras->slotInfo(0)->open);
    EXPECT_TRUE(cameras->captureFrame(100ms).success);
}

TEST_F(CameraSourceManagerTest, PoweredOffSlotCanBeSelectedWithoutOpening)
{
    ASSERT_TRUE(cameras->setPower(1, false).success);
    const auto result = cameras->select(1);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(cameras->activeSource(), 1);
    EXPECT_EQ(rig.states[1]->opens.load(), 0);
    EXPECT_EQ(cameras->captureFrame(50ms).error, ErrorCode::NoSignal);
}

TEST_F(CameraSourceManagerTest, OpenFailureIsDeviceFaultAndRetriedOnNextSelect)
{
    rig.states[0]->failOpen = true;
    const auto failed = cameras->select(0);
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.error, ErrorCode::DeviceFault);
    EXPECT_EQ(cameras->activeSource(), 0);
    EXPECT_EQ(cameras->captureFrame(50ms).error, ErrorCode::NoSignal);

    rig.states[0]->failOpen = false;
    EXPECT_TRUE(cameras->select(0).success);
    EXPECT_TRUE(cameras->captureFrame(100ms).success);
}

TEST_F(CameraSourceManagerTest, ReadFailureIsDeviceFault)
{
    ASSERT_TRUE(cameras->select(0).success);
    rig.states[0]->failRead = true;
    const auto result = cameras->captureFrame(100ms);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::DeviceFault);

    rig.states[0]->failRead = false;
    EXPECT_TRUE(cameras->captureFrame(100ms).success);
}

TEST_F(CameraSourceManagerTest, ConcurrentCapturesNeverOverlapReads)
{
    rig.states[0]->readDelay = 5ms;
    ASSERT_TRUE(cameras->select(0).success);

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([this]() {
            for (int i = 0; i < 10; ++i) {
                const auto result = cameras->captureFrame(20ms);
                (void)result;
            }
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }

    EXPECT_GT(rig.states[0]->reads.load(), 0);
    EXPECT_FALSE(rig.states[0]->overlapDetected.load());
}

TEST_F(CameraSourceManagerTest, BusySlotServesCachedFrameOrBusy)
{
    ASSERT_TRUE(cameras->select(0).success);
    ASSERT_TRUE(cameras->captureFrame(100ms).success);
    rig.states[0]->readDelay = 150ms;

    std::thread slowReader([this]() {
        const auto result = cameras->captureFrame(500ms);
        EXPECT_TRUE(result.success);
    });
    while (rig.states[0]->inFlight.load() == 0) {
        std::this_thread::sleep_for(1ms);
    }

    const auto cached = cameras->captureFrame(10ms);
    EXPECT_TRUE(cached.success);
    EXPECT_TRUE(cached.cached);

    const auto busy = cameras->captureFrame(10ms, false);
    EXPECT_FALSE(busy.success);
    EXPECT_EQ(busy.error, ErrorCode::Busy);

    slowReader.join();
}

TEST(CameraDeviceFactoryTest, UnknownOrEmptyBackendHasNoDevice)
{
    QString error;
    CameraSlotConfig config;
    config.backend = QStringLiteral("none");
    EXPECT_TRUE(createCameraDevice(config, &error) == nullptr);
    EXPECT_FALSE(error.isEmpty());

    config.backend = QStringLiteral("gige-magic");
    EXPECT_TRUE(createCameraDevice(config, &error) == nullptr);
    EXPECT_TRUE(error.contains(QStringLiteral("gige-magic")));

    config.backend = QStringLiteral("opencv");
    config.device = QStringLiteral("0");
    auto device = createCameraDevice(config, &error);
    ASSERT_TRUE(device != nullptr);
    EXPECT_EQ(device->backendName(), QStringLiteral("opencv"));
}
