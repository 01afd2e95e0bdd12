#include "TestSupport.h"

#include "pickcal/ConsoleCoordinator.h"
#include "pickcal/Logger.h"
#include "gtest/gtest.h"

#include <algorithm>
#include <chrono>
#include <memory>

using namespace pickcal;
using namespace std::chrono_literals;
using pickcal::test::FakeActuator;
using pickcal::test::FakeDetector;
using pickcal::test::FakeStage;
using pickcal::test::MockRig;

class ConsoleCoordinatorTest : public ::testing::Test {
protected:
    MockRig rig;
    std::shared_ptr<FakeStage> stage {std::make_shared<FakeStage>()};
    std::unique_ptr<ConsoleCoordinator> console;

    void SetUp() override
    {
        ConsoleConfig config;
        config.cameras = MockRig::poweredSlots();
        config.cameras[2].powered = false;
        config.activeSource = 0;
        config.calibration.reportDirectory.clear();
        config.display.displaySize = cv::Size(320, 240);

        ConsoleCollaborators collaborators;
        collaborators.deviceFactory = rig.factory();
        collaborators.actuator = std::make_unique<FakeActuator>(stage);
        collaborators.detector = std::make_unique<FakeDetector>(stage);
        console = std::make_unique<ConsoleCoordinator>(config, std::move(collaborators));
    }

    bool logContains(const QString &needle) const
    {
        const auto lines = console->statusLog().snapshot();
        return std::any_of(lines.begin(), lines.end(), [&needle](const StatusLine &line) {
            return line.text.contains(needle);
        });
    }
};

TEST_F(ConsoleCoordinatorTest, SelectsConfiguredSourceAtStartup)
{
    EXPECT_EQ(console->activeSource(), 0);
    EXPECT_TRUE(console->cameraSlots()[0].open);
    EXPECT_TRUE(logContains(QStringLiteral("selected")));
}

TEST_F(ConsoleCoordinatorTest, RenderImageAlwaysHasDisplaySize)
{
    const QImage live = console->renderImage(0);
    EXPECT_EQ(live.size(), QSize(320, 240));
    EXPECT_NE(live, console->framePump().placeholder());

    ASSERT_TRUE(console->submit(PowerCommand {0, false}).success);
    const int reads = rig.states[0]->reads.load();
    const QImage dark = console->renderImage(1);
    EXPECT_EQ(dark, console->framePump().placeholder());
    EXPECT_EQ(rig.states[0]->reads.load(), reads);
}

TEST_F(ConsoleCoordinatorTest, DispatchesSelectAndPowerCommands)
{
    EXPECT_TRUE(console->submit(SelectCommand {1}).success);
    EXPECT_EQ(console->activeSource(), 1);

    const auto invalid = console->submit(SelectCommand {3});
    EXPECT_EQ(invalid.error, ErrorCode::InvalidSource);
    EXPECT_EQ(console->activeSource(), 1);

    EXPECT_TRUE(console->submit(SelectCommand {2}).success);
    EXPECT_EQ(console->renderImage(0), console->framePump().placeholder());
    EXPECT_TRUE(console->submit(PowerCommand {2, true}).success);
    EXPECT_NE(console->renderImage(1), console->framePump().placeholder());
    EXPECT_TRUE(logContains(QStringLiteral("powered on")));
}

TEST_F(ConsoleCoordinatorTest, CalibrationStepRunsThroughSession)
{
    for (int cell = 0; cell < 4; ++cell) {
        const auto result = console->calibrationStep(0, 2, 2, QString::number(20 * (cell % 2)),
                                                     QString::number(20 * (cell / 2)));
        ASSERT_TRUE(result.success) << result.message.toStdString();
        ASSERT_TRUE(console->waitForCalibrationIdle(5000ms));
    }

    EXPECT_EQ(console->calibrationStatus().state, SessionState::Done);
    ASSERT_TRUE(console->lastCalibrationResult().has_value());
    EXPECT_TRUE(logContains(QStringLiteral("Calibration complete")));

    const auto closed = console->calibrationStep(0, 2, 2, QStringLiteral("0"), QStringLiteral("0"));
    EXPECT_EQ(closed.error, ErrorCode::SessionClosed);

    EXPECT_TRUE(console->submit(ResetCommand {}).success);
    EXPECT_EQ(console->calibrationStatus().state, SessionState::Idle);
}

TEST_F(ConsoleCoordinatorTest, InvalidLocationSurfacesInLog)
{
    const auto result = console->calibrationStep(0, 3, 3, QStringLiteral("abc"), QStringLiteral("1"));
    EXPECT_EQ(result.error, ErrorCode::InvalidLocation);
    EXPECT_TRUE(logContains(QStringLiteral("abc")));
}

TEST(ConsoleCoordinatorLifecycleTest, SinkIsRemovedAtShutdown)
{
    MockRig rig;
    ConsoleConfig config;
    config.cameras = MockRig::poweredSlots();
    config.calibration.reportDirectory.clear();
    ConsoleCollaborators collaborators;
    collaborators.deviceFactory = rig.factory();

    quint64 lastSequence = 0;
    {
        ConsoleCoordinator console(config, std::move(collaborators));
        Logger::info(QStringLiteral("inside"));
        lastSequence = console.statusLog().lastSequence();
        EXPECT_GT(lastSequence, 0u);
    }
    // Must not touch the destroyed log.
    Logger::info(QStringLiteral("outside"));
}
