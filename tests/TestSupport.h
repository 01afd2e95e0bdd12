#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>

#include "pickcal/Actuator.h"
#include "pickcal/TargetDetector.h"
#include "pickcal/camera/CameraDevice.h"
#include "pickcal/camera/CameraSourceManager.h"

namespace pickcal::test {

// Shared between a MockCameraDevice and the test that created it; the device
// itself is owned (and destroyed) by CameraSourceManager.
struct MockDeviceState {
    std::atomic<int> opens {0};
    std::atomic<int> closes {0};
    std::atomic<int> reads {0};
    std::atomic<int> inFlight {0};
    std::atomic<bool> overlapDetected {false};
    std::atomic<bool> failOpen {false};
    std::atomic<bool> failRead {false};
    std::chrono::milliseconds readDelay {0};
    cv::Mat frame {cv::Mat(240, 320, CV_8UC3, cv::Scalar(255, 0, 0))};
};

class MockCameraDevice : public CameraDevice {
public:
    explicit MockCameraDevice(std::shared_ptr<MockDeviceState> state)
        : m_state(std::move(state))
    {
    }

    QString backendName() const override { return QStringLiteral("mock"); }
    QString describe() const override { return QStringLiteral("mock %1x%2").arg(m_state->frame.cols).arg(m_state->frame.rows); }

    bool open(QString *errorMessage) override
    {
        ++m_state->opens;
        if (m_state->failOpen) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("mock open failure");
            }
            return false;
        }
        m_open = true;
        return true;
    }

    void close() override
    {
        if (m_open) {
            ++m_state->closes;
        }
        m_open = false;
    }

    bool isOpen() const override { return m_open; }

    bool read(cv::Mat &frame, std::chrono::milliseconds, QString *errorMessage) override
    {
        if (m_state->inFlight.fetch_add(1) != 0) {
            m_state->overlapDetected = true;
        }
        ++m_state->reads;
        if (m_state->readDelay.count() > 0) {
            std::this_thread::sleep_for(m_state->readDelay);
        }
        bool ok = true;
        if (m_state->failRead) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("mock read failure");
            }
            ok = false;
        } else {
            frame = m_state->frame.clone();
        }
        --m_state->inFlight;
        return ok;
    }

private:
    std::shared_ptr<MockDeviceState> m_state;
    bool m_open {false};
};

struct MockRig {
    std::vector<std::shared_ptr<MockDeviceState>> states;

    MockRig()
    {
        for (int i = 0; i < CameraSourceManager::kSlotCount; ++i) {
            states.push_back(std::make_shared<MockDeviceState>());
        }
    }

    CameraSourceManager::DeviceFactory factory() const
    {
        auto captured = states;
        return [captured](int slot, const CameraSlotConfig &, QString *) -> CameraDevicePtr {
            return std::make_unique<MockCameraDevice>(captured[static_cast<size_t>(slot)]);
        };
    }

    static CameraSourceManager::SlotConfigs poweredSlots()
    {
        CameraSourceManager::SlotConfigs configs;
        for (int i = 0; i < CameraSourceManager::kSlotCount; ++i) {
            configs[static_cast<size_t>(i)].name = QStringLiteral("Mock %1").arg(i);
            configs[static_cast<size_t>(i)].backend = QStringLiteral("mock");
            configs[static_cast<size_t>(i)].powered = true;
        }
        return configs;
    }
};

// Where the fake machine currently holds the target; shared by the fake
// actuator (writer) and the fake detector (reader).
struct FakeStage {
    std::mutex mutex;
    cv::Point2d location;
    std::vector<cv::Point2d> moves;

    // Image position of the target for a machine location: a fixed affine view.
    static cv::Point2f project(const cv::Point2d &worldMm)
    {
        return {static_cast<float>(100.0 + 2.0 * worldMm.x), static_cast<float>(50.0 + 2.5 * worldMm.y)};
    }
};

class FakeActuator : public Actuator {
public:
    explicit FakeActuator(std::shared_ptr<FakeStage> stage)
        : m_stage(std::move(stage))
    {
    }

    QString name() const override { return QStringLiteral("fake"); }

    OperationResult moveTo(const cv::Point2d &locationMm, std::chrono::milliseconds) override
    {
        if (moveDelay.count() > 0) {
            std::this_thread::sleep_for(moveDelay);
        }
        if (failMoves > 0) {
            --failMoves;
            return OperationResult::failure(ErrorCode::ActuatorFault, QStringLiteral("axis stalled"));
        }
        std::lock_guard<std::mutex> lock(m_stage->mutex);
        m_stage->location = locationMm;
        m_stage->moves.push_back(locationMm);
        return OperationResult::ok();
    }

    std::atomic<int> failMoves {0};
    std::chrono::milliseconds moveDelay {0};

private:
    std::shared_ptr<FakeStage> m_stage;
};

class FakeDetector : public TargetDetector {
public:
    explicit FakeDetector(std::shared_ptr<FakeStage> stage)
        : m_stage(std::move(stage))
    {
    }

    TargetDetection detect(const cv::Mat &frame, CalibrationTarget) const override
    {
        ++calls;
        TargetDetection result;
        result.resolution = frame.size();
        if (failDetections > 0) {
            --failDetections;
            result.message = QStringLiteral("target not in view");
            return result;
        }
        std::lock_guard<std::mutex> lock(m_stage->mutex);
        result.success = true;
        result.referencePoint = FakeStage::project(m_stage->location);
        return result;
    }

    mutable std::atomic<int> calls {0};
    mutable std::atomic<int> failDetections {0};

private:
    std::shared_ptr<FakeStage> m_stage;
};

} // namespace pickcal::test
