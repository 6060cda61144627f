#ifndef DLNACAST_TESTS_FIXTURES_EVENT_RECORDER_H
#define DLNACAST_TESTS_FIXTURES_EVENT_RECORDER_H

#include "EventSurface.h"

#include <mutex>
#include <string>
#include <vector>

namespace fixtures {

// Records everything an EventSurface delivers.
class EventRecorder {
public:
    EventSurface::Callbacks callbacks() {
        EventSurface::Callbacks callbacks;
        callbacks.onDeviceFound = [this](const RendererDevice& device) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_found.push_back(device);
        };
        callbacks.onDeviceLost = [this](const std::string& deviceId) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lost.push_back(deviceId);
        };
        callbacks.onCastProgress = [this](const CastProgress& progress) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_progress.push_back(progress);
        };
        return callbacks;
    }

    std::vector<RendererDevice> found() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_found;
    }

    std::vector<std::string> lost() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lost;
    }

    std::vector<CastProgress> progress() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_progress;
    }

    std::vector<CastStage> stages() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<CastStage> stages;
        for (const auto& progress : m_progress) {
            stages.push_back(progress.stage);
        }
        return stages;
    }

    int countStage(CastStage stage) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        int count = 0;
        for (const auto& progress : m_progress) {
            if (progress.stage == stage) {
                ++count;
            }
        }
        return count;
    }

    // Stages emitted for one device, in order
    std::vector<CastStage> stagesFor(const std::string& deviceName) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<CastStage> stages;
        for (const auto& progress : m_progress) {
            if (progress.deviceName == deviceName) {
                stages.push_back(progress.stage);
            }
        }
        return stages;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<RendererDevice> m_found;
    std::vector<std::string> m_lost;
    std::vector<CastProgress> m_progress;
};

}  // namespace fixtures

#endif  // DLNACAST_TESTS_FIXTURES_EVENT_RECORDER_H
