#pragma once

#include "../PositionSample.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace fleetsense::domain {

/**
 * @brief Per-vehicle reorder buffer
 *
 * Holds samples until they are older than the reorder window relative to the
 * newest timestamp seen, then releases them in timestamp order. Samples at or
 * before the last released timestamp are reported as late and never released.
 */
class SampleSequencer {
public:
    enum class Admission {
        Buffered,
        Duplicate,
        Late
    };

    explicit SampleSequencer(std::chrono::seconds reorderWindow);

    Admission push(const PositionSample& sample);

    // Samples now older than the window, ascending.
    std::vector<PositionSample> drainReady();

    // Everything still buffered, ascending.
    std::vector<PositionSample> flush();

    std::size_t pending() const { return buffer_.size(); }
    std::optional<Timestamp> lastReleased() const { return lastReleased_; }

private:
    std::chrono::seconds reorderWindow_;
    std::map<std::int64_t, PositionSample> buffer_;
    std::optional<Timestamp> newestSeen_;
    std::optional<Timestamp> lastReleased_;
};

} // namespace fleetsense::domain
