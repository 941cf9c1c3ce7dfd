#pragma once

#include "TimeUtil.hpp"
#include <cstdint>
#include <string>

namespace fleetsense {

// Wall clock. Only batch drivers and retention read it; detection and
// segmentation run on sample time.
class IClock {
public:
    virtual ~IClock() = default;

    virtual Timestamp now() const = 0;
    virtual uint64_t epochSeconds() const = 0;
    virtual std::string iso8601() const = 0;
};

class SystemClock : public IClock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }

    uint64_t epochSeconds() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            now().time_since_epoch()).count();
    }

    std::string iso8601() const override;
};

} // namespace fleetsense
