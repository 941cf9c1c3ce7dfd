#pragma once

#include "../VehicleEvent.hpp"
#include <functional>

namespace fleetsense::ports {

// Fan-out of stored events to notification collaborators.
class IEventBus {
public:
    virtual ~IEventBus() = default;

    using Handler = std::function<void(const VehicleEvent&)>;

    virtual void publish(const VehicleEvent& event) = 0;
    virtual void subscribe(EventType eventType, Handler handler) = 0;
    virtual void subscribeAll(Handler handler) = 0;
    virtual void unsubscribe(EventType eventType) = 0;
    virtual void processEvents() = 0;
};

} // namespace fleetsense::ports
