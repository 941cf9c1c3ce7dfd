#pragma once

#include "../ports/IEventBus.hpp"
#include <unordered_map>
#include <vector>
#include <queue>
#include <mutex>

namespace fleetsense::domain {

class EventBus : public ports::IEventBus {
public:
    EventBus() = default;
    ~EventBus() override = default;

    void publish(const VehicleEvent& event) override;
    void subscribe(EventType eventType, Handler handler) override;
    void subscribeAll(Handler handler) override;
    void unsubscribe(EventType eventType) override;
    void processEvents() override;

    std::size_t pending() const;

private:
    std::vector<Handler> handlersFor(EventType eventType) const;

    std::unordered_map<EventType, std::vector<Handler>> handlers_;
    std::vector<Handler> wildcardHandlers_;
    std::queue<VehicleEvent> eventQueue_;
    mutable std::mutex queueMutex_;
    mutable std::mutex handlerMutex_;
    bool processing_ = false;
};

} // namespace fleetsense::domain
