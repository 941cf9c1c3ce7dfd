#include "EventBus.hpp"
#include <iostream>

namespace fleetsense::domain {

void EventBus::publish(const VehicleEvent& event) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    eventQueue_.push(event);
}

void EventBus::subscribe(EventType eventType, Handler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    handlers_[eventType].push_back(std::move(handler));
}

void EventBus::subscribeAll(Handler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    wildcardHandlers_.push_back(std::move(handler));
}

void EventBus::unsubscribe(EventType eventType) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    handlers_.erase(eventType);
}

std::size_t EventBus::pending() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return eventQueue_.size();
}

std::vector<EventBus::Handler> EventBus::handlersFor(EventType eventType) const {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    std::vector<Handler> result;
    auto it = handlers_.find(eventType);
    if (it != handlers_.end()) {
        result = it->second;
    }
    result.insert(result.end(), wildcardHandlers_.begin(), wildcardHandlers_.end());
    return result;
}

void EventBus::processEvents() {
    if (processing_) return; // Prevent recursive processing

    processing_ = true;

    while (true) {
        VehicleEvent event;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (eventQueue_.empty()) break;

            event = std::move(eventQueue_.front());
            eventQueue_.pop();
        }

        // A failing subscriber must not starve the others
        for (const auto& handler : handlersFor(event.type)) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                std::cerr << "[EventBus] Handler failed for " << eventTypeToString(event.type)
                          << " event " << event.id << ": " << e.what() << std::endl;
            }
        }
    }

    processing_ = false;
}

} // namespace fleetsense::domain
