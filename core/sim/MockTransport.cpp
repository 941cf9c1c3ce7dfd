#include "MockTransport.hpp"
#include "../TopicFilter.hpp"
#include <algorithm>

namespace fleetsense::sim {

bool MockTransport::connect(const ports::BrokerCredentials& credentials) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastCredentials_ = credentials;
        connected_ = true;
    }
    notifyLink(true, "connected to " + credentials.host);
    return true;
}

void MockTransport::disconnect() {
    bool wasConnected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wasConnected = connected_;
        connected_ = false;
        subscriptions_.clear();
    }
    if (wasConnected) {
        notifyLink(false, "disconnected");
    }
}

bool MockTransport::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

bool MockTransport::publish(const ports::TransportMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_ || failPublish_) {
        return false;
    }
    published_.push_back(message);
    return true;
}

bool MockTransport::subscribe(const std::string& filter, int /*qos*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) return false;

    if (std::find(subscriptions_.begin(), subscriptions_.end(), filter) == subscriptions_.end()) {
        subscriptions_.push_back(filter);
    }
    return true;
}

bool MockTransport::unsubscribe(const std::string& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(subscriptions_.begin(), subscriptions_.end(), filter);
    if (it == subscriptions_.end()) return false;
    subscriptions_.erase(it);
    return true;
}

void MockTransport::setMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    messageHandler_ = std::move(handler);
}

void MockTransport::setLinkHandler(LinkHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    linkHandler_ = std::move(handler);
}

void MockTransport::poll() {
    std::deque<ports::TransportMessage> batch;
    MessageHandler handler;
    std::vector<std::string> filters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) return;
        batch.swap(inbound_);
        handler = messageHandler_;
        filters = subscriptions_;
    }

    // Handlers run unlocked so they may publish back through this transport
    for (const auto& message : batch) {
        bool routed = handler && std::any_of(filters.begin(), filters.end(), [&](const std::string& filter) {
            return topic::matches(filter, message.topic);
        });
        if (routed) {
            handler(message);
        } else {
            std::lock_guard<std::mutex> lock(mutex_);
            ++unrouted_;
        }
    }
}

void MockTransport::deliver(const std::string& topic, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    inbound_.push_back(ports::TransportMessage{topic, payload, 0});
}

void MockTransport::dropLink(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) return;
        connected_ = false;
    }
    notifyLink(false, reason);
}

void MockTransport::restoreLink() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connected_) return;
        connected_ = true;
    }
    notifyLink(true, "link restored");
}

void MockTransport::setPublishFailure(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failPublish_ = fail;
}

std::vector<ports::TransportMessage> MockTransport::publications() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

std::vector<std::string> MockTransport::subscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_;
}

ports::BrokerCredentials MockTransport::lastCredentials() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastCredentials_;
}

std::size_t MockTransport::unrouted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unrouted_;
}

void MockTransport::notifyLink(bool up, const std::string& reason) {
    LinkHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = linkHandler_;
    }
    if (handler) {
        handler(up, reason);
    }
}

} // namespace fleetsense::sim
