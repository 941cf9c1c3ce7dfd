#include "TelemetryBridge.hpp"
#include "../Errors.hpp"
#include "../JsonCodec.hpp"
#include "../TopicFilter.hpp"
#include <iostream>

namespace fleetsense::domain {

namespace {

constexpr int kEventQos = 1;

} // namespace

TelemetryBridge::TelemetryBridge(MqttConfig config,
                                 std::shared_ptr<ports::ITransport> transport,
                                 std::shared_ptr<ports::IEventBus> eventBus,
                                 std::shared_ptr<ports::IPolicyEngine> policyEngine,
                                 std::shared_ptr<IngestionPipeline> pipeline)
    : config_(config), transport_(transport), eventBus_(eventBus), policyEngine_(policyEngine),
      pipeline_(pipeline) {
}

void TelemetryBridge::start() {
    running_ = true;

    transport_->setMessageHandler([this](const ports::TransportMessage& message) {
        onMessage(message);
    });
    transport_->setLinkHandler([this](bool up, const std::string& reason) {
        onLink(up, reason);
    });

    if (!busSubscribed_) {
        eventBus_->subscribeAll([this](const VehicleEvent& event) {
            onEvent(event);
        });
        busSubscribed_ = true;
    }

    if (transport_->isConnected()) {
        transport_->subscribe(config_.positionTopic, kEventQos);
    }
}

void TelemetryBridge::stop() {
    running_ = false;
    if (transport_->isConnected()) {
        transport_->unsubscribe(config_.positionTopic);
    }
    transport_->setMessageHandler(nullptr);
    transport_->setLinkHandler(nullptr);
}

void TelemetryBridge::processEvents() {
    if (!running_) return;

    transport_->poll();
    eventBus_->processEvents();
    retryFailedMessages();
}

void TelemetryBridge::onLink(bool up, const std::string& reason) {
    std::cout << "[Notify] Transport " << (up ? "up" : "down") << ": " << reason << std::endl;
    if (up && running_) {
        transport_->subscribe(config_.positionTopic, kEventQos);
    }
}

void TelemetryBridge::onMessage(const ports::TransportMessage& message) {
    ++messagesReceived_;
    const std::string& topicStr = message.topic;

    auto vehicle = topic::captureVehicle(config_.positionTopic, topicStr);
    if (!vehicle) {
        return;
    }

    try {
        auto sample = JsonCodec::deserializeSample(message.payload);
        if (sample.vehicleId.empty()) {
            sample.vehicleId = *vehicle;
        } else if (!vehicle->empty() && sample.vehicleId != *vehicle) {
            throw InputError("vehicle_id '" + sample.vehicleId + "' does not match topic " + topicStr);
        }
        pipeline_->ingest(sample);
    } catch (const InputError& e) {
        ++decodeErrors_;
        std::cerr << "[Ingest] Dropped message on " << topicStr << ": " << e.what() << std::endl;
    } catch (const StorageError& e) {
        std::cerr << "[Ingest] Storage failure for message on " << topicStr << ": " << e.what() << std::endl;
    }
}

void TelemetryBridge::onEvent(const VehicleEvent& event) {
    if (!running_) return;

    std::string topic = buildTopic(event.vehicleId);
    std::string payload = JsonCodec::serialize(event);

    if (!transport_->isConnected()) {
        queueForRetry(std::move(topic), std::move(payload), 0);
        return;
    }

    if (transport_->publish(ports::TransportMessage{topic, payload, kEventQos})) {
        ++eventsPublished_;
    } else {
        queueForRetry(std::move(topic), std::move(payload), 1);
    }
}

void TelemetryBridge::queueForRetry(std::string topic, std::string payload, int attempts) {
    PendingMessage msg;
    msg.topic = std::move(topic);
    msg.payload = std::move(payload);
    msg.attempts = attempts;
    msg.nextRetry = std::chrono::steady_clock::now();
    if (attempts > 0) {
        msg.nextRetry += policyEngine_->getRetryPolicy().getBackoffDelay(attempts);
    }
    if (retryQueue_.size() >= kMaxPendingMessages) {
        std::cerr << "[Notify] Retry queue full, dropping event on " << retryQueue_.front().topic << std::endl;
        ++eventsDropped_;
        retryQueue_.pop();
    }
    retryQueue_.push(std::move(msg));
}

void TelemetryBridge::retryFailedMessages() {
    if (retryQueue_.empty() || !transport_->isConnected()) return;

    auto now = std::chrono::steady_clock::now();
    const auto& retry = policyEngine_->getRetryPolicy();

    while (!retryQueue_.empty()) {
        auto& msg = retryQueue_.front();

        if (msg.nextRetry > now) break;

        if (msg.attempts > 0 && !retry.shouldRetry(msg.attempts)) {
            std::cerr << "[Notify] Dropping event on " << msg.topic << " after "
                      << msg.attempts << " attempts" << std::endl;
            ++eventsDropped_;
            retryQueue_.pop();
            continue;
        }

        if (transport_->publish(ports::TransportMessage{msg.topic, msg.payload, kEventQos})) {
            ++eventsPublished_;
            retryQueue_.pop();
        } else {
            msg.attempts++;
            msg.nextRetry = now + retry.getBackoffDelay(msg.attempts);
            break; // Keep ordering: retry the head before anything behind it
        }
    }
}

TelemetryBridge::Stats TelemetryBridge::stats() const {
    Stats s;
    s.messagesReceived = messagesReceived_.load();
    s.decodeErrors = decodeErrors_.load();
    s.eventsPublished = eventsPublished_;
    s.eventsDropped = eventsDropped_;
    return s;
}

std::string TelemetryBridge::buildTopic(const std::string& vehicleId) const {
    return topic::eventTopic(config_.eventTopicPrefix, vehicleId);
}

} // namespace fleetsense::domain
