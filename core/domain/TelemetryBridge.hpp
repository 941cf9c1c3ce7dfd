#pragma once

#include "IngestionPipeline.hpp"
#include "../InsightConfig.hpp"
#include "../ports/ITransport.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../VehicleEvent.hpp"
#include <atomic>
#include <memory>
#include <queue>
#include <chrono>
#include <string>

namespace fleetsense::domain {

/**
 * @brief Connects the broker to the ingestion pipeline and back
 *
 * Inbound position messages are decoded and handed to the pipeline. Every
 * event published on the bus goes out on "<prefix>/<vehicle>/events" at QoS 1;
 * failed publishes wait in a retry queue paced by the retry policy. While the
 * link is down the queue keeps the newest kMaxPendingMessages events.
 */
class TelemetryBridge {
public:
    struct Stats {
        std::size_t messagesReceived = 0;
        std::size_t decodeErrors = 0;
        std::size_t eventsPublished = 0;
        std::size_t eventsDropped = 0;
    };

    TelemetryBridge(MqttConfig config,
                    std::shared_ptr<ports::ITransport> transport,
                    std::shared_ptr<ports::IEventBus> eventBus,
                    std::shared_ptr<ports::IPolicyEngine> policyEngine,
                    std::shared_ptr<IngestionPipeline> pipeline);

    void start();
    void stop();

    // Pumps the transport and the bus, then retries due messages.
    void processEvents();

    Stats stats() const;
    std::size_t pendingRetries() const { return retryQueue_.size(); }

    std::string buildTopic(const std::string& vehicleId) const;

private:
    void onMessage(const ports::TransportMessage& message);
    void onLink(bool up, const std::string& reason);
    void onEvent(const VehicleEvent& event);
    void queueForRetry(std::string topic, std::string payload, int attempts);
    void retryFailedMessages();

    struct PendingMessage {
        std::string topic;
        std::string payload;
        int attempts = 0;
        std::chrono::steady_clock::time_point nextRetry;
    };

    static constexpr std::size_t kMaxPendingMessages = 1000;

    MqttConfig config_;
    std::shared_ptr<ports::ITransport> transport_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::shared_ptr<IngestionPipeline> pipeline_;

    bool running_ = false;
    bool busSubscribed_ = false;
    std::queue<PendingMessage> retryQueue_;

    std::atomic<std::size_t> messagesReceived_{0};
    std::atomic<std::size_t> decodeErrors_{0};
    std::size_t eventsPublished_ = 0;
    std::size_t eventsDropped_ = 0;
};

} // namespace fleetsense::domain
