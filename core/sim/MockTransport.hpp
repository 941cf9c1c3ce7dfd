#pragma once

#include "../ports/ITransport.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace fleetsense::sim {

/**
 * @brief In-process broker stand-in for tests and offline replays
 *
 * Delivered messages are routed like a broker would: only to a handler whose
 * subscriptions cover the topic, and only from poll(). Everything published
 * is recorded for inspection.
 */
class MockTransport : public ports::ITransport {
public:
    MockTransport() = default;

    bool connect(const ports::BrokerCredentials& credentials) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const ports::TransportMessage& message) override;
    bool subscribe(const std::string& filter, int qos) override;
    bool unsubscribe(const std::string& filter) override;

    void setMessageHandler(MessageHandler handler) override;
    void setLinkHandler(LinkHandler handler) override;

    void poll() override;

    // Queue an inbound message for the next poll().
    void deliver(const std::string& topic, const std::string& payload);

    void dropLink(const std::string& reason = "link lost");
    void restoreLink();
    void setPublishFailure(bool fail);

    std::vector<ports::TransportMessage> publications() const;
    std::vector<std::string> subscriptions() const;
    ports::BrokerCredentials lastCredentials() const;
    std::size_t unrouted() const;

private:
    void notifyLink(bool up, const std::string& reason);

    mutable std::mutex mutex_;
    bool connected_ = false;
    bool failPublish_ = false;
    std::size_t unrouted_ = 0;

    MessageHandler messageHandler_;
    LinkHandler linkHandler_;

    ports::BrokerCredentials lastCredentials_;
    std::vector<std::string> subscriptions_;
    std::vector<ports::TransportMessage> published_;
    std::deque<ports::TransportMessage> inbound_;
};

} // namespace fleetsense::sim
