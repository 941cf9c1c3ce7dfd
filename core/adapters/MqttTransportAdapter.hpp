#pragma once

#include "../ports/ITransport.hpp"
#include "../IMqttClient.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace fleetsense::adapters {

/**
 * @brief ITransport over an IMqttClient
 *
 * The MQTT client calls back on its own network thread. Inbound messages and
 * link changes are queued here and handed to the handlers from poll(), so
 * the pipeline only ever sees the thread that drives the main loop.
 */
class MqttTransportAdapter : public ports::ITransport {
public:
    explicit MqttTransportAdapter(std::shared_ptr<IMqttClient> mqttClient);
    ~MqttTransportAdapter() override;

    bool connect(const ports::BrokerCredentials& credentials) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const ports::TransportMessage& message) override;
    bool subscribe(const std::string& filter, int qos) override;
    bool unsubscribe(const std::string& filter) override;

    void setMessageHandler(MessageHandler handler) override;
    void setLinkHandler(LinkHandler handler) override;

    void poll() override;

    std::size_t backlog() const;

    static MqttConnectOptions toConnectOptions(const ports::BrokerCredentials& credentials);

private:
    struct LinkChange {
        bool up = false;
        std::string reason;
    };

    static constexpr std::size_t kMaxBacklog = 10000;

    std::shared_ptr<IMqttClient> mqttClient_;
    MessageHandler messageHandler_;
    LinkHandler linkHandler_;

    mutable std::mutex mutex_;
    std::deque<ports::TransportMessage> inbound_;
    std::deque<LinkChange> linkChanges_;
    std::size_t overflowed_ = 0;
};

} // namespace fleetsense::adapters
