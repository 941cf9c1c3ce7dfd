#pragma once

#include "../InsightConfig.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace fleetsense::ports {

// Broker endpoint, identity and TLS material for one session.
struct BrokerCredentials {
    std::string host;
    std::uint16_t port = 1883;
    std::string clientId;
    std::string username;
    std::string password;

    bool useTls = false;
    std::string caPath;
    std::string certPath;
    std::string keyPath;

    static BrokerCredentials fromConfig(const MqttConfig& mqtt) {
        BrokerCredentials credentials;
        credentials.host = mqtt.host;
        credentials.port = mqtt.port;
        credentials.clientId = mqtt.clientId;
        credentials.username = mqtt.username;
        credentials.password = mqtt.password;
        credentials.useTls = mqtt.useTls;
        credentials.caPath = mqtt.caPath;
        credentials.certPath = mqtt.certPath;
        credentials.keyPath = mqtt.keyPath;
        return credentials;
    }
};

struct TransportMessage {
    std::string topic;
    std::string payload;
    int qos = 0;
};

/**
 * @brief Message link between the pipeline and a broker
 *
 * Handlers are invoked from poll() on the caller's thread, except where an
 * implementation documents otherwise.
 */
class ITransport {
public:
    using MessageHandler = std::function<void(const TransportMessage& message)>;
    using LinkHandler = std::function<void(bool up, const std::string& reason)>;

    virtual ~ITransport() = default;

    virtual bool connect(const BrokerCredentials& credentials) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // False when the message could not be handed to the broker.
    virtual bool publish(const TransportMessage& message) = 0;

    virtual bool subscribe(const std::string& filter, int qos) = 0;
    virtual bool unsubscribe(const std::string& filter) = 0;

    virtual void setMessageHandler(MessageHandler handler) = 0;
    virtual void setLinkHandler(LinkHandler handler) = 0;

    virtual void poll() = 0;
};

} // namespace fleetsense::ports
