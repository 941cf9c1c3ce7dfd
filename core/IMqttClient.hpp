/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface for the telemetry broker
 *
 * Platform-independent abstraction over an MQTT 3.1.1 client. Supports plain
 * TCP, server-authenticated TLS and mutual TLS with client certificates.
 */

#pragma once

#include <string>
#include <functional>
#include <memory>
#include <optional>
#include <cstdint>

namespace fleetsense {

/**
 * @brief Single MQTT message, inbound or outbound
 *
 * @note QoS levels: 0 (at most once), 1 (at least once), 2 (exactly once)
 */
struct MqttMessage {
    std::string topic;              ///< e.g. "fleet/{vehicleId}/positions"
    std::string payload;            ///< JSON document
    int qos = 0;
    bool retained = false;
};

/**
 * @brief TLS settings
 *
 * Certificate and key paths are optional. When both are set the client
 * authenticates with them; otherwise only the server is verified.
 *
 * @note Files must be PEM encoded
 */
struct TlsConfig {
    std::string certPath;          ///< Client certificate (.pem), optional
    std::string keyPath;           ///< Private key (.pem), optional
    std::string caPath;            ///< Trusted CA bundle (.pem), optional
    bool verifyServer = true;
};

struct MqttConnectOptions {
    std::string host;
    std::uint16_t port = 1883;
    std::string clientId;
    std::string username;
    std::string password;
    std::optional<TlsConfig> tls;   ///< Unset means plain TCP
};

/**
 * @brief Platform-independent MQTT client interface
 *
 * @note Callbacks may run on the client library's own thread
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;

    using MessageCallback = std::function<void(const MqttMessage&)>;
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;

    /**
     * @brief Start connecting to the broker
     * @return true if the attempt was initiated; the outcome arrives on the
     *         connection callback
     */
    virtual bool connect(const MqttConnectOptions& options) = 0;

    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    /**
     * @brief Publish a message
     * @return true if handed to the broker connection, false when offline or
     *         rejected. Nothing is buffered; the caller decides on redelivery.
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                        int qos = 0, bool retained = false) = 0;

    /**
     * @brief Subscribe to a topic filter (wildcards allowed)
     * @note Subscriptions are restored after a reconnect
     */
    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;
    virtual bool unsubscribe(const std::string& topic) = 0;

    virtual void setMessageCallback(MessageCallback callback) = 0;
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

    // Must be called regularly by clients that do not own a network thread.
    virtual void processEvents() = 0;

protected:
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace fleetsense
