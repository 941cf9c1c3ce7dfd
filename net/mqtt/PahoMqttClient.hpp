/**
 * @file PahoMqttClient.hpp
 * @brief Eclipse Paho MQTT C (async) implementation of IMqttClient
 *
 * Paho owns the network thread and reconnects on its own. Subscriptions are
 * replayed after every successful connect. Publishing while offline fails
 * fast; redelivery is the caller's job (see TelemetryBridge).
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace fleetsense {

class PahoMqttClient : public IMqttClient {
public:
    PahoMqttClient() = default;
    ~PahoMqttClient() override;

    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;

    bool connect(const MqttConnectOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                 int qos = 0, bool retained = false) override;
    bool subscribe(const std::string& topic, int qos = 0) override;
    bool unsubscribe(const std::string& topic) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

    void processEvents() override {}

    // Publishes the broker rejected after they were handed to Paho.
    std::size_t failedDeliveries() const { return failedDeliveries_.load(); }

private:
    static constexpr int kKeepAliveIntervalSeconds = 60;
    static constexpr int kConnectTimeoutSeconds = 30;
    static constexpr int kMinRetryIntervalSeconds = 1;
    static constexpr int kMaxRetryIntervalSeconds = 60;

    MQTTAsync client_ = nullptr;
    std::atomic<bool> connected_{false};
    std::atomic<std::size_t> failedDeliveries_{0};

    // Paho keeps pointers into these strings for the lifetime of the handle
    MqttConnectOptions options_;

    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;
    mutable std::mutex callbackMutex_;

    std::map<std::string, int> subscriptions_;  ///< filter -> qos
    std::mutex subscriptionMutex_;

    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onReconnected(void* context, char* cause);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static void onDisconnected(void* context, MQTTAsync_successData* response);
    static void onSendFailure(void* context, MQTTAsync_failureData* response);

    void linkUp(const std::string& reason);
    void notifyConnection(bool connected, const std::string& reason);
    bool sendSubscribe(const std::string& topic, int qos);
    void restoreSubscriptions();
    bool tlsFilesReadable(const TlsConfig& tls) const;
};

} // namespace fleetsense
