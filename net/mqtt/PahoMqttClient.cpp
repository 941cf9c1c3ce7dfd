#include "PahoMqttClient.hpp"
#include <fstream>
#include <iostream>

namespace fleetsense {

PahoMqttClient::~PahoMqttClient() {
    if (client_) {
        if (connected_) {
            MQTTAsync_disconnectOptions opts = MQTTAsync_disconnectOptions_initializer;
            opts.timeout = 1000;
            MQTTAsync_disconnect(client_, &opts);
        }
        MQTTAsync_destroy(&client_);
    }
}

bool PahoMqttClient::connect(const MqttConnectOptions& options) {
    options_ = options;

    if (options_.tls && !tlsFilesReadable(*options_.tls)) {
        return false;
    }

    const std::string serverUri = (options_.tls ? "ssl://" : "tcp://") + options_.host + ":" +
                                  std::to_string(options_.port);

    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }

    int rc = MQTTAsync_create(&client_, serverUri.c_str(), options_.clientId.c_str(),
                              MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Could not create client for " << serverUri << ", rc=" << rc << std::endl;
        return false;
    }

    rc = MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Could not register callbacks, rc=" << rc << std::endl;
        return false;
    }

    // automaticReconnect only reports success here, never through onSuccess
    rc = MQTTAsync_setConnected(client_, this, onReconnected);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Could not register reconnect callback, rc=" << rc << std::endl;
        return false;
    }

    MQTTAsync_connectOptions connOpts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions sslOpts = MQTTAsync_SSLOptions_initializer;

    connOpts.keepAliveInterval = kKeepAliveIntervalSeconds;
    connOpts.connectTimeout = kConnectTimeoutSeconds;
    connOpts.cleansession = 0;   // broker keeps our position subscription across drops
    connOpts.automaticReconnect = 1;
    connOpts.minRetryInterval = kMinRetryIntervalSeconds;
    connOpts.maxRetryInterval = kMaxRetryIntervalSeconds;
    connOpts.onSuccess = onConnected;
    connOpts.onFailure = onConnectFailure;
    connOpts.context = this;
    if (!options_.username.empty()) {
        connOpts.username = options_.username.c_str();
        connOpts.password = options_.password.c_str();
    }

    if (options_.tls) {
        const auto& tls = *options_.tls;
        if (!tls.caPath.empty()) {
            sslOpts.trustStore = tls.caPath.c_str();
        }
        // Mutual TLS only when both halves of the client identity are present
        if (!tls.certPath.empty() && !tls.keyPath.empty()) {
            sslOpts.keyStore = tls.certPath.c_str();
            sslOpts.privateKey = tls.keyPath.c_str();
        }
        sslOpts.enableServerCertAuth = tls.verifyServer ? 1 : 0;
        sslOpts.verify = tls.verifyServer ? 1 : 0;
        sslOpts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;
        connOpts.ssl = &sslOpts;
    }

    rc = MQTTAsync_connect(client_, &connOpts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connect to " << serverUri << " not started, rc=" << rc << std::endl;
        return false;
    }
    return true;
}

void PahoMqttClient::disconnect() {
    if (!client_ || !connected_) return;

    MQTTAsync_disconnectOptions opts = MQTTAsync_disconnectOptions_initializer;
    opts.onSuccess = onDisconnected;
    opts.context = this;

    int rc = MQTTAsync_disconnect(client_, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Disconnect failed, rc=" << rc << std::endl;
    }
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload,
                             int qos, bool retained) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_message message = MQTTAsync_message_initializer;
    message.payload = const_cast<char*>(payload.data());
    message.payloadlen = static_cast<int>(payload.size());
    message.qos = qos;
    message.retained = retained ? 1 : 0;

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.onFailure = onSendFailure;
    opts.context = this;

    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &message, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Publish to " << topic << " rejected, rc=" << rc << std::endl;
        return false;
    }
    return true;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        subscriptions_[topic] = qos;
    }
    // Recorded either way; onConnected replays it
    return connected_ && sendSubscribe(topic, qos);
}

bool PahoMqttClient::sendSubscribe(const std::string& topic, int qos) {
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Subscribe to " << topic << " failed, rc=" << rc << std::endl;
        return false;
    }
    std::cout << "[MQTT] Subscribed to " << topic << " (QoS " << qos << ")" << std::endl;
    return true;
}

bool PahoMqttClient::unsubscribe(const std::string& topic) {
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        subscriptions_.erase(topic);
    }
    if (!connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    return MQTTAsync_unsubscribe(client_, topic.c_str(), &opts) == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    connectionCallback_ = std::move(callback);
}

void PahoMqttClient::notifyConnection(bool connected, const std::string& reason) {
    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = connectionCallback_;
    }
    if (callback) {
        callback(connected, reason);
    }
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);

    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(client->callbackMutex_);
        callback = client->messageCallback_;
    }

    if (callback) {
        MqttMessage msg;
        msg.topic = topicLen > 0 ? std::string(topicName, topicLen) : std::string(topicName);
        msg.payload.assign(static_cast<const char*>(message->payload), message->payloadlen);
        msg.qos = message->qos;
        msg.retained = message->retained != 0;
        callback(msg);
    }

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* /*response*/) {
    static_cast<PahoMqttClient*>(context)->linkUp("connected");
}

void PahoMqttClient::onReconnected(void* context, char* cause) {
    static_cast<PahoMqttClient*>(context)->linkUp(cause ? std::string(cause) : "reconnected");
}

void PahoMqttClient::linkUp(const std::string& reason) {
    // Both callbacks fire for the first connect; only the first one counts
    if (connected_.exchange(true)) {
        return;
    }
    std::cout << "[MQTT] Connected to " << options_.host << " (" << reason << ")" << std::endl;

    restoreSubscriptions();
    notifyConnection(true, reason);
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    std::string reason = "connect failed";
    if (response) {
        reason += ", code " + std::to_string(response->code);
        if (response->message) {
            reason += ": " + std::string(response->message);
        }
    }
    std::cerr << "[MQTT] " << reason << std::endl;
    client->notifyConnection(false, reason);
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    std::string reason = cause ? std::string(cause) : "connection lost";
    std::cerr << "[MQTT] " << reason << ", reconnecting" << std::endl;
    client->notifyConnection(false, reason);
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* /*response*/) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    client->notifyConnection(false, "disconnected");
}

void PahoMqttClient::onSendFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    ++client->failedDeliveries_;
    std::cerr << "[MQTT] Delivery failed, code " << (response ? response->code : -1) << std::endl;
}

void PahoMqttClient::restoreSubscriptions() {
    std::lock_guard<std::mutex> lock(subscriptionMutex_);
    for (const auto& [topic, qos] : subscriptions_) {
        sendSubscribe(topic, qos);
    }
}

bool PahoMqttClient::tlsFilesReadable(const TlsConfig& tls) const {
    for (const auto* path : {&tls.caPath, &tls.certPath, &tls.keyPath}) {
        if (path->empty()) {
            continue;
        }
        std::ifstream file(*path);
        if (!file.good()) {
            std::cerr << "[MQTT] TLS file not readable: " << *path << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace fleetsense
