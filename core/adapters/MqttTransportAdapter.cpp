#include "MqttTransportAdapter.hpp"
#include <iostream>

namespace fleetsense::adapters {

MqttTransportAdapter::MqttTransportAdapter(std::shared_ptr<IMqttClient> mqttClient)
    : mqttClient_(std::move(mqttClient)) {

    mqttClient_->setMessageCallback([this](const MqttMessage& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inbound_.size() >= kMaxBacklog) {
            inbound_.pop_front();
            ++overflowed_;
        }
        inbound_.push_back(ports::TransportMessage{msg.topic, msg.payload, msg.qos});
    });

    mqttClient_->setConnectionCallback([this](bool connected, const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        linkChanges_.push_back(LinkChange{connected, reason});
    });
}

MqttTransportAdapter::~MqttTransportAdapter() {
    // The client may outlive us; stop it from calling into a dead adapter
    mqttClient_->setMessageCallback(nullptr);
    mqttClient_->setConnectionCallback(nullptr);
}

MqttConnectOptions MqttTransportAdapter::toConnectOptions(const ports::BrokerCredentials& credentials) {
    MqttConnectOptions options;
    options.host = credentials.host;
    options.port = credentials.port;
    options.clientId = credentials.clientId;
    options.username = credentials.username;
    options.password = credentials.password;

    if (credentials.useTls) {
        TlsConfig tls;
        tls.caPath = credentials.caPath;
        tls.certPath = credentials.certPath;
        tls.keyPath = credentials.keyPath;
        options.tls = tls;
    }
    return options;
}

bool MqttTransportAdapter::connect(const ports::BrokerCredentials& credentials) {
    std::cout << "[MQTT] Connecting to " << credentials.host << ":" << credentials.port
              << (credentials.useTls ? " (TLS)" : "") << std::endl;
    return mqttClient_->connect(toConnectOptions(credentials));
}

void MqttTransportAdapter::disconnect() {
    mqttClient_->disconnect();
}

bool MqttTransportAdapter::isConnected() const {
    return mqttClient_->isConnected();
}

bool MqttTransportAdapter::publish(const ports::TransportMessage& message) {
    return mqttClient_->publish(message.topic, message.payload, message.qos, false);
}

bool MqttTransportAdapter::subscribe(const std::string& filter, int qos) {
    return mqttClient_->subscribe(filter, qos);
}

bool MqttTransportAdapter::unsubscribe(const std::string& filter) {
    return mqttClient_->unsubscribe(filter);
}

void MqttTransportAdapter::setMessageHandler(MessageHandler handler) {
    messageHandler_ = std::move(handler);
}

void MqttTransportAdapter::setLinkHandler(LinkHandler handler) {
    linkHandler_ = std::move(handler);
}

void MqttTransportAdapter::poll() {
    mqttClient_->processEvents();

    std::deque<LinkChange> changes;
    std::deque<ports::TransportMessage> messages;
    std::size_t overflowed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changes.swap(linkChanges_);
        messages.swap(inbound_);
        std::swap(overflowed, overflowed_);
    }

    if (overflowed > 0) {
        std::cerr << "[MQTT] Inbound backlog full, dropped " << overflowed << " oldest messages" << std::endl;
    }
    for (const auto& change : changes) {
        if (linkHandler_) linkHandler_(change.up, change.reason);
    }
    for (const auto& message : messages) {
        if (messageHandler_) messageHandler_(message);
    }
}

std::size_t MqttTransportAdapter::backlog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inbound_.size();
}

} // namespace fleetsense::adapters
