/**
 * @file RabbitMQBridge.cpp
 * @brief Implémentation du pont RabbitMQ
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/RabbitMQBridge.hpp"
#include "biomirror/Serialization.hpp"
#include <chrono>
#include <iostream>

namespace biomirror {

using json = nlohmann::json;

namespace {

AmqpClient::Channel::ptr_t openChannel(const RabbitMQConfig& config) {
    AmqpClient::Channel::OpenOpts opts;
    opts.host = config.host;
    opts.port = config.port;
    opts.auth = AmqpClient::Channel::OpenOpts::BasicAuth{
        config.user,
        config.password
    };
    return AmqpClient::Channel::Open(opts);
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// CAPTEURS DISTANTS
// ═══════════════════════════════════════════════════════════════════════════

RabbitMQSensorService::RabbitMQSensorService(Stream stream, const RabbitMQConfig& config,
                                             StateFusionEngine& fusion, Clock& clock)
    : stream_(stream)
    , config_(config)
    , fusion_(fusion)
    , clock_(clock)
{
}

RabbitMQSensorService::~RabbitMQSensorService() {
    stop();
}

std::string RabbitMQSensorService::name() const {
    return stream_ == Stream::FACIAL ? "facial" : "physiological";
}

bool RabbitMQSensorService::start() {
    if (running_.load()) {
        return true;
    }

    const std::string& exchange = stream_ == Stream::FACIAL
        ? config_.facial_exchange : config_.physiological_exchange;
    const std::string& routing_key = stream_ == Stream::FACIAL
        ? config_.facial_routing_key : config_.physiological_routing_key;

    try {
        channel_ = openChannel(config_);

        channel_->DeclareExchange(
            exchange,
            AmqpClient::Channel::EXCHANGE_TYPE_TOPIC,
            false, true, false
        );

        std::string queue = channel_->DeclareQueue(
            "biomirror_" + name() + "_queue", false, true, false, false
        );
        channel_->BindQueue(queue, exchange, routing_key);
        consumer_tag_ = channel_->BasicConsume(queue, "", true, false, false, 1);

    } catch (const std::exception& e) {
        std::cerr << "[RabbitMQ] Erreur connexion " << name() << ": " << e.what() << "\n";
        channel_.reset();
        return false;
    }

    running_.store(true);
    consumer_thread_ = std::thread(&RabbitMQSensorService::consumeLoop, this);

    std::cout << "[RabbitMQ] Capteur " << name() << ": " << exchange << " / " << routing_key << "\n";
    return true;
}

void RabbitMQSensorService::stop() {
    if (!running_.load()) {
        return;
    }
    running_.store(false);

    if (consumer_thread_.joinable()) {
        consumer_thread_.join();
    }

    try {
        channel_->BasicCancel(consumer_tag_);
    } catch (const std::exception& e) {
        std::cerr << "[RabbitMQ] Erreur annulation " << name() << ": " << e.what() << "\n";
    }
    channel_.reset();

    std::cout << "[RabbitMQ] Capteur " << name() << " arrêté (" << received_.load()
              << " reçus, " << rejected_.load() << " rejetés)\n";
}

void RabbitMQSensorService::consumeLoop() {
    while (running_.load()) {
        try {
            AmqpClient::Envelope::ptr_t envelope;
            bool received = channel_->BasicConsumeMessage(consumer_tag_, envelope, 500);

            if (received && envelope) {
                std::string body(envelope->Message()->Body().begin(),
                                 envelope->Message()->Body().end());

                handleMessage(body);
                channel_->BasicAck(envelope);
            }

        } catch (const std::exception& e) {
            std::cerr << "[RabbitMQ] Erreur consommation " << name() << ": " << e.what() << "\n";
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
}

bool RabbitMQSensorService::handleMessage(const std::string& body) {
    received_++;

    json input;
    try {
        input = json::parse(body);
    } catch (const std::exception& e) {
        std::cerr << "[RabbitMQ] JSON invalide (" << name() << "): " << e.what() << "\n";
        rejected_++;
        return false;
    }

    const Timestamp now = clock_.now();
    if (stream_ == Stream::FACIAL) {
        auto sample = facialSampleFromJson(input, now);
        if (!sample) {
            rejected_++;
            return false;
        }
        fusion_.submitFacialSample(*sample);
    } else {
        auto sample = physiologicalSampleFromJson(input, now);
        if (!sample) {
            rejected_++;
            return false;
        }
        fusion_.submitPhysiologicalSample(*sample);
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// PUBLICATION
// ═══════════════════════════════════════════════════════════════════════════

RabbitMQPublisher::RabbitMQPublisher(const RabbitMQConfig& config)
    : config_(config)
{
}

RabbitMQPublisher::~RabbitMQPublisher() {
    detach();
}

bool RabbitMQPublisher::connect() {
    try {
        auto channel = openChannel(config_);
        channel->DeclareExchange(
            config_.output_exchange,
            AmqpClient::Channel::EXCHANGE_TYPE_TOPIC,
            false, true, false
        );

        std::lock_guard<std::mutex> lock(publish_mutex_);
        channel_ = channel;

    } catch (const std::exception& e) {
        std::cerr << "[RabbitMQ] Erreur connexion publication: " << e.what() << "\n";
        return false;
    }

    std::cout << "[RabbitMQ] Publication vers " << config_.output_exchange << "\n";
    return true;
}

void RabbitMQPublisher::attach(StateFusionEngine& fusion, SessionCoordinator& coordinator,
                               SafetyMonitor& safety) {
    detach();

    fusion_ = &fusion;
    coordinator_ = &coordinator;
    safety_ = &safety;

    subscription_ = fusion.subscribe([this](const IntegratedState& state) {
        publish(STATE_KEY, toJson(state));
    });
    coordinator.setDissociationCallback([this](const DissociationStatus& status) {
        publish(DISSOCIATION_KEY, toJson(status));
    });
    coordinator.setResponseCallback([this](const TherapeuticResponse& response) {
        publish(RESPONSE_KEY, toJson(response));
    });
    safety.setEventCallback([this](const SafetyEvent& event) {
        publish(SAFETY_KEY, toJson(event));
    });
}

void RabbitMQPublisher::detach() {
    if (fusion_ && subscription_ != 0) {
        fusion_->unsubscribe(subscription_);
    }
    if (coordinator_) {
        coordinator_->setDissociationCallback(nullptr);
        coordinator_->setResponseCallback(nullptr);
    }
    if (safety_) {
        safety_->setEventCallback(nullptr);
    }
    fusion_ = nullptr;
    coordinator_ = nullptr;
    safety_ = nullptr;
    subscription_ = 0;
}

void RabbitMQPublisher::publish(const std::string& routing_key, const json& payload) {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    if (!channel_) return;

    try {
        std::string body = payload.dump();
        channel_->BasicPublish(
            config_.output_exchange,
            routing_key,
            AmqpClient::BasicMessage::Create(body),
            false, false
        );
        published_++;

    } catch (const std::exception& e) {
        std::cerr << "[RabbitMQ] Erreur publication (" << routing_key << "): " << e.what() << "\n";
    }
}

} // namespace biomirror
