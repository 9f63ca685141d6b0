/**
 * @file RabbitMQBridge.hpp
 * @brief Pont RabbitMQ: capteurs distants en entrée, flux BioMirror en sortie
 * @version 1.0
 * @date 2026-10-19
 *
 * Entrées (topic exchanges):
 *   - biomirror.facial / facial.sample
 *   - biomirror.physiological / physiological.sample
 * Sortie (biomirror.output), clés de routage:
 *   state, dissociation, safety, response
 */

#ifndef BIOMIRROR_RABBITMQ_BRIDGE_HPP
#define BIOMIRROR_RABBITMQ_BRIDGE_HPP

#include "Clock.hpp"
#include "Config.hpp"
#include "SafetyMonitor.hpp"
#include "SessionCoordinator.hpp"
#include "StateFusionEngine.hpp"
#include "Types.hpp"
#include <SimpleAmqpClient/SimpleAmqpClient.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace biomirror {

/**
 * @class RabbitMQSensorService
 * @brief Consomme un flux d'échantillons JSON et les soumet à la fusion
 *
 * Un channel par service: AmqpClient::Channel n'est pas thread-safe.
 */
class RabbitMQSensorService : public SensorService {
public:
    enum class Stream { FACIAL, PHYSIOLOGICAL };

    RabbitMQSensorService(Stream stream, const RabbitMQConfig& config,
                          StateFusionEngine& fusion, Clock& clock);
    ~RabbitMQSensorService() override;

    RabbitMQSensorService(const RabbitMQSensorService&) = delete;
    RabbitMQSensorService& operator=(const RabbitMQSensorService&) = delete;

    /**
     * @brief Ouvre le channel, lie la queue et lance la boucle de consommation
     * @return false si le broker est injoignable
     */
    bool start() override;
    void stop() override;
    [[nodiscard]] std::string name() const override;

    /**
     * @brief Traite un message brut (appelé par la boucle de consommation)
     * @return true si l'échantillon a été soumis
     */
    bool handleMessage(const std::string& body);

    [[nodiscard]] uint64_t getReceivedCount() const { return received_.load(); }
    [[nodiscard]] uint64_t getRejectedCount() const { return rejected_.load(); }

private:
    void consumeLoop();

    Stream stream_;
    RabbitMQConfig config_;
    StateFusionEngine& fusion_;
    Clock& clock_;

    AmqpClient::Channel::ptr_t channel_;
    std::string consumer_tag_;
    std::thread consumer_thread_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> rejected_{0};
};

/**
 * @class RabbitMQPublisher
 * @brief Publie les états, statuts, événements et réponses en JSON
 */
class RabbitMQPublisher {
public:
    static constexpr const char* STATE_KEY = "state";
    static constexpr const char* DISSOCIATION_KEY = "dissociation";
    static constexpr const char* SAFETY_KEY = "safety";
    static constexpr const char* RESPONSE_KEY = "response";

    explicit RabbitMQPublisher(const RabbitMQConfig& config);
    ~RabbitMQPublisher();

    RabbitMQPublisher(const RabbitMQPublisher&) = delete;
    RabbitMQPublisher& operator=(const RabbitMQPublisher&) = delete;

    /**
     * @brief Ouvre le channel de publication et déclare les exchanges
     */
    bool connect();

    /**
     * @brief Branche les flux de sortie sur les composants
     */
    void attach(StateFusionEngine& fusion, SessionCoordinator& coordinator, SafetyMonitor& safety);
    void detach();

    void publish(const std::string& routing_key, const nlohmann::json& payload);

    [[nodiscard]] uint64_t getPublishedCount() const { return published_.load(); }

private:
    RabbitMQConfig config_;
    AmqpClient::Channel::ptr_t channel_;
    std::mutex publish_mutex_;
    std::atomic<uint64_t> published_{0};

    StateFusionEngine* fusion_{nullptr};
    SessionCoordinator* coordinator_{nullptr};
    SafetyMonitor* safety_{nullptr};
    StateFusionEngine::SubscriptionId subscription_{0};
};

} // namespace biomirror

#endif // BIOMIRROR_RABBITMQ_BRIDGE_HPP
