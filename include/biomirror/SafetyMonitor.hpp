/**
 * @file SafetyMonitor.hpp
 * @brief Surveillance de sécurité: escalade monotone des niveaux d'alerte
 * @version 1.0
 * @date 2026-10-19
 *
 * Niveaux none < low < medium < high. Un niveau candidat ne prend effet que
 * s'il est strictement supérieur au niveau courant; le retour à none n'a
 * lieu que lorsqu'aucun déclencheur ne s'active. Aucune décision n'est prise
 * sur des données de qualité invalide ou médiocre.
 */

#ifndef BIOMIRROR_SAFETY_MONITOR_HPP
#define BIOMIRROR_SAFETY_MONITOR_HPP

#include "Config.hpp"
#include "Types.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace biomirror {

/**
 * @brief Collaborateur externe recevant les protocoles de sécurité
 *
 * Notifications au thérapeute, au parent/tuteur, et signaux vers la couche
 * de présentation (apaisement, arrêt de séance).
 */
class SafetyAlertSink {
public:
    virtual ~SafetyAlertSink() = default;

    virtual void flagForReview(const SafetyEvent& event) = 0;
    virtual void triggerCalmingIntervention(const SafetyEvent& event) = 0;
    virtual void triggerSessionTermination(const SafetyEvent& event) = 0;
    virtual void notifyGuardian(const std::string& message, ContactMethod method) = 0;
    virtual void notifyTherapist(const std::string& message) = 0;
};

/**
 * @brief Implémentation qui journalise les protocoles sur la console
 */
class LoggingAlertSink : public SafetyAlertSink {
public:
    void flagForReview(const SafetyEvent& event) override;
    void triggerCalmingIntervention(const SafetyEvent& event) override;
    void triggerSessionTermination(const SafetyEvent& event) override;
    void notifyGuardian(const std::string& message, ContactMethod method) override;
    void notifyTherapist(const std::string& message) override;
};

/**
 * @class SafetyMonitor
 * @brief Machine à états d'alerte et vérifications temporelles
 */
class SafetyMonitor {
public:
    using EventCallback = std::function<void(const SafetyEvent&)>;
    using LevelCallback = std::function<void(AlertLevel previous, AlertLevel current)>;

    explicit SafetyMonitor(const SafetyThresholds& thresholds = SafetyThresholds{},
                           SafetyAlertSink* sink = nullptr);

    SafetyMonitor(const SafetyMonitor&) = delete;
    SafetyMonitor& operator=(const SafetyMonitor&) = delete;

    /**
     * @brief Évaluation par tick; seul point de mutation du niveau d'alerte
     * @return Niveau courant après évaluation
     */
    AlertLevel evaluate(const IntegratedState& state);

    /**
     * @brief Intervention obligatoire requise ?
     *
     * Détresse (arousal > 0.9) soutenue au-delà de 120s, avec une seule
     * alerte parentale par séance, ou dissociation sévère (> 0.8).
     */
    bool needsIntervention(const IntegratedState& state);

    /**
     * @brief La séance doit-elle être arrêtée ?
     *
     * Détresse soutenue au-delà de 240s, ou dissociation sévère sur données
     * fiables. L'alerte thérapeute n'est émise qu'à la première réponse vraie.
     */
    bool shouldTerminateSession(const IntegratedState& state);

    /**
     * @brief Efface minuteries, indicateurs et historique (nouvelle séance)
     */
    void reset();

    void setSessionStart(Timestamp start);
    void setAlertSink(SafetyAlertSink* sink);

    [[nodiscard]] AlertLevel currentLevel() const;
    [[nodiscard]] std::vector<SafetyEvent> getEvents() const;
    [[nodiscard]] bool hasPendingIntervention() const;

    /**
     * @brief Récupère (et efface) l'intervention en attente laissée par une escalade
     */
    std::optional<SafetyEvent> consumePendingIntervention();

    [[nodiscard]] uint64_t getTherapistAlertCount() const;
    [[nodiscard]] uint64_t getGuardianAlertCount() const;
    [[nodiscard]] const SafetyThresholds& getThresholds() const { return thresholds_; }

    void setEventCallback(EventCallback callback) { on_event_ = std::move(callback); }
    void setLevelCallback(LevelCallback callback) { on_level_ = std::move(callback); }
    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }

private:
    struct Trigger {
        SafetyEventType type;
        AlertLevel level;
        std::string description;
    };

    std::vector<Trigger> collectTriggers(const IntegratedState& state);
    double updateDistressTimer(const IntegratedState& state);
    void runProtocol(const SafetyEvent& event, bool notify_guardian);

    SafetyThresholds thresholds_;
    SafetyAlertSink* sink_;

    mutable std::mutex mutex_;
    AlertLevel level_{AlertLevel::NONE};
    std::vector<SafetyEvent> events_;
    std::optional<SafetyEvent> pending_intervention_;
    uint64_t next_event_id_{1};

    std::optional<Timestamp> session_start_;
    std::optional<Timestamp> negative_since_;
    std::optional<Timestamp> distress_since_;
    bool guardian_alerted_{false};
    bool therapist_alerted_{false};
    uint64_t therapist_alert_count_{0};
    uint64_t guardian_alert_count_{0};

    EventCallback on_event_;
    LevelCallback on_level_;
    bool quiet_mode_{false};
};

} // namespace biomirror

#endif // BIOMIRROR_SAFETY_MONITOR_HPP
