/**
 * @file StateFusionEngine.hpp
 * @brief Fusion périodique des échantillons faciaux et physiologiques
 * @version 1.0
 * @date 2026-10-19
 *
 * Deux producteurs asynchrones déposent leur dernier échantillon dans une
 * cellule à emplacement unique. À chaque tick (5 Hz par défaut), le moteur
 * combine la dernière paire connue en un IntegratedState et le publie de
 * façon synchrone à tous les abonnés.
 */

#ifndef BIOMIRROR_STATE_FUSION_ENGINE_HPP
#define BIOMIRROR_STATE_FUSION_ENGINE_HPP

#include "Config.hpp"
#include "TimerScheduler.hpp"
#include "Types.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace biomirror {

/**
 * @brief Statistiques du moteur de fusion
 */
struct FusionStats {
    uint64_t ticks{0};
    uint64_t states_emitted{0};
    uint64_t skipped_missing{0};
    uint64_t skipped_stale{0};
};

/**
 * @brief Bande d'arousal attendue pour une émotion faciale
 */
struct ArousalBand {
    double low;
    double high;

    [[nodiscard]] double center() const { return (low + high) / 2.0; }
    [[nodiscard]] double halfWidth() const { return (high - low) / 2.0; }
};

/**
 * @class StateFusionEngine
 * @brief Combine les deux flux en un état émotionnel intégré
 */
class StateFusionEngine {
public:
    using StateCallback = std::function<void(const IntegratedState&)>;
    using SubscriptionId = uint64_t;

    explicit StateFusionEngine(Clock& clock, const FusionConfig& config = FusionConfig{});
    ~StateFusionEngine();

    StateFusionEngine(const StateFusionEngine&) = delete;
    StateFusionEngine& operator=(const StateFusionEngine&) = delete;

    // ═══════════════════════════════════════════════════════════════
    // ENTRÉES
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Remplace le dernier échantillon facial connu
     */
    void submitFacialSample(const FacialSample& sample);

    /**
     * @brief Remplace le dernier échantillon physiologique connu
     */
    void submitPhysiologicalSample(const PhysiologicalSample& sample);

    /**
     * @brief Oublie les échantillons en attente (nouvelle séance)
     */
    void clearSamples();

    // ═══════════════════════════════════════════════════════════════
    // TICK DE FUSION
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Effectue un pas de fusion à l'instant courant
     * @return L'état publié, ou nullopt si une entrée manque (ou est périmée)
     */
    std::optional<IntegratedState> tick();

    /**
     * @brief Programme le tick périodique sur l'ordonnanceur
     */
    void start(Scheduler& scheduler);

    /**
     * @brief Annule le tick; aucun état n'est publié après le retour
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    // ═══════════════════════════════════════════════════════════════
    // ABONNEMENTS
    // ═══════════════════════════════════════════════════════════════

    SubscriptionId subscribe(StateCallback callback);
    void unsubscribe(SubscriptionId id);
    [[nodiscard]] size_t subscriberCount() const;

    // ═══════════════════════════════════════════════════════════════
    // CALCULS (purs)
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Fusionne une paire d'échantillons; tous les indices sont bornés
     */
    static IntegratedState fuse(const FacialSample& facial,
                                const PhysiologicalSample& physiological,
                                Timestamp timestamp);

    static std::optional<ArousalBand> expectedArousalBand(EmotionType emotion);
    static double computeCoherence(const FacialSample& facial, const PhysiologicalSample& physiological);
    static double computeMasking(const FacialSample& facial, const PhysiologicalSample& physiological,
                                 double coherence);
    static double computeDissociation(const FacialSample& facial, const PhysiologicalSample& physiological,
                                      double coherence);
    static EmotionType determineDominantEmotion(const FacialSample& facial,
                                                const PhysiologicalSample& physiological,
                                                double dissociation);
    static double computeIntensity(const FacialSample& facial, const PhysiologicalSample& physiological);
    static RegulationState determineRegulation(const PhysiologicalSample& physiological, double coherence);
    static DataQuality assessDataQuality(const FacialSample& facial, const PhysiologicalSample& physiological);

    /// SDNN normalisé: min(100, SDNN) / 100
    static double normalizedHrv(const PhysiologicalSample& physiological);

    [[nodiscard]] FusionStats getStats() const;
    [[nodiscard]] const FusionConfig& getConfig() const { return config_; }

    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }

private:
    void publish(const IntegratedState& state);

    Clock& clock_;
    FusionConfig config_;

    // Cellules "dernier échantillon" (écrivain: capteurs, lecteur: tick)
    mutable std::mutex samples_mutex_;
    std::optional<FacialSample> latest_facial_;
    std::optional<PhysiologicalSample> latest_physiological_;
    Timestamp facial_received_{};
    Timestamp physiological_received_{};
    bool stale_reported_{false};

    mutable std::mutex subscribers_mutex_;
    std::map<SubscriptionId, StateCallback> subscribers_;
    SubscriptionId next_subscription_{1};

    Scheduler* scheduler_{nullptr};
    TimerId tick_timer_{0};
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> states_emitted_{0};
    std::atomic<uint64_t> skipped_missing_{0};
    std::atomic<uint64_t> skipped_stale_{0};

    bool quiet_mode_{false};
};

} // namespace biomirror

#endif // BIOMIRROR_STATE_FUSION_ENGINE_HPP
