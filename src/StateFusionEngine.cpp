/**
 * @file StateFusionEngine.cpp
 * @brief Implémentation de la fusion multimodale
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/StateFusionEngine.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

namespace biomirror {

StateFusionEngine::StateFusionEngine(Clock& clock, const FusionConfig& config)
    : clock_(clock)
    , config_(config)
{
}

StateFusionEngine::~StateFusionEngine() {
    stop();
}

// ═══════════════════════════════════════════════════════════════════════════
// ENTRÉES
// ═══════════════════════════════════════════════════════════════════════════

void StateFusionEngine::submitFacialSample(const FacialSample& sample) {
    std::lock_guard<std::mutex> lock(samples_mutex_);
    latest_facial_ = sample;
    facial_received_ = clock_.now();
}

void StateFusionEngine::submitPhysiologicalSample(const PhysiologicalSample& sample) {
    std::lock_guard<std::mutex> lock(samples_mutex_);
    latest_physiological_ = sample;
    physiological_received_ = clock_.now();
}

void StateFusionEngine::clearSamples() {
    std::lock_guard<std::mutex> lock(samples_mutex_);
    latest_facial_.reset();
    latest_physiological_.reset();
    stale_reported_ = false;
}

// ═══════════════════════════════════════════════════════════════════════════
// TICK
// ═══════════════════════════════════════════════════════════════════════════

std::optional<IntegratedState> StateFusionEngine::tick() {
    const Timestamp now = clock_.now();
    ticks_++;

    FacialSample facial;
    PhysiologicalSample physiological;
    {
        std::lock_guard<std::mutex> lock(samples_mutex_);
        if (!latest_facial_ || !latest_physiological_) {
            skipped_missing_++;
            return std::nullopt;
        }

        if (config_.staleness_policy == StalenessPolicy::SKIP_STALE) {
            double facial_age = secondsBetween(facial_received_, now);
            double physio_age = secondsBetween(physiological_received_, now);
            if (facial_age > config_.max_sample_age_seconds ||
                physio_age > config_.max_sample_age_seconds) {
                skipped_stale_++;
                if (!stale_reported_ && !quiet_mode_) {
                    std::cout << "[StateFusionEngine] Échantillons périmés (visage "
                              << std::fixed << std::setprecision(1) << facial_age << "s, physio "
                              << physio_age << "s), fusion suspendue\n";
                }
                stale_reported_ = true;
                return std::nullopt;
            }
            stale_reported_ = false;
        }

        facial = *latest_facial_;
        physiological = *latest_physiological_;
    }

    IntegratedState state = fuse(facial, physiological, now);
    states_emitted_++;
    publish(state);
    return state;
}

void StateFusionEngine::start(Scheduler& scheduler) {
    if (running_.exchange(true)) return;
    scheduler_ = &scheduler;
    tick_timer_ = scheduler.schedulePeriodic(config_.tick_interval_seconds, [this] { tick(); });

    if (!quiet_mode_) {
        std::cout << "[StateFusionEngine] Fusion démarrée (tick "
                  << std::fixed << std::setprecision(2) << config_.tick_interval_seconds
                  << "s, politique " << stalenessPolicyToString(config_.staleness_policy) << ")\n";
    }
}

void StateFusionEngine::stop() {
    if (!running_.exchange(false)) return;
    if (scheduler_) {
        scheduler_->cancel(tick_timer_);
    }
    scheduler_ = nullptr;
    tick_timer_ = 0;

    if (!quiet_mode_) {
        std::cout << "[StateFusionEngine] Fusion arrêtée (" << states_emitted_.load()
                  << " états publiés)\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ABONNEMENTS
// ═══════════════════════════════════════════════════════════════════════════

StateFusionEngine::SubscriptionId StateFusionEngine::subscribe(StateCallback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    SubscriptionId id = next_subscription_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

void StateFusionEngine::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.erase(id);
}

size_t StateFusionEngine::subscriberCount() const {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return subscribers_.size();
}

void StateFusionEngine::publish(const IntegratedState& state) {
    std::vector<StateCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        callbacks.reserve(subscribers_.size());
        for (const auto& [id, callback] : subscribers_) {
            callbacks.push_back(callback);
        }
    }
    for (const auto& callback : callbacks) {
        callback(state);
    }
}

FusionStats StateFusionEngine::getStats() const {
    FusionStats stats;
    stats.ticks = ticks_.load();
    stats.states_emitted = states_emitted_.load();
    stats.skipped_missing = skipped_missing_.load();
    stats.skipped_stale = skipped_stale_.load();
    return stats;
}

// ═══════════════════════════════════════════════════════════════════════════
// CALCULS
// ═══════════════════════════════════════════════════════════════════════════

IntegratedState StateFusionEngine::fuse(const FacialSample& facial,
                                        const PhysiologicalSample& physiological,
                                        Timestamp timestamp)
{
    IntegratedState state;
    state.timestamp = timestamp;
    state.facial = facial;
    state.physiological = physiological;

    state.coherence_index = computeCoherence(facial, physiological);
    state.emotional_masking_index = computeMasking(facial, physiological, state.coherence_index);
    state.dissociation_index = computeDissociation(facial, physiological, state.coherence_index);
    state.dominant_emotion = determineDominantEmotion(facial, physiological, state.dissociation_index);
    state.emotional_intensity = computeIntensity(facial, physiological);
    state.regulation = determineRegulation(physiological, state.coherence_index);
    state.arousal_level = clamp01(physiological.arousal_level);
    state.data_quality = assessDataQuality(facial, physiological);

    return state;
}

std::optional<ArousalBand> StateFusionEngine::expectedArousalBand(EmotionType emotion) {
    switch (emotion) {
        case EmotionType::HAPPINESS: return ArousalBand{0.4, 0.8};
        case EmotionType::ANGER:     return ArousalBand{0.6, 1.0};
        case EmotionType::SURPRISE:  return ArousalBand{0.5, 0.9};
        case EmotionType::SADNESS:   return ArousalBand{0.3, 0.7};
        case EmotionType::DISGUST:   return ArousalBand{0.3, 0.7};
        case EmotionType::FEAR:      return ArousalBand{0.6, 1.0};
        case EmotionType::NEUTRAL:   return ArousalBand{0.0, 0.4};
        default:                     return std::nullopt;
    }
}

double StateFusionEngine::normalizedHrv(const PhysiologicalSample& physiological) {
    return clamp01(std::min(100.0, physiological.heart.heart_rate_variability) / 100.0);
}

double StateFusionEngine::computeCoherence(const FacialSample& facial,
                                           const PhysiologicalSample& physiological)
{
    const double arousal = clamp01(physiological.arousal_level);
    const EmotionType emotion = facial.primary_emotion;
    double coherence = 0.5;

    auto band = expectedArousalBand(emotion);
    if (emotion == EmotionType::FEAR && physiological.motion.freeze_index > 0.6) {
        // Peur figée: arousal bas attendu, cohérent
        coherence = 1.0;
    } else if (band) {
        double distance = std::abs(arousal - band->center());
        double half = band->halfWidth();
        if (distance <= half) {
            // Dans la bande: 1 au centre, 0.5 au bord
            coherence = 1.0 - 0.5 * (distance / half);
        } else {
            double outside = distance - half;
            coherence = 0.5 * (1.0 - std::min(1.0, outside / 0.5));
        }
    }

    // Corroboration physiologique spécifique à l'émotion
    const auto& heart = physiological.heart;
    switch (emotion) {
        case EmotionType::ANGER:
            if (heart.heart_rate > 100.0 && heart.heart_rate_variability < 30.0) coherence += 0.2;
            break;
        case EmotionType::FEAR:
            if (heart.heart_rate > 100.0 || physiological.motion.freeze_index > 0.7) coherence += 0.1;
            break;
        case EmotionType::SADNESS:
            if (heart.heart_rate < 75.0 && arousal < 0.5) coherence += 0.1;
            break;
        case EmotionType::HAPPINESS:
            if (heart.heart_rate_variability > 50.0) coherence += 0.1;
            break;
        default:
            break;
    }

    coherence = std::min(1.0, coherence);
    coherence *= clamp01(facial.confidence);
    coherence *= clamp01(physiological.quality_index);
    return clamp01(coherence);
}

double StateFusionEngine::computeMasking(const FacialSample& facial,
                                         const PhysiologicalSample& physiological,
                                         double coherence)
{
    const double arousal = clamp01(physiological.arousal_level);
    double masking = 0.0;

    if (facial.primary_emotion == EmotionType::NEUTRAL && arousal > 0.6) {
        masking = std::min(1.0, arousal * 1.5);
    } else if (facial.primary_emotion == EmotionType::HAPPINESS &&
               normalizedHrv(physiological) < 0.3 && arousal > 0.7) {
        masking = 0.8;
    }

    return clamp01(std::max(masking, 1.0 - coherence));
}

double StateFusionEngine::computeDissociation(const FacialSample& facial,
                                              const PhysiologicalSample& physiological,
                                              double coherence)
{
    double score = 0.0;

    // Affect plat
    if (facial.primary_emotion == EmotionType::NEUTRAL && facial.primary_intensity < 0.3) {
        score += 0.4;
    }

    // Réponse de figement
    if (physiological.motion.freeze_index > 0.7) {
        score += 0.4;
    }

    // HRV basse avec fréquence cardiaque basse
    if (physiological.heart.heart_rate_variability < 20.0 && physiological.heart.heart_rate < 70.0) {
        score += 0.3;
    }

    // Aucune micro-expression malgré une détection fiable
    if (facial.micro_expressions.empty() && facial.confidence > 0.8) {
        score += 0.2;
    }

    if (coherence < 0.3) {
        score += 0.3 * (1.0 - coherence);
    }

    return clamp01(std::min(1.0, score));
}

EmotionType StateFusionEngine::determineDominantEmotion(const FacialSample& facial,
                                                        const PhysiologicalSample& physiological,
                                                        double dissociation)
{
    if (facial.confidence > 0.7 && facial.primary_intensity > 0.5) {
        return facial.primary_emotion;
    }

    if (facial.confidence < 0.4 && physiological.quality_index > 0.7) {
        const double arousal = physiological.arousal_level;
        if (arousal > 0.8) {
            return physiological.motion.freeze_index > 0.7 ? EmotionType::FEAR : EmotionType::ANGER;
        }
        if (arousal < 0.3) {
            return EmotionType::SADNESS;
        }
    }

    if (dissociation > 0.7) {
        return EmotionType::DISSOCIATION;
    }

    return facial.primary_emotion;
}

double StateFusionEngine::computeIntensity(const FacialSample& facial,
                                           const PhysiologicalSample& physiological)
{
    const double facial_intensity = clamp01(facial.primary_intensity);
    const double arousal = clamp01(physiological.arousal_level);
    const double facial_weight = clamp01(facial.confidence);
    const double physio_weight = clamp01(physiological.quality_index);
    const double total = facial_weight + physio_weight;

    if (total <= 0.0) {
        return clamp01((facial_intensity + arousal) / 2.0);
    }
    return clamp01((facial_intensity * facial_weight + arousal * physio_weight) / total);
}

RegulationState StateFusionEngine::determineRegulation(const PhysiologicalSample& physiological,
                                                       double coherence)
{
    const double hrv = normalizedHrv(physiological);
    const double arousal = physiological.arousal_level;

    if (hrv > 0.6 && coherence > 0.6) return RegulationState::REGULATED;
    if (arousal > 0.8 && hrv < 0.3) return RegulationState::SEVERE_DYSREGULATION;
    if (arousal > 0.6 && hrv < 0.4) return RegulationState::MODERATE_DYSREGULATION;
    if (arousal > 0.5 && hrv < 0.5) return RegulationState::MILD_DYSREGULATION;
    return RegulationState::REGULATED;
}

DataQuality StateFusionEngine::assessDataQuality(const FacialSample& facial,
                                                 const PhysiologicalSample& physiological)
{
    const DetectionQuality face = facial.face_detection_quality;
    const double bio = physiological.quality_index;

    if (face == DetectionQuality::NO_FACE || bio < 0.2) {
        return DataQuality::INVALID;
    }
    if ((face == DetectionQuality::EXCELLENT && bio > 0.8) ||
        (face == DetectionQuality::GOOD && bio > 0.9)) {
        return DataQuality::EXCELLENT;
    }
    if ((face == DetectionQuality::EXCELLENT && bio > 0.6) ||
        (face == DetectionQuality::GOOD && bio > 0.7) ||
        (face == DetectionQuality::FAIR && bio > 0.8)) {
        return DataQuality::GOOD;
    }
    if ((face == DetectionQuality::POOR && bio < 0.5) ||
        (face == DetectionQuality::FAIR && bio < 0.4)) {
        return DataQuality::POOR;
    }
    return DataQuality::FAIR;
}

} // namespace biomirror
