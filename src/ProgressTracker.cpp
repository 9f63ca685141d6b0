/**
 * @file ProgressTracker.cpp
 * @brief Implémentation du suivi de progression entre séances
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/ProgressTracker.hpp"
#include "biomirror/Serialization.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace biomirror {

using json = nlohmann::json;

namespace {

double runningAverage(double current, double value, size_t count) {
    return (current * static_cast<double>(count - 1) + value) / static_cast<double>(count);
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// INTÉGRATION DES SÉANCES
// ═══════════════════════════════════════════════════════════════════════════

std::optional<ProgressUpdate> ProgressTracker::registerSession(const TherapeuticSession& session) {
    if (!session.isFinalized()) {
        std::cerr << "[ProgressTracker] Séance " << session.id() << " non clôturée, ignorée\n";
        return std::nullopt;
    }

    ProgressUpdate update;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& known : sessions_) {
            if (known.id() == session.id()) return std::nullopt;
        }

        const ProgressMetrics before = metrics_;
        const SessionMetrics& m = session.metrics();

        double masking = 0.0;
        double dissociation = 0.0;
        for (const auto& state : session.states()) {
            masking += state.emotional_masking_index;
            dissociation += state.dissociation_index;
        }
        const double state_count = static_cast<double>(std::max<size_t>(1, session.states().size()));
        masking /= state_count;
        dissociation /= state_count;

        metrics_.total_sessions++;
        const size_t n = metrics_.total_sessions;
        metrics_.total_therapy_time += m.session_duration;
        metrics_.average_coherence = runningAverage(metrics_.average_coherence, m.average_coherence_index, n);
        metrics_.average_masking = runningAverage(metrics_.average_masking, masking, n);
        metrics_.average_dissociation = runningAverage(metrics_.average_dissociation, dissociation, n);
        metrics_.total_dissociation_episodes += session.episodes().size();
        metrics_.average_regulation_capacity =
            runningAverage(metrics_.average_regulation_capacity, m.regulation_capacity, n);
        metrics_.emotional_range = std::max(metrics_.emotional_range, m.emotional_range_index);

        // Jalons
        auto reach = [this, &update](TherapeuticMilestone milestone) {
            if (metrics_.milestones.insert(milestone).second) {
                update.new_milestones.push_back(milestone);
            }
        };
        if (session.episodes().empty() && metrics_.total_dissociation_episodes > 0) {
            reach(TherapeuticMilestone::NO_DISSOCIATION);
        }
        if (m.average_coherence_index > 0.7) reach(TherapeuticMilestone::HIGH_COHERENCE);
        if (m.regulation_capacity > 0.7) reach(TherapeuticMilestone::HIGH_REGULATION);

        // Une séance plus ancienne ne change pas la dernière phase
        const bool latest = std::all_of(sessions_.begin(), sessions_.end(),
                                        [&session](const TherapeuticSession& known) {
                                            return known.startTime() <= session.startTime();
                                        });
        if (latest) metrics_.last_phase = session.phase();
        sessions_.push_back(session);

        update.session_id = session.id();
        update.phase = session.phase();
        update.phase_changed = before.last_phase.has_value() && *before.last_phase != session.phase();
        update.coherence_score = m.average_coherence_index;
        update.regulation_capacity = m.regulation_capacity;
        update.emotional_range = m.emotional_range_index;
        if (before.total_sessions > 0) {
            update.coherence_change = m.average_coherence_index - before.average_coherence;
            update.regulation_change = m.regulation_capacity - before.average_regulation_capacity;
        }

        if (update.coherence_change > 0.1) {
            update.improvements.push_back("Conscience émotionnelle");
        }
        if (update.regulation_change > 0.1) {
            update.improvements.push_back("Régulation émotionnelle");
        }
        if (session.episodes().empty() && before.average_dissociation > 0.4) {
            update.improvements.push_back("Dissociation réduite");
        }

        update.recommended_phase = recommendedPhaseLocked();
    }

    if (!quiet_mode_) {
        std::cout << "[ProgressTracker] Séance " << update.session_id << " intégrée (cohérence "
                  << std::fixed << std::setprecision(2) << update.coherence_score
                  << ", régulation " << update.regulation_capacity << ")\n";
        for (auto milestone : update.new_milestones) {
            std::cout << "[ProgressTracker] ★ Jalon atteint: " << milestoneToString(milestone) << "\n";
        }
        std::cout << "[ProgressTracker] Phase conseillée: "
                  << sessionPhaseToString(update.recommended_phase) << "\n";
    }

    if (on_update_) {
        on_update_(update);
    }
    return update;
}

// ═══════════════════════════════════════════════════════════════════════════
// RECOMMANDATIONS
// ═══════════════════════════════════════════════════════════════════════════

SessionPhase ProgressTracker::getRecommendedPhase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recommendedPhaseLocked();
}

SessionPhase ProgressTracker::recommendedPhaseLocked() const {
    const ProgressMetrics& m = metrics_;

    if (m.total_sessions < 3) return SessionPhase::CONNECTION;
    if (m.average_coherence < 0.4) return SessionPhase::AWARENESS;
    if (m.average_masking > 0.6 || m.average_dissociation > 0.5) return SessionPhase::INTEGRATION;
    if (m.average_regulation_capacity < 0.5) return SessionPhase::REGULATION;
    if (m.average_coherence > 0.6 && m.average_regulation_capacity > 0.6 && m.total_sessions > 10) {
        return SessionPhase::TRANSFER;
    }
    return m.last_phase.value_or(SessionPhase::CONNECTION);
}

std::vector<std::string> ProgressTracker::getRecommendations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recommendationsLocked();
}

std::vector<std::string> ProgressTracker::recommendationsLocked() const {
    const ProgressMetrics& m = metrics_;
    std::vector<std::string> recommendations;

    if (m.average_coherence < 0.4) {
        recommendations.push_back("Poursuivre le travail de reconnaissance des émotions");
    }
    if (m.average_masking > 0.6) {
        recommendations.push_back("Relier l'expression du visage aux sensations du corps");
    }
    if (m.average_dissociation > 0.5) {
        recommendations.push_back("Privilégier les exercices d'ancrage dans le présent");
    }
    if (m.emotional_range < 0.3) {
        recommendations.push_back("Explorer un éventail d'émotions plus large en sécurité");
    }
    if (m.average_regulation_capacity < 0.4) {
        recommendations.push_back("Pratiquer la régulation avec une intensité progressive");
    }
    return recommendations;
}

ProgressMetrics ProgressTracker::getMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

size_t ProgressTracker::sessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_.total_sessions;
}

void ProgressTracker::restore(const ProgressMetrics& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_ = metrics;
    sessions_.clear();
}

// ═══════════════════════════════════════════════════════════════════════════
// RAPPORT
// ═══════════════════════════════════════════════════════════════════════════

json ProgressTracker::generateReport() const {
    std::lock_guard<std::mutex> lock(mutex_);

    json sessions = json::array();
    for (const auto& session : sessions_) {
        sessions.push_back(toJson(session));
    }

    return {
        {"session_count", metrics_.total_sessions},
        {"metrics", toJson(metrics_)},
        {"recommendations", recommendationsLocked()},
        {"recommended_phase", sessionPhaseToString(recommendedPhaseLocked())},
        {"sessions", sessions}
    };
}

json toJson(const ProgressMetrics& metrics) {
    json milestones = json::array();
    for (auto milestone : metrics.milestones) {
        milestones.push_back(milestoneToString(milestone));
    }

    json output = {
        {"total_sessions", metrics.total_sessions},
        {"total_therapy_time", metrics.total_therapy_time},
        {"average_coherence", metrics.average_coherence},
        {"average_masking", metrics.average_masking},
        {"average_dissociation", metrics.average_dissociation},
        {"total_dissociation_episodes", metrics.total_dissociation_episodes},
        {"average_regulation_capacity", metrics.average_regulation_capacity},
        {"emotional_range", metrics.emotional_range},
        {"milestones", milestones}
    };
    if (metrics.last_phase) {
        output["last_phase"] = sessionPhaseToString(*metrics.last_phase);
    }
    return output;
}

json toJson(const ProgressUpdate& update) {
    json milestones = json::array();
    for (auto milestone : update.new_milestones) {
        milestones.push_back(milestoneToString(milestone));
    }

    return {
        {"session_id", update.session_id},
        {"phase", sessionPhaseToString(update.phase)},
        {"phase_changed", update.phase_changed},
        {"coherence_score", update.coherence_score},
        {"coherence_change", update.coherence_change},
        {"regulation_capacity", update.regulation_capacity},
        {"regulation_change", update.regulation_change},
        {"emotional_range", update.emotional_range},
        {"improvements", update.improvements},
        {"new_milestones", milestones},
        {"recommended_phase", sessionPhaseToString(update.recommended_phase)}
    };
}

std::optional<ProgressMetrics> progressMetricsFromJson(const json& report) {
    try {
        if (!report.contains("metrics") || !report["metrics"].is_object()) {
            std::cerr << "[ProgressTracker] Rapport sans métriques\n";
            return std::nullopt;
        }

        const auto& m = report["metrics"];
        ProgressMetrics metrics;
        metrics.total_sessions = m.value("total_sessions", metrics.total_sessions);
        metrics.total_therapy_time = m.value("total_therapy_time", metrics.total_therapy_time);
        metrics.average_coherence = clamp01(m.value("average_coherence", metrics.average_coherence));
        metrics.average_masking = clamp01(m.value("average_masking", metrics.average_masking));
        metrics.average_dissociation = clamp01(m.value("average_dissociation", metrics.average_dissociation));
        metrics.total_dissociation_episodes =
            m.value("total_dissociation_episodes", metrics.total_dissociation_episodes);
        metrics.average_regulation_capacity =
            clamp01(m.value("average_regulation_capacity", metrics.average_regulation_capacity));
        metrics.emotional_range = clamp01(m.value("emotional_range", metrics.emotional_range));

        if (m.contains("milestones")) {
            for (const auto& name : m["milestones"]) {
                auto milestone = stringToMilestone(name.get<std::string>());
                if (milestone) {
                    metrics.milestones.insert(*milestone);
                } else {
                    std::cerr << "[ProgressTracker] Jalon inconnu ignoré: " << name << "\n";
                }
            }
        }
        if (m.contains("last_phase")) {
            metrics.last_phase = stringToSessionPhase(m["last_phase"].get<std::string>());
        }
        return metrics;

    } catch (const std::exception& e) {
        std::cerr << "[ProgressTracker] Erreur lecture rapport: " << e.what() << "\n";
        return std::nullopt;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// PERSISTANCE
// ═══════════════════════════════════════════════════════════════════════════

bool loadProgress(const std::string& path, ProgressTracker& tracker) {
    try {
        std::ifstream file(path);
        if (!file) {
            std::cerr << "[ProgressTracker] Fichier de progression introuvable: " << path << "\n";
            return false;
        }

        json report;
        file >> report;
        auto metrics = progressMetricsFromJson(report);
        if (!metrics) return false;

        tracker.restore(*metrics);
        std::cout << "[ProgressTracker] " << metrics->total_sessions
                  << " séance(s) antérieure(s) chargée(s) depuis " << path << "\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[ProgressTracker] Erreur chargement progression: " << e.what() << "\n";
        return false;
    }
}

bool saveProgress(const std::string& path, const ProgressTracker& tracker) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        std::cerr << "[ProgressTracker] Impossible d'écrire " << path << "\n";
        return false;
    }
    file << tracker.generateReport().dump(2) << '\n';
    if (!file) {
        std::cerr << "[ProgressTracker] Erreur d'écriture dans " << path << "\n";
        return false;
    }
    std::cout << "[ProgressTracker] Progression enregistrée dans " << path << "\n";
    return true;
}

} // namespace biomirror
