/**
 * @file StateHistory.hpp
 * @brief Historique borné des états intégrés
 *
 * Buffer glissant des derniers états fusionnés (1000 par défaut). Sert aux
 * requêtes sur fenêtre temporelle: émotion dominante, cohérence moyenne,
 * volatilité émotionnelle.
 *
 * @version 1.0
 * @date 2026-10-19
 */

#pragma once

#include "Types.hpp"
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace biomirror {

/**
 * @brief Émotion dominante sur une fenêtre et sa prévalence [0, 1]
 */
struct DominantEmotion {
    EmotionType emotion{EmotionType::NEUTRAL};
    double prevalence{0.0};
};

/**
 * @class StateHistory
 * @brief Buffer circulaire thread-safe d'IntegratedState
 */
class StateHistory {
public:
    explicit StateHistory(size_t capacity = DEFAULT_HISTORY_CAPACITY);

    // ═══════════════════════════════════════════════════════════════
    // GESTION DU BUFFER
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Ajoute un état; le plus ancien est évincé si le buffer est plein
     */
    void push(const IntegratedState& state);

    void clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] bool empty() const { return size() == 0; }

    [[nodiscard]] std::optional<IntegratedState> latest() const;

    /**
     * @brief Les `limit` états les plus récents, du plus récent au plus ancien
     */
    [[nodiscard]] std::vector<IntegratedState> getRecentStates(size_t limit) const;

    /**
     * @brief États dont l'horodatage est >= since, ordre chronologique
     */
    [[nodiscard]] std::vector<IntegratedState> getStates(Timestamp since) const;

    // ═══════════════════════════════════════════════════════════════
    // REQUÊTES SUR FENÊTRE (fenêtre relative au dernier état)
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Émotion dominante la plus fréquente sur la fenêtre
     * @param window_seconds Durée de la fenêtre
     * @return nullopt si aucun état dans la fenêtre
     */
    [[nodiscard]] std::optional<DominantEmotion> getDominantEmotion(double window_seconds) const;

    /**
     * @brief Cohérence moyenne sur la fenêtre (0 si vide)
     */
    [[nodiscard]] double getAverageCoherence(double window_seconds) const;

    /**
     * @brief Changements d'émotion dominante / (n - 1); 0 si moins de 3 états
     */
    [[nodiscard]] double getEmotionalVolatility(double window_seconds) const;

private:
    std::vector<IntegratedState> window(double window_seconds) const;

    size_t capacity_;
    std::deque<IntegratedState> buffer_;
    mutable std::mutex mutex_;
};

} // namespace biomirror
