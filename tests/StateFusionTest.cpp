/**
 * @file StateFusionTest.cpp
 * @brief Tests du moteur de fusion et de l'historique des états
 */

#include "TestHarness.hpp"
#include "biomirror/Clock.hpp"
#include "biomirror/StateFusionEngine.hpp"
#include "biomirror/StateHistory.hpp"
#include "biomirror/TimerScheduler.hpp"

#include <limits>
#include <vector>

using namespace biomirror;
using namespace biomirror::test;

namespace {

bool inUnitRange(double value) {
    return value >= 0.0 && value <= 1.0;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// CALCULS DE FUSION
// ═══════════════════════════════════════════════════════════════════════════

void test_coherent_happiness() {
    auto facial = makeFacial(EmotionType::HAPPINESS, 0.8, 1.0);
    auto physio = makePhysio(0.6, 0.9, 70.0, 50.0);

    auto state = StateFusionEngine::fuse(facial, physio, at(0));

    // Centre de bande, pas de bonus HRV (SDNN non > 50), pondéré par la qualité
    ASSERT_NEAR(state.coherence_index, 0.9, 1e-9);
    ASSERT_NEAR(state.emotional_masking_index, 0.1, 1e-9);
    ASSERT_EQ(state.dominant_emotion, EmotionType::HAPPINESS);
    ASSERT_EQ(state.regulation, RegulationState::REGULATED);
    ASSERT_EQ(state.data_quality, DataQuality::GOOD);
    ASSERT_FALSE(state.isFacialEmotionMasked());
    ASSERT_FALSE(state.isDissociated());
    ASSERT_NEAR(state.emotional_intensity, (0.8 * 1.0 + 0.6 * 0.9) / 1.9, 1e-9);
}

void test_hrv_bonus_for_happiness() {
    auto facial = makeFacial(EmotionType::HAPPINESS, 0.8, 1.0);
    auto physio = makePhysio(0.5, 1.0, 70.0, 60.0);

    // Dans la bande (distance 0.1 sur demi-largeur 0.2) puis bonus +0.1
    ASSERT_NEAR(StateFusionEngine::computeCoherence(facial, physio), 0.85, 1e-9);
}

void test_masking_neutral_face_high_arousal() {
    auto facial = makeFacial(EmotionType::NEUTRAL, 0.2, 0.9);
    auto physio = makePhysio(0.8, 0.9);

    auto state = StateFusionEngine::fuse(facial, physio, at(0));

    ASSERT_NEAR(state.emotional_masking_index, 1.0, 1e-9);
    ASSERT_TRUE(state.isFacialEmotionMasked());
    ASSERT_LT(state.coherence_index, 0.3);
    // Affect plat + aucune micro-expression + incohérence
    ASSERT_GT(state.dissociation_index, 0.7);
    ASSERT_EQ(state.dominant_emotion, EmotionType::DISSOCIATION);
}

void test_frozen_fear_is_coherent() {
    auto facial = makeFacial(EmotionType::FEAR, 0.7, 1.0);
    auto physio = makePhysio(0.2, 1.0, 65.0, 40.0, 0.8);

    ASSERT_NEAR(StateFusionEngine::computeCoherence(facial, physio), 1.0, 1e-9);
}

void test_indices_always_clamped() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<std::pair<FacialSample, PhysiologicalSample>> inputs = {
        {makeFacial(EmotionType::ANGER, 5.0, 3.0), makePhysio(4.0, 2.0, 200.0, -10.0, 5.0)},
        {makeFacial(EmotionType::NEUTRAL, -1.0, -1.0), makePhysio(-2.0, -1.0, 0.0, 0.0, -1.0)},
        {makeFacial(EmotionType::FEAR, nan, 0.9), makePhysio(nan, 0.9)},
        {makeFacial(EmotionType::SHAME, 0.5, 0.5), makePhysio(0.5, 0.5)}
    };

    for (const auto& [facial, physio] : inputs) {
        auto state = StateFusionEngine::fuse(facial, physio, at(0));
        ASSERT_TRUE(inUnitRange(state.coherence_index));
        ASSERT_TRUE(inUnitRange(state.emotional_masking_index));
        ASSERT_TRUE(inUnitRange(state.dissociation_index));
        ASSERT_TRUE(inUnitRange(state.emotional_intensity));
        ASSERT_TRUE(inUnitRange(state.arousal_level));
    }
}

void test_data_quality_grades() {
    auto excellent = makeFacial(EmotionType::NEUTRAL, 0.5, 0.9, DetectionQuality::EXCELLENT);
    auto no_face = makeFacial(EmotionType::NEUTRAL, 0.5, 0.9, DetectionQuality::NO_FACE);
    auto poor = makeFacial(EmotionType::NEUTRAL, 0.5, 0.9, DetectionQuality::POOR);

    ASSERT_EQ(StateFusionEngine::assessDataQuality(excellent, makePhysio(0.5, 0.85)), DataQuality::EXCELLENT);
    ASSERT_EQ(StateFusionEngine::assessDataQuality(excellent, makePhysio(0.5, 0.1)), DataQuality::INVALID);
    ASSERT_EQ(StateFusionEngine::assessDataQuality(no_face, makePhysio(0.5, 1.0)), DataQuality::INVALID);
    ASSERT_EQ(StateFusionEngine::assessDataQuality(poor, makePhysio(0.5, 0.3)), DataQuality::POOR);
    ASSERT_EQ(StateFusionEngine::assessDataQuality(poor, makePhysio(0.5, 0.9)), DataQuality::FAIR);
}

void test_regulation_from_physiology() {
    ASSERT_EQ(StateFusionEngine::determineRegulation(makePhysio(0.9, 1.0, 110.0, 20.0), 0.5),
              RegulationState::SEVERE_DYSREGULATION);
    ASSERT_EQ(StateFusionEngine::determineRegulation(makePhysio(0.7, 1.0, 90.0, 35.0), 0.5),
              RegulationState::MODERATE_DYSREGULATION);
    ASSERT_EQ(StateFusionEngine::determineRegulation(makePhysio(0.55, 1.0, 80.0, 45.0), 0.5),
              RegulationState::MILD_DYSREGULATION);
    ASSERT_EQ(StateFusionEngine::determineRegulation(makePhysio(0.9, 1.0, 110.0, 80.0), 0.8),
              RegulationState::REGULATED);
}

void test_physiology_overrides_unreliable_face() {
    auto facial = makeFacial(EmotionType::NEUTRAL, 0.2, 0.3);
    ASSERT_EQ(StateFusionEngine::determineDominantEmotion(facial, makePhysio(0.9, 0.9, 110.0, 40.0, 0.8), 0.0),
              EmotionType::FEAR);
    ASSERT_EQ(StateFusionEngine::determineDominantEmotion(facial, makePhysio(0.9, 0.9), 0.0),
              EmotionType::ANGER);
    ASSERT_EQ(StateFusionEngine::determineDominantEmotion(facial, makePhysio(0.2, 0.9), 0.0),
              EmotionType::SADNESS);
}

// ═══════════════════════════════════════════════════════════════════════════
// TICK ET POLITIQUE DE FRAÎCHEUR
// ═══════════════════════════════════════════════════════════════════════════

void test_tick_requires_both_samples() {
    ManualClock clock;
    StateFusionEngine fusion(clock);
    fusion.setQuietMode(true);

    ASSERT_FALSE(fusion.tick().has_value());
    fusion.submitFacialSample(makeFacial(EmotionType::HAPPINESS, 0.8, 1.0));
    ASSERT_FALSE(fusion.tick().has_value());
    fusion.submitPhysiologicalSample(makePhysio(0.6));
    ASSERT_TRUE(fusion.tick().has_value());

    auto stats = fusion.getStats();
    ASSERT_EQ(stats.ticks, 3u);
    ASSERT_EQ(stats.skipped_missing, 2u);
    ASSERT_EQ(stats.states_emitted, 1u);
}

void test_sample_and_hold_reuses_last_pair() {
    ManualClock clock;
    StateFusionEngine fusion(clock);
    fusion.setQuietMode(true);

    fusion.submitFacialSample(makeFacial(EmotionType::HAPPINESS, 0.8, 1.0));
    fusion.submitPhysiologicalSample(makePhysio(0.6));
    clock.advance(10.0);

    auto state = fusion.tick();
    ASSERT_TRUE(state.has_value());
    ASSERT_TRUE(state->timestamp == clock.now());
    ASSERT_EQ(state->dominant_emotion, EmotionType::HAPPINESS);
}

void test_skip_stale_policy() {
    ManualClock clock;
    FusionConfig config;
    config.staleness_policy = StalenessPolicy::SKIP_STALE;
    config.max_sample_age_seconds = 2.0;
    StateFusionEngine fusion(clock, config);
    fusion.setQuietMode(true);

    fusion.submitFacialSample(makeFacial(EmotionType::HAPPINESS, 0.8, 1.0));
    fusion.submitPhysiologicalSample(makePhysio(0.6));

    clock.advance(1.0);
    ASSERT_TRUE(fusion.tick().has_value());

    clock.advance(1.5);
    ASSERT_FALSE(fusion.tick().has_value());
    ASSERT_EQ(fusion.getStats().skipped_stale, 1u);

    // Un seul flux rafraîchi ne suffit pas
    fusion.submitFacialSample(makeFacial(EmotionType::HAPPINESS, 0.8, 1.0));
    ASSERT_FALSE(fusion.tick().has_value());

    fusion.submitPhysiologicalSample(makePhysio(0.6));
    ASSERT_TRUE(fusion.tick().has_value());
}

void test_clear_samples() {
    ManualClock clock;
    StateFusionEngine fusion(clock);
    fusion.setQuietMode(true);

    fusion.submitFacialSample(makeFacial(EmotionType::HAPPINESS, 0.8, 1.0));
    fusion.submitPhysiologicalSample(makePhysio(0.6));
    fusion.clearSamples();
    ASSERT_FALSE(fusion.tick().has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// ABONNEMENTS ET ORDONNANCEMENT
// ═══════════════════════════════════════════════════════════════════════════

void test_periodic_tick_publishes_to_subscribers() {
    ManualClock clock;
    ManualScheduler scheduler(clock);
    StateFusionEngine fusion(clock);
    fusion.setQuietMode(true);

    int received = 0;
    auto id = fusion.subscribe([&received](const IntegratedState&) { received++; });
    ASSERT_EQ(fusion.subscriberCount(), 1u);

    fusion.submitFacialSample(makeFacial(EmotionType::HAPPINESS, 0.8, 1.0));
    fusion.submitPhysiologicalSample(makePhysio(0.6));
    fusion.start(scheduler);
    ASSERT_TRUE(fusion.isRunning());

    scheduler.advance(1.0);
    ASSERT_EQ(received, 5);

    fusion.unsubscribe(id);
    scheduler.advance(0.4);
    ASSERT_EQ(received, 5);
    ASSERT_EQ(fusion.getStats().states_emitted, 7u);
}

void test_stop_cancels_tick() {
    ManualClock clock;
    ManualScheduler scheduler(clock);
    StateFusionEngine fusion(clock);
    fusion.setQuietMode(true);

    fusion.start(scheduler);
    ASSERT_EQ(scheduler.pendingCount(), 1u);
    fusion.stop();
    ASSERT_FALSE(fusion.isRunning());
    ASSERT_EQ(scheduler.pendingCount(), 0u);

    const auto ticks = fusion.getStats().ticks;
    scheduler.advance(2.0);
    ASSERT_EQ(fusion.getStats().ticks, ticks);
}

// ═══════════════════════════════════════════════════════════════════════════
// HISTORIQUE
// ═══════════════════════════════════════════════════════════════════════════

void test_history_bounded_capacity() {
    StateHistory history(3);
    for (int i = 0; i < 5; ++i) {
        history.push(makeState(at(i * 1000), EmotionType::NEUTRAL, 0.3, 0.3));
    }

    ASSERT_EQ(history.size(), 3u);
    ASSERT_TRUE(history.latest()->timestamp == at(4000));

    auto recent = history.getRecentStates(2);
    ASSERT_EQ(recent.size(), 2u);
    ASSERT_TRUE(recent[0].timestamp == at(4000));
    ASSERT_TRUE(recent[1].timestamp == at(3000));

    ASSERT_EQ(history.getStates(at(3000)).size(), 2u);
}

void test_history_window_queries() {
    StateHistory history;
    ASSERT_FALSE(history.getDominantEmotion(10.0).has_value());
    ASSERT_NEAR(history.getAverageCoherence(10.0), 0.0, 1e-12);

    for (int i = 0; i < 10; ++i) {
        auto emotion = i < 6 ? EmotionType::HAPPINESS : EmotionType::SADNESS;
        auto state = makeState(at(i * 1000), emotion, 0.5, 0.5);
        state.coherence_index = i < 6 ? 0.8 : 0.4;
        history.push(state);
    }

    auto dominant = history.getDominantEmotion(100.0);
    ASSERT_TRUE(dominant.has_value());
    ASSERT_EQ(dominant->emotion, EmotionType::HAPPINESS);
    ASSERT_NEAR(dominant->prevalence, 0.6, 1e-9);

    // Fenêtre de 3s: états à 6, 7, 8, 9s
    auto recent = history.getDominantEmotion(3.0);
    ASSERT_EQ(recent->emotion, EmotionType::SADNESS);
    ASSERT_NEAR(history.getAverageCoherence(3.0), 0.4, 1e-9);

    // Un seul changement sur 9 transitions
    ASSERT_NEAR(history.getEmotionalVolatility(100.0), 1.0 / 9.0, 1e-9);
}

void test_volatility_needs_three_states() {
    StateHistory history;
    history.push(makeState(at(0), EmotionType::HAPPINESS, 0.5, 0.5));
    history.push(makeState(at(1000), EmotionType::SADNESS, 0.5, 0.5));
    ASSERT_NEAR(history.getEmotionalVolatility(10.0), 0.0, 1e-12);
}

// ═══════════════════════════════════════════════════════════════════════════
// MAIN
// ═══════════════════════════════════════════════════════════════════════════

int main() {
    printBanner("TESTS UNITAIRES - StateFusionEngine / StateHistory");

    std::cout << "\n>> Calculs de fusion\n";
    RUN_TEST(coherent_happiness);
    RUN_TEST(hrv_bonus_for_happiness);
    RUN_TEST(masking_neutral_face_high_arousal);
    RUN_TEST(frozen_fear_is_coherent);
    RUN_TEST(indices_always_clamped);
    RUN_TEST(data_quality_grades);
    RUN_TEST(regulation_from_physiology);
    RUN_TEST(physiology_overrides_unreliable_face);

    std::cout << "\n>> Tick et fraicheur\n";
    RUN_TEST(tick_requires_both_samples);
    RUN_TEST(sample_and_hold_reuses_last_pair);
    RUN_TEST(skip_stale_policy);
    RUN_TEST(clear_samples);

    std::cout << "\n>> Abonnements\n";
    RUN_TEST(periodic_tick_publishes_to_subscribers);
    RUN_TEST(stop_cancels_tick);

    std::cout << "\n>> Historique\n";
    RUN_TEST(history_bounded_capacity);
    RUN_TEST(history_window_queries);
    RUN_TEST(volatility_needs_three_states);

    return printSummary();
}
