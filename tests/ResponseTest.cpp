/**
 * @file ResponseTest.cpp
 * @brief Tests du générateur de réponses et de l'ordonnanceur anti-rebond
 */

#include "TestHarness.hpp"
#include "biomirror/Clock.hpp"
#include "biomirror/ResponseGenerator.hpp"
#include "biomirror/ResponseScheduler.hpp"
#include "biomirror/TimerScheduler.hpp"

#include <variant>
#include <vector>

using namespace biomirror;
using namespace biomirror::test;

namespace {

SchedulerConfig fullSensitivity() {
    SchedulerConfig config;
    config.response_sensitivity = 1.0;
    return config;
}

IntegratedState emotionState(long long ms, EmotionType emotion) {
    return makeState(at(ms), emotion, 0.5, 0.5);
}

/**
 * @brief Amorce puis alterne joie/tristesse: `changes` réponses en file
 */
void alternateEmotions(ResponseScheduler& scheduler, int changes) {
    scheduler.onStateChanged(emotionState(0, EmotionType::HAPPINESS));
    for (int i = 1; i <= changes; ++i) {
        auto emotion = i % 2 == 1 ? EmotionType::SADNESS : EmotionType::HAPPINESS;
        scheduler.onStateChanged(emotionState(i * 90, emotion));
    }
}

SafetyEvent mediumEvent() {
    SafetyEvent event;
    event.type = SafetyEventType::SEVERE_DISSOCIATION;
    event.level = AlertLevel::MEDIUM;
    event.description = "Severe dissociation detected";
    return event;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// GÉNÉRATEUR
// ═══════════════════════════════════════════════════════════════════════════

void test_connection_softens_negative_emotions() {
    ResponseGenerator generator;
    auto response = generator.connectionResponse(makeState(at(0), EmotionType::SADNESS, 0.8, 0.5));

    ASSERT_EQ(response.type, ResponseType::MIRRORING);
    ASSERT_EQ(response.character_emotion, EmotionType::SADNESS);
    ASSERT_NEAR(response.character_intensity, 0.8 * 0.7 * 0.5, 1e-9);
    ASSERT_EQ(response.intervention_level, InterventionLevel::MINIMAL);
    ASSERT_NEAR(response.duration, 5.0, 1e-12);
}

void test_awareness_applies_titration() {
    ResponseGenerator generator;
    auto response = generator.awarenessResponse(makeState(at(0), EmotionType::ANGER, 0.8, 0.7));

    // Sensibilité de reflet 0.8: facteur 0.4 * 0.2
    ASSERT_EQ(response.type, ResponseType::EXPLORATION);
    ASSERT_NEAR(response.character_intensity, 0.8 * (1.0 - 0.08), 1e-9);
    ASSERT_TRUE(response.target_state.has_value());
    ASSERT_EQ(*response.target_state, EmotionType::ANGER);
}

void test_integration_reflects_body_when_masked() {
    ResponseGenerator generator;
    auto masked = makeState(at(0), EmotionType::NEUTRAL, 0.2, 0.5);
    masked.emotional_masking_index = 0.7;
    masked.physiological.motion.freeze_index = 0.8;

    auto response = generator.integrationResponse(masked);
    ASSERT_EQ(response.type, ResponseType::MIRRORING);
    ASSERT_EQ(response.character_emotion, EmotionType::FEAR);
    ASSERT_EQ(response.intervention_level, InterventionLevel::MODERATE);

    auto open = makeState(at(0), EmotionType::HAPPINESS, 0.8, 0.5);
    auto validation = generator.integrationResponse(open);
    ASSERT_EQ(validation.type, ResponseType::VALIDATION);
    ASSERT_NEAR(validation.character_intensity, 0.64, 1e-9);
}

void test_regulation_guides_or_celebrates() {
    ResponseGenerator generator;

    auto angry = makeState(at(0), EmotionType::ANGER, 0.9, 0.9);
    angry.regulation = RegulationState::MODERATE_DYSREGULATION;
    auto guide = generator.regulationResponse(angry);
    ASSERT_EQ(guide.type, ResponseType::REGULATION);
    ASSERT_NEAR(guide.character_intensity, 0.6, 1e-9);
    ASSERT_TRUE(std::holds_alternative<BreathingAction>(guide.action));
    ASSERT_EQ(guide.intervention_level, InterventionLevel::SIGNIFICANT);

    auto afraid = angry;
    afraid.dominant_emotion = EmotionType::FEAR;
    auto shared = generator.regulationResponse(afraid);
    ASSERT_TRUE(std::holds_alternative<AttentionAction>(shared.action));
    ASSERT_EQ(std::get<AttentionAction>(shared.action).focus, AttentionFocus::SHARED);

    auto calm = makeState(at(0), EmotionType::NEUTRAL, 0.3, 0.3);
    ASSERT_EQ(generator.regulationResponse(calm).type, ResponseType::CELEBRATION);
}

void test_generate_dispatches_by_phase() {
    ResponseGenerator generator;
    auto state = makeState(at(0), EmotionType::HAPPINESS, 0.6, 0.5);

    ASSERT_EQ(generator.generate(state, SessionPhase::CONNECTION, at(10)).type, ResponseType::MIRRORING);
    ASSERT_EQ(generator.generate(state, SessionPhase::AWARENESS, at(10)).type, ResponseType::EXPLORATION);
    ASSERT_EQ(generator.generate(state, SessionPhase::INTEGRATION, at(10)).type, ResponseType::VALIDATION);
    ASSERT_EQ(generator.generate(state, SessionPhase::REGULATION, at(10)).type, ResponseType::CELEBRATION);

    auto transfer = generator.generate(state, SessionPhase::TRANSFER, at(10));
    ASSERT_EQ(transfer.type, ResponseType::TRANSFER);
    ASSERT_TRUE(transfer.timestamp == at(10));
}

void test_grounding_technique_table() {
    ResponseGenerator preferred;
    ASSERT_EQ(preferred.selectGroundingTechnique(DissociationSeverity::SEVERE), GroundingTechnique::SENSORY);
    ASSERT_EQ(preferred.selectGroundingTechnique(DissociationSeverity::MODERATE), GroundingTechnique::BREATHING);
    // Ni cognitif ni nommage préférés: première préférence
    ASSERT_EQ(preferred.selectGroundingTechnique(DissociationSeverity::MILD), GroundingTechnique::BREATHING);

    GroundingPreferences none;
    none.preferred_techniques.clear();
    ResponseGenerator fallback(none);
    ASSERT_EQ(fallback.selectGroundingTechnique(DissociationSeverity::SEVERE), GroundingTechnique::SENSORY);
    ASSERT_EQ(fallback.selectGroundingTechnique(DissociationSeverity::MODERATE), GroundingTechnique::BREATHING);
    ASSERT_EQ(fallback.selectGroundingTechnique(DissociationSeverity::MILD), GroundingTechnique::NAMING);
    ASSERT_EQ(fallback.selectGroundingTechnique(DissociationSeverity::POTENTIAL), GroundingTechnique::NAMING);

    GroundingPreferences movement;
    movement.preferred_techniques = {GroundingTechnique::MOVEMENT, GroundingTechnique::COGNITIVE};
    ResponseGenerator active(movement);
    ASSERT_EQ(active.selectGroundingTechnique(DissociationSeverity::MODERATE), GroundingTechnique::MOVEMENT);
    ASSERT_EQ(active.selectGroundingTechnique(DissociationSeverity::MILD), GroundingTechnique::COGNITIVE);
}

void test_grounding_response_levels() {
    ResponseGenerator generator;

    auto severe = generator.groundingResponse(DissociationSeverity::SEVERE, at(0));
    ASSERT_EQ(severe.type, ResponseType::GROUNDING);
    ASSERT_EQ(severe.intervention_level, InterventionLevel::INTENSIVE);
    ASSERT_NEAR(severe.duration, 30.0, 1e-12);
    ASSERT_TRUE(std::holds_alternative<AttentionAction>(severe.action));

    auto mild = generator.groundingResponse(DissociationSeverity::MILD, at(0));
    ASSERT_EQ(mild.intervention_level, InterventionLevel::MINIMAL);
    ASSERT_NEAR(mild.duration, 15.0, 1e-12);
    ASSERT_TRUE(std::holds_alternative<BreathingAction>(mild.action));
}

void test_infer_emotion_from_physiology() {
    ASSERT_EQ(ResponseGenerator::inferEmotionFromPhysiology(makePhysio(0.5, 1.0, 70.0, 50.0, 0.8)),
              EmotionType::FEAR);
    ASSERT_EQ(ResponseGenerator::inferEmotionFromPhysiology(makePhysio(0.9, 1.0, 110.0)), EmotionType::ANGER);
    ASSERT_EQ(ResponseGenerator::inferEmotionFromPhysiology(makePhysio(0.9, 1.0, 80.0)), EmotionType::FEAR);
    ASSERT_EQ(ResponseGenerator::inferEmotionFromPhysiology(makePhysio(0.7)), EmotionType::SURPRISE);
    ASSERT_EQ(ResponseGenerator::inferEmotionFromPhysiology(makePhysio(0.2)), EmotionType::SADNESS);
    ASSERT_EQ(ResponseGenerator::inferEmotionFromPhysiology(makePhysio(0.5)), EmotionType::NEUTRAL);
}

// ═══════════════════════════════════════════════════════════════════════════
// SIGNIFICATIVITÉ
// ═══════════════════════════════════════════════════════════════════════════

void test_state_change_significance() {
    SchedulerConfig config;
    auto base = makeState(at(0), EmotionType::NEUTRAL, 0.5, 0.5, 0.2);

    auto aroused = base;
    aroused.arousal_level = 0.75;
    auto change = ResponseScheduler::diff(base, aroused, config);
    ASSERT_TRUE(change.arousal_changed);
    ASSERT_TRUE(change.significant);
    ASSERT_NEAR(change.arousal_delta, 0.25, 1e-9);

    auto mild_rise = base;
    mild_rise.arousal_level = 0.65;
    ASSERT_FALSE(ResponseScheduler::diff(base, mild_rise, config).significant);

    auto low_dissociation = base;
    low_dissociation.dissociation_index = 0.45;
    change = ResponseScheduler::diff(base, low_dissociation, config);
    ASSERT_TRUE(change.dissociation_changed);
    ASSERT_FALSE(change.significant);

    auto dysregulated = base;
    dysregulated.regulation = RegulationState::MILD_DYSREGULATION;
    ASSERT_TRUE(ResponseScheduler::diff(base, dysregulated, config).significant);
}

void test_first_state_only_primes() {
    ManualClock clock;
    FixedRandomSource random(0.0);
    ResponseGenerator generator;
    ResponseScheduler scheduler(clock, random, generator, fullSensitivity());
    scheduler.setQuietMode(true);

    scheduler.onStateChanged(emotionState(0, EmotionType::HAPPINESS));
    ASSERT_EQ(scheduler.queueSize(), 0u);

    scheduler.onStateChanged(emotionState(200, EmotionType::SADNESS));
    ASSERT_EQ(scheduler.queueSize(), 1u);
}

void test_random_gate_on_emotion_change() {
    ManualClock clock;
    FixedRandomSource random(1.0);
    ResponseGenerator generator;
    ResponseScheduler scheduler(clock, random, generator, fullSensitivity());
    scheduler.setQuietMode(true);

    alternateEmotions(scheduler, 3);
    ASSERT_EQ(scheduler.queueSize(), 0u);

    // Un changement de régulation répond toujours
    auto dysregulated = emotionState(1000, EmotionType::HAPPINESS);
    dysregulated.regulation = RegulationState::MODERATE_DYSREGULATION;
    scheduler.onStateChanged(dysregulated);
    ASSERT_EQ(scheduler.queueSize(), 1u);
}

void test_small_arousal_swing_ignored() {
    ManualClock clock;
    FixedRandomSource random(0.0);
    ResponseGenerator generator;
    ResponseScheduler scheduler(clock, random, generator, fullSensitivity());

    StateChange change;
    change.significant = true;
    change.arousal_changed = true;
    change.arousal_delta = 0.25;
    ASSERT_FALSE(scheduler.shouldRespond(change));

    change.arousal_delta = -0.35;
    ASSERT_TRUE(scheduler.shouldRespond(change));
}

void test_response_delay_from_sensitivity() {
    ManualClock clock;
    FixedRandomSource random(0.0);
    ResponseGenerator generator;
    ResponseScheduler scheduler(clock, random, generator);

    ASSERT_NEAR(scheduler.responseDelay(), 3.0 - 0.7 * 2.5, 1e-9);
    scheduler.setSensitivity(2.0);
    ASSERT_NEAR(scheduler.getSensitivity(), 1.0, 1e-12);
    ASSERT_NEAR(scheduler.responseDelay(), 0.5, 1e-9);
    scheduler.setSensitivity(0.0);
    ASSERT_NEAR(scheduler.responseDelay(), 3.0, 1e-9);
}

void test_sensitivity_changed_during_delivery() {
    ManualClock clock;
    ManualScheduler timers(clock);
    FixedRandomSource random(0.0);
    ResponseGenerator generator;
    ResponseScheduler scheduler(clock, random, generator, fullSensitivity());
    scheduler.setQuietMode(true);

    // Le rappel de délivrance s'exécute hors verrou
    std::vector<double> delays;
    scheduler.setResponseCallback([&scheduler, &delays](const TherapeuticResponse&) {
        scheduler.setSensitivity(0.0);
        delays.push_back(scheduler.responseDelay());
    });

    scheduler.startScheduling(timers);
    alternateEmotions(scheduler, 2);
    timers.advance(0.5);
    ASSERT_EQ(delays.size(), 1u);
    ASSERT_NEAR(delays.front(), 3.0, 1e-9);

    // Réponse de 5 s terminée, délai de 3 s couvert: seconde délivrance
    timers.advance(6.0);
    ASSERT_EQ(delays.size(), 2u);
    ASSERT_EQ(scheduler.getDeliveredCount(), 2u);
}

// ═══════════════════════════════════════════════════════════════════════════
// FILE ET DÉLIVRANCE
// ═══════════════════════════════════════════════════════════════════════════

void test_queue_is_capped() {
    ManualClock clock;
    FixedRandomSource random(0.0);
    ResponseGenerator generator;
    ResponseScheduler scheduler(clock, random, generator, fullSensitivity());
    scheduler.setQuietMode(true);

    alternateEmotions(scheduler, 8);
    ASSERT_EQ(scheduler.queueSize(), MAX_QUEUED_RESPONSES);
}

void test_deliveries_never_overlap() {
    ManualClock clock;
    ManualScheduler timers(clock);
    FixedRandomSource random(0.0);
    ResponseGenerator generator;
    ResponseScheduler scheduler(clock, random, generator, fullSensitivity());
    scheduler.setQuietMode(true);

    std::vector<TherapeuticResponse> delivered;
    scheduler.setResponseCallback([&delivered](const TherapeuticResponse& response) {
        delivered.push_back(response);
    });

    // Rafale de dix changements significatifs en moins d'une seconde
    scheduler.startScheduling(timers);
    alternateEmotions(scheduler, 10);
    ASSERT_EQ(scheduler.queueSize(), MAX_QUEUED_RESPONSES);

    timers.advance(1.0);
    ASSERT_LE(delivered.size(), 2u);
    ASSERT_TRUE(scheduler.activeResponse().has_value());

    timers.advance(60.0);
    ASSERT_EQ(delivered.size(), MAX_QUEUED_RESPONSES);
    ASSERT_EQ(scheduler.getDeliveredCount(), MAX_QUEUED_RESPONSES);

    for (size_t i = 1; i < delivered.size(); ++i) {
        const double gap = secondsBetween(delivered[i - 1].timestamp, delivered[i].timestamp);
        ASSERT_GE(gap, delivered[i - 1].duration);
        ASSERT_GE(gap, scheduler.responseDelay());
    }
}

void test_grounding_preempts_phase_responses() {
    ManualClock clock;
    FixedRandomSource random(0.0);
    ResponseGenerator generator;
    ResponseScheduler scheduler(clock, random, generator, fullSensitivity());
    scheduler.setQuietMode(true);

    alternateEmotions(scheduler, 1);
    ASSERT_EQ(scheduler.queueSize(), 1u);

    scheduler.onDissociationStatus(DissociationStatus::active(DissociationSeverity::MILD, 6.0, 0.7));
    ASSERT_EQ(scheduler.queueSize(), 2u);

    // Même sévérité: pas de nouvel ancrage; pendant l'ancrage, pas de réponse de phase
    scheduler.onDissociationStatus(DissociationStatus::active(DissociationSeverity::MILD, 6.2, 0.7));
    scheduler.onStateChanged(emotionState(1000, EmotionType::ANGER));
    ASSERT_EQ(scheduler.queueSize(), 2u);

    auto first = scheduler.processQueue();
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first->type, ResponseType::GROUNDING);

    scheduler.onDissociationStatus(DissociationStatus::active(DissociationSeverity::MODERATE, 31.0, 0.7));
    ASSERT_EQ(scheduler.queueSize(), 2u);

    // Un épisode potentiel ne déclenche pas d'ancrage
    scheduler.onDissociationStatus(DissociationStatus::none());
    scheduler.onDissociationStatus(DissociationStatus::active(DissociationSeverity::POTENTIAL, 0.0, 0.7));
    ASSERT_EQ(scheduler.queueSize(), 2u);
}

void test_safety_intervention_purges_phase_responses() {
    ManualClock clock;
    FixedRandomSource random(0.0);
    ResponseGenerator generator;
    ResponseScheduler scheduler(clock, random, generator, fullSensitivity());
    scheduler.setQuietMode(true);

    alternateEmotions(scheduler, 3);
    ASSERT_EQ(scheduler.queueSize(), 3u);

    scheduler.onSafetyIntervention(mediumEvent());
    ASSERT_EQ(scheduler.queueSize(), 1u);

    auto response = scheduler.processQueue();
    ASSERT_TRUE(response.has_value());
    ASSERT_EQ(response->type, ResponseType::REGULATION);
    ASSERT_EQ(response->intervention_level, InterventionLevel::INTENSIVE);
    ASSERT_NEAR(response->duration, 20.0, 1e-12);
}

void test_stop_scheduling_clears_everything() {
    ManualClock clock;
    ManualScheduler timers(clock);
    FixedRandomSource random(0.0);
    ResponseGenerator generator;
    ResponseScheduler scheduler(clock, random, generator, fullSensitivity());
    scheduler.setQuietMode(true);

    scheduler.startScheduling(timers);
    alternateEmotions(scheduler, 3);
    timers.advance(0.5);
    ASSERT_TRUE(scheduler.activeResponse().has_value());

    scheduler.stopScheduling();
    ASSERT_FALSE(scheduler.isScheduling());
    ASSERT_EQ(timers.pendingCount(), 0u);
    ASSERT_EQ(scheduler.queueSize(), 0u);
    ASSERT_FALSE(scheduler.activeResponse().has_value());

    // L'état précédent est oublié: le prochain état ne fait qu'amorcer
    scheduler.onStateChanged(emotionState(2000, EmotionType::FEAR));
    ASSERT_EQ(scheduler.queueSize(), 0u);
}

void test_restart_ignores_states_seen_while_stopped() {
    ManualClock clock;
    ManualScheduler timers(clock);
    FixedRandomSource random(0.0);
    ResponseGenerator generator;
    ResponseScheduler scheduler(clock, random, generator, fullSensitivity());
    scheduler.setQuietMode(true);

    scheduler.startScheduling(timers);
    scheduler.onStateChanged(emotionState(0, EmotionType::SADNESS));
    scheduler.stopScheduling();

    // État tardif reçu entre deux séances
    scheduler.onStateChanged(emotionState(500, EmotionType::FEAR));

    scheduler.startScheduling(timers);
    scheduler.onStateChanged(emotionState(1000, EmotionType::HAPPINESS));
    ASSERT_EQ(scheduler.queueSize(), 0u);

    scheduler.onStateChanged(emotionState(1200, EmotionType::SADNESS));
    ASSERT_EQ(scheduler.queueSize(), 1u);
}

void test_phase_drives_generated_response() {
    ManualClock clock;
    FixedRandomSource random(0.0);
    ResponseGenerator generator;
    ResponseScheduler scheduler(clock, random, generator, fullSensitivity());
    scheduler.setQuietMode(true);

    scheduler.setPhase(SessionPhase::TRANSFER);
    ASSERT_EQ(scheduler.getPhase(), SessionPhase::TRANSFER);
    alternateEmotions(scheduler, 1);

    auto response = scheduler.processQueue();
    ASSERT_TRUE(response.has_value());
    ASSERT_EQ(response->type, ResponseType::TRANSFER);
}

// ═══════════════════════════════════════════════════════════════════════════
// MAIN
// ═══════════════════════════════════════════════════════════════════════════

int main() {
    printBanner("TESTS UNITAIRES - ResponseGenerator / ResponseScheduler");

    std::cout << "\n>> Strategies par phase\n";
    RUN_TEST(connection_softens_negative_emotions);
    RUN_TEST(awareness_applies_titration);
    RUN_TEST(integration_reflects_body_when_masked);
    RUN_TEST(regulation_guides_or_celebrates);
    RUN_TEST(generate_dispatches_by_phase);

    std::cout << "\n>> Ancrage\n";
    RUN_TEST(grounding_technique_table);
    RUN_TEST(grounding_response_levels);
    RUN_TEST(infer_emotion_from_physiology);

    std::cout << "\n>> Significativite\n";
    RUN_TEST(state_change_significance);
    RUN_TEST(first_state_only_primes);
    RUN_TEST(random_gate_on_emotion_change);
    RUN_TEST(small_arousal_swing_ignored);
    RUN_TEST(response_delay_from_sensitivity);
    RUN_TEST(sensitivity_changed_during_delivery);

    std::cout << "\n>> File et delivrance\n";
    RUN_TEST(queue_is_capped);
    RUN_TEST(deliveries_never_overlap);
    RUN_TEST(grounding_preempts_phase_responses);
    RUN_TEST(safety_intervention_purges_phase_responses);
    RUN_TEST(stop_scheduling_clears_everything);
    RUN_TEST(restart_ignores_states_seen_while_stopped);
    RUN_TEST(phase_drives_generated_response);

    return printSummary();
}
