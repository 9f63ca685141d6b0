/**
 * @file SafetyMonitorTest.cpp
 * @brief Tests de la machine à états d'alerte et des vérifications temporelles
 */

#include "TestHarness.hpp"
#include "biomirror/SafetyMonitor.hpp"

#include <vector>

using namespace biomirror;
using namespace biomirror::test;

namespace {

/**
 * @brief Collaborateur de sécurité qui compte les protocoles reçus
 */
class RecordingAlertSink : public SafetyAlertSink {
public:
    void flagForReview(const SafetyEvent&) override { reviews++; }
    void triggerCalmingIntervention(const SafetyEvent&) override { calming++; }
    void triggerSessionTermination(const SafetyEvent&) override { terminations++; }
    void notifyGuardian(const std::string&, ContactMethod method) override {
        guardian++;
        last_method = method;
    }
    void notifyTherapist(const std::string&) override { therapist++; }

    int reviews{0};
    int calming{0};
    int terminations{0};
    int guardian{0};
    int therapist{0};
    ContactMethod last_method{ContactMethod::NOTIFICATION};
};

IntegratedState calmState(long long ms) {
    return makeState(at(ms), EmotionType::NEUTRAL, 0.2, 0.3);
}

IntegratedState dissociatedState(long long ms, DataQuality quality = DataQuality::GOOD) {
    return makeState(at(ms), EmotionType::NEUTRAL, 0.2, 0.3, 0.85, quality);
}

IntegratedState distressState(long long ms, DataQuality quality = DataQuality::GOOD) {
    return makeState(at(ms), EmotionType::FEAR, 0.9, 0.8, 0.0, quality);
}

IntegratedState highArousalState(long long ms) {
    return makeState(at(ms), EmotionType::NEUTRAL, 0.4, 0.95);
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// ESCALADE
// ═══════════════════════════════════════════════════════════════════════════

void test_escalation_is_monotonic() {
    RecordingAlertSink sink;
    SafetyMonitor monitor(SafetyThresholds{}, &sink);
    monitor.setQuietMode(true);

    std::vector<std::pair<AlertLevel, AlertLevel>> transitions;
    monitor.setLevelCallback([&transitions](AlertLevel previous, AlertLevel current) {
        transitions.emplace_back(previous, current);
    });

    ASSERT_EQ(monitor.evaluate(dissociatedState(0)), AlertLevel::MEDIUM);
    ASSERT_EQ(monitor.getEvents().size(), 1u);

    ASSERT_EQ(monitor.evaluate(distressState(1000)), AlertLevel::HIGH);
    ASSERT_EQ(monitor.getEvents().size(), 2u);
    ASSERT_EQ(monitor.getEvents().back().type, SafetyEventType::SEVERE_DISTRESS);

    // Un déclencheur plus faible ne fait ni redescendre ni créer d'événement
    ASSERT_EQ(monitor.evaluate(dissociatedState(2000)), AlertLevel::HIGH);
    ASSERT_EQ(monitor.getEvents().size(), 2u);

    // Retour à none seulement sans aucun déclencheur
    ASSERT_EQ(monitor.evaluate(calmState(3000)), AlertLevel::NONE);
    ASSERT_EQ(monitor.currentLevel(), AlertLevel::NONE);

    ASSERT_EQ(transitions.size(), 3u);
    ASSERT_EQ(transitions[0].second, AlertLevel::MEDIUM);
    ASSERT_EQ(transitions[1].second, AlertLevel::HIGH);
    ASSERT_EQ(transitions[2].second, AlertLevel::NONE);

    ASSERT_EQ(sink.calming, 1);
    ASSERT_EQ(sink.terminations, 1);
    ASSERT_EQ(sink.guardian, 1);
}

void test_event_ids_increase() {
    SafetyMonitor monitor;
    monitor.setQuietMode(true);

    monitor.evaluate(dissociatedState(0));
    monitor.evaluate(calmState(1000));
    monitor.evaluate(distressState(2000));

    auto events = monitor.getEvents();
    ASSERT_EQ(events.size(), 2u);
    ASSERT_LT(events[0].id, events[1].id);
}

void test_unreliable_data_is_ignored() {
    SafetyMonitor monitor;
    monitor.setQuietMode(true);

    ASSERT_EQ(monitor.evaluate(distressState(0, DataQuality::POOR)), AlertLevel::NONE);
    ASSERT_EQ(monitor.evaluate(distressState(200, DataQuality::INVALID)), AlertLevel::NONE);
    ASSERT_TRUE(monitor.getEvents().empty());

    // Un tick douteux ne fait pas non plus redescendre le niveau
    monitor.evaluate(dissociatedState(400));
    auto poor_calm = calmState(600);
    poor_calm.data_quality = DataQuality::POOR;
    ASSERT_EQ(monitor.evaluate(poor_calm), AlertLevel::MEDIUM);
}

void test_prolonged_negative_state_flags_review() {
    RecordingAlertSink sink;
    SafetyMonitor monitor(SafetyThresholds{}, &sink);
    monitor.setQuietMode(true);

    auto sad = [](long long ms) { return makeState(at(ms), EmotionType::SADNESS, 0.3, 0.3); };

    ASSERT_EQ(monitor.evaluate(sad(0)), AlertLevel::NONE);
    ASSERT_EQ(monitor.evaluate(sad(120000)), AlertLevel::NONE);
    ASSERT_EQ(monitor.evaluate(sad(181000)), AlertLevel::LOW);
    ASSERT_EQ(monitor.getEvents().back().type, SafetyEventType::PROLONGED_NEGATIVE_STATE);
    ASSERT_EQ(sink.reviews, 1);

    // Une émotion non négative remet le chronomètre à zéro
    monitor.evaluate(calmState(182000));
    ASSERT_EQ(monitor.evaluate(sad(183000)), AlertLevel::NONE);
}

void test_extreme_arousal_requires_heart_rate() {
    SafetyMonitor monitor;
    monitor.setQuietMode(true);

    auto aroused = highArousalState(0);
    aroused.physiological.heart.heart_rate = 100.0;
    ASSERT_EQ(monitor.evaluate(aroused), AlertLevel::NONE);

    aroused.timestamp = at(200);
    aroused.physiological.heart.heart_rate = 130.0;
    ASSERT_EQ(monitor.evaluate(aroused), AlertLevel::MEDIUM);
    ASSERT_EQ(monitor.getEvents().back().type, SafetyEventType::EXTREME_AROUSAL);
}

void test_pending_intervention_consumed_once() {
    SafetyMonitor monitor;
    monitor.setQuietMode(true);

    ASSERT_FALSE(monitor.hasPendingIntervention());
    monitor.evaluate(dissociatedState(0));
    ASSERT_TRUE(monitor.hasPendingIntervention());

    auto event = monitor.consumePendingIntervention();
    ASSERT_TRUE(event.has_value());
    ASSERT_EQ(event->level, AlertLevel::MEDIUM);
    ASSERT_FALSE(monitor.consumePendingIntervention().has_value());
}

void test_guardian_notified_for_medium_after_delay() {
    RecordingAlertSink sink;
    SafetyThresholds thresholds;
    thresholds.guardian_contact_method = ContactMethod::SMS;
    SafetyMonitor monitor(thresholds, &sink);
    monitor.setQuietMode(true);
    monitor.setSessionStart(at(0));

    monitor.evaluate(dissociatedState(10000));
    ASSERT_EQ(sink.guardian, 0);

    monitor.evaluate(calmState(11000));
    monitor.evaluate(dissociatedState(301000));
    ASSERT_EQ(sink.guardian, 1);
    ASSERT_EQ(sink.last_method, ContactMethod::SMS);
    ASSERT_EQ(monitor.getGuardianAlertCount(), 1u);
}

// ═══════════════════════════════════════════════════════════════════════════
// VÉRIFICATIONS TEMPORELLES
// ═══════════════════════════════════════════════════════════════════════════

void test_sustained_distress_requires_intervention() {
    RecordingAlertSink sink;
    SafetyMonitor monitor(SafetyThresholds{}, &sink);
    monitor.setQuietMode(true);

    ASSERT_FALSE(monitor.needsIntervention(highArousalState(0)));
    ASSERT_FALSE(monitor.needsIntervention(highArousalState(60000)));
    ASSERT_TRUE(monitor.needsIntervention(highArousalState(121000)));
    ASSERT_TRUE(monitor.needsIntervention(highArousalState(130000)));

    // Une seule alerte parentale par séance
    ASSERT_EQ(sink.guardian, 1);

    // Le chronomètre repart de zéro quand l'arousal retombe
    ASSERT_FALSE(monitor.needsIntervention(calmState(131000)));
    ASSERT_FALSE(monitor.needsIntervention(highArousalState(132000)));
}

void test_severe_dissociation_requires_intervention() {
    SafetyMonitor monitor;
    monitor.setQuietMode(true);
    ASSERT_TRUE(monitor.needsIntervention(dissociatedState(0)));
}

void test_termination_after_sustained_distress() {
    SafetyMonitor monitor;
    monitor.setQuietMode(true);

    ASSERT_FALSE(monitor.shouldTerminateSession(highArousalState(0)));
    ASSERT_FALSE(monitor.shouldTerminateSession(highArousalState(200000)));
    ASSERT_TRUE(monitor.shouldTerminateSession(highArousalState(241000)));
}

void test_distress_timer_is_shared() {
    SafetyMonitor monitor;
    monitor.setQuietMode(true);

    monitor.needsIntervention(highArousalState(0));
    ASSERT_TRUE(monitor.shouldTerminateSession(highArousalState(241000)));
}

void test_therapist_alert_is_idempotent() {
    RecordingAlertSink sink;
    SafetyMonitor monitor(SafetyThresholds{}, &sink);
    monitor.setQuietMode(true);

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(monitor.shouldTerminateSession(dissociatedState(i * 200)));
    }
    ASSERT_EQ(sink.therapist, 1);
    ASSERT_EQ(monitor.getTherapistAlertCount(), 1u);
}

void test_termination_ignores_poor_dissociation_data() {
    SafetyMonitor monitor;
    monitor.setQuietMode(true);
    ASSERT_FALSE(monitor.shouldTerminateSession(dissociatedState(0, DataQuality::POOR)));
}

void test_reset_starts_a_new_session() {
    RecordingAlertSink sink;
    SafetyMonitor monitor(SafetyThresholds{}, &sink);
    monitor.setQuietMode(true);

    monitor.evaluate(distressState(0));
    monitor.shouldTerminateSession(dissociatedState(200));
    monitor.reset();

    ASSERT_EQ(monitor.currentLevel(), AlertLevel::NONE);
    ASSERT_TRUE(monitor.getEvents().empty());
    ASSERT_FALSE(monitor.hasPendingIntervention());
    ASSERT_EQ(monitor.getTherapistAlertCount(), 0u);
    ASSERT_EQ(monitor.getGuardianAlertCount(), 0u);

    // Nouvelle séance: le thérapeute peut de nouveau être alerté
    monitor.shouldTerminateSession(dissociatedState(400));
    ASSERT_EQ(sink.therapist, 2);
}

// ═══════════════════════════════════════════════════════════════════════════
// MAIN
// ═══════════════════════════════════════════════════════════════════════════

int main() {
    printBanner("TESTS UNITAIRES - SafetyMonitor");

    std::cout << "\n>> Escalade\n";
    RUN_TEST(escalation_is_monotonic);
    RUN_TEST(event_ids_increase);
    RUN_TEST(unreliable_data_is_ignored);
    RUN_TEST(prolonged_negative_state_flags_review);
    RUN_TEST(extreme_arousal_requires_heart_rate);
    RUN_TEST(pending_intervention_consumed_once);
    RUN_TEST(guardian_notified_for_medium_after_delay);

    std::cout << "\n>> Verifications temporelles\n";
    RUN_TEST(sustained_distress_requires_intervention);
    RUN_TEST(severe_dissociation_requires_intervention);
    RUN_TEST(termination_after_sustained_distress);
    RUN_TEST(distress_timer_is_shared);
    RUN_TEST(therapist_alert_is_idempotent);
    RUN_TEST(termination_ignores_poor_dissociation_data);
    RUN_TEST(reset_starts_a_new_session);

    return printSummary();
}
