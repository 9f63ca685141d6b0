/**
 * @file main.cpp
 * @brief Point d'entrée du démon BioMirror
 * @version 1.0
 * @date 2026-10-19
 *
 * BioMirror reçoit les échantillons faciaux et physiologiques via RabbitMQ,
 * les fusionne en état émotionnel intégré, surveille la dissociation et la
 * sécurité, et publie les réponses thérapeutiques du personnage.
 */

#include "biomirror/Clock.hpp"
#include "biomirror/Config.hpp"
#include "biomirror/DissociationTracker.hpp"
#include "biomirror/ProgressTracker.hpp"
#include "biomirror/RabbitMQBridge.hpp"
#include "biomirror/RecordSink.hpp"
#include "biomirror/ResponseGenerator.hpp"
#include "biomirror/ResponseScheduler.hpp"
#include "biomirror/SafetyMonitor.hpp"
#include "biomirror/SessionCoordinator.hpp"
#include "biomirror/StateFusionEngine.hpp"
#include "biomirror/StateHistory.hpp"
#include "biomirror/TimerScheduler.hpp"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

using namespace biomirror;

// Signal handler pour arrêt propre
std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    std::cout << "\n[Main] Signal " << signal << " reçu, arrêt en cours...\n";
    g_running.store(false);
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -h, --help            Affiche cette aide\n"
              << "  -c, --config <file>   Fichier de configuration JSON\n"
              << "  --host <host>         Hôte RabbitMQ (défaut: localhost)\n"
              << "  --port <port>         Port RabbitMQ (défaut: 5672)\n"
              << "  --user <user>         Utilisateur RabbitMQ (défaut: guest)\n"
              << "  --pass <password>     Mot de passe RabbitMQ\n"
              << "  --duration <sec>      Durée de séance (défaut: 1200)\n"
              << "  --phase <phase>       Phase initiale (connection, awareness, integration,\n"
              << "                        regulation, transfer)\n"
              << "  --record <file>       Enregistre états et épisodes (JSON Lines)\n"
              << "  --progress <file>     Suivi entre séances (phase conseillée si --phase absent)\n"
              << "  --demo                Mode démonstration (sans RabbitMQ)\n"
              << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// DÉMONSTRATION
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Capteur simulé: les échantillons sont injectés par le scénario
 */
class DemoSensor : public SensorService {
public:
    explicit DemoSensor(std::string name) : name_(std::move(name)) {}

    bool start() override {
        std::cout << "[Demo] Capteur " << name_ << " démarré\n";
        return true;
    }
    void stop() override {
        std::cout << "[Demo] Capteur " << name_ << " arrêté\n";
    }
    std::string name() const override { return name_; }

private:
    std::string name_;
};

struct DemoFrame {
    EmotionType emotion;
    double intensity;
    double confidence;
    double arousal;
    double heart_rate;
    double sdnn;
    double freeze;
};

/**
 * @brief Injecte une image répétée pendant `seconds` à 10 Hz
 */
void feed(StateFusionEngine& fusion, ManualScheduler& scheduler, ManualClock& clock,
          const DemoFrame& frame, double seconds) {
    const int steps = static_cast<int>(seconds / 0.1 + 0.5);
    for (int i = 0; i < steps; ++i) {
        FacialSample facial;
        facial.timestamp = clock.now();
        facial.primary_emotion = frame.emotion;
        facial.primary_intensity = frame.intensity;
        facial.confidence = frame.confidence;
        facial.face_detection_quality = DetectionQuality::EXCELLENT;
        if (frame.intensity > 0.3) {
            MicroExpression micro;
            micro.timestamp = facial.timestamp;
            micro.emotion = frame.emotion;
            micro.intensity = frame.intensity * 0.5;
            micro.duration = 0.2;
            facial.micro_expressions.push_back(micro);
        }

        PhysiologicalSample physio;
        physio.timestamp = clock.now();
        physio.arousal_level = frame.arousal;
        physio.quality_index = 0.9;
        physio.heart.heart_rate = frame.heart_rate;
        physio.heart.heart_rate_variability = frame.sdnn;
        physio.motion.freeze_index = frame.freeze;

        fusion.submitFacialSample(facial);
        fusion.submitPhysiologicalSample(physio);
        scheduler.advance(0.1);
    }
}

/**
 * @brief Intègre la séance clôturée au suivi et l'enregistre si demandé
 */
void recordProgress(const SessionCoordinator& coordinator, ProgressTracker& progress,
                    const std::string& progress_file) {
    auto session = coordinator.currentSession();
    if (!session || !session->isFinalized()) return;
    if (!progress.registerSession(*session)) return;
    if (!progress_file.empty() && !saveProgress(progress_file, progress)) {
        std::cerr << "[Main] Progression non enregistrée\n";
    }
}

void runDemo(const BioMirrorConfig& config, SessionPhase phase, double duration,
             ProgressTracker& progress, const std::string& progress_file) {
    std::cout << "\n[Demo] Mode démonstration - séance simulée (temps virtuel)\n\n";

    ManualClock clock;
    ManualScheduler scheduler(clock);
    MersenneRandomSource random(config.scheduler.random_seed != 0 ? config.scheduler.random_seed : 42);

    StateFusionEngine fusion(clock, config.fusion);
    StateHistory history(config.fusion.history_capacity);
    DissociationTracker tracker(config.dissociation);
    LoggingAlertSink alerts;
    SafetyMonitor safety(config.safety, &alerts);
    ResponseGenerator generator(config.grounding);
    ResponseScheduler responses(clock, random, generator, config.scheduler);
    DemoSensor facial_sensor("facial (simulé)");
    DemoSensor physio_sensor("physiological (simulé)");

    SessionCoordinator coordinator({fusion, history, tracker, safety, responses},
                                   scheduler, clock, facial_sensor, physio_sensor, config.session);

    coordinator.setResponseCallback([](const TherapeuticResponse& response) {
        std::cout << "  [Personnage] " << responseTypeToString(response.type) << " / "
                  << emotionToString(response.character_emotion) << " "
                  << std::fixed << std::setprecision(2) << response.character_intensity
                  << " : \"" << response.verbal_text << "\"\n";
    });
    coordinator.setTerminationCallback([](const IntegratedState&) {
        std::cout << "  [Demo] Arrêt de séance recommandé par la surveillance\n";
    });

    auto result = coordinator.startSession(phase, duration);
    if (!result.success) {
        std::cerr << "[Demo] Échec du démarrage: " << result.error << "\n";
        return;
    }

    // Scénario 1: connexion calme, émotion cohérente
    std::cout << "\n═══ Scénario 1: Joie cohérente ═══\n";
    feed(fusion, scheduler, clock, {EmotionType::HAPPINESS, 0.7, 0.9, 0.6, 78.0, 65.0, 0.0}, 8.0);

    // Scénario 2: visage neutre, activation élevée
    std::cout << "\n═══ Scénario 2: Masquage émotionnel ═══\n";
    feed(fusion, scheduler, clock, {EmotionType::NEUTRAL, 0.2, 0.9, 0.8, 95.0, 35.0, 0.0}, 8.0);

    // Scénario 3: affect plat, figement, HRV basse
    std::cout << "\n═══ Scénario 3: Épisode de dissociation ═══\n";
    feed(fusion, scheduler, clock, {EmotionType::NEUTRAL, 0.1, 0.9, 0.3, 62.0, 15.0, 0.8}, 8.0);
    feed(fusion, scheduler, clock, {EmotionType::NEUTRAL, 0.4, 0.9, 0.3, 72.0, 55.0, 0.0}, 3.0);

    // Scénario 4: peur intense
    std::cout << "\n═══ Scénario 4: ⚠ Détresse sévère ═══\n";
    coordinator.advanceToPhase(SessionPhase::REGULATION);
    feed(fusion, scheduler, clock, {EmotionType::FEAR, 0.9, 0.95, 0.95, 130.0, 18.0, 0.0}, 6.0);

    // Scénario 5: pause puis retour au calme
    std::cout << "\n═══ Scénario 5: Pause et retour au calme ═══\n";
    coordinator.pauseSession();
    scheduler.advance(5.0);
    coordinator.resumeSession();
    feed(fusion, scheduler, clock, {EmotionType::HAPPINESS, 0.6, 0.9, 0.35, 70.0, 70.0, 0.0}, 10.0);

    std::cout << "\n[Demo] Progression: " << std::fixed << std::setprecision(0)
              << coordinator.getCurrentSessionProgress() * 100.0 << "%\n";
    coordinator.endSession();
    recordProgress(coordinator, progress, progress_file);

    // Statistiques finales
    std::cout << "\n╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                    STATISTIQUES DEMO                          ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";
    auto stats = fusion.getStats();
    std::cout << "  Ticks de fusion      : " << stats.ticks << "\n";
    std::cout << "  États émis           : " << stats.states_emitted << "\n";
    std::cout << "  Épisodes dissociatifs: " << tracker.getEpisodes().size() << "\n";
    std::cout << "  Événements sécurité  : " << safety.getEvents().size() << "\n";
    std::cout << "  Réponses délivrées   : " << responses.getDeliveredCount() << "\n";
    if (auto dominant = history.getDominantEmotion(60.0)) {
        std::cout << "  Émotion dominante    : " << emotionToString(dominant->emotion) << " ("
                  << std::setprecision(0) << dominant->prevalence * 100.0 << "%)\n";
    }
    std::cout << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// MAIN
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    BioMirrorConfig config;
    std::string config_file = "config/biomirror_config.json";
    std::string record_file;
    std::string progress_file;
    std::optional<double> duration;
    std::optional<SessionPhase> phase;
    bool demo_mode = false;

    // Options RabbitMQ de la ligne de commande, appliquées après le fichier
    std::optional<std::string> host, user, pass;
    std::optional<int> port;

    // Parser les arguments
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "-c" || arg == "--config") {
                if (i + 1 < argc) {
                    config_file = argv[++i];
                }
            } else if (arg == "--host") {
                if (i + 1 < argc) {
                    host = argv[++i];
                }
            } else if (arg == "--port") {
                if (i + 1 < argc) {
                    port = std::stoi(argv[++i]);
                }
            } else if (arg == "--user") {
                if (i + 1 < argc) {
                    user = argv[++i];
                }
            } else if (arg == "--pass") {
                if (i + 1 < argc) {
                    pass = argv[++i];
                }
            } else if (arg == "--duration") {
                if (i + 1 < argc) {
                    duration = std::stod(argv[++i]);
                }
            } else if (arg == "--phase") {
                if (i + 1 < argc) {
                    auto parsed = stringToSessionPhase(argv[++i]);
                    if (!parsed) {
                        std::cerr << "[Main] Phase inconnue: " << argv[i] << "\n";
                        return 1;
                    }
                    phase = *parsed;
                }
            } else if (arg == "--record") {
                if (i + 1 < argc) {
                    record_file = argv[++i];
                }
            } else if (arg == "--progress") {
                if (i + 1 < argc) {
                    progress_file = argv[++i];
                }
            } else if (arg == "--demo") {
                demo_mode = true;
            } else {
                std::cerr << "[Main] Option inconnue: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[Main] Argument invalide: " << e.what() << "\n";
        return 1;
    }

    // Installer le signal handler
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        std::cout << "[Main] Chargement configuration..." << std::endl;
        if (std::ifstream(config_file).good()) {
            if (!loadConfig(config_file, config)) {
                std::cerr << "[Main] Configuration invalide, valeurs par défaut conservées\n";
            }
        } else {
            std::cout << "[Main] Fichier config non trouvé, utilisation des valeurs par défaut" << std::endl;
        }

        if (host) config.rabbitmq.host = *host;
        if (port) config.rabbitmq.port = *port;
        if (user) config.rabbitmq.user = *user;
        if (pass) config.rabbitmq.password = *pass;

        const double session_duration = duration.value_or(config.session.default_duration_seconds);

        ProgressTracker progress;
        if (!progress_file.empty() && std::ifstream(progress_file).good()) {
            if (!loadProgress(progress_file, progress)) {
                std::cerr << "[Main] Suivi de progression illisible, nouveau suivi\n";
            }
        }
        if (!phase) {
            phase = progress.getRecommendedPhase();
            if (progress.sessionCount() > 0) {
                std::cout << "[Main] Phase conseillée par le suivi: " << sessionPhaseToString(*phase) << "\n";
            }
        }

        if (demo_mode) {
            runDemo(config, *phase, duration.value_or(120.0), progress, progress_file);
            std::cout << "[Main] BioMirror terminé proprement.\n";
            return 0;
        }

        // ─── Composition ───
        SteadyClock clock;
        ThreadTimerScheduler scheduler;
        MersenneRandomSource random(config.scheduler.random_seed);

        StateFusionEngine fusion(clock, config.fusion);
        StateHistory history(config.fusion.history_capacity);
        DissociationTracker tracker(config.dissociation);
        LoggingAlertSink alerts;
        SafetyMonitor safety(config.safety, &alerts);
        ResponseGenerator generator(config.grounding);
        ResponseScheduler responses(clock, random, generator, config.scheduler);

        RabbitMQSensorService facial_sensor(RabbitMQSensorService::Stream::FACIAL,
                                            config.rabbitmq, fusion, clock);
        RabbitMQSensorService physio_sensor(RabbitMQSensorService::Stream::PHYSIOLOGICAL,
                                            config.rabbitmq, fusion, clock);

        std::unique_ptr<JsonLinesRecordSink> recorder;
        if (!record_file.empty()) {
            recorder = std::make_unique<JsonLinesRecordSink>(record_file);
            if (!recorder->open()) {
                return 1;
            }
        }

        SessionCoordinator coordinator({fusion, history, tracker, safety, responses},
                                       scheduler, clock, facial_sensor, physio_sensor,
                                       config.session, recorder.get());

        std::atomic<bool> terminate_requested{false};
        coordinator.setTerminationCallback([&terminate_requested](const IntegratedState&) {
            terminate_requested.store(true);
        });

        RabbitMQPublisher publisher(config.rabbitmq);
        if (!publisher.connect()) {
            std::cerr << "[Main] Échec de la connexion RabbitMQ" << std::endl;
            return 1;
        }
        publisher.attach(fusion, coordinator, safety);

        scheduler.start();

        auto result = coordinator.startSession(*phase, session_duration);
        if (!result.success) {
            std::cerr << "[Main] Échec du démarrage de séance: " << result.error << std::endl;
            publisher.detach();
            scheduler.stop();
            return 1;
        }

        std::cout << "[Main] BioMirror actif. Appuyez sur Ctrl+C pour arrêter." << std::endl;

        // Boucle principale
        while (g_running.load()) {
            SessionState state = coordinator.state();
            if (state != SessionState::ACTIVE && state != SessionState::PAUSED) break;
            if (terminate_requested.load()) {
                std::cerr << "[Main] Arrêt de séance demandé par la surveillance" << std::endl;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        coordinator.endSession();
        publisher.detach();
        scheduler.stop();
        recordProgress(coordinator, progress, progress_file);

        std::cout << "[Main] Messages publiés: " << publisher.getPublishedCount() << "\n";
        std::cout << "[Main] BioMirror terminé proprement.\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[Main] Erreur fatale: " << e.what() << "\n";
        return 1;
    }
}
