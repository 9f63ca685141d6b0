/**
 * @file Serialization.hpp
 * @brief Conversion JSON des échantillons, états et événements
 * @version 1.0
 * @date 2026-10-19
 *
 * Les horodatages sont exprimés en secondes depuis l'époque de l'horloge
 * monotone (champ "t").
 */

#ifndef BIOMIRROR_SERIALIZATION_HPP
#define BIOMIRROR_SERIALIZATION_HPP

#include "TherapeuticSession.hpp"
#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace biomirror {

double timestampToSeconds(Timestamp t);

nlohmann::json toJson(const FacialSample& sample);
nlohmann::json toJson(const PhysiologicalSample& sample);
nlohmann::json toJson(const IntegratedState& state);
nlohmann::json toJson(const DissociationStatus& status);
nlohmann::json toJson(const DissociationEpisode& episode);
nlohmann::json toJson(const SafetyEvent& event);
nlohmann::json toJson(const CharacterAction& action);
nlohmann::json toJson(const TherapeuticResponse& response);
nlohmann::json toJson(const SessionMetrics& metrics);
nlohmann::json toJson(const TherapeuticSession& session, bool include_states = false);

/**
 * @brief Lit un échantillon facial reçu du bus de messages
 * @param received Horodatage appliqué à l'échantillon
 * @return nullopt si un champ obligatoire manque ou est invalide
 */
std::optional<FacialSample> facialSampleFromJson(const nlohmann::json& input, Timestamp received);

/**
 * @brief Lit un échantillon physiologique reçu du bus de messages
 */
std::optional<PhysiologicalSample> physiologicalSampleFromJson(const nlohmann::json& input,
                                                               Timestamp received);

} // namespace biomirror

#endif // BIOMIRROR_SERIALIZATION_HPP
