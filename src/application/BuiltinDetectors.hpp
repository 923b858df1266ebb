/**
 * @file BuiltinDetectors.hpp
 * @brief The detectors shipped with the engine.
 */

#pragma once

#include "application/DetectorRegistry.hpp"

namespace notedrift::application {

/**
 * @brief Registers drift_velocity_anomaly, bridge_hunter, cluster_migration
 *        and trajectory_reversal.
 */
void RegisterBuiltinDetectors(DetectorRegistry& registry);

namespace detectors {

std::vector<domain::Suggestion> DriftVelocityAnomaly(const SessionHandle& handle);
std::vector<domain::Suggestion> BridgeHunter(const SessionHandle& handle);
std::vector<domain::Suggestion> ClusterMigrationDetector(const SessionHandle& handle);
std::vector<domain::Suggestion> TrajectoryReversalDetector(const SessionHandle& handle);

} // namespace detectors

} // namespace notedrift::application
