#ifndef SYSTEMS_HPP
#define SYSTEMS_HPP

#include "components.hpp"

#include <entt/entt.hpp>
#include <functional>
#include <string>
#include <thread>
#include <vector>

// Starts a worker thread running the given job. May throw std::system_error.
using WorkerLauncherFn = std::function<std::thread(std::function<void()>)>;

// --- System Declarations ---
// Systems are free functions that operate on the registry. Engine state
// (EngineConfig, EngineClock, ChargeSetState, FieldLineSet) lives in the
// registry's context and is set up by InitializeEngine.

/**
 * @brief Places the engine state in the registry context.
 * MUST be called before any other system.
 */
void InitializeEngine(entt::registry& registry, const EngineConfig& config = EngineConfig());

/**
 * @brief Checks a configuration for values the engine cannot work with.
 * Reports each problem on std::cerr.
 */
bool ValidateConfig(const EngineConfig& config);


// --- Charge Set Systems ---
// Every mutation bumps ChargeSetState::revision and marks the set dirty.

/**
 * @brief Places a charge of magnitude polarity * unit_charge.
 * Returns entt::null if polarity is 0 or the charge cap is reached.
 */
entt::entity PlaceCharge(entt::registry& registry, double x, double y, int polarity);

/**
 * @brief Places a charge with an explicit magnitude.
 * Returns entt::null if the charge cap is reached.
 */
entt::entity AddCharge(entt::registry& registry, double x, double y, double q);

/**
 * @brief Returns the first charge whose center is within charge_radius
 * of (x, y), or entt::null.
 */
entt::entity PickCharge(const entt::registry& registry, double x, double y);

/**
 * @brief Moves a charge. Returns false if the entity is not a charge.
 */
bool MoveCharge(entt::registry& registry, entt::entity charge, double x, double y);

void ClearCharges(entt::registry& registry);

/**
 * @brief Value snapshot of the charge set, in placement order.
 */
std::vector<PointCharge> SnapshotCharges(const entt::registry& registry);


// --- Field Line Collection ---

/**
 * @brief Seeds every charge with density traces on its charge_radius circle
 * and returns the lines with at least min_points points.
 * Positive charges are traced along the field, negative ones against it.
 * Output order is charge order, then seed angle, for any worker count.
 */
std::vector<FieldLine> RecomputeFieldLines(const std::vector<PointCharge>& charges,
                                           const CanvasBounds& bounds,
                                           const EngineConfig& config = EngineConfig());

/**
 * @brief Same, with worker threads started through `launch`.
 * Charges whose worker could not start or stopped early are traced on the
 * calling thread, so the result is the same as a sequential run.
 */
std::vector<FieldLine> RecomputeFieldLines(const std::vector<PointCharge>& charges,
                                           const CanvasBounds& bounds,
                                           const EngineConfig& config,
                                           const WorkerLauncherFn& launch);

/**
 * @brief Publishes a set of lines traced for the given charge-set revision.
 * A stale set (the charges changed since) is dropped and false is returned.
 */
bool PublishFieldLines(entt::registry& registry, std::vector<FieldLine> lines,
                       unsigned long revision);

/**
 * @brief Recomputes from the current charges and publishes immediately.
 */
bool RecomputeFieldLinesSystem(entt::registry& registry);

/**
 * @brief Recomputes once the charge set has been quiet for debounce_s.
 * Returns true if a new set was published.
 */
bool RecomputeIfDue(entt::registry& registry);


// --- Rendering Support ---

/**
 * @brief Arrow heads every `spacing` units of path length along a line.
 */
std::vector<ArrowHead> PlaceArrowHeads(const FieldLine& line, double spacing);

/**
 * @brief Polarity (+1/-1) of the charge the line starts from, found within
 * 1.5 * radius of the first point. Defaults to +1.
 */
int LineSourcePolarity(const FieldLine& line, const std::vector<PointCharge>& charges,
                       double radius);

const char* TerminationName(Termination termination);


// --- File I/O Systems ---

/**
 * @brief Loads charges from a text file: one "name x y q" per line.
 */
bool loadChargesFromFile(entt::registry& registry, const std::string& filename);

/**
 * @brief Writes the published field lines to an output file.
 */
bool writeFieldLines(const entt::registry& registry, const std::string& filename);


#endif // SYSTEMS_HPP
