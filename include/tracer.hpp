#ifndef TRACER_HPP
#define TRACER_HPP

#include "components.hpp"

#include <vector>

// --- Streamline Tracer ---

/**
 * @brief Traces one field line from a seed point.
 * Steps along the normalized local field (direction +1) or against it
 * (direction -1) with a step length that shrinks in strong fields:
 *   step = max(step_size * (1 - 1/(|E|/step_scale + 1)), min_step)
 * Stops when the step cap is reached, the field vanishes, the next point
 * leaves the canvas, or the line reaches a target charge. On a hit the
 * center of the reached charge is appended as the last point.
 *
 * Every returned line holds the seed plus at most max_steps + 1 points.
 */
FieldLine TraceFieldLine(const Vec2& seed, int direction,
                         const std::vector<PointCharge>& charges,
                         const CanvasBounds& bounds,
                         const FieldParams& field_params = FieldParams(),
                         const TraceParams& trace_params = TraceParams());

bool InsideCanvas(const Vec2& p, const CanvasBounds& bounds);

/**
 * @brief Adaptive step length for a given field magnitude.
 */
double AdaptiveStep(double magnitude, const TraceParams& params);

/**
 * @brief True if p ends a line traced in `direction`: within charge_radius
 * of a charge of opposite polarity, or within catch_radius of any charge.
 */
bool ReachesTarget(const Vec2& p, int direction,
                   const std::vector<PointCharge>& charges,
                   const TraceParams& params);


#endif // TRACER_HPP
