#ifndef FIELD_HPP
#define FIELD_HPP

#include "components.hpp"

#include <vector>

// --- Field Evaluation ---

/**
 * @brief Electric field at a point from a set of point charges.
 * Sums k*q/r^2 along the unit displacement for every charge at least
 * params.singularity_radius away from the point. Charges closer than
 * that are left out of the sum entirely.
 */
Vec2 EvaluateField(const Vec2& point, const std::vector<PointCharge>& charges,
                   const FieldParams& params = FieldParams());

/**
 * @brief Direct field query for overlays. Same as EvaluateField.
 */
Vec2 FieldAt(const Vec2& point, const std::vector<PointCharge>& charges,
             const FieldParams& params = FieldParams());

double Length(const Vec2& v);


#endif // FIELD_HPP
