#include "field.hpp"

#include <cmath>

double Length(const Vec2& v) {
    return std::sqrt(v.x * v.x + v.y * v.y);
}

Vec2 EvaluateField(const Vec2& point, const std::vector<PointCharge>& charges,
                   const FieldParams& params) {
    Vec2 e;

    for (const auto& charge : charges) {
        // Vector from the charge to the query point
        Vec2 d = point - charge.position;
        double r = Length(d);

        // Inside the near field the inverse-square law blows up; skip it.
        if (r < params.singularity_radius) continue;

        // E = k * q / r^2, directed along d / r
        double e_mag = params.coulomb_k * charge.q / (r * r);
        e.x += e_mag * (d.x / r);
        e.y += e_mag * (d.y / r);
    }

    return e;
}

Vec2 FieldAt(const Vec2& point, const std::vector<PointCharge>& charges,
             const FieldParams& params) {
    return EvaluateField(point, charges, params);
}
