#include "tracer.hpp"
#include "field.hpp"

#include <algorithm>

namespace {

bool IsOpposite(double q, int direction) {
    return direction > 0 ? q < 0.0 : q > 0.0;
}

} // namespace

bool InsideCanvas(const Vec2& p, const CanvasBounds& bounds) {
    return p.x >= 0.0 && p.x <= bounds.width && p.y >= 0.0 && p.y <= bounds.height;
}

double AdaptiveStep(double magnitude, const TraceParams& params) {
    double step = params.step_size * (1.0 - 1.0 / (magnitude / params.step_scale + 1.0));
    return std::max(step, params.min_step);
}

bool ReachesTarget(const Vec2& p, int direction,
                   const std::vector<PointCharge>& charges,
                   const TraceParams& params) {
    for (const auto& charge : charges) {
        double dist = Length(p - charge.position);
        if (dist < params.charge_radius && IsOpposite(charge.q, direction))
            return true;
        if (dist < params.catch_radius)
            return true;
    }
    return false;
}

FieldLine TraceFieldLine(const Vec2& seed, int direction,
                         const std::vector<PointCharge>& charges,
                         const CanvasBounds& bounds,
                         const FieldParams& field_params,
                         const TraceParams& trace_params) {
    FieldLine line;
    line.direction = direction;
    line.termination = Termination::StepLimit;
    line.points.reserve(64);
    line.points.push_back(seed);

    Vec2 p = seed;
    bool hit = false;

    for (std::size_t step = 0; step < trace_params.max_steps; ++step) {
        Vec2 e = EvaluateField(p, charges, field_params);
        double magnitude = Length(e);
        if (magnitude < trace_params.min_field) {
            line.termination = Termination::FieldVanished;
            break;
        }

        double h = AdaptiveStep(magnitude, trace_params);

        // Advance along the unit field direction.
        p += (e / magnitude) * (direction * h);

        if (!InsideCanvas(p, bounds)) {
            line.termination = Termination::LeftBounds;
            break;
        }

        line.points.push_back(p);

        if (ReachesTarget(p, direction, charges, trace_params)) {
            line.termination = Termination::HitCharge;
            hit = true;
            break;
        }
    }

    // Anchor the line on the body of the charge it ran into.
    if (hit && line.points.size() >= 2) {
        for (const auto& charge : charges) {
            if (Length(p - charge.position) < trace_params.charge_radius) {
                line.points.push_back(charge.position);
                break;
            }
        }
    }

    return line;
}
