#include "systems.hpp"
#include "field.hpp"
#include "tracer.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

namespace {

// Records a mutation of the charge set at the current engine time.
void MarkChargesChanged(entt::registry& registry) {
    auto& state = registry.ctx().get<ChargeSetState>();
    state.revision++;
    state.dirty = true;
    state.last_change_s = registry.ctx().get<EngineClock>().current_time;
}

// All lines seeded around one charge, short ones included.
std::vector<FieldLine> TraceAroundCharge(const PointCharge& source,
                                         const std::vector<PointCharge>& charges,
                                         const CanvasBounds& bounds,
                                         const EngineConfig& config) {
    std::vector<FieldLine> lines;
    // A neutral charge has no field lines of its own.
    if (source.q == 0.0) return lines;

    const int direction = source.q > 0.0 ? 1 : -1;
    const std::size_t density = config.seed.density;
    const double radius = config.trace.charge_radius;

    lines.reserve(density);
    for (std::size_t i = 0; i < density; ++i) {
        double angle = (i * 2.0 * PI) / density;
        Vec2 seed{source.position.x + radius * std::cos(angle),
                  source.position.y + radius * std::sin(angle)};
        // Seeds off the canvas would put their first point outside it.
        if (!InsideCanvas(seed, bounds)) continue;
        lines.push_back(TraceFieldLine(seed, direction, charges, bounds,
                                       config.field, config.trace));
    }
    return lines;
}

} // namespace


void InitializeEngine(entt::registry& registry, const EngineConfig& config) {
    registry.ctx().emplace<EngineConfig>(config);
    registry.ctx().emplace<EngineClock>();
    registry.ctx().emplace<ChargeSetState>();
    registry.ctx().emplace<FieldLineSet>();
}

bool ValidateConfig(const EngineConfig& config) {
    bool ok = true;
    if (!(config.bounds.width > 0.0) || !(config.bounds.height > 0.0)) {
        std::cerr << "Error: Canvas size must be positive, got "
                  << config.bounds.width << "x" << config.bounds.height << std::endl;
        ok = false;
    }
    if (config.seed.density == 0) {
        std::cerr << "Error: Field line density must be at least 1." << std::endl;
        ok = false;
    }
    if (!(config.field.singularity_radius > 0.0)) {
        std::cerr << "Error: Singularity radius must be positive." << std::endl;
        ok = false;
    }
    if (!(config.trace.min_step > 0.0) || config.trace.step_size < config.trace.min_step) {
        std::cerr << "Error: Step sizes must satisfy 0 < min_step <= step_size." << std::endl;
        ok = false;
    }
    if (!(config.trace.step_scale > 0.0)) {
        std::cerr << "Error: Step scale must be positive." << std::endl;
        ok = false;
    }
    if (config.seed.worker_threads == 0) {
        std::cerr << "Error: At least one worker thread is required." << std::endl;
        ok = false;
    }
    if (config.debounce_s < 0.0) {
        std::cerr << "Error: Debounce delay cannot be negative." << std::endl;
        ok = false;
    }
    return ok;
}


// --- Charge Set Systems ---

entt::entity PlaceCharge(entt::registry& registry, double x, double y, int polarity) {
    if (polarity == 0) return entt::null;
    const auto& config = registry.ctx().get<EngineConfig>();
    return AddCharge(registry, x, y, (polarity > 0 ? 1.0 : -1.0) * config.unit_charge);
}

entt::entity AddCharge(entt::registry& registry, double x, double y, double q) {
    const auto& config = registry.ctx().get<EngineConfig>();
    if (config.max_charges != 0 && registry.view<Charge>().size() >= config.max_charges) {
        std::cerr << "Warning: Charge limit of " << config.max_charges
                  << " reached, ignoring new charge." << std::endl;
        return entt::null;
    }

    auto& state = registry.ctx().get<ChargeSetState>();
    auto entity = registry.create();
    registry.emplace<Position>(entity, Vec2{x, y});
    registry.emplace<Charge>(entity, q);
    registry.emplace<Placement>(entity, state.next_order++);

    MarkChargesChanged(registry);
    return entity;
}

entt::entity PickCharge(const entt::registry& registry, double x, double y) {
    const double radius = registry.ctx().get<EngineConfig>().trace.charge_radius;

    entt::entity picked = entt::null;
    unsigned long picked_order = 0;

    auto view = registry.view<const Position, const Charge, const Placement>();
    for (auto entity : view) {
        const auto& pos = view.get<const Position>(entity);
        const auto& placement = view.get<const Placement>(entity);
        if (std::hypot(x - pos.p.x, y - pos.p.y) >= radius) continue;

        // First in placement order wins when charges overlap.
        if (picked == entt::null || placement.order < picked_order) {
            picked = entity;
            picked_order = placement.order;
        }
    }
    return picked;
}

bool MoveCharge(entt::registry& registry, entt::entity charge, double x, double y) {
    if (!registry.valid(charge) || !registry.all_of<Position, Charge>(charge)) {
        return false;
    }
    registry.get<Position>(charge).p = Vec2{x, y};
    MarkChargesChanged(registry);
    return true;
}

void ClearCharges(entt::registry& registry) {
    auto view = registry.view<Charge>();
    std::vector<entt::entity> doomed(view.begin(), view.end());
    for (auto entity : doomed) {
        registry.destroy(entity);
    }
    MarkChargesChanged(registry);
}

std::vector<PointCharge> SnapshotCharges(const entt::registry& registry) {
    std::vector<std::pair<unsigned long, PointCharge>> ordered;

    auto view = registry.view<const Position, const Charge, const Placement>();
    for (auto entity : view) {
        const auto& pos = view.get<const Position>(entity);
        const auto& charge = view.get<const Charge>(entity);
        const auto& placement = view.get<const Placement>(entity);
        ordered.emplace_back(placement.order, PointCharge{pos.p, charge.q});
    }

    std::sort(ordered.begin(), ordered.end(),
              [](const std::pair<unsigned long, PointCharge>& a,
                 const std::pair<unsigned long, PointCharge>& b) {
                  return a.first < b.first;
              });

    std::vector<PointCharge> charges;
    charges.reserve(ordered.size());
    for (const auto& entry : ordered) {
        charges.push_back(entry.second);
    }
    return charges;
}


// --- Field Line Collection ---

std::vector<FieldLine> RecomputeFieldLines(const std::vector<PointCharge>& charges,
                                           const CanvasBounds& bounds,
                                           const EngineConfig& config) {
    return RecomputeFieldLines(charges, bounds, config,
                               [](std::function<void()> job) { return std::thread(std::move(job)); });
}

std::vector<FieldLine> RecomputeFieldLines(const std::vector<PointCharge>& charges,
                                           const CanvasBounds& bounds,
                                           const EngineConfig& config,
                                           const WorkerLauncherFn& launch) {
    // One slot per source charge so the output order never depends on
    // which worker finished first.
    std::vector<std::vector<FieldLine>> per_charge(charges.size());
    std::vector<char> traced(charges.size(), 0);

    const unsigned workers = std::max(1u, std::min<unsigned>(
        config.seed.worker_threads, static_cast<unsigned>(charges.size())));

    if (workers > 1) {
        // Traces share no mutable state; each worker fills its own slots.
        // A worker that fails leaves its remaining slots untraced.
        std::vector<std::thread> pool;
        pool.reserve(workers);
        try {
            for (unsigned w = 0; w < workers; ++w) {
                pool.push_back(launch([&, w]() {
                    try {
                        for (std::size_t i = w; i < charges.size(); i += workers) {
                            per_charge[i] = TraceAroundCharge(charges[i], charges, bounds, config);
                            traced[i] = 1;
                        }
                    } catch (const std::exception& e) {
                        std::cerr << "Warning: Worker " << w << " stopped: " << e.what()
                                  << ", tracing its charges on the calling thread." << std::endl;
                    }
                }));
            }
        } catch (const std::system_error& e) {
            std::cerr << "Warning: Could not start worker " << pool.size() << ": " << e.what()
                      << ", continuing with " << pool.size() << " worker(s)." << std::endl;
        }
        for (auto& worker : pool) {
            if (worker.joinable()) worker.join();
        }
    }

    // Whatever no worker finished is traced here.
    for (std::size_t i = 0; i < charges.size(); ++i) {
        if (traced[i]) continue;
        per_charge[i] = TraceAroundCharge(charges[i], charges, bounds, config);
    }

    std::vector<FieldLine> lines;
    for (auto& group : per_charge) {
        for (auto& line : group) {
            if (line.points.size() < config.seed.min_points) continue;
            lines.push_back(std::move(line));
        }
    }
    return lines;
}

bool PublishFieldLines(entt::registry& registry, std::vector<FieldLine> lines,
                       unsigned long revision) {
    auto& state = registry.ctx().get<ChargeSetState>();
    if (revision != state.revision) {
        // The charges moved on while these lines were traced.
        return false;
    }

    auto& published = registry.ctx().get<FieldLineSet>();
    published.lines.swap(lines);
    published.revision = revision;
    state.dirty = false;
    return true;
}

bool RecomputeFieldLinesSystem(entt::registry& registry) {
    const auto& config = registry.ctx().get<EngineConfig>();
    const unsigned long revision = registry.ctx().get<ChargeSetState>().revision;

    auto lines = RecomputeFieldLines(SnapshotCharges(registry), config.bounds, config);
    return PublishFieldLines(registry, std::move(lines), revision);
}

bool RecomputeIfDue(entt::registry& registry) {
    const auto& state = registry.ctx().get<ChargeSetState>();
    if (!state.dirty) return false;

    const double now = registry.ctx().get<EngineClock>().current_time;
    const double debounce = registry.ctx().get<EngineConfig>().debounce_s;
    if (now - state.last_change_s < debounce) return false;

    return RecomputeFieldLinesSystem(registry);
}


// --- Rendering Support ---

std::vector<ArrowHead> PlaceArrowHeads(const FieldLine& line, double spacing) {
    std::vector<ArrowHead> heads;
    if (!(spacing > 0.0)) return heads;

    double accumulated = 0.0;
    for (std::size_t i = 1; i < line.points.size(); ++i) {
        const Vec2& prev = line.points[i - 1];
        const Vec2& curr = line.points[i];
        Vec2 d = curr - prev;
        double segment = Length(d);
        if (segment == 0.0) continue;

        accumulated += segment;
        if (accumulated >= spacing) {
            // Fraction of this segment at which the spacing is reached
            double t = (spacing - (accumulated - segment)) / segment;
            heads.push_back(ArrowHead{prev.x + d.x * t, prev.y + d.y * t,
                                      d.x / segment, d.y / segment});
            accumulated = 0.0;
        }
    }
    return heads;
}

int LineSourcePolarity(const FieldLine& line, const std::vector<PointCharge>& charges,
                       double radius) {
    if (line.points.empty()) return 1;

    const Vec2& start = line.points.front();
    for (const auto& charge : charges) {
        if (Length(start - charge.position) < 1.5 * radius) {
            return charge.q < 0.0 ? -1 : 1;
        }
    }
    return 1;
}

const char* TerminationName(Termination termination) {
    switch (termination) {
        case Termination::StepLimit: return "step_limit";
        case Termination::FieldVanished: return "field_vanished";
        case Termination::LeftBounds: return "left_bounds";
        case Termination::HitCharge: return "hit_charge";
    }
    return "unknown";
}


// --- File I/O Systems ---

bool loadChargesFromFile(entt::registry& registry, const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open input file: " << filename << std::endl;
        return false;
    }

    std::cout << "Loading charges from " << filename << "..." << std::endl;
    std::string line;
    int count = 0;
    while (std::getline(file, line)) {
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::stringstream ss(line);
        std::string name;
        double x, y, q;

        if (ss >> name >> x >> y >> q) {
            auto entity = AddCharge(registry, x, y, q);
            if (entity == entt::null) {
                std::cerr << "Warning: Skipping charge " << name << std::endl;
                continue;
            }
            registry.emplace<Name>(entity, name);

            std::cout << "  Loaded: " << name << " (q: " << q << " C at "
                      << x << ", " << y << ")" << std::endl;
            count++;
        } else {
            std::cerr << "Warning: Skipping malformed line: " << line << std::endl;
        }
    }
    std::cout << "Loaded " << count << " charges." << std::endl;
    return true;
}

bool writeFieldLines(const entt::registry& registry, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open output file: " << filename << std::endl;
        return false;
    }

    const auto& published = registry.ctx().get<FieldLineSet>();
    const auto& config = registry.ctx().get<EngineConfig>();
    const auto charges = SnapshotCharges(registry);

    std::cout << "Writing " << published.lines.size() << " field lines to "
              << filename << "..." << std::endl;
    // Use high precision for output data
    file << std::fixed << std::setprecision(6);

    std::size_t index = 0;
    for (const auto& line : published.lines) {
        file << "FieldLine: " << index++ << "\n";
        file << "Direction: " << line.direction << "\n";
        file << "Polarity: "
             << LineSourcePolarity(line, charges, config.trace.charge_radius) << "\n";
        file << "Termination: " << TerminationName(line.termination) << "\n";
        file << "Points:\n";
        for (const auto& p : line.points) {
            file << p.x << ", " << p.y << "\n";
        }
        file << "Arrows:\n";
        for (const auto& head : PlaceArrowHeads(line, config.arrow_spacing)) {
            file << head.x << ", " << head.y << ", " << head.dx << ", " << head.dy << "\n";
        }
        file << "EndLine\n\n";
    }
    std::cout << "Output file written." << std::endl;
    return true;
}
