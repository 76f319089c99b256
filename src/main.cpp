/**
 * Electric Field Line Tracer
 *
 * Traces the field lines of a set of 2D point charges. The charges live in
 * an EnTT registry; the engine state (configuration, clock, charge-set
 * revision and the published field lines) lives in the registry context.
 *
 * Two modes are supported: "headless" loads the charges, traces once and
 * writes the result; "realtime" runs a fixed-rate loop in which charge
 * changes are picked up by the debounced recompute trigger, as an
 * interactive front end would drive it.
 *
 * Usage: field_lines [--realtime] [input_file [output_file [width height]]]
 */

#include <entt/entt.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "components.hpp"
#include "systems.hpp"

// --- Application Configuration ---

enum class AppMode {
    HEADLESS, // Trace once and exit
    REALTIME  // Fixed-rate loop with debounced recomputes
};

struct AppConfig {
    std::string input_file = "data/charges.txt";
    std::string output_file = "field_lines.dat";

    AppMode mode = AppMode::HEADLESS;
    EngineConfig engine;

    // --- Realtime-Mode-Only Settings ---
    double tick_hz = 60.0;      // Loop rate
    double drag_seconds = 2.0;  // Length of the scripted drag
    double drag_radius = 50.0;  // The first charge is dragged around this circle
};


// --- Application Class ---

/**
 * @brief Owns the charge registry and drives recomputation.
 */
class FieldLineApp {
public:
    FieldLineApp(const AppConfig& config) : m_config(config) {
        InitializeEngine(m_registry, m_config.engine);
    }

    bool Initialize() {
        std::cout << "Initializing field line engine..." << std::endl;
        if (!ValidateConfig(m_config.engine)) {
            return false;
        }
        std::cout << "Canvas: " << m_config.engine.bounds.width << "x"
                  << m_config.engine.bounds.height << ", "
                  << m_config.engine.seed.density << " lines per charge, "
                  << m_config.engine.seed.worker_threads << " worker thread(s)" << std::endl;
        return true;
    }

    bool Run() {
        if (!loadChargesFromFile(m_registry, m_config.input_file)) {
            std::cerr << "Failed to load charges. Exiting." << std::endl;
            return false;
        }

        if (m_config.mode == AppMode::HEADLESS) {
            RunHeadless();
        } else {
            RunRealtime();
        }
        return true;
    }

    bool Shutdown() {
        std::cout << "\nTracing finished." << std::endl;
        return writeFieldLines(m_registry, m_config.output_file);
    }

private:
    void RunHeadless() {
        std::cout << "Running in HEADLESS mode..." << std::endl;

        auto start = std::chrono::high_resolution_clock::now();
        if (!RecomputeFieldLinesSystem(m_registry)) {
            std::cerr << "Warning: Charge set changed during the pass, field lines not published."
                      << std::endl;
        }
        auto end = std::chrono::high_resolution_clock::now();

        std::chrono::duration<double> elapsed = end - start;
        std::cout << "Traced " << m_registry.ctx().get<FieldLineSet>().lines.size()
                  << " field lines in " << elapsed.count() << " seconds." << std::endl;
    }

    /**
     * @brief Fixed-rate loop. Input is polled every tick, recomputation
     * happens only once the charge set has been quiet for debounce_s.
     */
    void RunRealtime() {
        std::cout << "Running in REALTIME mode..." << std::endl;

        using clock = std::chrono::high_resolution_clock;
        const std::chrono::duration<double> tick(1.0 / m_config.tick_hz);
        const auto start = clock::now();

        m_drag_target = PickFirstCharge();
        if (m_drag_target != entt::null) {
            m_drag_origin = m_registry.get<Position>(m_drag_target).p;
        }

        // Run until the drag is over and the final set has been published.
        const double end_time = m_config.drag_seconds + m_config.engine.debounce_s;
        while (m_running) {
            auto tick_start = clock::now();
            std::chrono::duration<double> since_start = tick_start - start;
            m_registry.ctx().get<EngineClock>().current_time = since_start.count();

            HandleInput(since_start.count());

            if (RecomputeIfDue(m_registry)) {
                m_recomputes++;
                std::cout << "Published " << m_registry.ctx().get<FieldLineSet>().lines.size()
                          << " field lines (revision "
                          << m_registry.ctx().get<FieldLineSet>().revision << ")\r" << std::flush;
            }

            auto work_time = clock::now() - tick_start;
            if (work_time < tick) {
                std::this_thread::sleep_for(tick - work_time);
            }

            if (since_start.count() >= end_time && !m_registry.ctx().get<ChargeSetState>().dirty) {
                m_running = false;
            }
        }
        std::cout << "\n" << m_recomputes << " recompute(s) published." << std::endl;
    }

    /**
     * @brief Scripted input: drags the first charge once around a circle.
     */
    void HandleInput(double t) {
        if (m_drag_target == entt::null || t > m_config.drag_seconds) return;

        const double angle = 2.0 * PI * t / m_config.drag_seconds;
        MoveCharge(m_registry, m_drag_target,
                   m_drag_origin.x + m_config.drag_radius * (std::cos(angle) - 1.0),
                   m_drag_origin.y + m_config.drag_radius * std::sin(angle));
    }

    entt::entity PickFirstCharge() const {
        auto charges = SnapshotCharges(m_registry);
        if (charges.empty()) return entt::null;
        return PickCharge(m_registry, charges.front().position.x, charges.front().position.y);
    }

private:
    entt::registry m_registry;
    AppConfig m_config;
    bool m_running = true;
    int m_recomputes = 0;

    entt::entity m_drag_target = entt::null;
    Vec2 m_drag_origin;
};


// --- Main ---
int main(int argc, char** argv) {

    // --- Parameters ---
    AppConfig config;

    // == Trace once ==
    config.mode = AppMode::HEADLESS;
    config.engine.bounds = CanvasBounds{1000.0, 600.0};
    config.engine.seed.worker_threads = std::max(1u, std::thread::hardware_concurrency());

    // == Interactive-style loop (--realtime) ==
    config.engine.debounce_s = 0.3;
    config.drag_seconds = 2.0;

    int arg = 1;
    if (arg < argc && std::string(argv[arg]) == "--realtime") {
        config.mode = AppMode::REALTIME;
        arg++;
    }
    if (arg < argc) config.input_file = argv[arg];
    if (arg + 1 < argc) config.output_file = argv[arg + 1];
    if (arg + 3 < argc) {
        config.engine.bounds.width = std::atof(argv[arg + 2]);
        config.engine.bounds.height = std::atof(argv[arg + 3]);
    }

    // --- End Parameters ---

    FieldLineApp app(config);

    if (!app.Initialize()) return 1;
    if (!app.Run()) return 1;
    if (!app.Shutdown()) return 1;

    return 0;
}
