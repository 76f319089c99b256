#ifndef COMPONENTS_HPP
#define COMPONENTS_HPP

#include <cstddef>
#include <string>
#include <vector>

// --- Constants ---
// Coulomb constant (N m^2 C^-2)
constexpr double COULOMB_K = 8.988e9;

constexpr double PI = 3.14159265358979323846;

// Magnitude given to a charge placed by polarity alone (Coulomb)
constexpr double UNIT_CHARGE = 1e-6;


// --- Helper: 2D Vector ---
struct Vec2 {
    double x = 0.0, y = 0.0;

    Vec2& operator+=(const Vec2& rhs) {
        x += rhs.x; y += rhs.y;
        return *this;
    }
    Vec2& operator-=(const Vec2& rhs) {
        x -= rhs.x; y -= rhs.y;
        return *this;
    }
    Vec2& operator*=(double scalar) {
        x *= scalar; y *= scalar;
        return *this;
    }
    Vec2& operator/=(double scalar) {
        x /= scalar; y /= scalar;
        return *this;
    }
};

// Non-member operators
inline Vec2 operator+(Vec2 lhs, const Vec2& rhs) { return lhs += rhs; }
inline Vec2 operator-(Vec2 lhs, const Vec2& rhs) { return lhs -= rhs; }
inline Vec2 operator*(Vec2 lhs, double scalar) { return lhs *= scalar; }
inline Vec2 operator*(double scalar, Vec2 rhs) { return rhs *= scalar; }
inline Vec2 operator/(Vec2 lhs, double scalar) { return lhs /= scalar; }

inline bool operator==(const Vec2& lhs, const Vec2& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y;
}
inline bool operator!=(const Vec2& lhs, const Vec2& rhs) { return !(lhs == rhs); }


// --- Components ---
// Components are simple data-only structs. A charge is an entity with
// a Position and a Charge; the entity handle is its identity.

struct Position { Vec2 p; };
struct Charge { double q; };
struct Name { std::string name; };
struct Placement { unsigned long order; }; // Creation order within the set


// --- Value types used by the numeric core ---

// Snapshot of one charge, detached from the registry.
struct PointCharge {
    Vec2 position;
    double q = 0.0;
};

struct CanvasBounds {
    double width = 1000.0;
    double height = 600.0;
};

// How a trace ended.
enum class Termination {
    StepLimit,
    FieldVanished,
    LeftBounds,
    HitCharge
};

struct FieldLine {
    std::vector<Vec2> points;
    int direction = 1;   // +1 traced along E, -1 against it
    Termination termination = Termination::StepLimit;
};

// Arrow head at (x, y) pointing along the unit vector (dx, dy).
struct ArrowHead {
    double x, y, dx, dy;
};


// --- Tunable parameters ---

struct FieldParams {
    double coulomb_k = COULOMB_K;
    // Charges closer than this to the query point are skipped entirely.
    double singularity_radius = 5.0;
};

struct TraceParams {
    double step_size = 3.0;     // Nominal step in weak fields
    double min_step = 0.5;
    double step_scale = 1000.0; // Field magnitude at which the step is half nominal
    std::size_t max_steps = 2000;
    double min_field = 1e-3;    // Below this the field has vanished
    double charge_radius = 20.0;
    double catch_radius = 15.0; // Hit radius for charges of either sign
};

struct SeedParams {
    std::size_t density = 24;    // Seeds per charge
    std::size_t min_points = 6;  // Shorter lines are dropped
    unsigned worker_threads = 1; // 1 = trace on the calling thread
};

struct EngineConfig {
    FieldParams field;
    TraceParams trace;
    SeedParams seed;
    CanvasBounds bounds;

    std::size_t max_charges = 0; // 0 = unlimited
    double unit_charge = UNIT_CHARGE;
    double debounce_s = 0.3;     // Quiet period before a recompute
    double arrow_spacing = 60.0;
};


// --- Global Engine State ---
// Stored in the registry's "context" via registry.ctx().

// Wall-clock time as seen by the engine, advanced by the application.
struct EngineClock {
    double current_time = 0.0;
};

// Bumped on every mutation of the charge set.
struct ChargeSetState {
    unsigned long revision = 0;
    unsigned long next_order = 0;
    double last_change_s = 0.0;
    bool dirty = false;
};

// The published field lines. Replaced as a whole, never edited in place.
struct FieldLineSet {
    std::vector<FieldLine> lines;
    unsigned long revision = 0; // Charge-set revision the lines were traced for
};


#endif // COMPONENTS_HPP
