#include <mecs/mecs.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

// ---------------------------------------------------------------------------
// Harness-local components
// ---------------------------------------------------------------------------

struct Position {
    float x, y;
};

struct Velocity {
    float vx, vy;
};

struct Lifetime {
    int frames_left;
};

struct Orbital {
    float speed;
    float angle;
};

std::ostream& operator<<(std::ostream& out, const Position& p) {
    return out << p.x << ',' << p.y;
}
std::ostream& operator<<(std::ostream& out, const Velocity& v) {
    return out << v.vx << ',' << v.vy;
}
std::ostream& operator<<(std::ostream& out, const Lifetime& l) { return out << l.frames_left; }
std::ostream& operator<<(std::ostream& out, const Orbital& o) { return out << o.speed; }

using Storage = mecs::DynStorage;
using World = mecs::World<Storage>;
using Entity = mecs::Entity<Storage>;

// ---------------------------------------------------------------------------
// Stress modes
// ---------------------------------------------------------------------------

enum class StressMode { STEADY, CHURN, BURST, COUNT };

static const char* mode_names[] = {"Steady", "Churn", "Burst"};

// ---------------------------------------------------------------------------
// Per-phase timing with EMA smoothing
// ---------------------------------------------------------------------------

struct Timings {
    double spawn_ms = 0.0;
    double systems_ms = 0.0;
    double reap_ms = 0.0;

    void update(double spawn, double systems, double reap) {
        constexpr double alpha = 0.05;
        spawn_ms += alpha * (spawn - spawn_ms);
        systems_ms += alpha * (systems - systems_ms);
        reap_ms += alpha * (reap - reap_ms);
    }
};

struct Clock {
    using C = std::chrono::steady_clock;
    static double now_ms() {
        return std::chrono::duration<double, std::milli>(C::now().time_since_epoch()).count();
    }
};

// ---------------------------------------------------------------------------
// Globals
// ---------------------------------------------------------------------------

static World world;
static Timings timings;
static std::vector<mecs::EntityId> live_ids;

static mecs::PredicateId moving_pred = 0;
static mecs::PredicateId mortal_pred = 0;
static mecs::PredicateId orbital_pred = 0;

static float randf() { return static_cast<float>(rand()) / static_cast<float>(RAND_MAX); }

// ---------------------------------------------------------------------------
// Spawning / reaping
// ---------------------------------------------------------------------------

static void spawn_one() {
    Entity e;
    e.emplace(Position{randf() * 100.0f, randf() * 100.0f});
    if (rand() % 2 == 0)
        e.emplace(Velocity{randf() - 0.5f, randf() - 0.5f});
    if (rand() % 3 == 0)
        e.emplace(Lifetime{1 + rand() % 120});
    if (rand() % 7 == 0)
        e.emplace(Orbital{randf(), 0.0f});
    live_ids.push_back(world.add(std::move(e)));
}

static void remove_random(int count) {
    for (int i = 0; i < count && !live_ids.empty(); ++i) {
        size_t slot = static_cast<size_t>(rand()) % live_ids.size();
        world.remove(live_ids[slot]);
        live_ids[slot] = live_ids.back();
        live_ids.pop_back();
    }
}

static void spawn_for_mode(StressMode mode, int frame) {
    switch (mode) {
    case StressMode::STEADY:
        for (int i = 0; i < 20; ++i)
            spawn_one();
        break;
    case StressMode::CHURN:
        for (int i = 0; i < 50; ++i)
            spawn_one();
        remove_random(50);
        break;
    case StressMode::BURST:
        if (frame % 30 == 0) {
            for (int i = 0; i < 2000; ++i)
                spawn_one();
        }
        break;
    case StressMode::COUNT:
        break;
    }
}

// Expired entities are collected during iteration and removed afterwards.
static void reap_expired() {
    std::vector<mecs::EntityId> expired;
    world.each_pred(mortal_pred, [&](mecs::EntityId id, const Entity& e) {
        if (e.get<Lifetime>()->frames_left <= 0)
            expired.push_back(id);
    });
    for (mecs::EntityId id : expired) {
        world.remove(id);
        live_ids.erase(std::find(live_ids.begin(), live_ids.end(), id));
    }
}

// ---------------------------------------------------------------------------
// Systems
// ---------------------------------------------------------------------------

static void motion_system(World& w) {
    w.each_pred(moving_pred, [](mecs::EntityId, Entity& e) {
        Position* p = e.get<Position>();
        const Velocity* v = e.get<Velocity>();
        p->x += v->vx;
        p->y += v->vy;
    });
}

static void orbit_system(World& w) {
    w.each_pred(orbital_pred, [](mecs::EntityId, Entity& e) {
        e.get<Orbital>()->angle += e.get<Orbital>()->speed * 0.016f;
    });
}

static void lifetime_system(World& w) {
    w.each_pred(mortal_pred, [](mecs::EntityId, Entity& e) { --e.get<Lifetime>()->frames_left; });
}

// ---------------------------------------------------------------------------
// Verification
// ---------------------------------------------------------------------------

// Predicate iteration must visit exactly the live entities a full scan would match.
template <typename Func>
static bool cross_check(mecs::PredicateId pid, Func&& matches) {
    std::vector<mecs::EntityId> via_pred;
    world.each_pred(pid, [&](mecs::EntityId id, const Entity&) { via_pred.push_back(id); });

    std::vector<mecs::EntityId> via_scan;
    world.each([&](mecs::EntityId id, const Entity& e) {
        if (matches(e))
            via_scan.push_back(id);
    });

    std::sort(via_pred.begin(), via_pred.end());
    std::sort(via_scan.begin(), via_scan.end());
    return via_pred == via_scan;
}

static bool verify() {
    bool ok = true;
    ok = ok && cross_check(moving_pred, [](const Entity& e) {
             return e.has<Position>() && e.has<Velocity>();
         });
    ok = ok && cross_check(mortal_pred, [](const Entity& e) { return e.has<Lifetime>(); });
    ok = ok && cross_check(orbital_pred, [](const Entity& e) { return e.has<Orbital>(); });
    return ok;
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main(int argc, char** argv) {
    srand(42);
    int frames_per_mode = argc > 1 ? std::atoi(argv[1]) : 300;
    if (frames_per_mode <= 0) {
        std::fprintf(stderr, "usage: %s [frames_per_mode]\n", argv[0]);
        return 1;
    }

    moving_pred = world.add_pred([](const Entity& e) {
        return e.has<Position>() && e.has<Velocity>();
    });
    mortal_pred = world.add_pred([](const Entity& e) { return e.has<Lifetime>(); });
    orbital_pred = world.add_pred([](const Entity& e) { return e.has<Orbital>(); });

    mecs::SystemRegistry<Storage> systems;
    systems.add("motion", motion_system);
    systems.add("orbit", orbit_system);
    systems.add("lifetime", lifetime_system);

    std::printf("=== mecs Stress Harness ===\n");
    for (int m = 0; m < static_cast<int>(StressMode::COUNT); ++m) {
        StressMode mode = static_cast<StressMode>(m);
        for (int frame = 0; frame < frames_per_mode; ++frame) {
            double t0 = Clock::now_ms();
            spawn_for_mode(mode, frame);
            double t1 = Clock::now_ms();
            systems.run_all(world);
            double t2 = Clock::now_ms();
            reap_expired();
            double t3 = Clock::now_ms();
            timings.update(t1 - t0, t2 - t1, t3 - t2);
        }

        if (!verify()) {
            std::fprintf(stderr, "Mode %s: predicate results diverge from full scan\n",
                         mode_names[m]);
            return 1;
        }
        std::printf("Mode: %-7s entities: %6zu  spawn %.3f ms  systems %.3f ms  reap %.3f ms\n",
                    mode_names[m], world.size(), timings.spawn_ms, timings.systems_ms,
                    timings.reap_ms);
    }

    std::printf("Done.\n");
    return 0;
}
