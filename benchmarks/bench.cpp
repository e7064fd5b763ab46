#include <chrono>
#include <cstdio>
#include <mecs/mecs.hpp>
#include <vector>

using namespace mecs;

// Simple benchmark components
struct Pos {
    float x, y, z;
    bool operator==(const Pos& o) const { return x == o.x && y == o.y && z == o.z; }
};
struct Vel {
    float dx, dy, dz;
    bool operator==(const Vel& o) const { return dx == o.dx && dy == o.dy && dz == o.dz; }
};
struct Mass {
    float value;
    bool operator==(const Mass& o) const { return value == o.value; }
};

std::ostream& operator<<(std::ostream& out, const Pos& p) {
    return out << p.x << ',' << p.y << ',' << p.z;
}
std::ostream& operator<<(std::ostream& out, const Vel& v) {
    return out << v.dx << ',' << v.dy << ',' << v.dz;
}
std::ostream& operator<<(std::ostream& out, const Mass& m) { return out << m.value; }

using Closed = VariantStorage<Pos, Vel, Mass>;

// Timer utility
struct Timer {
    using Clock = std::chrono::high_resolution_clock;
    Clock::time_point start;

    Timer() : start(Clock::now()) {}

    double elapsed_ms() const {
        auto end = Clock::now();
        return std::chrono::duration<double, std::milli>(end - start).count();
    }
};

// Every third entity has a Vel, every fifth a Mass.
template <typename S>
static Entity<S> make_bench_entity(size_t i) {
    Entity<S> e;
    e.emplace(Pos{1, 2, 3});
    if (i % 3 == 0)
        e.emplace(Vel{1, 1, 1});
    if (i % 5 == 0)
        e.emplace(Mass{10});
    return e;
}

template <typename S>
static void register_bench_preds(World<S>& w, size_t count) {
    for (size_t p = 0; p < count; ++p) {
        if (p % 2 == 0)
            w.add_pred([](const Entity<S>& e) { return e.template has<Vel>(); });
        else
            w.add_pred([](const Entity<S>& e) { return e.template has<Mass>(); });
    }
}

template <typename S>
static void bench_add(const char* label, size_t n, size_t preds) {
    World<S> w;
    register_bench_preds(w, preds);
    Timer t;
    for (size_t i = 0; i < n; ++i)
        w.add(make_bench_entity<S>(i));
    double ms = t.elapsed_ms();
    std::printf("  add %-8s %2zu preds   %zu entities: %.2f ms (%.0f ent/ms)\n", label, preds, n,
                ms, n / ms);
}

template <typename S>
static void bench_pred_vs_scan(const char* label, size_t n) {
    World<S> w;
    for (size_t i = 0; i < n; ++i)
        w.add(make_bench_entity<S>(i));
    PredicateId moving = w.add_pred([](const Entity<S>& e) { return e.template has<Vel>(); });

    Timer t;
    w.each_pred(moving, [](EntityId, Entity<S>& e) {
        Pos* p = e.template get<Pos>();
        const Vel* v = e.template get<Vel>();
        p->x += v->dx;
        p->y += v->dy;
        p->z += v->dz;
    });
    double pred_ms = t.elapsed_ms();

    Timer t2;
    w.each([](EntityId, Entity<S>& e) {
        const Vel* v = e.template get<Vel>();
        if (!v)
            return;
        Pos* p = e.template get<Pos>();
        p->x += v->dx;
        p->y += v->dy;
        p->z += v->dz;
    });
    double scan_ms = t2.elapsed_ms();

    std::printf("  %-8s %zu entities: predicate %.2f ms, full scan %.2f ms\n", label, n, pred_ms,
                scan_ms);
}

template <typename S>
static void bench_remove_and_sweep(const char* label, size_t n, size_t preds) {
    World<S> w;
    register_bench_preds(w, preds);
    std::vector<EntityId> ids;
    ids.reserve(n);
    for (size_t i = 0; i < n; ++i)
        ids.push_back(w.add(make_bench_entity<S>(i)));

    Timer t;
    for (size_t i = 0; i < n; i += 2)
        w.remove(ids[i]);
    double remove_ms = t.elapsed_ms();

    // Iterating turns the stale ids into tombstones; the next add compacts them.
    Timer t2;
    for (PredicateId pid = 1; pid <= preds; ++pid)
        w.count_pred(pid);
    w.add(make_bench_entity<S>(0));
    double sweep_ms = t2.elapsed_ms();

    std::printf("  %-8s %zu removes: %.2f ms, tombstone + sweep (%zu preds): %.2f ms\n", label,
                n / 2, remove_ms, preds, sweep_ms);
}

int main() {
    constexpr size_t N_SMALL = 100'000;
    constexpr size_t N_LARGE = 1'000'000;

    std::printf("=== mecs Benchmarks ===\n\n");

    std::printf("Insertion:\n");
    bench_add<DynStorage>("dyn", N_SMALL, 0);
    bench_add<DynStorage>("dyn", N_SMALL, 8);
    bench_add<Closed>("variant", N_SMALL, 0);
    bench_add<Closed>("variant", N_SMALL, 8);

    std::printf("\nPredicate Iteration vs Full Scan:\n");
    bench_pred_vs_scan<DynStorage>("dyn", N_LARGE);
    bench_pred_vs_scan<Closed>("variant", N_LARGE);

    std::printf("\nRemoval:\n");
    bench_remove_and_sweep<DynStorage>("dyn", N_SMALL, 4);
    bench_remove_and_sweep<Closed>("variant", N_SMALL, 4);

    std::printf("\nDone.\n");
    return 0;
}
