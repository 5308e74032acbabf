// Randomized checks: lattice laws, combinator bounds, resolution on large graphs.
// Fixed seeds, so every run checks the same cases.

#include <pramana/pramana.hpp>
#include <algorithm>
#include <iostream>
#include <cassert>
#include <cmath>
#include <random>
#include <string>
#include <vector>

using namespace pramana;

class ValueGen {
public:
    explicit ValueGen(uint64_t seed) : rng_(seed) {}

    // Coarse grid and small label sets so ties are common
    double unit() { return static_cast<double>(pick(11)) / 10.0; }

    size_t pick(size_t n) { return std::uniform_int_distribution<size_t>(0, n - 1)(rng_); }

    ConfidenceValue any() {
        static const char* labels[] = {"", "a", "b"};
        switch (pick(5)) {
            case 0:
                return ConfidenceValue::absent(static_cast<AbsentReason>(pick(3)));
            case 1: {
                double lo = unit(), hi = unit();
                if (lo > hi) std::swap(lo, hi);
                return ConfidenceValue::bounded(lo, hi, static_cast<BoundBasis>(pick(4)),
                                                labels[pick(3)]);
            }
            case 2:
                return ConfidenceValue::derived(unit(), pick(2) ? "min(a, b)" : "product(a, b)", {},
                                                static_cast<CalibrationStatus>(pick(3)));
            case 3: {
                double v = unit();
                double lo = unit(), hi = unit();
                if (lo > hi) std::swap(lo, hi);
                return ConfidenceValue::measured(v, labels[pick(3)], pick(3) * 50, unit(), lo, hi);
            }
            default:
                return ConfidenceValue::deterministic(pick(2) == 1, labels[pick(3)]);
        }
    }

    ConfidenceValue numeric() {
        ConfidenceValue v = any();
        while (v.is_absent()) v = any();
        return v;
    }

private:
    std::mt19937_64 rng_;
};

void test_lattice_laws() {
    std::cout << "Testing lattice laws on random values..." << std::endl;

    ValueGen gen(0x5EED);
    for (int i = 0; i < 5000; ++i) {
        ConfidenceValue a = gen.any();
        ConfidenceValue b = gen.any();
        ConfidenceValue c = gen.any();

        // Commutativity
        assert(meet(a, b) == meet(b, a));
        assert(join(a, b) == join(b, a));

        // Associativity
        assert(meet(meet(a, b), c) == meet(a, meet(b, c)));
        assert(join(join(a, b), c) == join(a, join(b, c)));

        // Idempotence
        assert(meet(a, a) == a);
        assert(join(a, a) == a);

        // Absorption
        assert(meet(a, join(a, b)) == a);
        assert(join(a, meet(a, b)) == a);

        // Bounds
        assert(meet(a, top()) == a);
        assert(join(a, bottom()) == a);
        assert(meet(a, bottom()) == bottom());
        assert(join(a, top()) == top());

        // Order agrees with equality and is antisymmetric
        assert((compare(a, b) == 0) == (a == b));
        assert(compare(a, b) == -compare(b, a));
        assert(compare(meet(a, b), a) <= 0 && compare(meet(a, b), b) <= 0);
        assert(compare(join(a, b), a) >= 0 && compare(join(a, b), b) >= 0);
    }

    std::cout << "  PASS" << std::endl;
}

void test_combinator_bounds() {
    std::cout << "Testing combinator bounds on random inputs..." << std::endl;

    const double eps = 1e-12;
    ValueGen gen(0xB0B);
    for (int i = 0; i < 2000; ++i) {
        ConfidenceValue a = gen.numeric();
        ConfidenceValue b = gen.numeric();
        double x = *a.conservative_value();
        double y = *b.conservative_value();

        DeriveResult p = product(a, b);
        assert(p.ok());
        double pv = *p.value->point_value();
        assert(pv >= 0.0 && pv <= std::min(x, y));

        DeriveResult o = join_independent(a, b);
        assert(o.ok());
        double ov = *o.value->point_value();
        assert(ov <= 1.0 && ov + eps >= std::max(x, y));

        DeriveResult s = sequence({a, b});
        assert(s.ok());
        assert(*s.value->point_value() == std::min(x, y));

        DeriveResult n = complement(a);
        assert(n.ok());
        DeriveResult nn = complement(*n.value);
        assert(nn.ok());
        assert(std::abs(*nn.value->point_value() - x) <= eps);

        // Every builder result checks out
        assert(DerivationBuilder::verify(*p.value));
        assert(DerivationBuilder::verify(*nn.value));
    }

    std::cout << "  PASS" << std::endl;
}

void test_random_graphs() {
    std::cout << "Testing resolution on random attack graphs..." << std::endl;

    ValueGen gen(0xA77AC4);
    size_t with_undecided = 0;
    for (int round = 0; round < 40; ++round) {
        size_t total = 2 + gen.pick(999);
        size_t claims = 1 + total / 5;
        size_t defeaters = total - claims;
        if (defeaters == 0) continue;

        AttackGraph::Builder builder;
        for (size_t i = 0; i < claims; ++i) {
            Claim c;
            c.id = "c" + std::to_string(i);
            c.confidence = gen.numeric();
            builder.add_claim(c);
        }
        for (size_t i = 0; i < defeaters; ++i) {
            Defeater d;
            d.id = "d" + std::to_string(i);
            do {
                size_t t = gen.pick(claims + defeaters);
                d.attacks = t < claims ? "c" + std::to_string(t)
                                       : "d" + std::to_string(t - claims);
            } while (d.attacks == d.id);
            size_t extra = defeaters > 1 ? gen.pick(3) : 0;
            for (size_t k = 0; k < extra; ++k) {
                std::string by = "d" + std::to_string(gen.pick(defeaters));
                if (by != d.id) d.attacked_by.push_back(by);
            }
            d.strength = gen.numeric();
            builder.add_defeater(d);
        }
        AttackGraph g = builder.build();

        ResolutionResult r = resolve(g);
        assert(r.converged);
        assert(r.active_defeaters.size() + r.inactive_defeaters.size() == defeaters);
        for (const auto& id : r.undecided) assert(r.inactive_defeaters.count(id));

        for (AttackGraph::Handle h = 0; h < g.size(); ++h) {
            if (g.kind(h) != NodeKind::Defeater) continue;
            const std::string& id = g.id(h);
            bool attacked_by_active = false;
            for (AttackGraph::Handle a : g.attackers(h)) {
                if (r.is_active(g.id(a))) attacked_by_active = true;
            }
            if (r.is_active(id)) {
                // Conflict free
                assert(!attacked_by_active);
            } else if (!r.is_undecided(id)) {
                // Out only when something active attacks it
                assert(attacked_by_active);
            }
        }

        // Undecided defeaters never go unexplained
        if (!r.undecided.empty()) {
            ++with_undecided;
            assert(!r.cycles.empty());
        }
        for (const auto& cycle : r.cycles) {
            assert(!cycle.empty());
            for (size_t i = 0; i < cycle.size(); ++i) {
                auto from = g.find(cycle[i]);
                auto to = g.find(cycle[(i + 1) % cycle.size()]);
                assert(from && to);
                const auto& targets = g.targets(*from);
                assert(std::find(targets.begin(), targets.end(), *to) != targets.end());
            }
        }

        // Deterministic
        ResolutionResult again = resolve(g);
        assert(again.active_defeaters == r.active_defeaters);
        assert(again.undecided == r.undecided);
        assert(again.cycles == r.cycles);

        std::vector<ClaimVerdict> verdicts = assess(g, r);
        assert(verdicts.size() == claims);
        for (const auto& v : verdicts) {
            // Active defeaters only ever lower confidence
            assert(compare(v.effective, v.original) <= 0);
            if (v.defeated) assert(!v.active_attackers.empty());
        }
    }
    std::cout << "  " << with_undecided << " graphs with undecided defeaters" << std::endl;
    assert(with_undecided > 0);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Pramana Property Tests ===" << std::endl;
    std::cout << std::endl;

    test_lattice_laws();
    test_combinator_bounds();
    test_random_graphs();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
