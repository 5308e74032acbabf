#pragma once
// Defeater resolution: grounded semantics over an attack graph
//
// Nodes are claims and defeaters. An edge x → y means "if x is active,
// y is defeated". Only defeaters attack; claims are attacked.
//
// Resolution starts from nothing active and iterates
//     U(S) = { d : no attacker of d is in S }
// twice per step. U is antitone, so U∘U is monotone and the sequence
// S0 = ∅, S1 = U(U(S0)), ... climbs to the grounded extension: only
// defeaters that must be active are active. What remains unattacked by
// the extension but outside it is undecided (it sits on or behind a
// cycle). Undecided defeaters are inactive and never defeat a claim.
//
// The iteration is capped; running out is a disclosed result, not an error.

#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "confidence.hpp"
#include "derivation.hpp"
#include "claims.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pramana {

// attacks(x, x): raised as soon as the edge is declared
class ReflexivityViolation : public std::logic_error {
public:
    explicit ReflexivityViolation(const std::string& id)
        : std::logic_error("reflexive attack: '" + id + "' attacks itself") {}
};

class GraphConstructionError : public std::logic_error {
public:
    explicit GraphConstructionError(const std::string& what) : std::logic_error(what) {}
};

enum class NodeKind : uint8_t {
    Claim = 0,
    Defeater = 1,
};

// ═══════════════════════════════════════════════════════════════════════════
// AttackGraph: immutable arena of nodes with index handles
// ═══════════════════════════════════════════════════════════════════════════

class AttackGraph {
public:
    using Handle = uint32_t;

    class Builder {
    public:
        Builder& add_claim(Claim claim) {
            require_new(claim.id);
            known_[claim.id] = NodeKind::Claim;
            if (attacker_ids_.count(claim.id)) {
                throw GraphConstructionError("claim '" + claim.id + "' is used as an attacker");
            }
            claims_.push_back(std::move(claim));
            order_.emplace_back(NodeKind::Claim, claims_.size() - 1);
            return *this;
        }

        // Edges: this defeater → its target, and each of attacked_by → this defeater
        Builder& add_defeater(Defeater defeater) {
            if (defeater.attacks == defeater.id) throw ReflexivityViolation(defeater.id);
            for (const auto& by : defeater.attacked_by) {
                if (by == defeater.id) throw ReflexivityViolation(defeater.id);
            }
            require_new(defeater.id);
            known_[defeater.id] = NodeKind::Defeater;

            add_attack(defeater.id, defeater.attacks);
            for (const auto& by : defeater.attacked_by) add_attack(by, defeater.id);

            defeater.active = false;
            defeaters_.push_back(std::move(defeater));
            order_.emplace_back(NodeKind::Defeater, defeaters_.size() - 1);
            return *this;
        }

        Builder& add_attack(const std::string& attacker, const std::string& target) {
            if (attacker == target) throw ReflexivityViolation(attacker);
            auto it = known_.find(attacker);
            if (it != known_.end() && it->second == NodeKind::Claim) {
                throw GraphConstructionError("claim '" + attacker + "' is used as an attacker");
            }
            attacker_ids_.insert(attacker);
            pending_.emplace_back(attacker, target);
            return *this;
        }

        // Every edge endpoint must exist and every attacker must be a defeater
        AttackGraph build() const {
            AttackGraph g;
            for (const auto& [kind, idx] : order_) {
                Node n;
                n.kind = kind;
                n.record = idx;
                n.id = kind == NodeKind::Claim ? claims_[idx].id : defeaters_[idx].id;
                g.index_[n.id] = static_cast<Handle>(g.nodes_.size());
                g.nodes_.push_back(std::move(n));
            }
            g.claims_ = claims_;
            g.defeaters_ = defeaters_;

            std::set<std::pair<Handle, Handle>> seen;
            for (const auto& [from, to] : pending_) {
                auto a = g.find(from);
                auto t = g.find(to);
                if (!a) throw GraphConstructionError("attack from unknown node '" + from + "'");
                if (!t) throw GraphConstructionError("attack on unknown node '" + to + "'");
                if (g.nodes_[*a].kind != NodeKind::Defeater) {
                    throw GraphConstructionError("claim '" + from + "' is used as an attacker");
                }
                if (!seen.insert({*a, *t}).second) continue;
                g.edges_.emplace_back(*a, *t);
                g.nodes_[*a].targets.push_back(*t);
                g.nodes_[*t].attackers.push_back(*a);
            }
            return g;
        }

    private:
        void require_new(const std::string& id) {
            if (id.empty()) throw GraphConstructionError("node with empty id");
            if (known_.count(id)) throw GraphConstructionError("duplicate node id '" + id + "'");
        }

        std::vector<Claim> claims_;
        std::vector<Defeater> defeaters_;
        std::vector<std::pair<NodeKind, size_t>> order_;
        std::unordered_map<std::string, NodeKind> known_;
        std::set<std::string> attacker_ids_;
        std::vector<std::pair<std::string, std::string>> pending_;
    };

    size_t size() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }

    std::optional<Handle> find(const std::string& id) const {
        auto it = index_.find(id);
        if (it == index_.end()) return std::nullopt;
        return it->second;
    }

    const std::string& id(Handle h) const { return nodes_[h].id; }
    NodeKind kind(Handle h) const { return nodes_[h].kind; }
    const std::vector<Handle>& attackers(Handle h) const { return nodes_[h].attackers; }
    const std::vector<Handle>& targets(Handle h) const { return nodes_[h].targets; }
    const std::vector<std::pair<Handle, Handle>>& edges() const { return edges_; }

    const Claim& claim(Handle h) const { return claims_[nodes_[h].record]; }
    const Defeater& defeater(Handle h) const { return defeaters_[nodes_[h].record]; }

    const std::vector<Claim>& claims() const { return claims_; }
    const std::vector<Defeater>& defeaters() const { return defeaters_; }

private:
    struct Node {
        std::string id;
        NodeKind kind = NodeKind::Claim;
        size_t record = 0;               // index into claims_ or defeaters_
        std::vector<Handle> attackers;
        std::vector<Handle> targets;
    };

    AttackGraph() = default;

    std::vector<Node> nodes_;
    std::vector<Claim> claims_;
    std::vector<Defeater> defeaters_;
    std::unordered_map<std::string, Handle> index_;
    std::vector<std::pair<Handle, Handle>> edges_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Resolution
// ═══════════════════════════════════════════════════════════════════════════

struct ResolutionResult {
    std::set<DefeaterId> active_defeaters;
    std::set<DefeaterId> inactive_defeaters;   // everything not active, undecided included
    std::set<DefeaterId> undecided;
    bool converged = false;
    size_t iterations = 0;
    std::vector<std::vector<DefeaterId>> cycles;

    bool is_active(const DefeaterId& id) const { return active_defeaters.count(id) > 0; }
    bool is_undecided(const DefeaterId& id) const { return undecided.count(id) > 0; }
};

inline void to_json(json& j, const ResolutionResult& r) {
    j = json{
        {"active_defeaters", r.active_defeaters},
        {"inactive_defeaters", r.inactive_defeaters},
        {"undecided", r.undecided},
        {"converged", r.converged},
        {"iterations", r.iterations},
        {"cycles", r.cycles},
    };
}

namespace detail {

// Rotate so the smallest id leads; the same cycle always prints the same way
inline std::vector<DefeaterId> canonical_cycle(std::vector<DefeaterId> cycle) {
    auto smallest = std::min_element(cycle.begin(), cycle.end());
    std::rotate(cycle.begin(), smallest, cycle.end());
    return cycle;
}

// Iterative DFS with an explicit stack. Every back edge closes one cycle.
// Only nodes with include[h] set are visited.
inline std::vector<std::vector<DefeaterId>> find_cycles(const AttackGraph& g,
                                                        const std::vector<char>& include,
                                                        size_t limit) {
    using Handle = AttackGraph::Handle;
    enum : uint8_t { White = 0, Grey = 1, Black = 2 };

    std::vector<std::vector<DefeaterId>> cycles;
    std::set<std::vector<DefeaterId>> seen;
    std::vector<uint8_t> color(g.size(), White);
    std::vector<size_t> path_pos(g.size(), 0);
    std::vector<Handle> path;
    std::vector<std::pair<Handle, size_t>> stack;  // node, next target index

    for (Handle root = 0; root < g.size() && cycles.size() < limit; ++root) {
        if (!include[root] || color[root] != White) continue;

        stack.emplace_back(root, 0);
        color[root] = Grey;
        path_pos[root] = path.size();
        path.push_back(root);

        while (!stack.empty() && cycles.size() < limit) {
            auto& [node, next] = stack.back();
            const auto& targets = g.targets(node);
            if (next >= targets.size()) {
                color[node] = Black;
                path.pop_back();
                stack.pop_back();
                continue;
            }
            Handle t = targets[next++];
            if (!include[t]) continue;
            if (color[t] == Grey) {
                std::vector<DefeaterId> cycle;
                for (size_t i = path_pos[t]; i < path.size(); ++i) {
                    cycle.push_back(g.id(path[i]));
                }
                cycle = canonical_cycle(std::move(cycle));
                if (seen.insert(cycle).second) cycles.push_back(std::move(cycle));
            } else if (color[t] == White) {
                color[t] = Grey;
                path_pos[t] = path.size();
                path.push_back(t);
                stack.emplace_back(t, 0);
            }
        }
        // Cap reached mid-walk: unwind
        for (Handle h : path) color[h] = Black;
        path.clear();
        stack.clear();
    }
    return cycles;
}

} // namespace detail

// Every cycle of the attack relation among defeaters, up to limit
inline std::vector<std::vector<DefeaterId>> detect_cycles(const AttackGraph& g, size_t limit = 64) {
    std::vector<char> include(g.size(), 0);
    for (AttackGraph::Handle h = 0; h < g.size(); ++h) {
        include[h] = g.kind(h) == NodeKind::Defeater;
    }
    return detail::find_cycles(g, include, limit);
}

inline ResolutionResult resolve(const AttackGraph& g, const ResolutionConfig& config = {}) {
    using Handle = AttackGraph::Handle;
    const size_t n = g.size();

    std::vector<Handle> defeaters;
    for (Handle h = 0; h < n; ++h) {
        if (g.kind(h) == NodeKind::Defeater) defeaters.push_back(h);
    }

    // U(S): defeaters with no attacker in S
    auto unattacked_by = [&](const std::vector<char>& s) {
        std::vector<char> out(n, 0);
        for (Handle d : defeaters) {
            bool attacked = false;
            for (Handle a : g.attackers(d)) {
                if (s[a]) {
                    attacked = true;
                    break;
                }
            }
            out[d] = !attacked;
        }
        return out;
    };

    ResolutionResult result;
    std::vector<char> active(n, 0);
    while (result.iterations < config.max_iterations) {
        std::vector<char> next = unattacked_by(unattacked_by(active));
        ++result.iterations;
        if (next == active) {
            result.converged = true;
            break;
        }
        active = std::move(next);
    }

    std::vector<char> unattacked = unattacked_by(active);
    std::vector<char> undecided(n, 0);
    for (Handle d : defeaters) {
        const std::string& id = g.id(d);
        if (active[d]) {
            result.active_defeaters.insert(id);
        } else {
            result.inactive_defeaters.insert(id);
            if (unattacked[d]) {
                undecided[d] = 1;
                result.undecided.insert(id);
            }
        }
    }

    if (!result.converged) {
        std::vector<char> include(n, 0);
        for (Handle d : defeaters) include[d] = 1;
        result.cycles = detail::find_cycles(g, include, config.max_reported_cycles);
        log_warn("defeaters",
                 "resolution did not converge after %zu iterations "
                 "(%zu active, %zu undecided, %zu cycles disclosed)",
                 result.iterations, result.active_defeaters.size(), result.undecided.size(),
                 result.cycles.size());
    } else if (!result.undecided.empty()) {
        // Every undecided defeater has an undecided attacker, so this subgraph has a cycle
        result.cycles = detail::find_cycles(g, undecided, config.max_reported_cycles);
    }

    log_debug("defeaters", "resolved %zu defeaters in %zu iterations: %zu active, %zu undecided",
              defeaters.size(), result.iterations, result.active_defeaters.size(),
              result.undecided.size());
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════
// Claim assessment
// ═══════════════════════════════════════════════════════════════════════════

// complement(strength); an Absent strength stays Absent.
// An interval strength [lo, hi] yields [1 - hi, 1 - lo], which meets the
// claim at 1 - hi: the defeater is taken at its strongest.
inline ConfidenceValue defeat_factor(const ConfidenceValue& strength) {
    if (strength.is_absent()) return strength;
    if (strength.kind() == ConfidenceKind::Bounded) {
        const auto& b = strength.as<Bounded>();
        return ConfidenceValue::bounded(std::max(0.0, 1.0 - b.high), std::min(1.0, 1.0 - b.low),
                                        b.basis, b.citation);
    }
    DeriveResult r = complement(strength);
    if (!r.ok()) {
        throw ConstructionError("defeat strength: " + r.error->to_string());
    }
    return *r.value;
}

// meet(claim, complement(s)) over the strengths of active attackers.
// Active defeaters only ever lower confidence.
inline ConfidenceValue effective_confidence(const ConfidenceValue& claim_confidence,
                                            const std::vector<ConfidenceValue>& active_strengths) {
    ConfidenceValue acc = claim_confidence;
    for (const auto& s : active_strengths) {
        acc = meet(acc, defeat_factor(s));
    }
    return acc;
}

struct ClaimVerdict {
    ClaimId claim_id;
    ConfidenceValue original;
    ConfidenceValue effective;
    std::vector<DefeaterId> active_attackers;
    std::vector<DefeaterId> undecided_attackers;
    bool defeated = false;
    bool unresolved_cycle = false;   // some attacker is undecided
};

inline void to_json(json& j, const ClaimVerdict& v) {
    j = json{
        {"claim_id", v.claim_id},
        {"original", v.original.to_json()},
        {"effective", v.effective.to_json()},
        {"active_attackers", v.active_attackers},
        {"undecided_attackers", v.undecided_attackers},
        {"defeated", v.defeated},
        {"unresolved_cycle", v.unresolved_cycle},
    };
}

// One verdict per claim, in graph order
inline std::vector<ClaimVerdict> assess(const AttackGraph& g, const ResolutionResult& result,
                                        const ResolutionConfig& config = {}) {
    std::vector<ClaimVerdict> verdicts;
    for (AttackGraph::Handle h = 0; h < g.size(); ++h) {
        if (g.kind(h) != NodeKind::Claim) continue;
        const Claim& claim = g.claim(h);

        ClaimVerdict v;
        v.claim_id = claim.id;
        v.original = claim.confidence;

        std::vector<ConfidenceValue> strengths;
        for (AttackGraph::Handle a : g.attackers(h)) {
            const Defeater& d = g.defeater(a);
            if (result.is_active(d.id)) {
                v.active_attackers.push_back(d.id);
                strengths.push_back(d.strength);
            } else if (result.is_undecided(d.id)) {
                v.undecided_attackers.push_back(d.id);
            }
        }

        v.effective = effective_confidence(claim.confidence, strengths);
        auto eff = v.effective.conservative_value();
        v.defeated = !v.active_attackers.empty() && eff.has_value() &&
                     *eff <= config.defeat_threshold;
        v.unresolved_cycle = !v.undecided_attackers.empty();
        if (v.unresolved_cycle && v.active_attackers.empty()) {
            log_debug("defeaters", "claim %s left undefeated: attackers undecided",
                      claim.id.c_str());
        }
        verdicts.push_back(std::move(v));
    }
    return verdicts;
}

// Set claim statuses from verdicts. A claim no longer defeated is reinstated.
inline size_t apply_verdicts(std::vector<Claim>& claims, const std::vector<ClaimVerdict>& verdicts) {
    std::unordered_map<std::string, const ClaimVerdict*> by_id;
    for (const auto& v : verdicts) by_id[v.claim_id] = &v;

    size_t changed = 0;
    for (auto& c : claims) {
        auto it = by_id.find(c.id);
        if (it == by_id.end()) continue;
        ClaimStatus before = c.status;
        if (it->second->defeated) {
            c.status = ClaimStatus::Defeated;
        } else if (c.status == ClaimStatus::Defeated) {
            c.status = ClaimStatus::Entertained;
        }
        if (c.status != before) ++changed;
    }
    return changed;
}

// Write the computed active flag back onto defeater records
inline void mark_active(std::vector<Defeater>& defeaters, const ResolutionResult& result) {
    for (auto& d : defeaters) d.active = result.is_active(d.id);
}

// Undermining defeaters for claims whose evidence has all expired.
// Evidence ids not found in the list are not judged.
inline std::vector<Defeater> stale_evidence_defeaters(const std::vector<Claim>& claims,
                                                      const std::vector<Evidence>& evidence,
                                                      Timestamp at) {
    std::unordered_map<std::string, const Evidence*> by_id;
    for (const auto& e : evidence) by_id[e.id] = &e;

    std::vector<Defeater> out;
    for (const auto& c : claims) {
        if (c.evidence_ids.empty()) continue;
        bool all_expired = true;
        for (const auto& eid : c.evidence_ids) {
            auto it = by_id.find(eid);
            if (it == by_id.end() || !it->second->expired(at)) {
                all_expired = false;
                break;
            }
        }
        if (!all_expired) continue;

        Defeater d;
        d.id = "stale:" + c.id;
        d.kind = DefeaterKind::Undermining;
        d.attacks = c.id;
        d.strength = ConfidenceValue::deterministic(true, "evidence_expired");
        d.description = "all " + std::to_string(c.evidence_ids.size()) +
                        " evidence item(s) expired by " + iso8601(at);
        out.push_back(std::move(d));
    }
    return out;
}

} // namespace pramana
