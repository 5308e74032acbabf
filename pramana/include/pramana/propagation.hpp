#pragma once
// Defeat propagation: a defeated claim weakens what rests on it
//
// Dependencies are edges between claims:
//   depends_on   from needs to; when to falls, from loses its footing
//   assumes      from takes to for granted; worth a look when to falls
//   supports     from backs to; when from falls, to lost a supporter
//
// propagate_defeat walks breadth first from a defeated claim up to a depth
// cap and reports each claim reached once, at its shallowest depth.
// depends_on hits become undermining defeaters that enter the next
// resolution like any other defeater.

#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "confidence.hpp"
#include "claims.hpp"
#include "defeaters.hpp"
#include <nlohmann/json.hpp>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace pramana {

enum class DependencyKind : uint8_t {
    DependsOn = 0,
    Assumes = 1,
    Supports = 2,
};

inline const char* to_string(DependencyKind k) {
    switch (k) {
        case DependencyKind::DependsOn: return "depends_on";
        case DependencyKind::Assumes: return "assumes";
        case DependencyKind::Supports: return "supports";
    }
    return "depends_on";
}

inline DependencyKind dependency_kind_from_string(const std::string& s) {
    if (s == "depends_on") return DependencyKind::DependsOn;
    if (s == "assumes") return DependencyKind::Assumes;
    if (s == "supports") return DependencyKind::Supports;
    throw ConstructionError("unknown dependency kind '" + s + "'");
}

struct Dependency {
    ClaimId from;
    ClaimId to;
    DependencyKind kind = DependencyKind::DependsOn;
};

inline void to_json(json& j, const Dependency& d) {
    j = json{{"from", d.from}, {"to", d.to}, {"kind", to_string(d.kind)}};
}

inline void from_json(const json& j, Dependency& d) {
    try {
        d.from = j.at("from").get<std::string>();
        d.to = j.at("to").get<std::string>();
        d.kind = dependency_kind_from_string(j.value("kind", "depends_on"));
    } catch (const json::exception& e) {
        throw ConstructionError(std::string("dependency: ") + e.what());
    }
}

enum class SuggestedAction : uint8_t {
    MarkStale = 0,
    Revalidate = 1,
    Investigate = 2,
};

inline const char* to_string(SuggestedAction a) {
    switch (a) {
        case SuggestedAction::MarkStale: return "mark_stale";
        case SuggestedAction::Revalidate: return "revalidate";
        case SuggestedAction::Investigate: return "investigate";
    }
    return "investigate";
}

struct AffectedClaim {
    ClaimId claim_id;
    std::vector<ClaimId> path;        // defeated claim first, excludes claim_id
    DependencyKind via = DependencyKind::DependsOn;
    SuggestedAction action = SuggestedAction::Investigate;
    size_t depth = 0;                 // 0 = directly attached to the defeated claim
    std::string reason;
};

inline void to_json(json& j, const AffectedClaim& a) {
    j = json{
        {"claim_id", a.claim_id},
        {"path", a.path},
        {"via", to_string(a.via)},
        {"action", to_string(a.action)},
        {"depth", a.depth},
        {"reason", a.reason},
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Dependency graph
// ═══════════════════════════════════════════════════════════════════════════

class DependencyGraph {
public:
    // A neighbouring claim and the edge that connects it.
    // Edge pointers stay valid until the next add().
    struct Link {
        ClaimId claim;
        const Dependency* edge;
    };

    DependencyGraph() = default;

    explicit DependencyGraph(const std::vector<Dependency>& dependencies) {
        for (const auto& d : dependencies) add(d);
    }

    void add(const Dependency& d) {
        if (d.from.empty() || d.to.empty()) {
            throw GraphConstructionError("dependency with empty endpoint");
        }
        if (d.from == d.to) {
            throw GraphConstructionError("claim '" + d.from + "' depends on itself");
        }
        edges_.push_back(d);
        outgoing_[d.from].push_back(edges_.size() - 1);
        incoming_[d.to].push_back(edges_.size() - 1);
    }

    // Claims that feel a defeat of `claim`
    std::vector<Link> downstream(const ClaimId& claim) const {
        std::vector<Link> out;
        for (size_t i : edges_at(incoming_, claim)) {
            const Dependency& d = edges_[i];
            if (d.kind != DependencyKind::Supports) out.push_back({d.from, &d});
        }
        for (size_t i : edges_at(outgoing_, claim)) {
            const Dependency& d = edges_[i];
            if (d.kind == DependencyKind::Supports) out.push_back({d.to, &d});
        }
        return out;
    }

    // Claims `claim` rests on
    std::vector<Link> upstream(const ClaimId& claim) const {
        std::vector<Link> out;
        for (size_t i : edges_at(outgoing_, claim)) {
            const Dependency& d = edges_[i];
            if (d.kind != DependencyKind::Supports) out.push_back({d.to, &d});
        }
        for (size_t i : edges_at(incoming_, claim)) {
            const Dependency& d = edges_[i];
            if (d.kind == DependencyKind::Supports) out.push_back({d.from, &d});
        }
        return out;
    }

    const std::vector<Dependency>& edges() const { return edges_; }
    size_t size() const { return edges_.size(); }

private:
    using Index = std::unordered_map<ClaimId, std::vector<size_t>>;

    static const std::vector<size_t>& edges_at(const Index& index, const ClaimId& claim) {
        static const std::vector<size_t> none;
        auto it = index.find(claim);
        return it == index.end() ? none : it->second;
    }

    std::vector<Dependency> edges_;
    Index outgoing_;
    Index incoming_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Propagation
// ═══════════════════════════════════════════════════════════════════════════

inline SuggestedAction suggested_action(DependencyKind via, size_t depth) {
    switch (via) {
        case DependencyKind::DependsOn:
            return depth == 0 ? SuggestedAction::MarkStale : SuggestedAction::Revalidate;
        case DependencyKind::Assumes:
            return SuggestedAction::Investigate;
        case DependencyKind::Supports:
            return depth == 0 ? SuggestedAction::Revalidate : SuggestedAction::Investigate;
    }
    return SuggestedAction::Investigate;
}

// Every claim reachable downstream of `defeated` within max_depth levels,
// in breadth-first order. The defeated claim itself is never reported.
inline std::vector<AffectedClaim> propagate_defeat(const DependencyGraph& g,
                                                   const ClaimId& defeated,
                                                   const PropagationConfig& config = {}) {
    struct Step {
        ClaimId claim;
        std::vector<ClaimId> path;
        DependencyKind via;
        size_t depth;
    };

    std::vector<AffectedClaim> out;
    std::unordered_set<ClaimId> visited{defeated};
    std::queue<Step> frontier;
    for (const auto& link : g.downstream(defeated)) {
        frontier.push({link.claim, {defeated}, link.edge->kind, 0});
    }

    while (!frontier.empty()) {
        Step step = std::move(frontier.front());
        frontier.pop();
        if (step.depth >= config.max_depth || !visited.insert(step.claim).second) continue;

        std::vector<ClaimId> next_path = step.path;
        next_path.push_back(step.claim);
        for (const auto& link : g.downstream(step.claim)) {
            if (visited.count(link.claim)) continue;
            frontier.push({link.claim, next_path, link.edge->kind, step.depth + 1});
        }

        std::string chain;
        for (const auto& id : next_path) {
            if (!chain.empty()) chain += " -> ";
            chain += id;
        }

        AffectedClaim a;
        a.claim_id = step.claim;
        a.path = std::move(step.path);
        a.via = step.via;
        a.action = suggested_action(step.via, step.depth);
        a.depth = step.depth;
        a.reason = std::string("affected via ") + to_string(step.via) + ": " + chain;
        out.push_back(std::move(a));
    }

    log_debug("propagation", "defeat of %s reaches %zu claims", defeated.c_str(), out.size());
    return out;
}

// Undermining defeaters for claims that depend on the defeated one.
// Assumes and supports hits are reported but never attacked.
inline std::vector<Defeater> transitive_defeaters(const ClaimId& defeated,
                                                  const std::vector<AffectedClaim>& affected,
                                                  const PropagationConfig& config = {}) {
    std::vector<Defeater> out;
    for (const auto& a : affected) {
        if (a.via != DependencyKind::DependsOn) continue;
        double s = a.depth == 0 ? config.direct_strength : config.indirect_strength;

        Defeater d;
        d.id = "transitive:" + defeated + ":" + a.claim_id;
        d.kind = DefeaterKind::Undermining;
        d.attacks = a.claim_id;
        d.strength = ConfidenceValue::bounded(s, s, BoundBasis::Estimated, "transitive defeat");
        d.description = "dependency " + defeated + " was defeated; " + a.reason;
        out.push_back(std::move(d));
    }
    return out;
}

// Mark entertained or accepted claims stale where the action asks for it.
// Returns the number marked.
inline size_t apply_transitive_defeat(std::vector<Claim>& claims,
                                      const std::vector<AffectedClaim>& affected) {
    std::unordered_map<std::string, const AffectedClaim*> by_id;
    for (const auto& a : affected) by_id[a.claim_id] = &a;

    size_t marked = 0;
    for (auto& c : claims) {
        auto it = by_id.find(c.id);
        if (it == by_id.end()) continue;
        SuggestedAction action = it->second->action;
        if (action != SuggestedAction::MarkStale && action != SuggestedAction::Revalidate) continue;
        if (c.status == ClaimStatus::Entertained || c.status == ClaimStatus::Accepted) {
            c.status = ClaimStatus::Stale;
            ++marked;
        }
    }
    return marked;
}

// Transitive defeaters for every defeated claim in a set of verdicts
inline std::vector<Defeater> propagate_verdicts(const DependencyGraph& g,
                                                const std::vector<ClaimVerdict>& verdicts,
                                                const PropagationConfig& config = {}) {
    std::vector<Defeater> out;
    for (const auto& v : verdicts) {
        if (!v.defeated) continue;
        auto affected = propagate_defeat(g, v.claim_id, config);
        auto defeaters = transitive_defeaters(v.claim_id, affected, config);
        out.insert(out.end(), defeaters.begin(), defeaters.end());
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════════════════
// Inspection
// ═══════════════════════════════════════════════════════════════════════════

enum class DependencyDirection : uint8_t {
    Upstream = 0,     // what the root rests on
    Downstream = 1,   // what rests on the root
};

struct DependencyView {
    std::vector<std::pair<ClaimId, size_t>> nodes;   // claim, depth; root first
    std::vector<Dependency> edges;
};

inline void to_json(json& j, const DependencyView& v) {
    json nodes = json::array();
    for (const auto& [id, depth] : v.nodes) nodes.push_back({{"id", id}, {"depth", depth}});
    json edges = json::array();
    for (const auto& e : v.edges) edges.push_back(json(e));
    j = json{{"nodes", nodes}, {"edges", edges}};
}

inline DependencyView dependency_view(const DependencyGraph& g, const ClaimId& root,
                                      DependencyDirection direction = DependencyDirection::Downstream,
                                      size_t max_depth = 5) {
    DependencyView view;
    std::unordered_set<ClaimId> seen{root};
    std::unordered_set<const Dependency*> used;
    std::queue<std::pair<ClaimId, size_t>> frontier;
    frontier.push({root, 0});

    while (!frontier.empty()) {
        auto [claim, depth] = frontier.front();
        frontier.pop();
        view.nodes.push_back({claim, depth});
        if (depth >= max_depth) continue;

        auto links = direction == DependencyDirection::Downstream ? g.downstream(claim)
                                                                  : g.upstream(claim);
        for (const auto& link : links) {
            if (used.insert(link.edge).second) view.edges.push_back(*link.edge);
            if (seen.insert(link.claim).second) frontier.push({link.claim, depth + 1});
        }
    }
    return view;
}

} // namespace pramana
