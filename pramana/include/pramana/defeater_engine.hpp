#pragma once
// Defeater engine: attack graphs rebuilt from the ledger
//
// Claims and defeaters are recorded as ledger entries. A snapshot replays
// a ledger prefix into an immutable AttackGraph; resolving it records the
// outcome as a resolution entry derived from everything the snapshot used.
// Retracting a declaration is a correction entry, so history stays intact.

#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "claims.hpp"
#include "defeaters.hpp"
#include "ledger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace pramana {

// An attack graph plus the ledger entries it was built from
struct Snapshot {
    AttackGraph graph;
    uint64_t upto = 0;                  // ledger head the snapshot reflects
    std::string correlation_id;         // empty = whole ledger
    std::vector<uint64_t> sources;      // claim and defeater entries used
};

struct EngineResolution {
    ResolutionResult result;
    std::vector<ClaimVerdict> verdicts;
    uint64_t sequence = 0;              // resolution entry in the ledger
};

class DefeaterEngine {
public:
    DefeaterEngine(EvidenceLedger& ledger, ResolutionConfig config = {})
        : ledger_(ledger), config_(config) {}

    uint64_t assert_claim(const Claim& claim, const std::string& correlation_id,
                          const std::string& agent = "") {
        if (claim.id.empty()) {
            throw GraphConstructionError("claim with empty id");
        }
        json payload = claim;
        return ledger_.append(EntryKind::Claim, payload, correlation_id, agent);
    }

    // Reflexive declarations are rejected before anything is written
    uint64_t declare(const Defeater& defeater, const std::string& correlation_id,
                     const std::string& agent = "") {
        if (defeater.id.empty()) {
            throw GraphConstructionError("defeater with empty id");
        }
        if (defeater.attacks == defeater.id) throw ReflexivityViolation(defeater.id);
        for (const auto& by : defeater.attacked_by) {
            if (by == defeater.id) throw ReflexivityViolation(defeater.id);
        }
        json payload = defeater;
        payload.erase("active");
        return ledger_.append(EntryKind::Defeater, payload, correlation_id, agent);
    }

    // Withdraw a claim or defeater declaration
    uint64_t retract(uint64_t sequence, const std::string& reason, const std::string& agent = "") {
        auto entry = ledger_.get(sequence);
        if (!entry) {
            throw LedgerError("retract: no entry " + std::to_string(sequence));
        }
        if (entry->kind != EntryKind::Claim && entry->kind != EntryKind::Defeater) {
            throw LedgerError("retract: entry " + std::to_string(sequence) + " is a " +
                              to_string(entry->kind) + ", not a claim or defeater");
        }
        return ledger_.correct(sequence, EntryKind::Correction,
                               {{"retracted", true}, {"reason", reason}}, agent);
    }

    // Replay entries 1..upto (0 = head) into an attack graph.
    // A later declaration with the same id replaces the earlier one. Each
    // declaration is read at its newest correction within the prefix and
    // dropped when that correction is a retraction.
    Snapshot snapshot(const std::string& correlation_id = "", uint64_t upto = 0) const {
        if (upto == 0 || upto > ledger_.head()) upto = ledger_.head();

        std::vector<LedgerEntry> prefix;
        ledger_.replay(upto, [&](const LedgerEntry& e) {
            if (correlation_id.empty() || e.correlation_id == correlation_id) {
                prefix.push_back(e);
            }
        });

        // id → (kind, entry). Insertion order is kept for deterministic graphs.
        std::vector<LedgerEntry> declarations = current_revisions(prefix);
        std::vector<std::string> order;
        std::map<std::string, const LedgerEntry*> latest;
        std::map<std::string, EntryKind> kinds;
        for (const auto& e : declarations) {
            if (e.kind != EntryKind::Claim && e.kind != EntryKind::Defeater) continue;
            if (!e.payload.is_object()) {
                throw LedgerError("entry " + std::to_string(e.sequence) + " has no object payload");
            }
            std::string id = e.payload.value("id", "");
            if (id.empty()) {
                throw LedgerError("entry " + std::to_string(e.sequence) + " has no id");
            }
            auto k = kinds.find(id);
            if (k != kinds.end() && k->second != e.kind) {
                throw GraphConstructionError("'" + id + "' declared as both claim and defeater");
            }
            if (!latest.count(id)) order.push_back(id);
            latest[id] = &e;
            kinds[id] = e.kind;
        }

        AttackGraph::Builder builder;
        std::vector<uint64_t> sources;
        for (const auto& id : order) {
            const LedgerEntry* e = latest[id];
            if (e->kind == EntryKind::Claim) {
                builder.add_claim(e->payload.get<Claim>());
            } else {
                builder.add_defeater(e->payload.get<Defeater>());
            }
            sources.push_back(e->sequence);
        }
        std::sort(sources.begin(), sources.end());
        Snapshot snap{builder.build(), upto, correlation_id, std::move(sources)};

        log_debug("engine", "snapshot '%s' @%llu: %zu nodes, %zu edges",
                  correlation_id.c_str(), static_cast<unsigned long long>(upto),
                  snap.graph.size(), snap.graph.edge_count());
        return snap;
    }

    // Resolve, assess every claim, and record the outcome
    EngineResolution resolve(const Snapshot& snap, const std::string& agent = "defeater-engine") {
        EngineResolution out;
        out.result = pramana::resolve(snap.graph, config_);
        out.verdicts = assess(snap.graph, out.result, config_);

        json verdicts = json::array();
        for (const auto& v : out.verdicts) verdicts.push_back(json(v));
        json payload = {
            {"upto", snap.upto},
            {"result", out.result},
            {"verdicts", verdicts},
        };
        out.sequence = ledger_.append(EntryKind::Resolution, payload, snap.correlation_id,
                                      agent, snap.sources);
        return out;
    }

    const ResolutionConfig& config() const { return config_; }

private:
    EvidenceLedger& ledger_;
    ResolutionConfig config_;
};

} // namespace pramana
