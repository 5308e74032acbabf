#pragma once
// Claims, evidence and defeaters: the records the engine reasons over
//
// A claim is produced upstream and carries its own confidence. Evidence is
// immutable and shared between claims by id. A defeater attacks either a
// claim or another defeater; whether it is active is decided by resolution.

#include "types.hpp"
#include "confidence.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pramana {

enum class ClaimStatus : uint8_t {
    Entertained = 0,  // default until something decides otherwise
    Accepted = 1,
    Rejected = 2,
    Defeated = 3,     // set and cleared only by the defeater engine
    Stale = 4,        // something it depends on was defeated; revalidate
};

inline const char* to_string(ClaimStatus s) {
    switch (s) {
        case ClaimStatus::Entertained: return "entertained";
        case ClaimStatus::Accepted: return "accepted";
        case ClaimStatus::Rejected: return "rejected";
        case ClaimStatus::Defeated: return "defeated";
        case ClaimStatus::Stale: return "stale";
    }
    return "entertained";
}

inline ClaimStatus claim_status_from_string(const std::string& s) {
    if (s == "entertained") return ClaimStatus::Entertained;
    if (s == "accepted") return ClaimStatus::Accepted;
    if (s == "rejected") return ClaimStatus::Rejected;
    if (s == "defeated") return ClaimStatus::Defeated;
    if (s == "stale") return ClaimStatus::Stale;
    throw ConstructionError("unknown claim status '" + s + "'");
}

// Undermining attacks premises, rebutting the conclusion,
// undercutting the inference from one to the other.
enum class DefeaterKind : uint8_t {
    Undermining = 0,
    Rebutting = 1,
    Undercutting = 2,
};

inline const char* to_string(DefeaterKind k) {
    switch (k) {
        case DefeaterKind::Undermining: return "undermining";
        case DefeaterKind::Rebutting: return "rebutting";
        case DefeaterKind::Undercutting: return "undercutting";
    }
    return "undermining";
}

inline DefeaterKind defeater_kind_from_string(const std::string& s) {
    if (s == "undermining") return DefeaterKind::Undermining;
    if (s == "rebutting") return DefeaterKind::Rebutting;
    if (s == "undercutting") return DefeaterKind::Undercutting;
    throw ConstructionError("unknown defeater kind '" + s + "'");
}

struct Claim {
    ClaimId id;
    std::string content_ref;          // pointer to the claim text, held upstream
    ProducerId producer;
    ConfidenceValue confidence;
    std::vector<EvidenceId> evidence_ids;
    ClaimStatus status = ClaimStatus::Entertained;
};

struct Evidence {
    EvidenceId id;
    std::string source;               // file path, URL, tool name
    Timestamp created_at = 0;
    std::optional<Timestamp> expires_at;

    bool expired(Timestamp at) const {
        return expires_at.has_value() && *expires_at <= at;
    }
};

struct Defeater {
    DefeaterId id;
    DefeaterKind kind = DefeaterKind::Rebutting;
    std::string attacks;              // ClaimId or DefeaterId
    std::vector<DefeaterId> attacked_by;
    ConfidenceValue strength = ConfidenceValue::deterministic(true, "");
    bool active = false;              // written by resolution only
    std::string description;
};

// ═══════════════════════════════════════════════════════════════════════════
// JSON
// ═══════════════════════════════════════════════════════════════════════════

inline void to_json(json& j, const Claim& c) {
    j = json{
        {"id", c.id},
        {"content_ref", c.content_ref},
        {"producer", c.producer},
        {"confidence", c.confidence.to_json()},
        {"evidence_ids", c.evidence_ids},
        {"status", to_string(c.status)},
    };
}

inline void from_json(const json& j, Claim& c) {
    try {
        c.id = j.at("id").get<std::string>();
        c.content_ref = j.value("content_ref", "");
        c.producer = j.value("producer", "");
        c.confidence = j.contains("confidence")
            ? ConfidenceValue::from_json(j.at("confidence"))
            : ConfidenceValue::absent();
        c.evidence_ids = j.value("evidence_ids", std::vector<std::string>{});
        c.status = claim_status_from_string(j.value("status", "entertained"));
    } catch (const json::exception& e) {
        throw ConstructionError(std::string("claim: ") + e.what());
    }
}

inline void to_json(json& j, const Evidence& e) {
    j = json{
        {"id", e.id},
        {"source", e.source},
        {"created_at", e.created_at},
    };
    if (e.expires_at) j["expires_at"] = *e.expires_at;
}

inline void from_json(const json& j, Evidence& e) {
    try {
        e.id = j.at("id").get<std::string>();
        e.source = j.value("source", "");
        e.created_at = j.value("created_at", Timestamp(0));
        if (j.contains("expires_at") && !j.at("expires_at").is_null()) {
            e.expires_at = j.at("expires_at").get<Timestamp>();
        } else {
            e.expires_at.reset();
        }
    } catch (const json::exception& ex) {
        throw ConstructionError(std::string("evidence: ") + ex.what());
    }
}

inline void to_json(json& j, const Defeater& d) {
    j = json{
        {"id", d.id},
        {"kind", to_string(d.kind)},
        {"attacks", d.attacks},
        {"attacked_by", d.attacked_by},
        {"strength", d.strength.to_json()},
        {"active", d.active},
        {"description", d.description},
    };
}

// "active" is ignored on input: only resolution decides it
inline void from_json(const json& j, Defeater& d) {
    try {
        d.id = j.at("id").get<std::string>();
        d.kind = defeater_kind_from_string(j.value("kind", "rebutting"));
        d.attacks = j.at("attacks").get<std::string>();
        d.attacked_by = j.value("attacked_by", std::vector<std::string>{});
        d.strength = j.contains("strength")
            ? ConfidenceValue::from_json(j.at("strength"))
            : ConfidenceValue::deterministic(true, "");
        d.active = false;
        d.description = j.value("description", "");
    } catch (const json::exception& e) {
        throw ConstructionError(std::string("defeater: ") + e.what());
    }
}

} // namespace pramana
