#pragma once
// Provenance export: ledger entries as a W3C PROV-JSON document
//
// Each entry becomes an entity (what was recorded) generated by an
// activity (the act of recording it). The recording agent is associated
// with the activity and the entity is attributed to it. Parent links are
// wasDerivedFrom; corrections are wasDerivedFrom typed prov:Revision.
//
// This is a read-side transform for audit, not a storage format.
// import_prov inverts it exactly for the exported entries.

#include "types.hpp"
#include "ledger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace pramana {

namespace prov {

constexpr const char* ENTRY_PREFIX = "pramana:entry/";
constexpr const char* ACTIVITY_PREFIX = "pramana:activity/";
constexpr const char* AGENT_PREFIX = "pramana:agent/";

inline std::string entity_id(uint64_t seq) { return ENTRY_PREFIX + std::to_string(seq); }
inline std::string activity_id(uint64_t seq) { return ACTIVITY_PREFIX + std::to_string(seq); }
inline std::string agent_id(const std::string& name) { return AGENT_PREFIX + name; }

inline uint64_t sequence_of(const std::string& entity) {
    std::string prefix = ENTRY_PREFIX;
    if (entity.compare(0, prefix.size(), prefix) != 0) {
        throw LedgerError("provenance: '" + entity + "' is not a ledger entity");
    }
    try {
        size_t used = 0;
        unsigned long long v = std::stoull(entity.substr(prefix.size()), &used);
        if (used != entity.size() - prefix.size() || v == 0) {
            throw LedgerError("provenance: bad entity id '" + entity + "'");
        }
        return v;
    } catch (const std::logic_error&) {
        throw LedgerError("provenance: bad entity id '" + entity + "'");
    }
}

} // namespace prov

inline json export_prov(const std::vector<LedgerEntry>& entries) {
    json doc;
    doc["prefix"] = {
        {"prov", "http://www.w3.org/ns/prov#"},
        {"pramana", "urn:pramana:"},
    };
    json entity = json::object();
    json activity = json::object();
    json agent = json::object();
    json generated = json::object();
    json associated = json::object();
    json attributed = json::object();
    json derived = json::object();

    std::set<uint64_t> exported;
    for (const auto& e : entries) exported.insert(e.sequence);

    for (const auto& e : entries) {
        std::string ent = prov::entity_id(e.sequence);
        std::string act = prov::activity_id(e.sequence);
        std::string seq = std::to_string(e.sequence);

        entity[ent] = {
            {"prov:type", std::string("pramana:") + to_string(e.kind)},
            {"pramana:sequence", e.sequence},
            {"pramana:kind", to_string(e.kind)},
            {"pramana:payload", e.payload},
            {"pramana:correlation_id", e.correlation_id},
            {"pramana:timestamp", e.timestamp},
        };
        activity[act] = {
            {"prov:startTime", iso8601(e.timestamp)},
            {"prov:endTime", iso8601(e.timestamp)},
            {"pramana:correlation_id", e.correlation_id},
        };
        generated["_:gen/" + seq] = {
            {"prov:entity", ent},
            {"prov:activity", act},
            {"prov:time", iso8601(e.timestamp)},
        };

        if (!e.agent.empty()) {
            std::string ag = prov::agent_id(e.agent);
            agent[ag] = {{"prov:type", "prov:SoftwareAgent"}, {"prov:label", e.agent}};
            associated["_:assoc/" + seq] = {{"prov:activity", act}, {"prov:agent", ag}};
            attributed["_:attr/" + seq] = {{"prov:entity", ent}, {"prov:agent", ag}};
        }

        for (size_t i = 0; i < e.derived_from.size(); ++i) {
            uint64_t parent = e.derived_from[i];
            std::string pent = prov::entity_id(parent);
            if (!exported.count(parent) && !entity.contains(pent)) {
                // Outside the exported segment: reference only
                entity[pent] = {{"pramana:sequence", parent}, {"pramana:external", true}};
            }
            derived["_:der/" + seq + "/" + std::to_string(i)] = {
                {"prov:generatedEntity", ent},
                {"prov:usedEntity", pent},
                {"prov:activity", act},
                {"pramana:position", i},
            };
        }

        if (e.corrects != 0) {
            std::string orig = prov::entity_id(e.corrects);
            if (!exported.count(e.corrects) && !entity.contains(orig)) {
                entity[orig] = {{"pramana:sequence", e.corrects}, {"pramana:external", true}};
            }
            derived["_:rev/" + seq] = {
                {"prov:generatedEntity", ent},
                {"prov:usedEntity", orig},
                {"prov:type", "prov:Revision"},
            };
        }
    }

    doc["entity"] = entity;
    doc["activity"] = activity;
    doc["agent"] = agent;
    doc["wasGeneratedBy"] = generated;
    doc["wasAssociatedWith"] = associated;
    doc["wasAttributedTo"] = attributed;
    doc["wasDerivedFrom"] = derived;
    return doc;
}

// Every relation endpoint must name a declared node. Empty when valid.
inline std::vector<std::string> validate_prov(const json& doc) {
    std::vector<std::string> problems;
    if (!doc.is_object()) {
        problems.push_back("document is not an object");
        return problems;
    }

    auto section = [&doc](const char* name) -> json {
        return doc.contains(name) && doc.at(name).is_object() ? doc.at(name) : json::object();
    };
    json entity = section("entity");
    json activity = section("activity");
    json agent = section("agent");

    struct Endpoint {
        const char* relation;
        const char* field;
        const json* nodes;
    };
    const Endpoint endpoints[] = {
        {"wasGeneratedBy", "prov:entity", &entity},
        {"wasGeneratedBy", "prov:activity", &activity},
        {"wasAssociatedWith", "prov:activity", &activity},
        {"wasAssociatedWith", "prov:agent", &agent},
        {"wasAttributedTo", "prov:entity", &entity},
        {"wasAttributedTo", "prov:agent", &agent},
        {"wasDerivedFrom", "prov:generatedEntity", &entity},
        {"wasDerivedFrom", "prov:usedEntity", &entity},
        {"wasDerivedFrom", "prov:activity", &activity},
    };

    for (const auto& ep : endpoints) {
        json rel = section(ep.relation);
        for (auto it = rel.begin(); it != rel.end(); ++it) {
            if (!it.value().is_object()) {
                problems.push_back(std::string(ep.relation) + " " + it.key() + " is not an object");
                continue;
            }
            if (!it.value().contains(ep.field)) {
                if (std::string(ep.field) != "prov:activity" ||
                    std::string(ep.relation) != "wasDerivedFrom") {
                    problems.push_back(std::string(ep.relation) + " " + it.key() + " lacks " +
                                       ep.field);
                }
                continue;
            }
            const json& target = it.value().at(ep.field);
            if (!target.is_string() || !ep.nodes->contains(target.get<std::string>())) {
                problems.push_back(std::string(ep.relation) + " " + it.key() + ": " + ep.field +
                                   " " + target.dump() + " is not declared");
            }
        }
    }
    return problems;
}

// Rebuild the exported entries, in sequence order.
// Throws LedgerError when the document is not a valid export.
inline std::vector<LedgerEntry> import_prov(const json& doc) {
    auto problems = validate_prov(doc);
    if (!problems.empty()) {
        throw LedgerError("provenance: " + problems.front());
    }

    std::map<uint64_t, LedgerEntry> by_seq;
    try {
        const json& entity = doc.at("entity");
        for (auto it = entity.begin(); it != entity.end(); ++it) {
            const json& attrs = it.value();
            if (attrs.value("pramana:external", false)) continue;
            LedgerEntry e;
            e.sequence = prov::sequence_of(it.key());
            if (attrs.at("pramana:sequence").get<uint64_t>() != e.sequence) {
                throw LedgerError("provenance: " + it.key() + " sequence attribute disagrees");
            }
            e.kind = entry_kind_from_string(attrs.at("pramana:kind").get<std::string>());
            e.payload = attrs.value("pramana:payload", json());
            e.correlation_id = attrs.value("pramana:correlation_id", "");
            e.timestamp = attrs.value("pramana:timestamp", Timestamp(0));
            uint64_t seq = e.sequence;
            by_seq[seq] = std::move(e);
        }

        std::map<std::string, std::string> agent_labels;
        if (doc.contains("agent")) {
            for (auto it = doc.at("agent").begin(); it != doc.at("agent").end(); ++it) {
                agent_labels[it.key()] = it.value().value("prov:label", "");
            }
        }
        if (doc.contains("wasAttributedTo")) {
            for (const auto& rel : doc.at("wasAttributedTo")) {
                auto e = by_seq.find(prov::sequence_of(rel.at("prov:entity").get<std::string>()));
                if (e == by_seq.end()) continue;
                e->second.agent = agent_labels[rel.at("prov:agent").get<std::string>()];
            }
        }

        std::map<uint64_t, std::vector<std::pair<size_t, uint64_t>>> parents;
        if (doc.contains("wasDerivedFrom")) {
            for (const auto& rel : doc.at("wasDerivedFrom")) {
                uint64_t child = prov::sequence_of(rel.at("prov:generatedEntity").get<std::string>());
                uint64_t used = prov::sequence_of(rel.at("prov:usedEntity").get<std::string>());
                auto e = by_seq.find(child);
                if (e == by_seq.end()) continue;
                if (rel.value("prov:type", "") == "prov:Revision") {
                    e->second.corrects = used;
                } else {
                    parents[child].emplace_back(rel.value("pramana:position", size_t(0)), used);
                }
            }
        }
        for (auto& [child, list] : parents) {
            std::sort(list.begin(), list.end());
            auto& derived_from = by_seq[child].derived_from;
            for (const auto& p : list) derived_from.push_back(p.second);
        }
    } catch (const json::exception& e) {
        throw LedgerError(std::string("provenance: ") + e.what());
    }

    std::vector<LedgerEntry> out;
    out.reserve(by_seq.size());
    for (auto& [seq, e] : by_seq) out.push_back(std::move(e));
    return out;
}

// Atomic write of an exported document
inline bool save_prov(const std::string& path, const json& doc) {
    return safe_save_text(path, doc.dump(2));
}

} // namespace pramana
