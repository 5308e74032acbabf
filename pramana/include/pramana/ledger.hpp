#pragma once
// Evidence ledger: append-only record of everything that happened
//
// Every extraction, claim, defeater, outcome and resolution is an entry.
// Entries are numbered 1, 2, 3... with no gaps, never mutated, never
// deleted. A correction is a new entry naming the one it corrects.
// Replaying any prefix rebuilds the state as of that sequence.
//
// Storage is injected: MemoryLedgerStore here, FileLedgerStore in wal.hpp.

#include "types.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace pramana {

using json = nlohmann::json;

// Invalid reference or inconsistent store contents
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& what) : std::runtime_error(what) {}
};

// The store could not durably record or recover an entry
class LedgerIoError : public std::runtime_error {
public:
    explicit LedgerIoError(const std::string& what) : std::runtime_error(what) {}
};

enum class EntryKind : uint8_t {
    Extraction = 1,
    Retrieval = 2,
    Synthesis = 3,
    Claim = 4,
    Verification = 5,
    Contradiction = 6,
    Feedback = 7,
    Outcome = 8,
    ToolCall = 9,
    Episode = 10,
    Calibration = 11,
    Defeater = 12,
    Resolution = 13,
    Correction = 14,
};

inline const char* to_string(EntryKind k) {
    switch (k) {
        case EntryKind::Extraction: return "extraction";
        case EntryKind::Retrieval: return "retrieval";
        case EntryKind::Synthesis: return "synthesis";
        case EntryKind::Claim: return "claim";
        case EntryKind::Verification: return "verification";
        case EntryKind::Contradiction: return "contradiction";
        case EntryKind::Feedback: return "feedback";
        case EntryKind::Outcome: return "outcome";
        case EntryKind::ToolCall: return "tool_call";
        case EntryKind::Episode: return "episode";
        case EntryKind::Calibration: return "calibration";
        case EntryKind::Defeater: return "defeater";
        case EntryKind::Resolution: return "resolution";
        case EntryKind::Correction: return "correction";
    }
    return "extraction";
}

inline EntryKind entry_kind_from_string(const std::string& s) {
    static const std::unordered_map<std::string, EntryKind> kinds = {
        {"extraction", EntryKind::Extraction},
        {"retrieval", EntryKind::Retrieval},
        {"synthesis", EntryKind::Synthesis},
        {"claim", EntryKind::Claim},
        {"verification", EntryKind::Verification},
        {"contradiction", EntryKind::Contradiction},
        {"feedback", EntryKind::Feedback},
        {"outcome", EntryKind::Outcome},
        {"tool_call", EntryKind::ToolCall},
        {"episode", EntryKind::Episode},
        {"calibration", EntryKind::Calibration},
        {"defeater", EntryKind::Defeater},
        {"resolution", EntryKind::Resolution},
        {"correction", EntryKind::Correction},
    };
    auto it = kinds.find(s);
    if (it == kinds.end()) {
        throw LedgerError("unknown entry kind '" + s + "'");
    }
    return it->second;
}

inline bool valid_entry_kind(uint8_t raw) {
    return raw >= static_cast<uint8_t>(EntryKind::Extraction) &&
           raw <= static_cast<uint8_t>(EntryKind::Correction);
}

struct LedgerEntry {
    uint64_t sequence = 0;            // assigned by the ledger
    EntryKind kind = EntryKind::Extraction;
    json payload;
    std::string correlation_id;       // session or trace
    Timestamp timestamp = 0;          // now() if left 0
    std::string agent;                // who recorded it
    std::vector<uint64_t> derived_from;
    uint64_t corrects = 0;            // sequence of the corrected entry, 0 if none
};

inline void to_json(json& j, const LedgerEntry& e) {
    j = json{
        {"sequence", e.sequence},
        {"kind", to_string(e.kind)},
        {"payload", e.payload},
        {"correlation_id", e.correlation_id},
        {"timestamp", e.timestamp},
        {"agent", e.agent},
        {"derived_from", e.derived_from},
        {"corrects", e.corrects},
    };
}

inline void from_json(const json& j, LedgerEntry& e) {
    try {
        e.sequence = j.at("sequence").get<uint64_t>();
        e.kind = entry_kind_from_string(j.at("kind").get<std::string>());
        e.payload = j.value("payload", json());
        e.correlation_id = j.value("correlation_id", "");
        e.timestamp = j.value("timestamp", Timestamp(0));
        e.agent = j.value("agent", "");
        e.derived_from = j.value("derived_from", std::vector<uint64_t>{});
        e.corrects = j.value("corrects", uint64_t(0));
    } catch (const json::exception& ex) {
        throw LedgerError(std::string("ledger entry: ") + ex.what());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Storage interface
// ═══════════════════════════════════════════════════════════════════════════

class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    // Durably record one entry. Throws LedgerIoError; nothing is kept on failure.
    virtual void persist(const LedgerEntry& entry) = 0;

    // Every valid entry, in sequence order
    virtual std::vector<LedgerEntry> load() = 0;

    virtual std::string describe() const = 0;
};

class MemoryLedgerStore : public LedgerStore {
public:
    void persist(const LedgerEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
    }

    std::vector<LedgerEntry> load() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    std::string describe() const override { return "memory"; }

private:
    std::mutex mutex_;
    std::vector<LedgerEntry> entries_;
};

class EvidenceLedger;

// Lazy, ordered, restartable. Bounded by the head when it was created.
class LedgerCursor {
public:
    LedgerCursor(const EvidenceLedger& ledger, uint64_t from, uint64_t end)
        : ledger_(&ledger), start_(from), next_(from), end_(end) {}

    std::optional<LedgerEntry> next();

    void restart() { next_ = start_; }

    uint64_t position() const { return next_; }
    uint64_t end() const { return end_; }
    bool done() const { return next_ > end_; }

private:
    const EvidenceLedger* ledger_;
    uint64_t start_;
    uint64_t next_;
    uint64_t end_;
};

// ═══════════════════════════════════════════════════════════════════════════
// The ledger
// ═══════════════════════════════════════════════════════════════════════════

class EvidenceLedger {
public:
    EvidenceLedger() : EvidenceLedger(std::make_shared<MemoryLedgerStore>()) {}

    // Recovers whatever the store already holds
    explicit EvidenceLedger(std::shared_ptr<LedgerStore> store) : store_(std::move(store)) {
        if (!store_) {
            throw LedgerError("ledger: null store");
        }
        std::vector<LedgerEntry> existing = store_->load();
        for (auto& e : existing) {
            if (e.sequence != entries_.size() + 1) {
                throw LedgerError("ledger: store " + store_->describe() +
                                  " out of sequence at " + std::to_string(e.sequence));
            }
            index(e);
            entries_.push_back(std::move(e));
        }
        log_debug("ledger", "opened %s with %zu entries", store_->describe().c_str(),
                  entries_.size());
    }

    EvidenceLedger(const EvidenceLedger&) = delete;
    EvidenceLedger& operator=(const EvidenceLedger&) = delete;

    // Assign the next sequence, persist, then publish.
    // Throws LedgerError on a forward or dangling reference, LedgerIoError on storage failure.
    uint64_t append(LedgerEntry entry) {
        std::unique_lock lock(mutex_);
        uint64_t seq = entries_.size() + 1;

        for (uint64_t parent : entry.derived_from) {
            if (parent == 0 || parent >= seq) {
                throw LedgerError("derived_from references " + std::to_string(parent) +
                                  ", head is " + std::to_string(seq - 1));
            }
        }
        if (entry.corrects >= seq) {
            throw LedgerError("corrects references " + std::to_string(entry.corrects) +
                              ", head is " + std::to_string(seq - 1));
        }

        entry.sequence = seq;
        if (entry.timestamp == 0) entry.timestamp = now();

        try {
            store_->persist(entry);
        } catch (const LedgerIoError& e) {
            log_warn("ledger", "append of %s failed: %s", to_string(entry.kind), e.what());
            throw;
        }

        index(entry);
        entries_.push_back(std::move(entry));
        return seq;
    }

    uint64_t append(EntryKind kind, json payload, std::string correlation_id,
                    std::string agent = "", std::vector<uint64_t> derived_from = {}) {
        LedgerEntry e;
        e.kind = kind;
        e.payload = std::move(payload);
        e.correlation_id = std::move(correlation_id);
        e.agent = std::move(agent);
        e.derived_from = std::move(derived_from);
        return append(std::move(e));
    }

    // Record a correction of an earlier entry. Inherits its correlation id.
    uint64_t correct(uint64_t original, EntryKind kind, json payload, std::string agent = "") {
        auto orig = get(original);
        if (!orig) {
            throw LedgerError("correct: no entry " + std::to_string(original));
        }
        LedgerEntry e;
        e.kind = kind;
        e.payload = std::move(payload);
        e.correlation_id = orig->correlation_id;
        e.agent = std::move(agent);
        e.corrects = original;
        return append(std::move(e));
    }

    // Follow corrections forward to the newest revision
    uint64_t latest_revision(uint64_t seq) const {
        std::shared_lock lock(mutex_);
        uint64_t current = seq;
        while (true) {
            auto it = latest_correction_.find(current);
            if (it == latest_correction_.end()) return current;
            current = it->second;
        }
    }

    std::optional<LedgerEntry> get(uint64_t seq) const {
        std::shared_lock lock(mutex_);
        if (seq == 0 || seq > entries_.size()) return std::nullopt;
        return entries_[seq - 1];
    }

    uint64_t head() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    size_t size() const { return head(); }

    LedgerCursor read_from(uint64_t seq = 1) const {
        return LedgerCursor(*this, seq == 0 ? 1 : seq, head());
    }

    std::vector<LedgerEntry> correlate(const std::string& correlation_id) const {
        std::shared_lock lock(mutex_);
        std::vector<LedgerEntry> out;
        auto it = by_correlation_.find(correlation_id);
        if (it == by_correlation_.end()) return out;
        out.reserve(it->second.size());
        for (uint64_t seq : it->second) out.push_back(entries_[seq - 1]);
        return out;
    }

    std::vector<LedgerEntry> by_kind(EntryKind kind) const {
        std::shared_lock lock(mutex_);
        std::vector<LedgerEntry> out;
        for (const auto& e : entries_) {
            if (e.kind == kind) out.push_back(e);
        }
        return out;
    }

    // Inclusive range, clamped to what exists
    std::vector<LedgerEntry> segment(uint64_t from, uint64_t to) const {
        std::shared_lock lock(mutex_);
        std::vector<LedgerEntry> out;
        if (from == 0) from = 1;
        if (to > entries_.size()) to = entries_.size();
        for (uint64_t s = from; s <= to; ++s) out.push_back(entries_[s - 1]);
        return out;
    }

    // Feed entries 1..upto to fn in order. Returns how many were fed.
    size_t replay(uint64_t upto, const std::function<void(const LedgerEntry&)>& fn) const {
        std::vector<LedgerEntry> prefix = segment(1, upto);
        for (const auto& e : prefix) fn(e);
        return prefix.size();
    }

    const LedgerStore& store() const { return *store_; }

private:
    // Caller holds the write lock (or is the constructor)
    void index(const LedgerEntry& e) {
        by_correlation_[e.correlation_id].push_back(e.sequence);
        if (e.corrects != 0) {
            latest_correction_[e.corrects] = e.sequence;
        }
    }

    std::shared_ptr<LedgerStore> store_;
    mutable std::shared_mutex mutex_;
    std::deque<LedgerEntry> entries_;
    std::unordered_map<std::string, std::vector<uint64_t>> by_correlation_;
    std::unordered_map<uint64_t, uint64_t> latest_correction_;
};

// Newest revision of each original entry in `entries`, in original order.
// Correction chains are followed within `entries` only, so a prefix sees
// the revisions it contains. An original whose newest revision is a
// Correction entry has been withdrawn and is left out.
inline std::vector<LedgerEntry> current_revisions(const std::vector<LedgerEntry>& entries) {
    std::unordered_map<uint64_t, size_t> position;
    std::unordered_map<uint64_t, uint64_t> corrected_by;
    for (size_t i = 0; i < entries.size(); ++i) {
        position[entries[i].sequence] = i;
        if (entries[i].corrects != 0) {
            auto& newest = corrected_by[entries[i].corrects];
            newest = std::max(newest, entries[i].sequence);
        }
    }

    std::vector<LedgerEntry> out;
    for (const auto& e : entries) {
        if (e.corrects != 0) continue;
        uint64_t current = e.sequence;
        for (auto it = corrected_by.find(current); it != corrected_by.end();
             it = corrected_by.find(current)) {
            current = it->second;
        }
        const LedgerEntry& newest = entries[position.at(current)];
        if (newest.kind == EntryKind::Correction) continue;
        out.push_back(newest);
    }
    return out;
}

inline std::optional<LedgerEntry> LedgerCursor::next() {
    if (next_ > end_) return std::nullopt;
    auto e = ledger_->get(next_);
    if (e) ++next_;
    return e;
}

} // namespace pramana
