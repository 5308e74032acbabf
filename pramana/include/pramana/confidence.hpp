#pragma once
// Confidence algebra: typed degrees of belief
//
// A confidence value is exactly one of five shapes:
// - Deterministic: logically certain, 1.0 or 0.0, with a reason
// - Derived: computed from named inputs by a known combinator
// - Measured: an empirical rate with its dataset, n and interval
// - Bounded: an interval estimate with its basis
// - Absent: explicitly unknown, never a number
//
// Values form a bounded lattice under a total order. meet and join select
// one of their arguments, so the laws hold exactly for every value.

#include "types.hpp"
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdio>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace pramana {

using json = nlohmann::json;

// Invariant violated while creating a value
class ConstructionError : public std::invalid_argument {
public:
    explicit ConstructionError(const std::string& what) : std::invalid_argument(what) {}
};

// Ordered from best to worst; combining takes the maximum
enum class CalibrationStatus : uint8_t {
    Preserved = 0,
    Unknown = 1,
    Degraded = 2,
};

enum class BoundBasis : uint8_t {
    Theoretical = 0,
    Literature = 1,
    FormalAnalysis = 2,
    Estimated = 3,
};

enum class AbsentReason : uint8_t {
    Uncalibrated = 0,
    InsufficientData = 1,
    NotApplicable = 2,
};

// Variant index order doubles as the tie-break rank at equal value
enum class ConfidenceKind : uint8_t {
    Absent = 0,
    Bounded = 1,
    Derived = 2,
    Measured = 3,
    Deterministic = 4,
};

inline const char* to_string(CalibrationStatus s) {
    switch (s) {
        case CalibrationStatus::Preserved: return "preserved";
        case CalibrationStatus::Unknown: return "unknown";
        case CalibrationStatus::Degraded: return "degraded";
    }
    return "unknown";
}

inline const char* to_string(BoundBasis b) {
    switch (b) {
        case BoundBasis::Theoretical: return "theoretical";
        case BoundBasis::Literature: return "literature";
        case BoundBasis::FormalAnalysis: return "formal_analysis";
        case BoundBasis::Estimated: return "estimated";
    }
    return "estimated";
}

inline const char* to_string(AbsentReason r) {
    switch (r) {
        case AbsentReason::Uncalibrated: return "uncalibrated";
        case AbsentReason::InsufficientData: return "insufficient_data";
        case AbsentReason::NotApplicable: return "not_applicable";
    }
    return "uncalibrated";
}

inline const char* to_string(ConfidenceKind k) {
    switch (k) {
        case ConfidenceKind::Absent: return "absent";
        case ConfidenceKind::Bounded: return "bounded";
        case ConfidenceKind::Derived: return "derived";
        case ConfidenceKind::Measured: return "measured";
        case ConfidenceKind::Deterministic: return "deterministic";
    }
    return "absent";
}

inline CalibrationStatus calibration_status_from_string(const std::string& s) {
    if (s == "preserved") return CalibrationStatus::Preserved;
    if (s == "unknown") return CalibrationStatus::Unknown;
    if (s == "degraded") return CalibrationStatus::Degraded;
    throw ConstructionError("unknown calibration_status '" + s + "'");
}

inline BoundBasis bound_basis_from_string(const std::string& s) {
    if (s == "theoretical") return BoundBasis::Theoretical;
    if (s == "literature") return BoundBasis::Literature;
    if (s == "formal_analysis") return BoundBasis::FormalAnalysis;
    if (s == "estimated") return BoundBasis::Estimated;
    throw ConstructionError("unknown bound basis '" + s + "'");
}

inline AbsentReason absent_reason_from_string(const std::string& s) {
    if (s == "uncalibrated") return AbsentReason::Uncalibrated;
    if (s == "insufficient_data") return AbsentReason::InsufficientData;
    if (s == "not_applicable") return AbsentReason::NotApplicable;
    throw ConstructionError("unknown absent reason '" + s + "'");
}

inline CalibrationStatus worst(CalibrationStatus a, CalibrationStatus b) {
    return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b) ? a : b;
}

class ConfidenceValue;
class DerivationProof;
class DerivationBuilder;

// Passkey: only the derivation builder can mint one, so only it can attach
// a proof to a value or construct a DerivationProof.
class ProofKey {
    ProofKey() {}
    friend class DerivationBuilder;
};

struct NamedInput {
    std::string name;
    std::shared_ptr<const ConfidenceValue> value;
};

struct Deterministic {
    bool value = false;
    std::string reason;
};

struct Derived {
    double value = 0.0;
    std::string formula;
    std::vector<NamedInput> inputs;
    CalibrationStatus calibration_status = CalibrationStatus::Unknown;
    std::shared_ptr<const DerivationProof> proof;  // null unless built by DerivationBuilder
};

struct Measured {
    double value = 0.0;
    std::string dataset_id;
    uint64_t sample_size = 0;
    double accuracy = 0.0;
    double ci_low = 0.0;   // 95% interval
    double ci_high = 1.0;
};

struct Bounded {
    double low = 0.0;
    double high = 1.0;
    BoundBasis basis = BoundBasis::Estimated;
    std::string citation;
};

struct Absent {
    AbsentReason reason = AbsentReason::Uncalibrated;
};

namespace detail {

inline void check_unit(double v, const char* field) {
    if (std::isnan(v)) {
        throw ConstructionError(std::string(field) + " is NaN");
    }
    if (v < 0.0 || v > 1.0) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "%s = %.17g outside [0,1]", field, v);
        throw ConstructionError(buf);
    }
}

template <typename T>
int cmp3(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

} // namespace detail

class ConfidenceValue {
public:
    using Variant = std::variant<Absent, Bounded, Derived, Measured, Deterministic>;

    // Absent(uncalibrated): the honest default
    ConfidenceValue() : v_(Absent{}) {}

    // ═══════════════════════════════════════════════════════════════════
    // Factories: each validates its invariants, never clamps
    // ═══════════════════════════════════════════════════════════════════

    static ConfidenceValue deterministic(bool value, std::string reason = "") {
        return ConfidenceValue(Deterministic{value, std::move(reason)});
    }

    // Unproven Derived value. Only DerivationBuilder produces proven ones.
    static ConfidenceValue derived(double value, std::string formula,
                                   std::vector<NamedInput> inputs,
                                   CalibrationStatus status) {
        Derived d;
        d.value = value;
        d.formula = std::move(formula);
        d.inputs = std::move(inputs);
        d.calibration_status = status;
        return from_derived(std::move(d));
    }

    static ConfidenceValue measured(double value, std::string dataset_id,
                                    uint64_t sample_size, double accuracy,
                                    double ci_low, double ci_high) {
        detail::check_unit(value, "measured.value");
        detail::check_unit(accuracy, "measured.accuracy");
        detail::check_unit(ci_low, "measured.ci_low");
        detail::check_unit(ci_high, "measured.ci_high");
        if (ci_low > ci_high) {
            throw ConstructionError("measured: ci_low > ci_high");
        }
        return ConfidenceValue(Measured{value, std::move(dataset_id), sample_size,
                                        accuracy, ci_low, ci_high});
    }

    static ConfidenceValue bounded(double low, double high,
                                   BoundBasis basis = BoundBasis::Estimated,
                                   std::string citation = "") {
        detail::check_unit(low, "bounded.low");
        detail::check_unit(high, "bounded.high");
        if (low > high) {
            throw ConstructionError("bounded: low > high");
        }
        return ConfidenceValue(Bounded{low, high, basis, std::move(citation)});
    }

    static ConfidenceValue absent(AbsentReason reason = AbsentReason::Uncalibrated) {
        return ConfidenceValue(Absent{reason});
    }

    // Attach a proof. Requires a ProofKey.
    static ConfidenceValue proven(ProofKey, Derived d) {
        return from_derived(std::move(d));
    }

    // ═══════════════════════════════════════════════════════════════════
    // Inspection
    // ═══════════════════════════════════════════════════════════════════

    ConfidenceKind kind() const { return static_cast<ConfidenceKind>(v_.index()); }
    bool is_absent() const { return kind() == ConfidenceKind::Absent; }

    template <typename T>
    const T* get_if() const { return std::get_if<T>(&v_); }

    template <typename T>
    const T& as() const { return std::get<T>(v_); }

    const Variant& variant() const { return v_; }

    bool is_proven() const {
        const Derived* d = get_if<Derived>();
        return d != nullptr && d->proof != nullptr;
    }

    // Single representative number. Bounded → midpoint. Absent → none.
    std::optional<double> point_value() const {
        switch (kind()) {
            case ConfidenceKind::Absent: return std::nullopt;
            case ConfidenceKind::Bounded: {
                const auto& b = as<Bounded>();
                return (b.low + b.high) / 2.0;
            }
            case ConfidenceKind::Derived: return as<Derived>().value;
            case ConfidenceKind::Measured: return as<Measured>().value;
            case ConfidenceKind::Deterministic: return as<Deterministic>().value ? 1.0 : 0.0;
        }
        return std::nullopt;
    }

    // Conservative number. Bounded → low bound. Absent → none.
    std::optional<double> conservative_value() const {
        if (const Bounded* b = get_if<Bounded>()) return b->low;
        return point_value();
    }

    json to_json() const;
    static ConfidenceValue from_json(const json& j);

    friend bool operator==(const ConfidenceValue& a, const ConfidenceValue& b);
    friend bool operator!=(const ConfidenceValue& a, const ConfidenceValue& b) { return !(a == b); }

private:
    explicit ConfidenceValue(Variant v) : v_(std::move(v)) {}

    static ConfidenceValue from_derived(Derived d) {
        detail::check_unit(d.value, "derived.value");
        if (d.formula.empty()) {
            throw ConstructionError("derived: empty formula");
        }
        for (const auto& in : d.inputs) {
            if (!in.value) {
                throw ConstructionError("derived: input '" + in.name + "' has no value");
            }
        }
        return ConfidenceValue(std::move(d));
    }

    Variant v_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Equality and the lattice order
// ═══════════════════════════════════════════════════════════════════════════

inline bool operator==(const ConfidenceValue& a, const ConfidenceValue& b) {
    if (a.kind() != b.kind()) return false;
    switch (a.kind()) {
        case ConfidenceKind::Absent:
            return a.as<Absent>().reason == b.as<Absent>().reason;
        case ConfidenceKind::Bounded: {
            const auto& x = a.as<Bounded>();
            const auto& y = b.as<Bounded>();
            return x.low == y.low && x.high == y.high && x.basis == y.basis &&
                   x.citation == y.citation;
        }
        case ConfidenceKind::Derived: {
            const auto& x = a.as<Derived>();
            const auto& y = b.as<Derived>();
            if (x.value != y.value || x.formula != y.formula ||
                x.calibration_status != y.calibration_status ||
                (x.proof != nullptr) != (y.proof != nullptr) ||
                x.inputs.size() != y.inputs.size()) {
                return false;
            }
            for (size_t i = 0; i < x.inputs.size(); ++i) {
                if (x.inputs[i].name != y.inputs[i].name) return false;
                if (!(*x.inputs[i].value == *y.inputs[i].value)) return false;
            }
            return true;
        }
        case ConfidenceKind::Measured: {
            const auto& x = a.as<Measured>();
            const auto& y = b.as<Measured>();
            return x.value == y.value && x.dataset_id == y.dataset_id &&
                   x.sample_size == y.sample_size && x.accuracy == y.accuracy &&
                   x.ci_low == y.ci_low && x.ci_high == y.ci_high;
        }
        case ConfidenceKind::Deterministic: {
            const auto& x = a.as<Deterministic>();
            const auto& y = b.as<Deterministic>();
            return x.value == y.value && x.reason == y.reason;
        }
    }
    return false;
}

// Total order: <0, 0, >0. Zero exactly when a == b.
//   Absent < every numeric value
//   numeric values by conservative value, then by kind rank
//   (Bounded < Derived < Measured < Deterministic), then field by field.
// Deterministic reasons compare descending so that top() is the maximum.
inline int compare(const ConfidenceValue& a, const ConfidenceValue& b) {
    using detail::cmp3;
    bool aa = a.is_absent(), ba = b.is_absent();
    if (aa || ba) {
        if (aa && ba) {
            return cmp3(static_cast<int>(a.as<Absent>().reason),
                        static_cast<int>(b.as<Absent>().reason));
        }
        return aa ? -1 : 1;
    }

    if (int c = cmp3(*a.conservative_value(), *b.conservative_value())) return c;
    if (int c = cmp3(static_cast<int>(a.kind()), static_cast<int>(b.kind()))) return c;

    switch (a.kind()) {
        case ConfidenceKind::Bounded: {
            const auto& x = a.as<Bounded>();
            const auto& y = b.as<Bounded>();
            if (int c = cmp3(x.high, y.high)) return c;
            if (int c = cmp3(static_cast<int>(x.basis), static_cast<int>(y.basis))) return c;
            return cmp3(x.citation, y.citation);
        }
        case ConfidenceKind::Derived: {
            const auto& x = a.as<Derived>();
            const auto& y = b.as<Derived>();
            if (int c = cmp3(x.formula, y.formula)) return c;
            if (int c = cmp3(static_cast<int>(x.calibration_status),
                             static_cast<int>(y.calibration_status))) return c;
            if (int c = cmp3(x.proof != nullptr, y.proof != nullptr)) return c;
            if (int c = cmp3(x.inputs.size(), y.inputs.size())) return c;
            for (size_t i = 0; i < x.inputs.size(); ++i) {
                if (int c = cmp3(x.inputs[i].name, y.inputs[i].name)) return c;
                if (int c = compare(*x.inputs[i].value, *y.inputs[i].value)) return c;
            }
            return 0;
        }
        case ConfidenceKind::Measured: {
            const auto& x = a.as<Measured>();
            const auto& y = b.as<Measured>();
            if (int c = cmp3(x.dataset_id, y.dataset_id)) return c;
            if (int c = cmp3(x.sample_size, y.sample_size)) return c;
            if (int c = cmp3(x.accuracy, y.accuracy)) return c;
            if (int c = cmp3(x.ci_low, y.ci_low)) return c;
            return cmp3(x.ci_high, y.ci_high);
        }
        case ConfidenceKind::Deterministic:
            return cmp3(b.as<Deterministic>().reason, a.as<Deterministic>().reason);
        case ConfidenceKind::Absent:
            break;
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Lattice operations
// ═══════════════════════════════════════════════════════════════════════════

inline ConfidenceValue top() { return ConfidenceValue::deterministic(true, ""); }
inline ConfidenceValue bottom() { return ConfidenceValue::absent(AbsentReason::Uncalibrated); }

// AND / sequential composition: the lesser argument, unchanged.
// Strict: Absent absorbs. Neutral: Absent is the identity.
inline ConfidenceValue meet(const ConfidenceValue& a, const ConfidenceValue& b,
                            AbsentPolicy policy = AbsentPolicy::Strict) {
    if (policy == AbsentPolicy::Neutral && a.is_absent() != b.is_absent()) {
        return a.is_absent() ? b : a;
    }
    return compare(a, b) <= 0 ? a : b;
}

// OR / disjunctive composition: the greater argument, unchanged.
// For independent evidence use join_independent (noisy-or) instead.
inline ConfidenceValue join(const ConfidenceValue& a, const ConfidenceValue& b) {
    return compare(a, b) >= 0 ? a : b;
}

inline ConfidenceValue meet_all(const std::vector<ConfidenceValue>& values,
                                AbsentPolicy policy = AbsentPolicy::Strict) {
    ConfidenceValue acc = top();
    for (const auto& v : values) acc = meet(acc, v, policy);
    return acc;
}

inline ConfidenceValue join_all(const std::vector<ConfidenceValue>& values) {
    ConfidenceValue acc = bottom();
    for (const auto& v : values) acc = join(acc, v);
    return acc;
}

// Absent never meets a threshold
inline bool meets_threshold(const ConfidenceValue& v, double threshold) {
    auto c = v.conservative_value();
    return c.has_value() && *c >= threshold;
}

// Human-readable status line
inline std::string describe(const ConfidenceValue& v) {
    char buf[256];
    switch (v.kind()) {
        case ConfidenceKind::Absent:
            return std::string("absent (") + to_string(v.as<Absent>().reason) + ")";
        case ConfidenceKind::Bounded: {
            const auto& b = v.as<Bounded>();
            std::snprintf(buf, sizeof(buf), "bounded [%.3f, %.3f] (%s)",
                          b.low, b.high, to_string(b.basis));
            std::string out = buf;
            if (!b.citation.empty()) out += " " + b.citation;
            return out;
        }
        case ConfidenceKind::Derived: {
            const auto& d = v.as<Derived>();
            std::snprintf(buf, sizeof(buf), "derived %.3f = ", d.value);
            return buf + d.formula + " [" + to_string(d.calibration_status) +
                   (d.proof ? ", proven]" : "]");
        }
        case ConfidenceKind::Measured: {
            const auto& m = v.as<Measured>();
            std::snprintf(buf, sizeof(buf), "measured %.3f (n=%llu, ci95 [%.3f, %.3f])",
                          m.value, static_cast<unsigned long long>(m.sample_size),
                          m.ci_low, m.ci_high);
            std::string out = buf;
            if (!m.dataset_id.empty()) out += " " + m.dataset_id;
            return out;
        }
        case ConfidenceKind::Deterministic: {
            const auto& d = v.as<Deterministic>();
            std::string out = d.value ? "certain true" : "certain false";
            if (!d.reason.empty()) out += " (" + d.reason + ")";
            return out;
        }
    }
    return "absent";
}

// ═══════════════════════════════════════════════════════════════════════════
// JSON: { "type": ..., ...fields }
// ═══════════════════════════════════════════════════════════════════════════

inline json ConfidenceValue::to_json() const {
    json j;
    j["type"] = pramana::to_string(kind());
    switch (kind()) {
        case ConfidenceKind::Absent:
            j["reason"] = pramana::to_string(as<Absent>().reason);
            break;
        case ConfidenceKind::Bounded: {
            const auto& b = as<Bounded>();
            j["low"] = b.low;
            j["high"] = b.high;
            j["basis"] = pramana::to_string(b.basis);
            if (!b.citation.empty()) j["citation"] = b.citation;
            break;
        }
        case ConfidenceKind::Derived: {
            const auto& d = as<Derived>();
            j["value"] = d.value;
            j["formula"] = d.formula;
            j["calibration_status"] = pramana::to_string(d.calibration_status);
            json inputs = json::array();
            for (const auto& in : d.inputs) {
                inputs.push_back({{"name", in.name}, {"value", in.value->to_json()}});
            }
            j["inputs"] = inputs;
            j["proven"] = d.proof != nullptr;
            break;
        }
        case ConfidenceKind::Measured: {
            const auto& m = as<Measured>();
            j["value"] = m.value;
            j["dataset_id"] = m.dataset_id;
            j["sample_size"] = m.sample_size;
            j["accuracy"] = m.accuracy;
            j["ci_95"] = {m.ci_low, m.ci_high};
            break;
        }
        case ConfidenceKind::Deterministic: {
            const auto& d = as<Deterministic>();
            j["value"] = d.value;
            j["reason"] = d.reason;
            break;
        }
    }
    return j;
}

// Validates every field. A parsed Derived value is never proven.
inline ConfidenceValue ConfidenceValue::from_json(const json& j) {
    try {
        if (!j.is_object()) {
            throw ConstructionError("confidence: expected object");
        }
        std::string type = j.at("type").get<std::string>();
        if (type == "absent") {
            return absent(absent_reason_from_string(j.value("reason", "uncalibrated")));
        }
        if (type == "bounded") {
            return bounded(j.at("low").get<double>(), j.at("high").get<double>(),
                           bound_basis_from_string(j.value("basis", "estimated")),
                           j.value("citation", ""));
        }
        if (type == "derived") {
            std::vector<NamedInput> inputs;
            for (const auto& in : j.value("inputs", json::array())) {
                inputs.push_back({in.at("name").get<std::string>(),
                                  std::make_shared<const ConfidenceValue>(
                                      from_json(in.at("value")))});
            }
            return derived(j.at("value").get<double>(), j.at("formula").get<std::string>(),
                           std::move(inputs),
                           calibration_status_from_string(
                               j.at("calibration_status").get<std::string>()));
        }
        if (type == "measured") {
            const auto& ci = j.at("ci_95");
            if (!ci.is_array() || ci.size() != 2) {
                throw ConstructionError("measured: ci_95 must be [low, high]");
            }
            if (!j.at("sample_size").is_number_unsigned()) {
                throw ConstructionError("measured: sample_size must be a non-negative integer");
            }
            return measured(j.at("value").get<double>(), j.value("dataset_id", ""),
                            j.at("sample_size").get<uint64_t>(),
                            j.at("accuracy").get<double>(),
                            ci[0].get<double>(), ci[1].get<double>());
        }
        if (type == "deterministic") {
            return deterministic(j.at("value").get<bool>(), j.value("reason", ""));
        }
        throw ConstructionError("confidence: unknown type '" + type + "'");
    } catch (const json::exception& e) {
        throw ConstructionError(std::string("confidence: ") + e.what());
    }
}

inline void to_json(json& j, const ConfidenceValue& v) { j = v.to_json(); }
inline void from_json(const json& j, ConfidenceValue& v) { v = ConfidenceValue::from_json(j); }

} // namespace pramana
