#pragma once
// Calibration tracker: does stated confidence match observed accuracy?
//
// Each verified claim contributes (predicted confidence, actual outcome).
// Per producer, predictions are binned into fixed-width buckets over [0,1]
// and compared with how often they turned out right:
//   ece = Σ (n_b / N) · |accuracy_b − reference_b|
// A report never says "well calibrated" unless enough samples back it:
// the Hoeffding bound n ≥ bins · ln(2·bins/δ) / (2ε²) decides sufficiency.
// Small-sample accuracies carry Wilson score intervals.
//
// Samples live in an injected store. Trackers never share hidden state.

#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "confidence.hpp"
#include "ledger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace pramana {

struct CalibrationSample {
    ProducerId producer;
    ConfidenceValue predicted;
    bool actual = false;
    Timestamp verified_at = 0;
};

inline void to_json(json& j, const CalibrationSample& s) {
    j = json{
        {"producer", s.producer},
        {"predicted", s.predicted.to_json()},
        {"actual", s.actual},
        {"verified_at", s.verified_at},
    };
}

inline void from_json(const json& j, CalibrationSample& s) {
    try {
        s.producer = j.at("producer").get<std::string>();
        s.predicted = ConfidenceValue::from_json(j.at("predicted"));
        s.actual = j.at("actual").get<bool>();
        s.verified_at = j.value("verified_at", Timestamp(0));
    } catch (const json::exception& e) {
        throw LedgerError(std::string("calibration sample: ") + e.what());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Statistics
// ═══════════════════════════════════════════════════════════════════════════

// Two-sided standard normal quantile for a coverage level in (0,1)
inline double z_score(double level) {
    if (!(level > 0.0 && level < 1.0)) {
        throw ConfigError("interval level must be in (0,1)");
    }
    if (std::abs(level - 0.95) < 0.001) return 1.959963984540054;
    if (std::abs(level - 0.99) < 0.001) return 2.5758293035489004;
    if (std::abs(level - 0.90) < 0.001) return 1.6448536269514729;

    // Abramowitz and Stegun 26.2.23, valid for 0.5 < p < 1
    double p = (1.0 + level) / 2.0;
    double t = std::sqrt(-2.0 * std::log(1.0 - p));
    constexpr double c0 = 2.515517, c1 = 0.802853, c2 = 0.010328;
    constexpr double d1 = 1.432788, d2 = 0.189269, d3 = 0.001308;
    return t - (c0 + c1 * t + c2 * t * t) / (1.0 + d1 * t + d2 * t * t + d3 * t * t * t);
}

// Wilson score interval; stays inside [0,1] and behaves near 0 and 1.
// No trials → the uninformative [0,1].
inline std::pair<double, double> wilson_interval(uint64_t successes, uint64_t trials,
                                                 double level = 0.95) {
    if (trials == 0) return {0.0, 1.0};
    if (successes > trials) {
        throw ConstructionError("wilson: successes exceed trials");
    }
    double z = z_score(level);
    double n = static_cast<double>(trials);
    double p = static_cast<double>(successes) / n;
    double z2 = z * z;
    double denom = 1.0 + z2 / n;
    double center = (p + z2 / (2.0 * n)) / denom;
    double margin = (z / denom) * std::sqrt(p * (1.0 - p) / n + z2 / (4.0 * n * n));
    return {std::max(0.0, center - margin), std::min(1.0, center + margin)};
}

// Hoeffding/PAC: samples needed so every bin's accuracy is within ε with
// probability 1-δ. bins = 1 gives ⌈ln(2/δ) / (2ε²)⌉.
inline uint64_t pac_min_samples(double epsilon, double delta, size_t bins = 1) {
    if (!(epsilon > 0.0 && epsilon < 1.0)) throw ConfigError("epsilon must be in (0,1)");
    if (!(delta > 0.0 && delta < 1.0)) throw ConfigError("delta must be in (0,1)");
    if (bins == 0) throw ConfigError("bins must be positive");
    double k = static_cast<double>(bins);
    return static_cast<uint64_t>(std::ceil(k * std::log(2.0 * k / delta) /
                                           (2.0 * epsilon * epsilon)));
}

// Inverse: the ε a sample count can guarantee (capped at 1)
inline double achievable_epsilon(uint64_t samples, double delta, size_t bins = 1) {
    if (samples == 0) return 1.0;
    double k = static_cast<double>(bins);
    double per_bin = static_cast<double>(samples) / k;
    return std::min(1.0, std::sqrt(std::log(2.0 * k / delta) / (2.0 * per_bin)));
}

// ═══════════════════════════════════════════════════════════════════════════
// Smooth ECE
// ═══════════════════════════════════════════════════════════════════════════

// Binned ECE jumps at bucket edges. Smooth ECE replaces the buckets with a
// kernel estimate: r(p) is the Nadaraya-Watson outcome rate near p, f(p)
// the prediction density, and
//   smooth_ece = ∫ |p − r(p)| f(p) dp / ∫ f(p) dp
// evaluated on an even grid over [0,1].

enum class KernelType : uint8_t {
    Gaussian = 0,
    Epanechnikov = 1,
};

struct SmoothEceOptions {
    double bandwidth = 0.0;           // 0 = Silverman's rule
    KernelType kernel = KernelType::Gaussian;
    size_t eval_points = 100;
};

inline double kernel_weight(KernelType kernel, double u) {
    if (kernel == KernelType::Epanechnikov) {
        return std::abs(u) > 1.0 ? 0.0 : 0.75 * (1.0 - u * u);
    }
    constexpr double inv_sqrt_2pi = 0.3989422804014327;
    return inv_sqrt_2pi * std::exp(-0.5 * u * u);
}

// h = 1.06 σ n^(-1/5), clamped to [0.01, 0.5] for data on [0,1]
inline double silverman_bandwidth(const std::vector<double>& xs) {
    if (xs.empty()) return 0.1;
    double n = static_cast<double>(xs.size());
    double mean = 0.0;
    for (double x : xs) mean += x;
    mean /= n;
    double var = 0.0;
    for (double x : xs) var += (x - mean) * (x - mean);
    var /= xs.size() > 1 ? n - 1.0 : 1.0;
    double h = 1.06 * std::sqrt(var) * std::pow(n, -0.2);
    return std::min(0.5, std::max(0.01, h));
}

// (predicted, actual) pairs. One sample gives |p − y|.
inline double smooth_ece(const std::vector<std::pair<double, bool>>& predictions,
                         const SmoothEceOptions& options = {}) {
    if (predictions.empty()) {
        throw ConstructionError("smooth ece: no predictions");
    }
    if (options.bandwidth < 0.0) throw ConfigError("smooth ece: negative bandwidth");
    if (options.eval_points == 0) throw ConfigError("smooth ece: no evaluation points");

    std::vector<double> probs;
    probs.reserve(predictions.size());
    for (const auto& [p, _] : predictions) probs.push_back(std::min(1.0, std::max(0.0, p)));
    if (predictions.size() == 1) {
        return std::abs(probs[0] - (predictions[0].second ? 1.0 : 0.0));
    }

    double h = options.bandwidth > 0.0 ? options.bandwidth : silverman_bandwidth(probs);
    double n = static_cast<double>(probs.size());
    double error = 0.0;
    double mass = 0.0;
    for (size_t i = 0; i <= options.eval_points; ++i) {
        double p = static_cast<double>(i) / static_cast<double>(options.eval_points);
        double weight_sum = 0.0;
        double outcome_sum = 0.0;
        for (size_t k = 0; k < probs.size(); ++k) {
            double w = kernel_weight(options.kernel, (p - probs[k]) / h);
            weight_sum += w;
            if (predictions[k].second) outcome_sum += w;
        }
        double density = weight_sum / (n * h);
        double reliability = weight_sum > 0.0 ? outcome_sum / weight_sum : p;
        error += std::abs(p - reliability) * density;
        mass += density;
    }
    return mass > 0.0 ? error / mass : 0.0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Report types
// ═══════════════════════════════════════════════════════════════════════════

enum class SufficiencyVerdict : uint8_t {
    Sufficient = 0,
    InsufficientData = 1,
};

enum class CalibrationClaim : uint8_t {
    WellCalibrated = 0,
    Miscalibrated = 1,
    Undetermined = 2,
};

inline const char* to_string(SufficiencyVerdict v) {
    return v == SufficiencyVerdict::Sufficient ? "sufficient" : "insufficient_data";
}

inline const char* to_string(CalibrationClaim c) {
    switch (c) {
        case CalibrationClaim::WellCalibrated: return "well_calibrated";
        case CalibrationClaim::Miscalibrated: return "miscalibrated";
        case CalibrationClaim::Undetermined: return "undetermined";
    }
    return "undetermined";
}

struct CalibrationBucket {
    double range_low = 0.0;
    double range_high = 0.0;
    double midpoint = 0.0;
    uint64_t sample_size = 0;
    uint64_t correct = 0;
    double observed_accuracy = 0.0;
    double stated_mean = 0.0;         // mean predicted value in the bucket
    double calibration_error = 0.0;   // |observed − reference|, 0 when empty
    double wilson_low = 0.0;
    double wilson_high = 1.0;
};

struct CalibrationReport {
    ProducerId producer_id;
    uint64_t sample_count = 0;        // binned samples
    uint64_t absent_count = 0;        // predictions that were Absent
    double ece = 0.0;
    double mce = 0.0;
    double smooth_ece = 0.0;          // kernel-smoothed, 0 without samples
    double brier_score = 0.0;
    double log_loss = 0.0;
    double overconfidence_ratio = 0.0;
    std::vector<CalibrationBucket> buckets;
    uint64_t required_samples = 0;    // PAC bound for the configured ε, δ
    uint64_t min_samples = 0;         // caller's floor
    double achievable_epsilon = 1.0;
    double accuracy = 0.0;            // over every outcome, Absent predictions included
    std::pair<double, double> accuracy_ci{0.0, 1.0};
    SufficiencyVerdict sufficiency_verdict = SufficiencyVerdict::InsufficientData;
    CalibrationClaim calibration_claim = CalibrationClaim::Undetermined;
    Timestamp computed_at = 0;

    bool sufficient() const { return sufficiency_verdict == SufficiencyVerdict::Sufficient; }
};

inline void to_json(json& j, const CalibrationBucket& b) {
    j = json{
        {"range", {b.range_low, b.range_high}},
        {"midpoint", b.midpoint},
        {"sample_size", b.sample_size},
        {"correct", b.correct},
        {"observed_accuracy", b.observed_accuracy},
        {"stated_mean", b.stated_mean},
        {"calibration_error", b.calibration_error},
        {"wilson", {b.wilson_low, b.wilson_high}},
    };
}

inline void to_json(json& j, const CalibrationReport& r) {
    json buckets = json::array();
    for (const auto& b : r.buckets) buckets.push_back(json(b));
    j = json{
        {"producer_id", r.producer_id},
        {"sample_count", r.sample_count},
        {"absent_count", r.absent_count},
        {"ece", r.ece},
        {"mce", r.mce},
        {"smooth_ece", r.smooth_ece},
        {"brier_score", r.brier_score},
        {"log_loss", r.log_loss},
        {"overconfidence_ratio", r.overconfidence_ratio},
        {"buckets", buckets},
        {"required_samples", r.required_samples},
        {"min_samples", r.min_samples},
        {"achievable_epsilon", r.achievable_epsilon},
        {"accuracy", r.accuracy},
        {"accuracy_ci", {r.accuracy_ci.first, r.accuracy_ci.second}},
        {"sufficiency_verdict", to_string(r.sufficiency_verdict)},
        {"calibration_claim", to_string(r.calibration_claim)},
        {"computed_at", r.computed_at},
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Stores
// ═══════════════════════════════════════════════════════════════════════════

class CalibrationStore {
public:
    virtual ~CalibrationStore() = default;

    // Returns an id for the recorded sample
    virtual uint64_t record(const CalibrationSample& sample) = 0;

    // Current samples for a producer, in recording order
    virtual std::vector<CalibrationSample> samples(const ProducerId& producer) const = 0;

    virtual std::vector<ProducerId> producers() const = 0;
};

class MemoryCalibrationStore : public CalibrationStore {
public:
    uint64_t record(const CalibrationSample& sample) override {
        std::unique_lock lock(mutex_);
        by_producer_[sample.producer].push_back(sample);
        return ++count_;
    }

    std::vector<CalibrationSample> samples(const ProducerId& producer) const override {
        std::shared_lock lock(mutex_);
        auto it = by_producer_.find(producer);
        if (it == by_producer_.end()) return {};
        return it->second;
    }

    std::vector<ProducerId> producers() const override {
        std::shared_lock lock(mutex_);
        std::vector<ProducerId> out;
        for (const auto& [p, _] : by_producer_) out.push_back(p);
        return out;
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<ProducerId, std::vector<CalibrationSample>> by_producer_;
    uint64_t count_ = 0;
};

// Outcomes as ledger entries. Samples are rebuilt from the ledger on every
// read: a correction of an outcome either replaces it (an outcome entry
// that corrects it) or withdraws it (a correction entry). Only the newest
// correction in a chain counts.
class LedgerCalibrationStore : public CalibrationStore {
public:
    explicit LedgerCalibrationStore(EvidenceLedger& ledger,
                                    std::string correlation_id = "calibration",
                                    std::string agent = "calibration-tracker")
        : ledger_(ledger), correlation_id_(std::move(correlation_id)), agent_(std::move(agent)) {}

    uint64_t record(const CalibrationSample& sample) override {
        return ledger_.append(EntryKind::Outcome, json(sample), correlation_id_, agent_);
    }

    uint64_t replace(uint64_t outcome_sequence, const CalibrationSample& sample) {
        require_outcome(outcome_sequence);
        return ledger_.correct(outcome_sequence, EntryKind::Outcome, json(sample), agent_);
    }

    uint64_t retract(uint64_t outcome_sequence, const std::string& reason) {
        require_outcome(outcome_sequence);
        return ledger_.correct(outcome_sequence, EntryKind::Correction,
                               {{"retracted", true}, {"reason", reason}}, agent_);
    }

    std::vector<CalibrationSample> samples(const ProducerId& producer) const override {
        std::vector<CalibrationSample> out;
        for (const auto& s : current()) {
            if (s.producer == producer) out.push_back(s);
        }
        return out;
    }

    std::vector<ProducerId> producers() const override {
        std::set<ProducerId> seen;
        for (const auto& s : current()) seen.insert(s.producer);
        return {seen.begin(), seen.end()};
    }

private:
    void require_outcome(uint64_t seq) const {
        auto e = ledger_.get(seq);
        if (!e || e->kind != EntryKind::Outcome) {
            throw LedgerError("entry " + std::to_string(seq) + " is not an outcome");
        }
    }

    // Newest revision of every outcome in the correlation, withdrawn ones left out
    std::vector<CalibrationSample> current() const {
        std::vector<CalibrationSample> out;
        for (const auto& e : current_revisions(ledger_.correlate(correlation_id_))) {
            if (e.kind != EntryKind::Outcome) continue;
            out.push_back(e.payload.get<CalibrationSample>());
        }
        return out;
    }

    EvidenceLedger& ledger_;
    std::string correlation_id_;
    std::string agent_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Tracker
// ═══════════════════════════════════════════════════════════════════════════

class CalibrationTracker {
public:
    explicit CalibrationTracker(CalibrationStore& store, CalibrationConfig config = {})
        : store_(store), config_(config) {
        if (config_.bucket_count == 0) throw ConfigError("bucket_count must be positive");
    }

    uint64_t record_outcome(const ProducerId& producer, const ConfidenceValue& predicted,
                            bool actual, Timestamp verified_at = 0) {
        CalibrationSample s;
        s.producer = producer;
        s.predicted = predicted;
        s.actual = actual;
        s.verified_at = verified_at != 0 ? verified_at : now();
        return store_.record(s);
    }

    // floor(p·k); p = 1 lands in the last bucket
    size_t bucket_index(double p) const {
        size_t k = config_.bucket_count;
        auto idx = static_cast<size_t>(std::floor(p * static_cast<double>(k)));
        return std::min(idx, k - 1);
    }

    CalibrationReport report(const ProducerId& producer, uint64_t min_samples = 0) const {
        const size_t k = config_.bucket_count;
        std::vector<CalibrationSample> samples = store_.samples(producer);

        CalibrationReport r;
        r.producer_id = producer;
        r.min_samples = min_samples;
        r.computed_at = now();
        r.buckets.resize(k);
        for (size_t i = 0; i < k; ++i) {
            auto& b = r.buckets[i];
            b.range_low = static_cast<double>(i) / static_cast<double>(k);
            b.range_high = static_cast<double>(i + 1) / static_cast<double>(k);
            b.midpoint = (2.0 * static_cast<double>(i) + 1.0) / (2.0 * static_cast<double>(k));
        }

        std::vector<double> predicted_sum(k, 0.0);
        std::vector<std::pair<double, bool>> scored;
        uint64_t correct_total = 0;
        uint64_t overconfident = 0;
        double brier = 0.0;
        double log_loss = 0.0;
        constexpr double eps = 1e-15;

        for (const auto& s : samples) {
            if (s.actual) ++correct_total;
            auto p = s.predicted.point_value();
            if (!p) {
                ++r.absent_count;
                continue;
            }
            double y = s.actual ? 1.0 : 0.0;
            size_t idx = bucket_index(*p);
            auto& b = r.buckets[idx];
            ++b.sample_size;
            if (s.actual) ++b.correct;
            predicted_sum[idx] += *p;
            scored.emplace_back(*p, s.actual);
            ++r.sample_count;

            if (*p > y) ++overconfident;
            brier += (*p - y) * (*p - y);
            double pc = std::min(std::max(*p, eps), 1.0 - eps);
            log_loss -= y * std::log(pc) + (1.0 - y) * std::log(1.0 - pc);
        }

        double n = static_cast<double>(r.sample_count);
        for (size_t i = 0; i < k; ++i) {
            auto& b = r.buckets[i];
            auto [lo, hi] = wilson_interval(b.correct, b.sample_size, config_.interval_level);
            b.wilson_low = lo;
            b.wilson_high = hi;
            if (b.sample_size == 0) continue;
            double bn = static_cast<double>(b.sample_size);
            b.observed_accuracy = static_cast<double>(b.correct) / bn;
            b.stated_mean = predicted_sum[i] / bn;
            double reference = config_.ece_reference == EceReference::StatedMean
                ? b.stated_mean : b.midpoint;
            b.calibration_error = std::abs(b.observed_accuracy - reference);
            r.ece += (bn / n) * b.calibration_error;
            r.mce = std::max(r.mce, b.calibration_error);
        }

        if (r.sample_count > 0) {
            SmoothEceOptions smooth;
            smooth.bandwidth = config_.smooth_bandwidth;
            r.smooth_ece = pramana::smooth_ece(scored, smooth);
            r.brier_score = brier / n;
            r.log_loss = log_loss / n;
            r.overconfidence_ratio = static_cast<double>(overconfident) / n;
        }

        uint64_t outcomes = samples.size();
        if (outcomes > 0) {
            r.accuracy = static_cast<double>(correct_total) / static_cast<double>(outcomes);
        }
        r.accuracy_ci = wilson_interval(correct_total, outcomes, config_.interval_level);

        r.required_samples = pac_min_samples(config_.epsilon, config_.delta);
        r.achievable_epsilon = achievable_epsilon(r.sample_count, config_.delta);
        uint64_t needed = std::max(min_samples, r.required_samples);
        if (r.sample_count >= needed) {
            r.sufficiency_verdict = SufficiencyVerdict::Sufficient;
            r.calibration_claim = r.ece <= config_.ece_threshold
                ? CalibrationClaim::WellCalibrated
                : CalibrationClaim::Miscalibrated;
        } else {
            r.sufficiency_verdict = SufficiencyVerdict::InsufficientData;
            r.calibration_claim = CalibrationClaim::Undetermined;
        }

        log_debug("calibration", "%s: n=%llu absent=%llu ece=%.4f verdict=%s claim=%s",
                  producer.c_str(), static_cast<unsigned long long>(r.sample_count),
                  static_cast<unsigned long long>(r.absent_count), r.ece,
                  to_string(r.sufficiency_verdict), to_string(r.calibration_claim));
        return r;
    }

    // Producer accuracy as a Measured value; Absent when nothing is recorded
    ConfidenceValue measured_accuracy(const ProducerId& producer) const {
        std::vector<CalibrationSample> samples = store_.samples(producer);
        if (samples.empty()) {
            return ConfidenceValue::absent(AbsentReason::InsufficientData);
        }
        uint64_t correct = 0;
        for (const auto& s : samples) {
            if (s.actual) ++correct;
        }
        double acc = static_cast<double>(correct) / static_cast<double>(samples.size());
        auto [lo, hi] = wilson_interval(correct, samples.size(), config_.interval_level);
        return ConfidenceValue::measured(acc, "calibration:" + producer, samples.size(), acc,
                                         std::min(lo, acc), std::max(hi, acc));
    }

    std::vector<CalibrationReport> report_all(uint64_t min_samples = 0) const {
        std::vector<CalibrationReport> out;
        for (const auto& p : store_.producers()) out.push_back(report(p, min_samples));
        return out;
    }

    // Record a computed report in the ledger
    uint64_t publish(EvidenceLedger& ledger, const CalibrationReport& report,
                     const std::string& correlation_id = "calibration",
                     const std::string& agent = "calibration-tracker") const {
        return ledger.append(EntryKind::Calibration, json(report), correlation_id, agent);
    }

    // Atomic write of a report as JSON
    bool save_report(const std::string& path, const CalibrationReport& report) const {
        return safe_save_text(path, json(report).dump(2));
    }

    const CalibrationConfig& config() const { return config_; }

private:
    CalibrationStore& store_;
    CalibrationConfig config_;
};

} // namespace pramana
