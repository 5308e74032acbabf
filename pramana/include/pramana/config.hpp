#pragma once
// Configuration: plain structs with defaults, optionally read from JSON
// and overridden from the environment.

#include "log.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace pramana {

using json = nlohmann::json;

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// How Absent participates in meet and in derivations.
// Strict is the default: Absent absorbs. Neutral treats it as the identity
// of the operation (and marks derivations degraded).
enum class AbsentPolicy : uint8_t {
    Strict = 0,
    Neutral = 1,
};

// What a bucket's accuracy is compared against when computing ECE
enum class EceReference : uint8_t {
    Midpoint = 0,    // centre of the bucket's range
    StatedMean = 1,  // mean predicted confidence within the bucket
};

struct DerivationOptions {
    AbsentPolicy absent_policy = AbsentPolicy::Strict;
};

struct ResolutionConfig {
    size_t max_iterations = 1000;     // hard cap on double-step Kleene iterations
    size_t max_reported_cycles = 64;  // disclosure cap, not a search cap
    double defeat_threshold = 0.05;   // effective conservative value at/below → defeated
};

// Defeat passed along claim dependencies
struct PropagationConfig {
    size_t max_depth = 10;            // levels walked past the defeated claim
    double direct_strength = 0.3;     // defeater strength one level out
    double indirect_strength = 0.15;  // and further out
};

struct CalibrationConfig {
    size_t bucket_count = 10;
    double epsilon = 0.1;             // PAC half-width
    double delta = 0.05;              // PAC failure probability
    double ece_threshold = 0.1;       // at/below → well calibrated (given sufficient data)
    double interval_level = 0.95;     // Wilson interval coverage
    EceReference ece_reference = EceReference::Midpoint;
    double smooth_bandwidth = 0.0;    // kernel bandwidth for smooth ECE, 0 = Silverman's rule
};

struct LedgerConfig {
    std::string path;                 // empty = in-memory ledger
    bool fsync = true;                // fsync after every append
};

struct Config {
    DerivationOptions derivation;
    ResolutionConfig resolution;
    PropagationConfig propagation;
    CalibrationConfig calibration;
    LedgerConfig ledger;
    bool verbose = false;

    // Reject values no computation could honour
    void validate() const {
        if (resolution.defeat_threshold < 0.0 || resolution.defeat_threshold > 1.0) {
            throw ConfigError("resolution.defeat_threshold must be in [0,1]");
        }
        if (propagation.max_depth == 0) {
            throw ConfigError("propagation.max_depth must be positive");
        }
        if (propagation.direct_strength < 0.0 || propagation.direct_strength > 1.0) {
            throw ConfigError("propagation.direct_strength must be in [0,1]");
        }
        if (propagation.indirect_strength < 0.0 || propagation.indirect_strength > 1.0) {
            throw ConfigError("propagation.indirect_strength must be in [0,1]");
        }
        if (calibration.bucket_count == 0) {
            throw ConfigError("calibration.bucket_count must be positive");
        }
        if (!(calibration.epsilon > 0.0 && calibration.epsilon < 1.0)) {
            throw ConfigError("calibration.epsilon must be in (0,1)");
        }
        if (!(calibration.delta > 0.0 && calibration.delta < 1.0)) {
            throw ConfigError("calibration.delta must be in (0,1)");
        }
        if (calibration.ece_threshold < 0.0 || calibration.ece_threshold > 1.0) {
            throw ConfigError("calibration.ece_threshold must be in [0,1]");
        }
        if (!(calibration.interval_level > 0.0 && calibration.interval_level < 1.0)) {
            throw ConfigError("calibration.interval_level must be in (0,1)");
        }
        if (calibration.smooth_bandwidth < 0.0) {
            throw ConfigError("calibration.smooth_bandwidth must not be negative");
        }
    }

    static Config from_json(const json& j) {
        Config c;
        try {
            if (j.contains("derivation")) {
                const auto& d = j.at("derivation");
                if (d.contains("absent_policy")) {
                    std::string p = d.at("absent_policy").get<std::string>();
                    if (p == "strict") c.derivation.absent_policy = AbsentPolicy::Strict;
                    else if (p == "neutral") c.derivation.absent_policy = AbsentPolicy::Neutral;
                    else throw ConfigError("derivation.absent_policy: unknown value '" + p + "'");
                }
            }
            if (j.contains("resolution")) {
                const auto& r = j.at("resolution");
                c.resolution.max_iterations = r.value("max_iterations", c.resolution.max_iterations);
                c.resolution.max_reported_cycles =
                    r.value("max_reported_cycles", c.resolution.max_reported_cycles);
                c.resolution.defeat_threshold = r.value("defeat_threshold", c.resolution.defeat_threshold);
            }
            if (j.contains("propagation")) {
                const auto& p = j.at("propagation");
                c.propagation.max_depth = p.value("max_depth", c.propagation.max_depth);
                c.propagation.direct_strength = p.value("direct_strength", c.propagation.direct_strength);
                c.propagation.indirect_strength =
                    p.value("indirect_strength", c.propagation.indirect_strength);
            }
            if (j.contains("calibration")) {
                const auto& k = j.at("calibration");
                c.calibration.bucket_count = k.value("bucket_count", c.calibration.bucket_count);
                c.calibration.epsilon = k.value("epsilon", c.calibration.epsilon);
                c.calibration.delta = k.value("delta", c.calibration.delta);
                c.calibration.ece_threshold = k.value("ece_threshold", c.calibration.ece_threshold);
                c.calibration.interval_level = k.value("interval_level", c.calibration.interval_level);
                c.calibration.smooth_bandwidth =
                    k.value("smooth_bandwidth", c.calibration.smooth_bandwidth);
                if (k.contains("ece_reference")) {
                    std::string ref = k.at("ece_reference").get<std::string>();
                    if (ref == "midpoint") c.calibration.ece_reference = EceReference::Midpoint;
                    else if (ref == "stated_mean") c.calibration.ece_reference = EceReference::StatedMean;
                    else throw ConfigError("calibration.ece_reference: unknown value '" + ref + "'");
                }
            }
            if (j.contains("ledger")) {
                const auto& l = j.at("ledger");
                c.ledger.path = l.value("path", c.ledger.path);
                c.ledger.fsync = l.value("fsync", c.ledger.fsync);
            }
            c.verbose = j.value("verbose", c.verbose);
        } catch (const json::exception& e) {
            throw ConfigError(std::string("config: ") + e.what());
        }
        c.validate();
        return c;
    }

    static Config load(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw ConfigError("config: cannot open " + path);
        }
        json j;
        try {
            in >> j;
        } catch (const json::parse_error& e) {
            throw ConfigError("config: " + path + ": " + e.what());
        }
        return from_json(j);
    }

    // Push process-wide settings (debug logging) into effect
    const Config& apply() const {
        set_verbose(verbose);
        return *this;
    }

    // Environment overrides: PRAMANA_LEDGER_PATH, PRAMANA_MAX_ITERATIONS, PRAMANA_VERBOSE
    Config& apply_env() {
        if (const char* p = std::getenv("PRAMANA_LEDGER_PATH")) {
            ledger.path = p;
        }
        if (const char* it = std::getenv("PRAMANA_MAX_ITERATIONS")) {
            char* end = nullptr;
            unsigned long long v = std::strtoull(it, &end, 10);
            if (end == it || *end != '\0') {
                throw ConfigError(std::string("PRAMANA_MAX_ITERATIONS: not a number: ") + it);
            }
            resolution.max_iterations = static_cast<size_t>(v);
        }
        if (const char* v = std::getenv("PRAMANA_VERBOSE")) {
            verbose = v[0] != '\0' && std::string(v) != "0";
        }
        validate();
        return *this;
    }
};

} // namespace pramana
