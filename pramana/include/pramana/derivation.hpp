#pragma once
// Derivation proof builder: confidence with an auditable formula
//
// A derived value records the formula that produced it and the named
// inputs it was computed from. Formulas are a closed tree of known
// combinators; every reference is checked before evaluation and nothing
// partial is ever returned.
//
// Calibration status table:
//   input:        Deterministic, Measured → preserved
//                 Derived → its own status
//                 Bounded, neutralized Absent → degraded
//   min/max/sequence/complement → worst of the arguments
//   product/parallel/noisy_or/parallel_any → preserved only when every
//                 direct argument is a Measured input, else degraded
//   scale(k, x)   → degraded unless k == 1

#include "confidence.hpp"
#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pramana {

enum class Combinator : uint8_t {
    Input = 0,
    Meet = 1,         // min, arity 2
    Join = 2,         // max, arity 2
    NoisyOr = 3,      // 1-(1-a)(1-b), arity 2
    Product = 4,      // a*b, arity 2
    Sequence = 5,     // min over n >= 1
    Parallel = 6,     // product over n >= 1
    ParallelAny = 7,  // noisy-or over n >= 1
    Complement = 8,   // 1-x, arity 1
    Scale = 9,        // k*x, arity 1, k in [0,1]
};

inline const char* to_string(Combinator c) {
    switch (c) {
        case Combinator::Input: return "input";
        case Combinator::Meet: return "min";
        case Combinator::Join: return "max";
        case Combinator::NoisyOr: return "noisy_or";
        case Combinator::Product: return "product";
        case Combinator::Sequence: return "sequence";
        case Combinator::Parallel: return "parallel";
        case Combinator::ParallelAny: return "parallel_any";
        case Combinator::Complement: return "complement";
        case Combinator::Scale: return "scale";
    }
    return "input";
}

inline std::optional<Combinator> combinator_from_name(const std::string& name) {
    if (name == "min" || name == "meet") return Combinator::Meet;
    if (name == "max" || name == "join") return Combinator::Join;
    if (name == "noisy_or") return Combinator::NoisyOr;
    if (name == "product") return Combinator::Product;
    if (name == "sequence") return Combinator::Sequence;
    if (name == "parallel") return Combinator::Parallel;
    if (name == "parallel_any") return Combinator::ParallelAny;
    if (name == "complement" || name == "not") return Combinator::Complement;
    if (name == "scale") return Combinator::Scale;
    return std::nullopt;
}

// Accepted argument count; max_args == 0 means unbounded
struct Arity {
    size_t min_args;
    size_t max_args;
};

inline Arity arity_of(Combinator c) {
    switch (c) {
        case Combinator::Input: return {0, 0};
        case Combinator::Meet:
        case Combinator::Join:
        case Combinator::NoisyOr:
        case Combinator::Product: return {2, 2};
        case Combinator::Sequence:
        case Combinator::Parallel:
        case Combinator::ParallelAny: return {1, 0};
        case Combinator::Complement:
        case Combinator::Scale: return {1, 1};
    }
    return {0, 0};
}

inline bool is_product_family(Combinator c) {
    return c == Combinator::Product || c == Combinator::Parallel ||
           c == Combinator::NoisyOr || c == Combinator::ParallelAny;
}

// Combinators with an identity element can drop a neutralized Absent argument
inline bool has_identity(Combinator c) {
    return c != Combinator::Input && c != Combinator::Complement && c != Combinator::Scale;
}

// ═══════════════════════════════════════════════════════════════════════════
// Formula: closed tagged tree
// ═══════════════════════════════════════════════════════════════════════════

class Formula {
public:
    static Formula input(std::string name) {
        Formula f;
        f.op_ = Combinator::Input;
        f.name_ = std::move(name);
        return f;
    }

    static Formula apply(Combinator op, std::vector<Formula> args) {
        Formula f;
        f.op_ = op;
        f.args_ = std::move(args);
        return f;
    }

    static Formula scale(double factor, Formula arg) {
        Formula f;
        f.op_ = Combinator::Scale;
        f.factor_ = factor;
        f.args_.push_back(std::move(arg));
        return f;
    }

    Combinator op() const { return op_; }
    const std::string& name() const { return name_; }
    double factor() const { return factor_; }
    const std::vector<Formula>& args() const { return args_; }

    // Arity and factor checks over the whole tree; nullopt when well formed
    std::optional<std::string> check() const {
        if (op_ == Combinator::Input) {
            if (name_.empty()) return std::string("input with empty name");
            if (!args_.empty()) return std::string("input '" + name_ + "' has arguments");
            return std::nullopt;
        }
        Arity a = arity_of(op_);
        if (args_.size() < a.min_args || (a.max_args != 0 && args_.size() > a.max_args)) {
            std::string expect = a.max_args == 0
                ? "at least " + std::to_string(a.min_args)
                : std::to_string(a.min_args);
            return std::string(pramana::to_string(op_)) + " expects " + expect +
                   " argument(s), got " + std::to_string(args_.size());
        }
        if (op_ == Combinator::Scale && (std::isnan(factor_) || factor_ < 0.0 || factor_ > 1.0)) {
            return std::string("scale factor outside [0,1]");
        }
        for (const auto& arg : args_) {
            if (auto err = arg.check()) return err;
        }
        return std::nullopt;
    }

    // Referenced input names, unique, in order of first appearance
    std::vector<std::string> input_names() const {
        std::vector<std::string> out;
        collect(out);
        return out;
    }

    std::string to_string() const {
        if (op_ == Combinator::Input) return name_;
        std::string s = pramana::to_string(op_);
        s += "(";
        if (op_ == Combinator::Scale) {
            s += format_factor(factor_);
            s += ", ";
        }
        for (size_t i = 0; i < args_.size(); ++i) {
            if (i > 0) s += ", ";
            s += args_[i].to_string();
        }
        s += ")";
        return s;
    }

    json to_json() const {
        if (op_ == Combinator::Input) return {{"input", name_}};
        json j;
        j["op"] = pramana::to_string(op_);
        if (op_ == Combinator::Scale) j["factor"] = factor_;
        json args = json::array();
        for (const auto& a : args_) args.push_back(a.to_json());
        j["args"] = args;
        return j;
    }

    // Parse "min(x, noisy_or(y, z))". Arity is checked by check().
    static std::optional<Formula> parse(const std::string& text, std::string* error = nullptr);

private:
    Formula() = default;

    void collect(std::vector<std::string>& out) const {
        if (op_ == Combinator::Input) {
            for (const auto& n : out) {
                if (n == name_) return;
            }
            out.push_back(name_);
            return;
        }
        for (const auto& a : args_) a.collect(out);
    }

    static std::string format_factor(double k) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.15g", k);
        if (std::strtod(buf, nullptr) != k) {
            std::snprintf(buf, sizeof(buf), "%.17g", k);
        }
        return buf;
    }

    Combinator op_ = Combinator::Input;
    std::string name_;
    double factor_ = 1.0;
    std::vector<Formula> args_;
};

namespace detail {

// Recursive descent over: expr := ident | ident '(' args ')'
class FormulaParser {
public:
    explicit FormulaParser(const std::string& text) : text_(text) {}

    std::optional<Formula> run(std::string& error) {
        auto f = expr(0, error);
        if (!f) return std::nullopt;
        skip_ws();
        if (pos_ != text_.size()) {
            error = "unexpected '" + std::string(1, text_[pos_]) + "' at " + std::to_string(pos_);
            return std::nullopt;
        }
        return f;
    }

private:
    static constexpr size_t MAX_DEPTH = 256;

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }

    static bool ident_start(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    static bool ident_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' ||
               c == ':' || c == '-';
    }

    bool expect(char c, std::string& error) {
        skip_ws();
        if (pos_ >= text_.size() || text_[pos_] != c) {
            error = std::string("expected '") + c + "' at " + std::to_string(pos_);
            return false;
        }
        ++pos_;
        return true;
    }

    std::optional<double> number(std::string& error) {
        skip_ws();
        size_t start = pos_;
        while (pos_ < text_.size() &&
               (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.' ||
                text_[pos_] == 'e' || text_[pos_] == 'E' || text_[pos_] == '+' || text_[pos_] == '-')) {
            ++pos_;
        }
        std::string lit = text_.substr(start, pos_ - start);
        char* end = nullptr;
        double v = lit.empty() ? 0.0 : std::strtod(lit.c_str(), &end);
        if (lit.empty() || end != lit.c_str() + lit.size()) {
            error = "expected number at " + std::to_string(start);
            return std::nullopt;
        }
        return v;
    }

    std::optional<Formula> expr(size_t depth, std::string& error) {
        if (depth > MAX_DEPTH) {
            error = "formula nested too deeply";
            return std::nullopt;
        }
        skip_ws();
        if (pos_ >= text_.size() || !ident_start(text_[pos_])) {
            error = pos_ >= text_.size() ? "unexpected end of formula"
                                         : "unexpected '" + std::string(1, text_[pos_]) +
                                               "' at " + std::to_string(pos_);
            return std::nullopt;
        }
        size_t start = pos_;
        while (pos_ < text_.size() && ident_char(text_[pos_])) ++pos_;
        std::string ident = text_.substr(start, pos_ - start);

        skip_ws();
        if (pos_ >= text_.size() || text_[pos_] != '(') {
            return Formula::input(ident);
        }
        ++pos_;  // '('

        auto op = combinator_from_name(ident);
        if (!op) {
            error = "unknown combinator '" + ident + "'";
            return std::nullopt;
        }

        if (*op == Combinator::Scale) {
            auto k = number(error);
            if (!k) return std::nullopt;
            if (!expect(',', error)) return std::nullopt;
            auto arg = expr(depth + 1, error);
            if (!arg) return std::nullopt;
            if (!expect(')', error)) return std::nullopt;
            return Formula::scale(*k, std::move(*arg));
        }

        std::vector<Formula> args;
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == ')') {
            ++pos_;
            return Formula::apply(*op, std::move(args));
        }
        while (true) {
            auto arg = expr(depth + 1, error);
            if (!arg) return std::nullopt;
            args.push_back(std::move(*arg));
            skip_ws();
            if (pos_ < text_.size() && text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (!expect(')', error)) return std::nullopt;
            break;
        }
        return Formula::apply(*op, std::move(args));
    }

    const std::string& text_;
    size_t pos_ = 0;
};

} // namespace detail

inline std::optional<Formula> Formula::parse(const std::string& text, std::string* error) {
    std::string err;
    detail::FormulaParser parser(text);
    auto f = parser.run(err);
    if (!f && error) *error = err;
    return f;
}

// ═══════════════════════════════════════════════════════════════════════════
// Proof and result types
// ═══════════════════════════════════════════════════════════════════════════

// Validated formula plus what it evaluated to. Requires a ProofKey to build.
class DerivationProof {
public:
    DerivationProof(ProofKey, Formula formula, double value,
                    std::vector<std::string> input_names,
                    CalibrationStatus status, AbsentPolicy policy)
        : formula_(std::move(formula)), value_(value),
          input_names_(std::move(input_names)), status_(status), policy_(policy) {}

    const Formula& formula() const { return formula_; }
    double value() const { return value_; }
    const std::vector<std::string>& input_names() const { return input_names_; }
    CalibrationStatus calibration_status() const { return status_; }
    AbsentPolicy absent_policy() const { return policy_; }

    json to_json() const {
        return {
            {"formula", formula_.to_json()},
            {"value", value_},
            {"inputs", input_names_},
            {"calibration_status", to_string(status_)},
            {"absent_policy", policy_ == AbsentPolicy::Neutral ? "neutral" : "strict"},
        };
    }

private:
    Formula formula_;
    double value_;
    std::vector<std::string> input_names_;
    CalibrationStatus status_;
    AbsentPolicy policy_;
};

enum class DerivationErrorKind : uint8_t {
    UnknownInputReference = 0,
    MalformedFormula = 1,
    AbsentInput = 2,
};

inline const char* to_string(DerivationErrorKind k) {
    switch (k) {
        case DerivationErrorKind::UnknownInputReference: return "UnknownInputReference";
        case DerivationErrorKind::MalformedFormula: return "MalformedFormula";
        case DerivationErrorKind::AbsentInput: return "AbsentInput";
    }
    return "MalformedFormula";
}

struct DerivationError {
    DerivationErrorKind kind = DerivationErrorKind::MalformedFormula;
    std::string detail;

    std::string to_string() const {
        return std::string(pramana::to_string(kind)) + ": " + detail;
    }
};

struct DeriveResult {
    std::optional<ConfidenceValue> value;   // proven Derived on success
    std::optional<DerivationError> error;

    bool ok() const { return value.has_value(); }

    static DeriveResult success(ConfidenceValue v) {
        DeriveResult r;
        r.value = std::move(v);
        return r;
    }

    static DeriveResult failure(DerivationErrorKind kind, std::string detail) {
        DeriveResult r;
        r.error = DerivationError{kind, std::move(detail)};
        return r;
    }
};

using InputMap = std::map<std::string, ConfidenceValue>;

// ═══════════════════════════════════════════════════════════════════════════
// Builder
// ═══════════════════════════════════════════════════════════════════════════

class DerivationBuilder {
public:
    explicit DerivationBuilder(DerivationOptions options = {}) : options_(options) {}

    DeriveResult derive(const Formula& formula, const InputMap& inputs) const {
        if (auto err = formula.check()) {
            return DeriveResult::failure(DerivationErrorKind::MalformedFormula, *err);
        }

        std::vector<std::string> names = formula.input_names();
        for (const auto& n : names) {
            if (inputs.find(n) == inputs.end()) {
                return DeriveResult::failure(DerivationErrorKind::UnknownInputReference,
                                             "'" + n + "' is not among the supplied inputs");
            }
        }

        Eval result;
        DerivationError error;
        if (!eval(formula, inputs, result, error)) {
            log_debug("derive", "%s rejected: %s", formula.to_string().c_str(),
                      error.to_string().c_str());
            return DeriveResult::failure(error.kind, error.detail);
        }

        Derived d;
        d.value = result.value;
        d.formula = formula.to_string();
        d.calibration_status = result.status;
        for (const auto& n : names) {
            d.inputs.push_back({n, std::make_shared<const ConfidenceValue>(inputs.at(n))});
        }
        d.proof = std::make_shared<const DerivationProof>(
            ProofKey(), formula, result.value, names, result.status, options_.absent_policy);

        log_debug("derive", "%s = %.4f [%s]", d.formula.c_str(), d.value,
                  to_string(d.calibration_status));
        return DeriveResult::success(ConfidenceValue::proven(ProofKey(), std::move(d)));
    }

    DeriveResult derive(const std::string& formula_text, const InputMap& inputs) const {
        std::string error;
        auto formula = Formula::parse(formula_text, &error);
        if (!formula) {
            return DeriveResult::failure(DerivationErrorKind::MalformedFormula, error);
        }
        return derive(*formula, inputs);
    }

    // Re-evaluate a value's proof against its recorded inputs.
    // False for anything that did not come out of a builder unchanged.
    static bool verify(const ConfidenceValue& value) {
        const Derived* d = value.get_if<Derived>();
        if (d == nullptr || d->proof == nullptr) return false;
        const DerivationProof& proof = *d->proof;

        if (proof.formula().to_string() != d->formula) return false;
        if (proof.value() != d->value || proof.calibration_status() != d->calibration_status) {
            return false;
        }
        if (proof.input_names().size() != d->inputs.size()) return false;

        InputMap inputs;
        for (size_t i = 0; i < d->inputs.size(); ++i) {
            if (d->inputs[i].name != proof.input_names()[i]) return false;
            inputs.emplace(d->inputs[i].name, *d->inputs[i].value);
        }

        DerivationBuilder builder(DerivationOptions{proof.absent_policy()});
        if (proof.formula().check()) return false;
        Eval replay;
        DerivationError error;
        if (!builder.eval(proof.formula(), inputs, replay, error)) return false;
        return replay.value == d->value && replay.status == d->calibration_status;
    }

private:
    struct Eval {
        double value = 0.0;
        CalibrationStatus status = CalibrationStatus::Preserved;
    };

    static CalibrationStatus input_status(const ConfidenceValue& v) {
        switch (v.kind()) {
            case ConfidenceKind::Deterministic:
            case ConfidenceKind::Measured: return CalibrationStatus::Preserved;
            case ConfidenceKind::Derived: return v.as<Derived>().calibration_status;
            case ConfidenceKind::Bounded:
            case ConfidenceKind::Absent: return CalibrationStatus::Degraded;
        }
        return CalibrationStatus::Degraded;
    }

    bool eval(const Formula& f, const InputMap& inputs, Eval& out, DerivationError& error) const {
        if (f.op() == Combinator::Input) {
            const ConfidenceValue& v = inputs.at(f.name());
            if (v.is_absent()) {
                error = {DerivationErrorKind::AbsentInput,
                         "'" + f.name() + "' is absent (" + to_string(v.as<Absent>().reason) + ")"};
                return false;
            }
            // Bounded enters by its low bound
            out.value = *v.conservative_value();
            out.status = input_status(v);
            return true;
        }

        std::vector<double> values;
        CalibrationStatus status = CalibrationStatus::Preserved;
        bool all_measured = true;
        for (const auto& arg : f.args()) {
            if (arg.op() == Combinator::Input) {
                const ConfidenceValue& v = inputs.at(arg.name());
                if (v.is_absent()) {
                    if (options_.absent_policy == AbsentPolicy::Strict || !has_identity(f.op())) {
                        error = {DerivationErrorKind::AbsentInput,
                                 "'" + arg.name() + "' is absent (" +
                                     to_string(v.as<Absent>().reason) + ") in " +
                                     to_string(f.op())};
                        return false;
                    }
                    // Neutral: identity of the combinator, contributes nothing
                    status = worst(status, CalibrationStatus::Degraded);
                    all_measured = false;
                    continue;
                }
                if (v.kind() != ConfidenceKind::Measured) all_measured = false;
            } else {
                all_measured = false;
            }
            Eval e;
            if (!eval(arg, inputs, e, error)) return false;
            values.push_back(e.value);
            status = worst(status, e.status);
        }

        if (values.empty()) {
            error = {DerivationErrorKind::AbsentInput,
                     std::string("every argument of ") + to_string(f.op()) + " is absent"};
            return false;
        }

        double v = 0.0;
        switch (f.op()) {
            case Combinator::Meet:
            case Combinator::Sequence:
                v = values[0];
                for (double x : values) v = std::min(v, x);
                break;
            case Combinator::Join:
                v = values[0];
                for (double x : values) v = std::max(v, x);
                break;
            case Combinator::Product:
            case Combinator::Parallel:
                v = 1.0;
                for (double x : values) v *= x;
                break;
            case Combinator::NoisyOr:
            case Combinator::ParallelAny: {
                double miss = 1.0;
                for (double x : values) miss *= (1.0 - x);
                v = 1.0 - miss;
                break;
            }
            case Combinator::Complement:
                v = 1.0 - values[0];
                break;
            case Combinator::Scale:
                v = f.factor() * values[0];
                break;
            case Combinator::Input:
                break;
        }

        if (is_product_family(f.op())) {
            status = all_measured ? CalibrationStatus::Preserved : CalibrationStatus::Degraded;
        } else if (f.op() == Combinator::Scale && f.factor() != 1.0) {
            status = CalibrationStatus::Degraded;
        }

        out.value = v;
        out.status = status;
        return true;
    }

    DerivationOptions options_;
};

inline DeriveResult derive(const Formula& formula, const InputMap& inputs,
                           DerivationOptions options = {}) {
    return DerivationBuilder(options).derive(formula, inputs);
}

inline DeriveResult derive(const std::string& formula_text, const InputMap& inputs,
                           DerivationOptions options = {}) {
    return DerivationBuilder(options).derive(formula_text, inputs);
}

// ═══════════════════════════════════════════════════════════════════════════
// Convenience combinators (all proven through the builder)
// ═══════════════════════════════════════════════════════════════════════════

namespace detail {

inline DeriveResult derive_binary(Combinator op, const ConfidenceValue& a,
                                  const ConfidenceValue& b, DerivationOptions options) {
    Formula f = Formula::apply(op, {Formula::input("a"), Formula::input("b")});
    return derive(f, InputMap{{"a", a}, {"b", b}}, options);
}

inline DeriveResult derive_nary(Combinator op, const std::vector<ConfidenceValue>& values,
                                DerivationOptions options) {
    std::vector<Formula> args;
    InputMap inputs;
    for (size_t i = 0; i < values.size(); ++i) {
        std::string name = "x" + std::to_string(i + 1);
        args.push_back(Formula::input(name));
        inputs.emplace(name, values[i]);
    }
    return derive(Formula::apply(op, std::move(args)), inputs, options);
}

} // namespace detail

// Independent AND. Degraded unless both inputs are Measured.
inline DeriveResult product(const ConfidenceValue& a, const ConfidenceValue& b,
                            DerivationOptions options = {}) {
    return detail::derive_binary(Combinator::Product, a, b, options);
}

// Independent OR: 1-(1-a)(1-b). Not interchangeable with join().
inline DeriveResult join_independent(const ConfidenceValue& a, const ConfidenceValue& b,
                                     DerivationOptions options = {}) {
    return detail::derive_binary(Combinator::NoisyOr, a, b, options);
}

inline DeriveResult complement(const ConfidenceValue& a, DerivationOptions options = {}) {
    return derive(Formula::apply(Combinator::Complement, {Formula::input("a")}),
                  InputMap{{"a", a}}, options);
}

// Chain of steps: as strong as the weakest
inline DeriveResult sequence(const std::vector<ConfidenceValue>& steps,
                             DerivationOptions options = {}) {
    return detail::derive_nary(Combinator::Sequence, steps, options);
}

// All independent branches must hold
inline DeriveResult parallel(const std::vector<ConfidenceValue>& branches,
                             DerivationOptions options = {}) {
    return detail::derive_nary(Combinator::Parallel, branches, options);
}

// Any independent branch suffices
inline DeriveResult parallel_any(const std::vector<ConfidenceValue>& branches,
                                 DerivationOptions options = {}) {
    return detail::derive_nary(Combinator::ParallelAny, branches, options);
}

// Exponential decay: value * 0.5^(age / half_life)
inline DeriveResult decay(const ConfidenceValue& value, Timestamp age_ms, Timestamp half_life_ms,
                          DerivationOptions options = {}) {
    if (half_life_ms <= 0) {
        return DeriveResult::failure(DerivationErrorKind::MalformedFormula,
                                     "decay: half_life must be positive");
    }
    if (age_ms < 0) {
        return DeriveResult::failure(DerivationErrorKind::MalformedFormula,
                                     "decay: age must not be negative");
    }
    double k = std::pow(0.5, static_cast<double>(age_ms) / static_cast<double>(half_life_ms));
    return derive(Formula::scale(k, Formula::input("a")), InputMap{{"a", value}}, options);
}

} // namespace pramana
