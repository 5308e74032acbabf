#include <pramana/pramana.hpp>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace pramana;

ConfidenceValue measured(double v) {
    return ConfidenceValue::measured(v, "bench", 100, v, std::max(0.0, v - 0.05),
                                     std::min(1.0, v + 0.05));
}

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

std::string temp_path(const char* name) {
    return "/tmp/pramana_test_" + std::to_string(::getpid()) + "_" + name;
}

Defeater defeater(const std::string& id, const std::string& attacks,
                  std::vector<DefeaterId> attacked_by = {}) {
    Defeater d;
    d.id = id;
    d.attacks = attacks;
    d.attacked_by = std::move(attacked_by);
    return d;
}

Claim claim(const std::string& id, ConfidenceValue confidence) {
    Claim c;
    c.id = id;
    c.producer = "extractor";
    c.confidence = std::move(confidence);
    return c;
}

const ClaimVerdict& verdict_for(const std::vector<ClaimVerdict>& verdicts, const std::string& id) {
    for (const auto& v : verdicts) {
        if (v.claim_id == id) return v;
    }
    assert(false && "no verdict");
    return verdicts.front();
}

// ═══════════════════════════════════════════════════════════════════════════
// Confidence
// ═══════════════════════════════════════════════════════════════════════════

void test_confidence_construction() {
    std::cout << "Testing ConfidenceValue construction..." << std::endl;

    ConfidenceValue d = ConfidenceValue::deterministic(true, "tautology");
    assert(d.kind() == ConfidenceKind::Deterministic);
    assert(*d.point_value() == 1.0);

    ConfidenceValue b = ConfidenceValue::bounded(0.2, 0.6, BoundBasis::Literature, "smith2020");
    assert(near(*b.point_value(), 0.4));
    assert(*b.conservative_value() == 0.2);

    ConfidenceValue a;
    assert(a.is_absent());
    assert(a.as<Absent>().reason == AbsentReason::Uncalibrated);
    assert(!a.point_value().has_value());
    assert(!meets_threshold(a, 0.0));

    bool threw = false;
    try { ConfidenceValue::bounded(0.7, 0.3); } catch (const ConstructionError&) { threw = true; }
    assert(threw);

    threw = false;
    try { ConfidenceValue::measured(1.5, "x", 10, 0.5, 0.4, 0.6); } catch (const ConstructionError&) { threw = true; }
    assert(threw);

    threw = false;
    try { ConfidenceValue::measured(std::nan(""), "x", 10, 0.5, 0.4, 0.6); } catch (const ConstructionError&) { threw = true; }
    assert(threw);

    threw = false;
    try { ConfidenceValue::measured(0.5, "x", 10, 0.5, 0.6, 0.4); } catch (const ConstructionError&) { threw = true; }
    assert(threw);

    // Parsing validates like the factories do
    threw = false;
    try {
        ConfidenceValue::from_json({{"type", "bounded"}, {"low", 0.9}, {"high", 0.1}});
    } catch (const ConstructionError&) { threw = true; }
    assert(threw);

    threw = false;
    try { ConfidenceValue::from_json({{"type", "hunch"}}); } catch (const ConstructionError&) { threw = true; }
    assert(threw);

    ConfidenceValue m = measured(0.8);
    assert(ConfidenceValue::from_json(m.to_json()) == m);
    assert(describe(m).find("n=100") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_lattice_order() {
    std::cout << "Testing lattice meet/join..." << std::endl;

    ConfidenceValue wide = ConfidenceValue::bounded(0.3, 0.9);
    ConfidenceValue m = measured(0.5);

    // Bounded compares by its low bound
    assert(meet(wide, m) == wide);
    assert(join(wide, m) == m);

    // Strict: Absent absorbs. Neutral: Absent is the identity.
    ConfidenceValue none = ConfidenceValue::absent(AbsentReason::NotApplicable);
    assert(meet(none, m).is_absent());
    assert(meet(m, none, AbsentPolicy::Neutral) == m);
    assert(join(none, m) == m);

    // Equal value: kind rank decides
    ConfidenceValue dv = ConfidenceValue::derived(0.5, "min(a, b)", {}, CalibrationStatus::Unknown);
    assert(meet(m, dv) == dv);
    assert(join(m, dv) == m);

    // Identities
    ConfidenceValue certain = ConfidenceValue::deterministic(true, "proof");
    assert(meet(top(), certain) == certain);
    assert(join(top(), certain) == top());
    assert(join(bottom(), none) == none);
    assert(meet(bottom(), m) == bottom());

    assert(meet_all({}) == top());
    assert(join_all({}) == bottom());
    assert(meet_all({m, wide, certain}) == wide);
    assert(join_all({m, wide, none}) == m);

    assert(meets_threshold(m, 0.5));
    assert(!meets_threshold(wide, 0.5));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Derivation
// ═══════════════════════════════════════════════════════════════════════════

void test_derive_formula() {
    std::cout << "Testing derivation from formula text..." << std::endl;

    InputMap inputs{{"x", measured(0.9)}, {"y", measured(0.5)}, {"z", measured(0.5)}};
    DeriveResult r = derive("min(x, noisy_or(y, z))", inputs);
    assert(r.ok());
    const Derived& d = r.value->as<Derived>();
    assert(near(d.value, 0.75));
    assert(d.formula == "min(x, noisy_or(y, z))");
    assert(d.calibration_status == CalibrationStatus::Preserved);
    assert(d.inputs.size() == 3);
    assert(d.inputs[0].name == "x");
    assert(r.value->is_proven());
    assert(DerivationBuilder::verify(*r.value));

    // Proofs serialize with the formula tree
    json proof = d.proof->to_json();
    assert(proof["formula"]["op"] == "min");
    assert(proof["inputs"].size() == 3);

    auto f = Formula::parse("scale(0.5, x)");
    assert(f.has_value());
    assert(f->to_string() == "scale(0.5, x)");
    assert(f->input_names() == std::vector<std::string>{"x"});

    std::cout << "  PASS" << std::endl;
}

void test_derive_unknown_input() {
    std::cout << "Testing unknown input reference..." << std::endl;

    InputMap inputs{{"x", measured(0.9)}, {"z", measured(0.4)}};
    DeriveResult r = derive("min(x, y)", inputs);
    assert(!r.ok());
    assert(r.error->kind == DerivationErrorKind::UnknownInputReference);
    assert(r.error->detail.find("'y'") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_derive_malformed() {
    std::cout << "Testing malformed formulas..." << std::endl;

    InputMap inputs{{"x", measured(0.9)}, {"y", measured(0.4)}};
    const char* bad[] = {
        "min(x",            // unclosed
        "min(x)",           // arity
        "frob(x, y)",       // unknown combinator
        "scale(1.5, x)",    // factor outside [0,1]
        "complement(x, y)", // arity
        "min(x, y) y",      // trailing input
        "",
    };
    for (const char* text : bad) {
        DeriveResult r = derive(text, inputs);
        assert(!r.ok());
        assert(r.error->kind == DerivationErrorKind::MalformedFormula);
    }

    std::string deep;
    for (int i = 0; i < 300; ++i) deep += "complement(";
    deep += "x";
    for (int i = 0; i < 300; ++i) deep += ")";
    std::string error;
    assert(!Formula::parse(deep, &error).has_value());
    assert(error.find("deeply") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_derive_absent_policy() {
    std::cout << "Testing Absent inputs under strict and neutral policy..." << std::endl;

    ConfidenceValue none = ConfidenceValue::absent(AbsentReason::InsufficientData);

    DeriveResult strict = product(measured(0.8), none);
    assert(!strict.ok());
    assert(strict.error->kind == DerivationErrorKind::AbsentInput);

    DerivationOptions neutral{AbsentPolicy::Neutral};
    DeriveResult lenient = product(measured(0.8), none, neutral);
    assert(lenient.ok());
    assert(near(*lenient.value->point_value(), 0.8));
    assert(lenient.value->as<Derived>().calibration_status == CalibrationStatus::Degraded);
    assert(DerivationBuilder::verify(*lenient.value));

    // No identity to fall back on
    DeriveResult comp = complement(none, neutral);
    assert(!comp.ok());
    assert(comp.error->kind == DerivationErrorKind::AbsentInput);

    DeriveResult all_absent = sequence({none, none}, neutral);
    assert(!all_absent.ok());

    std::cout << "  PASS" << std::endl;
}

void test_derive_calibration_status() {
    std::cout << "Testing calibration status propagation..." << std::endl;

    DeriveResult both = product(measured(0.8), measured(0.5));
    assert(both.ok());
    assert(near(*both.value->point_value(), 0.4));
    assert(both.value->as<Derived>().calibration_status == CalibrationStatus::Preserved);

    // Bounded enters by its low bound and degrades
    DeriveResult est = product(ConfidenceValue::bounded(0.4, 0.8), measured(0.5));
    assert(est.ok());
    assert(near(*est.value->point_value(), 0.2));
    assert(est.value->as<Derived>().calibration_status == CalibrationStatus::Degraded);

    DeriveResult seq = sequence({measured(0.9), ConfidenceValue::deterministic(true, "")});
    assert(seq.ok());
    assert(near(*seq.value->point_value(), 0.9));
    assert(seq.value->as<Derived>().calibration_status == CalibrationStatus::Preserved);

    // Derived of derived: product of a non-input argument degrades
    InputMap inputs{{"a", measured(0.5)}, {"b", measured(0.5)}, {"c", measured(0.5)}};
    DeriveResult nested = derive("product(a, product(b, c))", inputs);
    assert(nested.ok());
    assert(near(*nested.value->point_value(), 0.125));
    assert(nested.value->as<Derived>().calibration_status == CalibrationStatus::Degraded);

    DeriveResult any = parallel_any({measured(0.5), measured(0.5), measured(0.5)});
    assert(any.ok());
    assert(near(*any.value->point_value(), 0.875));

    DeriveResult half = decay(measured(0.8), 1000, 1000);
    assert(half.ok());
    assert(near(*half.value->point_value(), 0.4));
    assert(half.value->as<Derived>().calibration_status == CalibrationStatus::Degraded);

    DeriveResult bad = decay(measured(0.8), 1000, 0);
    assert(!bad.ok());
    assert(bad.error->kind == DerivationErrorKind::MalformedFormula);

    std::cout << "  PASS" << std::endl;
}

void test_verify_rejects_unproven() {
    std::cout << "Testing proof verification..." << std::endl;

    DeriveResult r = join_independent(measured(0.6), measured(0.3));
    assert(r.ok());
    assert(DerivationBuilder::verify(*r.value));

    // Hand-built: same fields, no proof
    const Derived& d = r.value->as<Derived>();
    ConfidenceValue forged = ConfidenceValue::derived(d.value, d.formula, d.inputs,
                                                      d.calibration_status);
    assert(!forged.is_proven());
    assert(!DerivationBuilder::verify(forged));

    // A parsed value never carries a proof
    ConfidenceValue parsed = ConfidenceValue::from_json(r.value->to_json());
    assert(r.value->to_json()["proven"] == true);
    assert(!parsed.is_proven());
    assert(!DerivationBuilder::verify(parsed));

    assert(!DerivationBuilder::verify(measured(0.5)));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Ledger
// ═══════════════════════════════════════════════════════════════════════════

class FailingStore : public LedgerStore {
public:
    explicit FailingStore(size_t allow) : allow_(allow) {}

    void persist(const LedgerEntry&) override {
        if (allow_ == 0) throw LedgerIoError("disk full");
        --allow_;
    }

    std::vector<LedgerEntry> load() override { return {}; }

    std::string describe() const override { return "failing"; }

private:
    size_t allow_;
};

void test_ledger_append() {
    std::cout << "Testing ledger append/correlate/correct..." << std::endl;

    EvidenceLedger ledger;
    uint64_t e1 = ledger.append(EntryKind::Extraction, {{"text", "water boils at 100C"}}, "s1", "extractor");
    uint64_t e2 = ledger.append(EntryKind::Claim, {{"id", "c1"}}, "s1", "claimer", {e1});
    uint64_t e3 = ledger.append(EntryKind::Retrieval, {{"doc", "d7"}}, "s2");
    assert(e1 == 1 && e2 == 2 && e3 == 3);
    assert(ledger.head() == 3);

    bool threw = false;
    try { ledger.append(EntryKind::Synthesis, {}, "s1", "", {7}); } catch (const LedgerError&) { threw = true; }
    assert(threw);
    threw = false;
    try { ledger.append(EntryKind::Synthesis, {}, "s1", "", {0}); } catch (const LedgerError&) { threw = true; }
    assert(threw);
    assert(ledger.head() == 3);

    uint64_t c = ledger.correct(e2, EntryKind::Claim, {{"id", "c1"}, {"content_ref", "fixed"}}, "claimer");
    assert(c == 4);
    assert(ledger.get(c)->correlation_id == "s1");
    assert(ledger.get(c)->corrects == e2);
    assert(ledger.latest_revision(e2) == c);
    assert(ledger.latest_revision(e1) == e1);
    // The original is untouched
    assert(ledger.get(e2)->payload == json({{"id", "c1"}}));

    threw = false;
    try { ledger.correct(99, EntryKind::Correction, {}); } catch (const LedgerError&) { threw = true; }
    assert(threw);

    assert(ledger.correlate("s1").size() == 3);
    assert(ledger.correlate("nope").empty());
    assert(ledger.by_kind(EntryKind::Claim).size() == 2);
    assert(ledger.segment(2, 10).size() == 3);
    assert(!ledger.get(0).has_value());
    assert(!ledger.get(5).has_value());

    size_t seen = ledger.replay(2, [](const LedgerEntry& e) { assert(e.sequence <= 2); });
    assert(seen == 2);

    std::cout << "  PASS" << std::endl;
}

void test_ledger_cursor_isolation() {
    std::cout << "Testing cursor snapshot isolation..." << std::endl;

    EvidenceLedger ledger;
    for (int i = 0; i < 3; ++i) ledger.append(EntryKind::ToolCall, {{"i", i}}, "s1");

    LedgerCursor cursor = ledger.read_from(1);
    ledger.append(EntryKind::ToolCall, {{"i", 3}}, "s1");
    assert(cursor.end() == 3);

    uint64_t last = 0;
    size_t count = 0;
    while (auto e = cursor.next()) {
        assert(e->sequence == last + 1);
        last = e->sequence;
        ++count;
    }
    assert(count == 3);
    assert(cursor.done());

    cursor.restart();
    assert(cursor.next()->sequence == 1);

    LedgerCursor tail = ledger.read_from(4);
    assert(tail.next()->payload["i"] == 3);
    assert(!tail.next().has_value());

    std::cout << "  PASS" << std::endl;
}

void test_ledger_store_failure() {
    std::cout << "Testing storage failure surfaces as LedgerIoError..." << std::endl;

    EvidenceLedger ledger(std::make_shared<FailingStore>(2));
    ledger.append(EntryKind::Feedback, {{"ok", 1}}, "s1");
    ledger.append(EntryKind::Feedback, {{"ok", 2}}, "s1");

    bool threw = false;
    try {
        ledger.append(EntryKind::Feedback, {{"ok", 3}}, "s1");
    } catch (const LedgerIoError&) {
        threw = true;
    }
    assert(threw);
    assert(ledger.head() == 2);
    assert(ledger.correlate("s1").size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_file_ledger_recovery() {
    std::cout << "Testing file ledger reopen and recovery..." << std::endl;

    std::string path = temp_path("ledger.log");
    std::remove(path.c_str());

    {
        EvidenceLedger ledger(std::make_shared<FileLedgerStore>(path, false));
        ledger.append(EntryKind::Extraction, {{"text", "alpha"}, {"score", 0.25}}, "s1", "extractor");
        ledger.append(EntryKind::Claim, {{"id", "c1"}}, "s1", "claimer", {1});
        ledger.append(EntryKind::Verification, {{"passed", true}}, "s1", "verifier", {1, 2});
    }

    {
        EvidenceLedger ledger(std::make_shared<FileLedgerStore>(path, false));
        assert(ledger.head() == 3);
        auto e = ledger.get(1);
        assert(e->payload["text"] == "alpha");
        assert(e->payload["score"] == 0.25);
        assert(e->agent == "extractor");
        assert((ledger.get(3)->derived_from == std::vector<uint64_t>{1, 2}));
        assert(ledger.store().describe() == "file:" + path);
    }

    // Torn tail: a crash in the middle of a header
    {
        std::FILE* f = std::fopen(path.c_str(), "ab");
        assert(f != nullptr);
        const char torn[] = "PRML-torn";
        std::fwrite(torn, 1, sizeof(torn) - 1, f);
        std::fclose(f);
    }
    {
        EvidenceLedger ledger(std::make_shared<FileLedgerStore>(path, false));
        assert(ledger.head() == 3);
        uint64_t seq = ledger.append(EntryKind::Outcome, {{"correct", true}}, "s1");
        assert(seq == 4);
    }
    {
        EvidenceLedger ledger(std::make_shared<FileLedgerStore>(path, false));
        assert(ledger.head() == 4);
        assert(ledger.get(4)->kind == EntryKind::Outcome);
    }

    // Corrupt body byte in the last record: checksum stops recovery before it
    {
        std::FILE* f = std::fopen(path.c_str(), "r+b");
        assert(f != nullptr);
        std::fseek(f, -1, SEEK_END);
        int c = std::fgetc(f);
        std::fseek(f, -1, SEEK_END);
        std::fputc(c ^ 0xFF, f);
        std::fclose(f);
    }
    {
        EvidenceLedger ledger(std::make_shared<FileLedgerStore>(path, false));
        assert(ledger.head() == 3);
    }

    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Provenance
// ═══════════════════════════════════════════════════════════════════════════

void test_ledger_concurrent_access() {
    std::cout << "Testing concurrent appends and reads..." << std::endl;

    constexpr int writers = 4;
    constexpr int per_writer = 250;
    constexpr int outcomes = 100;

    EvidenceLedger ledger;
    LedgerCalibrationStore store(ledger, "verified");
    CalibrationTracker tracker(store);
    std::atomic<int> running{writers + 1};

    std::vector<std::thread> threads;
    for (int w = 0; w < writers; ++w) {
        threads.emplace_back([&, w] {
            std::string trace = "w" + std::to_string(w);
            for (int n = 0; n < per_writer; ++n) {
                ledger.append(EntryKind::ToolCall, {{"n", n}}, trace, trace);
            }
            --running;
        });
    }
    threads.emplace_back([&] {
        for (int n = 0; n < outcomes; ++n) {
            tracker.record_outcome("extractor", measured(0.8), n % 2 == 0);
        }
        --running;
    });

    // Readers see gap-free prefixes whose per-writer order never goes backwards
    std::atomic<size_t> snapshots{0};
    for (int r = 0; r < 2; ++r) {
        threads.emplace_back([&] {
            uint64_t last_end = 0;
            uint64_t last_count = 0;
            do {
                LedgerCursor cursor = ledger.read_from(1);
                assert(cursor.end() >= last_end);
                last_end = cursor.end();
                uint64_t expected = 1;
                while (auto e = cursor.next()) {
                    assert(e->sequence == expected);
                    ++expected;
                }
                assert(expected == cursor.end() + 1);

                std::vector<LedgerEntry> trace = ledger.correlate("w0");
                for (size_t i = 0; i < trace.size(); ++i) {
                    assert(trace[i].payload["n"] == static_cast<int>(i));
                    if (i > 0) assert(trace[i].sequence > trace[i - 1].sequence);
                }

                uint64_t count = tracker.report("extractor").sample_count;
                assert(count >= last_count);
                last_count = count;
                ++snapshots;
            } while (running > 0);
        });
    }
    for (auto& t : threads) t.join();

    assert(snapshots > 0);
    assert(ledger.head() == writers * per_writer + outcomes);
    LedgerCursor all = ledger.read_from(1);
    uint64_t expected = 1;
    while (auto e = all.next()) {
        assert(e->sequence == expected);
        ++expected;
    }
    for (int w = 0; w < writers; ++w) {
        assert(ledger.correlate("w" + std::to_string(w)).size() == per_writer);
    }
    assert(tracker.report("extractor").sample_count == outcomes);

    std::cout << "  PASS" << std::endl;
}

bool same_entry(const LedgerEntry& a, const LedgerEntry& b) {
    return a.sequence == b.sequence && a.kind == b.kind && a.payload == b.payload &&
           a.correlation_id == b.correlation_id && a.timestamp == b.timestamp &&
           a.agent == b.agent && a.derived_from == b.derived_from && a.corrects == b.corrects;
}

void test_provenance_roundtrip() {
    std::cout << "Testing PROV export/import..." << std::endl;

    EvidenceLedger ledger;
    ledger.append(EntryKind::Extraction, {{"text", "alpha"}}, "s1", "extractor");
    ledger.append(EntryKind::Claim, {{"id", "c1"}}, "s1", "claimer", {1});
    ledger.append(EntryKind::Verification, {{"passed", true}}, "s1", "", {2, 1});
    ledger.correct(2, EntryKind::Claim, {{"id", "c1"}, {"content_ref", "v2"}}, "claimer");

    std::vector<LedgerEntry> all = ledger.segment(1, ledger.head());
    json doc = export_prov(all);
    assert(validate_prov(doc).empty());
    assert(doc["entity"].contains(prov::entity_id(1)));
    assert(doc["agent"].contains(prov::agent_id("claimer")));
    assert(doc["wasDerivedFrom"].contains("_:rev/4"));

    std::vector<LedgerEntry> back = import_prov(doc);
    assert(back.size() == all.size());
    for (size_t i = 0; i < all.size(); ++i) {
        assert(same_entry(all[i], back[i]));
    }

    // A segment references its parents without exporting them
    json part = export_prov(ledger.segment(3, 4));
    assert(validate_prov(part).empty());
    assert(part["entity"][prov::entity_id(1)]["pramana:external"] == true);
    std::vector<LedgerEntry> tail = import_prov(part);
    assert(tail.size() == 2);
    assert(same_entry(tail[0], all[2]));
    assert(same_entry(tail[1], all[3]));

    // Dangling endpoints are reported and refused
    json broken = doc;
    broken["entity"].erase(prov::entity_id(1));
    assert(!validate_prov(broken).empty());
    bool threw = false;
    try { import_prov(broken); } catch (const LedgerError&) { threw = true; }
    assert(threw);

    std::string path = temp_path("prov.json");
    assert(save_prov(path, doc));
    std::remove(path.c_str());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Defeaters
// ═══════════════════════════════════════════════════════════════════════════

void test_reflexivity() {
    std::cout << "Testing reflexive attacks are refused..." << std::endl;

    bool threw = false;
    try {
        AttackGraph::Builder b;
        b.add_defeater(defeater("d1", "d1"));
    } catch (const ReflexivityViolation&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        AttackGraph::Builder b;
        b.add_defeater(defeater("d1", "c1", {"d1"}));
    } catch (const ReflexivityViolation&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        AttackGraph::Builder b;
        b.add_attack("d2", "d2");
    } catch (const ReflexivityViolation&) {
        threw = true;
    }
    assert(threw);

    // Nothing reaches the ledger
    EvidenceLedger ledger;
    DefeaterEngine engine(ledger);
    threw = false;
    try { engine.declare(defeater("d1", "d1"), "s1"); } catch (const ReflexivityViolation&) { threw = true; }
    assert(threw);
    assert(ledger.head() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_graph_construction_errors() {
    std::cout << "Testing attack graph construction errors..." << std::endl;

    bool threw = false;
    try {
        AttackGraph::Builder b;
        b.add_claim(claim("c1", measured(0.9)));
        b.add_defeater(defeater("d1", "c404"));
        b.build();
    } catch (const GraphConstructionError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        AttackGraph::Builder b;
        b.add_claim(claim("c1", measured(0.9)));
        b.add_claim(claim("c2", measured(0.9)));
        b.add_attack("c1", "c2");
    } catch (const GraphConstructionError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        AttackGraph::Builder b;
        b.add_claim(claim("c1", measured(0.9)));
        b.add_claim(claim("c1", measured(0.5)));
    } catch (const GraphConstructionError&) {
        threw = true;
    }
    assert(threw);

    // Duplicate edges collapse
    AttackGraph::Builder b;
    b.add_claim(claim("c1", measured(0.9)));
    b.add_defeater(defeater("d1", "c1"));
    b.add_attack("d1", "c1");
    AttackGraph g = b.build();
    assert(g.size() == 2);
    assert(g.edge_count() == 1);
    assert(g.kind(*g.find("d1")) == NodeKind::Defeater);
    assert(!g.find("nope").has_value());

    std::cout << "  PASS" << std::endl;
}

void test_two_cycle_skepticism() {
    std::cout << "Testing mutual attack leaves both defeaters inactive..." << std::endl;

    AttackGraph::Builder b;
    b.add_claim(claim("c", measured(0.9)));
    b.add_defeater(defeater("A", "c", {"B"}));
    b.add_defeater(defeater("B", "A", {"A"}));
    AttackGraph g = b.build();
    assert(g.edge_count() == 3);

    ResolutionResult r = resolve(g);
    assert(r.converged);
    assert(r.active_defeaters.empty());
    assert((r.inactive_defeaters == std::set<DefeaterId>{"A", "B"}));
    assert((r.undecided == std::set<DefeaterId>{"A", "B"}));
    assert(r.cycles.size() == 1);
    assert((r.cycles[0] == std::vector<DefeaterId>{"A", "B"}));

    std::vector<ClaimVerdict> verdicts = assess(g, r);
    const ClaimVerdict& v = verdict_for(verdicts, "c");
    assert(!v.defeated);
    assert(v.unresolved_cycle);
    assert(v.effective == v.original);

    json j = r;
    assert(j["converged"] == true);
    assert(j["undecided"].size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_chain_reinstatement() {
    std::cout << "Testing reinstatement along C -> B -> A -> claim..." << std::endl;

    AttackGraph::Builder b;
    b.add_claim(claim("x", measured(0.9)));
    b.add_defeater(defeater("A", "x"));
    b.add_defeater(defeater("B", "A"));
    b.add_defeater(defeater("C", "B"));
    AttackGraph g = b.build();

    ResolutionResult r = resolve(g);
    assert(r.converged);
    assert((r.active_defeaters == std::set<DefeaterId>{"A", "C"}));
    assert((r.inactive_defeaters == std::set<DefeaterId>{"B"}));
    assert(r.undecided.empty());
    assert(r.cycles.empty());

    std::vector<ClaimVerdict> verdicts = assess(g, r);
    const ClaimVerdict& v = verdict_for(verdicts, "x");
    assert(v.defeated);
    assert(v.active_attackers == std::vector<DefeaterId>{"A"});
    assert(near(*v.effective.point_value(), 0.0));

    std::vector<Defeater> records = g.defeaters();
    mark_active(records, r);
    for (const auto& d : records) assert(d.active == (d.id != "B"));

    std::cout << "  PASS" << std::endl;
}

void test_partial_defeat() {
    std::cout << "Testing partial defeat lowers without defeating..." << std::endl;

    Defeater weak = defeater("d", "c");
    weak.strength = measured(0.3);
    AttackGraph::Builder b;
    b.add_claim(claim("c", measured(0.9)));
    b.add_defeater(weak);
    AttackGraph g = b.build();

    ResolutionResult r = resolve(g);
    std::vector<ClaimVerdict> verdicts = assess(g, r);
    const ClaimVerdict& v = verdict_for(verdicts, "c");
    assert(!v.defeated);
    assert(near(*v.effective.point_value(), 0.7));
    assert(compare(v.effective, v.original) < 0);

    // An Absent claim stays Absent and is never numerically defeated
    AttackGraph::Builder b2;
    b2.add_claim(claim("u", ConfidenceValue::absent()));
    b2.add_defeater(defeater("d", "u"));
    AttackGraph g2 = b2.build();
    std::vector<ClaimVerdict> v2 = assess(g2, resolve(g2));
    assert(v2[0].effective.is_absent());
    assert(!v2[0].defeated);

    // An interval strength counts at its high end
    ConfidenceValue factor = defeat_factor(ConfidenceValue::bounded(0.2, 0.9));
    assert(factor.kind() == ConfidenceKind::Bounded);
    assert(near(factor.as<Bounded>().low, 0.1));
    assert(near(factor.as<Bounded>().high, 0.8));

    Defeater vague = defeater("d", "c");
    vague.strength = ConfidenceValue::bounded(0.2, 0.9, BoundBasis::Literature, "survey");
    AttackGraph::Builder b3;
    b3.add_claim(claim("c", measured(0.9)));
    b3.add_defeater(vague);
    AttackGraph g3 = b3.build();
    std::vector<ClaimVerdict> verdicts3 = assess(g3, resolve(g3));
    const ClaimVerdict& v3 = verdict_for(verdicts3, "c");
    assert(near(*v3.effective.conservative_value(), 0.1));
    assert(!v3.defeated);

    std::cout << "  PASS" << std::endl;
}

void test_nonconvergence_disclosure() {
    std::cout << "Testing iteration cap discloses partial state and cycles..." << std::endl;

    AttackGraph::Builder b;
    b.add_claim(claim("x", measured(0.9)));
    b.add_defeater(defeater("A", "x"));
    b.add_defeater(defeater("B", "A"));
    b.add_defeater(defeater("C", "B"));
    b.add_defeater(defeater("P", "Q"));
    b.add_defeater(defeater("Q", "R"));
    b.add_defeater(defeater("R", "P"));
    AttackGraph g = b.build();

    ResolutionConfig tight;
    tight.max_iterations = 1;
    ResolutionResult r = resolve(g, tight);
    assert(!r.converged);
    assert(r.iterations == 1);
    assert(r.is_active("C"));
    assert(!r.is_active("A"));
    assert(!r.cycles.empty());
    bool found = false;
    for (const auto& c : r.cycles) {
        if (c == std::vector<DefeaterId>{"P", "Q", "R"}) found = true;
    }
    assert(found);

    // Partial state: no claim is defeated by a defeater that was never settled
    std::vector<ClaimVerdict> verdicts = assess(g, r, tight);
    assert(!verdict_for(verdicts, "x").defeated);

    ResolutionResult full = resolve(g);
    assert(full.converged);
    assert((full.undecided == std::set<DefeaterId>{"P", "Q", "R"}));
    assert((full.active_defeaters == std::set<DefeaterId>{"A", "C"}));
    assert(full.cycles.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_stale_evidence() {
    std::cout << "Testing expired evidence produces undermining defeaters..." << std::endl;

    Claim c1 = claim("c1", measured(0.9));
    c1.evidence_ids = {"e1", "e2"};
    Claim c2 = claim("c2", measured(0.9));
    c2.evidence_ids = {"e1", "e3"};

    Evidence e1{"e1", "https://example.org/a", 0, Timestamp(100)};
    Evidence e2{"e2", "tool:grep", 0, Timestamp(150)};
    Evidence e3{"e3", "tool:grep", 0, std::nullopt};

    auto stale = stale_evidence_defeaters({c1, c2}, {e1, e2, e3}, 200);
    assert(stale.size() == 1);
    assert(stale[0].id == "stale:c1");
    assert(stale[0].kind == DefeaterKind::Undermining);

    AttackGraph::Builder b;
    b.add_claim(c1);
    b.add_claim(c2);
    for (const auto& d : stale) b.add_defeater(d);
    AttackGraph g = b.build();
    std::vector<ClaimVerdict> verdicts = assess(g, resolve(g));

    std::vector<Claim> claims{c1, c2};
    assert(apply_verdicts(claims, verdicts) == 1);
    assert(claims[0].status == ClaimStatus::Defeated);
    assert(claims[1].status == ClaimStatus::Entertained);

    std::cout << "  PASS" << std::endl;
}

void test_engine_retraction_reinstates() {
    std::cout << "Testing engine snapshots, retraction and reinstatement..." << std::endl;

    EvidenceLedger ledger;
    DefeaterEngine engine(ledger);
    engine.assert_claim(claim("x", measured(0.9)), "s1", "extractor");
    engine.declare(defeater("A", "x"), "s1", "critic");
    engine.declare(defeater("B", "A"), "s1", "critic");
    uint64_t c_seq = engine.declare(defeater("C", "B"), "s1", "critic");
    ledger.append(EntryKind::ToolCall, {{"tool", "search"}}, "other");

    Snapshot first = engine.snapshot("s1");
    assert(first.graph.size() == 4);
    assert((first.sources == std::vector<uint64_t>{1, 2, 3, 4}));
    EngineResolution res = engine.resolve(first);
    assert(verdict_for(res.verdicts, "x").defeated);

    auto entry = ledger.get(res.sequence);
    assert(entry->kind == EntryKind::Resolution);
    assert(entry->derived_from == first.sources);
    assert(entry->payload["result"]["active_defeaters"].size() == 2);

    std::vector<Claim> claims = first.graph.claims();
    apply_verdicts(claims, res.verdicts);
    assert(claims[0].status == ClaimStatus::Defeated);

    engine.retract(c_seq, "source withdrawn", "critic");
    Snapshot second = engine.snapshot("s1");
    assert(second.graph.size() == 3);
    EngineResolution again = engine.resolve(second);
    assert((again.result.active_defeaters == std::set<DefeaterId>{"B"}));
    assert(!verdict_for(again.verdicts, "x").defeated);
    assert(apply_verdicts(claims, again.verdicts) == 1);
    assert(claims[0].status == ClaimStatus::Entertained);

    // History is intact: replaying the older prefix gives the older graph
    Snapshot past = engine.snapshot("s1", first.upto);
    assert(past.graph.size() == 4);

    bool threw = false;
    try { engine.retract(5, "not a declaration"); } catch (const LedgerError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_engine_retract_revised() {
    std::cout << "Testing retraction of a revised declaration..." << std::endl;

    EvidenceLedger ledger;
    DefeaterEngine engine(ledger);
    engine.assert_claim(claim("x", measured(0.9)), "s2", "extractor");
    uint64_t a_seq = engine.declare(defeater("A", "x"), "s2", "critic");

    // Revise A's strength; the snapshot reads the revision
    Defeater weaker = defeater("A", "x");
    weaker.strength = measured(0.5);
    json payload = weaker;
    ledger.correct(a_seq, EntryKind::Defeater, payload, "critic");
    Snapshot revised = engine.snapshot("s2");
    assert(revised.graph.size() == 2);
    auto a = revised.graph.find("A");
    assert(a);
    assert(near(*revised.graph.defeater(*a).strength.point_value(), 0.5));
    assert(!verdict_for(engine.resolve(revised).verdicts, "x").defeated);

    // Retracting the original declaration removes the revision with it
    engine.retract(a_seq, "critic withdrew", "critic");
    Snapshot gone = engine.snapshot("s2");
    assert(gone.graph.size() == 1);
    assert(!gone.graph.find("A"));
    EngineResolution res = engine.resolve(gone);
    assert(res.result.active_defeaters.empty());
    const ClaimVerdict& v = verdict_for(res.verdicts, "x");
    assert(!v.defeated);
    assert(v.effective == v.original);

    // The prefix before the retraction still holds the revised defeater
    assert(engine.snapshot("s2", revised.upto).graph.size() == 2);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Propagation
// ═══════════════════════════════════════════════════════════════════════════

DependencyGraph sample_dependencies() {
    DependencyGraph g;
    g.add({"b", "a", DependencyKind::DependsOn});
    g.add({"d", "a", DependencyKind::Assumes});
    g.add({"a", "e", DependencyKind::Supports});
    g.add({"c", "b", DependencyKind::DependsOn});
    g.add({"f", "c", DependencyKind::DependsOn});
    g.add({"a", "c", DependencyKind::DependsOn});   // closes a loop back to a
    return g;
}

void test_defeat_propagation() {
    std::cout << "Testing defeat propagation along dependencies..." << std::endl;

    DependencyGraph g = sample_dependencies();
    std::vector<AffectedClaim> affected = propagate_defeat(g, "a");
    assert(affected.size() == 5);

    std::vector<ClaimId> order;
    for (const auto& x : affected) order.push_back(x.claim_id);
    assert((order == std::vector<ClaimId>{"b", "d", "e", "c", "f"}));

    assert(affected[0].action == SuggestedAction::MarkStale);
    assert(affected[1].action == SuggestedAction::Investigate);
    assert(affected[2].action == SuggestedAction::Revalidate);
    assert(affected[3].action == SuggestedAction::Revalidate);
    assert(affected[3].depth == 1);
    assert((affected[3].path == std::vector<ClaimId>{"a", "b"}));
    assert(affected[3].reason == "affected via depends_on: a -> b -> c");
    assert(affected[4].depth == 2);

    // The depth cap stops the walk
    PropagationConfig shallow;
    shallow.max_depth = 2;
    assert(propagate_defeat(g, "a", shallow).size() == 4);
    assert(propagate_defeat(g, "unknown").empty());

    // Only depends_on hits get defeaters; strength falls off past the first level
    std::vector<Defeater> transitive = transitive_defeaters("a", affected);
    assert(transitive.size() == 3);
    assert(transitive[0].id == "transitive:a:b");
    assert(transitive[0].kind == DefeaterKind::Undermining);
    assert(near(*transitive[0].strength.conservative_value(), 0.3));
    assert(near(*transitive[1].strength.conservative_value(), 0.15));

    // They enter resolution like any other defeater
    AttackGraph::Builder b;
    b.add_claim(claim("b", measured(0.9)));
    b.add_claim(claim("c", measured(0.9)));
    b.add_claim(claim("f", measured(0.9)));
    for (const auto& d : transitive) b.add_defeater(d);
    AttackGraph ag = b.build();
    std::vector<ClaimVerdict> verdicts = assess(ag, resolve(ag));
    assert(near(*verdict_for(verdicts, "b").effective.conservative_value(), 0.7));
    assert(near(*verdict_for(verdicts, "c").effective.conservative_value(), 0.85));
    assert(!verdict_for(verdicts, "b").defeated);

    std::vector<Claim> claims = {
        claim("a", measured(0.9)), claim("b", measured(0.9)), claim("c", measured(0.9)),
        claim("d", measured(0.9)), claim("e", measured(0.9)), claim("f", measured(0.9)),
    };
    claims[0].status = ClaimStatus::Defeated;
    claims[2].status = ClaimStatus::Accepted;
    claims[5].status = ClaimStatus::Rejected;
    assert(apply_transitive_defeat(claims, affected) == 3);
    assert(claims[1].status == ClaimStatus::Stale);
    assert(claims[2].status == ClaimStatus::Stale);
    assert(claims[3].status == ClaimStatus::Entertained);
    assert(claims[4].status == ClaimStatus::Stale);
    assert(claims[5].status == ClaimStatus::Rejected);
    assert(claims[0].status == ClaimStatus::Defeated);

    // From resolution verdicts straight to the next round's defeaters
    AttackGraph::Builder rb;
    rb.add_claim(claim("a", measured(0.9)));
    rb.add_claim(claim("b", measured(0.9)));
    rb.add_defeater(defeater("refutation", "a"));
    AttackGraph rg = rb.build();
    std::vector<Defeater> next = propagate_verdicts(g, assess(rg, resolve(rg)));
    assert(next.size() == 3);

    bool threw = false;
    try { g.add({"z", "z", DependencyKind::DependsOn}); } catch (const GraphConstructionError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_dependency_view() {
    std::cout << "Testing dependency views..." << std::endl;

    DependencyGraph g = sample_dependencies();

    DependencyView down = dependency_view(g, "a", DependencyDirection::Downstream, 1);
    assert(down.nodes.size() == 4);
    assert(down.nodes[0].first == "a" && down.nodes[0].second == 0);
    assert(down.edges.size() == 3);

    DependencyView up = dependency_view(g, "c", DependencyDirection::Upstream);
    assert(up.nodes.size() == 3);
    assert(up.nodes[1].first == "b" && up.nodes[1].second == 1);
    assert(up.nodes[2].first == "a" && up.nodes[2].second == 2);
    assert(up.edges.size() == 3);

    json j = up;
    assert(j["nodes"].size() == 3);
    Dependency back = j["edges"][0].get<Dependency>();
    assert(back.from == "c" && back.to == "b");

    Dependency parsed = json{{"from", "x"}, {"to", "y"}, {"kind", "assumes"}}.get<Dependency>();
    assert(parsed.kind == DependencyKind::Assumes);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Calibration
// ═══════════════════════════════════════════════════════════════════════════

void test_calibration_statistics() {
    std::cout << "Testing PAC bound, Wilson interval, z-scores..." << std::endl;

    assert(pac_min_samples(0.1, 0.05) == 185);
    assert(pac_min_samples(0.1, 0.05, 10) > 185 * 10);
    assert(achievable_epsilon(185, 0.05) <= 0.1);
    assert(achievable_epsilon(0, 0.05) == 1.0);

    assert(z_score(0.95) == 1.959963984540054);
    assert(near(z_score(0.80), 1.2816, 1e-3));

    auto [lo0, hi0] = wilson_interval(0, 10);
    assert(lo0 < 1e-12);
    assert(hi0 > 0.2 && hi0 < 0.35);

    auto [lo, hi] = wilson_interval(15, 25);
    assert(lo > 0.38 && lo < 0.6);
    assert(hi > 0.6 && hi < 0.8);

    auto empty = wilson_interval(0, 0);
    assert(empty.first == 0.0 && empty.second == 1.0);

    bool threw = false;
    try { pac_min_samples(0.0, 0.05); } catch (const ConfigError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_calibration_overconfident() {
    std::cout << "Testing calibration report for an overconfident producer..." << std::endl;

    MemoryCalibrationStore store;
    CalibrationTracker tracker(store);
    for (int i = 0; i < 25; ++i) {
        tracker.record_outcome("extractor", measured(0.8), i < 15, 1000 + i);
    }
    tracker.record_outcome("extractor", ConfidenceValue::absent(), true, 2000);

    CalibrationReport r = tracker.report("extractor", 20);
    assert(r.sample_count == 25);
    assert(r.absent_count == 1);
    assert(r.ece > 0.15);
    assert(near(r.ece, 0.25));
    bool nonempty = false;
    for (const auto& b : r.buckets) {
        if (b.sample_size > 0) nonempty = true;
    }
    assert(nonempty);
    assert(r.buckets.size() == 10);
    assert(r.buckets[8].sample_size == 25);
    assert(r.buckets[8].correct == 15);
    assert(near(r.buckets[8].stated_mean, 0.8));
    assert(near(r.brier_score, 0.28));
    assert(near(r.overconfidence_ratio, 0.4));

    // 25 < 185: no claim either way
    assert(r.required_samples == 185);
    assert(r.sufficiency_verdict == SufficiencyVerdict::InsufficientData);
    assert(r.calibration_claim == CalibrationClaim::Undetermined);

    json j = r;
    assert(j["sufficiency_verdict"] == "insufficient_data");
    assert(j.contains("ece"));

    CalibrationConfig stated;
    stated.ece_reference = EceReference::StatedMean;
    CalibrationTracker by_mean(store, stated);
    assert(near(by_mean.report("extractor").ece, 0.2));

    CalibrationReport nobody = tracker.report("nobody");
    assert(nobody.sample_count == 0);
    assert(nobody.sufficiency_verdict == SufficiencyVerdict::InsufficientData);

    std::cout << "  PASS" << std::endl;
}

void test_calibration_sufficient() {
    std::cout << "Testing calibration verdicts with enough data..." << std::endl;

    MemoryCalibrationStore store;
    CalibrationTracker tracker(store);
    for (int i = 0; i < 200; ++i) {
        tracker.record_outcome("good", measured(0.85), i < 170);
        tracker.record_outcome("bold", ConfidenceValue::deterministic(true, "asserted"), i < 120);
    }

    CalibrationReport good = tracker.report("good");
    assert(good.sufficient());
    assert(good.ece <= 0.1);
    assert(good.calibration_claim == CalibrationClaim::WellCalibrated);

    CalibrationReport bold = tracker.report("bold");
    assert(bold.sufficient());
    assert(bold.buckets[9].sample_size == 200);
    assert(near(bold.ece, 0.35));
    assert(bold.calibration_claim == CalibrationClaim::Miscalibrated);

    // A caller floor above the PAC bound still applies
    assert(!tracker.report("good", 500).sufficient());

    ConfidenceValue acc = tracker.measured_accuracy("good");
    assert(acc.kind() == ConfidenceKind::Measured);
    const Measured& m = acc.as<Measured>();
    assert(near(m.value, 0.85));
    assert(m.sample_size == 200);
    assert(m.ci_low < 0.85 && m.ci_high > 0.85);

    ConfidenceValue none = tracker.measured_accuracy("nobody");
    assert(none.is_absent());
    assert(none.as<Absent>().reason == AbsentReason::InsufficientData);

    assert(tracker.report_all().size() == 2);

    std::string path = temp_path("calibration.json");
    assert(tracker.save_report(path, good));
    std::remove(path.c_str());

    std::cout << "  PASS" << std::endl;
}

void test_smooth_ece() {
    std::cout << "Testing kernel-smoothed ECE..." << std::endl;

    assert(near(smooth_ece({{0.8, false}}), 0.8));

    std::vector<std::pair<double, bool>> steady;
    for (int i = 0; i < 25; ++i) steady.emplace_back(0.8, i < 15);
    assert(silverman_bandwidth({0.8, 0.8, 0.8}) == 0.01);
    assert(silverman_bandwidth({}) == 0.1);
    assert(near(smooth_ece(steady), 0.2, 1e-6));

    SmoothEceOptions wide;
    wide.bandwidth = 0.1;
    wide.kernel = KernelType::Epanechnikov;
    assert(near(smooth_ece(steady, wide), 0.2, 1e-6));

    std::vector<std::pair<double, bool>> honest;
    for (int i = 0; i < 100; ++i) honest.emplace_back(0.5, i % 2 == 0);
    assert(smooth_ece(honest) < 0.01);

    bool threw = false;
    try { smooth_ece({}); } catch (const ConstructionError&) { threw = true; }
    assert(threw);

    // Reports carry it alongside the binned figure
    MemoryCalibrationStore store;
    CalibrationTracker tracker(store);
    for (int i = 0; i < 25; ++i) tracker.record_outcome("extractor", measured(0.8), i < 15);
    CalibrationReport r = tracker.report("extractor");
    assert(near(r.smooth_ece, 0.2, 1e-6));
    json j = r;
    assert(j.contains("smooth_ece"));
    assert(tracker.report("nobody").smooth_ece == 0.0);

    std::cout << "  PASS" << std::endl;
}

void test_calibration_ledger_store() {
    std::cout << "Testing ledger-backed calibration with corrections..." << std::endl;

    EvidenceLedger ledger;
    LedgerCalibrationStore store(ledger);
    CalibrationTracker tracker(store);

    uint64_t s1 = tracker.record_outcome("extractor", measured(0.9), true);
    uint64_t s2 = tracker.record_outcome("extractor", measured(0.9), false);
    tracker.record_outcome("extractor", measured(0.9), true);
    tracker.record_outcome("retriever", measured(0.6), true);
    assert(ledger.by_kind(EntryKind::Outcome).size() == 4);
    assert(store.samples("extractor").size() == 3);

    // Verified wrongly: the second outcome was actually correct
    CalibrationSample fixed = store.samples("extractor")[1];
    fixed.actual = true;
    store.replace(s2, fixed);
    store.retract(s1, "duplicate verification");

    auto samples = store.samples("extractor");
    assert(samples.size() == 2);
    assert(samples[0].actual && samples[1].actual);
    assert(tracker.report("extractor").sample_count == 2);
    assert((store.producers() == std::vector<ProducerId>{"extractor", "retriever"}));

    bool threw = false;
    try { store.retract(999, "missing"); } catch (const LedgerError&) { threw = true; }
    assert(threw);

    uint64_t published = tracker.publish(ledger, tracker.report("extractor"));
    assert(ledger.get(published)->kind == EntryKind::Calibration);
    assert(ledger.get(published)->payload["producer_id"] == "extractor");

    // Repeated corrections of one outcome: only the newest counts
    EvidenceLedger chained;
    LedgerCalibrationStore chain_store(chained);
    CalibrationTracker chain_tracker(chain_store);
    uint64_t once = chain_tracker.record_outcome("ranker", measured(0.7), false);
    CalibrationSample revised = chain_store.samples("ranker")[0];
    revised.actual = true;
    chain_store.replace(once, revised);
    revised.predicted = measured(0.4);
    chain_store.replace(once, revised);
    auto ranker = chain_store.samples("ranker");
    assert(ranker.size() == 1);
    assert(near(*ranker[0].predicted.point_value(), 0.4));
    assert(chain_tracker.report("ranker").sample_count == 1);

    // Withdrawing a replaced outcome withdraws the replacement too
    uint64_t twice = chain_tracker.record_outcome("ranker", measured(0.9), true);
    chain_store.replace(twice, revised);
    assert(chain_store.samples("ranker").size() == 2);
    chain_store.retract(twice, "never verified");
    assert(chain_store.samples("ranker").size() == 1);
    assert(chain_tracker.report("ranker").sample_count == 1);

    // Correcting the revision itself follows the chain as well
    uint64_t rev = chained.latest_revision(once);
    assert(rev != once);
    chain_store.retract(rev, "revision was wrong");
    assert(chain_store.samples("ranker").empty());
    assert(chain_store.producers().empty());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

void test_config() {
    std::cout << "Testing configuration parsing..." << std::endl;

    Config c = Config::from_json({
        {"derivation", {{"absent_policy", "neutral"}}},
        {"resolution", {{"max_iterations", 50}}},
        {"calibration", {{"bucket_count", 5}, {"ece_reference", "stated_mean"}}},
        {"ledger", {{"path", "/tmp/x.log"}, {"fsync", false}}},
    });
    assert(c.derivation.absent_policy == AbsentPolicy::Neutral);
    assert(c.resolution.max_iterations == 50);
    assert(c.resolution.defeat_threshold == 0.05);
    assert(c.calibration.bucket_count == 5);
    assert(c.calibration.ece_reference == EceReference::StatedMean);
    assert(!c.ledger.fsync);

    const json bad[] = {
        {{"derivation", {{"absent_policy", "lenient"}}}},
        {{"calibration", {{"epsilon", 2.0}}}},
        {{"calibration", {{"bucket_count", 0}}}},
        {{"resolution", {{"max_iterations", "many"}}}},
    };
    for (const auto& j : bad) {
        bool threw = false;
        try { Config::from_json(j); } catch (const ConfigError&) { threw = true; }
        assert(threw);
    }

    bool threw = false;
    try { Config::load(temp_path("missing.json")); } catch (const ConfigError&) { threw = true; }
    assert(threw);

    ::setenv("PRAMANA_MAX_ITERATIONS", "12", 1);
    Config env;
    env.apply_env();
    assert(env.resolution.max_iterations == 12);
    ::setenv("PRAMANA_MAX_ITERATIONS", "twelve", 1);
    threw = false;
    try { env.apply_env(); } catch (const ConfigError&) { threw = true; }
    assert(threw);
    ::unsetenv("PRAMANA_MAX_ITERATIONS");

    LedgerConfig mem;
    assert(make_ledger_store(mem)->describe() == "memory");

    Config prop = Config::from_json({
        {"propagation", {{"max_depth", 3}, {"direct_strength", 0.5}}},
        {"calibration", {{"smooth_bandwidth", 0.05}}},
        {"verbose", true},
    });
    assert(prop.propagation.max_depth == 3);
    assert(prop.propagation.direct_strength == 0.5);
    assert(prop.propagation.indirect_strength == 0.15);
    assert(prop.calibration.smooth_bandwidth == 0.05);
    threw = false;
    try { Config::from_json({{"propagation", {{"max_depth", 0}}}}); } catch (const ConfigError&) { threw = true; }
    assert(threw);

    // Verbosity takes effect only when applied
    bool was_verbose = verbose();
    set_verbose(false);
    assert(!verbose());
    prop.apply();
    assert(verbose());
    Config quiet;
    quiet.apply();
    assert(!verbose());
    set_verbose(was_verbose);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Pramana Tests ===" << std::endl;
    std::cout << "version " << PRAMANA_VERSION << std::endl;
    std::cout << std::endl;

    test_confidence_construction();
    test_lattice_order();

    test_derive_formula();
    test_derive_unknown_input();
    test_derive_malformed();
    test_derive_absent_policy();
    test_derive_calibration_status();
    test_verify_rejects_unproven();

    test_ledger_append();
    test_ledger_cursor_isolation();
    test_ledger_store_failure();
    test_file_ledger_recovery();
    test_ledger_concurrent_access();
    test_provenance_roundtrip();

    test_reflexivity();
    test_graph_construction_errors();
    test_two_cycle_skepticism();
    test_chain_reinstatement();
    test_partial_defeat();
    test_nonconvergence_disclosure();
    test_stale_evidence();
    test_engine_retraction_reinstates();
    test_engine_retract_revised();

    test_defeat_propagation();
    test_dependency_view();

    test_calibration_statistics();
    test_calibration_overconfident();
    test_calibration_sufficient();
    test_smooth_ece();
    test_calibration_ledger_store();

    test_config();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
