#pragma once
// Pramana: epistemic bookkeeping for agent claims
//
// - Confidence: typed values forming a bounded lattice
// - Derivation: formulas with machine-checkable proofs
// - Ledger: append-only evidence log, memory or file backed
// - Provenance: PROV-JSON export of any ledger segment
// - Defeaters: attack graphs under grounded semantics
// - Propagation: defeat passed along claim dependencies
// - Calibration: stated confidence against observed accuracy

#include "version.hpp"
#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "confidence.hpp"
#include "derivation.hpp"
#include "claims.hpp"
#include "ledger.hpp"
#include "wal.hpp"
#include "provenance.hpp"
#include "defeaters.hpp"
#include "defeater_engine.hpp"
#include "propagation.hpp"
#include "calibration.hpp"
