// ============================================================================
// Fragment 2.3.02 — Control Section Selector (Hard Constraints + Error Refinement + Size/Cap Bounds) (C++)
// File: section_selector.hpp
// ============================================================================
//
// Purpose:
// - Choose WHERE along the span to place K control sections so a piecewise
//   linear beam/aero model reproduces the tabulated properties within
//   tolerance, respecting discontinuities, element-size bounds and a total
//   element cap.
//
// Pipeline (each step: const SectionState& -> SectionState, no hidden state):
//   1) start detection         override | first chord > c_eps | first stiffness > 1e-6*max
//   2) detect_hard_constraints START/END + JUMP:<sig> + VERTEX:Chord
//   3) enforce_max_length      equal subdivision of over-long intervals (MAX_DR)
//   4) refine_by_error         bisect intervals whose midpoint error > tol (ERR>tol:<sig>)
//   5) enforce_min_length      drop unprotected sections next to short intervals
//   6) enforce_cap             drop unprotected sections nearest mid-span
//   7) finalize                sorted, deduped (1e-12) sections + report
//
// Precedence when bounds collide:
//   discontinuities (START/END/JUMP/VERTEX) > size bounds > element cap.
//   Protected sections are never removed; the conflict becomes a warning.
//
// Termination:
// - Every loop strictly removes or adds sections and is additionally bounded
//   by max_sweeps(cfg); hitting the ceiling records a warning.
//
// Failure:
// - InsufficientDomainError when the structural table has < 2 samples.
// - ValidationError for invalid settings.
// - Never fails because tolerances cannot be met.
//
// ============================================================================

#pragma once
#include "rotorbeam/blade/sample_series.hpp"
#include "rotorbeam/blade/section_reason.hpp"
#include "rotorbeam/blade/section_report.hpp"
#include "rotorbeam/core/settings.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rotorbeam::blade {

// Positions closer than this are the same section.
inline constexpr double kSectionMergeTol = 1e-12;

// Stiffness measures tracked by default (beam-local y/z naming).
inline const std::vector<std::string>& default_structural_signals() {
    static const std::vector<std::string> k{"EA", "EJY", "EJZ", "GJ"};
    return k;
}

inline constexpr const char* kChordSignal = "Chord";

struct TrackedSignal final {
    std::string name;
    SampleSeries series; // native samples
};

// Everything the pipeline steps read. Built once per select call.
struct SelectionContext final {
    SelectionSettings cfg;
    std::vector<TrackedSignal> structural;
    std::optional<TrackedSignal> chord;
    double domain_min = 0.0;
    double domain_max = 0.0;
    double start = 0.0;

    // structural first (tracking order), chord last
    std::vector<const TrackedSignal*> all_signals() const;
};

// Immutable-by-convention refinement state.
struct SectionState final {
    ReasonMap sections;
    std::vector<std::string> warnings;
    std::vector<std::string> notes;
    std::uint64_t next_seq = 1;

    std::vector<double> positions() const;
    std::size_t element_count() const noexcept { return sections.empty() ? 0 : sections.size() - 1; }

    // Attach `why` at r, merging into an existing section within kSectionMergeTol.
    // Returns the key the reason landed on.
    double add(double r, SectionReason why);

    // Like add(), but only if no section exists near r. Returns false otherwise.
    bool add_if_new(double r, SectionReason why);
};

struct SelectionResult final {
    std::vector<double> sections;
    SectionReport report;
};

// ---------- building blocks ----------

// Loop ceiling shared by all iterative steps.
std::size_t max_sweeps(const SelectionSettings& cfg) noexcept;

// Throws InsufficientDomainError / ValidationError / DataShapeError.
SelectionContext make_selection_context(const SignalTable& structural,
                                        const SignalTable* aero,
                                        const SelectionSettings& cfg);

double detect_start(const SelectionContext& ctx);

// Positions x[i] (i >= 1, x[i] >= start) where |y[i]-y[i-1]| / max(|y[i-1]|,|y[i]|,eps) >= tol.
std::vector<double> detect_jumps(const SampleSeries& s, double start, double jump_tol);

// Interior chord extrema beyond `start` whose neighbouring change exceeds 1e-3 * max|c|.
std::vector<double> detect_chord_vertices(const SampleSeries& chord, double start);

// Relative error between the true value at (a+b)/2 and the chord between a and b.
double midpoint_error(const SampleSeries& s, double a, double b) noexcept;

// ---------- pipeline steps ----------

SectionState initial_state(const SelectionContext& ctx);
SectionState detect_hard_constraints(const SectionState& in, const SelectionContext& ctx);
SectionState enforce_max_length(const SectionState& in, const SelectionContext& ctx);
SectionState refine_by_error(const SectionState& in, const SelectionContext& ctx);
SectionState enforce_min_length(const SectionState& in, const SelectionContext& ctx);
SectionState enforce_cap(const SectionState& in, const SelectionContext& ctx);
SelectionResult finalize(const SectionState& in, const SelectionContext& ctx);

// Full pipeline. Warnings are also logged at WARN level.
SelectionResult select_sections(const SignalTable& structural,
                                const SignalTable* aero,
                                const SelectionSettings& cfg);

} // namespace rotorbeam::blade
