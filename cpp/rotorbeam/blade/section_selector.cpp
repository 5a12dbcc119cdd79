// ============================================================================
// Fragment 2.3.02 — Control Section Selector (Implementation)
// File: section_selector.cpp
// ============================================================================

#include "rotorbeam/blade/section_selector.hpp"
#include "rotorbeam/blade/interpolator.hpp"
#include "rotorbeam/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace rotorbeam::blade {

namespace {

constexpr double kEps = 1e-12;

// Stiffness above this fraction of the global maximum marks the blade start.
constexpr double kStartFraction = 1e-6;

// Chord extrema smaller than this fraction of max|chord| are noise.
constexpr double kVertexFraction = 1e-3;

std::string fmt6(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << v;
    return oss.str();
}

std::string opt_str(const std::optional<double>& v) {
    if (!v) return "None";
    std::ostringstream oss;
    oss << *v;
    return oss.str();
}

std::string join_tags(const SectionEntry& e) {
    std::string out;
    for (const auto& t : e.tags()) {
        if (!out.empty()) out += ",";
        out += t;
    }
    return out;
}

ReasonMap::iterator find_near(ReasonMap& m, double r) {
    auto it = m.lower_bound(r - kSectionMergeTol);
    if (it != m.end() && it->first <= r + kSectionMergeTol) return it;
    return m.end();
}

TrackedSignal make_tracked(const std::string& name, const SignalTable& t) {
    TrackedSignal s;
    s.name = name;
    s.series = t.series(name);
    return s;
}

void note_ceiling(SectionState& s, const char* step, std::size_t sweeps) {
    s.warnings.push_back(std::string(step) + ": no fixed point after " + std::to_string(sweeps) +
                         " sweeps; stopped at iteration ceiling");
}

} // namespace

// ---------------------------------------------------------------------------
// SelectionContext / SectionState
// ---------------------------------------------------------------------------

std::vector<const TrackedSignal*> SelectionContext::all_signals() const {
    std::vector<const TrackedSignal*> out;
    out.reserve(structural.size() + 1);
    for (const auto& s : structural) out.push_back(&s);
    if (chord) out.push_back(&*chord);
    return out;
}

std::vector<double> SectionState::positions() const {
    std::vector<double> out;
    out.reserve(sections.size());
    for (const auto& kv : sections) out.push_back(kv.first);
    return out;
}

double SectionState::add(double r, SectionReason why) {
    why.seq = next_seq++;
    auto it = find_near(sections, r);
    if (it == sections.end()) {
        it = sections.emplace(r, SectionEntry{}).first;
    }
    auto& rs = it->second.reasons;
    for (const auto& e : rs) {
        if (e.same_tag(why)) return it->first;
    }
    rs.push_back(std::move(why));
    return it->first;
}

bool SectionState::add_if_new(double r, SectionReason why) {
    if (find_near(sections, r) != sections.end()) return false;
    add(r, std::move(why));
    return true;
}

// ---------------------------------------------------------------------------
// Building blocks
// ---------------------------------------------------------------------------

std::size_t max_sweeps(const SelectionSettings& cfg) noexcept {
    const int cap = std::max(cfg.max_elements, 1);
    return 4u * static_cast<std::size_t>(cap) + 64u;
}

SelectionContext make_selection_context(const SignalTable& structural,
                                        const SignalTable* aero,
                                        const SelectionSettings& cfg) {
    cfg.validate_or_throw();

    ROTORBEAM_REQUIRE(structural.x.size() >= 2, InsufficientDomainError,
                      "structural table needs at least 2 samples, got " + std::to_string(structural.x.size()));

    const SignalTable st = normalize_columns(structural.x, structural.columns);
    ROTORBEAM_REQUIRE(st.size() >= 2, InsufficientDomainError,
                      "structural table has fewer than 2 distinct stations");

    SelectionContext ctx;
    ctx.cfg = cfg;
    ctx.domain_min = st.x.front();
    ctx.domain_max = st.x.back();

    for (const auto& name : default_structural_signals()) {
        if (st.has(name)) ctx.structural.push_back(make_tracked(name, st));
    }
    if (ctx.structural.empty()) {
        // Non-canonical table: track every column.
        for (const auto& name : st.names()) ctx.structural.push_back(make_tracked(name, st));
    }

    if (aero != nullptr && aero->has(kChordSignal) && !aero->x.empty()) {
        ColumnMap cols;
        cols.emplace(kChordSignal, aero->column(kChordSignal));
        const SignalTable ct = normalize_columns(aero->x, cols);
        ctx.chord = make_tracked(kChordSignal, ct);
    }

    ctx.start = detect_start(ctx);
    return ctx;
}

double detect_start(const SelectionContext& ctx) {
    const double lo = ctx.domain_min;
    const double hi = ctx.domain_max;

    // clamp into [lo, hi)
    double upper = hi - kEps;
    if (!(upper < hi)) upper = std::nextafter(hi, -std::numeric_limits<double>::infinity());
    upper = std::max(lo, upper);
    const auto clamp_start = [&](double r) { return clamp(r, lo, upper); };

    if (ctx.cfg.start_override) {
        return clamp_start(*ctx.cfg.start_override);
    }

    if (ctx.chord) {
        const auto& c = ctx.chord->series;
        for (std::size_t i = 0; i < c.size(); ++i) {
            if (is_finite(c.y[i]) && c.y[i] > ctx.cfg.chord_epsilon) return clamp_start(c.x[i]);
        }
    }

    if (!ctx.structural.empty()) {
        double maxv = 0.0;
        for (const auto& sig : ctx.structural) {
            for (double y : sig.series.y) {
                if (is_finite(y)) maxv = std::max(maxv, std::fabs(y));
            }
        }
        if (maxv > 0.0) {
            const double thr = kStartFraction * maxv;
            const auto& x = ctx.structural.front().series.x;
            for (std::size_t i = 0; i < x.size(); ++i) {
                for (const auto& sig : ctx.structural) {
                    const double y = sig.series.y[i];
                    if (is_finite(y) && y > thr) return clamp_start(x[i]);
                }
            }
        }
    }

    return lo;
}

std::vector<double> detect_jumps(const SampleSeries& s, double start, double jump_tol) {
    std::vector<double> out;
    for (std::size_t i = 1; i < s.size(); ++i) {
        if (s.x[i] < start) continue;
        const double y0 = s.y[i - 1];
        const double y1 = s.y[i];
        if (!is_finite(y0) || !is_finite(y1)) continue;

        const double base = std::max({std::fabs(y0), std::fabs(y1), kEps});
        const double rel = std::fabs(y1 - y0) / base;
        if (rel >= jump_tol) out.push_back(s.x[i]);
    }
    return out;
}

std::vector<double> detect_chord_vertices(const SampleSeries& chord, double start) {
    std::vector<double> out;
    if (chord.size() < 3) return out;

    double cmax = 0.0;
    for (double c : chord.y) {
        if (is_finite(c)) cmax = std::max(cmax, std::fabs(c));
    }
    if (cmax <= 0.0) return out;

    const double delta_thr = kVertexFraction * cmax;
    for (std::size_t i = 1; i + 1 < chord.size(); ++i) {
        if (chord.x[i] < start) continue;
        const double dl = chord.y[i] - chord.y[i - 1];
        const double dr = chord.y[i + 1] - chord.y[i];
        if (!is_finite(dl) || !is_finite(dr)) continue;
        if (dl * dr <= 0.0 && std::max(std::fabs(dl), std::fabs(dr)) > delta_thr) {
            out.push_back(chord.x[i]);
        }
    }
    return out;
}

double midpoint_error(const SampleSeries& s, double a, double b) noexcept {
    if (b <= a + kEps) return 0.0;
    const double rm = 0.5 * (a + b);
    const double ya = interp_clamped(s, a);
    const double yb = interp_clamped(s, b);
    const double ym = interp_clamped(s, rm);
    const double ylin = ya + (yb - ya) * (rm - a) / (b - a);
    const double denom = std::max({std::fabs(ym), std::fabs(ya), std::fabs(yb), kEps});
    return std::fabs(ym - ylin) / denom;
}

// ---------------------------------------------------------------------------
// Pipeline steps
// ---------------------------------------------------------------------------

SectionState initial_state(const SelectionContext& ctx) {
    // START and END are placed directly (never merged) so K >= 2 holds even on
    // a domain narrower than the merge tolerance.
    SectionState s;
    SectionReason start = SectionReason::start();
    start.seq = s.next_seq++;
    SectionReason end = SectionReason::end();
    end.seq = s.next_seq++;

    s.sections[ctx.start].reasons.push_back(std::move(start));
    s.sections[ctx.domain_max].reasons.push_back(std::move(end));
    return s;
}

SectionState detect_hard_constraints(const SectionState& in, const SelectionContext& ctx) {
    SectionState s = in;
    const double lo = ctx.start;
    const double hi = ctx.domain_max;

    for (const auto& sig : ctx.structural) {
        for (double r : detect_jumps(sig.series, lo, ctx.cfg.jump_tolerance)) {
            if (r >= lo && r <= hi) s.add(r, SectionReason::jump(sig.name));
        }
    }

    if (ctx.chord) {
        for (double r : detect_jumps(ctx.chord->series, lo, ctx.cfg.jump_tolerance)) {
            if (r >= lo && r <= hi) s.add(r, SectionReason::jump(ctx.chord->name));
        }
        for (double r : detect_chord_vertices(ctx.chord->series, lo)) {
            if (r >= lo && r <= hi) s.add(r, SectionReason::vertex(ctx.chord->name));
        }
    }
    return s;
}

SectionState enforce_max_length(const SectionState& in, const SelectionContext& ctx) {
    if (!ctx.cfg.max_segment_length) return in;

    SectionState s = in;
    const double max_len = *ctx.cfg.max_segment_length;
    const auto cap = static_cast<std::size_t>(ctx.cfg.max_elements);
    const std::size_t ceiling = max_sweeps(ctx.cfg);

    for (std::size_t sweep = 0;; ++sweep) {
        if (sweep >= ceiling) {
            note_ceiling(s, "max_segment", sweep);
            break;
        }

        const auto pos = s.positions();
        std::vector<double> pts;
        for (std::size_t i = 0; i + 1 < pos.size(); ++i) {
            const double a = pos[i];
            const double dr = pos[i + 1] - a;
            if (dr > max_len + kEps) {
                const auto n = static_cast<std::size_t>(std::ceil(dr / max_len));
                for (std::size_t k = 1; k < n; ++k) {
                    pts.push_back(a + dr * static_cast<double>(k) / static_cast<double>(n));
                }
            }
        }
        if (pts.empty()) break;

        std::size_t added = 0;
        for (double p : pts) {
            if (s.add_if_new(p, SectionReason::max_segment())) ++added;
        }
        if (added == 0) break;
        if (s.element_count() >= cap) break;
    }
    return s;
}

SectionState refine_by_error(const SectionState& in, const SelectionContext& ctx) {
    SectionState s = in;
    const auto signals = ctx.all_signals();
    if (signals.empty()) return s;

    const double tol = ctx.cfg.error_tolerance;
    const auto cap = static_cast<std::size_t>(ctx.cfg.max_elements);
    const std::size_t ceiling = max_sweeps(ctx.cfg);

    for (std::size_t sweep = 0; s.element_count() < cap; ++sweep) {
        if (sweep >= ceiling) {
            note_ceiling(s, "error_refinement", sweep);
            break;
        }

        const auto pos = s.positions();
        std::vector<std::pair<double, SectionReason>> splits;
        for (std::size_t i = 0; i + 1 < pos.size(); ++i) {
            const double a = pos[i];
            const double b = pos[i + 1];
            // never refine sub-minimum segments
            if (ctx.cfg.min_segment_length && (b - a) <= *ctx.cfg.min_segment_length + kEps) continue;

            double emax = 0.0;
            const TrackedSignal* worst = nullptr;
            for (const TrackedSignal* sig : signals) {
                const double e = midpoint_error(sig->series, a, b);
                // a non-finite sample leaves its own signal out of the sweep
                if (!is_finite(e)) continue;
                if (worst == nullptr || e > emax) {
                    emax = e;
                    worst = sig;
                }
            }
            if (worst != nullptr && emax > tol) {
                splits.emplace_back(0.5 * (a + b), SectionReason::error_exceeded(tol, worst->name));
            }
        }
        if (splits.empty()) break;

        // all splits of one sweep are applied together
        const std::size_t before = s.sections.size();
        for (auto& sp : splits) s.add(sp.first, std::move(sp.second));
        if (s.sections.size() == before) break;
    }
    return s;
}

SectionState enforce_min_length(const SectionState& in, const SelectionContext& ctx) {
    if (!ctx.cfg.min_segment_length) return in;

    SectionState s = in;
    const double min_len = *ctx.cfg.min_segment_length;
    const std::size_t ceiling = max_sweeps(ctx.cfg) + in.sections.size();

    for (std::size_t sweep = 0;; ++sweep) {
        if (sweep >= ceiling) {
            note_ceiling(s, "min_segment", sweep);
            break;
        }
        if (s.sections.size() <= 2) break;

        const auto pos = s.positions();
        std::size_t victim = 0;
        std::uint64_t victim_seq = 0;
        for (std::size_t i = 1; i + 1 < pos.size(); ++i) {
            const double left = pos[i] - pos[i - 1];
            const double right = pos[i + 1] - pos[i];
            if (!(std::min(left, right) < min_len - kEps)) continue;

            const SectionEntry& e = s.sections.at(pos[i]);
            if (e.is_protected()) continue;

            // least recently justified first, ties by lowest index
            const std::uint64_t seq = e.justified_seq();
            if (victim == 0 || seq < victim_seq) {
                victim = i;
                victim_seq = seq;
            }
        }
        if (victim == 0) break;

        const double r = pos[victim];
        s.warnings.push_back("min_segment merge: removed section at r=" + fmt6(r) + " (" +
                             join_tags(s.sections.at(r)) + ")");
        s.sections.erase(r);
    }

    const auto pos = s.positions();
    for (std::size_t i = 0; i + 1 < pos.size(); ++i) {
        const double len = pos[i + 1] - pos[i];
        if (len < min_len - kEps) {
            s.warnings.push_back("interval [" + fmt6(pos[i]) + ", " + fmt6(pos[i + 1]) + "] length " +
                                 fmt6(len) + " below min_segment_length=" + fmt6(min_len) +
                                 " kept: bounded by protected sections");
        }
    }
    return s;
}

SectionState enforce_cap(const SectionState& in, const SelectionContext& ctx) {
    SectionState s = in;
    const auto cap = static_cast<std::size_t>(ctx.cfg.max_elements);
    const std::size_t ceiling = max_sweeps(ctx.cfg) + in.sections.size();

    for (std::size_t sweep = 0; s.element_count() > cap; ++sweep) {
        if (sweep >= ceiling) {
            note_ceiling(s, "element_cap", sweep);
            break;
        }

        const auto pos = s.positions();
        const double mid = 0.5 * (pos.front() + pos.back());

        std::size_t victim = 0;
        double victim_dist = 0.0;
        for (std::size_t i = 1; i + 1 < pos.size(); ++i) {
            if (s.sections.at(pos[i]).is_protected()) continue;
            const double d = std::fabs(pos[i] - mid);
            if (victim == 0 || d < victim_dist) {
                victim = i;
                victim_dist = d;
            }
        }

        if (victim == 0) {
            s.warnings.push_back("max_elements=" + std::to_string(cap) + " unsatisfiable: " +
                                 std::to_string(s.element_count()) +
                                 " elements remain and every interior section is protected");
            break;
        }

        const double r = pos[victim];
        s.notes.push_back("element cap: dropped section at r=" + fmt6(r) + " (" +
                          join_tags(s.sections.at(r)) + ")");
        s.sections.erase(r);
    }
    return s;
}

SelectionResult finalize(const SectionState& in, const SelectionContext& ctx) {
    SelectionResult out;
    SectionReport& rep = out.report;

    rep.reasons = in.sections;
    rep.sections = in.positions();
    rep.start_used = ctx.start;

    const std::size_t k = rep.sections.size();
    rep.elements = (k > 0) ? k - 1 : 0;
    rep.nodes = (k > 0) ? 2 * k - 1 : 0;

    std::vector<std::string> warnings = in.warnings;
    if (ctx.cfg.max_segment_length) {
        const double max_len = *ctx.cfg.max_segment_length;
        for (std::size_t i = 0; i + 1 < k; ++i) {
            const double len = rep.sections[i + 1] - rep.sections[i];
            if (len > max_len + kEps) {
                warnings.push_back("interval [" + fmt6(rep.sections[i]) + ", " + fmt6(rep.sections[i + 1]) +
                                   "] length " + fmt6(len) + " exceeds max_segment_length=" + fmt6(max_len) +
                                   " (element cap)");
            }
        }
    }

    std::unordered_set<std::string> seen;
    for (auto& w : warnings) {
        if (seen.insert(w).second) rep.warnings.push_back(std::move(w));
    }

    std::string sig_names;
    for (const TrackedSignal* sig : ctx.all_signals()) {
        if (!sig_names.empty()) sig_names += ",";
        sig_names += sig->name;
    }
    rep.notes.push_back("signals=" + sig_names);

    std::ostringstream params;
    params << "err_tol=" << ctx.cfg.error_tolerance
           << ", jump_tol=" << ctx.cfg.jump_tolerance
           << ", max_elems=" << ctx.cfg.max_elements
           << ", max_dr=" << opt_str(ctx.cfg.max_segment_length)
           << ", min_dr=" << opt_str(ctx.cfg.min_segment_length);
    rep.notes.push_back(params.str());
    for (const auto& n : in.notes) rep.notes.push_back(n);

    out.sections = rep.sections;
    return out;
}

SelectionResult select_sections(const SignalTable& structural,
                                const SignalTable* aero,
                                const SelectionSettings& cfg) {
    const SelectionContext ctx = make_selection_context(structural, aero, cfg);

    SectionState s = initial_state(ctx);
    s = detect_hard_constraints(s, ctx);
    s = enforce_max_length(s, ctx);
    s = refine_by_error(s, ctx);
    s = enforce_min_length(s, ctx);
    s = enforce_cap(s, ctx);

    SelectionResult out = finalize(s, ctx);

    for (const auto& w : out.report.warnings) log(LogLevel::WARN, "sections", w);
    log(LogLevel::INFO, "sections",
        "selected K=" + std::to_string(out.sections.size()) +
            " elements=" + std::to_string(out.report.elements) +
            " r_start=" + fmt6(out.report.start_used));
    return out;
}

} // namespace rotorbeam::blade
