// ============================================================================
// Fragment 2.3.01 — Section Reasons (Typed Provenance Tags + Protection Ranking) (C++)
// File: section_reason.hpp
// ============================================================================
//
// Every control section carries one or more reasons explaining why it exists.
// Reasons are typed internally; strings appear only when a report is emitted:
//
//   Start            -> "START"
//   End              -> "END"
//   Jump(signal)     -> "JUMP:<signal>"
//   Vertex(signal)   -> "VERTEX:<signal>"       (chord planform extremum)
//   MaxSegment       -> "MAX_DR"
//   ErrorExceeded    -> "ERR><tol %.3f>:<signal>"
//
// Priority ranking (higher wins; Discontinuity and above are never removed by
// min-length merging or element-cap trimming):
//
//   Boundary      (3)  Start, End
//   Discontinuity (2)  Jump, Vertex
//   Sizing        (1)  MaxSegment
//   Refinement    (0)  ErrorExceeded
//
// A section's priority is the highest priority among its reasons.
//
// ============================================================================

#pragma once
#include <cstdint>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace rotorbeam::blade {

enum class ReasonKind : std::uint8_t {
    Start = 0,
    End = 1,
    Jump = 2,
    Vertex = 3,
    MaxSegment = 4,
    ErrorExceeded = 5
};

enum class SectionPriority : std::uint8_t {
    Refinement = 0,
    Sizing = 1,
    Discontinuity = 2,
    Boundary = 3
};

inline SectionPriority priority_of(ReasonKind k) noexcept {
    switch (k) {
        case ReasonKind::Start:
        case ReasonKind::End:           return SectionPriority::Boundary;
        case ReasonKind::Jump:
        case ReasonKind::Vertex:        return SectionPriority::Discontinuity;
        case ReasonKind::MaxSegment:    return SectionPriority::Sizing;
        case ReasonKind::ErrorExceeded: return SectionPriority::Refinement;
        default:                        return SectionPriority::Refinement;
    }
}

inline bool is_protected(SectionPriority p) noexcept {
    return p >= SectionPriority::Discontinuity;
}

struct SectionReason final {
    ReasonKind kind = ReasonKind::Start;
    std::string signal;      // Jump / Vertex / ErrorExceeded
    double tolerance = 0.0;  // ErrorExceeded
    std::uint64_t seq = 0;   // pipeline order in which it was attached

    static SectionReason start() { return SectionReason{ReasonKind::Start, {}, 0.0, 0}; }
    static SectionReason end() { return SectionReason{ReasonKind::End, {}, 0.0, 0}; }
    static SectionReason jump(std::string sig) { return SectionReason{ReasonKind::Jump, std::move(sig), 0.0, 0}; }
    static SectionReason vertex(std::string sig) { return SectionReason{ReasonKind::Vertex, std::move(sig), 0.0, 0}; }
    static SectionReason max_segment() { return SectionReason{ReasonKind::MaxSegment, {}, 0.0, 0}; }
    static SectionReason error_exceeded(double tol, std::string sig) {
        return SectionReason{ReasonKind::ErrorExceeded, std::move(sig), tol, 0};
    }

    // Same tag (sequence number ignored).
    bool same_tag(const SectionReason& o) const noexcept {
        return kind == o.kind && signal == o.signal && tolerance == o.tolerance;
    }
};

inline std::string to_string(const SectionReason& r) {
    switch (r.kind) {
        case ReasonKind::Start:      return "START";
        case ReasonKind::End:        return "END";
        case ReasonKind::Jump:       return "JUMP:" + r.signal;
        case ReasonKind::Vertex:     return "VERTEX:" + r.signal;
        case ReasonKind::MaxSegment: return "MAX_DR";
        case ReasonKind::ErrorExceeded: {
            std::ostringstream oss;
            oss << "ERR>" << std::fixed << std::setprecision(3) << r.tolerance << ":" << r.signal;
            return oss.str();
        }
        default: return "UNKNOWN";
    }
}

// Accumulated reasons of one section, in attachment order.
struct SectionEntry final {
    std::vector<SectionReason> reasons;

    SectionPriority priority() const noexcept {
        SectionPriority p = SectionPriority::Refinement;
        for (const auto& r : reasons) {
            const SectionPriority q = priority_of(r.kind);
            if (q > p) p = q;
        }
        return p;
    }

    bool is_protected() const noexcept { return rotorbeam::blade::is_protected(priority()); }

    // Sequence number of the newest reason.
    std::uint64_t justified_seq() const noexcept {
        std::uint64_t s = 0;
        for (const auto& r : reasons) {
            if (r.seq > s) s = r.seq;
        }
        return s;
    }

    std::vector<std::string> tags() const {
        std::vector<std::string> out;
        out.reserve(reasons.size());
        for (const auto& r : reasons) out.push_back(to_string(r));
        return out;
    }
};

// Ordered by section position.
using ReasonMap = std::map<double, SectionEntry>;

} // namespace rotorbeam::blade
