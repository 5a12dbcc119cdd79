/*
===============================================================================
Fragment 3.1.01 — Blade Table Readers (Structural .tip / Aero .dat → SignalTable)
File: blade_tables.hpp
===============================================================================

Text format (both tables):
  - Comment lines ("#", "!", "//") and blank lines are ignored.
  - First non-numeric line is the header; following non-numeric lines that
    look like units ("deg", "kg", "ft", "**", ...) are skipped, others are
    appended to the header.
  - Remaining lines are numeric rows, whitespace and/or comma separated.
    Ragged rows are padded with 0.

Structural tables may wrap the data in a "BLADE STRUCT" / TABLE ... ENDTABLE
block. When several blocks exist, the one with metric units (STA in m,
WEIGHT in kg/m) is preferred, else the first one.

Structural X/Z axes are mapped to beam-local y/z once, here:
  EJY <- EJX   YNA <- ZNA   ZNA <- XNA   YCT <- ZCT   ZCT <- XCT
  YCG <- ZCG   ZCG <- XCG   dJY <- JZ    dJZ <- JX    dJX <- JP
  dM  <- WEIGHT             ROTAN_deg <- ROTAN        ROTAPI_deg <- ROTAPI
Downstream code only ever sees the y/z names.

Failure:
  - IOError: file missing or unreadable.
  - ParseError: no numeric rows, STA / Radial / Chord cannot be located.
  - DataShapeError: propagated from normalization.
*/

#pragma once

#include "rotorbeam/blade/sample_series.hpp"
#include "rotorbeam/core/errors.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rotorbeam::io {

struct RawTable final {
    std::vector<std::string> header;
    std::vector<std::string> units;
    std::vector<std::vector<double>> rows;

    std::size_t column_count() const noexcept;

    // Column j over all rows, 0.0 where a row is too short.
    std::vector<double> column(std::size_t j) const;
};

// Upper-case, alphanumerics only: "Chord (m)" -> "CHORDM".
std::string normalize_header_token(std::string_view tok);

// Generic reader over already-loaded text. `origin` only feeds messages.
RawTable parse_table_text(const std::string& text, const std::string& origin);

// Whole file as a string. Throws IOError.
std::string read_text_file(const std::string& path);

// Structural properties keyed by station (STA).
blade::SignalTable structural_table_from_text(const std::string& text, const std::string& origin);
blade::SignalTable load_structural_table(const std::string& path);

// Aero planform keyed by Radial: Chord, Twist, Sweep, Anhedral.
blade::SignalTable aero_table_from_text(const std::string& text, const std::string& origin);
blade::SignalTable load_aero_table(const std::string& path);

} // namespace rotorbeam::io
