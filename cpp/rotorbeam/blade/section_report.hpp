/*
================================================================================
Fragment 2.3.03 — Section Selection Report (Audit Log Text Export)
FILE: cpp/rotorbeam/blade/section_report.hpp

Purpose:
  - Human-auditable record of a section selection: final sections, the reason
    tags per section, the start actually used, counts, warnings and notes.
  - Plain-text rendering for blade.report.txt.

Output format:
  # Section selection report
  name=<name>
  <extra lines>
  K=<K>, elems=<K-1>, nodes=<2K-1>
  r_start_used=<start>
  params: err_tol=..., jump_tol=..., max_elems=..., max_dr=..., min_dr=..., c_eps=...

  Reasons per section:
    <r %.6f>: TAG, TAG
  Warnings:         (only if any)
    - ...
  Notes:            (only if any)
    - ...
================================================================================
*/

#pragma once

#include "rotorbeam/blade/section_reason.hpp"
#include "rotorbeam/core/settings.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace rotorbeam::blade {

struct SectionReport final {
  std::vector<double> sections;
  ReasonMap reasons;               // keyed by the values in `sections`
  double start_used = 0.0;
  std::size_t elements = 0;        // K-1
  std::size_t nodes = 0;           // 2K-1
  std::vector<std::string> warnings;
  std::vector<std::string> notes;

  // Tags of one section in attachment order; empty if unknown.
  std::vector<std::string> tags_at(double r) const;

  bool has_warning_containing(const std::string& needle) const;
};

std::string format_section_report(const SectionReport& report,
                                  const std::string& name,
                                  const SelectionSettings& cfg,
                                  const std::vector<std::string>& extra_lines = {});

// Throws IOError when the file cannot be written.
void write_section_report_file(const SectionReport& report,
                               const std::string& name,
                               const SelectionSettings& cfg,
                               const std::string& file_path,
                               const std::vector<std::string>& extra_lines = {});

}  // namespace rotorbeam::blade
