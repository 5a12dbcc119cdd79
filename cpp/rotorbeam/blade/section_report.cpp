/*
================================================================================
Fragment 2.3.03 — Section Selection Report (Implementation)
FILE: cpp/rotorbeam/blade/section_report.cpp
================================================================================
*/

#include "rotorbeam/blade/section_report.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace rotorbeam::blade {

static std::string opt_str(const std::optional<double>& v) {
  if (!v) return "None";
  std::ostringstream oss;
  oss << *v;
  return oss.str();
}

std::vector<std::string> SectionReport::tags_at(double r) const {
  auto it = reasons.find(r);
  if (it == reasons.end()) return {};
  return it->second.tags();
}

bool SectionReport::has_warning_containing(const std::string& needle) const {
  for (const auto& w : warnings) {
    if (w.find(needle) != std::string::npos) return true;
  }
  return false;
}

std::string format_section_report(const SectionReport& report,
                                  const std::string& name,
                                  const SelectionSettings& cfg,
                                  const std::vector<std::string>& extra_lines) {
  std::ostringstream out;
  out << "# Section selection report\n";
  out << "name=" << name << "\n";
  for (const auto& line : extra_lines) out << line << "\n";

  out << "K=" << report.sections.size()
      << ", elems=" << report.elements
      << ", nodes=" << report.nodes << "\n";
  out << "r_start_used=" << report.start_used << "\n";
  out << "params: err_tol=" << cfg.error_tolerance
      << ", jump_tol=" << cfg.jump_tolerance
      << ", max_elems=" << cfg.max_elements
      << ", max_dr=" << opt_str(cfg.max_segment_length)
      << ", min_dr=" << opt_str(cfg.min_segment_length)
      << ", c_eps=" << cfg.chord_epsilon << "\n\n";

  out << "Reasons per section:\n";
  for (double r : report.sections) {
    out << "  " << std::fixed << std::setprecision(6) << r << ": ";
    out.unsetf(std::ios_base::floatfield);
    const auto tags = report.tags_at(r);
    for (std::size_t i = 0; i < tags.size(); ++i) {
      if (i) out << ", ";
      out << tags[i];
    }
    out << "\n";
  }

  if (!report.warnings.empty()) {
    out << "\nWarnings:\n";
    for (const auto& w : report.warnings) out << "  - " << w << "\n";
  }
  if (!report.notes.empty()) {
    out << "\nNotes:\n";
    for (const auto& n : report.notes) out << "  - " << n << "\n";
  }
  return out.str();
}

void write_section_report_file(const SectionReport& report,
                               const std::string& name,
                               const SelectionSettings& cfg,
                               const std::string& file_path,
                               const std::vector<std::string>& extra_lines) {
  std::ofstream f(file_path, std::ios::out | std::ios::trunc);
  if (!f) {
    throw IOError("cannot open report file for writing: " + file_path);
  }
  f << format_section_report(report, name, cfg, extra_lines);
  f.flush();
  if (!f) {
    throw IOError("failed writing report file: " + file_path);
  }
}

}  // namespace rotorbeam::blade
