/*
  Fragment 2.3.02 — Control Section Selector Selftest

  Objective
  ---------
  Framework-free regression checks for section placement:
    1) Constant properties need only START and END.
    2) Stiffness steps and chord kinks become protected sections.
    3) Tighter error tolerance never yields fewer sections.
    4) Element cap: trimmed when possible, warned when every interior
       section is protected.
    5) Size bounds: max length subdivides, min length merges unprotected
       sections and warns on protected short intervals.
    6) Start detection (override clamp, chord, stiffness).
    7) Same inputs -> identical sections, tags and warnings.
    8) Plain-text report rendering.

  Expected use
  ------------
      ./section_selector_selftest
  Non-zero return code indicates failure.
*/

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "rotorbeam/blade/blade_grid.hpp"
#include "rotorbeam/blade/section_report.hpp"
#include "rotorbeam/blade/section_selector.hpp"
#include "rotorbeam/core/logging.hpp"

namespace rotorbeam {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  got " << a << " want " << b << "\n";
  } else {
    pass(msg);
  }
}

template <typename E, typename F>
void expect_throws(F&& f, std::string_view msg) {
  try {
    f();
    fail(msg);
    std::cerr << "  no exception thrown\n";
  } catch (const E&) {
    pass(msg);
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  wrong exception: " << e.what() << "\n";
  }
}

void dump_sections(const blade::SelectionResult& r) {
  std::cerr << "  sections:";
  for (double s : r.sections) std::cerr << " " << s;
  std::cerr << "\n";
}

bool has_tag(const blade::SelectionResult& r, double x, const std::string& tag) {
  const auto tags = r.report.tags_at(x);
  return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

bool contains(const std::vector<double>& v, double x) {
  return std::find(v.begin(), v.end(), x) != v.end();
}

// Structural table on [0, 10] with step 0.5; EA from `ea`, other stiffness constant.
blade::SignalTable structural(const std::function<double(double)>& ea, double step = 0.5) {
  blade::SignalTable t;
  const int n = static_cast<int>(std::lround(10.0 / step));
  for (int i = 0; i <= n; ++i) {
    const double r = step * i;
    t.x.push_back(r);
    t.columns["EA"].push_back(ea(r));
    t.columns["EJY"].push_back(1.0e4);
    t.columns["EJZ"].push_back(5.0e4);
    t.columns["GJ"].push_back(2.0e3);
  }
  return t;
}

blade::SignalTable constant_structural() {
  return structural([](double) { return 1.0e6; });
}

void check_result_shape(const blade::SelectionResult& r, const SelectionSettings& cfg, std::string_view tag) {
  const std::string t(tag);
  bool inc = r.sections.size() >= 2;
  for (std::size_t i = 1; inc && i < r.sections.size(); ++i) {
    inc = r.sections[i] - r.sections[i - 1] > blade::kSectionMergeTol;
  }
  expect_true(inc, t + ": K >= 2, strictly increasing, no near-duplicates");
  expect_true(r.report.sections == r.sections, t + ": report mirrors sections");
  expect_true(r.report.elements + 1 == r.sections.size(), t + ": elements = K-1");
  expect_true(r.report.nodes == 2 * r.sections.size() - 1, t + ": nodes = 2K-1");

  bool every_tagged = true;
  for (double s : r.sections) every_tagged = every_tagged && !r.report.tags_at(s).empty();
  expect_true(every_tagged, t + ": every section has at least one reason");

  const std::set<std::string> uniq(r.report.warnings.begin(), r.report.warnings.end());
  expect_true(uniq.size() == r.report.warnings.size(), t + ": warnings deduplicated");

  const auto g = blade::build_grid(r.sections);
  expect_true(g.node_count() == r.report.nodes && g.element_count() == r.report.elements,
              t + ": grid agrees with report counts");
  (void)cfg;
}

// ---------------------------------------------------------------------------

void test_constant_signal_needs_two_sections() {
  const auto st = constant_structural();
  const SelectionSettings cfg;
  const auto r = blade::select_sections(st, nullptr, cfg);

  check_result_shape(r, cfg, "constant");
  expect_true(r.sections.size() == 2, "constant: only START and END");
  if (r.sections.size() == 2) {
    expect_near(r.sections[0], 0.0, 0.0, "constant: START at domain min");
    expect_near(r.sections[1], 10.0, 0.0, "constant: END at domain max");
    expect_true(has_tag(r, r.sections[0], "START"), "constant: START tag");
    expect_true(has_tag(r, r.sections[1], "END"), "constant: END tag");
  }
  expect_true(r.report.warnings.empty(), "constant: no warnings");
}

void test_step_becomes_jump_section() {
  const auto st = structural([](double r) { return r < 5.0 ? 1.0e6 : 2.0e6; });
  const SelectionSettings cfg;
  const auto r = blade::select_sections(st, nullptr, cfg);

  check_result_shape(r, cfg, "step");
  expect_true(contains(r.sections, 5.0), "step: section at the step station");
  expect_true(has_tag(r, 5.0, "JUMP:EA"), "step: JUMP:EA tag");
  expect_true(r.report.elements <= static_cast<std::size_t>(cfg.max_elements), "step: within element cap");
  if (!contains(r.sections, 5.0)) dump_sections(r);
}

void test_tolerance_monotonicity() {
  const auto st = structural([](double r) { return 1.0 + r * r; }, 0.1);

  SelectionSettings loose;
  loose.error_tolerance = 0.5;
  SelectionSettings tight;
  tight.error_tolerance = 0.01;

  const auto a = blade::select_sections(st, nullptr, loose);
  const auto b = blade::select_sections(st, nullptr, tight);
  check_result_shape(a, loose, "loose");
  check_result_shape(b, tight, "tight");

  expect_true(a.sections.size() == 2, "loose tolerance: quadratic within 0.5 on one element");
  expect_true(b.sections.size() > a.sections.size(), "tight tolerance: refinement adds sections");

  bool err_tags = true;
  for (std::size_t i = 1; i + 1 < b.sections.size(); ++i) {
    err_tags = err_tags && has_tag(b, b.sections[i], "ERR>0.010:EA");
  }
  expect_true(err_tags, "tight tolerance: interior sections tagged ERR>0.010:EA");

  SelectionSettings dflt;
  const auto d = blade::select_sections(st, nullptr, dflt);
  expect_true(contains(d.sections, 5.0), "default tolerance: midspan section");
  expect_true(has_tag(d, 5.0, "ERR>0.050:EA"), "default tolerance: midspan tagged ERR>0.050:EA");

  for (double tol : {0.2, 0.1, 0.05, 0.02}) {
    SelectionSettings mid;
    mid.error_tolerance = tol;
    const auto m = blade::select_sections(st, nullptr, mid);
    expect_true(a.sections.size() <= m.sections.size() && m.sections.size() <= b.sections.size(),
                "tolerance sweep: section count between loose and tight");
  }
}

void test_non_finite_sample_does_not_mask_refinement() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  auto st = structural([nan](double r) { return r == 5.0 ? nan : 1.0e6; });
  auto& ejy = st.columns["EJY"];
  for (std::size_t i = 0; i < st.x.size(); ++i) ejy[i] = 100.0 + st.x[i] * st.x[i];

  const SelectionSettings cfg;
  const auto r = blade::select_sections(st, nullptr, cfg);
  check_result_shape(r, cfg, "nan-sample");
  expect_true(r.sections.size() >= 3, "nan-sample: EJY error still refines");
  expect_true(contains(r.sections, 5.0), "nan-sample: midspan section");
  expect_true(has_tag(r, 5.0, "ERR>0.050:EJY"), "nan-sample: split driven by EJY");
  if (!contains(r.sections, 5.0)) dump_sections(r);
}

void test_cap_unsatisfiable_with_protected_jumps() {
  const auto st = structural([](double r) {
    if (r < 2.0) return 1.0e6;
    if (r < 5.0) return 2.0e6;
    if (r < 8.0) return 4.0e6;
    return 8.0e6;
  });
  SelectionSettings cfg;
  cfg.max_elements = 2;
  const auto r = blade::select_sections(st, nullptr, cfg);

  check_result_shape(r, cfg, "cap-protected");
  expect_true(contains(r.sections, 2.0) && contains(r.sections, 5.0) && contains(r.sections, 8.0),
              "cap-protected: all jump sections kept");
  expect_true(r.report.elements == 4, "cap-protected: element count exceeds cap");
  expect_true(r.report.has_warning_containing("unsatisfiable"), "cap-protected: cap warning recorded");
}

void test_cap_trims_refinement() {
  const auto st = structural([](double r) { return 1.0 + r * r; }, 0.1);
  SelectionSettings cfg;
  cfg.error_tolerance = 0.001;
  cfg.max_elements = 5;
  const auto r = blade::select_sections(st, nullptr, cfg);

  check_result_shape(r, cfg, "cap-trim");
  expect_true(r.report.elements <= 5, "cap-trim: element count within cap");
  expect_true(has_tag(r, r.sections.front(), "START") && has_tag(r, r.sections.back(), "END"),
              "cap-trim: boundaries survive");
}

void test_max_segment_subdivides() {
  const auto st = constant_structural();
  SelectionSettings cfg;
  cfg.max_segment_length = 3.0;
  const auto r = blade::select_sections(st, nullptr, cfg);

  check_result_shape(r, cfg, "max-dr");
  const std::vector<double> want{0.0, 2.5, 5.0, 7.5, 10.0};
  bool same = r.sections.size() == want.size();
  for (std::size_t i = 0; same && i < want.size(); ++i) same = std::fabs(r.sections[i] - want[i]) < 1e-12;
  expect_true(same, "max-dr: four equal parts of 2.5");
  if (!same) dump_sections(r);

  bool within = true;
  for (std::size_t i = 1; i < r.sections.size(); ++i) within = within && (r.sections[i] - r.sections[i - 1] <= 3.0 + 1e-12);
  expect_true(within, "max-dr: every element within bound");
  if (r.sections.size() == 5) {
    expect_true(has_tag(r, r.sections[2], "MAX_DR"), "max-dr: new sections tagged MAX_DR");
  }
}

void test_min_segment_merges_and_protects() {
  // jumps at 5.0 and 5.5, closer than min_dr
  const auto st = structural([](double r) {
    if (r < 5.0) return 1.0e6;
    if (r < 5.5) return 2.0e6;
    return 4.0e6;
  });
  SelectionSettings cfg;
  cfg.min_segment_length = 1.0;
  const auto r = blade::select_sections(st, nullptr, cfg);

  check_result_shape(r, cfg, "min-dr");
  expect_true(has_tag(r, 5.0, "JUMP:EA") && has_tag(r, 5.5, "JUMP:EA"), "min-dr: protected jumps kept");
  expect_true(r.report.has_warning_containing("min_segment merge: removed section at r="),
              "min-dr: merge warning recorded");
  expect_true(r.report.has_warning_containing("below min_segment_length"),
              "min-dr: protected short interval warned");

  bool short_ok = true;
  for (std::size_t i = 1; i < r.sections.size(); ++i) {
    if (r.sections[i] - r.sections[i - 1] < 1.0 - 1e-12) {
      const auto& left = r.report.reasons.at(r.sections[i - 1]);
      const auto& right = r.report.reasons.at(r.sections[i]);
      short_ok = short_ok && left.is_protected() && right.is_protected();
    }
  }
  expect_true(short_ok, "min-dr: only protected sections bound short intervals");
  if (!short_ok) dump_sections(r);
}

void test_start_detection() {
  const auto st = constant_structural();

  SelectionSettings low;
  low.start_override = -5.0;
  const auto a = blade::select_sections(st, nullptr, low);
  expect_near(a.report.start_used, 0.0, 0.0, "start override clamped to domain min");

  SelectionSettings high;
  high.start_override = 100.0;
  const auto b = blade::select_sections(st, nullptr, high);
  expect_true(b.report.start_used < 10.0 && b.report.start_used > 10.0 - 1e-9,
              "start override clamped just below domain max");
  expect_true(b.sections.size() >= 2, "clamped start still yields K >= 2");

  blade::SignalTable aero;
  for (int i = 0; i <= 20; ++i) {
    const double r = 0.5 * i;
    aero.x.push_back(r);
    aero.columns["Chord"].push_back(r < 2.0 ? 0.0 : 0.5);
  }
  const SelectionSettings cfg;
  const auto c = blade::select_sections(st, &aero, cfg);
  expect_near(c.report.start_used, 2.0, 0.0, "start from first chord above epsilon");
  expect_near(c.sections.front(), 2.0, 0.0, "first section at detected start");
  expect_true(has_tag(c, 2.0, "START"), "detected start tagged START");

  const auto root_cut = structural([](double r) { return r < 1.0 ? 0.0 : 1.0e6; });
  blade::SignalTable zero_stiff = root_cut;
  zero_stiff.columns["EJY"].assign(zero_stiff.x.size(), 0.0);
  zero_stiff.columns["EJZ"].assign(zero_stiff.x.size(), 0.0);
  zero_stiff.columns["GJ"].assign(zero_stiff.x.size(), 0.0);
  const auto d = blade::select_sections(zero_stiff, nullptr, cfg);
  expect_near(d.report.start_used, 1.0, 0.0, "start from first significant stiffness");
}

void test_chord_vertex() {
  const auto st = constant_structural();
  blade::SignalTable aero;
  for (int i = 0; i <= 20; ++i) {
    const double r = 0.5 * i;
    aero.x.push_back(r);
    aero.columns["Chord"].push_back(r <= 3.0 ? 0.4 + 0.05 * r : 0.55 - 0.01 * (r - 3.0));
  }
  const SelectionSettings cfg;
  const auto r = blade::select_sections(st, &aero, cfg);

  check_result_shape(r, cfg, "vertex");
  expect_true(has_tag(r, 3.0, "VERTEX:Chord"), "vertex: chord extremum tagged VERTEX:Chord");
}

void test_determinism() {
  const auto st = structural([](double r) { return r < 4.0 ? 1.0 + r * r : 40.0 - r; }, 0.1);
  SelectionSettings cfg;
  cfg.error_tolerance = 0.02;
  cfg.min_segment_length = 0.2;

  const auto a = blade::select_sections(st, nullptr, cfg);
  const auto b = blade::select_sections(st, nullptr, cfg);

  expect_true(a.sections == b.sections, "determinism: identical sections");
  bool tags_same = a.sections.size() == b.sections.size();
  for (std::size_t i = 0; tags_same && i < a.sections.size(); ++i) {
    tags_same = a.report.tags_at(a.sections[i]) == b.report.tags_at(b.sections[i]);
  }
  expect_true(tags_same, "determinism: identical tags");
  expect_true(a.report.warnings == b.report.warnings, "determinism: identical warnings");

  const std::string ra = blade::format_section_report(a.report, "blade", cfg);
  const std::string rb = blade::format_section_report(b.report, "blade", cfg);
  expect_true(ra == rb, "determinism: identical report text");
}

void test_errors() {
  blade::SignalTable one;
  one.x = {1.0};
  one.columns["EA"] = {1.0};
  const SelectionSettings cfg;
  expect_throws<InsufficientDomainError>([&] { (void)blade::select_sections(one, nullptr, cfg); },
                                         "one sample -> InsufficientDomainError");

  blade::SignalTable dup;
  dup.x = {2.0, 2.0};
  dup.columns["EA"] = {1.0, 3.0};
  expect_throws<InsufficientDomainError>([&] { (void)blade::select_sections(dup, nullptr, cfg); },
                                         "one distinct station -> InsufficientDomainError");

  SelectionSettings bad;
  bad.error_tolerance = 0.0;
  const auto st = constant_structural();
  expect_throws<ValidationError>([&] { (void)blade::select_sections(st, nullptr, bad); },
                                 "zero error tolerance -> ValidationError");
}

void test_building_blocks() {
  const auto lin = blade::make_series({0.0, 1.0, 2.0}, {1.0, 2.0, 3.0});
  expect_near(blade::midpoint_error(lin, 0.0, 2.0), 0.0, 1e-15, "midpoint_error: linear -> 0");
  expect_near(blade::midpoint_error(lin, 1.0, 1.0), 0.0, 0.0, "midpoint_error: empty interval -> 0");

  const auto quad = blade::make_series({0.0, 1.0, 2.0}, {0.0, 1.0, 4.0});
  expect_near(blade::midpoint_error(quad, 0.0, 2.0), 1.0 / 4.0, 1e-15, "midpoint_error: relative to max magnitude");

  const auto step = blade::make_series({0.0, 1.0, 2.0, 3.0}, {1.0, 1.0, 2.0, 2.0});
  const auto all = blade::detect_jumps(step, 0.0, 0.1);
  expect_true(all.size() == 1 && all[0] == 2.0, "detect_jumps: placed at the later sample");
  expect_true(blade::detect_jumps(step, 2.5, 0.1).empty(), "detect_jumps: ignores stations before start");
  expect_true(blade::detect_jumps(step, 0.0, 0.6).empty(), "detect_jumps: below tolerance ignored");

  const auto chord = blade::make_series({0.0, 1.0, 2.0, 3.0}, {0.2, 0.5, 0.4, 0.3});
  const auto v = blade::detect_chord_vertices(chord, 0.0);
  expect_true(v.size() == 1 && v[0] == 1.0, "detect_chord_vertices: interior extremum");
  expect_true(blade::detect_chord_vertices(chord, 1.5).empty(), "detect_chord_vertices: start filter");

  blade::SectionState s;
  s.add(1.0, blade::SectionReason::max_segment());
  const double key = s.add(1.0 + 1e-13, blade::SectionReason::jump("EA"));
  expect_true(key == 1.0 && s.sections.size() == 1, "SectionState: merge within 1e-12");
  expect_true(s.sections.at(1.0).is_protected(), "SectionState: merged jump protects section");
  expect_true(!s.add_if_new(1.0, blade::SectionReason::max_segment()), "SectionState: add_if_new refuses existing");
}

void test_report_text() {
  const auto st = structural([](double r) { return r < 5.0 ? 1.0e6 : 2.0e6; });
  const SelectionSettings cfg;
  const auto r = blade::select_sections(st, nullptr, cfg);

  const std::string txt = blade::format_section_report(r.report, "unit", cfg, {"struct=unit.tip"});
  expect_true(txt.find("name=unit\n") != std::string::npos, "report: name line");
  expect_true(txt.find("struct=unit.tip\n") != std::string::npos, "report: extra line");
  expect_true(txt.find("K=" + std::to_string(r.sections.size()) + ", elems=") != std::string::npos,
              "report: count line");
  expect_true(txt.find("Reasons per section:") != std::string::npos, "report: reasons header");
  expect_true(txt.find("  5.000000: ") != std::string::npos, "report: six-decimal section line");
  expect_true(txt.find("JUMP:EA") != std::string::npos, "report: jump tag rendered");
  expect_true(txt.find("max_dr=None") != std::string::npos, "report: unset bound prints None");
  expect_true(txt.find("Notes:") != std::string::npos, "report: notes block");

  expect_throws<IOError>(
      [&] { blade::write_section_report_file(r.report, "unit", cfg, "/nonexistent_dir_rotorbeam/x.txt"); },
      "report: unwritable path -> IOError");
}

}  // namespace
}  // namespace rotorbeam

int main() {
  using namespace rotorbeam;
  set_log_level(LogLevel::ERROR);

  test_constant_signal_needs_two_sections();
  test_step_becomes_jump_section();
  test_tolerance_monotonicity();
  test_non_finite_sample_does_not_mask_refinement();
  test_cap_unsatisfiable_with_protected_jumps();
  test_cap_trims_refinement();
  test_max_segment_subdivides();
  test_min_segment_merges_and_protects();
  test_start_detection();
  test_chord_vertex();
  test_determinism();
  test_errors();
  test_building_blocks();
  test_report_text();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
