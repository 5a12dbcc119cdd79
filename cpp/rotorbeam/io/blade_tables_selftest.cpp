/*
  Fragment 3.1.01 — Blade Table Readers Selftest

  Objective
  ---------
    1) Structural tables: header/units detection, X/Z -> y/z mapping,
       metric block preference, sort + duplicate averaging.
    2) Aero tables: header synonyms, optional columns, heuristic fallback,
       single-column rejection.
    3) IOError for missing files, ParseError for tables without data.

  Expected use
  ------------
      ./blade_tables_selftest
  Writes scratch files under the system temp directory.
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

#include "rotorbeam/core/logging.hpp"
#include "rotorbeam/io/blade_tables.hpp"

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
void expect_throws(F&& f, std::string_view msg, std::string_view needle = {}) {
  try {
    f();
    fail(msg);
    std::cerr << "  no exception thrown\n";
  } catch (const E& e) {
    if (!needle.empty() && std::string(e.what()).find(needle) == std::string::npos) {
      fail(msg);
      std::cerr << "  message lacks '" << needle << "': " << e.what() << "\n";
      return;
    }
    pass(msg);
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  wrong exception: " << e.what() << "\n";
  }
}

std::string scratch_path(const std::string& name) {
  return (std::filesystem::temp_directory_path() / ("rotorbeam_selftest_" + name)).string();
}

std::string write_scratch(const std::string& name, const std::string& content) {
  const std::string path = scratch_path(name);
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  f << content;
  return path;
}

const char* kTipHeader =
    "SEC STA WEIGHT XCG ZCG ROTAPI JX JZ JP EA XNA ZNA ROTAN EJZ EJX GJ XCT ZCT\n";

void test_structural_plain() {
  const std::string text = std::string(
      "# XV-15 like structural table\n") +
      kTipHeader +
      "- m kg/m m m deg kg.m kg.m kg.m N m m deg N.m2 N.m2 N.m2 m m\n"
      "2 1.0 8.0 0.11 0.21 1.0 0.31 0.41 0.51 2.0e8 0.03 0.04 5.0 2.0e6 3.0e5 1.0e5 0.05 0.06\n"
      "1 0.0 10.0 0.10 0.20 0.0 0.30 0.40 0.50 1.0e8 0.01 0.02 4.0 1.0e6 2.0e5 9.0e4 0.07 0.08\n"
      "3 1.0 6.0 0.11 0.21 1.0 0.31 0.41 0.51 2.0e8 0.03 0.04 5.0 2.0e6 3.0e5 1.0e5 0.05 0.06\n";
  const std::string path = write_scratch("plain.tip", text);

  const auto t = io::load_structural_table(path);
  expect_true(t.size() == 2, "structural: duplicate STA collapsed");
  expect_near(t.x[0], 0.0, 0.0, "structural: sorted by STA");

  expect_near(t.column("EA")[0], 1.0e8, 0.0, "structural: EA kept");
  expect_near(t.column("EJY")[0], 2.0e5, 0.0, "structural: EJY <- EJX");
  expect_near(t.column("EJZ")[0], 1.0e6, 0.0, "structural: EJZ kept");
  expect_near(t.column("GJ")[0], 9.0e4, 0.0, "structural: GJ kept");
  expect_near(t.column("YNA")[0], 0.02, 0.0, "structural: YNA <- ZNA");
  expect_near(t.column("ZNA")[0], 0.01, 0.0, "structural: ZNA <- XNA");
  expect_near(t.column("YCT")[0], 0.08, 0.0, "structural: YCT <- ZCT");
  expect_near(t.column("ZCT")[0], 0.07, 0.0, "structural: ZCT <- XCT");
  expect_near(t.column("YCG")[0], 0.20, 0.0, "structural: YCG <- ZCG");
  expect_near(t.column("ZCG")[0], 0.10, 0.0, "structural: ZCG <- XCG");
  expect_near(t.column("dJX")[0], 0.50, 0.0, "structural: dJX <- JP");
  expect_near(t.column("dJY")[0], 0.40, 0.0, "structural: dJY <- JZ");
  expect_near(t.column("dJZ")[0], 0.30, 0.0, "structural: dJZ <- JX");
  expect_near(t.column("ROTAN_deg")[0], 4.0, 0.0, "structural: ROTAN_deg");
  expect_near(t.column("ROTAPI_deg")[1], 1.0, 0.0, "structural: ROTAPI_deg");
  expect_near(t.column("dM")[1], 7.0, 1e-12, "structural: dM <- WEIGHT averaged over duplicates");

  std::filesystem::remove(path);
}

void test_structural_blocks_prefer_metric() {
  const std::string text = std::string(
      "BLADE STRUCT Y (imperial)\n"
      "TABLE\n") +
      kTipHeader +
      "- in lb/in in in deg lb.in lb.in lb.in lb in in deg lb.in2 lb.in2 lb.in2 in in\n"
      "1 0.0 99.0 0 0 0 0 0 0 1 0 0 0 1 1 1 0 0\n"
      "2 40.0 99.0 0 0 0 0 0 0 1 0 0 0 1 1 1 0 0\n"
      "ENDTABLE\n"
      "BLADE STRUCT Y (metric)\n"
      "TABLE\n" +
      kTipHeader +
      "- m kg/m m m deg kg.m kg.m kg.m N m m deg N.m2 N.m2 N.m2 m m\n"
      "1 0.0 3.0 0 0 0 0 0 0 1 0 0 0 1 1 1 0 0\n"
      "2 1.0 3.0 0 0 0 0 0 0 1 0 0 0 1 1 1 0 0\n"
      "ENDTABLE\n";

  const auto t = io::structural_table_from_text(text, "blocks.tip");
  expect_true(t.size() == 2, "blocks: two stations read");
  expect_near(t.x.back(), 1.0, 0.0, "blocks: metric block chosen");
  expect_near(t.column("dM")[0], 3.0, 0.0, "blocks: metric WEIGHT used");
}

void test_structural_missing_columns() {
  const auto t = io::structural_table_from_text("STA EA GJ\n0 1e6 2e3\n2 5e5 1e3\n", "partial.tip");
  expect_near(t.column("EA")[1], 5e5, 0.0, "partial: EA read");
  expect_near(t.column("EJY")[1], 0.0, 0.0, "partial: missing EJX filled with 0");
  expect_true(t.has("dM") && t.has("ROTAN_deg"), "partial: every mapped column present");

  expect_throws<ParseError>([] { (void)io::structural_table_from_text("EA GJ\n1 2\n3 4\n", "nosta.tip"); },
                            "structural without STA -> ParseError", "STA");
}

void test_aero_canonical() {
  const std::string text =
      "! planform\n"
      "Radial Chord Twist\n"
      "(m) (m) (deg)\n"
      "2.0, 0.40, 8.0\n"
      "0.5, 0.50, 12.0\n"
      "\n"
      "4.0, 0.30, 4.0\n";
  const std::string path = write_scratch("canonical.dat", text);

  const auto t = io::load_aero_table(path);
  expect_true(t.size() == 3, "aero: three stations");
  expect_near(t.x.front(), 0.5, 0.0, "aero: sorted by Radial");
  expect_near(t.column("Chord")[0], 0.50, 0.0, "aero: Chord column");
  expect_near(t.column("Twist")[2], 4.0, 0.0, "aero: Twist column");
  expect_near(t.column("Sweep")[1], 0.0, 0.0, "aero: missing Sweep filled with 0");
  expect_true(t.has("Anhedral"), "aero: Anhedral present");

  std::filesystem::remove(path);
}

void test_aero_synonyms() {
  const auto t = io::aero_table_from_text("STATION CRD PITCH DIHEDRAL\n0 0.3 5 1\n1 0.2 4 2\n", "syn.dat");
  expect_near(t.column("Chord")[1], 0.2, 0.0, "aero synonyms: CRD -> Chord");
  expect_near(t.column("Twist")[0], 5.0, 0.0, "aero synonyms: PITCH -> Twist");
  expect_near(t.column("Anhedral")[1], 2.0, 0.0, "aero synonyms: DIHEDRAL -> Anhedral");
}

void test_aero_heuristic() {
  const auto t = io::aero_table_from_text("0.0 0.5\n1.0 0.6\n2.0 0.4\n", "bare.dat");
  expect_near(t.x.back(), 2.0, 0.0, "aero heuristic: monotonic column is Radial");
  expect_near(t.column("Chord")[1], 0.6, 0.0, "aero heuristic: other column is Chord");

  expect_throws<ParseError>([] { (void)io::aero_table_from_text("0.1\n0.2\n0.3\n", "single.dat"); },
                            "aero single column -> ParseError",
                            "could not infer Radial/Chord columns");
}

void test_failures() {
  expect_throws<IOError>([] { (void)io::load_aero_table(scratch_path("does_not_exist.dat")); },
                         "missing file -> IOError");
  expect_throws<ParseError>([] { (void)io::aero_table_from_text("Radial Chord\n# nothing\n", "empty.dat"); },
                            "no numeric rows -> ParseError", "no numeric data rows");
}

void test_normalize_header_token() {
  expect_true(io::normalize_header_token("Chord (m)") == "CHORDM", "normalize: strips punctuation");
  expect_true(io::normalize_header_token("...rotan") == "ROTAN", "normalize: upper-cases");
}

}  // namespace
}  // namespace rotorbeam

int main() {
  using namespace rotorbeam;
  set_log_level(LogLevel::ERROR);

  test_structural_plain();
  test_structural_blocks_prefer_metric();
  test_structural_missing_columns();
  test_aero_canonical();
  test_aero_synonyms();
  test_aero_heuristic();
  test_failures();
  test_normalize_header_token();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
