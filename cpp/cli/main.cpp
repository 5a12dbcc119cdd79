/*
================================================================================
Fragment 4.0 — CLI: Main Entry Point (rotorbeam_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line driver for the blade beam-model front end:
    * load structural (+ optional aero) tables
    * select control sections
    * build the end–mid–end grid and bind interpolation closures
    * export the section report, Gauss-point stiffness and lumped bodies

Usage:
  rotorbeam_cli [command] [options]

Commands:
  sections   - Run the full pipeline on table files
  demo       - Run the pipeline on a synthetic blade and print the report
  help       - Show help message

Hardening:
  - Explicit error codes for CI integration
  - No silent failures
  - Deterministic output format
================================================================================
*/

#include "rotorbeam/blade/aero_panels.hpp"
#include "rotorbeam/blade/beam_properties.hpp"
#include "rotorbeam/blade/blade_grid.hpp"
#include "rotorbeam/blade/section_report.hpp"
#include "rotorbeam/blade/section_selector.hpp"
#include "rotorbeam/core/errors.hpp"
#include "rotorbeam/core/logging.hpp"
#include "rotorbeam/core/settings.hpp"
#include "rotorbeam/io/blade_tables.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

using namespace rotorbeam;

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

void print_help() {
  std::cout << R"(
rotorbeam_cli - Rotor blade control sections and beam grid

Usage:
  rotorbeam_cli [command] [options]

Commands:
  sections      Select sections and export the beam model inputs
  demo          Run on a synthetic blade and print the report
  help          Show this help message

Options (sections):
  --struct <file>      Structural table (.tip), required
  --aero <file>        Aero planform table (.dat)
  --out <dir>          Output directory (default .)
  --name <name>        Blade name (default blade)
  --start <r>          Force the blade start station
  --err-tol <e>        Midpoint interpolation error tolerance (default 0.05)
  --jump-tol <j>       Relative jump tolerance (default 0.10)
  --max-elems <n>      Element cap (default 40)
  --max-dr <d>         Maximum element length
  --min-dr <d>         Minimum element length
  --chord-eps <c>      Chord threshold for start detection (default 1e-3)
  --nu <v>             Poisson ratio for shear stiffness (default 0.33)
  --log-level <l>      debug | info | warn | error

Outputs:
  <out>/<name>.report.txt
  <out>/<name>_elements.csv
  <out>/<name>_bodies.csv
  <out>/<name>_aero.csv      (only with --aero)

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed (settings or table contents)
  3 - Computation failed
  4 - I/O error
)";
}

namespace {

struct ArgError {
  std::string msg;
};

static double parse_number(const std::string& flag, const std::string& text) {
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (text.empty() || end == text.c_str() || *end != '\0' || !is_finite(v)) {
    throw ArgError{flag + ": expected a number, got '" + text + "'"};
  }
  return v;
}

static int parse_int(const std::string& flag, const std::string& text) {
  const double v = parse_number(flag, text);
  if (v != std::floor(v) || std::fabs(v) > 1e9) {
    throw ArgError{flag + ": expected an integer, got '" + text + "'"};
  }
  return static_cast<int>(v);
}

static RunSettings parse_sections_args(int argc, char** argv) {
  RunSettings s = RunSettings::defaults();

  for (int i = 2; i < argc; ++i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
      throw ArgError{flag + ": missing value"};
    }
    const std::string val = argv[++i];

    if (flag == "--struct") s.structural_path = val;
    else if (flag == "--aero") s.aero_path = val;
    else if (flag == "--out") s.out_dir = val;
    else if (flag == "--name") s.name = sanitize_name(val, "blade");
    else if (flag == "--start") s.selection.start_override = parse_number(flag, val);
    else if (flag == "--err-tol") s.selection.error_tolerance = parse_number(flag, val);
    else if (flag == "--jump-tol") s.selection.jump_tolerance = parse_number(flag, val);
    else if (flag == "--max-elems") s.selection.max_elements = parse_int(flag, val);
    else if (flag == "--max-dr") s.selection.max_segment_length = parse_number(flag, val);
    else if (flag == "--min-dr") s.selection.min_segment_length = parse_number(flag, val);
    else if (flag == "--chord-eps") s.selection.chord_epsilon = parse_number(flag, val);
    else if (flag == "--nu") s.material.nu = parse_number(flag, val);
    else if (flag == "--log-level") {
      if (!parse_log_level(val, s.log_level)) {
        throw ArgError{"--log-level: unknown level '" + val + "'"};
      }
    } else {
      throw ArgError{"unknown option: " + flag};
    }
  }
  return s;
}

// Synthetic 10 m blade: root cut-out, stiffness step at r=6, tapered chord
// with a planform kink at r=3.
static blade::SignalTable demo_structural() {
  blade::SignalTable t;
  for (int i = 0; i <= 40; ++i) {
    const double r = 0.25 * i;
    const double ea = (r < 6.0) ? 2.0e8 - 1.0e7 * r : 1.2e8 - 8.0e6 * (r - 6.0);
    const double ejy = 4.0e5 * (1.0 - 0.06 * r) * (1.0 - 0.06 * r);

    t.x.push_back(r);
    t.columns["EA"].push_back(ea);
    t.columns["EJY"].push_back(ejy);
    t.columns["EJZ"].push_back(8.0 * ejy);
    t.columns["GJ"].push_back(2.5e5 * (1.0 - 0.05 * r));
    t.columns["YNA"].push_back(0.0);
    t.columns["ZNA"].push_back(0.0);
    t.columns["YCT"].push_back(0.0);
    t.columns["ZCT"].push_back(0.01);
    t.columns["YCG"].push_back(0.0);
    t.columns["ZCG"].push_back(0.0);
    t.columns["dM"].push_back(12.0 - 0.6 * r);
    t.columns["dJX"].push_back(0.4 - 0.02 * r);
    t.columns["dJY"].push_back(0.05);
    t.columns["dJZ"].push_back(0.35 - 0.02 * r);
    t.columns["ROTAN_deg"].push_back(12.0 - 1.2 * r);
    t.columns["ROTAPI_deg"].push_back(0.0);
  }
  return t;
}

static blade::SignalTable demo_aero() {
  blade::SignalTable t;
  for (int i = 0; i <= 20; ++i) {
    const double r = 0.5 * i;
    const double chord = (r < 1.0) ? 0.0 : (r <= 3.0 ? 0.4 + 0.1 * (r - 1.0) : 0.6 - 0.03 * (r - 3.0));
    t.x.push_back(r);
    t.columns["Chord"].push_back(chord);
    t.columns["Twist"].push_back(10.0 - r);
    t.columns["Sweep"].push_back(0.0);
    t.columns["Anhedral"].push_back(0.0);
  }
  return t;
}

struct PipelineOutput {
  blade::SelectionResult selection;
  blade::BladeGrid grid;
  std::vector<blade::ElementStiffness> elements;
  std::vector<blade::NodeBody> bodies;
  std::vector<blade::AeroPanel> panels; // empty without aero data
};

static PipelineOutput run_pipeline(const blade::SignalTable& structural,
                                   const blade::SignalTable* aero,
                                   const RunSettings& s) {
  PipelineOutput out;
  out.selection = blade::select_sections(structural, aero, s.selection);
  out.grid = blade::build_grid(out.selection.sections);
  blade::attach_interpolators(out.grid, structural, aero);
  out.elements = blade::element_stiffness(out.grid, s.material);
  out.bodies = blade::lump_node_masses(out.grid);
  if (out.grid.has_aero()) out.panels = blade::aero_panels(out.grid);
  return out;
}

static std::vector<std::string> grid_summary_lines(const PipelineOutput& p) {
  return {
      "grid: nodes=" + std::to_string(p.grid.node_count()) +
          ", elements=" + std::to_string(p.grid.element_count()),
      "total_mass=" + std::to_string(blade::total_mass(p.bodies)),
      "aero_panels=" + std::to_string(p.panels.size()),
  };
}

int cmd_sections(int argc, char** argv) {
  RunSettings s;
  try {
    s = parse_sections_args(argc, argv);
  } catch (const ArgError& e) {
    std::cerr << "Invalid arguments: " << e.msg << "\n";
    std::cerr << "Run 'rotorbeam_cli help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  }

  try {
    s.validate_or_throw();
    set_log_level(s.log_level);

    const blade::SignalTable structural = io::load_structural_table(s.structural_path);
    std::optional<blade::SignalTable> aero;
    if (s.aero_path) aero = io::load_aero_table(*s.aero_path);

    const PipelineOutput p = run_pipeline(structural, aero ? &*aero : nullptr, s);

    std::error_code ec;
    std::filesystem::create_directories(s.out_dir, ec);
    if (ec) {
      throw IOError("cannot create output directory " + s.out_dir + ": " + ec.message());
    }
    const std::filesystem::path dir(s.out_dir);
    const std::string report_path = (dir / (s.name + ".report.txt")).string();
    const std::string elems_path = (dir / (s.name + "_elements.csv")).string();
    const std::string bodies_path = (dir / (s.name + "_bodies.csv")).string();

    std::vector<std::string> extra{"struct=" + s.structural_path,
                                   "aero=" + (s.aero_path ? *s.aero_path : std::string("None"))};
    for (const auto& l : grid_summary_lines(p)) extra.push_back(l);

    blade::write_section_report_file(p.selection.report, s.name, s.selection, report_path, extra);
    blade::write_elements_csv(elems_path, p.elements);
    blade::write_bodies_csv(bodies_path, p.bodies);
    if (p.grid.has_aero()) {
      const std::string aero_path = (dir / (s.name + "_aero.csv")).string();
      blade::write_aero_csv(aero_path, p.panels);
      log(LogLevel::INFO, "cli", "wrote " + aero_path);
    }

    log(LogLevel::INFO, "cli", "wrote " + report_path);
    log(LogLevel::INFO, "cli", "wrote " + elems_path);
    log(LogLevel::INFO, "cli", "wrote " + bodies_path);

    std::cout << "K=" << p.selection.sections.size()
              << " elements=" << p.grid.element_count()
              << " nodes=" << p.grid.node_count()
              << " warnings=" << p.selection.report.warnings.size() << "\n";
    return ExitCode::SUCCESS;

  } catch (const ValidationError& e) {
    std::cerr << "Validation FAILED: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const ParseError& e) {
    std::cerr << "Table rejected: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const IOError& e) {
    std::cerr << "I/O error: " << e.what() << "\n";
    return ExitCode::IO_ERROR;
  } catch (const RotorBeamError& e) {
    std::cerr << "Error [" << to_string(e.code()) << "]: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }
}

int cmd_demo() {
  std::cout << "=== Blade Section Selection Demo ===\n";

  try {
    RunSettings s = RunSettings::defaults();
    s.name = "demo_blade";
    s.structural_path = "<synthetic>";
    s.selection.max_elements = 20;
    s.selection.min_segment_length = 0.1;
    s.validate_or_throw();

    const blade::SignalTable structural = demo_structural();
    const blade::SignalTable aero = demo_aero();
    const PipelineOutput p = run_pipeline(structural, &aero, s);

    std::cout << blade::format_section_report(p.selection.report, s.name, s.selection,
                                              grid_summary_lines(p));
    std::cout << "\nComputation: SUCCESS\n";
    return ExitCode::SUCCESS;

  } catch (const ValidationError& e) {
    std::cerr << "Validation FAILED: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }
}

} // namespace

int main(int argc, char** argv) {
  // Parse command
  std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  if (cmd == "sections") {
    return cmd_sections(argc, argv);
  }

  if (cmd == "demo") {
    return cmd_demo();
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'rotorbeam_cli help' for usage information.\n";
  return ExitCode::INVALID_ARGS;
}
