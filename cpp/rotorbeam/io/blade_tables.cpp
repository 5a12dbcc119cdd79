/*
===============================================================================
Fragment 3.1.01 — Blade Table Readers (Implementation)
File: blade_tables.cpp
===============================================================================
*/

#include "rotorbeam/io/blade_tables.hpp"
#include "rotorbeam/core/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>

namespace rotorbeam::io {

namespace {

static std::string trim(std::string_view v) {
    std::size_t b = 0;
    std::size_t e = v.size();
    while (b < e && std::isspace(static_cast<unsigned char>(v[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(v[e - 1]))) --e;
    return std::string(v.substr(b, e - b));
}

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool starts_with(const std::string& s, std::string_view p) {
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

// Whitespace and commas both separate fields.
static std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : line) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) {
                out.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

static bool try_parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0') return false;
    return is_finite(out);
}

static bool parse_numeric_row(const std::vector<std::string>& toks, std::vector<double>& row) {
    if (toks.empty()) return false;
    row.clear();
    row.reserve(toks.size());
    for (const auto& t : toks) {
        double v = 0.0;
        if (!try_parse_double(t, v)) return false;
        row.push_back(v);
    }
    return true;
}

static bool looks_like_units(const std::vector<std::string>& toks) {
    std::string text;
    for (const auto& t : toks) {
        text += to_lower(t);
        text += ' ';
    }
    static const std::array<const char*, 14> keys{
        "deg", "adim", "unit", "lb", "slug", "ft", "m", "kg", "**", "[]", "rad", "in", "mm", "cm"};
    for (const char* k : keys) {
        if (text.find(k) != std::string::npos) return true;
    }
    return false;
}

static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(line);
    }
    return out;
}

static std::string join_lines(const std::vector<std::string>& lines, std::size_t b, std::size_t e) {
    std::string out;
    for (std::size_t i = b; i < e && i < lines.size(); ++i) {
        out += lines[i];
        out += '\n';
    }
    return out;
}

// ---------------------------------------------------------------------------
// Structural helpers
// ---------------------------------------------------------------------------

// Column names as they appear in the source table, in canonical order.
static const std::array<const char*, 18> kTipColumns{
    "SEC", "STA", "WEIGHT", "XCG", "ZCG", "ROTAPI", "JX", "JZ", "JP",
    "EA", "XNA", "ZNA", "ROTAN", "EJZ", "EJX", "GJ", "XCT", "ZCT"};

struct ColumnAlias {
    const char* target; // beam-local name
    const char* source; // table name
};

static const std::array<ColumnAlias, 16> kTipMapping{{
    {"EA", "EA"},
    {"EJY", "EJX"},
    {"EJZ", "EJZ"},
    {"GJ", "GJ"},
    {"YNA", "ZNA"},
    {"ZNA", "XNA"},
    {"YCT", "ZCT"},
    {"ZCT", "XCT"},
    {"YCG", "ZCG"},
    {"ZCG", "XCG"},
    {"dM", "WEIGHT"},
    {"dJX", "JP"},
    {"dJY", "JZ"},
    {"dJZ", "JX"},
    {"ROTAN_deg", "ROTAN"},
    {"ROTAPI_deg", "ROTAPI"},
}};

// Exact header matches first, then substring matches over unclaimed columns.
static std::map<std::string, std::size_t> map_tip_header(const std::vector<std::string>& header) {
    std::vector<std::string> norm;
    norm.reserve(header.size());
    for (const auto& h : header) norm.push_back(normalize_header_token(h));

    std::map<std::string, std::size_t> idx;
    std::set<std::size_t> claimed;

    for (const char* want : kTipColumns) {
        for (std::size_t j = 0; j < norm.size(); ++j) {
            if (claimed.count(j) == 0 && norm[j] == want) {
                idx[want] = j;
                claimed.insert(j);
                break;
            }
        }
    }
    for (const char* want : kTipColumns) {
        if (idx.count(want) != 0) continue;
        for (std::size_t j = 0; j < norm.size(); ++j) {
            if (claimed.count(j) == 0 && norm[j].find(want) != std::string::npos) {
                idx[want] = j;
                claimed.insert(j);
                break;
            }
        }
    }
    return idx;
}

static bool has_metric_units(const RawTable& t) {
    if (t.units.size() < 3) return false;
    const std::string sta = normalize_header_token(t.units[1]);
    const std::string wei = normalize_header_token(t.units[2]);
    return sta.find('M') != std::string::npos && wei.find("KGM") != std::string::npos;
}

// TABLE ... ENDTABLE bodies following a "BLADE STRUCT" marker.
static std::vector<std::string> extract_struct_blocks(const std::vector<std::string>& lines) {
    std::vector<std::string> blocks;
    std::size_t i = 0;
    while (i < lines.size()) {
        const std::string up = to_upper(lines[i]);
        if (up.find("BLADE") == std::string::npos || up.find("STRUCT") == std::string::npos) {
            ++i;
            continue;
        }
        std::size_t j = i + 1;
        while (j < lines.size() && to_upper(lines[j]).find("TABLE") == std::string::npos) ++j;
        if (j >= lines.size()) break;

        std::size_t k = j + 1;
        while (k < lines.size() && to_upper(lines[k]).find("ENDTABLE") == std::string::npos) ++k;
        if (k > j + 1) blocks.push_back(join_lines(lines, j + 1, k));
        i = k + 1;
    }
    return blocks;
}

// ---------------------------------------------------------------------------
// Aero helpers
// ---------------------------------------------------------------------------

static const std::set<std::string> kRadialKeys{"RADIAL", "R", "STA", "RADIUS", "RAD", "STATION", "SPAN"};
static const std::set<std::string> kChordKeys{"CHORD", "C", "CRD", "CHRD", "CH",
                                              "CHORDM", "CHORDMM", "CHORDIN", "CHORDLENGTH"};
static const std::set<std::string> kTwistKeys{"TWIST", "THETA", "PITCH", "TWISTDEG", "TWISTANGLE"};
static const std::set<std::string> kSweepKeys{"SWEEP"};
static const std::set<std::string> kAnhedralKeys{"ANHEDRAL", "DIHEDRAL", "ANHD", "ANH"};

// Fraction of non-decreasing steps.
static double monotonic_score(const std::vector<double>& c) {
    if (c.size() < 2) return 0.0;
    std::size_t nondec = 0;
    for (std::size_t k = 1; k < c.size(); ++k) {
        if (c[k] >= c[k - 1]) ++nondec;
    }
    return static_cast<double>(nondec) / static_cast<double>(c.size() - 1);
}

static double population_std(const std::vector<double>& c) {
    if (c.empty()) return 0.0;
    double mean = 0.0;
    for (double v : c) mean += v;
    mean /= static_cast<double>(c.size());
    double acc = 0.0;
    for (double v : c) acc += (v - mean) * (v - mean);
    return std::sqrt(acc / static_cast<double>(c.size()));
}

} // namespace

// ---------------------------------------------------------------------------
// RawTable
// ---------------------------------------------------------------------------

std::size_t RawTable::column_count() const noexcept {
    std::size_t n = 0;
    for (const auto& r : rows) n = std::max(n, r.size());
    return n;
}

std::vector<double> RawTable::column(std::size_t j) const {
    std::vector<double> out;
    out.reserve(rows.size());
    for (const auto& r : rows) out.push_back(j < r.size() ? r[j] : 0.0);
    return out;
}

std::string normalize_header_token(std::string_view tok) {
    std::string out;
    out.reserve(tok.size());
    for (char c : tok) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) out.push_back(static_cast<char>(std::toupper(uc)));
    }
    return out;
}

RawTable parse_table_text(const std::string& text, const std::string& origin) {
    std::vector<std::string> lines;
    for (const auto& raw : split_lines(text)) {
        std::string s = trim(raw);
        if (s.empty()) continue;
        if (starts_with(s, "#") || starts_with(s, "!") || starts_with(s, "//")) continue;
        lines.push_back(std::move(s));
    }

    RawTable t;
    std::vector<double> row;
    std::size_t i = 0;

    if (!lines.empty()) {
        const auto toks = tokenize(lines[0]);
        if (!parse_numeric_row(toks, row)) {
            t.header = toks;
            std::size_t j = 1;
            for (; j < lines.size(); ++j) {
                const auto t2 = tokenize(lines[j]);
                if (parse_numeric_row(t2, row)) break;
                if (looks_like_units(t2)) {
                    t.units.insert(t.units.end(), t2.begin(), t2.end());
                    continue;
                }
                t.header.insert(t.header.end(), t2.begin(), t2.end());
            }
            i = j;
        }
    }

    for (; i < lines.size(); ++i) {
        if (parse_numeric_row(tokenize(lines[i]), row)) t.rows.push_back(row);
    }

    if (t.rows.empty()) {
        throw ParseError(origin + ": no numeric data rows found");
    }
    return t;
}

std::string read_text_file(const std::string& path) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) {
        throw IOError("cannot open table file: " + path);
    }
    std::ostringstream oss;
    oss << f.rdbuf();
    if (f.bad()) {
        throw IOError("failed reading table file: " + path);
    }
    return oss.str();
}

// ---------------------------------------------------------------------------
// Structural
// ---------------------------------------------------------------------------

blade::SignalTable structural_table_from_text(const std::string& text, const std::string& origin) {
    const auto blocks = extract_struct_blocks(split_lines(text));

    RawTable raw;
    if (blocks.empty()) {
        raw = parse_table_text(text, origin);
    } else {
        std::vector<RawTable> parsed;
        parsed.reserve(blocks.size());
        for (const auto& b : blocks) parsed.push_back(parse_table_text(b, origin));

        std::size_t pick = 0;
        for (std::size_t k = 0; k < parsed.size(); ++k) {
            if (has_metric_units(parsed[k])) {
                pick = k;
                break;
            }
        }
        raw = std::move(parsed[pick]);
        log(LogLevel::DEBUG, "io",
            origin + ": using STRUCT table block " + std::to_string(pick + 1) + "/" + std::to_string(parsed.size()));
    }

    auto idx = map_tip_header(raw.header);
    if (idx.count("STA") == 0) {
        if (raw.column_count() >= kTipColumns.size()) {
            idx.clear();
            for (std::size_t j = 0; j < kTipColumns.size(); ++j) idx[kTipColumns[j]] = j;
            log(LogLevel::WARN, "io", origin + ": header mapping failed, assuming fixed column order");
        } else {
            throw ParseError(origin + ": cannot locate STA column");
        }
    }

    const auto col = [&](const char* name) -> std::vector<double> {
        const auto it = idx.find(name);
        if (it == idx.end()) return std::vector<double>(raw.rows.size(), 0.0);
        return raw.column(it->second);
    };

    blade::ColumnMap cols;
    for (const auto& m : kTipMapping) {
        if (idx.count(m.source) == 0) {
            log(LogLevel::DEBUG, "io", origin + ": column " + m.source + " missing, filled with 0");
        }
        cols[m.target] = col(m.source);
    }

    blade::SignalTable out = blade::normalize_columns(col("STA"), cols);
    log(LogLevel::INFO, "io",
        origin + ": structural table with " + std::to_string(out.size()) + " stations");
    return out;
}

blade::SignalTable load_structural_table(const std::string& path) {
    return structural_table_from_text(read_text_file(path), path);
}

// ---------------------------------------------------------------------------
// Aero
// ---------------------------------------------------------------------------

blade::SignalTable aero_table_from_text(const std::string& text, const std::string& origin) {
    const RawTable raw = parse_table_text(text, origin);
    const std::size_t ncols = raw.column_count();

    std::map<std::string, std::size_t> idx;
    for (std::size_t j = 0; j < raw.header.size(); ++j) {
        const std::string key = normalize_header_token(raw.header[j]);
        if (kRadialKeys.count(key) && !idx.count("Radial")) idx["Radial"] = j;
        else if (kChordKeys.count(key) && !idx.count("Chord")) idx["Chord"] = j;
        else if (kTwistKeys.count(key) && !idx.count("Twist")) idx["Twist"] = j;
        else if (kSweepKeys.count(key) && !idx.count("Sweep")) idx["Sweep"] = j;
        else if (kAnhedralKeys.count(key) && !idx.count("Anhedral")) idx["Anhedral"] = j;
    }

    const std::vector<double> zeros(raw.rows.size(), 0.0);
    std::vector<double> radial;
    blade::ColumnMap cols;

    if (!idx.count("Radial") || !idx.count("Chord")) {
        log(LogLevel::WARN, "io", origin + ": header lacks Radial/Chord names, guessing columns");
        if (ncols < 2) {
            throw ParseError(origin + ": could not infer Radial/Chord columns");
        }

        std::size_t rad = 0;
        double best = -1.0;
        for (std::size_t j = 0; j < ncols; ++j) {
            const double s = monotonic_score(raw.column(j));
            if (s > best) {
                best = s;
                rad = j;
            }
        }

        std::optional<std::size_t> chord;
        double best_std = -1.0;
        for (std::size_t j = 0; j < ncols; ++j) {
            if (j == rad) continue;
            const double s = population_std(raw.column(j));
            if (!chord || s > best_std) {
                best_std = s;
                chord = j;
            }
        }

        radial = raw.column(rad);
        cols["Chord"] = raw.column(*chord);
        cols["Twist"] = zeros;
        cols["Sweep"] = zeros;
        cols["Anhedral"] = zeros;
    } else {
        radial = raw.column(idx["Radial"]);
        for (const char* name : {"Chord", "Twist", "Sweep", "Anhedral"}) {
            const auto it = idx.find(name);
            if (it == idx.end()) {
                log(LogLevel::DEBUG, "io", origin + ": optional column " + name + " missing, filled with 0");
                cols[name] = zeros;
            } else {
                cols[name] = raw.column(it->second);
            }
        }
    }

    blade::SignalTable out = blade::normalize_columns(radial, cols);
    log(LogLevel::INFO, "io", origin + ": aero table with " + std::to_string(out.size()) + " stations");
    return out;
}

blade::SignalTable load_aero_table(const std::string& path) {
    return aero_table_from_text(read_text_file(path), path);
}

} // namespace rotorbeam::io
