/**
 * @file control.hpp
 * @brief Control file parser for the TWIST command line driver
 *
 * Format: one `KEY value` pair per line. String values are single-quoted,
 * numeric values are bare. Anything after `!` is a comment.
 *
 *   ! TWIST control file
 *   INPUT_FILE    'example_input.csv'
 *   OUTPUT_FILE   'twist_output.csv'
 *   COL_E         'transpiration_l.m2'
 *   F_E           0.6
 *   RHO_SAT       1.07
 */

#pragma once

#include "config.hpp"
#include "state.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace twist {

// ============================================================================
// CONTROL FILE
// ============================================================================

struct ControlFile {
    std::string input_file;
    std::string output_file;
    ColumnNames columns;
    Parameters params;
    PoolParameters pool;
    Real TWD_init = Real(0);
    bool write_fluxes = false;

    /// Keys that were present but not recognised
    std::vector<std::string> unknown_keys;
};

namespace detail {

inline std::string strip_comment(const std::string& line) {
    // A '!' inside a quoted value is not a comment
    bool in_quotes = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\'') in_quotes = !in_quotes;
        if (line[i] == '!' && !in_quotes) return line.substr(0, i);
    }
    return line;
}

inline bool parse_bool(const std::string& value, const std::string& key) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    if (v == "true" || v == "1" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "no") return false;
    throw std::runtime_error("Invalid boolean for " + key + ": '" + value + "'");
}

} // namespace detail

/**
 * @brief Parse a control file
 *
 * Unset keys keep their defaults. INPUT_FILE and OUTPUT_FILE are required.
 *
 * @throws std::runtime_error if the file cannot be read, a line is
 *         malformed, a number does not parse, or a required key is absent
 */
inline ControlFile parse_control_stream(std::istream& in, const std::string& source) {
    ControlFile ctl;

    std::map<std::string, std::string*> string_map = {
        {"INPUT_FILE", &ctl.input_file},
        {"OUTPUT_FILE", &ctl.output_file},
        {"COL_TIME", &ctl.columns.time},
        {"COL_E", &ctl.columns.E},
        {"COL_THETA", &ctl.columns.theta},
        {"COL_M_WOOD", &ctl.columns.m_wood},
        {"COL_W", &ctl.columns.W}
    };

    std::map<std::string, Real*> real_map = {
        {"F_E", &ctl.params.F_E},
        {"F_TWD", &ctl.params.F_TWD},
        {"F_THETA", &ctl.params.F_theta},
        {"RHO_SAT", &ctl.pool.rho_sat},
        {"RHO_DRY", &ctl.pool.rho_dry},
        {"TWD_INIT", &ctl.TWD_init}
    };

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = detail::strip_comment(line);

        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key)) continue;
        if (key == "TWIST_CONTROL") continue;  // Optional header

        std::string rest;
        std::getline(iss, rest);

        std::string value;
        size_t start = rest.find('\'');
        size_t end = rest.rfind('\'');
        if (start != std::string::npos && end != std::string::npos && end > start) {
            value = rest.substr(start + 1, end - start - 1);
        } else {
            std::istringstream vs(rest);
            if (!(vs >> value)) {
                throw std::runtime_error(source + ":" + std::to_string(line_no) +
                                         ": no value for " + key);
            }
        }

        auto s_it = string_map.find(key);
        if (s_it != string_map.end()) {
            *s_it->second = value;
            continue;
        }

        auto r_it = real_map.find(key);
        if (r_it != real_map.end()) {
            std::istringstream vs(value);
            double v;
            if (!(vs >> v) || !(vs >> std::ws).eof()) {
                throw std::runtime_error(source + ":" + std::to_string(line_no) +
                                         ": invalid number for " + key + ": '" + value + "'");
            }
            *r_it->second = static_cast<Real>(v);
            continue;
        }

        if (key == "WRITE_FLUXES") {
            ctl.write_fluxes = detail::parse_bool(value, key);
            continue;
        }

        ctl.unknown_keys.push_back(key);
    }

    if (ctl.input_file.empty()) {
        throw std::runtime_error(source + ": INPUT_FILE not set");
    }
    if (ctl.output_file.empty()) {
        throw std::runtime_error(source + ": OUTPUT_FILE not set");
    }

    return ctl;
}

inline ControlFile parse_control_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open control file: " + path);
    }
    return parse_control_stream(file, path);
}

} // namespace twist
