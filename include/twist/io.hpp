/**
 * @file io.hpp
 * @brief Table input/output for TWIST (CSV, optionally netCDF)
 *
 * CSV is always available. netCDF goes through netCDF-cxx4 and is compiled
 * in with -DTWIST_USE_NETCDF=ON; without it the netCDF functions throw.
 */

#pragma once

#include "config.hpp"
#include "timeseries.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef TWIST_USE_NETCDF
#include <ncFile.h>
#include <ncDim.h>
#include <ncVar.h>
#include <ncVarAtt.h>
#include <ncException.h>
#endif

namespace twist {
namespace io {

// ============================================================================
// CSV HELPERS
// ============================================================================

inline std::string trim(const std::string& s) {
    std::size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    std::size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

/**
 * @brief Split one CSV line on commas
 *
 * Double-quoted fields may contain commas; the quotes are removed.
 */
inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (c == ',' && !in_quotes) {
            fields.push_back(trim(field));
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(trim(field));
    return fields;
}

/**
 * @brief Parse a numeric cell
 *
 * Empty, "NA" and "NaN" cells are missing values and read as NaN.
 * @return false if the cell is not a number
 */
inline bool parse_real(const std::string& cell, Real& value) {
    if (cell.empty() || cell == "NA" || cell == "NaN" || cell == "nan") {
        value = std::numeric_limits<Real>::quiet_NaN();
        return true;
    }
    const char* begin = cell.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0') {
        return false;
    }
    // ERANGE on underflow still yields a usable (subnormal or zero) value
    if (errno == ERANGE && std::isinf(v)) {
        return false;
    }
    value = static_cast<Real>(v);
    return true;
}

// ============================================================================
// CSV READ / WRITE
// ============================================================================

/**
 * @brief Read a timeseries table from a CSV file with a header row
 *
 * The column named time_column is always kept as text. Any other column is
 * numeric if every cell parses as a number (or a missing value), and text
 * otherwise.
 *
 * @throws std::runtime_error on I/O errors or ragged rows
 */
inline TimeseriesTable read_timeseries_csv(
    const std::string& path,
    const std::string& time_column = "datetime"
) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error("Empty input file: " + path);
    }
    std::vector<std::string> header = split_csv_line(line);

    std::vector<std::vector<std::string>> cells(header.size());

    int line_no = 1;
    while (std::getline(file, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        std::vector<std::string> fields = split_csv_line(line);
        if (fields.size() != header.size()) {
            throw std::runtime_error(
                path + ":" + std::to_string(line_no) + ": expected " +
                std::to_string(header.size()) + " fields, found " +
                std::to_string(fields.size()));
        }
        for (std::size_t c = 0; c < header.size(); ++c) {
            cells[c].push_back(fields[c]);
        }
    }

    TimeseriesTable table;
    for (std::size_t c = 0; c < header.size(); ++c) {
        bool numeric = header[c] != time_column;
        std::vector<Real> values;
        if (numeric) {
            values.resize(cells[c].size());
            for (std::size_t r = 0; r < cells[c].size(); ++r) {
                if (!parse_real(cells[c][r], values[r])) {
                    numeric = false;
                    break;
                }
            }
        }

        if (numeric) {
            table.set_column(header[c], std::move(values));
        } else {
            table.set_text_column(header[c], std::move(cells[c]));
        }
    }
    return table;
}

/**
 * @brief Write model output as CSV: datetime,TWD,RWC[,f_soil,uptake]
 */
inline void write_output_csv(
    const std::string& path,
    const OutputTable& out,
    bool write_fluxes = false
) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }

    file << "datetime,TWD,RWC";
    if (write_fluxes) file << ",f_soil,uptake";
    file << "\n";

    file << std::setprecision(std::numeric_limits<Real>::max_digits10);
    for (std::size_t i = 0; i < out.size(); ++i) {
        file << out.datetime[i] << "," << out.TWD[i] << "," << out.RWC[i];
        if (write_fluxes) file << "," << out.f_soil[i] << "," << out.uptake[i];
        file << "\n";
    }

    if (!file) {
        throw std::runtime_error("Failed writing output file: " + path);
    }
}

// ============================================================================
// NETCDF I/O
// ============================================================================

#ifdef TWIST_USE_NETCDF

/**
 * @brief Read every 1-D variable on the "time" dimension into a table
 *
 * The "time" variable becomes a numeric column named time_column and its
 * units attribute is kept in the table.
 */
inline TimeseriesTable read_timeseries_netcdf(
    const std::string& path,
    const std::string& time_column = "datetime"
) {
    using namespace netCDF;

    NcFile file(path, NcFile::read);
    NcDim time_dim = file.getDim("time");
    if (time_dim.isNull()) {
        throw std::runtime_error("No 'time' dimension in " + path);
    }
    std::size_t n_time = time_dim.getSize();

    TimeseriesTable table;
    for (const auto& entry : file.getVars()) {
        NcVar var = entry.second;
        if (var.getDimCount() != 1 || var.getDim(0) != time_dim) continue;

        std::vector<double> values(n_time);
        var.getVar(values.data());
        std::vector<Real> column(values.begin(), values.end());

        if (entry.first == "time") {
            table.set_column(time_column, std::move(column));
            try {
                NcVarAtt units_att = var.getAtt("units");
                units_att.getValues(table.time_units);
            } catch (const exceptions::NcException&) {
                table.time_units.clear();
            }
        } else {
            table.set_column(entry.first, std::move(column));
        }
    }
    return table;
}

/**
 * @brief Write model output to netCDF
 *
 * Timestamps must be numeric offsets (as read from a netCDF input).
 */
inline void write_output_netcdf(
    const std::string& path,
    const OutputTable& out,
    bool write_fluxes = false
) {
    using namespace netCDF;

    std::vector<double> time(out.size());
    for (std::size_t i = 0; i < out.size(); ++i) {
        try {
            time[i] = std::stod(out.datetime[i]);
        } catch (const std::exception&) {
            throw std::runtime_error(
                "netCDF output needs numeric time values, got '" +
                out.datetime[i] + "'");
        }
    }

    NcFile file(path, NcFile::replace);
    NcDim time_dim = file.addDim("time", out.size());

    NcVar time_var = file.addVar("time", ncDouble, time_dim);
    if (!out.time_units.empty()) time_var.putAtt("units", out.time_units);
    time_var.putAtt("long_name", "time");
    time_var.putVar(time.data());

    auto put_series = [&](const std::string& name, const std::vector<Real>& data,
                          const std::string& units, const std::string& long_name) {
        NcVar var = file.addVar(name, ncDouble, time_dim);
        var.putAtt("units", units);
        var.putAtt("long_name", long_name);
        std::vector<double> values(data.begin(), data.end());
        var.putVar(values.data());
    };

    put_series("TWD", out.TWD, "same as transpiration", "Tree water deficit");
    put_series("RWC", out.RWC, "1", "Relative water content of the tree water pool");
    if (write_fluxes) {
        put_series("f_soil", out.f_soil, "1", "Soil water limitation factor");
        put_series("uptake", out.uptake, "same as transpiration", "Root water uptake");
    }

    file.putAtt("title", "TWIST model output");
    file.putAtt("source", "TWIST - Tree Water Imbalance and Storage Tracker");
}

#else

inline TimeseriesTable read_timeseries_netcdf(
    const std::string& path,
    const std::string& /*time_column*/ = "datetime"
) {
    throw std::runtime_error("Cannot read " + path +
                             ": NetCDF support not compiled. Rebuild with -DTWIST_USE_NETCDF=ON");
}

inline void write_output_netcdf(
    const std::string& path,
    const OutputTable& /*out*/,
    bool /*write_fluxes*/ = false
) {
    throw std::runtime_error("Cannot write " + path +
                             ": NetCDF support not compiled. Rebuild with -DTWIST_USE_NETCDF=ON");
}

#endif // TWIST_USE_NETCDF

// ============================================================================
// FORMAT DISPATCH
// ============================================================================

inline bool is_netcdf_path(const std::string& path) {
    auto ends_with = [&](const std::string& suffix) {
        return path.size() >= suffix.size() &&
               path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return ends_with(".nc") || ends_with(".nc4");
}

inline TimeseriesTable read_timeseries(
    const std::string& path,
    const std::string& time_column = "datetime"
) {
    if (is_netcdf_path(path)) return read_timeseries_netcdf(path, time_column);
    return read_timeseries_csv(path, time_column);
}

inline void write_output(
    const std::string& path,
    const OutputTable& out,
    bool write_fluxes = false
) {
    if (is_netcdf_path(path)) {
        write_output_netcdf(path, out, write_fluxes);
    } else {
        write_output_csv(path, out, write_fluxes);
    }
}

} // namespace io
} // namespace twist
