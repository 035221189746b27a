/**
 * @file timeseries.hpp
 * @brief Named-column timeseries tables and the table-level model runner
 *
 * A TimeseriesTable is rectangular and keeps rows in insertion order, which
 * is time order. Timestamps are opaque strings: the model never interprets
 * them, it only carries them from input to output.
 */

#pragma once

#include "config.hpp"
#include "state.hpp"
#include "physics.hpp"
#include "kernels.hpp"

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace twist {

// ============================================================================
// ERRORS
// ============================================================================

/**
 * @brief Raised when configured columns are absent from an input table
 *
 * Lists every missing column, not just the first one found.
 */
class MissingColumnsError : public std::runtime_error {
public:
    explicit MissingColumnsError(const std::vector<std::string>& missing)
        : std::runtime_error(build_message(missing)), missing_(missing) {}

    const std::vector<std::string>& missing() const { return missing_; }

private:
    static std::string build_message(const std::vector<std::string>& missing) {
        std::string msg = "The following required columns are missing: ";
        for (std::size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += missing[i];
        }
        return msg;
    }

    std::vector<std::string> missing_;
};

// ============================================================================
// INPUT TABLE
// ============================================================================

class TimeseriesTable {
public:
    std::size_t num_rows() const { return num_rows_; }
    std::size_t num_columns() const { return order_.size(); }

    /// Column names in insertion order
    const std::vector<std::string>& column_names() const { return order_; }

    bool has_column(const std::string& name) const {
        return numeric_.count(name) > 0 || text_.count(name) > 0;
    }

    bool is_numeric(const std::string& name) const {
        return numeric_.count(name) > 0;
    }

    /**
     * @brief Add or replace a numeric column
     * @throws std::invalid_argument if the length breaks rectangularity
     */
    void set_column(const std::string& name, std::vector<Real> values) {
        check_length(name, values.size());
        if (!has_column(name)) order_.push_back(name);
        text_.erase(name);
        numeric_[name] = std::move(values);
        num_rows_ = numeric_[name].size();
    }

    /**
     * @brief Add or replace a text column (timestamps)
     * @throws std::invalid_argument if the length breaks rectangularity
     */
    void set_text_column(const std::string& name, std::vector<std::string> values) {
        check_length(name, values.size());
        if (!has_column(name)) order_.push_back(name);
        numeric_.erase(name);
        text_[name] = std::move(values);
        num_rows_ = text_[name].size();
    }

    const std::vector<Real>& column(const std::string& name) const {
        auto it = numeric_.find(name);
        if (it == numeric_.end()) {
            throw std::out_of_range("No numeric column '" + name + "' in table");
        }
        return it->second;
    }

    const std::vector<std::string>& text_column(const std::string& name) const {
        auto it = text_.find(name);
        if (it == text_.end()) {
            throw std::out_of_range("No text column '" + name + "' in table");
        }
        return it->second;
    }

    /**
     * @brief Column rendered as text, whatever its storage
     *
     * Lets a numeric time axis (e.g. from netCDF) serve as the timestamp.
     * Numbers are written with enough digits to parse back exactly.
     */
    std::vector<std::string> column_as_text(const std::string& name) const {
        auto it = text_.find(name);
        if (it != text_.end()) return it->second;

        const std::vector<Real>& values = column(name);
        std::vector<std::string> out;
        out.reserve(values.size());
        std::ostringstream oss;
        oss << std::setprecision(std::numeric_limits<Real>::max_digits10);
        for (Real v : values) {
            oss.str("");
            oss << v;
            out.push_back(oss.str());
        }
        return out;
    }

    /// Attribute carried along with the table (e.g. time units)
    std::string time_units;

private:
    void check_length(const std::string& name, std::size_t n) const {
        bool only_column = order_.size() == 1 && order_[0] == name;
        if (!order_.empty() && !only_column && n != num_rows_) {
            throw std::invalid_argument(
                "Column '" + name + "' has " + std::to_string(n) +
                " rows, table has " + std::to_string(num_rows_));
        }
    }

    std::size_t num_rows_ = 0;
    std::vector<std::string> order_;
    std::map<std::string, std::vector<Real>> numeric_;
    std::map<std::string, std::vector<std::string>> text_;
};

// ============================================================================
// OUTPUT TABLE
// ============================================================================

/**
 * @brief Model output, one row per input row in input order
 */
struct OutputTable {
    std::vector<std::string> datetime;
    std::vector<Real> TWD;
    std::vector<Real> RWC;

    // Diagnostics, same length as TWD
    std::vector<Real> f_soil;
    std::vector<Real> uptake;

    std::string time_units;

    std::size_t size() const { return TWD.size(); }
};

// ============================================================================
// VALIDATION
// ============================================================================

/**
 * @brief Configured names absent from the table
 *
 * Deduplicated, in the order the names are given.
 */
inline std::vector<std::string> find_missing_columns(
    const TimeseriesTable& table,
    const std::vector<std::string>& required
) {
    std::vector<std::string> missing;
    for (const auto& name : required) {
        if (table.has_column(name)) continue;
        bool seen = false;
        for (const auto& m : missing) {
            if (m == name) { seen = true; break; }
        }
        if (!seen) missing.push_back(name);
    }
    return missing;
}

inline void require_columns(
    const TimeseriesTable& table,
    const std::vector<std::string>& required
) {
    std::vector<std::string> missing = find_missing_columns(table, required);
    if (!missing.empty()) {
        throw MissingColumnsError(missing);
    }
}

// ============================================================================
// WATER POOL ATTACHMENT
// ============================================================================

/**
 * @brief Compute W from the wood biomass column and store it in the W column
 *
 * Equation (5) applied row by row. An existing W column is overwritten.
 *
 * @throws MissingColumnsError if the wood biomass column is absent
 */
inline void attach_water_pool(
    TimeseriesTable& table,
    const PoolParameters& pool,
    const ColumnNames& columns = ColumnNames()
) {
    require_columns(table, {columns.m_wood});
    if (!table.is_numeric(columns.m_wood)) {
        throw std::runtime_error("Column '" + columns.m_wood + "' is not numeric");
    }

    const std::vector<Real>& m_wood = table.column(columns.m_wood);
    std::vector<Real> W(m_wood.size());
    for (std::size_t i = 0; i < m_wood.size(); ++i) {
        W[i] = physics::compute_water_pool(m_wood[i], pool);
    }
    table.set_column(columns.W, std::move(W));
}

// ============================================================================
// TABLE RUNNER
// ============================================================================

/**
 * @brief Run the model over a named-column timeseries table
 *
 * Fails before processing any row if any of the time, E, theta or W columns
 * is missing (the error names all of them) or if E, theta or W is not
 * numeric. Otherwise folds twist_step over
 * the rows in order, threading the deficit from one row to the next.
 *
 * @param table Input table with pool size already attached
 * @param params Deficit model parameters
 * @param TWD_initial Deficit before the first row (0 = fully hydrated)
 * @param columns Column names of the four roles
 * @return One output row per input row
 */
inline OutputTable run_timeseries(
    const TimeseriesTable& table,
    const Parameters& params,
    Real TWD_initial = Real(0),
    const ColumnNames& columns = ColumnNames()
) {
    require_columns(table, {columns.time, columns.E, columns.theta, columns.W});
    for (const std::string* name : {&columns.E, &columns.theta, &columns.W}) {
        if (!table.is_numeric(*name)) {
            throw std::runtime_error("Column '" + *name + "' is not numeric");
        }
    }

    const std::vector<Real>& E = table.column(columns.E);
    const std::vector<Real>& theta_rel = table.column(columns.theta);
    const std::vector<Real>& W = table.column(columns.W);
    const std::size_t n = table.num_rows();

    OutputTable out;
    out.datetime = table.column_as_text(columns.time);
    out.time_units = table.time_units;
    out.TWD.resize(n);
    out.RWC.resize(n);
    out.f_soil.resize(n);
    out.uptake.resize(n);

    State state(TWD_initial);
    Flux flux;
    for (std::size_t i = 0; i < n; ++i) {
        Forcing f(E[i], theta_rel[i], W[i]);
        state = twist_step(state, f, params, flux);

        out.TWD[i] = flux.TWD;
        out.RWC[i] = flux.RWC;
        out.f_soil[i] = flux.f_soil;
        out.uptake[i] = flux.uptake;
    }
    return out;
}

/**
 * @brief Number of rows whose TWD or RWC is NaN or infinite
 */
inline std::size_t count_non_finite(const OutputTable& out) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (!std::isfinite(out.TWD[i]) || !std::isfinite(out.RWC[i])) ++count;
    }
    return count;
}

} // namespace twist
