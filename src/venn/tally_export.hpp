#pragma once

#include "simulation/agreement_tally.hpp"
#include "simulation/simulation_driver.hpp"
#include "simulation/subset_code.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tally_io {

// ---------------------------------------------------------------------------
// TallyRow — one subset of the tally, flattened for tabular output
// ---------------------------------------------------------------------------
struct TallyRow {
    SubsetMask mask = 0;
    std::string code;
    std::string measures;
    int64_t count = 0;
    double probability = 0.0;
};

inline std::vector<TallyRow> tally_rows(const AgreementTally& tally) {
    std::vector<TallyRow> rows;
    rows.reserve(NUM_SUBSETS);
    for (SubsetMask mask = 0; mask < NUM_SUBSETS; ++mask) {
        TallyRow row;
        row.mask = mask;
        row.code = subset_code::code_of(mask);
        row.measures = subset_code::measures_of(mask);
        row.count = tally.counts[mask];
        row.probability = tally.probability(mask);
        rows.push_back(row);
    }
    return rows;
}

inline std::vector<std::string> column_names() {
    return {"mask", "code", "measures", "count", "probability"};
}

inline std::string header_line() {
    std::ostringstream ss;
    auto cols = column_names();
    for (size_t i = 0; i < cols.size(); ++i) {
        if (i > 0) ss << ",";
        ss << cols[i];
    }
    return ss.str();
}

inline std::string format_row(const TallyRow& row) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << row.mask << "," << row.code << "," << row.measures << ","
       << row.count << "," << row.probability;
    return ss.str();
}

inline std::string to_csv(const AgreementTally& tally) {
    std::ostringstream ss;
    ss << header_line() << "\n";
    for (const auto& row : tally_rows(tally)) {
        ss << format_row(row) << "\n";
    }
    return ss.str();
}

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            default:   result += c;
        }
    }
    return result;
}

inline std::string to_json(const SimulationResult& result) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << "{";
    ss << "\"trial_count\":" << result.tally.trial_count;
    ss << ",\"tent_mode\":" << (result.config.tent_mode ? "true" : "false");
    ss << ",\"lower_bound\":" << result.config.lower_bound;
    ss << ",\"upper_bound\":" << result.config.upper_bound;
    ss << ",\"bisection_precision\":" << result.config.effective_precision();
    ss << ",\"seed\":" << result.seed;

    ss << ",\"subsets\":[";
    auto rows = tally_rows(result.tally);
    for (size_t i = 0; i < rows.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& r = rows[i];
        ss << "{";
        ss << "\"mask\":" << r.mask;
        ss << ",\"code\":\"" << json_escape(r.code) << "\"";
        ss << ",\"measures\":\"" << json_escape(r.measures) << "\"";
        ss << ",\"count\":" << r.count;
        ss << ",\"probability\":" << r.probability;
        ss << "}";
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

inline void write_text(const std::string& path, const std::string& content) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        throw std::runtime_error("Output directory does not exist: " + parent.string());
    }
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    out << content;
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

inline void write_csv(const std::string& path, const AgreementTally& tally) {
    write_text(path, to_csv(tally));
}

inline void write_json(const std::string& path, const SimulationResult& result) {
    write_text(path, to_json(result) + "\n");
}

}  // namespace tally_io
