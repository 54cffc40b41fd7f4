#pragma once

#include "errors.hpp"
#include "simulation/agreement_tally.hpp"
#include "simulation/subset_code.hpp"

#include <array>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <regex>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Six-way Venn diagram templating
//
// The template is an SVG whose region labels are <text> elements holding a
// letter code, e.g.
//
//     <text x="262.5" y="301.25">abd</text>
//
// Every line carrying a y="<digits>.<digits>"> coordinate directly followed
// by a code has the code replaced with the subset's agreement probability.
// All other lines are copied through unchanged.
// ---------------------------------------------------------------------------
namespace venn {

// Shortest round-trip fixed-point form, always with a decimal point
// ("1.0", "0.25", "0.000031").
inline std::string format_probability(double p) {
    std::array<char, 64> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), p,
                                   std::chars_format::fixed);
    if (ec != std::errc()) {
        throw std::runtime_error("Cannot format probability value");
    }
    std::string s(buf.data(), end);
    if (s.find('.') == std::string::npos && s.find_first_of("ni") == std::string::npos) {
        s += ".0";
    }
    return s;
}

inline const std::regex& label_pattern() {
    static const std::regex pattern(R"re(y="[0-9]+\.[0-9]+">([a-f]+))re");
    return pattern;
}

// Substitute one line. Returns the line unchanged when it holds no label.
inline std::string render_line(const std::string& line, const AgreementTally& tally) {
    std::smatch m;
    if (!std::regex_search(line, m, label_pattern())) return line;

    const std::string code = m[1].str();
    auto code_pos = static_cast<size_t>(m.position(1));
    return line.substr(0, code_pos) +
           format_probability(subset_code::probability(code, tally)) +
           line.substr(code_pos + code.size());
}

// Returns the number of labels substituted.
inline int render_diagram(std::istream& in, std::ostream& out, const AgreementTally& tally) {
    int substituted = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::string rendered = render_line(line, tally);
        if (rendered != line) ++substituted;
        out << rendered << "\n";
    }
    if (in.bad()) {
        throw std::runtime_error("Read failure while rendering diagram template");
    }
    if (!out) {
        throw std::runtime_error("Write failure while rendering diagram");
    }
    return substituted;
}

inline int render_diagram_file(const std::string& template_path, std::ostream& out,
                               const AgreementTally& tally) {
    if (!std::filesystem::exists(template_path)) {
        throw ResourceNotFound(template_path);
    }
    std::ifstream in(template_path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open diagram template: " + template_path);
    }
    try {
        return render_diagram(in, out, tally);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::string(e.what()) + ": " + template_path);
    }
}

}  // namespace venn
