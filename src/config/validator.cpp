#include <qscope/config/validator.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <stdexcept>

#include <fmt/core.h>

#include <qscope/quantum/simulator.hpp>

namespace qscope::config {

bool parse_int(const std::string& text, int& out, std::string& err) {
    if (text.empty()) { err = "empty integer value"; return false; }
    std::size_t start = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    if (start == text.size() ||
        !std::all_of(text.begin() + static_cast<std::ptrdiff_t>(start), text.end(), ::isdigit)) {
        err = fmt::format("'{}' is not an integer", text); return false; }
    try {
        out = std::stoi(text);
    } catch (const std::out_of_range&) {
        err = fmt::format("'{}' is out of range", text); return false;
    }
    return true;
}

bool parse_bool(const std::string& text, bool& out, std::string& err) {
    std::string v = text;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") { out = true; return true; }
    if (v == "false" || v == "0" || v == "no" || v == "off") { out = false; return true; }
    err = fmt::format("'{}' is not a boolean", text);
    return false;
}

bool validate_range(const std::string& key, int value, int lo, int hi, std::string& err) {
    if (value < lo || value > hi) {
        err = fmt::format("{} must be in [{}, {}], got {}", key, lo, hi, value);
        return false;
    }
    return true;
}

bool is_known_backend(const std::string& name, std::string& err) {
    try {
        quantum::EvolverFactory::parse_backend(name);
    } catch (const std::invalid_argument& ex) {
        err = ex.what();
        return false;
    }
    return true;
}

} // namespace qscope::config
