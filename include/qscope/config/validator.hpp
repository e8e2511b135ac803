#pragma once

#include <string>

namespace qscope::config {

// Parses a base-10 integer occupying the whole text.
bool parse_int(const std::string& text, int& out, std::string& err);

// Accepts true/false, 1/0, yes/no, on/off.
bool parse_bool(const std::string& text, bool& out, std::string& err);

// Checks lo <= value <= hi and names the key in 'err' otherwise.
bool validate_range(const std::string& key, int value, int lo, int hi, std::string& err);

// Backend names accepted by the evolver factory, case-insensitive.
bool is_known_backend(const std::string& name, std::string& err);

} // namespace qscope::config
