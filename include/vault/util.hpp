#pragma once

#include "vault/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vault {

std::string trim(std::string value);

std::string to_lower_copy(std::string value);

// Whitespace-separated tokens; empty input yields no tokens.
std::vector<std::string> split_words(const std::string& line);

// Parses a non-negative decimal integer; rejects signs, fractions and overflow.
std::optional<Amount> parse_amount(const std::string& text);

// Exports KEY=VALUE lines into the process environment. A missing file is ignored.
void load_env_file(const std::string& path);

} // namespace vault
