#pragma once
#include <string>
#include <vector>

namespace textutil {

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);
std::vector<std::string> split(const std::string& s, char sep);

bool starts_with(const std::string& s, const std::string& prefix);

// Shortest decimal form for CSS values: 28 -> "28", 1.15 -> "1.15".
std::string format_number(double v);

// UTC, millisecond precision: 2024-01-31T12:00:00.000Z
std::string iso8601_now();
long long epoch_millis();

}
