#ifndef MAXIFY_UTIL_HPP
#define MAXIFY_UTIL_HPP

#include <string>
#include <utility>
#include <vector>

namespace maxify {

// Case-insensitive glob match: '*', '?' and '[...]' classes.
// An empty pattern matches everything.
bool glob_match(const std::string& pattern, const std::string& text);

// Natural ordering: digit runs compare by numeric value, the rest
// case-insensitively ("Task 2" < "Task 10").
bool natural_less(const std::string& a, const std::string& b);

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

// Random 32-character hex identifier for histogram entries
std::string generate_id();

} // namespace maxify

#endif // MAXIFY_UTIL_HPP
