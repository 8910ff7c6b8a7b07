#pragma once

#include <string>
#include <vector>

namespace sitenav::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep matching deterministic.
std::string to_lower(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);
/// Splits on ASCII whitespace, ignoring repeated separators.
std::vector<std::string> split_ws(const std::string& s);
/// Performs an ASCII case-insensitive substring match; an empty needle always matches.
bool contains_ci(const std::string& haystack, const std::string& needle);
/// Collapses whitespace runs to one space and trims the result.
std::string compact_whitespace(const std::string& s);

}  // namespace sitenav::util
