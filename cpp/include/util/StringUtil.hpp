#pragma once

/*
 * Various string utilities
 */
#include <cstdint>
#include <string>
#include <vector>

namespace util {

/*
 * Raises util::CleanException if s is not a non-negative base-10 integer that fits in 64 bits.
 */
uint64_t atou64_safe(const std::string& s);

/*
 * split(s) and split(s, t) behave just like s.split() and s.split(t), respectively, in python.
 */
std::vector<std::string> split(const std::string& s, const char* t = "");

// Similar to split(s, t), with some notable differences:
//
// - Writes the tokens to result instead of returning a new vector.
// - If the passed-in result is longer than the number of tokens, the excess entries in result are
//   left unchanged.
// - Returns the number of tokens found, which may be less than the size of result.
int split(std::vector<std::string>& result, const std::string& s, const char* t = "");

/*
 * Splits s on commas and whitespace, and parses each token with atou64_safe(). Empty tokens are
 * skipped, so "1,2, 3" and "1 2 3" both yield {1, 2, 3}.
 */
std::vector<uint64_t> parse_uint64_list(const std::string& s);

}  // namespace util

#include "inline/util/StringUtil.inl"
