#pragma once
#ifndef _UTIL_H_29D3A5E0_624A_49C3_9649_D10647FEA50C
#define _UTIL_H_29D3A5E0_624A_49C3_9649_D10647FEA50C
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
namespace tramp {
namespace util {

// true if is arithmetic operator character understood by the calculator
constexpr bool is_arith_operator(char c) {
    return c == '+' || c == '-' || c == '*' || c == '/';
}

// checks if string is a single arithmetic operator
bool is_operator_token(std::string_view token);

// checks if string is a nonnegative integer (only 0-9)
bool is_whole_number(std::string_view expr);

// parse a (optionally signed) decimal 64-bit integer; the whole string must
// be consumed. Returns false if not an integer or out of range
bool parse_int(std::string_view expr, int64_t& out);

// string trimming/strip
void ltrim(std::string &s);
void rtrim(std::string &s);
void trim(std::string &s);

// Remove and return the first whitespace-delimited word of str_to_parse
// (leading whitespace included in what is removed)
std::string get_word(std::string& str_to_parse);

// Split into whitespace-delimited words
std::vector<std::string> split_words(std::string str);

}  // namespace util
}  // namespace tramp
#endif // ifndef _UTIL_H_29D3A5E0_624A_49C3_9649_D10647FEA50C
