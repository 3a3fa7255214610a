#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace tramp {
namespace util {

bool is_operator_token(std::string_view token) {
    return token.size() == 1 && is_arith_operator(token[0]);
}

bool is_whole_number(std::string_view expr) {
    if (expr.empty()) return false;
    for (size_t k = 0; k < expr.size(); ++k) {
        if (expr[k] < '0' || expr[k] > '9') return false;
    }
    return true;
}

bool parse_int(std::string_view expr, int64_t& out) {
    // from_chars takes '-' but not '+'
    std::string_view digits = expr;
    if (digits.size() && digits[0] == '+') {
        expr.remove_prefix(1);
        digits.remove_prefix(1);
    } else if (digits.size() && digits[0] == '-') {
        digits.remove_prefix(1);
    }
    if (!is_whole_number(digits)) return false;
    int64_t val;
    auto res = std::from_chars(expr.data(), expr.data() + expr.size(), val);
    if (res.ec != std::errc() || res.ptr != expr.data() + expr.size())
        return false;
    out = val;
    return true;
}

void ltrim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
                return !::std::isspace(ch);
            }));
}

void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(),
                         [](unsigned char ch) { return !::std::isspace(ch); })
                .base(),
            s.end());
}

void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

std::string get_word(std::string& str_to_parse) {
    size_t i = 0;
    for (; i < str_to_parse.size(); ++i)
        if (!std::isspace(static_cast<unsigned char>(str_to_parse[i]))) break;
    size_t start = i;
    for (; i < str_to_parse.size(); ++i)
        if (std::isspace(static_cast<unsigned char>(str_to_parse[i]))) break;
    std::string word = str_to_parse.substr(start, i - start);
    str_to_parse = str_to_parse.substr(i);
    return word;
}

std::vector<std::string> split_words(std::string str) {
    std::vector<std::string> words;
    rtrim(str);
    while (str.size()) {
        words.push_back(get_word(str));
    }
    return words;
}

}  // namespace util
}  // namespace tramp
