#ifndef NLBD_PARSE_RULES_HPP
#define NLBD_PARSE_RULES_HPP

// Ordered rule table used by the command parser. The first rule whose
// pattern matches the whole clause (case-insensitive) builds the result.

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "parser/command_parser.hpp"

namespace parser {

using RuleBuilder = std::function<ParseResult(const std::smatch &match)>;

struct ParseRule {
    std::string name;
    std::string pattern_text;
    std::regex pattern;
    RuleBuilder build;
};

// Rules in priority order. Built once; patterns that fail to compile are
// logged and left out.
const std::vector<ParseRule> &get_parse_rules();

// Trim whitespace and strip one pair of matching surrounding quotes.
std::string clean_argument(const std::string &raw_argument);

// Saturating decimal parse of a digit string (values above maximum clamp to it).
int parse_bounded_int(const std::string &digits, int maximum);

// "5" + "seconds" -> 5000. Empty when the unit is not recognized.
std::optional<int> parse_duration_milliseconds(const std::string &amount, const std::string &unit);

} // namespace parser

#endif // NLBD_PARSE_RULES_HPP
