#ifndef NLBD_COMMAND_PARSER_HPP
#define NLBD_COMMAND_PARSER_HPP

// Natural-language instruction parser.
// parse() is a pure function: the same text always yields the same actions or
// the same error, and nothing escapes it as an exception.

#include <cstddef>
#include <string>
#include <vector>

#include "parser/action.hpp"

namespace parser {

enum class ParseErrorKind {
    None,
    Empty,
    TooLong,
    NoMatch,
    MissingArgument
};

const char *parse_error_kind_name(ParseErrorKind kind);

struct ParseResult {
    bool success = false;
    std::vector<Action> actions;
    ParseErrorKind error_kind = ParseErrorKind::None;
    std::string error_detail;
};

static constexpr size_t kMaxInstructionBytes = 8192;

// Parse a whole instruction. Compound instructions ("open a new tab and go to
// example.com") produce several actions in order.
ParseResult parse(const std::string &text);

// Parse a single clause against the rule table, honouring a trailing
// "in tab N" / "on tab N".
ParseResult parse_clause(const std::string &clause);

// Split at "and then", "then", "and", ";" and "," outside quotes and
// brackets. Empty clauses are dropped.
std::vector<std::string> split_clauses(const std::string &text);

} // namespace parser

#endif // NLBD_COMMAND_PARSER_HPP
