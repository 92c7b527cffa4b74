#include "parser/command_parser.hpp"
#include "parser/parse_rules.hpp"
#include "utils/debug_log.hpp"

#include <cctype>
#include <climits>
#include <cstring>
#include <regex>
#include <strings.h>

namespace parser {

const char *parse_error_kind_name(ParseErrorKind kind) {
    switch (kind) {
    case ParseErrorKind::None: return "none";
    case ParseErrorKind::Empty: return "empty";
    case ParseErrorKind::TooLong: return "too_long";
    case ParseErrorKind::NoMatch: return "no_match";
    case ParseErrorKind::MissingArgument: return "missing_argument";
    }
    return "unknown";
}

static bool is_space(char character) {
    return std::isspace(static_cast<unsigned char>(character)) != 0;
}

static std::string trim(const std::string &text) {
    size_t first = 0;
    size_t last = text.size();
    while (first < last && is_space(text[first])) {
        ++first;
    }
    while (last > first && is_space(text[last - 1])) {
        --last;
    }
    return text.substr(first, last - first);
}

// Drop politeness and trailing sentence punctuation: "Please take a screenshot." -> "take a screenshot".
static std::string normalize_clause(const std::string &clause) {
    static const std::regex polite_prefix(
        R"RX(^(?:please\s+|(?:can|could|would)\s+you\s+(?:please\s+)?|now\s+|and\s+|then\s+)+)RX",
        std::regex::ECMAScript | std::regex::icase);
    static const std::regex polite_suffix(R"RX(\s+please$)RX", std::regex::ECMAScript | std::regex::icase);

    std::string normalized = trim(clause);
    while (!normalized.empty() &&
           (normalized.back() == '.' || normalized.back() == '!' || normalized.back() == '?')) {
        normalized.pop_back();
    }
    normalized = std::regex_replace(normalized, polite_prefix, "");
    normalized = std::regex_replace(normalized, polite_suffix, "");
    return trim(normalized);
}

// Case-insensitive whole word at position, followed by whitespace.
static bool connector_word_at(const std::string &text, size_t position, const char *word) {
    size_t word_length = std::strlen(word);
    if (position + word_length >= text.size()) {
        return false;
    }
    return strncasecmp(text.c_str() + position, word, word_length) == 0 &&
           is_space(text[position + word_length]);
}

std::vector<std::string> split_clauses(const std::string &text) {
    std::vector<std::string> clauses;
    std::string current;
    char open_quote = 0;
    int bracket_depth = 0;

    auto flush = [&]() {
        std::string clause = trim(current);
        if (!clause.empty()) {
            clauses.push_back(clause);
        }
        current.clear();
    };

    size_t index = 0;
    while (index < text.size()) {
        char character = text[index];

        if (open_quote != 0) {
            current += character;
            if (character == '\\' && index + 1 < text.size()) {
                current += text[index + 1];
                index += 2;
                continue;
            }
            if (character == open_quote) {
                open_quote = 0;
            }
            ++index;
            continue;
        }

        // An apostrophe inside a word ("what's") is not a quote.
        bool opens_quote = character == '"' || character == '`' ||
            (character == '\'' && (current.empty() || is_space(current.back()) ||
                                   current.back() == '(' || current.back() == '[' ||
                                   current.back() == '='));
        if (opens_quote) {
            open_quote = character;
            current += character;
            ++index;
            continue;
        }

        if (character == '(' || character == '[' || character == '{') {
            ++bracket_depth;
        } else if ((character == ')' || character == ']' || character == '}') && bracket_depth > 0) {
            --bracket_depth;
        }

        // "a, b" separates clauses; "data:text/html,<p>" does not.
        bool separating_comma = character == ',' && (index + 1 == text.size() || is_space(text[index + 1]));
        if (bracket_depth == 0 && (character == ';' || separating_comma)) {
            flush();
            ++index;
            continue;
        }

        if (bracket_depth == 0 && is_space(character)) {
            size_t word_start = index;
            while (word_start < text.size() && is_space(text[word_start])) {
                ++word_start;
            }
            size_t connector_end = 0;
            if (connector_word_at(text, word_start, "and")) {
                connector_end = word_start + 3;
                size_t next_word = connector_end;
                while (next_word < text.size() && is_space(text[next_word])) {
                    ++next_word;
                }
                if (connector_word_at(text, next_word, "then")) {
                    connector_end = next_word + 4;
                }
            } else if (connector_word_at(text, word_start, "then")) {
                connector_end = word_start + 4;
            }
            if (connector_end != 0) {
                flush();
                index = connector_end;
                continue;
            }
        }

        current += character;
        ++index;
    }
    flush();
    return clauses;
}

static ParseResult match_rules(const std::string &clause) {
    for (const auto &rule : get_parse_rules()) {
        std::smatch match;
        if (std::regex_match(clause, match, rule.pattern)) {
            debug_log::log("parse: clause \"" + clause + "\" matched rule " + rule.name);
            return rule.build(match);
        }
    }
    ParseResult result;
    result.error_kind = ParseErrorKind::NoMatch;
    result.error_detail = "unrecognized instruction: \"" + clause + "\"";
    return result;
}

ParseResult parse_clause(const std::string &clause) {
    static const std::regex tab_suffix(
        R"RX(^([\s\S]*\S)\s+(?:in|on)\s+(?:the\s+)?tab\s+(?:#|number\s+)?(\d+)$)RX",
        std::regex::ECMAScript | std::regex::icase);

    std::string normalized = normalize_clause(clause);
    if (normalized.empty()) {
        ParseResult result;
        result.error_kind = ParseErrorKind::Empty;
        result.error_detail = "empty instruction";
        return result;
    }

    std::smatch suffix_match;
    if (std::regex_match(normalized, suffix_match, tab_suffix)) {
        ParseResult remainder_result = match_rules(suffix_match[1].str());
        bool all_page_actions = remainder_result.success;
        for (const auto &action : remainder_result.actions) {
            all_page_actions = all_page_actions && verb_requires_tab(action.verb);
        }
        if (all_page_actions) {
            int position = parse_bounded_int(suffix_match[2].str(), INT_MAX);
            for (auto &action : remainder_result.actions) {
                action.tab_position = position;
            }
            return remainder_result;
        }
    }

    return match_rules(normalized);
}

ParseResult parse(const std::string &text) {
    ParseResult result;

    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        result.error_kind = ParseErrorKind::Empty;
        result.error_detail = "empty instruction";
        return result;
    }
    if (text.size() > kMaxInstructionBytes) {
        result.error_kind = ParseErrorKind::TooLong;
        result.error_detail = "instruction too long (" + std::to_string(text.size()) +
                              " bytes, limit " + std::to_string(kMaxInstructionBytes) + ")";
        return result;
    }

    try {
        std::vector<std::string> clauses = split_clauses(trimmed);

        if (clauses.size() >= 2) {
            ParseResult compound;
            compound.success = true;
            for (const auto &clause : clauses) {
                ParseResult clause_result = parse_clause(clause);
                if (!clause_result.success) {
                    compound.success = false;
                    break;
                }
                compound.actions.insert(compound.actions.end(), clause_result.actions.begin(),
                                        clause_result.actions.end());
            }
            if (compound.success) {
                return compound;
            }
        }

        // Not a compound (or one clause did not parse): the whole text is one clause,
        // so "fill #q with salt and pepper" keeps its "and".
        const std::string &whole = clauses.size() == 1 ? clauses.front() : trimmed;
        result = parse_clause(whole);
        if (!result.success && result.error_kind == ParseErrorKind::NoMatch) {
            result.error_detail = "unrecognized instruction: \"" + trimmed + "\"";
        }
        return result;
    } catch (const std::regex_error &regex_error) {
        result = ParseResult();
        result.error_kind = ParseErrorKind::NoMatch;
        result.error_detail = std::string("parser error: ") + regex_error.what();
        return result;
    } catch (const std::length_error &length_error) {
        result = ParseResult();
        result.error_kind = ParseErrorKind::TooLong;
        result.error_detail = std::string("instruction too long: ") + length_error.what();
        return result;
    }
}

} // namespace parser
