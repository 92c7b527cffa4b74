#include "parser/parse_rules.hpp"
#include "utils/debug_log.hpp"

#include <cctype>
#include <climits>
#include <initializer_list>

namespace parser {

static const char kSearchFieldSelector[] = "input[name=\"q\"]";
static const char kSearchSubmitSelector[] = "input[type=\"submit\"]";
static const int kMaxWaitMilliseconds = 3600000;

std::string clean_argument(const std::string &raw_argument) {
    size_t first = 0;
    size_t last = raw_argument.size();
    while (first < last && std::isspace(static_cast<unsigned char>(raw_argument[first]))) {
        ++first;
    }
    while (last > first && std::isspace(static_cast<unsigned char>(raw_argument[last - 1]))) {
        --last;
    }
    std::string argument = raw_argument.substr(first, last - first);
    if (argument.size() >= 2) {
        char opening = argument.front();
        char closing = argument.back();
        bool paired = (opening == '"' && closing == '"') || (opening == '\'' && closing == '\'') ||
                      (opening == '`' && closing == '`') || (opening == '<' && closing == '>');
        // 'a' + 'b' is code, not one quoted argument.
        std::string inner = argument.substr(1, argument.size() - 2);
        if (paired && inner.find(closing) == std::string::npos) {
            argument = inner;
        }
    }
    return argument;
}

int parse_bounded_int(const std::string &digits, int maximum) {
    long long value = 0;
    for (char digit : digits) {
        if (!std::isdigit(static_cast<unsigned char>(digit))) {
            break;
        }
        value = value * 10 + (digit - '0');
        if (value >= maximum) {
            return maximum;
        }
    }
    return static_cast<int>(value);
}

std::optional<int> parse_duration_milliseconds(const std::string &amount, const std::string &unit) {
    std::string lowered;
    for (char character : unit) {
        lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
    }
    int value = parse_bounded_int(amount, kMaxWaitMilliseconds);
    if (lowered == "ms" || lowered == "millisecond" || lowered == "milliseconds") {
        return value;
    }
    if (lowered == "s" || lowered == "sec" || lowered == "secs" || lowered == "second" ||
        lowered == "seconds") {
        return value >= kMaxWaitMilliseconds / 1000 ? kMaxWaitMilliseconds : value * 1000;
    }
    return std::nullopt;
}

// Text of capture group index, empty when the group did not participate.
static std::string group_text(const std::smatch &match, size_t index) {
    if (index >= match.size() || !match[index].matched) {
        return "";
    }
    return match[index].str();
}

// First participating group among indices (for alternations).
static std::string first_group(const std::smatch &match, std::initializer_list<size_t> indices) {
    for (size_t index : indices) {
        if (index < match.size() && match[index].matched) {
            return match[index].str();
        }
    }
    return "";
}

static ParseResult single_action(const Action &action) {
    ParseResult result;
    result.success = true;
    result.actions.push_back(action);
    return result;
}

static ParseResult missing_argument(const std::string &piece, Verb verb) {
    ParseResult result;
    result.error_kind = ParseErrorKind::MissingArgument;
    result.error_detail = "missing " + piece + " for " + verb_name(verb);
    return result;
}

static Action make_action(Verb verb) {
    Action action;
    action.verb = verb;
    return action;
}

static ParseResult build_screenshot(const std::string &full_page_words, const std::string &file_name) {
    Action action = make_action(Verb::Screenshot);
    action.full_page = !full_page_words.empty();
    std::string cleaned_file_name = clean_argument(file_name);
    if (!cleaned_file_name.empty()) {
        action.target = cleaned_file_name;
    }
    return single_action(action);
}

static ParseResult build_fill(const std::string &selector, const std::string &text) {
    std::string cleaned_selector = clean_argument(selector);
    if (cleaned_selector.empty()) {
        return missing_argument("field", Verb::Fill);
    }
    Action action = make_action(Verb::Fill);
    action.target = cleaned_selector;
    action.payload = clean_argument(text);
    return single_action(action);
}

static ParseResult build_navigate(const std::string &url) {
    std::string cleaned_url = clean_argument(url);
    if (cleaned_url.empty()) {
        return missing_argument("url", Verb::Navigate);
    }
    Action action = make_action(Verb::Navigate);
    action.target = cleaned_url;
    return single_action(action);
}

static void add_rule(std::vector<ParseRule> &rules, const std::string &name,
                     const std::string &pattern_text, RuleBuilder build) {
    ParseRule rule;
    rule.name = name;
    rule.pattern_text = pattern_text;
    try {
        rule.pattern = std::regex("^(?:" + pattern_text + ")$",
                                  std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error &regex_error) {
        debug_log::warn("Invalid pattern for rule " + name + ": " + regex_error.what());
        return;
    }
    rule.build = std::move(build);
    rules.push_back(std::move(rule));
}

static std::vector<ParseRule> build_parse_rules() {
    std::vector<ParseRule> rules;

    // --- session control ---

    add_rule(rules, "close_browser",
             R"RX((?:close|quit|exit|stop|kill|shut\s+down)(?:\s+the)?\s+(?:browser|daemon|session)|quit|exit|stop|shutdown|shut\s+down)RX",
             [](const std::smatch &) { return single_action(make_action(Verb::CloseBrowser)); });

    add_rule(rules, "list_tabs",
             R"RX((?:list|show|display|get)(?:\s+(?:me|all|the|my))*\s+(?:open\s+)?tabs|tabs|what\s+tabs\s+are\s+open)RX",
             [](const std::smatch &) { return single_action(make_action(Verb::ListTabs)); });

    add_rule(rules, "current_tab",
             R"RX((?:show\s+|get\s+)?(?:me\s+)?(?:the\s+)?(?:current|active)\s+tab|(?:which|what)\s+tab(?:\s+am\s+i\s+on|\s+is\s+(?:active|current|open))?)RX",
             [](const std::smatch &) { return single_action(make_action(Verb::CurrentTab)); });

    add_rule(rules, "switch_tab",
             R"RX((?:switch|go|change|jump|move)\s+(?:back\s+)?to\s+(?:the\s+)?tab\s+(?:#|number\s+)?(\d+)|(?:select|activate|focus|switch)\s+tab\s+(?:#|number\s+)?(\d+))RX",
             [](const std::smatch &match) {
                 Action action = make_action(Verb::SwitchTab);
                 action.tab_position = parse_bounded_int(first_group(match, {1, 2}), INT_MAX);
                 return single_action(action);
             });

    add_rule(rules, "switch_tab_missing_number",
             R"RX((?:switch|change|jump)\s+(?:to\s+)?(?:a\s+|the\s+|another\s+)?(?:tab|tabs)|(?:select|activate|focus)\s+(?:a\s+|the\s+)?tab)RX",
             [](const std::smatch &) { return missing_argument("tab number", Verb::SwitchTab); });

    add_rule(rules, "close_tab_at",
             R"RX(close\s+(?:the\s+)?tab\s+(?:#|number\s+)?(\d+))RX",
             [](const std::smatch &match) {
                 Action action = make_action(Verb::CloseTab);
                 action.tab_position = parse_bounded_int(group_text(match, 1), INT_MAX);
                 return single_action(action);
             });

    add_rule(rules, "close_tab",
             R"RX(close\s+(?:the\s+|this\s+)?(?:current\s+|active\s+)?tab)RX",
             [](const std::smatch &) { return single_action(make_action(Verb::CloseTab)); });

    add_rule(rules, "open_tab_with_url",
             R"RX((?:open|create)\s+(?:up\s+)?(?:a\s+)?(?:new\s+)?tab\s+(?:with|at|to|on|for)\s+(\S+)|new\s+tab\s+(?:with\s+|at\s+|for\s+)?(\S+)|open\s+(\S+)\s+in\s+(?:a\s+)?new\s+tab)RX",
             [](const std::smatch &match) {
                 Action action = make_action(Verb::OpenTab);
                 std::string url = clean_argument(first_group(match, {1, 2, 3}));
                 if (!url.empty()) {
                     action.target = url;
                 }
                 return single_action(action);
             });

    add_rule(rules, "open_tab",
             R"RX((?:open|create)\s+(?:up\s+)?(?:a\s+)?(?:new\s+)?tab|new\s+tab)RX",
             [](const std::smatch &) { return single_action(make_action(Verb::OpenTab)); });

    // --- page inspection ---

    add_rule(rules, "screenshot",
             R"RX((?:take|capture|grab|save|make)\s+(?:a\s+|the\s+)?((?:full|whole|entire)[\s-]*page\s+)?screenshot(?:\s+of\s+(?:the\s+)?(full|whole|entire)\s+page|\s+of\s+(?:the|this)\s+page)?(?:\s+(?:as|to|named|called|into|and\s+save\s+(?:it\s+)?(?:as|to))\s+(\S+))?)RX",
             [](const std::smatch &match) {
                 return build_screenshot(group_text(match, 1) + group_text(match, 2), group_text(match, 3));
             });

    add_rule(rules, "screenshot_short",
             R"RX(((?:full|whole|entire)[\s-]*page\s+)?screenshot(?:\s+(\S+))?)RX",
             [](const std::smatch &match) {
                 return build_screenshot(group_text(match, 1), group_text(match, 2));
             });

    add_rule(rules, "get_content",
             R"RX((?:get|read|show|extract|fetch|scrape|dump)\s+(?:me\s+)?(?:the\s+)?(?:page\s+|full\s+)?(?:content|contents|text)(?:\s+of\s+(?:the|this)\s+page)?|(?:get|read|show|extract|summarize)\s+(?:the\s+|this\s+)?page|what(?:'s|\s+is)\s+on\s+(?:the|this)\s+page|content)RX",
             [](const std::smatch &) { return single_action(make_action(Verb::GetContent)); });

    add_rule(rules, "get_text",
             R"RX((?:get|read|extract|show)\s+(?:me\s+)?(?:the\s+)?(?:inner\s+)?text\s+(?:of|from|in|inside)\s+(?:the\s+)?(.+)|text\s+(.+))RX",
             [](const std::smatch &match) {
                 std::string selector = clean_argument(first_group(match, {1, 2}));
                 if (selector.empty()) {
                     return missing_argument("selector", Verb::GetText);
                 }
                 Action action = make_action(Verb::GetText);
                 action.target = selector;
                 return single_action(action);
             });

    add_rule(rules, "get_text_missing_selector",
             R"RX((?:get|read|extract)\s+(?:the\s+)?text\s+(?:of|from|in|inside))RX",
             [](const std::smatch &) { return missing_argument("selector", Verb::GetText); });

    add_rule(rules, "get_title",
             R"RX((?:get|show|read|what(?:'s|\s+is))\s+(?:me\s+)?(?:the\s+)?(?:page\s+)?title(?:\s+of\s+(?:the|this)\s+page)?|title)RX",
             [](const std::smatch &) { return single_action(make_action(Verb::GetTitle)); });

    add_rule(rules, "wait_for",
             R"RX(wait\s+(?:for|until)\s+(?:the\s+)?(.+?)(?:\s+to\s+(?:appear|load|exist|be\s+visible|show\s+up|show))?(?:\s+(?:for|up\s+to|at\s+most|max)\s+(\d+)\s*(ms|milliseconds?|s|secs?|seconds?))?)RX",
             [](const std::smatch &match) {
                 std::string selector = clean_argument(group_text(match, 1));
                 static const std::regex bare_duration(R"RX(^\d+\s*(?:ms|milliseconds?|s|secs?|seconds?)$)RX",
                                                       std::regex::ECMAScript | std::regex::icase);
                 if (selector.empty() || std::regex_match(selector, bare_duration)) {
                     return missing_argument("selector", Verb::WaitFor);
                 }
                 Action action = make_action(Verb::WaitFor);
                 action.target = selector;
                 if (match[2].matched) {
                     action.timeout_ms = parse_duration_milliseconds(group_text(match, 2), group_text(match, 3));
                 }
                 return single_action(action);
             });

    add_rule(rules, "wait_for_missing_selector",
             R"RX(wait(?:\s+for|\s+until)?)RX",
             [](const std::smatch &) { return missing_argument("selector", Verb::WaitFor); });

    add_rule(rules, "execute_script",
             R"RX((?:run|execute|exec|eval|evaluate)\s+(?:the\s+)?(?:javascript|js|script|code)\s*:?\s+([\s\S]+)|js\s+([\s\S]+))RX",
             [](const std::smatch &match) {
                 std::string code = clean_argument(first_group(match, {1, 2}));
                 if (code.empty()) {
                     return missing_argument("code", Verb::ExecuteScript);
                 }
                 Action action = make_action(Verb::ExecuteScript);
                 action.payload = code;
                 return single_action(action);
             });

    add_rule(rules, "execute_script_missing_code",
             R"RX((?:run|execute|exec|eval|evaluate)\s+(?:the\s+|some\s+)?(?:javascript|js|script|code)\s*:?|js)RX",
             [](const std::smatch &) { return missing_argument("code", Verb::ExecuteScript); });

    // --- scrolling ---

    add_rule(rules, "scroll_to_edge",
             R"RX((?:scroll|go|jump)\s+(?:the\s+page\s+)?(?:back\s+)?(?:up\s+|down\s+)?to\s+(?:the\s+)?(top|bottom)(?:\s+of\s+(?:the\s+)?page)?|(top|bottom)\s+of\s+(?:the\s+)?page)RX",
             [](const std::smatch &match) {
                 Action action = make_action(Verb::Scroll);
                 std::string edge = first_group(match, {1, 2});
                 for (char &character : edge) {
                     character = static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
                 }
                 action.target = edge;
                 return single_action(action);
             });

    add_rule(rules, "scroll",
             R"RX(scroll(?:\s+the\s+page)?(?:\s+(up|down|left|right))?(?:\s+(?:by\s+)?(\d+)\s*(?:px|pixels?)?)?|page\s+(up|down))RX",
             [](const std::smatch &match) {
                 Action action = make_action(Verb::Scroll);
                 std::string direction = first_group(match, {1, 3});
                 for (char &character : direction) {
                     character = static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
                 }
                 action.target = direction.empty() ? "down" : direction;
                 if (match[2].matched) {
                     action.payload = std::to_string(parse_bounded_int(group_text(match, 2), 1000000));
                 }
                 return single_action(action);
             });

    // --- forms ---

    add_rule(rules, "search",
             R"RX((?:search\s+for|search|look\s+up|google)\s+([\s\S]+))RX",
             [](const std::smatch &match) {
                 std::string query = clean_argument(group_text(match, 1));
                 if (query.empty()) {
                     return missing_argument("text", Verb::Fill);
                 }
                 Action fill_action = make_action(Verb::Fill);
                 fill_action.target = kSearchFieldSelector;
                 fill_action.payload = query;
                 Action click_action = make_action(Verb::Click);
                 click_action.target = kSearchSubmitSelector;
                 ParseResult result;
                 result.success = true;
                 result.actions = {fill_action, click_action};
                 return result;
             });

    add_rule(rules, "search_missing_text",
             R"RX(search(?:\s+for)?|look\s+up)RX",
             [](const std::smatch &) { return missing_argument("text", Verb::Fill); });

    add_rule(rules, "fill_with",
             R"RX((?:fill(?:\s+in|\s+out)?|enter)\s+(?:the\s+)?(.+?)\s+with\s+([\s\S]+))RX",
             [](const std::smatch &match) { return build_fill(group_text(match, 1), group_text(match, 2)); });

    add_rule(rules, "set_field",
             R"RX(set\s+(?:the\s+)?(.+?)\s+to\s+([\s\S]+))RX",
             [](const std::smatch &match) { return build_fill(group_text(match, 1), group_text(match, 2)); });

    add_rule(rules, "type_quoted_into",
             R"RX((?:type|enter|input|write|put)\s+("[^"]*"|'[^']*')\s+(?:into|in)\s+(?:the\s+)?(.+))RX",
             [](const std::smatch &match) { return build_fill(group_text(match, 2), group_text(match, 1)); });

    add_rule(rules, "type_into",
             R"RX((?:type|enter|input|write|put)\s+([\s\S]+)\s+(?:into|in)\s+(?:the\s+)?(.+))RX",
             [](const std::smatch &match) { return build_fill(group_text(match, 2), group_text(match, 1)); });

    add_rule(rules, "fill_positional",
             R"RX(fill\s+(?!(?:in|out)\s)(\S+)\s+([\s\S]+))RX",
             [](const std::smatch &match) { return build_fill(group_text(match, 1), group_text(match, 2)); });

    add_rule(rules, "fill_missing_argument",
             R"RX((fill(?:\s+in|\s+out)?|type|enter|input|write)(?:\s+([\s\S]+))?)RX",
             [](const std::smatch &match) {
                 std::string keyword = group_text(match, 1);
                 bool names_field_first = std::tolower(static_cast<unsigned char>(keyword[0])) == 'f';
                 if (!match[2].matched) {
                     return missing_argument(names_field_first ? "field" : "text", Verb::Fill);
                 }
                 return missing_argument(names_field_first ? "text" : "field", Verb::Fill);
             });

    // --- clicking ---

    add_rule(rules, "click",
             R"RX((?:click|tap)(?:\s+on)?(?:\s+the)?\s+(.+?)(?:\s+(?:button|link))?)RX",
             [](const std::smatch &match) {
                 std::string selector = clean_argument(group_text(match, 1));
                 if (selector.empty()) {
                     return missing_argument("selector", Verb::Click);
                 }
                 Action action = make_action(Verb::Click);
                 action.target = selector;
                 return single_action(action);
             });

    add_rule(rules, "click_missing_selector",
             R"RX((?:click|tap)(?:\s+on)?)RX",
             [](const std::smatch &) { return missing_argument("selector", Verb::Click); });

    // --- navigation (catch-alls last) ---

    add_rule(rules, "navigate",
             R"RX((?:go\s+to|goto|navigate\s+to|navigate|open|visit|browse\s+to|browse|load|head\s+to)\s+(?:the\s+)?(?:url\s+|page\s+|website\s+|site\s+)?(\S+))RX",
             [](const std::smatch &match) { return build_navigate(group_text(match, 1)); });

    add_rule(rules, "navigate_bare_url",
             R"RX(((?:https?|file|about|data):\S+|www\.\S+|localhost(?::\d+)?(?:/\S*)?|[a-z0-9-]+(?:\.[a-z0-9-]+)*\.[a-z]{2,}(?::\d+)?(?:/\S*)?))RX",
             [](const std::smatch &match) { return build_navigate(group_text(match, 1)); });

    add_rule(rules, "navigate_missing_url",
             R"RX(go\s+to|goto|navigate(?:\s+to)?|visit|browse(?:\s+to)?|load|open|head\s+to)RX",
             [](const std::smatch &) { return missing_argument("url", Verb::Navigate); });

    return rules;
}

const std::vector<ParseRule> &get_parse_rules() {
    static const std::vector<ParseRule> rules = build_parse_rules();
    return rules;
}

} // namespace parser
