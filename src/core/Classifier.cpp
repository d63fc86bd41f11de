#include "../../include/cleanup_history/Classifier.h"
#include "../../include/cleanup_history/HistoryError.h"
#include "../../include/cleanup_history/Utils.h"

#include <regex>
#include <string>
#include <vector>

RuleSet RuleSet::defaults() {
    RuleSet rules;
    // short things, counted in characters so "äöü" is as short as "abc"
    rules.maxShortLength = 3;
    rules.ignorePatterns = {
        // cd / ls with relative directories
        "^cd [^~/]",
        "^ls [^~/]",
        // annoying if accidentally re-executed at a later date
        "^(sudo )?(reboot|shutdown|halt)",
        // mouse escape codes
        "^0",
        // hidden by the user with a leading space
        "^ ",
        // sensitive looking lines
        "(api|token|key|secret|pass)",
    };
    rules.exceptionPatterns = {
        // password retrieval to clipboard
        "^pass -c",
    };
    return rules;
}

Classifier::Classifier(const RuleSet& rules)
    : rules_(rules),
      ignores_(compile(rules.ignorePatterns)),
      exceptions_(compile(rules.exceptionPatterns)) {}

std::vector<std::regex> Classifier::compile(const std::vector<std::string>& patterns) {
    std::vector<std::regex> compiled;
    compiled.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        try {
            compiled.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
        } catch (const std::regex_error&) {
            throw HistoryError(ErrorKind::RULE_COMPILATION_FAILURE, pattern);
        }
    }
    return compiled;
}

bool Classifier::searchAny(const std::vector<std::regex>& regexes, const std::string& command) {
    for (const auto& regex : regexes) {
        if (std::regex_search(command, regex)) {
            return true;
        }
    }
    return false;
}

bool Classifier::matchesException(const std::string& command) const {
    return searchAny(exceptions_, command);
}

bool Classifier::isShort(const std::string& command) const {
    size_t length = utf8Length(command);
    return length >= 1 && length <= rules_.maxShortLength;
}

bool Classifier::matchesIgnore(const std::string& command) const {
    return isShort(command) || searchAny(ignores_, command);
}

bool Classifier::isRetained(const std::string& command) const {
    if (matchesException(command)) {
        return true;
    }
    return !matchesIgnore(command);
}
