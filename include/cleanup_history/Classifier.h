#ifndef CLASSIFIER_H
#define CLASSIFIER_H

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

// Immutable pattern lists the Classifier is built from.
struct RuleSet {
    std::vector<std::string> ignorePatterns;    // Drop commands matching any of these...
    std::vector<std::string> exceptionPatterns; // ...unless they also match one of these
    size_t maxShortLength = 0;                  // Drop commands of 1..N UTF-8 characters (0 = off)

    // The built-in rules used by the command line tool.
    static RuleSet defaults();
};

// Decides whether a normalized command is kept in the cleaned history.
// Patterns are ECMAScript, case-insensitive and searched anywhere in the
// command (anchor with '^' / '$' as needed).
class Classifier {
public:
    // Compiles every pattern. Throws HistoryError (RULE_COMPILATION_FAILURE)
    // naming the first pattern that does not compile.
    explicit Classifier(const RuleSet& rules = RuleSet::defaults());

    // Exceptions win over ignores; commands matching neither are kept.
    bool isRetained(const std::string& command) const;

    bool matchesException(const std::string& command) const;
    bool matchesIgnore(const std::string& command) const;

    // Character (not byte) length check for the short command rule.
    bool isShort(const std::string& command) const;

    const RuleSet& rules() const { return rules_; }

private:
    static std::vector<std::regex> compile(const std::vector<std::string>& patterns);
    static bool searchAny(const std::vector<std::regex>& regexes, const std::string& command);

    RuleSet rules_;
    std::vector<std::regex> ignores_;
    std::vector<std::regex> exceptions_;
};

#endif // CLASSIFIER_H
