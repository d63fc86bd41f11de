// =============================================================================
// Classifier Tests
// =============================================================================

#include <gtest/gtest.h>
#include "../include/cleanup_history/Classifier.h"
#include "../include/cleanup_history/HistoryError.h"

#include <string>

class ClassifierTest : public ::testing::Test {
protected:
    Classifier classifier; // Built-in rules
};

TEST_F(ClassifierTest, KeepsOrdinaryCommands) {
    EXPECT_TRUE(classifier.isRetained("echo foo"));
    EXPECT_TRUE(classifier.isRetained("git status"));
    EXPECT_TRUE(classifier.isRetained("cd /etc"));
    EXPECT_TRUE(classifier.isRetained("cd ~/src"));
    EXPECT_TRUE(classifier.isRetained("ls /var/log"));
    EXPECT_TRUE(classifier.isRetained("ls ~"));
}

TEST_F(ClassifierTest, DropsShortCommands) {
    EXPECT_FALSE(classifier.isRetained("l"));
    EXPECT_FALSE(classifier.isRetained("cd"));
    EXPECT_FALSE(classifier.isRetained("top"));
    EXPECT_TRUE(classifier.isRetained("htop"));
}

// Length is counted in characters, not bytes
TEST_F(ClassifierTest, DropsShortMultibyteCommands) {
    EXPECT_FALSE(classifier.isRetained("\xC3\xA4\xC3\xB6\xC3\xBC"));   // "äöü", 6 bytes
    EXPECT_FALSE(classifier.isRetained("\xF0\x9F\x9A\x80"));             // one emoji, 4 bytes
    EXPECT_FALSE(classifier.isRetained("\xE6\x97\xA5\xE6\x9C\xAC")); // two CJK characters
    EXPECT_TRUE(classifier.isRetained("\xC3\xA4\xC3\xB6\xC3\xBC\xC3\x9F")); // four characters
    EXPECT_TRUE(classifier.isShort("\xC3\xA4"));
    EXPECT_FALSE(classifier.isShort(""));
}

TEST_F(ClassifierTest, DropsRelativeCdAndLs) {
    EXPECT_FALSE(classifier.isRetained("cd ./baz"));
    EXPECT_FALSE(classifier.isRetained("cd ../foo"));
    EXPECT_FALSE(classifier.isRetained("ls foo"));
    EXPECT_FALSE(classifier.isRetained("ls -la"));
}

TEST_F(ClassifierTest, DropsPowerCommands) {
    EXPECT_FALSE(classifier.isRetained("reboot"));
    EXPECT_FALSE(classifier.isRetained("sudo reboot"));
    EXPECT_FALSE(classifier.isRetained("shutdown -h now"));
    EXPECT_FALSE(classifier.isRetained("sudo shutdown -r now"));
    EXPECT_FALSE(classifier.isRetained("halt"));
    EXPECT_FALSE(classifier.isRetained("sudo halt"));
    EXPECT_TRUE(classifier.isRetained("echo reboot"));
}

TEST_F(ClassifierTest, DropsEscapeArtifactsAndHiddenCommands) {
    EXPECT_FALSE(classifier.isRetained("0;12;34M"));
    EXPECT_FALSE(classifier.isRetained(" echo hidden"));
}

TEST_F(ClassifierTest, DropsSensitiveLookingCommands) {
    EXPECT_FALSE(classifier.isRetained("export GITHUB_TOKEN=abc"));
    EXPECT_FALSE(classifier.isRetained("curl -H 'X-Api-Key: 1234' example.com"));
    EXPECT_FALSE(classifier.isRetained("echo mysecret"));
    EXPECT_FALSE(classifier.isRetained("passwd"));
    EXPECT_FALSE(classifier.isRetained("ssh-keygen -t ed25519"));
}

TEST_F(ClassifierTest, MatchingIsCaseInsensitive) {
    EXPECT_FALSE(classifier.isRetained("export API_URL=x"));
    EXPECT_FALSE(classifier.isRetained("SUDO REBOOT"));
    EXPECT_FALSE(classifier.isRetained("CD foo"));
}

// Test exception override
TEST_F(ClassifierTest, ClipboardPassIsKept) {
    EXPECT_TRUE(classifier.matchesIgnore("pass -c email/work"));
    EXPECT_TRUE(classifier.matchesException("pass -c email/work"));
    EXPECT_TRUE(classifier.isRetained("pass -c email/work"));
    EXPECT_TRUE(classifier.isRetained("PASS -C email/work"));

    // Only the clipboard form is exempt
    EXPECT_FALSE(classifier.isRetained("pass show email/work"));
    EXPECT_FALSE(classifier.isRetained("echo pass -c x"));
}

TEST_F(ClassifierTest, DefaultRuleSetContents) {
    RuleSet rules = RuleSet::defaults();
    EXPECT_EQ(rules.maxShortLength, 3u);
    EXPECT_EQ(rules.ignorePatterns.size(), 6u);
    ASSERT_EQ(rules.exceptionPatterns.size(), 1u);
    EXPECT_EQ(rules.exceptionPatterns[0], "^pass -c");
}

TEST(ClassifierCustomRulesTest, UsesInjectedRules) {
    RuleSet rules;
    rules.ignorePatterns = {"^git "};
    rules.exceptionPatterns = {"^git log"};
    Classifier custom(rules);

    EXPECT_FALSE(custom.isRetained("git push"));
    EXPECT_TRUE(custom.isRetained("git log --oneline"));
    EXPECT_TRUE(custom.isRetained("cd"));          // Not in this rule set
    EXPECT_TRUE(custom.isRetained("export TOKEN=1"));
}

TEST(ClassifierCustomRulesTest, EmptyRuleSetKeepsEverything) {
    Classifier permissive(RuleSet{});
    EXPECT_TRUE(permissive.isRetained("ls"));
    EXPECT_TRUE(permissive.isRetained("secret"));
}

TEST(ClassifierCustomRulesTest, BadPatternIsFatal) {
    RuleSet rules;
    rules.ignorePatterns = {"^ok", "(unclosed"};
    try {
        Classifier broken(rules);
        FAIL() << "expected HistoryError";
    } catch (const HistoryError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::RULE_COMPILATION_FAILURE);
        EXPECT_EQ(e.context(), "(unclosed");
        EXPECT_TRUE(e.isFatal());
    }
}
