// ==============================================================================
// test_classifier_gtest.cpp - Тесты классификатора безопасности (GoogleTest)
// ==============================================================================
//
// TST-SAFETY-001..TST-SAFETY-003
//
// ==============================================================================

#include "terse/classifier.hpp"
#include "terse/command.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>

namespace terse::safety::test {

namespace {

Classification classify(const std::string& cmd, const Classifier& c = Classifier{}) {
    return c.classify(command::normalize(cmd));
}

}  // namespace

// ==============================================================================
// TST-SAFETY-001: Порядок проверок
// ==============================================================================

TEST(ClassifierTest, Classify_ReadOnlyCommand_Optimizable) {
    EXPECT_TRUE(classify("git status").optimizable);
    EXPECT_TRUE(classify("cd repo && cargo test 2>&1").optimizable);
}

TEST(ClassifierTest, Classify_SelfInvocation_LoopGuard) {
    auto c = classify("terse run \"git status\"");
    EXPECT_FALSE(c.optimizable);
    EXPECT_EQ(c.reason, NeverReason::LoopGuard);
}

TEST(ClassifierTest, Classify_LoopGuardWinsOverDenyList) {
    auto c = classify("rm -rf x && terse run ls");
    EXPECT_EQ(c.reason, NeverReason::LoopGuard);
}

TEST(ClassifierTest, Classify_Destructive_DenyListed) {
    auto c = classify("rm -rf build");
    EXPECT_FALSE(c.optimizable);
    EXPECT_EQ(c.reason, NeverReason::DenyListed);
    EXPECT_EQ(c.detail, "rm");
}

TEST(ClassifierTest, Classify_EditorBehindPathAndSudo_DenyListed) {
    EXPECT_EQ(classify("/usr/bin/vim notes.txt").reason, NeverReason::DenyListed);
    EXPECT_EQ(classify("sudo -E nano /etc/hosts").reason, NeverReason::DenyListed);
    EXPECT_EQ(classify("cd src && Remove-Item -Recurse bin").reason, NeverReason::DenyListed);
}

TEST(ClassifierTest, Classify_Heredoc_BeforeRedirection) {
    auto c = classify("cat <<EOF > out.txt\nhi\nEOF");
    EXPECT_FALSE(c.optimizable);
    EXPECT_EQ(c.reason, NeverReason::Heredoc);
}

TEST(ClassifierTest, Classify_Redirection) {
    auto c = classify("git log > history.txt");
    EXPECT_FALSE(c.optimizable);
    EXPECT_EQ(c.reason, NeverReason::Redirection);
}

// ==============================================================================
// TST-SAFETY-002: Дополнительный deny-list
// ==============================================================================

TEST(ClassifierTest, ExtraDeny_MatchedCaseInsensitive) {
    Classifier c({" Kubectl ", ""});
    EXPECT_TRUE(c.is_denied("kubectl"));
    EXPECT_TRUE(c.is_denied("KUBECTL"));
    EXPECT_EQ(classify("kubectl delete pod web", c).reason, NeverReason::DenyListed);
    EXPECT_TRUE(classify("kubectl delete pod web").optimizable);
}

TEST(ClassifierTest, BuiltinDenyList_ContainsEditorsAndRemoval) {
    const auto& list = builtin_deny_list();
    EXPECT_NE(std::find(list.begin(), list.end(), "rm"), list.end());
    EXPECT_NE(std::find(list.begin(), list.end(), "vim"), list.end());
    EXPECT_EQ(std::find(list.begin(), list.end(), "git"), list.end());
}

// ==============================================================================
// TST-SAFETY-003: program_name и строки причин
// ==============================================================================

TEST(ClassifierTest, ProgramName_StripsPathExeAndPrefixes) {
    EXPECT_EQ(program_name("C:\\Tools\\RM.exe -f x"), "rm");
    EXPECT_EQ(program_name("sudo nice ls"), "ls");
    EXPECT_EQ(program_name("sudo -E vim a"), "vim");
    EXPECT_EQ(program_name("sudo"), "sudo");
    EXPECT_EQ(program_name(""), "");
}

TEST(ClassifierTest, ReasonStrings) {
    EXPECT_EQ(to_string(NeverReason::LoopGuard), "terse invocation (loop guard)");
    EXPECT_EQ(to_string(NeverReason::DenyListed), "destructive or editor command");
    EXPECT_EQ(to_string(NeverReason::Redirection), "output redirection");
    EXPECT_EQ(to_string(NeverReason::Heredoc), "contains heredoc");
}

}  // namespace terse::safety::test
