// ==============================================================================
// test_optimizer_gtest.cpp - Тесты оптимизаторов и реестра (GoogleTest)
// ==============================================================================
//
// TST-OPT-001..TST-OPT-006
//
// ==============================================================================

#include "terse/command.hpp"
#include "terse/optimizer.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace terse::optimizer::test {

namespace {

command::CommandContext ctx(const std::string& cmd) {
    return command::normalize(cmd);
}

std::string optimize(const Optimizer& opt, const std::string& cmd, const std::string& raw) {
    OptimizeResult r = opt.optimize(ctx(cmd), raw);
    EXPECT_TRUE(r.ok) << r.error;
    return r.output;
}

std::string pad(const std::string& s, size_t width) {
    std::string out = s;
    out.resize(width < s.size() ? s.size() : width, ' ');
    return out;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

// ==============================================================================
// TST-OPT-001: git
// ==============================================================================

TEST(GitOptimizerTest, Status_CdPrefix_SubstitutesPorcelain) {
    GitOptimizer git;
    auto c = ctx("cd /repo && git status");
    ASSERT_TRUE(git.can_handle(c));
    auto sub = git.substitute(c);
    ASSERT_TRUE(sub.has_value());
    EXPECT_EQ(*sub, "git status --porcelain -b");
}

TEST(GitOptimizerTest, Status_AlreadyShort_NotHandled) {
    GitOptimizer git;
    EXPECT_FALSE(git.can_handle(ctx("git status -s")));
    EXPECT_FALSE(git.can_handle(ctx("git status --porcelain")));
    EXPECT_FALSE(git.can_handle(ctx("git rebase -i HEAD~3")));
}

TEST(GitOptimizerTest, Status_Porcelain_GroupsFiles) {
    GitOptimizer git;
    const std::string raw =
        "## main...origin/main [ahead 1]\nM  src/a.rs\n M src/b.rs\n?? notes.txt\n"
        "UU conflict.rs\n";
    EXPECT_EQ(optimize(git, "git status", raw),
              "branch: main...origin/main [ahead 1]\nstaged (1): src/a.rs\n"
              "modified (1): src/b.rs\nuntracked (1): notes.txt\nconflicts: 1");
}

TEST(GitOptimizerTest, Status_Porcelain_Clean) {
    GitOptimizer git;
    EXPECT_EQ(optimize(git, "git status", "## main\n"), "branch: main\nclean");
}

TEST(GitOptimizerTest, Status_LongFormat_Condensed) {
    GitOptimizer git;
    const std::string raw =
        "On branch main\n"
        "Your branch is ahead of 'origin/main' by 2 commits.\n"
        "  (use \"git push\" to publish your local commits)\n"
        "\n"
        "Changes not staged for commit:\n"
        "  (use \"git add <file>...\" to update what will be committed)\n"
        "\tmodified:   src/main.cpp\n"
        "\n"
        "Untracked files:\n"
        "  (use \"git add <file>...\" to include in what will be committed)\n"
        "\tnew.txt\n";
    EXPECT_EQ(optimize(git, "git status", raw),
              "branch: main (ahead 2)\nmodified (1): src/main.cpp\nuntracked (1): new.txt");
}

TEST(GitOptimizerTest, Status_FatalError_KeptVerbatim) {
    GitOptimizer git;
    EXPECT_EQ(optimize(git, "git status", "fatal: not a git repository\n"),
              "fatal: not a git repository");
}

TEST(GitOptimizerTest, Log_SubstitutesOnlyMissingFlags) {
    GitOptimizer git;
    EXPECT_EQ(git.substitute(ctx("git log")).value_or(""), "git log --oneline -n 20");
    EXPECT_EQ(git.substitute(ctx("git log -5")).value_or(""), "git log --oneline -5");
    EXPECT_EQ(git.substitute(ctx("git log --oneline")).value_or(""), "git log -n 20 --oneline");
    EXPECT_FALSE(git.substitute(ctx("git log --oneline -n 3")).has_value());
    EXPECT_FALSE(git.substitute(ctx("git diff")).has_value());
}

TEST(GitOptimizerTest, Log_FullFormat_OneLinePerCommit) {
    GitOptimizer git;
    const std::string raw =
        "commit abcdef1234567890abcdef1234567890abcdef12\n"
        "Author: Dev <dev@example.com>\n"
        "Date:   Mon Jan 1 10:00:00 2024 +0000\n"
        "\n"
        "    Fix parser\n"
        "\n"
        "commit 1234567abcdef1234567abcdef1234567abcdef1\n"
        "Author: Dev <dev@example.com>\n"
        "\n"
        "    Add tests\n";
    EXPECT_EQ(optimize(git, "git log", raw), "abcdef1 Fix parser\n1234567 Add tests");
    EXPECT_EQ(optimize(git, "git log", "\n"), "No commits");
}

TEST(GitOptimizerTest, Diff_StatAndCompactHunks) {
    GitOptimizer git;
    const std::string raw =
        "diff --git a/src/a.rs b/src/a.rs\n"
        "index 1111111..2222222 100644\n"
        "--- a/src/a.rs\n"
        "+++ b/src/a.rs\n"
        "@@ -1,3 +1,3 @@\n"
        " context line\n"
        "-old\n"
        "+new\n";
    const std::string out = optimize(git, "git diff", raw);
    EXPECT_TRUE(contains(out, " src/a.rs | +1 -1"));
    EXPECT_TRUE(contains(out, "1 file changed, 1 insertion(+), 1 deletion(-)"));
    EXPECT_TRUE(contains(out, "@@ -1,3 +1,3 @@\n-old\n+new"));
    EXPECT_FALSE(contains(out, "context line"));
    EXPECT_FALSE(contains(out, "index 1111111"));
    EXPECT_FALSE(git.can_handle(ctx("git diff --stat")));
}

TEST(GitOptimizerTest, Diff_LongHunkTruncated) {
    GitLimits limits;
    limits.diff_max_hunk_lines = 3;
    GitOptimizer git(limits);
    std::string raw = "diff --git a/x b/x\n@@ -1,10 +1,10 @@\n";
    for (int i = 0; i < 10; ++i) {
        raw += "+line" + std::to_string(i) + "\n";
    }
    const std::string out = optimize(git, "git diff", raw);
    EXPECT_TRUE(contains(out, "+line2\n  ...(hunk truncated)"));
    EXPECT_FALSE(contains(out, "+line3"));
}

TEST(GitOptimizerTest, Branch_CurrentLocalAndRemoteOnly) {
    GitOptimizer git;
    const std::string raw =
        "* main\n  feature/x\n  remotes/origin/HEAD -> origin/main\n  remotes/origin/main\n"
        "  remotes/origin/old\n";
    EXPECT_EQ(optimize(git, "git branch -a", raw),
              "branches: 2 local, 2 remote\n* main\n  feature/x\n  remote-only (1):\n    old");
    EXPECT_FALSE(git.can_handle(ctx("git branch -D old")));
}

TEST(GitOptimizerTest, ShortOperations_OkOrFailed) {
    GitOptimizer git;
    EXPECT_EQ(optimize(git, "git push", "Everything up-to-date\n"), "git push: ok");
    EXPECT_EQ(optimize(git, "git push origin main",
                       "To github.com:x/y.git\n ! [rejected] main -> main (fetch first)\n"
                       "error: failed to push some refs\n"),
              "git push: failed - To github.com:x/y.git");
    EXPECT_EQ(optimize(git, "git pull",
                       "Updating 1a2b3c4..5d6e7f8\nFast-forward\n"
                       " src/error_handler.rs | 12 ++++++------\n"
                       " 1 file changed, 6 insertions(+), 6 deletions(-)\n"),
              "git pull: ok");
    EXPECT_EQ(optimize(git, "git commit -m 'Fix error path'",
                       "[main 1a2b3c4] Fix error path\n 1 file changed, 2 insertions(+)\n"),
              "git commit: ok");
    EXPECT_EQ(optimize(git, "git pull",
                       "Auto-merging src/a.rs\nCONFLICT (content): Merge conflict in src/a.rs\n"
                       "Automatic merge failed; fix conflicts and then commit the result.\n"),
              "git pull: failed - Auto-merging src/a.rs");
    EXPECT_EQ(optimize(git, "git fetch",
                       "fatal: 'origin' does not appear to be a git repository\n"),
              "git fetch: failed - fatal: 'origin' does not appear to be a git repository");
}

TEST(GitOptimizerTest, Stash_ListAndPush) {
    GitOptimizer git;
    EXPECT_EQ(optimize(git, "git stash list", "stash@{0}: WIP on main: abc1234 msg\n"),
              "stash@{0}: abc1234 msg");
    EXPECT_EQ(optimize(git, "git stash", "No local changes to save\n"),
              "git stash push: nothing to stash");
    EXPECT_EQ(optimize(git, "git stash",
                       "Saved working directory and index state WIP on main: 1a2b3c4 error page\n"),
              "git stash push: ok");
    EXPECT_EQ(optimize(git, "git stash pop",
                       "error: Your local changes to the following files would be overwritten\n"),
              "git stash pop: failed - error: Your local changes to the following files would be "
              "overwritten");
}

// ==============================================================================
// TST-OPT-002: файловые команды
// ==============================================================================

TEST(FileOptimizerTest, CanHandle_FileCommands) {
    FileOptimizer file;
    EXPECT_TRUE(file.can_handle(ctx("ls -la")));
    EXPECT_TRUE(file.can_handle(ctx("find . -name '*.rs'")));
    EXPECT_TRUE(file.can_handle(ctx("tree src")));
    EXPECT_FALSE(file.can_handle(ctx("ls -1")));
    EXPECT_FALSE(file.can_handle(ctx("git status")));
}

TEST(FileOptimizerTest, Ls_LongFormat_CapsEntries) {
    FileOptimizer file;
    std::string raw = "total 240\n";
    for (int i = 0; i < 60; ++i) {
        raw += "-rw-r--r-- 1 dev dev 100 Jan 1 10:00 file" + std::to_string(i) + ".txt\n";
    }
    const std::string out = optimize(file, "ls -la", raw);
    EXPECT_FALSE(contains(out, "total 240"));
    EXPECT_TRUE(contains(out, "file49.txt"));
    EXPECT_FALSE(contains(out, "file50.txt"));
    EXPECT_TRUE(contains(out, "...+10 more entries (60 total)"));
}

TEST(FileOptimizerTest, Ls_Empty) {
    FileOptimizer file;
    EXPECT_EQ(optimize(file, "ls", "  \n"), "(empty directory)");
}

TEST(FileOptimizerTest, Find_CapsResults) {
    FileOptimizer file;
    std::string raw;
    for (int i = 0; i < 45; ++i) {
        raw += "./src/f" + std::to_string(i) + ".rs\n";
    }
    const std::string out = optimize(file, "find . -name '*.rs'", raw);
    EXPECT_TRUE(contains(out, "./src/f39.rs\n...+5 more (45 total)"));
    EXPECT_EQ(optimize(file, "find . -name x", ""), "No files found");
}

TEST(FileOptimizerTest, Cat_HeadAndTail) {
    FileOptimizer file;
    std::string raw;
    for (int i = 1; i <= 200; ++i) {
        raw += "row " + std::to_string(i) + "\n";
    }
    const std::string out = optimize(file, "cat big.txt", raw);
    EXPECT_TRUE(contains(out, "row 60\n... (110 lines omitted, 200 total) ...\nrow 171"));
    EXPECT_TRUE(contains(out, "row 200"));
    EXPECT_FALSE(contains(out, "row 100\n"));
}

TEST(FileOptimizerTest, Tree_NoiseDirectoryPruned) {
    FileOptimizer file;
    const std::string raw =
        "project\n"
        "\xe2\x94\x9c\xe2\x94\x80\xe2\x94\x80 node_modules\n"
        "\xe2\x94\x82   \xe2\x94\x9c\xe2\x94\x80\xe2\x94\x80 a\n"
        "\xe2\x94\x82   \xe2\x94\x94\xe2\x94\x80\xe2\x94\x80 b\n"
        "\xe2\x94\x9c\xe2\x94\x80\xe2\x94\x80 src\n"
        "\xe2\x94\x82   \xe2\x94\x94\xe2\x94\x80\xe2\x94\x80 main.rs\n"
        "\xe2\x94\x94\xe2\x94\x80\xe2\x94\x80 README.md\n"
        "\n"
        "4 directories, 4 files\n";
    const std::string out = optimize(file, "tree", raw);
    EXPECT_TRUE(contains(out, "node_modules/ [contents hidden]"));
    EXPECT_FALSE(contains(out, "\xe2\x94\x80 a\n"));
    EXPECT_TRUE(contains(out, "main.rs"));
    EXPECT_TRUE(contains(out, "4 directories, 4 files"));
}

// ==============================================================================
// TST-OPT-003: сборка и тесты
// ==============================================================================

TEST(BuildOptimizerTest, Classify_TestBeforeBuild) {
    EXPECT_EQ(BuildOptimizer::classify("make test"), BuildOptimizer::Kind::Test);
    EXPECT_EQ(BuildOptimizer::classify("cargo build --release"), BuildOptimizer::Kind::Build);
    EXPECT_EQ(BuildOptimizer::classify("npm run lint"), BuildOptimizer::Kind::Lint);
    EXPECT_EQ(BuildOptimizer::classify("Pytest -x"), BuildOptimizer::Kind::Test);
    EXPECT_FALSE(BuildOptimizer::classify("echo build").has_value());
}

TEST(BuildOptimizerTest, TestOutput_FailuresVerbatimPassesCounted) {
    BuildOptimizer build;
    const std::string raw =
        "   Compiling terse v0.1.0\n"
        "running 3 tests\n"
        "test a ... ok\n"
        "test b ... ok\n"
        "test c ... FAILED\n"
        "\n"
        "---- c stdout ----\n"
        "thread 'c' panicked at src/lib.rs:10:5\n"
        "\n"
        "test result: FAILED. 2 passed; 1 failed; 0 ignored\n";
    const std::string out = optimize(build, "cargo test", raw);
    EXPECT_TRUE(contains(out, "[1 compilation steps]"));
    EXPECT_TRUE(contains(out, "FAILURES:\ntest c ... FAILED"));
    EXPECT_TRUE(contains(out, "thread 'c' panicked at src/lib.rs:10:5"));
    EXPECT_TRUE(contains(out, "[2 tests passed]"));
    EXPECT_TRUE(contains(out, "test result: FAILED. 2 passed; 1 failed; 0 ignored"));
    EXPECT_FALSE(contains(out, "test a ... ok"));
}

TEST(BuildOptimizerTest, BuildOutput_ErrorsWithContext) {
    BuildOptimizer build;
    const std::string raw =
        "   Compiling foo v0.1.0\n"
        "   Compiling bar v0.1.0\n"
        "error[E0308]: mismatched types\n"
        " --> src/main.rs:2:5\n"
        "\n"
        "warning: unused variable: `x`\n"
        "    Finished dev [unoptimized] target(s)\n";
    EXPECT_EQ(optimize(build, "cargo build", raw),
              "[2 build steps]\nERRORS:\nerror[E0308]: mismatched types\n--> src/main.rs:2:5\n"
              "warning: unused variable: `x`\nFinished dev [unoptimized] target(s)");
}

TEST(BuildOptimizerTest, BuildOutput_EmptyAndQuiet) {
    BuildOptimizer build;
    EXPECT_EQ(optimize(build, "make", ""), "Build completed (no output)");
    EXPECT_EQ(optimize(build, "make", "nothing to be done\n"), "Build succeeded");
}

TEST(BuildOptimizerTest, WarningsCapped) {
    BuildLimits limits;
    limits.build_max_warnings = 2;
    BuildOptimizer build(limits);
    std::string raw;
    for (int i = 0; i < 5; ++i) {
        raw += "warning: thing " + std::to_string(i) + "\n";
    }
    EXPECT_EQ(optimize(build, "cargo build", raw),
              "warning: thing 0\nwarning: thing 1\n...+3 more warnings");
}

// ==============================================================================
// TST-OPT-004: docker
// ==============================================================================

TEST(DockerOptimizerTest, Ps_ColumnsByHeaderPositions) {
    DockerOptimizer docker;
    const std::string header = pad("CONTAINER ID", 15) + pad("IMAGE", 15) + pad("COMMAND", 14) +
                               pad("CREATED", 14) + pad("STATUS", 13) + pad("PORTS", 23) +
                               "NAMES";
    const std::string row = pad("a1b2c3d4e5f6", 15) + pad("nginx:latest", 15) +
                            pad("\"nginx -g\"", 14) + pad("2 hours ago", 14) +
                            pad("Up 2 hours", 13) + pad("0.0.0.0:80->80/tcp", 23) + "web";
    EXPECT_EQ(optimize(docker, "docker ps", header + "\n" + row + "\n"),
              "NAME | IMAGE | STATUS | PORTS\nweb | nginx:latest | Up 2 hours | "
              "0.0.0.0:80->80/tcp");
}

TEST(DockerOptimizerTest, Ps_FormatFlag_NotHandled) {
    DockerOptimizer docker;
    EXPECT_FALSE(docker.can_handle(ctx("docker ps --format '{{.Names}}'")));
    EXPECT_TRUE(docker.can_handle(ctx("docker logs web")));
    EXPECT_FALSE(docker.can_handle(ctx("docker run nginx")));
}

TEST(DockerOptimizerTest, Logs_ErrorsAndTail) {
    DockerOptimizer docker;
    std::string raw;
    for (int i = 0; i < 100; ++i) {
        raw += (i == 10 ? std::string("ERROR db down") : "request " + std::to_string(i)) + "\n";
    }
    const std::string out = optimize(docker, "docker logs api", raw);
    EXPECT_TRUE(contains(out, "ERRORS/WARNINGS (1):\nERROR db down"));
    EXPECT_TRUE(contains(out, "TAIL (30 of 100 lines):\nrequest 70"));
    EXPECT_FALSE(contains(out, "request 50\n"));
}

TEST(DockerOptimizerTest, Pull_LayerProgressRemoved) {
    DockerOptimizer docker;
    const std::string raw =
        "Using default tag: latest\n"
        "latest: Pulling from library/nginx\n"
        "a1b2: Pulling fs layer\n"
        "a1b2: Pull complete\n"
        "Digest: sha256:abc\n"
        "Status: Downloaded newer image for nginx:latest\n";
    EXPECT_EQ(optimize(docker, "docker pull nginx", raw),
              "Using default tag: latest\nDigest: sha256:abc\n"
              "Status: Downloaded newer image for nginx:latest");
}

// ==============================================================================
// TST-OPT-005: generic
// ==============================================================================

TEST(GenericOptimizerTest, SmallOutput_Unchanged) {
    GenericOptimizer generic;
    EXPECT_TRUE(generic.can_handle(ctx("anything at all")));
    EXPECT_TRUE(generic.is_fallback());
    EXPECT_EQ(optimize(generic, "echo", "a   \n\n\n\nb"), "a   \n\n\n\nb");
}

TEST(GenericOptimizerTest, LargeOutput_HeadTailCap) {
    GenericOptimizer generic;
    std::string raw;
    for (int i = 0; i < 300; ++i) {
        raw += "line " + std::to_string(i) + "   \n";
    }
    const std::string out = optimize(generic, "./script.sh", raw);
    EXPECT_TRUE(contains(out, "line 132\n\n... (101 lines omitted, 300 total) ...\n\nline 234"));
    EXPECT_TRUE(contains(out, "line 299"));
    EXPECT_FALSE(contains(out, "   "));
}

// ==============================================================================
// TST-OPT-006: реестр
// ==============================================================================

TEST(RegistryTest, WithDefaults_OrderAndFallbackLast) {
    Registry reg = Registry::with_defaults();
    EXPECT_EQ(reg.names(), (std::vector<std::string>{"git", "file", "build", "docker", "generic"}));
    EXPECT_EQ(reg.select(ctx("git status"))->name(), "git");
    EXPECT_EQ(reg.select(ctx("cargo test"))->name(), "build");
    EXPECT_EQ(reg.select(ctx("echo hi"))->name(), "generic");
    EXPECT_EQ(reg.select_specialized(ctx("echo hi")), nullptr);
}

TEST(RegistryTest, WithDefaults_DisabledOptimizerSkipped) {
    Settings settings;
    settings.git.enabled = false;
    Registry reg = Registry::with_defaults(settings);
    EXPECT_EQ(reg.select(ctx("git status"))->name(), "generic");
    EXPECT_EQ(reg.size(), 4u);
}

TEST(RegistryTest, Constructor_MovesFallbackToEnd) {
    std::vector<std::unique_ptr<Optimizer>> list;
    list.push_back(std::make_unique<GenericOptimizer>());
    list.push_back(std::make_unique<GitOptimizer>());
    Registry reg(std::move(list));
    EXPECT_EQ(reg.names(), (std::vector<std::string>{"git", "generic"}));
}

TEST(RegistryTest, CapLines_MoreMarker) {
    EXPECT_EQ(cap_lines({"a", "b", "c"}, 2, "files"), "a\nb\n...+1 more files");
    EXPECT_EQ(cap_lines({"a"}, 2), "a");
}

}  // namespace terse::optimizer::test
