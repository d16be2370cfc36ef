#include <gtest/gtest.h>
#include <git/output_parser.hpp>

TEST(ParseWorktreeList, MainAndLinkedWorktrees) {
    std::string out =
        "worktree /src/project\n"
        "HEAD 1111111111111111111111111111111111111111\n"
        "branch refs/heads/main\n"
        "\n"
        "worktree /src/.worktrees/project/project-feature\n"
        "HEAD 2222222222222222222222222222222222222222\n"
        "branch refs/heads/feature/login\n"
        "locked reason text\n"
        "\n"
        "worktree /src/.worktrees/project/detached\n"
        "HEAD 3333333333333333333333333333333333333333\n"
        "detached\n"
        "prunable gitdir file points to non-existent location\n"
        "\n";

    auto wts = parse_worktree_list(out);
    ASSERT_EQ(wts.size(), 3u);

    EXPECT_EQ(wts[0].path, "/src/project");
    EXPECT_EQ(wts[0].branch, "main");
    EXPECT_EQ(wts[0].head, "1111111111111111111111111111111111111111");
    EXPECT_FALSE(wts[0].locked);

    EXPECT_EQ(wts[1].branch, "feature/login");
    EXPECT_TRUE(wts[1].locked);
    EXPECT_FALSE(wts[1].detached);

    EXPECT_TRUE(wts[2].detached);
    EXPECT_TRUE(wts[2].prunable);
    EXPECT_TRUE(wts[2].branch.empty());
}

TEST(ParseWorktreeList, BareRepositoryWithoutTrailingBlank) {
    auto wts = parse_worktree_list("worktree /srv/repo.git\nbare");
    ASSERT_EQ(wts.size(), 1u);
    EXPECT_TRUE(wts[0].bare);
    EXPECT_EQ(wts[0].path, "/srv/repo.git");
}

TEST(ParseWorktreeList, PathsWithSpacesAndNoise) {
    std::string out =
        "garbage before any record\n"
        "worktree /home/me/my project\r\n"
        "HEAD abc\n"
        "unknown-key value\n";
    auto wts = parse_worktree_list(out);
    ASSERT_EQ(wts.size(), 1u);
    EXPECT_EQ(wts[0].path, "/home/me/my project");
    EXPECT_EQ(wts[0].head, "abc");
}

TEST(ParseWorktreeList, Empty) {
    EXPECT_TRUE(parse_worktree_list("").empty());
    EXPECT_TRUE(parse_worktree_list("\n\n").empty());
}

TEST(ParseRemoteList, OneEntryPerName) {
    std::string out =
        "origin\tgit@github.com:acme/widget.git (fetch)\n"
        "origin\tgit@github.com:acme/widget.git (push)\n"
        "upstream\thttps://gitlab.com/group/widget (fetch)\n"
        "upstream\thttps://gitlab.com/group/widget (push)\n";
    auto remotes = parse_remote_list(out);
    ASSERT_EQ(remotes.size(), 2u);
    EXPECT_EQ(remotes[0].name, "origin");
    EXPECT_EQ(remotes[0].url, "git@github.com:acme/widget.git");
    EXPECT_EQ(remotes[1].name, "upstream");
    EXPECT_FALSE(remotes[1].parsed);
}

TEST(ParseStatusPorcelain, KeepsColumns) {
    std::string out =
        " M src/main.cpp\n"
        "M  staged.txt\n"
        "?? new file.txt\n"
        "R  old.txt -> new.txt\n";
    auto entries = parse_status_porcelain(out);
    ASSERT_EQ(entries.size(), 4u);

    EXPECT_EQ(entries[0].index, ' ');
    EXPECT_EQ(entries[0].worktree, 'M');
    EXPECT_EQ(entries[0].path, "src/main.cpp");

    EXPECT_EQ(entries[1].index, 'M');
    EXPECT_EQ(entries[1].worktree, ' ');

    EXPECT_TRUE(entries[2].untracked());
    EXPECT_EQ(entries[2].path, "new file.txt");

    EXPECT_EQ(entries[3].orig_path, "old.txt");
    EXPECT_EQ(entries[3].path, "new.txt");
}

TEST(ParseStatusPorcelain, CleanTree) {
    EXPECT_TRUE(parse_status_porcelain("").empty());
}

TEST(ParseCommitInfo, HeaderAndFiles) {
    std::string out =
        "0123456789abcdef0123456789abcdef01234567\n"
        "Jane Doe\n"
        "1700000000\n"
        "Add login form\n"
        "\n"
        "src/login.cpp\n"
        "src/login.hpp\n";
    auto r = parse_commit_info(out);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.hash, "0123456789abcdef0123456789abcdef01234567");
    EXPECT_EQ(r.value.author, "Jane Doe");
    EXPECT_EQ(r.value.date, static_cast<std::time_t>(1700000000));
    EXPECT_EQ(r.value.subject, "Add login form");
    std::vector<std::string> files = {"src/login.cpp", "src/login.hpp"};
    EXPECT_EQ(r.value.files, files);
}

TEST(ParseCommitInfo, TooShort) {
    auto r = parse_commit_info("abc\nJane\n");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Backend);
    EXPECT_TRUE(parse_commit_info("").is_err());
}

TEST(ParseCommitInfo, BadTimestampBecomesZero) {
    auto r = parse_commit_info("abc\nJane\nnot-a-number\nsubject");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.date, static_cast<std::time_t>(0));
    EXPECT_TRUE(r.value.files.empty());
}

TEST(ParseBranchList, StripsMarkers) {
    std::string out =
        "* main\n"
        "+ feature/checked-out-elsewhere\n"
        "  bugfix/crash\n"
        "* (HEAD detached at 1234abc)\n";
    auto branches = parse_branch_list(out);
    std::vector<std::string> expected = {"main", "feature/checked-out-elsewhere", "bugfix/crash"};
    EXPECT_EQ(branches, expected);
}
