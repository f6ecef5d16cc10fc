#include <gtest/gtest.h>

#include <git_info.hpp>

TEST(BuildInfoTest, GitMetadataAvailable)
{
    EXPECT_FALSE(gtxfer::build_info::git_commit.empty());
    EXPECT_FALSE(gtxfer::build_info::git_commit_short.empty());
    // Вне git-репозитория оба поля "unknown"
    if (gtxfer::build_info::git_commit != "unknown") {
        EXPECT_EQ(gtxfer::build_info::git_commit_short.size(), 7u); // typical short SHA
        EXPECT_TRUE(gtxfer::build_info::git_commit.starts_with(gtxfer::build_info::git_commit_short));
    }
}

TEST(BuildInfoTest, GetGitInfoMatchesConstants)
{
    constexpr auto info = gtxfer::build_info::get_git_info();
    static_assert(info.commit == gtxfer::build_info::git_commit);
    EXPECT_EQ(info.dirty, gtxfer::build_info::git_dirty);
    EXPECT_FALSE(info.timestamp.empty());
}
