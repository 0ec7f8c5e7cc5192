#include "relevance.hpp"

#include <gtest/gtest.h>

using namespace dastore;

namespace {

PackageInfo make(const std::string &name, bool installed = false) {
    PackageInfo pkg;
    pkg.name = name;
    pkg.installed = installed;
    return pkg;
}

} // anonymous namespace

TEST(Relevance, ScoresByMatchKind) {
    EXPECT_EQ(relevance_score(make("firefox"), "firefox"), SCORE_EXACT);
    EXPECT_EQ(relevance_score(make("firefox-developer-edition"), "firefox"), SCORE_PREFIX);
    EXPECT_EQ(relevance_score(make("python-firefox"), "firefox"), SCORE_SUBSTRING);
    EXPECT_EQ(relevance_score(make("chromium"), "firefox"), 0);
}

TEST(Relevance, IgnoresCase) {
    EXPECT_EQ(relevance_score(make("LibreOffice"), "libreoffice"), SCORE_EXACT);
    EXPECT_EQ(relevance_score(make("vim"), "VIM"), SCORE_EXACT);
}

TEST(Relevance, InstalledBonus) {
    EXPECT_EQ(relevance_score(make("firefox", true), "firefox"), SCORE_EXACT + SCORE_INSTALLED);
    EXPECT_EQ(relevance_score(make("other", true), "firefox"), SCORE_INSTALLED);
}

TEST(Relevance, SortsBestFirstAndKeepsTies) {
    PackageList pkgs = {
        make("python-vim"),
        make("vim-airline"),
        make("vim"),
        make("neovim"),
        make("vim-fugitive"),
    };

    sort_by_relevance(pkgs, "vim");

    ASSERT_EQ(pkgs.size(), 5u);
    EXPECT_EQ(pkgs[0].name, "vim");
    EXPECT_EQ(pkgs[0].relevance_score, SCORE_EXACT);
    // Equal scores keep the backend's order.
    EXPECT_EQ(pkgs[1].name, "vim-airline");
    EXPECT_EQ(pkgs[2].name, "vim-fugitive");
    EXPECT_EQ(pkgs[3].name, "python-vim");
    EXPECT_EQ(pkgs[4].name, "neovim");
}

TEST(Relevance, InstalledSubstringBeatsPlainSubstring) {
    PackageList pkgs = {make("python-vim"), make("neovim", true)};
    sort_by_relevance(pkgs, "vim");
    EXPECT_EQ(pkgs[0].name, "neovim");
}
