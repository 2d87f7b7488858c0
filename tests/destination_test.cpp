// DestinationPlanner tests

#include "test_helpers.hpp"
#include "engine/destination.hpp"
#include "engine/errors.hpp"

using namespace verso::engine;
using verso::test::SiteTest;

class DestinationTest : public SiteTest {
protected:
    Destination plan(const fs::path& relative, std::optional<bool> clean = std::nullopt) {
        index();
        DestinationPlanner planner(config_, *tree_, *classifier_);
        return planner.plan(entry(relative), clean);
    }
};

TEST_F(DestinationTest, CleanUrlsUseDirectoryIndex) {
    write("a/about.md", "x");
    auto dest = plan("a/about.md");
    EXPECT_EQ(dest.path, fs::path("a/about/index.html"));
    EXPECT_FALSE(dest.demoted);
}

TEST_F(DestinationTest, IndexFilesStayPut) {
    write("index.md", "x");
    write("docs/index.html", "x");
    EXPECT_EQ(plan("index.md").path, fs::path("index.html"));
    EXPECT_EQ(plan("docs/index.html").path, fs::path("docs/index.html"));
}

TEST_F(DestinationTest, ConflictWithDirectoryIndexDemotes) {
    write("a/about.md", "x");
    write("a/about/index.md", "x");

    auto dest = plan("a/about.md");
    EXPECT_EQ(dest.path, fs::path("a/about.html"));
    EXPECT_TRUE(dest.demoted);
    EXPECT_EQ(plan("a/about/index.md").path, fs::path("a/about/index.html"));
}

TEST_F(DestinationTest, ConflictWithHtmlDirectoryIndexDemotes) {
    write("about.md", "x");
    write("about/index.html", "x");
    EXPECT_EQ(plan("about.md").path, fs::path("about.html"));
}

TEST_F(DestinationTest, CleanUrlsCanBeDisabled) {
    config_.clean_url = false;
    write("about.md", "x");
    write("contact.md", "x");
    EXPECT_EQ(plan("about.md").path, fs::path("about.html"));
    EXPECT_EQ(plan("contact.md", true).path, fs::path("contact/index.html"));
}

TEST_F(DestinationTest, PerDocumentOverride) {
    write("feed.md", "x");
    EXPECT_EQ(plan("feed.md", false).path, fs::path("feed.html"));
}

TEST_F(DestinationTest, PassthroughKeepsItsPath) {
    write("img/logo.png", "png");
    auto dest = plan("img/logo.png");
    EXPECT_EQ(dest.path, fs::path("img/logo.png"));
}

TEST_F(DestinationTest, TwinDocumentsCollide) {
    write("about.md", "x");
    write("about.html", "x");
    EXPECT_THROW(plan("about.md"), RenderError);
    EXPECT_THROW(plan("about.html"), RenderError);
}
