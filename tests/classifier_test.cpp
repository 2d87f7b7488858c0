// Scanner and classifier tests

#include "test_helpers.hpp"
#include "engine/errors.hpp"

using namespace verso::engine;
using verso::test::SiteTest;

class ClassifierTest : public SiteTest {
protected:
    SourceKind kind(const fs::path& relative) {
        return classifier_->classify(relative).kind;
    }
};

// ============================================================================
// Scanner
// ============================================================================

TEST_F(ClassifierTest, ScanSortsEntriesAndSkipsHiddenFiles) {
    write("b.md", "b");
    write("a/z.md", "z");
    write(".secret", "x");
    index();

    ASSERT_EQ(scan_.entries.size(), 2u);
    EXPECT_EQ(scan_.entries[0].relative, fs::path("a/z.md"));
    EXPECT_EQ(scan_.entries[1].relative, fs::path("b.md"));
}

TEST_F(ClassifierTest, ScanHonoursIgnoreFiles) {
    write(".versoignore", "*.psd\n");
    write("blog/.versoignore", "wip/\n");
    write("art.psd", "x");
    write("blog/wip/post.md", "x");
    write("blog/post.md", "x");
    index();

    ASSERT_EQ(scan_.entries.size(), 1u);
    EXPECT_EQ(scan_.entries[0].relative, fs::path("blog/post.md"));
}

TEST_F(ClassifierTest, ScanRecordsBooksWithoutDescending) {
    write("guide/book.toml", "[book]\n");
    write("guide/src/SUMMARY.md", "# Summary");
    write("index.md", "home");
    index();

    ASSERT_EQ(scan_.books.size(), 1u);
    EXPECT_EQ(scan_.books[0].root, fs::path("guide"));
    EXPECT_EQ(scan_.books[0].marker, fs::path("guide/book.toml"));
    ASSERT_EQ(scan_.entries.size(), 1u);
}

TEST_F(ClassifierTest, ScanMissingRootIsFatal) {
    config_.source = temp_dir_ / "missing";
    Scanner scanner(config_);
    EXPECT_THROW(scanner.scan(config_.source), FatalError);
}

// ============================================================================
// Classification rules
// ============================================================================

TEST_F(ClassifierTest, AssignsKinds) {
    write("index.md", "home");
    write("about.html", "<p>about</p>");
    write("about.json", "{}");
    write("data.json", "{}");
    write("layout.tmpl", "{{ template }}");
    write("templates/nav.html", "<nav></nav>");
    write("templates/meta.json", "{}");
    write("style.css", "body {}");
    write("feed.json", "[]");
    index();

    EXPECT_EQ(kind("index.md"), SourceKind::Document);
    EXPECT_EQ(kind("about.html"), SourceKind::Document);
    EXPECT_EQ(kind("about.json"), SourceKind::Data);
    EXPECT_EQ(kind("data.json"), SourceKind::Data);
    EXPECT_EQ(kind("layout.tmpl"), SourceKind::Template);
    EXPECT_EQ(kind("templates/nav.html"), SourceKind::Template);
    EXPECT_EQ(kind("templates/meta.json"), SourceKind::Template);
    EXPECT_EQ(kind("style.css"), SourceKind::Passthrough);
    EXPECT_EQ(kind("feed.json"), SourceKind::Passthrough);
}

TEST_F(ClassifierTest, LayoutFileIsTemplateAnywhere) {
    write("blog/layout.tmpl", "{{ template }}");
    index();
    EXPECT_EQ(kind("blog/layout.tmpl"), SourceKind::Template);
}

TEST_F(ClassifierTest, LayoutOptionsAreData) {
    write("blog/layout.tmpl", "{{ template }}");
    write("blog/layout.json", "{\"inherit\": true}");
    index();
    EXPECT_EQ(kind("blog/layout.json"), SourceKind::Data);
}

TEST_F(ClassifierTest, BookFilesBelongToTheBook) {
    write("guide/book.toml", "[book]\n");
    index();
    EXPECT_EQ(kind("guide/src/chapter.md"), SourceKind::Book);
}

TEST_F(ClassifierTest, IgnoredPathsAreIgnored) {
    config_.ignore = {"drafts/"};
    index();
    EXPECT_EQ(kind("drafts/post.md"), SourceKind::Ignored);
}

TEST_F(ClassifierTest, AmbiguousTemplateFragmentWarns) {
    write("templates/nav.html", "<nav></nav>");
    write("templates/nav.json", "{}");
    index();

    auto result = classifier_->classify("templates/nav.json");
    EXPECT_EQ(result.kind, SourceKind::Template);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("ClassificationAmbiguous"), std::string::npos);
}

// ============================================================================
// Sidecars and twins
// ============================================================================

TEST_F(ClassifierTest, SidecarPrefersMarkdownTwin) {
    write("about.md", "md");
    write("about.html", "html");
    write("about.json", "{}");
    index();

    EXPECT_EQ(classifier_->sidecar_owner("about.json"), fs::path("about.md"));
    EXPECT_EQ(classifier_->sidecar_for("about.md"), fs::path("about.json"));
    EXPECT_FALSE(classifier_->sidecar_for("about.html").has_value());
    EXPECT_EQ(classifier_->twin_of("about.md"), fs::path("about.html"));
}

TEST_F(ClassifierTest, DataFileIsNeverASidecar) {
    write("data.md", "a page called data");
    write("data.json", "{}");
    index();

    EXPECT_EQ(kind("data.json"), SourceKind::Data);
    EXPECT_FALSE(classifier_->sidecar_for("data.md").has_value());
}
