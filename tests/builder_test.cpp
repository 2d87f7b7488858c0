// Builder tests: full passes over scratch sites

#include "test_helpers.hpp"
#include "engine/builder.hpp"
#include "engine/errors.hpp"
#include "engine/files.hpp"

#include <map>
#include <string>
#include <utility>

using namespace verso::engine;
using verso::test::SiteTest;

namespace {

    struct FakeCompiler : BookCompiler {
        int* calls;
        bool fail;

        explicit FakeCompiler(int* counter, bool should_fail = false) : calls(counter), fail(should_fail) {}

        void compile(const BookRequest& request) override {
            ++*calls;
            if (fail) throw BookError(request.source, "compiler failed");
            files::write(request.output / "index.html", "<h1>book</h1>");
        }
    };

}

class BuilderTest : public SiteTest {
protected:
    int book_builds_ = 0;
    bool book_fails_ = false;

    BuildReport build() {
        Builder builder(config_, std::make_unique<FakeCompiler>(&book_builds_, book_fails_));
        return builder.run();
    }

    std::string manifest_text() const {
        return files::read(config_.manifest_file());
    }

    // Every output file with its content and modification time
    std::map<std::string, std::pair<std::string, fs::file_time_type>> output_tree() const {
        std::map<std::string, std::pair<std::string, fs::file_time_type>> tree;
        for (const auto& e : fs::recursive_directory_iterator(target())) {
            if (!e.is_regular_file()) continue;
            tree[fs::relative(e.path(), target()).generic_string()] = {files::read(e.path()), e.last_write_time()};
        }
        return tree;
    }
};

// ============================================================================
// Basic passes
// ============================================================================

TEST_F(BuilderTest, RendersThroughTheNearestLayout) {
    write("layout.tmpl", "<html><body>{{ template }}</body></html>");
    write("index.md", "# Hi\n");

    auto report = build();
    ASSERT_TRUE(report.ok()) << report.summary();
    EXPECT_EQ(report.rendered, 1u);
    EXPECT_EQ(read_output("index.html"), "<html><body><h1>Hi</h1>\n</body></html>");
    EXPECT_TRUE(fs::exists(config_.manifest_file()));
}

TEST_F(BuilderTest, EmptySiteSucceeds) {
    auto report = build();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.documents(), 0u);
}

TEST_F(BuilderTest, SecondPassIsAllNoop) {
    write("layout.tmpl", "{{ template }}");
    write("index.md", "home");
    write("blog/post.md", "post");
    write("img/logo.png", "png");
    ASSERT_TRUE(build().ok());
    auto before = manifest_text();
    auto outputs = output_tree();
    ASSERT_EQ(outputs.size(), 3u);

    auto report = build();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.rendered, 0u);
    EXPECT_EQ(report.skipped, 2u);
    EXPECT_EQ(report.copied, 0u);
    EXPECT_EQ(report.assets_skipped, 1u);
    EXPECT_EQ(report.removed, 0u);
    EXPECT_EQ(manifest_text(), before);
    EXPECT_EQ(output_tree(), outputs);
}

TEST_F(BuilderTest, ForceRebuildsEverything) {
    write("a.md", "a");
    write("b.md", "b");
    ASSERT_TRUE(build().ok());

    config_.force = true;
    EXPECT_EQ(build().rendered, 2u);
}

// ============================================================================
// Incremental staleness
// ============================================================================

TEST_F(BuilderTest, TouchedDocumentIsTheOnlyOneRerendered) {
    write("a.md", "a");
    write("b.md", "b");
    write("c.md", "c");
    ASSERT_TRUE(build().ok());

    touch("b.md");
    auto report = build();
    EXPECT_EQ(report.rendered, 1u);
    EXPECT_EQ(report.skipped, 2u);
}

TEST_F(BuilderTest, LayoutChangeRerendersItsDependents) {
    write("layout.tmpl", "root {{ template }}");
    write("blog/layout.tmpl", "blog {{ template }}");
    write("about.md", "about");
    write("blog/one.md", "one");
    write("blog/two.md", "two");
    ASSERT_TRUE(build().ok());

    touch("blog/layout.tmpl");
    auto report = build();
    EXPECT_EQ(report.rendered, 2u);
    EXPECT_EQ(report.skipped, 1u);
}

TEST_F(BuilderTest, DataChangeRerendersItsDependents) {
    write("about.html", "{{ title }}");
    write("blog/data.json", R"({"section": "Blog"})");
    write("blog/post.html", "{{ section }}");
    ASSERT_TRUE(build().ok());

    write("blog/data.json", R"({"section": "News"})");
    touch("blog/data.json");
    auto report = build();
    EXPECT_EQ(report.rendered, 1u);
    EXPECT_EQ(read_output("blog/post/index.html"), "News");
}

TEST_F(BuilderTest, PartialChangeRerendersDocuments) {
    write("templates/nav.html", "v1");
    write("a.html", "{% include \"nav\" %}");
    write("b.html", "plain");
    ASSERT_TRUE(build().ok());

    write("templates/nav.html", "v2");
    auto report = build();
    EXPECT_EQ(report.rendered, 2u);
    EXPECT_EQ(read_output("a/index.html"), "v2");
}

TEST_F(BuilderTest, PartialChangeKeepsFailedDocumentsStale) {
    write("templates/nav.html", "{{ label }}");
    write("a.html", "{% include \"nav\" %}");
    write("a.json", R"({"label": "A"})");
    write("b.html", "plain");
    ASSERT_TRUE(build().ok());

    // The new partial fails only where it is included
    write("templates/nav.html", "{{ label }} {{ missing }}");
    auto report = build();
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(report.rendered, 1u);

    report = build();
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(report.skipped, 1u);
    EXPECT_FALSE(report.ok());
}

TEST_F(BuilderTest, ChangedChaptersRebuildBooksInDigestMode) {
    config_.digest = true;
    write("index.md", "home");
    write("guide/book.toml", "[book]\n");
    write("guide/src/one.md", "first");
    ASSERT_TRUE(build().ok());
    ASSERT_EQ(book_builds_, 1);

    write("guide/src/one.md", "second");
    touch("guide/src/one.md");
    auto report = build();
    EXPECT_EQ(report.books, 1u);
    EXPECT_EQ(book_builds_, 2);
}

TEST_F(BuilderTest, DeletedOutputIsRestored) {
    write("a.md", "a");
    ASSERT_TRUE(build().ok());
    fs::remove(target() / "a/index.html");

    EXPECT_EQ(build().rendered, 1u);
    EXPECT_TRUE(output_exists("a/index.html"));
}

// ============================================================================
// Data and destinations
// ============================================================================

TEST_F(BuilderTest, CleanUrlConflictDemotesTheSibling) {
    write("about.html", "page");
    write("about/index.html", "section");
    ASSERT_TRUE(build().ok());

    EXPECT_EQ(read_output("about.html"), "page");
    EXPECT_EQ(read_output("about/index.html"), "section");
}

TEST_F(BuilderTest, TitlesAreInferred) {
    write("getting-started.html", "{{ title }}");
    write("user_guide/index.html", "{{ title }}");
    write("custom.html", "{{ title }}");
    write("custom.json", R"({"title": "Chosen"})");
    ASSERT_TRUE(build().ok());

    EXPECT_EQ(read_output("getting-started/index.html"), "Getting Started");
    EXPECT_EQ(read_output("user_guide/index.html"), "User Guide");
    EXPECT_EQ(read_output("custom/index.html"), "Chosen");
}

TEST_F(BuilderTest, DataIsInheritedDownTheTree) {
    write("data.json", R"({"site": "Root", "author": "Ann"})");
    write("blog/data.json", R"({"site": "Blog"})");
    write("top.html", "{{ site }}/{{ author }}");
    write("blog/post.html", "{{ site }}/{{ author }}");
    ASSERT_TRUE(build().ok());

    EXPECT_EQ(read_output("top/index.html"), "Root/Ann");
    EXPECT_EQ(read_output("blog/post/index.html"), "Blog/Ann");
}

TEST_F(BuilderTest, StandaloneDocumentSkipsLayouts) {
    write("layout.tmpl", "<main>{{ template }}</main>");
    write("raw.html", "raw");
    write("raw.json", R"({"standalone": true})");
    write("wrapped.html", "wrapped");
    ASSERT_TRUE(build().ok());

    EXPECT_EQ(read_output("raw/index.html"), "raw");
    EXPECT_EQ(read_output("wrapped/index.html"), "<main>wrapped</main>");
}

TEST_F(BuilderTest, DraftsAreLeftOutOfReleaseBuilds) {
    write("index.html", "home");
    write("wip.html", "wip");
    write("wip.json", R"({"draft": true})");

    ASSERT_TRUE(build().ok());
    EXPECT_TRUE(output_exists("wip/index.html"));

    config_.set_release(true);
    auto report = build();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.drafts, 1u);
    EXPECT_EQ(config_.tag, "release");
    EXPECT_FALSE(output_exists("wip/index.html"));
    EXPECT_TRUE(output_exists("index.html"));
}

TEST_F(BuilderTest, AssetsAreCopied) {
    write("img/logo.png", "png-bytes");
    write("css/site.css", "body{}");
    auto report = build();
    EXPECT_EQ(report.copied, 2u);
    EXPECT_EQ(read_output("img/logo.png"), "png-bytes");
    EXPECT_EQ(read_output("css/site.css"), "body{}");
}

TEST_F(BuilderTest, RemovedSourcesArePruned) {
    write("keep.md", "k");
    write("gone.md", "g");
    write("old.txt", "o");
    ASSERT_TRUE(build().ok());
    ASSERT_TRUE(output_exists("gone/index.html"));

    fs::remove(source() / "gone.md");
    fs::remove(source() / "old.txt");
    auto report = build();
    EXPECT_EQ(report.removed, 2u);
    EXPECT_FALSE(output_exists("gone/index.html"));
    EXPECT_FALSE(output_exists("old.txt"));
    EXPECT_TRUE(output_exists("keep/index.html"));
}

TEST_F(BuilderTest, ReplacedSourceKeepsTheSharedOutput) {
    write("about.md", "first");
    ASSERT_TRUE(build().ok());
    ASSERT_TRUE(output_exists("about/index.html"));

    fs::remove(source() / "about.md");
    write("about/index.md", "second");
    auto report = build();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.rendered, 1u);
    EXPECT_EQ(report.removed, 0u);
    EXPECT_EQ(read_output("about/index.html"), "<p>second</p>\n");

    fs::remove(source() / "about/index.md");
    write("about.html", "third");
    report = build();
    EXPECT_EQ(report.removed, 0u);
    EXPECT_EQ(read_output("about/index.html"), "third");

    report = build();
    EXPECT_EQ(report.rendered, 0u);
    EXPECT_EQ(report.skipped, 1u);
    EXPECT_TRUE(output_exists("about/index.html"));
}

TEST_F(BuilderTest, MovedDestinationRemovesTheOldOutput) {
    write("page.md", "p");
    write("other.md", "o");
    ASSERT_TRUE(build().ok());
    ASSERT_TRUE(output_exists("page/index.html"));

    write("page.json", R"({"clean": false})");
    auto report = build();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.removed, 1u);
    EXPECT_TRUE(output_exists("page.html"));
    EXPECT_FALSE(output_exists("page/index.html"));
    EXPECT_TRUE(output_exists("other/index.html"));
}

TEST_F(BuilderTest, FrontMatterFeedsTheTemplateAndIsStripped) {
    write("data.json", R"({"greeting": "Hello", "who": "world"})");
    write("hi.html", "<!--\n{\"greeting\": \"Hi\"}\n-->\n<b>{{ greeting }} {{ who }}</b>");
    write("post.md", "+++\n{\"title\": \"From front matter\"}\n+++\n{{ title }}\n");
    ASSERT_TRUE(build().ok());

    auto hi = read_output("hi/index.html");
    EXPECT_NE(hi.find("<b>Hi world</b>"), std::string::npos);
    EXPECT_EQ(hi.find("-->"), std::string::npos);
    auto post = read_output("post/index.html");
    EXPECT_NE(post.find("From front matter"), std::string::npos);
    EXPECT_EQ(post.find("+++"), std::string::npos);
}

// ============================================================================
// Redirects
// ============================================================================

TEST_F(BuilderTest, RedirectPagesAreWrittenAndPruned) {
    config_.redirect = {{"/old/", "/new/"}};
    write("new.md", "n");

    auto report = build();
    ASSERT_TRUE(report.ok()) << report.summary();
    EXPECT_EQ(report.redirects, 1u);
    EXPECT_NE(read_output("old/index.html").find("url=/new/"), std::string::npos);

    report = build();
    EXPECT_EQ(report.redirects, 0u);
    EXPECT_EQ(report.rendered, 0u);

    config_.redirect.clear();
    report = build();
    EXPECT_EQ(report.removed, 1u);
    EXPECT_FALSE(output_exists("old/index.html"));
    EXPECT_TRUE(output_exists("new/index.html"));
}

TEST_F(BuilderTest, RedirectNeverOverwritesAPage) {
    config_.redirect = {{"/about/", "/elsewhere/"}};
    write("about.md", "real");

    auto report = build();
    EXPECT_EQ(report.redirects_failed, 1u);
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(read_output("about/index.html"), "<p>real</p>\n");
}

TEST_F(BuilderTest, CyclicRedirectsAreFatal) {
    config_.redirect = {{"/a/", "/b/"}, {"/b/", "/a/"}};
    write("index.md", "home");
    auto report = build();
    EXPECT_TRUE(report.fatal);
    EXPECT_FALSE(output_exists("index.html"));
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(BuilderTest, OneBadDocumentDoesNotStopTheRest) {
    for (int i = 0; i < 10; ++i) {
        write("p" + std::to_string(i) + ".md", "page " + std::to_string(i));
    }
    write("p3.json", "{ not json");

    auto report = build();
    EXPECT_EQ(report.rendered, 9u);
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(report.exit_code(), 1);
    EXPECT_FALSE(report.fatal);
    EXPECT_EQ(report.errors(), 1u);
    EXPECT_TRUE(output_exists("p0/index.html"));
    EXPECT_TRUE(output_exists("p9/index.html"));
    EXPECT_FALSE(output_exists("p3/index.html"));

    // The failed document is retried once fixed
    write("p3.json", "{}");
    touch("p3.json");
    report = build();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.rendered, 1u);
}

TEST_F(BuilderTest, TwinDocumentsBothFail) {
    write("index.html", "home");
    write("about.md", "a");
    write("about.html", "b");

    auto report = build();
    EXPECT_EQ(report.failed, 2u);
    EXPECT_EQ(report.rendered, 1u);
    EXPECT_FALSE(output_exists("about/index.html"));
}

TEST_F(BuilderTest, EveryDocumentFailingIsFatal) {
    write("a.html", "{{ missing }}");
    auto report = build();
    EXPECT_TRUE(report.fatal);
    EXPECT_EQ(report.exit_code(), 1);
}

TEST_F(BuilderTest, CorruptManifestIsFatal) {
    write("a.md", "a");
    files::write(config_.manifest_file(), "{ broken");
    auto report = build();
    EXPECT_TRUE(report.fatal);
    EXPECT_FALSE(output_exists("a/index.html"));
}

TEST_F(BuilderTest, NonIntegerManifestVersionIsFatal) {
    write("a.md", "a");
    files::write(config_.manifest_file(), R"({"version": "1", "tag": "debug", "entries": {}})");
    auto report = build();
    EXPECT_TRUE(report.fatal);
    EXPECT_NE(report.fatal_message.find("version"), std::string::npos);
    EXPECT_FALSE(output_exists("a/index.html"));
}

TEST_F(BuilderTest, BrokenPartialIsFatal) {
    write("templates/bad.html", "{% if %}");
    write("a.md", "a");
    auto report = build();
    EXPECT_TRUE(report.fatal);
}

// ============================================================================
// Books and live mode
// ============================================================================

TEST_F(BuilderTest, BooksAreDelegatedAndTrackedIncrementally) {
    write("index.md", "home");
    write("guide/book.toml", "[book]\n");
    write("guide/src/SUMMARY.md", "- [One](one.md)\n");

    auto report = build();
    ASSERT_TRUE(report.ok()) << report.summary();
    EXPECT_EQ(report.books, 1u);
    EXPECT_EQ(book_builds_, 1);
    EXPECT_EQ(read_output("guide/index.html"), "<h1>book</h1>");
    // Book sources are not rendered as pages
    EXPECT_EQ(report.documents(), 1u);

    report = build();
    EXPECT_EQ(report.books_skipped, 1u);
    EXPECT_EQ(book_builds_, 1);

    touch("guide/src/SUMMARY.md");
    report = build();
    EXPECT_EQ(report.books, 1u);
    EXPECT_EQ(book_builds_, 2);
}

TEST_F(BuilderTest, BookFailureIsReported) {
    book_fails_ = true;
    write("index.md", "home");
    write("guide/book.toml", "[book]\n");

    auto report = build();
    EXPECT_EQ(report.books_failed, 1u);
    EXPECT_EQ(report.exit_code(), 1);
    EXPECT_TRUE(output_exists("index.html"));
}

TEST_F(BuilderTest, LiveModeWritesTheScript) {
    config_.live.enabled = true;
    write("index.html", "<html><body>home</body></html>");
    ASSERT_TRUE(build().ok());

    EXPECT_EQ(read_output(kScriptFile), livereload_script());
    EXPECT_EQ(read_output("index.html"), "<html><body>home" + livereload_tag() + "</body></html>");
}

TEST_F(BuilderTest, LiveModeOnReleaseWarns) {
    config_.set_release(true);
    config_.live.enabled = true;
    write("index.html", "home");
    auto report = build();
    EXPECT_TRUE(report.ok());
    EXPECT_FALSE(report.diagnostics.empty());
}
