#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "providers/WebExtractor.hpp"

using namespace later;

namespace {
    const char* kArticlePage = R"HTML(<!DOCTYPE html>
<html>
<head>
  <title>Fallback Title</title>
  <meta property="og:title" content="Tide Tables Explained">
  <meta property="og:site_name" content="Coast Weekly">
  <meta property="article:published_time" content="2024-05-01T08:00:00Z">
  <link rel="canonical" href="/guides/tides">
  <script>var x = "<p>not content</p>";</script>
  <style>p { color: red; }</style>
</head>
<body>
  <nav><a href="/">Home</a> <a href="/about">About</a></nav>
  <article>
    <h1>Tide Tables Explained</h1>
    <p>Tides rise &amp; fall twice a day &mdash; mostly.</p>
    <p>See the <a href="charts">chart archive</a> for details.</p>
    <ul><li>High water</li><li>Low water</li></ul>
  </article>
  <footer>Copyright notice</footer>
</body>
</html>)HTML";
}

TEST(WebExtractor, ParsesArticleAndMetadata) {
    ArticleContent article = WebExtractor::parseHtml(kArticlePage, "https://coast.example.com/guides/tides?ref=x");

    EXPECT_EQ(article.title, std::optional<std::string>("Fallback Title"));
    EXPECT_EQ(article.sourceSite, std::optional<std::string>("Coast Weekly"));
    EXPECT_EQ(article.publicationDate, std::optional<std::string>("2024-05-01T08:00:00Z"));
    EXPECT_EQ(article.canonicalUrl, std::optional<std::string>("https://coast.example.com/guides/tides"));
    EXPECT_EQ(article.faviconUrl, std::optional<std::string>("https://coast.example.com/favicon.ico"));

    EXPECT_NE(article.text.find("Tides rise & fall twice a day \xE2\x80\x94 mostly."), std::string::npos);
    EXPECT_EQ(article.text.find("not content"), std::string::npos);
    EXPECT_EQ(article.text.find("Home"), std::string::npos);
    EXPECT_EQ(article.text.find("Copyright"), std::string::npos);

    EXPECT_NE(article.markdown.find("# Tide Tables Explained"), std::string::npos);
    EXPECT_NE(article.markdown.find("[chart archive](https://coast.example.com/guides/charts)"), std::string::npos);
    EXPECT_NE(article.markdown.find("- High water"), std::string::npos);
}

TEST(WebExtractor, FallsBackToBodyAndHost) {
    const char* page = "<html><body><div>First paragraph of plain text.</div>"
                       "<div>First paragraph of plain text.</div><div>Second one.</div></body></html>";
    ArticleContent article = WebExtractor::parseHtml(page, "https://blog.example.org/post");

    EXPECT_FALSE(article.title.has_value());
    EXPECT_EQ(article.sourceSite, std::optional<std::string>("blog.example.org"));
    EXPECT_EQ(article.text, "First paragraph of plain text.\nSecond one.");
}

TEST(WebExtractor, OgTitleUsedWhenNoTitleTag) {
    const char* page = "<html><head><meta name=\"og:title\" content=\"Only OG\"></head>"
                       "<body><p>Enough body text to count.</p></body></html>";
    ArticleContent article = WebExtractor::parseHtml(page, "https://example.com/");
    EXPECT_EQ(article.title, std::optional<std::string>("Only OG"));
}

TEST(WebExtractor, DecodesNumericEntities) {
    ArticleContent article = WebExtractor::parseHtml("<p>caf&#233; &#x2014; open late</p>", "https://example.com/");
    EXPECT_EQ(article.text, "caf\xC3\xA9 \xE2\x80\x94 open late");
}

TEST(WebExtractor, EmptyOrTinyPagesFail) {
    EXPECT_THROW(WebExtractor::parseHtml("<html><body><script>x()</script></body></html>", "https://example.com/"),
                 ExtractionError);
    EXPECT_THROW(WebExtractor::parseHtml("<p>Hi</p>", "https://example.com/"), ExtractionError);
}

TEST(WebExtractor, RecoversFromUnclosedTagsAndDecodesNamedEntities) {
    const char* page = "<html><body><article><p>Cr&egrave;me br&ucirc;l&eacute;e recipe"
                       "<p>Bake at <b>low heat</b> &amp; chill"
                       "<p>See <a href=\"notes?a=1&amp;b=2\">the notes</a></article></body></html>";
    ArticleContent article = WebExtractor::parseHtml(page, "https://food.example.com/desserts/");

    EXPECT_EQ(article.text, "Cr\xC3\xA8me br\xC3\xBBl\xC3\xA9" "e recipe\nBake at low heat & chill\nSee the notes");
    EXPECT_NE(article.markdown.find("[the notes](https://food.example.com/desserts/notes?a=1&b=2)"),
              std::string::npos);
}
