#include "providers/WebExtractor.hpp"
#include "core/Errors.hpp"
#include "core/UrlUtils.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <set>
#include <gumbo.h>

namespace later {

namespace {
    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r\n\f\v");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t\r\n\f\v");
        return s.substr(start, end - start + 1);
    }

    struct GumboOutputDeleter {
        void operator()(GumboOutput* output) const {
            gumbo_destroy_output(&kGumboDefaultOptions, output);
        }
    };
    using GumboDocument = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

    std::string attribute(const GumboNode* node, const char* name) {
        const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
        return attr ? attr->value : "";
    }

    std::string tagName(const GumboNode* node) {
        return gumbo_normalized_tagname(node->v.element.tag);
    }

    // Concatenated text of every descendant text node.
    void collectText(const GumboNode* node, std::string& out) {
        if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE ||
            node->type == GUMBO_NODE_CDATA) {
            out += node->v.text.text;
            return;
        }
        if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) return;
        const GumboVector* children = &node->v.element.children;
        for (unsigned int i = 0; i < children->length; ++i) {
            collectText(static_cast<const GumboNode*>(children->data[i]), out);
        }
    }

    const std::set<std::string>& skippedElements() {
        static const std::set<std::string> names = {
            "script", "style", "noscript", "svg", "nav", "header", "footer", "aside",
            "form", "iframe", "template", "button", "select", "figure"
        };
        return names;
    }

    bool isBlock(const std::string& name) {
        static const std::set<std::string> names = {
            "p", "div", "section", "article", "main", "li", "ul", "ol", "br", "pre",
            "blockquote", "h1", "h2", "h3", "h4", "h5", "h6", "tr", "table", "hr", "dd", "dt"
        };
        return names.count(name) > 0;
    }

    struct Block {
        std::string markdown;
        std::string text;
    };

    // Accumulates text into blocks, keeping separate lists for <article>, <main> and the whole body.
    class BlockBuilder {
    public:
        explicit BlockBuilder(const std::string& baseUrl) : baseUrl_(baseUrl) {}

        void text(const std::string& decoded) {
            if (preDepth_ > 0) {
                markdown_ += decoded;
                text_ += decoded;
                return;
            }
            for (char c : decoded) {
                bool space = std::isspace(static_cast<unsigned char>(c)) != 0;
                if (space) {
                    if (!lastSpace_) {
                        markdown_ += ' ';
                        text_ += ' ';
                    }
                    lastSpace_ = true;
                } else {
                    markdown_ += c;
                    text_ += c;
                    lastSpace_ = false;
                }
            }
        }

        void open(const std::string& name, const std::string& href) {
            if (isBlock(name)) flush();
            if (name == "article") ++articleDepth_;
            else if (name == "main") ++mainDepth_;
            else if (name == "pre") ++preDepth_;
            else if (name.size() == 2 && name[0] == 'h' && name[1] >= '1' && name[1] <= '6') {
                prefix_ = std::string(static_cast<size_t>(name[1] - '0'), '#') + " ";
            } else if (name == "li") {
                prefix_ = "- ";
            } else if (name == "blockquote") {
                prefix_ = "> ";
            } else if (name == "a") {
                std::string resolved = resolveUrl(baseUrl_, href);
                hrefs_.push_back(resolved);
                if (!resolved.empty()) markdown_ += '[';
            }
        }

        void close(const std::string& name) {
            if (name == "a") {
                if (!hrefs_.empty()) {
                    const std::string href = hrefs_.back();
                    hrefs_.pop_back();
                    if (!href.empty()) markdown_ += "](" + href + ")";
                }
                return;
            }
            if (isBlock(name)) flush();
            if (name == "article" && articleDepth_ > 0) --articleDepth_;
            else if (name == "main" && mainDepth_ > 0) --mainDepth_;
            else if (name == "pre" && preDepth_ > 0) --preDepth_;
        }

        void flush() {
            std::string text = trim(text_);
            std::string markdown = trim(markdown_);
            text_.clear();
            markdown_.clear();
            lastSpace_ = true;
            std::string prefix = prefix_;
            prefix_.clear();
            if (text.empty()) return;

            Block block{prefix + markdown, text};
            push(body_, block);
            if (articleDepth_ > 0) push(article_, block);
            if (mainDepth_ > 0) push(main_, block);
        }

        const std::vector<Block>& best() const {
            if (!article_.empty()) return article_;
            if (!main_.empty()) return main_;
            return body_;
        }

    private:
        std::string baseUrl_;
        std::string markdown_;
        std::string text_;
        std::string prefix_;
        std::vector<std::string> hrefs_;
        bool lastSpace_ = true;
        int articleDepth_ = 0;
        int mainDepth_ = 0;
        int preDepth_ = 0;
        std::vector<Block> article_;
        std::vector<Block> main_;
        std::vector<Block> body_;

        // Repeated boilerplate (share buttons, bylines) appears as identical blocks.
        static void push(std::vector<Block>& blocks, const Block& block) {
            for (const auto& existing : blocks) {
                if (existing.text == block.text) return;
            }
            blocks.push_back(block);
        }
    };

    // Walks the parsed tree in document order, filling metadata and body blocks.
    class PageWalker {
    public:
        PageWalker(ArticleContent& article, const std::string& url)
            : article_(article), url_(url), builder_(url) {}

        void visit(const GumboNode* node) {
            switch (node->type) {
                case GUMBO_NODE_DOCUMENT:
                    children(&node->v.document.children);
                    break;
                case GUMBO_NODE_ELEMENT:
                case GUMBO_NODE_TEMPLATE:
                    element(node);
                    break;
                case GUMBO_NODE_TEXT:
                case GUMBO_NODE_WHITESPACE:
                case GUMBO_NODE_CDATA:
                    builder_.text(node->v.text.text);
                    break;
                default:
                    break;
            }
        }

        const std::vector<Block>& finish() {
            builder_.flush();
            return builder_.best();
        }

    private:
        ArticleContent& article_;
        std::string url_;
        BlockBuilder builder_;

        void children(const GumboVector* nodes) {
            for (unsigned int i = 0; i < nodes->length; ++i) {
                visit(static_cast<const GumboNode*>(nodes->data[i]));
            }
        }

        void element(const GumboNode* node) {
            const std::string name = tagName(node);
            if (name == "title") {
                std::string title;
                collectText(node, title);
                title = trim(title);
                if (!article_.title && !title.empty()) article_.title = title;
                return;
            }
            if (name == "meta") {
                meta(node);
                return;
            }
            if (name == "link") {
                if (toLower(attribute(node, "rel")) == "canonical") {
                    std::string resolved = resolveUrl(url_, attribute(node, "href"));
                    if (!resolved.empty()) article_.canonicalUrl = resolved;
                }
                return;
            }
            if (skippedElements().count(name)) return;

            builder_.open(name, name == "a" ? attribute(node, "href") : std::string());
            children(&node->v.element.children);
            builder_.close(name);
        }

        void meta(const GumboNode* node) {
            std::string key = toLower(attribute(node, "property"));
            if (key.empty()) key = toLower(attribute(node, "name"));
            std::string content = trim(attribute(node, "content"));
            if (content.empty()) return;
            if (key == "og:site_name") {
                article_.sourceSite = content;
            } else if (key == "article:published_time" || key == "date" ||
                       key == "citation_publication_date") {
                if (!article_.publicationDate) article_.publicationDate = content;
            } else if (key == "og:title" && !article_.title) {
                article_.title = content;
            } else if (key == "og:url" && !article_.canonicalUrl) {
                std::string resolved = resolveUrl(url_, content);
                if (!resolved.empty()) article_.canonicalUrl = resolved;
            }
        }
    };

    bool looksLikeHtml(const std::string& contentType, const std::string& body) {
        std::string type = toLower(contentType);
        if (type.find("html") != std::string::npos || type.find("xml") != std::string::npos) {
            return true;
        }
        if (!type.empty()) return false;
        std::string head = toLower(body.substr(0, 512));
        return head.find("<html") != std::string::npos || head.find("<!doctype") != std::string::npos;
    }
}

WebExtractor::WebExtractor(long timeoutSeconds) : timeoutSeconds_(timeoutSeconds) {
    http_.setUserAgent("Mozilla/5.0 (compatible; later/1.0)");
    http_.setMaxBodyBytes(8 * 1024 * 1024);
}

ArticleContent WebExtractor::parseHtml(const std::string& html, const std::string& url) {
    ArticleContent article;
    article.url = url;

    GumboDocument document(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
    if (!document) {
        throw ExtractionError("Extraction failed: the page could not be parsed.");
    }
    PageWalker walker(article, url);
    walker.visit(document->document);
    const std::vector<Block>& blocks = walker.finish();

    std::string markdown;
    std::string text;
    for (const auto& block : blocks) {
        if (!markdown.empty()) markdown += "\n\n";
        markdown += block.markdown;
        if (!text.empty()) text += "\n";
        text += block.text;
    }

    if (text.empty()) {
        throw ExtractionError("Extraction failed: No content could be extracted from the webpage.");
    }
    if (text.size() < kMinTextLength) {
        throw ExtractionError("Extraction failed: Insufficient content found on the webpage.");
    }
    article.markdown = markdown;
    article.text = text;

    const std::string& siteUrl = article.canonicalUrl ? *article.canonicalUrl : url;
    std::string favicon = faviconUrl(siteUrl);
    if (!favicon.empty()) article.faviconUrl = favicon;
    if (!article.sourceSite) {
        std::string host = hostOf(siteUrl);
        if (!host.empty()) article.sourceSite = host;
    }
    return article;
}

ArticleContent WebExtractor::extract(const std::string& rawUrl, const CancelToken* cancel) {
    std::string url = prepareUrl(rawUrl);

    HttpResponse response = http_.get(url, {"Accept: text/html,application/xhtml+xml;q=0.9,*/*;q=0.5"},
                                      timeoutSeconds_, cancel);
    if (response.status == 404 || response.status == 410) {
        throw ExtractionError("Extraction failed: page not found (HTTP " +
                              std::to_string(response.status) + ")");
    }
    HttpClient::checkStatus(response, "Page download");

    if (response.body.empty()) {
        throw ExtractionError("Extraction failed: empty response from " + url);
    }

    if (!looksLikeHtml(response.contentType, response.body)) {
        std::string type = toLower(response.contentType);
        if (type.find("text/plain") == std::string::npos) {
            throw ExtractionError("Extraction failed: unsupported content type " + response.contentType);
        }
        std::string text = trim(response.body);
        if (text.size() < kMinTextLength) {
            throw ExtractionError("Extraction failed: Insufficient content found on the webpage.");
        }
        ArticleContent article;
        article.url = url;
        article.text = text;
        article.markdown = text;
        article.sourceSite = hostOf(url);
        std::string favicon = faviconUrl(url);
        if (!favicon.empty()) article.faviconUrl = favicon;
        return article;
    }

    // Relative links resolve against where the redirects ended up.
    std::string base = response.effectiveUrl.empty() ? url : response.effectiveUrl;
    ArticleContent article = parseHtml(response.body, base);
    article.url = url;
    return article;
}

} // namespace later
