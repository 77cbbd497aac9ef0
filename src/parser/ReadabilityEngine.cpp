#include "ReadabilityEngine.hpp"
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <regex>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "../utils/Logger.hpp"

namespace {

using Unclutter::Dom::TextContent;

const std::regex kUnlikelyCandidates(
    R"(-ad-|ai2html|banner|breadcrumbs|combx|comment|community|cover-wrap|disqus|extra|footer|gdpr|header|legends|menu|related|remark|replies|rss|shoutbox|sidebar|skyscraper|social|sponsor|supplemental|ad-break|agegate|pagination|pager|popup|yom-remote)",
    std::regex::icase);
const std::regex kMaybeCandidate(R"(and|article|body|column|content|main|shadow)", std::regex::icase);
const std::regex kPositive(
    R"(article|body|content|entry|hentry|h-entry|main|page|pagination|post|text|blog|story)",
    std::regex::icase);
const std::regex kNegative(
    R"(-ad-|hidden|^hid$| hid$| hid |^hid |banner|combx|comment|com-|contact|foot|footer|footnote|gdpr|masthead|media|meta|outbrain|promo|related|scroll|share|shoutbox|sidebar|skyscraper|sponsor|shopping|tags|tool|widget)",
    std::regex::icase);

// Minimum trimmed text for a node to count towards the readerable score.
constexpr size_t kMinContentLength = 140;
constexpr double kMinReaderableScore = 20.0;
constexpr size_t kMinParagraphLength = 25;

// Helper to convert lxb_char_t* to std::string
std::string to_std_string(const lxb_char_t* lxb_str, size_t len) {
    if (lxb_str && len > 0) {
        return std::string(reinterpret_cast<const char*>(lxb_str), len);
    }
    return "";
}

// Helper to get an attribute value by key
std::string get_attribute_value(lxb_dom_element_t* element, const char* key) {
    size_t len;
    const lxb_char_t* value = lxb_dom_element_get_attribute(element, reinterpret_cast<const lxb_char_t*>(key), strlen(key), &len);
    return to_std_string(value, len);
}

// ASCII lowercase helper
static inline void ascii_tolower_inplace(std::string& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
}

static inline bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (unsigned char c : s) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

size_t utf8_length(const std::string& s) {
    return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](unsigned char c) {
        return (c & 0xC0) != 0x80;
    }));
}

bool is_element(const lxb_dom_node_t* node) {
    return node && node->type == LXB_DOM_NODE_TYPE_ELEMENT;
}

std::string local_name(lxb_dom_node_t* node) {
    size_t len = 0;
    const lxb_char_t* name = lxb_dom_element_local_name(lxb_dom_interface_element(node), &len);
    std::string out = to_std_string(name, len);
    ascii_tolower_inplace(out);
    return out;
}

std::string class_and_id(lxb_dom_element_t* element) {
    return get_attribute_value(element, "class") + " " + get_attribute_value(element, "id");
}

bool looks_unlikely(lxb_dom_element_t* element) {
    std::string match = class_and_id(element);
    if (match.size() <= 1) return false;
    return std::regex_search(match, kUnlikelyCandidates) && !std::regex_search(match, kMaybeCandidate);
}

bool is_hidden(lxb_dom_element_t* element) {
    if (lxb_dom_element_has_attribute(element, reinterpret_cast<const lxb_char_t*>("hidden"), 6)) return true;
    std::string style = get_attribute_value(element, "style");
    style.erase(std::remove_if(style.begin(), style.end(), [](unsigned char c) { return is_space(c); }), style.end());
    ascii_tolower_inplace(style);
    return style.find("display:none") != std::string::npos || style.find("visibility:hidden") != std::string::npos;
}

bool has_ancestor(lxb_dom_node_t* node, const char* tag) {
    for (lxb_dom_node_t* p = node->parent; is_element(p); p = p->parent) {
        if (local_name(p) == tag) return true;
    }
    return false;
}

// Next node in document order after node's subtree, staying under root.
lxb_dom_node_t* next_skipping_children(lxb_dom_node_t* node, lxb_dom_node_t* root) {
    while (node && node != root) {
        if (node->next) return node->next;
        node = node->parent;
    }
    return nullptr;
}

lxb_dom_node_t* next_node(lxb_dom_node_t* node, lxb_dom_node_t* root) {
    if (node->first_child) return node->first_child;
    return next_skipping_children(node, root);
}

std::vector<lxb_dom_element_t*> elements_by_tag(lxb_dom_element_t* root, const char* tag) {
    std::vector<lxb_dom_element_t*> out;
    if (!root) return out;
    lxb_dom_node_t* root_node = lxb_dom_interface_node(root);
    lxb_dom_collection_t* col = lxb_dom_collection_make(root_node->owner_document, 32);
    if (!col) return out;
    (void) lxb_dom_elements_by_tag_name(root, col, reinterpret_cast<const lxb_char_t*>(tag), strlen(tag));
    const size_t count = lxb_dom_collection_length(col);
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        lxb_dom_element_t* el = lxb_dom_collection_element(col, i);
        if (el) out.push_back(el);
    }
    lxb_dom_collection_destroy(col, true);
    return out;
}

struct PageMetadata {
    std::string title;
    std::string byline;
    std::string excerpt;
    std::string site_name;
    std::string image;
    std::string language;
};

PageMetadata CollectMetadata(lxb_html_document_t* document) {
    PageMetadata meta;
    // 1) title: use lexbor API for robustness
    {
        size_t tlen = 0;
        const lxb_char_t* t = lxb_html_document_title(document, &tlen);
        meta.title = collapse_whitespace(to_std_string(t, tlen));
    }

    // 2) meta tags in the head element
    auto* head_el = lxb_html_document_head_element(document);
    if (head_el != nullptr) {
        for (lxb_dom_element_t* el : elements_by_tag(lxb_dom_interface_element(head_el), "meta")) {
            std::string prop = get_attribute_value(el, "property");
            if (prop.empty()) prop = get_attribute_value(el, "name");
            std::string content = collapse_whitespace(get_attribute_value(el, "content"));

            if (prop.empty() || content.empty()) continue;
            ascii_tolower_inplace(prop);

            if ((prop == "og:title" || prop == "twitter:title") && meta.title.empty()) meta.title = content;
            else if ((prop == "og:description" || prop == "twitter:description" || prop == "description") && meta.excerpt.empty()) meta.excerpt = content;
            else if ((prop == "og:image" || prop == "og:image:url" || prop == "og:image:secure_url" || prop == "twitter:image" || prop == "twitter:image:src") && meta.image.empty()) meta.image = content;
            else if (prop == "og:site_name" && meta.site_name.empty()) meta.site_name = content;
            else if ((prop == "author" || prop == "article:author" || prop == "dc.creator") && meta.byline.empty()) meta.byline = content;
        }
    }

    // 3) <html lang>
    lxb_dom_element_t* root = lxb_dom_document_element(lxb_html_document_original_ref(document));
    if (root) meta.language = get_attribute_value(root, "lang");
    return meta;
}

bool ShouldStrip(lxb_dom_node_t* node) {
    static const std::unordered_set<std::string> clutter_tags = {
        "script", "style", "noscript", "iframe", "nav", "footer", "aside", "form", "button",
        "svg", "object", "embed", "link", "meta", "template", "input", "select", "textarea"
    };
    const std::string name = local_name(node);
    if (clutter_tags.count(name)) return true;
    if (name == "html" || name == "body" || name == "article" || name == "main" || name == "a") return false;
    lxb_dom_element_t* el = lxb_dom_interface_element(node);
    return is_hidden(el) || looks_unlikely(el);
}

void StripClutter(lxb_dom_node_t* root) {
    std::vector<lxb_dom_node_t*> doomed;
    lxb_dom_node_t* node = root->first_child;
    while (node) {
        bool drop = node->type == LXB_DOM_NODE_TYPE_COMMENT || (is_element(node) && ShouldStrip(node));
        if (drop) {
            doomed.push_back(node);
            node = next_skipping_children(node, root);
        } else {
            node = next_node(node, root);
        }
    }
    // Subtrees never nest here, so each node is destroyed once.
    for (lxb_dom_node_t* n : doomed) {
        lxb_dom_node_remove(n);
        lxb_dom_node_destroy_deep(n);
    }
}

double InitialTagScore(const std::string& name) {
    if (name == "div") return 5;
    if (name == "pre" || name == "td" || name == "blockquote") return 3;
    if (name == "address" || name == "ol" || name == "ul" || name == "dl" || name == "dd" ||
        name == "dt" || name == "li" || name == "form") return -3;
    if (name == "h1" || name == "h2" || name == "h3" || name == "h4" || name == "h5" ||
        name == "h6" || name == "th") return -5;
    return 0;
}

double ClassWeight(lxb_dom_element_t* element) {
    double weight = 0;
    for (const char* attr : {"class", "id"}) {
        std::string value = get_attribute_value(element, attr);
        if (value.empty()) continue;
        if (std::regex_search(value, kNegative)) weight -= 25;
        if (std::regex_search(value, kPositive)) weight += 25;
    }
    return weight;
}

double LinkDensity(lxb_dom_element_t* element) {
    const size_t text_length = utf8_length(collapse_whitespace(TextContent(lxb_dom_interface_node(element))));
    if (text_length == 0) return 0;
    size_t link_length = 0;
    for (lxb_dom_element_t* a : elements_by_tag(element, "a")) {
        link_length += utf8_length(collapse_whitespace(TextContent(lxb_dom_interface_node(a))));
    }
    return static_cast<double>(link_length) / static_cast<double>(text_length);
}

// A div that only holds inline content reads like a paragraph.
bool IsParagraphLikeDiv(lxb_dom_node_t* node) {
    static const std::unordered_set<std::string> block_tags = {
        "blockquote", "dl", "div", "img", "ol", "p", "pre", "table", "ul"
    };
    for (lxb_dom_node_t* child = node->first_child; child; child = child->next) {
        if (is_element(child) && block_tags.count(local_name(child))) return false;
    }
    return true;
}

lxb_dom_node_t* PickTopCandidate(lxb_dom_element_t* body) {
    std::unordered_map<lxb_dom_node_t*, double> scores;
    std::vector<lxb_dom_node_t*> candidates;
    auto ensure_candidate = [&](lxb_dom_node_t* node) -> double& {
        auto it = scores.find(node);
        if (it == scores.end()) {
            candidates.push_back(node);
            it = scores.emplace(node, InitialTagScore(local_name(node)) +
                                      ClassWeight(lxb_dom_interface_element(node))).first;
        }
        return it->second;
    };

    std::vector<lxb_dom_element_t*> paragraphs;
    for (const char* tag : {"p", "pre", "td"}) {
        auto found = elements_by_tag(body, tag);
        paragraphs.insert(paragraphs.end(), found.begin(), found.end());
    }
    for (lxb_dom_element_t* div : elements_by_tag(body, "div")) {
        if (IsParagraphLikeDiv(lxb_dom_interface_node(div))) paragraphs.push_back(div);
    }

    for (lxb_dom_element_t* el : paragraphs) {
        lxb_dom_node_t* node = lxb_dom_interface_node(el);
        lxb_dom_node_t* parent = node->parent;
        if (!is_element(parent)) continue;

        std::string text = collapse_whitespace(TextContent(node));
        const size_t length = utf8_length(text);
        if (length < kMinParagraphLength) continue;

        double score = 1.0 + static_cast<double>(std::count(text.begin(), text.end(), ','));
        score += std::min(std::floor(static_cast<double>(length) / 100.0), 3.0);

        ensure_candidate(parent) += score;
        lxb_dom_node_t* grandparent = parent->parent;
        if (is_element(grandparent) && local_name(grandparent) != "html") {
            ensure_candidate(grandparent) += score / 2.0;
        }
    }

    lxb_dom_node_t* best = nullptr;
    double best_score = 0;
    for (lxb_dom_node_t* candidate : candidates) {
        double score = scores[candidate] * (1.0 - LinkDensity(lxb_dom_interface_element(candidate)));
        if (!best || score > best_score) {
            best = candidate;
            best_score = score;
        }
    }
    return best;
}

void AbsolutizeLinks(lxb_dom_element_t* root, const std::string& base_url) {
    const std::pair<const char*, const char*> targets[] = {
        {"a", "href"}, {"img", "src"}, {"video", "src"}, {"audio", "src"}, {"source", "src"}
    };
    for (const auto& target : targets) {
        for (lxb_dom_element_t* el : elements_by_tag(root, target.first)) {
            std::string value = get_attribute_value(el, target.second);
            if (value.empty()) continue;
            std::string resolved = Unclutter::UrlUtil::ResolveAgainst(base_url, value);
            if (resolved == value) continue;
            lxb_dom_element_set_attribute(el,
                reinterpret_cast<const lxb_char_t*>(target.second), strlen(target.second),
                reinterpret_cast<const lxb_char_t*>(resolved.data()), resolved.size());
        }
    }
}

} // anonymous namespace

namespace Unclutter {

ReadabilityEngine::ReadabilityEngine() : ReadabilityEngine(ReadabilityOptions{}) {}

ReadabilityEngine::ReadabilityEngine(const ReadabilityOptions& options) : options_(options) {}

ParseResult ReadabilityEngine::Parse(IBodyStream& input, const Url& page_url) {
    auto document = HtmlDocument::Parse(input);
    if (!document) return {std::nullopt, "failed to parse input"};
    return Extract(*document, page_url);
}

ParseResult ReadabilityEngine::ParseDocument(const HtmlDocument& document, const Url& page_url) {
    // The caller's tree stays untouched.
    auto working = document.Clone();
    if (!working) return {std::nullopt, "failed to clone document"};
    return Extract(*working, page_url);
}

ParseResult ReadabilityEngine::Extract(HtmlDocument& working, const Url& page_url) const {
    lxb_html_document_t* document = working.get();
    PageMetadata meta = CollectMetadata(document);

    auto* body_el = lxb_html_document_body_element(document);
    if (body_el == nullptr) return {std::nullopt, "document has no body"};
    lxb_dom_element_t* body = lxb_dom_interface_element(body_el);

    StripClutter(lxb_dom_interface_node(body));

    lxb_dom_node_t* top = PickTopCandidate(body);
    if (top) {
        size_t top_length = utf8_length(collapse_whitespace(TextContent(top)));
        if (top_length < options_.char_threshold) {
            Logger::Log(LogLevel::Debug, "Top candidate has only " + std::to_string(top_length) +
                                             " characters, using the whole body");
            top = lxb_dom_interface_node(body);
        }
    } else {
        top = lxb_dom_interface_node(body);
    }

    Article article;
    article.text_content = collapse_whitespace(TextContent(top));
    if (article.text_content.empty()) return {std::nullopt, "no readable content found"};

    AbsolutizeLinks(lxb_dom_interface_element(top), page_url.href);
    article.content = Dom::SerializeNode(top);
    article.length = utf8_length(article.text_content);
    article.title = meta.title;
    article.byline = meta.byline;
    article.site_name = meta.site_name;
    article.language = meta.language;
    article.image = meta.image.empty() ? "" : UrlUtil::ResolveAgainst(page_url.href, meta.image);
    article.excerpt = meta.excerpt;
    if (article.excerpt.empty()) {
        for (lxb_dom_element_t* p : elements_by_tag(lxb_dom_interface_element(top), "p")) {
            std::string text = collapse_whitespace(TextContent(lxb_dom_interface_node(p)));
            if (!text.empty()) {
                article.excerpt = text;
                break;
            }
        }
    }
    return {std::move(article), ""};
}

bool ReadabilityEngine::Check(IBodyStream& input) {
    auto document = HtmlDocument::Parse(input);
    if (!document) return false;
    return CheckDocument(*document);
}

bool ReadabilityEngine::CheckDocument(const HtmlDocument& document) {
    if (!document.get()) return false;
    lxb_dom_element_t* root = lxb_dom_document_element(lxb_html_document_original_ref(document.get()));
    if (!root) return false;

    std::vector<lxb_dom_element_t*> nodes;
    for (const char* tag : {"p", "pre", "article"}) {
        auto found = elements_by_tag(root, tag);
        nodes.insert(nodes.end(), found.begin(), found.end());
    }

    double score = 0;
    for (lxb_dom_element_t* el : nodes) {
        lxb_dom_node_t* node = lxb_dom_interface_node(el);
        if (is_hidden(el) || looks_unlikely(el)) continue;
        if (local_name(node) == "p" && has_ancestor(node, "li")) continue;

        std::string text = TextContent(node);
        size_t begin = 0, end = text.size();
        while (begin < end && is_space(static_cast<unsigned char>(text[begin]))) ++begin;
        while (end > begin && is_space(static_cast<unsigned char>(text[end - 1]))) --end;
        const size_t length = utf8_length(text.substr(begin, end - begin));
        if (length < kMinContentLength) continue;

        score += std::sqrt(static_cast<double>(length - kMinContentLength));
        if (score > kMinReaderableScore) return true;
    }
    return false;
}

}
