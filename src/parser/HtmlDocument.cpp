#include "HtmlDocument.hpp"
#include <lexbor/html/serialize.h>
#include <utility>
#include <vector>

namespace {

constexpr size_t kParseChunkBytes = 16 * 1024;

lxb_status_t AppendToString(const lxb_char_t* data, size_t len, void* ctx) {
    static_cast<std::string*>(ctx)->append(reinterpret_cast<const char*>(data), len);
    return LXB_STATUS_OK;
}

} // anonymous namespace

namespace Unclutter {

HtmlDocument::~HtmlDocument() {
    if (document_) lxb_html_document_destroy(document_);
}

HtmlDocument::HtmlDocument(HtmlDocument&& other) noexcept
    : document_(std::exchange(other.document_, nullptr)) {}

HtmlDocument& HtmlDocument::operator=(HtmlDocument&& other) noexcept {
    if (this != &other) {
        if (document_) lxb_html_document_destroy(document_);
        document_ = std::exchange(other.document_, nullptr);
    }
    return *this;
}

std::optional<HtmlDocument> HtmlDocument::Parse(const std::string& html) {
    lxb_html_document_t* raw = lxb_html_document_create();
    if (!raw) return std::nullopt;
    HtmlDocument document(raw);

    lxb_status_t status = lxb_html_document_parse(raw,
        reinterpret_cast<const lxb_char_t*>(html.c_str()),
        html.length());
    if (status != LXB_STATUS_OK) return std::nullopt;
    return std::optional<HtmlDocument>(std::move(document));
}

std::optional<HtmlDocument> HtmlDocument::Parse(IBodyStream& input) {
    lxb_html_document_t* raw = lxb_html_document_create();
    if (!raw) return std::nullopt;
    HtmlDocument document(raw);

    if (lxb_html_document_parse_chunk_begin(raw) != LXB_STATUS_OK) return std::nullopt;

    std::vector<char> chunk(kParseChunkBytes);
    size_t n;
    while ((n = input.Read(chunk.data(), chunk.size())) > 0) {
        lxb_status_t status = lxb_html_document_parse_chunk(raw,
            reinterpret_cast<const lxb_char_t*>(chunk.data()), n);
        if (status != LXB_STATUS_OK) return std::nullopt;
    }

    if (lxb_html_document_parse_chunk_end(raw) != LXB_STATUS_OK) return std::nullopt;
    return std::optional<HtmlDocument>(std::move(document));
}

std::optional<HtmlDocument> HtmlDocument::Clone() const {
    if (!document_) return std::nullopt;
    return Parse(Serialize());
}

std::string HtmlDocument::Serialize() const {
    std::string out;
    if (document_) {
        lxb_html_serialize_deep_cb(lxb_dom_interface_node(document_), AppendToString, &out);
    }
    return out;
}

namespace Dom {

std::string SerializeNode(lxb_dom_node_t* node) {
    std::string out;
    if (node) lxb_html_serialize_tree_cb(node, AppendToString, &out);
    return out;
}

std::string TextContent(lxb_dom_node_t* node) {
    if (!node) return "";
    size_t len = 0;
    lxb_char_t* text = lxb_dom_node_text_content(node, &len);
    if (!text) return "";
    std::string out(reinterpret_cast<const char*>(text), len);
    lxb_dom_document_destroy_text(node->owner_document, text);
    return out;
}

}

}
