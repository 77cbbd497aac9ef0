#pragma once
#include <lexbor/html/html.h>
#include <optional>
#include <string>
#include "../interfaces/IBodyStream.hpp"

namespace Unclutter {

// Owning handle for a lexbor HTML document.
class HtmlDocument {
public:
    ~HtmlDocument();
    HtmlDocument(HtmlDocument&& other) noexcept;
    HtmlDocument& operator=(HtmlDocument&& other) noexcept;

    // Non-copyable; use Clone()
    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    // std::nullopt when lexbor fails.
    static std::optional<HtmlDocument> Parse(const std::string& html);
    // Feeds the stream to lexbor chunk by chunk. Exceptions thrown by the
    // stream propagate; the partial document is released.
    static std::optional<HtmlDocument> Parse(IBodyStream& input);

    std::optional<HtmlDocument> Clone() const;
    std::string Serialize() const;

    lxb_html_document_t* get() const { return document_; }

private:
    explicit HtmlDocument(lxb_html_document_t* document) : document_(document) {}

    lxb_html_document_t* document_ = nullptr;
};

namespace Dom {
    std::string SerializeNode(lxb_dom_node_t* node);
    std::string TextContent(lxb_dom_node_t* node);
}

}
