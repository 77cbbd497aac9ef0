#pragma once
#include <optional>
#include <string>
#include "IBodyStream.hpp"
#include "../parser/Article.hpp"
#include "../parser/HtmlDocument.hpp"
#include "../utils/UrlUtil.hpp"

namespace Unclutter {

struct ParseResult {
    std::optional<Article> article;
    std::string error;
};

class IExtractionEngine {
public:
    virtual ~IExtractionEngine() = default;
    virtual ParseResult Parse(IBodyStream& input, const Url& page_url) = 0;
    virtual ParseResult ParseDocument(const HtmlDocument& document, const Url& page_url) = 0;
    virtual bool Check(IBodyStream& input) = 0;
    virtual bool CheckDocument(const HtmlDocument& document) = 0;
};

}
