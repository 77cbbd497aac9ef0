#pragma once
#include <string>

namespace Unclutter {
    struct Article {
        std::string title;
        std::string byline;
        std::string excerpt;
        std::string site_name;
        std::string image;
        std::string language;
        std::string content;      // serialized HTML of the readable node
        std::string text_content;
        size_t length = 0;        // characters in text_content
    };
}
