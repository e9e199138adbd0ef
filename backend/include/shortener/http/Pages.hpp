#pragma once

#include "shortener/ShortLink.hpp"

#include <string>
#include <vector>

namespace shortener::http {

struct IndexView {
    std::vector<ShortLink> history;
    std::string short_url;   // set after a successful creation
    std::string error;

    // Echoed back into the form when creation failed.
    std::string long_url;
    std::string custom_code;
    std::string expiration_date;
};

std::string html_escape(const std::string& text);

std::string renderIndex(const IndexView& view);

std::string renderPreview(const ShortLink& link);

}
