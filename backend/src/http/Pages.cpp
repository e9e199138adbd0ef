#include "shortener/http/Pages.hpp"
#include "shortener/util/parse.hpp"
#include "shortener/util/time.hpp"

#include <sstream>

namespace shortener::http {

namespace {

constexpr auto STYLE = R"(
body{margin:0;font-family:Verdana,Arial,Helvetica,sans-serif;background:#fff;color:#000;text-align:center}
h1{margin:60px 0 20px;font-size:28px;color:#c00}
#main{max-width:520px;margin:0 auto;padding:0 10px}
#urlBox{width:100%;padding:6px;font-size:16px;border:1px solid #999;box-sizing:border-box}
#shortenBtn{margin-top:8px;padding:4px 18px;font-size:14px;cursor:pointer}
details{margin-top:8px;text-align:left;font-size:13px}
details label{display:block;margin-bottom:4px}
details input{width:100%;padding:4px;margin-bottom:8px;box-sizing:border-box}
#result{margin-top:12px;font-size:14px;word-break:break-all}
#result a{color:#c00;text-decoration:none}
#error{margin-top:8px;color:#c00;font-size:13px}
table{width:100%;margin-top:15px;font-size:.85rem;border-collapse:collapse}
td,th{padding:6px;word-break:break-all;border-bottom:1px solid #ddd}
th{color:#c00;text-align:left}
)";

void writeHead(std::ostringstream& out, const std::string& title) {
    out << "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n"
        << "<meta charset=\"utf-8\">\n"
        << "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n"
        << "<title>" << html_escape(title) << "</title>\n"
        << "<style>" << STYLE << "</style>\n"
        << "</head>\n";
}

}

std::string html_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string renderIndex(const IndexView& view) {
    std::ostringstream out;
    writeHead(out, "URL Shortener");

    out << "<body>\n<h1>URL Shortener</h1>\n<div id=\"main\">\n"
        << "<form method=\"post\" action=\"/\">\n"
        << "<input id=\"urlBox\" type=\"url\" name=\"long_url\" placeholder=\"Enter a long URL\" required value=\""
        << html_escape(view.long_url) << "\">\n"
        << "<details" << (view.custom_code.empty() && view.expiration_date.empty() ? "" : " open") << ">\n"
        << "<summary>Further options/custom URL</summary>\n"
        << "<label for=\"custom_code\">Custom code (optional)</label>\n"
        << "<input id=\"custom_code\" type=\"text\" name=\"custom_code\" value=\""
        << html_escape(view.custom_code) << "\">\n"
        << "<label for=\"expiration_date\">Expiration date (optional)</label>\n"
        << "<input id=\"expiration_date\" type=\"date\" name=\"expiration_date\" value=\""
        << html_escape(view.expiration_date) << "\">\n"
        << "</details>\n"
        << "<button id=\"shortenBtn\" type=\"submit\">Shorten</button>\n"
        << "</form>\n";

    if (!view.error.empty()) out << "<div id=\"error\">" << html_escape(view.error) << "</div>\n";

    if (!view.short_url.empty()) {
        const auto url = html_escape(view.short_url);
        out << "<div id=\"result\">Your short URL: <a href=\"" << url << "\">" << url << "</a></div>\n";
    }

    if (!view.history.empty()) {
        out << "<table>\n<tr><th>Code</th><th>Destination</th><th>Clicks</th><th>Expires</th><th></th></tr>\n";
        for (const auto& link : view.history) {
            const auto code = html_escape(link.short_code);
            const auto href = html_escape("/" + util::url_encode(link.short_code));
            out << "<tr>"
                << "<td><a href=\"" << href << "\">" << code << "</a> "
                << "<a href=\"" << href << "+\" title=\"Preview\">+</a></td>"
                << "<td>" << html_escape(link.long_url) << "</td>"
                << "<td>" << link.clicks << "</td>"
                << "<td>" << (link.expiration ? util::formatIsoDate(*link.expiration) : "Never") << "</td>"
                << "<td><form method=\"post\" action=\"/delete\">"
                << "<input type=\"hidden\" name=\"short_code\" value=\"" << code << "\">"
                << "<button type=\"submit\">Delete</button></form></td>"
                << "</tr>\n";
        }
        out << "</table>\n";
    }

    out << "</div>\n</body>\n</html>\n";
    return out.str();
}

std::string renderPreview(const ShortLink& link) {
    std::ostringstream out;
    writeHead(out, "Preview: " + link.short_code);

    const auto href = html_escape("/" + util::url_encode(link.short_code));
    out << "<body>\n<div id=\"main\">\n<h1>Link preview</h1>\n"
        << "<p>This short link points to:</p>\n"
        << "<p id=\"result\">" << html_escape(link.long_url) << "</p>\n"
        << "<p>Clicks: " << link.clicks << "</p>\n"
        << "<form method=\"get\" action=\"" << href << "\">"
        << "<button id=\"shortenBtn\" type=\"submit\">Continue to site</button></form>\n"
        << "</div>\n</body>\n</html>\n";
    return out.str();
}

}
