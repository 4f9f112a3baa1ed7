#include "render/Minify.hpp"

#include "util/TextUtil.hpp"

#include <cctype>
#include <cstring>
#include <sstream>

namespace render {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string strip_blocks(const std::string& s, const char* open, const char* close) {
    const size_t open_len = std::strlen(open);
    const size_t close_len = std::strlen(close);

    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        const size_t start = s.find(open, i);
        if (start == std::string::npos) {
            out.append(s, i, std::string::npos);
            break;
        }
        out.append(s, i, start - i);

        const size_t end = s.find(close, start + open_len);
        if (end == std::string::npos) break; // unterminated comment runs to the end
        i = end + close_len;
    }
    return out;
}

std::string collapse_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending = false;
    for (char c : s) {
        if (is_space(c)) {
            pending = true;
            continue;
        }
        if (pending && !out.empty()) out += ' ';
        pending = false;
        out += c;
    }
    return out;
}

} // namespace

std::string minify_html(const std::string& html) {
    const std::string s = strip_blocks(html, "<!--", "-->");

    // Whitespace-only runs between tags disappear.
    std::string tight;
    tight.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '>') {
            size_t j = i + 1;
            while (j < s.size() && is_space(s[j])) ++j;
            tight += '>';
            if (j < s.size() && s[j] == '<') {
                i = j;
            } else {
                i = i + 1;
            }
            continue;
        }
        tight += s[i];
        ++i;
    }

    return textutil::trim_copy(collapse_spaces(tight));
}

std::string minify_css(const std::string& css) {
    const std::string s = collapse_spaces(strip_blocks(css, "/*", "*/"));

    auto is_punct = [](char c) { return c == '{' || c == '}' || c == ':' || c == ';' || c == ','; };

    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == ' ') {
            const bool before_punct = i + 1 < s.size() && is_punct(s[i + 1]);
            const bool after_punct = !out.empty() && is_punct(out.back());
            if (before_punct || after_punct) continue;
        }
        if (c == '}' && !out.empty() && out.back() == ';') out.pop_back();
        out += c;
    }
    return textutil::trim_copy(out);
}

std::string inline_css(const std::string& html, const std::string& css) {
    const std::string style = "<style>\n" + css + "\n</style>\n";

    const size_t head = html.find("</head>");
    if (head == std::string::npos) return style + html;

    std::string out = html;
    out.insert(head, style);
    return out;
}

std::string compress_html(const std::string& html) {
    const std::string s = strip_blocks(html, "<!--", "-->");

    std::istringstream in(s);
    std::string out;
    out.reserve(s.size());

    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && is_space(line.back())) line.pop_back();
        if (line.empty()) continue;
        out += line;
        out += '\n';
    }
    return out;
}

} // namespace render
