#pragma once

#include <string>

namespace render {

// Drops comments and whitespace between tags, collapses remaining runs to one space.
std::string minify_html(const std::string& html);

// Drops comments, whitespace around punctuation and the last semicolon of each block.
std::string minify_css(const std::string& css);

// Places a <style> block just before </head>; prepends it when there is no head.
std::string inline_css(const std::string& html, const std::string& css);

// Drops comments, trailing whitespace and blank lines.
std::string compress_html(const std::string& html);

} // namespace render
