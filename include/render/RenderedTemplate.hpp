#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "model/Customization.hpp"
#include "nlohmann/json.hpp"

namespace render {

struct RenderedContent {
    std::string html;
    std::string css;
    std::string javascript;
    std::vector<std::string> assets;

    nlohmann::json to_json() const;
};

struct RenderSize {
    size_t html = 0;
    size_t css = 0;
    size_t total = 0;
};

struct RenderMetadata {
    std::string generated_at;
    long long rendering_time_ms = 0;
    std::string version = "1.0";
    std::string checksum; // 8 lowercase hex digits
    RenderSize size;
};

struct RenderedTemplate {
    std::string id; // rendered-<templateId>-<epoch ms>
    std::string template_id;
    std::string resume_id;
    std::optional<model::TemplateCustomization> customizations;

    RenderedContent rendered;
    RenderMetadata metadata;
    std::vector<std::string> warnings;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// 32-bit rolling hash h = h*31 + c over `s`, as 8 hex digits.
std::string content_checksum(const std::string& s);

} // namespace render
