#include "render/RenderedTemplate.hpp"

#include "io/CustomizationJson.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace render {

nlohmann::json RenderedContent::to_json() const {
    nlohmann::json j;
    j["html"] = html;
    j["css"] = css;
    j["javascript"] = javascript;
    j["assets"] = assets;
    return j;
}

std::string content_checksum(const std::string& s) {
    uint32_t h = 0;
    for (unsigned char c : s) {
        h = h * 31u + c;
    }
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", h);
    return buf;
}

nlohmann::json RenderedTemplate::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["templateId"] = template_id;
    j["resumeId"] = resume_id;
    j["customizations"] = customizations ? io::customization_to_json(*customizations) : nlohmann::json();
    j["rendered"] = rendered.to_json();

    j["metadata"] = {
        {"generatedAt", metadata.generated_at},
        {"renderingTime", metadata.rendering_time_ms},
        {"version", metadata.version},
        {"checksum", metadata.checksum},
        {"size", {
            {"html", metadata.size.html},
            {"css", metadata.size.css},
            {"total", metadata.size.total},
        }},
    };

    j["warnings"] = warnings;
    return j;
}

void RenderedTemplate::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

} // namespace render
