#include "render/HtmlRenderer.hpp"

#include "util/TextUtil.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace render {

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 32);
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;";  break;
            case '<': out += "&lt;";   break;
            case '>': out += "&gt;";   break;
            case '"': out += "&quot;"; break;
            default:  out += c;        break;
        }
    }
    return out;
}

namespace {

void append_if(std::string& html, const char* tag, const char* cls, const std::string& text) {
    if (text.empty()) return;
    html += "<";
    html += tag;
    html += " class=\"";
    html += cls;
    html += "\">";
    html += html_escape(text);
    html += "</";
    html += tag;
    html += ">\n";
}

std::string join_nonempty(const std::vector<std::string>& parts, const std::string& sep) {
    std::vector<std::string> kept;
    for (const auto& p : parts) {
        if (!p.empty()) kept.push_back(p);
    }
    return textutil::join(kept, sep);
}

void append_list(std::string& html, const char* cls, const std::vector<std::string>& items) {
    if (items.empty()) return;
    html += "<ul class=\"";
    html += cls;
    html += "\">\n";
    for (const auto& item : items) {
        html += "<li>" + html_escape(item) + "</li>\n";
    }
    html += "</ul>\n";
}

std::string json_html(const nlohmann::json& data) {
    if (data.is_string()) return "<p>" + html_escape(data.get<std::string>()) + "</p>\n";

    if (data.is_array()) {
        std::string html = "<ul class=\"generic-list\">\n";
        for (const auto& item : data) {
            const std::string text = item.is_string() ? item.get<std::string>() : item.dump();
            html += "<li>" + html_escape(text) + "</li>\n";
        }
        html += "</ul>\n";
        return html;
    }

    if (data.is_object()) {
        std::string html = "<dl class=\"generic-fields\">\n";
        for (auto it = data.begin(); it != data.end(); ++it) {
            const std::string text = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
            html += "<dt>" + html_escape(it.key()) + "</dt><dd>" + html_escape(text) + "</dd>\n";
        }
        html += "</dl>\n";
        return html;
    }

    if (data.is_null()) return {};
    return "<p>" + html_escape(data.dump()) + "</p>\n";
}

struct SectionBodyVisitor {
    std::string operator()(const model::PersonalInfo& p) const {
        std::string html = "<div class=\"personal-info\">\n";
        append_if(html, "h1", "name", p.full_name);
        append_if(html, "p", "title", p.title);

        html += "<div class=\"contact-info\">\n";
        const std::pair<const char*, const std::string*> items[] = {
            {"Email", &p.email}, {"Phone", &p.phone}, {"Location", &p.location},
            {"LinkedIn", &p.linkedin}, {"Website", &p.website},
        };
        for (const auto& item : items) {
            if (item.second->empty()) continue;
            html += "<div class=\"contact-item\"><span class=\"contact-label\">";
            html += item.first;
            html += ":</span> <span class=\"contact-value\">" + html_escape(*item.second) + "</span></div>\n";
        }
        html += "</div>\n</div>\n";
        return html;
    }

    std::string operator()(const SummaryText& s) const {
        std::string html = "<div class=\"summary\">\n";
        append_if(html, "p", "summary-text", s.text);
        html += "</div>\n";
        return html;
    }

    std::string operator()(const std::vector<model::ExperienceItem>& items) const {
        std::string html = "<div class=\"experience\">\n";
        for (const auto& e : items) {
            html += "<div class=\"experience-item\">\n";
            append_if(html, "h3", "position", e.position);
            append_if(html, "h4", "company", join_nonempty({e.company, e.location}, " - "));
            if (!e.start_date.empty()) {
                const std::string end = e.current ? std::string("Present") : e.end_date;
                append_if(html, "p", "duration", join_nonempty({e.start_date, end}, " - "));
            }
            append_if(html, "div", "description", e.description);
            append_list(html, "achievements", e.achievements);
            html += "</div>\n";
        }
        html += "</div>\n";
        return html;
    }

    std::string operator()(const std::vector<model::EducationItem>& items) const {
        std::string html = "<div class=\"education\">\n";
        for (const auto& e : items) {
            html += "<div class=\"education-item\">\n";
            append_if(html, "h3", "degree", e.degree);
            append_if(html, "h4", "institution", join_nonempty({e.institution, e.location}, " - "));
            append_if(html, "p", "graduation-year", e.graduation_year);
            if (!e.gpa.empty()) append_if(html, "p", "gpa", "GPA: " + e.gpa);
            html += "</div>\n";
        }
        html += "</div>\n";
        return html;
    }

    std::string operator()(const model::SkillGroups& s) const {
        std::string html = "<div class=\"skills\">\n<div class=\"skills-list\">\n";
        for (const auto& skill : s.all()) {
            html += "<span class=\"skill-item\">" + html_escape(skill) + "</span>\n";
        }
        html += "</div>\n</div>\n";
        return html;
    }

    std::string operator()(const std::vector<model::CertificationItem>& items) const {
        std::string html = "<div class=\"certifications\">\n";
        for (const auto& c : items) {
            html += "<div class=\"certification-item\">\n";
            append_if(html, "h3", "certification-name", c.name);
            append_if(html, "p", "issuer", join_nonempty({c.issuer, c.date}, ", "));
            html += "</div>\n";
        }
        html += "</div>\n";
        return html;
    }

    std::string operator()(const std::vector<model::ProjectItem>& items) const {
        std::string html = "<div class=\"projects\">\n";
        for (const auto& p : items) {
            html += "<div class=\"project-item\">\n";
            append_if(html, "h3", "project-name", p.name);
            append_if(html, "p", "project-description", p.description);
            if (!p.url.empty()) {
                html += "<a class=\"project-link\" href=\"" + html_escape(p.url) + "\">" + html_escape(p.url) + "</a>\n";
            }
            if (!p.technologies.empty()) {
                append_if(html, "p", "technologies", textutil::join(p.technologies, ", "));
            }
            html += "</div>\n";
        }
        html += "</div>\n";
        return html;
    }

    std::string operator()(const LanguageList& l) const {
        std::string html = "<div class=\"languages\">\n";
        append_list(html, "language-list", l.items);
        html += "</div>\n";
        return html;
    }

    std::string operator()(const nlohmann::json& data) const {
        return "<div class=\"generic-section\">\n" + json_html(data) + "</div>\n";
    }
};

} // namespace

std::string render_section_html(const ProcessedSection& section) {
    std::string html;
    html += "<section class=\"resume-section section-";
    html += model::section_type_str(section.type);
    if (!section.styling.css_class.empty()) html += " " + section.styling.css_class;
    html += "\" data-section=\"" + html_escape(section.catalog_id) + "\"";
    html += " data-section-type=\"";
    html += model::section_type_str(section.type);
    html += "\"";
    if (section.layout.alignment != "left") html += " data-align=\"" + html_escape(section.layout.alignment) + "\"";
    html += ">\n";

    if (section.type != model::SectionType::PersonalInfo) {
        html += "<h2 class=\"section-title\">" + html_escape(section.name) + "</h2>\n";
    }
    html += std::visit(SectionBodyVisitor{}, section.payload);
    html += "</section>\n";
    return html;
}

std::string render_document_html(const model::ResumeTemplate& tmpl,
                                 const std::vector<ProcessedSection>& sections,
                                 const std::string& format) {
    std::string html;
    html.reserve(4096);

    html += "<!doctype html>\n";
    html += "<html lang=\"en\">\n<head>\n";
    html += "<meta charset=\"utf-8\"/>\n";
    html += "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\"/>\n";
    html += "<title>Resume - " + html_escape(tmpl.name) + "</title>\n";
    html += "</head>\n";
    html += "<body class=\"format-" + html_escape(format) + "\">\n";
    html += "<div class=\"resume-template template-" + html_escape(tmpl.layout.format) + "\" data-template-id=\"" +
            html_escape(tmpl.id) + "\">\n";

    for (const auto& s : sections) {
        if (!s.visible) continue;
        html += render_section_html(s);
    }

    html += "</div>\n</body>\n</html>\n";
    return html;
}

std::string template_script(const model::ResumeTemplate& tmpl) {
    // JSON string literal, with "</" broken up so it cannot close a <script> element.
    std::string id = nlohmann::json(tmpl.id).dump();
    for (size_t pos = id.find("</"); pos != std::string::npos; pos = id.find("</", pos + 3)) {
        id.replace(pos, 2, "<\\/");
    }

    std::string js;
    js += "document.addEventListener('DOMContentLoaded', function() {\n";
    js += "  document.body.setAttribute('data-template', " + id + ");\n";
    js += "});\n";
    return js;
}

} // namespace render
