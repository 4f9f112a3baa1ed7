#include "io/CustomizationJson.hpp"

#include "io/JsonRequire.hpp"

namespace io {

using json = nlohmann::json;
using namespace detail;

json color_scheme_to_json(const model::ColorScheme& s) {
    json j;
    j["name"] = s.name;
    for (model::ColorRole r : model::all_color_roles()) {
        j[model::color_role_str(r)] = s.get(r);
    }
    return j;
}

model::ColorScheme color_scheme_from_json(const json& j, const std::string& where) {
    require_object(j, where);

    model::ColorScheme s;
    s.name = optional_string(j, "name", where, "Custom Theme");
    for (model::ColorRole r : model::all_color_roles()) {
        s.get(r) = require_string(j, model::color_role_str(r), where);
    }
    return s;
}

static json text_style_to_json(const model::TextStyle& t) {
    json sizes = json::object();
    for (const auto& kv : t.font_size) sizes[kv.first] = kv.second;

    return {
        {"fontFamily", t.font_family},
        {"fontWeight", t.font_weight},
        {"fontSize", sizes},
        {"lineHeight", t.line_height},
        {"letterSpacing", t.letter_spacing},
    };
}

static model::TextStyle text_style_from_json(const json& j, const std::string& where) {
    require_object(j, where);

    model::TextStyle t;
    t.font_family = require_string(j, "fontFamily", where);
    t.font_weight = static_cast<int>(require_number(j, "fontWeight", where));
    t.line_height = require_number(j, "lineHeight", where);
    t.letter_spacing = optional_number(j, "letterSpacing", where, 0.0);

    const json& sizes = require_field(j, "fontSize", where);
    if (sizes.is_number()) {
        t.font_size["base"] = sizes.get<double>();
    } else {
        require_object(sizes, where + ".fontSize");
        for (auto it = sizes.begin(); it != sizes.end(); ++it) {
            if (!it.value().is_number()) {
                throw std::runtime_error(where + ".fontSize." + it.key() + " must be a number");
            }
            t.font_size[it.key()] = it.value().get<double>();
        }
    }
    return t;
}

json typography_to_json(const model::TypographySettings& t) {
    return {
        {"heading", text_style_to_json(t.heading)},
        {"body", text_style_to_json(t.body)},
        {"accent", text_style_to_json(t.accent)},
        {"monospace", text_style_to_json(t.monospace)},
    };
}

model::TypographySettings typography_from_json(const json& j, const std::string& where) {
    require_object(j, where);

    model::TypographySettings t;
    t.heading = text_style_from_json(require_field(j, "heading", where), where + ".heading");
    t.body = text_style_from_json(require_field(j, "body", where), where + ".body");
    t.accent = text_style_from_json(require_field(j, "accent", where), where + ".accent");
    t.monospace = text_style_from_json(require_field(j, "monospace", where), where + ".monospace");
    return t;
}

json layout_to_json(const model::LayoutSettings& l) {
    json custom = json::object();
    for (const auto& kv : l.custom_sections) {
        const auto& a = kv.second;
        json s = json::object();
        if (a.spacing) s["spacing"] = *a.spacing;
        if (a.alignment) s["alignment"] = *a.alignment;
        if (a.width) s["width"] = *a.width;
        if (a.columns) s["columns"] = *a.columns;
        if (a.priority) s["priority"] = *a.priority;
        custom[kv.first] = s;
    }

    return {
        {"margins", {{"top", l.margins.top}, {"right", l.margins.right},
                     {"bottom", l.margins.bottom}, {"left", l.margins.left}}},
        {"sectionSpacing", {{"before", l.section_spacing.before}, {"after", l.section_spacing.after}}},
        {"itemSpacing", l.item_spacing},
        {"lineHeight", l.line_height},
        {"alignment", l.alignment},
        {"customSections", custom},
    };
}

model::LayoutSettings layout_from_json(const json& j, const std::string& where) {
    require_object(j, where);

    model::LayoutSettings l;

    const json& m = require_field(j, "margins", where);
    require_object(m, where + ".margins");
    l.margins.top = require_number(m, "top", where + ".margins");
    l.margins.right = require_number(m, "right", where + ".margins");
    l.margins.bottom = require_number(m, "bottom", where + ".margins");
    l.margins.left = require_number(m, "left", where + ".margins");

    const json& sp = require_field(j, "sectionSpacing", where);
    require_object(sp, where + ".sectionSpacing");
    l.section_spacing.before = require_number(sp, "before", where + ".sectionSpacing");
    l.section_spacing.after = require_number(sp, "after", where + ".sectionSpacing");

    l.item_spacing = require_number(j, "itemSpacing", where);
    l.line_height = require_number(j, "lineHeight", where);
    l.alignment = optional_string(j, "alignment", where, "left");

    if (j.contains("customSections") && !j.at("customSections").is_null()) {
        const json& custom = j.at("customSections");
        require_object(custom, where + ".customSections");
        for (auto it = custom.begin(); it != custom.end(); ++it) {
            const std::string w = where + ".customSections." + it.key();
            const json& s = it.value();
            require_object(s, w);

            model::SectionLayoutAdjustment a;
            if (s.contains("spacing")) a.spacing = require_number(s, "spacing", w);
            if (s.contains("alignment")) a.alignment = require_string(s, "alignment", w);
            if (s.contains("width")) a.width = require_string(s, "width", w);
            if (s.contains("columns")) a.columns = static_cast<int>(require_number(s, "columns", w));
            if (s.contains("priority")) a.priority = static_cast<int>(require_number(s, "priority", w));
            l.custom_sections[it.key()] = a;
        }
    }
    return l;
}

json section_visibility_to_json(const model::SectionVisibility& v) {
    json sections = json::object();
    for (const auto& s : v.sections) {
        sections[s.id] = {
            {"id", s.id},
            {"name", s.name},
            {"visible", s.visible},
            {"required", s.required},
            {"priority", s.priority},
            {"order", s.order},
            {"minItems", s.min_items},
            {"maxItems", s.max_items},
            {"description", s.description},
        };
    }
    return {{"sections", sections}};
}

model::SectionVisibility section_visibility_from_json(const json& j, const std::string& where) {
    require_object(j, where);
    const json& sections = require_field(j, "sections", where);
    require_object(sections, where + ".sections");

    model::SectionVisibility v;
    for (auto it = sections.begin(); it != sections.end(); ++it) {
        const std::string w = where + ".sections." + it.key();
        const json& s = it.value();
        require_object(s, w);

        model::SectionConfig c;
        c.id = it.key();
        c.name = optional_string(s, "name", w, it.key());
        c.visible = require_bool(s, "visible", w);
        c.required = optional_bool(s, "required", w, false);
        c.priority = static_cast<int>(optional_number(s, "priority", w, 0));
        c.order = static_cast<int>(optional_number(s, "order", w, 0));
        c.min_items = static_cast<int>(optional_number(s, "minItems", w, 0));
        c.max_items = static_cast<int>(optional_number(s, "maxItems", w, 0));
        c.description = optional_string(s, "description", w);
        v.sections.push_back(c);
    }
    return v;
}

json customization_to_json(const model::TemplateCustomization& c) {
    return {
        {"id", c.id},
        {"templateId", c.template_id},
        {"name", c.name},
        {"colorScheme", color_scheme_to_json(c.color_scheme)},
        {"typography", typography_to_json(c.typography)},
        {"layout", layout_to_json(c.layout)},
        {"sectionVisibility", section_visibility_to_json(c.section_visibility)},
        {"metadata", {
            {"createdAt", c.metadata.created_at},
            {"updatedAt", c.metadata.updated_at},
            {"version", c.metadata.version},
            {"changes", c.metadata.changes},
        }},
    };
}

model::TemplateCustomization customization_from_json(const json& j, const std::string& where) {
    require_object(j, where);

    model::TemplateCustomization c;
    c.id = optional_string(j, "id", where);
    c.template_id = optional_string(j, "templateId", where);
    c.name = optional_string(j, "name", where);
    c.color_scheme = color_scheme_from_json(require_field(j, "colorScheme", where), where + ".colorScheme");
    c.typography = typography_from_json(require_field(j, "typography", where), where + ".typography");
    c.layout = layout_from_json(require_field(j, "layout", where), where + ".layout");
    c.section_visibility = section_visibility_from_json(require_field(j, "sectionVisibility", where),
                                                        where + ".sectionVisibility");

    if (j.contains("metadata") && j.at("metadata").is_object()) {
        const json& m = j.at("metadata");
        const std::string w = where + ".metadata";
        c.metadata.created_at = optional_string(m, "createdAt", w);
        c.metadata.updated_at = optional_string(m, "updatedAt", w);
        c.metadata.version = optional_string(m, "version", w, "1.0");
        c.metadata.changes = static_cast<int>(optional_number(m, "changes", w, 0));
    }
    return c;
}

} // namespace io
