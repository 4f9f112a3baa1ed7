#include "customize/CustomizationEngine.hpp"

#include "customize/ColorTheme.hpp"
#include "errors/TemplateError.hpp"
#include "io/CustomizationJson.hpp"
#include "io/JsonRequire.hpp"
#include "util/TextUtil.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace customize {

using nlohmann::json;

namespace {

// JSON objects come back keyed by id; put them back into catalog order.
model::SectionVisibility catalog_ordered(const model::SectionVisibility& parsed) {
    model::SectionVisibility out;
    for (const auto& def : default_sections().sections) {
        if (const auto* s = parsed.find(def.id)) out.sections.push_back(*s);
    }
    for (const auto& s : parsed.sections) {
        if (!out.find(s.id)) out.sections.push_back(s);
    }
    return out;
}

TextStyleOverrides overrides_from_style(const model::TextStyle& t) {
    TextStyleOverrides o;
    o.font_family = t.font_family;
    o.font_weight = t.font_weight;
    o.font_size = t.font_size;
    o.line_height = t.line_height;
    o.letter_spacing = t.letter_spacing;
    return o;
}

TypographyOverrides overrides_from_typography(const model::TypographySettings& t) {
    TypographyOverrides o;
    o.heading = overrides_from_style(t.heading);
    o.body = overrides_from_style(t.body);
    o.accent = overrides_from_style(t.accent);
    o.monospace = overrides_from_style(t.monospace);
    return o;
}

LayoutOverrides overrides_from_layout(const model::LayoutSettings& l) {
    LayoutOverrides o;
    o.margins = l.margins;
    o.section_spacing = l.section_spacing;
    o.item_spacing = l.item_spacing;
    o.line_height = l.line_height;
    o.alignment = l.alignment;
    o.custom_sections = l.custom_sections;
    return o;
}

std::map<std::string, SectionOverride> overrides_from_visibility(const model::SectionVisibility& v) {
    std::map<std::string, SectionOverride> o;
    for (const auto& s : v.sections) o[s.id] = SectionOverride{s.visible, s.order};
    return o;
}

std::string section_css(const model::SectionVisibility& v) {
    std::ostringstream css;
    bool first = true;

    for (const auto& s : visible_sections(v)) {
        if (!first) css << "\n\n";
        first = false;
        css << ".resume-section[data-section=\"" << s.id << "\"] {\n"
            << "  display: block;\n"
            << "  order: " << s.order << ";\n"
            << "}";
    }
    for (const auto& s : v.sections) {
        if (s.visible) continue;
        if (!first) css << "\n\n";
        first = false;
        css << ".resume-section[data-section=\"" << s.id << "\"] {\n"
            << "  display: none;\n"
            << "}";
    }
    return css.str();
}

} // namespace

json CustomizationAnalytics::to_json() const {
    return {
        {"overallScore", overall_score},
        {"atsScore", ats_score},
        {"readabilityScore", readability_score},
        {"designScore", design_score},
        {"contentCompleteness", content_completeness},
        {"recommendations", recommendations},
        {"strengths", strengths},
        {"warnings", warnings},
    };
}

std::string customization_css(const model::TemplateCustomization& c) {
    std::ostringstream css;
    css << "/* Resume Template Customization */\n"
        << color_css(c.color_scheme) << "\n\n"
        << typography_css(c.typography) << "\n\n"
        << layout_css(c.layout) << "\n\n"
        << "/* Section Visibility Styles */\n"
        << section_css(c.section_visibility);
    return css.str();
}

CustomizationEngine::CustomizationEngine(const model::ResumeTemplate& base_template)
    : id_("custom-" + std::to_string(textutil::epoch_millis())),
      template_id_(base_template.id),
      template_name_(base_template.name),
      created_at_(textutil::iso8601_now()),
      updated_at_(created_at_),
      color_scheme_(*predefined_theme("executive")),
      typography_(default_typography()),
      layout_(default_layout()),
      section_visibility_(default_sections()) {}

model::TemplateCustomization CustomizationEngine::current_customization() const {
    model::TemplateCustomization c;
    c.id = id_;
    c.template_id = template_id_;
    c.name = template_name_.empty() ? std::string("Custom Resume") : template_name_ + " (Custom)";
    c.color_scheme = color_scheme_;
    c.typography = typography_;
    c.layout = layout_;
    c.section_visibility = section_visibility_;
    c.metadata.created_at = created_at_;
    c.metadata.updated_at = updated_at_;
    c.metadata.version = "1.0";
    c.metadata.changes = mutations_;
    return c;
}

void CustomizationEngine::apply_color_theme(const std::string& theme_id) {
    auto theme = predefined_theme(theme_id);
    if (!theme) {
        throw errors::validation_error("Color theme '" + theme_id + "' not found", {{"themeId", theme_id}});
    }

    json previous = io::color_scheme_to_json(color_scheme_);
    color_scheme_ = optimize_for_ats(*theme);

    record_change(ChangeKind::Color, "theme", std::move(previous), io::color_scheme_to_json(color_scheme_));
    notify_listeners();
}

void CustomizationEngine::customize_color(model::ColorRole role, const std::string& color) {
    const char* property = model::color_role_str(role);
    if (!is_ats_safe(color)) {
        throw errors::validation_error("Color '" + color + "' is not ATS-safe",
                                       {{"color", color}, {"property", property}});
    }

    model::ColorScheme next = color_scheme_;
    next.get(role) = color;
    next = optimize_for_ats(next);

    json previous = io::color_scheme_to_json(color_scheme_);
    color_scheme_ = next;

    record_change(ChangeKind::Color, property, std::move(previous), io::color_scheme_to_json(color_scheme_));
    notify_listeners();
}

void CustomizationEngine::apply_font_combination(const std::string& name) {
    model::TypographySettings next = apply_professional_combination(name);

    json previous = io::typography_to_json(typography_);
    typography_ = next;

    record_change(ChangeKind::Typography, "combination", std::move(previous), io::typography_to_json(typography_));
    notify_listeners();
}

void CustomizationEngine::customize_typography(const TypographyOverrides& overrides) {
    json previous = io::typography_to_json(typography_);
    typography_ = create_custom_typography(overrides, typography_);

    record_change(ChangeKind::Typography, "settings", std::move(previous), io::typography_to_json(typography_));
    notify_listeners();
}

void CustomizationEngine::apply_layout_preset(const std::string& preset_id) {
    auto preset = layout_preset(preset_id);
    if (!preset) {
        throw errors::validation_error("Layout preset '" + preset_id + "' not found", {{"presetId", preset_id}});
    }

    json previous = io::layout_to_json(layout_);
    layout_ = optimize_for_ats(*preset);

    record_change(ChangeKind::Layout, "preset", std::move(previous), io::layout_to_json(layout_));
    notify_listeners();
}

void CustomizationEngine::customize_layout(const LayoutOverrides& overrides) {
    model::LayoutSettings next = create_custom_layout(overrides, layout_);

    json previous = io::layout_to_json(layout_);
    layout_ = next;

    record_change(ChangeKind::Layout, "settings", std::move(previous), io::layout_to_json(layout_));
    notify_listeners();
}

void CustomizationEngine::toggle_section(const std::string& section_id) {
    model::SectionVisibility next = customize::toggle_section(section_id, section_visibility_);

    json previous = io::section_visibility_to_json(section_visibility_);
    section_visibility_ = next;

    record_change(ChangeKind::Section, "visibility-" + section_id, std::move(previous),
                  io::section_visibility_to_json(section_visibility_));
    notify_listeners();
}

void CustomizationEngine::reorder_sections(const std::vector<std::string>& section_ids) {
    model::SectionVisibility next = customize::reorder_sections(section_ids, section_visibility_);

    json previous = io::section_visibility_to_json(section_visibility_);
    section_visibility_ = next;

    record_change(ChangeKind::Section, "order", std::move(previous),
                  io::section_visibility_to_json(section_visibility_));
    notify_listeners();
}

void CustomizationEngine::apply_role_customization(const std::string& role,
                                                   const std::string& industry,
                                                   const std::string& experience_level) {
    model::SectionVisibility sections = optimize_for_ats(role_specific_sections(role));
    model::TypographySettings typography = typography_;
    model::LayoutSettings layout = layout_;

    if (!industry.empty()) {
        typography = create_custom_typography(industry_recommendations(industry), typography_);
    }
    if (!experience_level.empty()) {
        layout = create_custom_layout(experience_based_recommendations(experience_level), layout_);
    }

    json previous = state_snapshot();
    section_visibility_ = sections;
    typography_ = typography;
    layout_ = layout;

    json meta = {{"role", role}};
    if (!industry.empty()) meta["industry"] = industry;
    if (!experience_level.empty()) meta["experienceLevel"] = experience_level;

    record_change(ChangeKind::Role, "customization", std::move(previous), state_snapshot(), std::move(meta));
    notify_listeners();
}

void CustomizationEngine::reset_to_defaults() {
    json previous = state_snapshot();

    color_scheme_ = *predefined_theme("executive");
    typography_ = default_typography();
    layout_ = default_layout();
    section_visibility_ = default_sections();
    history_.clear();

    record_change(ChangeKind::Reset, "all", std::move(previous), state_snapshot());
    notify_listeners();
}

bool CustomizationEngine::undo_last_change() {
    const CustomizationChange* last = history_.latest();
    if (!last) return false;

    if (last->kind == ChangeKind::Reset) {
        history_.clear();
        return false;
    }

    // Decode before touching state so a bad record leaves everything as it was.
    model::ColorScheme colors = color_scheme_;
    model::TypographySettings typography = typography_;
    model::LayoutSettings layout = layout_;
    model::SectionVisibility sections = section_visibility_;

    try {
        switch (last->kind) {
            case ChangeKind::Color:
                colors = io::color_scheme_from_json(last->previous_value, "previousValue");
                break;
            case ChangeKind::Typography:
                typography = io::typography_from_json(last->previous_value, "previousValue");
                break;
            case ChangeKind::Layout:
                layout = io::layout_from_json(last->previous_value, "previousValue");
                break;
            case ChangeKind::Section:
                sections = catalog_ordered(io::section_visibility_from_json(last->previous_value, "previousValue"));
                break;
            default: {
                const json& snap = last->previous_value;
                io::detail::require_object(snap, "previousValue");
                colors = io::color_scheme_from_json(io::detail::require_field(snap, "colorScheme", "previousValue"),
                                                    "previousValue.colorScheme");
                typography = io::typography_from_json(io::detail::require_field(snap, "typography", "previousValue"),
                                                      "previousValue.typography");
                layout = io::layout_from_json(io::detail::require_field(snap, "layout", "previousValue"),
                                              "previousValue.layout");
                sections = catalog_ordered(io::section_visibility_from_json(
                    io::detail::require_field(snap, "sectionVisibility", "previousValue"),
                    "previousValue.sectionVisibility"));
                break;
            }
        }
    } catch (const std::runtime_error& e) {
        throw errors::validation_error("Cannot undo change", {{"error", e.what()},
                                                              {"type", change_kind_str(last->kind)}});
    }

    history_.pop_latest();
    color_scheme_ = colors;
    typography_ = typography;
    layout_ = layout;
    section_visibility_ = sections;

    touch();
    notify_listeners();
    return true;
}

CustomizationAnalytics CustomizationEngine::analytics(const json& content) const {
    const ReadabilityScore readability = calculate_readability_score(typography_);
    const LayoutEfficiency layout = calculate_layout_efficiency(layout_, 500);
    const SectionAnalytics sections = section_analytics(section_visibility_, content);

    double ats = 100;
    ats -= std::max(0, 100 - readability.score) * 0.3;
    ats -= std::max(0, 100 - layout.ats_compliance) * 0.4;
    ats -= std::max(0, 100 - sections.ats_score) * 0.3;

    CustomizationAnalytics a;
    a.ats_score = static_cast<int>(std::round(std::max(0.0, ats)));
    a.readability_score = readability.score;
    a.design_score = layout.score;
    a.content_completeness = sections.content_completeness;
    a.overall_score = static_cast<int>(std::round(readability.score * 0.3 + layout.score * 0.3 +
                                                  sections.content_completeness * 0.4));

    for (const auto* recs : {&readability.recommendations, &layout.recommendations, &sections.recommendations}) {
        for (const auto& r : *recs) {
            if (a.recommendations.size() < 5) a.recommendations.push_back(r);
        }
    }

    if (readability.score >= 85) a.strengths.push_back("Excellent typography for readability");
    if (layout.score >= 85) a.strengths.push_back("Well-optimized layout");
    if (sections.content_completeness >= 80) a.strengths.push_back("Comprehensive content coverage");
    if (a.ats_score >= 90) a.strengths.push_back("ATS-optimized formatting");

    if (readability.score < 70) a.warnings.push_back("Typography may need improvement for ATS systems");
    if (layout.score < 70) a.warnings.push_back("Layout may not be optimal for ATS parsing");
    if (sections.content_completeness < 60) a.warnings.push_back("Consider adding more content sections");

    return a;
}

std::string CustomizationEngine::export_customization() const {
    json j = io::customization_to_json(current_customization());
    j["changeHistory"] = history_.to_json();
    j["baseTemplate"] = template_id_;
    return j.dump(2);
}

void CustomizationEngine::import_customization(const std::string& customization_json) {
    json imported;
    try {
        imported = json::parse(customization_json);
    } catch (const json::exception& e) {
        throw errors::validation_error("Failed to import customization", {{"error", e.what()}});
    }

    if (!imported.is_object() || !imported.contains("colorScheme") || !imported.contains("typography") ||
        !imported.contains("layout") || !imported.contains("sectionVisibility")) {
        throw errors::validation_error("Invalid customization format");
    }

    model::ColorScheme colors;
    model::TypographySettings typography;
    model::LayoutSettings layout;
    model::SectionVisibility sections;
    std::vector<CustomizationChange> changes;

    try {
        colors = io::color_scheme_from_json(imported.at("colorScheme"), "colorScheme");
        typography = io::typography_from_json(imported.at("typography"), "typography");
        layout = io::layout_from_json(imported.at("layout"), "layout");
        sections = io::section_visibility_from_json(imported.at("sectionVisibility"), "sectionVisibility");

        if (imported.contains("changeHistory") && !imported.at("changeHistory").is_null()) {
            const json& arr = imported.at("changeHistory");
            io::detail::require_array(arr, "changeHistory");
            for (size_t i = 0; i < arr.size(); ++i) {
                changes.push_back(CustomizationChange::from_json(arr.at(i), "changeHistory[" + std::to_string(i) + "]"));
            }
        }
    } catch (const std::runtime_error& e) {
        throw errors::validation_error("Failed to import customization", {{"error", e.what()}});
    }

    for (model::ColorRole r : model::all_color_roles()) {
        if (!hex_to_rgb(colors.get(r))) {
            throw errors::validation_error("Invalid color format",
                                           {{"property", model::color_role_str(r)}, {"color", colors.get(r)}});
        }
    }

    colors = optimize_for_ats(colors);
    typography = create_custom_typography(overrides_from_typography(typography), default_typography());
    layout = optimize_for_ats(create_custom_layout(overrides_from_layout(layout), default_layout()));
    sections = create_custom_visibility(overrides_from_visibility(sections));

    json previous = state_snapshot();
    color_scheme_ = colors;
    typography_ = typography;
    layout_ = layout;
    section_visibility_ = sections;

    if (!changes.empty()) {
        history_.clear();
        for (auto& c : changes) history_.push(std::move(c));
    }

    record_change(ChangeKind::Import, "customization", std::move(previous), state_snapshot());
    notify_listeners();
}

CustomizationEngine::ListenerId CustomizationEngine::add_listener(Listener listener) {
    const ListenerId id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void CustomizationEngine::remove_listener(ListenerId id) {
    listeners_.erase(id);
}

std::string CustomizationEngine::generate_css() const {
    return customization_css(current_customization());
}

void CustomizationEngine::record_change(ChangeKind kind, const std::string& property,
                                        json previous_value, json new_value, json metadata) {
    CustomizationChange c;
    c.kind = kind;
    c.property = property;
    c.previous_value = std::move(previous_value);
    c.new_value = std::move(new_value);
    c.timestamp = textutil::iso8601_now();
    c.metadata = std::move(metadata);
    history_.push(std::move(c));
    touch();
}

void CustomizationEngine::touch() {
    updated_at_ = textutil::iso8601_now();
    ++mutations_;
}

void CustomizationEngine::notify_listeners() const {
    const model::TemplateCustomization snapshot = current_customization();

    // Copy so a listener may unsubscribe while being called.
    const auto listeners = listeners_;
    for (const auto& kv : listeners) {
        try {
            kv.second(snapshot);
        } catch (const std::exception& e) {
            std::cerr << "CustomizationEngine: listener " << kv.first << " failed: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "CustomizationEngine: listener " << kv.first << " failed: unknown error\n";
        }
    }
}

json CustomizationEngine::state_snapshot() const {
    return {
        {"colorScheme", io::color_scheme_to_json(color_scheme_)},
        {"typography", io::typography_to_json(typography_)},
        {"layout", io::layout_to_json(layout_)},
        {"sectionVisibility", io::section_visibility_to_json(section_visibility_)},
    };
}

} // namespace customize
