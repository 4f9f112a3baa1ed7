#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "customize/ChangeHistory.hpp"
#include "customize/Layout.hpp"
#include "customize/SectionVisibility.hpp"
#include "customize/Typography.hpp"
#include "model/Customization.hpp"
#include "model/Template.hpp"
#include "nlohmann/json.hpp"

namespace customize {

struct CustomizationAnalytics {
    int overall_score = 0;
    int ats_score = 0;
    int readability_score = 0;
    int design_score = 0;
    int content_completeness = 0;
    std::vector<std::string> recommendations; // at most five
    std::vector<std::string> strengths;
    std::vector<std::string> warnings;

    nlohmann::json to_json() const;
};

// Color block, typography, layout, then per-section visibility selectors.
std::string customization_css(const model::TemplateCustomization& c);

// Stateful editing session over one base template. Not thread-safe: one writer per engine.
class CustomizationEngine {
public:
    using Listener = std::function<void(const model::TemplateCustomization&)>;
    using ListenerId = size_t;

    explicit CustomizationEngine(const model::ResumeTemplate& base_template);

    model::TemplateCustomization current_customization() const;

    // Mutations validate first; a thrown error leaves the state untouched.
    void apply_color_theme(const std::string& theme_id);
    void customize_color(model::ColorRole role, const std::string& color);
    void apply_font_combination(const std::string& name);
    void customize_typography(const TypographyOverrides& overrides);
    void apply_layout_preset(const std::string& preset_id);
    void customize_layout(const LayoutOverrides& overrides);
    void toggle_section(const std::string& section_id);
    void reorder_sections(const std::vector<std::string>& section_ids);
    void apply_role_customization(const std::string& role,
                                  const std::string& industry = {},
                                  const std::string& experience_level = {});
    void reset_to_defaults();

    // False when there is nothing to undo, or when the latest record is a reset.
    bool undo_last_change();

    // `content` maps section id -> payload; pass an empty object when unknown.
    CustomizationAnalytics analytics(const nlohmann::json& content = nlohmann::json::object()) const;

    std::string export_customization() const;
    void import_customization(const std::string& customization_json);

    ListenerId add_listener(Listener listener);
    void remove_listener(ListenerId id);
    size_t listener_count() const { return listeners_.size(); }

    std::string generate_css() const;

    const ChangeHistory& history() const { return history_; }

private:
    void record_change(ChangeKind kind, const std::string& property,
                       nlohmann::json previous_value, nlohmann::json new_value,
                       nlohmann::json metadata = nullptr);
    void touch();
    void notify_listeners() const;
    nlohmann::json state_snapshot() const;

    std::string id_;
    std::string template_id_;
    std::string template_name_;
    std::string created_at_;
    std::string updated_at_;
    int mutations_ = 0;

    model::ColorScheme color_scheme_;
    model::TypographySettings typography_;
    model::LayoutSettings layout_;
    model::SectionVisibility section_visibility_;

    ChangeHistory history_;

    ListenerId next_listener_id_ = 1;
    std::map<ListenerId, Listener> listeners_;
};

} // namespace customize
