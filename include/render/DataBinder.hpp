#pragma once

#include "model/Customization.hpp"
#include "model/ResumeData.hpp"
#include "model/Template.hpp"
#include "render/RenderingContext.hpp"

namespace render {

class DataBinder {
public:
    virtual ~DataBinder() = default;

    // `customization` may be null. Sections it hides are not bound.
    virtual BindingResult bind(const model::ResumeTemplate& tmpl,
                               const model::ResumeData& resume,
                               const model::TemplateCustomization* customization) = 0;
};

// Binds resume fields to template sections and applies each field's validation rules.
//   REQUIRED_FIELD_MISSING  required field empty (not recoverable)
//   REQUIRED_SECTION_EMPTY  required section has no data
//   FIELD_VALIDATION_ERROR  a rule or max length failed
class ResumeDataBinder final : public DataBinder {
public:
    BindingResult bind(const model::ResumeTemplate& tmpl,
                       const model::ResumeData& resume,
                       const model::TemplateCustomization* customization) override;
};

// Raw payload for one template section, null when the resume has nothing for it.
nlohmann::json section_data(const model::SectionDefinition& section, const model::ResumeData& resume);

// Empty string when `value` passes `rule`, else the message to report.
std::string check_rule(const model::ValidationRule& rule, const std::string& field_name, const std::string& value);

} // namespace render
