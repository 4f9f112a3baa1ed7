#pragma once

#include <string>
#include <vector>

#include "model/Template.hpp"
#include "render/RenderingContext.hpp"

namespace render {

std::string html_escape(const std::string& s);

// One <section> per processed section, tagged with data-section="<catalog id>".
std::string render_section_html(const ProcessedSection& section);

// Full document shell. The stylesheet is not embedded here; the optimization stage inlines it.
std::string render_document_html(const model::ResumeTemplate& tmpl,
                                 const std::vector<ProcessedSection>& sections,
                                 const std::string& format);

std::string template_script(const model::ResumeTemplate& tmpl);

} // namespace render
