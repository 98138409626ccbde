#pragma once
// hmb/plan/template.h
//
// `{{name}}` placeholder substitution for run configuration strings.
// Whitespace inside the braces is ignored ("{{ threads }}" == "{{threads}}").
// Unterminated or empty placeholders are TemplateErrors.

#include "hmb/core/error.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hmb {
namespace plan {

using Bindings = std::unordered_map<std::string, std::string>;

// Collect placeholder names in order of appearance (duplicates kept).
bool ScanPlaceholders(std::string_view text, std::vector<std::string>* names,
                      Error* err = nullptr);

// Substitute every placeholder. A name missing from `vars` is a TemplateError.
bool RenderTemplate(std::string_view text, const Bindings& vars, std::string* out,
                    Error* err = nullptr);

}  // namespace plan
}  // namespace hmb
