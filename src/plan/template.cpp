// src/plan/template.cpp

#include "hmb/plan/template.h"

#include <cctype>

namespace hmb {
namespace plan {

namespace {

std::string_view TrimSpaces(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

// Walks `text`, calling on_literal(chunk) and on_name(name) in order.
template <class OnLiteral, class OnName>
bool Walk(std::string_view text, Error* err, OnLiteral&& on_literal, OnName&& on_name) {
  usize pos = 0;
  while (pos < text.size()) {
    const usize open = text.find("{{", pos);
    if (open == std::string_view::npos) {
      on_literal(text.substr(pos));
      return true;
    }
    on_literal(text.substr(pos, open - pos));
    const usize close = text.find("}}", open + 2);
    if (close == std::string_view::npos) {
      SetErr(err, ErrorKind::Template,
             "unterminated placeholder at offset " + std::to_string(open) + " in '" +
                 std::string(text) + "'");
      return false;
    }
    const std::string_view name = TrimSpaces(text.substr(open + 2, close - open - 2));
    if (name.empty()) {
      SetErr(err, ErrorKind::Template, "empty placeholder in '" + std::string(text) + "'");
      return false;
    }
    if (!on_name(name)) return false;
    pos = close + 2;
  }
  return true;
}

}  // namespace

bool ScanPlaceholders(std::string_view text, std::vector<std::string>* names, Error* err) {
  if (!names) {
    SetErr(err, ErrorKind::Template, "ScanPlaceholders: names is null");
    return false;
  }
  return Walk(
      text, err, [](std::string_view) {},
      [&](std::string_view name) {
        names->emplace_back(name);
        return true;
      });
}

bool RenderTemplate(std::string_view text, const Bindings& vars, std::string* out, Error* err) {
  if (!out) {
    SetErr(err, ErrorKind::Template, "RenderTemplate: out is null");
    return false;
  }
  std::string res;
  res.reserve(text.size());
  const bool ok = Walk(
      text, err, [&](std::string_view lit) { res.append(lit); },
      [&](std::string_view name) {
        auto it = vars.find(std::string(name));
        if (it == vars.end()) {
          SetErr(err, ErrorKind::Template,
                 "placeholder '{{" + std::string(name) + "}}' has no value");
          return false;
        }
        res.append(it->second);
        return true;
      });
  if (!ok) return false;
  *out = std::move(res);
  return true;
}

}  // namespace plan
}  // namespace hmb
