// src/io/json.cpp

#include "hmb/io/json.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace hmb {
namespace json {

Value& Value::operator=(const Value& other) {
  if (this == &other) return *this;
  type = other.type;
  b = other.b;
  num = other.num;
  str = other.str;
  arr = other.arr;
  keys = other.keys;
  obj.clear();
  obj.reserve(other.obj.size());
  for (const auto& kv : other.obj) {
    obj.emplace(kv.first, std::make_unique<Value>(*kv.second));
  }
  return *this;
}

namespace {

// Plans and status records are shallow; anything deeper is malformed input.
constexpr int kMaxDepth = 64;

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

class Parser {
 public:
  Parser(std::string_view s, Error* err) : s_(s), err_(err) {}

  bool Document(Value* out) {
    if (!ParseValue(out, 0)) return false;
    SkipWs();
    return AtEnd() || Fail("trailing characters after the document");
  }

 private:
  bool AtEnd() const { return i_ >= s_.size(); }
  char Peek() const { return AtEnd() ? '\0' : s_[i_]; }

  void SkipWs() {
    while (!AtEnd() && (s_[i_] == ' ' || s_[i_] == '\n' || s_[i_] == '\r' || s_[i_] == '\t')) ++i_;
  }

  bool Consume(char c) {
    SkipWs();
    if (Peek() != c) return false;
    ++i_;
    return true;
  }

  // Reports the position as 1-based line and column.
  bool Fail(const std::string& what) {
    usize line = 1;
    usize col = 1;
    for (usize k = 0; k < i_ && k < s_.size(); ++k) {
      if (s_[k] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    SetErr(err_, ErrorKind::Config,
           "json: " + what + " (line " + std::to_string(line) + ", column " +
               std::to_string(col) + ")");
    return false;
  }

  bool Literal(std::string_view word, Type type, bool b, Value* out) {
    if (s_.substr(i_, word.size()) != word) return Fail("invalid literal");
    i_ += word.size();
    out->type = type;
    out->b = b;
    return true;
  }

  bool ParseValue(Value* out, int depth) {
    if (depth > kMaxDepth) return Fail("nesting too deep");
    SkipWs();
    if (AtEnd()) return Fail("unexpected end of input");
    const char c = Peek();
    switch (c) {
      case '{': return ParseObject(out, depth);
      case '[': return ParseArray(out, depth);
      case '"':
        out->type = Type::String;
        return ParseString(&out->str);
      case 't': return Literal("true", Type::Bool, true, out);
      case 'f': return Literal("false", Type::Bool, false, out);
      case 'n': return Literal("null", Type::Null, false, out);
      default: break;
    }
    if (c == '-' || IsDigit(c)) return ParseNumber(out);
    return Fail(std::string("unexpected character '") + c + "'");
  }

  bool Hex4(unsigned* code) {
    if (i_ + 4 > s_.size()) return false;
    unsigned v = 0;
    for (usize k = 0; k < 4; ++k) {
      const char h = detail::LowerAscii(s_[i_ + k]);
      if (IsDigit(h)) {
        v = v * 16 + static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        v = v * 16 + static_cast<unsigned>(h - 'a' + 10);
      } else {
        return false;
      }
    }
    i_ += 4;
    *code = v;
    return true;
  }

  // Positioned on the opening quote.
  bool ParseString(std::string* out) {
    ++i_;
    out->clear();
    while (!AtEnd()) {
      const char c = s_[i_++];
      if (c == '"') return true;
      if (c != '\\') {
        out->push_back(c);
        continue;
      }
      if (AtEnd()) break;
      const char e = s_[i_++];
      switch (e) {
        case '"':
        case '\\':
        case '/': out->push_back(e); break;
        case 'b': out->push_back('\b'); break;
        case 'f': out->push_back('\f'); break;
        case 'n': out->push_back('\n'); break;
        case 'r': out->push_back('\r'); break;
        case 't': out->push_back('\t'); break;
        case 'u': {
          unsigned code = 0;
          if (!Hex4(&code)) return Fail("bad \\u escape");
          out->push_back(code < 0x80 ? static_cast<char>(code) : '?');
          break;
        }
        default: return Fail(std::string("unknown escape '\\") + e + "'");
      }
    }
    return Fail("unterminated string");
  }

  // Keeps the source spelling in Value::str.
  bool ParseNumber(Value* out) {
    const usize start = i_;
    auto digits = [&] {
      const usize from = i_;
      while (!AtEnd() && IsDigit(s_[i_])) ++i_;
      return i_ > from;
    };
    if (Peek() == '-') ++i_;
    if (!digits()) return Fail("malformed number");
    if (Peek() == '.') {
      ++i_;
      if (!digits()) return Fail("malformed number");
    }
    if (Peek() == 'e' || Peek() == 'E') {
      ++i_;
      if (Peek() == '+' || Peek() == '-') ++i_;
      if (!digits()) return Fail("malformed number");
    }
    out->type = Type::Number;
    out->str.assign(s_.substr(start, i_ - start));
    out->num = std::strtod(out->str.c_str(), nullptr);
    return true;
  }

  // Comma-separated items up to `close`; positioned on the opening bracket.
  template <class Fn>
  bool Items(char close, const char* what, Fn&& item) {
    ++i_;
    if (Consume(close)) return true;
    do {
      if (!item()) return false;
    } while (Consume(','));
    if (Consume(close)) return true;
    return Fail(std::string("expected ',' or '") + close + "' in " + what);
  }

  bool ParseArray(Value* out, int depth) {
    out->type = Type::Array;
    out->arr.clear();
    return Items(']', "array", [&] {
      out->arr.emplace_back();
      return ParseValue(&out->arr.back(), depth + 1);
    });
  }

  bool ParseObject(Value* out, int depth) {
    out->type = Type::Object;
    out->obj.clear();
    out->keys.clear();
    return Items('}', "object", [&] {
      SkipWs();
      if (Peek() != '"') return Fail("expected a quoted key");
      std::string key;
      if (!ParseString(&key)) return false;
      if (!Consume(':')) return Fail("expected ':' after key '" + key + "'");
      auto val = std::make_unique<Value>();
      if (!ParseValue(val.get(), depth + 1)) return false;
      if (!out->obj.emplace(key, std::move(val)).second) {
        return Fail("duplicate key '" + key + "'");
      }
      out->keys.push_back(std::move(key));
      return true;
    });
  }

  std::string_view s_;
  Error* err_;
  usize i_ = 0;
};

void DumpTo(std::ostringstream& oss, const Value& v) {
  switch (v.type) {
    case Type::Null: oss << "null"; break;
    case Type::Bool: oss << (v.b ? "true" : "false"); break;
    case Type::Number:
      if (!v.str.empty()) {
        oss << v.str;
      } else {
        oss << std::setprecision(17) << v.num;
      }
      break;
    case Type::String: oss << '"' << Escape(v.str) << '"'; break;
    case Type::Array: {
      oss << '[';
      for (usize i = 0; i < v.arr.size(); ++i) {
        if (i) oss << ',';
        DumpTo(oss, v.arr[i]);
      }
      oss << ']';
      break;
    }
    case Type::Object: {
      oss << '{';
      bool first = true;
      for (const auto& kv : SortedMembers(v)) {
        if (!first) oss << ',';
        first = false;
        oss << '"' << Escape(kv.first) << "\":";
        DumpTo(oss, *kv.second);
      }
      oss << '}';
      break;
    }
  }
}

}  // namespace

bool Parse(std::string_view text, Value* out, Error* err) {
  Value v;
  if (!Parser(text, err).Document(&v)) return false;
  *out = std::move(v);
  return true;
}

bool ParseFile(const std::string& path, Value* out, Error* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    SetErr(err, ErrorKind::Config, "cannot open " + path);
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (!Parse(text, out, err)) {
    AddContext(err, path);
    return false;
  }
  return true;
}

std::string Dump(const Value& v) {
  std::ostringstream oss;
  DumpTo(oss, v);
  return oss.str();
}

std::string Escape(std::string_view s) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default: {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20) {
          out += "\\u00";
          out.push_back(kHex[u >> 4]);
          out.push_back(kHex[u & 0xF]);
        } else {
          out.push_back(c);
        }
      }
    }
  }
  return out;
}

const Value* Get(const Value& obj, std::string_view key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.obj.find(std::string(key));
  if (it == obj.obj.end()) return nullptr;
  return it->second.get();
}

bool GetString(const Value& v, std::string* out) {
  if (!v.IsString()) return false;
  *out = v.str;
  return true;
}

bool GetBool(const Value& v, bool* out) {
  if (!v.IsBool()) return false;
  *out = v.b;
  return true;
}

// Numbers, and strings that hold exactly one number ("4" as well as 4).
bool GetNumber(const Value& v, double* out) {
  if (v.IsNumber()) {
    *out = v.num;
    return true;
  }
  if (!v.IsString() || v.str.empty()) return false;
  char* end = nullptr;
  const double x = std::strtod(v.str.c_str(), &end);
  if (end != v.str.c_str() + v.str.size()) return false;
  *out = x;
  return true;
}

bool GetU64(const Value& v, u64* out) {
  double x = 0.0;
  if (!GetNumber(v, &x) || x < 0.0 || x > 1.8e19 || std::floor(x) != x) return false;
  *out = static_cast<u64>(x);
  return true;
}

bool GetScalarText(const Value& v, std::string* out) {
  if (!out) return false;
  switch (v.type) {
    case Type::String:
    case Type::Number:
      *out = v.str;
      return true;
    case Type::Bool:
      *out = v.b ? "true" : "false";
      return true;
    default:
      return false;
  }
}

std::vector<std::pair<std::string, const Value*>> Members(const Value& obj) {
  std::vector<std::pair<std::string, const Value*>> out;
  if (!obj.IsObject()) return out;
  out.reserve(obj.keys.size());
  for (const auto& k : obj.keys) {
    auto it = obj.obj.find(k);
    if (it != obj.obj.end()) out.emplace_back(k, it->second.get());
  }
  return out;
}

std::vector<std::pair<std::string, const Value*>> SortedMembers(const Value& obj) {
  std::vector<std::pair<std::string, const Value*>> out;
  if (!obj.IsObject()) return out;
  out.reserve(obj.obj.size());
  for (const auto& kv : obj.obj) out.emplace_back(kv.first, kv.second.get());
  std::sort(out.begin(), out.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  return out;
}

}  // namespace json
}  // namespace hmb
