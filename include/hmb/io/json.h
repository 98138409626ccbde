#pragma once
// hmb/io/json.h
//
// Minimal JSON (subset) reader/writer used for plan documents and the
// per-run status records. No external JSON dependency.
//
// Supported: objects, arrays, strings (standard escapes; \uXXXX is decoded
// for the ASCII range only, other code points become '?'), numbers, true,
// false, null. Numbers keep their source spelling in Value::str so that an
// axis value written as `1` renders as "1", not "1.000000".

#include "hmb/core/error.h"
#include "hmb/core/types.h"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hmb {
namespace json {

enum class Type : u8 { Null, Bool, Number, String, Array, Object };

struct Value {
  Type type{Type::Null};
  bool b{false};
  double num{0.0};
  std::string str;  // string payload, or the source spelling of a number
  std::vector<Value> arr;
  std::unordered_map<std::string, std::unique_ptr<Value>> obj;
  std::vector<std::string> keys;  // object keys in document order

  Value() = default;
  Value(Value&&) noexcept = default;
  Value& operator=(Value&&) noexcept = default;
  Value(const Value& other) { *this = other; }
  Value& operator=(const Value& other);

  bool IsNull() const { return type == Type::Null; }
  bool IsBool() const { return type == Type::Bool; }
  bool IsNumber() const { return type == Type::Number; }
  bool IsString() const { return type == Type::String; }
  bool IsArray() const { return type == Type::Array; }
  bool IsObject() const { return type == Type::Object; }
};

// Parse a complete document. Errors are ErrorKind::Config and name the line
// and column of the offending input.
bool Parse(std::string_view text, Value* out, Error* err = nullptr);
bool ParseFile(const std::string& path, Value* out, Error* err = nullptr);

// Serialize with object keys in sorted order (stable output).
std::string Dump(const Value& v);

std::string Escape(std::string_view s);

// --------------------------
// Accessors
// --------------------------
const Value* Get(const Value& obj, std::string_view key);

bool GetString(const Value& v, std::string* out);
bool GetBool(const Value& v, bool* out);
bool GetNumber(const Value& v, double* out);
bool GetU64(const Value& v, u64* out);

// Scalars (string, number, bool) as text; numbers use their source spelling.
bool GetScalarText(const Value& v, std::string* out);

// Object members in document order.
std::vector<std::pair<std::string, const Value*>> Members(const Value& obj);

// Object members sorted by key.
std::vector<std::pair<std::string, const Value*>> SortedMembers(const Value& obj);

}  // namespace json
}  // namespace hmb
