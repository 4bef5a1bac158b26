#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termpanel::json
{

// Minimal JSON document model for our small on-disk files (config, quick
// commands). Not a general-purpose parser: numbers are doubles, no comments.
class Value
{
   public:
    enum class Type : uint8_t
    {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object,
    };

    using Array  = std::vector<Value>;
    using Object = std::map<std::string, Value>;

    Value() = default;
    Value(bool b) : type_(Type::Bool), bool_(b) {}
    Value(double n) : type_(Type::Number), number_(n) {}
    Value(int n) : type_(Type::Number), number_(n) {}
    Value(const char* s) : type_(Type::String), string_(s) {}
    Value(std::string s) : type_(Type::String), string_(std::move(s)) {}
    Value(Array a) : type_(Type::Array), array_(std::move(a)) {}
    Value(Object o) : type_(Type::Object), object_(std::move(o)) {}

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    bool               as_bool() const { return bool_; }
    double             as_number() const { return number_; }
    const std::string& as_string() const { return string_; }
    const Array&       as_array() const { return array_; }
    Array&             as_array() { return array_; }
    const Object&      as_object() const { return object_; }
    Object&            as_object() { return object_; }

    // Object member lookup. Returns nullptr when absent or not an object.
    const Value* find(const std::string& key) const;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<int64_t>     get_int(const std::string& key) const;
    std::optional<bool>        get_bool(const std::string& key) const;

   private:
    Type        type_   = Type::Null;
    bool        bool_   = false;
    double      number_ = 0.0;
    std::string string_;
    Array       array_;
    Object      object_;
};

// Parse a complete document. Returns std::nullopt on any syntax error; the
// error position is written to *error_offset when non-null.
std::optional<Value> parse(std::string_view text, size_t* error_offset = nullptr);

// Serialize with two-space indentation.
std::string serialize(const Value& value);

std::string escape(std::string_view s);

}   // namespace termpanel::json
