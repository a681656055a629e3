#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace whisperkeys::json
{

// Minimal JSON document model for the shortcut configuration files.
// Objects keep their members in document order so group order survives a
// load/save cycle. Not intended as a general-purpose JSON library.
class Value
{
   public:
    enum class Type
    {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object,
    };

    using Member = std::pair<std::string, Value>;

    Value() = default;
    Value(bool b) : type_(Type::Bool), bool_(b) {}
    Value(double n) : type_(Type::Number), number_(n) {}
    Value(int n) : type_(Type::Number), number_(static_cast<double>(n)) {}
    Value(const char* s) : type_(Type::String), string_(s ? s : "") {}
    Value(std::string s) : type_(Type::String), string_(std::move(s)) {}

    static Value array() { return Value(Type::Array); }
    static Value object() { return Value(Type::Object); }

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    bool               as_bool(bool def = false) const { return is_bool() ? bool_ : def; }
    double             as_number(double def = 0.0) const { return is_number() ? number_ : def; }
    const std::string& as_string() const { return string_; }

    // Array access
    const std::vector<Value>& items() const { return items_; }
    void                      push_back(Value v);

    // Object access. find() returns nullptr for a missing key or a non-object.
    const std::vector<Member>& members() const { return members_; }
    const Value*               find(const std::string& key) const;
    void                       set(const std::string& key, Value v);

    // Typed member lookups with defaults (missing or wrong type -> def).
    std::string get_string(const std::string& key, const std::string& def = "") const;
    bool        get_bool(const std::string& key, bool def) const;

   private:
    explicit Value(Type t) : type_(t) {}

    Type                type_   = Type::Null;
    bool                bool_   = false;
    double              number_ = 0.0;
    std::string         string_;
    std::vector<Value>  items_;
    std::vector<Member> members_;
};

struct ParseError
{
    std::string message;
    size_t      offset = 0;
};

// Parse a complete document. Trailing non-whitespace is an error.
std::optional<Value> parse(const std::string& text, ParseError* error = nullptr);

// Serialize with the given indent width (0 = compact, single line).
std::string dump(const Value& value, int indent = 2);

std::string escape(const std::string& s);

}   // namespace whisperkeys::json
