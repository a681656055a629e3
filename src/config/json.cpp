#include "json.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace whisperkeys::json
{

// ─── Value ───────────────────────────────────────────────────────────────────

void Value::push_back(Value v)
{
    if (type_ == Type::Null)
        type_ = Type::Array;
    if (type_ == Type::Array)
        items_.push_back(std::move(v));
}

const Value* Value::find(const std::string& key) const
{
    if (type_ != Type::Object)
        return nullptr;
    for (const auto& [k, v] : members_)
    {
        if (k == key)
            return &v;
    }
    return nullptr;
}

void Value::set(const std::string& key, Value v)
{
    if (type_ == Type::Null)
        type_ = Type::Object;
    if (type_ != Type::Object)
        return;
    for (auto& [k, existing] : members_)
    {
        if (k == key)
        {
            existing = std::move(v);
            return;
        }
    }
    members_.emplace_back(key, std::move(v));
}

std::string Value::get_string(const std::string& key, const std::string& def) const
{
    const Value* v = find(key);
    return v && v->is_string() ? v->as_string() : def;
}

bool Value::get_bool(const std::string& key, bool def) const
{
    const Value* v = find(key);
    return v && v->is_bool() ? v->as_bool() : def;
}

// ─── Reader ──────────────────────────────────────────────────────────────────

namespace
{

// Nesting deeper than this is rejected; config documents are three levels deep.
constexpr int kMaxDepth = 64;

class Reader
{
   public:
    explicit Reader(const std::string& text) : text_(text) {}

    std::optional<Value> document(ParseError* error)
    {
        Value v;
        skip_ws();
        if (!value(v, 0))
            return fail(error);
        skip_ws();
        if (pos_ != text_.size())
        {
            message_ = "unexpected trailing characters";
            return fail(error);
        }
        return v;
    }

   private:
    const std::string& text_;
    size_t             pos_ = 0;
    std::string        message_;

    std::optional<Value> fail(ParseError* error)
    {
        if (error)
        {
            error->message = message_.empty() ? "invalid JSON" : message_;
            error->offset  = pos_;
        }
        return std::nullopt;
    }

    bool error(const char* msg)
    {
        if (message_.empty())
            message_ = msg;
        return false;
    }

    void skip_ws()
    {
        while (pos_ < text_.size()
               && (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n'
                   || text_[pos_] == '\r'))
            ++pos_;
    }

    bool literal(const char* word)
    {
        size_t i = 0;
        for (; word[i] != '\0'; ++i)
        {
            if (pos_ + i >= text_.size() || text_[pos_ + i] != word[i])
                return error("invalid literal");
        }
        pos_ += i;
        return true;
    }

    bool value(Value& out, int depth)
    {
        if (depth > kMaxDepth)
            return error("nesting too deep");
        if (pos_ >= text_.size())
            return error("unexpected end of input");

        char c = text_[pos_];
        switch (c)
        {
            case '{':
                return object(out, depth);
            case '[':
                return array(out, depth);
            case '"':
            {
                std::string s;
                if (!string(s))
                    return false;
                out = Value(std::move(s));
                return true;
            }
            case 't':
                out = Value(true);
                return literal("true");
            case 'f':
                out = Value(false);
                return literal("false");
            case 'n':
                out = Value();
                return literal("null");
            default:
                if (c == '-' || (c >= '0' && c <= '9'))
                    return number(out);
                return error("unexpected character");
        }
    }

    bool object(Value& out, int depth)
    {
        out = Value::object();
        ++pos_;   // '{'
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == '}')
        {
            ++pos_;
            return true;
        }
        while (true)
        {
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != '"')
                return error("expected object key");
            std::string key;
            if (!string(key))
                return false;
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != ':')
                return error("expected ':'");
            ++pos_;
            skip_ws();
            Value member;
            if (!value(member, depth + 1))
                return false;
            out.set(key, std::move(member));
            skip_ws();
            if (pos_ >= text_.size())
                return error("unterminated object");
            if (text_[pos_] == ',')
            {
                ++pos_;
                continue;
            }
            if (text_[pos_] == '}')
            {
                ++pos_;
                return true;
            }
            return error("expected ',' or '}'");
        }
    }

    bool array(Value& out, int depth)
    {
        out = Value::array();
        ++pos_;   // '['
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == ']')
        {
            ++pos_;
            return true;
        }
        while (true)
        {
            skip_ws();
            Value item;
            if (!value(item, depth + 1))
                return false;
            out.push_back(std::move(item));
            skip_ws();
            if (pos_ >= text_.size())
                return error("unterminated array");
            if (text_[pos_] == ',')
            {
                ++pos_;
                continue;
            }
            if (text_[pos_] == ']')
            {
                ++pos_;
                return true;
            }
            return error("expected ',' or ']'");
        }
    }

    static void append_utf8(std::string& out, unsigned cp)
    {
        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    bool hex4(unsigned& out)
    {
        if (pos_ + 4 > text_.size())
            return error("truncated \\u escape");
        out = 0;
        for (int i = 0; i < 4; ++i)
        {
            char     h = text_[pos_++];
            unsigned d = 0;
            if (h >= '0' && h <= '9')
                d = static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f')
                d = static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F')
                d = static_cast<unsigned>(h - 'A' + 10);
            else
                return error("invalid \\u escape");
            out = (out << 4) | d;
        }
        return true;
    }

    bool string(std::string& out)
    {
        ++pos_;   // opening quote
        while (pos_ < text_.size())
        {
            char c = text_[pos_++];
            if (c == '"')
                return true;
            if (static_cast<unsigned char>(c) < 0x20)
                return error("control character in string");
            if (c != '\\')
            {
                out += c;
                continue;
            }
            if (pos_ >= text_.size())
                break;
            char e = text_[pos_++];
            switch (e)
            {
                case '"':
                    out += '"';
                    break;
                case '\\':
                    out += '\\';
                    break;
                case '/':
                    out += '/';
                    break;
                case 'b':
                    out += '\b';
                    break;
                case 'f':
                    out += '\f';
                    break;
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'u':
                {
                    unsigned cp = 0;
                    if (!hex4(cp))
                        return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF && pos_ + 1 < text_.size()
                        && text_[pos_] == '\\' && text_[pos_ + 1] == 'u')
                    {
                        pos_ += 2;
                        unsigned low = 0;
                        if (!hex4(low))
                            return false;
                        if (low >= 0xDC00 && low <= 0xDFFF)
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    return error("invalid escape");
            }
        }
        return error("unterminated string");
    }

    bool number(Value& out)
    {
        size_t start = pos_;
        if (text_[pos_] == '-')
            ++pos_;
        while (pos_ < text_.size()
               && ((text_[pos_] >= '0' && text_[pos_] <= '9') || text_[pos_] == '.'
                   || text_[pos_] == 'e' || text_[pos_] == 'E' || text_[pos_] == '+'
                   || text_[pos_] == '-'))
            ++pos_;
        std::string digits = text_.substr(start, pos_ - start);
        char*       end    = nullptr;
        double      v      = std::strtod(digits.c_str(), &end);
        if (digits.empty() || end != digits.c_str() + digits.size() || !std::isfinite(v))
            return error("invalid number");
        out = Value(v);
        return true;
    }
};

// ─── Writer ──────────────────────────────────────────────────────────────────

void write(std::ostringstream& os, const Value& v, int indent, int level)
{
    auto newline = [&](int lvl)
    {
        if (indent <= 0)
            return;
        os << '\n' << std::string(static_cast<size_t>(indent * lvl), ' ');
    };

    switch (v.type())
    {
        case Value::Type::Null:
            os << "null";
            break;
        case Value::Type::Bool:
            os << (v.as_bool() ? "true" : "false");
            break;
        case Value::Type::Number:
        {
            double n = v.as_number();
            if (std::floor(n) == n && std::fabs(n) < 1e15)
            {
                os << static_cast<long long>(n);
            }
            else
            {
                char buf[32];
                std::snprintf(buf, sizeof(buf), "%.17g", n);
                os << buf;
            }
            break;
        }
        case Value::Type::String:
            os << '"' << escape(v.as_string()) << '"';
            break;
        case Value::Type::Array:
        {
            if (v.items().empty())
            {
                os << "[]";
                break;
            }
            os << '[';
            for (size_t i = 0; i < v.items().size(); ++i)
            {
                newline(level + 1);
                write(os, v.items()[i], indent, level + 1);
                if (i + 1 < v.items().size())
                    os << (indent > 0 ? "," : ", ");
            }
            newline(level);
            os << ']';
            break;
        }
        case Value::Type::Object:
        {
            if (v.members().empty())
            {
                os << "{}";
                break;
            }
            os << '{';
            for (size_t i = 0; i < v.members().size(); ++i)
            {
                const auto& [key, member] = v.members()[i];
                newline(level + 1);
                os << '"' << escape(key) << "\": ";
                write(os, member, indent, level + 1);
                if (i + 1 < v.members().size())
                    os << (indent > 0 ? "," : ", ");
            }
            newline(level);
            os << '}';
            break;
        }
    }
}

}   // namespace

std::optional<Value> parse(const std::string& text, ParseError* error)
{
    Reader reader(text);
    return reader.document(error);
}

std::string dump(const Value& value, int indent)
{
    std::ostringstream os;
    write(os, value, indent, 0);
    if (indent > 0)
        os << '\n';
    return os.str();
}

std::string escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

}   // namespace whisperkeys::json
