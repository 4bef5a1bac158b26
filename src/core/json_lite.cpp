#include "json_lite.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace termpanel::json
{

const Value* Value::find(const std::string& key) const
{
    if (type_ != Type::Object)
        return nullptr;
    auto it = object_.find(key);
    return it == object_.end() ? nullptr : &it->second;
}

std::optional<std::string> Value::get_string(const std::string& key) const
{
    const Value* v = find(key);
    if (!v || !v->is_string())
        return std::nullopt;
    return v->as_string();
}

std::optional<int64_t> Value::get_int(const std::string& key) const
{
    const Value* v = find(key);
    if (!v || !v->is_number())
        return std::nullopt;
    return static_cast<int64_t>(std::llround(v->as_number()));
}

std::optional<bool> Value::get_bool(const std::string& key) const
{
    const Value* v = find(key);
    if (!v || !v->is_bool())
        return std::nullopt;
    return v->as_bool();
}

// ─── Parser ──────────────────────────────────────────────────────────────────

namespace
{

class Parser
{
   public:
    explicit Parser(std::string_view text) : text_(text) {}

    std::optional<Value> parse_document()
    {
        auto v = parse_value(0);
        if (!v)
            return std::nullopt;
        skip_ws();
        if (pos_ != text_.size())
            return std::nullopt;
        return v;
    }

    size_t position() const { return pos_; }

   private:
    static constexpr int MAX_DEPTH = 64;

    std::string_view text_;
    size_t           pos_ = 0;

    void skip_ws()
    {
        while (pos_ < text_.size()
               && (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n'
                   || text_[pos_] == '\r'))
            ++pos_;
    }

    bool consume(std::string_view word)
    {
        if (text_.substr(pos_, word.size()) != word)
            return false;
        pos_ += word.size();
        return true;
    }

    std::optional<Value> parse_value(int depth)
    {
        if (depth > MAX_DEPTH)
            return std::nullopt;
        skip_ws();
        if (pos_ >= text_.size())
            return std::nullopt;

        char c = text_[pos_];
        if (c == '{')
            return parse_object(depth);
        if (c == '[')
            return parse_array(depth);
        if (c == '"')
        {
            auto s = parse_string();
            if (!s)
                return std::nullopt;
            return Value(std::move(*s));
        }
        if (consume("true"))
            return Value(true);
        if (consume("false"))
            return Value(false);
        if (consume("null"))
            return Value();
        return parse_number();
    }

    std::optional<Value> parse_number()
    {
        size_t start = pos_;
        if (pos_ < text_.size() && (text_[pos_] == '-' || text_[pos_] == '+'))
            ++pos_;
        while (pos_ < text_.size()
               && (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.'
                   || text_[pos_] == 'e' || text_[pos_] == 'E' || text_[pos_] == '-'
                   || text_[pos_] == '+'))
            ++pos_;
        if (pos_ == start)
            return std::nullopt;

        std::string token(text_.substr(start, pos_ - start));
        char*       end = nullptr;
        double      n   = std::strtod(token.c_str(), &end);
        if (end == token.c_str() || *end != '\0')
            return std::nullopt;
        return Value(n);
    }

    static void append_utf8(std::string& out, uint32_t cp)
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

    std::optional<uint32_t> parse_hex4()
    {
        if (pos_ + 4 > text_.size())
            return std::nullopt;
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i)
        {
            char c = text_[pos_++];
            v <<= 4;
            if (c >= '0' && c <= '9')
                v |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f')
                v |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F')
                v |= static_cast<uint32_t>(c - 'A' + 10);
            else
                return std::nullopt;
        }
        return v;
    }

    std::optional<std::string> parse_string()
    {
        ++pos_;   // opening quote
        std::string out;
        while (pos_ < text_.size())
        {
            char c = text_[pos_++];
            if (c == '"')
                return out;
            if (c != '\\')
            {
                out += c;
                continue;
            }
            if (pos_ >= text_.size())
                return std::nullopt;
            char esc = text_[pos_++];
            switch (esc)
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
                    auto cp = parse_hex4();
                    if (!cp)
                        return std::nullopt;
                    uint32_t code = *cp;
                    // Surrogate pair
                    if (code >= 0xD800 && code <= 0xDBFF && consume("\\u"))
                    {
                        auto low = parse_hex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF)
                            return std::nullopt;
                        code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;   // unterminated
    }

    std::optional<Value> parse_array(int depth)
    {
        ++pos_;   // [
        Value::Array items;
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == ']')
        {
            ++pos_;
            return Value(std::move(items));
        }
        while (true)
        {
            auto item = parse_value(depth + 1);
            if (!item)
                return std::nullopt;
            items.push_back(std::move(*item));
            skip_ws();
            if (pos_ >= text_.size())
                return std::nullopt;
            if (text_[pos_] == ',')
            {
                ++pos_;
                continue;
            }
            if (text_[pos_] == ']')
            {
                ++pos_;
                return Value(std::move(items));
            }
            return std::nullopt;
        }
    }

    std::optional<Value> parse_object(int depth)
    {
        ++pos_;   // {
        Value::Object members;
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == '}')
        {
            ++pos_;
            return Value(std::move(members));
        }
        while (true)
        {
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != '"')
                return std::nullopt;
            auto key = parse_string();
            if (!key)
                return std::nullopt;
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != ':')
                return std::nullopt;
            ++pos_;
            auto val = parse_value(depth + 1);
            if (!val)
                return std::nullopt;
            members[std::move(*key)] = std::move(*val);
            skip_ws();
            if (pos_ >= text_.size())
                return std::nullopt;
            if (text_[pos_] == ',')
            {
                ++pos_;
                continue;
            }
            if (text_[pos_] == '}')
            {
                ++pos_;
                return Value(std::move(members));
            }
            return std::nullopt;
        }
    }
};

void write_value(std::ostringstream& os, const Value& v, int indent)
{
    std::string pad(static_cast<size_t>(indent) * 2, ' ');
    std::string inner(static_cast<size_t>(indent + 1) * 2, ' ');

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
                os << static_cast<int64_t>(n);
            else
                os << n;
            break;
        }
        case Value::Type::String:
            os << '"' << escape(v.as_string()) << '"';
            break;
        case Value::Type::Array:
        {
            const auto& arr = v.as_array();
            if (arr.empty())
            {
                os << "[]";
                break;
            }
            os << "[\n";
            for (size_t i = 0; i < arr.size(); ++i)
            {
                os << inner;
                write_value(os, arr[i], indent + 1);
                if (i + 1 < arr.size())
                    os << ",";
                os << "\n";
            }
            os << pad << "]";
            break;
        }
        case Value::Type::Object:
        {
            const auto& obj = v.as_object();
            if (obj.empty())
            {
                os << "{}";
                break;
            }
            os << "{\n";
            size_t i = 0;
            for (const auto& [key, member] : obj)
            {
                os << inner << '"' << escape(key) << "\": ";
                write_value(os, member, indent + 1);
                if (++i < obj.size())
                    os << ",";
                os << "\n";
            }
            os << pad << "}";
            break;
        }
    }
}

}   // namespace

std::optional<Value> parse(std::string_view text, size_t* error_offset)
{
    Parser p(text);
    auto   v = p.parse_document();
    if (!v && error_offset)
        *error_offset = p.position();
    return v;
}

std::string serialize(const Value& value)
{
    std::ostringstream os;
    write_value(os, value, 0);
    os << "\n";
    return os.str();
}

std::string escape(std::string_view s)
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

}   // namespace termpanel::json
