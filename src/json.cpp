#include "json.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>

// ---------------------------------------------------------------------------
// Recursive-descent reader
// ---------------------------------------------------------------------------
class JsonReader {
  public:
    explicit JsonReader(const std::string& src) : src_(src) {}

    json read_document() {
        json result = read_value();
        skip_ws();
        if (pos_ != src_.size())
            throw json::exception("Trailing content after JSON value");
        return result;
    }

  private:
    const std::string& src_;
    size_t             pos_ = 0;

    void skip_ws() {
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
                break;
            ++pos_;
        }
    }

    char peek() {
        skip_ws();
        return pos_ < src_.size() ? src_[pos_] : '\0';
    }

    char next() {
        skip_ws();
        if (pos_ >= src_.size())
            throw json::exception("Unexpected end of input");
        return src_[pos_++];
    }

    void expect(char c) {
        char got = next();
        if (got != c)
            throw json::exception(std::string("Expected '") + c + "', got '" + got + "'");
    }

    void expect_word(const char* word) {
        const std::string w(word);
        if (src_.compare(pos_, w.size(), w) != 0)
            throw json::exception("Expected '" + w + "'");
        pos_ += w.size();
    }

    unsigned read_hex4() {
        if (pos_ + 4 > src_.size())
            throw json::exception("Truncated \\u escape");
        unsigned cp = 0;
        for (int i = 0; i < 4; ++i) {
            char h = src_[pos_++];
            cp <<= 4;
            if (h >= '0' && h <= '9')
                cp |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f')
                cp |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F')
                cp |= static_cast<unsigned>(h - 'A' + 10);
            else
                throw json::exception("Bad hex in \\u escape");
        }
        return cp;
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string read_string() {
        expect('"');
        std::string out;
        while (pos_ < src_.size()) {
            char c = src_[pos_++];
            if (c == '"')
                return out;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= src_.size())
                break;
            char e = src_[pos_++];
            switch (e) {
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u': {
                unsigned cp = read_hex4();
                // File names from torrents may be outside the BMP.
                if (cp >= 0xD800 && cp <= 0xDBFF && src_.compare(pos_, 2, "\\u") == 0) {
                    pos_ += 2;
                    unsigned lo = read_hex4();
                    if (lo < 0xDC00 || lo > 0xDFFF)
                        throw json::exception("Invalid low surrogate in \\u escape");
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                }
                append_utf8(out, cp);
                break;
            }
            default:
                out += e; // \" \\ \/
                break;
            }
        }
        throw json::exception("Unterminated string");
    }

    json read_number() {
        const size_t start    = pos_;
        bool         is_float = false;
        auto         digits   = [&] {
            while (pos_ < src_.size() && src_[pos_] >= '0' && src_[pos_] <= '9')
                ++pos_;
        };
        if (src_[pos_] == '-')
            ++pos_;
        digits();
        if (pos_ < src_.size() && src_[pos_] == '.') {
            is_float = true;
            ++pos_;
            digits();
        }
        if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
            is_float = true;
            ++pos_;
            if (pos_ < src_.size() && (src_[pos_] == '+' || src_[pos_] == '-'))
                ++pos_;
            digits();
        }
        const std::string text = src_.substr(start, pos_ - start);
        json              j;
        try {
            if (is_float) {
                j.kind_ = json::Kind::Float;
                j.fval_ = std::stod(text);
            } else {
                j.kind_ = json::Kind::Int;
                j.ival_ = std::stoll(text);
            }
        } catch (const std::logic_error&) {
            throw json::exception("Invalid number: " + text);
        }
        return j;
    }

    json read_object() {
        json j = json::object();
        if (peek() == '}') {
            next();
            return j;
        }
        while (true) {
            skip_ws();
            std::string key = read_string();
            expect(':');
            j.oval_[key] = read_value();
            const char sep = next();
            if (sep == '}')
                return j;
            if (sep != ',')
                throw json::exception("Expected ',' or '}'");
        }
    }

    json read_array() {
        json j = json::array();
        if (peek() == ']') {
            next();
            return j;
        }
        while (true) {
            j.aval_.push_back(read_value());
            const char sep = next();
            if (sep == ']')
                return j;
            if (sep != ',')
                throw json::exception("Expected ',' or ']'");
        }
    }

    json read_value() {
        const char c = peek();
        switch (c) {
        case '"':
            return json(read_string());
        case '{':
            next();
            return read_object();
        case '[':
            next();
            return read_array();
        case 't':
            expect_word("true");
            return json(true);
        case 'f':
            expect_word("false");
            return json(false);
        case 'n':
            expect_word("null");
            return json{};
        default:
            break;
        }
        if (c == '-' || (c >= '0' && c <= '9'))
            return read_number();
        if (c == '\0')
            throw json::exception("Unexpected end of input");
        throw json::exception(std::string("Unexpected character: ") + c);
    }
};

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------
static void write_quoted(std::string& out, const std::string& s) {
    out += '"';
    for (unsigned char c : s) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (c < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<int>(c));
                out += buf;
            } else {
                out += static_cast<char>(c);
            }
        }
    }
    out += '"';
}

static void write_newline(std::string& out, int indent, int depth) {
    if (indent < 0)
        return;
    out += '\n';
    out.append(static_cast<size_t>(depth * indent), ' ');
}

void json::write(std::string& out, int indent, int depth) const {
    switch (kind_) {
    case Kind::Null:
        out += "null";
        return;
    case Kind::Bool:
        out += bval_ ? "true" : "false";
        return;
    case Kind::Int:
        out += std::to_string(ival_);
        return;
    case Kind::Float: {
        if (!std::isfinite(fval_)) {
            out += "null";
            return;
        }
        std::ostringstream ss;
        ss << std::setprecision(17) << fval_;
        out += ss.str();
        return;
    }
    case Kind::String:
        write_quoted(out, sval_);
        return;
    case Kind::Array:
        if (aval_.empty()) {
            out += "[]";
            return;
        }
        out += '[';
        for (size_t i = 0; i < aval_.size(); ++i) {
            if (i)
                out += ',';
            write_newline(out, indent, depth + 1);
            aval_[i].write(out, indent, depth + 1);
        }
        write_newline(out, indent, depth);
        out += ']';
        return;
    case Kind::Object: {
        if (oval_.empty()) {
            out += "{}";
            return;
        }
        out += '{';
        bool first = true;
        for (const auto& [k, v] : oval_) {
            if (!first)
                out += ',';
            first = false;
            write_newline(out, indent, depth + 1);
            write_quoted(out, k);
            out += indent >= 0 ? ": " : ":";
            v.write(out, indent, depth + 1);
        }
        write_newline(out, indent, depth);
        out += '}';
        return;
    }
    }
}

// ---------------------------------------------------------------------------
// Construction and access
// ---------------------------------------------------------------------------
json::json(std::initializer_list<json> init) {
    bool all_pairs = init.size() > 0;
    for (const auto& el : init) {
        if (!el.is_array() || el.aval_.size() != 2 || !el.aval_[0].is_string()) {
            all_pairs = false;
            break;
        }
    }

    if (all_pairs) {
        kind_ = Kind::Object;
        for (const auto& el : init)
            oval_[el.aval_[0].sval_] = el.aval_[1];
    } else {
        kind_ = Kind::Array;
        aval_ = array_t(init);
    }
}

json& json::operator[](const std::string& key) {
    if (kind_ == Kind::Null)
        kind_ = Kind::Object;
    if (kind_ != Kind::Object)
        throw exception("operator[string] on non-object");
    return oval_[key];
}

const json& json::operator[](const std::string& key) const {
    static const json null_val{};
    if (kind_ != Kind::Object)
        return null_val;
    auto it = oval_.find(key);
    return it != oval_.end() ? it->second : null_val;
}

json& json::operator[](size_t i) {
    if (kind_ != Kind::Array)
        throw exception("operator[size_t] on non-array");
    if (i >= aval_.size())
        throw exception("array index out of range");
    return aval_[i];
}

const json& json::operator[](size_t i) const {
    if (kind_ != Kind::Array)
        throw exception("operator[size_t] on non-array");
    if (i >= aval_.size())
        throw exception("array index out of range");
    return aval_[i];
}

std::string json::value(const std::string& key, const char* def) const {
    const char* fallback = def ? def : "";
    if (kind_ != Kind::Object)
        return fallback;
    auto it = oval_.find(key);
    if (it == oval_.end() || it->second.kind_ != Kind::String)
        return fallback;
    return it->second.sval_;
}

void json::push_back(json v) {
    if (kind_ == Kind::Null)
        kind_ = Kind::Array;
    if (kind_ != Kind::Array)
        throw exception("push_back on non-array");
    aval_.push_back(std::move(v));
}

json json::parse(const std::string& s) { return JsonReader(s).read_document(); }

std::string json::dump(int indent) const {
    std::string out;
    write(out, indent, 0);
    return out;
}
