// JSON document type used for aria2 RPC requests and responses.
//
// Supported operations:
//   parse, dump, operator[], contains, value, get<T>, push_back,
//   is_null/bool/number/string/array/object, begin/end, size,
//   initializer-list construction (object detection), json::array()

#pragma once

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class json {
  public:
    class exception : public std::runtime_error {
      public:
        explicit exception(const std::string& msg) : std::runtime_error(msg) {}
    };

    using object_t = std::map<std::string, json>;
    using array_t  = std::vector<json>;

  private:
    enum class Kind { Null, Bool, Int, Float, String, Array, Object };

    Kind        kind_ = Kind::Null;
    bool        bval_ = false;
    int64_t     ival_ = 0;
    double      fval_ = 0.0;
    std::string sval_;
    array_t     aval_;
    object_t    oval_;

    friend class JsonReader;
    void write(std::string& out, int indent, int depth) const;

  public:
    json() = default;
    json(std::nullptr_t) {}

    // Bool must come before the integral concept to take precedence
    json(bool v) : kind_(Kind::Bool), bval_(v) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    json(T v) : kind_(Kind::Int), ival_(static_cast<int64_t>(v)) {}

    template <std::floating_point T>
    json(T v) : kind_(Kind::Float), fval_(static_cast<double>(v)) {}

    json(const char* v) : kind_(Kind::String), sval_(v ? v : "") {}
    json(const std::string& v) : kind_(Kind::String), sval_(v) {}
    json(std::string&& v) : kind_(Kind::String), sval_(std::move(v)) {}

    json(array_t v) : kind_(Kind::Array), aval_(std::move(v)) {}
    json(object_t v) : kind_(Kind::Object), oval_(std::move(v)) {}

    // {{"key",val},{"key2",val2}} -> object, {val1, val2, ...} -> array
    json(std::initializer_list<json> init);

    [[nodiscard]] bool is_null() const noexcept { return kind_ == Kind::Null; }
    [[nodiscard]] bool is_bool() const noexcept { return kind_ == Kind::Bool; }
    [[nodiscard]] bool is_number() const noexcept {
        return kind_ == Kind::Int || kind_ == Kind::Float;
    }
    [[nodiscard]] bool is_number_integer() const noexcept { return kind_ == Kind::Int; }
    [[nodiscard]] bool is_number_float() const noexcept { return kind_ == Kind::Float; }
    [[nodiscard]] bool is_string() const noexcept { return kind_ == Kind::String; }
    [[nodiscard]] bool is_array() const noexcept { return kind_ == Kind::Array; }
    [[nodiscard]] bool is_object() const noexcept { return kind_ == Kind::Object; }

    template <typename T> [[nodiscard]] T get() const {
        if constexpr (std::same_as<T, bool>) {
            if (kind_ != Kind::Bool)
                throw exception("get<bool> on non-bool");
            return bval_;
        } else if constexpr (std::integral<T>) {
            if (kind_ == Kind::Int)
                return static_cast<T>(ival_);
            if (kind_ == Kind::Float)
                return static_cast<T>(fval_);
            throw exception("get<integer> on non-number");
        } else if constexpr (std::floating_point<T>) {
            if (kind_ == Kind::Float)
                return static_cast<T>(fval_);
            if (kind_ == Kind::Int)
                return static_cast<T>(ival_);
            throw exception("get<float> on non-number");
        } else if constexpr (std::same_as<T, std::string>) {
            if (kind_ != Kind::String)
                throw exception("get<string> on non-string");
            return sval_;
        } else {
            static_assert(sizeof(T) == 0, "json::get: unsupported type");
        }
    }

    json&                     operator[](const std::string& key);
    [[nodiscard]] const json& operator[](const std::string& key) const;
    json&                     operator[](size_t i);
    [[nodiscard]] const json& operator[](size_t i) const;

    [[nodiscard]] bool contains(const std::string& key) const noexcept {
        return kind_ == Kind::Object && oval_.contains(key);
    }

    // Typed lookup; a missing, null or mistyped member yields def.
    template <typename T> [[nodiscard]] T value(const std::string& key, const T& def) const {
        if (kind_ != Kind::Object)
            return def;
        auto it = oval_.find(key);
        if (it == oval_.end() || it->second.is_null())
            return def;
        try {
            return it->second.get<T>();
        } catch (const exception&) {
            return def;
        }
    }

    [[nodiscard]] std::string value(const std::string& key, const char* def) const;

    void push_back(json v);

    [[nodiscard]] size_t size() const noexcept {
        if (kind_ == Kind::Array)
            return aval_.size();
        if (kind_ == Kind::Object)
            return oval_.size();
        return 0;
    }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    // Iteration (arrays)
    auto begin() { return aval_.begin(); }
    auto end() { return aval_.end(); }
    auto begin() const { return aval_.begin(); }
    auto end() const { return aval_.end(); }

    [[nodiscard]] static json array() {
        json j;
        j.kind_ = Kind::Array;
        return j;
    }
    [[nodiscard]] static json object() {
        json j;
        j.kind_ = Kind::Object;
        return j;
    }

    [[nodiscard]] static json parse(const std::string& s);

    // indent < 0 produces the compact form sent on the wire.
    [[nodiscard]] std::string dump(int indent = -1) const;
};
