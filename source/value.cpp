// value.cpp - Value members, diagnostics and formatting helpers

#include <geo_nodes/value.h>

#include <algorithm>
#include <charconv>
#include <iostream>

namespace geo_nodes {

// ============================================================
// Diagnostics
// ============================================================

namespace detail {

void log_access_error(std::string_view func, std::string_view message, std::source_location loc) noexcept
{
#if GEO_NODES_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name() << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

void log_key_error(std::string_view func, std::string_view key, std::string_view reason,
                   std::source_location loc) noexcept
{
#if GEO_NODES_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name() << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

std::string format_double(double v)
{
    // Shortest text that reads back to the same double; subnormals included
    char buf[64];
    const auto result = std::to_chars(buf, buf + sizeof(buf), v);
    std::string text(buf, result.ptr);

    // "10" would read back as an integer
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

} // namespace detail

// ============================================================
// Value
// ============================================================

Value Value::map(std::initializer_list<std::pair<std::string, Value>> entries)
{
    auto t = ValueMap{}.transient();
    for (const auto& [key, val] : entries) {
        t.set(key, ValueBox{val});
    }
    return Value{t.persistent()};
}

Value Value::vector(std::initializer_list<Value> items)
{
    auto t = ValueVector{}.transient();
    for (const auto& item : items) {
        t.push_back(ValueBox{item});
    }
    return Value{t.persistent()};
}

const Value* Value::find(const std::string& key) const
{
    const auto* m = get_if<ValueMap>();
    if (m == nullptr) {
        return nullptr;
    }
    const ValueBox* box = m->find(key);
    return box ? &box->get() : nullptr;
}

Value Value::at(const std::string& key) const
{
    if (const Value* child = find(key)) {
        return *child;
    }
    detail::log_key_error("Value::at", key, is_map() ? "not found" : "looked up on a non-map");
    return {};
}

Value Value::at(std::size_t index) const
{
    const auto* v = get_if<ValueVector>();
    if (v != nullptr && index < v->size()) {
        return (*v)[index].get();
    }
    detail::log_access_error("Value::at", "index " + std::to_string(index) + " out of range or not a vector");
    return {};
}

double Value::as_number(double fallback) const noexcept
{
    if (const auto* d = get_if<double>()) {
        return *d;
    }
    if (const auto* i = get_if<int64_t>()) {
        return static_cast<double>(*i);
    }
    return fallback;
}

std::string Value::as_string(std::string fallback) const
{
    const auto* s = get_if<std::string>();
    return s ? *s : fallback;
}

std::string_view Value::as_string_view() const noexcept
{
    const auto* s = get_if<std::string>();
    return s ? std::string_view{*s} : std::string_view{};
}

std::size_t Value::size() const noexcept
{
    if (const auto* m = get_if<ValueMap>()) {
        return m->size();
    }
    if (const auto* v = get_if<ValueVector>()) {
        return v->size();
    }
    return 0;
}

std::vector<std::string> Value::keys() const
{
    std::vector<std::string> result;
    if (const auto* m = get_if<ValueMap>()) {
        result.reserve(m->size());
        for (const auto& entry : *m) {
            result.push_back(entry.first);
        }
        std::sort(result.begin(), result.end());
    }
    return result;
}

Value Value::set(const std::string& key, Value val) const
{
    if (const auto* m = get_if<ValueMap>()) {
        return Value{m->set(key, ValueBox{std::move(val)})};
    }
    if (is_null()) {
        return Value{ValueMap{}.set(key, ValueBox{std::move(val)})};
    }
    detail::log_key_error("Value::set", key, "cannot be set on a scalar");
    return *this;
}

// ============================================================
// Formatting
// ============================================================

std::string value_to_string(const Value& val)
{
    struct Formatter {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { return detail::format_double(d); }
        std::string operator()(const std::string& s) const { return "\"" + s + "\""; }
        std::string operator()(const ValueMap& m) const { return "{map:" + std::to_string(m.size()) + "}"; }
        std::string operator()(const ValueVector& v) const { return "[vector:" + std::to_string(v.size()) + "]"; }
    };
    return std::visit(Formatter{}, val.data);
}

std::string path_to_string(const Path& path)
{
    if (path.empty()) {
        return "/";
    }
    std::string result;
    for (const auto& elem : path) {
        if (const auto* key = std::get_if<std::string>(&elem)) {
            result += '.';
            result += *key;
        } else {
            result += '[';
            result += std::to_string(std::get<std::size_t>(elem));
            result += ']';
        }
    }
    return result;
}

} // namespace geo_nodes
