#include "core/Json.hpp"

#include <cmath>
#include <cstdlib>
#include <limits>

namespace tetrys::json {

tl::expected<JsonPtr, std::string> parse(std::string_view text) {
    json_error_t error{};
    JsonPtr root{json_loadb(text.data(), text.size(), JSON_DECODE_ANY, &error)};
    if (!root) {
        return tl::make_unexpected("line " + std::to_string(error.line) + ": " + error.text);
    }
    return root;
}

tl::expected<std::string, std::string> dump(const json_t* value) {
    if (!value) {
        return tl::make_unexpected(std::string{"null json value"});
    }
    std::unique_ptr<char, decltype(&std::free)> text{
        json_dumps(value, JSON_COMPACT | JSON_ENCODE_ANY), &std::free};
    if (!text) {
        return tl::make_unexpected(std::string{"json_dumps failed"});
    }
    return std::string{text.get()};
}

std::optional<std::int64_t> get_number(const json_t* object, const char* key) {
    if (!json_is_object(object)) return std::nullopt;
    const json_t* field = json_object_get(object, key);
    if (json_is_integer(field)) {
        return static_cast<std::int64_t>(json_integer_value(field));
    }
    if (json_is_real(field)) {
        const double v = json_real_value(field);
        if (!std::isfinite(v)) return std::nullopt;
        const double f = std::floor(v);
        // int64 に収まらない実数は不正値として扱う(2^63 は表現できないので上限は未満比較)
        constexpr double kMin = static_cast<double>(std::numeric_limits<std::int64_t>::min());
        constexpr double kMaxExclusive = 9.2233720368547758e18;
        if (f < kMin || f >= kMaxExclusive) return std::nullopt;
        return static_cast<std::int64_t>(f);
    }
    return std::nullopt;
}

std::optional<std::string> get_string(const json_t* object, const char* key) {
    if (!json_is_object(object)) return std::nullopt;
    const json_t* field = json_object_get(object, key);
    if (!json_is_string(field)) return std::nullopt;
    return std::string{json_string_value(field), json_string_length(field)};
}

}  // namespace tetrys::json
