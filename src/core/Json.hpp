#ifndef TETRYS_CORE_JSON_HPP
#define TETRYS_CORE_JSON_HPP

#include <jansson.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tl/expected.hpp>

namespace tetrys::json {

struct JsonDeleter {
    void operator()(json_t* value) const noexcept {
        if (value) {
            json_decref(value);
        }
    }
};

// jansson の参照を1つ所有する
using JsonPtr = std::unique_ptr<json_t, JsonDeleter>;

[[nodiscard]] tl::expected<JsonPtr, std::string> parse(std::string_view text);

// compact 形式で文字列化
[[nodiscard]] tl::expected<std::string, std::string> dump(const json_t* value);

// 数値フィールド(integer / real どちらも可)を取り出す。無い・数値でない場合は nullopt
[[nodiscard]] std::optional<std::int64_t> get_number(const json_t* object, const char* key);

[[nodiscard]] std::optional<std::string> get_string(const json_t* object, const char* key);

}  // namespace tetrys::json

#endif /* TETRYS_CORE_JSON_HPP */
