#include "core/KeyValueStore.hpp"

#include <SDL2/SDL_log.h>

#include <fstream>
#include <sstream>
#include <system_error>

namespace tetrys::storage {

// =============================
// MemoryStore
// =============================

ReadResult MemoryStore::get(std::string_view key) const {
    if (fail_reads_) {
        return tl::make_unexpected("read failed: " + std::string{key});
    }
    if (auto it = values_.find(key); it != values_.end()) {
        return std::optional<std::string>{it->second};
    }
    return std::optional<std::string>{};
}

WriteResult MemoryStore::set(std::string_view key, std::string value) {
    if (fail_writes_) {
        return tl::make_unexpected("write failed: " + std::string{key});
    }
    values_.insert_or_assign(std::string{key}, std::move(value));
    return {};
}

WriteResult MemoryStore::remove(std::string_view key) {
    if (fail_writes_) {
        return tl::make_unexpected("remove failed: " + std::string{key});
    }
    if (auto it = values_.find(key); it != values_.end()) {
        values_.erase(it);
    }
    return {};
}

// =============================
// JsonFileStore
// =============================

JsonFileStore::JsonFileStore(std::filesystem::path path, json::JsonPtr root)
    : path_(std::move(path)), root_(std::move(root)) {}

tl::expected<std::unique_ptr<JsonFileStore>, std::string> JsonFileStore::open(
    std::filesystem::path path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unique_ptr<JsonFileStore>(
            new JsonFileStore(std::move(path), json::JsonPtr{json_object()}));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return tl::make_unexpected("cannot open " + path.string());
    }
    std::ostringstream buf;
    buf << in.rdbuf();

    in.close();

    auto root = json::parse(buf.str());
    std::string reason;
    if (!root) {
        reason = root.error();
    } else if (!json_is_object(root->get())) {
        reason = "top level is not an object";
    } else {
        return std::unique_ptr<JsonFileStore>(
            new JsonFileStore(std::move(path), std::move(*root)));
    }

    // 壊れたファイルは退避して空のストアから始める
    std::filesystem::path aside = path;
    aside += ".corrupt";
    std::filesystem::rename(path, aside, ec);
    if (ec) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "save file %s is malformed (%s); starting empty, could not move it aside: %s",
                    path.string().c_str(), reason.c_str(), ec.message().c_str());
    } else {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "save file %s is malformed (%s); moved to %s, starting empty",
                    path.string().c_str(), reason.c_str(), aside.string().c_str());
    }
    return std::unique_ptr<JsonFileStore>(
        new JsonFileStore(std::move(path), json::JsonPtr{json_object()}));
}

ReadResult JsonFileStore::get(std::string_view key) const {
    const std::string k{key};
    const json_t* value = json_object_get(root_.get(), k.c_str());
    if (!value) {
        return std::optional<std::string>{};
    }
    if (!json_is_string(value)) {
        return tl::make_unexpected("value of '" + k + "' is not a string");
    }
    return std::optional<std::string>{std::string{json_string_value(value), json_string_length(value)}};
}

WriteResult JsonFileStore::set(std::string_view key, std::string value) {
    const std::string k{key};
    if (json_object_set_new(root_.get(), k.c_str(),
                            json_stringn(value.data(), value.size())) != 0) {
        return tl::make_unexpected("cannot set '" + k + "'");
    }
    return flush();
}

WriteResult JsonFileStore::remove(std::string_view key) {
    const std::string k{key};
    if (json_object_get(root_.get(), k.c_str())) {
        json_object_del(root_.get(), k.c_str());
    }
    return flush();
}

WriteResult JsonFileStore::flush() const {
    std::filesystem::path tmp = path_;
    tmp += ".tmp";

    if (json_dump_file(root_.get(), tmp.string().c_str(), JSON_INDENT(2) | JSON_SORT_KEYS) != 0) {
        return tl::make_unexpected("cannot write " + tmp.string());
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        return tl::make_unexpected("cannot replace " + path_.string() + ": " + ec.message());
    }
    return {};
}

}  // namespace tetrys::storage
