#ifndef TETRYS_CORE_KEY_VALUE_STORE_HPP
#define TETRYS_CORE_KEY_VALUE_STORE_HPP

#include "core/Json.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tl/expected.hpp>

namespace tetrys::storage {

// キーが無ければ nullopt、読み出し自体の失敗は unexpected
using ReadResult = tl::expected<std::optional<std::string>, std::string>;
using WriteResult = tl::expected<void, std::string>;

/**
 * @brief ローカルのキー・バリューストア(文字列値)
 */
class KeyValueStore {
   public:
    virtual ~KeyValueStore() = default;

    [[nodiscard]] virtual ReadResult get(std::string_view key) const = 0;
    [[nodiscard]] virtual WriteResult set(std::string_view key, std::string value) = 0;
    [[nodiscard]] virtual WriteResult remove(std::string_view key) = 0;
};

// プロセス内だけの実装
class MemoryStore : public KeyValueStore {
   public:
    [[nodiscard]] ReadResult get(std::string_view key) const override;
    [[nodiscard]] WriteResult set(std::string_view key, std::string value) override;
    [[nodiscard]] WriteResult remove(std::string_view key) override;

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

    // 障害注入(テスト用): true の間は該当操作が unexpected を返す
    void fail_reads(bool on) noexcept { fail_reads_ = on; }
    void fail_writes(bool on) noexcept { fail_writes_ = on; }

   private:
    std::map<std::string, std::string, std::less<>> values_;
    bool fail_reads_ = false;
    bool fail_writes_ = false;
};

/**
 * @brief 1つの JSON オブジェクトファイルに全キーを保存する実装
 *
 * 書き込みごとに一時ファイルへ書き出してから rename で置き換える。
 */
class JsonFileStore : public KeyValueStore {
   public:
    // ファイルが無ければ空のストアとして開く。壊れていれば <path>.corrupt へ退避して空で開く
    // 読めないファイルのみ unexpected
    [[nodiscard]] static tl::expected<std::unique_ptr<JsonFileStore>, std::string> open(
        std::filesystem::path path);

    [[nodiscard]] ReadResult get(std::string_view key) const override;
    [[nodiscard]] WriteResult set(std::string_view key, std::string value) override;
    [[nodiscard]] WriteResult remove(std::string_view key) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

   private:
    JsonFileStore(std::filesystem::path path, json::JsonPtr root);

    [[nodiscard]] WriteResult flush() const;

    std::filesystem::path path_;
    json::JsonPtr root_;
};

}  // namespace tetrys::storage

#endif /* TETRYS_CORE_KEY_VALUE_STORE_HPP */
