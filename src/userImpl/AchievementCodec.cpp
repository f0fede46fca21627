#include "userImpl/AchievementCodec.hpp"

#include "core/Json.hpp"
#include "userImpl/AchievementCatalog.hpp"

#include <algorithm>
#include <set>

namespace tetrys::achievement::codec {

namespace {

// json_object_set_new の失敗は OOM のみ
bool put_integer(json_t* object, const char* key, std::int64_t value) {
    return json_object_set_new(object, key, json_integer(static_cast<json_int_t>(value))) == 0;
}

std::optional<UnlockedAchievement> decode_record(const json_t* entry, std::string& why) {
    if (!json_is_object(entry)) {
        why = "entry is not an object";
        return std::nullopt;
    }
    auto id = json::get_string(entry, "achievementId");
    if (!id || id->empty()) {
        why = "missing achievementId";
        return std::nullopt;
    }
    auto at = json::get_number(entry, "unlockedAt");
    if (!at || *at < 0) {
        why = "bad unlockedAt for " + *id;
        return std::nullopt;
    }

    UnlockedAchievement rec{std::move(*id), *at, std::nullopt};
    if (const json_t* gs = json_object_get(entry, "gameStats"); json_is_object(gs)) {
        rec.gameStats = GameStatsSnapshot{json::get_number(gs, "score").value_or(0),
                                          json::get_number(gs, "level").value_or(0),
                                          json::get_number(gs, "lines").value_or(0)};
    }
    return rec;
}

}  // namespace

tl::expected<std::string, std::string> encode_unlocked(
    const std::vector<UnlockedAchievement>& records) {
    json::JsonPtr array{json_array()};
    if (!array) return tl::make_unexpected(std::string{"json_array failed"});

    for (const auto& rec : records) {
        json_t* entry = json_object();
        if (!entry || json_array_append_new(array.get(), entry) != 0) {
            return tl::make_unexpected(std::string{"cannot append record"});
        }
        bool ok = json_object_set_new(entry, "achievementId",
                                      json_stringn(rec.achievementId.data(),
                                                   rec.achievementId.size())) == 0;
        ok = ok && put_integer(entry, "unlockedAt", rec.unlockedAt);
        if (ok && rec.gameStats) {
            json_t* gs = json_object();
            ok = gs && json_object_set_new(entry, "gameStats", gs) == 0;
            ok = ok && put_integer(gs, "score", rec.gameStats->score);
            ok = ok && put_integer(gs, "level", rec.gameStats->level);
            ok = ok && put_integer(gs, "lines", rec.gameStats->lines);
        }
        if (!ok) {
            return tl::make_unexpected("cannot encode " + rec.achievementId);
        }
    }
    return json::dump(array.get());
}

tl::expected<DecodedUnlocks, std::string> decode_unlocked(std::string_view text,
                                                          const std::vector<Achievement>& catalog) {
    auto root = json::parse(text);
    if (!root) return tl::make_unexpected(root.error());
    if (!json_is_array(root->get())) {
        return tl::make_unexpected(std::string{"unlocked list is not an array"});
    }

    DecodedUnlocks out;
    std::set<std::string, std::less<>> seen;
    std::size_t index = 0;
    const json_t* entry = nullptr;
    json_array_foreach(root->get(), index, entry) {
        std::string why;
        auto rec = decode_record(entry, why);
        if (!rec) {
            out.skipped.push_back("#" + std::to_string(index) + ": " + why);
            continue;
        }
        if (!find_in(catalog, rec->achievementId)) {
            out.skipped.push_back("#" + std::to_string(index) + ": unknown id " +
                                  rec->achievementId);
            continue;
        }
        if (!seen.insert(rec->achievementId).second) {
            out.skipped.push_back("#" + std::to_string(index) + ": duplicate " +
                                  rec->achievementId);
            continue;
        }
        out.records.push_back(std::move(*rec));
    }
    return out;
}

tl::expected<std::string, std::string> encode_session_stats(const SessionStats& s) {
    json::JsonPtr object{json_object()};
    if (!object) return tl::make_unexpected(std::string{"json_object failed"});

    const bool ok = put_integer(object.get(), "linesCleared", s.linesCleared) &&
                    put_integer(object.get(), "tetrisCount", s.tetrisCount) &&
                    put_integer(object.get(), "maxCombo", s.maxCombo) &&
                    put_integer(object.get(), "gamesPlayed", s.gamesPlayed) &&
                    put_integer(object.get(), "totalLinesCleared", s.totalLines) &&
                    put_integer(object.get(), "timePlayed", s.timePlayed);
    if (!ok) return tl::make_unexpected(std::string{"cannot encode session stats"});
    return json::dump(object.get());
}

tl::expected<SessionStats, std::string> decode_session_stats(std::string_view text) {
    auto root = json::parse(text);
    if (!root) return tl::make_unexpected(root.error());
    const json_t* o = root->get();
    if (!json_is_object(o)) {
        return tl::make_unexpected(std::string{"session stats is not an object"});
    }

    // 負の値は壊れたデータとして 0 に丸める
    const auto field = [o](const char* key) {
        return std::max<std::int64_t>(0, json::get_number(o, key).value_or(0));
    };
    SessionStats s;
    s.linesCleared = field("linesCleared");
    s.tetrisCount = field("tetrisCount");
    s.maxCombo = field("maxCombo");
    s.gamesPlayed = field("gamesPlayed");
    s.totalLines = field("totalLinesCleared");
    s.timePlayed = field("timePlayed");
    return s;
}

}  // namespace tetrys::achievement::codec
