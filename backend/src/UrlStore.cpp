#include "shortener/UrlStore.hpp"
#include "shortener/errors.hpp"
#include "shortener/logging/LogRegistry.hpp"
#include "shortener/util/time.hpp"

#include <sqlite3.h>

using namespace shortener::logging;

namespace shortener {

namespace {

constexpr auto LINK_COLUMNS = "id, long_url, short_code, clicks, expiration";

ShortLink readLink(SQLite::Statement& query) {
    ShortLink link;
    link.id = query.getColumn(0).getInt64();
    link.long_url = query.getColumn(1).getText();
    link.short_code = query.getColumn(2).getText();
    link.clicks = query.getColumn(3).getInt64();
    if (!query.getColumn(4).isNull()) link.expiration = util::fromUnixSeconds(query.getColumn(4).getInt64());
    return link;
}

}

UrlStore::UrlStore(std::string db_path, const int busy_timeout_ms)
    : db_path_(std::move(db_path)), busy_timeout_ms_(busy_timeout_ms) {}

void UrlStore::initSchema() const {
    withConnection([](SQLite::Database& db) {
        db.exec("PRAGMA journal_mode=WAL");
        db.exec(R"(
            CREATE TABLE IF NOT EXISTS urls (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                long_url TEXT NOT NULL,
                short_code TEXT UNIQUE NOT NULL,
                clicks INTEGER NOT NULL DEFAULT 0,
                expiration INTEGER
            )
        )");
    });
    LogRegistry::db()->info("[UrlStore] Schema ready in {}", db_path_);
}

ShortLink UrlStore::create(const std::string& long_url,
                           const std::string& short_code,
                           const std::optional<Timestamp>& expiration) const {
    return withConnection([&](SQLite::Database& db) {
        SQLite::Statement insert(db,
            "INSERT INTO urls (long_url, short_code, expiration) VALUES (?, ?, ?)");
        insert.bind(1, long_url);
        insert.bind(2, short_code);
        if (expiration) insert.bind(3, util::toUnixSeconds(*expiration));
        else insert.bind(3);

        try {
            insert.exec();
        } catch (const SQLite::Exception& e) {
            if (e.getExtendedErrorCode() == SQLITE_CONSTRAINT_UNIQUE) {
                LogRegistry::db()->debug("[UrlStore] Rejected duplicate short code '{}'", short_code);
                throw DuplicateCodeError(short_code);
            }
            throw;
        }

        ShortLink link;
        link.id = db.getLastInsertRowid();
        link.long_url = long_url;
        link.short_code = short_code;
        link.expiration = expiration;
        LogRegistry::db()->debug("[UrlStore] Created link #{} '{}'", link.id, short_code);
        return link;
    });
}

std::optional<ShortLink> UrlStore::getByCode(const std::string& short_code) const {
    return withConnection([&](SQLite::Database& db) -> std::optional<ShortLink> {
        SQLite::Statement query(db, std::string("SELECT ") + LINK_COLUMNS + " FROM urls WHERE short_code = ?");
        query.bind(1, short_code);
        if (query.executeStep()) return readLink(query);
        return std::nullopt;
    });
}

bool UrlStore::incrementClicks(const std::string& short_code) const {
    return withConnection([&](SQLite::Database& db) {
        SQLite::Statement update(db, "UPDATE urls SET clicks = clicks + 1 WHERE short_code = ?");
        update.bind(1, short_code);
        return update.exec() > 0;
    });
}

void UrlStore::remove(const std::string& short_code) const {
    withConnection([&](SQLite::Database& db) {
        SQLite::Statement del(db, "DELETE FROM urls WHERE short_code = ?");
        del.bind(1, short_code);
        if (del.exec() > 0) LogRegistry::db()->debug("[UrlStore] Deleted '{}'", short_code);
    });
}

std::vector<ShortLink> UrlStore::listRecent(const std::size_t limit) const {
    return withConnection([&](SQLite::Database& db) {
        SQLite::Statement query(db, std::string("SELECT ") + LINK_COLUMNS + " FROM urls ORDER BY id DESC LIMIT ?");
        query.bind(1, static_cast<int64_t>(limit));

        std::vector<ShortLink> links;
        while (query.executeStep()) links.push_back(readLink(query));
        return links;
    });
}

std::size_t UrlStore::deleteExpired(const Timestamp now) const {
    return withConnection([&](SQLite::Database& db) {
        SQLite::Statement del(db, "DELETE FROM urls WHERE expiration IS NOT NULL AND expiration <= ?");
        del.bind(1, util::toUnixSeconds(now));
        return static_cast<std::size_t>(del.exec());
    });
}

std::size_t UrlStore::count() const {
    return withConnection([](SQLite::Database& db) {
        SQLite::Statement query(db, "SELECT COUNT(*) FROM urls");
        query.executeStep();
        return static_cast<std::size_t>(query.getColumn(0).getInt64());
    });
}

}
