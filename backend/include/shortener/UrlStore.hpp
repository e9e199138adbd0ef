#pragma once

#include "shortener/ShortLink.hpp"

#include <SQLiteCpp/SQLiteCpp.h>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shortener {

// Persistent ShortLink records in a single SQLite file.
// Every call opens its own connection and closes it before returning, so one
// UrlStore can be shared by all worker threads.
class UrlStore {
public:
    explicit UrlStore(std::string db_path, int busy_timeout_ms = 5000);

    // Creates the urls table if needed and switches the file to WAL journaling.
    void initSchema() const;

    // Throws DuplicateCodeError if short_code is taken; nothing is written in that case.
    ShortLink create(const std::string& long_url,
                     const std::string& short_code,
                     const std::optional<Timestamp>& expiration = std::nullopt) const;

    std::optional<ShortLink> getByCode(const std::string& short_code) const;

    // Atomic clicks = clicks + 1. Returns false when no record matched.
    bool incrementClicks(const std::string& short_code) const;

    // Idempotent.
    void remove(const std::string& short_code) const;

    // Newest first.
    std::vector<ShortLink> listRecent(std::size_t limit = 10) const;

    // Removes every record whose expiration is set and <= now. Returns the number removed.
    std::size_t deleteExpired(Timestamp now) const;

    std::size_t count() const;

    const std::string& path() const { return db_path_; }

private:
    template <typename Func>
    auto withConnection(Func&& func) const -> decltype(func(std::declval<SQLite::Database&>())) {
        SQLite::Database db(db_path_, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE, busy_timeout_ms_);
        return func(db);
    }

    std::string db_path_;
    int busy_timeout_ms_;
};

}
