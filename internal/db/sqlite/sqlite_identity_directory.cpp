#include "sqlite_identity_directory.hpp"

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace claimstone::db::sqlite {

SqliteIdentityDirectory::SqliteIdentityDirectory(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::vector<model::Identity> SqliteIdentityDirectory::Enumerate() {
    std::vector<model::Identity> out;
    std::scoped_lock lock(db_->Mutex());

    sqlite3_stmt* st = nullptr;
    try {
        st = db_->Prepare(sql::SELECT_KNOWN_PLAYERS);
    } catch (const std::runtime_error& e) {
        throw util::DirectoryUnavailable(std::string("known_player: ") + e.what());
    }

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        const auto* raw_id   = sqlite3_column_text(st, 0);
        const auto* raw_name = sqlite3_column_text(st, 1);
        if (!raw_id || !raw_name) continue;

        const std::string id_text = reinterpret_cast<const char*>(raw_id);
        auto id = util::TryParse(id_text);
        if (!id) {
            CLAIMSTONE_LOG_WARN("skipping known player with malformed uuid", {observability::StringField("uuid", id_text)});
            continue;
        }
        out.push_back({*id, reinterpret_cast<const char*>(raw_name)});
    }
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE) {
        throw util::DirectoryUnavailable(std::string("known_player: ") + sqlite3_errmsg(db_->Handle()));
    }
    return out;
}

void SqliteIdentityDirectory::Remember(const model::Identity& identity) {
    std::scoped_lock lock(db_->Mutex());
    sqlite3_stmt* st = db_->Prepare(sql::UPSERT_KNOWN_PLAYER);

    const auto id_text = util::ToString(identity.id);
    sqlite3_bind_text(st, 1, id_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 2, identity.name.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
        throw util::StoreError(std::string("remember player: ") + sqlite3_errmsg(db_->Handle()));
    }
}

} // namespace claimstone::db::sqlite
