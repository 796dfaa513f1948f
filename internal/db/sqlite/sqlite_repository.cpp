#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace claimstone::db::sqlite {

using claimstone::db::ErrorCode;
using claimstone::db::Result;

namespace {

constexpr int kRoleOwner  = 0;
constexpr int kRoleMember = 1;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s)
        BindText(st, idx, *s);
    else
        sqlite3_bind_null(st, idx);
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL)
        return std::nullopt;
    return ColText(st, col);
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

model::RegionRecord ReadRegionRow(sqlite3_stmt* st) {
    model::RegionRecord r;
    r.world      = ColText(st, 0);
    r.id         = ColText(st, 1);
    r.alias      = ColOptionalText(st, 2);
    r.block_type = ColOptionalText(st, 3);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

void SqliteRepository::ThrowRead(sqlite3* db, int rc, const std::string& what) {
    throw util::StoreError(what + ": " + Translate(db, rc).Describe());
}

// ------------------------------------------------------------------
// Worlds
// ------------------------------------------------------------------

Result SqliteRepository::CreateWorld(Transaction& t, const std::string& world) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_WORLD, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, world);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, world);
    return Translate(db, rc);
}

bool SqliteRepository::HasWorld(Transaction& t, const std::string& world) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql::SELECT_WORLD, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        ThrowRead(db, rc, "has world " + world);

    BindText(st, 1, world);
    rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE)
        ThrowRead(db, rc, "has world " + world);
    return rc == SQLITE_ROW;
}

std::vector<std::string> SqliteRepository::ListWorlds(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<std::string> out;
    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql::SELECT_WORLDS, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        ThrowRead(db, rc, "list worlds");

    while ((rc = sqlite3_step(st)) == SQLITE_ROW)
        out.push_back(ColText(st, 0));

    sqlite3_finalize(st);
    if (rc != SQLITE_DONE)
        ThrowRead(db, rc, "list worlds");
    return out;
}

// ------------------------------------------------------------------
// Regions
// ------------------------------------------------------------------

void SqliteRepository::LoadPrincipals(sqlite3* db, model::RegionRecord& r) {
    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql::SELECT_PRINCIPALS, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        ThrowRead(db, rc, "load principals " + r.world + "/" + r.id);

    BindText(st, 1, r.world);
    BindText(st, 2, r.id);

    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        auto ref = model::ParsePrincipal(ColText(st, 1));
        if (ColI32(st, 0) == kRoleOwner)
            r.owners.push_back(std::move(ref));
        else
            r.members.push_back(std::move(ref));
    }

    sqlite3_finalize(st);
    if (rc != SQLITE_DONE)
        ThrowRead(db, rc, "load principals " + r.world + "/" + r.id);
}

std::optional<model::RegionRecord>
SqliteRepository::GetRegion(Transaction& t, const std::string& world, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql::SELECT_REGION, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        ThrowRead(db, rc, "get region " + world + "/" + id);

    BindText(st, 1, world);
    BindText(st, 2, id);

    rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        // only SQLITE_DONE means the row is absent
        if (rc != SQLITE_DONE)
            ThrowRead(db, rc, "get region " + world + "/" + id);
        return std::nullopt;
    }

    auto r = ReadRegionRow(st);
    sqlite3_finalize(st);

    LoadPrincipals(db, r);
    return r;
}

std::vector<model::RegionRecord>
SqliteRepository::ListRegions(Transaction& t, const std::string& world) {
    auto* db = TX(t).Handle();

    std::vector<model::RegionRecord> out;
    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql::SELECT_REGIONS, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        ThrowRead(db, rc, "list regions " + world);

    BindText(st, 1, world);
    while ((rc = sqlite3_step(st)) == SQLITE_ROW)
        out.push_back(ReadRegionRow(st));
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE)
        ThrowRead(db, rc, "list regions " + world);

    for (auto& r : out)
        LoadPrincipals(db, r);
    return out;
}

Result SqliteRepository::UpsertRegion(Transaction& t, const model::RegionRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_REGION, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.world);
    BindText(st, 2, r.id);
    BindOptionalText(st, 3, r.alias);
    BindOptionalText(st, 4, r.block_type);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
        // foreign key failure means the world row is missing
        if (rc == SQLITE_CONSTRAINT)
            return Result::Err(ErrorCode::NotFound, "world " + r.world);
        return Translate(db, rc);
    }

    if (sqlite3_prepare_v2(db, sql::DELETE_PRINCIPALS, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st, 1, r.world);
    BindText(st, 2, r.id);
    rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE)
        return Translate(db, rc);

    if (sqlite3_prepare_v2(db, sql::INSERT_PRINCIPAL, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    auto insert_all = [&](const std::vector<model::PrincipalRef>& refs, int role) -> int {
        for (std::size_t i = 0; i < refs.size(); ++i) {
            sqlite3_reset(st);
            sqlite3_clear_bindings(st);
            BindText(st, 1, r.world);
            BindText(st, 2, r.id);
            BindI32(st, 3, role);
            BindI32(st, 4, static_cast<int>(i));
            BindText(st, 5, model::FormatPrincipal(refs[i]));
            const int step = sqlite3_step(st);
            if (step != SQLITE_DONE) return step;
        }
        return SQLITE_DONE;
    };

    rc = insert_all(r.owners, kRoleOwner);
    if (rc == SQLITE_DONE)
        rc = insert_all(r.members, kRoleMember);

    sqlite3_finalize(st);
    return Translate(db, rc);
}

Result SqliteRepository::DeleteRegion(Transaction& t, const std::string& world, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_REGION, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, world);
    BindText(st, 2, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, id);
    return Translate(db, rc);
}

} // namespace claimstone::db::sqlite
