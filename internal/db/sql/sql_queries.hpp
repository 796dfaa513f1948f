#pragma once

namespace claimstone::db::sql {

/*
  Canonical SQL for the region store.

  role column: 0 = owner, 1 = member. position keeps list order stable.
*/

static constexpr const char* CREATE_WORLD_TABLE =
    "CREATE TABLE IF NOT EXISTS world (name TEXT PRIMARY KEY);";

static constexpr const char* CREATE_REGION_TABLE =
    "CREATE TABLE IF NOT EXISTS region ("
    " world TEXT NOT NULL REFERENCES world(name) ON DELETE CASCADE,"
    " id TEXT NOT NULL,"
    " alias TEXT,"
    " block_type TEXT,"
    " PRIMARY KEY (world, id));";

static constexpr const char* CREATE_REGION_ALIAS_INDEX =
    "CREATE INDEX IF NOT EXISTS region_alias_idx ON region(world, alias);";

static constexpr const char* CREATE_REGION_PRINCIPAL_TABLE =
    "CREATE TABLE IF NOT EXISTS region_principal ("
    " world TEXT NOT NULL,"
    " region_id TEXT NOT NULL,"
    " role INTEGER NOT NULL,"
    " position INTEGER NOT NULL,"
    " principal TEXT NOT NULL,"
    " PRIMARY KEY (world, region_id, role, position),"
    " FOREIGN KEY (world, region_id) REFERENCES region(world, id) ON DELETE CASCADE);";

static constexpr const char* CREATE_KNOWN_PLAYER_TABLE =
    "CREATE TABLE IF NOT EXISTS known_player (uuid TEXT PRIMARY KEY, name TEXT NOT NULL);";

// worlds

static constexpr const char* INSERT_WORLD =
    "INSERT INTO world(name) VALUES(?);";

static constexpr const char* SELECT_WORLD =
    "SELECT name FROM world WHERE name=?;";

static constexpr const char* SELECT_WORLDS =
    "SELECT name FROM world ORDER BY name;";

// regions

static constexpr const char* UPSERT_REGION =
    "INSERT INTO region(world,id,alias,block_type) VALUES(?,?,?,?)"
    " ON CONFLICT(world,id) DO UPDATE SET"
    " alias=excluded.alias,"
    " block_type=excluded.block_type;";

static constexpr const char* SELECT_REGION =
    "SELECT world,id,alias,block_type FROM region WHERE world=? AND id=?;";

static constexpr const char* SELECT_REGIONS =
    "SELECT world,id,alias,block_type FROM region WHERE world=? ORDER BY id;";

static constexpr const char* DELETE_REGION =
    "DELETE FROM region WHERE world=? AND id=?;";

// principals

static constexpr const char* DELETE_PRINCIPALS =
    "DELETE FROM region_principal WHERE world=? AND region_id=?;";

static constexpr const char* INSERT_PRINCIPAL =
    "INSERT INTO region_principal(world,region_id,role,position,principal) VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_PRINCIPALS =
    "SELECT role,principal FROM region_principal WHERE world=? AND region_id=?"
    " ORDER BY role,position;";

// known players

static constexpr const char* UPSERT_KNOWN_PLAYER =
    "INSERT INTO known_player(uuid,name) VALUES(?,?)"
    " ON CONFLICT(uuid) DO UPDATE SET name=excluded.name;";

static constexpr const char* SELECT_KNOWN_PLAYERS =
    "SELECT uuid,name FROM known_player ORDER BY uuid;";

}
