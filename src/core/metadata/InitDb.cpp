// src/core/metadata/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fam {

static constexpr int kSchemaVersion = 1;

static void execAll(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("SQLite exec failed: " + msg);
  }
}

static int userVersion(sqlite3* db) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "PRAGMA user_version;", -1, &st, nullptr) != SQLITE_OK) {
    std::string msg = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("Cannot read schema version: " + msg);
  }
  const int v = sqlite3_step(st) == SQLITE_ROW ? sqlite3_column_int(st, 0) : 0;
  sqlite3_finalize(st);
  return v;
}

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
  const auto parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(
    dbPath.c_str(),
    &db,
    SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
    nullptr
  );
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("Failed to open DB: " + msg);
  }

  try {
    // Pragmas: concurrency + durability + integrity
    execAll(db, "PRAGMA journal_mode=WAL;");
    execAll(db, "PRAGMA synchronous=NORMAL;");
    execAll(db, "PRAGMA foreign_keys=ON;");
    execAll(db, "PRAGMA busy_timeout=5000;");

    const int found = userVersion(db);
    if (found > kSchemaVersion) {
      throw std::runtime_error("index " + dbPath + " has schema v" + std::to_string(found) +
                               ", this build understands up to v" + std::to_string(kSchemaVersion));
    }

    std::ifstream in(schemaPath);
    if (!in) throw std::runtime_error("Cannot open schema file: " + schemaPath);
    std::ostringstream buf; buf << in.rdbuf();
    execAll(db, buf.str());

    execAll(db, "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");

    sqlite3_close(db);
    spdlog::debug("index schema v{} applied to {}", kSchemaVersion, dbPath);
    return true;
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
}

} // namespace fam
