// src/core/metadata/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace urlsh {

namespace {

// WAL lets readers run alongside the single writer.
constexpr const char* kConnectionPragmas =
    "PRAGMA journal_mode=WAL;"
    "PRAGMA synchronous=NORMAL;"
    "PRAGMA busy_timeout=5000;";

constexpr int kSchemaVersion = 1;

struct DbCloser {
    void operator()(sqlite3* db) const { sqlite3_close_v2(db); }
};

std::string readSchema(const std::string& schemaPath) {
    std::ifstream in(schemaPath);
    if (!in) throw std::runtime_error("Cannot open schema file: " + schemaPath);
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

void run(sqlite3* db, const std::string& sql, const char* step) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw std::runtime_error(std::string("SQLite ") + step + " failed: " + msg);
    }
}

} // namespace

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    const std::string schema = readSchema(schemaPath);

    std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(dbPath.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    std::unique_ptr<sqlite3, DbCloser> db(raw);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to open DB " + dbPath + ": " +
                                 (raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc)));
    }

    run(db.get(), kConnectionPragmas, "pragmas");
    run(db.get(), schema, "schema");
    run(db.get(), "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";", "user_version");

    spdlog::debug("schema v{} applied to {}", kSchemaVersion, dbPath);
    return true;
}

} // namespace urlsh
