#include "UrlStore.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <ctime>
#include <memory>
#include <stdexcept>
#include <utility>

namespace urlsh {

namespace {

struct DbCloser {
  void operator()(sqlite3* db) const { sqlite3_close_v2(db); }
};
struct StmtFinalizer {
  void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

using DbPtr   = std::unique_ptr<sqlite3, DbCloser>;
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

[[noreturn]] void storageFailure(sqlite3* db, const std::string& what) {
  throw StoreError(ErrorKind::StorageUnavailable,
                   what + ": " + (db ? sqlite3_errmsg(db) : "no connection"));
}

DbPtr openDb(const std::string& path) {
  sqlite3* raw = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &raw,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr);
  DbPtr db(raw);
  if (rc != SQLITE_OK) {
    throw StoreError(ErrorKind::StorageUnavailable,
                     "failed to open db " + path + ": " +
                     (raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc)));
  }
  sqlite3_extended_result_codes(db.get(), 1);
  if (sqlite3_busy_timeout(db.get(), 5000) != SQLITE_OK) {
    storageFailure(db.get(), "busy_timeout");
  }
  return db;
}

StmtPtr prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    storageFailure(db, "prepare failed");
  }
  return StmtPtr(st);
}

void bindText(sqlite3* db, sqlite3_stmt* st, int idx, const std::string& v) {
  if (sqlite3_bind_text(st, idx, v.data(), static_cast<int>(v.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    storageFailure(db, "bind failed");
  }
}

void bindInt64(sqlite3* db, sqlite3_stmt* st, int idx, int64_t v) {
  if (sqlite3_bind_int64(st, idx, v) != SQLITE_OK) {
    storageFailure(db, "bind failed");
  }
}

std::string columnText(sqlite3_stmt* st, int col) {
  const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
  if (!p) return {};
  return std::string(p, static_cast<size_t>(sqlite3_column_bytes(st, col)));
}

UrlRecord readRecord(sqlite3_stmt* st) {
  return UrlRecord{
    sqlite3_column_int64(st, 0),
    columnText(st, 1),
    columnText(st, 2),
    sqlite3_column_int64(st, 3)
  };
}

bool isBlank(const std::string& s) {
  for (char c : s) {
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != '\v') {
      return false;
    }
  }
  return true;
}

bool hasControlChars(const std::string& s) {
  for (char c : s) {
    auto u = static_cast<unsigned char>(c);
    if (u < 0x20 || u == 0x7f) return true;
  }
  return false;
}

} // namespace

UrlStore::UrlStore(std::string dbPath, ShortCodeGenerator generator, int maxAttempts)
  : dbPath_(std::move(dbPath)), generator_(std::move(generator)), maxAttempts_(maxAttempts) {
  if (maxAttempts_ < 1) throw std::invalid_argument("maxAttempts must be at least 1");

  // Fail at startup rather than on the first request if the schema is missing.
  DbPtr db = openDb(dbPath_);
  StmtPtr st = prepare(db.get(),
    "SELECT 1 FROM sqlite_master WHERE type='table' AND name='urls'");
  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    throw StoreError(ErrorKind::StorageUnavailable,
                     "table 'urls' missing in " + dbPath_ + " (run --init)");
  }
  if (rc != SQLITE_ROW) storageFailure(db.get(), "schema check failed");
}

UrlStore::UrlStore(std::string dbPath)
  : UrlStore(std::move(dbPath), ShortCodeGenerator()) {}

std::string UrlStore::create(const std::string& url) {
  if (isBlank(url)) {
    throw StoreError(ErrorKind::InvalidInput, "url must not be empty");
  }
  if (hasControlChars(url)) {
    throw StoreError(ErrorKind::InvalidInput, "url contains control characters");
  }

  DbPtr db = openDb(dbPath_);
  const int64_t now = static_cast<int64_t>(std::time(nullptr));

  for (int attempt = 1; attempt <= maxAttempts_; ++attempt) {
    const std::string code = generator_.generate();

    // UNIQUE(short_code) makes the collision check part of the insert.
    StmtPtr st = prepare(db.get(),
      "INSERT INTO urls (url, short_code, created_at) VALUES (?,?,?)");
    bindText(db.get(), st.get(), 1, url);
    bindText(db.get(), st.get(), 2, code);
    bindInt64(db.get(), st.get(), 3, now);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) {
      spdlog::debug("created {} -> {}", code, url);
      return code;
    }
    if (rc == SQLITE_CONSTRAINT_UNIQUE) {
      spdlog::warn("short code collision on {} (attempt {}/{})", code, attempt, maxAttempts_);
      continue;
    }
    storageFailure(db.get(), "insert failed");
  }

  spdlog::error("no free short code after {} attempts", maxAttempts_);
  throw StoreError(ErrorKind::ExhaustedRetries,
                   "no free short code after " + std::to_string(maxAttempts_) + " attempts");
}

std::string UrlStore::resolve(const std::string& shortCode) const {
  auto rec = find(shortCode);
  if (!rec) throw StoreError(ErrorKind::NotFound, "unknown short code: " + shortCode);
  return rec->original_url;
}

std::optional<UrlRecord> UrlStore::find(const std::string& shortCode) const {
  DbPtr db = openDb(dbPath_);
  StmtPtr st = prepare(db.get(),
    "SELECT id, url, short_code, created_at FROM urls WHERE short_code = ?");
  bindText(db.get(), st.get(), 1, shortCode);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return readRecord(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  storageFailure(db.get(), "lookup failed");
}

std::vector<UrlRecord> UrlStore::listAll() const {
  DbPtr db = openDb(dbPath_);
  StmtPtr st = prepare(db.get(),
    "SELECT id, url, short_code, created_at FROM urls ORDER BY id ASC");

  std::vector<UrlRecord> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(readRecord(st.get()));
  }
  if (rc != SQLITE_DONE) storageFailure(db.get(), "scan failed");
  return out;
}

void UrlStore::remove(const std::string& shortCode) {
  DbPtr db = openDb(dbPath_);
  StmtPtr st = prepare(db.get(), "DELETE FROM urls WHERE short_code = ?");
  bindText(db.get(), st.get(), 1, shortCode);

  if (sqlite3_step(st.get()) != SQLITE_DONE) storageFailure(db.get(), "delete failed");
  if (sqlite3_changes(db.get()) == 0) {
    throw StoreError(ErrorKind::NotFound, "unknown short code: " + shortCode);
  }
  spdlog::debug("deleted {}", shortCode);
}

int64_t UrlStore::count() const {
  DbPtr db = openDb(dbPath_);
  StmtPtr st = prepare(db.get(), "SELECT COUNT(*) FROM urls");
  if (sqlite3_step(st.get()) != SQLITE_ROW) storageFailure(db.get(), "count failed");
  return sqlite3_column_int64(st.get(), 0);
}

} // namespace urlsh
