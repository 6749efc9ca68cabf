#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/codegen/ShortCodeGenerator.hpp"
#include "StoreError.hpp"

namespace urlsh {

struct UrlRecord {
  int64_t     id;
  std::string original_url;
  std::string short_code;
  int64_t     created_at;
};

// Owns the `urls` table of an SQLite database created by initDatabase().
// Every call opens its own connection, so one instance may be shared by all
// request threads. All failures are reported as StoreError.
class UrlStore {
public:
  static constexpr int kDefaultMaxAttempts = 10;

  UrlStore(std::string dbPath,
           ShortCodeGenerator generator,
           int maxAttempts = kDefaultMaxAttempts);
  explicit UrlStore(std::string dbPath);

  // Stores url verbatim under a fresh short code and returns the code.
  // A code already taken by a live record is regenerated, up to maxAttempts
  // times in total.
  std::string create(const std::string& url);

  std::string resolve(const std::string& shortCode) const;
  std::optional<UrlRecord> find(const std::string& shortCode) const;

  // Ascending id, i.e. insertion order.
  std::vector<UrlRecord> listAll() const;

  // Hard delete. Throws NotFound when no record carries shortCode.
  void remove(const std::string& shortCode);

  int64_t count() const;

  const std::string& dbPath() const { return dbPath_; }
  int maxAttempts() const { return maxAttempts_; }

private:
  std::string dbPath_;
  ShortCodeGenerator generator_;
  int maxAttempts_;
};

} // namespace urlsh
