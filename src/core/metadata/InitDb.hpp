#pragma once
#include <string>

namespace urlsh {

// Creates the database file (and its parent directory) if needed, applies the
// connection pragmas and runs schema.sql. Safe to call on every startup.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace urlsh
