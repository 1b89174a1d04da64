#pragma once
#include <string>

namespace fam {

// Creates the database file if needed, applies pragmas and the schema file.
// Safe to call on every start: the schema only uses IF NOT EXISTS. An index
// written by a newer schema version is refused.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace fam
