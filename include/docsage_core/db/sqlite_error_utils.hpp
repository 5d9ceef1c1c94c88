#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace docsage_core {

// Short label for SQLite's primary result code.
inline const char *sqlite_error_kind(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return "busy_or_locked";
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return "corrupt";
    case SQLITE_READONLY:
      return "readonly";
    case SQLITE_IOERR:
      return "io";
    case SQLITE_CANTOPEN:
      return "cantopen";
    case SQLITE_FULL:
      return "full";
    case SQLITE_CONSTRAINT:
      return "constraint";
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return "schema";
    default:
      return "generic";
  }
}

// "<operation> failed: (<kind>) <sqlite message> [code=N, xcode=M]"
inline std::string format_db_error(const std::string &operation,
                                   const sqlite::sqlite_exception &e) {
  const int code = e.get_code();
  return operation + " failed: (" + sqlite_error_kind(code) + ") " + e.errstr() +
         " [code=" + std::to_string(code) + ", xcode=" + std::to_string(e.get_extended_code()) +
         "]";
}

}  // namespace docsage_core
