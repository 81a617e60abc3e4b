#include "sqlite_statement.hpp"

#include <type_traits>

namespace activity::db::sqlite {

Statement::Statement(sqlite3* db, const std::string& sql) {
  prepare_rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
  if (prepare_rc_ != SQLITE_OK && stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::Bind(const sql::Params& params) {
  int idx = 1;
  for (const auto& param : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt_, idx);
          } else if constexpr (std::is_same_v<T, int32_t>) {
            sqlite3_bind_int(stmt_, idx, v);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
          } else if constexpr (std::is_same_v<T, uint64_t>) {
            sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
          } else {
            sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT);
          }
        },
        param);
    ++idx;
  }
}

int Statement::Step() {
  return sqlite3_step(stmt_);
}

std::string Statement::GetText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int Statement::GetInt(int col) const {
  return sqlite3_column_int(stmt_, col);
}

int64_t Statement::GetInt64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

bool Statement::IsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

}
