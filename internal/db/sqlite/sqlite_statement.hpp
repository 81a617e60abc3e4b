#pragma once

#include <sqlite3.h>

#include <string>

#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace activity::db::sqlite {

/*
  RAII prepared statement bound from sql::Params.

  Rows are read through sql::Row while Step() returns SQLITE_ROW.
*/
class Statement final : public sql::Row {
public:
  Statement(sqlite3* db, const std::string& sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const { return stmt_ != nullptr; }
  int PrepareCode() const { return prepare_rc_; }

  void Bind(const sql::Params& params);

  int Step();

  std::string GetText(int col) const override;
  int GetInt(int col) const override;
  int64_t GetInt64(int col) const override;
  bool IsNull(int col) const override;

private:
  sqlite3_stmt* stmt_       = nullptr;
  int           prepare_rc_ = SQLITE_OK;
};

}
