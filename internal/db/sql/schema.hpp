#pragma once

#include <string>
#include <vector>

namespace hivestate::db::sql {

/*
  Backend-agnostic schema bootstrap.

  Each backend implements ExecuteSQL(). Every statement is idempotent
  (IF NOT EXISTS / OR REPLACE) so bootstrap runs on every start.
*/

class SchemaExecutor {
 public:
  virtual ~SchemaExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

void ApplySchema(SchemaExecutor& executor, const std::vector<std::string>& ordered_sql);

const std::vector<std::string>& PostgresSchema();
const std::vector<std::string>& SqliteSchema();

} // namespace hivestate::db::sql
