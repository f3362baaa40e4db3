#include "legacy_database.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <string_view>

#include "internal/util/errors.hpp"

namespace hivestate::migration {

using db::sqlite::SqliteDB;
using db::sqlite::Stmt;

namespace {

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

bool IsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

bool IsKnownTable(const std::string& table) {
  return std::any_of(std::begin(LegacyDatabase::kRequiredTables), std::end(LegacyDatabase::kRequiredTables),
                     [&](const char* name) { return table == name; });
}

bool AllDigits(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

// Fixed-width fields only (at most 4 digits).
bool ParseDigits(std::string_view text, int* out) {
  if (text.size() > 4 || !AllDigits(text)) {
    return false;
  }
  int value = 0;
  for (char c : text) {
    value = value * 10 + (c - '0');
  }
  *out = value;
  return true;
}

// "Z", "+HH:MM", "-HH:MM" or "+HHMM" to seconds east of UTC.
bool ParseUtcOffset(std::string_view text, int64_t* offset_sec) {
  if (text == "Z") {
    *offset_sec = 0;
    return true;
  }
  if (text.size() < 5 || (text[0] != '+' && text[0] != '-')) {
    return false;
  }
  std::string_view rest = text.substr(1);
  int              hours = 0, minutes = 0;
  if (!ParseDigits(rest.substr(0, 2), &hours)) {
    return false;
  }
  rest.remove_prefix(2);
  if (!rest.empty() && rest[0] == ':') {
    rest.remove_prefix(1);
  }
  if (rest.size() != 2 || !ParseDigits(rest, &minutes) || hours > 23 || minutes > 59) {
    return false;
  }
  *offset_sec = (text[0] == '-' ? -1 : 1) * static_cast<int64_t>(hours * 3600 + minutes * 60);
  return true;
}

} // namespace

LegacyDatabase::LegacyDatabase(const std::string& path) : db_(std::make_unique<SqliteDB>(path, SqliteDB::Mode::kReadOnly)) {
}

std::vector<std::string> LegacyDatabase::Tables() {
  Stmt                     st(*db_, "SELECT name FROM sqlite_master WHERE type='table' ORDER BY name;");
  std::vector<std::string> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ColText(st.get(), 0));
  }
  return out;
}

uint64_t LegacyDatabase::Count(const std::string& table) {
  if (!IsKnownTable(table)) {
    throw util::StoreError(util::ErrorCode::InvalidArgument, "unknown legacy table: " + table);
  }
  const std::string sql = "SELECT COUNT(*) FROM " + table + ";";
  Stmt              st(*db_, sql.c_str());
  if (st.Step() != SQLITE_ROW) {
    return 0;
  }
  return static_cast<uint64_t>(sqlite3_column_int64(st.get(), 0));
}

std::vector<LegacyAgent> LegacyDatabase::Agents(uint64_t limit, uint64_t offset) {
  Stmt st(*db_,
          "SELECT agent_id, status, current_task_id, context_usage, last_activity, capabilities, performance_metrics "
          "FROM agents ORDER BY rowid LIMIT ? OFFSET ?;");
  sqlite3_bind_int64(st.get(), 1, static_cast<sqlite3_int64>(limit));
  sqlite3_bind_int64(st.get(), 2, static_cast<sqlite3_int64>(offset));

  std::vector<LegacyAgent> out;
  while (st.Step() == SQLITE_ROW) {
    LegacyAgent a;
    a.agent_id        = ColText(st.get(), 0);
    a.status          = ColText(st.get(), 1);
    a.current_task_id = ColText(st.get(), 2);
    if (!IsNull(st.get(), 3)) {
      a.context_usage = sqlite3_column_double(st.get(), 3);
    }
    a.last_activity       = ColText(st.get(), 4);
    a.capabilities        = ColText(st.get(), 5);
    a.performance_metrics = ColText(st.get(), 6);
    out.push_back(std::move(a));
  }
  return out;
}

std::vector<LegacyTask> LegacyDatabase::Tasks(uint64_t limit, uint64_t offset) {
  Stmt st(*db_,
          "SELECT task_id, status, agent_id, priority, created_at, started_at, completed_at, metadata "
          "FROM tasks ORDER BY rowid LIMIT ? OFFSET ?;");
  sqlite3_bind_int64(st.get(), 1, static_cast<sqlite3_int64>(limit));
  sqlite3_bind_int64(st.get(), 2, static_cast<sqlite3_int64>(offset));

  std::vector<LegacyTask> out;
  while (st.Step() == SQLITE_ROW) {
    LegacyTask t;
    t.task_id  = ColText(st.get(), 0);
    t.status   = ColText(st.get(), 1);
    t.agent_id = ColText(st.get(), 2);
    if (!IsNull(st.get(), 3)) {
      t.priority = sqlite3_column_int(st.get(), 3);
    }
    t.created_at   = ColText(st.get(), 4);
    t.started_at   = ColText(st.get(), 5);
    t.completed_at = ColText(st.get(), 6);
    t.metadata     = ColText(st.get(), 7);
    out.push_back(std::move(t));
  }
  return out;
}

std::vector<LegacySnapshot> LegacyDatabase::Snapshots() {
  Stmt st(*db_,
          "SELECT timestamp, total_agents, active_agents, total_tasks, completed_tasks, failed_tasks, "
          "average_context_usage, quality_score FROM system_snapshots ORDER BY rowid;");

  std::vector<LegacySnapshot> out;
  while (st.Step() == SQLITE_ROW) {
    LegacySnapshot s;
    s.timestamp             = ColText(st.get(), 0);
    s.total_agents          = sqlite3_column_int64(st.get(), 1);
    s.active_agents         = sqlite3_column_int64(st.get(), 2);
    s.total_tasks           = sqlite3_column_int64(st.get(), 3);
    s.completed_tasks       = sqlite3_column_int64(st.get(), 4);
    s.failed_tasks          = sqlite3_column_int64(st.get(), 5);
    s.average_context_usage = sqlite3_column_double(st.get(), 6);
    s.quality_score         = sqlite3_column_double(st.get(), 7);
    out.push_back(std::move(s));
  }
  return out;
}

std::vector<LegacyCheckpoint> LegacyDatabase::RecentCheckpoints(uint64_t limit) {
  Stmt st(*db_, "SELECT checkpoint_name, timestamp, data FROM checkpoints ORDER BY timestamp DESC, rowid DESC LIMIT ?;");
  sqlite3_bind_int64(st.get(), 1, static_cast<sqlite3_int64>(limit));

  std::vector<LegacyCheckpoint> out;
  while (st.Step() == SQLITE_ROW) {
    LegacyCheckpoint c;
    c.name      = ColText(st.get(), 0);
    c.timestamp = ColText(st.get(), 1);
    c.data      = ColText(st.get(), 2);
    out.push_back(std::move(c));
  }
  return out;
}

bool ParseLegacyTime(const std::string& text, uint64_t* unix_ms) {
  if (text.empty()) {
    *unix_ms = 0;
    return true;
  }

  // Epoch seconds.
  char*        end     = nullptr;
  const double seconds = std::strtod(text.c_str(), &end);
  if (end == text.c_str() + text.size()) {
    if (!std::isfinite(seconds) || seconds < 0) {
      return false;
    }
    *unix_ms = static_cast<uint64_t>(std::llround(seconds * 1000.0));
    return true;
  }

  // YYYY-MM-DD[ T]HH:MM:SS[.ffffff][Z|+HH:MM|-HH:MM]
  std::string_view s(text);
  if (s.size() < 19 || s[4] != '-' || s[7] != '-' || (s[10] != 'T' && s[10] != ' ') || s[13] != ':' || s[16] != ':') {
    return false;
  }

  std::tm tm{};
  int     year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!ParseDigits(s.substr(0, 4), &year) || !ParseDigits(s.substr(5, 2), &month) || !ParseDigits(s.substr(8, 2), &day) ||
      !ParseDigits(s.substr(11, 2), &hour) || !ParseDigits(s.substr(14, 2), &minute) || !ParseDigits(s.substr(17, 2), &second)) {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return false;
  }

  std::string_view rest = s.substr(19);

  // Milliseconds from the first three fraction digits; finer digits are dropped.
  int64_t millis = 0;
  if (!rest.empty() && rest[0] == '.') {
    rest.remove_prefix(1);
    const auto digits_end = std::find_if(rest.begin(), rest.end(), [](char c) { return !std::isdigit(static_cast<unsigned char>(c)); });
    const auto fraction   = rest.substr(0, static_cast<std::size_t>(digits_end - rest.begin()));
    if (fraction.empty()) {
      return false;
    }
    for (std::size_t i = 0; i < 3; ++i) {
      millis = millis * 10 + (i < fraction.size() ? fraction[i] - '0' : 0);
    }
    rest.remove_prefix(fraction.size());
  }

  int64_t offset_sec = 0;
  if (!rest.empty() && !ParseUtcOffset(rest, &offset_sec)) {
    return false;
  }

  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = second;

  const int64_t utc_sec = static_cast<int64_t>(timegm(&tm)) - offset_sec;
  if (utc_sec < 0) {
    return false;
  }
  *unix_ms = static_cast<uint64_t>(utc_sec) * 1000 + static_cast<uint64_t>(millis);
  return true;
}

} // namespace hivestate::migration
