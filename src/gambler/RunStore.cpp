#include "gambler/RunStore.hpp"
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace gambler {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char*>(text) : "";
}

json column_json(sqlite3_stmt* stmt, int col) {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return json();
  return json::parse(column_text(stmt, col));
}

} // namespace

RunStore::RunStore(const RunStoreConfig& config)
    : config_(config) {
  int rc = sqlite3_open(config_.db_path.c_str(), &db_);
  if (rc != SQLITE_OK) {
    std::string msg = "Failed to open database: " + std::string(sqlite3_errmsg(db_));
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  std::cout << "[RunStore] Opened database: " << config_.db_path << "\n";
  try {
    ensure_schema();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

RunStore::~RunStore() {
  try {
    flush_bars();
  } catch (const std::exception& e) {
    std::cerr << "[RunStore] Error flushing bars on shutdown: " << e.what() << "\n";
  }
  try {
    flush_events();
  } catch (const std::exception& e) {
    std::cerr << "[RunStore] Error flushing events on shutdown: " << e.what() << "\n";
  }

  if (db_) {
    sqlite3_close(db_);
    std::cout << "[RunStore] Closed database\n";
  }
}

void RunStore::ensure_schema() {
  std::lock_guard<std::mutex> lock(db_mutex_);
  db_ensure_schema();
}

int RunStore::schema_version() {
  std::lock_guard<std::mutex> lock(db_mutex_);
  return query_int("SELECT version FROM schema_version LIMIT 1;", 0);
}

void RunStore::db_ensure_schema() {
  exec_sql("PRAGMA journal_mode=WAL;");
  exec_sql("PRAGMA synchronous=NORMAL;");
  exec_sql("PRAGMA foreign_keys=ON;");
  exec_sql("PRAGMA busy_timeout=5000;");

  // Schema version tracking
  exec_sql("CREATE TABLE IF NOT EXISTS schema_version(version INTEGER NOT NULL);");

  int v = query_int("SELECT version FROM schema_version LIMIT 1;", 0);

  exec_sql("BEGIN;");
  try {
    if (v < 1) {
      exec_sql(R"SQL(
        CREATE TABLE IF NOT EXISTS runs(
          run_id TEXT PRIMARY KEY,
          symbol TEXT NOT NULL,
          started_at DATETIME DEFAULT CURRENT_TIMESTAMP,
          config TEXT NOT NULL,
          summary TEXT
        );
      )SQL");

      // OHLCV bars as the run saw them
      exec_sql(R"SQL(
        CREATE TABLE IF NOT EXISTS bars(
          run_id TEXT NOT NULL REFERENCES runs(run_id) ON DELETE CASCADE,
          symbol TEXT NOT NULL,
          ts_ms INTEGER NOT NULL,
          open REAL NOT NULL,
          high REAL NOT NULL,
          low REAL NOT NULL,
          close REAL NOT NULL,
          volume REAL NOT NULL,
          PRIMARY KEY(run_id, symbol, ts_ms)
        );
      )SQL");

      // Events table: flexible JSON storage for order status changes
      exec_sql(R"SQL(
        CREATE TABLE IF NOT EXISTS events(
          event_id INTEGER PRIMARY KEY AUTOINCREMENT,
          run_id TEXT NOT NULL REFERENCES runs(run_id) ON DELETE CASCADE,
          event_type TEXT NOT NULL,
          timestamp_ms INTEGER NOT NULL,
          symbol TEXT NOT NULL,
          data TEXT NOT NULL
        );
      )SQL");

      exec_sql(R"SQL(
        CREATE INDEX IF NOT EXISTS idx_events_query
        ON events(run_id, event_type, timestamp_ms);
      )SQL");

      exec_sql("DELETE FROM schema_version;");
      exec_sql("INSERT INTO schema_version(version) VALUES (1);");
      v = 1;

      std::cout << "[RunStore] Schema initialized (v1)\n";
    }

    exec_sql("COMMIT;");
  } catch (const std::exception&) {
    exec_sql("ROLLBACK;");
    throw;
  }
}

void RunStore::begin_run(const std::string& run_id, const std::string& symbol, const json& config) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  sqlite3_stmt* stmt = prepare(R"SQL(
    INSERT INTO runs(run_id, symbol, config) VALUES(?, ?, ?);
  )SQL");

  std::string config_str = config.dump();
  sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_STATIC);
  sqlite3_bind_text(stmt, 2, symbol.c_str(), -1, SQLITE_STATIC);
  sqlite3_bind_text(stmt, 3, config_str.c_str(), -1, SQLITE_TRANSIENT);

  int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("Failed to insert run '" + run_id + "': " + sqlite3_errmsg(db_));
  }
  std::cout << "[RunStore] Recording run " << run_id << "\n";
}

void RunStore::finish_run(const std::string& run_id, const json& summary) {
  flush_all();

  std::lock_guard<std::mutex> lock(db_mutex_);
  sqlite3_stmt* stmt = prepare("UPDATE runs SET summary = ? WHERE run_id = ?;");

  std::string summary_str = summary.dump();
  sqlite3_bind_text(stmt, 1, summary_str.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, run_id.c_str(), -1, SQLITE_STATIC);

  int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("Failed to finish run '" + run_id + "': " + sqlite3_errmsg(db_));
  }
  if (sqlite3_changes(db_) == 0) {
    throw std::runtime_error("Unknown run '" + run_id + "'");
  }
}

void RunStore::add_bar(const std::string& run_id, const Bar& bar) {
  bool full = false;
  {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    // append a copy of the bar to the write buffer
    bars_write_buffer_.push_back({run_id, bar});
    full = bars_write_buffer_.size() >= config_.bar_buffer_size;
  }

  if (full) {
    flush_bars();
  }
}

void RunStore::add_event(const std::string& run_id, const std::string& event_type,
                         long long timestamp_ms, const std::string& symbol,
                         const json& data) {
  bool full = false;
  {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    events_write_buffer_.push_back({run_id, StoredEvent{event_type, timestamp_ms, symbol, data}});
    full = events_write_buffer_.size() >= config_.event_buffer_size;
  }

  if (full) {
    flush_events();
  }
}

void RunStore::flush_all() {
  flush_bars();
  flush_events();
}

void RunStore::flush_bars() {
  std::vector<BufferedBar> to_flush;
  {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    to_flush = std::move(bars_write_buffer_);
    bars_write_buffer_.clear();
  }

  if (to_flush.empty()) return;

  try {
    std::lock_guard<std::mutex> lock(db_mutex_);
    db_batch_insert_bars(to_flush);
  } catch (const std::exception&) {
    // the transaction was rolled back; keep the batch ahead of newer writes
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    bars_write_buffer_.insert(bars_write_buffer_.begin(),
                 std::make_move_iterator(to_flush.begin()),
                 std::make_move_iterator(to_flush.end()));
    throw;
  }

#ifdef GAMBLER_DEBUG
  std::cout << "[RunStore] Flushed " << to_flush.size() << " bars to DB\n";
#endif
}

void RunStore::flush_events() {
  std::vector<BufferedEvent> to_flush;
  {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    to_flush = std::move(events_write_buffer_);
    events_write_buffer_.clear();
  }

  if (to_flush.empty()) return;

  try {
    std::lock_guard<std::mutex> lock(db_mutex_);
    db_batch_insert_events(to_flush);
  } catch (const std::exception&) {
    // the transaction was rolled back; keep the batch ahead of newer writes
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    events_write_buffer_.insert(events_write_buffer_.begin(),
                 std::make_move_iterator(to_flush.begin()),
                 std::make_move_iterator(to_flush.end()));
    throw;
  }

#ifdef GAMBLER_DEBUG
  std::cout << "[RunStore] Flushed " << to_flush.size() << " events to DB\n";
#endif
}

std::size_t RunStore::pending_writes() const {
  std::lock_guard<std::mutex> lock(buffer_mutex_);
  return bars_write_buffer_.size() + events_write_buffer_.size();
}

void RunStore::db_batch_insert_bars(const std::vector<BufferedBar>& batch) {
  if (batch.empty()) return;

  sqlite3_stmt* stmt = prepare(R"SQL(
    INSERT OR IGNORE INTO bars(run_id, symbol, ts_ms, open, high, low, close, volume)
    VALUES(?, ?, ?, ?, ?, ?, ?, ?);
  )SQL");

  exec_sql("BEGIN TRANSACTION;");
  try {
    for (const auto& [run_id, bar] : batch) {
      sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_STATIC);
      sqlite3_bind_text(stmt, 2, bar.symbol.c_str(), -1, SQLITE_STATIC);
      sqlite3_bind_int64(stmt, 3, to_epoch_ms(bar.ts));
      sqlite3_bind_double(stmt, 4, bar.open);
      sqlite3_bind_double(stmt, 5, bar.high);
      sqlite3_bind_double(stmt, 6, bar.low);
      sqlite3_bind_double(stmt, 7, bar.close);
      sqlite3_bind_double(stmt, 8, bar.volume);

      int rc = sqlite3_step(stmt);
      if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to insert bar: ") + sqlite3_errmsg(db_));
      }
      sqlite3_reset(stmt);
    }
    exec_sql("COMMIT;");
  } catch (const std::exception&) {
    exec_sql("ROLLBACK;");
    sqlite3_finalize(stmt);
    throw;
  }
  sqlite3_finalize(stmt);
}

void RunStore::db_batch_insert_events(const std::vector<BufferedEvent>& batch) {
  if (batch.empty()) return;

  sqlite3_stmt* stmt = prepare(R"SQL(
    INSERT INTO events(run_id, event_type, timestamp_ms, symbol, data)
    VALUES(?, ?, ?, ?, ?);
  )SQL");

  exec_sql("BEGIN TRANSACTION;");
  try {
    for (const auto& [run_id, event] : batch) {
      sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_STATIC);
      sqlite3_bind_text(stmt, 2, event.event_type.c_str(), -1, SQLITE_STATIC);
      sqlite3_bind_int64(stmt, 3, event.timestamp_ms);
      sqlite3_bind_text(stmt, 4, event.symbol.c_str(), -1, SQLITE_STATIC);

      std::string data_str = event.data.dump();
      sqlite3_bind_text(stmt, 5, data_str.c_str(), -1, SQLITE_TRANSIENT);

      int rc = sqlite3_step(stmt);
      if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to insert event: ") + sqlite3_errmsg(db_));
      }
      sqlite3_reset(stmt);
    }
    exec_sql("COMMIT;");
  } catch (const std::exception&) {
    exec_sql("ROLLBACK;");
    sqlite3_finalize(stmt);
    throw;
  }
  sqlite3_finalize(stmt);
}

std::vector<Bar> RunStore::query_bars(const std::string& run_id) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  sqlite3_stmt* stmt = prepare(R"SQL(
    SELECT symbol, ts_ms, open, high, low, close, volume
    FROM bars
    WHERE run_id = ?
    ORDER BY ts_ms ASC;
  )SQL");

  sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_STATIC);

  std::vector<Bar> result;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    Bar bar;
    bar.symbol = column_text(stmt, 0);
    bar.ts = from_epoch_ms(sqlite3_column_int64(stmt, 1));
    bar.open = sqlite3_column_double(stmt, 2);
    bar.high = sqlite3_column_double(stmt, 3);
    bar.low = sqlite3_column_double(stmt, 4);
    bar.close = sqlite3_column_double(stmt, 5);
    bar.volume = sqlite3_column_double(stmt, 6);
    result.push_back(std::move(bar));
  }

  sqlite3_finalize(stmt);
  return result;
}

std::vector<StoredEvent> RunStore::query_events(const std::string& run_id,
                                                const std::vector<std::string>& event_types) {
  std::string sql = R"SQL(
    SELECT event_type, timestamp_ms, symbol, data
    FROM events
    WHERE run_id = ?
  )SQL";

  // Optional: filter by event types
  if (!event_types.empty()) {
    sql += " AND event_type IN (";
    for (size_t i = 0; i < event_types.size(); ++i) {
      if (i > 0) sql += ",";
      sql += "?";
    }
    sql += ")";
  }

  sql += " ORDER BY event_id ASC;";

  std::lock_guard<std::mutex> lock(db_mutex_);
  sqlite3_stmt* stmt = prepare(sql.c_str());

  int bind_idx = 1;
  sqlite3_bind_text(stmt, bind_idx++, run_id.c_str(), -1, SQLITE_STATIC);
  for (const auto& type : event_types) {
    sqlite3_bind_text(stmt, bind_idx++, type.c_str(), -1, SQLITE_STATIC);
  }

  std::vector<StoredEvent> result;
  try {
    while (sqlite3_step(stmt) == SQLITE_ROW) {
      StoredEvent event;
      event.event_type = column_text(stmt, 0);
      event.timestamp_ms = sqlite3_column_int64(stmt, 1);
      event.symbol = column_text(stmt, 2);
      event.data = column_json(stmt, 3);
      result.push_back(std::move(event));
    }
  } catch (const json::exception& e) {
    sqlite3_finalize(stmt);
    throw std::runtime_error(std::string("Corrupt event payload: ") + e.what());
  }

  sqlite3_finalize(stmt);
  return result;
}

std::vector<RunRecord> RunStore::list_runs(int limit) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  sqlite3_stmt* stmt = prepare(R"SQL(
    SELECT run_id, symbol, started_at, config, summary
    FROM runs
    ORDER BY started_at DESC, rowid DESC
    LIMIT ?;
  )SQL");

  sqlite3_bind_int(stmt, 1, limit);

  std::vector<RunRecord> result;
  try {
    while (sqlite3_step(stmt) == SQLITE_ROW) {
      RunRecord run;
      run.run_id = column_text(stmt, 0);
      run.symbol = column_text(stmt, 1);
      run.started_at = column_text(stmt, 2);
      run.config = column_json(stmt, 3);
      run.summary = column_json(stmt, 4);
      result.push_back(std::move(run));
    }
  } catch (const json::exception& e) {
    sqlite3_finalize(stmt);
    throw std::runtime_error(std::string("Corrupt run record: ") + e.what());
  }

  sqlite3_finalize(stmt);
  return result;
}

void RunStore::exec_sql(const std::string& sql) {
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg ? err_msg : "Unknown error";
    if (err_msg) sqlite3_free(err_msg);
    throw std::runtime_error("SQL error: " + error);
  }
}

int RunStore::query_int(const std::string& sql, int default_value) {
  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return default_value;
  }

  int result = default_value;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    result = sqlite3_column_int(stmt, 0);
  }
  sqlite3_finalize(stmt);
  return result;
}

sqlite3_stmt* RunStore::prepare(const char* sql) {
  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
  }
  return stmt;
}

} // namespace gambler
