#pragma once

#include "gambler/MarketDataTypes.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <vector>
#include <mutex>
#include <string>

/*
RunStore:
  Persistent SQLite storage for backtest runs: one row per run, the bars the
  run saw, and every order event it produced.

  Write path (during backtest):
    - Bars/events buffered in memory
    - Flushed to SQLite in one transaction when a buffer reaches its threshold,
      or on flush_all() / finish_run() / destruction

  Read path:
    - query_bars / query_events / list_runs go straight to SQLite
*/

namespace gambler {

using json = nlohmann::json;

struct RunStoreConfig {
  std::string db_path{"backtest.db"};   // ":memory:" for a throwaway store
  size_t bar_buffer_size{50000};        // Flush bars when buffer reaches this size
  size_t event_buffer_size{50000};      // Flush events when buffer reaches this size
};

struct StoredEvent {
  std::string event_type;      // 'OrderStatus', ...
  long long timestamp_ms{0};
  std::string symbol;
  json data;                   // Flexible JSON payload
};

struct RunRecord {
  std::string run_id;
  std::string symbol;
  std::string started_at;      // SQLite CURRENT_TIMESTAMP, UTC
  json config;
  json summary;                // null until finish_run
};

class RunStore {
public:
  // Throws std::runtime_error if the database cannot be opened or migrated.
  explicit RunStore(const RunStoreConfig& config = RunStoreConfig());
  ~RunStore();

  RunStore(const RunStore&) = delete;
  RunStore& operator=(const RunStore&) = delete;

  // Initialize database schema (idempotent)
  void ensure_schema();
  int schema_version();

  // Run bookkeeping (written immediately)
  void begin_run(const std::string& run_id, const std::string& symbol, const json& config);
  void finish_run(const std::string& run_id, const json& summary);

  // Write operations (buffered)
  void add_bar(const std::string& run_id, const Bar& bar);
  void add_event(const std::string& run_id, const std::string& event_type,
                 long long timestamp_ms, const std::string& symbol, const json& data);

  // Flush buffered writes to database
  void flush_all();
  void flush_bars();
  void flush_events();

  std::size_t pending_writes() const;

  // Read operations (flushed data only)
  std::vector<Bar> query_bars(const std::string& run_id);
  std::vector<StoredEvent> query_events(const std::string& run_id,
                                        const std::vector<std::string>& event_types = {});
  std::vector<RunRecord> list_runs(int limit = 20);

private:
  struct BufferedBar {
    std::string run_id;
    Bar bar;
  };
  struct BufferedEvent {
    std::string run_id;
    StoredEvent event;
  };

  RunStoreConfig config_;
  sqlite3* db_{nullptr};

  // Thread safety
  mutable std::mutex buffer_mutex_;
  std::mutex db_mutex_;

  // Write buffers (accumulate before flushing to DB)
  std::vector<BufferedBar> bars_write_buffer_;
  std::vector<BufferedEvent> events_write_buffer_;

  // DB operations (must hold db_mutex_)
  void db_ensure_schema();
  void db_batch_insert_bars(const std::vector<BufferedBar>& batch);
  void db_batch_insert_events(const std::vector<BufferedEvent>& batch);

  // Utility
  void exec_sql(const std::string& sql);
  int query_int(const std::string& sql, int default_value = 0);
  sqlite3_stmt* prepare(const char* sql);
};

} // namespace gambler
