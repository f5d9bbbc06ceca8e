#include "mysql_metric_store.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <format>
#include <iomanip>
#include <sstream>

#include "fastlog/fastlog.hpp"

namespace clustermon {

namespace {
constexpr char kManagerLoggerName[] = "manager_file_logger";

constexpr char kCreateMetricsTable[] = R"(
CREATE TABLE IF NOT EXISTS metrics (
  id BIGINT NOT NULL PRIMARY KEY,
  timestamp DATETIME(6) NOT NULL,
  node_name VARCHAR(253) NOT NULL,
  cpu_usage DOUBLE NOT NULL,
  memory_usage BIGINT NOT NULL,
  is_benchmark TINYINT(1) NOT NULL DEFAULT 0,
  cluster_cpu_usage DOUBLE NOT NULL,
  cluster_total_cpu BIGINT NOT NULL,
  KEY idx_metrics_time (timestamp, id)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4)";

constexpr char kCreateSequenceTable[] = R"(
CREATE TABLE IF NOT EXISTS metrics_sequence (
  name VARCHAR(64) NOT NULL PRIMARY KEY,
  next_id BIGINT NOT NULL
) ENGINE=InnoDB)";

// 表中已有数据时，从 MAX(id) 之后继续分配
constexpr char kSeedSequence[] =
    "INSERT IGNORE INTO metrics_sequence (name, next_id) "
    "SELECT 'metrics', COALESCE(MAX(id), 0) + 1 FROM metrics";

constexpr char kSelectAll[] =
    "SELECT id, timestamp, node_name, cpu_usage, memory_usage, is_benchmark, "
    "cluster_cpu_usage, cluster_total_cpu FROM metrics "
    "ORDER BY timestamp DESC, id DESC";

void set_error(std::string* error, std::string message) {
  if (error) {
    *error = std::move(message);
  }
}

std::string format_time(const std::chrono::system_clock::time_point& tp) {
  auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
  auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(tp - seconds)
          .count();
  std::time_t t = std::chrono::system_clock::to_time_t(seconds);
  std::tm tm_time;
  gmtime_r(&t, &tm_time);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_time);
  return std::format("{}.{:06}", buf, micros);
}

std::chrono::system_clock::time_point parse_time(const char* str) {
  std::tm tm = {};
  std::istringstream ss(str);
  ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

  // DATETIME(6) 的小数部分
  const char* dot = std::strchr(str, '.');
  if (dot) {
    std::string frac(dot + 1);
    frac.resize(6, '0');
    tp += std::chrono::microseconds(std::strtoll(frac.c_str(), nullptr, 10));
  }
  return tp;
}

MetricSample row_to_sample(MYSQL_ROW row) {
  auto text = [row](int i) -> const char* { return row[i] ? row[i] : ""; };

  MetricSample sample;
  sample.id = std::strtoll(text(0), nullptr, 10);
  sample.timestamp = parse_time(text(1));
  sample.node_name = text(2);
  sample.cpu_usage = std::strtod(text(3), nullptr);
  sample.memory_usage = std::strtoll(text(4), nullptr, 10);
  sample.is_benchmark = std::strtol(text(5), nullptr, 10) != 0;
  sample.cluster_cpu_usage = std::strtod(text(6), nullptr);
  sample.cluster_total_cpu = std::strtoll(text(7), nullptr, 10);
  return sample;
}

// 事务守卫，未提交的事务在析构时回滚
class Transaction {
 public:
  explicit Transaction(MYSQL* conn) : _conn(conn) {}

  ~Transaction() {
    if (_active && mysql_query(_conn, "ROLLBACK") != 0) {
      auto* log = fastlog::file::get_logger(kManagerLoggerName);
      if (log) log->error("MetricStore: rollback failed: {}", mysql_error(_conn));
    }
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  bool begin(std::string* error) {
    if (mysql_query(_conn, "START TRANSACTION") != 0) {
      set_error(error, std::format("Failed to start transaction: {}",
                                   mysql_error(_conn)));
      return false;
    }
    _active = true;
    return true;
  }

  bool commit(std::string* error) {
    if (mysql_query(_conn, "COMMIT") != 0) {
      set_error(error, std::format("Failed to commit transaction: {}",
                                   mysql_error(_conn)));
      return false;
    }
    _active = false;
    return true;
  }

 private:
  MYSQL* _conn;
  bool _active = false;
};
}  // namespace

MysqlMetricStore::MysqlMetricStore() = default;

MysqlMetricStore::~MysqlMetricStore() { close(); }

bool MysqlMetricStore::open(const MysqlOptions& options, std::string* error) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_initialized) {
    return true;
  }

  conn_ = mysql_init(nullptr);
  if (!conn_) {
    set_error(error, "mysql_init failed");
    fastlog::file::get_logger(kManagerLoggerName)->error("MetricStore: mysql_init failed");
    return false;
  }

  if (!mysql_real_connect(conn_, options.host.c_str(), options.user.c_str(),
                          options.password.c_str(), options.database.c_str(),
                          options.port, nullptr, 0)) {
    std::string message =
        std::format("mysql_real_connect failed: {}", mysql_error(conn_));
    fastlog::file::get_logger(kManagerLoggerName)->error("MetricStore: {}", message);
    set_error(error, std::move(message));
    mysql_close(conn_);
    conn_ = nullptr;
    return false;
  }

  // 设置字符集
  mysql_set_character_set(conn_, "utf8mb4");

  const char* schema[] = {kCreateMetricsTable, kCreateSequenceTable,
                          kSeedSequence};
  for (const char* sql : schema) {
    std::string message;
    if (!execute(sql, &message)) {
      fastlog::file::get_logger(kManagerLoggerName)->error("MetricStore: schema setup failed: {}", message);
      set_error(error, "schema setup failed: " + message);
      mysql_close(conn_);
      conn_ = nullptr;
      return false;
    }
  }

  _initialized = true;
  fastlog::file::get_logger(kManagerLoggerName)->info("MetricStore: connected to {}:{}/{}",
               options.host, options.port, options.database);
  return true;
}

void MysqlMetricStore::close() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (conn_) {
    mysql_close(conn_);
    conn_ = nullptr;
  }
  _initialized = false;
}

bool MysqlMetricStore::append(const MetricSample& sample, std::string* error) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (!_initialized || !conn_) {
    set_error(error, "metric store is not open");
    return false;
  }

  Transaction tx(conn_);
  int64_t id = 0;
  if (!tx.begin(error) || !next_id(&id, error) ||
      !insert_row(sample, id, error)) {
    return false;
  }
  return tx.commit(error);
}

bool MysqlMetricStore::query_all(std::vector<MetricSample>* samples,
                                 std::string* error) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (!_initialized || !conn_) {
    set_error(error, "metric store is not open");
    return false;
  }

  if (mysql_query(conn_, kSelectAll) != 0) {
    set_error(error, std::format("Failed to query metrics: {}", mysql_error(conn_)));
    return false;
  }

  MYSQL_RES* result = mysql_store_result(conn_);
  if (!result) {
    set_error(error, std::format("Failed to read metrics: {}", mysql_error(conn_)));
    return false;
  }

  std::vector<MetricSample> rows;
  rows.reserve(mysql_num_rows(result));
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(result)) != nullptr) {
    rows.push_back(row_to_sample(row));
  }
  mysql_free_result(result);

  samples->swap(rows);
  return true;
}

bool MysqlMetricStore::mark_benchmark(std::string* error) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (!_initialized || !conn_) {
    set_error(error, "metric store is not open");
    return false;
  }

  // 先锁序列行，与 append/reset 的加锁顺序一致
  Transaction tx(conn_);
  int64_t id = 0;
  if (!tx.begin(error) || !next_id(&id, error)) {
    return false;
  }

  int64_t source_id = 0;
  bool found = false;
  if (!latest_collected_id(&source_id, &found, error)) {
    return false;
  }
  if (!found) {
    // 没有可复制的行，回滚以免消耗 id
    return true;
  }

  std::string sql = std::format(
      "INSERT INTO metrics (id, timestamp, node_name, cpu_usage, memory_usage, "
      "is_benchmark, cluster_cpu_usage, cluster_total_cpu) "
      "SELECT {}, timestamp, node_name, cpu_usage, memory_usage, 1, "
      "cluster_cpu_usage, cluster_total_cpu FROM metrics WHERE id = {}",
      id, source_id);
  std::string message;
  if (!execute(sql, &message)) {
    set_error(error, "Failed to insert benchmark row: " + message);
    return false;
  }
  if (!tx.commit(error)) {
    return false;
  }

  fastlog::file::get_logger(kManagerLoggerName)->info("MetricStore: row {} copied as benchmark row {}", source_id, id);
  return true;
}

bool MysqlMetricStore::reset(std::string* error) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (!_initialized || !conn_) {
    set_error(error, "metric store is not open");
    return false;
  }

  Transaction tx(conn_);
  if (!tx.begin(error)) {
    return false;
  }

  std::string message;
  if (!execute("UPDATE metrics_sequence SET next_id = 1 WHERE name = 'metrics'",
               &message)) {
    set_error(error, "Failed to reset sequence: " + message);
    return false;
  }
  if (!execute("DELETE FROM metrics", &message)) {
    set_error(error, "Failed to delete records: " + message);
    return false;
  }
  if (!tx.commit(error)) {
    return false;
  }

  fastlog::file::get_logger(kManagerLoggerName)->info("MetricStore: history reset");
  return true;
}

bool MysqlMetricStore::execute(const std::string& sql, std::string* error) {
  if (mysql_query(conn_, sql.c_str()) != 0) {
    set_error(error, mysql_error(conn_));
    return false;
  }
  return true;
}

bool MysqlMetricStore::next_id(int64_t* id, std::string* error) {
  std::string message;
  if (!execute("UPDATE metrics_sequence SET next_id = LAST_INSERT_ID(next_id + 1) "
               "WHERE name = 'metrics'",
               &message)) {
    set_error(error, "Failed to allocate id: " + message);
    return false;
  }
  if (mysql_affected_rows(conn_) != 1) {
    set_error(error, "Failed to allocate id: metrics_sequence row is missing");
    return false;
  }
  // LAST_INSERT_ID(expr) 返回更新后的 next_id
  *id = static_cast<int64_t>(mysql_insert_id(conn_)) - 1;
  return true;
}

bool MysqlMetricStore::insert_row(const MetricSample& sample, int64_t id,
                                  std::string* error) {
  if (!std::isfinite(sample.cpu_usage) || !std::isfinite(sample.cluster_cpu_usage)) {
    set_error(error, std::format("Refusing to insert non-finite usage for node {}",
                                 sample.node_name));
    return false;
  }

  std::string sql = std::format(
      "INSERT INTO metrics (id, timestamp, node_name, cpu_usage, memory_usage, "
      "is_benchmark, cluster_cpu_usage, cluster_total_cpu) "
      "VALUES ({}, '{}', '{}', {}, {}, {}, {}, {})",
      id, format_time(sample.timestamp), escape(sample.node_name),
      sample.cpu_usage, sample.memory_usage, sample.is_benchmark ? 1 : 0,
      sample.cluster_cpu_usage, sample.cluster_total_cpu);

  std::string message;
  if (!execute(sql, &message)) {
    set_error(error, "Failed to insert metrics: " + message);
    return false;
  }
  return true;
}

bool MysqlMetricStore::latest_collected_id(int64_t* id, bool* found,
                                           std::string* error) {
  *found = false;
  if (mysql_query(conn_,
                  "SELECT id FROM metrics WHERE is_benchmark = 0 "
                  "ORDER BY id DESC LIMIT 1") != 0) {
    set_error(error, std::format("Failed to find latest sample: {}",
                                 mysql_error(conn_)));
    return false;
  }

  MYSQL_RES* result = mysql_store_result(conn_);
  if (!result) {
    set_error(error, std::format("Failed to find latest sample: {}",
                                 mysql_error(conn_)));
    return false;
  }

  MYSQL_ROW row = mysql_fetch_row(result);
  if (row && row[0]) {
    *id = std::strtoll(row[0], nullptr, 10);
    *found = true;
  }
  mysql_free_result(result);
  return true;
}

std::string MysqlMetricStore::escape(const std::string& value) {
  std::string escaped(value.size() * 2 + 1, '\0');
  unsigned long length = mysql_real_escape_string(
      conn_, escaped.data(), value.c_str(), value.size());
  escaped.resize(length);
  return escaped;
}

}  // namespace clustermon
