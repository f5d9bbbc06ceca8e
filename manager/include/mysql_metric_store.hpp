#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <mysql/mysql.h>

#include "metric_store.hpp"

namespace clustermon {

// MySQL 连接参数
struct MysqlOptions {
  std::string host = "127.0.0.1";
  unsigned int port = 3306;
  std::string user = "monitor";
  std::string password;
  std::string database = "clustermon_db";
};

// 基于 MySQL 的采样表。
// id 不使用 AUTO_INCREMENT，而是由 metrics_sequence 表在每个写事务内分配，
// 这样 reset 时序列复位与删除行在同一个事务里提交或回滚。
class MysqlMetricStore : public MetricStore {
 public:
  MysqlMetricStore();
  ~MysqlMetricStore() override;

  // 连接数据库并建表
  bool open(const MysqlOptions& options, std::string* error);

  void close();

  bool append(const MetricSample& sample, std::string* error) override;
  bool query_all(std::vector<MetricSample>* samples,
                 std::string* error) override;
  bool mark_benchmark(std::string* error) override;
  bool reset(std::string* error) override;

 private:
  bool execute(const std::string& sql, std::string* error);

  // 从 metrics_sequence 取下一个 id，必须在事务内调用
  bool next_id(int64_t* id, std::string* error);

  bool insert_row(const MetricSample& sample, int64_t id, std::string* error);

  // id 最大的非 benchmark 行
  bool latest_collected_id(int64_t* id, bool* found, std::string* error);

  std::string escape(const std::string& value);

  MYSQL* conn_ = nullptr;
  std::mutex _mtx;
  bool _initialized = false;
};

}  // namespace clustermon
