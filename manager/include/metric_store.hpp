#pragma once

#include <string>
#include <vector>

#include "metric_sample.hpp"

namespace clustermon {

// 采样表：只追加、整表清空，行写入后不可修改。
// 所有操作失败时返回 false，并将原因写入 error（可为 nullptr）。
class MetricStore {
 public:
  virtual ~MetricStore() = default;

  // 追加一行，id 由存储层按插入顺序分配
  virtual bool append(const MetricSample& sample, std::string* error) = 0;

  // 全部行，按 timestamp 降序，id 降序
  virtual bool query_all(std::vector<MetricSample>* samples,
                         std::string* error) = 0;

  // 复制 id 最大的非 benchmark 行并标记为 benchmark；没有这样的行时什么也不做
  virtual bool mark_benchmark(std::string* error) = 0;

  // 原子地删除所有行并将 id 序列复位
  virtual bool reset(std::string* error) = 0;
};

}  // namespace clustermon
