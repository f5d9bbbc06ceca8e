#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "monitor/cpu_usage_monitor.hpp"

using namespace clustermon;

namespace {

class CpuUsageMonitorTest : public testing::Test {
 protected:
  void SetUp() override {
    _path = std::filesystem::temp_directory_path() /
            ("clustermon_stat_" +
             std::string(testing::UnitTest::GetInstance()->current_test_info()->name()));
  }
  void TearDown() override { std::filesystem::remove(_path); }

  void write_stat(const std::string& cpu_line) {
    std::ofstream out(_path, std::ios::trunc);
    out << cpu_line << "\n"
        << "cpu0 1 2 3 4 5 6 7 8 0 0\n"
        << "intr 12345\n";
  }

  std::filesystem::path _path;
};

}  // namespace

TEST(CpuUsageParseTest, ParsesAggregateLine)
{
  CpuUsageMonitor::CpuTimes times;
  ASSERT_TRUE(CpuUsageMonitor::parse_cpu_line(
      {"cpu", "100", "10", "40", "800", "30", "5", "5", "10", "0", "0"}, &times));
  EXPECT_EQ(170u, times.busy);
  EXPECT_EQ(1000u, times.total);
}

TEST(CpuUsageParseTest, RejectsOtherLines)
{
  CpuUsageMonitor::CpuTimes times;
  EXPECT_FALSE(CpuUsageMonitor::parse_cpu_line({"cpu0", "1", "2", "3", "4"}, &times));
  EXPECT_FALSE(CpuUsageMonitor::parse_cpu_line({"cpu", "1", "2"}, &times));
  EXPECT_FALSE(CpuUsageMonitor::parse_cpu_line({"cpu", "1", "x", "3", "4"}, &times));
}

TEST(CpuUsageParseTest, UsedMillicores)
{
  CpuUsageMonitor::CpuTimes prev{100, 1000};
  CpuUsageMonitor::CpuTimes curr{350, 2000};
  // 250 / 1000 忙碌
  EXPECT_EQ(1000, CpuUsageMonitor::used_millicores(prev, curr, 4000));
  EXPECT_EQ(0, CpuUsageMonitor::used_millicores(prev, prev, 4000));
  EXPECT_EQ(0, CpuUsageMonitor::used_millicores(prev, curr, 0));
}

TEST_F(CpuUsageMonitorTest, FirstSampleReportsZero)
{
  write_stat("cpu 100 0 100 800 0 0 0 0 0 0");
  CpuUsageMonitor monitor(_path.string());

  clustermon::proto::NodeReport report;
  report.set_cpu_capacity_millicores(2000);
  monitor.update(&report);
  EXPECT_EQ(0, report.cpu_used_millicores());
}

TEST_F(CpuUsageMonitorTest, ReportsDeltaBetweenSamples)
{
  write_stat("cpu 100 0 100 800 0 0 0 0 0 0");
  CpuUsageMonitor monitor(_path.string());

  clustermon::proto::NodeReport report;
  report.set_cpu_capacity_millicores(2000);
  monitor.update(&report);

  // busy +300, total +400 → 75%
  write_stat("cpu 300 0 200 900 0 0 0 0 0 0");
  monitor.update(&report);
  EXPECT_EQ(1500, report.cpu_used_millicores());
}

TEST(CpuUsageMonitorMissingTest, MissingFileLeavesReportUntouched)
{
  CpuUsageMonitor monitor("/nonexistent/clustermon/stat");
  clustermon::proto::NodeReport report;
  report.set_cpu_used_millicores(7);
  monitor.update(&report);
  EXPECT_EQ(7, report.cpu_used_millicores());
}
