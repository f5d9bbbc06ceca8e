#pragma once

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace clustermon {
// 读取文件类
class ReadFile {
public:
  ReadFile(const std::string &name) : _file_stream(name) {}

  ~ReadFile() {
    if (_file_stream.is_open())
      _file_stream.close();
  }

  bool is_open() const { return _file_stream.is_open(); }

  // 读取一行并将其分割成单词存储在args中，读到文件末尾返回 false
  bool read_line(std::vector<std::string> *args) {
    std::string line;
    if (!std::getline(_file_stream, line)) {
      return false;
    }
    std::istringstream line_stream(line);
    std::string word;
    while (line_stream >> word) {
      args->push_back(word);
    }
    return true;
  }

private:
  std::ifstream _file_stream;
};

} // namespace clustermon
