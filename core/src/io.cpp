#include "io.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace hql {

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw std::runtime_error("Failed to read file: " + path);
  }
  return buffer.str();
}

}  // namespace hql
