#include "cli_utils.h"

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace hql::cli {

std::string read_stdin() {
  std::string out{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
  if (std::cin.bad()) {
    throw std::runtime_error("Failed to read stdin");
  }
  return out;
}

bool trace_enabled_from_env() {
  const char* raw = std::getenv("HQL_TRACE");
  if (!raw || !*raw) return false;
  return std::string(raw) != "0";
}

}  // namespace hql::cli
