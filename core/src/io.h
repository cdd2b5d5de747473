#pragma once

#include <string>

namespace hql {

/// Loads file contents for query execution.
/// MUST throw std::runtime_error on IO errors.
std::string read_file(const std::string& path);

}  // namespace hql
