#pragma once

#include <string>

namespace hql::cli {

/// Reads all of stdin as raw bytes.
/// MUST throw std::runtime_error when the stream fails.
std::string read_stdin();

/// True when HQL_TRACE is set to a non-empty value other than "0".
bool trace_enabled_from_env();

}  // namespace hql::cli
