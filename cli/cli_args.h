#pragma once

#include <ostream>
#include <string>

namespace hql::cli {

/// Parsed command-line options for the hql binary.
/// Defaults describe a plain-mode query against a full document.
struct CliOptions {
  std::string query;
  std::string input;
  std::string document;
  bool fragment = false;
  std::string output_mode = "plain";
  bool lint = false;
  std::string lint_format = "text";
  bool explain = false;
  bool verbose = false;
  bool show_help = false;
  bool show_version = false;
};

void print_startup_help(std::ostream& os);
void print_help(std::ostream& os);
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace hql::cli
