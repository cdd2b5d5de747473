#include "cli_args.h"

#include <string>

namespace hql::cli {

/// Prints the startup help so users see baseline usage without flags.
/// MUST keep examples aligned with current CLI and MUST not throw on stream errors.
void print_startup_help(std::ostream& os) {
  os << "hql - HTML pipeline query command line interface\n\n";
  os << "Usage:\n";
  os << "  hql --query <hql> [--input <path>] [DOCUMENT]\n";
  os << "  hql --lint \"<hql>\" [--format text|json]\n";
  os << "  hql --mode plain|json\n";
  os << "  hql --version\n\n";
  os << "Notes:\n";
  os << "  - The document comes from --input, then the DOCUMENT argument, then stdin.\n";
  os << "  - Stages are separated by '|'; literals are wrapped in backticks.\n";
  os << "  - Exit codes: 0=success, 1=parse/runtime error, 2=CLI/IO usage error.\n\n";
  os << "Examples:\n";
  os << "  hql --query \"@path(\\`//a\\`) | @attr(\\`href\\`)\" --input ./index.html\n";
  os << "  hql --query \"@id(\\`title\\`) | #text() | #trim()\" \"<h1 id=title> Hi </h1>\"\n";
  os << "  hql --lint \"@path(\\`//p\\`) | #text() | @child(0)\"\n";
}

/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags.
void print_help(std::ostream& os) {
  os << "Usage: hql --query <hql> [--input <path>] [DOCUMENT]\n";
  os << "       hql --lint \"<hql>\" [--format text|json]\n";
  os << "       hql --mode plain|json\n";
  os << "       hql --version\n";
  os << "If neither --input nor DOCUMENT is given, HTML is read from stdin.\n";
  os << "--fragment parses the document as a fragment without implied html/body wrappers.\n";
  os << "--explain prints the normalized pipeline without running it.\n";
  os << "--verbose traces each stage on stderr (same as HQL_TRACE=1).\n";
  os << "--lint validates syntax and stage order without executing the query.\n";
  os << "--format json emits lint diagnostics as a JSON array.\n";
  os << "Exit codes: 0=success, 1=parse/runtime error, 2=CLI/IO usage error.\n";
}

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags. Inputs are argc/argv; outputs are options/error.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  bool have_document = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--query" || arg == "--hql" || arg == "-q") {
      if (i + 1 >= argc) {
        error = "Missing value for --query";
        return false;
      }
      options.query = argv[++i];
    } else if (arg == "--input" || arg == "-f" || arg == "--file") {
      if (i + 1 >= argc) {
        error = "Missing value for --input";
        return false;
      }
      options.input = argv[++i];
    } else if (arg == "--lint") {
      options.lint = true;
      if (i + 1 < argc) {
        std::string maybe_query = argv[i + 1];
        if (!maybe_query.empty() && maybe_query[0] != '-') {
          options.query = maybe_query;
          ++i;
        }
      }
    } else if (arg == "--format") {
      if (i + 1 >= argc) {
        error = "Missing value for --format";
        return false;
      }
      options.lint_format = argv[++i];
    } else if (arg == "--mode") {
      if (i + 1 >= argc) {
        error = "Missing value for --mode";
        return false;
      }
      options.output_mode = argv[++i];
    } else if (arg == "--fragment") {
      options.fragment = true;
    } else if (arg == "--explain") {
      options.explain = true;
    } else if (arg == "--verbose" || arg == "-v") {
      options.verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      options.show_help = true;
    } else if (arg == "--version") {
      options.show_version = true;
    } else if (!arg.empty() && arg[0] == '-') {
      error = "Unknown argument: " + arg;
      return false;
    } else {
      if (have_document) {
        error = "Unexpected extra argument: " + arg;
        return false;
      }
      options.document = arg;
      have_document = true;
    }
  }
  if (!options.lint && options.lint_format != "text") {
    error = "--format is only supported with --lint";
    return false;
  }
  if (options.lint_format != "text" && options.lint_format != "json") {
    error = "Invalid --format value (use text|json)";
    return false;
  }
  // WHY: unknown modes would silently change the output contract.
  if (options.output_mode != "plain" && options.output_mode != "json") {
    error = "Invalid --mode value (use plain|json)";
    return false;
  }
  if (!options.input.empty() && have_document) {
    error = "--input and an inline DOCUMENT are mutually exclusive";
    return false;
  }
  return true;
}

}  // namespace hql::cli
