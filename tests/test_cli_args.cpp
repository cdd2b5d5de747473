#include "test_harness.h"

#include <sstream>
#include <string>
#include <vector>

#include "cli_args.h"

namespace {

bool parse(std::vector<const char*> args, hql::cli::CliOptions& options, std::string& error) {
  args.insert(args.begin(), "hql");
  return hql::cli::parse_cli_args(static_cast<int>(args.size()), const_cast<char**>(args.data()), options, error);
}

void test_parse_cli_args_accepts_query_and_input() {
  hql::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--query", "@flat()", "--input", "page.html", "--mode", "json", "--fragment"}, options, error);
  expect_true(ok, "parse_cli_args accepts query flags");
  expect_eq(options.query, "@flat()", "query parsed");
  expect_eq(options.input, "page.html", "input parsed");
  expect_eq(options.output_mode, "json", "mode parsed");
  expect_true(options.fragment, "fragment parsed");
}

void test_parse_cli_args_short_aliases() {
  hql::cli::CliOptions options;
  std::string error;
  bool ok = parse({"-q", "#text()", "-f", "a.html", "-v"}, options, error);
  expect_true(ok, "short aliases accepted");
  expect_eq(options.query, "#text()", "-q sets query");
  expect_eq(options.input, "a.html", "-f sets input");
  expect_true(options.verbose, "-v sets verbose");
}

void test_parse_cli_args_inline_document() {
  hql::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--query", "@flat()", "<p>x</p>"}, options, error);
  expect_true(ok, "inline document accepted");
  expect_eq(options.document, "<p>x</p>", "document captured");

  hql::cli::CliOptions both;
  expect_true(!parse({"--query", "@flat()", "--input", "a.html", "<p>x</p>"}, both, error),
              "input and inline document conflict");
  hql::cli::CliOptions extra;
  expect_true(!parse({"--query", "@flat()", "<p>x</p>", "<p>y</p>"}, extra, error), "only one inline document");
}

void test_parse_cli_args_rejects_missing_value() {
  hql::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--query"}, options, error);
  expect_true(!ok, "missing value is rejected");
  expect_true(error.find("Missing value for --query") != std::string::npos, "missing value has clear error");
}

void test_parse_cli_args_rejects_unknown_argument() {
  hql::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--unknown"}, options, error);
  expect_true(!ok, "unknown argument is rejected");
  expect_true(error.find("Unknown argument: --unknown") != std::string::npos, "unknown argument has clear error");
}

void test_parse_cli_args_lint_takes_inline_query() {
  hql::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--lint", "@flat()", "--format", "json"}, options, error);
  expect_true(ok, "lint with inline query");
  expect_true(options.lint, "lint flag");
  expect_eq(options.query, "@flat()", "lint query captured");
  expect_eq(options.lint_format, "json", "lint format");
}

void test_parse_cli_args_validates_enums() {
  hql::cli::CliOptions mode;
  std::string error;
  expect_true(!parse({"--query", "@flat()", "--mode", "table"}, mode, error), "bad mode rejected");
  expect_true(error.find("--mode") != std::string::npos, "mode error names the flag");
  hql::cli::CliOptions format;
  expect_true(!parse({"--lint", "@flat()", "--format", "xml"}, format, error), "bad format rejected");
  hql::cli::CliOptions format_without_lint;
  expect_true(!parse({"--query", "@flat()", "--format", "json"}, format_without_lint, error),
              "format requires lint");
}

void test_help_mentions_flags() {
  std::ostringstream help;
  hql::cli::print_help(help);
  for (const char* flag : {"--query", "--input", "--fragment", "--mode", "--lint", "--format", "--explain",
                           "--verbose", "--version"}) {
    expect_true(help.str().find(flag) != std::string::npos, std::string("help mentions ") + flag);
  }
}

}  // namespace

void register_cli_args_tests(std::vector<TestCase>& tests) {
  tests.push_back({"parse_cli_args_accepts_query_and_input", test_parse_cli_args_accepts_query_and_input});
  tests.push_back({"parse_cli_args_short_aliases", test_parse_cli_args_short_aliases});
  tests.push_back({"parse_cli_args_inline_document", test_parse_cli_args_inline_document});
  tests.push_back({"parse_cli_args_rejects_missing_value", test_parse_cli_args_rejects_missing_value});
  tests.push_back({"parse_cli_args_rejects_unknown_argument", test_parse_cli_args_rejects_unknown_argument});
  tests.push_back({"parse_cli_args_lint_takes_inline_query", test_parse_cli_args_lint_takes_inline_query});
  tests.push_back({"parse_cli_args_validates_enums", test_parse_cli_args_validates_enums});
  tests.push_back({"help_mentions_flags", test_help_mentions_flags});
}
