#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "hql/diagnostics.h"
#include "hql/hql.h"
#include "hql/version.h"
#include "cli_args.h"
#include "cli_utils.h"
#include "io.h"
#include "render/result_renderer.h"

using namespace hql::cli;

namespace {

int run_lint(const CliOptions& options) {
  if (options.query.empty()) {
    std::cerr << "Missing query for --lint (use --lint \"...\" or --query)\n";
    return 2;
  }
  std::vector<hql::Diagnostic> diagnostics = hql::lint_query(options.query);
  if (options.lint_format == "json") {
    std::cout << hql::render_diagnostics_json(diagnostics) << std::endl;
  } else if (diagnostics.empty()) {
    std::cout << "No diagnostics." << std::endl;
  } else {
    std::cout << hql::render_diagnostics_text(diagnostics) << std::endl;
  }
  return hql::has_error_diagnostics(diagnostics) ? 1 : 0;
}

}  // namespace

/// Entry point that parses CLI options, loads the document and runs one query.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
int main(int argc, char** argv) {
  CliOptions options;
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "hql " << hql::version_string() << std::endl;
    return 0;
  }
  if (options.lint) {
    return run_lint(options);
  }
  if (options.query.empty()) {
    std::cerr << "Missing --query\n";
    return 2;
  }

  std::shared_ptr<const hql::CompiledQuery> compiled;
  try {
    compiled = hql::compile(options.query);
  } catch (const hql::QueryError& ex) {
    if (ex.parse_error().has_value()) {
      std::cerr << hql::render_diagnostics_text(
                       {hql::make_syntax_diagnostic(options.query, *ex.parse_error())})
                << std::endl;
    } else {
      std::cerr << "Error: " << ex.what() << std::endl;
    }
    return 1;
  }
  if (options.explain) {
    std::cout << hql::describe_pipeline(compiled->pipeline) << std::endl;
    return 0;
  }

  std::string html;
  try {
    if (!options.input.empty()) {
      html = hql::read_file(options.input);
    } else if (!options.document.empty()) {
      html = options.document;
    } else {
      html = read_stdin();
    }
  } catch (const std::exception& ex) {
    std::cerr << hql::render_diagnostics_text({hql::make_io_diagnostic(ex.what())})
              << std::endl;
    return 2;
  }

  hql::EvalOptions eval_options;
  if (options.verbose || trace_enabled_from_env()) {
    eval_options.trace = &std::cerr;
    std::cerr << "apply selector: " << hql::describe_pipeline(compiled->pipeline) << std::endl;
  }

  try {
    const hql::ParseMode mode = options.fragment ? hql::ParseMode::Fragment : hql::ParseMode::Document;
    auto prepared = hql::prepare_document(html, mode);
    hql::QueryResult result = hql::execute_query(*compiled, *prepared, eval_options);
    if (options.output_mode == "json") {
      std::cout << hql::render::render_json(result) << std::endl;
    } else {
      std::cout << hql::render::render_plain(result);
    }
    return 0;
  } catch (const hql::QueryError& ex) {
    if (ex.eval_error().has_value()) {
      std::cerr << hql::render_diagnostics_text(
                       {hql::make_runtime_diagnostic(options.query, *ex.eval_error())})
                << std::endl;
    } else {
      std::cerr << "Error: " << ex.what() << std::endl;
    }
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 1;
  }
}
