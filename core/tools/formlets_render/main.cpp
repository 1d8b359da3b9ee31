// formlets-render - Render and evaluate a described form
//
// Usage:
//   formlets-render [form.yaml] [name=value ...] [--json] [--no-color] [-v]
//
// Without a path, formlets.yaml is searched upward from the current
// directory. Without name=value pairs the pristine form is printed.
//
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "formlets/basic/diagnostic_printer.hpp"
#include "formlets/form/form_factory.hpp"
#include "formlets/json/json_dump.hpp"
#include "formlets/project/form_config.hpp"
#include "formlets/render/render_diagnostics.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_invalid_input = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "formlets-render v0.1.0\n\n"
            << "Usage: " << program_name << " [form.yaml] [name=value ...] [options]\n\n"
            << "Arguments:\n"
            << "  form.yaml                Form description (default: search formlets.yaml)\n"
            << "  name=value               Submitted value of a field (repeatable)\n\n"
            << "Options:\n"
            << "  --json                   Print a JSON dump instead of HTML\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n\n"
            << "Exit status: 0 success, 1 invalid input, 2 usage or configuration error\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string config_file;
  formlets::InputMap input;
  bool has_input = false;
  bool json = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--json") {
      args.json = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
    } else if (const auto eq = arg.find('='); eq != std::string::npos) {
      args.input[arg.substr(0, eq)] = arg.substr(eq + 1);
      args.has_input = true;
    } else if (args.config_file.empty()) {
      args.config_file = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

formlets::FormConfigLoadResult load_config(const CommandArgs & args)
{
  if (!args.config_file.empty()) {
    const fs::path path = fs::absolute(args.config_file);
    if (!fs::exists(path)) {
      return formlets::FormConfigLoadResult::fail("file not found: " + path.string());
    }
    if (args.verbose) {
      std::cerr << "Loading: " << path.string() << "\n";
    }
    return formlets::load_form_config(path);
  }

  const auto found = formlets::find_form_config(fs::current_path());
  if (!found) {
    return formlets::FormConfigLoadResult::fail(
      std::string("no ") + formlets::k_form_config_file_name +
      " found in current directory or parents");
  }
  if (args.verbose) {
    std::cerr << "Loading: " << found->string() << "\n";
  }
  return formlets::load_form_config(*found);
}

nlohmann::json dump(formlets::Form & form)
{
  nlohmann::json out;
  out["id"] = form.id();
  out["submitted"] = form.was_submitted();
  out["successful"] = form.was_successful();
  out["render_dict"] = formlets::to_json(form.render_dict());
  const formlets::ValuePtr & value = form.result_value();
  out["value"] = value ? formlets::to_json(*value) : nlohmann::json();
  out["result"] = form.was_successful() ? form.result_as<nlohmann::json>() : nlohmann::json();
  out["html"] = form.html();
  return out;
}

// ============================================================================
// Command
// ============================================================================

int run(const CommandArgs & args)
{
  const auto config_result = load_config(args);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return k_exit_usage;
  }

  try {
    formlets::Form form = formlets::build_form(config_result.config);
    if (args.verbose) {
      std::cerr << "Form '" << form.id() << "' with " << config_result.config.fields.size()
                << " field(s)\n";
    }

    if (args.has_input) {
      form.init(args.input);
      if (!form.was_submitted()) {
        std::cerr << "error: input does not contain a value for every field\n";
        return k_exit_usage;
      }
    }

    if (args.json) {
      std::cout << dump(form).dump(2) << "\n";
    } else {
      std::cout << form.html() << "\n";
    }

    if (!args.has_input || form.was_successful()) {
      return k_exit_ok;
    }

    const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
    formlets::DiagnosticPrinter printer(std::cerr, use_color);
    printer.print_all(formlets::to_diagnostics(form.render_dict()));
    if (args.verbose) {
      std::cerr << "Evaluation failed: " << form.error() << "\n";
    }
    return k_exit_invalid_input;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return k_exit_usage;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  return run(args);
}
