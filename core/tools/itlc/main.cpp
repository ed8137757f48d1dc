// itlc - ITL Schema Checker Command Line Interface
//
// Usage:
//   itlc check [file.json | --project]
//   itlc dump <file.json> [-o output.json]
//   itlc init <project-name>
//
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "itl/basic/diagnostic_printer.hpp"
#include "itl/driver/schema_loader.hpp"
#include "itl/project/project_config.hpp"
#include "itl/schema/json_writer.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "ITL Schema Checker v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [file.json]        Check a document or every document of a project\n"
            << "  dump <file.json>         Print the canonical form of a valid document\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file (dump)\n"
            << "  --project                Check the documents listed in itl.yaml\n"
            << "  --legacy                 Accept rune, enum, bitset and the encoding key\n"
            << "  --lenient-keys           Report unknown keys as warnings\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  bool use_project = false;
  bool legacy = false;
  bool lenient_keys = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--legacy") {
      args.legacy = true;
    } else if (arg == "--lenient-keys") {
      args.lenient_keys = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

itl::LoadOptions make_load_options(const CommandArgs & args)
{
  itl::LoadOptions options;
  options.grammar.legacy_kinds = args.legacy;
  options.grammar.strict_keys = !args.lenient_keys;
  return options;
}

void print_diagnostics(const itl::LoadResult & result, const CommandArgs & args)
{
  if (result.diagnostics.empty()) {
    return;
  }
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
  itl::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(result.diagnostics, &result.source);
}

/// Load one document, print its diagnostics and report "OK" on success
bool check_document(
  const fs::path & path, const std::string & display, const itl::LoadOptions & options,
  const CommandArgs & args)
{
  if (args.verbose) {
    std::cerr << "Checking: " << path.string() << "\n";
  }

  const itl::LoadResult result = itl::SchemaLoader::load_file(path, options);
  print_diagnostics(result, args);

  if (!result.success) {
    return false;
  }
  if (args.verbose) {
    std::cerr << "  " << result.schema->size() << " types\n";
  }
  std::cout << display << ": OK\n";
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  if (!args.use_project && !args.input_file.empty()) {
    // Single file mode
    return check_document(
             fs::absolute(args.input_file), args.input_file, make_load_options(args), args)
             ? 0
             : 1;
  }

  // Project mode
  auto config_path = itl::find_project_config(fs::current_path());
  if (!config_path) {
    std::cerr << "error: no " << itl::k_project_config_file_name
              << " found in current directory or parents\n";
    return 1;
  }

  const auto config_result = itl::load_project_config(*config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return 1;
  }

  const itl::ProjectConfig & config = config_result.config;
  if (args.verbose) {
    std::cerr << "Checking project: " << config.package.name << "\n";
  }
  if (config.schema.documents.empty()) {
    std::cerr << "warning: " << config_path->string() << " lists no documents\n";
    return 0;
  }

  itl::LoadOptions options;
  options.grammar = config.grammar_options();
  // Command-line flags only widen what the project file accepts.
  options.grammar.legacy_kinds = options.grammar.legacy_kinds || args.legacy;
  options.grammar.strict_keys = options.grammar.strict_keys && !args.lenient_keys;

  bool all_ok = true;
  for (const auto & doc : config.schema.documents) {
    const fs::path path = doc.is_absolute() ? doc : config.project_root / doc;
    if (!check_document(path.lexically_normal(), doc.string(), options, args)) {
      all_ok = false;
    }
  }
  return all_ok ? 0 : 1;
}

int cmd_dump(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: itlc dump <file.json> [-o output.json]\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (args.verbose) {
    std::cerr << "Loading: " << input_path.string() << "\n";
  }

  const itl::LoadResult result = itl::SchemaLoader::load_file(input_path, make_load_options(args));
  print_diagnostics(result, args);
  if (!result.success) {
    return 1;
  }

  const std::string text = itl::to_json(*result.schema).dump(2);

  if (args.output_path.empty()) {
    std::cout << text << "\n";
    return 0;
  }

  std::ofstream out(args.output_path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << args.output_path << "\n";
    return 1;
  }
  out << text << "\n";
  if (args.verbose) {
    std::cerr << "Wrote " << args.output_path << "\n";
  }
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: itlc init <project-name>\n";
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "schemas");

    // Create itl.yaml
    itl::ProjectConfig project;
    project.package.name = args.input_file;
    project.package.version = "0.1.0";
    project.schema.documents.emplace_back("./schemas/example.json");
    std::ofstream config(project_dir / itl::k_project_config_file_name);
    config << itl::format_project_config(project);
    config.close();

    // Create example.json
    std::ofstream example(project_dir / "schemas" / "example.json");
    example << "{\n"
            << "  \"types\": [\n"
            << "    {\"kind\": \"int\", \"name\": \"Id\", \"bits\": 32, \"unsigned\": true},\n"
            << "    {\n"
            << "      \"kind\": \"record\",\n"
            << "      \"name\": \"Reading\",\n"
            << "      \"fields\": [\n"
            << "        {\"name\": \"id\", \"type\": \"Id\"},\n"
            << "        {\"name\": \"value\", \"type\": {\"kind\": \"float\", \"model\": "
               "\"binary64\"}},\n"
            << "        {\"name\": \"label\", \"type\": {\"kind\": \"string\", \"capacity\": "
               "64}, \"optional\": true}\n"
            << "      ]\n"
            << "    }\n"
            << "  ]\n"
            << "}\n";
    example.close();

    std::cout << "Initialized new ITL project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << args.input_file << "\n"
              << "  itlc check\n";

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "dump") {
    return cmd_dump(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
