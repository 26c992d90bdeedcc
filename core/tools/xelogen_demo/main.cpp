// xelogen_demo - builds, lints and prints a sample Xelogen graph
//
// Usage:
//   xelogen_demo [--config xelogen.yaml] [--dump-json] [--no-color] [-v]
//
#include <fmt/core.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "xelogen/basic/build_error.hpp"
#include "xelogen/driver/diagnostic_printer.hpp"
#include "xelogen/driver/graph_json.hpp"
#include "xelogen/driver/node_catalog.hpp"
#include "xelogen/driver/project_config.hpp"
#include "xelogen/flow/impulse_chain.hpp"
#include "xelogen/ir/combine.hpp"
#include "xelogen/ir/graph.hpp"
#include "xelogen/lint/lint_pass.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Xelogen demo v0.1.0\n\n"
            << "Usage: " << program_name << " [options]\n\n"
            << "Options:\n"
            << "  --config <path>          Project configuration (default: search for xelogen.yaml)\n"
            << "  --dump-json              Print the graph as JSON instead of a node listing\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_graph(const xelogen::Graph & graph)
{
  for (const auto & node : graph.nodes()) {
    fmt::print("{}:", node->describe());
    for (const auto & input : node->spec().inputs) {
      const auto sources = node->bound(input.name);
      if (sources.empty()) {
        continue;
      }
      fmt::print(" {}=[", input.name);
      bool first = true;
      for (const auto & source : sources) {
        fmt::print("{}{}.{}", first ? "" : ", ", source.node_id(), source.name());
        first = false;
      }
      fmt::print("]");
    }
    if (node->content()) {
      fmt::print(" content={}", node->content()->to_string());
    }
    fmt::print("\n");
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string config_path;
  bool dump_json = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string unknown;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--dump-json") {
      args.dump_json = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (args.unknown.empty()) {
      args.unknown = arg;
    }
  }

  return args;
}

// ============================================================================
// Session Setup
// ============================================================================

std::optional<xelogen::ProjectConfig> load_config(const CommandArgs & args)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = xelogen::find_project_config(fs::current_path());
  }

  if (!config_path) {
    // No project file: standard catalog, every lint pass.
    return xelogen::ProjectConfig{};
  }

  const auto result = xelogen::load_project_config(*config_path);
  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return std::nullopt;
  }
  if (args.verbose) {
    std::cerr << "Using project: " << config_path->string() << "\n";
  }
  return result.config;
}

void fill_registry(
  const xelogen::ProjectConfig & config, xelogen::NodeRegistry & registry,
  xelogen::DiagnosticBag & diags, bool verbose)
{
  if (config.catalog.builtin) {
    xelogen::register_builtin_nodes(registry);
  }

  for (const auto & path : config.catalog_paths()) {
    const auto catalog = xelogen::load_node_catalog(path);
    if (!catalog.success) {
      diags.report_error(xelogen::GraphLocation{}, fmt::format("{}: {}", path.string(), catalog.error));
      continue;
    }
    for (const auto & name : xelogen::merge_into(catalog, registry)) {
      diags.report_warning(
        xelogen::GraphLocation{},
        fmt::format("node type '{}' already defined; ignoring {}", name, path.string()));
    }
    if (verbose) {
      std::cerr << "Loaded " << catalog.specs.size() << " node types from " << path.string()
                << "\n";
    }
  }
}

// ============================================================================
// Sample Graph
// ============================================================================

void build_sample(xelogen::Graph & graph)
{
  using xelogen::Operand;

  xelogen::Node & pulse = graph.add_node("Pulse");
  xelogen::Node & root = graph.root();
  xelogen::Node & num_children = graph.add_node("NumChildren");
  xelogen::Node & write = graph.add_node("WriteDynVar<Int>");
  xelogen::Node & name = graph.add_node("StringInput");
  xelogen::Node & add_one = graph.add_node("PlusOne<Int>");

  num_children.bind_to_node("slot", root);
  add_one.bind_to_node("value", num_children);

  name.set_content(xelogen::ContentValue::make_string("World/Meow"));
  xelogen::Node & concat = graph.add_node("Plus<String>");
  concat.input("values").append(name);
  concat.input("values").append(name);

  write.bind_to_node("write", pulse);
  write.bind_to_node("name", concat);
  xelogen::Node & extra = add_one.combine(Operand::integer(1));
  write.bind_to_node("value", extra.combine(Operand::integer(2)));

  xelogen::ImpulseChain chain(write.output("success"));
  chain.append(write);
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.unknown.empty()) {
    std::cerr << "error: unknown option '" << args.unknown << "'\n";
    print_usage(argv[0]);
    return 1;
  }

  const auto config = load_config(args);
  if (!config) {
    return 1;
  }

  const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
  xelogen::DiagnosticPrinter printer(std::cerr, use_color);

  xelogen::NodeRegistry registry;
  xelogen::DiagnosticBag load_diagnostics;
  fill_registry(*config, registry, load_diagnostics, args.verbose);
  printer.print_all(load_diagnostics);
  if (load_diagnostics.has_errors()) {
    return 1;
  }

  xelogen::Graph graph(registry);
  try {
    build_sample(graph);
  } catch (const xelogen::BuildError & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  xelogen::LintEngine linter;
  xelogen::register_default_passes(linter, config->lint.disabled);

  xelogen::DiagnosticBag diagnostics;
  const size_t warnings = linter.run(graph, &diagnostics);
  if (config->lint.warnings_as_errors) {
    diagnostics.promote_warnings();
  }
  printer.print_all(diagnostics);

  if (args.dump_json) {
    std::cout << xelogen::dump_graph_json(graph) << "\n";
  } else {
    std::cout << "Done!\n";
    print_graph(graph);
  }

  if (args.verbose) {
    std::cerr << graph.size() << " nodes, " << warnings << " lint warnings\n";
  }

  return diagnostics.has_errors() ? 1 : 0;
}
