#include <xg/dataset_config.hpp>
#include <xg/expat_reader.hpp>
#include <xg/instance_parser.hpp>
#include <xg/ostream_writer.hpp>
#include <xg/owl_writer.hpp>
#include <xg/schema_compiler.hpp>
#include <xg/xml_node.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_schema = 3;
static constexpr int exit_convert = 4;

struct cli_options {
  std::string schema_file;
  std::vector<std::string> data_files;
  std::string config_file;
  std::string kind;
  std::string output_file;
  std::string name;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: xg [options] <schema.xsd> <data.xml> [data2.xml ...]\n"
     << "\n"
     << "Options:\n"
     << "  -c <file>         Dataset configuration file (xg-dataset.xml)\n"
     << "  -k <kind>         Built-in MITRE dataset settings (capec, cve, "
        "cwe)\n"
     << "  -o <file>         Output file (default: <name>.owx)\n"
     << "  -n <name>         Ontology name (default: dataset name or schema "
        "file stem)\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "xg " << XG_VERSION << "\n";
}

static std::string
option_value(int argc, char* argv[], int& i, const std::string& option) {
  if (i + 1 >= argc) {
    std::cerr << "xg: " << option << " requires an argument\n";
    std::exit(exit_usage);
  }
  return argv[++i];
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "-c") {
      opts.config_file = option_value(argc, argv, i, arg);
      continue;
    }

    if (arg == "-k") {
      opts.kind = option_value(argc, argv, i, arg);
      continue;
    }

    if (arg == "-o") {
      opts.output_file = option_value(argc, argv, i, arg);
      continue;
    }

    if (arg == "-n") {
      opts.name = option_value(argc, argv, i, arg);
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "xg: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    positional.push_back(arg);
  }

  if (!opts.config_file.empty() && !opts.kind.empty()) {
    std::cerr << "xg: -c and -k are mutually exclusive\n";
    std::exit(exit_usage);
  }

  if (!positional.empty()) {
    opts.schema_file = positional.front();
    opts.data_files.assign(positional.begin() + 1, positional.end());
  }
  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "xg: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static std::string
file_stem(const std::string& path) {
  auto slash = path.find_last_of('/');
  std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
  auto dot = base.find('.');
  return dot == std::string::npos ? base : base.substr(0, dot);
}

static int
run(const cli_options& opts) {
  // Dataset settings
  auto config = xg::dataset_config::defaults();
  try {
    if (!opts.config_file.empty()) {
      std::string xml = read_file(opts.config_file);
      xg::expat_reader reader(xml);
      config = xg::dataset_config::load(reader);
    } else if (!opts.kind.empty()) {
      config = xg::dataset_config::mitre(opts.kind);
    }
  } catch (const std::exception& e) {
    std::cerr << "xg: error loading configuration: " << e.what() << "\n";
    return exit_schema;
  }
  if (!opts.name.empty()) config.name = opts.name;
  if (config.name.empty()) config.name = file_stem(opts.schema_file);

  // Compile the schema
  std::string xsd = read_file(opts.schema_file);
  std::optional<xg::schema> compiled;
  try {
    auto root = xg::xml_node::parse(xsd);
    compiled.emplace(xg::schema_compiler{}.compile(root, config.compiling));
  } catch (const std::exception& e) {
    std::cerr << "xg: error compiling schema " << opts.schema_file << ": "
              << e.what() << "\n";
    return exit_schema;
  }

  // Convert the documents
  xg::ontology onto;
  onto.iri = config.ontology_iri();
  onto.entries = compiled->prelude();
  onto.rules = config.rules;

  xg::instance_parser parser(*compiled);
  for (const auto& file : opts.data_files) {
    std::string xml = read_file(file);
    try {
      onto.add(parser.parse(xg::xml_node::parse(xml)));
    } catch (const std::exception& e) {
      std::cerr << "xg: error converting " << file << ": " << e.what()
                << "\n";
      return exit_convert;
    }
  }

  // Write the ontology
  std::string output =
      opts.output_file.empty() ? config.name + ".owx" : opts.output_file;
  std::ofstream out(output);
  if (!out) {
    std::cerr << "xg: cannot write file: " << output << "\n";
    return exit_io;
  }
  xg::ostream_writer xml_out(out, true);
  xg::owl_writer writer(xml_out, config.identity);
  writer.write(onto);
  out << "\n";
  if (!out) {
    std::cerr << "xg: error writing file: " << output << "\n";
    return exit_io;
  }

  return exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.schema_file.empty() || opts.data_files.empty()) {
    std::cerr << "xg: a schema and at least one document are required\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
