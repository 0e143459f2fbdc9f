#include <tfd/description_parser.hpp>
#include <tfd/embed_writer.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;

struct cli_options {
  std::string descriptions_file;
  std::string output_file;
  std::string namespace_name = "tfd_embedded";
  tfd::description_version default_version = tfd::description_version::v1;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: tfd-embed [options] <descriptions-file>\n"
     << "\n"
     << "Compiles each `<identifier> <description>` line of the input into a\n"
     << "C++ header with one accessor per description.\n"
     << "\n"
     << "Options:\n"
     << "  -o <file>              Output header (default: stdout)\n"
     << "  -n <namespace>         C++ namespace (default: tfd_embedded)\n"
     << "  --default-version <N>  Grammar version without a version "
        "directive (1 or 2)\n"
     << "  -h, --help             Show this help message\n"
     << "  --version              Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "tfd-embed " << TFD_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

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

    if (arg == "-o") {
      if (i + 1 >= argc) {
        std::cerr << "tfd-embed: -o requires an argument\n";
        std::exit(exit_usage);
      }
      opts.output_file = argv[++i];
      continue;
    }

    if (arg == "-n") {
      if (i + 1 >= argc) {
        std::cerr << "tfd-embed: -n requires an argument\n";
        std::exit(exit_usage);
      }
      opts.namespace_name = argv[++i];
      if (!tfd::is_identifier(opts.namespace_name, true)) {
        std::cerr << "tfd-embed: invalid namespace: " << opts.namespace_name
                  << "\n";
        std::exit(exit_usage);
      }
      continue;
    }

    if (arg == "--default-version") {
      if (i + 1 >= argc) {
        std::cerr << "tfd-embed: --default-version requires an argument\n";
        std::exit(exit_usage);
      }
      std::string version = argv[++i];
      if (version == "1")
        opts.default_version = tfd::description_version::v1;
      else if (version == "2")
        opts.default_version = tfd::description_version::v2;
      else {
        std::cerr << "tfd-embed: --default-version must be 1 or 2\n";
        std::exit(exit_usage);
      }
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "tfd-embed: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (!opts.descriptions_file.empty()) {
      std::cerr << "tfd-embed: only one descriptions file may be given\n";
      std::exit(exit_usage);
    }
    opts.descriptions_file = arg;
  }

  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "tfd-embed: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// file:line: message, then the description with a caret line under the
// offending bytes.
static void
report(const std::string& file, const tfd::description_entry& entry,
       const tfd::invalid_format_description& e) {
  auto span = e.span();
  auto begin = std::min(span.begin, entry.source.size());
  auto width = span.end > begin ? span.end - begin : std::size_t{1};

  std::cerr << "tfd-embed: " << file << ":" << entry.line << ":"
            << entry.column + begin + 1 << ": " << entry.name << ": "
            << e.what() << "\n"
            << "  " << entry.source << "\n"
            << "  " << std::string(begin, ' ') << std::string(width, '^')
            << "\n";
}

static int
run(const cli_options& opts) {
  std::string text = read_file(opts.descriptions_file);

  std::vector<tfd::description_entry> entries;
  try {
    entries = tfd::read_descriptions(text);
  } catch (const std::invalid_argument& e) {
    std::cerr << "tfd-embed: " << opts.descriptions_file << ": " << e.what()
              << "\n";
    return exit_parse;
  }

  // Every entry is compiled so that all bad descriptions are reported.
  tfd::description_parser parser(opts.default_version);
  std::vector<tfd::embedded_description> compiled;
  bool failed = false;
  for (const auto& entry : entries) {
    try {
      compiled.push_back({entry.name, parser.parse(entry.source)});
    } catch (const tfd::invalid_format_description& e) {
      report(opts.descriptions_file, entry, e);
      failed = true;
    }
  }
  if (failed) return exit_parse;

  tfd::embed_writer writer(opts.namespace_name);
  std::string header = writer.write(compiled);

  if (opts.output_file.empty()) {
    std::cout << header;
    return exit_success;
  }

  std::ofstream out(opts.output_file, std::ios::binary);
  if (!out) {
    std::cerr << "tfd-embed: cannot write file: " << opts.output_file << "\n";
    return exit_io;
  }
  out << header;
  if (!out) {
    std::cerr << "tfd-embed: error writing file: " << opts.output_file << "\n";
    return exit_io;
  }
  return exit_success;
}

int
main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.descriptions_file.empty()) {
    std::cerr << "tfd-embed: no descriptions file specified\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
