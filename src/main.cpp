#include "cli/cli.hpp"
#include "grid/fs.hpp"
#include "logger/logger.hpp"
#include "store/memory_database.hpp"
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string prefix{gridstore::grid::FSOptions::DEFAULT_ROOT};
  std::size_t chunk_size{gridstore::grid::Chunk::DEFAULT_SIZE};
  bool acknowledged{true};
  std::string log_file;
  gridstore::logger::severity_level log_level{boost::log::trivial::warning};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  --prefix <name>       Collection prefix (default: fs)\n"
        << "  --chunk-size <bytes>  Chunk size for new files (default: 261120)\n"
        << "  --unacknowledged      Skip the post-insert checksum verification\n"
        << "  --log-file <path>     Write logs to <path> instead of the console\n"
        << "  --log-level <level>   trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " --prefix photos --chunk-size 1024\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {
    "--prefix", "--chunk-size", "--log-file", "--log-level"
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--unacknowledged") {
      options.acknowledged = false;
      continue;
    }
    if (flag == "--help" || flag == "-h") {
      print_usage(argv[0]);
      return options;
    }
    if (value_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    const std::string value(argv[++i]);
    if (flag == "--prefix") {
      options.prefix = value;
    } else if (flag == "--chunk-size") {
      try {
        long long size = std::stoll(value);
        if (size <= 0) {
          throw std::out_of_range("chunk size");
        }
        options.chunk_size = static_cast<std::size_t>(size);
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid chunk size\n";
        print_usage(argv[0]);
        return options;
      }
    } else if (flag == "--log-file") {
      options.log_file = value;
    } else if (flag == "--log-level") {
      try {
        options.log_level = gridstore::logger::parse_severity(value);
      } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << '\n';
        print_usage(argv[0]);
        return options;
      }
    }
  }

  if (options.prefix.empty()) {
    std::cerr << "Error: Prefix must not be empty\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    if (options.log_file.empty()) {
      gridstore::logger::init_console_logging(options.log_level);
    } else {
      gridstore::logger::init_logging(options.log_file, options.log_level);
    }

    gridstore::store::WriteConcern write_concern;
    if (!options.acknowledged) {
      write_concern = gridstore::store::WriteConcern::unacknowledged();
    }
    gridstore::store::MemoryDatabase database(write_concern);

    gridstore::grid::FSOptions fs_options;
    fs_options.fs_name = options.prefix;
    gridstore::grid::FS fs(database, fs_options);

    gridstore::cli::CLI cli(fs, options.chunk_size);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
