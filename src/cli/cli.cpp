#include "cli/cli.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <vector>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================
  
CLI::CLI(grid::FS& fs, std::size_t chunk_size)
  : running_(false)
  , chunk_size_(chunk_size)
  , fs_(fs)
  , reconciler_(fs) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized on prefix " << fs_.prefix();
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;
  
  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  std::cout << "gridstore> " << std::flush;
  
  while (running_ && std::getline(std::cin, line)) {
    running_ = execute(line);
    if (running_) {
      std::cout << "gridstore> " << std::flush;
    }
  }
  
  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command, first, second;
  iss >> command >> first >> second;

  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with arguments: "
                           << first << " " << second;

  if (command.empty()) {
    return true;
  }
  if (command == "quit" || command == "exit") {
    return false;
  }

  if (command == "ls") {
    handle_list_command();
  }
  else if (command == "help") {
    handle_help_command();
  }
  else if (command == "sweep") {
    handle_sweep_command();
  }
  else if (first.empty()) {
    std::cout << "Invalid input. Usage: <command> [arguments], try 'help'" << std::endl;
  }
  else if (command == "put") {
    handle_put_command(first);
  }
  else if (command == "get" && !second.empty()) {
    handle_get_command(first, second);
  }
  else if (command == "cat") {
    handle_cat_command(first);
  }
  else if (command == "rm") {
    handle_remove_command(first);
  }
  else if (command == "check") {
    handle_check_command(first);
  }
  else {
    std::cout << "Unknown command or invalid arguments" << std::endl;
  }
  return true;
}


//==============================================
// COMMAND PROCESSING 
//==============================================

void CLI::handle_put_command(const std::string& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    std::cout << "Error opening file: " << path << std::endl;
    return;
  }

  std::vector<uint8_t> data((std::istreambuf_iterator<char>(input)),
                            std::istreambuf_iterator<char>());
  std::string filename = std::filesystem::path(path).filename().string();

  try {
    grid::FileOptions options;
    options.chunk_size = chunk_size_;
    grid::File file(data, filename, options);
    auto result = fs_.insert_one(file);
    std::cout << "Stored " << filename << " as " << result.file_id << " ("
              << result.chunks_inserted << " chunks"
              << (result.validated ? ", checksum verified" : "") << ")" << std::endl;
  } catch (const grid::InvalidFile& e) {
    log_and_display_error("Stored file failed verification", e.what());
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_get_command(const std::string& filename, const std::string& path) {
  try {
    auto file = fs_.find_one(store::Selector{{"filename", filename}});
    if (!file) {
      std::cout << "File not found: " << filename << std::endl;
      return;
    }

    std::ofstream output(path, std::ios::binary);
    if (!output) {
      std::cout << "Error opening file: " << path << std::endl;
      return;
    }
    auto data = file->data();
    output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    std::cout << "Wrote " << data.size() << " bytes to " << path << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading file", e.what());
  }
}

void CLI::handle_cat_command(const std::string& filename) {
  try {
    auto file = fs_.find_one(store::Selector{{"filename", filename}});
    if (!file) {
      std::cout << "File not found: " << filename << std::endl;
      return;
    }
    std::cout << file->data_string() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading file", e.what());
  }
}

void CLI::handle_remove_command(const std::string& filename) {
  try {
    auto file = fs_.find_one(store::Selector{{"filename", filename}});
    if (!file) {
      std::cout << "File not found: " << filename << std::endl;
      return;
    }
    auto result = fs_.remove_one(*file);
    std::cout << "Removed " << filename << " (" << result.chunks_removed << " chunks)" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting file", e.what());
  }
}

void CLI::handle_list_command() {
  try {
    auto files = fs_.find();
    std::cout << fs_.files_name() << ":" << std::endl;
    for (const auto& metadata : files) {
      std::cout << "  " << metadata.filename << "  " << metadata.length << " bytes  "
                << metadata.md5 << "  " << metadata.id << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error listing files", e.what());
  }
}

void CLI::handle_check_command(const std::string& filename) {
  try {
    auto file = fs_.find_one(store::Selector{{"filename", filename}});
    if (!file) {
      std::cout << "File not found: " << filename << std::endl;
      return;
    }
    fs_.validate(*file);
    std::cout << filename << ": checksum " << file->md5() << " OK" << std::endl;
  } catch (const grid::InvalidFile& e) {
    log_and_display_error("Checksum mismatch", e.what());
  } catch (const std::exception& e) {
    log_and_display_error("Error checking file", e.what());
  }
}

void CLI::handle_sweep_command() {
  try {
    auto result = reconciler_.sweep();
    std::cout << "Removed " << result.files_removed << " orphaned metadata and "
              << result.chunks_removed << " orphaned chunk records" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error sweeping store", e.what());
  }
}

void CLI::handle_help_command() {
  std::cout << "Available commands:" << std::endl;
  std::cout << "  help                 Display this help message" << std::endl;
  std::cout << "  ls                   List stored files" << std::endl;
  std::cout << "  put <path>           Store local file <path>" << std::endl;
  std::cout << "  get <file> <path>    Write stored <file> to local <path>" << std::endl;
  std::cout << "  cat <file>           Print contents of stored <file>" << std::endl;
  std::cout << "  rm <file>            Remove stored <file>" << std::endl;
  std::cout << "  check <file>         Verify the stored checksum of <file>" << std::endl;
  std::cout << "  sweep                Remove orphaned metadata and chunks" << std::endl;
  std::cout << "  quit                 Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  std::cout << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace gridstore
