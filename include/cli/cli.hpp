#pragma once

#include <cstddef>
#include <string>
#include "grid/fs.hpp"
#include "grid/reconciler.hpp"

namespace gridstore {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(grid::FS& fs, std::size_t chunk_size);


    // ---- STARTUP ----
    void run();
    // Runs one command line, returns false once the shell should exit
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    std::size_t chunk_size_;
    // System components
    grid::FS& fs_;
    grid::Reconciler reconciler_;


    // ---- COMMAND PROCESSING ----
    void handle_put_command(const std::string& path);
    void handle_get_command(const std::string& filename, const std::string& path);
    void handle_cat_command(const std::string& filename);
    void handle_remove_command(const std::string& filename);
    void handle_list_command();
    void handle_check_command(const std::string& filename);
    void handle_sweep_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace gridstore
