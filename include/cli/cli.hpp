#pragma once

#include <string>
#include <iostream>
#include "core/random_fs.hpp"

namespace randomfs {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(core::RandomFS& random_fs, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    void run();

    // Runs one command line; false once the shell should stop
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    core::RandomFS& random_fs_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void handle_store_command(const std::string& path, const std::string& content_type);
    void handle_get_command(const std::string& reference, const std::string& output_path);
    void handle_parse_command(const std::string& reference);
    void handle_token_command(const std::string& locator);
    void handle_stats_command();
    void handle_health_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);

    // rd:// locator, URL token, or bare representation id
    std::string resolve_representation_id(const std::string& reference) const;
    static codec::Locator parse_reference(const std::string& reference);
};

} // namespace cli
} // namespace randomfs
