#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace dock {

struct AppConfig {
    std::string command;  // subcommand that was selected

    // Global
    std::string data_dir;
    std::string catalog;
    std::string python = "python3";
    std::string log_level = "info";

    // serve
    std::string host = "127.0.0.1";
    int port = 8000;

    // Command arguments
    std::string model;
    std::string prompt;

    // Tuning
    int health_attempts = 30;
    int health_interval_ms = 1000;
    int lock_timeout_ms = 0;
    int max_tokens = 200;
};

class CLIParser {
public:
    CLIParser();

    // Parse command line arguments
    // Returns: 0 if should continue, exit code (may be 0) if should exit
    int parse(int argc, char** argv);

    AppConfig get_config() const { return config_; }

    // Check if we should continue (false means exit cleanly, e.g., after --help)
    bool should_continue() const { return should_continue_; }

    // Get exit code (only valid if should_continue() is false)
    int get_exit_code() const { return exit_code_; }

private:
    CLI::App app_;
    AppConfig config_;
    bool should_continue_ = true;
    int exit_code_ = 0;
};

} // namespace dock
