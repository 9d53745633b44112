#include <dock/cli_parser.h>
#include <dock/version.h>
#include <iostream>

#define APP_NAME "modeldock"
#define APP_DESC APP_NAME " - Local model installer and runner"

#define INSTALL_FOOTER "Examples:\n" \
    "  # Download weights and dependencies for a catalog model\n" \
    "  modeldock install qwen2.5-1.5b-instruct\n\n" \
    "  # Use a custom catalog\n" \
    "  modeldock --catalog ./models.json install tiny-chat"

namespace dock {

static void add_global_options(CLI::App& app, AppConfig& config) {
    app.add_option("--data-dir", config.data_dir, "Directory holding models and the dependency environment")
        ->envname("DOCK_DATA_DIR")
        ->type_name("PATH");

    app.add_option("--catalog", config.catalog, "JSON model catalog (defaults to the built-in list)")
        ->envname("DOCK_CATALOG")
        ->type_name("FILE")
        ->check(CLI::ExistingFile);

    app.add_option("--python", config.python, "Python interpreter used to create the dependency environment")
        ->envname("DOCK_PYTHON")
        ->type_name("EXE")
        ->default_val(config.python);

    app.add_option("--log-level", config.log_level, "Log level")
        ->envname("DOCK_LOG_LEVEL")
        ->type_name("LEVEL")
        ->check(CLI::IsMember({"critical", "error", "warning", "info", "debug", "trace"}))
        ->default_val(config.log_level);

    app.add_option("--health-attempts", config.health_attempts, "Health checks before a launch is abandoned")
        ->envname("DOCK_HEALTH_ATTEMPTS")
        ->type_name("N")
        ->check(CLI::PositiveNumber)
        ->default_val(config.health_attempts);

    app.add_option("--health-interval-ms", config.health_interval_ms, "Delay between health checks")
        ->envname("DOCK_HEALTH_INTERVAL_MS")
        ->type_name("MS")
        ->check(CLI::PositiveNumber)
        ->default_val(config.health_interval_ms);

    app.add_option("--lock-timeout-ms", config.lock_timeout_ms,
                   "How long a generation waits for the engine (0 waits forever)")
        ->envname("DOCK_LOCK_TIMEOUT_MS")
        ->type_name("MS")
        ->check(CLI::NonNegativeNumber)
        ->default_val(config.lock_timeout_ms);
}

static void add_serve_options(CLI::App* serve, AppConfig& config) {
    serve->add_option("--port", config.port, "Port number to serve on")
        ->envname("DOCK_PORT")
        ->type_name("PORT")
        ->check(CLI::Range(1, 65535))
        ->default_val(config.port);

    serve->add_option("--host", config.host, "Address to bind for connections")
        ->envname("DOCK_HOST")
        ->type_name("HOST")
        ->default_val(config.host);
}

CLIParser::CLIParser()
    : app_(APP_DESC) {

    app_.set_version_flag("-v,--version", (APP_NAME " version " DOCK_VERSION_STRING));
    app_.require_subcommand(1);
    app_.fallthrough();

    add_global_options(app_, config_);

    // Serve
    CLI::App* serve = app_.add_subcommand("serve", "Start the control server");
    add_serve_options(serve, config_);

    // List
    app_.add_subcommand("list", "List catalog models and their install state");

    // System
    app_.add_subcommand("system", "Show this machine's hardware as models are checked against it");

    // Install
    CLI::App* install = app_.add_subcommand("install", "Download a model and its dependencies");
    install->add_option("model", config_.model, "The model to install")
        ->type_name("MODEL")
        ->required();
    install->footer(INSTALL_FOOTER);

    // Launch
    CLI::App* launch = app_.add_subcommand("launch", "Run a model in its backing service until interrupted");
    launch->add_option("model", config_.model, "The model to launch")
        ->type_name("MODEL")
        ->required();

    // Chat
    CLI::App* chat = app_.add_subcommand("chat", "Generate a reply with the embedded engine");
    chat->add_option("model", config_.model, "The model to load")
        ->type_name("MODEL")
        ->required();
    chat->add_option("prompt", config_.prompt, "Prompt text")
        ->required();
    chat->add_option("--max-tokens", config_.max_tokens, "Upper bound on generated tokens")
        ->type_name("N")
        ->check(CLI::Range(1, 200))
        ->default_val(config_.max_tokens);

    // Remove
    CLI::App* remove = app_.add_subcommand("remove", "Delete a model's downloaded files");
    remove->add_option("model", config_.model, "The model to remove")
        ->type_name("MODEL")
        ->required();
}

int CLIParser::parse(int argc, char** argv) {
    try {
        // Show help if no arguments provided
        if (argc == 1) {
            throw CLI::CallForHelp();
        }
        app_.parse(argc, argv);

        config_.command = app_.get_subcommands().at(0)->get_name();
        should_continue_ = true;
        exit_code_ = 0;
        return 0;  // Success, continue
    } catch (const CLI::ParseError& e) {
        // Help/version requested or parse error occurred
        // Let CLI11 handle printing and get the exit code
        exit_code_ = app_.exit(e);
        should_continue_ = false;  // Don't continue, just exit
        return exit_code_;
    }
}

} // namespace dock
