#pragma once

#include <string>

class Config;

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -2 if the caller should run the supervisor.
    static int run(int argc, char* argv[]);

    /// Value of `--config <path>` anywhere on the command line, empty if absent
    static std::string config_arg(int argc, char* argv[]);

    /// Load config from `--config` or the default location
    static void load_config(Config& config, int argc, char* argv[]);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status(int argc, char* argv[]);
    static int cmd_reconcile(int argc, char* argv[]);
};
