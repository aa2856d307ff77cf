#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <unistd.h>

#include "warden/cli/commands.hpp"
#include "warden/cli/handlers.hpp"
#include "warden/cli/options.hpp"
#include "warden/config/config.hpp"
#include "warden/core/errors.hpp"
#include "warden/core/log.hpp"
#include "warden/db/db.hpp"
#include "warden/security/resource_types.hpp"
#include "warden/service/access_service.hpp"

// ========================================================================
// Global State
// ========================================================================

volatile sig_atomic_t g_running = 1;

void sigint_handler(int sig) {
    (void)sig;
    g_running = 0;
}

// ========================================================================
// Line Parsing
// ========================================================================

void parse_line(const char* line, int* argc, char** argv, int max_args) {
    *argc = 0;

    while (*line && (*line == ' ' || *line == '\t' || *line == '\n')) {
        line++;
    }

    while (*line && *argc < max_args) {
        const char* token_start = line;
        while (*line && *line != ' ' && *line != '\t' && *line != '\n') {
            line++;
        }

        size_t token_len = line - token_start;
        if (token_len > 0) {
            char* token = static_cast<char*>(malloc(token_len + 1));
            if (token == nullptr) {
                return;
            }
            memcpy(token, token_start, token_len);
            token[token_len] = '\0';
            argv[(*argc)++] = token;
        }

        while (*line && (*line == ' ' || *line == '\t' || *line == '\n')) {
            line++;
        }
    }
}

void free_argv(char** argv, int argc) {
    for (int i = 0; i < argc; ++i) {
        free(argv[i]);
    }
}

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* context, const warden::core::Status& s, const warden::core::ErrorReport& report) {
    fprintf(stderr, "error: %s: %s: %s\n", context, warden::core::status_code_name(s.code),
            report.message.empty() ? warden::core::status_domain_name(s.domain) : report.message.c_str());
}

// ========================================================================
// Startup
// ========================================================================

struct GlobalOptions {
    const char* db_path{nullptr};
    const char* config_path{nullptr};
    const char* acting_user{nullptr};
};

warden::cli::OptionSpec g_global_options[] = {
    {warden::cli::OptionId::Db, warden::cli::OptionType::String, "db", 'd'},
    {warden::cli::OptionId::Config, warden::cli::OptionType::String, "config", 'c'},
    {warden::cli::OptionId::As, warden::cli::OptionType::String, "as", 'u'},
};

int main(int argc, char** argv) {
    using namespace warden;

    signal(SIGINT, sigint_handler);

    // Global options come before the command.
    cli::ParsedOption option_storage[16]{};
    cli::ParsedOptions options{option_storage, 0, 16};
    core::u32 consumed = 0;
    const cli::CliArgs all_args{argc > 1 ? argv + 1 : nullptr, static_cast<core::u32>(argc > 1 ? argc - 1 : 0)};
    core::Status s = cli::parse_options(all_args, g_global_options,
                                        sizeof(g_global_options) / sizeof(g_global_options[0]), &options, &consumed);
    if (!core::is_ok(s)) {
        fprintf(stderr, "error: options: Invalid: usage: warden [--db PATH] [--config FILE] [--as USER] <command>\n");
        return EXIT_FAILURE;
    }
    GlobalOptions globals;
    if (const cli::ParsedOption* o = cli::find_option(options, cli::OptionId::Db)) {
        globals.db_path = o->value.str;
    }
    if (const cli::ParsedOption* o = cli::find_option(options, cli::OptionId::Config)) {
        globals.config_path = o->value.str;
    }
    if (const cli::ParsedOption* o = cli::find_option(options, cli::OptionId::As)) {
        globals.acting_user = o->value.str;
    }

    // Configuration: file, then environment, then command line.
    config::ServiceConfig cfg;
    core::ErrorReport report;
    if (globals.config_path != nullptr) {
        s = config::config_load_file(globals.config_path, &cfg, &report);
        if (!core::is_ok(s)) {
            print_error("config", s, report);
            return EXIT_FAILURE;
        }
    }
    s = config::config_apply_env(&cfg, &report);
    if (!core::is_ok(s)) {
        print_error("config", s, report);
        return EXIT_FAILURE;
    }
    if (globals.db_path != nullptr) {
        cfg.db_path = globals.db_path;
    }
    core::log_set_level(cfg.log_level);

    security::ResourceTypeRegistry registry;
    s = config::config_build_registry(cfg, &registry, &report);
    if (!core::is_ok(s)) {
        print_error("config", s, report);
        return EXIT_FAILURE;
    }

    db::DbConfig db_cfg{
        .path = cfg.db_path.empty() ? nullptr : cfg.db_path.c_str(),
        .journal_mode = cfg.journal_mode.empty() ? nullptr : cfg.journal_mode.c_str(),
        .busy_timeout_ms = cfg.busy_timeout_ms,
        .max_write_attempts = cfg.max_write_attempts,
    };
    db::DbHandle db{};
    s = db::db_open(db_cfg, &db);
    if (!core::is_ok(s)) {
        report.message = cfg.db_path.empty() ? std::string("in-memory database") : "cannot open " + cfg.db_path;
        print_error("database", s, report);
        return EXIT_FAILURE;
    }

    int exit_code = EXIT_SUCCESS;
    {
        service::AccessService access(db, registry, cfg.email_domain);
        cli::CliSession session;
        session.access = &access;
        session.acting_user = globals.acting_user != nullptr ? globals.acting_user : "";
        session.ctx.trace_id = "cli-" + std::to_string(static_cast<long long>(getpid()));
        session.ctx.started_at = core::now_millis();

        // Resource types are registered idempotently on every start.
        s = access.init(session.ctx, &report);
        if (!core::is_ok(s)) {
            print_error("init", s, report);
            exit_code = EXIT_FAILURE;
        } else if (consumed < all_args.argc) {
            // One-shot mode.
            const cli::CliArgs rest{all_args.argv + consumed, all_args.argc - consumed};
            cli::CommandInvocation cmd;
            core::u32 cmd_consumed = 0;
            s = cli::parse_command(rest, cli::kCommands, cli::kCommandCount, &cmd, &cmd_consumed);
            if (!core::is_ok(s) || cmd.id == cli::CommandId::Exit) {
                fprintf(stderr, "error: command: Invalid: unknown command '%s' (try help)\n", rest.argv[0]);
                exit_code = EXIT_FAILURE;
            } else if (cli::run_command(session, cmd, stdout, stderr) != 0) {
                exit_code = EXIT_FAILURE;
            }
        } else {
            printf("warden - interactive mode\n");
            printf("db_path=%s\n", cfg.db_path.empty() ? ":memory:" : cfg.db_path.c_str());
            printf("Type 'help' for commands, 'q' to quit\n\n");

            while (g_running) {
                printf("warden> ");
                fflush(stdout);

                char line[1024];
                if (!fgets(line, sizeof(line), stdin)) {
                    break;
                }

                int cmd_argc = 0;
                char* cmd_argv[64];
                parse_line(line, &cmd_argc, cmd_argv, 64);
                if (cmd_argc == 0) {
                    continue;
                }

                cli::CommandInvocation cmd;
                core::u32 cmd_consumed = 0;
                const cli::CliArgs line_args{cmd_argv, static_cast<core::u32>(cmd_argc)};
                s = cli::parse_command(line_args, cli::kCommands, cli::kCommandCount, &cmd, &cmd_consumed);
                if (!core::is_ok(s)) {
                    fprintf(stderr, "error: command: Invalid: unknown command '%s'\n", cmd_argv[0]);
                } else if (cmd.id == cli::CommandId::Exit) {
                    g_running = 0;
                } else {
                    (void)cli::run_command(session, cmd, stdout, stderr);
                }

                free_argv(cmd_argv, cmd_argc);
            }
        }
    }

    s = db::db_close(db);
    if (!core::is_ok(s)) {
        report.message = "close failed";
        print_error("database", s, report);
    }
    return exit_code;
}
