#pragma once

#include <cstdio>
#include <string>

#include "warden/cli/commands.hpp"
#include "warden/core/request_context.hpp"
#include "warden/service/access_service.hpp"

namespace warden::cli {

    struct CliSession {
        service::AccessService* access{nullptr};
        // Caller for gated commands and default user for evaluation ones.
        std::string acting_user;
        warden::core::RequestContext ctx;
    };

    // Runs one parsed command. Results go to `out`, failures to `err` as
    // "error: <context>: <kind>: <message>". Returns a process exit code.
    int run_command(CliSession& session, const CommandInvocation& cmd, std::FILE* out, std::FILE* err);

    void print_help(std::FILE* out);

} // namespace warden::cli
