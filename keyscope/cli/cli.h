#pragma once
#include <string>
#include <string_view>

#include "../core/browser_session.h"

#ifndef KEYSCOPE_VERSION
#define KEYSCOPE_VERSION "0.3.0"
#endif

namespace keyscope {

enum repl_result : uint8_t
{
    repl_continue = 0,
    repl_quit     = 1
};

// Runs one REPL line against the session and appends what it prints to `out`
repl_result cli_execute(browser_session& session, std::string_view line, std::string& out);

// Process entry: config, connect, first page, then the interactive loop
int cli_main(int argc, char** argv);

} // namespace keyscope
