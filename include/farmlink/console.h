#pragma once
#include <stddef.h>
#include <stdint.h>

#include "farmlink/local_auth.h"
#include "farmlink/memory_store.h"
#include "farmlink/simulation.h"
#include "farmlink/sync_session.h"

namespace farmlink
{

// Everything the operator console can reach. simulator may be null.
struct ConsoleContext
{
    SyncSession &session;
    MemoryStore &store;
    LocalAuth &auth;
    ControllerSimulator *simulator;
};

enum class ConsoleResult : uint8_t
{
    EMPTY = 0, // blank line
    OK,
    REFUSED,   // well-formed, but the session or collaborator declined it
    USAGE,     // bad arguments, help was printed
    UNKNOWN,   // unknown command, help was printed
    QUIT
};

const char *consoleResultName(ConsoleResult result);

// Trims surrounding whitespace and lower-cases in place. Returns false for an empty line.
bool console_normalizeLine(char *line);

// Executes one command line. The line is copied; long lines are truncated to FARMLINK_CFG_CONSOLE_BUF.
ConsoleResult console_handleLine(ConsoleContext &ctx, const char *line);

void console_printHelp();

} // namespace farmlink
