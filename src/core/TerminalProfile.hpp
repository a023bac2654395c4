#pragma once
#include <cstdio>

struct TerminalSize {
    int rows = 24;
    int columns = 80;
};

// Queries the terminal behind stream. Falls back to $LINES/$COLUMNS and then
// to 24x80, never fails.
TerminalSize get_terminal_size(FILE* stream = stdout);

struct TerminalProfile {
    int rows = 24;
    int columns = 80;
    bool interactive = false; // a terminal, not a pipe or a file

    // captures the profile of stream, a positive columns_override wins over the probe
    static TerminalProfile detect(FILE* stream, int columns_override = 0);
};
