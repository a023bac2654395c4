/**
 * @file TerminalProfile.cpp
 * @brief Terminal dimension and interactivity probe.
 */

#include "TerminalProfile.hpp"
#include "utils/common.hpp"

#include <cstdlib>
#include <sys/ioctl.h>
#include <unistd.h>

static int env_int(const char* name){
    const char* value = std::getenv(name);
    if( !value || !*value ){
        return 0;
    }
    char* end = nullptr;
    long n = std::strtol(value, &end, 10);
    if( *end != 0 || n <= 0 || n > 0xffff ){
        return 0;
    }
    return static_cast<int>(n);
}

TerminalSize get_terminal_size(FILE* stream){
    TerminalSize size;

    struct winsize ws;
    if( stream && ioctl(fileno(stream), TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0 ){
        size.rows = ws.ws_row;
        size.columns = ws.ws_col;
        return size;
    }

    if( int rows = env_int("LINES") ){
        size.rows = rows;
    }
    if( int cols = env_int("COLUMNS") ){
        size.columns = cols;
    }
    logger->trace("terminal size probe failed, using {}x{}", size.rows, size.columns);
    return size;
}

TerminalProfile TerminalProfile::detect(FILE* stream, int columns_override){
    TerminalSize size = get_terminal_size(stream);

    TerminalProfile profile;
    profile.rows = size.rows;
    profile.columns = columns_override > 0 ? columns_override : size.columns;
    profile.interactive = stream && isatty(fileno(stream));
    return profile;
}
