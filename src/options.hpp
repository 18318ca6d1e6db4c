#pragma once

#include "types.hpp"

// Command line options

struct Options {
    const char* filename = nullptr;
    bool dry_run = false; // load only
    bool list = false;    // print the loaded program before running it
    bool debug = false;   // dump the data deque after every instruction
};

bool parse_options(int argc, char **argv, Options &out);
