#pragma once

#include <string>
#include <string_view>

#include "program.hpp"

namespace Compiler {
    // Prints diagnostics for every malformed token and returns false if there were any.
    // `out` is only written on success.
    bool compile(std::string_view file_name, std::string source_code, Program &out);
}
