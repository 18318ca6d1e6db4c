#pragma once

#include <deque>
#include <iostream>
#include <span>
#include <string_view>

#include "types.hpp"
#include "instructions.hpp"
#include "options.hpp"
#include "program.hpp"

enum class ExecutionError : u8 {
    NONE,
    STACK_UNDERFLOW,      // pop from a deque with too few values
    UNKNOWN_LABEL,        // push of a name that is neither an integer nor a label
    NON_INTEGER_INPUT,    // `read` got something other than an integer
    INVALID_JUMP_ADDRESS, // jump target outside [0, instruction count]
    RUNTIME_EXIT,         // `exit` with a nonzero code, see Runtime::exit_code
};

struct Runtime {
    std::span<const Instruction> instructions;
    std::deque<i64> data;
    u64 ip = 0; // index of the next instruction

    u64 executed_instructions = 0;
    ExecutionError error = ExecutionError::NONE;
    i64 exit_code = 0;

    // Not reset by create_runtime(), so they can be redirected before or after it.
    std::istream *input = &std::cin;
    std::ostream *output = &std::cout;

    const Program *program_ref = nullptr;
};

// Resets `out` to a fresh run of `program`: empty deque, ip at 0, no error.
bool create_runtime(const Program &program, Runtime &out, const Options &options);

// Runs until the end of the program, an `exit`, or an error.
// Returns false on error or nonzero exit; the reason is left in `runtime.error`.
bool execute(Runtime &runtime, const Options &options);

std::string_view error_name(ExecutionError error);
