#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "tsl/robin_map.h"

#include "types.hpp"
#include "instructions.hpp"

// Label name (lowercase) -> address of the label's own no-op instruction
using LabelTable = tsl::robin_map<std::string, u64>;

struct SourceLocation {
    u32 line;   // 0-based line index into source_code_lines
    u32 column; // 0-based byte offset within the line
    u32 length; // token length
};

struct Program {
    std::vector<Instruction> instructions;
    LabelTable labels;

    std::string source_code;
    std::vector<std::string> source_code_lines;
    std::vector<SourceLocation> instr_idx_to_location;
};

// Re-serializes the instruction stream, one token per instruction.
std::string to_source(const Program &program);
