#pragma once

#include "types.hpp"
#include "direction.hpp"

#include <string>
#include <string_view>

// Every opcode the interpreter dispatches on.
//
// The interpreter's jump table is kept in the same order as this enum,
// so new opcodes must be added to both places at the same position.
// PUSH_VALUE and PUSH_LABEL have no source name: any operation that isn't
// a known opcode is compiled to one of them.
enum class InstructionType : u8 {
    // Stack shuffling
    SWAP,
    MOVE,
    OVER,
    DROP,
    DUP,

    // Integer arithmetic
    ADD,
    SUB,

    // Boolean/bit logic
    AND,
    OR,
    XOR,
    NOT,
    SHL,
    SHR,

    // Comparisons, push 0 or 1
    EQ,
    GRE,  // >
    LES,  // <
    NLES, // >=
    NGRE, // <=

    // I/O
    PRINT,
    PRINTC,
    READ,
    READC,
    TRACE,

    // Control flow
    JMP,
    JMPIF,
    EXIT,

    LABEL, // no-op, keeps addresses aligned with the token stream

    PUSH_VALUE, // integer literal
    PUSH_LABEL, // label reference, resolved when executed

    NUM_INSTRUCTIONS // not an instruction.
};

struct Instruction {
    InstructionType type;
    Direction direction;

    // `name:` tokens compile to LABEL, but so does an explicit `!label`.
    bool defines_label = false;

    i64 value = 0;       // PUSH_VALUE only
    std::string label;   // PUSH_LABEL only, lowercased lookup key

    // Operation text exactly as written, without the direction/label marker.
    std::string operation;
};

// Returns false if `name` isn't an opcode (it is then a literal or a label).
bool lookup_opcode(std::string_view name, InstructionType &out);

// Base-10 integer with an optional leading '+' or '-'. The whole string must be consumed.
bool parse_integer(std::string_view str, i64 &out);

std::string_view instruction_name(InstructionType type);

// Source form of a single instruction: `!op`, `op!` or `name:`.
std::string to_token(const Instruction &ins);

void debug_print(const Instruction &ins, const char *end = "\n");
