#include "instructions.hpp"

#include <charconv>
#include <cstdio>

#include "tsl/robin_map.h"

using OpcodeTable = tsl::robin_map<std::string_view, InstructionType>;

static OpcodeTable &opcode_table() {
    static auto table = OpcodeTable{
        { "swap",   InstructionType::SWAP },
        { "move",   InstructionType::MOVE },
        { "over",   InstructionType::OVER },
        { "drop",   InstructionType::DROP },
        { "dup",    InstructionType::DUP },

        { "add",    InstructionType::ADD },
        { "sub",    InstructionType::SUB },

        { "and",    InstructionType::AND },
        { "or",     InstructionType::OR },
        { "xor",    InstructionType::XOR },
        { "not",    InstructionType::NOT },
        { "shl",    InstructionType::SHL },
        { "shr",    InstructionType::SHR },

        { "eq",     InstructionType::EQ },
        { ">",      InstructionType::GRE },
        { "<",      InstructionType::LES },
        { ">=",     InstructionType::NLES },
        { "<=",     InstructionType::NGRE },

        { "print",  InstructionType::PRINT },
        { "printc", InstructionType::PRINTC },
        { "read",   InstructionType::READ },
        { "readc",  InstructionType::READC },
        { "trace",  InstructionType::TRACE },

        { "jmp",    InstructionType::JMP },
        { "jmpif",  InstructionType::JMPIF },
        { "exit",   InstructionType::EXIT },

        { "label",  InstructionType::LABEL },
    };
    return table;
}

static tsl::robin_map<u8, std::string_view> &instr_name_table() {
    static auto table = [] {
        auto names = tsl::robin_map<u8, std::string_view>{};
        for (const auto &[name, type] : opcode_table()) {
            names.insert({ u8(type), name });
        }
        names.insert({ u8(InstructionType::PUSH_VALUE), "push" });
        names.insert({ u8(InstructionType::PUSH_LABEL), "push" });
        return names;
    }();
    return table;
}

bool lookup_opcode(std::string_view name, InstructionType &out) {
    auto &tbl = opcode_table();
    if (auto it = tbl.find(name); it != tbl.end()) {
        out = it->second;
        return true;
    }
    return false;
}

bool parse_integer(std::string_view str, i64 &out) {
    // from_chars rejects an explicit plus sign, but "+5" is a valid literal
    if (str.starts_with('+')) {
        str = str.substr(1);
        if (str.starts_with('-')) return false;
    }
    if (str.empty()) return false;

    i64 temp{};
    const auto result = std::from_chars(str.data(), str.data() + str.length(), temp);
    if (result.ec != std::errc{} || result.ptr != str.data() + str.length()) {
        return false;
    }

    out = temp;
    return true;
}

std::string_view instruction_name(InstructionType type) {
    auto &tbl = instr_name_table();
    if (auto it = tbl.find(static_cast<u8>(type)); it != tbl.end()) {
        return it->second;
    }
    return "{unknown}";
}

std::string to_token(const Instruction &ins) {
    if (ins.defines_label) {
        return ins.operation + ":";
    }
    if (ins.direction == Direction::LEFT) {
        return "!" + ins.operation;
    }
    return ins.operation + "!";
}

void debug_print(const Instruction &ins, const char *end) {
    std::printf("%-6s %-5s", instruction_name(ins.type).data(), direction_name(ins.direction).data());

    switch (ins.type) {
        case InstructionType::PUSH_VALUE: std::printf(" %lld", (long long)ins.value); break;
        case InstructionType::PUSH_LABEL: std::printf(" @%s", ins.label.c_str()); break;
        case InstructionType::LABEL:
            if (ins.defines_label) std::printf(" %s:", ins.operation.c_str());
            break;
        default: break;
    }
    std::printf("%s", end);
}
