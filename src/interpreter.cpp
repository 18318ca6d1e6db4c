#include "interpreter.hpp"

#include <cctype>
#include <cstdio>
#include <string>

// Both assume the caller checked that the deque holds enough values
#define POP(_dir) pop_unchecked(data, _dir)
#define REQUIRE(_n) do { needed = (_n); if (data.size() < needed) goto Lestack_underflow; } while (0)

static i64 pop_unchecked(std::deque<i64> &data, Direction dir) {
    i64 value{};
    if (dir == Direction::LEFT) {
        value = data.front();
        data.pop_front();
    } else {
        value = data.back();
        data.pop_back();
    }
    return value;
}

static void push(std::deque<i64> &data, Direction dir, i64 value) {
    if (dir == Direction::LEFT) data.push_front(value);
    else data.push_back(value);
}

static std::string_view trim(std::string_view str) {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) str.remove_prefix(1);
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) str.remove_suffix(1);
    return str;
}

__attribute__((noinline))
static void print_data(const std::deque<i64> &data) {
    std::fprintf(stderr, "data [");
    for (std::size_t i = 0; i < data.size(); ++i) {
        std::fprintf(stderr, "%s%lld", i == 0 ? "" : ", ", (long long)data[i]);
    }
    std::fprintf(stderr, "]\n");
}

__attribute__((noinline))
static void print_faulty_instruction(u64 instruction_idx, const Program &prog) {
    if (instruction_idx >= prog.instr_idx_to_location.size()) return;

    const SourceLocation loc = prog.instr_idx_to_location[instruction_idx];
    std::string_view line{};
    if (loc.line < prog.source_code_lines.size()) line = prog.source_code_lines[loc.line];

    std::fprintf(stderr, "Error occurred during the execution of instruction #%llu on line %u:\n",
        (unsigned long long)instruction_idx, loc.line + 1);
    std::fprintf(stderr,
        "     |\n"
        "%4u | %.*s\n"
        "     | %*s^\n",
        loc.line + 1, (int)line.length(), line.data(),
        (int)loc.column, ""
    );
}

bool execute(Runtime &rt, const Options &opts) {
    const Instruction *const instructions = rt.instructions.data();
    const u64 num_instructions = rt.instructions.size();
    const LabelTable &labels = rt.program_ref->labels;

    std::deque<i64> &data = rt.data;
    std::istream &in = *rt.input;
    std::ostream &out = *rt.output;

    // Compiler extension. Supported by GCC / Clang.
    // Kept in same order as the InstructionType enum.
    static void *const INS_JUMP_TABLE[] = {
        &&Lop_swap,
        &&Lop_move,
        &&Lop_over,
        &&Lop_drop,
        &&Lop_dup,

        &&Lop_add,
        &&Lop_sub,

        &&Lop_and,
        &&Lop_or,
        &&Lop_xor,
        &&Lop_not,
        &&Lop_shl,
        &&Lop_shr,

        &&Lop_eq,
        &&Lop_gre,
        &&Lop_les,
        &&Lop_nles,
        &&Lop_ngre,

        &&Lop_print,
        &&Lop_printc,
        &&Lop_read,
        &&Lop_readc,
        &&Lop_trace,

        &&Lop_jmp,
        &&Lop_jmpif,
        &&Lop_exit,

        &&Lop_label,

        &&Lop_push_value,
        &&Lop_push_label,
    };
    static_assert(sizeof(INS_JUMP_TABLE) / sizeof(INS_JUMP_TABLE[0]) == std::size_t(InstructionType::NUM_INSTRUCTIONS));

    // Per cycle values
    const Instruction *ins = nullptr;
    Direction dir{};
    std::size_t needed = 0;
    i64 a{}, b{};
    std::string line{};

    while (true) {
        if (opts.debug && rt.executed_instructions > 0) print_data(data);

        if (rt.ip >= num_instructions) break;

        ins = &instructions[rt.ip++];
        dir = ins->direction;
        rt.executed_instructions += 1;

        goto *INS_JUMP_TABLE[u8(ins->type)];

        //
        // OPERATIONS
        // a is always the first value popped, b the second.
        //

        Lop_push_value:
        push(data, dir, ins->value);
        continue;

        Lop_push_label:
        if (auto it = labels.find(ins->label); it != labels.end()) {
            push(data, dir, i64(it->second));
            continue;
        }
        goto Leunknown_label;

        Lop_swap:
        REQUIRE(2);
        a = POP(dir); b = POP(dir);
        push(data, dir, a);
        push(data, dir, b);
        continue;

        Lop_move:
        REQUIRE(1);
        push(data, invert(dir), POP(dir));
        continue;

        Lop_over:
        REQUIRE(2);
        a = POP(dir); b = POP(dir);
        push(data, dir, b);
        push(data, dir, a);
        push(data, dir, b);
        continue;

        Lop_drop:
        REQUIRE(1);
        POP(dir);
        continue;

        Lop_dup:
        REQUIRE(1);
        a = POP(dir);
        push(data, dir, a);
        push(data, dir, a);
        continue;

        // Two's complement wraparound instead of signed overflow
        Lop_add: REQUIRE(2); a = POP(dir); b = POP(dir); push(data, dir, i64(u64(b) + u64(a))); continue;
        Lop_sub: REQUIRE(2); a = POP(dir); b = POP(dir); push(data, dir, i64(u64(b) - u64(a))); continue;

        Lop_and: REQUIRE(2); a = POP(dir); b = POP(dir); push(data, dir, a & b); continue;
        Lop_or:  REQUIRE(2); a = POP(dir); b = POP(dir); push(data, dir, a | b); continue;
        Lop_xor: REQUIRE(2); a = POP(dir); b = POP(dir); push(data, dir, a ^ b); continue;
        Lop_not: REQUIRE(1); a = POP(dir); push(data, dir, ~a); continue;

        // Shift count is taken modulo 64, shr is arithmetic
        Lop_shl: REQUIRE(2); a = POP(dir); b = POP(dir); push(data, dir, i64(u64(b) << (a & 63))); continue;
        Lop_shr: REQUIRE(2); a = POP(dir); b = POP(dir); push(data, dir, b >> (a & 63)); continue;

        Lop_eq:   REQUIRE(2); a = POP(dir); b = POP(dir); push(data, dir, a == b); continue;
        Lop_gre:  REQUIRE(2); a = POP(dir); b = POP(dir); push(data, dir, a > b);  continue;
        Lop_les:  REQUIRE(2); a = POP(dir); b = POP(dir); push(data, dir, a < b);  continue;
        Lop_nles: REQUIRE(2); a = POP(dir); b = POP(dir); push(data, dir, a >= b); continue;
        Lop_ngre: REQUIRE(2); a = POP(dir); b = POP(dir); push(data, dir, a <= b); continue;

        Lop_print:
        REQUIRE(1);
        out << POP(dir) << '\n';
        continue;

        Lop_printc:
        REQUIRE(1);
        out.put(char(u8(POP(dir))));
        continue;

        Lop_read:
        if (!std::getline(in, line) || !parse_integer(trim(line), a)) goto Lenon_integer_input;
        push(data, dir, a);
        continue;

        Lop_readc:
        if (!std::getline(in, line) || line.empty()) a = ' ';
        else a = u8(line[0]);
        push(data, dir, a);
        continue;

        Lop_trace:
        line.clear();
        for (i64 value : data) line += value == 1 ? '*' : ' ';
        out << line << '\n';
        continue;

        Lop_jmp:
        REQUIRE(1);
        a = POP(dir);
        if (a < 0 || u64(a) > num_instructions) goto Leinvalid_jump_address;
        rt.ip = u64(a);
        continue;

        Lop_jmpif:
        REQUIRE(2);
        a = POP(dir); // address
        b = POP(dir); // condition
        if (b != 0) {
            if (a < 0 || u64(a) > num_instructions) goto Leinvalid_jump_address;
            rt.ip = u64(a);
        }
        continue;

        Lop_exit:
        REQUIRE(1);
        a = POP(dir);
        if (a != 0) {
            rt.exit_code = a;
            goto Leruntime_exit;
        }
        goto Lhalt;

        Lop_label:
        continue;
    }

Lhalt:
    if (opts.debug) {
        std::fprintf(stderr, "\nExecuted %llu instructions\n", (unsigned long long)rt.executed_instructions);
    }
    out.flush();
    return true;

// Start of error handling spaghetti
Lestack_underflow:
    rt.error = ExecutionError::STACK_UNDERFLOW;
    std::fprintf(stderr, "Execution error: Stack underflow, '%s' needs %zu value%s but the deque holds %zu\n",
        ins->operation.c_str(), needed, needed == 1 ? "" : "s", data.size());
    goto Lprint_faulty_instruction;

Leunknown_label:
    rt.error = ExecutionError::UNKNOWN_LABEL;
    std::fprintf(stderr, "Execution error: Label '%s' does not exist\n", ins->operation.c_str());
    goto Lprint_faulty_instruction;

Lenon_integer_input:
    rt.error = ExecutionError::NON_INTEGER_INPUT;
    if (in) std::fprintf(stderr, "Execution error: Expected an integer as input, got \"%s\"\n", line.c_str());
    else std::fprintf(stderr, "Execution error: Expected an integer as input, reached end of input\n");
    goto Lprint_faulty_instruction;

Leinvalid_jump_address:
    rt.error = ExecutionError::INVALID_JUMP_ADDRESS;
    std::fprintf(stderr, "Execution error: Instruction #%llu jumped out of bounds (jump address %lld, valid addresses are 0 to %llu)\n",
        (unsigned long long)(rt.ip - 1), (long long)a, (unsigned long long)num_instructions);
    goto Lprint_faulty_instruction;

Lprint_faulty_instruction:
    out.flush();
    print_faulty_instruction(rt.ip - 1, *rt.program_ref);
    return false;
// End of error handling spaghetti

Leruntime_exit:
    rt.error = ExecutionError::RUNTIME_EXIT;
    out.flush();
    std::fprintf(stderr, "Program exited with code %lld\n", (long long)rt.exit_code);
    return false;
}

#undef REQUIRE
#undef POP

bool create_runtime(const Program &program, Runtime &out, const Options &options) {
    out.instructions = program.instructions;
    out.program_ref = &program;

    out.data.clear();
    out.ip = 0;
    out.executed_instructions = 0;
    out.error = ExecutionError::NONE;
    out.exit_code = 0;

    (void)options;
    return true;
}

std::string_view error_name(ExecutionError error) {
    switch (error) {
        case ExecutionError::NONE: return "none";
        case ExecutionError::STACK_UNDERFLOW: return "stack underflow";
        case ExecutionError::UNKNOWN_LABEL: return "unknown label";
        case ExecutionError::NON_INTEGER_INPUT: return "non-integer input";
        case ExecutionError::INVALID_JUMP_ADDRESS: return "invalid jump address";
        case ExecutionError::RUNTIME_EXIT: return "exit";
        default: return "{??}";
    }
}
