#include "compiler.hpp"

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <vector>

#include "tsl/robin_map.h"

#include "types.hpp"

// str.substr() does bounds checks that are redundant here
static std::string_view substring(std::string_view str, std::size_t start, std::size_t end) {
    return std::string_view { str.data() + start, end - start };
}

static std::string_view substring(std::string_view str, std::size_t start) {
    return std::string_view { str.data() + start, str.length() - start };
}

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c));
}

// FIXME: ASCII only. Labels with non-ASCII letters compare case-sensitively.
static std::string lowercase(std::string_view str) {
    auto buf = std::string(str);
    for (char &c : buf) {
        c = char(std::tolower(static_cast<unsigned char>(c)));
    }
    return buf;
}

static std::vector<std::string> to_lines(std::string_view str) {
    auto lines = std::vector<std::string>{};

    while (!str.empty()) {
        std::string_view line{};
        if (auto idx = str.find_first_of('\n'); idx != str.npos) {
            line = substring(str, 0, idx);
            str = substring(str, idx + 1);
        } else {
            line = str;
            str = substring(str, str.length());
        }

        if (!line.empty() && line.back() == '\r') line = substring(line, 0, line.length() - 1);

        lines.emplace_back(line);
    }

    return lines;
}

struct Token {
    std::string_view text;
    SourceLocation location;
};

// Any run of whitespace separates tokens, newlines included.
static std::vector<Token> tokenize(std::string_view str) {
    auto tokens = std::vector<Token>{};

    u32 line = 0;
    u32 column = 0;
    std::size_t i = 0;
    while (i < str.length()) {
        if (is_space(str[i])) {
            if (str[i] == '\n') {
                line += 1;
                column = 0;
            } else {
                column += 1;
            }
            i += 1;
            continue;
        }

        std::size_t end = i;
        while (end < str.length() && !is_space(str[end])) end += 1;

        tokens.push_back(Token{
            .text = substring(str, i, end),
            .location = SourceLocation{ .line = line, .column = column, .length = u32(end - i) },
        });

        column += u32(end - i);
        i = end;
    }

    return tokens;
}

// A reference to a label, checked once the whole label table is known
struct LabelReference {
    std::string label_name;
    u64 instruction_idx;
};

struct Logging {
    u32 num_errors;
    u32 num_warnings;

    SourceLocation current_location;
    std::string_view file_name;
    const std::vector<std::string> *lines;
};

struct CompilerCtx {
    std::vector<Instruction> instructions;
    std::vector<SourceLocation> locations;
    LabelTable labels;
    std::vector<LabelReference> label_references;
    Logging logging;
};

class Message {
public:
    static Message error(CompilerCtx &ctx) {
        ctx.logging.num_errors += 1;
        return Message(ctx, "Error");
    }

    static Message warning(CompilerCtx &ctx) {
        ctx.logging.num_warnings += 1;
        return Message(ctx, "Warning");
    }

    Message &with_hint(std::string_view hint) { this->hint = hint; return *this; }

    Message &at(SourceLocation location) { this->location = location; return *this; }

    Message &printf(const char* format...) {
        auto &logging = ctx.logging;
        auto file = logging.file_name;
        auto line_num = location.line;

        std::fprintf(stderr, "%.*s:%u:\n%s: ", (int)file.length(), file.data(), line_num + 1, severity);
        va_list args;
        va_start(args, format);
        std::vfprintf(stderr, format, args);
        va_end(args);
        std::fprintf(stderr, "\n");

        std::string_view line_str{};
        if (line_num < logging.lines->size()) line_str = (*logging.lines)[line_num];

        auto underline = std::string(location.column, ' ');
        underline.append(std::max<u32>(location.length, 1), '~');

        std::fprintf(stderr,
            "     |     \n"
            "%4u | %.*s\n"
            "     | %s ",
            line_num + 1, (int)line_str.length(), line_str.data(),
            underline.c_str()
        );
        if (!hint.empty()) {
            std::fprintf(stderr, "(%.*s)", (int)hint.length(), hint.data());
        }
        std::fprintf(stderr, "\n\n");
        return *this;
    }

private:
    Message(CompilerCtx &ctx, const char *severity)
        : ctx(ctx), severity(severity), location(ctx.logging.current_location) {}

    CompilerCtx &ctx;
    const char *severity;
    std::string_view hint = "";
    SourceLocation location;
};

static void add_instruction(CompilerCtx &ctx, Instruction ins) {
    ctx.instructions.push_back(std::move(ins));
    ctx.locations.push_back(ctx.logging.current_location);
}

// `name:`
static void parse_label_definition(CompilerCtx &ctx, std::string_view token) {
    std::string_view name = substring(token, 0, token.length() - 1);

    if (name.empty()) {
        Message::error(ctx)
            .with_hint("Put a name before the colon")
            .printf("Empty label name:");
        return;
    }

    const u64 address = ctx.instructions.size();
    if (!ctx.labels.try_emplace(lowercase(name), address).second) {
        Message::error(ctx)
            .with_hint("Label names are case-insensitive")
            .printf("Duplicate label '%.*s'", (int)name.length(), name.data());
        return;
    }

    add_instruction(ctx, Instruction{
        .type = InstructionType::LABEL,
        .direction = Direction::LEFT,
        .defines_label = true,
        .operation = std::string(name),
    });
}

// `!op` or `op!`, where op is an opcode name, an integer or a label name
static void parse_operation(CompilerCtx &ctx, std::string_view op, Direction dir) {
    if (op.empty()) {
        Message::error(ctx)
            .with_hint("Expected an opcode, an integer or a label name")
            .printf("Missing operation after direction marker:");
        return;
    }

    auto ins = Instruction{
        .type = InstructionType::PUSH_LABEL,
        .direction = dir,
        .operation = std::string(op),
    };

    if (lookup_opcode(op, ins.type)) {
        // opcode
    } else if (parse_integer(op, ins.value)) {
        ins.type = InstructionType::PUSH_VALUE;
    } else {
        ins.label = lowercase(op);
        ctx.label_references.push_back(LabelReference{
            .label_name = ins.label,
            .instruction_idx = ctx.instructions.size(),
        });
    }

    add_instruction(ctx, std::move(ins));
}

static void parse_token(CompilerCtx &ctx, const Token &token) {
    std::string_view word = token.text;
    ctx.logging.current_location = token.location;

    // Order matters: `!x:` is a label named "!x", and `!x!` is "x!" on the left.
    if (word.ends_with(':')) {
        parse_label_definition(ctx, word);
    } else if (word.starts_with('!')) {
        parse_operation(ctx, substring(word, 1), Direction::LEFT);
    } else if (word.ends_with('!')) {
        parse_operation(ctx, substring(word, 0, word.length() - 1), Direction::RIGHT);
    } else {
        Message::error(ctx)
            .with_hint("Use '!op' for the left end, 'op!' for the right end or 'name:' for a label")
            .printf("Token '%.*s' has no direction or label marker:", (int)word.length(), word.data());
    }
}

// Undefined references still compile, they only fail if executed.
static void check_labels(CompilerCtx &ctx) {
    for (const auto &ref : ctx.label_references) {
        if (ctx.labels.find(ref.label_name) != ctx.labels.end()) continue;

        Message::warning(ctx)
            .at(ctx.locations[ref.instruction_idx])
            .printf("Label '%s' is never defined", ref.label_name.c_str());
    }

    for (u64 i = 0; i < ctx.instructions.size(); ++i) {
        const auto &ins = ctx.instructions[i];
        if (!ins.defines_label) continue;

        i64 value{};
        if (parse_integer(ins.operation, value)) {
            Message::warning(ctx)
                .at(ctx.locations[i])
                .with_hint("References to it are pushed as integers")
                .printf("Label '%s' can't be referenced, its name is an integer literal", ins.operation.c_str());
        }
    }
}

bool Compiler::compile(std::string_view file_name, std::string source_code, Program &out) {
    auto lines = to_lines(source_code);

    auto ctx = CompilerCtx{};
    ctx.logging = Logging {
        .num_errors = 0,
        .num_warnings = 0,
        .current_location = SourceLocation{},
        .file_name = file_name,
        .lines = &lines,
    };

    for (const auto &token : tokenize(source_code)) {
        parse_token(ctx, token);
    }

    auto errors = ctx.logging.num_errors;
    if (errors > 0) {
        std::fprintf(stderr, "Found %u error%s, aborting\n", errors, errors == 1 ? "" : "s");
        return false;
    }

    check_labels(ctx);

    auto warns = ctx.logging.num_warnings;
    if (warns > 0) {
        std::fprintf(stderr, "Compilation finished with %u warning%s\n",
            warns, warns == 1 ? "" : "s");
    }

    out.instructions = std::move(ctx.instructions);
    out.labels = std::move(ctx.labels);
    out.instr_idx_to_location = std::move(ctx.locations);
    out.source_code_lines = std::move(lines);
    out.source_code = std::move(source_code);

    return true;
}

std::string to_source(const Program &program) {
    auto text = std::string{};
    for (const auto &ins : program.instructions) {
        if (!text.empty()) text += ' ';
        text += to_token(ins);
    }
    return text;
}
