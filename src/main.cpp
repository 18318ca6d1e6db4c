#include <fstream>
#include <string_view>
#include <iostream>
#include <string>
#include <cstdio>
#include <cstring>

#include "types.hpp"
#include "compiler.hpp"
#include "interpreter.hpp"
#include "options.hpp"

static bool read_file(const char *filename, std::string &out) {
    std::ifstream stream(filename, std::ios::in | std::ios::binary);
    if (!stream) return false;

    stream.seekg(0, std::ios::end);
    const auto size = stream.tellg();
    if (size < 0) return false;

    out.resize(std::size_t(size));
    stream.seekg(0, std::ios::beg);
    stream.read(out.data(), std::streamsize(out.size()));
    return bool(stream);
}

static bool compile_file(const char *filename, Program &out) {
    auto source = std::string{};
    if (!read_file(filename, source)) {
        std::fprintf(stderr, "Error: Could not read file '%s'\n", filename);
        return false;
    }

    std::string_view name{ filename, std::strlen(filename) };
    return Compiler::compile(name, std::move(source), out);
}

// `exit` codes outside of what a process can report still have to fail
static int process_status(const Runtime &runtime) {
    if (runtime.error == ExecutionError::RUNTIME_EXIT
        && runtime.exit_code > 0 && runtime.exit_code <= 255) {
        return int(runtime.exit_code);
    }
    return 1;
}

int main(int argc, char **argv) {
    auto opts = Options{};
    if (!parse_options(argc, argv, opts)) {
        return 1;
    }

    auto prog = Program{};
    if (!compile_file(opts.filename, prog)) {
        return 1;
    }

    if (opts.list) {
        for (std::size_t i = 0; i < prog.instructions.size(); ++i) {
            std::printf("%4zu  ", i);
            debug_print(prog.instructions[i]);
        }
        std::printf("\n");
    }

    if (opts.dry_run) {
        std::printf("Dry run finished\n");
        return 0;
    }

    auto runtime = Runtime{};
    if (!create_runtime(prog, runtime, opts)) {
        return 1;
    }

    if (!execute(runtime, opts)) {
        return process_status(runtime);
    }

    return 0;
}
