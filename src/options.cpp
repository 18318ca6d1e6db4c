#include "options.hpp"

#include <cstdio>
#include <cstdlib>
#include <string_view>
#include <vector>

#include "args.hpp"

#define DQVM_VERSION "0.1.0"

struct OptionHelp {
    const char *short_form;
    const char *long_form;
    const char *description;
};

static constexpr OptionHelp OPTION_HELP[] = {
    { "-d", "--dry",     "Loads the file without executing it." },
    { "-l", "--list",    "Prints the loaded instructions before running." },
    { "-D", "--debug",   "Prints the data deque after every instruction (to stderr)." },
    { "",   "--help",    "Shows this page." },
    { "-v", "--version", "Shows version information." },
};

static void print_usage(bool with_options) {
    std::printf("dqvm " DQVM_VERSION ", a stack machine over one double-ended queue\n");
    if (!with_options) return;

    std::printf("\nUsage:\n  dqvm <file> [option(s)]\n\nOptions:\n");
    for (const auto &opt : OPTION_HELP) {
        std::printf("  %-4s  %-10s   %s\n", opt.short_form, opt.long_form, opt.description);
    }
}

static void print_list(const char *what, const std::vector<std::string_view> &items) {
    std::fprintf(stderr, "%s (", what);
    for (std::size_t i = 0; i < items.size(); ++i) {
        std::fprintf(stderr, "%s\"%.*s\"", i == 0 ? "" : " ", (int)items[i].length(), items[i].data());
    }
    std::fprintf(stderr, ")");
}

bool parse_options(int argc, char **argv, Options &out) {
    bool show_help = false;
    bool show_version = false;

    const auto parsed = Args::parser()
        .add_arg("d", "dry", out.dry_run)
        .add_arg("l", "list", out.list)
        .add_arg("D", "debug", out.debug)
        .add_arg("help", show_help)
        .add_arg("v", "version", show_version)
        .parse(std::size_t(argc), argv);

    if (show_help || show_version) {
        print_usage(show_help);
        std::exit(0);
    }

    if (!parsed.unrecognized_options.empty()) {
        print_list("Warning: Ignoring unrecognized options", parsed.unrecognized_options);
        std::fprintf(stderr, "\n\n");
    }

    switch (parsed.remaining_args.size()) {
        case 0:
            std::fprintf(stderr, "No input files.\n");
            return false;
        case 1:
            out.filename = parsed.remaining_args.front().data();
            return true;
        default:
            print_list("Error: More than one filename given", parsed.remaining_args);
            std::fprintf(stderr, ". Only one is allowed.\n");
            return false;
    }
}
