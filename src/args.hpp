#pragma once

#include <optional>
#include <vector>
#include <string_view>
#include <cstring> // std::strlen()
#include <unordered_map>
#include <stdexcept> // std::invalid_argument
#include <cstdio>
#include <cstdlib> // std::exit()
#include <charconv> // std::from_chars()
#include <type_traits> // std::is_same_v

#include "types.hpp"

namespace ArgParsers {
    template<typename T>
    bool parse_to(std::string_view string, T *out) {
        if constexpr (std::is_same_v<T, bool>) {
            if (string == "0" || string == "false") { *out = false; return true; }
            if (string == "1" || string == "true") { *out = true; return true; }
            return false;
        } else if constexpr (std::is_same_v<T, std::string_view>) {
            *out = string;
            return true;
        } else {
            static_assert(std::is_integral_v<T>, "unsupported option type");

            T temp;
            const auto result = std::from_chars(string.data(), string.data() + string.length(), temp);
            if (result.ec != std::errc{} || result.ptr != string.data() + string.length()) {
                return false;
            }
            *out = temp;
            return true;
        }
    }
}

// Small command line parser.
// Supports `-v`, `--verbose`, `--opt=value`, `--opt value`, grouped short flags (`-dD`)
// and `--` to end option parsing.
class Args {
    using CallbackFn = bool(void*, std::string_view);
    struct Arg {
        void *out_ptr;
        bool is_flag;
        CallbackFn *callback;
    };
public:
    struct ParseResult {
        std::vector<std::string_view> remaining_args;
        std::vector<std::string_view> unrecognized_options;
    };

    static Args parser() {
        return Args();
    }

    template<typename T>
    Args &add_arg(std::string_view short_form, std::string_view long_form, T &out) {
        if (short_form.empty() && long_form.empty()) {
            throw std::invalid_argument("can't have both short and long forms of an argument empty");
        }

        auto arg = Arg {
            .out_ptr = &out,
            .is_flag = std::is_same_v<T, bool>,
            .callback = [](void *raw_out_ptr, std::string_view val) {
                return ArgParsers::parse_to(val, static_cast<T*>(raw_out_ptr));
            }
        };

        if (!short_form.empty()) short_args.insert({ short_form, arg });
        if (!long_form.empty()) long_args.insert({ long_form, arg });

        return *this;
    }

    template<typename T>
    Args &add_arg(std::string_view long_form, T &out) {
        return add_arg("", long_form, out);
    }

    ParseResult parse(std::size_t argc, char **argv) {
        auto result = ParseResult{};

        // Skip 0 (application name)
        for (std::size_t i = 1; i < argc; ++i) {
            const auto input = to_str_view(argv[i]);

            if (input == "--") {
                // rest are positional args and not parsed
                for (std::size_t j = i + 1; j < argc; ++j) {
                    result.remaining_args.push_back(to_str_view(argv[j]));
                }
                break;
            }

            auto next = i + 1 < argc ? std::optional{ to_str_view(argv[i + 1]) } : std::nullopt;
            if (parse_input(input, next, result)) i += 1; // value was taken from the next argument
        }

        return result;
    }

private:
    static std::string_view to_str_view(const char *c_str) {
        if (!c_str) return {};
        return std::string_view(c_str, std::strlen(c_str));
    }

    // Returns true if `next` was consumed as the value of an option.
    bool parse_input(std::string_view input, std::optional<std::string_view> next, ParseResult &result) {
        if (!input.starts_with("-") || input == "-") {
            result.remaining_args.push_back(input);
            return false;
        }

        if (input.starts_with("--")) {
            return parse_option(long_args, input.substr(2), next, result);
        }
        input = input.substr(1);

        // -d, -ss=1, -ss 1, or several flags at once: -dD
        auto name = input.substr(0, input.find_first_of('='));
        if (short_args.find(name) != short_args.end()) {
            return parse_option(short_args, input, next, result);
        }

        for (char c : input) {
            auto it = short_args.find(std::string_view(&c, 1));
            if (it == short_args.end() || !it->second.is_flag) {
                result.unrecognized_options.push_back(input);
                return false;
            }
        }
        for (std::size_t i = 0; i < input.length(); ++i) {
            parse_option(short_args, input.substr(i, 1), std::nullopt, result);
        }
        return false;
    }

    bool parse_option(std::unordered_map<std::string_view, Arg> &args, std::string_view option,
                      std::optional<std::string_view> next, ParseResult &result) {
        auto value = std::string_view{};
        bool has_value = false;
        if (const auto idx = option.find_first_of('='); idx != option.npos) {
            value = option.substr(idx + 1);
            option = option.substr(0, idx);
            has_value = true;
        }

        auto it = args.find(option);
        if (it == args.end()) {
            result.unrecognized_options.push_back(option);
            return false;
        }

        const Arg &mapping = it->second;
        bool consumed_next = false;
        if (!has_value) {
            if (mapping.is_flag) value = "1";
            else if (next) {
                value = *next;
                consumed_next = true;
            }
        }

        if (!mapping.callback(mapping.out_ptr, value)) {
            std::printf("Failed to parse value \"%.*s\" for option \"%.*s\"\n",
                (int)value.length(), value.data(), (int)option.length(), option.data());
            std::exit(1);
        }
        return consumed_next;
    }

    std::unordered_map<std::string_view, Arg> short_args;
    std::unordered_map<std::string_view, Arg> long_args;
};
