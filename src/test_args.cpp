#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "args.hpp"

// Args keeps views into argv, so the strings must outlive the parse result
struct Argv {
	Argv(std::initializer_list<const char *> args) {
		strings.emplace_back("dqvm");
		for (const char *arg : args) strings.emplace_back(arg);
		for (auto &str : strings) pointers.push_back(str.data());
	}

	std::size_t argc() const { return pointers.size(); }
	char **argv() { return pointers.data(); }

	std::vector<std::string> strings;
	std::vector<char *> pointers;
};

TEST(ArgsTest, flags) {
	bool dry = false, debug = false, list = false;
	Argv args {"-d", "--debug", "prog.dq"};

	auto result = Args::parser()
		.add_arg("d", "dry", dry)
		.add_arg("D", "debug", debug)
		.add_arg("l", "list", list)
		.parse(args.argc(), args.argv());

	EXPECT_TRUE(dry);
	EXPECT_TRUE(debug);
	EXPECT_FALSE(list);
	ASSERT_EQ(result.remaining_args.size(), 1u);
	EXPECT_EQ(result.remaining_args[0], "prog.dq");
	EXPECT_TRUE(result.unrecognized_options.empty());
}

TEST(ArgsTest, grouped_short_flags) {
	bool dry = false, debug = false, list = false;
	Argv args {"-dl", "prog.dq"};

	auto result = Args::parser()
		.add_arg("d", "dry", dry)
		.add_arg("D", "debug", debug)
		.add_arg("l", "list", list)
		.parse(args.argc(), args.argv());

	EXPECT_TRUE(dry);
	EXPECT_FALSE(debug);
	EXPECT_TRUE(list);
	EXPECT_EQ(result.remaining_args.size(), 1u);
}

TEST(ArgsTest, explicit_values) {
	bool dry = true;
	u64 limit = 0;
	Argv args {"--dry=false", "--limit", "42", "prog.dq"};

	auto result = Args::parser()
		.add_arg("d", "dry", dry)
		.add_arg("limit", limit)
		.parse(args.argc(), args.argv());

	EXPECT_FALSE(dry);
	EXPECT_EQ(limit, 42u);
	ASSERT_EQ(result.remaining_args.size(), 1u);
	EXPECT_EQ(result.remaining_args[0], "prog.dq");
}

TEST(ArgsTest, unrecognized_options) {
	bool dry = false;
	Argv args {"--fast", "-x", "prog.dq"};

	auto result = Args::parser()
		.add_arg("d", "dry", dry)
		.parse(args.argc(), args.argv());

	ASSERT_EQ(result.unrecognized_options.size(), 2u);
	EXPECT_EQ(result.unrecognized_options[0], "fast");
	EXPECT_EQ(result.unrecognized_options[1], "x");
	EXPECT_EQ(result.remaining_args.size(), 1u);
}

TEST(ArgsTest, double_dash_ends_options) {
	bool dry = false;
	Argv args {"--", "-d", "prog.dq"};

	auto result = Args::parser()
		.add_arg("d", "dry", dry)
		.parse(args.argc(), args.argv());

	EXPECT_FALSE(dry);
	ASSERT_EQ(result.remaining_args.size(), 2u);
	EXPECT_EQ(result.remaining_args[0], "-d");
}

TEST(ArgsTest, needs_a_form) {
	bool flag = false;
	EXPECT_THROW(Args::parser().add_arg("", "", flag), std::invalid_argument);
}
