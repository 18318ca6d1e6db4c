#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "compiler.hpp"
#include "program.hpp"

static Program compile_ok(std::string_view source) {
	Program prog {};
	EXPECT_TRUE(Compiler::compile("test.dq", std::string(source), prog));
	return prog;
}

static bool compiles(std::string_view source) {
	Program prog {};
	return Compiler::compile("test.dq", std::string(source), prog);
}

TEST(CompilerTest, direction_markers) {
	auto prog = compile_ok("!add sub!");

	ASSERT_EQ(prog.instructions.size(), 2u);
	EXPECT_EQ(prog.instructions[0].type, InstructionType::ADD);
	EXPECT_EQ(prog.instructions[0].direction, Direction::LEFT);
	EXPECT_EQ(prog.instructions[1].type, InstructionType::SUB);
	EXPECT_EQ(prog.instructions[1].direction, Direction::RIGHT);
}

TEST(CompilerTest, any_whitespace_separates_tokens) {
	auto prog = compile_ok("  !1\t\t2!\n\n\r\n  !add \n");

	ASSERT_EQ(prog.instructions.size(), 3u);
	EXPECT_EQ(prog.instructions[0].value, 1);
	EXPECT_EQ(prog.instructions[1].value, 2);
	EXPECT_EQ(prog.instructions[2].type, InstructionType::ADD);
}

TEST(CompilerTest, empty_program) {
	auto prog = compile_ok(" \n\t ");

	EXPECT_TRUE(prog.instructions.empty());
	EXPECT_TRUE(prog.labels.empty());
}

TEST(CompilerTest, integer_literals) {
	auto prog = compile_ok("!42 -7! !+5 !007 !-0");

	ASSERT_EQ(prog.instructions.size(), 5u);
	for (const auto &ins : prog.instructions) {
		EXPECT_EQ(ins.type, InstructionType::PUSH_VALUE);
	}
	EXPECT_EQ(prog.instructions[0].value, 42);
	EXPECT_EQ(prog.instructions[1].value, -7);
	EXPECT_EQ(prog.instructions[2].value, 5);
	EXPECT_EQ(prog.instructions[3].value, 7);
	EXPECT_EQ(prog.instructions[4].value, 0);
}

TEST(CompilerTest, extreme_integer_literals) {
	auto prog = compile_ok("!9223372036854775807 !-9223372036854775808");

	EXPECT_EQ(prog.instructions[0].value, INT64_MAX);
	EXPECT_EQ(prog.instructions[1].value, INT64_MIN);
}

TEST(CompilerTest, non_integers_are_label_references) {
	auto prog = compile_ok("!99999999999999999999 !+-1 !1x !- !Loop");

	ASSERT_EQ(prog.instructions.size(), 5u);
	for (const auto &ins : prog.instructions) {
		EXPECT_EQ(ins.type, InstructionType::PUSH_LABEL);
	}
	EXPECT_EQ(prog.instructions[4].label, "loop");
	EXPECT_EQ(prog.instructions[4].operation, "Loop");
}

TEST(CompilerTest, opcode_names_are_case_sensitive) {
	auto prog = compile_ok("!ADD");

	EXPECT_EQ(prog.instructions[0].type, InstructionType::PUSH_LABEL);
	EXPECT_EQ(prog.instructions[0].label, "add");
}

TEST(CompilerTest, every_opcode_name) {
	auto prog = compile_ok(
		"!swap !move !over !drop !dup !add !sub !and !or !xor !not !shl !shr "
		"!eq !> !< !>= !<= !print !printc !read !readc !trace !jmp !jmpif !exit !label");

	ASSERT_EQ(prog.instructions.size(), std::size_t(InstructionType::LABEL) + 1);
	for (std::size_t i = 0; i < prog.instructions.size(); ++i) {
		EXPECT_EQ(prog.instructions[i].type, InstructionType(i)) << "instruction #" << i;
		EXPECT_FALSE(prog.instructions[i].defines_label);
	}
}

TEST(CompilerTest, label_address_is_token_index) {
	auto prog = compile_ok("!1 !2 Start: !add END:");

	ASSERT_EQ(prog.instructions.size(), 5u);
	ASSERT_EQ(prog.labels.size(), 2u);
	EXPECT_EQ(prog.labels.at("start"), 2u);
	EXPECT_EQ(prog.labels.at("end"), 4u);

	EXPECT_EQ(prog.instructions[2].type, InstructionType::LABEL);
	EXPECT_TRUE(prog.instructions[2].defines_label);
	EXPECT_EQ(prog.instructions[2].operation, "Start");
}

TEST(CompilerTest, label_marker_wins_over_direction) {
	auto prog = compile_ok("!x: y!: !z!");

	EXPECT_EQ(prog.labels.count("!x"), 1u);
	EXPECT_EQ(prog.labels.count("y!"), 1u);

	EXPECT_EQ(prog.instructions[2].direction, Direction::LEFT);
	EXPECT_EQ(prog.instructions[2].operation, "z!");
}

TEST(CompilerTest, forward_references) {
	auto prog = compile_ok("!later !jmp later:");

	EXPECT_EQ(prog.instructions[0].type, InstructionType::PUSH_LABEL);
	EXPECT_EQ(prog.labels.at(prog.instructions[0].label), 2u);
}

TEST(CompilerTest, undefined_reference_still_compiles) {
	EXPECT_TRUE(compiles("!nowhere !jmp"));
}

TEST(CompilerTest, missing_direction_marker) {
	EXPECT_FALSE(compiles("!1 add !print"));
	EXPECT_FALSE(compiles("5"));
}

TEST(CompilerTest, empty_operation) {
	EXPECT_FALSE(compiles("!"));
	EXPECT_FALSE(compiles("!1 !"));
}

TEST(CompilerTest, empty_label_name) {
	EXPECT_FALSE(compiles(":"));
}

TEST(CompilerTest, duplicate_labels) {
	EXPECT_FALSE(compiles("a: !1 a:"));
	EXPECT_FALSE(compiles("loop: LOOP:"));
}

TEST(CompilerTest, failed_compile_leaves_output_untouched) {
	Program prog {};
	ASSERT_TRUE(Compiler::compile("a.dq", "!1 !2", prog));

	EXPECT_FALSE(Compiler::compile("b.dq", "!1 oops !3", prog));
	EXPECT_EQ(prog.instructions.size(), 2u);
	EXPECT_EQ(prog.source_code, "!1 !2");
}

TEST(CompilerTest, source_locations) {
	auto prog = compile_ok("!1 !2\n  !add\n\n   loop:");

	ASSERT_EQ(prog.instr_idx_to_location.size(), 4u);
	EXPECT_EQ(prog.instr_idx_to_location[1].line, 0u);
	EXPECT_EQ(prog.instr_idx_to_location[1].column, 3u);
	EXPECT_EQ(prog.instr_idx_to_location[2].line, 1u);
	EXPECT_EQ(prog.instr_idx_to_location[2].column, 2u);
	EXPECT_EQ(prog.instr_idx_to_location[2].length, 4u);
	EXPECT_EQ(prog.instr_idx_to_location[3].line, 3u);
	EXPECT_EQ(prog.instr_idx_to_location[3].column, 3u);

	ASSERT_EQ(prog.source_code_lines.size(), 4u);
	EXPECT_EQ(prog.source_code_lines[1], "  !add");
}

TEST(CompilerTest, to_source) {
	auto prog = compile_ok("!10\n  Loop: !dup   print!\n!LOOP !jmp");

	EXPECT_EQ(to_source(prog), "!10 Loop: !dup print! !LOOP !jmp");
}

TEST(CompilerTest, reloading_serialized_program_is_equivalent) {
	auto original = compile_ok(
		"!10 loop: !dup !0 !>= !END !jmpif\n"
		"!dup print!\n!1 sub! !loop !jmp\nEnd:");
	auto reloaded = compile_ok(to_source(original));

	ASSERT_EQ(original.instructions.size(), reloaded.instructions.size());
	for (std::size_t i = 0; i < original.instructions.size(); ++i) {
		const auto &a = original.instructions[i];
		const auto &b = reloaded.instructions[i];
		EXPECT_EQ(a.type, b.type) << "instruction #" << i;
		EXPECT_EQ(a.direction, b.direction) << "instruction #" << i;
		EXPECT_EQ(a.defines_label, b.defines_label) << "instruction #" << i;
		EXPECT_EQ(a.value, b.value) << "instruction #" << i;
		EXPECT_EQ(a.label, b.label) << "instruction #" << i;
		EXPECT_EQ(a.operation, b.operation) << "instruction #" << i;
	}
	EXPECT_TRUE(original.labels == reloaded.labels);
}
