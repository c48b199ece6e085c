#include <array>
#include <gtest/gtest.h>
#include <sstream>
#include <tuple>
#include <utility>

#include <DiffToPatch/UnifiedDiff.hpp>

using namespace DiffToPatch;

TEST(DiffReader, numbers) {
	auto cases = std::to_array<std::pair<std::string, HunkRange>>({
		{"@@ -123,456 +789,101112 @@", {123, 456, 789, 101112}},
		{"@@ -123 +789,101112 @@", {123, 1, 789, 101112}},
		{"@@ -123,456 +789 @@", {123, 456, 789, 1}},
		{"@@ -123 +789 @@", {123, 1, 789, 1}},
		{"@@ -0,0 +1,3 @@", {0, 0, 1, 3}},
		{"@@ -12,3 +12,4 @@ \"characters\": [", {12, 3, 12, 4}},
		{"@@  -7,2  +7,2  @@", {7, 2, 7, 2}},
		{"@@ -4294967295 +1 @@", {4294967295u, 1, 1, 1}},
	});
	for(auto &c: cases) {
		LineReader line {.buf = c.first, .line = 1};
		auto numbers_some = line.parse_numbers();
		ASSERT_TRUE(numbers_some.has_value()) << c.first;
		ASSERT_EQ(*numbers_some, c.second) << c.first;
	}
}

TEST(DiffReader, invalid_numbers) {
	auto cases = std::to_array<std::string>({
		"@@ @@",
		"@@ -a,b +c,d @@",
		"@@ -1,2 +3,4",
		"@@ -1, +3 @@",
		"@@ +1,2 -3,4 @@",
		"@@@ -1 +1 @@@",
		"@@ -99999999999 +1 @@",
		"@@ -1,4294967296 +1 @@",
		"@@ -1 +1,000000000000000000004294967296 @@",
	});
	for(auto &c: cases) {
		LineReader line {.buf = c, .line = 7};
		auto numbers_some = line.parse_numbers();
		ASSERT_FALSE(numbers_some.has_value()) << c;
		ASSERT_EQ(numbers_some.error().code, ReaderErrorCode::InvalidHunkHeader);
		ASSERT_EQ(numbers_some.error().line, 7u);
	}
}

TEST(DiffReader, classify_lines) {
	auto cases = std::to_array<std::tuple<std::string, LineKind, std::string>>({
		{"+  \"added\": 1,", LineKind::Addition, "  \"added\": 1,"},
		{"-  \"removed\": 2", LineKind::Deletion, "  \"removed\": 2"},
		{"   \"kept\": 3", LineKind::Context, "  \"kept\": 3"},
		{"}", LineKind::Context, "}"},
		{"", LineKind::Context, ""},
		{"+    \"name\": \"弗利沙沙\",", LineKind::Addition, "    \"name\": \"弗利沙沙\","},
	});
	for(auto &[buf, kind, content]: cases) {
		LineReader line {.buf = buf, .line = 1};
		ASSERT_EQ(line.get_kind(), kind) << buf;
		ASSERT_EQ(line.get_content(), content) << buf;
	}
}

TEST(DiffReader, simple_diff) {
	std::string s {
		"--- a/document.json\n"
		"+++ b/document.json\n"
		"@@ -1,3 +1,3 @@\n"
		" {\n"
		"-  \"title\": \"Original\"\n"
		"+  \"title\": \"Modified\"\n"
		" }\n"};
	auto hunks = parse_unified_diff(s);
	ASSERT_EQ(hunks.size(), 1u);

	auto &hunk = hunks[0];
	ASSERT_EQ(hunk.range(), (HunkRange {1, 3, 1, 3}));
	std::vector<DiffLine> etalon {
		{LineKind::Context, "{"},
		{LineKind::Deletion, "  \"title\": \"Original\""},
		{LineKind::Addition, "  \"title\": \"Modified\""},
		{LineKind::Context, "}"},
	};
	ASSERT_EQ(hunk.lines, etalon);

	std::vector<std::string_view> old_block {"{", "  \"title\": \"Original\"", "}"};
	std::vector<std::string_view> new_block {"{", "  \"title\": \"Modified\"", "}"};
	ASSERT_EQ(hunk.old_block(), old_block);
	ASSERT_EQ(hunk.new_block(), new_block);
}

TEST(DiffReader, no_hunks) {
	auto cases = std::to_array<std::string>({
		"",
		"This is not a valid unified diff",
		"--- a/document.json\n+++ b/document.json\n",
		"\n\n\n",
	});
	for(auto &c: cases) {
		ASSERT_TRUE(parse_unified_diff(c).empty()) << c;
	}
}

TEST(DiffReader, prose_and_fences_around_the_diff) {
	std::string s {
		"Here is the change you asked for:\n"
		"```diff\n"
		"@@ -2,2 +2,3 @@\n"
		"   \"a\": 1,\n"
		"+  \"b\": 2,\n"
		"   \"c\": 3\n"
		"```\n"
		"Let me know if you need anything else.\n"};
	auto hunks = parse_unified_diff(s);
	ASSERT_EQ(hunks.size(), 1u);
	ASSERT_EQ(hunks[0].lines.size(), 3u);
	ASSERT_EQ(hunks[0].lines.back(), (DiffLine {LineKind::Context, "  \"c\": 3"}));
	ASSERT_EQ(hunks[0].range(), (HunkRange {2, 2, 2, 3}));
}

TEST(DiffReader, trailing_text_with_wrong_counts) {
	auto cases = std::to_array<std::string>({
		"```diff\n"
		"@@ -2,2 +2,4 @@\n"
		"   \"a\": 1,\n"
		"+  \"b\": 2,\n"
		"   \"c\": 3\n"
		"```\n"
		"Hope this helps!\n",

		"@@ -2,2 +2,4 @@\n"
		"   \"a\": 1,\n"
		"+  \"b\": 2,\n"
		"   \"c\": 3\n"
		"\n"
		"Hope this helps!\n",

		"@@ -2,9 +2,9 @@\n"
		"   \"a\": 1,\n"
		"+  \"b\": 2,\n"
		"   \"c\": 3\n"
		"```\n"
		"  \"d\": 4\n",
	});
	std::vector<DiffLine> etalon {
		{LineKind::Context, "  \"a\": 1,"},
		{LineKind::Addition, "  \"b\": 2,"},
		{LineKind::Context, "  \"c\": 3"},
	};
	for(auto &c: cases) {
		auto hunks = parse_unified_diff(c);
		ASSERT_EQ(hunks.size(), 1u) << c;
		ASSERT_EQ(hunks[0].lines, etalon) << c;
		ASSERT_EQ(hunks[0].range(), (HunkRange {2, 2, 2, 3})) << c;
	}
}

TEST(DiffReader, hunks_in_separate_fences) {
	std::string s {
		"```diff\n"
		"@@ -1 +1 @@\n"
		"-a\n"
		"+b\n"
		"```\n"
		"and then\n"
		"```diff\n"
		"@@ -5 +5 @@\n"
		"-c\n"
		"+d\n"
		"```\n"};
	auto hunks = parse_unified_diff(s);
	ASSERT_EQ(hunks.size(), 2u);
	ASSERT_EQ(hunks[0].lines.size(), 2u);
	ASSERT_EQ(hunks[1].lines.size(), 2u);
	ASSERT_EQ(hunks[1].old_start, 5u);
}

TEST(DiffReader, crlf_and_multiple_hunks) {
	std::string s {
		"@@ -1,2 +1,2 @@\r\n"
		" a\r\n"
		"-b\r\n"
		"+c\r\n"
		"@@ -10 +10 @@\r\n"
		"-x\r\n"
		"+y"};
	auto hunks = parse_unified_diff(s);
	ASSERT_EQ(hunks.size(), 2u);
	ASSERT_EQ(hunks[0].range(), (HunkRange {1, 2, 1, 2}));
	ASSERT_EQ(hunks[0].lines[1].content, "b");
	ASSERT_EQ(hunks[1].range(), (HunkRange {10, 1, 10, 1}));
	ASSERT_EQ(hunks[1].lines[1], (DiffLine {LineKind::Addition, "y"}));
}

TEST(DiffReader, file_headers_between_hunks) {
	std::string s {
		"--- a/document.json\n"
		"+++ b/document.json\n"
		"@@ -1,1 +1,1 @@\n"
		"-a\n"
		"+b\n"
		"--- a/document.json\n"
		"+++ b/document.json\n"
		"@@ -5,2 +5,1 @@\n"
		"--- separator\n"
		" tail\n"};
	auto hunks = parse_unified_diff(s);
	ASSERT_EQ(hunks.size(), 2u);
	ASSERT_EQ(hunks[0].lines.size(), 2u);
	std::vector<DiffLine> etalon {
		{LineKind::Deletion, "-- separator"},
		{LineKind::Context, "tail"},
	};
	ASSERT_EQ(hunks[1].lines, etalon);
}

TEST(DiffReader, counts_follow_the_body) {
	std::string s {
		"@@ -1,5 +1,9 @@\n"
		" a\n"
		"-b\n"
		"+c\n"
		"+d\n"
		"\\ No newline at end of file\n"};
	auto hunks = parse_unified_diff(s);
	ASSERT_EQ(hunks.size(), 1u);
	ASSERT_EQ(hunks[0].range(), (HunkRange {1, 2, 1, 3}));
	ASSERT_EQ(hunks[0].lines.size(), 4u);
}

TEST(DiffReader, blank_context_lines_within_counts_are_kept) {
	std::string s {
		"@@ -1,3 +1,3 @@\n"
		" a\n"
		"\n"
		"-b\n"
		"+c\n"};
	auto hunks = parse_unified_diff(s);
	ASSERT_EQ(hunks.size(), 1u);
	ASSERT_EQ(hunks[0].lines.size(), 4u);
	ASSERT_EQ(hunks[0].lines[1], (DiffLine {LineKind::Context, ""}));
}

TEST(DiffReader, malformed_header_drops_its_body) {
	std::string s {
		"@@ somewhere in the middle @@\n"
		"-a\n"
		"+b\n"
		"@@ -3,1 +3,1 @@\n"
		"-c\n"
		"+d\n"};
	std::ostringstream trace;
	DiffReader r;
	r.tracing = &trace;
	auto hunks = r.by_buf(s);
	ASSERT_EQ(hunks.size(), 1u);
	ASSERT_EQ(hunks[0].old_start, 3u);
	ASSERT_NE(trace.str().find("Invalid hunk header at line 1"), std::string::npos);
}

TEST(DiffReader, reader_is_reusable) {
	DiffReader r;
	ASSERT_EQ(r.by_buf("@@ -1 +1 @@\n-a\n+b\n").size(), 1u);
	ASSERT_EQ(r.get_line(), 4u);
	ASSERT_TRUE(r.by_buf("nothing here").empty());
	ASSERT_EQ(r.by_buf("@@ -1 +1 @@\n-a\n+b\n@@ -4 +4 @@\n-c\n+d\n").size(), 2u);
}

TEST(DiffReader, print_hunk) {
	UnifiedDiffHunk hunk {
		.old_start = 4,
		.old_count = 2,
		.new_start = 4,
		.new_count = 2,
		.lines = {
			{LineKind::Context, "  ],"},
			{LineKind::Deletion, "  \"a\": 1"},
			{LineKind::Addition, "  \"a\": 2"},
		},
	};
	std::ostringstream s;
	s << hunk;
	ASSERT_EQ(s.str(), "@@ -4,2 +4,2 @@\n   ],\n-  \"a\": 1\n+  \"a\": 2\n");
	ASSERT_EQ(parse_unified_diff(s.str())[0], hunk);
}
