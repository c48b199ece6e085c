#pragma once
#include <cstdint>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Common.hpp"

namespace DiffToPatch {

enum struct LineKind : uint8_t {
	Context,
	Addition,
	Deletion
};

/// One body line of a hunk, without its marker
struct DIFFTOPATCH_API DiffLine {
	LineKind kind = LineKind::Context;
	std::string content;
};

DIFFTOPATCH_API bool operator==(const DiffLine &lhs, const DiffLine &rhs);

/// Line ranges declared in a `@@ -a,b +c,d @@` header
struct DIFFTOPATCH_API HunkRange {
	uint32_t old_start = 0, old_count = 0, new_start = 0, new_count = 0;
};

DIFFTOPATCH_API bool operator==(const HunkRange &lhs, const HunkRange &rhs);

struct DIFFTOPATCH_API UnifiedDiffHunk {
	uint32_t old_start = 0, old_count = 0, new_start = 0, new_count = 0;
	std::vector<DiffLine> lines;

	/// Context and deletion lines, in order: the text the hunk expects to find
	std::vector<std::string_view> old_block() const;

	/// Context and addition lines, in order: the text the hunk leaves behind
	std::vector<std::string_view> new_block() const;

	HunkRange range() const;
};

DIFFTOPATCH_API bool operator==(const UnifiedDiffHunk &lhs, const UnifiedDiffHunk &rhs);

/// Hunks in the order they appear in the diff text
using ParsedDiff = std::vector<UnifiedDiffHunk>;

enum struct ReaderErrorCode : uint8_t {
	OK = 0,
	InvalidHunkHeader
};

struct DIFFTOPATCH_API ReaderError {
	ReaderErrorCode code;
	uint64_t line;

	constexpr operator bool() const {
		return code != ReaderErrorCode::OK;
	}
};

template <typename T> using ReaderResult = expected<T, ReaderError>;

struct DIFFTOPATCH_API LineReader {
	std::string_view buf;
	size_t line;

	bool is_hunk_header() const;

	bool is_triple_minus() const;

	bool is_triple_plus() const;

	/// A markdown code fence, "```" with an optional language
	bool is_fence() const;

	bool is_no_newline_marker() const;

	/// Starts with '+', '-' or ' '
	bool is_marked() const;

	size_t get_line() const;

	LineKind get_kind() const;

	/// The line without its marker; unmarked lines are returned whole
	std::string_view get_content() const;

	ReaderResult<HunkRange> parse_numbers() const;
};

typedef bool (*NextFilterF)(const LineReader &);

namespace ScannerUtils {
/// Empty when the number does not fit
std::optional<uint32_t> parse_u32(const char *&iter, const char *bound);

bool any(const LineReader &line);

bool hunk_at(const LineReader &line);
};// namespace ScannerUtils

/// Reads the hunks of a unified diff, tolerating the noise language models put around it
struct DIFFTOPATCH_API DiffReader {
	std::string_view buf;
	size_t pos = 0;
	size_t line = 1;
	std::optional<LineReader> last;
	std::ostream *tracing = nullptr;

	void reset();

	ParsedDiff by_buf(std::string_view buf);

	size_t get_line() const;

	ParsedDiff parse();

	void parse_hunk(HunkRange declared, ParsedDiff &hunks);

	void set_last(LineReader line);

	std::optional<LineReader> next(NextFilterF filter);
};

DIFFTOPATCH_API ParsedDiff parse_unified_diff(std::string_view raw);

DIFFTOPATCH_API std::ostream &operator<<(std::ostream &s, LineKind kind);

DIFFTOPATCH_API std::ostream &operator<<(std::ostream &s, const DiffLine &line);

DIFFTOPATCH_API std::ostream &operator<<(std::ostream &s, const UnifiedDiffHunk &hunk);

DIFFTOPATCH_API std::ostream &operator<<(std::ostream &s, const ReaderError &err);

DIFFTOPATCH_API std::ostream &operator<<(std::ostream &s, const LineReader &line);

};// namespace DiffToPatch
