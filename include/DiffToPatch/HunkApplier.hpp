#pragma once
#include <cstdint>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "UnifiedDiff.hpp"

namespace DiffToPatch {

enum struct LineEnding : uint8_t {
	None,
	LF,
	CRLF
};

/// A text split into lines, each remembering its own terminator
struct DIFFTOPATCH_API TextLines {
	std::vector<std::string> lines;
	/// One per line, only the last line may have none
	std::vector<LineEnding> endings;

	static TextLines split(std::string_view text);

	bool trailing_terminator() const;

	/// Terminates unterminated lines like the line before them; the last one only if `trailing`
	void fill_endings(bool trailing);

	std::string join() const;
};

struct DIFFTOPATCH_API ApplierOptions {
	/// How far (in lines) a hunk may drift from the position its header declares
	size_t search_window = 200;
	/// Retry a failed match comparing lines without surrounding whitespace
	bool ignore_whitespace = true;
};

struct DIFFTOPATCH_API HunkOutcome {
	size_t hunk = 0;
	bool applied = false;
	bool fuzzy = false;
	/// First line of the hunk's new block in the patched text
	size_t position = 0;
	/// Anchor minus the position implied by the header
	int64_t drift = 0;
};

DIFFTOPATCH_API bool operator==(const HunkOutcome &lhs, const HunkOutcome &rhs);

struct DIFFTOPATCH_API ApplyResult {
	std::string text;
	/// One entry per hunk, in application order
	std::vector<HunkOutcome> outcomes;
	/// Indices (into the parsed diff) of the hunks whose context was not found
	std::vector<size_t> skipped;

	size_t applied_count() const;
};

/// Applies hunks to a text, locating each one by its context rather than trusting its line numbers
struct DIFFTOPATCH_API HunkApplier {
	ApplierOptions options;
	std::ostream *tracing = nullptr;

	ApplyResult apply(std::string_view original, const ParsedDiff &hunks) const;

	std::optional<size_t> locate(const std::vector<std::string> &lines, const std::vector<std::string_view> &block, size_t cursor, size_t expected, bool loose) const;
};

DIFFTOPATCH_API std::string apply_hunks(std::string_view original, const ParsedDiff &hunks);

DIFFTOPATCH_API std::ostream &operator<<(std::ostream &s, const HunkOutcome &outcome);

};// namespace DiffToPatch
