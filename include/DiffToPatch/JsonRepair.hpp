#pragma once
#include <cstdint>

#include <iosfwd>
#include <string>
#include <string_view>

#include "Common.hpp"

namespace DiffToPatch {

struct DIFFTOPATCH_API RepairOptions {
	/// Escape everything outside of ASCII as \uXXXX
	bool ascii_only = false;
	/// Negative values produce compact output
	int indent = 2;
};

enum struct RepairErrorCode : uint8_t {
	OK = 0,
	NoJsonFound,
	TooDeep
};

struct DIFFTOPATCH_API RepairError {
	RepairErrorCode code;
	uint64_t offset;

	constexpr operator bool() const {
		return code != RepairErrorCode::OK;
	}
};

template <typename T> using RepairResult = expected<T, RepairError>;

/// Turns near-valid JSON text into valid JSON text
struct DIFFTOPATCH_API JsonRepairer {
	virtual ~JsonRepairer();

	virtual RepairResult<std::string> repair(std::string_view text, const RepairOptions &options) const = 0;
};

/// Tolerant recursive-descent reader: it accepts what a language model usually gets wrong
/// (trailing or missing commas, truncated documents, stray quotes, comments, Python
/// literals) and re-serializes the value it recovered.
struct DIFFTOPATCH_API LenientJsonRepairer: public JsonRepairer {
	size_t max_depth = 512;

	RepairResult<std::string> repair(std::string_view text, const RepairOptions &options) const override;

	RepairResult<Json> read(std::string_view text) const;
};

DIFFTOPATCH_API std::ostream &operator<<(std::ostream &s, const RepairError &err);

};// namespace DiffToPatch
