#pragma once
#include <cstdint>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Common.hpp"

namespace DiffToPatch {

/// The subset of RFC 6902 operations the generator emits
enum struct PatchOpCode : uint8_t {
	Add,
	Remove,
	Replace
};

struct DIFFTOPATCH_API PatchOperation {
	PatchOpCode op;
	std::string path;
	/// Present for add and replace, never for remove
	std::optional<Json> value;
};

DIFFTOPATCH_API bool operator==(const PatchOperation &lhs, const PatchOperation &rhs);

DIFFTOPATCH_API std::string_view op_name(PatchOpCode op);

/// Escapes '~' as "~0" and '/' as "~1"
DIFFTOPATCH_API std::string escape_pointer_token(std::string_view token);

DIFFTOPATCH_API std::string join_pointer(std::string_view parent, std::string_view token);

/// Walks two documents side by side and records how to turn one into the other
struct DIFFTOPATCH_API PatchGenerator {
	std::vector<PatchOperation> ops;

	void diff_value(const Json &before, const Json &after, const std::string &path);

	void diff_object(const Json &before, const Json &after, const std::string &path);

	/// Index by index: common indices recurse, the tail is removed from the end or appended
	void diff_array(const Json &before, const Json &after, const std::string &path);
};

/// Minimal, deterministic list of add/remove/replace operations turning `before` into `after`
DIFFTOPATCH_API std::vector<PatchOperation> diff(const Json &before, const Json &after);

DIFFTOPATCH_API std::ostream &operator<<(std::ostream &s, const PatchOperation &op);

};// namespace DiffToPatch
