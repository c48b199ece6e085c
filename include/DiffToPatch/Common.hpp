#pragma once
#include <cstdint>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#ifdef _MSC_VER
	#define DIFFTOPATCH_EXPORT_API __declspec(dllexport)
	#define DIFFTOPATCH_IMPORT_API __declspec(dllimport)
#else
	#ifdef _WIN32
		#define DIFFTOPATCH_EXPORT_API [[gnu::dllexport]]
		#define DIFFTOPATCH_IMPORT_API [[gnu::dllimport]]
	#else
		#define DIFFTOPATCH_EXPORT_API [[gnu::visibility("default")]]
		#define DIFFTOPATCH_IMPORT_API
	#endif
#endif

#ifdef DIFFTOPATCH_EXPORTS
	#define DIFFTOPATCH_API DIFFTOPATCH_EXPORT_API
#else
	#define DIFFTOPATCH_API DIFFTOPATCH_IMPORT_API
#endif

namespace DiffToPatch {

template <typename T, typename E>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected = tl::unexpected<E>;

/// Documents keep the key order they were written with
using Json = nlohmann::ordered_json;

/// Closed set of JSON value shapes
enum struct ValueKind : uint8_t {
	Null,
	Boolean,
	Number,
	String,
	Array,
	Object
};

DIFFTOPATCH_API ValueKind kind_of(const Json &value);

};// namespace DiffToPatch
