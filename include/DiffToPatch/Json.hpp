#pragma once

#include <string_view>
#include <vector>

#include "Pipeline.hpp"

namespace DiffToPatch {

NLOHMANN_JSON_SERIALIZE_ENUM(LineKind, {
	{LineKind::Context, "context"},
	{LineKind::Addition, "addition"},
	{LineKind::Deletion, "deletion"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(PatchOpCode, {
	{PatchOpCode::Add, "add"},
	{PatchOpCode::Remove, "remove"},
	{PatchOpCode::Replace, "replace"},
})

DIFFTOPATCH_API void to_json(Json &j, const DiffLine &l);
DIFFTOPATCH_API void from_json(const Json &j, DiffLine &l);

DIFFTOPATCH_API void to_json(Json &j, const UnifiedDiffHunk &h);
DIFFTOPATCH_API void from_json(const Json &j, UnifiedDiffHunk &h);

DIFFTOPATCH_API void to_json(Json &j, const PatchOperation &op);
DIFFTOPATCH_API void from_json(const Json &j, PatchOperation &op);

DIFFTOPATCH_API void to_json(Json &j, const HunkOutcome &o);

DIFFTOPATCH_API void to_json(Json &j, const ApplierOptions &o);
DIFFTOPATCH_API void from_json(const Json &j, ApplierOptions &o);

DIFFTOPATCH_API void to_json(Json &j, const RepairOptions &o);
DIFFTOPATCH_API void from_json(const Json &j, RepairOptions &o);

DIFFTOPATCH_API void to_json(Json &j, const PipelineOptions &o);
DIFFTOPATCH_API void from_json(const Json &j, PipelineOptions &o);

/// Diagnostics of a run: hunks, patched text, outcomes, patches
DIFFTOPATCH_API void to_json(Json &j, const PipelineResult &r);

/// The operations as an RFC 6902 document
DIFFTOPATCH_API Json to_json_patch(const std::vector<PatchOperation> &ops);

DIFFTOPATCH_API ParsedDiff hunksFromJSONBuffer(std::string_view fileContents);

};// namespace DiffToPatch
