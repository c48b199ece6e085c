#pragma once
#include <cstdint>

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "HunkApplier.hpp"
#include "JsonRepair.hpp"
#include "StructuralDiff.hpp"
#include "UnifiedDiff.hpp"

namespace DiffToPatch {

struct DIFFTOPATCH_API PipelineOptions {
	ApplierOptions applier;
	RepairOptions repair;

	static PipelineOptions fromJSONBuffer(std::string_view fileContents);
};

enum struct DocumentStage : uint8_t {
	None = 0,
	OriginalDocument,/// The document handed in is not JSON
	PatchedDocument  /// The patched text stays invalid after repair
};

struct DIFFTOPATCH_API MalformedDocumentError {
	DocumentStage stage = DocumentStage::None;
	std::string reason;
	/// The text that failed to parse
	std::string unrepaired_text;
	/// What the repairer made of it, empty if it gave up
	std::string repair_output;

	operator bool() const {
		return stage != DocumentStage::None;
	}
};

/// Everything one run produced, so callers never have to redo a stage
struct DIFFTOPATCH_API PipelineResult {
	ParsedDiff hunks;
	std::string patched_text;
	bool repaired = false;
	std::string repaired_text;
	Json patched_document;
	std::vector<PatchOperation> patches;
	std::vector<HunkOutcome> outcomes;
	std::vector<size_t> skipped_hunks;
};

template <typename T> using RunResult = expected<T, MalformedDocumentError>;

/// Turns (document, model diff) into the patch operations the diff stands for
struct DIFFTOPATCH_API Pipeline {
	PipelineOptions options;
	/// Defaults to a shared LenientJsonRepairer
	const JsonRepairer *repairer = nullptr;
	std::ostream *tracing = nullptr;

	RunResult<PipelineResult> run(std::string_view original_document, std::string_view raw_diff) const;

	/// Direct parse first, repair only when it fails
	RunResult<Json> parse_or_repair(std::string_view text, PipelineResult &result) const;
};

DIFFTOPATCH_API RunResult<PipelineResult> run_pipeline(std::string_view original_document, std::string_view raw_diff, const PipelineOptions &options = {});

DIFFTOPATCH_API std::ostream &operator<<(std::ostream &s, const MalformedDocumentError &err);

};// namespace DiffToPatch
