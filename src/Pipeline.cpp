#include <iostream>

#include <magic_enum.hpp>

#include "DiffToPatch/Json.hpp"
#include "DiffToPatch/Pipeline.hpp"

namespace DiffToPatch {

static const LenientJsonRepairer default_repairer {};

std::ostream &operator<<(std::ostream &s, const MalformedDocumentError &err) {
	switch(err.stage) {
		case DocumentStage::None: {
			return s << "OK" << std::endl;
		} break;
		case DocumentStage::OriginalDocument: {
			return s << "Original document is not JSON: " << err.reason << std::endl;
		} break;
		case DocumentStage::PatchedDocument: {
			return s << "Patched document is not JSON even after repair: " << err.reason << std::endl;
		} break;
	}
	return s;
}

PipelineOptions PipelineOptions::fromJSONBuffer(std::string_view fileContents) {
	return Json::parse(fileContents).get<PipelineOptions>();
}

static expected<Json, std::string> parse_document(std::string_view text) {
	try {
		return Json::parse(text);
	} catch(const Json::exception &e) {
		// parse_error, or out_of_range for a number beyond a double
		return unexpected<std::string>(e.what());
	}
}

RunResult<Json> Pipeline::parse_or_repair(std::string_view text, PipelineResult &result) const {
	auto direct = parse_document(text);
	if(direct) {
		return std::move(*direct);
	}

	if(tracing) {
		*tracing << "Patched text is not JSON (" << direct.error() << "), repairing" << std::endl;
	}
	auto &repairer = this->repairer ? *this->repairer : default_repairer;
	auto repaired_some = repairer.repair(text, this->options.repair);
	if(!repaired_some) {
		return unexpected<MalformedDocumentError>(MalformedDocumentError {
			.stage = DocumentStage::PatchedDocument,
			.reason = std::string(magic_enum::enum_name(repaired_some.error().code)),
			.unrepaired_text = std::string(text),
		});
	}

	result.repaired = true;
	result.repaired_text = std::move(*repaired_some);
	auto reparsed = parse_document(result.repaired_text);
	if(!reparsed) {
		return unexpected<MalformedDocumentError>(MalformedDocumentError {
			.stage = DocumentStage::PatchedDocument,
			.reason = reparsed.error(),
			.unrepaired_text = std::string(text),
			.repair_output = result.repaired_text,
		});
	}
	return std::move(*reparsed);
}

RunResult<PipelineResult> Pipeline::run(std::string_view original_document, std::string_view raw_diff) const {
	auto before_some = parse_document(original_document);
	if(!before_some) {
		return unexpected<MalformedDocumentError>(MalformedDocumentError {
			.stage = DocumentStage::OriginalDocument,
			.reason = before_some.error(),
			.unrepaired_text = std::string(original_document),
		});
	}
	auto &before = *before_some;

	PipelineResult result;
	DiffReader reader;
	reader.tracing = this->tracing;
	result.hunks = reader.by_buf(raw_diff);

	HunkApplier applier {
		.options = this->options.applier,
		.tracing = this->tracing,
	};
	auto applied = applier.apply(original_document, result.hunks);
	result.patched_text = std::move(applied.text);
	result.outcomes = std::move(applied.outcomes);
	result.skipped_hunks = std::move(applied.skipped);
	if(tracing && !result.skipped_hunks.empty()) {
		*tracing << "Skipped " << result.skipped_hunks.size() << " of " << result.hunks.size() << " hunk(s)" << std::endl;
	}

	if(result.patched_text == original_document) {
		result.patched_document = before;
		return result;
	}

	auto after_some = this->parse_or_repair(result.patched_text, result);
	if(!after_some) {
		return unexpected<MalformedDocumentError>(std::move(after_some.error()));
	}
	result.patched_document = std::move(*after_some);
	result.patches = diff(before, result.patched_document);

	if(tracing) {
		*tracing << "Generated " << result.patches.size() << " patch operation(s)" << std::endl;
		for(auto &op: result.patches) {
			*tracing << "  " << op << std::endl;
		}
	}
	return result;
}

RunResult<PipelineResult> run_pipeline(std::string_view original_document, std::string_view raw_diff, const PipelineOptions &options) {
	Pipeline pipeline {.options = options};
	return pipeline.run(original_document, raw_diff);
}

}// namespace DiffToPatch
