#include "DiffToPatch/Json.hpp"

namespace DiffToPatch {

void to_json(Json &j, const DiffLine &l) {
	j = Json {{"type", l.kind}, {"content", l.content}};
}

void from_json(const Json &j, DiffLine &l) {
	j.at("type").get_to(l.kind);
	j.at("content").get_to(l.content);
}

void to_json(Json &j, const UnifiedDiffHunk &h) {
	j = Json {
		{"oldStart", h.old_start},
		{"oldCount", h.old_count},
		{"newStart", h.new_start},
		{"newCount", h.new_count},
		{"lines", h.lines},
	};
}

void from_json(const Json &j, UnifiedDiffHunk &h) {
	j.at("oldStart").get_to(h.old_start);
	j.at("oldCount").get_to(h.old_count);
	j.at("newStart").get_to(h.new_start);
	j.at("newCount").get_to(h.new_count);
	j.at("lines").get_to(h.lines);
}

void to_json(Json &j, const PatchOperation &op) {
	j = Json {{"op", op.op}, {"path", op.path}};
	if(op.value) {
		j["value"] = *op.value;
	}
}

void from_json(const Json &j, PatchOperation &op) {
	j.at("op").get_to(op.op);
	j.at("path").get_to(op.path);
	if(j.contains("value")) {
		op.value = j.at("value");
	} else {
		op.value.reset();
	}
}

void to_json(Json &j, const HunkOutcome &o) {
	j = Json {
		{"hunk", o.hunk},
		{"applied", o.applied},
		{"fuzzy", o.fuzzy},
		{"position", o.position},
		{"drift", o.drift},
	};
}

void to_json(Json &j, const ApplierOptions &o) {
	j = Json {{"searchWindow", o.search_window}, {"ignoreWhitespace", o.ignore_whitespace}};
}

void from_json(const Json &j, ApplierOptions &o) {
	o.search_window = j.value("searchWindow", o.search_window);
	o.ignore_whitespace = j.value("ignoreWhitespace", o.ignore_whitespace);
}

void to_json(Json &j, const RepairOptions &o) {
	j = Json {{"asciiOnly", o.ascii_only}, {"indent", o.indent}};
}

void from_json(const Json &j, RepairOptions &o) {
	o.ascii_only = j.value("asciiOnly", o.ascii_only);
	o.indent = j.value("indent", o.indent);
}

void to_json(Json &j, const PipelineOptions &o) {
	j = Json {{"applier", o.applier}, {"repair", o.repair}};
}

void from_json(const Json &j, PipelineOptions &o) {
	if(j.contains("applier")) {
		j.at("applier").get_to(o.applier);
	}
	if(j.contains("repair")) {
		j.at("repair").get_to(o.repair);
	}
}

void to_json(Json &j, const PipelineResult &r) {
	j = Json {
		{"hunks", r.hunks},
		{"patchedText", r.patched_text},
		{"repaired", r.repaired},
	};
	if(r.repaired) {
		j["repairedText"] = r.repaired_text;
	}
	j["patchedDocument"] = r.patched_document;
	j["patches"] = to_json_patch(r.patches);
	j["outcomes"] = r.outcomes;
	j["skippedHunks"] = r.skipped_hunks;
}

Json to_json_patch(const std::vector<PatchOperation> &ops) {
	auto res = Json::array();
	for(auto &op: ops) {
		res.push_back(Json(op));
	}
	return res;
}

ParsedDiff hunksFromJSONBuffer(std::string_view fileContents) {
	return Json::parse(fileContents).get<ParsedDiff>();
}

}// namespace DiffToPatch
