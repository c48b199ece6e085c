#include <algorithm>
#include <iostream>

#include "DiffToPatch/StructuralDiff.hpp"

namespace DiffToPatch {

ValueKind kind_of(const Json &value) {
	switch(value.type()) {
		case Json::value_t::null:
		case Json::value_t::discarded:
			return ValueKind::Null;
		case Json::value_t::boolean:
			return ValueKind::Boolean;
		case Json::value_t::number_integer:
		case Json::value_t::number_unsigned:
		case Json::value_t::number_float:
			return ValueKind::Number;
		case Json::value_t::string:
			return ValueKind::String;
		case Json::value_t::array:
		case Json::value_t::binary:
			return ValueKind::Array;
		case Json::value_t::object:
			return ValueKind::Object;
	}
	return ValueKind::Null;
}

bool operator==(const PatchOperation &lhs, const PatchOperation &rhs) {
	if(lhs.value.has_value() != rhs.value.has_value()) {
		return false;
	}
	return lhs.op == rhs.op && lhs.path == rhs.path && (!lhs.value || *lhs.value == *rhs.value);
}

std::string_view op_name(PatchOpCode op) {
	switch(op) {
		case PatchOpCode::Add:
			return "add";
		case PatchOpCode::Remove:
			return "remove";
		case PatchOpCode::Replace:
			return "replace";
	}
	return "";
}

std::ostream &operator<<(std::ostream &s, const PatchOperation &op) {
	s << op_name(op.op) << " \"" << op.path << "\"";
	if(op.value) {
		s << " " << op.value->dump();
	}
	return s;
}

std::string escape_pointer_token(std::string_view token) {
	std::string res;
	res.reserve(token.size());
	for(auto c: token) {
		switch(c) {
			case '~': {
				res += "~0";
			} break;
			case '/': {
				res += "~1";
			} break;
			default: {
				res += c;
			} break;
		}
	}
	return res;
}

std::string join_pointer(std::string_view parent, std::string_view token) {
	std::string res {parent};
	res += '/';
	res += escape_pointer_token(token);
	return res;
}

void PatchGenerator::diff_value(const Json &before, const Json &after, const std::string &path) {
	auto kind = kind_of(before);
	if(kind != kind_of(after)) {
		this->ops.emplace_back(PatchOperation {PatchOpCode::Replace, path, after});
		return;
	}

	switch(kind) {
		case ValueKind::Object: {
			this->diff_object(before, after, path);
		} break;
		case ValueKind::Array: {
			this->diff_array(before, after, path);
		} break;
		default: {
			if(before != after) {
				this->ops.emplace_back(PatchOperation {PatchOpCode::Replace, path, after});
			}
		} break;
	}
}

void PatchGenerator::diff_object(const Json &before, const Json &after, const std::string &path) {
	for(auto it = before.begin(); it != before.end(); ++it) {
		if(!after.contains(it.key())) {
			this->ops.emplace_back(PatchOperation {PatchOpCode::Remove, join_pointer(path, it.key()), std::nullopt});
		}
	}

	for(auto it = after.begin(); it != after.end(); ++it) {
		auto child = join_pointer(path, it.key());
		auto old = before.find(it.key());
		if(old == before.end()) {
			this->ops.emplace_back(PatchOperation {PatchOpCode::Add, std::move(child), it.value()});
		} else if(*old != it.value()) {
			this->diff_value(*old, it.value(), child);
		}
	}
}

void PatchGenerator::diff_array(const Json &before, const Json &after, const std::string &path) {
	auto common = std::min(before.size(), after.size());
	for(size_t i = 0; i < common; ++i) {
		if(before[i] != after[i]) {
			this->diff_value(before[i], after[i], join_pointer(path, std::to_string(i)));
		}
	}

	// highest index first, so that pending removals keep their indices
	for(auto i = before.size(); i > after.size(); --i) {
		this->ops.emplace_back(PatchOperation {PatchOpCode::Remove, join_pointer(path, std::to_string(i - 1)), std::nullopt});
	}

	for(auto i = before.size(); i < after.size(); ++i) {
		this->ops.emplace_back(PatchOperation {PatchOpCode::Add, join_pointer(path, std::to_string(i)), after[i]});
	}
}

std::vector<PatchOperation> diff(const Json &before, const Json &after) {
	PatchGenerator generator;
	generator.diff_value(before, after, "");
	return std::move(generator.ops);
}

}// namespace DiffToPatch
