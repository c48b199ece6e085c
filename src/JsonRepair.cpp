#include <algorithm>
#include <cstring>
#include <iostream>
#include <optional>

#include "DiffToPatch/JsonRepair.hpp"

namespace DiffToPatch {

JsonRepairer::~JsonRepairer() = default;

std::ostream &operator<<(std::ostream &s, const RepairError &err) {
	switch(err.code) {
		case RepairErrorCode::OK: {
			return s << "OK" << std::endl;
		} break;
		case RepairErrorCode::NoJsonFound: {
			return s << "No JSON value found (offset " << err.offset << ")" << std::endl;
		} break;
		case RepairErrorCode::TooDeep: {
			return s << "Nesting too deep at offset " << err.offset << std::endl;
		} break;
	}
	return s;
}

namespace {

constexpr std::string_view left_double_quote = "\xE2\x80\x9C";
constexpr std::string_view right_double_quote = "\xE2\x80\x9D";
constexpr std::string_view left_single_quote = "\xE2\x80\x98";
constexpr std::string_view right_single_quote = "\xE2\x80\x99";

constexpr bool is_blank(char c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

constexpr bool is_digit(char c) {
	return c >= '0' && c <= '9';
}

constexpr bool is_word_char(char c) {
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || is_digit(c) || c == '_' || c == '$' || static_cast<unsigned char>(c) >= 0x80;
}

int hex_value(char c) {
	if(c >= '0' && c <= '9') {
		return c - '0';
	}
	if(c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	}
	if(c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}
	return -1;
}

void append_utf8(std::string &out, uint32_t cp) {
	if(cp < 0x80) {
		out += static_cast<char>(cp);
	} else if(cp < 0x800) {
		out += static_cast<char>(0xC0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else if(cp < 0x10000) {
		out += static_cast<char>(0xE0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else {
		out += static_cast<char>(0xF0 | (cp >> 18));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
}

struct LenientReader {
	std::string_view buf;
	size_t pos = 0;
	size_t depth = 0;
	size_t max_depth = 512;
	RepairError error {RepairErrorCode::OK, 0};

	bool at_end() const {
		return this->pos >= this->buf.size();
	}

	char peek() const {
		return this->at_end() ? '\0' : this->buf[this->pos];
	}

	bool looking_at(std::string_view s) const {
		return this->buf.substr(std::min(this->pos, this->buf.size())).starts_with(s);
	}

	/// Whitespace, comments and markdown code fences
	void skip_blanks() {
		while(!this->at_end()) {
			if(is_blank(this->peek())) {
				this->pos += 1;
			} else if(this->looking_at("//") || this->looking_at("```")) {
				auto n = this->buf.find('\n', this->pos);
				this->pos = n == std::string_view::npos ? this->buf.size() : n + 1;
			} else if(this->looking_at("/*")) {
				auto n = this->buf.find("*/", this->pos + 2);
				this->pos = n == std::string_view::npos ? this->buf.size() : n + 2;
			} else {
				break;
			}
		}
	}

	/// Next character that is not whitespace, starting at `from`
	char peek_past_blanks(size_t from) const {
		while(from < this->buf.size() && is_blank(this->buf[from])) {
			++from;
		}
		return from < this->buf.size() ? this->buf[from] : '\0';
	}

	bool enter() {
		this->depth += 1;
		if(this->depth > this->max_depth) {
			this->error = {RepairErrorCode::TooDeep, this->pos};
			return false;
		}
		return true;
	}

	std::optional<Json> read_value() {
		this->skip_blanks();
		if(this->at_end()) {
			return {};
		}
		auto c = this->peek();
		if(c == '{') {
			return this->read_object();
		} else if(c == '[') {
			return this->read_array();
		} else if(c == '"' || c == '\'' || this->looking_at(left_double_quote) || this->looking_at(left_single_quote)) {
			return Json(this->read_string());
		} else if(is_digit(c) || c == '-' || c == '+' || c == '.') {
			return this->read_number();
		} else if(is_word_char(c)) {
			return this->read_word();
		}
		return {};
	}

	Json read_object() {
		// we know that we are on '{'
		this->pos += 1;
		auto obj = Json::object();
		if(!this->enter()) {
			return obj;
		}

		while(true) {
			this->skip_blanks();
			if(this->at_end()) {
				break;
			}
			auto c = this->peek();
			if(c == '}') {
				this->pos += 1;
				break;
			}
			if(c == ']') {
				// mismatched closer, it belongs to an enclosing array
				break;
			}
			if(c == ',') {
				this->pos += 1;
				continue;
			}

			auto key = this->read_key();
			if(!key) {
				this->pos += 1;
				continue;
			}
			this->skip_blanks();
			if(this->peek() == ':') {
				this->pos += 1;
			}
			auto value = this->read_value();
			if(this->error) {
				return obj;
			}
			obj[*key] = value ? std::move(*value) : Json(nullptr);

			this->skip_blanks();
			if(this->peek() == ',') {
				this->pos += 1;
			}
		}
		this->depth -= 1;
		return obj;
	}

	Json read_array() {
		// we know that we are on '['
		this->pos += 1;
		auto arr = Json::array();
		if(!this->enter()) {
			return arr;
		}

		while(true) {
			this->skip_blanks();
			if(this->at_end()) {
				break;
			}
			auto c = this->peek();
			if(c == ']') {
				this->pos += 1;
				break;
			}
			if(c == '}') {
				// mismatched closer, it belongs to an enclosing object
				break;
			}
			if(c == ',') {
				this->pos += 1;
				continue;
			}

			auto value = this->read_value();
			if(this->error) {
				return arr;
			}
			if(!value) {
				this->pos += 1;
				continue;
			}
			arr.push_back(std::move(*value));

			this->skip_blanks();
			if(this->peek() == ',') {
				this->pos += 1;
			}
		}
		this->depth -= 1;
		return arr;
	}

	std::optional<std::string> read_key() {
		auto c = this->peek();
		if(c == '"' || c == '\'' || this->looking_at(left_double_quote) || this->looking_at(left_single_quote)) {
			return this->read_string(true);
		}
		if(!is_word_char(c)) {
			return {};
		}
		auto start = this->pos;
		while(!this->at_end() && (is_word_char(this->peek()) || this->peek() == '-')) {
			this->pos += 1;
		}
		return std::string(this->buf.substr(start, this->pos - start));
	}

	/// Does the quote at `at` end the string, or is it a quote the model forgot to escape?
	bool closes_string(size_t at) const {
		auto next = this->peek_past_blanks(at + 1);
		return next == '\0' || next == ',' || next == ':' || next == '}' || next == ']' || next == '"';
	}

	bool read_escape(std::string &out) {
		// we know that we are on '\\'
		if(this->pos + 1 >= this->buf.size()) {
			this->pos += 1;
			return false;
		}
		auto e = this->buf[this->pos + 1];
		switch(e) {
			case 'b': {
				out += '\b';
			} break;
			case 'f': {
				out += '\f';
			} break;
			case 'n': {
				out += '\n';
			} break;
			case 'r': {
				out += '\r';
			} break;
			case 't': {
				out += '\t';
			} break;
			case 'u': {
				auto cp = this->read_hex4(this->pos + 2);
				if(!cp) {
					out += 'u';
					break;
				}
				this->pos += 6;
				if(*cp >= 0xD800 && *cp <= 0xDBFF && this->looking_at("\\u")) {
					auto low = this->read_hex4(this->pos + 2);
					if(low && *low >= 0xDC00 && *low <= 0xDFFF) {
						this->pos += 6;
						append_utf8(out, 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00));
						return true;
					}
				}
				if(*cp >= 0xD800 && *cp <= 0xDFFF) {
					append_utf8(out, 0xFFFD);
				} else {
					append_utf8(out, *cp);
				}
				return true;
			}
			default: {
				// \" \\ \/ and escapes JSON does not know
				out += e;
			} break;
		}
		this->pos += 2;
		return true;
	}

	std::optional<uint32_t> read_hex4(size_t at) const {
		if(at + 4 > this->buf.size()) {
			return {};
		}
		uint32_t res = 0;
		for(size_t i = at; i < at + 4; ++i) {
			auto v = hex_value(this->buf[i]);
			if(v < 0) {
				return {};
			}
			res = res * 16 + static_cast<uint32_t>(v);
		}
		return res;
	}

	/// Inside a key any matching quote ends the string
	std::string read_string(bool key = false) {
		std::string out;
		bool smart = false;
		char quote = '"';
		if(this->looking_at(left_double_quote) || this->looking_at(left_single_quote)) {
			smart = true;
			this->pos += 3;
		} else {
			quote = this->peek();
			this->pos += 1;
		}

		while(!this->at_end()) {
			auto c = this->peek();
			if(c == '\\') {
				if(!this->read_escape(out)) {
					break;
				}
				continue;
			}
			if(smart) {
				if(this->looking_at(right_double_quote) || this->looking_at(left_double_quote) || this->looking_at(right_single_quote) || this->looking_at(left_single_quote)) {
					this->pos += 3;
					return out;
				}
			} else if(c == quote) {
				if(key || this->closes_string(this->pos)) {
					this->pos += 1;
					return out;
				}
				out += c;
				this->pos += 1;
				continue;
			}
			if(c == '\n') {
				// a string left open at the end of a line is followed by the next member
				auto next = this->peek_past_blanks(this->pos + 1);
				if(next == '"' || next == '}' || next == ']') {
					if(!out.empty() && out.back() == ',') {
						out.pop_back();
					}
					return out;
				}
			}
			out += c;
			this->pos += 1;
		}
		return out;
	}

	Json read_number() {
		auto start = this->pos;
		while(!this->at_end() && (is_digit(this->peek()) || std::strchr("+-.eE", this->peek()) != nullptr)) {
			this->pos += 1;
		}
		auto raw = std::string(this->buf.substr(start, this->pos - start));
		auto token = raw;

		bool negative = false;
		if(!token.empty() && (token[0] == '+' || token[0] == '-')) {
			negative = token[0] == '-';
			token.erase(0, 1);
		}
		while(token.size() > 1 && token[0] == '0' && is_digit(token[1])) {
			token.erase(0, 1);
		}
		if(!token.empty() && token[0] == '.') {
			token.insert(0, "0");
		}
		while(!token.empty() && std::strchr("+-.eE", token.back()) != nullptr) {
			token.pop_back();
		}
		if(negative) {
			token.insert(0, "-");
		}

		auto value = Json::parse(token, nullptr, false);
		if(!value.is_discarded() && value.is_number()) {
			return value;
		}
		return Json(raw);
	}

	Json read_word() {
		auto start = this->pos;
		while(!this->at_end() && is_word_char(this->peek())) {
			this->pos += 1;
		}
		auto word = this->buf.substr(start, this->pos - start);
		if(word == "true" || word == "True") {
			return true;
		} else if(word == "false" || word == "False") {
			return false;
		} else if(word == "null" || word == "None" || word == "undefined" || word == "NaN" || word == "Infinity") {
			return nullptr;
		}

		// an unquoted string runs up to the next delimiter
		auto end = this->buf.find_first_of(",}]\n", start);
		if(end == std::string_view::npos) {
			end = this->buf.size();
		}
		this->pos = end;
		auto text = this->buf.substr(start, end - start);
		while(!text.empty() && is_blank(text.back())) {
			text.remove_suffix(1);
		}
		return Json(std::string(text));
	}
};

};// namespace

RepairResult<Json> LenientJsonRepairer::read(std::string_view text) const {
	LenientReader r {
		.buf = text,
		.max_depth = this->max_depth,
	};
	r.skip_blanks();

	// prose in front of the document
	auto c = r.peek();
	bool starts_value = c == '{' || c == '[' || c == '"' || c == '\'' || c == '-' || is_digit(c) || r.looking_at(left_double_quote);
	if(!r.at_end() && !starts_value) {
		auto first = text.find_first_of("{[", r.pos);
		if(first != std::string_view::npos) {
			r.pos = first;
		}
	}

	auto value = r.read_value();
	if(r.error) {
		return unexpected<RepairError>(r.error);
	}
	if(!value) {
		return unexpected<RepairError>(RepairError {RepairErrorCode::NoJsonFound, r.pos});
	}
	return std::move(*value);
}

RepairResult<std::string> LenientJsonRepairer::repair(std::string_view text, const RepairOptions &options) const {
	auto value_some = this->read(text);
	if(!value_some) {
		return unexpected<RepairError>(value_some.error());
	}
	return value_some->dump(options.indent, ' ', options.ascii_only, Json::error_handler_t::replace);
}

}// namespace DiffToPatch
