#include <iostream>
#include <limits>

#include <magic_enum.hpp>
#include <range/v3/all.hpp>

#include "DiffToPatch/UnifiedDiff.hpp"

namespace DiffToPatch {

using namespace ScannerUtils;

bool operator==(const DiffLine &lhs, const DiffLine &rhs) {
	return lhs.kind == rhs.kind && lhs.content == rhs.content;
}

bool operator==(const HunkRange &lhs, const HunkRange &rhs) {
	return lhs.old_start == rhs.old_start && lhs.old_count == rhs.old_count && lhs.new_start == rhs.new_start && lhs.new_count == rhs.new_count;
}

bool operator==(const UnifiedDiffHunk &lhs, const UnifiedDiffHunk &rhs) {
	return lhs.range() == rhs.range() && lhs.lines == rhs.lines;
}

std::ostream &operator<<(std::ostream &s, LineKind kind) {
	return s << magic_enum::enum_name(kind);
}

std::ostream &operator<<(std::ostream &s, const DiffLine &line) {
	switch(line.kind) {
		case LineKind::Addition: {
			s << '+';
		} break;
		case LineKind::Deletion: {
			s << '-';
		} break;
		case LineKind::Context: {
			s << ' ';
		} break;
	}
	return s << line.content;
}

std::ostream &operator<<(std::ostream &s, const UnifiedDiffHunk &hunk) {
	s << "@@ -" << hunk.old_start << "," << hunk.old_count << " +" << hunk.new_start << "," << hunk.new_count << " @@" << std::endl;
	for(auto &line: hunk.lines) {
		s << line << std::endl;
	}
	return s;
}

std::ostream &operator<<(std::ostream &s, const ReaderError &err) {
	switch(err.code) {
		case ReaderErrorCode::OK: {
			return s << "OK" << std::endl;
		} break;
		case ReaderErrorCode::InvalidHunkHeader: {
			return s << "Invalid hunk header at line " << err.line << std::endl;
		} break;
	}
	return s;
}

std::ostream &operator<<(std::ostream &s, const LineReader &line) {
	return s << "buffer: " << line.buf;
}

constexpr bool is_digit(char c) {
	return c >= '0' && c <= '9';
};

constexpr uint64_t decimal_reducer(uint64_t r, char c) {
	return r * 10 + static_cast<uint64_t>(c - '0');
};

std::vector<std::string_view> UnifiedDiffHunk::old_block() const {
	return this->lines | ranges::views::filter([](const DiffLine &l) {
		return l.kind != LineKind::Addition;
	}) | ranges::views::transform([](const DiffLine &l) {
		return std::string_view(l.content);
	}) | ranges::to<std::vector<std::string_view>>();
}

std::vector<std::string_view> UnifiedDiffHunk::new_block() const {
	return this->lines | ranges::views::filter([](const DiffLine &l) {
		return l.kind != LineKind::Deletion;
	}) | ranges::views::transform([](const DiffLine &l) {
		return std::string_view(l.content);
	}) | ranges::to<std::vector<std::string_view>>();
}

HunkRange UnifiedDiffHunk::range() const {
	return {this->old_start, this->old_count, this->new_start, this->new_count};
}

bool LineReader::is_hunk_header() const {
	return this->buf.starts_with("@@");
}

bool LineReader::is_triple_minus() const {
	return this->buf.starts_with("---");
}

bool LineReader::is_triple_plus() const {
	return this->buf.starts_with("+++");
}

bool LineReader::is_fence() const {
	return this->buf.starts_with("```");
}

bool LineReader::is_no_newline_marker() const {
	return this->buf.starts_with("\\ ");
}

bool LineReader::is_marked() const {
	if(this->buf.empty()) {
		return false;
	}
	auto c = this->buf[0];
	return c == '+' || c == '-' || c == ' ';
}

size_t LineReader::get_line() const {
	return this->line;
}

LineKind LineReader::get_kind() const {
	if(this->buf.starts_with('+')) {
		return LineKind::Addition;
	} else if(this->buf.starts_with('-')) {
		return LineKind::Deletion;
	} else {
		return LineKind::Context;
	}
}

std::string_view LineReader::get_content() const {
	if(this->is_marked()) {
		return this->buf.substr(1);
	}
	return this->buf;
}

ReaderResult<HunkRange> LineReader::parse_numbers() const {
	// we know that line is beginning with "@@"
	// "@@ -a[,b] +c[,d] @@", anything after the closing "@@" is a section name
	const char *iter = this->buf.data() + 2;
	const char *bound = this->buf.data() + this->buf.size();
	auto invalid = unexpected<ReaderError>(ReaderError {ReaderErrorCode::InvalidHunkHeader, this->get_line()});

	auto skip_spaces = [&]() {
		while(iter != bound && *iter == ' ') {
			++iter;
		}
	};

	auto parse_side = [&](char marker, uint32_t &start, uint32_t &count) {
		skip_spaces();
		if(iter == bound || *iter != marker) {
			return false;
		}
		++iter;
		if(iter == bound || !is_digit(*iter)) {
			return false;
		}
		auto start_some = parse_u32(iter, bound);
		if(!start_some) {
			return false;
		}
		start = *start_some;
		count = 1;
		if(iter != bound && *iter == ',') {
			++iter;
			if(iter == bound || !is_digit(*iter)) {
				return false;
			}
			auto count_some = parse_u32(iter, bound);
			if(!count_some) {
				return false;
			}
			count = *count_some;
		}
		return true;
	};

	HunkRange range;
	if(!parse_side('-', range.old_start, range.old_count)) {
		return invalid;
	}
	if(!parse_side('+', range.new_start, range.new_count)) {
		return invalid;
	}
	skip_spaces();
	if(!std::string_view(iter, static_cast<size_t>(bound - iter)).starts_with("@@")) {
		return invalid;
	}
	return range;
}

/// Prepares the object to parsing of new diff
void DiffReader::reset() {
	this->pos = 0;
	this->line = 1;
	this->last = {};
}

/// Read the hunks from the given buffer
ParsedDiff DiffReader::by_buf(std::string_view buf) {
	reset();
	this->buf = buf;
	return parse();
}

size_t DiffReader::get_line() const {
	return line;
}

ParsedDiff DiffReader::parse() {
	ParsedDiff hunks;
	for(auto some_line = this->next(hunk_at); some_line; some_line = this->next(hunk_at)) {
		auto header = *some_line;
		auto range_some = header.parse_numbers();
		if(!range_some) {
			// the body cannot be anchored, skip to the next header
			if(tracing) {
				*tracing << range_some.error();
			}
			continue;
		}

		if(tracing) {
			*tracing << "Hunk " << header << std::endl;
		}
		this->parse_hunk(*range_some, hunks);
	}

	if(tracing) {
		*tracing << "Parsed " << hunks.size() << " hunk(s)" << std::endl;
	}
	return hunks;
}

void DiffReader::parse_hunk(HunkRange declared, ParsedDiff &hunks) {
	UnifiedDiffHunk hunk {
		.old_start = declared.old_start,
		.new_start = declared.new_start,
	};
	std::vector<bool> unmarked;

	for(auto line_some = this->next(any); line_some; line_some = this->next(any)) {
		auto line = *line_some;
		if(line.is_hunk_header()) {
			this->set_last(line);
			break;
		}
		if(line.is_fence()) {
			// the closing fence ends the diff, whatever the header says
			if(tracing) {
				*tracing << "Closing fence at line " << line.get_line() << std::endl;
			}
			break;
		}
		if(line.is_no_newline_marker()) {
			continue;
		}
		if(line.is_triple_minus()) {
			// "---" followed by "+++" names the files, it is not a deletion
			auto following = this->next(any);
			if(following && following->is_triple_plus()) {
				if(tracing) {
					*tracing << "Skipping file header at line " << line.get_line() << std::endl;
				}
				continue;
			}
			if(following) {
				this->set_last(*following);
			}
		}
		hunk.lines.emplace_back(DiffLine {line.get_kind(), std::string(line.get_content())});
		unmarked.push_back(!line.is_marked());
	}

	uint32_t old_count = 0, new_count = 0;
	for(auto &l: hunk.lines) {
		if(l.kind != LineKind::Addition) {
			old_count += 1;
		}
		if(l.kind != LineKind::Deletion) {
			new_count += 1;
		}
	}

	// blank lines and prose after the last marked line, as long as the body overflows the header
	while(!hunk.lines.empty() && unmarked.back() && (old_count > declared.old_count || new_count > declared.new_count)) {
		if(tracing) {
			*tracing << "Dropping trailing line: " << hunk.lines.back().content << std::endl;
		}
		hunk.lines.pop_back();
		unmarked.pop_back();
		old_count -= 1;
		new_count -= 1;
	}

	if(old_count != declared.old_count || new_count != declared.new_count) {
		if(tracing) {
			*tracing << "Hunk at -" << declared.old_start << " declares " << declared.old_count << "/" << declared.new_count << " lines, body has " << old_count << "/" << new_count << std::endl;
		}
	}
	hunk.old_count = old_count;
	hunk.new_count = new_count;
	hunks.emplace_back(std::move(hunk));
}

void DiffReader::set_last(LineReader line) {
	this->last = std::optional<LineReader> {line};
}

std::optional<LineReader> DiffReader::next(NextFilterF filter) {
	std::optional<LineReader> l = {};
	std::swap(l, this->last);
	if(l && filter(*l)) {
		return l;
	}

	while(this->pos < this->buf.size()) {
		auto rest = this->buf.substr(this->pos);
		auto n = rest.find('\n');
		auto content = rest.substr(0, n);
		auto consumed = n == std::string_view::npos ? rest.size() : n + 1;
		if(!content.empty() && content.back() == '\r') {
			content.remove_suffix(1);
		}

		auto line = LineReader {
			.buf = content,
			.line = this->line,
		};
		this->pos += consumed;
		this->line += 1;
		if(filter(line)) {
			return {line};
		}
	}
	return {};
}

ParsedDiff parse_unified_diff(std::string_view raw) {
	DiffReader r;
	return r.by_buf(raw);
}

namespace ScannerUtils {
std::optional<uint32_t> parse_u32(const char *&iter, const char *bound) {
	uint64_t res = 0;
	bool overflow = false;
	for(; iter != bound; ++iter) {
		auto el = *iter;
		if(!is_digit(el)) {
			break;
		}
		if(!overflow) {
			res = decimal_reducer(res, el);
			overflow = res > std::numeric_limits<uint32_t>::max();
		}
	}
	if(overflow) {
		return {};
	}
	return static_cast<uint32_t>(res);
}

bool any([[maybe_unused]] const LineReader &_) {
	return true;
}

bool hunk_at(const LineReader &line) {
	return line.is_hunk_header();
}
};// namespace ScannerUtils

}// namespace DiffToPatch
