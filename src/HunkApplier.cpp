#include <algorithm>
#include <iostream>
#include <iterator>
#include <numeric>

#include "DiffToPatch/HunkApplier.hpp"

namespace DiffToPatch {

bool operator==(const HunkOutcome &lhs, const HunkOutcome &rhs) {
	return lhs.hunk == rhs.hunk && lhs.applied == rhs.applied && lhs.fuzzy == rhs.fuzzy && lhs.position == rhs.position && lhs.drift == rhs.drift;
}

std::ostream &operator<<(std::ostream &s, const HunkOutcome &outcome) {
	s << "Hunk " << outcome.hunk;
	if(!outcome.applied) {
		return s << ": context not found, skipped";
	}
	s << ": applied at line " << outcome.position + 1 << " (drift " << outcome.drift << ")";
	if(outcome.fuzzy) {
		s << " ignoring whitespace";
	}
	return s;
}

static std::string_view trim(std::string_view s) {
	constexpr std::string_view spaces = " \t\r\f\v";
	auto first = s.find_first_not_of(spaces);
	if(first == std::string_view::npos) {
		return {};
	}
	auto last = s.find_last_not_of(spaces);
	return s.substr(first, last - first + 1);
}

TextLines TextLines::split(std::string_view text) {
	TextLines res;
	size_t start = 0;
	while(start < text.size()) {
		auto n = text.find('\n', start);
		if(n == std::string_view::npos) {
			res.lines.emplace_back(text.substr(start));
			res.endings.push_back(LineEnding::None);
			break;
		}
		auto line = text.substr(start, n - start);
		auto ending = LineEnding::LF;
		if(line.ends_with('\r')) {
			line.remove_suffix(1);
			ending = LineEnding::CRLF;
		}
		res.lines.emplace_back(line);
		res.endings.push_back(ending);
		start = n + 1;
	}
	return res;
}

bool TextLines::trailing_terminator() const {
	return !this->endings.empty() && this->endings.back() != LineEnding::None;
}

void TextLines::fill_endings(bool trailing) {
	auto n = this->endings.size();
	for(size_t i = 0; i < n; ++i) {
		if(i + 1 == n && !trailing) {
			this->endings[i] = LineEnding::None;
			break;
		}
		if(this->endings[i] != LineEnding::None) {
			continue;
		}
		if(i) {
			this->endings[i] = this->endings[i - 1];
			continue;
		}
		auto found = std::find_if(begin(this->endings) + 1, end(this->endings), [](LineEnding e) {
			return e != LineEnding::None;
		});
		this->endings[i] = found != end(this->endings) ? *found : LineEnding::LF;
	}
}

std::string TextLines::join() const {
	std::string res;
	for(size_t i = 0; i < this->lines.size(); ++i) {
		res += this->lines[i];
		switch(this->endings[i]) {
			case LineEnding::None: {
			} break;
			case LineEnding::LF: {
				res += '\n';
			} break;
			case LineEnding::CRLF: {
				res += "\r\n";
			} break;
		}
	}
	return res;
}

size_t ApplyResult::applied_count() const {
	return static_cast<size_t>(std::count_if(begin(this->outcomes), end(this->outcomes), [](const HunkOutcome &o) {
		return o.applied;
	}));
}

std::optional<size_t> HunkApplier::locate(const std::vector<std::string> &lines, const std::vector<std::string_view> &block, size_t cursor, size_t expected, bool loose) const {
	auto n = lines.size();
	auto m = block.size();
	if(m > n || cursor > n - m) {
		return {};
	}
	auto last = n - m;

	auto matches_at = [&](size_t p) {
		for(size_t i = 0; i < m; ++i) {
			std::string_view have = lines[p + i];
			if(loose ? trim(have) != trim(block[i]) : have != block[i]) {
				return false;
			}
		}
		return true;
	};
	auto candidate = [&](size_t p) {
		return p >= cursor && p <= last && matches_at(p);
	};

	if(candidate(expected)) {
		return expected;
	}
	// closest to the declared position wins, forward on ties
	for(size_t d = 1; d <= this->options.search_window; ++d) {
		bool forward_done = expected + d > last;
		bool backward_done = expected < cursor + d;
		if(forward_done && backward_done) {
			break;
		}
		if(!forward_done && candidate(expected + d)) {
			return expected + d;
		}
		if(!backward_done && candidate(expected - d)) {
			return expected - d;
		}
	}
	return {};
}

ApplyResult HunkApplier::apply(std::string_view original, const ParsedDiff &hunks) const {
	ApplyResult result;
	if(hunks.empty()) {
		result.text = std::string(original);
		return result;
	}

	auto text = TextLines::split(original);
	auto trailing = text.trailing_terminator();

	std::vector<size_t> order(hunks.size());
	std::iota(begin(order), end(order), size_t {0});
	std::stable_sort(begin(order), end(order), [&](size_t a, size_t b) {
		return hunks[a].old_start < hunks[b].old_start;
	});

	size_t cursor = 0;
	int64_t size_delta = 0;

	for(auto index: order) {
		auto &hunk = hunks[index];
		auto old_block = hunk.old_block();
		HunkOutcome outcome {.hunk = index};

		int64_t declared = static_cast<int64_t>(hunk.old_start);
		if(!old_block.empty() && declared > 0) {
			// a pure insertion goes after line old_start, anything else starts on it
			declared -= 1;
		}
		declared += size_delta;
		auto expected = declared < static_cast<int64_t>(cursor) ? cursor : static_cast<size_t>(declared);

		std::optional<size_t> anchor;
		if(old_block.empty()) {
			anchor = std::min(expected, text.lines.size());
		} else {
			anchor = this->locate(text.lines, old_block, cursor, expected, false);
			if(!anchor && this->options.ignore_whitespace) {
				anchor = this->locate(text.lines, old_block, cursor, expected, true);
				outcome.fuzzy = anchor.has_value();
			}
		}

		if(!anchor) {
			result.skipped.push_back(index);
			result.outcomes.push_back(outcome);
			if(tracing) {
				*tracing << outcome << std::endl;
			}
			continue;
		}

		std::vector<std::string> replacement;
		std::vector<LineEnding> replacement_endings;
		replacement.reserve(hunk.lines.size());
		replacement_endings.reserve(hunk.lines.size());
		auto source = *anchor;
		auto deleted_ending = LineEnding::None;
		for(auto &line: hunk.lines) {
			switch(line.kind) {
				case LineKind::Context: {
					// keep the original's spelling of the line
					replacement.push_back(text.lines[source]);
					replacement_endings.push_back(text.endings[source]);
					deleted_ending = LineEnding::None;
					source += 1;
				} break;
				case LineKind::Deletion: {
					deleted_ending = text.endings[source];
					source += 1;
				} break;
				case LineKind::Addition: {
					// a rewritten line keeps the terminator of the one it replaces, fill_endings does the rest
					replacement.push_back(line.content);
					replacement_endings.push_back(deleted_ending);
				} break;
			}
		}

		auto at = static_cast<std::ptrdiff_t>(*anchor);
		auto removed = static_cast<std::ptrdiff_t>(old_block.size());
		text.lines.erase(begin(text.lines) + at, begin(text.lines) + at + removed);
		text.lines.insert(begin(text.lines) + at, std::make_move_iterator(begin(replacement)), std::make_move_iterator(end(replacement)));
		text.endings.erase(begin(text.endings) + at, begin(text.endings) + at + removed);
		text.endings.insert(begin(text.endings) + at, begin(replacement_endings), end(replacement_endings));
		text.fill_endings(trailing);

		outcome.applied = true;
		outcome.position = *anchor;
		outcome.drift = static_cast<int64_t>(*anchor) - declared;
		size_delta += static_cast<int64_t>(replacement.size()) - static_cast<int64_t>(old_block.size());
		cursor = *anchor + replacement.size();

		result.outcomes.push_back(outcome);
		if(tracing) {
			*tracing << outcome << std::endl;
		}
	}

	if(result.applied_count()) {
		result.text = text.join();
	} else {
		result.text = std::string(original);
	}
	return result;
}

std::string apply_hunks(std::string_view original, const ParsedDiff &hunks) {
	HunkApplier applier;
	return applier.apply(original, hunks).text;
}

}// namespace DiffToPatch
