#include <algorithm>
#include <iostream>
#include <limits>
#include <type_traits>

#include "ParseGitDiff.hpp"

#if __has_include(<magic_enum.hpp>)
#include <magic_enum.hpp>
#else
#warning "magic_enum is unavailable. The built variant of the lib will output error codes as numbers instead of fancy string names. You can get magic_enum by the link: https://github.com/Neargye/magic_enum"
#endif

namespace ParseGitDiff {

constexpr std::string_view kDiffMarker = "diff --git";
constexpr std::string_view kHunkMarker = "@@";

template<typename IntT, typename = std::enable_if_t<std::is_integral<IntT>::value>>
constexpr IntT decimal_reducer(IntT r, char c) {
	return r * 10 + static_cast<IntT>(c - '0');
};

constexpr bool is_digit(char c) {
	return c >= '0' && c <= '9';
};

constexpr bool is_lower(char c) {
	return c >= 'a' && c <= 'z';
};

constexpr uint32_t octal_reducer(uint32_t r, char c) {
	return r * 8 + static_cast<uint32_t>(c - '0');
};

constexpr bool is_octal_digit(char c) {
	return c >= '0' && c <= '7';
}

/// Reads at least one decimal digit. Returns an empty optional when there is none or the value doesn't fit 32 bits.
constexpr std::optional<uint32_t> parse_decimal_number(const char *&iter, const char *bound) {
	if(iter == bound || !is_digit(*iter)) {
		return {};
	}
	uint64_t res = 0;
	for(; iter != bound; ++iter) {
		auto el = *iter;
		if(!is_digit(el))
			break;

		res = decimal_reducer(res, el);
		if(res > std::numeric_limits<uint32_t>::max()) {
			return {};
		}
	}
	return static_cast<uint32_t>(res);
}

/// Consumes `lit` if the input continues with it
constexpr bool eat(const char *&iter, const char *bound, std::string_view lit) {
	if(static_cast<size_t>(bound - iter) < lit.size()) {
		return false;
	}
	if(std::string_view(iter, lit.size()) != lit) {
		return false;
	}
	iter += lit.size();
	return true;
}

bool operator==(const FileMode &lhs, const FileMode &rhs) {
	return lhs.old == rhs.old && lhs.neo == rhs.neo;
}

bool operator==(const Line &lhs, const Line &rhs) {
	return lhs.type == rhs.type && lhs.content == rhs.content && lhs.old_number == rhs.old_number && lhs.new_number == rhs.new_number;
}

Line Line::context(std::string content, uint32_t old_number, uint32_t new_number) {
	return Line {.type = LineType::Context, .content = std::move(content), .old_number = old_number, .new_number = new_number};
}

Line Line::added(std::string content, uint32_t new_number) {
	return Line {.type = LineType::Added, .content = std::move(content), .old_number = {}, .new_number = new_number};
}

Line Line::deleted(std::string content, uint32_t old_number) {
	return Line {.type = LineType::Deleted, .content = std::move(content), .old_number = old_number, .new_number = {}};
}

bool operator==(const HunkRange &lhs, const HunkRange &rhs) {
	return lhs.old_start == rhs.old_start && lhs.old_lines == rhs.old_lines && lhs.new_start == rhs.new_start && lhs.new_lines == rhs.new_lines;
}

uint32_t HunkRange::old_count() const {
	return this->old_lines.value_or(1);
}

uint32_t HunkRange::new_count() const {
	return this->new_lines.value_or(1);
}

void FileChange::tally() {
	this->additions = 0;
	this->deletions = 0;
	for(auto &hunk: this->hunks) {
		for(auto &line: hunk.lines) {
			switch(line.type) {
				case LineType::Added:
					++this->additions;
					break;
				case LineType::Deleted:
					++this->deletions;
					break;
				default:
					break;
			}
		}
	}
}

std::string_view to_string(FileStatus status) {
	switch(status) {
		case FileStatus::Added:
			return "added";
		case FileStatus::Deleted:
			return "deleted";
		case FileStatus::Modified:
			return "modified";
		case FileStatus::Renamed:
			return "renamed";
	}
	return "modified";
}

std::string_view to_string(LineType type) {
	switch(type) {
		case LineType::Context:
			return "context";
		case LineType::Added:
			return "added";
		case LineType::Deleted:
			return "deleted";
	}
	return "context";
}

std::ostream &operator<<(std::ostream &s, const DiffError &err) {
	switch(err.code) {
		case DiffErrorCode::OK: {
			return s << "OK";
		} break;
		case DiffErrorCode::InvalidHunkHeader: {
			return s << "Invalid hunk header at line " << err.line_or_str;
		} break;
		case DiffErrorCode::NoFilename: {
			return s << "Cannot get filenames at line " << err.line_or_str;
		} break;
		default:
			break;
	}
	s <<
#if defined(NEARGYE_MAGIC_ENUM_HPP)
	magic_enum::enum_name(err.code)
#else
	static_cast<uint16_t>(err.code)
#endif
	;
	if(!err.message.empty()) {
		s << ": " << err.message;
	}
	return s;
}

std::ostream &operator<<(std::ostream &s, const LineReader &line) {
	return s << line.line << ": " << line.buf;
}

std::ostream &operator<<(std::ostream &s, const Line &line) {
	s << to_string(line.type) << " (";
	if(line.old_number) {
		s << *line.old_number;
	} else {
		s << "-";
	}
	s << ", ";
	if(line.new_number) {
		s << *line.new_number;
	} else {
		s << "-";
	}
	return s << "): " << line.content;
}

std::ostream &operator<<(std::ostream &s, const FileChange &file) {
	s << "path: " << file.path << ", old_path: " << file.old_path << std::endl;
	s << "status: " << to_string(file.status) << ", binary: " << file.is_binary << ", +" << file.additions << " -" << file.deletions << std::endl;
	if(file.mode) {
		s << "old mode: 0" << std::oct << file.mode->old << ", new mode: 0" << file.mode->neo << std::dec << std::endl;
	}
	for(auto &hunk: file.hunks) {
		s << " " << hunk.header << std::endl;

		for(auto &line: hunk.lines) {
			s << " - " << line << std::endl;
		}
	}
	return s;
}

bool LineReader::is_empty() const {
	return this->buf.empty();
}

bool LineReader::is_diff() const {
	return this->buf.starts_with(kDiffMarker);
}

bool LineReader::is_hunk_header() const {
	return this->buf.starts_with(kHunkMarker);
}

bool LineReader::is_binary() const {
	return this->buf.starts_with("Binary files") || this->buf == "GIT binary patch";
}

bool LineReader::is_rename_from() const {
	return this->buf.starts_with("rename from");
}

bool LineReader::is_new_file() const {
	return this->buf.starts_with("new file");
}

bool LineReader::is_deleted_file() const {
	return this->buf.starts_with("deleted file");
}

bool LineReader::is_old_mode() const {
	return this->buf.starts_with("old mode ");
}

bool LineReader::is_new_mode() const {
	return this->buf.starts_with("new mode ");
}

size_t LineReader::get_line() const {
	return this->line;
}

Result<HunkRange> LineReader::parse_range() const {
	// @@ -<old_start>[,<old_lines>] +<new_start>[,<new_lines>] @@<section heading>
	auto iter = this->buf.data();
	auto bound = this->buf.data() + this->buf.size();
	auto invalid = unexpected<DiffError>({DiffErrorCode::InvalidHunkHeader, this->get_line()});

	if(!eat(iter, bound, "@@ -")) {
		return invalid;
	}

	HunkRange res;
	auto old_start = parse_decimal_number(iter, bound);
	if(!old_start) {
		return invalid;
	}
	res.old_start = *old_start;
	if(eat(iter, bound, ",")) {
		res.old_lines = parse_decimal_number(iter, bound);
		if(!res.old_lines) {
			return invalid;
		}
	}

	if(!eat(iter, bound, " +")) {
		return invalid;
	}
	auto new_start = parse_decimal_number(iter, bound);
	if(!new_start) {
		return invalid;
	}
	res.new_start = *new_start;
	if(eat(iter, bound, ",")) {
		res.new_lines = parse_decimal_number(iter, bound);
		if(!res.new_lines) {
			return invalid;
		}
	}

	if(!eat(iter, bound, " @@")) {
		return invalid;
	}
	return res;
}

uint32_t LineReader::parse_mode(const std::string_view start) const {
	// we know that line is beginning with `start`
	// the following number is an octal number with 6 digits (so max is
	// 8^6 - 1)
	auto buf = this->buf.substr(std::min(start.size(), this->buf.size()));
	uint32_t res = 0;
	for(auto c: buf) {
		if(!is_octal_digit(c)) {
			break;
		}
		res = octal_reducer(res, c);
	}
	return res;
}

Result<std::tuple<std::string_view, std::string_view>> LineReader::parse_files() const {
	// diff --git a/<old> b/<new>
	// Paths may contain spaces, so the split happens at the last " x/" that
	// leaves both sides non-empty.
	constexpr std::string_view prefix = "diff --git ";
	if(!this->buf.starts_with(prefix)) {
		return unexpected<DiffError>({DiffErrorCode::NoFilename, this->get_line()});
	}
	auto buf = this->buf.substr(prefix.size());
	if(buf.size() < 7 || !is_lower(buf[0]) || buf[1] != '/') {
		return unexpected<DiffError>({DiffErrorCode::NoFilename, this->get_line()});
	}

	for(size_t pos = buf.size() - 4; pos >= 3; --pos) {
		if(buf[pos] == ' ' && is_lower(buf[pos + 1]) && buf[pos + 2] == '/') {
			return {{buf.substr(2, pos - 2), buf.substr(pos + 3)}};
		}
	}
	return unexpected<DiffError>({DiffErrorCode::NoFilename, this->get_line()});
}

std::vector<std::string_view> split_lines(std::string_view buf) {
	std::vector<std::string_view> res;
	size_t start = 0;
	for(auto end = buf.find('\n'); end != std::string_view::npos; start = end + 1, end = buf.find('\n', start)) {
		res.emplace_back(buf.substr(start, end - start));
	}
	res.emplace_back(buf.substr(start));
	return res;
}

/// Prepares the object to parsing of a new diff
void DiffReader::reset() {
	this->lines.clear();
	this->current = 0;
	this->issues.clear();
}

/// Read a diff from the given buffer
std::vector<FileChange> DiffReader::by_buf(std::string_view buf) {
	reset();
	this->lines = split_lines(buf);
	return parse();
}

LineReader DiffReader::at(size_t idx) const {
	return {.buf = this->lines[idx], .line = idx + 1};
}

std::vector<FileChange> DiffReader::parse() {
	std::vector<FileChange> files;

	while(this->current < this->lines.size()) {
		if(this->at(this->current).is_diff()) {
			files.emplace_back(this->parse_file());
		} else {
			++this->current;
		}
	}

	return files;
}

FileChange DiffReader::parse_file() {
	FileChange file;

	auto diff_line = this->at(this->current);
	if(auto some_paths = diff_line.parse_files()) {
		auto [old, neo] = *some_paths;
		file.old_path = old;
		file.path = neo;
	} else {
		this->issues.emplace_back(some_paths.error());
		if(tracing) {
			*tracing << some_paths.error() << std::endl;
		}
	}

	if(tracing) {
		*tracing << "Diff " << diff_line << std::endl;
	}

	++this->current;

	while(this->current < this->lines.size()) {
		auto line = this->at(this->current);
		if(line.is_diff()) {
			break;
		}

		if(line.is_new_file()) {
			file.status = FileStatus::Added;
			if(line.buf.starts_with("new file mode ")) {
				file.mode = FileMode {.old = 0, .neo = line.parse_mode("new file mode ")};
			}
		} else if(line.is_deleted_file()) {
			file.status = FileStatus::Deleted;
			if(line.buf.starts_with("deleted file mode ")) {
				file.mode = FileMode {.old = line.parse_mode("deleted file mode "), .neo = 0};
			}
		} else if(line.is_rename_from()) {
			file.status = FileStatus::Renamed;
			auto from = line.buf.substr(sizeof("rename from") - 1);
			if(from.starts_with(' ')) {
				from.remove_prefix(1);
			}
			file.old_path = from;
		} else if(line.is_binary()) {
			file.is_binary = true;
		} else if(line.is_old_mode()) {
			auto mode = file.mode.value_or(FileMode {});
			mode.old = line.parse_mode("old mode ");
			file.mode = mode;
		} else if(line.is_new_mode()) {
			auto mode = file.mode.value_or(FileMode {});
			mode.neo = line.parse_mode("new mode ");
			file.mode = mode;
		} else if(line.is_hunk_header()) {
			if(auto some_hunk = this->parse_hunk()) {
				file.hunks.emplace_back(std::move(*some_hunk));
				// the hunk consumed its own lines
				continue;
			}
		}
		++this->current;
	}

	if(file.is_binary) {
		file.hunks.clear();
	}
	file.tally();

	if(tracing) {
		*tracing << "File " << file.path << " (" << to_string(file.status) << "): " << file.hunks.size() << " hunks, +" << file.additions << " -" << file.deletions << std::endl;
	}

	return file;
}

std::optional<Hunk> DiffReader::parse_hunk() {
	auto header = this->at(this->current);
	auto some_range = header.parse_range();
	if(!some_range) {
		// the caller steps over the header
		this->issues.emplace_back(some_range.error());
		if(tracing) {
			*tracing << "Skipping hunk: " << some_range.error() << ": " << header.buf << std::endl;
		}
		return {};
	}
	auto range = *some_range;

	Hunk hunk {
		.old_start = range.old_start,
		.old_lines = range.old_count(),
		.new_start = range.new_start,
		.new_lines = range.new_count(),
		.header = std::string(header.buf),
		.lines = {},
	};

	if(tracing) {
		*tracing << "Hunk " << header << std::endl;
	}

	++this->current;

	uint32_t old_line = hunk.old_start;
	uint32_t new_line = hunk.new_start;

	for(; this->current < this->lines.size(); ++this->current) {
		auto line = this->at(this->current);
		if(line.is_hunk_header() || line.is_diff()) {
			break;
		}
		if(line.is_empty()) {
			continue;
		}

		auto content = std::string(line.buf.substr(1));
		switch(line.buf[0]) {
			case '+': {
				hunk.lines.emplace_back(Line::added(std::move(content), new_line++));
			} break;
			case '-': {
				hunk.lines.emplace_back(Line::deleted(std::move(content), old_line++));
			} break;
			case ' ': {
				hunk.lines.emplace_back(Line::context(std::move(content), old_line++, new_line++));
			} break;
			default: {
				// "\ No newline at end of file" and anything unexpected
			} break;
		}
	}

	return hunk;
}

std::vector<FileChange> parse_diff(std::string_view buf, std::ostream *tracing) {
	DiffReader r;
	r.tracing = tracing;
	return r.by_buf(buf);
}

}// namespace ParseGitDiff
