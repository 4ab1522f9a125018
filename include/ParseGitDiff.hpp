#pragma once
#include <cstdint>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#if __has_include(<expected>)
	#include <expected>
#endif

#if !defined(__cpp_lib_expected)
	#if __has_include(<tl/expected.hpp>)
		#include <tl/expected.hpp>
	#else
		#error "Your compiler doesn't support std::expected and you have no polyfill (https://github.com/TartanLlama/expected) installed."
	#endif
#endif

#ifdef _MSC_VER
	#define PARSEGITDIFF_EXPORT_API __declspec(dllexport)
	#define PARSEGITDIFF_IMPORT_API __declspec(dllimport)
#else
	#ifdef _WIN32
		#define PARSEGITDIFF_EXPORT_API [[gnu::dllexport]]
		#define PARSEGITDIFF_IMPORT_API [[gnu::dllimport]]
	#else
		#define PARSEGITDIFF_EXPORT_API [[gnu::visibility("default")]]
		#define PARSEGITDIFF_IMPORT_API
	#endif
#endif

#ifdef PARSEGITDIFF_EXPORTS
	#define PARSEGITDIFF_API PARSEGITDIFF_EXPORT_API
#else
	#define PARSEGITDIFF_API PARSEGITDIFF_IMPORT_API
#endif

namespace ParseGitDiff {

#if defined(__cpp_lib_expected)
	template <typename T, typename E>
	using expected = std::expected<T, E>;

	template <typename E>
	using unexpected = std::unexpected<E>;
#else
	template <typename T, typename E>
	using expected = tl::expected<T, E>;

	template <typename E>
	using unexpected = tl::unexpected<E>;
#endif

enum struct DiffErrorCode : uint8_t {
	OK = 0,
	InvalidHunkHeader,
	NoFilename,
	GitCommandFailed,
	FileReadFailed,
	FileNotInDiff
};

struct PARSEGITDIFF_API DiffError {
	DiffErrorCode code;
	uint64_t line_or_str = 0;
	std::string message {};

	constexpr operator bool() const {
		return code != DiffErrorCode::OK;
	}
};

template <typename T> using Result = expected<T, DiffError>;

enum struct FileStatus : uint8_t {
	Added,
	Deleted,
	Modified,
	Renamed
};

enum struct LineType : uint8_t {
	Context,
	Added,
	Deleted
};

/// File mode change, octal permission bits. 0 stands for "no file on this side".
struct FileMode {
	uint32_t old = 0, neo = 0;
};

PARSEGITDIFF_API bool operator==(const FileMode &lhs, const FileMode &rhs);

/// A line inside a hunk.
///
/// Context lines carry both numbers, added lines only new_number,
/// deleted lines only old_number.
/// A context line carries both numbers, an added line only the new one, a deleted line only the old one.
/// The factories below set the numbers matching the tag.
struct PARSEGITDIFF_API Line {
	LineType type = LineType::Context;
	std::string content;
	std::optional<uint32_t> old_number;
	std::optional<uint32_t> new_number;

	static Line context(std::string content, uint32_t old_number, uint32_t new_number);
	static Line added(std::string content, uint32_t new_number);
	static Line deleted(std::string content, uint32_t old_number);
};

PARSEGITDIFF_API bool operator==(const Line &lhs, const Line &rhs);

struct PARSEGITDIFF_API Hunk {
	uint32_t old_start = 0, old_lines = 0, new_start = 0, new_lines = 0;
	std::string header;
	std::vector<Line> lines;
};

struct PARSEGITDIFF_API FileChange {
	std::string old_path;
	std::string path;
	FileStatus status = FileStatus::Modified;
	bool is_binary = false;
	uint32_t additions = 0, deletions = 0;
	std::vector<Hunk> hunks;
	std::optional<FileMode> mode;

	/// Recounts additions and deletions from the hunks
	void tally();
};

/// Ranges of a hunk header as written. A count missing from the header is
/// kept as an empty optional, it means "1".
struct PARSEGITDIFF_API HunkRange {
	uint32_t old_start = 0;
	std::optional<uint32_t> old_lines;
	uint32_t new_start = 0;
	std::optional<uint32_t> new_lines;

	uint32_t old_count() const;
	uint32_t new_count() const;
};

PARSEGITDIFF_API bool operator==(const HunkRange &lhs, const HunkRange &rhs);

struct PARSEGITDIFF_API LineReader {
	std::string_view buf;
	size_t line;

	bool is_empty() const;

	bool is_diff() const;

	bool is_hunk_header() const;

	bool is_binary() const;

	bool is_rename_from() const;

	bool is_new_file() const;

	bool is_deleted_file() const;

	bool is_old_mode() const;

	bool is_new_mode() const;

	size_t get_line() const;

	Result<HunkRange> parse_range() const;

	uint32_t parse_mode(const std::string_view start) const;

	Result<std::tuple<std::string_view, std::string_view>> parse_files() const;
};

/// Splits a buffer on '\n'. Nothing else is stripped, so "a\n" gives {"a", ""}.
PARSEGITDIFF_API std::vector<std::string_view> split_lines(std::string_view buf);

/// Type to read a `git diff` output
struct PARSEGITDIFF_API DiffReader {
	std::vector<std::string_view> lines;
	size_t current = 0;
	std::vector<DiffError> issues {};
	std::ostream *tracing = nullptr;

	void reset();

	std::vector<FileChange> by_buf(std::string_view buf);

	std::vector<FileChange> parse();

	FileChange parse_file();

	std::optional<Hunk> parse_hunk();

	LineReader at(size_t idx) const;
};

/// Parses a whole diff. Malformed sections are skipped, never reported as a failure.
PARSEGITDIFF_API std::vector<FileChange> parse_diff(std::string_view buf, std::ostream *tracing = nullptr);

PARSEGITDIFF_API std::string_view to_string(FileStatus status);

PARSEGITDIFF_API std::string_view to_string(LineType type);

PARSEGITDIFF_API std::ostream &operator<<(std::ostream &s, const DiffError &err);

PARSEGITDIFF_API std::ostream &operator<<(std::ostream &s, const LineReader &line);

PARSEGITDIFF_API std::ostream &operator<<(std::ostream &s, const Line &line);

PARSEGITDIFF_API std::ostream &operator<<(std::ostream &s, const FileChange &file);

};// namespace ParseGitDiff
