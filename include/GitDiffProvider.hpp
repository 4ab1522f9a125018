#pragma once
#include <cstdint>

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "ParseGitDiff.hpp"

namespace ParseGitDiff {

enum struct DiffKind : uint8_t {
	Staged,  /// index against HEAD
	Unstaged,/// work tree against index
	All      /// work tree against HEAD
};

constexpr int kDefaultContextLines = 3;

/// Large enough for git to emit whole files as a single hunk
constexpr int kFullContextLines = 999999;

struct PARSEGITDIFF_API DiffResult {
	std::vector<FileChange> files;
	DiffKind kind = DiffKind::All;
};

/// Where raw diffs and file contents come from
struct PARSEGITDIFF_API GitBackend {
	virtual ~GitBackend();

	/// Run git with the given arguments and return its standard output
	virtual Result<std::string> run_git(const std::vector<std::string> &args) = 0;

	/// Read a file of the work tree
	virtual Result<std::string> read_file(const std::string &path) = 0;
};

struct PARSEGITDIFF_API ProcessGitOptions {
	std::string git_executable = "git";
	std::filesystem::path work_tree = ".";
};

/// Runs a real git executable through the shell
struct PARSEGITDIFF_API ProcessGitBackend: public GitBackend {
	ProcessGitOptions options;

	ProcessGitBackend() = default;
	explicit ProcessGitBackend(ProcessGitOptions options);

	virtual Result<std::string> run_git(const std::vector<std::string> &args) override;

	virtual Result<std::string> read_file(const std::string &path) override;
};

struct PARSEGITDIFF_API GitDiffProvider {
	GitBackend &backend;
	std::ostream *tracing = nullptr;

	Result<std::string> raw_diff_text(DiffKind kind, int context_lines = kDefaultContextLines);

	/// Parsed diff. Unstaged and All also list untracked files as added ones.
	Result<DiffResult> get_diff(DiffKind kind, int context_lines = kDefaultContextLines);

	/// Paths from `git status --porcelain`
	Result<std::vector<std::string>> get_status();

	/// Content at HEAD, or the work tree copy when HEAD doesn't have the file
	Result<std::string> get_file_content(const std::string &path);

	Result<std::vector<std::string>> get_untracked_files();

	Result<FileChange> get_untracked_file_diff(const std::string &path);

	Result<FileChange> get_file_diff(const std::string &path, DiffKind kind, int context_lines = kDefaultContextLines);

	Result<FileChange> get_file_diff_with_full_context(const std::string &path, DiffKind kind);
};

PARSEGITDIFF_API std::vector<std::string> diff_args(DiffKind kind, int context_lines);

/// Strips the two status letters and the separator of every porcelain line
PARSEGITDIFF_API std::vector<std::string> porcelain_paths(std::string_view output);

/// Builds the diff of a file that has no previous version: a single hunk
/// where every line is added.
PARSEGITDIFF_API FileChange synthesize_added_file(std::string_view path, std::string_view content);

PARSEGITDIFF_API std::string_view to_string(DiffKind kind);

};// namespace ParseGitDiff
