#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

#include "GitDiffProvider.hpp"

namespace ParseGitDiff {

GitBackend::~GitBackend() = default;

static DiffError wrap(DiffError err, std::string_view what) {
	err.message = std::string(what) + ": " + err.message;
	return err;
}

static std::string_view trim(std::string_view s) {
	constexpr std::string_view ws = " \t\r\n";
	auto start = s.find_first_not_of(ws);
	if(start == std::string_view::npos) {
		return {};
	}
	auto end = s.find_last_not_of(ws);
	return s.substr(start, end - start + 1);
}

/// Single-quotes an argument for /bin/sh
static std::string shell_quote(std::string_view arg) {
	std::string res = "'";
	for(auto c: arg) {
		if(c == '\'') {
			res += "'\\''";
		} else {
			res += c;
		}
	}
	res += '\'';
	return res;
}

std::string_view to_string(DiffKind kind) {
	switch(kind) {
		case DiffKind::Staged:
			return "staged";
		case DiffKind::Unstaged:
			return "unstaged";
		case DiffKind::All:
			return "all";
	}
	return "all";
}

ProcessGitBackend::ProcessGitBackend(ProcessGitOptions options): options(std::move(options)) {
}

namespace {

/// Temporary file that receives the stderr of one git invocation, removed on scope exit
struct StderrCapture {
	std::filesystem::path path;

	StderrCapture() {
		auto pattern = (std::filesystem::temp_directory_path() / "parsegitdiff-XXXXXX").string();
		int fd = mkstemp(pattern.data());
		if(fd != -1) {
			close(fd);
			this->path = pattern;
		}
	}

	StderrCapture(const StderrCapture &) = delete;
	StderrCapture &operator=(const StderrCapture &) = delete;

	~StderrCapture() {
		if(!this->path.empty()) {
			std::error_code ec;
			std::filesystem::remove(this->path, ec);
		}
	}

	std::string text() const {
		if(this->path.empty()) {
			return {};
		}
		std::ifstream f(this->path, std::ios::binary);
		std::ostringstream content;
		content << f.rdbuf();
		return std::string(trim(content.str()));
	}
};

};// namespace

Result<std::string> ProcessGitBackend::run_git(const std::vector<std::string> &args) {
	std::string cmd = shell_quote(this->options.git_executable) + " -C " + shell_quote(this->options.work_tree.string());
	for(auto &arg: args) {
		cmd += ' ';
		cmd += shell_quote(arg);
	}

	StderrCapture err;
	std::string shell_cmd = cmd;
	if(!err.path.empty()) {
		shell_cmd += " 2>" + shell_quote(err.path.string());
	}

	FILE *pipe = popen(shell_cmd.c_str(), "r");
	if(!pipe) {
		return unexpected<DiffError>({DiffErrorCode::GitCommandFailed, 0, "popen(" + cmd + "): " + std::strerror(errno)});
	}

	std::string out;
	char buffer[4096];
	for(size_t n = fread(buffer, 1, sizeof(buffer), pipe); n > 0; n = fread(buffer, 1, sizeof(buffer), pipe)) {
		out.append(buffer, n);
	}

	int status = pclose(pipe);
	if(status == -1) {
		return unexpected<DiffError>({DiffErrorCode::GitCommandFailed, 0, "pclose(" + cmd + "): " + std::strerror(errno)});
	}
	if(!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
		auto code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
		std::string message = "git command failed with status " + std::to_string(code) + ": " + cmd;
		auto diagnostic = err.text();
		if(!diagnostic.empty()) {
			message += ": " + diagnostic;
		}
		return unexpected<DiffError>({DiffErrorCode::GitCommandFailed, static_cast<uint64_t>(status), message});
	}
	return out;
}

Result<std::string> ProcessGitBackend::read_file(const std::string &path) {
	std::ifstream f(this->options.work_tree / path, std::ios::binary);
	if(!f) {
		return unexpected<DiffError>({DiffErrorCode::FileReadFailed, 0, "cannot open " + path});
	}
	std::ostringstream content;
	content << f.rdbuf();
	if(f.bad()) {
		return unexpected<DiffError>({DiffErrorCode::FileReadFailed, 0, "cannot read " + path});
	}
	return content.str();
}

std::vector<std::string> diff_args(DiffKind kind, int context_lines) {
	std::vector<std::string> args;
	switch(kind) {
		case DiffKind::Staged:
			args = {"diff", "--cached", "--no-color", "--no-ext-diff"};
			break;
		case DiffKind::Unstaged:
			args = {"diff", "--no-color", "--no-ext-diff"};
			break;
		default:
			args = {"diff", "HEAD", "--no-color", "--no-ext-diff"};
			break;
	}
	if(context_lines >= 0) {
		args.emplace_back("-U" + std::to_string(context_lines));
	}
	return args;
}

std::vector<std::string> porcelain_paths(std::string_view output) {
	std::vector<std::string> res;
	// the status letters may start with a space, so lines are not trimmed before the cut
	for(auto line: split_lines(output)) {
		if(line.size() > 3) {
			res.emplace_back(trim(line.substr(3)));
		}
	}
	return res;
}

FileChange synthesize_added_file(std::string_view path, std::string_view content) {
	FileChange file {
		.old_path = {},
		.path = std::string(path),
		.status = FileStatus::Added,
	};

	auto lines = split_lines(content);
	// a final newline terminates the last line, it doesn't start a new one
	if(!lines.empty() && lines.back().empty()) {
		lines.pop_back();
	}
	auto count = static_cast<uint32_t>(lines.size());
	Hunk hunk {
		.old_start = 0,
		.old_lines = 0,
		.new_start = 1,
		.new_lines = count,
		.header = "@@ -0,0 +1," + std::to_string(count) + " @@",
		.lines = {},
	};
	hunk.lines.reserve(lines.size());
	uint32_t number = 1;
	for(auto line: lines) {
		hunk.lines.emplace_back(Line::added(std::string(line), number++));
	}
	file.hunks.emplace_back(std::move(hunk));
	file.tally();
	return file;
}

Result<std::string> GitDiffProvider::raw_diff_text(DiffKind kind, int context_lines) {
	return this->backend.run_git(diff_args(kind, context_lines));
}

Result<DiffResult> GitDiffProvider::get_diff(DiffKind kind, int context_lines) {
	auto some_text = this->raw_diff_text(kind, context_lines);
	if(!some_text) {
		return unexpected<DiffError>(wrap(some_text.error(), "failed to get diff"));
	}

	DiffReader reader;
	reader.tracing = this->tracing;
	DiffResult res {
		.files = reader.by_buf(*some_text),
		.kind = kind,
	};

	if(kind == DiffKind::Unstaged || kind == DiffKind::All) {
		auto some_untracked = this->get_untracked_files();
		if(!some_untracked) {
			if(tracing) {
				*tracing << "Untracked files are not listed: " << some_untracked.error() << std::endl;
			}
			return res;
		}
		for(auto &path: *some_untracked) {
			auto some_file = this->get_untracked_file_diff(path);
			if(!some_file) {
				if(tracing) {
					*tracing << "Skipping untracked " << path << ": " << some_file.error() << std::endl;
				}
				continue;
			}
			res.files.emplace_back(std::move(*some_file));
		}
	}

	return res;
}

Result<std::vector<std::string>> GitDiffProvider::get_status() {
	auto some_out = this->backend.run_git({"status", "--porcelain"});
	if(!some_out) {
		return unexpected<DiffError>(some_out.error());
	}
	return porcelain_paths(*some_out);
}

Result<std::string> GitDiffProvider::get_file_content(const std::string &path) {
	auto some_content = this->backend.run_git({"show", "HEAD:" + path});
	if(some_content) {
		return some_content;
	}

	if(tracing) {
		*tracing << path << " is not in HEAD, reading the work tree" << std::endl;
	}
	auto some_file = this->backend.read_file(path);
	if(!some_file) {
		return unexpected<DiffError>(wrap(some_file.error(), "failed to read file"));
	}
	return some_file;
}

Result<std::vector<std::string>> GitDiffProvider::get_untracked_files() {
	auto some_out = this->backend.run_git({"ls-files", "--others", "--exclude-standard"});
	if(!some_out) {
		return unexpected<DiffError>(some_out.error());
	}

	std::vector<std::string> res;
	for(auto line: split_lines(trim(*some_out))) {
		if(!line.empty()) {
			res.emplace_back(line);
		}
	}
	return res;
}

Result<FileChange> GitDiffProvider::get_untracked_file_diff(const std::string &path) {
	auto some_content = this->backend.read_file(path);
	if(!some_content) {
		return unexpected<DiffError>(wrap(some_content.error(), "failed to read untracked file " + path));
	}
	return synthesize_added_file(path, *some_content);
}

Result<FileChange> GitDiffProvider::get_file_diff(const std::string &path, DiffKind kind, int context_lines) {
	if(auto some_untracked = this->get_untracked_files()) {
		for(auto &untracked: *some_untracked) {
			if(untracked == path) {
				return this->get_untracked_file_diff(path);
			}
		}
	} else if(tracing) {
		*tracing << "Untracked files are not listed: " << some_untracked.error() << std::endl;
	}

	auto some_diff = this->get_diff(kind, context_lines);
	if(!some_diff) {
		return unexpected<DiffError>(some_diff.error());
	}

	for(auto &file: some_diff->files) {
		if(file.path == path) {
			return std::move(file);
		}
	}

	return unexpected<DiffError>({DiffErrorCode::FileNotInDiff, 0, "file not found in diff: " + path});
}

Result<FileChange> GitDiffProvider::get_file_diff_with_full_context(const std::string &path, DiffKind kind) {
	return this->get_file_diff(path, kind, kFullContextLines);
}

}// namespace ParseGitDiff
