#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "DiffJSON.hpp"
#include "GitDiffProvider.hpp"
#include "ParseGitDiff.hpp"

using namespace ParseGitDiff;

static void print_usage() {
	std::cerr << "usage: gitdiff-json [--staged|--unstaged|--all] [-U<n>] [-C <dir>] [--file <path>] [--trace] [-]\n"
	          << "  -        parse a diff read from stdin instead of running git\n";
}

int main(int argc, char **argv) {
	DiffKind kind = DiffKind::All;
	int context_lines = kDefaultContextLines;
	ProcessGitOptions options;
	std::optional<std::string> file;
	bool from_stdin = false;
	bool trace = false;

	for(int i = 1; i < argc; ++i) {
		std::string_view arg = argv[i];
		if(arg == "--staged") {
			kind = DiffKind::Staged;
		} else if(arg == "--unstaged") {
			kind = DiffKind::Unstaged;
		} else if(arg == "--all") {
			kind = DiffKind::All;
		} else if(arg.starts_with("-U") && arg.size() > 2) {
			try {
				context_lines = std::stoi(std::string(arg.substr(2)));
			} catch(const std::exception &) {
				std::cerr << "bad context size: " << arg << "\n";
				return 2;
			}
		} else if(arg == "-C" && i + 1 < argc) {
			options.work_tree = argv[++i];
		} else if(arg == "--file" && i + 1 < argc) {
			file = argv[++i];
		} else if(arg == "--trace") {
			trace = true;
		} else if(arg == "-") {
			from_stdin = true;
		} else {
			std::cerr << "unknown argument: " << arg << "\n";
			print_usage();
			return 2;
		}
	}

	std::ostream *tracing = trace ? &std::cerr : nullptr;

	if(from_stdin) {
		std::string text {std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
		std::cout << to_text(json(parse_diff(text, tracing))) << std::endl;
		return 0;
	}

	ProcessGitBackend backend {options};
	GitDiffProvider provider {.backend = backend, .tracing = tracing};

	if(file) {
		auto some_file = provider.get_file_diff(*file, kind, context_lines);
		if(!some_file) {
			std::cerr << some_file.error() << std::endl;
			return 1;
		}
		std::cout << to_text(json(*some_file)) << std::endl;
		return 0;
	}

	auto some_diff = provider.get_diff(kind, context_lines);
	if(!some_diff) {
		std::cerr << some_diff.error() << std::endl;
		return 1;
	}
	std::cout << to_text(json(*some_diff)) << std::endl;
	return 0;
}
