#include <cstdint>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <range/v3/all.hpp>
#include <sstream>
#include <string>
#include <vector>

#include <DiffJSON.hpp>
#include <GitDiffProvider.hpp>
#include <ParseGitDiff.hpp>

using namespace ParseGitDiff;

static std::string read_all(const std::filesystem::path &p) {
	std::ifstream f(p, std::ios::binary);
	return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

/// Every `<name>.diff` under the fixtures directory parses to `<name>.json`
TEST(DiffJSON, fixtures) {
	std::vector<std::filesystem::path> challenges;
	for(auto &entry: std::filesystem::directory_iterator(PARSEGITDIFF_FIXTURES_DIR)) {
		if(entry.path().extension() == ".diff") {
			challenges.emplace_back(entry.path());
		}
	}
	ASSERT_FALSE(challenges.empty());

	for(auto &challenge: challenges) {
		SCOPED_TRACE(challenge.string());
		auto etalon_path = std::filesystem::path(challenge).replace_extension(".json");
		ASSERT_TRUE(std::filesystem::exists(etalon_path));

		auto json_files = files_from_json(read_all(etalon_path));
		auto parsed_files = parse_diff(read_all(challenge));

		ASSERT_EQ(json_files.size(), parsed_files.size());
		for(auto [fj, fp]: ranges::views::zip(json_files, parsed_files)) {
			EXPECT_EQ(fj.path, fp.path);
			EXPECT_EQ(fj.old_path, fp.old_path);
			EXPECT_EQ(fj.status, fp.status) << fp.path;
			EXPECT_EQ(fj.is_binary, fp.is_binary) << fp.path;
			EXPECT_EQ(fj.additions, fp.additions) << fp.path;
			EXPECT_EQ(fj.deletions, fp.deletions) << fp.path;
			EXPECT_EQ(fj.mode.has_value(), fp.mode.has_value()) << fp.path;
			if(fj.mode && fp.mode) {
				EXPECT_EQ(*fj.mode, *fp.mode) << fp.path;
			}
			ASSERT_EQ(fj.hunks.size(), fp.hunks.size()) << fp.path;
			for(auto [hj, hp]: ranges::views::zip(fj.hunks, fp.hunks)) {
				EXPECT_EQ(hj.header, hp.header);
				EXPECT_EQ(hj.old_start, hp.old_start) << hp.header;
				EXPECT_EQ(hj.old_lines, hp.old_lines) << hp.header;
				EXPECT_EQ(hj.new_start, hp.new_start) << hp.header;
				EXPECT_EQ(hj.new_lines, hp.new_lines) << hp.header;
				ASSERT_EQ(hj.lines.size(), hp.lines.size()) << hp.header;
				for(auto [lj, lp]: ranges::views::zip(hj.lines, hp.lines)) {
					EXPECT_EQ(lp, lj);
				}
			}
		}
	}
}

TEST(DiffJSON, line_numbers_are_null_when_absent) {
	json added = Line {.type = LineType::Added, .content = "x", .old_number = {}, .new_number = 4};
	EXPECT_EQ(added["type"], "added");
	EXPECT_TRUE(added["oldNumber"].is_null());
	EXPECT_EQ(added["newNumber"], 4);

	json deleted = Line {.type = LineType::Deleted, .content = "y", .old_number = 9, .new_number = {}};
	EXPECT_EQ(deleted["oldNumber"], 9);
	EXPECT_TRUE(deleted["newNumber"].is_null());
}

TEST(DiffJSON, invalid_utf8_content_is_replaced) {
	json j = Line {.type = LineType::Added, .content = "a\xff", .old_number = {}, .new_number = 1};
	EXPECT_THROW(j.dump(), json::type_error);

	std::string text;
	ASSERT_NO_THROW(text = to_text(j));
	EXPECT_NE(text.find("a\xEF\xBF\xBD"), std::string::npos) << text;

	auto files = parse_diff(
		"diff --git a/blob b/blob\n"
		"--- a/blob\n"
		"+++ b/blob\n"
		"@@ -1 +1 @@\n"
		"-\xfe\n"
		"+\xff\n");
	ASSERT_NO_THROW(text = to_text(json(files)));
	EXPECT_NE(text.find("\"additions\": 1"), std::string::npos) << text;
}

TEST(DiffJSON, file_change) {
	auto files = parse_diff(
		"diff --git a/run.sh b/run.sh\n"
		"old mode 100644\n"
		"new mode 100755\n"
		"@@ -1 +1,2 @@\n"
		" #!/bin/sh\n"
		"+exit 0\n");
	ASSERT_EQ(files.size(), 1u);

	json j = files[0];
	EXPECT_EQ(j["path"], "run.sh");
	EXPECT_EQ(j["oldPath"], "run.sh");
	EXPECT_EQ(j["status"], "modified");
	EXPECT_EQ(j["isBinary"], false);
	EXPECT_EQ(j["additions"], 1);
	EXPECT_EQ(j["deletions"], 0);
	EXPECT_EQ(j["mode"]["old"], 0100644);
	EXPECT_EQ(j["mode"]["new"], 0100755);
	EXPECT_EQ(j["hunks"][0]["header"], "@@ -1 +1,2 @@");
	EXPECT_EQ(j["hunks"][0]["oldLines"], 1);
	EXPECT_EQ(j["hunks"][0]["newLines"], 2);
	EXPECT_EQ(j["hunks"][0]["lines"].size(), 2u);

	auto back = j.get<FileChange>();
	EXPECT_EQ(back.path, files[0].path);
	EXPECT_EQ(back.mode, files[0].mode);
	ASSERT_EQ(back.hunks.size(), 1u);
	EXPECT_EQ(back.hunks[0].lines, files[0].hunks[0].lines);
}

TEST(DiffJSON, file_without_mode) {
	json j = synthesize_added_file("new.txt", "a\n");
	EXPECT_FALSE(j.contains("mode"));
	EXPECT_EQ(j["status"], "added");
	EXPECT_EQ(j["hunks"][0]["header"], "@@ -0,0 +1,1 @@");
}

TEST(DiffJSON, diff_result) {
	DiffResult r {
		.files = {synthesize_added_file("a.txt", "x\ny\n")},
		.kind = DiffKind::Unstaged,
	};
	json j = r;
	EXPECT_EQ(j["type"], "unstaged");
	ASSERT_EQ(j["files"].size(), 1u);
	EXPECT_EQ(j["files"][0]["additions"], 2);
}
