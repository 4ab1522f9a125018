#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "GitDiffProvider.hpp"
#include "ParseGitDiff.hpp"

namespace ParseGitDiff {

using json = nlohmann::json;

PARSEGITDIFF_API void to_json(json &j, const FileMode &m);
PARSEGITDIFF_API void from_json(const json &j, FileMode &m);

PARSEGITDIFF_API void to_json(json &j, const Line &l);
PARSEGITDIFF_API void from_json(const json &j, Line &l);

PARSEGITDIFF_API void to_json(json &j, const Hunk &h);
PARSEGITDIFF_API void from_json(const json &j, Hunk &h);

PARSEGITDIFF_API void to_json(json &j, const FileChange &f);
PARSEGITDIFF_API void from_json(const json &j, FileChange &f);

PARSEGITDIFF_API void to_json(json &j, const DiffResult &r);

/// Serializes `j`. Line content is raw file bytes, so invalid UTF-8 is replaced with U+FFFD instead of throwing.
PARSEGITDIFF_API std::string to_text(const json &j, int indent = 2);

/// Parses a JSON array of files, as written by to_json.
/// Throws nlohmann::json::exception on malformed input.
PARSEGITDIFF_API std::vector<FileChange> files_from_json(std::string_view buf);

};// namespace ParseGitDiff
