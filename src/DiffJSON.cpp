#include "DiffJSON.hpp"

namespace ParseGitDiff {

static FileStatus status_from_string(std::string_view s) {
	if(s == "added") {
		return FileStatus::Added;
	} else if(s == "deleted") {
		return FileStatus::Deleted;
	} else if(s == "renamed") {
		return FileStatus::Renamed;
	}
	return FileStatus::Modified;
}

static LineType line_type_from_string(std::string_view s) {
	if(s == "added") {
		return LineType::Added;
	} else if(s == "deleted") {
		return LineType::Deleted;
	}
	return LineType::Context;
}

static json optional_number(const std::optional<uint32_t> &n) {
	if(n) {
		return *n;
	}
	return nullptr;
}

static std::optional<uint32_t> optional_number(const json &j, const char *key) {
	auto it = j.find(key);
	if(it == j.end() || it->is_null()) {
		return {};
	}
	return it->get<uint32_t>();
}

void to_json(json &j, const FileMode &m) {
	j = json {{"old", m.old}, {"new", m.neo}};
}

void from_json(const json &j, FileMode &m) {
	j.at("old").get_to(m.old);
	j.at("new").get_to(m.neo);
}

void to_json(json &j, const Line &l) {
	j = json {
		{"type", std::string(to_string(l.type))},
		{"content", l.content},
		{"oldNumber", optional_number(l.old_number)},
		{"newNumber", optional_number(l.new_number)},
	};
}

void from_json(const json &j, Line &l) {
	l.type = line_type_from_string(j.at("type").get<std::string>());
	j.at("content").get_to(l.content);
	l.old_number = optional_number(j, "oldNumber");
	l.new_number = optional_number(j, "newNumber");
}

void to_json(json &j, const Hunk &h) {
	j = json {
		{"oldStart", h.old_start},
		{"oldLines", h.old_lines},
		{"newStart", h.new_start},
		{"newLines", h.new_lines},
		{"header", h.header},
		{"lines", h.lines},
	};
}

void from_json(const json &j, Hunk &h) {
	j.at("oldStart").get_to(h.old_start);
	j.at("oldLines").get_to(h.old_lines);
	j.at("newStart").get_to(h.new_start);
	j.at("newLines").get_to(h.new_lines);
	j.at("header").get_to(h.header);
	j.at("lines").get_to(h.lines);
}

void to_json(json &j, const FileChange &f) {
	j = json {
		{"oldPath", f.old_path},
		{"path", f.path},
		{"status", std::string(to_string(f.status))},
		{"isBinary", f.is_binary},
		{"additions", f.additions},
		{"deletions", f.deletions},
		{"hunks", f.hunks},
	};
	if(f.mode) {
		j["mode"] = *f.mode;
	}
}

void from_json(const json &j, FileChange &f) {
	j.at("oldPath").get_to(f.old_path);
	j.at("path").get_to(f.path);
	f.status = status_from_string(j.at("status").get<std::string>());
	j.at("isBinary").get_to(f.is_binary);
	j.at("additions").get_to(f.additions);
	j.at("deletions").get_to(f.deletions);
	j.at("hunks").get_to(f.hunks);
	if(auto it = j.find("mode"); it != j.end() && !it->is_null()) {
		f.mode = it->get<FileMode>();
	} else {
		f.mode = {};
	}
}

void to_json(json &j, const DiffResult &r) {
	j = json {
		{"files", r.files},
		{"type", std::string(to_string(r.kind))},
	};
}

std::string to_text(const json &j, int indent) {
	return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::vector<FileChange> files_from_json(std::string_view buf) {
	return json::parse(buf).get<std::vector<FileChange>>();
}

}// namespace ParseGitDiff
