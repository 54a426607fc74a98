#pragma once

#include "debsnap/util/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace debsnap {

// Where the host's APT source configuration lives.
struct SourceLayout {
    std::filesystem::path sources_list = "/etc/apt/sources.list";
    std::filesystem::path sources_list_d = "/etc/apt/sources.list.d";
    // Quarantine directories are created below this one.
    std::filesystem::path backup_base = "/etc/apt";
};

// An active source declaration: a one-line "deb"/"deb-src" entry or a
// deb822 "URIs:" field.
struct SourceEntry {
    std::filesystem::path file;
    size_t line = 0;
    std::string text;
    std::vector<std::string> uris;
};

std::vector<SourceEntry> ParseSourceEntries(std::string_view text,
                                            const std::filesystem::path& file);

// Reads sources.list and every regular file under sources.list.d (sorted by
// name). An unreadable file is an error so that callers fail closed.
Result ScanSourceEntries(const SourceLayout& layout, std::vector<SourceEntry>& out);

// "deb [trusted=yes] file:/opt/offline-repo ./"
std::string FormatLocalSourceLine(const std::filesystem::path& repo, bool trusted);

bool UriReferencesPath(std::string_view uri, const std::filesystem::path& repo);
// True when the entry names at least one URI and every URI is `repo`.
bool EntryReferencesOnly(const SourceEntry& entry, const std::filesystem::path& repo);

} // namespace debsnap
