#pragma once

#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace debsnap {

// One installed package as reported by dpkg-query. `name` is
// ${binary:Package} and may carry a ":arch" qualifier.
struct PackageRecord {
    std::string name;
    std::string version;
    std::string architecture;

    std::string BareName() const;
    std::string ToString() const;

    auto operator<=>(const PackageRecord&) const = default;
};

// Identity read back out of an archive's own control data.
struct DebIdentity {
    std::string package;
    std::string version;
    std::string architecture;

    bool Complete() const { return !package.empty() && !version.empty() && !architecture.empty(); }
    bool Matches(const PackageRecord& rec) const;
};

// dpkg-query -W -f='${binary:Package} ${Version} ${Architecture}\n'
inline constexpr const char* kInstalledQueryFormat = "${binary:Package} ${Version} ${Architecture}\\n";

// Parses query output into a sorted, de-duplicated list. Lines that do not
// have exactly three fields are appended to `rejected` when given.
std::vector<PackageRecord> ParseInstalledPackages(std::string_view text,
                                                  std::vector<std::string>* rejected = nullptr);

// Sorts and de-duplicates in place.
void NormalizeRecords(std::vector<PackageRecord>& records);

std::string VersionWithoutEpoch(std::string_view version);
// APT's archive cache spells the epoch colon as "%3a".
std::string VersionForCacheName(std::string_view version);

// Filenames under which an archive for `rec` is conventionally stored:
// the dpkg-deb form first, then the APT cache form when it differs.
std::vector<std::string> CanonicalArchiveNames(const PackageRecord& rec);
std::string CanonicalArchiveName(const DebIdentity& id);

// Package-name part of an archive filename ("foo" for "foo_1.0_all.deb").
// Debian package names cannot contain '_'.
std::string ArchiveNameKey(std::string_view filename);

// Identity spelled by a "<name>_<version>_<arch>.deb" filename, with "%3a"
// read back as the epoch colon. Nothing for any other shape.
std::optional<PackageRecord> RecordFromArchiveName(std::string_view filename);

} // namespace debsnap
