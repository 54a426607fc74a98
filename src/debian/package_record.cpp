#include "debsnap/debian/package_record.hpp"

#include <algorithm>
#include <sstream>

namespace debsnap {

std::string PackageRecord::BareName() const {
    const size_t colon = name.find(':');
    return colon == std::string::npos ? name : name.substr(0, colon);
}

std::string PackageRecord::ToString() const {
    return name + " (" + version + "/" + architecture + ")";
}

bool DebIdentity::Matches(const PackageRecord& rec) const {
    return package == rec.BareName() && version == rec.version && architecture == rec.architecture;
}

std::vector<PackageRecord> ParseInstalledPackages(std::string_view text,
                                                  std::vector<std::string>* rejected) {
    std::vector<PackageRecord> out;
    std::istringstream is{std::string(text)};
    std::string line;
    while (std::getline(is, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        std::istringstream fields(line);
        PackageRecord rec;
        std::string extra;
        if (!(fields >> rec.name >> rec.version >> rec.architecture) || (fields >> extra)) {
            if (rejected) rejected->push_back(line);
            continue;
        }
        out.push_back(std::move(rec));
    }
    NormalizeRecords(out);
    return out;
}

void NormalizeRecords(std::vector<PackageRecord>& records) {
    std::sort(records.begin(), records.end());
    records.erase(std::unique(records.begin(), records.end()), records.end());
}

std::string VersionWithoutEpoch(std::string_view version) {
    const size_t colon = version.find(':');
    if (colon == std::string_view::npos) return std::string(version);
    return std::string(version.substr(colon + 1));
}

std::string VersionForCacheName(std::string_view version) {
    std::string out;
    out.reserve(version.size() + 2);
    for (char c : version) {
        if (c == ':') {
            out += "%3a";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::vector<std::string> CanonicalArchiveNames(const PackageRecord& rec) {
    const std::string bare = rec.BareName();
    std::vector<std::string> names;
    names.push_back(bare + "_" + VersionWithoutEpoch(rec.version) + "_" + rec.architecture + ".deb");
    std::string cache_name =
        bare + "_" + VersionForCacheName(rec.version) + "_" + rec.architecture + ".deb";
    if (cache_name != names.front()) names.push_back(std::move(cache_name));
    return names;
}

std::string CanonicalArchiveName(const DebIdentity& id) {
    return id.package + "_" + VersionWithoutEpoch(id.version) + "_" + id.architecture + ".deb";
}

std::string ArchiveNameKey(std::string_view filename) {
    const size_t us = filename.find('_');
    return std::string(us == std::string_view::npos ? filename : filename.substr(0, us));
}

std::optional<PackageRecord> RecordFromArchiveName(std::string_view filename) {
    constexpr std::string_view kSuffix = ".deb";
    if (filename.size() <= kSuffix.size() || filename.substr(filename.size() - kSuffix.size()) != kSuffix) {
        return std::nullopt;
    }
    filename.remove_suffix(kSuffix.size());

    const size_t first = filename.find('_');
    const size_t last = filename.rfind('_');
    if (first == std::string_view::npos || first == last || filename.find('_', first + 1) != last) {
        return std::nullopt;
    }

    PackageRecord rec;
    rec.name = std::string(filename.substr(0, first));
    rec.architecture = std::string(filename.substr(last + 1));
    const std::string_view version = filename.substr(first + 1, last - first - 1);
    for (size_t i = 0; i < version.size(); ++i) {
        if (version.compare(i, 3, "%3a") == 0 || version.compare(i, 3, "%3A") == 0) {
            rec.version.push_back(':');
            i += 2;
        } else {
            rec.version.push_back(version[i]);
        }
    }
    if (rec.name.empty() || rec.version.empty() || rec.architecture.empty()) return std::nullopt;
    return rec;
}

} // namespace debsnap
