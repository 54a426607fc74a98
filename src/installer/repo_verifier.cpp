#include "debsnap/installer/repo_verifier.hpp"

#include "debsnap/crypto/sha256.hpp"
#include "debsnap/debian/control_fields.hpp"
#include "debsnap/io/atomic_file.hpp"
#include "debsnap/io/file_reader.hpp"
#include "debsnap/io/gzip_reader.hpp"
#include "debsnap/util/logger.hpp"
#include "debsnap/util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <memory>

namespace fs = std::filesystem;

namespace debsnap {

namespace {

constexpr size_t kMaxReportedProblems = 5;

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

bool ParseSize(const std::string& text, std::uint64_t& out) {
    const char* first = text.data();
    const char* last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

// Index paths are relative to the repo root; "./pool/x.deb" and "pool/x.deb"
// both occur. Anything leaving the root is rejected.
bool ResolveIndexPath(const fs::path& repo, std::string filename, fs::path& out) {
    while (StartsWith(filename, "./")) filename.erase(0, 2);
    const fs::path rel = fs::path(filename).lexically_normal();
    if (filename.empty() || rel.is_absolute() || StartsWith(rel.generic_string(), "..")) return false;
    out = repo / rel;
    return true;
}

void CheckStanza(const fs::path& repo, const ControlStanza& st, bool check_hashes, VerifySummary& out) {
    const std::string filename = st.Get("Filename");
    const std::string label = st.Get("Package").empty() ? filename : st.Get("Package");
    if (filename.empty()) {
        out.problems.push_back(label + ": stanza has no Filename");
        return;
    }

    fs::path file;
    if (!ResolveIndexPath(repo, filename, file)) {
        out.problems.push_back(filename + ": path escapes the repository");
        return;
    }

    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        out.problems.push_back(filename + ": missing");
        return;
    }

    const std::string size_text = st.Get("Size");
    std::uint64_t declared = 0;
    if (!size_text.empty()) {
        if (!ParseSize(size_text, declared)) {
            out.problems.push_back(filename + ": bad Size '" + size_text + "'");
            return;
        }
        const auto actual = fs::file_size(file, ec);
        if (ec || actual != declared) {
            out.problems.push_back(filename + ": size " + (ec ? std::string("unknown") : std::to_string(actual)) +
                                   ", index says " + size_text);
            return;
        }
    }

    const std::string expected = st.Get("SHA256");
    if (!check_hashes || expected.empty()) return;
    std::string actual;
    auto hr = Sha256HexFile(file.string(), actual);
    if (!hr.is_ok()) {
        out.problems.push_back(filename + ": " + hr.msg);
        return;
    }
    ++out.hashed;
    if (Lower(actual) != Lower(expected)) out.problems.push_back(filename + ": sha256 mismatch");
}

} // namespace

Result ReadRepoIndex(const fs::path& repo, std::string& out) {
    out.clear();
    std::error_code ec;
    if (fs::is_regular_file(repo / "Packages", ec)) return ReadFileToString((repo / "Packages").string(), out);

    const fs::path gz = repo / "Packages.gz";
    if (!fs::is_regular_file(gz, ec)) return Result::Fail(ENOENT, "no Packages or Packages.gz in " + repo.string());

    auto file = std::make_unique<FileReader>();
    auto orr = FileReader::Open(gz.string(), *file);
    if (!orr.is_ok()) return orr;

    GzipReader reader(std::move(file));
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(-1, "corrupt gzip stream: " + gz.string());
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return Result::Ok();
}

Result VerifyRepo(const fs::path& repo, bool check_hashes, VerifySummary& out) {
    out = VerifySummary{};

    std::error_code ec;
    if (!fs::is_directory(repo / "pool", ec)) return Result::Fail(-1, "repository has no pool/: " + repo.string());

    std::string index;
    auto ir = ReadRepoIndex(repo, index);
    if (!ir.is_ok()) return ir;

    auto stanzas = ParseControlStanzas(index);
    if (!stanzas) return Result::Fail(-1, "index is not parsable: " + stanzas.error());
    out.stanzas = stanzas->size();
    if (out.stanzas == 0) return Result::Fail(-1, "index lists no packages: " + repo.string());

    for (const auto& st : *stanzas) CheckStanza(repo, st, check_hashes, out);

    if (!out.problems.empty()) {
        std::string msg = std::to_string(out.problems.size()) + " of " + std::to_string(out.stanzas) +
                          " index entries do not match the pool:";
        for (size_t i = 0; i < out.problems.size() && i < kMaxReportedProblems; ++i) {
            msg += " " + out.problems[i] + ";";
        }
        msg.pop_back();
        return Result::Fail(-1, msg);
    }

    LogInfo("Verified %s: %zu index entries%s", repo.c_str(), out.stanzas,
            check_hashes ? " with SHA256" : "");
    return Result::Ok();
}

} // namespace debsnap
