#include "debsnap/debian/source_entries.hpp"

#include "debsnap/io/atomic_file.hpp"
#include "debsnap/util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace fs = std::filesystem;

namespace debsnap {

namespace {

std::string_view TrimLeft(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    return s;
}

std::vector<std::string> SplitWords(std::string_view s) {
    std::vector<std::string> out;
    std::istringstream is{std::string(s)};
    std::string w;
    while (is >> w) out.push_back(w);
    return out;
}

bool IsOneLineType(std::string_view word) { return word == "deb" || word == "deb-src"; }

bool StartsWithFieldIgnoreCase(std::string_view line, std::string_view field) {
    if (line.size() < field.size()) return false;
    for (size_t i = 0; i < field.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(line[i])) !=
            std::tolower(static_cast<unsigned char>(field[i]))) {
            return false;
        }
    }
    return true;
}

// "deb [opts] uri suite..." -> uri, or empty when the line is malformed.
std::string OneLineUri(std::string_view rest) {
    rest = TrimLeft(rest);
    if (!rest.empty() && rest.front() == '[') {
        const size_t close = rest.find(']');
        if (close == std::string_view::npos) return {};
        rest = TrimLeft(rest.substr(close + 1));
    }
    const auto words = SplitWords(rest);
    return words.empty() ? std::string() : words.front();
}

} // namespace

std::vector<SourceEntry> ParseSourceEntries(std::string_view text, const fs::path& file) {
    std::vector<SourceEntry> out;
    SourceEntry* open_uris = nullptr;

    size_t line_no = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) end = text.size();
        std::string_view raw = text.substr(pos, end - pos);
        pos = end + 1;
        ++line_no;

        if (!raw.empty() && raw.back() == '\r') raw.remove_suffix(1);

        // deb822 continuation of a "URIs:" field
        if (open_uris && !raw.empty() && (raw.front() == ' ' || raw.front() == '\t')) {
            for (auto& w : SplitWords(raw)) open_uris->uris.push_back(std::move(w));
            open_uris->text += "\n" + std::string(raw);
            continue;
        }
        open_uris = nullptr;

        const std::string_view line = TrimLeft(raw);
        if (line.empty() || line.front() == '#') continue;

        if (StartsWithFieldIgnoreCase(line, "URIs:")) {
            SourceEntry entry{file, line_no, std::string(line), SplitWords(line.substr(5))};
            out.push_back(std::move(entry));
            open_uris = &out.back();
            continue;
        }

        const size_t word_end = line.find_first_of(" \t");
        const std::string_view type = line.substr(0, word_end);
        if (!IsOneLineType(type)) continue;

        SourceEntry entry{file, line_no, std::string(line), {}};
        if (word_end != std::string_view::npos) {
            std::string uri = OneLineUri(line.substr(word_end));
            if (!uri.empty()) entry.uris.push_back(std::move(uri));
        }
        out.push_back(std::move(entry));
    }
    return out;
}

Result ScanSourceEntries(const SourceLayout& layout, std::vector<SourceEntry>& out) {
    out.clear();

    std::vector<fs::path> files;
    std::error_code ec;
    if (fs::exists(layout.sources_list, ec)) files.push_back(layout.sources_list);

    if (fs::is_directory(layout.sources_list_d, ec)) {
        std::vector<fs::path> children;
        for (fs::directory_iterator it(layout.sources_list_d, ec), end; !ec && it != end;
             it.increment(ec)) {
            std::error_code sec;
            if (it->is_regular_file(sec) || it->is_symlink(sec)) children.push_back(it->path());
        }
        if (ec) {
            return Result::Fail(ec.value(),
                                "cannot list " + layout.sources_list_d.string() + ": " + ec.message());
        }
        std::sort(children.begin(), children.end());
        files.insert(files.end(), children.begin(), children.end());
    }

    for (const auto& file : files) {
        std::string text;
        auto rr = ReadFileToString(file.string(), text);
        if (!rr.is_ok()) return rr;
        auto entries = ParseSourceEntries(text, file);
        out.insert(out.end(),
                   std::make_move_iterator(entries.begin()),
                   std::make_move_iterator(entries.end()));
    }
    return Result::Ok();
}

std::string FormatLocalSourceLine(const fs::path& repo, bool trusted) {
    std::string line = "deb ";
    if (trusted) line += "[trusted=yes] ";
    line += "file:" + TrimTrailingSlashes(repo.string()) + " ./";
    return line;
}

bool UriReferencesPath(std::string_view uri, const fs::path& repo) {
    if (!StartsWith(uri, "file:")) return false;
    std::string_view rest = uri.substr(5);
    // file:///x and file:/x name the same directory
    while (StartsWith(rest, "//")) rest.remove_prefix(1);
    return TrimTrailingSlashes(std::string(rest)) == TrimTrailingSlashes(repo.string());
}

bool EntryReferencesOnly(const SourceEntry& entry, const fs::path& repo) {
    if (entry.uris.empty()) return false;
    return std::all_of(entry.uris.begin(), entry.uris.end(), [&](const std::string& uri) {
        return UriReferencesPath(uri, repo);
    });
}

} // namespace debsnap
