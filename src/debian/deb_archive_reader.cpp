#include "debsnap/debian/deb_archive_reader.hpp"

#include "debsnap/debian/control_fields.hpp"
#include "debsnap/util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstdint>
#include <vector>

namespace debsnap {

namespace {

// Control archives are small; anything larger is not a sane .deb.
constexpr la_int64_t kMaxControlMemberBytes = 64LL * 1024 * 1024;

class ArchiveReadHandle {
public:
    ArchiveReadHandle() : ar_(archive_read_new()) {}
    ArchiveReadHandle(const ArchiveReadHandle&) = delete;
    ArchiveReadHandle& operator=(const ArchiveReadHandle&) = delete;
    ~ArchiveReadHandle() {
        if (ar_) archive_read_free(ar_);
    }

    archive* get() const { return ar_; }

    std::string Error() const {
        const char* em = ar_ ? archive_error_string(ar_) : nullptr;
        return em ? em : "unknown";
    }

private:
    archive* ar_ = nullptr;
};

std::string EntryName(archive_entry* entry) {
    const char* name = archive_entry_pathname(entry);
    std::string out = name ? name : "";
    while (StartsWith(out, "./")) out.erase(0, 2);
    // GNU ar terminates member names with '/'.
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

template <typename Buffer>
Result ReadCurrentEntry(const ArchiveReadHandle& ar, Buffer& out) {
    std::vector<char> buf(64 * 1024);
    while (true) {
        const la_ssize_t n = archive_read_data(ar.get(), buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) return Result::Fail(-1, "archive_read_data: " + ar.Error());
        if (static_cast<la_int64_t>(out.size()) + n > kMaxControlMemberBytes) {
            return Result::Fail(-1, "control member exceeds size limit");
        }
        out.insert(out.end(), buf.data(), buf.data() + n);
    }
    return Result::Ok();
}

Result ExtractControlMember(const std::string& deb_path, std::vector<char>& out) {
    ArchiveReadHandle ar;
    if (!ar.get()) return Result::Fail(-1, "archive_read_new failed");

    archive_read_support_format_ar(ar.get());
    if (archive_read_open_filename(ar.get(), deb_path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return Result::Fail(-1, "cannot open " + deb_path + ": " + ar.Error());
    }

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(-1, deb_path + ": archive_read_next_header: " + ar.Error());
        }

        if (StartsWith(EntryName(entry), "control.tar")) {
            return ReadCurrentEntry(ar, out);
        }
        archive_read_data_skip(ar.get());
    }
    return Result::Fail(-1, deb_path + ": no control.tar member");
}

} // namespace

Result ReadDebControlText(const std::string& deb_path, std::string& out_text) {
    out_text.clear();

    std::vector<char> member;
    auto er = ExtractControlMember(deb_path, member);
    if (!er.is_ok()) return er;

    ArchiveReadHandle ar;
    if (!ar.get()) return Result::Fail(-1, "archive_read_new failed");
    archive_read_support_filter_all(ar.get());
    archive_read_support_format_tar(ar.get());
    if (archive_read_open_memory(ar.get(), member.data(), member.size()) != ARCHIVE_OK) {
        return Result::Fail(-1, deb_path + ": control.tar: " + ar.Error());
    }

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(-1, deb_path + ": control.tar: " + ar.Error());
        }
        if (archive_entry_filetype(entry) == AE_IFREG && EntryName(entry) == "control") {
            return ReadCurrentEntry(ar, out_text);
        }
        archive_read_data_skip(ar.get());
    }
    return Result::Fail(-1, deb_path + ": control.tar has no control file");
}

Result ReadDebIdentity(const std::string& deb_path, DebIdentity& out) {
    out = DebIdentity{};

    std::string text;
    auto rr = ReadDebControlText(deb_path, text);
    if (!rr.is_ok()) return rr;

    auto stanza = ParseControlStanza(text);
    if (!stanza) return Result::Fail(-1, deb_path + ": " + stanza.error());

    out.package = stanza->Get("Package");
    out.version = stanza->Get("Version");
    out.architecture = stanza->Get("Architecture");
    return Result::Ok();
}

} // namespace debsnap
