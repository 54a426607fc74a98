#include "debsnap/io/atomic_file.hpp"

#include "debsnap/io/fd_writer.hpp"
#include "debsnap/io/file_reader.hpp"
#include "debsnap/io/gzip_writer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace debsnap {

namespace {

std::span<const std::uint8_t> AsBytes(std::string_view s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

std::string ErrnoText(const char* what, const std::string& path) {
    return std::string(what) + " " + path + ": " + std::strerror(errno);
}

Result FinalizeFd(int fd, mode_t mode, const std::string& path) {
    if (::fchmod(fd, mode) != 0) return Result::Fail(errno, ErrnoText("fchmod failed", path));
    if (::fsync(fd) != 0) return Result::Fail(errno, ErrnoText("fsync failed", path));
    return Result::Ok();
}

} // namespace

Result TempFile::CreateIn(const std::string& dir, std::string_view prefix, TempFile& out) {
    std::string tmpl = (fs::path(dir) / (std::string(prefix) + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkostemp(buf.data(), O_CLOEXEC);
    if (fd < 0) return Result::Fail(errno, ErrnoText("mkstemp failed in", dir));

    out.fd_.Reset(fd);
    out.path_ = buf.data();
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

void TempFile::Close() { fd_.Close(); }

Result TempFile::CommitReplace(const std::string& dest, mode_t mode) {
    if (path_.empty()) return Result::Fail(-1, "temp file already committed");
    if (fd_.Valid()) {
        auto fr = FinalizeFd(fd_.Get(), mode, path_);
        if (!fr.is_ok()) return fr;
        Close();
    }
    if (::rename(path_.c_str(), dest.c_str()) != 0) {
        return Result::Fail(errno, ErrnoText("rename failed to", dest));
    }
    path_.clear();
    return Result::Ok();
}

Result TempFile::CommitNoClobber(const std::string& dest, mode_t mode, bool& existed) {
    existed = false;
    if (path_.empty()) return Result::Fail(-1, "temp file already committed");
    if (fd_.Valid()) {
        auto fr = FinalizeFd(fd_.Get(), mode, path_);
        if (!fr.is_ok()) return fr;
        Close();
    }
    if (::link(path_.c_str(), dest.c_str()) != 0) {
        if (errno != EEXIST) return Result::Fail(errno, ErrnoText("link failed to", dest));
        existed = true;
    }
    Cleanup();
    return Result::Ok();
}

void TempFile::Cleanup() {
    Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

Result CopyFileInto(const std::string& src, TempFile& tmp) {
    FileReader reader;
    auto orr = FileReader::Open(src, reader);
    if (!orr.is_ok()) return orr;

    FdWriter writer{Fd(::dup(tmp.GetFd()))};
    if (writer.Get() < 0) return Result::Fail(errno, ErrnoText("dup failed for", tmp.Path()));

    std::vector<std::uint8_t> buf(256 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(errno, ErrnoText("read failed", src));
        auto wr = writer.WriteAll({buf.data(), static_cast<size_t>(n)});
        if (!wr.is_ok()) return wr;
    }
    return Result::Ok();
}

Result WriteFileAtomic(const std::string& path, std::string_view content, mode_t mode) {
    const fs::path target(path);
    const std::string dir = target.has_parent_path() ? target.parent_path().string() : ".";

    TempFile tmp;
    auto cr = TempFile::CreateIn(dir, "." + target.filename().string() + ".tmp-", tmp);
    if (!cr.is_ok()) return cr;

    FdWriter writer{Fd(::dup(tmp.GetFd()))};
    if (writer.Get() < 0) return Result::Fail(errno, ErrnoText("dup failed for", tmp.Path()));
    auto wr = writer.WriteAll(AsBytes(content));
    if (!wr.is_ok()) return wr;
    writer.Close();

    return tmp.CommitReplace(path, mode);
}

Result WriteGzipFileAtomic(const std::string& path, std::string_view content, mode_t mode) {
    const fs::path target(path);
    const std::string dir = target.has_parent_path() ? target.parent_path().string() : ".";

    TempFile tmp;
    auto cr = TempFile::CreateIn(dir, "." + target.filename().string() + ".tmp-", tmp);
    if (!cr.is_ok()) return cr;

    FdWriter sink{Fd(::dup(tmp.GetFd()))};
    if (sink.Get() < 0) return Result::Fail(errno, ErrnoText("dup failed for", tmp.Path()));
    {
        GzipWriter gz(sink);
        auto wr = gz.WriteAll(AsBytes(content));
        if (!wr.is_ok()) return wr;
        auto fr = gz.Finish();
        if (!fr.is_ok()) return fr;
    }
    sink.Close();

    return tmp.CommitReplace(path, mode);
}

Result ReadFileToString(const std::string& path, std::string& out) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) return Result::Fail(-1, "cannot open " + path);
    std::ostringstream ss;
    ss << is.rdbuf();
    if (is.bad()) return Result::Fail(-1, "read failed: " + path);
    out = ss.str();
    return Result::Ok();
}

} // namespace debsnap
