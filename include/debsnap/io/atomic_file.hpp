#pragma once

#include "debsnap/io/fd.hpp"
#include "debsnap/util/result.hpp"

#include <string>
#include <string_view>
#include <sys/types.h>

namespace debsnap {

// Scratch file created next to its final destination so that the final
// rename(2) or link(2) stays on one filesystem. Unlinked on destruction
// unless committed.
class TempFile {
public:
    static Result CreateIn(const std::string& dir, std::string_view prefix, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;
    void Close();

    // rename() over `dest`, replacing it.
    Result CommitReplace(const std::string& dest, mode_t mode);
    // link() to `dest`; EEXIST is reported through `existed`, not as failure.
    Result CommitNoClobber(const std::string& dest, mode_t mode, bool& existed);

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

// Appends the bytes of `src` to the temp file.
Result CopyFileInto(const std::string& src, TempFile& tmp);

Result WriteFileAtomic(const std::string& path, std::string_view content, mode_t mode = 0644);
Result WriteGzipFileAtomic(const std::string& path, std::string_view content, mode_t mode = 0644);
Result ReadFileToString(const std::string& path, std::string& out);

} // namespace debsnap
