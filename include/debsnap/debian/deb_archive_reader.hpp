#pragma once

#include "debsnap/debian/package_record.hpp"
#include "debsnap/util/result.hpp"

#include <string>

namespace debsnap {

// Reads the `control` member out of a .deb: the outer ar archive is opened
// with libarchive, the control.tar[.gz|.xz|.zst|.bz2] member is buffered and
// opened as a second archive.
Result ReadDebControlText(const std::string& deb_path, std::string& out_text);

// Package/Version/Architecture from the archive's control data. Absent
// fields are left empty; an unreadable archive is an error.
Result ReadDebIdentity(const std::string& deb_path, DebIdentity& out);

} // namespace debsnap
