#pragma once

#include "debsnap/debian/source_entries.hpp"
#include "debsnap/installer/apt_client.hpp"
#include "debsnap/util/result.hpp"

#include <cstdio>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace debsnap {

// Replaces every APT source of the host with a single local one.
//
//   kActive --Quarantine--> kQuarantined --WriteLocalSource--> kSwitched
//   kSwitched --CheckNoStraySources, Verify--> kVerified
//
// Any failing step ends in kFailed. There is no way back: the previous
// configuration stays in QuarantineDir() for the operator. Calling a step
// out of order is an error and changes nothing.
class SourceSwitch {
public:
    enum class State { kActive, kQuarantined, kSwitched, kVerified, kFailed };

    // rename(2) signature: 0 on success, -1 with errno set.
    using RenameFn = std::function<int(const char* from, const char* to)>;

    struct Options {
        SourceLayout layout;
        std::filesystem::path stage_dir;
        bool trusted = true;
        // Quarantine directory suffix; the current UTC time when empty.
        std::string stamp;
        RenameFn rename_fn = &::rename;
    };

    SourceSwitch(const AptClient& apt, Options opt);

    State GetState() const { return state_; }
    const std::filesystem::path& QuarantineDir() const { return quarantine_dir_; }
    // Files Quarantine() could not move. An unmovable sources.list fails
    // Quarantine() itself, since WriteLocalSource() would replace it.
    const std::vector<std::filesystem::path>& Unmoved() const { return unmoved_; }

    Result Quarantine();
    Result WriteLocalSource();
    Result CheckNoStraySources();
    Result Verify();

    // All four steps in order; stops at the first failure.
    Result Run();

private:
    Result Expect(State wanted, const char* step) const;
    Result Fail(Result r);
    int MoveInto(const std::filesystem::path& src, const std::filesystem::path& dest);

    const AptClient& apt_;
    Options opt_;
    State state_ = State::kActive;
    bool guard_passed_ = false;
    std::filesystem::path quarantine_dir_;
    std::vector<std::filesystem::path> unmoved_;
    size_t moved_ = 0;
};

const char* ToString(SourceSwitch::State state);

} // namespace debsnap
