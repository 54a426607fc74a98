#include "debsnap/system/command_runner.hpp"

#include "debsnap/io/fd.hpp"
#include "debsnap/util/logger.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace debsnap {

namespace {

struct Pipe {
    Fd read_end;
    Fd write_end;
};

Result MakePipe(Pipe& out) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Result::Fail(errno, std::string("pipe2 failed: ") + std::strerror(errno));
    }
    out.read_end.Reset(fds[0]);
    out.write_end.Reset(fds[1]);
    return Result::Ok();
}

// Everything the child needs is built before fork(); workers spawn
// concurrently and only async-signal-safe calls may run after fork.
std::vector<std::string> BuildEnvironment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        const std::string entry(*e);
        const std::string key = entry.substr(0, entry.find('='));
        bool replaced = false;
        for (const auto& [k, v] : overrides) {
            if (k == key) {
                replaced = true;
                break;
            }
        }
        if (!replaced) env.push_back(entry);
    }
    for (const auto& [k, v] : overrides) {
        env.push_back(k + "=" + v);
    }
    return env;
}

std::vector<char*> ToCharArray(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

void DrainPipes(Fd& out_fd, Fd& err_fd, std::string& out, std::string& err) {
    std::array<char, 16 * 1024> buf{};
    while (out_fd.Valid() || err_fd.Valid()) {
        std::array<pollfd, 2> pfds{};
        nfds_t n = 0;
        if (out_fd.Valid()) pfds[n++] = {out_fd.Get(), POLLIN, 0};
        if (err_fd.Valid()) pfds[n++] = {err_fd.Get(), POLLIN, 0};

        if (::poll(pfds.data(), n, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (nfds_t i = 0; i < n; ++i) {
            if (pfds[i].revents == 0) continue;
            Fd& fd = (pfds[i].fd == out_fd.Get()) ? out_fd : err_fd;
            std::string& sink = (pfds[i].fd == out_fd.Get()) ? out : err;
            const ssize_t r = ::read(fd.Get(), buf.data(), buf.size());
            if (r > 0) {
                sink.append(buf.data(), static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                fd.Close();
            }
        }
    }
}

} // namespace

Result PosixCommandRunner::Run(const CommandSpec& spec, CommandOutput& out) const {
    out = CommandOutput{};
    if (spec.argv.empty()) return Result::Fail(-1, "empty command");

    Pipe out_pipe;
    Pipe err_pipe;
    if (auto r = MakePipe(out_pipe); !r.is_ok()) return r;
    if (auto r = MakePipe(err_pipe); !r.is_ok()) return r;

    std::vector<std::string> args = spec.argv;
    std::vector<std::string> env = BuildEnvironment(spec.env);
    std::vector<char*> argv = ToCharArray(args);
    std::vector<char*> envp = ToCharArray(env);
    const char* cwd = spec.cwd.empty() ? nullptr : spec.cwd.c_str();

    LogDebug("exec: %s (cwd=%s)", DescribeCommand(spec.argv).c_str(), cwd ? cwd : ".");

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Result::Fail(errno, std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe.write_end.Get(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end.Get(), STDERR_FILENO);
        if (cwd && ::chdir(cwd) != 0) ::_exit(126);
        ::execvpe(argv[0], argv.data(), envp.data());
        ::_exit(127);
    }

    out_pipe.write_end.Close();
    err_pipe.write_end.Close();
    DrainPipes(out_pipe.read_end, err_pipe.read_end, out.out, out.err);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Result::Fail(errno, std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.exit_code = 128 + WTERMSIG(status);
    }

    if (out.exit_code == 127) {
        return Result::Fail(127, "cannot execute " + spec.argv[0]);
    }
    return Result::Ok();
}

std::shared_ptr<const ICommandRunner> DefaultCommandRunner() {
    static const std::shared_ptr<const ICommandRunner> kDefault =
        std::make_shared<PosixCommandRunner>();
    return kDefault;
}

std::string DescribeCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        if (a.find_first_of(" \t'\"*") != std::string::npos) {
            out += "'" + a + "'";
        } else {
            out += a;
        }
    }
    return out;
}

std::string LastLines(const std::string& text, size_t max_lines) {
    size_t end = text.size();
    while (end > 0 && (text[end - 1] == '\n' || text[end - 1] == '\r')) --end;
    if (end == 0 || max_lines == 0) return {};

    size_t pos = end;
    size_t lines = 0;
    while (pos > 0) {
        if (text[pos - 1] == '\n' && ++lines == max_lines) break;
        --pos;
    }
    return text.substr(pos, end - pos);
}

std::optional<std::string> FindInPath(const std::string& tool) {
    if (tool.find('/') != std::string::npos) {
        if (::access(tool.c_str(), X_OK) == 0) return tool;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    const std::string path = path_env ? path_env : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        const std::string dir = path.substr(start, end - start);
        if (!dir.empty()) {
            const std::string candidate = dir + "/" + tool;
            struct stat st{};
            if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
                ::access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
        }
        start = end + 1;
    }
    return std::nullopt;
}

Result RequireTools(const std::vector<std::string>& tools) {
    std::string missing;
    for (const auto& tool : tools) {
        if (!FindInPath(tool)) {
            if (!missing.empty()) missing += ", ";
            missing += tool;
        }
    }
    if (!missing.empty()) return Result::Fail(-1, "Missing required tool(s): " + missing);
    return Result::Ok();
}

} // namespace debsnap
