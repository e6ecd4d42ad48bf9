#include "engine/ProcessRunner.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace coderun {
namespace engine {

namespace {

constexpr std::chrono::milliseconds kPollSlice{50};

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/**
 * RAII pair of pipe file descriptors (close-on-exec)
 */
class Pipe {
public:
    Pipe() {
        if (::pipe2(m_fds, O_CLOEXEC) != 0) {
            m_fds[0] = m_fds[1] = -1;
        }
    }

    ~Pipe() {
        closeFd(m_fds[0]);
        closeFd(m_fds[1]);
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool valid() const { return m_fds[0] >= 0 && m_fds[1] >= 0; }
    int& readEnd() { return m_fds[0]; }
    int& writeEnd() { return m_fds[1]; }

private:
    int m_fds[2] = {-1, -1};
};

/**
 * Sends SIGKILL to a whole process group exactly once
 */
class GroupKiller {
public:
    explicit GroupKiller(pid_t pgid) : m_pgid(pgid) {}

    void kill() {
        if (m_done) return;
        m_done = true;
        // ESRCH just means the group is already empty
        ::kill(-m_pgid, SIGKILL);
    }

private:
    pid_t m_pgid;
    bool m_done = false;
};

struct CaptureStream {
    int fd = -1;
    std::string* text = nullptr;
    bool* overflow = nullptr;
};

// Reads whatever is available; returns false once the stream hit EOF or failed
bool readAvailable(CaptureStream& stream, size_t limit) {
    char buffer[8192];
    while (true) {
        ssize_t n = ::read(stream.fd, buffer, sizeof(buffer));
        if (n > 0) {
            size_t room = stream.text->size() < limit ? limit - stream.text->size() : 0;
            size_t take = std::min(room, static_cast<size_t>(n));
            stream.text->append(buffer, take);
            if (take < static_cast<size_t>(n)) {
                *stream.overflow = true;
            }
            continue;
        }
        if (n == 0) {
            closeFd(stream.fd);
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        closeFd(stream.fd);
        return false;
    }
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> toCharArray(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

void reap(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // anonymous namespace

std::optional<std::string> findExecutable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) return name;
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    std::string path = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";
    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

ProcessResult runProcess(const ProcessSpec& spec) {
    ProcessResult result;
    auto start = std::chrono::steady_clock::now();
    auto finish = [&]() {
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return result;
    };

    if (spec.argv.empty()) {
        result.launchError = "empty command line";
        return finish();
    }

    auto program = findExecutable(spec.argv[0]);
    if (!program) {
        result.launchError = "executable not found: " + spec.argv[0];
        return finish();
    }

    // Everything the child touches is prepared before fork()
    std::vector<std::string> argvStrings = spec.argv;
    std::vector<std::string> envStrings = buildEnvironment(spec.environment);
    std::vector<char*> argvPtrs = toCharArray(argvStrings);
    std::vector<char*> envPtrs = toCharArray(envStrings);
    const char* programPath = program->c_str();
    const char* workDir = spec.workingDirectory.empty() ? nullptr : spec.workingDirectory.c_str();

    Pipe outPipe, errPipe, execPipe;
    if (!outPipe.valid() || !errPipe.valid() || !execPipe.valid()) {
        result.launchError = std::string("pipe failed: ") + std::strerror(errno);
        return finish();
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        result.launchError = std::string("fork failed: ") + std::strerror(errno);
        return finish();
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        ::dup2(outPipe.writeEnd(), STDOUT_FILENO);
        ::dup2(errPipe.writeEnd(), STDERR_FILENO);

        if (workDir && ::chdir(workDir) != 0) {
            int err = errno;
            ssize_t ignored = ::write(execPipe.writeEnd(), &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }

        ::execve(programPath, argvPtrs.data(), envPtrs.data());
        int err = errno;
        ssize_t ignored = ::write(execPipe.writeEnd(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent. Set the group here as well to close the race with the child.
    ::setpgid(pid, pid);
    GroupKiller killer(pid);

    closeFd(outPipe.writeEnd());
    closeFd(errPipe.writeEnd());
    closeFd(execPipe.writeEnd());

    // EOF on the exec pipe means execve succeeded (close-on-exec)
    int execErrno = 0;
    ssize_t got;
    do {
        got = ::read(execPipe.readEnd(), &execErrno, sizeof(execErrno));
    } while (got < 0 && errno == EINTR);

    int status = 0;
    if (got == static_cast<ssize_t>(sizeof(execErrno))) {
        reap(pid, status);
        result.launchError = "cannot launch " + spec.argv[0] + ": " + std::strerror(execErrno);
        return finish();
    }
    result.launched = true;

    CaptureStream streams[2] = {
        {outPipe.readEnd(), &result.stdoutText, &result.stdoutOverflow},
        {errPipe.readEnd(), &result.stderrText, &result.stderrOverflow},
    };
    // The Pipe objects no longer own the read ends
    outPipe.readEnd() = -1;
    errPipe.readEnd() = -1;
    for (auto& stream : streams) {
        int flags = ::fcntl(stream.fd, F_GETFL);
        ::fcntl(stream.fd, F_SETFL, flags | O_NONBLOCK);
    }

    auto deadline = start + spec.timeout;
    bool exited = false;

    while (!exited) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timedOut = true;
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int waitMs = static_cast<int>(std::max<int64_t>(1, std::min(remaining, kPollSlice).count()));

        pollfd fds[2];
        nfds_t count = 0;
        CaptureStream* polled[2] = {nullptr, nullptr};
        for (auto& stream : streams) {
            if (stream.fd >= 0) {
                fds[count].fd = stream.fd;
                fds[count].events = POLLIN;
                fds[count].revents = 0;
                polled[count] = &stream;
                ++count;
            }
        }

        int rc = ::poll(count ? fds : nullptr, count, waitMs);
        if (rc < 0 && errno != EINTR) {
            result.launchError = std::string("poll failed: ") + std::strerror(errno);
            result.timedOut = false;
            killer.kill();
            break;
        }
        for (nfds_t i = 0; rc > 0 && i < count; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                readAvailable(*polled[i], spec.captureLimit);
            }
        }

        // Detect exit without reaping so the group id cannot be recycled yet
        siginfo_t info{};
        info.si_pid = 0;
        if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0
            && info.si_pid == pid) {
            exited = true;
        }
    }

    // Timeout, or stragglers left behind by a child that exited on its own
    killer.kill();
    reap(pid, status);

    for (auto& stream : streams) {
        if (stream.fd >= 0) {
            readAvailable(stream, spec.captureLimit);
            closeFd(stream.fd);
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.termSignal = WTERMSIG(status);
    }

    return finish();
}

} // namespace engine
} // namespace coderun
