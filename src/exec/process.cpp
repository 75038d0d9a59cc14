#include "scriptbox/exec/process.hpp"

#include "scriptbox/core/logger.hpp"
#include "scriptbox/core/types.hpp"
#include "scriptbox/core/utils.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace scriptbox::exec {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;
constexpr auto kExitPollInterval = std::chrono::milliseconds(5);
constexpr auto kPollSlice = std::chrono::milliseconds(50);

/// Owning file descriptor.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }

    Fd(Fd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    Fd& operator=(Fd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }

    void reset() noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    Fd read;
    Fd write;
};

auto make_pipe(Pipe& p) -> bool {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return false;
    p.read = Fd(fds[0]);
    p.write = Fd(fds[1]);
    return true;
}

auto errno_text(std::string_view what) -> std::string {
    return std::string(what) + ": " + std::strerror(errno);
}

auto decode_wait_status(int status) -> int {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

/// Kills every process in the child's group. The leader must not have been
/// reaped yet, so its pid (and therefore the group id) cannot be recycled.
void kill_group(pid_t pid) {
    if (::kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        LOG_WARN("kill(-{}, SIGKILL) failed: {}", pid, std::strerror(errno));
    }
}

auto reap(pid_t pid) -> int {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            LOG_WARN("waitpid({}) failed: {}", pid, std::strerror(errno));
            return -1;
        }
    }
    return decode_wait_status(status);
}

/// True once the child has exited. The child is left unreaped.
auto has_exited(pid_t pid) -> bool {
    for (;;) {
        siginfo_t info{};
        if (::waitid(P_PID, static_cast<id_t>(pid), &info,
                     WEXITED | WNOHANG | WNOWAIT) == 0) {
            return info.si_pid == pid;
        }
        if (errno != EINTR) {
            LOG_WARN("waitid({}) failed: {}", pid, std::strerror(errno));
            return true;
        }
    }
}

/// Waits (without reaping) until the child exits or the deadline passes.
auto wait_for_exit(pid_t pid, Clock::time_point deadline) -> bool {
    for (;;) {
        if (has_exited(pid)) return true;
        if (Clock::now() >= deadline) return false;
        std::this_thread::sleep_for(kExitPollInterval);
    }
}

/// Reads what is available on `fd`. Returns false once the stream is done.
auto drain(int fd, std::string& sink, std::size_t limit) -> bool {
    std::array<char, kReadChunk> buf;
    auto n = ::read(fd, buf.data(), buf.size());
    if (n > 0) {
        auto room = sink.size() < limit ? limit - sink.size() : 0;
        sink.append(buf.data(), std::min(room, static_cast<std::size_t>(n)));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    return false;
}

} // anonymous namespace

auto resolve_executable(std::string_view name) -> std::string {
    if (name.empty()) return {};
    if (name.find('/') != std::string_view::npos) return std::string(name);

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    for (const auto& dir : utils::split(search, ':')) {
        auto candidate = (dir.empty() ? std::string(".") : dir) + "/" + std::string(name);
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return {};
}

auto run_process(const std::vector<std::string>& argv,
                 std::chrono::milliseconds timeout,
                 std::size_t max_output_bytes) -> ExecutionReport {
    if (argv.empty()) {
        return {LaunchFailed{"empty command line"}, {}};
    }

    auto program = resolve_executable(argv.front());
    if (program.empty()) {
        return {LaunchFailed{"executable not found: " + argv.front()}, {}};
    }

    Pipe out, err, exec_status;
    if (!make_pipe(out) || !make_pipe(err) || !make_pipe(exec_status)) {
        return {LaunchFailed{errno_text("pipe2")}, {}};
    }

    // Everything the child touches is prepared before fork().
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return {LaunchFailed{errno_text("fork")}, {}};
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::setsid();
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out.write.get(), STDOUT_FILENO);
        ::dup2(err.write.get(), STDERR_FILENO);
        ::execv(program.c_str(), cargv.data());

        int code = errno;
        [[maybe_unused]] auto n = ::write(exec_status.write.get(), &code, sizeof(code));
        ::_exit(127);
    }

    out.write.reset();
    err.write.reset();
    exec_status.write.reset();

    // The status pipe is close-on-exec: EOF means execv succeeded.
    int child_errno = 0;
    ssize_t status_len;
    do {
        status_len = ::read(exec_status.read.get(), &child_errno, sizeof(child_errno));
    } while (status_len < 0 && errno == EINTR);
    if (status_len == static_cast<ssize_t>(sizeof(child_errno))) {
        reap(pid);
        return {LaunchFailed{"exec " + program + ": " + std::strerror(child_errno)}, {}};
    }

    LOG_DEBUG("Spawned {} (pid={}, timeout={}ms)", program, pid, timeout.count());

    auto deadline = Clock::now() + timeout;
    std::string stdout_text;
    std::string stderr_text;

    std::array<pollfd, 2> fds{{
        {out.read.get(), POLLIN, 0},
        {err.read.get(), POLLIN, 0},
    }};
    std::array<std::string*, 2> sinks{&stdout_text, &stderr_text};

    bool timed_out = false;
    std::string poll_error;
    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        auto slice = std::min(remaining, kPollSlice);
        int rc = ::poll(fds.data(), fds.size(), static_cast<int>(slice.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            poll_error = errno_text("poll");
            break;
        }
        // A background descendant may hold the pipes open after the leader
        // has exited; once they go quiet the run is over.
        if (rc == 0) {
            if (has_exited(pid)) break;
            continue;
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            if (!drain(fds[i].fd, *sinks[i], max_output_bytes)) {
                // A negative fd is ignored by poll().
                fds[i].fd = -1;
            }
        }
    }

    if (!timed_out && poll_error.empty()) {
        timed_out = !wait_for_exit(pid, deadline);
    }

    kill_group(pid);
    int exit_code = reap(pid);

    if (timed_out) {
        LOG_WARN("pid {} exceeded {}ms, process group killed", pid, timeout.count());
        return {TimedOut{}, std::move(stderr_text)};
    }
    if (!poll_error.empty()) {
        return {LaunchFailed{poll_error}, std::move(stderr_text)};
    }

    LOG_DEBUG("pid {} exited with {} ({} stdout bytes, {} stderr bytes)",
              pid, exit_code, stdout_text.size(), stderr_text.size());
    return {Completed{exit_code, std::move(stdout_text)}, std::move(stderr_text)};
}

} // namespace scriptbox::exec
