#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <pthread.h>
#include <sandpit/sandbox/executor.h>
#include <sandpit/sandbox/protocol.h>
#include <string>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace sandpit::sandbox
{

using namespace sandpit::result;

namespace
{

// Raw stdout bytes accepted from a runner beyond the JSON-escaped output cap.
constexpr std::size_t kResponseOverheadBytes = 64 * 1024;
// Stderr is drained so the runner never blocks on it, but only a prefix is kept.
constexpr std::size_t kStderrKeepBytes = 4096;
// The interpreter recurses on the native stack; give the runner room for deep scripts.
constexpr rlim_t kRunnerStackBytes = 256u * 1024u * 1024u;
constexpr int kPollSliceMs = 50;

std::atomic<unsigned long> next_request_id{1};

/** @brief Owning file descriptor. */
class Fd
{
  public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }
    Fd(Fd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    Fd& operator=(Fd&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

    void reset()
    {
        if (fd_ >= 0)
        {
            (void)close(fd_);
            fd_ = -1;
        }
    }

  private:
    int fd_ = -1;
};

struct Pipe
{
    Fd read;
    Fd write;
};

bool make_pipe(Pipe& p)
{
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0)
    {
        return false;
    }
    p.read = Fd(fds[0]);
    p.write = Fd(fds[1]);
    return true;
}

void set_nonblocking(int fd)
{
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1)
    {
        return;
    }
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

std::string errno_text(std::string_view what, int err)
{
    return std::string(what) + ": " + std::strerror(err);
}

/**
 * @brief Blocks SIGPIPE in the calling thread while writing to a runner that may have exited.
 *
 * A SIGPIPE raised while blocked stays pending; it is consumed before the old mask returns.
 */
class SigpipeBlock
{
  public:
    SigpipeBlock()
    {
        sigemptyset(&set_);
        sigaddset(&set_, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        (void)sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;
        (void)pthread_sigmask(SIG_BLOCK, &set_, &old_);
    }

    ~SigpipeBlock()
    {
        sigset_t pending;
        sigemptyset(&pending);
        (void)sigpending(&pending);
        if (!was_pending_ && sigismember(&pending, SIGPIPE) == 1)
        {
            const timespec zero{.tv_sec = 0, .tv_nsec = 0};
            (void)sigtimedwait(&set_, nullptr, &zero);
        }
        (void)pthread_sigmask(SIG_SETMASK, &old_, nullptr);
    }

    SigpipeBlock(const SigpipeBlock&) = delete;
    SigpipeBlock& operator=(const SigpipeBlock&) = delete;

  private:
    sigset_t set_{};
    sigset_t old_{};
    bool was_pending_ = false;
};

struct ProcResult
{
    std::string spawn_error;
    std::string reap_error;
    bool timed_out = false;
    bool output_limit_exceeded = false;
    int exit_code = -1;
    int term_signal = 0;
    std::string out;
    std::string err;
    std::int64_t elapsed_ms = 0;
};

void read_into(int fd, std::string& out, bool& eof, std::size_t max_bytes, bool& limit_hit,
               bool drop_excess)
{
    char buf[4096];
    while (true)
    {
        const ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0)
        {
            const auto count = static_cast<std::size_t>(n);
            const std::size_t remaining = max_bytes - std::min(max_bytes, out.size());
            const std::size_t to_append = std::min(count, remaining);
            out.append(buf, to_append);
            if (to_append < count && !drop_excess)
            {
                limit_hit = true;
                return;
            }
            continue;
        }
        if (n == 0)
        {
            eof = true;
            return;
        }
        if (errno == EINTR)
        {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK)
        {
            eof = true;
        }
        return;
    }
}

std::string resolve_on_path(const std::string& name)
{
    if (name.find('/') != std::string::npos)
    {
        return name;
    }
    const char* path = std::getenv("PATH");
    if (path == nullptr)
    {
        return name;
    }
    std::string_view dirs(path);
    while (!dirs.empty())
    {
        const std::size_t colon = dirs.find(':');
        const std::string_view dir = dirs.substr(0, colon);
        dirs = colon == std::string_view::npos ? std::string_view{} : dirs.substr(colon + 1);
        const std::string candidate = std::string(dir.empty() ? "." : dir) + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0)
        {
            return candidate;
        }
    }
    return name;
}

pid_t wait_for(pid_t pid, int& status)
{
    while (true)
    {
        const pid_t r = waitpid(pid, &status, 0);
        if (r >= 0 || errno != EINTR)
        {
            return r;
        }
    }
}

void record_status(ProcResult& result, int status)
{
    if (WIFEXITED(status))
    {
        result.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        result.term_signal = WTERMSIG(status);
    }
}

ProcResult run_process(const std::string& exe_path, const std::string& stdin_data,
                       std::chrono::milliseconds deadline, std::size_t max_output_bytes)
{
    ProcResult result;
    Pipe in_pipe;
    Pipe out_pipe;
    Pipe err_pipe;
    Pipe exec_pipe;
    if (!make_pipe(in_pipe) || !make_pipe(out_pipe) || !make_pipe(err_pipe) ||
        !make_pipe(exec_pipe))
    {
        result.spawn_error = errno_text("pipe2 failed", errno);
        return result;
    }

    // Everything the child touches is prepared before fork; the child only makes syscalls.
    const std::string path = resolve_on_path(exe_path);
    std::vector<char*> argv{const_cast<char*>(path.c_str()), nullptr};
    std::vector<char*> envp{nullptr};
    rlimit stack_limit{};
    const bool raise_stack = getrlimit(RLIMIT_STACK, &stack_limit) == 0;
    if (raise_stack)
    {
        stack_limit.rlim_cur = (stack_limit.rlim_max == RLIM_INFINITY)
                                   ? kRunnerStackBytes
                                   : std::min(kRunnerStackBytes, stack_limit.rlim_max);
    }
    const rlimit no_core{.rlim_cur = 0, .rlim_max = 0};
    const pid_t parent = getpid();

    // The deadline clock starts at spawn, not at evaluation: runner startup counts against it.
    const auto start = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0)
    {
        result.spawn_error = errno_text("fork failed", errno);
        return result;
    }

    if (pid == 0)
    {
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
        if (getppid() != parent)
        {
            _exit(127);
        }
        (void)setrlimit(RLIMIT_CORE, &no_core);
        if (raise_stack)
        {
            (void)setrlimit(RLIMIT_STACK, &stack_limit);
        }
        if (dup2(in_pipe.read.get(), STDIN_FILENO) < 0 ||
            dup2(out_pipe.write.get(), STDOUT_FILENO) < 0 ||
            dup2(err_pipe.write.get(), STDERR_FILENO) < 0)
        {
            const int code = errno;
            (void)!write(exec_pipe.write.get(), &code, sizeof(code));
            _exit(127);
        }
        execve(path.c_str(), argv.data(), envp.data());
        const int code = errno;
        (void)!write(exec_pipe.write.get(), &code, sizeof(code));
        _exit(127);
    }

    in_pipe.read.reset();
    out_pipe.write.reset();
    err_pipe.write.reset();
    exec_pipe.write.reset();

    // The exec pipe is close-on-exec: EOF means execve succeeded.
    int exec_errno = 0;
    ssize_t got = 0;
    do
    {
        got = read(exec_pipe.read.get(), &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        int status = 0;
        (void)wait_for(pid, status);
        result.spawn_error = errno_text("failed to start runner '" + path + "'", exec_errno);
        return result;
    }

    set_nonblocking(in_pipe.write.get());
    set_nonblocking(out_pipe.read.get());
    set_nonblocking(err_pipe.read.get());

    const std::size_t max_stdout = max_output_bytes * 6 + kResponseOverheadBytes;
    std::size_t written = 0;
    bool out_eof = false;
    bool err_eof = false;
    bool reaped = false;
    bool limit_hit = false;
    int status = 0;
    {
        SigpipeBlock sigpipe;
        while (true)
        {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            if (elapsed >= deadline)
            {
                result.timed_out = true;
                break;
            }
            const int remaining_ms = static_cast<int>((deadline - elapsed).count());
            const int slice = std::min(remaining_ms, kPollSliceMs);

            if (out_eof && err_eof)
            {
                const pid_t r = waitpid(pid, &status, WNOHANG);
                if (r == pid)
                {
                    reaped = true;
                    break;
                }
                if (r < 0 && errno != EINTR)
                {
                    result.reap_error = errno_text("waitpid failed", errno);
                    break;
                }
                (void)poll(nullptr, 0, std::min(slice, 5));
                continue;
            }

            pollfd fds[3];
            nfds_t count = 0;
            if (!out_eof)
            {
                fds[count++] = pollfd{.fd = out_pipe.read.get(), .events = POLLIN, .revents = 0};
            }
            if (!err_eof)
            {
                fds[count++] = pollfd{.fd = err_pipe.read.get(), .events = POLLIN, .revents = 0};
            }
            if (in_pipe.write.valid())
            {
                fds[count++] = pollfd{.fd = in_pipe.write.get(), .events = POLLOUT, .revents = 0};
            }
            (void)poll(fds, count, slice);

            if (in_pipe.write.valid())
            {
                const ssize_t n = write(in_pipe.write.get(), stdin_data.data() + written,
                                        stdin_data.size() - written);
                if (n > 0)
                {
                    written += static_cast<std::size_t>(n);
                }
                if ((n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) ||
                    written == stdin_data.size())
                {
                    in_pipe.write.reset();
                }
            }
            if (!out_eof)
            {
                read_into(out_pipe.read.get(), result.out, out_eof, max_stdout, limit_hit, false);
            }
            if (!err_eof)
            {
                read_into(err_pipe.read.get(), result.err, err_eof, kStderrKeepBytes, limit_hit,
                          true);
            }
            if (limit_hit)
            {
                result.output_limit_exceeded = true;
                break;
            }
        }
        in_pipe.write.reset();
    }
    out_pipe.read.reset();
    err_pipe.read.reset();

    if (!reaped && result.reap_error.empty())
    {
        if (kill(pid, SIGKILL) != 0 && errno != ESRCH)
        {
            result.reap_error = errno_text("kill failed", errno);
        }
        else if (wait_for(pid, status) < 0)
        {
            result.reap_error = errno_text("waitpid failed", errno);
        }
        else
        {
            reaped = true;
        }
    }
    if (reaped)
    {
        record_status(result, status);
    }
    result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - start)
                            .count();
    return result;
}

std::string first_line(const std::string& out)
{
    const std::size_t nl = out.find('\n');
    return nl == std::string::npos ? out : out.substr(0, nl);
}

ExecutionOutcome classify(const ProcResult& proc)
{
    if (!proc.spawn_error.empty())
    {
        return IsolationFailure{.detail = proc.spawn_error};
    }
    if (!proc.reap_error.empty())
    {
        return IsolationFailure{.detail = proc.reap_error};
    }
    if (proc.timed_out)
    {
        return Timeout{.elapsed_ms = proc.elapsed_ms};
    }
    if (proc.output_limit_exceeded)
    {
        return RuntimeFailure{.message = "Your program produced too much output.",
                              .partial_output = ""};
    }
    if (proc.term_signal != 0)
    {
        return RuntimeFailure{.message = "Your program crashed (signal " +
                                         std::to_string(proc.term_signal) + ").",
                              .partial_output = ""};
    }

    const auto response = decode_response(first_line(proc.out));
    if (!response.has_value())
    {
        return IsolationFailure{.detail = "runner exited with code " +
                                          std::to_string(proc.exit_code) +
                                          " without a well-formed response"};
    }
    if (response->ok)
    {
        return Success{.captured_output = response->output, .truncated = response->truncated};
    }
    const ResponseError& error = *response->error;
    if (error.kind == kValidationError)
    {
        return ValidationRejected{.reason = error.message};
    }
    if (error.kind == kRuntimeError)
    {
        return RuntimeFailure{.message = error.message, .partial_output = response->output};
    }
    return IsolationFailure{.detail = "runner rejected the request: " + error.kind + ": " +
                                      error.message};
}

std::string make_id()
{
    return "req-" + std::to_string(next_request_id.fetch_add(1));
}

} // namespace

std::string find_runner_path(std::string_view configured)
{
    if (!configured.empty())
    {
        return std::string(configured);
    }
    if (const char* env = std::getenv("SANDPIT_RUNNER"); env != nullptr && *env != '\0')
    {
        return std::string(env);
    }

    char buf[4096];
    const ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n > 0)
    {
        buf[n] = '\0';
        std::error_code ec;
        const std::filesystem::path self(buf);
        const auto candidate = self.parent_path() / "sandpit_runner";
        if (std::filesystem::exists(candidate, ec))
        {
            return candidate.string();
        }
    }

    return "sandpit_runner";
}

Executor::Executor(ExecutorOptions options) : options_(std::move(options))
{
    options_.runner_path = find_runner_path(options_.runner_path);
}

ExecutionOutcome Executor::execute(std::string_view source) const
{
    return execute(source, options_.deadline);
}

ExecutionOutcome Executor::execute(std::string_view source, std::chrono::milliseconds deadline) const
{
    const std::string request = encode_request(Request{RunRequest{
        .id = make_id(), .source = std::string(source), .max_output_bytes = options_.max_output_bytes}});
    return classify(run_process(options_.runner_path, request, deadline, options_.max_output_bytes));
}

std::optional<std::string> Executor::handshake() const
{
    const std::string request = encode_request(Request{HandshakeRequest{.id = make_id()}});
    const auto proc = run_process(options_.runner_path, request, options_.deadline, 0);
    if (!proc.spawn_error.empty())
    {
        return proc.spawn_error;
    }
    if (!proc.reap_error.empty())
    {
        return proc.reap_error;
    }
    if (proc.timed_out)
    {
        return std::string("runner did not answer the handshake in time");
    }
    const auto response = decode_response(first_line(proc.out));
    if (!response.has_value())
    {
        return "runner sent a malformed handshake response (exit code " +
               std::to_string(proc.exit_code) + ")";
    }
    if (!response->ok || response->output != "ok")
    {
        return std::string("runner rejected the handshake");
    }
    return std::nullopt;
}

} // namespace sandpit::sandbox
