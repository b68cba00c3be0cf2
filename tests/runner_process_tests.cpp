#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

[[noreturn]] static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

struct ProcResult
{
    int exit_code = -1;
    std::string out;
    std::string err;
};

static void set_nonblocking(int fd)
{
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1)
    {
        fail(std::string("fcntl(F_GETFL) failed: ") + std::strerror(errno));
    }
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
    {
        fail(std::string("fcntl(F_SETFL) failed: ") + std::strerror(errno));
    }
}

static void read_into(int fd, std::string& out, bool& eof)
{
    char buf[4096];
    while (true)
    {
        const ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0)
        {
            out.append(buf, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0)
        {
            eof = true;
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            return;
        }
        fail(std::string("read failed: ") + std::strerror(errno));
    }
}

static ProcResult run_runner(const std::string& exe_path, const std::string& stdin_data)
{
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe(err_pipe) != 0)
    {
        fail(std::string("pipe failed: ") + std::strerror(errno));
    }

    const pid_t pid = fork();
    if (pid < 0)
    {
        fail(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0)
    {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        close(in_pipe[0]);
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(exe_path.c_str()));
        argv.push_back(nullptr);

        execv(exe_path.c_str(), argv.data());
        _exit(127);
    }

    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);

    // Send input then close stdin.
    {
        const char* data = stdin_data.data();
        std::size_t remaining = stdin_data.size();
        while (remaining > 0)
        {
            const ssize_t n = write(in_pipe[1], data, remaining);
            if (n < 0)
            {
                fail(std::string("write failed: ") + std::strerror(errno));
            }
            data += n;
            remaining -= static_cast<std::size_t>(n);
        }
        close(in_pipe[1]);
    }

    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    ProcResult result;
    bool out_eof = false;
    bool err_eof = false;

    while (!out_eof || !err_eof)
    {
        struct pollfd fds[2];
        fds[0].fd = out_pipe[0];
        fds[0].events = POLLIN;
        fds[1].fd = err_pipe[0];
        fds[1].events = POLLIN;

        const int rc = poll(fds, 2, 1000);
        if (rc < 0)
        {
            fail(std::string("poll failed: ") + std::strerror(errno));
        }

        if (!out_eof)
        {
            read_into(out_pipe[0], result.out, out_eof);
        }
        if (!err_eof)
        {
            read_into(err_pipe[0], result.err, err_eof);
        }
    }

    close(out_pipe[0]);
    close(err_pipe[0]);

    int status = 0;
    if (waitpid(pid, &status, 0) < 0)
    {
        fail(std::string("waitpid failed: ") + std::strerror(errno));
    }
    if (WIFEXITED(status))
    {
        result.exit_code = WEXITSTATUS(status);
    }
    else
    {
        result.exit_code = 128;
    }
    return result;
}

int main(int argc, char** argv)
{
    if (argc != 2)
    {
        fail("usage: runner_process_tests <path-to-sandpit_runner>");
    }
    const std::string runner = argv[1];

    {
        const auto res = run_runner(runner, "");
        if (res.exit_code != 2)
        {
            fail("expected empty input to exit 2");
        }
        const std::string expected = "{\"error\":{\"kind\":\"invalid_request\",\"message\":\"empty "
                                     "input\"},\"id\":\"\",\"ok\":false,\"output\":\"\","
                                     "\"protocol_version\":1}\n";
        if (res.out != expected)
        {
            fail("empty input stdout mismatch: " + res.out);
        }
    }

    {
        const auto res =
            run_runner(runner, "{\"protocol_version\":1,\"id\":\"t1\",\"op\":\"handshake\"}\n");
        if (res.exit_code != 0)
        {
            fail("expected handshake to exit 0");
        }
        const std::string expected = "{\"id\":\"t1\",\"ok\":true,\"protocol_version\":1,\"result\":"
                                     "{\"output\":\"ok\",\"truncated\":false}}\n";
        if (res.out != expected)
        {
            fail("handshake stdout mismatch: " + res.out);
        }
        if (!res.err.empty())
        {
            fail("handshake expected empty stderr");
        }
    }

    {
        const auto res = run_runner(runner, "{\"protocol_version\":1,\"id\":\"t2\",\"op\":\"run\","
                                            "\"source\":\"for i in range(3):\\n    print(i)\"}\n");
        const std::string expected = "{\"id\":\"t2\",\"ok\":true,\"protocol_version\":1,\"result\":"
                                     "{\"output\":\"0\\n1\\n2\\n\",\"truncated\":false}}\n";
        if (res.exit_code != 0 || res.out != expected)
        {
            fail("run stdout mismatch: " + res.out);
        }
    }

    {
        // Script faults are answered normally; the runner itself does not fail.
        const auto res = run_runner(runner, "{\"protocol_version\":1,\"id\":\"t3\",\"op\":\"run\","
                                            "\"source\":\"print(undefined)\"}\n");
        if (res.exit_code != 0 || res.out.find("\"kind\":\"runtime_error\"") == std::string::npos ||
            res.out.find("NameError: name 'undefined' is not defined (line 1)") == std::string::npos)
        {
            fail("runtime error stdout mismatch: " + res.out);
        }
    }

    {
        const auto res =
            run_runner(runner, "{\"protocol_version\":1,\"id\":\"t4\",\"op\":\"run\",\"source\":"
                               "\"a = []\\na.append(a)\\nb = []\\nb.append(b)\\nprint(a == b)\"}\n");
        if (res.exit_code != 0 ||
            res.out.find("RecursionError: maximum recursion depth exceeded in comparison") ==
                std::string::npos)
        {
            fail("self-referential comparison stdout: " + res.out);
        }
    }

    {
        const auto res =
            run_runner(runner, "{\"protocol_version\":1,\"id\":\"t6\",\"op\":\"run\",\"source\":"
                               "\"x = []\\nfor i in range(100000):\\n    x = [x]\\nx = 0\\n"
                               "print('freed')\"}\n");
        const std::string expected = "{\"id\":\"t6\",\"ok\":true,\"protocol_version\":1,\"result\":"
                                     "{\"output\":\"freed\\n\",\"truncated\":false}}\n";
        if (res.exit_code != 0 || res.out != expected)
        {
            fail("deep list teardown stdout: " + res.out);
        }
    }

    {
        const auto res = run_runner(runner, "{\"protocol_version\":7,\"id\":\"t5\",\"op\":\"handshake\"}\n");
        if (res.exit_code != 2 ||
            res.out.find("\"kind\":\"protocol_version_unsupported\"") == std::string::npos)
        {
            fail("version mismatch stdout: " + res.out);
        }
    }

    std::cout << "OK\n";
    return 0;
}
