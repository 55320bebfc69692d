#include "disk/command_runner.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace piprov {

namespace {

std::string JoinArgv(const std::vector<std::string>& argv) {
    std::string s;
    for (const auto& a : argv) {
        if (!s.empty()) s += ' ';
        s += a;
    }
    return s;
}

} // namespace

Result ProcessRunner::Run(const std::vector<std::string>& argv, CommandOutput& out) const {
    if (argv.empty()) return Result::Fail(EINVAL, "empty command line");

    int fds[2];
    if (::pipe(fds) != 0) {
        const int err = errno;
        return Result::Fail(err, "pipe failed (" + std::string(std::strerror(err)) + ")");
    }
    Fd read_end(fds[0]);
    Fd write_end(fds[1]);
    (void)::fcntl(read_end.Get(), F_SETFD, FD_CLOEXEC);
    (void)::fcntl(write_end.Get(), F_SETFD, FD_CLOEXEC);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    LogDebug("exec: %s", JoinArgv(argv).c_str());

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        return Result::Fail(err, "fork failed (" + std::string(std::strerror(err)) + ")");
    }
    if (pid == 0) {
        ::dup2(write_end.Get(), STDOUT_FILENO);
        ::execvp(cargv[0], cargv.data());
        ::_exit(127);
    }

    (void)write_end.Close();

    out.out.clear();
    char buf[4096];
    for (;;) {
        const ssize_t n = ::read(read_end.Get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        out.out.append(buf, static_cast<size_t>(n));
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            const int err = errno;
            return Result::Fail(err, "waitpid failed (" + std::string(std::strerror(err)) + ")");
        }
    }

    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else {
        out.exit_code = -1;
    }
    if (out.exit_code == 127) {
        return Result::Fail(ENOENT, "cannot execute " + argv[0]);
    }
    return Result::Ok();
}

Result RunChecked(const ICommandRunner& runner,
                  const std::vector<std::string>& argv,
                  std::string* out_stdout) {
    CommandOutput out;
    auto r = runner.Run(argv, out);
    if (!r.ok) return r;
    if (out.exit_code != 0) {
        return Result::Fail(ECHILD, JoinArgv(argv) + " exited with status " +
                                        std::to_string(out.exit_code));
    }
    if (out_stdout) *out_stdout = std::move(out.out);
    return Result::Ok();
}

} // namespace piprov
