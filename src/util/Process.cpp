#include "util/Process.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "util/Logger.hpp"

namespace czcheck {
namespace Process {

namespace {

// Exit status the child uses when exec itself fails.
constexpr int EXEC_FAILED = 127;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace

Expected<ProcessResult> run(const std::vector<std::string>& argv,
                            const std::filesystem::path& workingDir) {
    if (argv.empty()) {
        return Error{ErrorCode::InternalError, "Process::run called without a program"};
    }

    std::string cmdline;
    for (const auto& a : argv) {
        if (!cmdline.empty()) cmdline += ' ';
        cmdline += a;
    }
    Logger::instance().debug("Running: " + cmdline);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe(outPipe) != 0) {
        return Error{ErrorCode::IoError, std::string("pipe failed: ") + std::strerror(errno)};
    }
    if (::pipe(errPipe) != 0) {
        int e = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return Error{ErrorCode::IoError, std::string("pipe failed: ") + std::strerror(e)};
    }

    // Build argv before fork: only async-signal-safe calls are allowed in the child.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);
    std::string dir = workingDir.string();

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        return Error{ErrorCode::IoError, std::string("fork failed: ") + std::strerror(e)};
    }

    if (pid == 0) {
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        if (!dir.empty() && ::chdir(dir.c_str()) != 0) {
            ::_exit(EXEC_FAILED);
        }
        ::execvp(cargv[0], cargv.data());
        ::_exit(EXEC_FAILED);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    ProcessResult result;
    pollfd fds[2];
    fds[0] = {outPipe[0], POLLIN, 0};
    fds[1] = {errPipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.out, &result.err};
    int open = 2;
    char buffer[4096];

    while (open > 0) {
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open;
            }
        }
    }
    for (auto& f : fds) {
        if (f.fd >= 0) ::close(f.fd);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Error{ErrorCode::IoError, std::string("waitpid failed: ") + std::strerror(errno)};
        }
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = -WTERMSIG(status);
    }

    if (result.exitCode == EXEC_FAILED && result.out.empty() && result.err.empty()) {
        return Error{ErrorCode::IoError, "Failed to execute '" + argv.front() + "'"};
    }
    return result;
}

}  // namespace Process
}  // namespace czcheck
