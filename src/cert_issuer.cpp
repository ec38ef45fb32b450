#include "cert_issuer.hpp"
#include "errors.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

extern char** environ;

namespace redirector {

namespace {

constexpr int POLL_SLICE_MS = 200;

std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

// Closes a descriptor on scope exit.
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { if (fd_ >= 0) ::close(fd_); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    int get() const { return fd_; }
private:
    int fd_;
};

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw IssuanceError(errno_text("waitpid() failed"));
        }
    }
    return status;
}

void kill_child(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

} // namespace

ExecCertificateIssuer::ExecCertificateIssuer(std::string command, std::string challenge_dir,
                                             std::chrono::seconds timeout)
    : command_(std::move(command))
    , challenge_dir_(std::move(challenge_dir))
    , timeout_(timeout)
{}

std::string ExecCertificateIssuer::issue(const std::string& host, const RequestContext& ctx) {
    ctx.check();

    // Everything the child needs is prepared before fork(); only
    // async-signal-safe calls happen in between fork() and execve().
    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        if (std::strncmp(*e, "REDIRECTOR_CHALLENGE_DIR=", 25) != 0) {
            env_storage.emplace_back(*e);
        }
    }
    env_storage.push_back("REDIRECTOR_CHALLENGE_DIR=" + challenge_dir_);

    std::vector<char*> envp;
    for (auto& s : env_storage) envp.push_back(s.data());
    envp.push_back(nullptr);

    std::string arg0 = command_;
    std::string arg1 = host;
    char* argv[] = {arg0.data(), arg1.data(), nullptr};

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        throw IssuanceError(errno_text("pipe() failed"));
    }
    FdGuard read_end(fds[0]);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[1]);
        throw IssuanceError(errno_text("fork() failed"));
    }

    if (pid == 0) {
        ::dup2(fds[1], STDOUT_FILENO);
        ::execve(argv[0], argv, envp.data());
        ::_exit(127);
    }

    ::close(fds[1]);

    auto deadline = RequestContext::Clock::now() + ctx.remaining(timeout_);
    std::string output;
    char buf[4096];

    while (true) {
        if (ctx.cancelled() || RequestContext::Clock::now() >= deadline) {
            kill_child(pid);
            throw OperationCancelledError(command_ + " did not finish in time for " + host);
        }

        struct pollfd pfd{read_end.get(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, POLL_SLICE_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            kill_child(pid);
            throw IssuanceError(errno_text("poll() failed"));
        }
        if (ready == 0) continue;

        ssize_t n = ::read(read_end.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            kill_child(pid);
            throw IssuanceError(errno_text("read() failed"));
        }
        if (n == 0) break;
        output.append(buf, static_cast<size_t>(n));
    }

    int status = wait_child(pid);

    if (WIFSIGNALED(status)) {
        throw IssuanceError(command_ + " was killed by signal " + std::to_string(WTERMSIG(status)));
    }
    if (!WIFEXITED(status)) {
        throw IssuanceError(command_ + " did not exit");
    }
    if (WEXITSTATUS(status) != 0) {
        throw IssuanceError(command_ + " exited with status " + std::to_string(WEXITSTATUS(status)));
    }
    if (output.empty()) {
        throw IssuanceError(command_ + " produced no certificate for " + host);
    }
    return output;
}

} // namespace redirector
