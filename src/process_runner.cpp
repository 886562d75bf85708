#include <shellsense/process_runner.h>

#include <cerrno>
#include <csignal>
#include <ctime>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace shellsense {

namespace {

using Clock = std::chrono::steady_clock;

void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void fillExitStatus(ProcessResult& result, int status) {
    if (WIFEXITED(status)) {
        result.status = ProcessResult::Status::Exited;
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.status = ProcessResult::Status::Signaled;
        result.exitCode = 128 + WTERMSIG(status);
    }
}

void killAndReap(pid_t pid) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

std::vector<std::string> ProcessResult::lines() const {
    std::vector<std::string> result;
    size_t start = 0;
    while (start <= this->output.size()) {
        size_t end = this->output.find('\n', start);
        if (end == std::string::npos) {
            end = this->output.size();
        }
        std::string line = this->output.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            result.push_back(std::move(line));
        }
        start = end + 1;
    }
    return result;
}

PosixProcessRunner::PosixProcessRunner(ShellEnvironment environment, size_t maxOutputBytes)
    : environment(std::move(environment))
    , maxOutputBytes(maxOutputBytes)
{
}

ProcessResult PosixProcessRunner::run(const ProcessRequest& request) {
    ProcessResult result;
    if (request.argv.empty()) {
        return result;
    }

    auto executable = this->environment.findExecutable(request.argv[0]);
    if (!executable) {
        return result;
    }

    // Everything the child needs is prepared before fork
    std::string executablePath = executable->string();
    std::string workingDirectory = request.workingDirectory.string();
    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& argument : request.argv) {
        argv.push_back(const_cast<char*>(argument.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> environmentStrings;
    for (const auto& [name, value] : this->environment.getVariables()) {
        environmentStrings.push_back(name + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(environmentStrings.size() + 1);
    for (auto& entry : environmentStrings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    int stdinPipe[2] = {-1, -1};
    int stdoutPipe[2] = {-1, -1};
    if (pipe(stdinPipe) != 0) {
        return result;
    }
    if (pipe(stdoutPipe) != 0) {
        closeFd(stdinPipe[0]);
        closeFd(stdinPipe[1]);
        return result;
    }

    pid_t childPid = fork();
    if (childPid < 0) {
        closeFd(stdinPipe[0]);
        closeFd(stdinPipe[1]);
        closeFd(stdoutPipe[0]);
        closeFd(stdoutPipe[1]);
        return result;
    }

    if (childPid == 0) {
        // Child process
        setpgid(0, 0);
        dup2(stdinPipe[0], STDIN_FILENO);
        dup2(stdoutPipe[1], STDOUT_FILENO);
        int devNull = open("/dev/null", O_WRONLY);
        if (devNull >= 0) {
            dup2(devNull, STDERR_FILENO);
            close(devNull);
        }
        close(stdinPipe[0]);
        close(stdinPipe[1]);
        close(stdoutPipe[0]);
        close(stdoutPipe[1]);
        if (!workingDirectory.empty() && chdir(workingDirectory.c_str()) != 0) {
            _exit(127);
        }
        execve(executablePath.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    setpgid(childPid, childPid);
    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    int inputFd = stdinPipe[1];
    int outputFd = stdoutPipe[0];
    setNonBlocking(inputFd);
    setNonBlocking(outputFd);
    if (request.input.empty()) {
        closeFd(inputFd);
    }

    // A child that exits before reading its input must not kill us with SIGPIPE
    sigset_t pipeMask;
    sigset_t previousMask;
    sigemptyset(&pipeMask);
    sigaddset(&pipeMask, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipeMask, &previousMask);

    const auto deadline = Clock::now() + request.timeout;
    size_t written = 0;
    bool timedOut = false;
    char buffer[4096];

    while (outputFd >= 0) {
        auto now = Clock::now();
        if (now >= deadline) {
            timedOut = true;
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

        struct pollfd fds[2];
        nfds_t count = 0;
        fds[count++] = {outputFd, POLLIN, 0};
        if (inputFd >= 0) {
            fds[count++] = {inputFd, POLLOUT, 0};
        }

        int ready = poll(fds, count, static_cast<int>(remaining > 0 ? remaining : 1));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t bytesRead = read(outputFd, buffer, sizeof(buffer));
            if (bytesRead > 0) {
                size_t room = this->maxOutputBytes > result.output.size() ? this->maxOutputBytes - result.output.size() : 0;
                result.output.append(buffer, std::min(room, static_cast<size_t>(bytesRead)));
            } else if (bytesRead == 0 || (errno != EAGAIN && errno != EINTR)) {
                closeFd(outputFd);
            }
        }

        if (count > 1 && inputFd >= 0 && fds[1].revents != 0) {
            if (fds[1].revents & (POLLERR | POLLHUP)) {
                closeFd(inputFd);
            } else if (fds[1].revents & POLLOUT) {
                ssize_t bytesWritten = write(inputFd, request.input.data() + written, request.input.size() - written);
                if (bytesWritten > 0) {
                    written += static_cast<size_t>(bytesWritten);
                    if (written >= request.input.size()) {
                        closeFd(inputFd);
                    }
                } else if (bytesWritten < 0 && errno != EAGAIN && errno != EINTR) {
                    closeFd(inputFd);
                }
            }
        }
    }

    closeFd(inputFd);
    closeFd(outputFd);

    struct timespec noWait = {0, 0};
    while (sigtimedwait(&pipeMask, nullptr, &noWait) > 0) {
    }
    pthread_sigmask(SIG_SETMASK, &previousMask, nullptr);

    if (timedOut) {
        killAndReap(childPid);
        result.status = ProcessResult::Status::TimedOut;
        return result;
    }

    // Output is closed; give the child the rest of the deadline to exit
    int status = 0;
    while (true) {
        pid_t waited = waitpid(childPid, &status, WNOHANG);
        if (waited == childPid) {
            fillExitStatus(result, status);
            return result;
        }
        if (waited < 0 && errno != EINTR) {
            result.status = ProcessResult::Status::LaunchFailed;
            return result;
        }
        if (Clock::now() >= deadline) {
            killAndReap(childPid);
            result.status = ProcessResult::Status::TimedOut;
            return result;
        }
        usleep(2000);
    }
}

} // namespace shellsense
