/*
 * ocrd - Document OCR Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "ocrd/pipeline.hpp"
#include "ocrd/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <thread>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ocrd {

namespace {

constexpr std::size_t kMaxCaptureBytes = 1024 * 1024;

std::string errnoMessage(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

std::string trimTrailing(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                             text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }
    return text;
}

std::string joinArgs(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) joined += ' ';
        joined += arg;
    }
    return joined;
}

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Reads whatever is available on fd into sink. Returns false on EOF or error.
bool drain(int fd, std::string& sink) {
    char buffer[8192];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        std::size_t room = kMaxCaptureBytes > sink.size() ? kMaxCaptureBytes - sink.size() : 0;
        sink.append(buffer, std::min(room, static_cast<std::size_t>(n)));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

int waitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return status;
}

}

ProcessPipeline::ProcessPipeline(std::vector<std::string> command, std::chrono::seconds timeout)
    : command_(std::move(command)), timeout_(timeout) {
    LOG_DEBUG("Pipeline command: " + joinArgs(command_));
}

std::vector<std::string> ProcessPipeline::buildArguments(const std::filesystem::path& workspace,
                                                         const std::filesystem::path& source,
                                                         const PipelineOptions& options) const {
    std::vector<std::string> args = command_;
    args.push_back(workspace.string());
    if (options.markdown) args.emplace_back("--markdown");
    if (options.extractTables) args.emplace_back("--extract_tables");
    if (options.extractFigures) args.emplace_back("--extract_figures");
    args.emplace_back("--pdfs");
    args.push_back(source.string());
    return args;
}

PipelineResult ProcessPipeline::run(const std::filesystem::path& workspace,
                                    const std::filesystem::path& source,
                                    const PipelineOptions& options) {
    PipelineResult result;

    std::vector<std::string> args = buildArguments(workspace, source, options);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // the child may only make async-signal-safe calls, so this is built up front
    const std::string execFailure = "cannot execute " + args.front() + "\n";

    LOG_DEBUG("Executing: " + joinArgs(args));

    // O_CLOEXEC keeps these descriptors out of children forked concurrently by other workers
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        result.error = errnoMessage("pipe");
        return result;
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        result.error = errnoMessage("pipe");
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return result;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = errnoMessage("fork");
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::execvp(argv[0], argv.data());
        ssize_t ignored = ::write(STDERR_FILENO, execFailure.data(), execFailure.size());
        (void)ignored;
        ::_exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    const bool bounded = timeout_.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    bool timedOut = false;

    while (outPipe[0] >= 0 || errPipe[0] >= 0) {
        int waitMs = -1;
        if (bounded) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                timedOut = true;
                break;
            }
            waitMs = static_cast<int>(std::min<long long>(left, 1000));
        }

        pollfd fds[2];
        nfds_t count = 0;
        int* owners[2];
        std::string* sinks[2];
        if (outPipe[0] >= 0) {
            fds[count] = {outPipe[0], POLLIN, 0};
            owners[count] = &outPipe[0];
            sinks[count] = &result.output;
            ++count;
        }
        if (errPipe[0] >= 0) {
            fds[count] = {errPipe[0], POLLIN, 0};
            owners[count] = &errPipe[0];
            sinks[count] = &result.error;
            ++count;
        }

        int ready = ::poll(fds, count, waitMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR(errnoMessage("poll"));
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                if (!drain(fds[i].fd, *sinks[i])) {
                    closeFd(*owners[i]);
                }
            }
        }
    }

    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    // The child may close its streams and keep running; honour the deadline here too
    int status = 0;
    bool reaped = false;
    while (bounded && !timedOut && !reaped) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            reaped = true;
        } else if (done < 0 && errno != EINTR) {
            break;
        } else if (std::chrono::steady_clock::now() >= deadline) {
            timedOut = true;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    if (timedOut) {
        LOG_WARN("Pipeline exceeded " + std::to_string(timeout_.count()) + "s, killing pid " + std::to_string(pid));
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
    }
    if (!reaped) {
        status = waitForChild(pid);
    }
    if (timedOut) {
        result.ok = false;
        result.error = "pipeline timed out after " + std::to_string(timeout_.count()) + " seconds";
        return result;
    }
    if (status < 0) {
        result.error = errnoMessage("waitpid");
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        result.ok = result.exitCode == 0;
        if (result.ok) {
            // stderr of a successful run is diagnostic noise, keep it out of the error slot
            if (!result.error.empty()) {
                LOG_DEBUG("Pipeline stderr: " + trimTrailing(result.error));
            }
            result.error.clear();
        } else {
            result.error = trimTrailing(result.error);
            if (result.error.empty()) {
                result.error = "pipeline exited with code " + std::to_string(result.exitCode);
            }
        }
    } else if (WIFSIGNALED(status)) {
        result.error = "pipeline terminated by signal " + std::to_string(WTERMSIG(status));
    } else {
        result.error = "pipeline ended in an unknown state";
    }
    return result;
}

}
