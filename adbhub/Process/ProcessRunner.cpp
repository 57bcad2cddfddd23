//
//  ProcessRunner.cpp
//  adbhub
//
//  Created on 18.05.25.
//

#include "ProcessRunner.hpp"
#include "../ADBException.hpp"

#include <exception>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <libgeneral/macros.h>

extern char **environ;

#define KILL_GRACE_PERIOD_MS 2000
#define POLL_SLICE_MS 50
#define READ_BUFSIZE 0x4000

static uint64_t now_ms(){
    struct timespec ts = {};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (uint64_t)ts.tv_sec*1000 + ts.tv_nsec/1000000;
}

std::string trim_whitespace(const std::string &str){
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end-start+1);
}

#pragma mark ProcessResult
std::string ProcessResult::combinedOutput() const{
    if (errorOutput.empty()) return output;
    if (output.empty()) return errorOutput;
    return output + "\n" + errorOutput;
}

#pragma mark StreamingProcess
StreamingProcess::StreamingProcess(pid_t pid, int stdoutFd, int stderrFd, uint64_t timeoutMs, line_callback lineCallback, std::string description)
: _description(description), _pid(pid)
, _stdoutFd(stdoutFd), _stderrFd(stderrFd)
, _wakePipe{-1,-1}
, _timeoutMs(timeoutMs), _lineCallback(lineCallback)
, _resolution(RESOLUTION_PENDING)
, _cancelRequested(false)
{
    retassure(!pipe2(_wakePipe, O_CLOEXEC), "pipe2() failed: %s",strerror(errno));
    _readerThread = std::thread([this]{
        reader_runloop();
    });
}

StreamingProcess::~StreamingProcess(){
    cancel();
    {
        std::unique_lock<std::mutex> ul(_joinLck);
        if (_readerThread.joinable()) _readerThread.join();
    }
    safeClose(_wakePipe[0]);
    safeClose(_wakePipe[1]);
}

void StreamingProcess::cancel() noexcept{
    if (_resolution != RESOLUTION_PENDING) return;
    if (_cancelRequested.exchange(true)) return;
    debug("[StreamingProcess] cancel requested for pid=%d (%s)",_pid,_description.c_str());
    char c = 0;
    if (write(_wakePipe[1], &c, 1) != 1) {
        error("[StreamingProcess] failed to wake reader of pid=%d: %s",_pid,strerror(errno));
    }
}

const ProcessResult &StreamingProcess::wait(){
    {
        std::unique_lock<std::mutex> ul(_joinLck);
        if (_readerThread.joinable()) _readerThread.join();
    }
    if (_resolution == RESOLUTION_TIMEDOUT) {
        retcustomerror(ADBException_timeout, "'%s' timed out after %llu ms",_description.c_str(),(unsigned long long)_timeoutMs);
    }
    return _result;
}

void StreamingProcess::handle_stdout(const char *buf, size_t len, std::string &lineBuf) noexcept{
    if (!_lineCallback) return;
    lineBuf.append(buf, len);
    size_t pos = 0;
    while ((pos = lineBuf.find('\n')) != std::string::npos) {
        std::string line = lineBuf.substr(0, pos);
        lineBuf.erase(0, pos+1);
        if (line.size() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        try {
            _lineCallback(line);
        } catch (tihmstar::exception &e) {
            error("[StreamingProcess] line callback failed with error=%d (%s)",e.code(),e.what());
        } catch (std::exception &e) {
            error("[StreamingProcess] line callback failed (%s)",e.what());
        }
    }
}

/*
 Reads whatever is available without blocking.
 Closes the fd (and sets it to -1) on EOF or error.
 */
static void drain_fd(int &fd, std::string &dst, std::function<void(const char *, size_t)> onData){
    char buf[READ_BUFSIZE];
    while (fd >= 0) {
        ssize_t didRead = read(fd, buf, sizeof(buf));
        if (didRead > 0) {
            dst.append(buf, didRead);
            if (onData) onData(buf, didRead);
        } else if (didRead == 0) {
            close(fd); fd = -1;
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        } else {
            debug("[StreamingProcess] read failed on fd=%d: %s",fd,strerror(errno));
            close(fd); fd = -1;
        }
    }
}

void StreamingProcess::reader_runloop() noexcept{
    std::string out;
    std::string err;
    std::string lineBuf;
    uint64_t deadline = _timeoutMs ? now_ms() + _timeoutMs : UINT64_MAX;
    uint64_t killDeadline = 0; //nonzero once SIGTERM was sent
    resolution signalledFor = RESOLUTION_PENDING; //why we sent SIGTERM
    bool didSendKill = false;
    bool reaped = false;
    int status = 0;
    auto onStdout = [&](const char *buf, size_t len){
        handle_stdout(buf, len, lineBuf);
    };

    while (!reaped) {
        struct pollfd pfd[3] = {};
        int outIdx = -1, errIdx = -1, wakeIdx = -1;
        nfds_t nfds = 0;
        if (_stdoutFd >= 0) {
            outIdx = (int)nfds;
            pfd[nfds++] = {
                .fd = _stdoutFd,
                .events = POLLIN
            };
        }
        if (_stderrFd >= 0) {
            errIdx = (int)nfds;
            pfd[nfds++] = {
                .fd = _stderrFd,
                .events = POLLIN
            };
        }
        if (!killDeadline) {
            wakeIdx = (int)nfds;
            pfd[nfds++] = {
                .fd = _wakePipe[0],
                .events = POLLIN
            };
        }

        if (poll(pfd, nfds, POLL_SLICE_MS) == -1 && errno != EINTR) {
            error("[StreamingProcess] poll failed errno=%d (%s)",errno,strerror(errno));
            usleep(POLL_SLICE_MS*1000);
        }

        if (outIdx >= 0 && pfd[outIdx].revents) drain_fd(_stdoutFd, out, onStdout);
        if (errIdx >= 0 && pfd[errIdx].revents) drain_fd(_stderrFd, err, nullptr);

        if (wakeIdx >= 0 && (pfd[wakeIdx].revents & POLLIN)) {
            char c = 0;
            if (read(_wakePipe[0], &c, 1) != 1) {
                debug("[StreamingProcess] failed to consume wake byte");
            }
            if (_cancelRequested) {
                debug("[StreamingProcess] terminating pid=%d on request",_pid);
                kill(_pid, SIGTERM);
                killDeadline = now_ms() + KILL_GRACE_PERIOD_MS;
                signalledFor = RESOLUTION_CANCELLED;
            }
        }

        //only this thread reaps, so _pid can not have been reused while we signal it
        pid_t r = waitpid(_pid, &status, WNOHANG);
        if (r == _pid) {
            reaped = true;
            break;
        } else if (r == -1 && errno != EINTR) {
            error("[StreamingProcess] waitpid(%d) failed: %s",_pid,strerror(errno));
            status = -1;
            reaped = true;
            break;
        }

        uint64_t now = now_ms();
        if (!killDeadline && now >= deadline) {
            signalledFor = RESOLUTION_TIMEDOUT;
            warning("[StreamingProcess] pid=%d (%s) exceeded its timeout of %llu ms, terminating",_pid,_description.c_str(),(unsigned long long)_timeoutMs);
            kill(_pid, SIGTERM);
            killDeadline = now + KILL_GRACE_PERIOD_MS;
        } else if (killDeadline && !didSendKill && now >= killDeadline) {
            warning("[StreamingProcess] pid=%d ignored SIGTERM, sending SIGKILL",_pid);
            kill(_pid, SIGKILL);
            didSendKill = true;
        }
    }

    //everything the child wrote is in the pipe now, don't wait for EOF (grandchildren may hold the pipe)
    drain_fd(_stdoutFd, out, onStdout);
    drain_fd(_stderrFd, err, nullptr);
    if (lineBuf.size()) handle_stdout("\n", 1, lineBuf);
    safeClose(_stdoutFd);
    safeClose(_stderrFd);

    _result.output = trim_whitespace(out);
    _result.rawOutput = std::move(out);
    _result.errorOutput = trim_whitespace(err);
    if (status != -1 && WIFEXITED(status)) {
        _result.exitCode = WEXITSTATUS(status);
        _result.termSignal = 0;
    } else if (status != -1 && WIFSIGNALED(status)) {
        _result.exitCode = -1;
        _result.termSignal = WTERMSIG(status);
    }
    if (status != -1 && WIFSIGNALED(status) && signalledFor != RESOLUTION_PENDING) {
        _resolution = signalledFor;
    } else {
        _resolution = RESOLUTION_FINISHED;
    }
    debug("[StreamingProcess] pid=%d (%s) exited code=%d signal=%d",_pid,_description.c_str(),_result.exitCode,_result.termSignal);
}

#pragma mark ProcessRunner
ProcessRunner::ProcessRunner()
: _extraSearchPaths(defaultSearchPaths())
{
    //
}

ProcessRunner::ProcessRunner(std::vector<std::string> extraSearchPaths)
: _extraSearchPaths(extraSearchPaths)
{
    //
}

std::vector<std::string> ProcessRunner::defaultSearchPaths(){
    std::vector<std::string> ret{
        "/usr/local/bin",
        "/opt/homebrew/bin",
    };
    if (const char *home = getenv("HOME")) {
        ret.push_back(std::string(home) + "/Library/Android/sdk/platform-tools");
        ret.push_back(std::string(home) + "/Android/Sdk/platform-tools");
    }
    return ret;
}

static std::vector<std::string> split_path(const std::string &path){
    std::vector<std::string> ret;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        if (end > start) ret.push_back(path.substr(start, end-start));
        start = end+1;
    }
    return ret;
}

std::string ProcessRunner::augmentedPath() const{
    const char *curPath = getenv("PATH");
    std::vector<std::string> existing = split_path(curPath ? curPath : "/usr/bin:/bin");
    std::string ret;
    for (auto &p : _extraSearchPaths) {
        bool isPresent = false;
        for (auto &e : existing) {
            if (e == p) {
                isPresent = true;
                break;
            }
        }
        if (isPresent) continue;
        ret += p;
        ret += ':';
    }
    for (auto &e : existing) {
        ret += e;
        ret += ':';
    }
    if (ret.size()) ret.pop_back();
    return ret;
}

std::string ProcessRunner::findExecutable(const std::string &name) const{
    for (auto &dir : split_path(augmentedPath())) {
        struct stat st = {};
        std::string candidate = dir + "/" + name;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return {};
}

ProcessResult ProcessRunner::run(const std::string &executable, const std::vector<std::string> &args, uint64_t timeoutMs) const{
    std::shared_ptr<StreamingProcess> proc = runStreaming(executable, args, timeoutMs, nullptr);
    return proc->wait();
}

std::shared_ptr<StreamingProcess> ProcessRunner::runStreaming(const std::string &executable, const std::vector<std::string> &args,
                                                              uint64_t timeoutMs, StreamingProcess::line_callback lineCallback) const{
    int outPipe[2] = {-1,-1};
    int errPipe[2] = {-1,-1};
    int statusPipe[2] = {-1,-1};
    int devnull = -1;
    pid_t pid = -1;
    cleanup([&]{
        safeClose(outPipe[0]);
        safeClose(outPipe[1]);
        safeClose(errPipe[0]);
        safeClose(errPipe[1]);
        safeClose(statusPipe[0]);
        safeClose(statusPipe[1]);
        safeClose(devnull);
        if (pid > 0) {
            //launch failed after fork, never leave the child behind
            kill(pid, SIGKILL);
            while (waitpid(pid, NULL, 0) == -1 && errno == EINTR);
        }
    });
    std::string path = executable;
    std::string description = executable;
    std::vector<std::string> envstrs;
    std::vector<char*> argv;
    std::vector<char*> envp;

    if (path.find('/') == std::string::npos) {
        retassure((path = findExecutable(executable)).size(), "failed to find '%s' in PATH",executable.c_str());
    }

    argv.push_back((char*)path.c_str());
    for (auto &a : args) {
        argv.push_back((char*)a.c_str());
        description += " ";
        description += a;
    }
    argv.push_back(NULL);

    for (char **e = environ; e && *e; e++) {
        if (strncmp(*e, "PATH=", 5) == 0) continue;
        envstrs.push_back(*e);
    }
    envstrs.push_back("PATH=" + augmentedPath());
    for (auto &e : envstrs) envp.push_back((char*)e.c_str());
    envp.push_back(NULL);

    retassure(!pipe2(outPipe, O_CLOEXEC), "pipe2() failed: %s",strerror(errno));
    retassure(!pipe2(errPipe, O_CLOEXEC), "pipe2() failed: %s",strerror(errno));
    retassure(!pipe2(statusPipe, O_CLOEXEC), "pipe2() failed: %s",strerror(errno));
    retassure((devnull = open("/dev/null", O_RDONLY | O_CLOEXEC)) >= 0, "failed to open /dev/null: %s",strerror(errno));

    debug("[ProcessRunner] launching '%s'",description.c_str());
    retassure((pid = fork()) >= 0, "fork() failed: %s",strerror(errno));

    if (pid == 0) {
        //child, async-signal-safe calls only
        int childErr = 0;
        signal(SIGPIPE, SIG_DFL);
        if (dup2(devnull, STDIN_FILENO) != -1
            && dup2(outPipe[1], STDOUT_FILENO) != -1
            && dup2(errPipe[1], STDERR_FILENO) != -1) {
            execve(argv[0], argv.data(), envp.data());
        }
        childErr = errno;
        if (write(statusPipe[1], &childErr, sizeof(childErr))) {
            //nothing left to do
        }
        _exit(127);
    }

    safeClose(outPipe[1]);
    safeClose(errPipe[1]);
    safeClose(statusPipe[1]);
    safeClose(devnull);

    {
        int childErr = 0;
        ssize_t didRead = 0;
        while ((didRead = read(statusPipe[0], &childErr, sizeof(childErr))) == -1 && errno == EINTR);
        if (didRead > 0) {
            reterror("failed to execute '%s': %s",path.c_str(),strerror(childErr));
        }
    }

    assure(fcntl(outPipe[0], F_SETFL, fcntl(outPipe[0], F_GETFL) | O_NONBLOCK) != -1);
    assure(fcntl(errPipe[0], F_SETFL, fcntl(errPipe[0], F_GETFL) | O_NONBLOCK) != -1);

    {
        std::shared_ptr<StreamingProcess> ret = std::make_shared<StreamingProcess>(pid, outPipe[0], errPipe[0], timeoutMs, lineCallback, description);
        //ownership of pid and read ends moved to the StreamingProcess
        pid = -1;
        outPipe[0] = -1;
        errPipe[0] = -1;
        return ret;
    }
}
