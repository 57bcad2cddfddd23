//
//  ProcessRunner.hpp
//  adbhub
//
//  Created on 18.05.25.
//

#ifndef ProcessRunner_hpp
#define ProcessRunner_hpp

#include <stdint.h>
#include <sys/types.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct ProcessResult{
    std::string output;         //stdout, trimmed
    std::string rawOutput;      //stdout, untouched (binary safe)
    std::string errorOutput;    //stderr, trimmed
    int exitCode;               //-1 if terminated by a signal
    int termSignal;             //0 unless terminated by a signal

    ProcessResult() : exitCode(-1), termSignal(0) {}

    bool isSuccess() const noexcept {return exitCode == 0 && termSignal == 0;}
    std::string combinedOutput() const;
};

/*
 A running child process.
 stdout and stderr are drained continuously by a reader thread,
 stdout lines are handed to the line callback as they arrive (on the reader thread).
 Exactly one of {finished, cancelled, timed out} takes effect, decided by the reader thread when it reaps the child.
 A child that exits on its own is finished, even if a cancel or the timeout raced with it.
 */
class StreamingProcess{
public:
    enum resolution{
        RESOLUTION_PENDING = 0,
        RESOLUTION_FINISHED,
        RESOLUTION_CANCELLED,
        RESOLUTION_TIMEDOUT
    };
    typedef std::function<void(const std::string &line)> line_callback;
private:
    std::string _description; //for logging
    pid_t _pid;
    int _stdoutFd;
    int _stderrFd;
    int _wakePipe[2];
    uint64_t _timeoutMs;
    line_callback _lineCallback;
    std::atomic<resolution> _resolution;
    std::atomic<bool> _cancelRequested;
    ProcessResult _result;
    std::thread _readerThread;
    std::mutex _joinLck;

    void reader_runloop() noexcept;
    void handle_stdout(const char *buf, size_t len, std::string &lineBuf) noexcept;

public:
    StreamingProcess(const StreamingProcess&) = delete;
    StreamingProcess(pid_t pid, int stdoutFd, int stderrFd, uint64_t timeoutMs, line_callback lineCallback, std::string description);
    ~StreamingProcess();

    /*
     Asks the reader thread to terminate the child unless it already resolved.
     Safe to call any number of times, from any thread.
     */
    void cancel() noexcept;

    /*
     Blocks until the child is reaped.
     Throws ADBException_timeout if the timeout won.
     A cancelled process returns normally, check wasCancelled().
     Only a child that died by our SIGTERM counts as cancelled.
     */
    const ProcessResult &wait();

    resolution state() const noexcept {return _resolution;}
    bool wasCancelled() const noexcept {return _resolution == RESOLUTION_CANCELLED;}
    pid_t pid() const noexcept {return _pid;}
};

class ProcessRunner{
    std::vector<std::string> _extraSearchPaths;
public:
    ProcessRunner();
    ProcessRunner(std::vector<std::string> extraSearchPaths);

    static std::vector<std::string> defaultSearchPaths();
    const std::vector<std::string> &extraSearchPaths() const noexcept {return _extraSearchPaths;}

    /*
     The caller's PATH with the extra search directories prepended.
     The caller's own environment is never modified.
     */
    std::string augmentedPath() const;

    /*
     Resolves a bare executable name against augmentedPath().
     Returns an empty string if nothing executable was found.
     */
    std::string findExecutable(const std::string &name) const;

    ProcessResult run(const std::string &executable, const std::vector<std::string> &args, uint64_t timeoutMs) const;

    std::shared_ptr<StreamingProcess> runStreaming(const std::string &executable, const std::vector<std::string> &args,
                                                   uint64_t timeoutMs, StreamingProcess::line_callback lineCallback) const;
};

std::string trim_whitespace(const std::string &str);

#endif /* ProcessRunner_hpp */
