#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <core/types.hpp>

// One multiplexed channel carrying exactly one remote command.
//
// The command's stdin/stdout are exposed as raw byte streams so protocols
// (scp) can be spoken over them from a background thread while another
// thread blocks in wait(). Implementations must allow write_stdin /
// read_stdout / close_stdin to run concurrently with wait().
//
// Owned by whoever asked the pool for it; dropping it closes the channel.
class Session {
public:
    virtual ~Session() = default;

    // Start the remote command. Does not wait for it.
    virtual Result<void> start(const std::string& command) = 0;

    // Write all of data to the command's stdin.
    virtual Result<void> write_stdin(const char* data, size_t len) = 0;

    // Send EOF on the command's stdin.
    virtual Result<void> close_stdin() = 0;

    // Read up to len bytes of stdout. Returns 0 once stdout is exhausted.
    virtual Result<size_t> read_stdout(char* buf, size_t len) = 0;

    // While stdout is attached, wait() leaves it to the reader.
    // Detached stdout is read and discarded so the command cannot stall.
    virtual void attach_stdout() = 0;
    virtual void detach_stdout() = 0;

    // Block until the command exits; collects stderr, exit status and signal.
    virtual SSHResult wait() = 0;

    // start + wait, stdout discarded. Err only when the command could not start.
    Result<SSHResult> run(const std::string& command);

    // start + collect stdout + wait
    Result<SSHResult> output(const std::string& command);

    // start + hand each stdout chunk to sink + wait
    using OutputSink = std::function<void(const char*, size_t)>;
    Result<SSHResult> stream(const std::string& command, const OutputSink& sink);
};

// True when the command was terminated by SIGKILL.
bool is_sigkill(const SSHResult& r);

// RemoteCommand error for a failed command, Ok otherwise.
Result<void> check_command(const SSHResult& r);

// Convenience for fan-out operations: run and return stdout, failing on
// start errors and on non-zero exit / signal.
Result<std::string> command_output(Session& session, const std::string& command);
