#include "session.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <vector>

Result<SSHResult> Session::run(const std::string& command) {
    detach_stdout();
    auto started = start(command);
    if (started.is_err()) return Result<SSHResult>::Err(started);
    return Result<SSHResult>::Ok(wait());
}

Result<SSHResult> Session::output(const std::string& command) {
    std::string out;
    auto r = stream(command, [&out](const char* data, size_t len) {
        out.append(data, len);
    });
    if (r.is_ok()) r.value.stdout_data = std::move(out);
    return r;
}

Result<SSHResult> Session::stream(const std::string& command, const OutputSink& sink) {
    attach_stdout();
    auto started = start(command);
    if (started.is_err()) {
        detach_stdout();
        return Result<SSHResult>::Err(started);
    }

    std::vector<char> buf(SSH_READ_BUF_SIZE);
    std::string read_error;
    while (true) {
        auto n = read_stdout(buf.data(), buf.size());
        if (n.is_err()) {
            read_error = n.error;
            break;
        }
        if (n.value == 0) break;
        sink(buf.data(), n.value);
    }
    detach_stdout();

    SSHResult r = wait();
    if (!read_error.empty() && r.success()) {
        return Result<SSHResult>::Err(ErrorKind::Session, read_error);
    }
    return Result<SSHResult>::Ok(r);
}

bool is_sigkill(const SSHResult& r) {
    return r.exit_signal == "KILL";
}

Result<void> check_command(const SSHResult& r) {
    if (r.success()) return Result<void>::Ok();

    std::string msg = r.exit_signal.empty()
        ? fmt::format("Process exited with status {}", r.exit_code)
        : fmt::format("Process exited with signal {}", r.exit_signal);

    std::string detail = r.stderr_data;
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r'))
        detail.pop_back();
    if (!detail.empty()) msg += ": " + detail;

    return Result<void>::Err(ErrorKind::RemoteCommand, msg);
}

Result<std::string> command_output(Session& session, const std::string& command) {
    auto r = session.output(command);
    if (r.is_err()) return Result<std::string>::Err(r);

    auto checked = check_command(r.value);
    if (checked.is_err()) return Result<std::string>::Err(checked);

    return Result<std::string>::Ok(r.value.stdout_data);
}
