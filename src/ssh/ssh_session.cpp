#include "ssh_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <vector>

SshSession::SshSession(std::shared_ptr<SshLink> link, LIBSSH2_CHANNEL* channel)
    : link_(std::move(link)), channel_(channel) {}

SshSession::~SshSession() {
    if (!channel_) return;

    // Bounded: a dead connection must not hang the destructor
    for (int i = 0; i < 100; ++i) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            rc = libssh2_channel_free(channel_);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    channel_ = nullptr;
}

Result<void> SshSession::start(const std::string& command) {
    command_ = command;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    int rc = LIBSSH2_ERROR_EAGAIN;
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            rc = libssh2_channel_exec(channel_, command.c_str());
            if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN) {
                return Result<void>::Err(ErrorKind::Session,
                    fmt::format("{}: failed to start command: {}", link_->target, link_->last_error()));
            }
        }
        if (rc == 0) return Result<void>::Ok();
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    return Result<void>::Err(ErrorKind::Session,
        fmt::format("{}: timed out starting command", link_->target));
}

Result<void> SshSession::write_stdin(const char* data, size_t len) {
    size_t sent = 0;
    auto last_progress = std::chrono::steady_clock::now();

    while (sent < len) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            w = libssh2_channel_write(channel_, data + sent, len - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            auto stalled = std::chrono::steady_clock::now() - last_progress;
            if (stalled > std::chrono::milliseconds(SSH_WRITE_STALL_MS)) {
                return Result<void>::Err(ErrorKind::Session, "write stalled (remote not reading)");
            }
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
            continue;
        }
        if (w < 0) {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            return Result<void>::Err(ErrorKind::Session,
                fmt::format("channel write error: {}", link_->last_error()));
        }
        sent += static_cast<size_t>(w);
        last_progress = std::chrono::steady_clock::now();
    }
    return Result<void>::Ok();
}

Result<void> SshSession::close_stdin() {
    if (stdin_closed_.exchange(true)) return Result<void>::Ok();

    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            rc = libssh2_channel_send_eof(channel_);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::Session, "failed to close remote stdin");
    }
    return Result<void>::Ok();
}

Result<size_t> SshSession::read_stdout(char* buf, size_t len) {
    while (true) {
        ssize_t n;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            n = libssh2_channel_read(channel_, buf, len);
            if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
                eof = libssh2_channel_eof(channel_) != 0;
            }
        }
        if (n > 0) return Result<size_t>::Ok(static_cast<size_t>(n));
        if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
            if (eof) return Result<size_t>::Ok(0);
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
            continue;
        }
        std::lock_guard<std::mutex> lock(link_->io_mutex);
        return Result<size_t>::Err(ErrorKind::Session,
            fmt::format("channel read error: {}", link_->last_error()));
    }
}

SSHResult SshSession::wait() {
    SSHResult result{-1, "", "", ""};
    std::vector<char> buf(SSH_READ_BUF_SIZE);

    // Drain stderr (and unattached stdout) until the remote side is done
    while (true) {
        bool progressed = false;
        bool eof = false;
        bool broken = false;
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            if (!stdout_attached_) {
                ssize_t n;
                while ((n = libssh2_channel_read(channel_, buf.data(), buf.size())) > 0) {
                    progressed = true;
                }
                if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) broken = true;
            }
            ssize_t e;
            while ((e = libssh2_channel_read_stderr(channel_, buf.data(), buf.size())) > 0) {
                result.stderr_data.append(buf.data(), static_cast<size_t>(e));
                progressed = true;
            }
            if (e < 0 && e != LIBSSH2_ERROR_EAGAIN) broken = true;
            eof = libssh2_channel_eof(channel_) != 0;
        }
        if (broken) {
            result.stderr_data += "channel read error while waiting for command";
            fleet_log_ssh(link_->target, command_, result);
            return result;
        }
        if (eof) break;
        if (!progressed) platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }

    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            rc = libssh2_channel_close(channel_);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (rc == 0) {
        while (true) {
            {
                std::lock_guard<std::mutex> lock(link_->io_mutex);
                rc = libssh2_channel_wait_closed(channel_);
            }
            if (rc != LIBSSH2_ERROR_EAGAIN) break;
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        }
    }

    {
        std::lock_guard<std::mutex> lock(link_->io_mutex);
        result.exit_code = libssh2_channel_get_exit_status(channel_);

        char* signal = nullptr;
        size_t signal_len = 0;
        libssh2_channel_get_exit_signal(channel_, &signal, &signal_len,
                                        nullptr, nullptr, nullptr, nullptr);
        if (signal) {
            result.exit_signal.assign(signal, signal_len);
            libssh2_free(link_->session, signal);
        }
    }

    fleet_log_ssh(link_->target, command_, result);
    return result;
}
