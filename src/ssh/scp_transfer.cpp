#include "scp_transfer.hpp"
#include "connection_pool.hpp"
#include "scp_protocol.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// ── ProgressTracker ─────────────────────────────────────────

ProgressTracker::ProgressTracker(uint64_t total, ProgressCallback callback)
    : total_(total), callback_(std::move(callback)) {}

void ProgressTracker::advance(uint64_t n) {
    done_ += n;
    if (callback_ && total_ > 0) {
        callback_(static_cast<double>(done_) / static_cast<double>(total_));
    }
}

void ProgressTracker::finish() {
    if (callback_ && total_ == 0) callback_(1.0);
}

// ── Buffered reader over a session's stdout ─────────────────

namespace {

class StdoutReader {
public:
    explicit StdoutReader(Session& session)
        : session_(session), buf_(SCP_COPY_BUF_SIZE) {}

    // One byte; false on EOF or error (see error()).
    bool read_byte(char& out) {
        if (!fill()) return false;
        out = buf_[pos_++];
        return true;
    }

    // Bytes up to '\n' (newline dropped). False on EOF before the newline.
    bool read_line(std::string& line) {
        line.clear();
        char c;
        while (read_byte(c)) {
            if (c == '\n') return true;
            line.push_back(c);
            if (line.size() > SCP_MAX_LINE) {
                error_ = "protocol line too long";
                return false;
            }
        }
        return false;
    }

    // Up to len bytes; 0 on EOF or error.
    size_t read(char* out, size_t len) {
        if (!fill()) return 0;
        size_t n = std::min(len, end_ - pos_);
        std::copy(buf_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  buf_.begin() + static_cast<std::ptrdiff_t>(pos_ + n), out);
        pos_ += n;
        return n;
    }

    const std::string& error() const { return error_; }

private:
    bool fill() {
        if (pos_ < end_) return true;
        if (!error_.empty()) return false;
        auto n = session_.read_stdout(buf_.data(), buf_.size());
        if (n.is_err()) {
            error_ = n.error;
            return false;
        }
        pos_ = 0;
        end_ = n.value;
        return end_ > 0;
    }

    Session& session_;
    std::vector<char> buf_;
    size_t pos_ = 0;
    size_t end_ = 0;
    std::string error_;
};

Result<void> protocol_error(const std::string& msg) {
    return Result<void>::Err(ErrorKind::TransferProtocol, msg);
}

// Status byte from the other side; 1/2 carry a message line.
Result<void> read_ack(StdoutReader& reader, const char* step) {
    char status;
    if (!reader.read_byte(status)) {
        return protocol_error(reader.error().empty()
            ? fmt::format("unexpected EOF waiting for acknowledgment ({})", step)
            : fmt::format("{} ({})", reader.error(), step));
    }
    if (status == SCP_ACK) return Result<void>::Ok();

    if (status == SCP_WARNING || status == SCP_FATAL) {
        std::string msg;
        reader.read_line(msg);
        trim(msg);
        return protocol_error(msg.empty() ? fmt::format("remote error ({})", step) : msg);
    }
    return protocol_error(fmt::format("unexpected response byte {:#04x} ({})",
                                      static_cast<unsigned char>(status), step));
}

Result<void> send_bytes(Session& session, const char* data, size_t len, const char* step) {
    auto w = session.write_stdin(data, len);
    if (w.is_err()) {
        return protocol_error(fmt::format("short write ({}): {}", step, w.error));
    }
    return Result<void>::Ok();
}

Result<void> send_ack(Session& session, const char* step) {
    const char nul = SCP_ACK;
    return send_bytes(session, &nul, 1, step);
}

} // namespace

// ── ScpTransfer ─────────────────────────────────────────────

ScpTransfer::ScpTransfer(Session& session)
    : session_(session) {}

Result<void> ScpTransfer::run_transfer(const std::string& command,
                                       const std::function<Result<void>()>& background) {
    session_.attach_stdout();
    auto started = session_.start(command);
    if (started.is_err()) {
        session_.detach_stdout();
        return started;
    }

    Result<void> bg = Result<void>::Ok();
    std::thread worker([&] {
        try {
            bg = background();
        } catch (const std::exception& e) {
            bg = Result<void>::Err(ErrorKind::TransferProtocol, e.what());
        }
        // Always release the remote: EOF on its stdin, stop holding stdout
        auto closed = session_.close_stdin();
        if (closed.is_err() && bg.is_ok()) {
            bg = protocol_error(closed.error);
        }
        session_.detach_stdout();
    });

    SSHResult fg = session_.wait();
    worker.join();

    // The remote command's own failure wins; the protocol side is only
    // consulted once the command has exited cleanly.
    auto cmd = check_command(fg);
    if (cmd.is_err()) {
        fleet_log(fmt::format("scp: `{}` failed: {}", command, cmd.error));
        return cmd;
    }
    if (bg.is_err()) {
        fleet_log(fmt::format("scp: `{}` failed: {}", command, bg.error));
        return bg;
    }
    return Result<void>::Ok();
}

Result<void> ScpTransfer::send_file(const TransferDescriptor& desc) {
    std::ifstream in(desc.local_path, std::ios::binary);
    if (!in) {
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("open {}: cannot read file", desc.local_path.string()));
    }

    StdoutReader reader(session_);
    ProgressTracker progress(desc.size, desc.progress);

    auto r = read_ack(reader, "sink ready");
    if (r.is_err()) return r;

    std::string control = build_control_line({desc.mode, desc.size, base_name(desc.local_path)});
    r = send_bytes(session_, control.data(), control.size(), "control line");
    if (r.is_err()) return r;
    r = read_ack(reader, "control line");
    if (r.is_err()) return r;

    std::vector<char> buf(SCP_COPY_BUF_SIZE);
    uint64_t remaining = desc.size;
    while (remaining > 0) {
        auto want = static_cast<std::streamsize>(std::min<uint64_t>(remaining, buf.size()));
        in.read(buf.data(), want);
        auto got = in.gcount();
        if (got <= 0) {
            return Result<void>::Err(ErrorKind::IO,
                fmt::format("read {}: file shrank to {} of {} bytes",
                            desc.local_path.string(), progress.done(), desc.size));
        }
        r = send_bytes(session_, buf.data(), static_cast<size_t>(got), "payload");
        if (r.is_err()) return r;
        progress.advance(static_cast<uint64_t>(got));
        remaining -= static_cast<uint64_t>(got);
    }

    r = send_ack(session_, "payload terminator");
    if (r.is_err()) return r;
    r = read_ack(reader, "payload");
    if (r.is_err()) return r;

    progress.finish();
    return Result<void>::Ok();
}

Result<void> ScpTransfer::upload(const fs::path& src, const std::string& dest,
                                 ProgressCallback progress) {
    std::error_code ec;
    auto status = fs::status(src, ec);
    if (ec || !fs::exists(status)) {
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("open {}: no such file or directory", src.string()));
    }
    if (!fs::is_regular_file(status)) {
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("{}: not a regular file", src.string()));
    }
    uint64_t size = fs::file_size(src, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("stat {}: {}", src.string(), ec.message()));
    }

    TransferDescriptor desc;
    desc.local_path = src;
    desc.remote_path = dest;
    desc.mode = static_cast<uint32_t>(status.permissions() & fs::perms::mask);
    desc.size = size;
    desc.progress = std::move(progress);

    // Fail on an unreadable file before touching the remote side
    {
        std::ifstream probe(src, std::ios::binary);
        if (!probe) {
            return Result<void>::Err(ErrorKind::IO,
                fmt::format("open {}: permission denied", src.string()));
        }
    }

    fleet_log(fmt::format("scp: put {} -> {} ({} bytes, mode {:04o})",
                          src.string(), dest, desc.size, desc.mode));
    return run_transfer(scp_sink_command(dest), [this, &desc] { return send_file(desc); });
}

Result<void> ScpTransfer::receive_file(TransferDescriptor& desc) {
    StdoutReader reader(session_);

    auto r = send_ack(session_, "source start");
    if (r.is_err()) return r;

    std::string line;
    if (!reader.read_line(line)) {
        if (!line.empty() && (line[0] == SCP_WARNING || line[0] == SCP_FATAL)) {
            return protocol_error(line.substr(1));
        }
        return protocol_error(reader.error().empty()
            ? "unexpected EOF waiting for control line" : reader.error());
    }
    if (!line.empty() && (line[0] == SCP_WARNING || line[0] == SCP_FATAL)) {
        std::string msg = line.substr(1);
        trim(msg);
        return protocol_error(msg);
    }

    auto parsed = parse_control_line(line);
    if (parsed.is_err()) return Result<void>::Err(parsed);
    desc.mode = parsed.value.mode;
    desc.size = parsed.value.size;

    std::ofstream out(desc.local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("create {}: cannot open for writing", desc.local_path.string()));
    }

    std::error_code ec;
    fs::permissions(desc.local_path, static_cast<fs::perms>(desc.mode) & fs::perms::mask,
                    fs::perm_options::replace, ec);
    if (ec) {
        return protocol_error(fmt::format("chmod {}: {}", desc.local_path.string(), ec.message()));
    }

    r = send_ack(session_, "ready for payload");
    if (r.is_err()) return r;

    ProgressTracker progress(desc.size, desc.progress);
    std::vector<char> buf(SCP_COPY_BUF_SIZE);
    uint64_t remaining = desc.size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buf.size()));
        size_t got = reader.read(buf.data(), want);
        if (got == 0) {
            return protocol_error(fmt::format("short read: got {} of {} bytes{}",
                progress.done(), desc.size,
                reader.error().empty() ? "" : ": " + reader.error()));
        }
        out.write(buf.data(), static_cast<std::streamsize>(got));
        if (!out) {
            return Result<void>::Err(ErrorKind::IO,
                fmt::format("write {}: write failed", desc.local_path.string()));
        }
        progress.advance(got);
        remaining -= got;
    }

    out.close();
    if (!out) {
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("close {}: write failed", desc.local_path.string()));
    }

    r = read_ack(reader, "payload terminator");
    if (r.is_err()) return r;
    r = send_ack(session_, "payload received");
    if (r.is_err()) return r;

    progress.finish();
    return Result<void>::Ok();
}

Result<void> ScpTransfer::download(const std::string& src, const fs::path& dest,
                                   ProgressCallback progress) {
    TransferDescriptor desc;
    desc.local_path = dest;
    desc.remote_path = src;
    desc.progress = std::move(progress);

    fleet_log(fmt::format("scp: get {} -> {}", src, dest.string()));
    auto r = run_transfer(scp_source_command(src), [this, &desc] { return receive_file(desc); });
    if (r.is_ok()) {
        fleet_log(fmt::format("scp: got {} ({} bytes, mode {:04o})", src, desc.size, desc.mode));
    }
    return r;
}

// ── Pool helpers ────────────────────────────────────────────

Result<void> scp_put(ConnectionPool& pool, const Target& target,
                     const fs::path& src, const std::string& dest,
                     ProgressCallback progress) {
    auto session = pool.get_session(target);
    if (session.is_err()) return Result<void>::Err(session);
    return ScpTransfer(*session.value).upload(src, dest, std::move(progress));
}

Result<void> scp_get(ConnectionPool& pool, const Target& target,
                     const std::string& src, const fs::path& dest,
                     ProgressCallback progress) {
    auto session = pool.get_session(target);
    if (session.is_err()) return Result<void>::Err(session);
    return ScpTransfer(*session.value).download(src, dest, std::move(progress));
}
