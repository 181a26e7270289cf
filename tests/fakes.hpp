#pragma once

// In-process stand-ins for the libssh2-backed Connector / Transport /
// Session, and a fake remote scp that speaks the wire protocol against an
// in-memory file system.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <ssh/session.hpp>
#include <ssh/transport.hpp>

namespace fake {

// ── Byte pipe ───────────────────────────────────────────────

class Pipe {
public:
    void write(const char* data, size_t len) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            bytes_.insert(bytes_.end(), data, data + len);
            written_.append(data, len);
        }
        cv_.notify_all();
    }

    void write(const std::string& s) { write(s.data(), s.size()); }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Blocks for at least one byte; 0 once closed and drained.
    size_t read(char* buf, size_t len) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !bytes_.empty(); });
        size_t n = 0;
        while (n < len && !bytes_.empty()) {
            buf[n++] = bytes_.front();
            bytes_.pop_front();
        }
        return n;
    }

    bool read_byte(char& c) { return read(&c, 1) == 1; }

    bool read_line(std::string& line) {
        line.clear();
        char c;
        while (read_byte(c)) {
            if (c == '\n') return true;
            line.push_back(c);
        }
        return false;
    }

    // Exactly len bytes, false on early EOF
    bool read_exact(std::string& out, size_t len) {
        out.clear();
        std::vector<char> buf(4096);
        while (out.size() < len) {
            size_t n = read(buf.data(), std::min(buf.size(), len - out.size()));
            if (n == 0) return false;
            out.append(buf.data(), n);
        }
        return true;
    }

    // Everything ever written, for wire assertions
    std::string written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<char> bytes_;
    std::string written_;
    bool closed_ = false;
};

// Runs a remote command: reads its stdin, writes its stdout, returns the exit.
using RemoteHandler = std::function<SSHResult(const std::string& command, Pipe& in, Pipe& out)>;

inline SSHResult exit_with(int code, const std::string& err = "", const std::string& signal = "") {
    return SSHResult{code, "", err, signal};
}

// ── Session ─────────────────────────────────────────────────

class FakeSession : public Session {
public:
    explicit FakeSession(RemoteHandler handler) : handler_(std::move(handler)) {}

    ~FakeSession() override {
        in_.close();
        if (remote_.joinable()) remote_.join();
    }

    Result<void> start(const std::string& command) override {
        command_ = command;
        remote_ = std::thread([this] {
            result_ = handler_(command_, in_, out_);
            out_.close();
        });
        return Result<void>::Ok();
    }

    Result<void> write_stdin(const char* data, size_t len) override {
        in_.write(data, len);
        return Result<void>::Ok();
    }

    Result<void> close_stdin() override {
        in_.close();
        return Result<void>::Ok();
    }

    Result<size_t> read_stdout(char* buf, size_t len) override {
        return Result<size_t>::Ok(out_.read(buf, len));
    }

    void attach_stdout() override {}
    void detach_stdout() override {}

    SSHResult wait() override {
        if (remote_.joinable()) remote_.join();
        return result_;
    }

    const std::string& command() const { return command_; }
    std::string stdin_bytes() const { return in_.written(); }

private:
    RemoteHandler handler_;
    std::string command_;
    Pipe in_;
    Pipe out_;
    SSHResult result_{-1, "", "", ""};
    std::thread remote_;
};

// ── Transport / Connector ───────────────────────────────────

// Tracks how many calls are inside a section at once, and the maximum seen.
struct Concurrency {
    std::atomic<int> current{0};
    std::atomic<int> peak{0};

    void enter() {
        int now = ++current;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
    }

    void leave() { current--; }
};

struct HostState {
    std::atomic<bool> alive{true};
    std::atomic<int> sessions{0};
    Concurrency opens;
};

class FakeTransport : public Transport {
public:
    FakeTransport(std::shared_ptr<HostState> state, std::shared_ptr<Concurrency> all_opens,
                  int open_delay_ms, RemoteHandler handler)
        : state_(std::move(state)), all_opens_(std::move(all_opens)),
          open_delay_ms_(open_delay_ms), handler_(std::move(handler)) {}

    Result<std::unique_ptr<Session>> open_session() override {
        state_->opens.enter();
        all_opens_->enter();
        if (open_delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(open_delay_ms_));
        }
        all_opens_->leave();
        state_->opens.leave();

        if (!state_->alive) {
            return Result<std::unique_ptr<Session>>::Err(ErrorKind::Session,
                "channel open failed: connection closed");
        }
        state_->sessions++;
        return Result<std::unique_ptr<Session>>::Ok(std::make_unique<FakeSession>(handler_));
    }

private:
    std::shared_ptr<HostState> state_;
    std::shared_ptr<Concurrency> all_opens_;
    int open_delay_ms_;
    RemoteHandler handler_;
};

// Counts handshakes per target. Hosts listed in unreachable fail to connect;
// fail_next makes the next N connects fail regardless of host.
class FakeConnector : public Connector {
public:
    explicit FakeConnector(RemoteHandler handler = nullptr) : handler_(std::move(handler)) {}

    Result<std::unique_ptr<Transport>> connect(const Target& target) override {
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        connects_[target.key()]++;
        if (fail_next > 0) {
            fail_next--;
            return Result<std::unique_ptr<Transport>>::Err(ErrorKind::Connect,
                fmt_error(target, "connection refused"));
        }
        for (const auto& h : unreachable) {
            if (h == target.host) {
                return Result<std::unique_ptr<Transport>>::Err(ErrorKind::Connect,
                    fmt_error(target, "no route to host"));
            }
        }
        auto& state = states_[target.key()];
        state = std::make_shared<HostState>();

        RemoteHandler h = handler_;
        std::string host = target.host;
        auto bound = [h, host](const std::string& cmd, Pipe& in, Pipe& out) {
            return h ? h(host + "|" + cmd, in, out) : exit_with(0);
        };
        return Result<std::unique_ptr<Transport>>::Ok(
            std::make_unique<FakeTransport>(state, all_opens_, open_delay_ms, bound));
    }

    int connects(const Target& target) {
        std::lock_guard<std::mutex> lock(mutex_);
        return connects_[target.key()];
    }

    int total_connects() {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& kv : connects_) n += kv.second;
        return n;
    }

    std::shared_ptr<HostState> state(const Target& target) {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_[target.key()];
    }

    // open_session calls in flight across every target
    const Concurrency& all_opens() const { return *all_opens_; }

    int fail_next = 0;
    int delay_ms = 0;
    int open_delay_ms = 0;   // applies to transports connected afterwards
    std::vector<std::string> unreachable;

private:
    static std::string fmt_error(const Target& t, const std::string& what) {
        return "dial " + t.host + ":22: " + what;
    }

    RemoteHandler handler_;
    std::shared_ptr<Concurrency> all_opens_ = std::make_shared<Concurrency>();
    std::mutex mutex_;
    std::map<std::string, int> connects_;
    std::map<std::string, std::shared_ptr<HostState>> states_;
};

// ── Remote file system + scp ends ───────────────────────────

struct RemoteFile {
    std::string data;
    uint32_t mode = 0644;
};

class FakeRemoteFs {
public:
    void put(const std::string& path, std::string data, uint32_t mode = 0644) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[path] = RemoteFile{std::move(data), mode};
    }

    bool get(const std::string& path, RemoteFile& out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(path);
        if (it == files_.end()) return false;
        out = it->second;
        return true;
    }

    void remove(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_.erase(path);
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, RemoteFile> files_;
};

inline std::string base_of(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// "rm -f <dest> ; scp -t <dest>"
inline SSHResult scp_sink(FakeRemoteFs& fs, const std::string& dest, Pipe& in, Pipe& out) {
    fs.remove(dest);
    out.write(std::string(1, '\0'));

    std::string line;
    if (!in.read_line(line)) return exit_with(1, "scp: protocol error: no control line");

    unsigned mode = 0;
    unsigned long long size = 0;
    char name[256] = {0};
    if (std::sscanf(line.c_str(), "C%o %llu %255s", &mode, &size, name) != 3) {
        out.write("\x02scp: protocol error: bad control line\n");
        return exit_with(1, "scp: protocol error: bad control line");
    }
    out.write(std::string(1, '\0'));

    std::string data;
    if (!in.read_exact(data, static_cast<size_t>(size))) {
        return exit_with(1, "scp: protocol error: short payload");
    }
    char nul;
    if (!in.read_byte(nul) || nul != '\0') {
        return exit_with(1, "scp: protocol error: missing terminator");
    }
    fs.put(dest, data, mode);
    out.write(std::string(1, '\0'));

    // scp -t keeps reading until the client closes stdin
    while (in.read_byte(nul)) {}
    return exit_with(0);
}

// "scp -qrf <src>"
inline SSHResult scp_source(FakeRemoteFs& fs, const std::string& src, Pipe& in, Pipe& out) {
    char c;
    if (!in.read_byte(c)) return exit_with(1);

    RemoteFile f;
    if (!fs.get(src, f)) {
        std::string msg = "scp: " + src + ": No such file or directory";
        out.write("\x01" + msg + "\n");
        return exit_with(1, msg);
    }

    char header[512];
    std::snprintf(header, sizeof(header), "C%04o %zu %s\n", f.mode, f.data.size(),
                  base_of(src).c_str());
    out.write(header);
    if (!in.read_byte(c) || c != '\0') return exit_with(1);

    out.write(f.data);
    out.write(std::string(1, '\0'));
    if (!in.read_byte(c) || c != '\0') return exit_with(1);
    return exit_with(0);
}

// Dispatches the two scp command shapes the transfer engine issues.
inline RemoteHandler scp_handler(FakeRemoteFs& fs) {
    return [&fs](const std::string& command, Pipe& in, Pipe& out) {
        const std::string sink = "scp -t ";
        const std::string source = "scp -qrf ";
        auto pos = command.find(sink);
        if (pos != std::string::npos) {
            return scp_sink(fs, command.substr(pos + sink.size()), in, out);
        }
        pos = command.find(source);
        if (pos != std::string::npos) {
            return scp_source(fs, command.substr(pos + source.size()), in, out);
        }
        return exit_with(127, "sh: command not found");
    };
}

} // namespace fake
