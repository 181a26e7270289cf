#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <core/types.hpp>
#include "session.hpp"

// One directed file transfer. size is fixed before the payload starts and
// the transfer never moves more than size bytes.
struct TransferDescriptor {
    std::filesystem::path local_path;
    std::string remote_path;
    uint32_t mode = 0644;
    uint64_t size = 0;
    ProgressCallback progress;
};

// Reports done/total to a callback after every successful chunk.
// Values are non-decreasing and reach 1.0 when the last byte is through.
class ProgressTracker {
public:
    ProgressTracker(uint64_t total, ProgressCallback callback);

    void advance(uint64_t n);

    // Zero-byte transfers have no chunks; report completion once.
    void finish();

    uint64_t done() const { return done_; }
    uint64_t total() const { return total_; }

private:
    uint64_t total_;
    uint64_t done_ = 0;
    ProgressCallback callback_;
};

// ScpTransfer: upload/download of a single regular file by speaking the scp
// protocol over a session's stdin/stdout.
//
// Each transfer runs the remote scp in the foreground (blocking wait) while a
// background thread drives the protocol. Both outcomes are always collected
// before the result is decided: a failed remote command is returned first,
// and the background protocol error only when the command succeeded.
//
// The session carries exactly one transfer.
class ScpTransfer {
public:
    explicit ScpTransfer(Session& session);

    // PUT local src to remote dest ("rm -f dest ; scp -t dest").
    Result<void> upload(const std::filesystem::path& src, const std::string& dest,
                        ProgressCallback progress = nullptr);

    // GET remote src to local dest ("scp -qrf src").
    Result<void> download(const std::string& src, const std::filesystem::path& dest,
                          ProgressCallback progress = nullptr);

private:
    Session& session_;

    Result<void> send_file(const TransferDescriptor& desc);
    Result<void> receive_file(TransferDescriptor& desc);
    Result<void> run_transfer(const std::string& command,
                              const std::function<Result<void>()>& background);
};

// Open a session on user@host through the pool and upload/download on it.
class ConnectionPool;
Result<void> scp_put(ConnectionPool& pool, const Target& target,
                     const std::filesystem::path& src, const std::string& dest,
                     ProgressCallback progress = nullptr);
Result<void> scp_get(ConnectionPool& pool, const Target& target,
                     const std::string& src, const std::filesystem::path& dest,
                     ProgressCallback progress = nullptr);
