#pragma once

#include <filesystem>
#include <string>
#include <core/types.hpp>

// libssh2 forward declaration
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Decides whether a server's host key is acceptable.
//
// Built once at startup and handed by reference to the connector, which
// consults it on every handshake. The mode cannot change afterwards.
//
//   Strict      key must match an entry in the OpenSSH known_hosts file
//   Permissive  any key is accepted
class HostVerifier {
public:
    enum class Mode {
        Strict,
        Permissive,
    };

    // Fails with ErrorKind::Config if the trust store cannot be read.
    static Result<HostVerifier> strict(const std::filesystem::path& known_hosts);
    static HostVerifier permissive();

    Mode mode() const { return mode_; }
    bool is_strict() const { return mode_ == Mode::Strict; }
    const std::filesystem::path& known_hosts() const { return known_hosts_; }

    // Check the key presented during the handshake on session.
    // ErrorKind::Connect for unknown or mismatched keys.
    Result<void> verify(LIBSSH2_SESSION* session, const std::string& host, int port) const;

    // Needed by Result<HostVerifier>
    HostVerifier() = default;

private:
    HostVerifier(Mode mode, std::filesystem::path known_hosts);

    Mode mode_ = Mode::Strict;
    std::filesystem::path known_hosts_;
};
