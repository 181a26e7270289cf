#include "host_verifier.hpp"
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

HostVerifier::HostVerifier(Mode mode, fs::path known_hosts)
    : mode_(mode), known_hosts_(std::move(known_hosts)) {}

Result<HostVerifier> HostVerifier::strict(const fs::path& known_hosts) {
    std::ifstream probe(known_hosts);
    if (!probe) {
        return Result<HostVerifier>::Err(ErrorKind::Config,
            fmt::format("cannot read known hosts file {}", known_hosts.string()));
    }
    return Result<HostVerifier>::Ok(HostVerifier(Mode::Strict, known_hosts));
}

HostVerifier HostVerifier::permissive() {
    return HostVerifier(Mode::Permissive, fs::path());
}

// Map the negotiated host key type onto the known-host key type bits.
static int knownhost_key_type(int hostkey_type) {
    switch (hostkey_type) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:       return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:       return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
    case LIBSSH2_HOSTKEY_TYPE_ED25519:   return LIBSSH2_KNOWNHOST_KEY_ED25519;
    default:                             return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

Result<void> HostVerifier::verify(LIBSSH2_SESSION* session, const std::string& host,
                                  int port) const {
    if (mode_ == Mode::Permissive) {
        return Result<void>::Ok();
    }

    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session, &key_len, &key_type);
    if (!key) {
        return Result<void>::Err(ErrorKind::Connect,
            fmt::format("{}: server presented no host key", host));
    }

    LIBSSH2_KNOWNHOSTS* hosts = libssh2_knownhost_init(session);
    if (!hosts) {
        return Result<void>::Err(ErrorKind::Connect, "failed to initialize known hosts");
    }

    int loaded = libssh2_knownhost_readfile(hosts, known_hosts_.string().c_str(),
                                            LIBSSH2_KNOWNHOST_FILE_OPENSSH);
    if (loaded < 0) {
        libssh2_knownhost_free(hosts);
        return Result<void>::Err(ErrorKind::Connect,
            fmt::format("failed to read known hosts file {}", known_hosts_.string()));
    }

    struct libssh2_knownhost* found = nullptr;
    int typemask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW |
                   knownhost_key_type(key_type);
    int check = libssh2_knownhost_checkp(hosts, host.c_str(), port, key, key_len,
                                         typemask, &found);
    libssh2_knownhost_free(hosts);

    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        return Result<void>::Ok();
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        fleet_log(fmt::format("host key MISMATCH for {}:{}", host, port));
        return Result<void>::Err(ErrorKind::Connect,
            fmt::format("ssh: handshake failed: knownhosts: key mismatch for {}", host));
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        return Result<void>::Err(ErrorKind::Connect,
            fmt::format("ssh: handshake failed: knownhosts: key is unknown for {}", host));
    default:
        return Result<void>::Err(ErrorKind::Connect,
            fmt::format("ssh: handshake failed: host key check failed for {}", host));
    }
}
