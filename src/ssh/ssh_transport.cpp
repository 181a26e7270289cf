#include "ssh_transport.hpp"
#include "auth.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <mutex>

// ── SshLink ─────────────────────────────────────────────────

SshLink::~SshLink() {
    if (session) {
        std::lock_guard<std::mutex> lock(io_mutex);
        libssh2_session_disconnect(session, "Normal disconnection");
        libssh2_session_free(session);
        session = nullptr;
    }
    if (sock != FLEET_INVALID_SOCKET) {
        platform::close_socket(sock);
        sock = FLEET_INVALID_SOCKET;
    }
    if (!target.empty()) fleet_log("ssh: closed connection to " + target);
}

std::string SshLink::last_error() const {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len <= 0) return "unknown error";
    return std::string(msg, static_cast<size_t>(len));
}

// ── SshTransport ────────────────────────────────────────────

SshTransport::SshTransport(std::shared_ptr<SshLink> link)
    : link_(std::move(link)) {}

Result<std::unique_ptr<Session>> SshTransport::open_session() {
    LIBSSH2_CHANNEL* ch = nullptr;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);

    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            ch = libssh2_channel_open_session(link_->session);
            if (!ch && libssh2_session_last_errno(link_->session) != LIBSSH2_ERROR_EAGAIN) {
                std::string err = link_->last_error();
                fleet_log(fmt::format("ssh: {}: channel open failed: {}", link_->target, err));
                return Result<std::unique_ptr<Session>>::Err(ErrorKind::Session,
                    fmt::format("{}: failed to open session: {}", link_->target, err));
            }
        }
        if (ch) break;
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }

    if (!ch) {
        return Result<std::unique_ptr<Session>>::Err(ErrorKind::Session,
            fmt::format("{}: timed out opening session", link_->target));
    }

    return Result<std::unique_ptr<Session>>::Ok(
        std::make_unique<SshSession>(link_, ch));
}

// ── SshConnector ────────────────────────────────────────────

SshConnector::SshConnector(const HostVerifier& verifier, Options options)
    : verifier_(verifier), options_(std::move(options)) {}

// libssh2_init is not thread-safe; fan-out connects from many threads.
static int init_libssh2_once() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    return rc;
}

Result<std::unique_ptr<Transport>> SshConnector::connect(const Target& target) {
    using Out = Result<std::unique_ptr<Transport>>;
    std::string label = target.key();

    auto agent_socket = platform::get_env(options_.agent_socket_env);
    if (!agent_socket) {
        return Out::Err(ErrorKind::Connect,
            fmt::format("{} empty", options_.agent_socket_env));
    }

    if (init_libssh2_once() != 0) {
        return Out::Err(ErrorKind::Connect, "failed to initialize libssh2");
    }

    auto link = std::make_shared<SshLink>();
    link->session = libssh2_session_init();
    if (!link->session) {
        return Out::Err(ErrorKind::Connect, "failed to create SSH session");
    }

    // Agent first: no point dialing the host without keys to offer
    AgentAuth agent(link->session);
    auto agent_result = agent.connect(*agent_socket);
    if (agent_result.is_err()) {
        fleet_log(fmt::format("ssh: {}: {}", label, agent_result.error));
        return Out::Err(agent_result);
    }

    auto timeout_ms = options_.connect_timeout_secs * 1000;
    auto dialed = platform::dial_tcp(target.host, options_.port, timeout_ms);
    if (dialed.is_err()) {
        fleet_log(fmt::format("ssh: {}: dial failed: {}", label, dialed.error));
        return Out::Err(dialed);
    }
    link->sock = dialed.value;

    libssh2_session_set_blocking(link->session, 0);

    // Handshake and authentication share one bound with the dial
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(options_.connect_timeout_secs);

    int rc;
    while ((rc = libssh2_session_handshake(link->session, link->sock)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return Out::Err(ErrorKind::Connect, fmt::format("{}: handshake timed out", label));
        }
        platform::sleep_ms(SSH_HANDSHAKE_SLEEP_MS);
    }
    if (rc != 0) {
        std::string err = link->last_error();
        fleet_log(fmt::format("ssh: {}: handshake failed: {}", label, err));
        return Out::Err(ErrorKind::Connect, fmt::format("ssh: handshake failed: {}", err));
    }

    auto verified = verifier_.verify(link->session, target.host, options_.port);
    if (verified.is_err()) {
        fleet_log(fmt::format("ssh: {}: {}", label, verified.error));
        return Out::Err(verified);
    }

    auto authed = agent.authenticate(target.user, deadline);
    if (authed.is_err()) {
        fleet_log(fmt::format("ssh: {}: {}", label, authed.error));
        return Out::Err(authed);
    }

    link->target = label;
    fleet_log(fmt::format("ssh: connected to {} ({} agent identities)",
                          label, agent.identity_count()));

    return Out::Ok(std::make_unique<SshTransport>(std::move(link)));
}
