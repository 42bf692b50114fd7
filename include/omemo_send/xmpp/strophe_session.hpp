#pragma once
#include "omemo_send/core/failures.hpp"
#include "omemo_send/core/result.hpp"
#include "omemo_send/interfaces/i_iq_channel.hpp"
#include "omemo_send/interfaces/i_session.hpp"
#include "omemo_send/models/bare_jid.hpp"

#include <strophe.h>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace omemo_send::xmpp {

struct ConnectionSettings {
    models::BareJid jid;
    std::string password;
    bool allow_plaintext = false;
};

/**
 * @brief Client session over libstrophe
 *
 * Single-threaded. All network progress happens inside Run() and inside
 * RoundTrip(), which pumps the event loop until its response arrives. The
 * session-start handler is invoked from the top of the loop, never from a
 * stanza callback, so it may block on round trips.
 *
 * Answers XEP-0199 pings and XEP-0030 disco#info queries for as long as the
 * loop runs, and acknowledges roster pushes.
 */
/// RFC 6121 roster push: a `set` carrying a roster query, either without `from`
/// or from the account's own bare JID.
[[nodiscard]] bool IsRosterPush(xmpp_stanza_t* iq, const models::BareJid& account);

class StropheSession final : public interfaces::ISession, public interfaces::IIqChannel {
public:
    using SessionStartHandler = std::function<void(StropheSession&)>;

    /// Initializes libstrophe and allocates a context with its log bridged to spdlog
    [[nodiscard]] static Result<std::unique_ptr<StropheSession>, SessionFailure> Create();

    ~StropheSession() override;

    /// Features advertised in disco#info besides disco#info, ping and EME
    void AddFeature(std::string feature);

    void OnSessionStart(SessionStartHandler handler);

    /// Starts connecting; the stream is established inside Run()
    [[nodiscard]] Result<Unit, SessionFailure> Connect(const ConnectionSettings& settings);

    /**
     * @brief Drives the event loop until the connection is closed
     *
     * @return ConnectFailed if the stream was never established
     */
    [[nodiscard]] Result<Unit, SessionFailure> Run();

    [[nodiscard]] Result<Unit, SessionFailure> SendPresence() override;

    [[nodiscard]] Result<Unit, SessionFailure> RequestRoster() override;

    [[nodiscard]] Result<Unit, SessionFailure> SendMessage(
        const models::OutgoingMessage& message) override;

    void Disconnect() override;

    [[nodiscard]] bool IsConnected() const override;

    [[nodiscard]] Result<std::string, IqFailure> RoundTrip(
        const std::string& iq_xml,
        std::chrono::milliseconds timeout) override;

    StropheSession(const StropheSession&) = delete;
    StropheSession& operator=(const StropheSession&) = delete;
    StropheSession(StropheSession&&) = delete;
    StropheSession& operator=(StropheSession&&) = delete;

private:
    enum class State {
        Idle,
        Connecting,
        Connected,
        Disconnecting,
        Closed
    };

    struct ContextDeleter {
        void operator()(xmpp_ctx_t* context) const noexcept;
    };
    struct ConnectionDeleter {
        void operator()(xmpp_conn_t* connection) const noexcept;
    };
    struct StanzaDeleter {
        void operator()(xmpp_stanza_t* stanza) const noexcept;
    };
    using StanzaPtr = std::unique_ptr<xmpp_stanza_t, StanzaDeleter>;

    StropheSession();

    [[nodiscard]] StanzaPtr NewStanza(const char* name, const char* ns) const;
    [[nodiscard]] std::string NewId() const;
    [[nodiscard]] Result<Unit, SessionFailure> Send(xmpp_stanza_t* stanza);
    [[nodiscard]] StanzaPtr BuildDiscoInfoReply(xmpp_stanza_t* request) const;

    void HandleConnectionEvent(xmpp_conn_event_t event, int error, const xmpp_stream_error_t* stream_error);
    bool HandleIncomingIq(xmpp_stanza_t* stanza);
    void HandleIqResponse(xmpp_stanza_t* stanza);

    static void LogBridge(void* userdata, xmpp_log_level_t level, const char* area, const char* message);
    static void ConnectionHandler(
        xmpp_conn_t* connection, xmpp_conn_event_t event, int error,
        xmpp_stream_error_t* stream_error, void* userdata);
    static int IncomingIqHandler(xmpp_conn_t* connection, xmpp_stanza_t* stanza, void* userdata);
    static int IqResponseHandler(xmpp_conn_t* connection, xmpp_stanza_t* stanza, void* userdata);
    static int RosterResponseHandler(xmpp_conn_t* connection, xmpp_stanza_t* stanza, void* userdata);

    xmpp_log_t log_{};
    std::unique_ptr<xmpp_ctx_t, ContextDeleter> context_;
    std::unique_ptr<xmpp_conn_t, ConnectionDeleter> connection_;
    State state_ = State::Idle;
    std::optional<models::BareJid> account_;
    std::optional<std::string> failure_reason_;
    bool session_start_pending_ = false;
    SessionStartHandler on_session_start_;
    std::vector<std::string> features_;
    std::map<std::string, std::optional<Result<std::string, IqFailure>>> pending_iqs_;
};

}
