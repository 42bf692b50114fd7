#include "omemo_send/xmpp/strophe_session.hpp"
#include "omemo_send/core/constants.hpp"
#include "omemo_send/crypto/sodium_interop.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstring>

namespace omemo_send::xmpp {

using crypto::SodiumInterop;

namespace {

using SessionResult = Result<Unit, SessionFailure>;
using IqResult = Result<std::string, IqFailure>;

bool Equals(const char* value, const std::string_view expected) {
    return value != nullptr && expected == value;
}

std::string DescribeConnectionError(const int error, const xmpp_stream_error_t* stream_error) {
    if (stream_error != nullptr && stream_error->text != nullptr) {
        return fmt::format("stream error: {}", stream_error->text);
    }
    if (stream_error != nullptr) {
        return "stream error";
    }
    if (error != 0) {
        return fmt::format("socket error: {}", std::strerror(error));
    }
    return "connection closed before the session was established";
}

std::string ErrorCondition(xmpp_stanza_t* stanza) {
    xmpp_stanza_t* error = xmpp_stanza_get_child_by_name(stanza, "error");
    if (error == nullptr) {
        return "undefined-condition";
    }
    for (xmpp_stanza_t* child = xmpp_stanza_get_children(error); child != nullptr;
         child = xmpp_stanza_get_next(child)) {
        const char* name = xmpp_stanza_get_name(child);
        if (name != nullptr && Equals(xmpp_stanza_get_ns(child), XmppNamespaces::STANZAS) &&
            std::strcmp(name, "text") != 0) {
            return name;
        }
    }
    return "undefined-condition";
}

}

bool IsRosterPush(xmpp_stanza_t* iq, const models::BareJid& account) {
    if (!Equals(xmpp_stanza_get_type(iq), StanzaConstants::IQ_TYPE_SET) ||
        xmpp_stanza_get_child_by_name_and_ns(iq, "query", XmppNamespaces::ROSTER.data()) == nullptr) {
        return false;
    }
    const char* from = xmpp_stanza_get_attribute(iq, "from");
    if (from == nullptr) {
        return true;
    }
    if (std::strchr(from, '/') != nullptr) {
        return false;
    }
    auto sender = models::BareJid::Parse(from);
    return sender.IsOk() && sender.Unwrap() == account;
}

void StropheSession::ContextDeleter::operator()(xmpp_ctx_t* context) const noexcept {
    xmpp_ctx_free(context);
}

void StropheSession::ConnectionDeleter::operator()(xmpp_conn_t* connection) const noexcept {
    xmpp_conn_release(connection);
}

void StropheSession::StanzaDeleter::operator()(xmpp_stanza_t* stanza) const noexcept {
    xmpp_stanza_release(stanza);
}

StropheSession::StropheSession() {
    xmpp_initialize();
    log_.handler = &StropheSession::LogBridge;
    log_.userdata = nullptr;
}

StropheSession::~StropheSession() {
    connection_.reset();
    context_.reset();
    xmpp_shutdown();
}

Result<std::unique_ptr<StropheSession>, SessionFailure> StropheSession::Create() {
    using CreateResult = Result<std::unique_ptr<StropheSession>, SessionFailure>;

    std::unique_ptr<StropheSession> session(new StropheSession());
    session->context_.reset(xmpp_ctx_new(nullptr, &session->log_));
    if (!session->context_) {
        return CreateResult::Err(SessionFailure::ConnectFailed("could not allocate an XMPP context"));
    }
    session->connection_.reset(xmpp_conn_new(session->context_.get()));
    if (!session->connection_) {
        return CreateResult::Err(SessionFailure::ConnectFailed("could not allocate an XMPP connection"));
    }
    return CreateResult::Ok(std::move(session));
}

void StropheSession::AddFeature(std::string feature) {
    features_.push_back(std::move(feature));
}

void StropheSession::OnSessionStart(SessionStartHandler handler) {
    on_session_start_ = std::move(handler);
}

SessionResult StropheSession::Connect(const ConnectionSettings& settings) {
    if (state_ != State::Idle) {
        return SessionResult::Err(SessionFailure::ConnectFailed("session was already started"));
    }

    const auto suffix = SodiumInterop::GetRandomBytes(StanzaConstants::RESOURCE_SUFFIX_LENGTH / 2);
    const auto full_jid = fmt::format("{}/{}{}",
                                      settings.jid.ToString(),
                                      StanzaConstants::RESOURCE_PREFIX,
                                      SodiumInterop::ToHex(suffix));
    xmpp_conn_set_jid(connection_.get(), full_jid.c_str());
    account_ = settings.jid;
    xmpp_conn_set_pass(connection_.get(), settings.password.c_str());

    long flags = xmpp_conn_get_flags(connection_.get());
    if (settings.allow_plaintext) {
        flags &= ~XMPP_CONN_FLAG_MANDATORY_TLS;
    } else {
        flags |= XMPP_CONN_FLAG_MANDATORY_TLS;
    }
    if (xmpp_conn_set_flags(connection_.get(), flags) != XMPP_EOK) {
        return SessionResult::Err(SessionFailure::ConnectFailed("could not set connection flags"));
    }

    spdlog::info("Connecting as {}", full_jid);
    if (xmpp_connect_client(connection_.get(), nullptr, 0, &StropheSession::ConnectionHandler, this) != XMPP_EOK) {
        return SessionResult::Err(SessionFailure::ConnectFailed(
            fmt::format("could not start connecting to {}", settings.jid.Domain())));
    }
    state_ = State::Connecting;
    return SessionResult::Ok(unit);
}

SessionResult StropheSession::Run() {
    if (state_ == State::Idle) {
        return SessionResult::Err(SessionFailure::NotConnected("Run() called before Connect()"));
    }
    while (state_ != State::Closed) {
        xmpp_run_once(context_.get(), static_cast<unsigned long>(WorkflowConstants::LOOP_POLL_INTERVAL.count()));
        if (session_start_pending_) {
            session_start_pending_ = false;
            if (on_session_start_) {
                on_session_start_(*this);
            }
        }
    }
    if (failure_reason_.has_value()) {
        return SessionResult::Err(SessionFailure::ConnectFailed(*failure_reason_));
    }
    return SessionResult::Ok(unit);
}

SessionResult StropheSession::SendPresence() {
    StanzaPtr presence(xmpp_presence_new(context_.get()));
    if (!presence) {
        return SessionResult::Err(SessionFailure::SendFailed("could not allocate presence"));
    }
    return Send(presence.get());
}

SessionResult StropheSession::RequestRoster() {
    const auto id = NewId();
    StanzaPtr iq(xmpp_iq_new(context_.get(), StanzaConstants::IQ_TYPE_GET.data(), id.c_str()));
    auto query = NewStanza("query", XmppNamespaces::ROSTER.data());
    if (!iq || !query) {
        return SessionResult::Err(SessionFailure::SendFailed("could not allocate roster request"));
    }
    xmpp_stanza_add_child(iq.get(), query.get());

    auto sent = Send(iq.get());
    if (sent.IsOk()) {
        xmpp_id_handler_add(connection_.get(), &StropheSession::RosterResponseHandler, id.c_str(), this);
    }
    return sent;
}

SessionResult StropheSession::SendMessage(const models::OutgoingMessage& message) {
    if (state_ != State::Connected) {
        return SessionResult::Err(SessionFailure::NotConnected("session is not connected"));
    }

    const auto id = NewId();
    const auto to = message.To().ToString();
    StanzaPtr stanza(xmpp_message_new(context_.get(), message.Type().c_str(), to.c_str(), id.c_str()));
    if (!stanza) {
        return SessionResult::Err(SessionFailure::SendFailed("could not allocate message"));
    }

    if (message.Body().has_value() &&
        xmpp_message_set_body(stanza.get(), message.Body()->c_str()) != XMPP_EOK) {
        return SessionResult::Err(SessionFailure::SendFailed("could not set message body"));
    }

    if (const auto& method = message.Method(); method.has_value()) {
        auto encryption = NewStanza("encryption", XmppNamespaces::EME.data());
        if (!encryption) {
            return SessionResult::Err(SessionFailure::SendFailed("could not allocate EME element"));
        }
        xmpp_stanza_set_attribute(encryption.get(), "namespace", method->ns.c_str());
        xmpp_stanza_set_attribute(encryption.get(), "name", method->name.c_str());
        xmpp_stanza_add_child(stanza.get(), encryption.get());
    }

    for (const auto& envelope : message.Envelopes()) {
        StanzaPtr payload(xmpp_stanza_new_from_string(context_.get(), envelope.Xml().c_str()));
        if (!payload) {
            return SessionResult::Err(SessionFailure::InvalidStanza("encrypted payload is not well-formed XML"));
        }
        xmpp_stanza_add_child(stanza.get(), payload.get());
    }

    spdlog::debug("Sending {} message to {}", message.IsEncrypted() ? "encrypted" : "plain", to);
    return Send(stanza.get());
}

void StropheSession::Disconnect() {
    switch (state_) {
        case State::Connecting:
        case State::Connected:
            spdlog::debug("Disconnecting");
            state_ = State::Disconnecting;
            xmpp_disconnect(connection_.get());
            break;
        case State::Idle:
            state_ = State::Closed;
            break;
        case State::Disconnecting:
        case State::Closed:
            break;
    }
}

bool StropheSession::IsConnected() const {
    return state_ == State::Connected;
}

IqResult StropheSession::RoundTrip(const std::string& iq_xml, const std::chrono::milliseconds timeout) {
    if (state_ != State::Connected) {
        return IqResult::Err(IqFailure::Disconnected("session is not connected"));
    }

    StanzaPtr iq(xmpp_stanza_new_from_string(context_.get(), iq_xml.c_str()));
    if (!iq || !Equals(xmpp_stanza_get_name(iq.get()), "iq")) {
        return IqResult::Err(IqFailure::InvalidRequest("request is not an <iq/> stanza"));
    }

    std::string id;
    if (const char* existing = xmpp_stanza_get_id(iq.get()); existing != nullptr && *existing != '\0') {
        id = existing;
    } else {
        id = NewId();
        xmpp_stanza_set_id(iq.get(), id.c_str());
    }
    if (pending_iqs_.contains(id)) {
        return IqResult::Err(IqFailure::InvalidRequest(fmt::format("request id {} is already in flight", id)));
    }

    auto pending = pending_iqs_.emplace(id, std::nullopt).first;
    xmpp_id_handler_add(connection_.get(), &StropheSession::IqResponseHandler, id.c_str(), this);
    xmpp_send(connection_.get(), iq.get());

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pending->second.has_value() && state_ == State::Connected &&
           std::chrono::steady_clock::now() < deadline) {
        xmpp_run_once(context_.get(), static_cast<unsigned long>(WorkflowConstants::LOOP_POLL_INTERVAL.count()));
    }

    auto response = std::move(pending->second);
    pending_iqs_.erase(pending);
    if (response.has_value()) {
        return std::move(*response);
    }

    xmpp_id_handler_delete(connection_.get(), &StropheSession::IqResponseHandler, id.c_str());
    if (state_ != State::Connected) {
        return IqResult::Err(IqFailure::Disconnected(fmt::format("disconnected while waiting for {}", id)));
    }
    return IqResult::Err(IqFailure::Timeout(
        fmt::format("no response to {} within {} ms", id, timeout.count())));
}

StropheSession::StanzaPtr StropheSession::NewStanza(const char* name, const char* ns) const {
    StanzaPtr stanza(xmpp_stanza_new(context_.get()));
    if (!stanza) {
        return stanza;
    }
    xmpp_stanza_set_name(stanza.get(), name);
    if (ns != nullptr) {
        xmpp_stanza_set_ns(stanza.get(), ns);
    }
    return stanza;
}

std::string StropheSession::NewId() const {
    char* uuid = xmpp_uuid_gen(context_.get());
    if (uuid == nullptr) {
        return SodiumInterop::ToHex(SodiumInterop::GetRandomBytes(16));
    }
    std::string id(uuid);
    xmpp_free(context_.get(), uuid);
    return id;
}

SessionResult StropheSession::Send(xmpp_stanza_t* stanza) {
    if (state_ != State::Connected) {
        return SessionResult::Err(SessionFailure::NotConnected("session is not connected"));
    }
    xmpp_send(connection_.get(), stanza);
    return SessionResult::Ok(unit);
}

StropheSession::StanzaPtr StropheSession::BuildDiscoInfoReply(xmpp_stanza_t* request) const {
    StanzaPtr reply(xmpp_stanza_reply(request));
    auto query = NewStanza("query", XmppNamespaces::DISCO_INFO.data());
    auto identity = NewStanza("identity", nullptr);
    if (!reply || !query || !identity) {
        return nullptr;
    }
    xmpp_stanza_set_type(reply.get(), StanzaConstants::IQ_TYPE_RESULT.data());

    xmpp_stanza_t* request_query = xmpp_stanza_get_child_by_name_and_ns(
        request, "query", XmppNamespaces::DISCO_INFO.data());
    if (const char* node = xmpp_stanza_get_attribute(request_query, "node"); node != nullptr) {
        xmpp_stanza_set_attribute(query.get(), "node", node);
    }

    xmpp_stanza_set_attribute(identity.get(), "category", StanzaConstants::DISCO_IDENTITY_CATEGORY.data());
    xmpp_stanza_set_attribute(identity.get(), "type", StanzaConstants::DISCO_IDENTITY_TYPE.data());
    xmpp_stanza_set_attribute(identity.get(), "name", StanzaConstants::DISCO_IDENTITY_NAME.data());
    xmpp_stanza_add_child(query.get(), identity.get());

    std::vector<std::string> features{
        std::string(XmppNamespaces::DISCO_INFO),
        std::string(XmppNamespaces::PING),
        std::string(XmppNamespaces::EME)};
    features.insert(features.end(), features_.begin(), features_.end());
    for (const auto& var : features) {
        auto feature = NewStanza("feature", nullptr);
        if (!feature) {
            return nullptr;
        }
        xmpp_stanza_set_attribute(feature.get(), "var", var.c_str());
        xmpp_stanza_add_child(query.get(), feature.get());
    }

    xmpp_stanza_add_child(reply.get(), query.get());
    return reply;
}

void StropheSession::HandleConnectionEvent(
    const xmpp_conn_event_t event,
    const int error,
    const xmpp_stream_error_t* stream_error) {
    switch (event) {
        case XMPP_CONN_CONNECT: {
            spdlog::info("Session established");
            state_ = State::Connected;
            xmpp_handler_add(connection_.get(), &StropheSession::IncomingIqHandler, nullptr, "iq", nullptr, this);
            if (const auto presence = SendPresence(); presence.IsErr()) {
                spdlog::warn("Could not send presence: {}", presence.UnwrapErr().message);
            }
            if (const auto roster = RequestRoster(); roster.IsErr()) {
                spdlog::warn("Could not request roster: {}", roster.UnwrapErr().message);
            }
            session_start_pending_ = true;
            break;
        }
        case XMPP_CONN_DISCONNECT:
        case XMPP_CONN_FAIL:
            if (state_ == State::Connecting) {
                failure_reason_ = DescribeConnectionError(error, stream_error);
                spdlog::error("Could not connect: {}", *failure_reason_);
            } else {
                spdlog::info("Disconnected");
            }
            state_ = State::Closed;
            break;
        default:
            break;
    }
}

bool StropheSession::HandleIncomingIq(xmpp_stanza_t* stanza) {
    const char* type = xmpp_stanza_get_type(stanza);
    const bool is_get = Equals(type, StanzaConstants::IQ_TYPE_GET);
    if (!is_get && !Equals(type, StanzaConstants::IQ_TYPE_SET)) {
        return true;
    }

    StanzaPtr reply;
    if (is_get && xmpp_stanza_get_child_by_name_and_ns(stanza, "ping", XmppNamespaces::PING.data()) != nullptr) {
        spdlog::debug("Answering ping");
        reply.reset(xmpp_stanza_reply(stanza));
        if (reply) {
            xmpp_stanza_set_type(reply.get(), StanzaConstants::IQ_TYPE_RESULT.data());
        }
    } else if (is_get && xmpp_stanza_get_child_by_name_and_ns(
                             stanza, "query", XmppNamespaces::DISCO_INFO.data()) != nullptr) {
        spdlog::debug("Answering disco#info query");
        reply = BuildDiscoInfoReply(stanza);
    } else if (account_.has_value() && IsRosterPush(stanza, *account_)) {
        spdlog::debug("Acknowledging roster push");
        reply.reset(xmpp_stanza_reply(stanza));
        if (reply) {
            xmpp_stanza_set_type(reply.get(), StanzaConstants::IQ_TYPE_RESULT.data());
        }
    } else {
        reply.reset(xmpp_stanza_reply(stanza));
        auto error = NewStanza("error", nullptr);
        auto condition = NewStanza("service-unavailable", XmppNamespaces::STANZAS.data());
        if (reply && error && condition) {
            xmpp_stanza_set_type(reply.get(), StanzaConstants::IQ_TYPE_ERROR.data());
            xmpp_stanza_set_attribute(error.get(), "type", "cancel");
            xmpp_stanza_add_child(error.get(), condition.get());
            xmpp_stanza_add_child(reply.get(), error.get());
        } else {
            reply.reset();
        }
    }

    if (!reply) {
        spdlog::warn("Could not build reply to incoming IQ");
        return true;
    }
    if (const auto sent = Send(reply.get()); sent.IsErr()) {
        spdlog::warn("Could not answer incoming IQ: {}", sent.UnwrapErr().message);
    }
    return true;
}

void StropheSession::HandleIqResponse(xmpp_stanza_t* stanza) {
    const char* id = xmpp_stanza_get_id(stanza);
    if (id == nullptr) {
        return;
    }
    const auto pending = pending_iqs_.find(id);
    if (pending == pending_iqs_.end()) {
        return;
    }

    if (Equals(xmpp_stanza_get_type(stanza), StanzaConstants::IQ_TYPE_ERROR)) {
        pending->second = IqResult::Err(IqFailure::Error(ErrorCondition(stanza)));
        return;
    }

    char* buffer = nullptr;
    size_t length = 0;
    if (xmpp_stanza_to_text(stanza, &buffer, &length) != XMPP_EOK || buffer == nullptr) {
        pending->second = IqResult::Err(IqFailure::InvalidRequest("could not serialize response"));
        return;
    }
    pending->second = IqResult::Ok(std::string(buffer, length));
    xmpp_free(context_.get(), buffer);
}

void StropheSession::LogBridge(
    void* /*userdata*/,
    const xmpp_log_level_t level,
    const char* area,
    const char* message) {
    const char* safe_area = area != nullptr ? area : "xmpp";
    const char* safe_message = message != nullptr ? message : "";
    // libstrophe logs raw traffic, including authentication, at debug level.
    switch (level) {
        case XMPP_LEVEL_DEBUG:
            spdlog::trace("[{}] {}", safe_area, safe_message);
            break;
        case XMPP_LEVEL_INFO:
            spdlog::debug("[{}] {}", safe_area, safe_message);
            break;
        case XMPP_LEVEL_WARN:
            spdlog::warn("[{}] {}", safe_area, safe_message);
            break;
        case XMPP_LEVEL_ERROR:
            spdlog::error("[{}] {}", safe_area, safe_message);
            break;
    }
}

void StropheSession::ConnectionHandler(
    xmpp_conn_t* /*connection*/,
    const xmpp_conn_event_t event,
    const int error,
    xmpp_stream_error_t* stream_error,
    void* userdata) {
    static_cast<StropheSession*>(userdata)->HandleConnectionEvent(event, error, stream_error);
}

int StropheSession::IncomingIqHandler(xmpp_conn_t* /*connection*/, xmpp_stanza_t* stanza, void* userdata) {
    return static_cast<StropheSession*>(userdata)->HandleIncomingIq(stanza) ? 1 : 0;
}

int StropheSession::IqResponseHandler(xmpp_conn_t* /*connection*/, xmpp_stanza_t* stanza, void* userdata) {
    static_cast<StropheSession*>(userdata)->HandleIqResponse(stanza);
    return 0;
}

int StropheSession::RosterResponseHandler(xmpp_conn_t* /*connection*/, xmpp_stanza_t* stanza, void* /*userdata*/) {
    if (Equals(xmpp_stanza_get_type(stanza), StanzaConstants::IQ_TYPE_ERROR)) {
        spdlog::warn("Roster request failed: {}", ErrorCondition(stanza));
        return 0;
    }
    size_t items = 0;
    xmpp_stanza_t* query = xmpp_stanza_get_child_by_name_and_ns(stanza, "query", XmppNamespaces::ROSTER.data());
    if (query != nullptr) {
        for (xmpp_stanza_t* item = xmpp_stanza_get_children(query); item != nullptr;
             item = xmpp_stanza_get_next(item)) {
            ++items;
        }
    }
    spdlog::debug("Roster received with {} item(s)", items);
    return 0;
}

}
