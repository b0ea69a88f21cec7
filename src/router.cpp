// -----------------------------------------------------------------------------
// Implementation for router.hpp
//
// - See router.hpp for the accepted payload shapes and the error surface.
// - See tests/test_router.cpp for the cases pinned down.
//
// Notes for maintainers:
// - JSON exceptions stop here. Nothing past handle_text() ever sees one.
// - Error lines are part of the client-visible surface; change them with care.
// -----------------------------------------------------------------------------

#include "serialhub/router.hpp"

#include "serialhub/connection_manager.hpp"
#include "serialhub/log.hpp"
#include "serialhub/outbound_writer.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace serialhub {

using nlohmann::json;

const char* to_string(Router::Outcome o) {
    switch (o) {
        case Router::Outcome::Reconfigured:  return "reconfigured";
        case Router::Outcome::Unchanged:     return "unchanged";
        case Router::Outcome::CommandQueued: return "command_queued";
        case Router::Outcome::Rejected:      return "rejected";
        case Router::Outcome::Unrecognized:  return "unrecognized";
        case Router::Outcome::Malformed:     return "malformed";
        case Router::Outcome::Dropped:       return "dropped";
    }
    return "?";
}

// ---------- baud parsing (no exceptions) ----------
// strtol with an explicit end check, base 10 only: "0x2580" is not a baud rate.
bool parse_baud(const std::string& text, int& out) {
    if (text.empty()) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;   // no sign, no spaces, no junk
    }

    errno = 0;
    char* e = nullptr;
    long v = std::strtol(text.c_str(), &e, 10);
    if (!e || *e || errno == ERANGE) return false;
    if (v <= 0 || v > INT_MAX) return false;

    out = static_cast<int>(v);
    return true;
}

// ---------- shape detection ----------
// Reconfigure wins when both of its keys are present; only then is "command"
// looked at. A field that is present but mistyped is reported, never guessed.
ClientPayload decode_payload(const json& payload) {
    if (!payload.is_object()) return UnrecognizedPayload{};

    const auto port = payload.find("port");
    const auto baud = payload.find("baudRate");

    if (port != payload.end() && baud != payload.end()) {
        PayloadError bad;
        if (!port->is_string()) bad.errors.emplace_back("Error: invalid data type for port.");
        if (!baud->is_string()) bad.errors.emplace_back("Error: invalid data type for baud rate.");
        if (!bad.errors.empty()) return bad;

        ReconfigureRequest req;
        req.settings.port = port->get<std::string>();
        if (!parse_baud(baud->get<std::string>(), req.settings.baud_rate)) {
            return PayloadError{{"Error: unable to convert baud rate."}};
        }
        return req;
    }

    const auto cmd = payload.find("command");
    if (cmd != payload.end()) {
        if (!cmd->is_string()) return PayloadError{{"Error: invalid data type for command."}};
        return CommandRequest{cmd->get<std::string>()};
    }

    return UnrecognizedPayload{};
}


Router::Router(ConnectionManager& connection, OutboundWriter& writer, StatusSink& status)
    : connection_(connection), writer_(writer), status_(status) {}

Router::Outcome Router::handle_text(const std::string& raw) {
    json payload;
    try {
        payload = json::parse(raw);
    } catch (const json::parse_error& ex) {
        log::warn("router", "cannot parse client message: ", ex.what());
        return Outcome::Malformed;
    }

    if (!payload.is_object()) {
        log::warn("router", "client message is not a JSON object, dropped");
        return Outcome::Malformed;
    }
    return handle(payload);
}

Router::Outcome Router::handle(const json& payload) {
    const ClientPayload decoded = decode_payload(payload);

    if (const auto* req = std::get_if<ReconfigureRequest>(&decoded)) {
        const auto r = connection_.configure(req->settings);
        return r == ConnectionManager::ConfigureResult::Changed ? Outcome::Reconfigured
                                                                : Outcome::Unchanged;
    }

    if (const auto* cmd = std::get_if<CommandRequest>(&decoded)) {
        OutboundRequest out;
        out.payload = cmd->command + "\n";
        return writer_.submit(std::move(out)) ? Outcome::CommandQueued : Outcome::Dropped;
    }

    if (const auto* bad = std::get_if<PayloadError>(&decoded)) {
        for (const auto& line : bad->errors) status_.publish(line, Source::Status);
        return Outcome::Rejected;
    }

    // Neither shape. Kept silent towards clients; the log shows what arrived.
    log::warn("router", "payload matches neither settings nor command shape: ", payload.dump());
    return Outcome::Unrecognized;
}

} // namespace serialhub
