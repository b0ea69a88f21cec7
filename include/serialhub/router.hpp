#pragma once
/**
 * @page sh-router serialhub Settings/Command Router
 * @file router.hpp
 * @brief Turns one client text frame into a reconfiguration or a device command.
 *
 * @details
 * PURPOSE
 * -------
 * Clients speak two JSON shapes and nothing else:
 *   - reconfigure: {"port": "<string>", "baudRate": "<string of digits>"}
 *   - command:     {"command": "<string>"}
 * The router is the switchboard between those shapes and the components that
 * act on them. main/ws_server never look inside a payload.
 *
 * WHAT THIS DOES
 * --------------
 * - decode_payload() classifies a parsed JSON object into a tagged union:
 *   ReconfigureRequest, CommandRequest, PayloadError or UnrecognizedPayload.
 *   The reconfigure shape is tried first: it applies whenever BOTH "port" and
 *   "baudRate" are present, even if a "command" key is there too.
 * - Router::handle() acts on the decoded value:
 *     ReconfigureRequest  → ConnectionManager::configure() (changed/unchanged reported there)
 *     CommandRequest      → OutboundWriter::submit() with "\n" appended
 *     PayloadError        → each error line broadcast, connection untouched
 *     UnrecognizedPayload → logged, nothing broadcast
 * - Router::handle_text() parses raw text first. Text that is not a JSON object
 *   is logged and dropped; the client session is never closed for it.
 *
 * VALIDATION
 * ----------
 * - "port" and "baudRate" must both be JSON strings. Each wrong type produces its
 *   own error line, so a client that gets both wrong hears about both.
 * - "baudRate" must be a base-10 positive integer that fits in int; anything else
 *   ("96x0", "-9600", "0", "") is a conversion error.
 * - "command" must be a JSON string; the empty string is a valid command (a bare
 *   newline reaches the device).
 *
 * EXAMPLE
 * -------
 * @code
 *   router.handle_text(R"({"port":"/dev/ttyUSB0","baudRate":"9600"})");  // Reconfigured
 *   router.handle_text(R"({"command":"AT"})");                            // CommandQueued
 *   router.handle_text("not json");                                       // Malformed
 * @endcode
 */

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

#include "serialhub/settings.hpp"
#include "serialhub/status_sink.hpp"

namespace serialhub {

class ConnectionManager;
class OutboundWriter;

struct ReconfigureRequest { ConnectionSettings settings; };
struct CommandRequest     { std::string command; };
struct PayloadError       { std::vector<std::string> errors; };
struct UnrecognizedPayload {};

using ClientPayload = std::variant<ReconfigureRequest, CommandRequest, PayloadError, UnrecognizedPayload>;

/// Strict base-10 positive int parse ("9600" ok; "9600 ", "+0", "-1", "" rejected).
bool parse_baud(const std::string& text, int& out);

/// Classify a parsed client payload. Non-objects decode as UnrecognizedPayload.
ClientPayload decode_payload(const nlohmann::json& payload);

class Router {
public:
  enum class Outcome : uint8_t {
    Reconfigured  = 0,  ///< settings differed; reconnect performed
    Unchanged     = 1,  ///< settings identical; "unchanged" reported
    CommandQueued = 2,  ///< handed to the outbound writer
    Rejected      = 3,  ///< field type / conversion errors reported
    Unrecognized  = 4,  ///< JSON object of neither shape; ignored
    Malformed     = 5,  ///< not a JSON object; logged and dropped
    Dropped       = 6   ///< writer no longer accepts commands
  };

  Router(ConnectionManager& connection, OutboundWriter& writer, StatusSink& status);

  Outcome handle_text(const std::string& raw);
  Outcome handle(const nlohmann::json& payload);

private:
  ConnectionManager& connection_;
  OutboundWriter&    writer_;
  StatusSink&        status_;
};

const char* to_string(Router::Outcome o);

} // namespace serialhub
