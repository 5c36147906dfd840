/*
 * parabox - Supervisor <-> host protocol
 *
 * One JSON object per line over the control channel. The supervisor sends
 * commands (load, menu:click, shutdown); the host answers with events
 * (ready, error, menu:add, say, suggestion, menu:click:result).
 */
#ifndef PARABOX_IPC_PROTOCOL_HPP
#define PARABOX_IPC_PROTOCOL_HPP

#include "../core/json.hpp"
#include <string>
#include <cstddef>

namespace parabox {
namespace protocol {

// Commands (supervisor -> host)
const char* const kLoad = "load";
const char* const kMenuClick = "menu:click";
const char* const kShutdown = "shutdown";

// Events (host -> supervisor)
const char* const kReady = "ready";
const char* const kError = "error";
const char* const kMenuAdd = "menu:add";
const char* const kSay = "say";
const char* const kSuggestion = "suggestion";
const char* const kMenuClickResult = "menu:click:result";

// menu:click:result failure codes
const char* const kNotLoaded = "NOT_LOADED";
const char* const kPluginMismatch = "PLUGIN_MISMATCH";
const char* const kInvalidMenuId = "INVALID_MENU_ID";
const char* const kNoHandler = "NO_HANDLER";
const char* const kMenuClickFailed = "MENU_CLICK_FAILED";

// error{message} codes emitted while loading
const char* const kInvalidLoadCmd = "INVALID_LOAD_CMD";
const char* const kPermissionsRequired = "PERMISSIONS_REQUIRED";
const char* const kEntryReadFailed = "ENTRY_READ_FAILED";
const char* const kVmInitFailed = "VM_INIT_FAILED";
const char* const kVmExecFailed = "VM_EXEC_FAILED";

// Text limits, enforced on both sides of the channel
const size_t kSayMaxChars = 200;
const size_t kSuggestionMaxChars = 200;
const size_t kMenuItemsMax = 10;
const size_t kMenuIdMaxChars = 80;
const size_t kMenuLabelMaxChars = 80;
const size_t kRequestIdMaxChars = 80;

// Message type, or "" when msg is not an object with a string "type"
std::string message_type(const Json& msg);

// Declared permissions must be an object or an array
bool is_permissions_value(const Json& permissions);

Json make_load(const std::string& plugin_id, const std::string& version,
               const std::string& entry_path, const Json& permissions);
Json make_menu_click(const std::string& plugin_id, const std::string& id,
                     const std::string& request_id);
Json make_shutdown();

Json make_ready();
Json make_error(const std::string& message);
Json make_menu_add(const std::string& plugin_id, const std::string& id,
                   const std::string& label);
// type is kSay or kSuggestion
Json make_output(const char* type, const std::string& plugin_id, const std::string& text);
Json make_click_result(const std::string& request_id, bool ok,
                       const std::string& error = "");

} // namespace protocol
} // namespace parabox

#endif // PARABOX_IPC_PROTOCOL_HPP
