#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace termpanel::ipc
{

// ─── IPC ID types ────────────────────────────────────────────────────────────
using RequestId    = uint64_t;
using SubscriberId = uint64_t;

static constexpr RequestId    INVALID_REQUEST    = 0;
static constexpr SubscriberId INVALID_SUBSCRIBER = 0;

// ─── Message types ───────────────────────────────────────────────────────────
enum class MessageType : uint16_t
{
    // Handshake
    HELLO   = 0x0001,
    WELCOME = 0x0002,

    // Request/Response
    RESP_OK  = 0x0010,
    RESP_ERR = 0x0011,

    // Real-time terminal events (client → daemon)
    REQ_SUBSCRIBE   = 0x0100,
    REQ_UNSUBSCRIBE = 0x0101,
    REQ_INPUT       = 0x0102,
    REQ_RESIZE      = 0x0103,
    REQ_SIGNAL      = 0x0104,
    REQ_SCROLL      = 0x0105,
    REQ_SCROLLBACK  = 0x0106,

    // Session management
    REQ_SESSION_CREATE  = 0x0200,
    REQ_SESSION_LIST    = 0x0201,
    REQ_SESSION_DESTROY = 0x0202,
    REQ_SESSION_COMMAND = 0x0203,
    REQ_BIND_DISPLAY    = 0x0204,
    REQ_UNBIND_DISPLAY  = 0x0205,

    // Display management
    REQ_DISPLAY_ALLOCATE = 0x0300,
    REQ_DISPLAY_LIST     = 0x0301,
    REQ_DISPLAY_RELEASE  = 0x0302,
    REQ_DISPLAY_GET      = 0x0303,
    REQ_DISPLAY_ENV      = 0x0304,
    REQ_DISPLAY_RESIZE   = 0x0305,
    REQ_DISPLAY_PANELS   = 0x0306,

    // Quick commands
    REQ_COMMANDS_GET    = 0x0400,
    REQ_COMMANDS_ADD    = 0x0401,
    REQ_COMMANDS_REMOVE = 0x0402,

    // Typed responses
    RESP_SESSION  = 0x0500,
    RESP_SESSIONS = 0x0501,
    RESP_DISPLAY  = 0x0502,
    RESP_DISPLAYS = 0x0503,
    RESP_ENV      = 0x0504,
    RESP_COMMANDS = 0x0505,
    RESP_PANELS   = 0x0506,

    // Events (daemon → client)
    EVT_OUTPUT       = 0x0600,
    EVT_SUBSCRIBED   = 0x0601,
    EVT_UNSUBSCRIBED = 0x0602,
    EVT_SCROLLBACK   = 0x0603,
    EVT_ERROR        = 0x0604,
};

const char* message_type_name(MessageType type);

// ─── Message envelope ────────────────────────────────────────────────────────
// Wire format: [Header (fixed 40 bytes)] [payload (variable)]
//
// Header layout:
//   bytes 0-1:   magic (0x54, 0x50 = "TP")
//   bytes 2-3:   message type (uint16_t LE)
//   bytes 4-7:   payload length (uint32_t LE)
//   bytes 8-15:  sequence number (uint64_t LE)
//   bytes 16-23: request_id (uint64_t LE)
//   bytes 24-31: subscriber_id (uint64_t LE)
//   bytes 32-39: reserved, zero

static constexpr uint8_t MAGIC_0          = 0x54;   // 'T'
static constexpr uint8_t MAGIC_1          = 0x50;   // 'P'
static constexpr size_t  HEADER_SIZE      = 40;
static constexpr size_t  MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;   // 16 MiB

struct MessageHeader
{
    MessageType  type          = MessageType::HELLO;
    uint32_t     payload_len   = 0;
    uint64_t     seq           = 0;
    RequestId    request_id    = INVALID_REQUEST;
    SubscriberId subscriber_id = INVALID_SUBSCRIBER;
    uint64_t     reserved      = 0;
};

struct Message
{
    MessageHeader        header;
    std::vector<uint8_t> payload;
};

// ─── Handshake payloads ──────────────────────────────────────────────────────

static constexpr uint16_t PROTOCOL_MAJOR = 1;
static constexpr uint16_t PROTOCOL_MINOR = 0;

struct HelloPayload
{
    uint16_t    protocol_major = PROTOCOL_MAJOR;
    uint16_t    protocol_minor = PROTOCOL_MINOR;
    std::string client_build;
};

struct WelcomePayload
{
    SubscriberId subscriber_id = INVALID_SUBSCRIBER;
    uint64_t     daemon_pid    = 0;
    std::string  session_prefix;
};

// ─── Response payloads ───────────────────────────────────────────────────────

struct RespOkPayload
{
    RequestId request_id = INVALID_REQUEST;
};

// `kind` is a stable tag such as "not_found"; `code` is its numeric value.
struct RespErrPayload
{
    RequestId   request_id = INVALID_REQUEST;
    uint32_t    code       = 0;
    std::string kind;
    std::string message;
};

// ─── Terminal event payloads ────────────────────────────────────────────────

// REQ_UNSUBSCRIBE, REQ_SESSION_DESTROY, REQ_UNBIND_DISPLAY, REQ_COMMANDS_GET,
// EVT_SUBSCRIBED, EVT_UNSUBSCRIBED.
struct SessionTargetPayload
{
    std::string session;
};

// REQ_SUBSCRIBE, REQ_RESIZE.
struct TerminalSizePayload
{
    std::string session;
    uint16_t    cols = 0;
    uint16_t    rows = 0;
};

// REQ_INPUT, EVT_OUTPUT.
struct TerminalDataPayload
{
    std::string session;
    std::string data;
};

struct SignalPayload
{
    std::string session;
    std::string signal;   // "SIGINT", "TERM", ...
};

struct ScrollPayload
{
    std::string session;
    std::string command;   // enter, exit, up, down, page_up, page_down, top, bottom
    int32_t     lines = 1;
};

struct ScrollbackRequestPayload
{
    std::string            session;
    int32_t                start_line = -1000;
    std::optional<int32_t> end_line;
};

// EVT_SCROLLBACK
struct ScrollbackPayload
{
    std::string session;
    std::string content;
    int32_t     history_size = 0;
    int32_t     start_line   = 0;
};

struct ErrorEventPayload
{
    std::string kind;
    std::string message;
    std::string session;   // empty when not session-specific
};

// ─── Session management payloads ────────────────────────────────────────────

struct SessionCreatePayload
{
    std::optional<std::string> name;
    std::optional<std::string> cwd;
    std::optional<std::string> command;
};

struct SessionCommandPayload
{
    std::string session;
    std::string command;
};

struct BindDisplayPayload
{
    std::string session;
    int32_t     display = 0;
};

struct SessionEntry
{
    std::string name;
    bool        bridged     = false;
    uint32_t    subscribers = 0;
    uint64_t    pane_pid    = 0;   // 0 = unknown
};

// RESP_SESSION carries exactly one entry.
struct SessionListPayload
{
    std::vector<SessionEntry> sessions;
};

// ─── Display payloads ───────────────────────────────────────────────────────

struct DisplayAllocatePayload
{
    std::optional<int32_t> display;
    std::optional<int32_t> panel;
    uint32_t               width  = 0;
    uint32_t               height = 0;
    uint32_t               depth  = 0;
};

// REQ_DISPLAY_RELEASE, REQ_DISPLAY_GET, REQ_DISPLAY_ENV.
struct DisplayTargetPayload
{
    int32_t display = 0;
};

struct DisplayResizePayload
{
    int32_t  display = 0;
    uint32_t width   = 0;
    uint32_t height  = 0;
};

struct DisplayEntry
{
    int32_t  display     = 0;
    int32_t  panel_index = 0;
    uint16_t vnc_port    = 0;
    uint16_t ws_port     = 0;
    uint32_t width       = 0;
    uint32_t height      = 0;
    uint32_t depth       = 0;
    bool     created     = false;
};

// RESP_DISPLAY carries exactly one entry.
struct DisplayListPayload
{
    std::vector<DisplayEntry> displays;
};

struct EnvPayload
{
    int32_t                                          display = 0;
    std::vector<std::pair<std::string, std::string>> vars;
    std::vector<std::string>                         unset;
    std::string                                      export_command;
};

struct PanelEntry
{
    int32_t  panel_index = 0;
    int32_t  display     = 0;
    uint16_t vnc_port    = 0;
    uint16_t ws_port     = 0;
};

struct PanelsPayload
{
    std::vector<PanelEntry> panels;
};

// ─── Quick command payloads ─────────────────────────────────────────────────

struct CommandsAddPayload
{
    std::string session;
    std::string label;
    std::string command;
};

struct CommandsRemovePayload
{
    std::string session;
    uint32_t    index = 0;
};

struct CommandEntry
{
    std::string label;
    std::string command;
};

struct CommandsPayload
{
    std::string               session;
    std::vector<CommandEntry> commands;
};

}   // namespace termpanel::ipc
