#pragma once

#include "message.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace termpanel::ipc
{

// ─── Header serialization ────────────────────────────────────────────────────
// Encodes/decodes the fixed 40-byte message header.

// Encode header into exactly HEADER_SIZE bytes (appended to `out`).
void encode_header(const MessageHeader& hdr, std::vector<uint8_t>& out);

// Decode header from exactly HEADER_SIZE bytes.
// Returns std::nullopt if magic bytes are wrong or buffer too small.
std::optional<MessageHeader> decode_header(std::span<const uint8_t> data);

// ─── Full message serialization ──────────────────────────────────────────────

std::vector<uint8_t>   encode_message(const Message& msg);
std::optional<Message> decode_message(std::span<const uint8_t> data);

// ─── Payload serialization (simple TLV-style binary) ─────────────────────────
// Format for each field: [tag: uint8_t] [len: uint32_t LE] [data: len bytes]
// Integers are little-endian; signed values travel as their two's complement
// bit pattern. Repeated fields repeat the tag; nested records are TLV blobs.

class PayloadEncoder
{
   public:
    void put_u16(uint8_t tag, uint16_t val);
    void put_u32(uint8_t tag, uint32_t val);
    void put_u64(uint8_t tag, uint64_t val);
    void put_i32(uint8_t tag, int32_t val) { put_u32(tag, static_cast<uint32_t>(val)); }
    void put_bool(uint8_t tag, bool val);
    void put_string(uint8_t tag, const std::string& val);
    void put_blob(uint8_t tag, const std::vector<uint8_t>& blob);

    const std::vector<uint8_t>& data() const { return buf_; }
    std::vector<uint8_t>        take() { return std::move(buf_); }

   private:
    std::vector<uint8_t> buf_;
};

class PayloadDecoder
{
   public:
    explicit PayloadDecoder(std::span<const uint8_t> data);

    // Advance to the next field. Returns false when no more fields.
    bool next();

    uint8_t  tag() const { return tag_; }
    uint32_t field_len() const { return len_; }

    uint16_t                 as_u16() const;
    uint32_t                 as_u32() const;
    uint64_t                 as_u64() const;
    int32_t                  as_i32() const { return static_cast<int32_t>(as_u32()); }
    bool                     as_bool() const;
    std::string              as_string() const;
    std::span<const uint8_t> as_blob() const;

   private:
    std::span<const uint8_t> data_;
    size_t                   pos_        = 0;
    uint8_t                  tag_        = 0;
    uint32_t                 len_        = 0;
    size_t                   val_offset_ = 0;
};

// ─── Field tags ──────────────────────────────────────────────────────────────

// Handshake
static constexpr uint8_t TAG_PROTOCOL_MAJOR = 0x10;
static constexpr uint8_t TAG_PROTOCOL_MINOR = 0x11;
static constexpr uint8_t TAG_CLIENT_BUILD   = 0x12;
static constexpr uint8_t TAG_SUBSCRIBER_ID  = 0x20;
static constexpr uint8_t TAG_DAEMON_PID     = 0x21;
static constexpr uint8_t TAG_SESSION_PREFIX = 0x22;

// Responses
static constexpr uint8_t TAG_REQUEST_ID    = 0x30;
static constexpr uint8_t TAG_ERROR_CODE    = 0x31;
static constexpr uint8_t TAG_ERROR_MESSAGE = 0x32;
static constexpr uint8_t TAG_ERROR_KIND    = 0x33;

// Terminal events
static constexpr uint8_t TAG_SESSION        = 0x40;
static constexpr uint8_t TAG_COLS           = 0x41;
static constexpr uint8_t TAG_ROWS           = 0x42;
static constexpr uint8_t TAG_DATA           = 0x43;
static constexpr uint8_t TAG_SIGNAL         = 0x44;
static constexpr uint8_t TAG_SCROLL_COMMAND = 0x45;
static constexpr uint8_t TAG_LINES          = 0x46;
static constexpr uint8_t TAG_START_LINE     = 0x47;
static constexpr uint8_t TAG_END_LINE       = 0x48;
static constexpr uint8_t TAG_HISTORY_SIZE   = 0x49;
static constexpr uint8_t TAG_CONTENT        = 0x4A;

// Sessions
static constexpr uint8_t TAG_NAME         = 0x50;
static constexpr uint8_t TAG_CWD          = 0x51;
static constexpr uint8_t TAG_COMMAND      = 0x52;
static constexpr uint8_t TAG_BRIDGED      = 0x53;
static constexpr uint8_t TAG_SUBSCRIBERS  = 0x54;
static constexpr uint8_t TAG_PANE_PID     = 0x55;
static constexpr uint8_t TAG_SESSION_BLOB = 0x56;

// Displays
static constexpr uint8_t TAG_DISPLAY        = 0x60;
static constexpr uint8_t TAG_PANEL          = 0x61;
static constexpr uint8_t TAG_VNC_PORT       = 0x62;
static constexpr uint8_t TAG_WS_PORT        = 0x63;
static constexpr uint8_t TAG_WIDTH          = 0x64;
static constexpr uint8_t TAG_HEIGHT         = 0x65;
static constexpr uint8_t TAG_DEPTH          = 0x66;
static constexpr uint8_t TAG_CREATED        = 0x67;
static constexpr uint8_t TAG_DISPLAY_BLOB   = 0x68;
static constexpr uint8_t TAG_ENV_VAR_BLOB   = 0x69;
static constexpr uint8_t TAG_ENV_KEY        = 0x6A;
static constexpr uint8_t TAG_ENV_VALUE      = 0x6B;
static constexpr uint8_t TAG_ENV_UNSET      = 0x6C;   // repeated string
static constexpr uint8_t TAG_EXPORT_COMMAND = 0x6D;
static constexpr uint8_t TAG_PANEL_BLOB     = 0x6E;

// Quick commands
static constexpr uint8_t TAG_LABEL        = 0x70;
static constexpr uint8_t TAG_INDEX        = 0x71;
static constexpr uint8_t TAG_COMMAND_BLOB = 0x72;

// ─── Payload encode/decode ───────────────────────────────────────────────────
// Decoders skip unknown tags. Those whose payload names a session return
// std::nullopt when the session field is missing.

std::vector<uint8_t>        encode_hello(const HelloPayload& p);
std::optional<HelloPayload> decode_hello(std::span<const uint8_t> data);

std::vector<uint8_t>          encode_welcome(const WelcomePayload& p);
std::optional<WelcomePayload> decode_welcome(std::span<const uint8_t> data);

std::vector<uint8_t>         encode_resp_ok(const RespOkPayload& p);
std::optional<RespOkPayload> decode_resp_ok(std::span<const uint8_t> data);

std::vector<uint8_t>          encode_resp_err(const RespErrPayload& p);
std::optional<RespErrPayload> decode_resp_err(std::span<const uint8_t> data);

std::vector<uint8_t>                encode_session_target(const SessionTargetPayload& p);
std::optional<SessionTargetPayload> decode_session_target(std::span<const uint8_t> data);

std::vector<uint8_t>               encode_terminal_size(const TerminalSizePayload& p);
std::optional<TerminalSizePayload> decode_terminal_size(std::span<const uint8_t> data);

std::vector<uint8_t>               encode_terminal_data(const TerminalDataPayload& p);
std::optional<TerminalDataPayload> decode_terminal_data(std::span<const uint8_t> data);

std::vector<uint8_t>         encode_signal(const SignalPayload& p);
std::optional<SignalPayload> decode_signal(std::span<const uint8_t> data);

std::vector<uint8_t>         encode_scroll(const ScrollPayload& p);
std::optional<ScrollPayload> decode_scroll(std::span<const uint8_t> data);

std::vector<uint8_t>                    encode_scrollback_request(const ScrollbackRequestPayload& p);
std::optional<ScrollbackRequestPayload> decode_scrollback_request(std::span<const uint8_t> data);

std::vector<uint8_t>             encode_scrollback(const ScrollbackPayload& p);
std::optional<ScrollbackPayload> decode_scrollback(std::span<const uint8_t> data);

std::vector<uint8_t>             encode_error_event(const ErrorEventPayload& p);
std::optional<ErrorEventPayload> decode_error_event(std::span<const uint8_t> data);

std::vector<uint8_t>                encode_session_create(const SessionCreatePayload& p);
std::optional<SessionCreatePayload> decode_session_create(std::span<const uint8_t> data);

std::vector<uint8_t>                 encode_session_command(const SessionCommandPayload& p);
std::optional<SessionCommandPayload> decode_session_command(std::span<const uint8_t> data);

std::vector<uint8_t>              encode_bind_display(const BindDisplayPayload& p);
std::optional<BindDisplayPayload> decode_bind_display(std::span<const uint8_t> data);

std::vector<uint8_t>              encode_session_list(const SessionListPayload& p);
std::optional<SessionListPayload> decode_session_list(std::span<const uint8_t> data);

std::vector<uint8_t>                  encode_display_allocate(const DisplayAllocatePayload& p);
std::optional<DisplayAllocatePayload> decode_display_allocate(std::span<const uint8_t> data);

std::vector<uint8_t>                encode_display_target(const DisplayTargetPayload& p);
std::optional<DisplayTargetPayload> decode_display_target(std::span<const uint8_t> data);

std::vector<uint8_t>                encode_display_resize(const DisplayResizePayload& p);
std::optional<DisplayResizePayload> decode_display_resize(std::span<const uint8_t> data);

std::vector<uint8_t>              encode_display_list(const DisplayListPayload& p);
std::optional<DisplayListPayload> decode_display_list(std::span<const uint8_t> data);

std::vector<uint8_t>      encode_env(const EnvPayload& p);
std::optional<EnvPayload> decode_env(std::span<const uint8_t> data);

std::vector<uint8_t>         encode_panels(const PanelsPayload& p);
std::optional<PanelsPayload> decode_panels(std::span<const uint8_t> data);

std::vector<uint8_t>              encode_commands_add(const CommandsAddPayload& p);
std::optional<CommandsAddPayload> decode_commands_add(std::span<const uint8_t> data);

std::vector<uint8_t>                 encode_commands_remove(const CommandsRemovePayload& p);
std::optional<CommandsRemovePayload> decode_commands_remove(std::span<const uint8_t> data);

std::vector<uint8_t>           encode_commands(const CommandsPayload& p);
std::optional<CommandsPayload> decode_commands(std::span<const uint8_t> data);

}   // namespace termpanel::ipc
