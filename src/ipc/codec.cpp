#include "codec.hpp"

namespace termpanel::ipc
{

// ─── Little-endian helpers ───────────────────────────────────────────────────

static void write_u16_le(std::vector<uint8_t>& buf, uint16_t v)
{
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

static void write_u32_le(std::vector<uint8_t>& buf, uint32_t v)
{
    for (int i = 0; i < 4; ++i)
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
}

static void write_u64_le(std::vector<uint8_t>& buf, uint64_t v)
{
    for (int i = 0; i < 8; ++i)
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
}

static uint16_t read_u16_le(const uint8_t* p)
{
    return static_cast<uint16_t>(p[0]) | static_cast<uint16_t>(static_cast<uint16_t>(p[1]) << 8);
}

static uint32_t read_u32_le(const uint8_t* p)
{
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8)
           | (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

static uint64_t read_u64_le(const uint8_t* p)
{
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
        v |= static_cast<uint64_t>(p[i]) << (i * 8);
    return v;
}

// ─── Message type names ──────────────────────────────────────────────────────

const char* message_type_name(MessageType type)
{
    switch (type)
    {
        case MessageType::HELLO: return "HELLO";
        case MessageType::WELCOME: return "WELCOME";
        case MessageType::RESP_OK: return "RESP_OK";
        case MessageType::RESP_ERR: return "RESP_ERR";
        case MessageType::REQ_SUBSCRIBE: return "REQ_SUBSCRIBE";
        case MessageType::REQ_UNSUBSCRIBE: return "REQ_UNSUBSCRIBE";
        case MessageType::REQ_INPUT: return "REQ_INPUT";
        case MessageType::REQ_RESIZE: return "REQ_RESIZE";
        case MessageType::REQ_SIGNAL: return "REQ_SIGNAL";
        case MessageType::REQ_SCROLL: return "REQ_SCROLL";
        case MessageType::REQ_SCROLLBACK: return "REQ_SCROLLBACK";
        case MessageType::REQ_SESSION_CREATE: return "REQ_SESSION_CREATE";
        case MessageType::REQ_SESSION_LIST: return "REQ_SESSION_LIST";
        case MessageType::REQ_SESSION_DESTROY: return "REQ_SESSION_DESTROY";
        case MessageType::REQ_SESSION_COMMAND: return "REQ_SESSION_COMMAND";
        case MessageType::REQ_BIND_DISPLAY: return "REQ_BIND_DISPLAY";
        case MessageType::REQ_UNBIND_DISPLAY: return "REQ_UNBIND_DISPLAY";
        case MessageType::REQ_DISPLAY_ALLOCATE: return "REQ_DISPLAY_ALLOCATE";
        case MessageType::REQ_DISPLAY_LIST: return "REQ_DISPLAY_LIST";
        case MessageType::REQ_DISPLAY_RELEASE: return "REQ_DISPLAY_RELEASE";
        case MessageType::REQ_DISPLAY_GET: return "REQ_DISPLAY_GET";
        case MessageType::REQ_DISPLAY_ENV: return "REQ_DISPLAY_ENV";
        case MessageType::REQ_DISPLAY_RESIZE: return "REQ_DISPLAY_RESIZE";
        case MessageType::REQ_DISPLAY_PANELS: return "REQ_DISPLAY_PANELS";
        case MessageType::REQ_COMMANDS_GET: return "REQ_COMMANDS_GET";
        case MessageType::REQ_COMMANDS_ADD: return "REQ_COMMANDS_ADD";
        case MessageType::REQ_COMMANDS_REMOVE: return "REQ_COMMANDS_REMOVE";
        case MessageType::RESP_SESSION: return "RESP_SESSION";
        case MessageType::RESP_SESSIONS: return "RESP_SESSIONS";
        case MessageType::RESP_DISPLAY: return "RESP_DISPLAY";
        case MessageType::RESP_DISPLAYS: return "RESP_DISPLAYS";
        case MessageType::RESP_ENV: return "RESP_ENV";
        case MessageType::RESP_COMMANDS: return "RESP_COMMANDS";
        case MessageType::RESP_PANELS: return "RESP_PANELS";
        case MessageType::EVT_OUTPUT: return "EVT_OUTPUT";
        case MessageType::EVT_SUBSCRIBED: return "EVT_SUBSCRIBED";
        case MessageType::EVT_UNSUBSCRIBED: return "EVT_UNSUBSCRIBED";
        case MessageType::EVT_SCROLLBACK: return "EVT_SCROLLBACK";
        case MessageType::EVT_ERROR: return "EVT_ERROR";
    }
    return "UNKNOWN";
}

// ─── Header encode/decode ────────────────────────────────────────────────────

void encode_header(const MessageHeader& hdr, std::vector<uint8_t>& out)
{
    out.reserve(out.size() + HEADER_SIZE);
    out.push_back(MAGIC_0);
    out.push_back(MAGIC_1);
    write_u16_le(out, static_cast<uint16_t>(hdr.type));
    write_u32_le(out, hdr.payload_len);
    write_u64_le(out, hdr.seq);
    write_u64_le(out, hdr.request_id);
    write_u64_le(out, hdr.subscriber_id);
    write_u64_le(out, hdr.reserved);
}

std::optional<MessageHeader> decode_header(std::span<const uint8_t> data)
{
    if (data.size() < HEADER_SIZE)
        return std::nullopt;
    if (data[0] != MAGIC_0 || data[1] != MAGIC_1)
        return std::nullopt;

    MessageHeader hdr;
    hdr.type          = static_cast<MessageType>(read_u16_le(&data[2]));
    hdr.payload_len   = read_u32_le(&data[4]);
    hdr.seq           = read_u64_le(&data[8]);
    hdr.request_id    = read_u64_le(&data[16]);
    hdr.subscriber_id = read_u64_le(&data[24]);
    hdr.reserved      = read_u64_le(&data[32]);
    return hdr;
}

// ─── Full message encode/decode ──────────────────────────────────────────────

std::vector<uint8_t> encode_message(const Message& msg)
{
    std::vector<uint8_t> out;
    MessageHeader        hdr = msg.header;
    hdr.payload_len          = static_cast<uint32_t>(msg.payload.size());
    encode_header(hdr, out);
    out.insert(out.end(), msg.payload.begin(), msg.payload.end());
    return out;
}

std::optional<Message> decode_message(std::span<const uint8_t> data)
{
    auto hdr_opt = decode_header(data);
    if (!hdr_opt)
        return std::nullopt;

    auto& hdr = *hdr_opt;
    if (hdr.payload_len > MAX_PAYLOAD_SIZE)
        return std::nullopt;
    if (data.size() < HEADER_SIZE + hdr.payload_len)
        return std::nullopt;

    Message msg;
    msg.header = hdr;
    msg.payload.assign(data.begin() + HEADER_SIZE, data.begin() + HEADER_SIZE + hdr.payload_len);
    return msg;
}

// ─── PayloadEncoder ──────────────────────────────────────────────────────────

void PayloadEncoder::put_u16(uint8_t tag, uint16_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 2);
    write_u16_le(buf_, val);
}

void PayloadEncoder::put_u32(uint8_t tag, uint32_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 4);
    write_u32_le(buf_, val);
}

void PayloadEncoder::put_u64(uint8_t tag, uint64_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 8);
    write_u64_le(buf_, val);
}

void PayloadEncoder::put_bool(uint8_t tag, bool val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 1);
    buf_.push_back(val ? 1 : 0);
}

void PayloadEncoder::put_string(uint8_t tag, const std::string& val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, static_cast<uint32_t>(val.size()));
    buf_.insert(buf_.end(), val.begin(), val.end());
}

void PayloadEncoder::put_blob(uint8_t tag, const std::vector<uint8_t>& blob)
{
    buf_.push_back(tag);
    write_u32_le(buf_, static_cast<uint32_t>(blob.size()));
    buf_.insert(buf_.end(), blob.begin(), blob.end());
}

// ─── PayloadDecoder ──────────────────────────────────────────────────────────

PayloadDecoder::PayloadDecoder(std::span<const uint8_t> data) : data_(data) {}

bool PayloadDecoder::next()
{
    // Need at least 1 (tag) + 4 (len) bytes
    if (pos_ + 5 > data_.size())
        return false;

    tag_        = data_[pos_];
    len_        = read_u32_le(&data_[pos_ + 1]);
    val_offset_ = pos_ + 5;

    if (val_offset_ + len_ > data_.size())
        return false;

    pos_ = val_offset_ + len_;
    return true;
}

uint16_t PayloadDecoder::as_u16() const
{
    if (len_ < 2)
        return 0;
    return read_u16_le(&data_[val_offset_]);
}

uint32_t PayloadDecoder::as_u32() const
{
    if (len_ < 4)
        return 0;
    return read_u32_le(&data_[val_offset_]);
}

uint64_t PayloadDecoder::as_u64() const
{
    if (len_ < 8)
        return 0;
    return read_u64_le(&data_[val_offset_]);
}

bool PayloadDecoder::as_bool() const
{
    return len_ >= 1 && data_[val_offset_] != 0;
}

std::string PayloadDecoder::as_string() const
{
    if (len_ == 0)
        return {};
    return std::string(reinterpret_cast<const char*>(&data_[val_offset_]), len_);
}

std::span<const uint8_t> PayloadDecoder::as_blob() const
{
    return data_.subspan(val_offset_, len_);
}

// ─── Handshake ───────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_hello(const HelloPayload& p)
{
    PayloadEncoder enc;
    enc.put_u16(TAG_PROTOCOL_MAJOR, p.protocol_major);
    enc.put_u16(TAG_PROTOCOL_MINOR, p.protocol_minor);
    enc.put_string(TAG_CLIENT_BUILD, p.client_build);
    return enc.take();
}

std::optional<HelloPayload> decode_hello(std::span<const uint8_t> data)
{
    HelloPayload   p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_PROTOCOL_MAJOR: p.protocol_major = dec.as_u16(); break;
            case TAG_PROTOCOL_MINOR: p.protocol_minor = dec.as_u16(); break;
            case TAG_CLIENT_BUILD:   p.client_build   = dec.as_string(); break;
            default: break;   // skip unknown tags (forward compat)
        }
    }
    return p;
}

std::vector<uint8_t> encode_welcome(const WelcomePayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_SUBSCRIBER_ID, p.subscriber_id);
    enc.put_u64(TAG_DAEMON_PID, p.daemon_pid);
    enc.put_string(TAG_SESSION_PREFIX, p.session_prefix);
    return enc.take();
}

std::optional<WelcomePayload> decode_welcome(std::span<const uint8_t> data)
{
    WelcomePayload p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SUBSCRIBER_ID:  p.subscriber_id  = dec.as_u64(); break;
            case TAG_DAEMON_PID:     p.daemon_pid     = dec.as_u64(); break;
            case TAG_SESSION_PREFIX: p.session_prefix = dec.as_string(); break;
            default: break;
        }
    }
    return p;
}

// ─── Responses ───────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_resp_ok(const RespOkPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_REQUEST_ID, p.request_id);
    return enc.take();
}

std::optional<RespOkPayload> decode_resp_ok(std::span<const uint8_t> data)
{
    RespOkPayload  p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_REQUEST_ID)
            p.request_id = dec.as_u64();
    }
    return p;
}

std::vector<uint8_t> encode_resp_err(const RespErrPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_REQUEST_ID, p.request_id);
    enc.put_u32(TAG_ERROR_CODE, p.code);
    enc.put_string(TAG_ERROR_KIND, p.kind);
    enc.put_string(TAG_ERROR_MESSAGE, p.message);
    return enc.take();
}

std::optional<RespErrPayload> decode_resp_err(std::span<const uint8_t> data)
{
    RespErrPayload p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_REQUEST_ID:    p.request_id = dec.as_u64(); break;
            case TAG_ERROR_CODE:    p.code       = dec.as_u32(); break;
            case TAG_ERROR_KIND:    p.kind       = dec.as_string(); break;
            case TAG_ERROR_MESSAGE: p.message    = dec.as_string(); break;
            default: break;
        }
    }
    return p;
}

// ─── Terminal events ─────────────────────────────────────────────────────────

std::vector<uint8_t> encode_session_target(const SessionTargetPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_SESSION, p.session);
    return enc.take();
}

std::optional<SessionTargetPayload> decode_session_target(std::span<const uint8_t> data)
{
    SessionTargetPayload p;
    bool                 have_session = false;
    PayloadDecoder       dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_SESSION)
        {
            p.session    = dec.as_string();
            have_session = true;
        }
    }
    if (!have_session)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_terminal_size(const TerminalSizePayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_SESSION, p.session);
    enc.put_u16(TAG_COLS, p.cols);
    enc.put_u16(TAG_ROWS, p.rows);
    return enc.take();
}

std::optional<TerminalSizePayload> decode_terminal_size(std::span<const uint8_t> data)
{
    TerminalSizePayload p;
    bool                have_session = false;
    PayloadDecoder      dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION:
                p.session    = dec.as_string();
                have_session = true;
                break;
            case TAG_COLS: p.cols = dec.as_u16(); break;
            case TAG_ROWS: p.rows = dec.as_u16(); break;
            default: break;
        }
    }
    if (!have_session)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_terminal_data(const TerminalDataPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_SESSION, p.session);
    enc.put_string(TAG_DATA, p.data);
    return enc.take();
}

std::optional<TerminalDataPayload> decode_terminal_data(std::span<const uint8_t> data)
{
    TerminalDataPayload p;
    bool                have_session = false;
    PayloadDecoder      dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION:
                p.session    = dec.as_string();
                have_session = true;
                break;
            case TAG_DATA: p.data = dec.as_string(); break;
            default: break;
        }
    }
    if (!have_session)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_signal(const SignalPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_SESSION, p.session);
    enc.put_string(TAG_SIGNAL, p.signal);
    return enc.take();
}

std::optional<SignalPayload> decode_signal(std::span<const uint8_t> data)
{
    SignalPayload  p;
    bool           have_session = false;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION:
                p.session    = dec.as_string();
                have_session = true;
                break;
            case TAG_SIGNAL: p.signal = dec.as_string(); break;
            default: break;
        }
    }
    if (!have_session)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_scroll(const ScrollPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_SESSION, p.session);
    enc.put_string(TAG_SCROLL_COMMAND, p.command);
    enc.put_i32(TAG_LINES, p.lines);
    return enc.take();
}

std::optional<ScrollPayload> decode_scroll(std::span<const uint8_t> data)
{
    ScrollPayload  p;
    bool           have_session = false;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION:
                p.session    = dec.as_string();
                have_session = true;
                break;
            case TAG_SCROLL_COMMAND: p.command = dec.as_string(); break;
            case TAG_LINES:          p.lines   = dec.as_i32(); break;
            default: break;
        }
    }
    if (!have_session)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_scrollback_request(const ScrollbackRequestPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_SESSION, p.session);
    enc.put_i32(TAG_START_LINE, p.start_line);
    if (p.end_line)
        enc.put_i32(TAG_END_LINE, *p.end_line);
    return enc.take();
}

std::optional<ScrollbackRequestPayload> decode_scrollback_request(std::span<const uint8_t> data)
{
    ScrollbackRequestPayload p;
    bool                     have_session = false;
    PayloadDecoder           dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION:
                p.session    = dec.as_string();
                have_session = true;
                break;
            case TAG_START_LINE: p.start_line = dec.as_i32(); break;
            case TAG_END_LINE:   p.end_line   = dec.as_i32(); break;
            default: break;
        }
    }
    if (!have_session)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_scrollback(const ScrollbackPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_SESSION, p.session);
    enc.put_string(TAG_CONTENT, p.content);
    enc.put_i32(TAG_HISTORY_SIZE, p.history_size);
    enc.put_i32(TAG_START_LINE, p.start_line);
    return enc.take();
}

std::optional<ScrollbackPayload> decode_scrollback(std::span<const uint8_t> data)
{
    ScrollbackPayload p;
    PayloadDecoder    dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION:      p.session      = dec.as_string(); break;
            case TAG_CONTENT:      p.content      = dec.as_string(); break;
            case TAG_HISTORY_SIZE: p.history_size = dec.as_i32(); break;
            case TAG_START_LINE:   p.start_line   = dec.as_i32(); break;
            default: break;
        }
    }
    return p;
}

std::vector<uint8_t> encode_error_event(const ErrorEventPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_ERROR_KIND, p.kind);
    enc.put_string(TAG_ERROR_MESSAGE, p.message);
    if (!p.session.empty())
        enc.put_string(TAG_SESSION, p.session);
    return enc.take();
}

std::optional<ErrorEventPayload> decode_error_event(std::span<const uint8_t> data)
{
    ErrorEventPayload p;
    PayloadDecoder    dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_ERROR_KIND:    p.kind    = dec.as_string(); break;
            case TAG_ERROR_MESSAGE: p.message = dec.as_string(); break;
            case TAG_SESSION:       p.session = dec.as_string(); break;
            default: break;
        }
    }
    return p;
}

// ─── Session management ──────────────────────────────────────────────────────

std::vector<uint8_t> encode_session_create(const SessionCreatePayload& p)
{
    PayloadEncoder enc;
    if (p.name)
        enc.put_string(TAG_NAME, *p.name);
    if (p.cwd)
        enc.put_string(TAG_CWD, *p.cwd);
    if (p.command)
        enc.put_string(TAG_COMMAND, *p.command);
    return enc.take();
}

std::optional<SessionCreatePayload> decode_session_create(std::span<const uint8_t> data)
{
    SessionCreatePayload p;
    PayloadDecoder       dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_NAME:    p.name    = dec.as_string(); break;
            case TAG_CWD:     p.cwd     = dec.as_string(); break;
            case TAG_COMMAND: p.command = dec.as_string(); break;
            default: break;
        }
    }
    return p;
}

std::vector<uint8_t> encode_session_command(const SessionCommandPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_SESSION, p.session);
    enc.put_string(TAG_COMMAND, p.command);
    return enc.take();
}

std::optional<SessionCommandPayload> decode_session_command(std::span<const uint8_t> data)
{
    SessionCommandPayload p;
    bool                  have_session = false;
    PayloadDecoder        dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION:
                p.session    = dec.as_string();
                have_session = true;
                break;
            case TAG_COMMAND: p.command = dec.as_string(); break;
            default: break;
        }
    }
    if (!have_session)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_bind_display(const BindDisplayPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_SESSION, p.session);
    enc.put_i32(TAG_DISPLAY, p.display);
    return enc.take();
}

std::optional<BindDisplayPayload> decode_bind_display(std::span<const uint8_t> data)
{
    BindDisplayPayload p;
    bool               have_session = false;
    bool               have_display = false;
    PayloadDecoder     dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION:
                p.session    = dec.as_string();
                have_session = true;
                break;
            case TAG_DISPLAY:
                p.display    = dec.as_i32();
                have_display = true;
                break;
            default: break;
        }
    }
    if (!have_session || !have_display)
        return std::nullopt;
    return p;
}

static std::vector<uint8_t> encode_session_blob(const SessionEntry& s)
{
    PayloadEncoder enc;
    enc.put_string(TAG_NAME, s.name);
    enc.put_bool(TAG_BRIDGED, s.bridged);
    enc.put_u32(TAG_SUBSCRIBERS, s.subscribers);
    enc.put_u64(TAG_PANE_PID, s.pane_pid);
    return enc.take();
}

static SessionEntry decode_session_blob(std::span<const uint8_t> data)
{
    SessionEntry   s;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_NAME:        s.name        = dec.as_string(); break;
            case TAG_BRIDGED:     s.bridged     = dec.as_bool(); break;
            case TAG_SUBSCRIBERS: s.subscribers = dec.as_u32(); break;
            case TAG_PANE_PID:    s.pane_pid    = dec.as_u64(); break;
            default: break;
        }
    }
    return s;
}

std::vector<uint8_t> encode_session_list(const SessionListPayload& p)
{
    PayloadEncoder enc;
    for (const auto& s : p.sessions)
        enc.put_blob(TAG_SESSION_BLOB, encode_session_blob(s));
    return enc.take();
}

std::optional<SessionListPayload> decode_session_list(std::span<const uint8_t> data)
{
    SessionListPayload p;
    PayloadDecoder     dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_SESSION_BLOB)
            p.sessions.push_back(decode_session_blob(dec.as_blob()));
    }
    return p;
}

// ─── Displays ────────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_display_allocate(const DisplayAllocatePayload& p)
{
    PayloadEncoder enc;
    if (p.display)
        enc.put_i32(TAG_DISPLAY, *p.display);
    if (p.panel)
        enc.put_i32(TAG_PANEL, *p.panel);
    enc.put_u32(TAG_WIDTH, p.width);
    enc.put_u32(TAG_HEIGHT, p.height);
    enc.put_u32(TAG_DEPTH, p.depth);
    return enc.take();
}

std::optional<DisplayAllocatePayload> decode_display_allocate(std::span<const uint8_t> data)
{
    DisplayAllocatePayload p;
    PayloadDecoder         dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_DISPLAY: p.display = dec.as_i32(); break;
            case TAG_PANEL:   p.panel   = dec.as_i32(); break;
            case TAG_WIDTH:   p.width   = dec.as_u32(); break;
            case TAG_HEIGHT:  p.height  = dec.as_u32(); break;
            case TAG_DEPTH:   p.depth   = dec.as_u32(); break;
            default: break;
        }
    }
    return p;
}

std::vector<uint8_t> encode_display_target(const DisplayTargetPayload& p)
{
    PayloadEncoder enc;
    enc.put_i32(TAG_DISPLAY, p.display);
    return enc.take();
}

std::optional<DisplayTargetPayload> decode_display_target(std::span<const uint8_t> data)
{
    DisplayTargetPayload p;
    bool                 have_display = false;
    PayloadDecoder       dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_DISPLAY)
        {
            p.display    = dec.as_i32();
            have_display = true;
        }
    }
    if (!have_display)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_display_resize(const DisplayResizePayload& p)
{
    PayloadEncoder enc;
    enc.put_i32(TAG_DISPLAY, p.display);
    enc.put_u32(TAG_WIDTH, p.width);
    enc.put_u32(TAG_HEIGHT, p.height);
    return enc.take();
}

std::optional<DisplayResizePayload> decode_display_resize(std::span<const uint8_t> data)
{
    DisplayResizePayload p;
    bool                 have_display = false;
    PayloadDecoder       dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_DISPLAY:
                p.display    = dec.as_i32();
                have_display = true;
                break;
            case TAG_WIDTH:  p.width  = dec.as_u32(); break;
            case TAG_HEIGHT: p.height = dec.as_u32(); break;
            default: break;
        }
    }
    if (!have_display)
        return std::nullopt;
    return p;
}

static std::vector<uint8_t> encode_display_blob(const DisplayEntry& d)
{
    PayloadEncoder enc;
    enc.put_i32(TAG_DISPLAY, d.display);
    enc.put_i32(TAG_PANEL, d.panel_index);
    enc.put_u16(TAG_VNC_PORT, d.vnc_port);
    enc.put_u16(TAG_WS_PORT, d.ws_port);
    enc.put_u32(TAG_WIDTH, d.width);
    enc.put_u32(TAG_HEIGHT, d.height);
    enc.put_u32(TAG_DEPTH, d.depth);
    enc.put_bool(TAG_CREATED, d.created);
    return enc.take();
}

static DisplayEntry decode_display_blob(std::span<const uint8_t> data)
{
    DisplayEntry   d;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_DISPLAY:  d.display     = dec.as_i32(); break;
            case TAG_PANEL:    d.panel_index = dec.as_i32(); break;
            case TAG_VNC_PORT: d.vnc_port    = dec.as_u16(); break;
            case TAG_WS_PORT:  d.ws_port     = dec.as_u16(); break;
            case TAG_WIDTH:    d.width       = dec.as_u32(); break;
            case TAG_HEIGHT:   d.height      = dec.as_u32(); break;
            case TAG_DEPTH:    d.depth       = dec.as_u32(); break;
            case TAG_CREATED:  d.created     = dec.as_bool(); break;
            default: break;
        }
    }
    return d;
}

std::vector<uint8_t> encode_display_list(const DisplayListPayload& p)
{
    PayloadEncoder enc;
    for (const auto& d : p.displays)
        enc.put_blob(TAG_DISPLAY_BLOB, encode_display_blob(d));
    return enc.take();
}

std::optional<DisplayListPayload> decode_display_list(std::span<const uint8_t> data)
{
    DisplayListPayload p;
    PayloadDecoder     dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_DISPLAY_BLOB)
            p.displays.push_back(decode_display_blob(dec.as_blob()));
    }
    return p;
}

std::vector<uint8_t> encode_env(const EnvPayload& p)
{
    PayloadEncoder enc;
    enc.put_i32(TAG_DISPLAY, p.display);
    for (const auto& [key, value] : p.vars)
    {
        PayloadEncoder var;
        var.put_string(TAG_ENV_KEY, key);
        var.put_string(TAG_ENV_VALUE, value);
        enc.put_blob(TAG_ENV_VAR_BLOB, var.take());
    }
    for (const auto& name : p.unset)
        enc.put_string(TAG_ENV_UNSET, name);
    enc.put_string(TAG_EXPORT_COMMAND, p.export_command);
    return enc.take();
}

std::optional<EnvPayload> decode_env(std::span<const uint8_t> data)
{
    EnvPayload     p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_DISPLAY: p.display = dec.as_i32(); break;
            case TAG_ENV_VAR_BLOB:
            {
                std::string    key;
                std::string    value;
                PayloadDecoder var(dec.as_blob());
                while (var.next())
                {
                    if (var.tag() == TAG_ENV_KEY)
                        key = var.as_string();
                    else if (var.tag() == TAG_ENV_VALUE)
                        value = var.as_string();
                }
                p.vars.emplace_back(std::move(key), std::move(value));
                break;
            }
            case TAG_ENV_UNSET:      p.unset.push_back(dec.as_string()); break;
            case TAG_EXPORT_COMMAND: p.export_command = dec.as_string(); break;
            default: break;
        }
    }
    return p;
}

std::vector<uint8_t> encode_panels(const PanelsPayload& p)
{
    PayloadEncoder enc;
    for (const auto& panel : p.panels)
    {
        PayloadEncoder blob;
        blob.put_i32(TAG_PANEL, panel.panel_index);
        blob.put_i32(TAG_DISPLAY, panel.display);
        blob.put_u16(TAG_VNC_PORT, panel.vnc_port);
        blob.put_u16(TAG_WS_PORT, panel.ws_port);
        enc.put_blob(TAG_PANEL_BLOB, blob.take());
    }
    return enc.take();
}

std::optional<PanelsPayload> decode_panels(std::span<const uint8_t> data)
{
    PanelsPayload  p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        if (dec.tag() != TAG_PANEL_BLOB)
            continue;
        PanelEntry     panel;
        PayloadDecoder blob(dec.as_blob());
        while (blob.next())
        {
            switch (blob.tag())
            {
                case TAG_PANEL:    panel.panel_index = blob.as_i32(); break;
                case TAG_DISPLAY:  panel.display     = blob.as_i32(); break;
                case TAG_VNC_PORT: panel.vnc_port    = blob.as_u16(); break;
                case TAG_WS_PORT:  panel.ws_port     = blob.as_u16(); break;
                default: break;
            }
        }
        p.panels.push_back(panel);
    }
    return p;
}

// ─── Quick commands ──────────────────────────────────────────────────────────

std::vector<uint8_t> encode_commands_add(const CommandsAddPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_SESSION, p.session);
    enc.put_string(TAG_LABEL, p.label);
    enc.put_string(TAG_COMMAND, p.command);
    return enc.take();
}

std::optional<CommandsAddPayload> decode_commands_add(std::span<const uint8_t> data)
{
    CommandsAddPayload p;
    bool               have_session = false;
    PayloadDecoder     dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION:
                p.session    = dec.as_string();
                have_session = true;
                break;
            case TAG_LABEL:   p.label   = dec.as_string(); break;
            case TAG_COMMAND: p.command = dec.as_string(); break;
            default: break;
        }
    }
    if (!have_session)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_commands_remove(const CommandsRemovePayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_SESSION, p.session);
    enc.put_u32(TAG_INDEX, p.index);
    return enc.take();
}

std::optional<CommandsRemovePayload> decode_commands_remove(std::span<const uint8_t> data)
{
    CommandsRemovePayload p;
    bool                  have_session = false;
    PayloadDecoder        dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION:
                p.session    = dec.as_string();
                have_session = true;
                break;
            case TAG_INDEX: p.index = dec.as_u32(); break;
            default: break;
        }
    }
    if (!have_session)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_commands(const CommandsPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_SESSION, p.session);
    for (const auto& c : p.commands)
    {
        PayloadEncoder blob;
        blob.put_string(TAG_LABEL, c.label);
        blob.put_string(TAG_COMMAND, c.command);
        enc.put_blob(TAG_COMMAND_BLOB, blob.take());
    }
    return enc.take();
}

std::optional<CommandsPayload> decode_commands(std::span<const uint8_t> data)
{
    CommandsPayload p;
    PayloadDecoder  dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION: p.session = dec.as_string(); break;
            case TAG_COMMAND_BLOB:
            {
                CommandEntry   entry;
                PayloadDecoder blob(dec.as_blob());
                while (blob.next())
                {
                    if (blob.tag() == TAG_LABEL)
                        entry.label = blob.as_string();
                    else if (blob.tag() == TAG_COMMAND)
                        entry.command = blob.as_string();
                }
                p.commands.push_back(std::move(entry));
                break;
            }
            default: break;
        }
    }
    return p;
}

}   // namespace termpanel::ipc
