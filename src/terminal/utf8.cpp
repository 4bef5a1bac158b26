#include "utf8.hpp"

#include <cstdint>

namespace termpanel::terminal
{

namespace
{

// Length of the sequence introduced by `lead`, 0 if it cannot start one.
int sequence_length(uint8_t lead)
{
    if (lead < 0x80)
        return 1;
    if (lead >= 0xC2 && lead <= 0xDF)
        return 2;
    if (lead >= 0xE0 && lead <= 0xEF)
        return 3;
    if (lead >= 0xF0 && lead <= 0xF4)
        return 4;
    return 0;
}

// Allowed range of the second byte excludes overlongs, surrogates and
// code points above U+10FFFF.
bool valid_second(uint8_t lead, uint8_t b)
{
    switch (lead)
    {
        case 0xE0:
            return b >= 0xA0 && b <= 0xBF;
        case 0xED:
            return b >= 0x80 && b <= 0x9F;
        case 0xF0:
            return b >= 0x90 && b <= 0xBF;
        case 0xF4:
            return b >= 0x80 && b <= 0x8F;
        default:
            return b >= 0x80 && b <= 0xBF;
    }
}

bool is_continuation(uint8_t b)
{
    return (b & 0xC0) == 0x80;
}

}   // namespace

void Utf8Decoder::feed(std::string_view bytes, std::string& out)
{
    std::string joined;
    if (!pending_.empty())
    {
        joined = pending_;
        joined.append(bytes);
        pending_.clear();
        bytes = joined;
    }

    out.reserve(out.size() + bytes.size());
    size_t i = 0;
    while (i < bytes.size())
    {
        uint8_t lead = static_cast<uint8_t>(bytes[i]);
        int     len  = sequence_length(lead);
        if (len == 1)
        {
            // Fast path for runs of ASCII.
            size_t j = i + 1;
            while (j < bytes.size() && static_cast<uint8_t>(bytes[j]) < 0x80)
                ++j;
            out.append(bytes.substr(i, j - i));
            i = j;
            continue;
        }
        if (len == 0)
        {
            out.append(REPLACEMENT_CHARACTER);
            ++i;
            continue;
        }

        // Count how many bytes of the sequence are well formed.
        int good = 1;
        while (good < len && i + good < bytes.size())
        {
            uint8_t b  = static_cast<uint8_t>(bytes[i + good]);
            bool    ok = good == 1 ? valid_second(lead, b) : is_continuation(b);
            if (!ok)
                break;
            ++good;
        }

        if (good == len)
        {
            out.append(bytes.substr(i, len));
            i += len;
        }
        else if (i + good == bytes.size())
        {
            pending_.assign(bytes.substr(i));
            return;
        }
        else
        {
            out.append(REPLACEMENT_CHARACTER);
            i += good;
        }
    }
}

void Utf8Decoder::flush(std::string& out)
{
    if (!pending_.empty())
        out.append(REPLACEMENT_CHARACTER);
    pending_.clear();
}

}   // namespace termpanel::terminal
