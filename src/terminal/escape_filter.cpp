#include "escape_filter.hpp"

namespace termpanel::terminal
{

namespace
{

constexpr char ESC = '\x1b';
constexpr char BEL = '\x07';

enum class Scan
{
    Strip,         // sequence complete, drop [start, end)
    PassThrough,   // not ours, emit the ESC and keep scanning
    Incomplete,    // ran out of input
};

// Finds BEL or ST starting at `from`. Returns the index one past the
// terminator, or npos.
size_t find_terminator(std::string_view data, size_t from, bool allow_bel)
{
    for (size_t i = from; i < data.size(); ++i)
    {
        if (allow_bel && data[i] == BEL)
            return i + 1;
        if (data[i] == ESC)
        {
            if (i + 1 >= data.size())
                return std::string_view::npos;
            if (data[i + 1] == '\\')
                return i + 2;
        }
    }
    return std::string_view::npos;
}

Scan scan_osc(std::string_view data, size_t start, size_t& end)
{
    size_t i    = start + 2;
    int    code = 0;
    int    digits = 0;
    while (i < data.size() && data[i] >= '0' && data[i] <= '9')
    {
        if (++digits > 3)
            return Scan::PassThrough;
        code = code * 10 + (data[i] - '0');
        ++i;
    }
    if (i >= data.size())
        return Scan::Incomplete;
    if (digits == 0 || !is_filtered_osc_code(code))
        return Scan::PassThrough;

    // Reset codes may omit the parameter list entirely.
    if (data[i] != ';' && data[i] != BEL && data[i] != ESC)
        return Scan::PassThrough;

    size_t term = find_terminator(data, i, true);
    if (term == std::string_view::npos)
        return Scan::Incomplete;
    end = term;
    return Scan::Strip;
}

Scan scan_dcs(std::string_view data, size_t start, size_t& end)
{
    size_t term = find_terminator(data, start + 2, false);
    if (term == std::string_view::npos)
        return Scan::Incomplete;
    end = term;
    return Scan::Strip;
}

}   // namespace

bool is_filtered_osc_code(int code)
{
    if (code >= 10 && code <= 19)
        return true;
    switch (code)
    {
        case 4:
        case 52:
        case 104:
        case 110:
        case 111:
        case 112:
            return true;
        default:
            return false;
    }
}

void EscapeFilter::feed(std::string_view chunk, std::string& out)
{
    std::string joined;
    if (!held_.empty())
    {
        joined = std::move(held_);
        held_.clear();
        joined.append(chunk);
        chunk = joined;
    }

    size_t pos = 0;
    while (pos < chunk.size())
    {
        size_t esc = chunk.find(ESC, pos);
        if (esc == std::string_view::npos)
        {
            out.append(chunk.substr(pos));
            return;
        }
        out.append(chunk.substr(pos, esc - pos));

        if (esc + 1 >= chunk.size())
        {
            held_.assign(chunk.substr(esc));
            return;
        }

        Scan   result = Scan::PassThrough;
        size_t end    = 0;
        if (chunk[esc + 1] == ']')
            result = scan_osc(chunk, esc, end);
        else if (chunk[esc + 1] == 'P')
            result = scan_dcs(chunk, esc, end);

        switch (result)
        {
            case Scan::Strip:
                pos = end;
                break;
            case Scan::PassThrough:
                out.push_back(ESC);
                pos = esc + 1;
                break;
            case Scan::Incomplete:
                if (chunk.size() - esc > MAX_HELD)
                {
                    // Too long to be a query; stop treating it as one.
                    out.push_back(ESC);
                    pos = esc + 1;
                    break;
                }
                held_.assign(chunk.substr(esc));
                return;
        }
    }
}

void EscapeFilter::flush(std::string& out)
{
    out.append(held_);
    held_.clear();
}

}   // namespace termpanel::terminal
