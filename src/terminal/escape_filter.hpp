#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace termpanel::terminal
{

// Strips terminal query/response sequences that a non-interactive renderer
// would print as garbage: OSC color queries and clipboard access
// (codes 4, 10-19, 52, 104, 110-112) and every DCS string. Window titles,
// hyperlinks and CSI sequences pass through untouched.
//
// Stateful: a candidate sequence cut off at the end of a chunk is held until
// the next feed() completes it. Held bytes beyond MAX_HELD are given up on and
// passed through as text.
class EscapeFilter
{
   public:
    static constexpr size_t MAX_HELD = 4096;

    void        feed(std::string_view chunk, std::string& out);
    std::string feed(std::string_view chunk)
    {
        std::string out;
        feed(chunk, out);
        return out;
    }

    // Releases any held bytes unchanged.
    void flush(std::string& out);

    size_t held() const { return held_.size(); }

   private:
    std::string held_;
};

// True for OSC command codes the filter removes.
bool is_filtered_osc_code(int code);

}   // namespace termpanel::terminal
