#pragma once

#include <string>
#include <string_view>

namespace termpanel::terminal
{

// Incremental, permissive UTF-8 validation. Malformed input becomes U+FFFD
// (one replacement per maximal invalid subpart); a well-formed but incomplete
// sequence at the end of a chunk is held back and completed by the next one.
class Utf8Decoder
{
   public:
    // Appends the valid text of `bytes` to `out`.
    void feed(std::string_view bytes, std::string& out);

    std::string feed(std::string_view bytes)
    {
        std::string out;
        feed(bytes, out);
        return out;
    }

    // Emits U+FFFD for a dangling partial sequence and resets.
    void flush(std::string& out);

    size_t pending() const { return pending_.size(); }

   private:
    std::string pending_;
};

static constexpr std::string_view REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

}   // namespace termpanel::terminal
