#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <termpanel/error.hpp>

namespace termpanel::commands
{

struct QuickCommand
{
    std::string label;
    std::string command;

    bool operator==(const QuickCommand&) const = default;
};

// Per-session quick-command lists persisted as one JSON object:
//   { "term-build": [ {"label": "make", "command": "make -j8"} ] }
// The whole file is rewritten after every mutation.
// Thread-safe: all public methods lock the internal mutex.
class CommandStore
{
   public:
    explicit CommandStore(std::string path);

    CommandStore(const CommandStore&)            = delete;
    CommandStore& operator=(const CommandStore&) = delete;

    // A missing or malformed file leaves the store empty.
    void load();

    std::map<std::string, std::vector<QuickCommand>> all() const;
    std::vector<QuickCommand>                        get(const std::string& session) const;

    Status add(const std::string& session, const std::string& label, const std::string& command);
    Status remove(const std::string& session, size_t index);
    void   clear(const std::string& session);

    const std::string& path() const { return path_; }

    // Replace the lists with those parsed from `text`. Not persisted.
    bool deserialize(const std::string& text);

   private:
    std::string serialize_locked() const;
    bool        save_locked() const;

    std::string                                      path_;
    mutable std::mutex                               mu_;
    std::map<std::string, std::vector<QuickCommand>> lists_;
};

}   // namespace termpanel::commands
