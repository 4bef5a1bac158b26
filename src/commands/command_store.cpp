#include "command_store.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

#include <termpanel/logger.hpp>

#include "../core/json_lite.hpp"

namespace termpanel::commands
{

CommandStore::CommandStore(std::string path) : path_(std::move(path)) {}

void CommandStore::load()
{
    std::ifstream f(path_);
    if (!f.is_open())
    {
        TERMPANEL_LOG_DEBUG("commands", "No command file at {}", path_);
        return;
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(text))
        TERMPANEL_LOG_WARN("commands", "Ignoring malformed command file {}", path_);
    else
        TERMPANEL_LOG_INFO("commands", "Loaded quick commands for {} session(s) from {}",
                           all().size(), path_);
}

std::map<std::string, std::vector<QuickCommand>> CommandStore::all() const
{
    std::lock_guard lock(mu_);
    return lists_;
}

std::vector<QuickCommand> CommandStore::get(const std::string& session) const
{
    std::lock_guard lock(mu_);
    auto            it = lists_.find(session);
    if (it == lists_.end())
        return {};
    return it->second;
}

Status CommandStore::add(const std::string& session, const std::string& label,
                         const std::string& command)
{
    if (label.empty() || command.empty())
        return make_error(ErrorKind::InvalidArgument, "label and command are required");

    std::lock_guard lock(mu_);
    lists_[session].push_back(QuickCommand{label, command});
    if (!save_locked())
        return make_error(ErrorKind::Internal, "cannot write " + path_);
    return Status::success();
}

Status CommandStore::remove(const std::string& session, size_t index)
{
    std::lock_guard lock(mu_);
    auto            it = lists_.find(session);
    if (it == lists_.end() || index >= it->second.size())
        return make_error(ErrorKind::NotFound, "Invalid command index");

    it->second.erase(it->second.begin() + static_cast<std::ptrdiff_t>(index));
    if (it->second.empty())
        lists_.erase(it);
    if (!save_locked())
        return make_error(ErrorKind::Internal, "cannot write " + path_);
    return Status::success();
}

void CommandStore::clear(const std::string& session)
{
    std::lock_guard lock(mu_);
    if (lists_.erase(session) > 0)
        save_locked();
}

// ─── Serialization ──────────────────────────────────────────────────────────

std::string CommandStore::serialize_locked() const
{
    json::Value::Object root;
    for (const auto& [session, list] : lists_)
    {
        json::Value::Array entries;
        for (const auto& qc : list)
        {
            json::Value::Object entry;
            entry["label"]   = qc.label;
            entry["command"] = qc.command;
            entries.emplace_back(std::move(entry));
        }
        root[session] = json::Value(std::move(entries));
    }
    return json::serialize(json::Value(std::move(root)));
}

bool CommandStore::deserialize(const std::string& text)
{
    auto doc = json::parse(text);
    if (!doc || !doc->is_object())
        return false;

    std::map<std::string, std::vector<QuickCommand>> parsed;
    for (const auto& [session, list] : doc->as_object())
    {
        if (!list.is_array())
            continue;
        for (const auto& entry : list.as_array())
        {
            auto label   = entry.get_string("label");
            auto command = entry.get_string("command");
            if (label && command)
                parsed[session].push_back(QuickCommand{*label, *command});
        }
    }

    std::lock_guard lock(mu_);
    lists_ = std::move(parsed);
    return true;
}

bool CommandStore::save_locked() const
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path_).parent_path();
    if (!dir.empty())
        std::filesystem::create_directories(dir, ec);

    std::ofstream f(path_, std::ios::trunc);
    if (!f.is_open())
    {
        TERMPANEL_LOG_ERROR("commands", "Cannot open {} for writing", path_);
        return false;
    }
    f << serialize_locked() << '\n';
    return f.good();
}

}   // namespace termpanel::commands
