#include "display_manager.hpp"

#include <thread>

#include <termpanel/logger.hpp>

#include "resource_probe.hpp"

namespace termpanel::display
{

namespace
{

constexpr const char* INSTALL_HINT = "Install with: sudo apt install xvfb x11vnc websockify";

std::string join(const std::vector<std::string>& parts, const char* sep)
{
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i)
    {
        if (i > 0)
            out += sep;
        out += parts[i];
    }
    return out;
}

std::string stage_tag(int display, const char* stage)
{
    return "display:" + std::to_string(display) + "/" + stage;
}

}   // namespace

DisplayManager::DisplayManager(process::ProcessRegistry& registry, DisplayConfig config)
    : registry_(registry), config_(std::move(config))
{
}

// ─── Panel table ────────────────────────────────────────────────────────────

std::vector<PanelInfo> DisplayManager::fixed_table() const
{
    std::vector<PanelInfo> table;
    for (int i = 0; i < config_.panel_count; ++i)
    {
        // A wrapped port would alias another panel's or become 0.
        if (config_.vnc_port_base + i > 65535 || config_.ws_port_base + i > 65535)
            break;
        PanelInfo p;
        p.panel_index = i;
        p.display     = config_.display_base + i;
        p.vnc_port    = static_cast<uint16_t>(config_.vnc_port_base + i);
        p.ws_port     = static_cast<uint16_t>(config_.ws_port_base + i);
        table.push_back(p);
    }
    return table;
}

std::optional<PanelInfo> DisplayManager::panel_for_display(int display) const
{
    int index = display - config_.display_base;
    return panel_by_index(index);
}

std::optional<PanelInfo> DisplayManager::panel_by_index(int index) const
{
    auto table = fixed_table();
    if (index < 0 || static_cast<size_t>(index) >= table.size())
        return std::nullopt;
    return table[static_cast<size_t>(index)];
}

std::vector<std::string> DisplayManager::missing_dependencies() const
{
    std::vector<std::string> missing;
    for (const auto* binary :
         {&config_.xvfb_binary, &config_.vnc_binary, &config_.websockify_binary})
    {
        if (!process::ProcessRegistry::find_executable(*binary))
            missing.push_back(*binary);
    }
    return missing;
}

Result<PanelInfo> DisplayManager::resolve_panel_locked(const AllocateRequest& request) const
{
    std::vector<std::string> valid;
    for (const auto& p : fixed_table())
        valid.push_back(std::to_string(p.display));

    if (request.display)
    {
        auto panel = panel_for_display(*request.display);
        if (!panel)
            return make_error(ErrorKind::InvalidArgument,
                              "Invalid display number " + std::to_string(*request.display)
                                  + ". Must be one of " + join(valid, ", "));
        if (request.panel && *request.panel != panel->panel_index)
            return make_error(ErrorKind::InvalidArgument, "Display and panel index disagree");
        return *panel;
    }

    if (request.panel)
    {
        auto panel = panel_by_index(*request.panel);
        if (!panel)
            return make_error(ErrorKind::InvalidArgument,
                              "Invalid panel index " + std::to_string(*request.panel)
                                  + ". Must be 0.." + std::to_string(fixed_table().size() - 1));
        return *panel;
    }

    for (const auto& p : fixed_table())
    {
        if (slots_.count(p.display))
            continue;
        if (check_resources(p))
            return p;
    }
    return make_error(ErrorKind::ResourceBusy, "No free display panel");
}

Status DisplayManager::check_resources(const PanelInfo& panel) const
{
    if (!port_available(panel.vnc_port))
        return make_error(ErrorKind::ResourceBusy,
                          "VNC port " + std::to_string(panel.vnc_port) + " is in use");
    if (!port_available(panel.ws_port))
        return make_error(ErrorKind::ResourceBusy,
                          "WebSocket port " + std::to_string(panel.ws_port) + " is in use");
    if (!display_available(config_.x11_tmp_dir, panel.display))
        return make_error(ErrorKind::ResourceBusy,
                          "Display " + panel.display_name() + " is in use by another process");
    return Status::success();
}

// ─── Allocation ─────────────────────────────────────────────────────────────

Result<AllocateResult> DisplayManager::allocate(const AllocateRequest& request)
{
    std::unique_lock lock(mu_);

    auto resolved = resolve_panel_locked(request);
    if (!resolved)
        return resolved.error();
    const PanelInfo panel = *resolved;

    for (;;)
    {
        auto it = slots_.find(panel.display);
        if (it == slots_.end())
            break;
        if (it->second.state == SlotState::Running)
        {
            if (registry_.is_alive(it->second.xvfb_pid))
                return AllocateResult{it->second, false};
            TERMPANEL_LOG_WARN("display", "Xvfb for {} died, replacing slot", panel.display_name());
            evict_locked(lock, panel.display);
            continue;
        }
        // Another caller is starting or stopping this slot.
        cv_.wait(lock);
    }

    auto missing = missing_dependencies();
    if (!missing.empty())
        return make_error(ErrorKind::DependencyMissing,
                          "Missing dependencies: " + join(missing, ", ") + ". " + INSTALL_HINT);

    if (auto busy = check_resources(panel); !busy)
        return busy.error();

    SlotInfo slot;
    slot.display     = panel.display;
    slot.panel_index = panel.panel_index;
    slot.vnc_port    = panel.vnc_port;
    slot.ws_port     = panel.ws_port;
    slot.width       = request.width ? request.width : config_.default_width;
    slot.height      = request.height ? request.height : config_.default_height;
    slot.depth       = request.depth ? request.depth : config_.default_depth;
    slot.state       = SlotState::Starting;
    slots_[slot.display] = slot;

    lock.unlock();
    Status started = launch_pipeline(slot);
    lock.lock();

    if (!started)
    {
        slots_.erase(slot.display);
        cv_.notify_all();
        return started.error();
    }

    slot.state           = SlotState::Running;
    slots_[slot.display] = slot;
    cv_.notify_all();
    TERMPANEL_LOG_INFO("display", "Display {} running ({}x{}x{}, vnc={}, ws={})",
                       slot.display_name(), slot.width, slot.height, slot.depth, slot.vnc_port,
                       slot.ws_port);
    return AllocateResult{slot, true};
}

Status DisplayManager::launch_pipeline(SlotInfo& slot)
{
    const std::string display = slot.display_name();
    const auto        env     = DisplayEnvironment::for_display(slot.display);

    process::ProcessSpec graphical;
    for (const auto& [key, value] : env.entries())
        graphical.env_set.emplace_back(std::string(env_key_name(key)), value);
    for (std::string_view name : COMPETING_DISPLAY_VARS)
        graphical.env_unset.emplace_back(name);
    graphical.capture_stderr = true;

    struct Stage
    {
        const char*               name;
        process::ProcessSpec      spec;
        std::chrono::milliseconds settle;
        pid_t*                    pid;
    };

    Stage stages[3] = {
        {"xvfb", graphical, config_.framebuffer_settle, &slot.xvfb_pid},
        {"vnc", graphical, config_.vnc_settle, &slot.vnc_pid},
        {"websockify", {}, config_.bridge_settle, &slot.ws_pid},
    };

    const std::string screen = std::to_string(slot.width) + "x" + std::to_string(slot.height)
                               + "x" + std::to_string(slot.depth);
    stages[0].spec.argv = {config_.xvfb_binary, display, "-screen", "0", screen, "-ac",
                           "+extension", "GLX", "+extension", "RENDER", "-nolisten", "tcp"};
    stages[1].spec.argv = {config_.vnc_binary, "-display", display, "-rfbport",
                           std::to_string(slot.vnc_port), "-nopw", "-forever", "-shared",
                           "-noxdamage", "-wait", "5", "-defer", "5"};
    stages[2].spec.argv = {config_.websockify_binary, std::to_string(slot.ws_port),
                           "127.0.0.1:" + std::to_string(slot.vnc_port)};
    stages[2].spec.capture_stderr = true;

    for (auto& stage : stages)
    {
        auto pid = registry_.spawn(stage_tag(slot.display, stage.name), stage.spec);
        if (!pid)
        {
            TERMPANEL_LOG_ERROR("display", "Cannot start {} for {}: {}", stage.spec.argv[0],
                                display, pid.error().detail);
            stop_stages(slot);
            if (pid.error().kind == ErrorKind::DependencyMissing)
                return make_error(ErrorKind::DependencyMissing,
                                  "Missing dependencies: " + pid.error().detail + ". "
                                      + INSTALL_HINT);
            return make_error(ErrorKind::ProcessStartFailure,
                              "Failed to start " + stage.spec.argv[0] + ": "
                                  + pid.error().detail);
        }
        *stage.pid = *pid;

        std::this_thread::sleep_for(stage.settle);
        if (!registry_.is_alive(*pid))
        {
            std::string detail = "Failed to start " + stage.spec.argv[0] + " for " + display
                                 + " (" + registry_.describe_exit(*pid) + ")";
            std::string err = registry_.captured_stderr(*pid);
            if (!err.empty())
                detail += ": " + err;
            TERMPANEL_LOG_ERROR("display", "{}", detail);
            stop_stages(slot);
            return make_error(ErrorKind::ProcessStartFailure, detail);
        }
        TERMPANEL_LOG_DEBUG("display", "{} stage {} up (pid={})", display, stage.name, *pid);
    }
    return Status::success();
}

void DisplayManager::stop_stages(const SlotInfo& slot)
{
    // Reverse start order. terminate() never fails, so one stage cannot
    // block the next.
    for (pid_t pid : {slot.ws_pid, slot.vnc_pid, slot.xvfb_pid})
    {
        if (pid > 0)
            registry_.terminate(pid, config_.terminate_grace);
    }
}

// ─── Release / probe ────────────────────────────────────────────────────────

void DisplayManager::evict_locked(std::unique_lock<std::mutex>& lock, int display)
{
    auto it = slots_.find(display);
    if (it == slots_.end())
        return;
    it->second.state = SlotState::Stopping;
    SlotInfo victim  = it->second;

    lock.unlock();
    stop_stages(victim);
    lock.lock();

    slots_.erase(display);
    cv_.notify_all();
}

Status DisplayManager::release(int display)
{
    std::unique_lock lock(mu_);
    for (;;)
    {
        auto it = slots_.find(display);
        if (it == slots_.end())
            return make_error(ErrorKind::NotFound,
                              "Display :" + std::to_string(display) + " not found");
        if (it->second.state == SlotState::Running)
            break;
        cv_.wait(lock);
    }

    evict_locked(lock, display);
    TERMPANEL_LOG_INFO("display", "Released display :{}", display);
    return Status::success();
}

std::optional<SlotInfo> DisplayManager::probe(int display)
{
    std::unique_lock lock(mu_);
    auto             it = slots_.find(display);
    if (it == slots_.end() || it->second.state != SlotState::Running)
        return std::nullopt;

    if (registry_.is_alive(it->second.xvfb_pid))
        return it->second;

    TERMPANEL_LOG_WARN("display", "Xvfb for :{} is gone, releasing slot", display);
    evict_locked(lock, display);
    return std::nullopt;
}

std::vector<SlotInfo> DisplayManager::list()
{
    std::vector<int> tracked;
    {
        std::lock_guard lock(mu_);
        for (const auto& [display, _] : slots_)
            tracked.push_back(display);
    }

    std::vector<SlotInfo> live;
    for (int display : tracked)
    {
        if (auto slot = probe(display))
            live.push_back(*slot);
    }
    return live;
}

std::optional<DisplayEnvironment> DisplayManager::binding_environment(int display) const
{
    std::lock_guard lock(mu_);
    if (!slots_.count(display))
        return std::nullopt;
    return DisplayEnvironment::for_display(display);
}

Result<AllocateResult> DisplayManager::resize(int display, uint32_t width, uint32_t height)
{
    uint32_t depth = 0;
    {
        std::lock_guard lock(mu_);
        auto            it = slots_.find(display);
        if (it == slots_.end())
            return make_error(ErrorKind::NotFound,
                              "Display :" + std::to_string(display) + " not found");
        depth = it->second.depth;
    }

    if (auto released = release(display); !released)
        return released.error();

    AllocateRequest request;
    request.display = display;
    request.width   = width;
    request.height  = height;
    request.depth   = depth;
    return allocate(request);
}

void DisplayManager::release_all()
{
    std::vector<int> tracked;
    {
        std::lock_guard lock(mu_);
        for (const auto& [display, _] : slots_)
            tracked.push_back(display);
    }
    for (int display : tracked)
    {
        if (auto status = release(display); !status)
            TERMPANEL_LOG_DEBUG("display", "release_all: {}", status.error().detail);
    }
}

size_t DisplayManager::slot_count() const
{
    std::lock_guard lock(mu_);
    return slots_.size();
}

}   // namespace termpanel::display
