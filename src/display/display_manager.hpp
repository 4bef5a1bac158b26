#pragma once

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>
#include <termpanel/error.hpp>

#include "../core/config.hpp"
#include "../process/process_registry.hpp"
#include "display_environment.hpp"

namespace termpanel::display
{

enum class SlotState : uint8_t
{
    Starting,
    Running,
    Stopping,
};

// One row of the fixed panel table.
struct PanelInfo
{
    int      panel_index = 0;
    int      display     = 0;
    uint16_t vnc_port    = 0;
    uint16_t ws_port     = 0;

    std::string display_name() const { return ":" + std::to_string(display); }
};

struct SlotInfo
{
    int       display     = 0;
    int       panel_index = 0;
    uint16_t  vnc_port    = 0;
    uint16_t  ws_port     = 0;
    uint32_t  width       = 0;
    uint32_t  height      = 0;
    uint32_t  depth       = 0;
    pid_t     xvfb_pid    = 0;
    pid_t     vnc_pid     = 0;
    pid_t     ws_pid      = 0;
    SlotState state       = SlotState::Starting;

    std::string display_name() const { return ":" + std::to_string(display); }
};

// Target by display number, by panel index, or neither (first free panel).
// Zero geometry fields take the configured defaults.
struct AllocateRequest
{
    std::optional<int> display;
    std::optional<int> panel;
    uint32_t           width  = 0;
    uint32_t           height = 0;
    uint32_t           depth  = 0;
};

struct AllocateResult
{
    SlotInfo slot;
    bool     created = false;   // false when an existing slot was returned
};

// Supervises the Xvfb -> x11vnc -> websockify pipeline of each display slot.
//
// Slot life cycle: (none) -> Starting -> Running -> Stopping -> (none).
// The table lock is not held while stages settle; callers that hit a Starting
// or Stopping slot wait for it to leave that state and then decide again.
class DisplayManager
{
   public:
    DisplayManager(process::ProcessRegistry& registry, DisplayConfig config);

    DisplayManager(const DisplayManager&)            = delete;
    DisplayManager& operator=(const DisplayManager&) = delete;

    // Idempotent for a Running slot. Fails with InvalidArgument,
    // DependencyMissing, ResourceBusy or ProcessStartFailure; on failure no
    // process of the pipeline is left running.
    Result<AllocateResult> allocate(const AllocateRequest& request);

    // Tear down websockify, x11vnc, Xvfb in that order, each best effort.
    Status release(int display);

    // The slot if its Xvfb is alive. A dead slot is released and forgotten.
    std::optional<SlotInfo> probe(int display);

    // probe() over every tracked slot; live ones sorted by display number.
    std::vector<SlotInfo> list();

    // nullopt unless the display is tracked.
    std::optional<DisplayEnvironment> binding_environment(int display) const;

    // Release, then allocate the same display with new geometry.
    Result<AllocateResult> resize(int display, uint32_t width, uint32_t height);

    std::vector<PanelInfo>   fixed_table() const;
    std::optional<PanelInfo> panel_for_display(int display) const;
    std::optional<PanelInfo> panel_by_index(int index) const;

    // Pipeline binaries that cannot be found on PATH.
    std::vector<std::string> missing_dependencies() const;

    void   release_all();
    size_t slot_count() const;

    const DisplayConfig& config() const { return config_; }

   private:
    Result<PanelInfo> resolve_panel_locked(const AllocateRequest& request) const;
    Status            check_resources(const PanelInfo& panel) const;
    Status            launch_pipeline(SlotInfo& slot);
    void              stop_stages(const SlotInfo& slot);
    void              evict_locked(std::unique_lock<std::mutex>& lock, int display);

    process::ProcessRegistry& registry_;
    DisplayConfig             config_;

    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::map<int, SlotInfo> slots_;
};

}   // namespace termpanel::display
