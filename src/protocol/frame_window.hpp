#pragma once

#include "sequence.hpp"
#include <cstdint>
#include <vector>

namespace conduit {
namespace protocol {

/**
 * Receiver-side frame ID window
 *
 * Tracks which DATA frame IDs have been seen so that link-level duplicates
 * are ignored. The window spans FRAME_WINDOW_SIZE IDs starting at the base;
 * the base trails the newest accepted frame by half a window, leaving the
 * upper half free for frames still in flight.
 *
 *   base                newest
 *    |<---- W/2 ---->|    |<-------- W/2 -------->|
 *    [ stale below ] [ accepted / duplicate-checked ] [ AHEAD: desync ]
 */
class FrameWindow {
public:
    enum class Verdict : uint8_t {
        ACCEPTED,   // First sighting, now marked
        DUPLICATE,  // Already seen
        STALE,      // Behind the window base
        AHEAD,      // Too far ahead (sender and receiver out of sync)
    };

    explicit FrameWindow(uint32_t base_id);

    Verdict accept(uint32_t frame_id);

    // Reposition so that next_frame_id is accepted. Only forward moves
    // (within half the ID space) are honoured. Returns true if the base moved.
    bool resynchronize(uint32_t next_frame_id);

    uint32_t baseId() const { return base_id_; }

private:
    void advanceTo(uint32_t new_base);

    uint32_t base_id_;
    std::vector<bool> seen_;  // Indexed by id % FRAME_WINDOW_SIZE
};

const char* frameVerdictToString(FrameWindow::Verdict verdict);

} // namespace protocol
} // namespace conduit
