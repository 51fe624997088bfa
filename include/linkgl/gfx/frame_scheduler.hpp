#pragma once

#include "linkgl/core/types.hpp"

namespace linkgl {

/**
 * @brief Host primitive: "invoke this callback once on the next display refresh"
 *
 * A requested callback fires at most once. Callbacks requested while a frame
 * is being dispatched fire on the following refresh, never the current one.
 */
class FrameScheduler {
public:
    virtual ~FrameScheduler() = default;

    /// Schedule a callback for the next refresh; returns a cancellation token
    virtual FrameToken requestFrame(FrameCallback callback) = 0;

    /// Cancel a pending callback; unknown or already fired tokens are ignored
    virtual void cancelFrame(FrameToken token) = 0;
};

} // namespace linkgl
