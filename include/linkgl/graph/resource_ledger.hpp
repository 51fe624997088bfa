#pragma once

#include "linkgl/core/id.hpp"

#include <vector>

namespace linkgl {

class GraphicsContext;

/**
 * @brief Ownership record of every native handle a renderer created
 *
 * Handles are recorded the moment the graphics API returns them, before any
 * further setup that could fail. releaseAll() deletes each recorded handle
 * exactly once, newest first, through the delete primitive matching its
 * kind, and empties the ledger.
 *
 * **Failure policy**: a deletion that throws is logged and skipped; the
 * remaining handles are still released. releaseAll() itself never throws.
 *
 * Usage:
 * @code
 * Handle buffer = gl.createBuffer();
 * ledger.record(BufferId("quad"), buffer);
 * ...
 * ledger.releaseAll(gl);  // deleteBuffer(buffer)
 * @endcode
 */
class ResourceLedger {
public:
    struct Entry {
        ResourceRef ref;
        Handle handle;
    };

    ResourceLedger() = default;

    // Owns native handles
    ResourceLedger(const ResourceLedger&) = delete;
    ResourceLedger& operator=(const ResourceLedger&) = delete;
    ResourceLedger(ResourceLedger&&) noexcept = default;
    ResourceLedger& operator=(ResourceLedger&&) noexcept = default;

    /// Record ownership of a freshly created handle
    void record(const ResourceRef& ref, Handle handle);

    /**
     * @brief Delete every recorded handle, newest first
     *
     * @return Number of handles released
     */
    size_t releaseAll(GraphicsContext& gl) noexcept;

    /// Get count of owned handles
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /// Owned handles, in creation order
    const std::vector<Entry>& entries() const { return entries_; }

private:
    static void release(GraphicsContext& gl, const Entry& entry);

    std::vector<Entry> entries_;
};

} // namespace linkgl
