#ifndef BUBBLEFIT_LEDGER_REGION_LEDGER_H
#define BUBBLEFIT_LEDGER_REGION_LEDGER_H

#include "bubblefit/core/types.h"
#include "bubblefit/layout/render_plan.h"
#include "bubblefit/layout/typeset_engine.h"
#include "bubblefit/mask/mask_builder.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bubblefit::ledger {

// Detection output for one region.
struct RegionSeed {
    Rect sourceBox;
    std::string sourceText;
    Orientation orientation = Orientation::Horizontal;
    TextStyle style;
};

// Value copy of a region as stored in the ledger.
struct Region {
    std::uint32_t id = 0;
    std::uint64_t version = 0;
    Rect sourceBox;
    Rect editBox;
    std::string sourceText;
    std::string translatedText;
    Orientation orientation = Orientation::Horizontal;
    TextStyle style;
};

/**
 * RegionLedger: owns every Region of the current image.
 *
 * Responsibilities:
 * - Id assignment (monotonic, never reused, not even across clear())
 * - Per-region version stamps, bumped on every effective mutation
 * - Lazy render plans: a dirty flag plus a cached plan per slot
 * - Mask snapshots over the full region set
 *
 * All methods are thread-safe. Layout runs outside the lock; a plan computed
 * from a superseded version is discarded and recomputed.
 */
class RegionLedger {
public:
    explicit RegionLedger(std::shared_ptr<const layout::TypesetEngine> engine);
    ~RegionLedger();

    RegionLedger(const RegionLedger&) = delete;
    RegionLedger& operator=(const RegionLedger&) = delete;

    // ==========================================================================
    // Lifecycle
    // ==========================================================================

    /**
     * Append a region. editBox starts equal to sourceBox.
     * @return The new id, or 0 when sourceBox has no area
     */
    std::uint32_t addRegion(RegionSeed seed);

    EngineError removeRegion(std::uint32_t id);

    /**
     * Drop every region (new detection pass). Id assignment continues.
     */
    void clear();

    // ==========================================================================
    // Mutations
    // ==========================================================================

    // Unchanged text is a no-op and keeps the current version.
    EngineError setTranslatedText(std::uint32_t id, std::string text);
    // Rejects boxes without area with InvalidOperation.
    EngineError setEditBox(std::uint32_t id, const Rect& box);
    EngineError resetEditBox(std::uint32_t id);
    // Color-only changes are patched into the cached plan without relayout.
    EngineError setStyle(std::uint32_t id, const TextStyle& style);
    EngineError setOrientation(std::uint32_t id, Orientation orientation);

    // ==========================================================================
    // Queries
    // ==========================================================================

    std::optional<Region> snapshot(std::uint32_t id) const;
    std::vector<Region> snapshotAll() const;
    std::vector<std::uint32_t> ids() const;
    std::size_t size() const;
    std::optional<std::uint64_t> version(std::uint32_t id) const;

    /**
     * Regions whose plan must be recomputed before the next read.
     */
    std::vector<std::uint32_t> dirtyIds() const;

    /**
     * Current render plan, recomputed first when the region is dirty.
     * @return nullopt when the id is unknown
     */
    std::optional<layout::RenderPlan> renderPlan(std::uint32_t id);

    /**
     * Build the erasure mask from every region's editBox.
     */
    mask::MaskBuildResult buildMask(std::int32_t imageWidth, std::int32_t imageHeight) const;

    // Number of layouts run so far, discarded ones included.
    std::uint64_t layoutCount() const;

    const layout::TypesetEngine& engine() const { return *engine_; }

private:
    struct Slot {
        bool alive = false;
        bool dirty = true;
        Region region;
        std::optional<layout::RenderPlan> plan;
    };

    std::shared_ptr<const layout::TypesetEngine> engine_;
    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
    std::uint32_t baseId_ = 1;  // id of slots_[0]
    std::uint32_t nextId_ = 1;
    std::uint64_t layoutCount_ = 0;

    Slot* findLocked(std::uint32_t id);
    const Slot* findLocked(std::uint32_t id) const;
    static void touch(Slot& slot, bool invalidate);
};

} // namespace bubblefit::ledger

#endif // BUBBLEFIT_LEDGER_REGION_LEDGER_H
