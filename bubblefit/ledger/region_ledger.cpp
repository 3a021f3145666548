#include "bubblefit/ledger/region_ledger.h"
#include "bubblefit/core/logging.h"

#include <algorithm>
#include <utility>

namespace bubblefit::ledger {

RegionLedger::RegionLedger(std::shared_ptr<const layout::TypesetEngine> engine)
    : engine_(std::move(engine)) {
}

RegionLedger::~RegionLedger() = default;

RegionLedger::Slot* RegionLedger::findLocked(std::uint32_t id) {
    if (id < baseId_) return nullptr;
    const std::size_t index = id - baseId_;
    if (index >= slots_.size() || !slots_[index].alive) return nullptr;
    return &slots_[index];
}

const RegionLedger::Slot* RegionLedger::findLocked(std::uint32_t id) const {
    if (id < baseId_) return nullptr;
    const std::size_t index = id - baseId_;
    if (index >= slots_.size() || !slots_[index].alive) return nullptr;
    return &slots_[index];
}

void RegionLedger::touch(Slot& slot, bool invalidate) {
    ++slot.region.version;
    if (invalidate) {
        slot.dirty = true;
        slot.plan.reset();
    } else if (slot.plan) {
        slot.plan->version = slot.region.version;
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

std::uint32_t RegionLedger::addRegion(RegionSeed seed) {
    if (seed.sourceBox.empty()) {
        BUBBLEFIT_LOG_WARN("ledger: rejected seed with empty box %dx%d", seed.sourceBox.w, seed.sourceBox.h);
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint32_t id = nextId_++;

    Slot slot;
    slot.alive = true;
    slot.dirty = true;
    slot.region.id = id;
    slot.region.version = 1;
    slot.region.sourceBox = seed.sourceBox;
    slot.region.editBox = seed.sourceBox;
    slot.region.sourceText = std::move(seed.sourceText);
    slot.region.orientation = seed.orientation;
    slot.region.style = std::move(seed.style);
    slots_.push_back(std::move(slot));
    return id;
}

EngineError RegionLedger::removeRegion(std::uint32_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = findLocked(id);
    if (!slot) return EngineError::NotFound;
    *slot = Slot{};

    // Slots stay in place so indices keep mapping to ids; once every slot is
    // dead the table restarts at the next id.
    const bool anyAlive = std::any_of(slots_.begin(), slots_.end(), [](const Slot& s) { return s.alive; });
    if (!anyAlive) {
        slots_.clear();
        baseId_ = nextId_;
    }
    return EngineError::Ok;
}

void RegionLedger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.clear();
    baseId_ = nextId_;
}

// =============================================================================
// Mutations
// =============================================================================

EngineError RegionLedger::setTranslatedText(std::uint32_t id, std::string text) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = findLocked(id);
    if (!slot) return EngineError::NotFound;
    if (slot->region.translatedText == text) return EngineError::Ok;
    slot->region.translatedText = std::move(text);
    touch(*slot, true);
    return EngineError::Ok;
}

EngineError RegionLedger::setEditBox(std::uint32_t id, const Rect& box) {
    if (box.empty()) return EngineError::InvalidOperation;

    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = findLocked(id);
    if (!slot) return EngineError::NotFound;
    if (slot->region.editBox == box) return EngineError::Ok;
    slot->region.editBox = box;
    touch(*slot, true);
    return EngineError::Ok;
}

EngineError RegionLedger::resetEditBox(std::uint32_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = findLocked(id);
    if (!slot) return EngineError::NotFound;
    if (slot->region.editBox == slot->region.sourceBox) return EngineError::Ok;
    slot->region.editBox = slot->region.sourceBox;
    touch(*slot, true);
    return EngineError::Ok;
}

EngineError RegionLedger::setStyle(std::uint32_t id, const TextStyle& style) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = findLocked(id);
    if (!slot) return EngineError::NotFound;

    TextStyle& current = slot->region.style;
    const bool layoutChanged = current.fontFamily != style.fontFamily
        || current.fontSizeHint != style.fontSizeHint
        || current.align != style.align;
    const bool colorChanged = current.colorRGBA != style.colorRGBA;
    if (!layoutChanged && !colorChanged) return EngineError::Ok;

    current = style;
    if (!layoutChanged && slot->plan) {
        slot->plan->colorRGBA = style.colorRGBA;
    }
    touch(*slot, layoutChanged);
    return EngineError::Ok;
}

EngineError RegionLedger::setOrientation(std::uint32_t id, Orientation orientation) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = findLocked(id);
    if (!slot) return EngineError::NotFound;
    if (slot->region.orientation == orientation) return EngineError::Ok;
    slot->region.orientation = orientation;
    touch(*slot, true);
    return EngineError::Ok;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Region> RegionLedger::snapshot(std::uint32_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Slot* slot = findLocked(id);
    if (!slot) return std::nullopt;
    return slot->region;
}

std::vector<Region> RegionLedger::snapshotAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Region> out;
    out.reserve(slots_.size());
    for (const Slot& slot : slots_) {
        if (slot.alive) out.push_back(slot.region);
    }
    return out;
}

std::vector<std::uint32_t> RegionLedger::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::uint32_t> out;
    out.reserve(slots_.size());
    for (const Slot& slot : slots_) {
        if (slot.alive) out.push_back(slot.region.id);
    }
    return out;
}

std::size_t RegionLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(slots_.begin(), slots_.end(),
        [](const Slot& slot) { return slot.alive; }));
}

std::optional<std::uint64_t> RegionLedger::version(std::uint32_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Slot* slot = findLocked(id);
    if (!slot) return std::nullopt;
    return slot->region.version;
}

std::vector<std::uint32_t> RegionLedger::dirtyIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::uint32_t> out;
    for (const Slot& slot : slots_) {
        if (slot.alive && slot.dirty) out.push_back(slot.region.id);
    }
    return out;
}

std::optional<layout::RenderPlan> RegionLedger::renderPlan(std::uint32_t id) {
    for (;;) {
        layout::TypesetInput input;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const Slot* slot = findLocked(id);
            if (!slot) return std::nullopt;
            if (!slot->dirty && slot->plan) return slot->plan;

            input.regionId = slot->region.id;
            input.version = slot->region.version;
            input.editBox = slot->region.editBox;
            input.text = slot->region.translatedText;
            input.orientation = slot->region.orientation;
            input.style = slot->region.style;
            ++layoutCount_;
        }

        layout::RenderPlan plan = engine_->layout(input);

        std::lock_guard<std::mutex> lock(mutex_);
        Slot* slot = findLocked(id);
        if (!slot) return std::nullopt;
        if (slot->region.version != input.version) {
            BUBBLEFIT_LOG_DEBUG("region %u: plan for version %llu superseded, recomputing",
                                id, static_cast<unsigned long long>(input.version));
            continue;
        }
        slot->plan = plan;
        slot->dirty = false;
        return plan;
    }
}

mask::MaskBuildResult RegionLedger::buildMask(std::int32_t imageWidth, std::int32_t imageHeight) const {
    std::vector<mask::MaskSource> sources;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sources.reserve(slots_.size());
        for (const Slot& slot : slots_) {
            if (slot.alive) sources.push_back(mask::MaskSource{slot.region.id, slot.region.editBox});
        }
    }
    const mask::MaskBuilder builder(engine_->config().mask);
    return builder.build(std::move(sources), imageWidth, imageHeight);
}

std::uint64_t RegionLedger::layoutCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return layoutCount_;
}

} // namespace bubblefit::ledger
