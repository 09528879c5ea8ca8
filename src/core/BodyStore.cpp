#include "BodyStore.h"

namespace BouncePit {

BodyHandle BodyStore::add(Body body)
{
    uint32_t slotIndex;
    if (!free_slots_.empty()) {
        slotIndex = free_slots_.back();
        free_slots_.pop_back();
    }
    else {
        slotIndex = static_cast<uint32_t>(slots_.size());
        slots_.push_back(Slot{});
    }

    Slot& slot = slots_[slotIndex];
    slot.dense_index = static_cast<uint32_t>(bodies_.size());

    body.handle = BodyHandle{ slotIndex, slot.generation };
    bodies_.push_back(body);
    return body.handle;
}

uint32_t BodyStore::denseIndexOf(const BodyHandle& handle) const
{
    if (handle.index >= slots_.size()) {
        return NO_BODY;
    }
    const Slot& slot = slots_[handle.index];
    if (slot.generation != handle.generation) {
        return NO_BODY;
    }
    return slot.dense_index;
}

bool BodyStore::contains(const BodyHandle& handle) const
{
    return denseIndexOf(handle) != NO_BODY;
}

Body* BodyStore::find(const BodyHandle& handle)
{
    const uint32_t dense = denseIndexOf(handle);
    return dense == NO_BODY ? nullptr : &bodies_[dense];
}

const Body* BodyStore::find(const BodyHandle& handle) const
{
    const uint32_t dense = denseIndexOf(handle);
    return dense == NO_BODY ? nullptr : &bodies_[dense];
}

bool BodyStore::remove(const BodyHandle& handle)
{
    const uint32_t dense = denseIndexOf(handle);
    if (dense == NO_BODY) {
        return false;
    }

    bodies_.erase(bodies_.begin() + dense);
    releaseSlot(handle.index);

    // Everything after the removed body shifted down by one.
    for (uint32_t i = dense; i < bodies_.size(); ++i) {
        slots_[bodies_[i].handle.index].dense_index = i;
    }
    return true;
}

void BodyStore::clear()
{
    for (const Body& body : bodies_) {
        releaseSlot(body.handle.index);
    }
    bodies_.clear();
}

void BodyStore::releaseSlot(uint32_t slotIndex)
{
    Slot& slot = slots_[slotIndex];
    slot.generation++;
    slot.dense_index = NO_BODY;
    free_slots_.push_back(slotIndex);
}

} // namespace BouncePit
