#pragma once

#include "Body.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace BouncePit {

/**
 * BodyStore: arena of live bodies addressed by generational handles.
 *
 * Design:
 * - Bodies live densely in spawn order, so renderers iterate a flat vector
 *   and "last spawned wins" is a reverse scan.
 * - Each handle names a slot; the slot maps to the dense position and carries
 *   a generation that is bumped whenever its body is discarded.
 * - A handle whose generation no longer matches its slot is stale; lookups
 *   return nullptr instead of aliasing a newer body.
 *
 * Usage:
 *   BodyHandle h = store.add(body);
 *   if (Body* b = store.find(h)) { b->position = ...; }
 *   store.clear(); // h is now stale.
 */
class BodyStore {
public:
    BodyStore() = default;

    // Assigns body.handle and appends the body. Returns the new handle.
    BodyHandle add(Body body);

    bool contains(const BodyHandle& handle) const;

    Body* find(const BodyHandle& handle);
    const Body* find(const BodyHandle& handle) const;

    // Removes one body, keeping the spawn order of the rest.
    // Returns false for a stale handle.
    bool remove(const BodyHandle& handle);

    // Discards every body. All outstanding handles become stale.
    void clear();

    size_t size() const { return bodies_.size(); }
    bool empty() const { return bodies_.empty(); }

    // Dense access in spawn order.
    Body& at(size_t denseIndex) { return bodies_.at(denseIndex); }
    const Body& at(size_t denseIndex) const { return bodies_.at(denseIndex); }

    std::vector<Body>& getBodies() { return bodies_; }
    const std::vector<Body>& getBodies() const { return bodies_; }

    std::vector<Body>::iterator begin() { return bodies_.begin(); }
    std::vector<Body>::iterator end() { return bodies_.end(); }
    std::vector<Body>::const_iterator begin() const { return bodies_.begin(); }
    std::vector<Body>::const_iterator end() const { return bodies_.end(); }

private:
    static constexpr uint32_t NO_BODY = UINT32_MAX;

    struct Slot {
        uint32_t generation = 0;
        uint32_t dense_index = NO_BODY;
    };

    // Returns the dense index for a live handle, NO_BODY otherwise.
    uint32_t denseIndexOf(const BodyHandle& handle) const;
    void releaseSlot(uint32_t slotIndex);

    std::vector<Body> bodies_;
    std::vector<Slot> slots_;
    std::vector<uint32_t> free_slots_;
};

} // namespace BouncePit
