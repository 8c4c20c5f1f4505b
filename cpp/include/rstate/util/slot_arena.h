#ifndef RSTATE_UTIL_SLOT_ARENA_H
#define RSTATE_UTIL_SLOT_ARENA_H

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

namespace rstate {

    /**
     * A stable handle into a SlotArena. The generation distinguishes a live entry from an entry that has been
     * released and whose slot has since been reused, so a stale id never resolves to the wrong object.
     *
     * The Tag only exists to make ids of different arenas distinct types.
     */
    template<typename Tag>
    struct SlotId {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t index{INVALID_INDEX};
        uint32_t generation{0};

        [[nodiscard]] constexpr bool valid() const { return index != INVALID_INDEX; }

        [[nodiscard]] constexpr uint64_t key() const {
            return (static_cast<uint64_t>(generation) << 32) | static_cast<uint64_t>(index);
        }

        constexpr bool operator==(const SlotId &) const = default;
    };

    template<typename Tag>
    struct SlotIdHash {
        using is_avalanching = void;

        [[nodiscard]] auto operator()(const SlotId<Tag> &id) const noexcept -> uint64_t {
            return ankerl::unordered_dense::hash<uint64_t>{}(id.key());
        }
    };

    /**
     * Arena storage keyed by SlotId.
     *
     * Entries are held by shared_ptr so that code which is part way through using an entry (for example a
     * computation that disposes itself while it is running) can keep it alive after it has been erased from the
     * arena. The arena itself is the only long-lived owner.
     */
    template<typename T, typename Tag>
    class SlotArena {
    public:
        using id_type = SlotId<Tag>;
        using value_ptr = std::shared_ptr<T>;

        /**
         * Reserve a slot and construct the entry with the factory, the factory receives the id the entry will be
         * stored under and must return a shared_ptr<T> (or something convertible to it).
         */
        template<typename Factory>
        id_type insert(Factory &&make) {
            id_type id;
            if (_free.empty()) {
                id.index = static_cast<uint32_t>(_slots.size());
                _slots.emplace_back();
            } else {
                id.index = _free.back();
                _free.pop_back();
            }
            auto &slot = _slots[id.index];
            id.generation = slot.generation;
            slot.value = make(id);
            ++_size;
            return id;
        }

        [[nodiscard]] value_ptr find(id_type id) const {
            if (!id.valid() || id.index >= _slots.size()) { return nullptr; }
            const auto &slot = _slots[id.index];
            if (slot.generation != id.generation) { return nullptr; }
            return slot.value;
        }

        [[nodiscard]] T *get(id_type id) const {
            if (!id.valid() || id.index >= _slots.size()) { return nullptr; }
            const auto &slot = _slots[id.index];
            if (slot.generation != id.generation) { return nullptr; }
            return slot.value.get();
        }

        [[nodiscard]] bool contains(id_type id) const { return get(id) != nullptr; }

        /**
         * Remove the entry, returns the released value so the caller decides when it is destroyed.
         */
        value_ptr erase(id_type id) {
            if (!contains(id)) { return nullptr; }
            auto &slot = _slots[id.index];
            value_ptr released = std::move(slot.value);
            slot.value.reset();
            ++slot.generation;
            _free.push_back(id.index);
            --_size;
            return released;
        }

        template<typename Op>
        void for_each(Op op) const {
            for (const auto &slot: _slots) {
                if (slot.value) { op(*slot.value); }
            }
        }

        [[nodiscard]] size_t size() const { return _size; }

        [[nodiscard]] bool empty() const { return _size == 0; }

        void clear() {
            _slots.clear();
            _free.clear();
            _size = 0;
        }

    private:
        struct Slot {
            value_ptr value{};
            uint32_t generation{0};
        };

        std::vector<Slot> _slots{};
        std::vector<uint32_t> _free{};
        size_t _size{0};
    };
} // namespace rstate

#endif  // RSTATE_UTIL_SLOT_ARENA_H
