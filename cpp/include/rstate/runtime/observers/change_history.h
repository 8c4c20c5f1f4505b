#pragma once

#include <rstate/runtime/observers/reactive_observer.h>

#include <deque>
#include <string>

namespace rstate {

    /**
     * One recorded write, values are rendered at the time of the write.
     */
    struct RSTATE_EXPORT ChangeRecord {
        size_t sequence{0};
        std::string container;
        std::string field;
        std::string old_value;
        std::string new_value;
    };

    /**
     * @brief Keeps the most recent field writes for inspection.
     *
     * Only the last max_entries writes are kept, the oldest is dropped first.
     */
    struct RSTATE_EXPORT ChangeHistory : ReactiveLifeCycleObserver {
        static constexpr size_t DEFAULT_MAX_ENTRIES = 50;

        explicit ChangeHistory(size_t max_entries = DEFAULT_MAX_ENTRIES);

        void on_field_write(const ContainerState &container, std::string_view field, const Value &old_value,
                            const Value &new_value) override;

        [[nodiscard]] const std::deque<ChangeRecord> &history() const { return _history; }

        [[nodiscard]] size_t max_entries() const { return _max_entries; }

        /**
         * The total number of writes seen, including those no longer held.
         */
        [[nodiscard]] size_t total_writes() const { return _sequence; }

        void clear() { _history.clear(); }

    private:
        size_t _max_entries;
        size_t _sequence{0};
        std::deque<ChangeRecord> _history{};
    };

} // namespace rstate
