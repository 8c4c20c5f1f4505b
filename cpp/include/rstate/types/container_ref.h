#pragma once

#include <rstate/rstate_base.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rstate {

    /**
     * Field key of the synthetic shape field. Every container has one, reading the membership of a container
     * (its keys, its size, iterating it) subscribes to it and every structural change triggers it.
     */
    inline constexpr std::string_view SHAPE_FIELD{"[[shape]]"};

    /**
     * @brief Handle to a reactive record.
     *
     * A Record is a cheap, copyable reference to a container owned by a ReactiveEngine. All access goes through
     * the accessors below, which is how the engine sees every read and write:
     *
     * - get/has/keys/size record a dependency for the computation currently running (if any).
     * - set/set_plain/remove notify the computations that depend on the field, immediately or at the end of the
     *   enclosing batch.
     *
     * Two handles compare equal when they refer to the same container, which is also what makes a nested record
     * value compare equal to itself when it is written back into a field.
     */
    class RSTATE_EXPORT Record {
    public:
        Record() = default;

        Record(engine_ptr engine, ContainerId id) : _engine{engine}, _id{id} {}

        [[nodiscard]] engine_ptr engine() const { return _engine; }

        [[nodiscard]] ContainerId id() const { return _id; }

        /**
         * True if the handle refers to a live container.
         */
        [[nodiscard]] bool is_alive() const;

        [[nodiscard]] Value get(std::string_view field) const;

        void set(std::string_view field, Value value) const;

        /**
         * Write structured plain data, records and lists become fresh nested containers. A nested container
         * created this way is released once it is overwritten or removed.
         */
        void set_plain(std::string_view field, const PlainValue &value) const;

        [[nodiscard]] bool has(std::string_view field) const;

        /**
         * Remove a field, returns false if the field did not exist.
         */
        bool remove(std::string_view field) const;

        [[nodiscard]] std::vector<std::string> keys() const;

        [[nodiscard]] size_t size() const;

        /**
         * Apply several writes as one batch.
         */
        void update(const std::vector<std::pair<std::string, Value>> &values) const;

        /**
         * Notify the subscribers of a field as if it had changed.
         */
        void notify(std::string_view field) const;

        /**
         * Notify the subscribers of every field of this record.
         */
        void notify_all() const;

        /**
         * Install a derived value as a read-only field of this record.
         */
        Derived computed(std::string field, reader_fn fn) const;

        [[nodiscard]] PlainValue snapshot() const;

        void set_label(std::string label) const;

        [[nodiscard]] std::string label() const;

        bool operator==(const Record &other) const { return _engine == other._engine && _id == other._id; }

    private:
        engine_ptr _engine{nullptr};
        ContainerId _id{};
    };

    /**
     * @brief Handle to a reactive ordered sequence.
     *
     * Elements are addressed by index, each index is its own field. Structural mutations (push_back, pop_back,
     * insert, erase, clear) write the shape field as well as every index whose element moved, appeared or
     * disappeared, so a computation iterating the sequence re-runs when membership changes and a computation
     * reading a single position re-runs when that position is affected.
     */
    class RSTATE_EXPORT Sequence {
    public:
        Sequence() = default;

        Sequence(engine_ptr engine, ContainerId id) : _engine{engine}, _id{id} {}

        [[nodiscard]] engine_ptr engine() const { return _engine; }

        [[nodiscard]] ContainerId id() const { return _id; }

        [[nodiscard]] bool is_alive() const;

        [[nodiscard]] size_t size() const;

        [[nodiscard]] bool empty() const { return size() == 0; }

        [[nodiscard]] Value at(size_t index) const;

        [[nodiscard]] std::vector<Value> values() const;

        void set(size_t index, Value value) const;

        void push_back(Value value) const;

        void push_back_plain(const PlainValue &value) const;

        Value pop_back() const;

        void insert(size_t index, Value value) const;

        /**
         * Remove and return the element. An element created from plain data is released with its removal, the
         * returned handle is then no longer alive.
         */
        Value erase(size_t index) const;

        void clear() const;

        [[nodiscard]] PlainValue snapshot() const;

        void set_label(std::string label) const;

        [[nodiscard]] std::string label() const;

        bool operator==(const Sequence &other) const { return _engine == other._engine && _id == other._id; }

    private:
        engine_ptr _engine{nullptr};
        ContainerId _id{};
    };

} // namespace rstate
