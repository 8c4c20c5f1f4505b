#pragma once

#include <rstate/types/value.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rstate {

    enum class ContainerKind : uint8_t { RECORD = 0, SEQUENCE = 1 };

    /**
     * @brief The storage behind a Record or Sequence handle.
     *
     * This is plain storage, it knows nothing about tracking. The engine wraps every access in the dependency
     * bookkeeping and only then touches the state here.
     *
     * Record fields keep insertion order. Computed fields are derived values installed under a field name, they
     * shadow any stored value of the same name.
     */
    struct RSTATE_EXPORT ContainerState {
        using field_type = std::pair<std::string, Value>;

        ContainerState(ContainerId id, ContainerKind kind, std::string label);

        [[nodiscard]] ContainerId id() const { return _id; }

        [[nodiscard]] ContainerKind kind() const { return _kind; }

        [[nodiscard]] bool is_record() const { return _kind == ContainerKind::RECORD; }

        [[nodiscard]] bool is_sequence() const { return _kind == ContainerKind::SEQUENCE; }

        [[nodiscard]] const std::string &label() const { return _label; }

        void set_label(std::string label) { _label = std::move(label); }

        /**
         * The label, or record#N / sequence#N when unlabelled.
         */
        [[nodiscard]] std::string display_name() const;

        // Record storage

        [[nodiscard]] const Value *find_field(std::string_view name) const;

        /**
         * Store the value, returns the previous value (nullopt if the field was created).
         */
        std::optional<Value> put_field(std::string_view name, Value value);

        /**
         * Remove the field, returns the removed value (nullopt if there was no such field).
         */
        std::optional<Value> remove_field(std::string_view name);

        [[nodiscard]] const std::vector<field_type> &fields() const { return _fields; }

        [[nodiscard]] derived_s_ptr find_computed(std::string_view name) const;

        void put_computed(std::string name, derived_s_ptr derived);

        [[nodiscard]] const std::vector<std::pair<std::string, derived_s_ptr>> &computed_fields() const {
            return _computed;
        }

        // Sequence storage

        [[nodiscard]] std::vector<Value> &elements() { return _elements; }

        [[nodiscard]] const std::vector<Value> &elements() const { return _elements; }

        // Nested containers created from plain data on behalf of this container, released with it

        void adopt(ContainerId child) { _children.push_back(child); }

        [[nodiscard]] const std::vector<ContainerId> &children() const { return _children; }

        /**
         * Stop owning the child, returns false if it was not adopted by this container.
         */
        bool disown(ContainerId child);

        /**
         * True if a stored field or element still holds a handle to the container.
         */
        [[nodiscard]] bool references(ContainerId child) const;

    private:
        void reindex_from(size_t position);

        ContainerId _id;
        ContainerKind _kind;
        std::string _label;
        std::vector<field_type> _fields{};
        ankerl::unordered_dense::map<std::string, size_t> _field_index{};
        std::vector<std::pair<std::string, derived_s_ptr>> _computed{};
        std::vector<Value> _elements{};
        std::vector<ContainerId> _children{};
    };

} // namespace rstate
