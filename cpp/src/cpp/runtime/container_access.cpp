#include <rstate/runtime/reactive_engine.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace rstate {

    namespace {
        FieldKey index_key(ContainerId id, size_t index) { return FieldKey::container(id, std::to_string(index)); }

        FieldKey shape_key(ContainerId id) { return FieldKey::container(id, SHAPE_FIELD); }

        // The shape change of a sequence, plus every index from first to (exclusive) last
        std::vector<FieldKey> structural_keys(ContainerId id, size_t first, size_t last) {
            std::vector<FieldKey> keys;
            keys.reserve(last - first + 1);
            for (size_t i = first; i < last; ++i) { keys.push_back(index_key(id, i)); }
            keys.push_back(shape_key(id));
            return keys;
        }
    } // namespace

    const ContainerState &ReactiveEngine::container(ContainerId id) const { return live_container(id); }

    ContainerState &ReactiveEngine::live_container(ContainerId id) const {
        auto state = _containers.get(id);
        if (state == nullptr) {
            throw_error<ReleasedContainerError>("Container #{} has been released", id.index);
        }
        return *state;
    }

    ContainerState &ReactiveEngine::live_record(ContainerId id) const {
        auto &state = live_container(id);
        if (!state.is_record()) { throw_error<BadValueType>("record", "sequence"); }
        return state;
    }

    ContainerState &ReactiveEngine::live_sequence(ContainerId id) const {
        auto &state = live_container(id);
        if (!state.is_sequence()) { throw_error<BadValueType>("sequence", "record"); }
        return state;
    }

    ContainerId ReactiveEngine::create_container(ContainerKind kind, std::string label) {
        auto id = _containers.insert([&](ContainerId id) {
            return std::make_shared<ContainerState>(id, kind, std::move(label));
        });
        const auto &state = *_containers.get(id);
        for (auto observer: _observers) { observer->on_container_created(state); }
        return id;
    }

    Value ReactiveEngine::convert_plain(ContainerId owner, const PlainValue &value) {
        if (value.is_record()) {
            auto id = create_container(ContainerKind::RECORD, {});
            live_container(owner).adopt(id);
            populate(id, value);
            return Value{Record{this, id}};
        }
        if (value.is_list()) {
            auto id = create_container(ContainerKind::SEQUENCE, {});
            live_container(owner).adopt(id);
            populate(id, value);
            return Value{Sequence{this, id}};
        }
        return Value::from_scalar(value);
    }

    void ReactiveEngine::populate(ContainerId id, const PlainValue &value) {
        if (value.is_record()) {
            for (const auto &[name, field]: value.as_record()) {
                auto converted = convert_plain(id, field);
                live_container(id).put_field(name, std::move(converted));
            }
        } else {
            for (const auto &item: value.as_list()) {
                auto converted = convert_plain(id, item);
                live_container(id).elements().push_back(std::move(converted));
            }
        }
    }

    void ReactiveEngine::release(const Record &record) {
        live_record(record.id());
        release_container(record.id());
    }

    void ReactiveEngine::release(const Sequence &sequence) {
        live_sequence(sequence.id());
        release_container(sequence.id());
    }

    void ReactiveEngine::release_container(ContainerId id) {
        auto state = _containers.find(id);
        if (!state) { return; }
        for (const auto &[_, derived]: state->computed_fields()) { dispose(derived->id()); }
        for (auto child: state->children()) { release_container(child); }
        _graph.release(id);
        _containers.erase(id);
        for (auto observer: _observers) { observer->on_container_released(*state); }
    }

    void ReactiveEngine::release_dropped(ContainerId owner, const std::vector<Value> &dropped) {
        for (const auto &value: dropped) {
            auto child = value.container_id();
            if (!child) { continue; }
            auto &state = live_container(owner);
            if (state.references(*child) || !state.disown(*child)) { continue; }
            release_container(*child);
        }
    }

    void ReactiveEngine::check_writable(const ContainerState &state, std::string_view field) const {
        if (field == SHAPE_FIELD) { throw_error<std::invalid_argument>("'{}' is a reserved field name", field); }
        if (state.find_computed(field)) {
            throw_error<ReadOnlyFieldError>("Field '{}' of {} is computed and cannot be written", field,
                                            state.display_name());
        }
    }

    // Records

    Value ReactiveEngine::read_field(ContainerId id, std::string_view field) {
        auto &state = live_record(id);
        if (auto derived = state.find_computed(field)) { return read_derived(derived); }
        track(FieldKey::container(id, field));
        if (auto value = state.find_field(field)) { return *value; }
        return Value{};
    }

    void ReactiveEngine::write_field(ContainerId id, std::string_view field, Value value) {
        auto &state = live_record(id);
        check_writable(state, field);
        auto existing = state.find_field(field);
        if (existing != nullptr && *existing == value) { return; }
        auto new_value = value;
        auto previous = state.put_field(field, std::move(value));
        notify_field_write(state, field, previous.value_or(Value{}), new_value);
        if (previous) {
            release_dropped(id, {*previous});
            trigger_all({FieldKey::container(id, field)});
        } else {
            trigger_all({FieldKey::container(id, field), shape_key(id)});
        }
    }

    void ReactiveEngine::write_plain_field(ContainerId id, std::string_view field, const PlainValue &value) {
        check_writable(live_record(id), field);
        write_field(id, field, convert_plain(id, value));
    }

    bool ReactiveEngine::has_field(ContainerId id, std::string_view field) {
        auto &state = live_record(id);
        if (state.find_computed(field)) { return true; }
        track(FieldKey::container(id, field));
        return state.find_field(field) != nullptr;
    }

    bool ReactiveEngine::remove_field(ContainerId id, std::string_view field) {
        auto &state = live_record(id);
        if (state.find_computed(field)) {
            throw_error<ReadOnlyFieldError>("Field '{}' of {} is computed and cannot be removed", field,
                                            state.display_name());
        }
        auto removed = state.remove_field(field);
        if (!removed) { return false; }
        notify_field_write(state, field, *removed, Value{});
        release_dropped(id, {*removed});
        trigger_all({FieldKey::container(id, field), shape_key(id)});
        return true;
    }

    std::vector<std::string> ReactiveEngine::field_names(ContainerId id) {
        auto &state = live_record(id);
        track(shape_key(id));
        std::vector<std::string> names;
        names.reserve(state.fields().size() + state.computed_fields().size());
        for (const auto &[name, _]: state.fields()) { names.push_back(name); }
        for (const auto &[name, _]: state.computed_fields()) {
            if (state.find_field(name) == nullptr) { names.push_back(name); }
        }
        return names;
    }

    size_t ReactiveEngine::field_count(ContainerId id) { return field_names(id).size(); }

    void ReactiveEngine::notify_field(ContainerId id, std::string_view field) {
        auto &state = live_record(id);
        if (auto derived = state.find_computed(field)) {
            trigger_all({derived->source_key()});
            return;
        }
        trigger_all({FieldKey::container(id, field)});
    }

    void ReactiveEngine::notify_all_fields(ContainerId id) {
        auto &state = live_record(id);
        std::vector<FieldKey> keys;
        for (const auto &[name, _]: state.fields()) { keys.push_back(FieldKey::container(id, name)); }
        for (const auto &[_, derived]: state.computed_fields()) { keys.push_back(derived->source_key()); }
        keys.push_back(shape_key(id));
        trigger_all(keys);
    }

    Derived ReactiveEngine::add_computed_field(ContainerId id, std::string field, reader_fn fn) {
        auto &state = live_record(id);
        if (field == SHAPE_FIELD) { throw_error<std::invalid_argument>("'{}' is a reserved field name", field); }
        if (state.find_computed(field)) {
            throw_error<ReadOnlyFieldError>("Field '{}' of {} is already computed", field, state.display_name());
        }
        auto derived = derive(std::move(fn), fmt::format("{}.{}", state.display_name(), field));
        state.put_computed(field, derived.computation());
        // Readers of the stored field (if any) now see the computed value instead
        trigger_all({FieldKey::container(id, field), shape_key(id)});
        return derived;
    }

    void ReactiveEngine::set_container_label(ContainerId id, std::string label) {
        live_container(id).set_label(std::move(label));
    }

    std::string ReactiveEngine::container_label(ContainerId id) const { return live_container(id).label(); }

    // Sequences

    size_t ReactiveEngine::sequence_size(ContainerId id) {
        auto &state = live_sequence(id);
        track(shape_key(id));
        return state.elements().size();
    }

    Value ReactiveEngine::sequence_at(ContainerId id, size_t index) {
        auto &state = live_sequence(id);
        // Tracked also when out of range, so the reader re-runs once the position appears
        track(index_key(id, index));
        const auto &elements = state.elements();
        if (index >= elements.size()) {
            throw_error<std::out_of_range>("Index {} out of range for {} of size {}", index, state.display_name(),
                                           elements.size());
        }
        return elements[index];
    }

    std::vector<Value> ReactiveEngine::sequence_values(ContainerId id) {
        auto &state = live_sequence(id);
        track(shape_key(id));
        for (size_t i = 0; i < state.elements().size(); ++i) { track(index_key(id, i)); }
        return state.elements();
    }

    void ReactiveEngine::sequence_set(ContainerId id, size_t index, Value value) {
        auto &state = live_sequence(id);
        auto &elements = state.elements();
        if (index >= elements.size()) {
            throw_error<std::out_of_range>("Index {} out of range for {} of size {}", index, state.display_name(),
                                           elements.size());
        }
        if (elements[index] == value) { return; }
        auto old_value = std::exchange(elements[index], value);
        notify_field_write(state, std::to_string(index), old_value, value);
        release_dropped(id, {old_value});
        trigger_all({index_key(id, index)});
    }

    void ReactiveEngine::sequence_insert(ContainerId id, size_t index, Value value) {
        auto &state = live_sequence(id);
        auto &elements = state.elements();
        if (index > elements.size()) {
            throw_error<std::out_of_range>("Insert position {} out of range for {} of size {}", index,
                                           state.display_name(), elements.size());
        }
        auto old_size = elements.size();
        elements.insert(elements.begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
        notify_field_write(state, SHAPE_FIELD, Value{static_cast<int64_t>(old_size)},
                           Value{static_cast<int64_t>(elements.size())});
        trigger_all(structural_keys(id, index, elements.size()));
    }

    void ReactiveEngine::sequence_insert_plain(ContainerId id, size_t index, const PlainValue &value) {
        auto &state = live_sequence(id);
        if (index > state.elements().size()) {
            throw_error<std::out_of_range>("Insert position {} out of range for {} of size {}", index,
                                           state.display_name(), state.elements().size());
        }
        sequence_insert(id, index, convert_plain(id, value));
    }

    Value ReactiveEngine::sequence_erase(ContainerId id, size_t index) {
        auto &state = live_sequence(id);
        auto &elements = state.elements();
        if (index >= elements.size()) {
            throw_error<std::out_of_range>("Index {} out of range for {} of size {}", index, state.display_name(),
                                           elements.size());
        }
        auto old_size = elements.size();
        auto removed = std::move(elements[index]);
        elements.erase(elements.begin() + static_cast<std::ptrdiff_t>(index));
        notify_field_write(state, SHAPE_FIELD, Value{static_cast<int64_t>(old_size)},
                           Value{static_cast<int64_t>(elements.size())});
        release_dropped(id, {removed});
        trigger_all(structural_keys(id, index, old_size));
        return removed;
    }

    void ReactiveEngine::sequence_clear(ContainerId id) {
        auto &state = live_sequence(id);
        auto &elements = state.elements();
        if (elements.empty()) { return; }
        auto old_size = elements.size();
        auto removed = std::exchange(elements, {});
        notify_field_write(state, SHAPE_FIELD, Value{static_cast<int64_t>(old_size)}, Value{int64_t{0}});
        release_dropped(id, removed);
        trigger_all(structural_keys(id, 0, old_size));
    }

    // Snapshots

    PlainValue ReactiveEngine::snapshot(const Record &record) const {
        live_record(record.id());
        std::vector<ContainerId> visiting;
        return snapshot_container(record.id(), visiting);
    }

    PlainValue ReactiveEngine::snapshot(const Sequence &sequence) const {
        live_sequence(sequence.id());
        std::vector<ContainerId> visiting;
        return snapshot_container(sequence.id(), visiting);
    }

    PlainValue ReactiveEngine::snapshot_container(ContainerId id, std::vector<ContainerId> &visiting) const {
        const auto &state = live_container(id);
        if (std::find(visiting.begin(), visiting.end(), id) != visiting.end()) {
            throw_error<ReactiveError>("Cannot snapshot {}, it contains itself", state.display_name());
        }
        visiting.push_back(id);
        PlainValue result;
        if (state.is_record()) {
            PlainValue::record_type fields;
            fields.reserve(state.fields().size());
            for (const auto &[name, value]: state.fields()) {
                fields.emplace_back(name, snapshot_value(value, visiting));
            }
            result = PlainValue::record(std::move(fields));
        } else {
            PlainValue::list_type items;
            items.reserve(state.elements().size());
            for (const auto &value: state.elements()) { items.push_back(snapshot_value(value, visiting)); }
            result = PlainValue::list(std::move(items));
        }
        visiting.pop_back();
        return result;
    }

    PlainValue ReactiveEngine::snapshot_value(const Value &value, std::vector<ContainerId> &visiting) const {
        return std::visit(
            [&]<typename T>(const T &v) -> PlainValue {
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return PlainValue{};
                } else if constexpr (std::is_same_v<T, Record> || std::is_same_v<T, Sequence>) {
                    if (v.engine() != this) {
                        throw_error<ReactiveError>("Cannot snapshot a container of another engine");
                    }
                    return snapshot_container(v.id(), visiting);
                } else {
                    return PlainValue{v};
                }
            },
            value.storage());
    }

} // namespace rstate
