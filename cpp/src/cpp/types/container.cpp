#include <rstate/types/container.h>

#include <algorithm>

namespace rstate {

    ContainerState::ContainerState(ContainerId id, ContainerKind kind, std::string label)
        : _id{id}, _kind{kind}, _label{std::move(label)} {}

    std::string ContainerState::display_name() const {
        if (!_label.empty()) { return _label; }
        return fmt::format("{}#{}", is_record() ? "record" : "sequence", _id.index);
    }

    const Value *ContainerState::find_field(std::string_view name) const {
        auto it = _field_index.find(std::string{name});
        if (it == _field_index.end()) { return nullptr; }
        return &_fields[it->second].second;
    }

    std::optional<Value> ContainerState::put_field(std::string_view name, Value value) {
        std::string key{name};
        if (auto it = _field_index.find(key); it != _field_index.end()) {
            auto &slot = _fields[it->second].second;
            auto previous = std::move(slot);
            slot = std::move(value);
            return previous;
        }
        _field_index.emplace(key, _fields.size());
        _fields.emplace_back(std::move(key), std::move(value));
        return std::nullopt;
    }

    std::optional<Value> ContainerState::remove_field(std::string_view name) {
        auto it = _field_index.find(std::string{name});
        if (it == _field_index.end()) { return std::nullopt; }
        auto position = it->second;
        _field_index.erase(it);
        auto removed = std::move(_fields[position].second);
        _fields.erase(_fields.begin() + static_cast<std::ptrdiff_t>(position));
        reindex_from(position);
        return removed;
    }

    derived_s_ptr ContainerState::find_computed(std::string_view name) const {
        for (const auto &[key, derived]: _computed) {
            if (key == name) { return derived; }
        }
        return nullptr;
    }

    void ContainerState::put_computed(std::string name, derived_s_ptr derived) {
        for (auto &[key, existing]: _computed) {
            if (key == name) {
                existing = std::move(derived);
                return;
            }
        }
        _computed.emplace_back(std::move(name), std::move(derived));
    }

    bool ContainerState::disown(ContainerId child) {
        auto it = std::find(_children.begin(), _children.end(), child);
        if (it == _children.end()) { return false; }
        _children.erase(it);
        return true;
    }

    bool ContainerState::references(ContainerId child) const {
        auto holds = [child](const Value &value) { return value.container_id() == child; };
        return std::any_of(_fields.begin(), _fields.end(), [&](const auto &field) { return holds(field.second); }) ||
               std::any_of(_elements.begin(), _elements.end(), holds);
    }

    void ContainerState::reindex_from(size_t position) {
        for (size_t i = position; i < _fields.size(); ++i) { _field_index[_fields[i].first] = i; }
    }

} // namespace rstate
