#include <rstate/runtime/observers/change_history.h>
#include <rstate/types/container.h>

namespace rstate {

    ChangeHistory::ChangeHistory(size_t max_entries) : _max_entries{max_entries} {}

    void ChangeHistory::on_field_write(const ContainerState &container, std::string_view field,
                                       const Value &old_value, const Value &new_value) {
        ++_sequence;
        if (_max_entries == 0) { return; }
        _history.push_back(ChangeRecord{_sequence, container.display_name(), std::string{field}, old_value.to_string(),
                                        new_value.to_string()});
        while (_history.size() > _max_entries) { _history.pop_front(); }
    }

} // namespace rstate
