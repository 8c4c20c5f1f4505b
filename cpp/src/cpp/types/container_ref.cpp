#include <rstate/runtime/reactive_engine.h>
#include <rstate/types/container_ref.h>

namespace rstate {

    namespace {
        ReactiveEngine &engine_of(engine_ptr engine) {
            if (engine == nullptr) { throw_error<ReleasedContainerError>("Handle does not refer to a container"); }
            return *engine;
        }
    } // namespace

    // Record

    bool Record::is_alive() const { return _engine != nullptr && _engine->is_alive(_id); }

    Value Record::get(std::string_view field) const { return engine_of(_engine).read_field(_id, field); }

    void Record::set(std::string_view field, Value value) const {
        engine_of(_engine).write_field(_id, field, std::move(value));
    }

    void Record::set_plain(std::string_view field, const PlainValue &value) const {
        engine_of(_engine).write_plain_field(_id, field, value);
    }

    bool Record::has(std::string_view field) const { return engine_of(_engine).has_field(_id, field); }

    bool Record::remove(std::string_view field) const { return engine_of(_engine).remove_field(_id, field); }

    std::vector<std::string> Record::keys() const { return engine_of(_engine).field_names(_id); }

    size_t Record::size() const { return engine_of(_engine).field_count(_id); }

    void Record::update(const std::vector<std::pair<std::string, Value>> &values) const {
        auto &engine = engine_of(_engine);
        engine.run_batched([&] {
            for (const auto &[field, value]: values) { engine.write_field(_id, field, value); }
        });
    }

    void Record::notify(std::string_view field) const { engine_of(_engine).notify_field(_id, field); }

    void Record::notify_all() const { engine_of(_engine).notify_all_fields(_id); }

    Derived Record::computed(std::string field, reader_fn fn) const {
        return engine_of(_engine).add_computed_field(_id, std::move(field), std::move(fn));
    }

    PlainValue Record::snapshot() const { return engine_of(_engine).snapshot(*this); }

    void Record::set_label(std::string label) const { engine_of(_engine).set_container_label(_id, std::move(label)); }

    std::string Record::label() const { return engine_of(_engine).container_label(_id); }

    // Sequence

    bool Sequence::is_alive() const { return _engine != nullptr && _engine->is_alive(_id); }

    size_t Sequence::size() const { return engine_of(_engine).sequence_size(_id); }

    Value Sequence::at(size_t index) const { return engine_of(_engine).sequence_at(_id, index); }

    std::vector<Value> Sequence::values() const { return engine_of(_engine).sequence_values(_id); }

    void Sequence::set(size_t index, Value value) const {
        engine_of(_engine).sequence_set(_id, index, std::move(value));
    }

    void Sequence::push_back(Value value) const {
        auto &engine = engine_of(_engine);
        engine.sequence_insert(_id, engine.container(_id).elements().size(), std::move(value));
    }

    void Sequence::push_back_plain(const PlainValue &value) const {
        auto &engine = engine_of(_engine);
        engine.sequence_insert_plain(_id, engine.container(_id).elements().size(), value);
    }

    Value Sequence::pop_back() const {
        auto &engine = engine_of(_engine);
        const auto &elements = engine.container(_id).elements();
        if (elements.empty()) { throw_error<std::out_of_range>("pop_back on an empty sequence"); }
        return engine.sequence_erase(_id, elements.size() - 1);
    }

    void Sequence::insert(size_t index, Value value) const {
        engine_of(_engine).sequence_insert(_id, index, std::move(value));
    }

    Value Sequence::erase(size_t index) const { return engine_of(_engine).sequence_erase(_id, index); }

    void Sequence::clear() const { engine_of(_engine).sequence_clear(_id); }

    PlainValue Sequence::snapshot() const { return engine_of(_engine).snapshot(*this); }

    void Sequence::set_label(std::string label) const {
        engine_of(_engine).set_container_label(_id, std::move(label));
    }

    std::string Sequence::label() const { return engine_of(_engine).container_label(_id); }

} // namespace rstate
