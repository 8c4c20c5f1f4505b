#include <rstate/types/plain_value.h>

#include <stdexcept>

namespace rstate {

    namespace {
        template<typename T>
        const T &expect(const PlainValue::storage_type &value, std::string_view expected, std::string_view actual) {
            if (auto v = std::get_if<T>(&value)) { return *v; }
            throw_error<BadValueType>(expected, actual);
        }

        void append_quoted(std::string &out, const std::string &s) {
            out += '"';
            for (char c: s) {
                switch (c) {
                    case '"': out += "\\\"";
                        break;
                    case '\\': out += "\\\\";
                        break;
                    case '\n': out += "\\n";
                        break;
                    default: out += c;
                }
            }
            out += '"';
        }

        void render(const PlainValue &value, std::string &out) {
            std::visit([&out]<typename T>(const T &v) {
                if constexpr (std::is_same_v<T, std::monostate>) {
                    out += "null";
                } else if constexpr (std::is_same_v<T, bool>) {
                    out += v ? "true" : "false";
                } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
                    out += fmt::format("{}", v);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    append_quoted(out, v);
                } else if constexpr (std::is_same_v<T, PlainValue::list_type>) {
                    out += '[';
                    for (size_t i = 0; i < v.size(); ++i) {
                        if (i > 0) { out += ", "; }
                        render(v[i], out);
                    }
                    out += ']';
                } else {
                    out += '{';
                    for (size_t i = 0; i < v.size(); ++i) {
                        if (i > 0) { out += ", "; }
                        append_quoted(out, v[i].first);
                        out += ": ";
                        render(v[i].second, out);
                    }
                    out += '}';
                }
            }, value.storage());
        }
    } // namespace

    PlainValue PlainValue::list(list_type items) {
        PlainValue result;
        result._value = std::move(items);
        return result;
    }

    PlainValue PlainValue::record(record_type fields) {
        PlainValue result;
        result._value = std::move(fields);
        return result;
    }

    bool PlainValue::as_bool() const { return expect<bool>(_value, "bool", type_name()); }

    int64_t PlainValue::as_int() const { return expect<int64_t>(_value, "int", type_name()); }

    double PlainValue::as_double() const {
        if (auto v = std::get_if<int64_t>(&_value)) { return static_cast<double>(*v); }
        return expect<double>(_value, "double", type_name());
    }

    const std::string &PlainValue::as_string() const { return expect<std::string>(_value, "string", type_name()); }

    const PlainValue::list_type &PlainValue::as_list() const { return expect<list_type>(_value, "list", type_name()); }

    const PlainValue::record_type &PlainValue::as_record() const {
        return expect<record_type>(_value, "record", type_name());
    }

    const PlainValue *PlainValue::find(std::string_view name) const {
        auto fields = std::get_if<record_type>(&_value);
        if (fields == nullptr) { return nullptr; }
        for (const auto &[key, value]: *fields) {
            if (key == name) { return &value; }
        }
        return nullptr;
    }

    const PlainValue &PlainValue::operator[](std::string_view name) const {
        auto value = find(name);
        if (value == nullptr) { throw_error<std::out_of_range>("No field named '{}' in {}", name, to_string()); }
        return *value;
    }

    const PlainValue &PlainValue::operator[](size_t index) const {
        const auto &items = as_list();
        if (index >= items.size()) {
            throw_error<std::out_of_range>("Index {} out of range for list of size {}", index, items.size());
        }
        return items[index];
    }

    size_t PlainValue::size() const {
        if (auto v = std::get_if<list_type>(&_value)) { return v->size(); }
        if (auto v = std::get_if<record_type>(&_value)) { return v->size(); }
        return 0;
    }

    std::string_view PlainValue::type_name() const {
        switch (_value.index()) {
            case 0: return "null";
            case 1: return "bool";
            case 2: return "int";
            case 3: return "double";
            case 4: return "string";
            case 5: return "list";
            default: return "record";
        }
    }

    bool PlainValue::operator==(const PlainValue &other) const { return _value == other._value; }

    std::string PlainValue::to_string() const {
        std::string out;
        render(*this, out);
        return out;
    }

} // namespace rstate
