#include <rstate/types/plain_value.h>
#include <rstate/types/value.h>

namespace rstate {

    namespace {
        template<typename T>
        const T &expect(const Value::storage_type &value, std::string_view expected, std::string_view actual) {
            if (auto v = std::get_if<T>(&value)) { return *v; }
            throw_error<BadValueType>(expected, actual);
        }
    } // namespace

    bool Value::as_bool() const { return expect<bool>(_value, "bool", type_name()); }

    int64_t Value::as_int() const { return expect<int64_t>(_value, "int", type_name()); }

    double Value::as_double() const {
        if (auto v = std::get_if<int64_t>(&_value)) { return static_cast<double>(*v); }
        return expect<double>(_value, "double", type_name());
    }

    const std::string &Value::as_string() const { return expect<std::string>(_value, "string", type_name()); }

    Record Value::as_record() const { return expect<Record>(_value, "record", type_name()); }

    Sequence Value::as_sequence() const { return expect<Sequence>(_value, "sequence", type_name()); }

    std::string_view Value::type_name() const {
        switch (_value.index()) {
            case 0: return "null";
            case 1: return "bool";
            case 2: return "int";
            case 3: return "double";
            case 4: return "string";
            case 5: return "record";
            default: return "sequence";
        }
    }

    std::optional<ContainerId> Value::container_id() const {
        if (auto record = std::get_if<Record>(&_value)) { return record->id(); }
        if (auto sequence = std::get_if<Sequence>(&_value)) { return sequence->id(); }
        return std::nullopt;
    }

    std::string Value::to_string() const {
        return std::visit([]<typename T>(const T &v) -> std::string {
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("\"{}\"", v);
            } else if constexpr (std::is_same_v<T, Record>) {
                return fmt::format("record#{}", v.id().index);
            } else {
                return fmt::format("sequence#{}", v.id().index);
            }
        }, _value);
    }

    Value Value::from_scalar(const PlainValue &value) {
        return std::visit([&value]<typename T>(const T &v) -> Value {
            if constexpr (std::is_same_v<T, std::monostate>) {
                return Value{};
            } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                                 std::is_same_v<T, double> || std::is_same_v<T, std::string>) {
                return Value{v};
            } else {
                throw_error<BadValueType>("scalar", value.type_name());
            }
        }, value.storage());
    }

} // namespace rstate
