#pragma once

#include <rstate/types/container_ref.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace rstate {

    /**
     * @brief The value of a field in a reactive container.
     *
     * Scalars are held by value. Nested records and sequences are held as handles, so reading a nested container
     * and mutating it through the handle stays tracked.
     *
     * Equality is what decides whether a write is a change: scalars compare by value (a NaN never equals itself,
     * so writing NaN always notifies), handles compare by container identity.
     */
    class RSTATE_EXPORT Value {
    public:
        using storage_type = std::variant<std::monostate, bool, int64_t, double, std::string, Record, Sequence>;

        Value() = default;

        Value(std::nullptr_t) {}

        Value(bool value) : _value{value} {}

        Value(int value) : _value{static_cast<int64_t>(value)} {}

        Value(int64_t value) : _value{value} {}

        Value(double value) : _value{value} {}

        Value(const char *value) : _value{std::string{value}} {}

        Value(std::string value) : _value{std::move(value)} {}

        Value(Record value) : _value{value} {}

        Value(Sequence value) : _value{value} {}

        [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(_value); }
        [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(_value); }
        [[nodiscard]] bool is_int() const { return std::holds_alternative<int64_t>(_value); }
        [[nodiscard]] bool is_double() const { return std::holds_alternative<double>(_value); }
        [[nodiscard]] bool is_number() const { return is_int() || is_double(); }
        [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(_value); }
        [[nodiscard]] bool is_record() const { return std::holds_alternative<Record>(_value); }
        [[nodiscard]] bool is_sequence() const { return std::holds_alternative<Sequence>(_value); }

        [[nodiscard]] bool as_bool() const;

        [[nodiscard]] int64_t as_int() const;

        [[nodiscard]] double as_double() const;

        [[nodiscard]] const std::string &as_string() const;

        [[nodiscard]] Record as_record() const;

        [[nodiscard]] Sequence as_sequence() const;

        /**
         * The id of the held record or sequence, nullopt for scalars.
         */
        [[nodiscard]] std::optional<ContainerId> container_id() const;

        [[nodiscard]] std::string_view type_name() const;

        [[nodiscard]] const storage_type &storage() const { return _value; }

        bool operator==(const Value &other) const { return _value == other._value; }

        [[nodiscard]] std::string to_string() const;

        /**
         * Convert a scalar PlainValue, structured plain values need an engine to become containers and are
         * rejected with BadValueType.
         */
        static Value from_scalar(const PlainValue &value);

    private:
        storage_type _value{};
    };

} // namespace rstate

template<>
struct fmt::formatter<rstate::Value> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const rstate::Value &value, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(value.to_string(), ctx);
    }
};
