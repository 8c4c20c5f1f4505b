#pragma once

#include <rstate/rstate_base.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rstate {

    /**
     * @brief Detached, non-reactive data.
     *
     * PlainValue is what a consumer hands to the engine to create a reactive container, and what it gets back
     * from a snapshot. Nothing about it is tracked: it is an ordinary value type that can be copied, compared and
     * serialised freely.
     *
     * Records keep their fields in insertion order, so a snapshot of a wrapped record reproduces the field order
     * it was created with.
     */
    class RSTATE_EXPORT PlainValue {
    public:
        using list_type = std::vector<PlainValue>;
        using record_type = std::vector<std::pair<std::string, PlainValue>>;
        using storage_type = std::variant<std::monostate, bool, int64_t, double, std::string, list_type, record_type>;

        PlainValue() = default;

        PlainValue(std::nullptr_t) {}

        PlainValue(bool value) : _value{value} {}

        PlainValue(int value) : _value{static_cast<int64_t>(value)} {}

        PlainValue(int64_t value) : _value{value} {}

        PlainValue(double value) : _value{value} {}

        PlainValue(const char *value) : _value{std::string{value}} {}

        PlainValue(std::string value) : _value{std::move(value)} {}

        static PlainValue list(list_type items);

        static PlainValue record(record_type fields);

        [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(_value); }
        [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(_value); }
        [[nodiscard]] bool is_int() const { return std::holds_alternative<int64_t>(_value); }
        [[nodiscard]] bool is_double() const { return std::holds_alternative<double>(_value); }
        [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(_value); }
        [[nodiscard]] bool is_list() const { return std::holds_alternative<list_type>(_value); }
        [[nodiscard]] bool is_record() const { return std::holds_alternative<record_type>(_value); }

        [[nodiscard]] bool as_bool() const;

        [[nodiscard]] int64_t as_int() const;

        /**
         * Integers are widened, so numeric fields can be read as double regardless of how they were written.
         */
        [[nodiscard]] double as_double() const;

        [[nodiscard]] const std::string &as_string() const;

        [[nodiscard]] const list_type &as_list() const;

        [[nodiscard]] const record_type &as_record() const;

        /**
         * Lookup a record field by name, nullptr if absent or if this is not a record.
         */
        [[nodiscard]] const PlainValue *find(std::string_view name) const;

        [[nodiscard]] const PlainValue &operator[](std::string_view name) const;

        [[nodiscard]] const PlainValue &operator[](size_t index) const;

        [[nodiscard]] size_t size() const;

        [[nodiscard]] std::string_view type_name() const;

        [[nodiscard]] const storage_type &storage() const { return _value; }

        bool operator==(const PlainValue &other) const;

        /**
         * A JSON-like rendering, used for diagnostics and test output.
         */
        [[nodiscard]] std::string to_string() const;

    private:
        storage_type _value{};
    };

} // namespace rstate

template<>
struct fmt::formatter<rstate::PlainValue> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const rstate::PlainValue &value, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(value.to_string(), ctx);
    }
};
