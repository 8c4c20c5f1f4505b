#pragma once

#include <rstate/rstate_base.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace rstate {

    /**
     * What a field entry belongs to. Containers own named fields; a derived value is itself a source with a
     * single field, its value.
     */
    enum class SourceKind : uint8_t { CONTAINER = 0, DERIVED = 1 };

    /**
     * @brief Identity of a field entry in the dependency graph: (source identity, field key).
     */
    struct RSTATE_EXPORT FieldKey {
        SourceKind kind{SourceKind::CONTAINER};
        uint32_t index{0};
        uint32_t generation{0};
        std::string field{};

        static FieldKey container(ContainerId id, std::string_view field) {
            return FieldKey{SourceKind::CONTAINER, id.index, id.generation, std::string{field}};
        }

        static FieldKey derived(ComputationId id) {
            return FieldKey{SourceKind::DERIVED, id.index, id.generation, std::string{}};
        }

        [[nodiscard]] bool belongs_to(ContainerId id) const {
            return kind == SourceKind::CONTAINER && index == id.index && generation == id.generation;
        }

        [[nodiscard]] bool belongs_to(ComputationId id) const {
            return kind == SourceKind::DERIVED && index == id.index && generation == id.generation;
        }

        bool operator==(const FieldKey &) const = default;
    };

    struct FieldKeyHash {
        using is_avalanching = void;

        [[nodiscard]] auto operator()(const FieldKey &key) const noexcept -> uint64_t {
            auto source = (static_cast<uint64_t>(key.generation) << 33) | (static_cast<uint64_t>(key.index) << 1) |
                          static_cast<uint64_t>(key.kind);
            auto h1 = ankerl::unordered_dense::hash<uint64_t>{}(source);
            auto h2 = ankerl::unordered_dense::hash<std::string>{}(key.field);
            return ankerl::unordered_dense::hash<uint64_t>{}(h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2)));
        }
    };

} // namespace rstate

template<>
struct fmt::formatter<rstate::FieldKey> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const rstate::FieldKey &key, FormatContext &ctx) const {
        auto s = key.kind == rstate::SourceKind::DERIVED
                     ? fmt::format("derived#{}", key.index)
                     : fmt::format("container#{}.{}", key.index, key.field);
        return fmt::formatter<std::string_view>::format(s, ctx);
    }
};
