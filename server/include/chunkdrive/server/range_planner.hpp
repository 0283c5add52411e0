#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace chunkdrive::server
{

    // Inclusive byte interval [start, end].
    struct RangeWindow
    {
        std::uint64_t start{};
        std::uint64_t end{};

        std::uint64_t length() const noexcept { return end - start + 1; }

        bool operator==(const RangeWindow &) const = default;
    };

    struct FullFile
    {
        bool operator==(const FullFile &) const = default;
    };

    enum class RangeRejection
    {
        BadSyntax,
        Unsatisfiable,
        Unsupported,
    };

    using RangePlan = std::variant<FullFile, RangeWindow, RangeRejection>;

    // Resolves a `Range` header value against an artifact of `length` bytes.
    // Only the `bytes` unit and a single sub-range are accepted; no I/O.
    RangePlan plan_range(std::optional<std::string_view> header, std::uint64_t length);

} // namespace chunkdrive::server
