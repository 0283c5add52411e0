#include "chunkdrive/server/range_planner.hpp"

#include <charconv>
#include <system_error>

namespace chunkdrive::server
{

    namespace
    {

        constexpr std::string_view kUnitPrefix = "bytes=";

        std::string_view trim(std::string_view text)
        {
            while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
            {
                text.remove_prefix(1);
            }
            while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
            {
                text.remove_suffix(1);
            }
            return text;
        }

        enum class NumberStatus
        {
            Ok,
            Invalid,
            Overflow,
        };

        NumberStatus parse_position(std::string_view text, std::uint64_t &value)
        {
            if (text.empty())
            {
                return NumberStatus::Invalid;
            }
            for (const char ch : text)
            {
                if (ch < '0' || ch > '9')
                {
                    return NumberStatus::Invalid;
                }
            }
            const auto *first = text.data();
            const auto *last = first + text.size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec == std::errc::result_out_of_range)
            {
                return NumberStatus::Overflow;
            }
            if (ec != std::errc{} || ptr != last)
            {
                return NumberStatus::Invalid;
            }
            return NumberStatus::Ok;
        }

    } // namespace

    RangePlan plan_range(std::optional<std::string_view> header, std::uint64_t length)
    {
        if (!header)
        {
            return FullFile{};
        }
        auto value = trim(*header);
        if (value.empty())
        {
            return FullFile{};
        }
        if (value.substr(0, kUnitPrefix.size()) != kUnitPrefix)
        {
            return RangeRejection::BadSyntax;
        }
        value = trim(value.substr(kUnitPrefix.size()));
        if (value.find(',') != std::string_view::npos)
        {
            return RangeRejection::Unsupported;
        }

        const auto dash = value.find('-');
        if (dash == std::string_view::npos)
        {
            return RangeRejection::BadSyntax;
        }
        const auto first_text = trim(value.substr(0, dash));
        const auto last_text = trim(value.substr(dash + 1));

        if (first_text.empty())
        {
            // Suffix form: the last N bytes.
            std::uint64_t suffix = 0;
            switch (parse_position(last_text, suffix))
            {
            case NumberStatus::Invalid:
                return RangeRejection::BadSyntax;
            case NumberStatus::Overflow:
                return RangeRejection::Unsatisfiable;
            case NumberStatus::Ok:
                break;
            }
            if (suffix == 0 || suffix > length)
            {
                return RangeRejection::Unsatisfiable;
            }
            return RangeWindow{.start = length - suffix, .end = length - 1};
        }

        std::uint64_t start = 0;
        switch (parse_position(first_text, start))
        {
        case NumberStatus::Invalid:
            return RangeRejection::BadSyntax;
        case NumberStatus::Overflow:
            return RangeRejection::Unsatisfiable;
        case NumberStatus::Ok:
            break;
        }

        if (last_text.empty())
        {
            if (start >= length)
            {
                return RangeRejection::Unsatisfiable;
            }
            return RangeWindow{.start = start, .end = length - 1};
        }

        std::uint64_t end = 0;
        switch (parse_position(last_text, end))
        {
        case NumberStatus::Invalid:
            return RangeRejection::BadSyntax;
        case NumberStatus::Overflow:
            return RangeRejection::Unsatisfiable;
        case NumberStatus::Ok:
            break;
        }
        if (length == 0 || start > end || end > length - 1)
        {
            return RangeRejection::Unsatisfiable;
        }
        return RangeWindow{.start = start, .end = end};
    }

} // namespace chunkdrive::server
