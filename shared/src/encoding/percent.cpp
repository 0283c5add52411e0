#include "chunkdrive/encoding/percent.hpp"

#include <cstdint>
#include <string_view>

namespace chunkdrive::encoding
{

    namespace
    {

        constexpr std::string_view kHexUpper = "0123456789ABCDEF";

        int hex_value(char ch) noexcept
        {
            if (ch >= '0' && ch <= '9')
            {
                return ch - '0';
            }
            if (ch >= 'a' && ch <= 'f')
            {
                return ch - 'a' + 10;
            }
            if (ch >= 'A' && ch <= 'F')
            {
                return ch - 'A' + 10;
            }
            return -1;
        }

        bool is_attr_char(unsigned char c) noexcept
        {
            if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'))
            {
                return true;
            }
            switch (c)
            {
            case '!':
            case '#':
            case '$':
            case '&':
            case '+':
            case '-':
            case '.':
            case '^':
            case '_':
            case '`':
            case '|':
            case '~':
                return true;
            default:
                return false;
            }
        }

    } // namespace

    std::optional<std::string> percent_decode(std::string_view input)
    {
        std::string output;
        output.reserve(input.size());
        for (std::size_t i = 0; i < input.size(); ++i)
        {
            const char ch = input[i];
            if (ch != '%')
            {
                output.push_back(ch);
                continue;
            }
            if (i + 2 >= input.size())
            {
                return std::nullopt;
            }
            const int high = hex_value(input[i + 1]);
            const int low = hex_value(input[i + 2]);
            if (high < 0 || low < 0)
            {
                return std::nullopt;
            }
            output.push_back(static_cast<char>((high << 4) | low));
            i += 2;
        }
        return output;
    }

    bool is_valid_utf8(std::string_view input) noexcept
    {
        std::size_t i = 0;
        while (i < input.size())
        {
            const auto lead = static_cast<unsigned char>(input[i]);
            std::size_t extra = 0;
            std::uint32_t code_point = 0;
            if (lead < 0x80)
            {
                ++i;
                continue;
            }
            if (lead >= 0xC2 && lead <= 0xDF)
            {
                extra = 1;
                code_point = lead & 0x1F;
            }
            else if (lead >= 0xE0 && lead <= 0xEF)
            {
                extra = 2;
                code_point = lead & 0x0F;
            }
            else if (lead >= 0xF0 && lead <= 0xF4)
            {
                extra = 3;
                code_point = lead & 0x07;
            }
            else
            {
                return false;
            }
            if (extra > input.size() - i - 1)
            {
                return false;
            }
            for (std::size_t k = 1; k <= extra; ++k)
            {
                const auto next = static_cast<unsigned char>(input[i + k]);
                if ((next & 0xC0) != 0x80)
                {
                    return false;
                }
                code_point = (code_point << 6) | (next & 0x3F);
            }
            if ((extra == 2 && (code_point < 0x800 || (code_point >= 0xD800 && code_point <= 0xDFFF))) ||
                (extra == 3 && (code_point < 0x10000 || code_point > 0x10FFFF)))
            {
                return false;
            }
            i += extra + 1;
        }
        return true;
    }

    std::string percent_encode_attr(std::string_view input)
    {
        std::string output;
        output.reserve(input.size() * 3);
        for (const char ch : input)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (is_attr_char(c))
            {
                output.push_back(ch);
                continue;
            }
            output.push_back('%');
            output.push_back(kHexUpper[(c >> 4) & 0x0F]);
            output.push_back(kHexUpper[c & 0x0F]);
        }
        return output;
    }

} // namespace chunkdrive::encoding
