/**
 * @file TextIO.hpp
 * @brief Central utility functions for LHE text I/O.
 *
 * This file provides a single source of truth for the low-level text
 * conversions used by the decoder and the encoder: whitespace-separated
 * number scanning, exact round-trip number formatting and XML escaping.
 */

#pragma once

#include <array>
#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace lheutils
{
namespace utils
{
    inline constexpr std::string_view kWhitespace = " \t\n\r";

    inline std::string_view trim(std::string_view sv)
    {
        size_t begin = sv.find_first_not_of(kWhitespace);
        if (begin == std::string_view::npos) return {};
        size_t end = sv.find_last_not_of(kWhitespace);
        return sv.substr(begin, end - begin + 1);
    }

    /**
     * @brief Converts one complete token to a number.
     *
     * Accepts a leading '+' and Fortran 'D' exponents, both of which
     * appear in files written by Fortran generators.
     *
     * @return true if the whole token was a valid number.
     */
    template <typename T>
    bool parseNumber(std::string_view token, T& value)
    {
        if (token.size() > 1 && token[0] == '+' && token[1] != '-')
        {
            token.remove_prefix(1);
        }
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec == std::errc() && ptr == token.data() + token.size())
        {
            return true;
        }

        if constexpr (std::is_floating_point_v<T>)
        {
            // 1.0D+00 -> 1.0e+00
            std::array<char, 64> buf{};
            if (token.size() >= buf.size()) return false;
            bool replaced = false;
            for (size_t i = 0; i < token.size(); ++i)
            {
                char c = token[i];
                if (c == 'D' || c == 'd')
                {
                    c = 'e';
                    replaced = true;
                }
                buf[i] = c;
            }
            if (!replaced) return false;
            auto [p2, ec2] = std::from_chars(buf.data(), buf.data() + token.size(), value);
            return ec2 == std::errc() && p2 == buf.data() + token.size();
        }
        return false;
    }

    /**
     * @brief Extracts the next whitespace-separated token from sv.
     * @return The token, or an empty view if sv holds only whitespace.
     */
    inline std::string_view nextToken(std::string_view& sv)
    {
        size_t begin = sv.find_first_not_of(kWhitespace);
        if (begin == std::string_view::npos)
        {
            sv = {};
            return {};
        }
        sv.remove_prefix(begin);

        size_t end = sv.find_first_of(kWhitespace);
        std::string_view token = sv.substr(0, end);
        if (end == std::string_view::npos) sv = {};
        else sv.remove_prefix(end);
        return token;
    }

    /**
     * @brief Reads the next token of sv as a number.
     * @return false if sv is exhausted or the token is not a number.
     */
    template <typename T>
    bool consumeNext(std::string_view& sv, T& value)
    {
        std::string_view token = nextToken(sv);
        if (token.empty()) return false;
        return parseNumber(token, value);
    }

    /**
     * @brief Appends v right-aligned in a field of the given width.
     *
     * Doubles use the shortest scientific representation that converts
     * back to the same value.
     */
    template <typename T>
    void appendNumber(std::string& out, T v, size_t width = 0)
    {
        std::array<char, 64> buf{};
        std::to_chars_result res;
        if constexpr (std::is_floating_point_v<T>)
        {
            res = std::to_chars(buf.data(), buf.data() + buf.size(), v, std::chars_format::scientific);
        }
        else
        {
            res = std::to_chars(buf.data(), buf.data() + buf.size(), v);
        }
        size_t len = static_cast<size_t>(res.ptr - buf.data());
        if (len < width) out.append(width - len, ' ');
        out.append(buf.data(), len);
    }

    /// Escapes the five XML special characters.
    inline std::string escapeXml(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());
        for (char c : text)
        {
            switch (c)
            {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c;
            }
        }
        return out;
    }

} // namespace utils
} // namespace lheutils
