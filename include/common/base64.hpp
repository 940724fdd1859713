/*
 * File: include/common/base64.hpp
 * Project: Rig Marshal
 * Purpose: Base64 for file_chunk payloads
 * Notes:
 *  - Standard alphabet with '=' padding
 *  - Decode rejects characters outside the alphabet
 * Last updated: 2026-10-18
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>

inline std::string base64_encode(std::string_view bytes)
{
    using namespace boost::archive::iterators;
    using It = base64_from_binary<transform_width<std::string_view::const_iterator, 6, 8>>;
    std::string out(It(bytes.begin()), It(bytes.end()));
    out.append((3 - bytes.size() % 3) % 3, '=');
    return out;
}

// Returns nullopt on characters outside the alphabet or a bad length.
inline std::optional<std::string> base64_decode(std::string_view text)
{
    using namespace boost::archive::iterators;
    using It = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

    std::string_view body = text;
    while (!body.empty() && (body.back() == '\n' || body.back() == '\r'))
        body.remove_suffix(1);
    if (body.size() % 4 != 0)
        return std::nullopt;

    std::size_t pad = 0;
    while (pad < 2 && pad < body.size() && body[body.size() - 1 - pad] == '=')
        ++pad;
    if (body.substr(0, body.size() - pad).find('=') != std::string_view::npos)
        return std::nullopt;

    // padding decodes as zero bits, then the pad bytes are cut off
    std::string digits(body);
    for (std::size_t i = 0; i < pad; ++i)
        digits[digits.size() - 1 - i] = 'A';

    try
    {
        std::string out(It(digits.cbegin()), It(digits.cend()));
        out.resize(body.size() / 4 * 3 - pad);
        return out;
    }
    catch (const dataflow_exception &)
    {
        return std::nullopt;
    }
}
