/********************************************************************
 * kap-guid.cpp -- globally unique identifiers                      *
 * Copyright 2024 The KapCalc Authors                               *
 *                                                                  *
 * This program is free software; you can redistribute it and/or    *
 * modify it under the terms of the GNU General Public License as   *
 * published by the Free Software Foundation; either version 2 of   *
 * the License, or (at your option) any later version.              *
 *                                                                  *
 * This program is distributed in the hope that it will be useful,  *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of   *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the    *
 * GNU General Public License for more details.                     *
 *                                                                  *
 * You should have received a copy of the GNU General Public License*
 * along with this program; if not, contact:                        *
 *                                                                  *
 * Free Software Foundation           Voice:  +1-617-542-5942       *
 * 51 Franklin Street, Fifth Floor    Fax:    +1-617-542-2652       *
 * Boston, MA  02110-1301,  USA       gnu@gnu.org                   *
 *                                                                  *
 ********************************************************************/

#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <cctype>

#include "kap-guid.hpp"

namespace kap
{

guid_syntax_exception::guid_syntax_exception(const std::string& text) :
    std::invalid_argument{"\"" + text + "\" is not a GUID."}
{
}

GUID::GUID() noexcept : m_uuid{boost::uuids::nil_uuid()} {}

GUID
GUID::create_random()
{
    thread_local boost::uuids::random_generator generator;
    return GUID{generator()};
}

const GUID&
GUID::null_guid() noexcept
{
    static const GUID null;
    return null;
}

bool
GUID::is_valid_guid(const std::string& str) noexcept
{
    std::string::size_type digits = 0;
    for (auto c : str)
    {
        if (std::isxdigit(static_cast<unsigned char>(c)))
            ++digits;
        else if (c != '-' && c != '{' && c != '}')
            return false;
    }
    if (digits != 32)
        return false;
    try
    {
        boost::uuids::string_generator{}(str);
        return true;
    }
    catch (const std::runtime_error&)
    {
        return false;
    }
}

GUID
GUID::from_string(const std::string& str)
{
    if (!is_valid_guid(str))
        throw guid_syntax_exception{str};
    return GUID{boost::uuids::string_generator{}(str)};
}

std::string
GUID::to_string() const
{
    static const char hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(2 * m_uuid.size());
    for (auto byte : m_uuid)
    {
        result.push_back(hex[byte >> 4]);
        result.push_back(hex[byte & 0x0f]);
    }
    return result;
}

} // namespace kap
