/********************************************************************
 * kap-guid.hpp -- globally unique identifiers                      *
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

#ifndef KAP_GUID_HPP_HEADER
#define KAP_GUID_HPP_HEADER

#include <boost/uuid/uuid.hpp>
#include <stdexcept>
#include <string>

namespace kap
{

/** Thrown by GUID::from_string() for text that isn't a GUID. */
class guid_syntax_exception : public std::invalid_argument
{
public:
    explicit guid_syntax_exception(const std::string& text);
};

/** Identifier of a financial event, written as 32 lower case hex digits.
 *
 * Events that agree on every other sort field are ordered by their GUID, so
 * the ordering only has to be total, not meaningful.
 */
class GUID
{
public:
    /** The null GUID. */
    GUID() noexcept;
    explicit GUID(const boost::uuids::uuid& uuid) noexcept : m_uuid{uuid} {}

    static GUID create_random();
    static const GUID& null_guid() noexcept;
    /**
     * Parse 32 hex digits, with or without the dashes and braces of the
     * RFC 4122 form.
     * @exception guid_syntax_exception for anything else.
     */
    static GUID from_string(const std::string& str);
    static bool is_valid_guid(const std::string& str) noexcept;

    std::string to_string() const;
    bool is_null() const noexcept { return m_uuid.is_nil(); }

    bool operator<(const GUID& other) const noexcept
    {
        return m_uuid < other.m_uuid;
    }
    bool operator==(const GUID& other) const noexcept
    {
        return m_uuid == other.m_uuid;
    }
    bool operator!=(const GUID& other) const noexcept
    {
        return !(*this == other);
    }

private:
    boost::uuids::uuid m_uuid;
};

} // namespace kap

#endif // KAP_GUID_HPP_HEADER
