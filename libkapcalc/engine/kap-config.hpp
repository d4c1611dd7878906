/********************************************************************
 * kap-config.hpp -- engine configuration from key files            *
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

#ifndef __KAP_CONFIG_HPP__
#define __KAP_CONFIG_HPP__

#include <string>
#include <glib.h>
#include "kap-numeric.hpp"

/** @brief Settings for a calculation run, read from a GKeyFile.
 *
 * @verbatim
    [numeric]
    precision=28
    rounding=half-up
    amount-places=2
    per-unit-places=6
    quantity-places=8

    [loss-offsetting]
    apply-derivative-loss-cap=true
    derivative-loss-cap=20000

    [levels]
    kap.engine=info
 @endverbatim
 *
 * Missing groups and keys keep their defaults. The [levels] and [output]
 * groups are handed to the logging subsystem.
 */
class KapConfig
{
public:
    /** The default settings. */
    KapConfig();
    /**
     * Read a configuration file.
     * @exception std::runtime_error if the file can't be read or parsed.
     * @exception std::invalid_argument if a value is malformed.
     */
    static KapConfig from_file(const std::string& path);
    /**
     * Read configuration text.
     * @exception std::invalid_argument if the text can't be parsed or a value
     * is malformed.
     */
    static KapConfig from_data(const std::string& data);

    const KapNumericContext& numeric_context() const noexcept { return m_context; }
    bool apply_derivative_loss_cap() const noexcept { return m_apply_cap; }
    const KapNumeric& derivative_loss_cap() const noexcept { return m_loss_cap; }

private:
    void load(GKeyFile* key_file);

    KapNumericContext m_context;
    bool m_apply_cap;
    KapNumeric m_loss_cap;
};

#endif // __KAP_CONFIG_HPP__
