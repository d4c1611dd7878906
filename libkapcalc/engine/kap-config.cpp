/********************************************************************
 * kap-config.cpp -- engine configuration from key files            *
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

#include <memory>
#include "kap-config.hpp"
#include "kaplog.h"

static KapLogModule log_module = KAP_MOD_CONFIG;

static const gchar* numeric_group = "numeric";
static const gchar* loss_group = "loss-offsetting";

using KeyFilePtr = std::unique_ptr<GKeyFile, decltype(&g_key_file_free)>;

/* Reads an integer key; returns false if the key isn't present and throws
 * if it is present but not an integer.
 */
static bool
read_int(GKeyFile* key_file, const gchar* group, const gchar* key, int& value)
{
    if (!g_key_file_has_key(key_file, group, key, NULL))
        return false;
    GError* err = NULL;
    auto result = g_key_file_get_integer(key_file, group, key, &err);
    if (err)
    {
        std::string msg = std::string("Invalid value for [") + group + "] " +
            key + ": " + err->message;
        g_error_free(err);
        throw std::invalid_argument(msg);
    }
    value = result;
    return true;
}

static bool
read_string(GKeyFile* key_file, const gchar* group, const gchar* key,
            std::string& value)
{
    gchar* str = g_key_file_get_string(key_file, group, key, NULL);
    if (!str)
        return false;
    value = g_strstrip(str);
    g_free(str);
    return true;
}

static bool
read_bool(GKeyFile* key_file, const gchar* group, const gchar* key, bool& value)
{
    if (!g_key_file_has_key(key_file, group, key, NULL))
        return false;
    GError* err = NULL;
    auto result = g_key_file_get_boolean(key_file, group, key, &err);
    if (err)
    {
        std::string msg = std::string("Invalid value for [") + group + "] " +
            key + ": " + err->message;
        g_error_free(err);
        throw std::invalid_argument(msg);
    }
    value = result;
    return true;
}

KapConfig::KapConfig() :
    m_context{}, m_apply_cap{true}, m_loss_cap{20000}
{
}

KapConfig
KapConfig::from_file(const std::string& path)
{
    KeyFilePtr key_file{g_key_file_new(), &g_key_file_free};
    GError* err = NULL;
    if (!g_key_file_load_from_file(key_file.get(), path.c_str(),
                                   G_KEY_FILE_NONE, &err))
    {
        std::string msg = "Unable to read configuration " + path + ": " +
            err->message;
        g_error_free(err);
        throw std::runtime_error(msg);
    }
    KapConfig config;
    config.load(key_file.get());
    return config;
}

KapConfig
KapConfig::from_data(const std::string& data)
{
    KeyFilePtr key_file{g_key_file_new(), &g_key_file_free};
    GError* err = NULL;
    if (!g_key_file_load_from_data(key_file.get(), data.c_str(), data.size(),
                                   G_KEY_FILE_NONE, &err))
    {
        std::string msg = std::string("Unable to parse configuration: ") +
            err->message;
        g_error_free(err);
        throw std::invalid_argument(msg);
    }
    KapConfig config;
    config.load(key_file.get());
    return config;
}

void
KapConfig::load(GKeyFile* key_file)
{
    int precision = static_cast<int>(m_context.precision);
    if (read_int(key_file, numeric_group, "precision", precision))
    {
        if (precision <= 0)
            throw std::invalid_argument("[numeric] precision must be positive.");
        m_context.precision = static_cast<unsigned int>(precision);
    }

    std::string rounding;
    if (read_string(key_file, numeric_group, "rounding", rounding))
        m_context.rounding = round_type_from_string(rounding);

    read_int(key_file, numeric_group, "amount-places", m_context.amount_places);
    read_int(key_file, numeric_group, "per-unit-places", m_context.unit_places);
    read_int(key_file, numeric_group, "quantity-places", m_context.quantity_places);
    m_context.validate();

    read_bool(key_file, loss_group, "apply-derivative-loss-cap", m_apply_cap);
    std::string cap;
    if (read_string(key_file, loss_group, "derivative-loss-cap", cap))
    {
        m_loss_cap = KapNumeric(cap);
        if (m_loss_cap.is_negative())
            throw std::invalid_argument("[loss-offsetting] derivative-loss-cap must not be negative.");
    }

    kap_log_apply_key_file(key_file);
    PINFO("precision %u, rounding %s, places %d/%d/%d, loss cap %s (%s)",
          m_context.precision, round_type_to_string(m_context.rounding),
          m_context.amount_places, m_context.unit_places,
          m_context.quantity_places, m_loss_cap.to_string().c_str(),
          m_apply_cap ? "applied" : "not applied");
}
