/********************************************************************
 * kaplog.cpp -- hierarchical logging over GLib                     *
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

#include <glib.h>
#include <glib/gstdio.h>
#include <stdio.h>
#include <string.h>

#include "kaplog.h"
#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

static constexpr size_t max_function_chars = 50;
static constexpr int indent_width = 4;
static constexpr KapLogLevel default_level = KAP_LOG_WARNING;

/* A node of the log-domain tree. Nodes created only to reach a deeper domain
 * carry no level of their own and defer to their nearest configured ancestor.
 */
struct KapLogNode
{
    std::optional<KapLogLevel> m_level;
    std::map<std::string, std::unique_ptr<KapLogNode>> m_children;
};

struct KapLogState
{
    KapLogNode m_root;
    FILE* m_out = nullptr;
    bool m_owns_out = false;
    int m_indent = 0;
    int m_domain_width = 0;
    GLogFunc m_previous_handler = nullptr;
    bool m_installed = false;

    KapLogState() { m_root.m_level = default_level; }

    void close_output()
    {
        if (m_out && m_owns_out)
            fclose(m_out);
        m_out = nullptr;
        m_owns_out = false;
    }

    FILE* output() { return m_out ? m_out : stderr; }
};

static std::unique_ptr<KapLogState> s_state;

static KapLogState&
log_state()
{
    if (!s_state)
        s_state = std::make_unique<KapLogState>();
    return *s_state;
}

static std::vector<std::string>
domain_parts(const std::string& domain)
{
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    for (auto dot = domain.find('.'); dot != std::string::npos;
         dot = domain.find('.', start))
    {
        parts.emplace_back(domain, start, dot - start);
        start = dot + 1;
    }
    parts.emplace_back(domain, start);
    return parts;
}

void
kap_log_indent(void)
{
    log_state().m_indent += indent_width;
}

void
kap_log_dedent(void)
{
    auto& state = log_state();
    state.m_indent = std::max(0, state.m_indent - indent_width);
}

void
kap_log_set_file(FILE *outfile)
{
    auto& state = log_state();
    state.close_output();
    state.m_out = outfile;
}

static void
kap_log_handler(const gchar *log_domain, GLogLevelFlags log_level,
                const gchar *message, gpointer)
{
    auto level = static_cast<KapLogLevel>(log_level & G_LOG_LEVEL_MASK);
    if (G_LIKELY(!kap_log_check(log_domain, level)))
        return;

    auto& state = log_state();
    GDateTime *now = g_date_time_new_now_local();
    gchar *timestamp = g_date_time_format(now, "%H:%M:%S");
    auto newline = g_str_has_suffix(message, "\n") ? "" : "\n";

    fprintf(state.output(), "* %s %5s <%-*s> %*s%s%s", timestamp,
            kap_log_level_to_string(level), state.m_domain_width,
            log_domain ? log_domain : "", state.m_indent, "", message,
            newline);
    fflush(state.output());

    g_free(timestamp);
    g_date_time_unref(now);
}

void
kap_log_init(void)
{
    auto& state = log_state();
    if (state.m_installed)
        return;
    state.m_previous_handler = g_log_set_default_handler(kap_log_handler,
                                                         nullptr);
    state.m_installed = true;
}

void
kap_log_init_filename(const gchar* log_filename)
{
    kap_log_init();
    if (!log_filename)
        return;

    if (g_ascii_strcasecmp(log_filename, "stderr") == 0)
    {
        kap_log_set_file(stderr);
        return;
    }
    if (g_ascii_strcasecmp(log_filename, "stdout") == 0)
    {
        kap_log_set_file(stdout);
        return;
    }

    auto out = g_fopen(log_filename, "w");
    if (!out)
    {
        kap_log_set_file(stderr);
        g_critical("Cannot open log output file \"%s\", using stderr.",
                   log_filename);
        return;
    }
    kap_log_set_file(out);
    log_state().m_owns_out = true;
}

void
kap_log_shutdown(void)
{
    if (!s_state)
        return;
    if (s_state->m_installed)
        g_log_set_default_handler(s_state->m_previous_handler, nullptr);
    s_state->close_output();
    s_state.reset();
}

void
kap_log_set_level(KapLogModule log_module, KapLogLevel level)
{
    if (!log_module || level == 0)
        return;

    auto node = &log_state().m_root;
    for (const auto& part : domain_parts(log_module))
    {
        auto& child = node->m_children[part];
        if (!child)
            child = std::make_unique<KapLogNode>();
        node = child.get();
    }
    node->m_level = level;
}

gboolean
kap_log_check(KapLogModule domain, KapLogLevel level)
{
    auto node = &log_state().m_root;
    auto threshold = *node->m_level;
    if (domain)
    {
        for (const auto& part : domain_parts(domain))
        {
            auto iter = node->m_children.find(part);
            if (iter == node->m_children.end())
                break;
            node = iter->second.get();
            if (node->m_level)
                threshold = *node->m_level;
        }
    }
    /* GLib numbers its levels from most to least severe. */
    return level <= threshold;
}

const char *
kap_log_prettify(const char *name)
{
    thread_local std::string buffer;
    if (!name)
        return "";

    /* Clang's __func__ carries the full signature; reduce it to the bare
     * name so that messages read the same with every compiler. */
    std::string func{name};
    auto paren = func.find('(');
    if (paren != std::string::npos)
        func.erase(paren);
    auto begin = func.find_last_of("* ");
    if (begin != std::string::npos)
        func.erase(0, begin + 1);
    if (func.size() > max_function_chars)
        func.resize(max_function_chars);
    buffer = std::move(func);
    return buffer.c_str();
}

void
kap_log_parse_log_config(const char *filename)
{
    GError *err = nullptr;
    GKeyFile *conf = g_key_file_new();

    if (!g_key_file_load_from_file(conf, filename, G_KEY_FILE_NONE, &err))
    {
        g_warning("unable to parse [%s]: %s", filename, err->message);
        g_error_free(err);
        g_key_file_free(conf);
        return;
    }

    kap_log_apply_key_file(conf);
    g_key_file_free(conf);
}

void
kap_log_apply_key_file(GKeyFile *conf)
{
    static const gchar *levels_group = "levels", *output_group = "output";

    if (g_key_file_has_group(conf, levels_group))
    {
        gsize num_keys = 0;
        gchar **keys = g_key_file_get_keys(conf, levels_group, &num_keys,
                                           nullptr);
        auto& state = log_state();
        for (gsize idx = 0; idx < num_keys; ++idx)
        {
            gchar *level_str = g_key_file_get_string(conf, levels_group,
                                                     keys[idx], nullptr);
            auto level = kap_log_level_from_string(level_str);
            g_debug("setting log [%s] to level [%s=%d]", keys[idx],
                    level_str, level);
            kap_log_set_level(keys[idx], level);
            state.m_domain_width = std::max(state.m_domain_width,
                                            static_cast<int>(strlen(keys[idx])));
            g_free(level_str);
        }
        g_strfreev(keys);
    }

    if (g_key_file_has_group(conf, output_group))
    {
        gchar *target = g_key_file_get_string(conf, output_group, "to",
                                              nullptr);
        if (target)
            kap_log_init_filename(target);
        else
            g_warning("[%s] has no \"to\" key, output unchanged", output_group);
        g_free(target);
    }
}

static const struct
{
    KapLogLevel level;
    const char *name;
    const char *prefix;
} level_names[] =
{
    {KAP_LOG_FATAL,   "FATAL", "error"},
    {KAP_LOG_ERROR,   "ERROR", "crit"},
    {KAP_LOG_WARNING, "WARN",  "warn"},
    {KAP_LOG_MESSAGE, "MESSG", "mess"},
    {KAP_LOG_INFO,    "INFO",  "info"},
    {KAP_LOG_DEBUG,   "DEBUG", "debug"},
};

const gchar*
kap_log_level_to_string(KapLogLevel log_level)
{
    for (const auto& entry : level_names)
        if (entry.level == log_level)
            return entry.name;
    return "OTHER";
}

KapLogLevel
kap_log_level_from_string(const gchar *str)
{
    if (!str)
        return KAP_LOG_DEBUG;
    for (const auto& entry : level_names)
        if (g_ascii_strncasecmp(entry.prefix, str, strlen(entry.prefix)) == 0)
            return entry.level;
    return KAP_LOG_DEBUG;
}
