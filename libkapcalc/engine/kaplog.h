/********************************************************************
 * kaplog.h -- hierarchical logging over GLib                       *
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

/**
 * @addtogroup Logging
 * @{
 * @brief Logging and tracing facility.
 *
 * kap_log_init(void) installs a GLib log handler that interprets the
 * "log_domain" as a "."-separated path. Log level thresholds can be set for
 * each level in the tree. When a message is logged, the longest level match
 * is found, and used as the threshold.
 *
 * For instance, we can set the levels as such:
 * @verbatim
   "kap"                        = WARN
   "kap.engine"                 = INFO
   "kap.engine.ledger"          = DEBUG
 @endverbatim
 *
 * When code in the log_module of "kap.engine.order" attempts to log at DEBUG
 * the handler matches "kap" and then "kap.engine", finds INFO and rejects
 * the message; "kap.engine.order" has no level of its own. Code in "kap.engine.ledger" logging at DEBUG is accepted.
 *
 * The log format is:
 *
 * @verbatim
     * [timestamp] [level] <[log-domain]> [message]
 @endverbatim
 *
 * Every source file declares
 * <tt>static KapLogModule log_module = KAP_MOD_...;</tt> and logs with the
 * PERR, PWARN, PINFO, DEBUG, ENTER and LEAVE macros, which prefix the
 * message with the name of the calling function.
 *
 * @see kap_log_parse_log_config(const char*)
 **/

#ifndef _KAP_LOG_H
#define _KAP_LOG_H

#include <stdarg.h>
#include <stdio.h>
#include <glib.h>

typedef const gchar* KapLogModule;

#define KAP_MOD_ROOT     "kap"
#define KAP_MOD_ENGINE   "kap.engine"
#define KAP_MOD_NUMERIC  "kap.engine.numeric"
#define KAP_MOD_CONFIG   "kap.engine.config"
#define KAP_MOD_CURRENCY "kap.engine.currency"
#define KAP_MOD_ORDER    "kap.engine.order"
#define KAP_MOD_LEDGER   "kap.engine.ledger"
#define KAP_MOD_SOY      "kap.engine.ledger.soy"
#define KAP_MOD_PROCESS  "kap.engine.processors"
#define KAP_MOD_LOSS     "kap.engine.loss-offsetting"

typedef enum
{
    KAP_LOG_FATAL   = G_LOG_LEVEL_ERROR,
    KAP_LOG_ERROR   = G_LOG_LEVEL_CRITICAL,
    KAP_LOG_WARNING = G_LOG_LEVEL_WARNING,
    KAP_LOG_MESSAGE = G_LOG_LEVEL_MESSAGE,
    KAP_LOG_INFO    = G_LOG_LEVEL_INFO,
    KAP_LOG_DEBUG   = G_LOG_LEVEL_DEBUG,
} KapLogLevel;

const gchar* kap_log_level_to_string(KapLogLevel lvl);
KapLogLevel kap_log_level_from_string(const gchar *str);

/** Indents one level; see ENTER macro. **/
void kap_log_indent(void);

/**
 * De-dent one level, capped at 0; see LEAVE macro.
 **/
void kap_log_dedent(void);

/**
 * Install the KapCalc log handler. Defaults to a level-threshold of
 * "warning", and logging to stderr.
 **/
void kap_log_init (void);

/** Set the logging level of the given log_module. Domains below it that
 * have no level of their own inherit it. **/
void kap_log_set_level(KapLogModule module, KapLogLevel level);

/** Specify an alternate log output, to pipe or file. **/
void kap_log_set_file (FILE *outfile);

/**
 * Install the handler and send its output to @a logfilename. The names
 * "stderr" and "stdout" (case-insensitive) select those streams.
 **/
void kap_log_init_filename (const gchar* logfilename);

/**
 * Parse a log-configuration file.  A GKeyFile-format file of the schema:
 * @verbatim
    [levels]
    # log.ger.path=level
    kap.engine.ledger=debug
    kap.engine.loss-offsetting=info

    [output]
    # to=["stderr"|"stdout"|filename]
    to=stderr
 @endverbatim
 **/
void kap_log_parse_log_config(const char *filename);

/** Apply the [levels] and [output] groups of an already loaded key file. */
void kap_log_apply_key_file(GKeyFile *conf);

/** Restore the previous handler, close the log file and forget all levels. */
void kap_log_shutdown (void);

/**
 * Reduce a __func__ string to the bare function name, truncated to 50
 * characters.
 **/
const gchar * kap_log_prettify (const gchar *name);

/** Check to see if the given @a log_module is configured to log at the given
 * @a log_level.  This implements the "log.path.hierarchy" logic. **/
gboolean kap_log_check(KapLogModule log_module, KapLogLevel log_level);

#define PRETTY_FUNC_NAME kap_log_prettify(G_STRFUNC)

/** Log a serious error */
#define PERR(format, args...) do { \
    g_log (log_module, G_LOG_LEVEL_CRITICAL, \
      "[%s()] " format, PRETTY_FUNC_NAME , ## args); \
} while (0)

/** Log a warning */
#define PWARN(format, args...) do { \
    g_log (log_module, G_LOG_LEVEL_WARNING, \
      "[%s()] " format, PRETTY_FUNC_NAME , ## args); \
} while (0)

/** Print an informational note */
#define PINFO(format, args...) do { \
    g_log (log_module, G_LOG_LEVEL_INFO, \
      "[%s] " format, PRETTY_FUNC_NAME , ## args); \
} while (0)

/** Print a debugging message */
#define DEBUG(format, args...) do { \
    g_log (log_module, G_LOG_LEVEL_DEBUG, \
      "[%s] " format, PRETTY_FUNC_NAME , ## args); \
} while (0)

/** Print a function entry debugging message */
#define ENTER(format, args...) do { \
    if (kap_log_check(log_module, KAP_LOG_DEBUG)) { \
      g_log (log_module, G_LOG_LEVEL_DEBUG, \
        "[enter %s:%s()] " format, __FILE__, \
        PRETTY_FUNC_NAME , ## args); \
      kap_log_indent(); \
    } \
} while (0)

/** Print a function exit debugging message. **/
#define LEAVE(format, args...) do { \
    if (kap_log_check(log_module, KAP_LOG_DEBUG)) { \
      kap_log_dedent(); \
      g_log (log_module, G_LOG_LEVEL_DEBUG, \
        "[leave %s()] " format, \
        PRETTY_FUNC_NAME , ## args); \
    } \
} while (0)

#endif /* _KAP_LOG_H */
/** @} */
