/********************************************************************
 * gtest-kap-log.cpp -- unit tests for the logger                   *
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

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include "../kaplog.h"

static KapLogModule log_module = "kap.test.log";

class KapLogTest : public ::testing::Test
{
protected:
    KapLogTest() { kap_log_init(); }
    ~KapLogTest() { kap_log_shutdown(); }
};

TEST_F(KapLogTest, test_default_threshold)
{
    EXPECT_TRUE(kap_log_check("kap.engine", KAP_LOG_ERROR));
    EXPECT_TRUE(kap_log_check("kap.engine", KAP_LOG_WARNING));
    EXPECT_FALSE(kap_log_check("kap.engine", KAP_LOG_INFO));
    EXPECT_TRUE(kap_log_check(nullptr, KAP_LOG_WARNING));
}

TEST_F(KapLogTest, test_levels_are_inherited)
{
    kap_log_set_level("kap.engine", KAP_LOG_INFO);
    kap_log_set_level("kap.engine.ledger.soy", KAP_LOG_DEBUG);
    EXPECT_TRUE(kap_log_check("kap.engine.order", KAP_LOG_INFO));
    EXPECT_FALSE(kap_log_check("kap.engine.order", KAP_LOG_DEBUG));
    EXPECT_TRUE(kap_log_check("kap.engine.ledger", KAP_LOG_INFO));
    EXPECT_FALSE(kap_log_check("kap.engine.ledger", KAP_LOG_DEBUG));
    EXPECT_TRUE(kap_log_check("kap.engine.ledger.soy", KAP_LOG_DEBUG));
    EXPECT_FALSE(kap_log_check("kap.other", KAP_LOG_INFO));

    kap_log_set_level("kap.engine", KAP_LOG_ERROR);
    EXPECT_FALSE(kap_log_check("kap.engine.order", KAP_LOG_WARNING));
    EXPECT_TRUE(kap_log_check("kap.engine.ledger.soy", KAP_LOG_DEBUG));
}

TEST_F(KapLogTest, test_level_names)
{
    EXPECT_STREQ("WARN", kap_log_level_to_string(KAP_LOG_WARNING));
    EXPECT_STREQ("DEBUG", kap_log_level_to_string(KAP_LOG_DEBUG));
    EXPECT_EQ(KAP_LOG_INFO, kap_log_level_from_string("info"));
    EXPECT_EQ(KAP_LOG_WARNING, kap_log_level_from_string("WARNING"));
    EXPECT_EQ(KAP_LOG_ERROR, kap_log_level_from_string("critical"));
    EXPECT_EQ(KAP_LOG_DEBUG, kap_log_level_from_string("bogus"));
    EXPECT_EQ(KAP_LOG_DEBUG, kap_log_level_from_string(nullptr));
}

TEST_F(KapLogTest, test_prettify)
{
    EXPECT_STREQ("KapLedger::consume",
                 kap_log_prettify("KapLedgerResult KapLedger::consume(int)"));
    EXPECT_STREQ("run", kap_log_prettify("int* run(const char*)"));
    EXPECT_STREQ("kap_sort_events", kap_log_prettify("kap_sort_events"));
    EXPECT_STREQ("", kap_log_prettify(nullptr));
}

TEST_F(KapLogTest, test_config_file_sets_levels_and_output)
{
    const char* config = "test-kap-log.conf";
    const char* output = "test-kap-log.log";
    {
        std::ofstream out{config};
        out << "[levels]\nkap.test=info\n\n[output]\nto=" << output << "\n";
    }
    kap_log_parse_log_config(config);
    EXPECT_TRUE(kap_log_check(log_module, KAP_LOG_INFO));
    PINFO("logged %d", 42);
    DEBUG("not logged");
    kap_log_shutdown();

    std::ifstream in{output};
    std::stringstream text;
    text << in.rdbuf();
    EXPECT_NE(std::string::npos, text.str().find("INFO <kap.test.log>"));
    EXPECT_NE(std::string::npos, text.str().find("logged 42"));
    EXPECT_EQ(std::string::npos, text.str().find("not logged"));
    std::remove(config);
    std::remove(output);
}
