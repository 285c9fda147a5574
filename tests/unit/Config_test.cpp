/**
 * (c) 2019 by Mega Limited, Wellsford, New Zealand
 *
 * This file is part of the MEGA SDK - Client Access Engine.
 *
 * Applications using the MEGA API must present a valid application key
 * and comply with the the rules set forth in the Terms of Service.
 *
 * The MEGA SDK is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */

#include <gtest/gtest.h>

#include <megaflow/config.h>
#include <megaflow/posix/megafs.h>

#include "TempDir.h"

using namespace megaflow;

namespace mt {

TEST(Config, DefaultsAreValid)
{
    Config config;

    EXPECT_EQ(API_OK, config.validate());
    EXPECT_EQ(10u, config.maxWorkers);
    EXPECT_EQ(10u, config.concurrencyBudget);
    EXPECT_EQ(3u, config.maxRetries);
    EXPECT_EQ("downloads", config.downloadDir);

    NetworkSettings net = config.networkSettings();
    EXPECT_EQ(std::chrono::seconds(20), net.timeout);
    EXPECT_EQ(std::chrono::milliseconds(10000), net.minRetryDelay);
    EXPECT_EQ(std::chrono::milliseconds(30000), net.maxRetryDelay);

    EXPECT_EQ(10u, config.executorFlags().mMaxWorkers);
    EXPECT_TRUE(config.transferSettings().verifyResumed);
}

TEST(Config, BoundsAreEnforced)
{
    auto invalid = [](const char* name, const char* value)
    {
        Config config;
        EXPECT_EQ(API_OK, config.set(name, value)) << name;
        return config.validate();
    };

    EXPECT_EQ(API_EARGS, invalid("max_workers", "0"));
    EXPECT_EQ(API_EARGS, invalid("max_workers", "11"));
    EXPECT_EQ(API_EARGS, invalid("concurrency_budget", "0"));
    EXPECT_EQ(API_EARGS, invalid("concurrency_budget", "101"));
    EXPECT_EQ(API_EARGS, invalid("max_retries", "101"));
    EXPECT_EQ(API_EARGS, invalid("timeout", "0"));
    EXPECT_EQ(API_EARGS, invalid("min_retry_delay", "31"));
    EXPECT_EQ(API_EARGS, invalid("proxy_mode", "single"));
    EXPECT_EQ(API_EARGS, invalid("download_dir", ""));

    EXPECT_EQ(API_OK, invalid("max_workers", "1"));
    EXPECT_EQ(API_OK, invalid("max_retries", "0"));
}

TEST(Config, SetRejectsUnknownNamesAndBadValues)
{
    Config config;

    EXPECT_EQ(API_ENOENT, config.set("colour", "blue"));
    EXPECT_EQ(API_EARGS, config.set("max_workers", "-1"));
    EXPECT_EQ(API_EARGS, config.set("max_workers", "four"));
    EXPECT_EQ(API_EARGS, config.set("keep_partial", "maybe"));
    EXPECT_EQ(API_EARGS, config.set("proxy_mode", "socks"));

    EXPECT_EQ(API_OK, config.set("keep_partial", "0"));
    EXPECT_FALSE(config.keepPartial);

    EXPECT_EQ(API_OK, config.set("proxies", "http://a:1,,http://b:2"));
    EXPECT_EQ((std::vector<std::string>{"http://a:1", "http://b:2"}), config.proxies);

    EXPECT_EQ(API_OK, config.set("proxy_mode", "random"));
    EXPECT_EQ(PROXY_RANDOM, config.proxySettings().mode);
    EXPECT_EQ(API_OK, config.validate());
}

TEST(Config, ParsesHandEditedFiles)
{
    Config config;

    ASSERT_TRUE(config.parse(
        "{\n"
        "    \"max_workers\": 4,\n"
        "    \"concurrency_budget\": 6,\n"
        "    \"proxy_mode\": \"single\",\n"
        "    \"proxies\": [ \"http://proxy:3128\" ],\n"
        "    \"download_dir\": \"my downloads\",\n"
        "    \"verify_resumed\": false,\n"
        "    \"future_option\": { \"x\": [1, 2] }\n"
        "}\n"));

    EXPECT_EQ(4u, config.maxWorkers);
    EXPECT_EQ(6u, config.concurrencyBudget);
    EXPECT_EQ(PROXY_SINGLE, config.proxyMode);
    EXPECT_EQ(std::vector<std::string>{"http://proxy:3128"}, config.proxies);
    EXPECT_EQ("my downloads", config.downloadDir);
    EXPECT_FALSE(config.verifyResumed);
    EXPECT_EQ(API_OK, config.validate());

    EXPECT_FALSE(Config().parse("{\"max_workers\":\"many\"}"));
    EXPECT_FALSE(Config().parse("[1,2]"));
    EXPECT_FALSE(Config().parse("{\"max_workers\":4"));
    EXPECT_TRUE(Config().parse("{}"));
}

TEST(Config, SerializedFormParsesBack)
{
    Config config;
    config.maxWorkers = 3;
    config.timeout = 45;
    config.proxyMode = PROXY_SINGLE;
    config.proxies = {"http://p:8080"};
    config.downloadDir = "dir with \"quotes\"";
    config.keepPartial = false;

    Config back;
    ASSERT_TRUE(back.parse(config.serialize()));

    EXPECT_EQ(3u, back.maxWorkers);
    EXPECT_EQ(45u, back.timeout);
    EXPECT_EQ(PROXY_SINGLE, back.proxyMode);
    EXPECT_EQ(config.proxies, back.proxies);
    EXPECT_EQ(config.downloadDir, back.downloadDir);
    EXPECT_FALSE(back.keepPartial);
}

TEST(Config, MissingFileIsCreatedWithDefaults)
{
    TempDir dir;
    PosixFileSystemAccess fs;
    std::string path = dir.path() + "/conf/megaflow.json";

    Config config = Config::load(fs, path);

    EXPECT_EQ(10u, config.maxWorkers);
    ASSERT_TRUE(fs.existslocal(path));

    std::string data;
    ASSERT_TRUE(fs.readfile(path, data));
    EXPECT_EQ(Config().serialize(), data);
}

TEST(Config, InvalidFileIsBackedUpAndReplaced)
{
    TempDir dir;
    PosixFileSystemAccess fs;
    std::string path = dir.path() + "/megaflow.json";

    ASSERT_TRUE(fs.writefileatomic(path, "{\"max_workers\":500}"));

    Config config = Config::load(fs, path);
    EXPECT_EQ(10u, config.maxWorkers);

    std::string data;
    ASSERT_TRUE(fs.readfile(path, data));
    EXPECT_EQ(Config().serialize(), data);

    size_t backups = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path()))
    {
        std::string name = entry.path().filename().string();
        if (name.rfind("megaflow.json.backup.", 0) == 0)
        {
            backups++;

            std::string old;
            ASSERT_TRUE(fs.readfile(entry.path().string(), old));
            EXPECT_EQ("{\"max_workers\":500}", old);
        }
    }
    EXPECT_EQ(1u, backups);
}

TEST(Config, ValidFileIsKept)
{
    TempDir dir;
    PosixFileSystemAccess fs;
    std::string path = dir.path() + "/megaflow.json";

    ASSERT_TRUE(fs.writefileatomic(path, "{\"max_retries\":7,\"unknown\":true}"));

    Config config = Config::load(fs, path);
    EXPECT_EQ(7u, config.maxRetries);

    std::string data;
    ASSERT_TRUE(fs.readfile(path, data));
    EXPECT_EQ("{\"max_retries\":7,\"unknown\":true}", data);
}

TEST(Config, DownloadWeightGrowsWithSizeAndFitsTheBudget)
{
    const m_off_t MIB = 1 << 20;
    Config config;

    EXPECT_EQ(1u, config.downloadWeight(0));
    EXPECT_EQ(1u, config.downloadWeight(5 * MIB - 1));
    EXPECT_EQ(2u, config.downloadWeight(5 * MIB));
    EXPECT_EQ(5u, config.downloadWeight(20 * MIB));
    EXPECT_EQ(10u, config.downloadWeight(100 * MIB));

    config.concurrencyBudget = 3;
    EXPECT_EQ(3u, config.downloadWeight(100 * MIB));
}

} // mt
