#include "config_synthesizer.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

static const char* kExisting =
    "ctrl_interface=DIR=/var/run/wpa_supplicant GROUP=netdev\n"
    "update_config=1\n"
    "country=GB\n"
    "\n"
    "network={\n"
    "    ssid=\"Office\"\n"
    "    psk=\"office-pass\"\n"
    "}\n"
    "\n"
    "network={\n"
    "    ssid=\"Home\"\n"
    "    psk=\"old-pass\"\n"
    "    priority=1\n"
    "}\n"
    "\n"
    "network={\n"
    "  # guest wifi\n"
    "\tssid=\"Guest\"\n"
    "\tkey_mgmt=NONE\n"
    "}\n";

static std::string block(const std::string& ssid, const std::string& secret_line) {
    return "network={\n    ssid=\"" + ssid + "\"\n    " + secret_line +
           "\n    priority=1\n}\n";
}

static size_t count(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

TEST(RewriteClientConfigTest, ReplacesMatchingBlockAndKeepsOthersInOrder) {
    std::string out = rewriteClientConfig(kExisting, "Home", "new-pass");

    const std::string office =
        "network={\n    ssid=\"Office\"\n    psk=\"office-pass\"\n}\n";
    const std::string guest =
        "network={\n  # guest wifi\n\tssid=\"Guest\"\n\tkey_mgmt=NONE\n}\n";

    size_t office_at = out.find(office);
    size_t guest_at = out.find(guest);
    size_t home_at = out.find(block("Home", "psk=\"new-pass\""));

    ASSERT_NE(office_at, std::string::npos);
    ASSERT_NE(guest_at, std::string::npos);
    ASSERT_NE(home_at, std::string::npos);
    EXPECT_LT(office_at, guest_at);
    EXPECT_LT(guest_at, home_at);

    EXPECT_EQ(out.find("old-pass"), std::string::npos);
    EXPECT_EQ(count(out, "ssid=\"Home\""), 1u);

    const std::string header =
        "ctrl_interface=DIR=/var/run/wpa_supplicant GROUP=netdev\n"
        "update_config=1\n"
        "country=GB\n";
    EXPECT_EQ(out.compare(0, header.size(), header), 0);
}

TEST(RewriteClientConfigTest, AppendsWhenNoBlockMatches) {
    std::string out = rewriteClientConfig(kExisting, "Cafe", "");

    EXPECT_EQ(out, std::string(kExisting) + "\n" + block("Cafe", "key_mgmt=NONE"));
}

TEST(RewriteClientConfigTest, EmptyInputGivesSingleBlock) {
    EXPECT_EQ(rewriteClientConfig("", "Home", "secret123"),
              block("Home", "psk=\"secret123\""));
}

TEST(RewriteClientConfigTest, RepeatedApplicationIsStable) {
    std::string once = rewriteClientConfig(kExisting, "Home", "new-pass");
    std::string twice = rewriteClientConfig(once, "Home", "new-pass");

    EXPECT_EQ(once, twice);
    EXPECT_EQ(count(twice, "ssid=\"Home\""), 1u);
}

TEST(RewriteClientConfigTest, UnterminatedBlockForOtherNetworkIsKept) {
    std::string existing = "network={\n    ssid=\"Other\"\n";
    std::string out = rewriteClientConfig(existing, "Home", "");

    EXPECT_EQ(out.compare(0, existing.size(), existing), 0);
    EXPECT_NE(out.find(block("Home", "key_mgmt=NONE")), std::string::npos);
}

TEST(RewriteClientConfigTest, UnterminatedBlockForTargetIsDropped) {
    std::string out = rewriteClientConfig("network={\n    ssid=\"Home\"\n    psk=\"x\"\n",
                                          "Home", "y12345678");

    EXPECT_EQ(out, block("Home", "psk=\"y12345678\""));
}

class ConfigSynthesizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        char pattern[] = "/tmp/wifiarbiter-conf-XXXXXX";
        ASSERT_NE(mkdtemp(pattern), nullptr);
        dir_ = pattern;
        path_ = dir_ + "/wpa_supplicant.conf";
    }

    void TearDown() override {
        std::remove(path_.c_str());
        std::remove((path_ + ".tmp").c_str());
        ::rmdir(dir_.c_str());
    }

    std::string readFile() const {
        std::ifstream in(path_);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::string dir_;
    std::string path_;
    ConfigSynthesizer synthesizer_;
};

TEST_F(ConfigSynthesizerTest, CreatesMissingFileWithOneBlock) {
    ASSERT_TRUE(synthesizer_.upsertClientBlock(path_, "Home", "secret123"));

    EXPECT_EQ(readFile(), block("Home", "psk=\"secret123\""));
}

TEST_F(ConfigSynthesizerTest, RestrictsPermissionsToOwner) {
    ASSERT_TRUE(synthesizer_.upsertClientBlock(path_, "Home", "secret123"));

    struct stat st;
    ASSERT_EQ(::stat(path_.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(ConfigSynthesizerTest, RewritesExistingFile) {
    {
        std::ofstream out(path_);
        out << kExisting;
    }

    ASSERT_TRUE(synthesizer_.upsertClientBlock(path_, "Home", "new-pass"));
    ASSERT_TRUE(synthesizer_.upsertClientBlock(path_, "Home", "new-pass"));

    std::string contents = readFile();
    EXPECT_EQ(contents, rewriteClientConfig(kExisting, "Home", "new-pass"));
    EXPECT_NE(::access((path_ + ".tmp").c_str(), F_OK), 0);
}

TEST_F(ConfigSynthesizerTest, FailsWhenDirectoryIsMissing) {
    EXPECT_FALSE(synthesizer_.upsertClientBlock(dir_ + "/missing/wpa.conf", "Home", ""));
}
