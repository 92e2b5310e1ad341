/*
 * Rules directory resolution and bundle extraction.
 */

#include "resources.hpp"
#include "fake_engines.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using namespace mathwords;
using namespace mathwords::resources;
using mathwords::fakes::ScopedEnv;
using mathwords::fakes::ScopedTempDir;

namespace {

const unsigned char kClearSpeak[] = {'r', 'u', 'l', 'e', 's', '\n'};
const unsigned char kDefinitions[] = {'d', 'e', 'f', 's'};
const unsigned char kEmpty[] = {0};

const EmbeddedFile kFiles[] = {
    {"en/ClearSpeak_Rules.yaml", kClearSpeak, sizeof(kClearSpeak)},
    {"en/SharedRules/definitions.yaml", kDefinitions, sizeof(kDefinitions)},
    {"prefs.yaml", kEmpty, 0},
};

const char* kOverrideVar = "MATHWORDS_TEST_RULES_OVERRIDE";

std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class ResourcesTest : public ::testing::Test {
protected:
    ResolveOptions options() const {
        ResolveOptions o;
        o.overrideEnv = kOverrideVar;
        o.localCandidates = {tmp.path() / "cwd" / "Rules", tmp.path() / "exe" / "Rules"};
        o.extractRoot = tmp.path() / "tmp";
        o.extractDirName = "mathwords_rules";
        o.bundle = {kFiles, 3};
        return o;
    }

    fs::path extractTarget() const { return tmp.path() / "tmp" / "mathwords_rules"; }

    ScopedTempDir tmp;
    ScopedEnv clearOverride{kOverrideVar, nullptr};
};

} // namespace

// ========================================================================
// Precedence
// ========================================================================

TEST_F(ResourcesTest, OverrideWinsOverLocalDirectory) {
    fs::create_directories(tmp.path() / "override");
    fs::create_directories(tmp.path() / "cwd" / "Rules");
    ScopedEnv env(kOverrideVar, (tmp.path() / "override").string());

    RulesLocation loc;
    ErrorInfo err;
    ASSERT_TRUE(resolveRulesDirectory(options(), loc, &err)) << err.message;
    EXPECT_EQ(loc.source, RulesSource::Override);
    EXPECT_EQ(loc.path, tmp.path() / "override");
    EXPECT_FALSE(loc.extracted);
    EXPECT_FALSE(fs::exists(extractTarget()));
}

TEST_F(ResourcesTest, OverrideNamingMissingDirectoryIsIgnored) {
    fs::create_directories(tmp.path() / "cwd" / "Rules");
    ScopedEnv env(kOverrideVar, (tmp.path() / "does_not_exist").string());

    RulesLocation loc;
    ASSERT_TRUE(resolveRulesDirectory(options(), loc, nullptr));
    EXPECT_EQ(loc.source, RulesSource::Local);
    EXPECT_EQ(loc.path, tmp.path() / "cwd" / "Rules");
}

TEST_F(ResourcesTest, LocalCandidatesAreCheckedInOrder) {
    fs::create_directories(tmp.path() / "exe" / "Rules");

    RulesLocation loc;
    ASSERT_TRUE(resolveRulesDirectory(options(), loc, nullptr));
    EXPECT_EQ(loc.source, RulesSource::Local);
    EXPECT_EQ(loc.path, tmp.path() / "exe" / "Rules");

    fs::create_directories(tmp.path() / "cwd" / "Rules");
    ASSERT_TRUE(resolveRulesDirectory(options(), loc, nullptr));
    EXPECT_EQ(loc.path, tmp.path() / "cwd" / "Rules");
}

TEST_F(ResourcesTest, LocalRulesFileIsNotADirectory) {
    fs::create_directories(tmp.path() / "cwd");
    std::ofstream(tmp.path() / "cwd" / "Rules") << "not a dir";

    RulesLocation loc;
    ASSERT_TRUE(resolveRulesDirectory(options(), loc, nullptr));
    EXPECT_EQ(loc.source, RulesSource::Extracted);
}

TEST_F(ResourcesTest, EmptyOverrideNameDisablesOverride) {
    fs::create_directories(tmp.path() / "override");
    ScopedEnv env(kOverrideVar, (tmp.path() / "override").string());

    ResolveOptions o = options();
    o.overrideEnv.clear();

    RulesLocation loc;
    ASSERT_TRUE(resolveRulesDirectory(o, loc, nullptr));
    EXPECT_EQ(loc.source, RulesSource::Extracted);
}

// ========================================================================
// Extraction
// ========================================================================

TEST_F(ResourcesTest, BundleIsExtractedPreservingRelativePaths) {
    RulesLocation loc;
    ErrorInfo err;
    ASSERT_TRUE(resolveRulesDirectory(options(), loc, &err)) << err.message;

    EXPECT_EQ(loc.source, RulesSource::Extracted);
    EXPECT_TRUE(loc.extracted);
    EXPECT_EQ(loc.path, extractTarget());

    EXPECT_EQ(readFile(extractTarget() / "en" / "ClearSpeak_Rules.yaml"), "rules\n");
    EXPECT_EQ(readFile(extractTarget() / "en" / "SharedRules" / "definitions.yaml"), "defs");
    ASSERT_TRUE(fs::exists(extractTarget() / "prefs.yaml"));
    EXPECT_EQ(fs::file_size(extractTarget() / "prefs.yaml"), 0u);
}

TEST_F(ResourcesTest, SecondResolveDoesNotRewriteExtractedFiles) {
    RulesLocation first;
    ASSERT_TRUE(resolveRulesDirectory(options(), first, nullptr));
    ASSERT_TRUE(first.extracted);

    fs::path file = extractTarget() / "en" / "ClearSpeak_Rules.yaml";
    auto before = fs::last_write_time(file);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    RulesLocation second;
    ASSERT_TRUE(resolveRulesDirectory(options(), second, nullptr));
    EXPECT_FALSE(second.extracted);
    EXPECT_EQ(second.path, first.path);
    EXPECT_EQ(fs::last_write_time(file), before);
}

TEST_F(ResourcesTest, ExistingTargetGatesExtractionWithoutContentCheck) {
    fs::create_directories(extractTarget());

    RulesLocation loc;
    ASSERT_TRUE(resolveRulesDirectory(options(), loc, nullptr));
    EXPECT_EQ(loc.source, RulesSource::Extracted);
    EXPECT_FALSE(loc.extracted);
    EXPECT_FALSE(fs::exists(extractTarget() / "en"));
}

TEST_F(ResourcesTest, EmptyBundleCreatesOnlyTheTargetDirectory) {
    ResolveOptions o = options();
    o.bundle = {};

    RulesLocation loc;
    ASSERT_TRUE(resolveRulesDirectory(o, loc, nullptr));
    EXPECT_TRUE(fs::is_directory(extractTarget()));
    EXPECT_TRUE(fs::is_empty(extractTarget()));
}

TEST_F(ResourcesTest, UnwritableRootIsResourceError) {
    // A regular file where the extraction root should be
    std::ofstream(tmp.path() / "blocked") << "file";
    ResolveOptions o = options();
    o.extractRoot = tmp.path() / "blocked";

    RulesLocation loc;
    ErrorInfo err;
    EXPECT_FALSE(resolveRulesDirectory(o, loc, &err));
    EXPECT_EQ(err.kind, ErrorKind::Resource);
    EXPECT_EQ(err.code, "ERR_RULES_RESOURCE");
    EXPECT_NE(err.message.find("blocked"), std::string::npos);
}

TEST_F(ResourcesTest, EscapingBundlePathFailsAndLeavesNoPartialTree) {
    const EmbeddedFile bad[] = {
        {"en/ok.yaml", kClearSpeak, sizeof(kClearSpeak)},
        {"../escape.yaml", kDefinitions, sizeof(kDefinitions)},
    };
    ResolveOptions o = options();
    o.bundle = {bad, 2};

    RulesLocation loc;
    ErrorInfo err;
    EXPECT_FALSE(resolveRulesDirectory(o, loc, &err));
    EXPECT_EQ(err.kind, ErrorKind::Resource);
    EXPECT_FALSE(fs::exists(extractTarget()));
    EXPECT_FALSE(fs::exists(tmp.path() / "tmp" / "escape.yaml"));
}

TEST_F(ResourcesTest, MissingExtractRootIsResourceError) {
    ResolveOptions o = options();
    o.extractRoot.clear();

    RulesLocation loc;
    ErrorInfo err;
    EXPECT_FALSE(resolveRulesDirectory(o, loc, &err));
    EXPECT_EQ(err.kind, ErrorKind::Resource);
}

// ========================================================================
// Options from settings
// ========================================================================

TEST(ResourceOptionsTest, MakeResolveOptionsUsesSettings) {
    bootstrap_config::RulesSettings settings;
    settings.overrideEnv = "MY_RULES";
    settings.localDir = "MyRules";
    settings.extractDir = "my_rules";

    ResolveOptions o = makeResolveOptions(settings);
    EXPECT_EQ(o.overrideEnv, "MY_RULES");
    EXPECT_EQ(o.extractDirName, "my_rules");
    ASSERT_EQ(o.localCandidates.size(), 2u);
    EXPECT_EQ(o.localCandidates[0], fs::current_path() / "MyRules");
    EXPECT_EQ(o.localCandidates[1], executableDir() / "MyRules");
    EXPECT_EQ(o.extractRoot, fs::temp_directory_path());
}

TEST(ResourceOptionsTest, ExecutableDirIsADirectory) {
    EXPECT_TRUE(fs::is_directory(executableDir()));
}
