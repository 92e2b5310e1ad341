/*
 * Verbalizer and the public free functions.
 */

#include "mathwords.hpp"
#include "fake_engines.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace mathwords;
using mathwords::fakes::FakeLatexEngine;
using mathwords::fakes::FakeSpeechEngine;
using mathwords::fakes::ScopedTempDir;

namespace {

class VerbalizerTest : public ::testing::Test {
protected:
    Verbalizer::Options options(bool serialize = true) {
        Verbalizer::Options o;
        o.rules.overrideEnv.clear();
        o.rules.localCandidates = {rulesDir.path()};
        o.rules.extractRoot = rulesDir.path();
        o.serializeConversions = serialize;
        return o;
    }

    ScopedTempDir rulesDir;
    std::shared_ptr<FakeSpeechEngine> speech = std::make_shared<FakeSpeechEngine>();
    std::shared_ptr<FakeLatexEngine> latex = std::make_shared<FakeLatexEngine>();
};

} // namespace

// ========================================================================
// Scenarios
// ========================================================================

TEST_F(VerbalizerTest, LatexExpressionProducesPlainText) {
    Verbalizer v(speech, latex, options());
    std::string text = v.verbalize("x+y", false, "ClearSpeak");

    EXPECT_FALSE(text.empty());
    EXPECT_EQ(text.find('<'), std::string::npos);
    EXPECT_EQ(speech->count("SetRulesDir:" + rulesDir.path().string()), 1u);
}

TEST_F(VerbalizerTest, MathMLInputNeverCallsLatexStage) {
    Verbalizer v(speech, latex, options());
    EXPECT_EQ(v.verbalize("<math><mi>x</mi></math>", true), "x");
    EXPECT_EQ(latex->creates(), 0u);
    EXPECT_EQ(latex->conversions(), 0u);
}

TEST_F(VerbalizerTest, BatchReturnsOrderedResultsWithOneInitialization) {
    Verbalizer v(speech, latex, options());
    auto results = v.verbalizeBatch({{"x", false}, {"y", false}}, "SimpleSpeak");

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0], "x");
    EXPECT_EQ(results[1], "y");
    EXPECT_EQ(v.initializer().fullInitializations(), 1u);
    EXPECT_EQ(speech->count("SetRulesDir"), 1u);
}

TEST_F(VerbalizerTest, DisplayFlagSelectsBlockMode) {
    Verbalizer v(speech, latex, options());
    v.verbalize("x", false, "ClearSpeak", true);
    ASSERT_EQ(latex->modes().size(), 1u);
    EXPECT_EQ(latex->modes()[0], engine::DisplayMode::Block);
}

// ========================================================================
// Errors
// ========================================================================

TEST_F(VerbalizerTest, EmptyInputsThrowValidationError) {
    Verbalizer v(speech, latex, options());
    EXPECT_THROW(v.verbalize(""), ValidationError);
    EXPECT_THROW(v.verbalize("   "), ValidationError);
    EXPECT_THROW(v.verbalizeBatch({}), ValidationError);
    EXPECT_TRUE(speech->calls().empty());
    EXPECT_FALSE(v.initializer().isReady());
}

TEST_F(VerbalizerTest, ValidationErrorIsInvalidArgument) {
    Verbalizer v(speech, latex, options());
    try {
        v.verbalize("");
        FAIL() << "expected ValidationError";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "Input cannot be empty");
    }
}

TEST_F(VerbalizerTest, EngineFailuresThrowConversionError) {
    latex->failInput = "\\oops";
    Verbalizer v(speech, latex, options());
    try {
        v.verbalize("\\oops");
        FAIL() << "expected ConversionError";
    } catch (const ConversionError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::LatexConversion);
        EXPECT_FALSE(e.panicked());
        EXPECT_EQ(std::string(e.what()).rfind("Failed to convert LaTeX to MathML: ", 0), 0u);
    }
}

TEST_F(VerbalizerTest, PanicSurfacesAsRuntimeError) {
    speech->throws["GetSpokenText"] = "boom";
    Verbalizer v(speech, latex, options());
    try {
        v.verbalize("x");
        FAIL() << "expected ConversionError";
    } catch (const std::runtime_error& e) {
        auto* conv = dynamic_cast<const ConversionError*>(&e);
        ASSERT_NE(conv, nullptr);
        EXPECT_TRUE(conv->panicked());
        EXPECT_EQ(conv->kind(), ErrorKind::MathMLConversion);
    }
}

TEST_F(VerbalizerTest, TryVerbalizeReportsWithoutThrowing) {
    speech->failures["SetRulesDir"] = "bad";
    Verbalizer v(speech, latex, options());
    std::string text;
    ErrorInfo err;
    EXPECT_FALSE(v.tryVerbalize("x", false, "ClearSpeak", false, text, &err));
    EXPECT_EQ(err.kind, ErrorKind::Initialization);
    EXPECT_EQ(err.describe(), "Failed to initialize speech engine: Failed to set rules directory: bad");
}

TEST_F(VerbalizerTest, BatchFailFastThrowsAndStops) {
    speech->failMathMLContaining = "<mi>bad</mi>";
    Verbalizer v(speech, latex, options());
    EXPECT_THROW(v.verbalizeBatch({{"x", false}, {"bad", false}, {"z", false}}), ConversionError);
    EXPECT_EQ(latex->conversions(), 2u);
}

// ========================================================================
// Host lock hooks
// ========================================================================

TEST_F(VerbalizerTest, HostLockReleasedAroundConversion) {
    Verbalizer v(speech, latex, options());
    std::vector<std::string> events;
    v.setHostLockHooks({
        [&] { events.push_back("release:" + std::to_string(speech->calls().size())); },
        [&] { events.push_back("reacquire:" + std::to_string(speech->calls().size())); },
    });

    v.verbalize("x");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], "release:0");
    EXPECT_EQ(events[1], "reacquire:5");
}

TEST_F(VerbalizerTest, HostLockReacquiredOnFailure) {
    latex->failInput = "bad";
    Verbalizer v(speech, latex, options());
    int released = 0, reacquired = 0;
    v.setHostLockHooks({[&] { released++; }, [&] { reacquired++; }});

    EXPECT_THROW(v.verbalize("bad"), ConversionError);
    EXPECT_THROW(v.verbalizeBatch({{"bad", false}}), ConversionError);
    EXPECT_EQ(released, 2);
    EXPECT_EQ(reacquired, 2);
}

TEST_F(VerbalizerTest, BlankInputDoesNotTouchHostLock) {
    Verbalizer v(speech, latex, options());
    int calls = 0;
    v.setHostLockHooks({[&] { calls++; }, [&] { calls++; }});
    EXPECT_THROW(v.verbalize(" "), ValidationError);
    EXPECT_EQ(calls, 0);
}

// ========================================================================
// Concurrency
// ========================================================================

TEST_F(VerbalizerTest, ConcurrentCallersShareOneInitialization) {
    Verbalizer v(speech, latex, options());
    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 20; i++) {
                std::string input = "v" + std::to_string(t) + "_" + std::to_string(i);
                if (v.verbalize(input) != input) mismatches++;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(v.initializer().fullInitializations(), 1u);
    EXPECT_EQ(speech->count("SetRulesDir"), 1u);
}

TEST_F(VerbalizerTest, VerbalizersOverOneEngineInitializeOnce) {
    Verbalizer first(speech, latex, options());
    Verbalizer second(speech, latex, options());

    EXPECT_EQ(first.verbalize("x"), "x");
    EXPECT_EQ(second.verbalize("y", false, "SimpleSpeak"), "y");

    EXPECT_EQ(speech->count("SetRulesDir"), 1u);
    EXPECT_EQ(speech->count("SetPreference:Language"), 1u);
    EXPECT_EQ(&first.initializer(), &second.initializer());
    EXPECT_EQ(second.initializer().styleUpdates(), 1u);
}

TEST_F(VerbalizerTest, EngineStateOutlivesVerbalizer) {
    {
        Verbalizer first(speech, latex, options());
        first.verbalize("x");
    }
    Verbalizer second(speech, latex, options());
    EXPECT_TRUE(second.initializer().isReady());
    second.verbalize("y");
    EXPECT_EQ(speech->count("SetRulesDir"), 1u);
}

// ========================================================================
// Metadata
// ========================================================================

TEST(PublicApiTest, SpeechStylesAreFixed) {
    EXPECT_EQ(listSpeechStyles(), (std::vector<std::string>{"ClearSpeak", "SimpleSpeak"}));
}

TEST(PublicApiTest, VersionAndDescription) {
    EXPECT_FALSE(version().empty());
    EXPECT_FALSE(description().empty());
}

TEST(PublicApiTest, FreeFunctionsValidateBeforeLoadingEngines) {
    EXPECT_THROW(verbalize(""), ValidationError);
    EXPECT_THROW(verbalizeBatch({}), ValidationError);
}
