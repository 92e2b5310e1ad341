/*
 * ConversionPipeline: validation, stage routing, error mapping.
 */

#include "pipeline.hpp"
#include "fake_engines.hpp"

#include <gtest/gtest.h>

using namespace mathwords;
using mathwords::fakes::FakeLatexEngine;
using mathwords::fakes::FakeSpeechEngine;

namespace {

class PipelineTest : public ::testing::Test {
protected:
    PipelineTest()
        : init(speech,
               [](resources::RulesLocation& loc, ErrorInfo*) {
                   loc.path = "/rules";
                   return true;
               }),
          pipeline(init, speech, latex, &conversionLock) {}

    ConversionRequest request(const std::string& input, InputKind kind = InputKind::LaTeX) {
        ConversionRequest r;
        r.input = input;
        r.kind = kind;
        return r;
    }

    FakeSpeechEngine speech;
    FakeLatexEngine latex;
    std::mutex conversionLock;
    EngineInitializer init;
    ConversionPipeline pipeline;
};

} // namespace

TEST(ValidationTest, BlankDetection) {
    EXPECT_TRUE(isBlank(""));
    EXPECT_TRUE(isBlank("   "));
    EXPECT_TRUE(isBlank("\t\n "));
    EXPECT_FALSE(isBlank(" x "));
}

TEST_F(PipelineTest, EmptyAndWhitespaceInputNeverReachEngine) {
    for (const std::string input : {"", "   ", "\n\t"}) {
        std::string text;
        ErrorInfo err;
        EXPECT_FALSE(pipeline.convert(request(input), text, &err));
        EXPECT_EQ(err.kind, ErrorKind::Validation);
        EXPECT_EQ(err.code, "ERR_EMPTY_INPUT");
    }
    EXPECT_TRUE(speech.calls().empty());
    EXPECT_EQ(latex.creates(), 0u);
    EXPECT_EQ(init.status(), EngineStatus::Uninitialized);
}

TEST_F(PipelineTest, LatexGoesThroughBothStages) {
    std::string text;
    ErrorInfo err;
    ASSERT_TRUE(pipeline.convert(request("x+y"), text, &err)) << err.describe();

    EXPECT_EQ(text, "x+y");
    EXPECT_EQ(latex.creates(), 1u);
    EXPECT_EQ(latex.conversions(), 1u);
    EXPECT_EQ(speech.count("SetMathML:<math><mi>x+y</mi></math>"), 1u);
    EXPECT_EQ(speech.count("GetSpokenText"), 1u);
    EXPECT_EQ(text.find('<'), std::string::npos);
}

TEST_F(PipelineTest, MathMLSkipsLatexStage) {
    std::string text;
    ASSERT_TRUE(pipeline.convert(request("<math><mi>x</mi></math>", InputKind::MathML), text, nullptr));
    EXPECT_EQ(text, "x");
    EXPECT_EQ(latex.creates(), 0u);
    EXPECT_EQ(latex.conversions(), 0u);
    EXPECT_EQ(speech.count("SetMathML:<math><mi>x</mi></math>"), 1u);
}

TEST_F(PipelineTest, DisplayModeIsForwarded) {
    ConversionRequest r = request("x");
    r.displayMode = engine::DisplayMode::Block;
    std::string text;
    ASSERT_TRUE(pipeline.convert(r, text, nullptr));

    ASSERT_EQ(latex.modes().size(), 1u);
    EXPECT_EQ(latex.modes()[0], engine::DisplayMode::Block);
    EXPECT_EQ(speech.count("SetMathML:<math display=\"block\">"), 1u);
}

TEST_F(PipelineTest, ConverterUsesDefaultConfig) {
    std::string text;
    ASSERT_TRUE(pipeline.convert(request("x"), text, nullptr));
    EXPECT_EQ(latex.lastConfigJson(), engine::LatexConfig{}.toJson());
}

TEST_F(PipelineTest, SpeechStyleReachesInitializer) {
    ConversionRequest r = request("x");
    r.speechStyle = "SimpleSpeak";
    std::string text;
    ASSERT_TRUE(pipeline.convert(r, text, nullptr));
    EXPECT_EQ(speech.count("SetPreference:SpeechStyle=SimpleSpeak"), 1u);
}

TEST_F(PipelineTest, LatexFailureIsLatexConversionError) {
    latex.failInput = "\\frac{";
    std::string text = "unchanged";
    ErrorInfo err;
    EXPECT_FALSE(pipeline.convert(request("\\frac{"), text, &err));

    EXPECT_EQ(err.kind, ErrorKind::LatexConversion);
    EXPECT_EQ(err.code, "ERR_LATEX_CONVERSION");
    EXPECT_NE(err.message.find("unexpected token"), std::string::npos);
    EXPECT_EQ(err.describe().rfind("Failed to convert LaTeX to MathML: ", 0), 0u);
    EXPECT_EQ(speech.count("SetMathML"), 0u);
    EXPECT_EQ(text, "unchanged");
}

TEST_F(PipelineTest, ConverterConstructionFailureIsLatexConversionError) {
    latex.createFailure = "bad config";
    ErrorInfo err;
    std::string text;
    EXPECT_FALSE(pipeline.convert(request("x"), text, &err));
    EXPECT_EQ(err.kind, ErrorKind::LatexConversion);
    EXPECT_NE(err.message.find("bad config"), std::string::npos);
}

TEST_F(PipelineTest, ConverterPanicIsContained) {
    latex.throwInput = "boom";
    ErrorInfo err;
    std::string text;
    EXPECT_FALSE(pipeline.convert(request("boom"), text, &err));
    EXPECT_TRUE(err.panicked);
    EXPECT_EQ(err.kind, ErrorKind::LatexConversion);
    EXPECT_EQ(err.message, "LatexToMathML panicked");
}

TEST_F(PipelineTest, ConstructorPanicIsContained) {
    latex.createThrows = true;
    ErrorInfo err;
    std::string text;
    EXPECT_FALSE(pipeline.convert(request("x"), text, &err));
    EXPECT_TRUE(err.panicked);
    EXPECT_EQ(err.kind, ErrorKind::LatexConversion);
}

TEST_F(PipelineTest, SetMathMLFailureIsMathMLConversionError) {
    speech.failures["SetMathML"] = "unbalanced tags";
    ErrorInfo err;
    std::string text;
    EXPECT_FALSE(pipeline.convert(request("<math>", InputKind::MathML), text, &err));
    EXPECT_EQ(err.kind, ErrorKind::MathMLConversion);
    EXPECT_EQ(err.message, "Failed to set MathML: unbalanced tags");
    EXPECT_EQ(speech.count("GetSpokenText"), 0u);
}

TEST_F(PipelineTest, SpokenTextPanicIsMathMLConversionError) {
    speech.throws["GetSpokenText"] = "rule recursion";
    ErrorInfo err;
    std::string text;
    EXPECT_FALSE(pipeline.convert(request("x"), text, &err));
    EXPECT_EQ(err.kind, ErrorKind::MathMLConversion);
    EXPECT_TRUE(err.panicked);
    EXPECT_EQ(err.message, "GetSpokenText panicked");
}

TEST_F(PipelineTest, InitializationFailureStopsBeforeConversion) {
    speech.failures["SetRulesDir"] = "missing";
    ErrorInfo err;
    std::string text;
    EXPECT_FALSE(pipeline.convert(request("x"), text, &err));
    EXPECT_EQ(err.kind, ErrorKind::Initialization);
    EXPECT_EQ(latex.creates(), 0u);
}

TEST_F(PipelineTest, ConversionLockIsHeldDuringConvert) {
    // The lock is free before and after; render() itself does not take it
    ASSERT_TRUE(conversionLock.try_lock());
    conversionLock.unlock();

    std::string text;
    ASSERT_TRUE(pipeline.convert(request("x"), text, nullptr));
    ASSERT_TRUE(conversionLock.try_lock());
    EXPECT_TRUE(pipeline.render(request("y"), text, nullptr));
    conversionLock.unlock();
    EXPECT_EQ(text, "y");
}
