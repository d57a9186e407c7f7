#include <drogon/drogon_test.h>
#include "../adapters/ThinkingExtractor.h"

DROGON_TEST(ThinkingExtractor_ShortTextUntouched)
{
    HeuristicThinkingExtractor extractor;
    auto split = extractor.extract("Because. It. Rains.", Json::Value());
    CHECK(!split.found);
    CHECK(split.text == "Because. It. Rains.");
}

DROGON_TEST(ThinkingExtractor_SplitsHalfOfSentences)
{
    const std::string text =
        "Let me think about this question in detail. First the inputs must be checked. "
        "Then the totals are summed. Finally the answer is 42.";
    HeuristicThinkingExtractor extractor;
    auto split = extractor.extract(text, Json::Value());
    REQUIRE(split.found);
    CHECK(split.thinking == "Let me think about this question in detail. First the inputs must be checked");
    CHECK(split.text == "Then the totals are summed. Finally the answer is 42.");
}

DROGON_TEST(ThinkingExtractor_NoKeywordNoSplit)
{
    const std::string text =
        "The sky is blue today in the city. The sun is out over the harbor. "
        "Birds are singing in the park. People are walking outside.";
    HeuristicThinkingExtractor extractor;
    CHECK(!extractor.extract(text, Json::Value()).found);
}

DROGON_TEST(ThinkingExtractor_NativePrefersReasoningField)
{
    Json::Value message(Json::objectValue);
    message["reasoning_content"] = "step by step";
    NativeReasoningExtractor extractor;
    auto split = extractor.extract("answer", message);
    REQUIRE(split.found);
    CHECK(split.thinking == "step by step");
    CHECK(split.text == "answer");
}

DROGON_TEST(ThinkingExtractor_FactoryModes)
{
    CHECK(makeThinkingExtractor("heuristic")->name() == "heuristic");
    CHECK(makeThinkingExtractor("native")->name() == "native");
    CHECK(makeThinkingExtractor("off") == nullptr);
    CHECK(makeThinkingExtractor("bogus") == nullptr);
}
