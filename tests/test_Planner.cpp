/**
 * Planner: manifest construction against the registry, on-demand generation and replanning prompts.
 */
#include <gtest/gtest.h>
#include "core/Errors.h"
#include "planner/Planner.h"
#include "TestDoubles.h"

namespace {

// Registers a scripted tool instead of writing Python; can be told to fail.
class FakeGenerator : public ToolGenerator {
public:
    FakeGenerator(std::shared_ptr<LLMClient> llm, ToolRegistry& registry, int failuresBeforeSuccess = 0)
        : ToolGenerator(std::move(llm), registry, Config::Pipeline()), registry(registry),
          failuresLeft(failuresBeforeSuccess) {}

    ToolSpec generate(const GenerationRequest& request) override {
        requests.push_back(request);
        if (failuresLeft > 0) {
            failuresLeft--;
            throw GenerationFailure("sandbox screen rejected " + request.name);
        }
        auto tool = std::make_shared<ScriptedTool>(
            request.name, request.kind ? *request.kind : inferToolKind(request.name),
            [](const ToolContext& c, const nlohmann::json&) { return writeOutput(c); },
            [](const nlohmann::json&, const nlohmann::json&) { return passed(); });
        ToolSpec spec = ToolSpec::forBuiltin(*tool);
        spec.origin = ToolOrigin::Generated;
        registry.registerTool(spec, tool);
        return spec;
    }

    std::vector<GenerationRequest> requests;

private:
    ToolRegistry& registry;
    int failuresLeft;
};

std::shared_ptr<ScriptedTool> builtin(const std::string& name) {
    return std::make_shared<ScriptedTool>(
        name, ToolKind::Composite, [](const ToolContext& c, const nlohmann::json&) { return writeOutput(c); },
        [](const nlohmann::json&, const nlohmann::json&) { return passed(); });
}

class PlannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        llm = std::make_shared<MockLLMClient>();
        registry.registerTool(builtin("blur_faces"));
        registry.registerTool(builtin("mute_keywords"));
    }

    std::shared_ptr<MockLLMClient> llm;
    ToolRegistry registry;
    RecordingAuditSink audit;
};

}

TEST_F(PlannerTest, RegisteredToolNeedsNoGeneration) {
    llm->queueJson({{"pipeline", {{{"tool", "blur_faces"}, {"args", nlohmann::json::object()}}}}});
    FakeGenerator generator(llm, registry);
    Planner planner(llm, registry, generator, &audit);

    Manifest m = planner.plan("blur faces in my video");
    ASSERT_EQ(m.steps.size(), 1u);
    EXPECT_EQ(m.steps[0].tool, "blur_faces");
    EXPECT_FALSE(m.steps[0].generated);
    EXPECT_TRUE(generator.requests.empty());
    EXPECT_EQ(audit.count(AuditStage::Plan, AuditOutcome::Ok), 1u);
}

TEST_F(PlannerTest, SystemPromptListsRegisteredTools) {
    llm->queueJson({{"pipeline", {{{"tool", "mute_keywords"}}}}});
    FakeGenerator generator(llm, registry);
    Planner planner(llm, registry, generator);
    planner.plan("mute my address");
    // The user prompt carries the request; the catalogue goes in the system role
    ASSERT_EQ(llm->prompts.size(), 1u);
    EXPECT_NE(llm->prompts[0].find("mute my address"), std::string::npos);
}

TEST_F(PlannerTest, MissingToolIsGeneratedBeforeTheManifestReturns) {
    llm->queueJson({{"pipeline",
                     {{{"tool", "detect_plates"}, {"args", {{"min_size", 20}}}, {"description", "Find plates"}},
                      {{"tool", "blur_faces"}}}}});
    FakeGenerator generator(llm, registry);
    Planner planner(llm, registry, generator);

    Manifest m = planner.plan("blur licence plates");
    ASSERT_EQ(generator.requests.size(), 1u);
    EXPECT_EQ(generator.requests[0].name, "detect_plates");
    EXPECT_EQ(generator.requests[0].description, "Find plates");
    EXPECT_EQ(generator.requests[0].arguments["min_size"], 20);
    EXPECT_TRUE(m.steps[0].generated);
    EXPECT_FALSE(m.steps[1].generated);
    EXPECT_NO_THROW(m.requireRegistered(registry));
}

TEST_F(PlannerTest, ToolNamesAreNormalized) {
    llm->queueJson({{"pipeline", {{{"tool", "Blur Faces"}}}}});
    FakeGenerator generator(llm, registry);
    Planner planner(llm, registry, generator);
    Manifest m = planner.plan("blur faces");
    EXPECT_EQ(m.steps[0].tool, "blur_faces");
    EXPECT_TRUE(generator.requests.empty());
}

TEST_F(PlannerTest, MalformedToolNameIsPlanningFailure) {
    llm->queueJson({{"pipeline", {{{"tool", "blur!!"}}}}});
    FakeGenerator generator(llm, registry);
    Planner planner(llm, registry, generator, &audit);
    EXPECT_THROW(planner.plan("blur things"), PlanningFailure);
    EXPECT_TRUE(generator.requests.empty());
    EXPECT_EQ(audit.count(AuditStage::Plan, AuditOutcome::Fail), 1u);
}

TEST_F(PlannerTest, MalformedReplyIsPlanningFailure) {
    llm->queueJson({{"answer", "use blur_faces"}});
    FakeGenerator generator(llm, registry);
    Planner planner(llm, registry, generator);
    EXPECT_THROW(planner.plan("blur faces"), PlanningFailure);
}

TEST_F(PlannerTest, ModelErrorIsPlanningFailure) {
    FakeGenerator generator(llm, registry);
    Planner planner(llm, registry, generator);
    EXPECT_THROW(planner.plan("blur faces"), PlanningFailure);
}

TEST_F(PlannerTest, GenerationIsRetriedOnceWithFeedback) {
    llm->queueJson({{"pipeline", {{{"tool", "blur_plates"}}}}});
    FakeGenerator generator(llm, registry, 1);
    Planner planner(llm, registry, generator);

    Manifest m = planner.plan("blur plates");
    ASSERT_EQ(generator.requests.size(), 2u);
    EXPECT_TRUE(generator.requests[0].previousFailure.empty());
    EXPECT_NE(generator.requests[1].previousFailure.find("sandbox screen"), std::string::npos);
    EXPECT_TRUE(m.steps[0].generated);
}

TEST_F(PlannerTest, SecondGenerationFailureIsPlanningFailure) {
    llm->queueJson({{"pipeline", {{{"tool", "blur_plates"}}}}});
    FakeGenerator generator(llm, registry, 2);
    Planner planner(llm, registry, generator);
    EXPECT_THROW(planner.plan("blur plates"), PlanningFailure);
    EXPECT_EQ(generator.requests.size(), 2u);
    EXPECT_FALSE(registry.hasTool("blur_plates"));
}

TEST_F(PlannerTest, ReusedGeneratedToolIsRecordedAsGenerated) {
    llm->queueJson({{"pipeline", {{{"tool", "detect_plates"}, {"description", "Find plates"}}}}});
    llm->queueJson({{"pipeline", {{{"tool", "detect_plates"}, {"args", {{"min_size", 10}}}}, {{"tool", "blur_faces"}}}}});
    FakeGenerator generator(llm, registry);
    Planner planner(llm, registry, generator);

    Manifest first = planner.plan("blur licence plates");
    DiagnosticContext diag;
    diag.priorManifest = first;
    diag.failedStage = "detection";
    diag.tool = "detect_plates";
    Manifest second = planner.plan("blur licence plates", diag);

    EXPECT_EQ(generator.requests.size(), 1u);
    EXPECT_TRUE(first.steps[0].generated);
    EXPECT_TRUE(second.steps[0].generated);
    EXPECT_FALSE(second.steps[1].generated);
}

TEST_F(PlannerTest, NewToolNameMustMatchItsKind) {
    llm->queueJson({{"pipeline", {{{"tool", "blur_plates"}, {"kind", "detector"}}}}});
    llm->queueJson({{"pipeline", {{{"tool", "detect_and_blur_plates"}, {"kind", "composite"}}}}});
    llm->queueJson({{"pipeline", {{{"tool", "anonymize_plates"}, {"kind", "transform"}}}}});
    llm->queueJson({{"pipeline", {{{"tool", "find_plates"}, {"kind", "sorter"}}}}});
    FakeGenerator generator(llm, registry);
    Planner planner(llm, registry, generator, &audit);

    EXPECT_THROW(planner.plan("blur plates"), PlanningFailure);
    EXPECT_THROW(planner.plan("blur plates"), PlanningFailure);
    EXPECT_THROW(planner.plan("blur plates"), PlanningFailure);
    EXPECT_THROW(planner.plan("blur plates"), PlanningFailure);
    EXPECT_TRUE(generator.requests.empty());
    EXPECT_EQ(audit.count(AuditStage::Plan, AuditOutcome::Fail), 4u);
}

TEST_F(PlannerTest, DeclaredKindReachesTheGenerator) {
    llm->queueJson({{"pipeline", {{{"tool", "anonymize_plates"}, {"kind", "composite"}}}}});
    FakeGenerator generator(llm, registry);
    Planner planner(llm, registry, generator);

    planner.plan("anonymize plates");
    ASSERT_EQ(generator.requests.size(), 1u);
    ASSERT_TRUE(generator.requests[0].kind.has_value());
    EXPECT_EQ(*generator.requests[0].kind, ToolKind::Composite);
    EXPECT_EQ(registry.lookup("anonymize_plates")->kind, ToolKind::Composite);
}

TEST_F(PlannerTest, ReplanPromptCarriesDiagnostics) {
    llm->queueJson({{"pipeline", {{{"tool", "blur_faces"}, {"args", {{"detect_every", 1}}}}}}});
    FakeGenerator generator(llm, registry);
    Planner planner(llm, registry, generator);

    DiagnosticContext diag;
    diag.priorManifest = Manifest::fromJson({{"pipeline", {{{"tool", "blur_faces"}}}}});
    diag.failedStage = "detection";
    diag.tool = "blur_faces";
    diag.category = "DetectionVerificationFailure";
    diag.error = "miss ratio 0.2 is not below 0.1";
    planner.plan("blur faces", diag);

    ASSERT_EQ(llm->prompts.size(), 1u);
    const std::string& prompt = llm->prompts[0];
    EXPECT_NE(prompt.find("DetectionVerificationFailure"), std::string::npos);
    EXPECT_NE(prompt.find("miss ratio 0.2"), std::string::npos);
    EXPECT_NE(prompt.find("\"blur_faces\""), std::string::npos);
}

TEST(PlannerNameTest, WellFormedToolNames) {
    EXPECT_TRUE(Planner::isWellFormedToolName("detect_plates"));
    EXPECT_TRUE(Planner::isWellFormedToolName("mute_phone_numbers"));
    EXPECT_FALSE(Planner::isWellFormedToolName("blur"));
    EXPECT_FALSE(Planner::isWellFormedToolName("Blur_Plates"));
    EXPECT_FALSE(Planner::isWellFormedToolName("_blur_plates"));
    EXPECT_FALSE(Planner::isWellFormedToolName("blur__plates"));
}

TEST(PlannerNameTest, PrefixFollowsKind) {
    EXPECT_TRUE(Planner::nameMatchesKind("detect_plates", ToolKind::Detector));
    EXPECT_TRUE(Planner::nameMatchesKind("mute_phone_numbers", ToolKind::Transform));
    EXPECT_TRUE(Planner::nameMatchesKind("blur_plates", ToolKind::Transform));
    EXPECT_TRUE(Planner::nameMatchesKind("anonymize_scene", ToolKind::Composite));
    EXPECT_TRUE(Planner::nameMatchesKind("blur_plates", ToolKind::Composite));
    EXPECT_FALSE(Planner::nameMatchesKind("blur_plates", ToolKind::Detector));
    EXPECT_FALSE(Planner::nameMatchesKind("find_plates", ToolKind::Detector));
    EXPECT_FALSE(Planner::nameMatchesKind("detect_plates", ToolKind::Transform));
    EXPECT_FALSE(Planner::nameMatchesKind("detect_plates", ToolKind::Composite));
    EXPECT_FALSE(Planner::nameMatchesKind("anonymize_plates", ToolKind::Transform));
}
