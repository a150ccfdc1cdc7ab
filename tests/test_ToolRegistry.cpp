/**
 * ToolRegistry: lookup, idempotent registration, conflicts and concurrent registration.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

#include "core/Errors.h"
#include "tools/ToolRegistry.h"

namespace {

class EchoTool : public ITool {
public:
    EchoTool(std::string name, std::string version = "1") : name(std::move(name)), version(std::move(version)) {}

    std::string getName() const override { return name; }
    std::string getDescription() const override { return "Echoes its input"; }
    nlohmann::json getSchema() const override {
        return {{"type", "object"}, {"properties", {{"video_path", {{"type", "string"}}}}}};
    }
    ToolKind getKind() const override { return ToolKind::Transform; }
    std::string getVersion() const override { return version; }

    nlohmann::json apply(const ToolContext& ctx, const nlohmann::json& args) override {
        (void)args;
        return {{"output_path", ctx.inputPath}, {"summary", nlohmann::json::object()}};
    }
    nlohmann::json verify(const ToolContext&, const nlohmann::json&, const nlohmann::json&) override {
        return {{"verified", true}, {"check", "echo"}};
    }

private:
    std::string name;
    std::string version;
};

}

TEST(ToolRegistryTest, LookupOfUnknownToolIsEmpty) {
    ToolRegistry registry;
    EXPECT_FALSE(registry.lookup("blur_faces").has_value());
    EXPECT_EQ(registry.getTool("blur_faces"), nullptr);
    EXPECT_FALSE(registry.hasTool("blur_faces"));
}

TEST(ToolRegistryTest, RegisterThenLookup) {
    ToolRegistry registry;
    auto tool = std::make_shared<EchoTool>("blur_plates");
    EXPECT_EQ(registry.registerTool(tool), ToolRegistry::RegisterOutcome::Registered);

    auto spec = registry.lookup("blur_plates");
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->kind, ToolKind::Transform);
    EXPECT_EQ(spec->origin, ToolOrigin::Builtin);
    EXPECT_EQ(spec->contentHash.size(), 64u);
    EXPECT_EQ(registry.getTool("blur_plates"), tool);
}

TEST(ToolRegistryTest, IdenticalRegistrationIsNoOp) {
    ToolRegistry registry;
    auto first = std::make_shared<EchoTool>("blur_plates");
    ASSERT_EQ(registry.registerTool(first), ToolRegistry::RegisterOutcome::Registered);

    ToolSpec spec = ToolSpec::forBuiltin(*first);
    auto second = std::make_shared<EchoTool>("blur_plates");
    EXPECT_EQ(registry.registerTool(spec, second), ToolRegistry::RegisterOutcome::AlreadyPresent);
    EXPECT_EQ(registry.getToolCount(), 1u);
    // The first registration stays in place
    EXPECT_EQ(registry.getTool("blur_plates"), first);
}

TEST(ToolRegistryTest, DifferentContentUnderSameNameConflicts) {
    ToolRegistry registry;
    registry.registerTool(std::make_shared<EchoTool>("blur_plates", "1"));
    EXPECT_THROW(registry.registerTool(std::make_shared<EchoTool>("blur_plates", "2")), RegistryConflict);
}

TEST(ToolRegistryTest, ReplaceIsExplicit) {
    ToolRegistry registry;
    registry.registerTool(std::make_shared<EchoTool>("blur_plates", "1"));
    auto replacement = std::make_shared<EchoTool>("blur_plates", "2");
    registry.replaceTool(ToolSpec::forBuiltin(*replacement), replacement);
    EXPECT_EQ(registry.getTool("blur_plates"), replacement);
}

TEST(ToolRegistryTest, SchemasAreSortedAndCarryParameters) {
    ToolRegistry registry;
    registry.registerTool(std::make_shared<EchoTool>("mute_words"));
    registry.registerTool(std::make_shared<EchoTool>("blur_plates"));

    auto schemas = registry.listToolSchemas();
    ASSERT_EQ(schemas.size(), 2u);
    EXPECT_EQ(schemas[0]["name"], "blur_plates");
    EXPECT_EQ(schemas[0]["kind"], "transform");
    EXPECT_TRUE(schemas[0]["parameters"]["properties"].contains("video_path"));
}

TEST(ToolRegistryTest, ConcurrentIdenticalRegistrationRegistersOnce) {
    ToolRegistry registry;
    std::atomic<int> registered{0};
    std::atomic<int> present{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto outcome = registry.registerTool(std::make_shared<EchoTool>("detect_plates"));
            if (outcome == ToolRegistry::RegisterOutcome::Registered) registered++;
            else present++;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(registered.load(), 1);
    EXPECT_EQ(present.load(), 7);
}

TEST(ToolKindTest, InferredFromName) {
    EXPECT_EQ(inferToolKind("detect_plates"), ToolKind::Detector);
    EXPECT_EQ(inferToolKind("blur_plates"), ToolKind::Transform);
    EXPECT_EQ(inferToolKind("mute_numbers"), ToolKind::Transform);
    EXPECT_EQ(inferToolKind("anonymize_scene"), ToolKind::Composite);
    // Only the leading word counts
    EXPECT_EQ(inferToolKind("blur_detected_plates"), ToolKind::Transform);
    EXPECT_EQ(inferToolKind("find_and_blur_plates"), ToolKind::Composite);
    EXPECT_THROW(toolKindFromName("filter"), std::invalid_argument);
}
