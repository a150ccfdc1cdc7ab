#include "tools/BuiltinTools.h"
#include "tools/AudioTools.h"
#include "tools/VideoTools.h"
#include "utils/Logger.h"

void registerBuiltinTools(ToolRegistry& registry, const ToolServices& services) {
    registry.registerTool(std::make_shared<DetectFacesTool>(services));
    registry.registerTool(std::make_shared<BlurTool>(services));
    registry.registerTool(std::make_shared<BlurFacesTool>(services));
    registry.registerTool(std::make_shared<DetectKeywordsTool>(services));
    registry.registerTool(std::make_shared<MuteSegmentsTool>(services));
    registry.registerTool(std::make_shared<MuteKeywordsTool>(services));
    Logger::getInstance().info("Registered " + std::to_string(registry.getToolCount()) + " tools");
}
