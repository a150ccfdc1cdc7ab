#pragma once
#include "tools/ToolRegistry.h"
#include "tools/ToolServices.h"

/**
 * @brief Registers detect_faces, blur, blur_faces, detect_keywords,
 * mute_segments and mute_keywords.
 */
void registerBuiltinTools(ToolRegistry& registry, const ToolServices& services);
