#pragma once
#include <functional>
#include <memory>
#include "audio/Transcript.h"
#include "core/ConfigManager.h"
#include "core/LLMClient.h"
#include "video/FaceDetector.h"

using FaceDetectorFactory = std::function<std::unique_ptr<IFaceDetector>()>;

/**
 * @brief Collaborators the built-in tools run against.
 *
 * Detectors hold per-stream state, so every detection pass asks the factory
 * for a fresh one.
 */
struct ToolServices {
    Config config;
    std::shared_ptr<LLMClient> llm;
    FaceDetectorFactory detectorFactory;
    std::shared_ptr<ITranscriber> transcriber;
};
