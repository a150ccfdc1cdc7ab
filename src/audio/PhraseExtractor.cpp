#include "audio/PhraseExtractor.h"
#include <stdexcept>
#include "utils/Logger.h"

namespace {
const char* kSystemRole =
    "You find sensitive spoken content in transcripts. "
    "Reply with a JSON object {\"phrases\": [\"...\"]} listing every phrase from the transcript "
    "that the user's request asks to remove. Copy each phrase exactly as it appears in the transcript. "
    "Reply {\"phrases\": []} when nothing matches.";
}

PhraseExtractor::PhraseExtractor(std::shared_ptr<LLMClient> llm) : llm(std::move(llm)) {}

std::vector<std::string> PhraseExtractor::extract(const std::string& transcript, const std::string& intent) const {
    if (transcript.empty()) return {};

    std::string prompt = "User request: " + intent + "\n\nTranscript:\n" + transcript;
    nlohmann::json answer = llm->chatJson(prompt, kSystemRole);
    if (!answer.contains("phrases") || !answer["phrases"].is_array()) {
        throw std::runtime_error("phrase extraction answer has no \"phrases\" array");
    }

    std::vector<std::string> phrases;
    for (const auto& p : answer["phrases"]) {
        if (p.is_string() && !p.get<std::string>().empty()) phrases.push_back(p.get<std::string>());
    }
    Logger::getInstance().info("Sensitive phrases: " + nlohmann::json(phrases).dump());
    return phrases;
}
