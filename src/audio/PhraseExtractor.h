#pragma once
#include <memory>
#include <string>
#include <vector>
#include "core/LLMClient.h"

/**
 * @brief Asks the language model which exact transcript phrases the user wants removed.
 */
class PhraseExtractor {
public:
    explicit PhraseExtractor(std::shared_ptr<LLMClient> llm);

    /**
     * @return phrases quoted verbatim from the transcript (may be empty)
     * @throws std::runtime_error when the model answer lacks a "phrases" array
     */
    std::vector<std::string> extract(const std::string& transcript, const std::string& intent) const;

private:
    std::shared_ptr<LLMClient> llm;
};
