#include "core/LLMClient.h"
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <algorithm>
#include <chrono>
#include <regex>
#include <stdexcept>
#include <thread>
#include "utils/Logger.h"

LLMClient::LLMClient(const Config::LLM& settings) : settings(settings) {
    parseBaseUrl(settings.baseUrl);
}

LLMClient::LLMClient(const std::string& apiKey, const std::string& baseUrl, const std::string& model) {
    settings.apiKey = apiKey;
    settings.baseUrl = baseUrl;
    settings.model = model;
    parseBaseUrl(baseUrl);
}

void LLMClient::parseBaseUrl(const std::string& url) {
    std::regex urlRegex(R"((http|https)://([^/:]+)(?::(\d+))?(.*))");
    std::smatch match;
    if (std::regex_match(url, match, urlRegex)) {
        isSsl = (match[1] == "https");
        host = match[2];
        if (match[3].matched) {
            port = std::stoi(match[3]);
        } else {
            port = isSsl ? 443 : 80;
        }
        pathPrefix = match[4];
    } else {
        // Bare host name
        isSsl = true;
        host = url;
        port = 443;
        pathPrefix = "";
    }
}

std::string stripCodeFence(const std::string& text) {
    std::string s = text;
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    s = s.substr(first);
    if (s.rfind("```", 0) == 0) {
        size_t nl = s.find('\n');
        s = (nl == std::string::npos) ? "" : s.substr(nl + 1);
        size_t close = s.rfind("```");
        if (close != std::string::npos) s = s.substr(0, close);
    }
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

std::string LLMClient::chat(const std::string& prompt, const std::string& systemRole) {
    nlohmann::json messages = nlohmann::json::array();
    std::string role = systemRole.empty() ? "You are a helpful assistant." : systemRole;
    messages.push_back({{"role", "system"}, {"content", role}});
    messages.push_back({{"role", "user"}, {"content", prompt}});

    nlohmann::json res = complete(messages, false);
    if (res.is_object() && res.contains("choices") && !res["choices"].empty()) {
        auto& msg = res["choices"][0]["message"];
        if (msg.contains("content") && msg["content"].is_string()) {
            return msg["content"];
        }
    }
    return "";
}

nlohmann::json LLMClient::chatJson(const std::string& prompt, const std::string& systemRole) {
    nlohmann::json messages = nlohmann::json::array();
    messages.push_back({{"role", "system"}, {"content", systemRole}});
    messages.push_back({{"role", "user"}, {"content", prompt}});

    nlohmann::json res = complete(messages, true);
    if (!res.is_object() || !res.contains("choices") || res["choices"].empty()) {
        throw std::runtime_error("LLM returned no choices");
    }
    const auto& msg = res["choices"][0]["message"];
    if (!msg.contains("content") || !msg["content"].is_string()) {
        throw std::runtime_error("LLM returned no content");
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(stripCodeFence(msg["content"].get<std::string>()));
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("LLM returned malformed JSON: ") + e.what());
    }
    if (!parsed.is_object()) {
        throw std::runtime_error("LLM returned JSON that is not an object");
    }
    return parsed;
}

nlohmann::json LLMClient::complete(const nlohmann::json& messages, bool jsonMode) {
    httplib::Headers headers = {
        {"Authorization", "Bearer " + settings.apiKey},
        {"Content-Type", "application/json"}
    };

    nlohmann::json body = {
        {"model", settings.model},
        {"messages", messages},
        {"temperature", settings.temperature}
    };
    if (jsonMode) {
        body["response_format"] = {{"type", "json_object"}};
    }

    std::string endpoint = pathPrefix + "/chat/completions";
    std::string bodyStr = body.dump();
    auto& logger = Logger::getInstance();

    httplib::Result res;
    int retryCount = 0;
    const int maxRetries = std::max(1, settings.maxRetries);

    while (retryCount < maxRetries) {
        try {
            if (isSsl) {
                httplib::SSLClient cli(host, port);
                cli.set_follow_location(true);
                cli.set_connection_timeout(settings.connectTimeoutSec);
                cli.set_read_timeout(settings.readTimeoutSec);
                res = cli.Post(endpoint.c_str(), headers, bodyStr, "application/json");
            } else {
                httplib::Client cli(host, port);
                cli.set_follow_location(true);
                cli.set_connection_timeout(settings.connectTimeoutSec);
                cli.set_read_timeout(settings.readTimeoutSec);
                res = cli.Post(endpoint.c_str(), headers, bodyStr, "application/json");
            }

            if (res && res->status == 200) break;

            retryCount++;
            if (retryCount < maxRetries) {
                logger.warn("API request failed (Status: " + (res ? std::to_string(res->status) : std::string("Timeout")) +
                            "). Retrying (" + std::to_string(retryCount) + "/" + std::to_string(maxRetries) + ")...");
                std::this_thread::sleep_for(std::chrono::seconds(2 * retryCount));
            }
        } catch (const std::exception& e) {
            retryCount++;
            logger.warn(std::string("API request raised: ") + e.what());
            if (retryCount >= maxRetries) throw;
            std::this_thread::sleep_for(std::chrono::seconds(2 * retryCount));
        }
    }

    if (res && res->status == 200) {
        try {
            return nlohmann::json::parse(res->body);
        } catch (const nlohmann::json::parse_error& e) {
            logger.error(std::string("API returned unparsable body: ") + e.what());
            return nlohmann::json::object();
        }
    }

    logger.error("API Error after " + std::to_string(maxRetries) + " attempts: " +
                 (res ? std::to_string(res->status) : std::string("Connection failed")));
    if (res && !res->body.empty()) logger.error("  Body: " + res->body);
    return nlohmann::json::object();
}
