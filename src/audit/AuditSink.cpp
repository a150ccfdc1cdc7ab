#include "audit/AuditSink.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

std::string auditStageName(AuditStage stage) {
    switch (stage) {
        case AuditStage::Plan: return "plan";
        case AuditStage::Generate: return "generate";
        case AuditStage::Execute: return "execute";
        case AuditStage::Verify: return "verify";
        case AuditStage::Recover: return "recover";
    }
    return "execute";
}

std::string auditOutcomeName(AuditOutcome outcome) {
    return outcome == AuditOutcome::Ok ? "ok" : "fail";
}

AuditEntry AuditEntry::now(AuditStage stage, AuditOutcome outcome, nlohmann::json detail) {
    auto tp = std::chrono::system_clock::now();
    auto secs = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm tmBuf{};
    gmtime_r(&secs, &tmBuf);
    std::ostringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << millis << "Z";

    AuditEntry e;
    e.timestamp = ss.str();
    e.stage = stage;
    e.outcome = outcome;
    e.detail = std::move(detail);
    return e;
}

nlohmann::json AuditEntry::toJson() const {
    return {{"timestamp", timestamp},
            {"stage", auditStageName(stage)},
            {"outcome", auditOutcomeName(outcome)},
            {"detail", detail}};
}

JsonlAuditSink::JsonlAuditSink(const std::string& path) : path(path) {
    fs::path p = fs::u8path(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) throw std::runtime_error("Cannot create audit directory: " + p.parent_path().string());
    }
}

void JsonlAuditSink::append(const AuditEntry& entry) {
    std::lock_guard<std::mutex> lock(mtx);
    std::ofstream out(fs::u8path(path), std::ios::app);
    if (!out.is_open()) throw std::runtime_error("Cannot open audit log: " + path);
    out << entry.toJson().dump() << "\n";
}
