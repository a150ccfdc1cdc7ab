#pragma once
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

enum class AuditStage { Plan, Generate, Execute, Verify, Recover };
enum class AuditOutcome { Ok, Fail };

std::string auditStageName(AuditStage stage);
std::string auditOutcomeName(AuditOutcome outcome);

struct AuditEntry {
    std::string timestamp;  // ISO-8601 UTC
    AuditStage stage = AuditStage::Execute;
    AuditOutcome outcome = AuditOutcome::Ok;
    nlohmann::json detail = nlohmann::json::object();

    static AuditEntry now(AuditStage stage, AuditOutcome outcome, nlohmann::json detail);
    nlohmann::json toJson() const;
};

/**
 * @brief Append-only audit trail. There is no read API.
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void append(const AuditEntry& entry) = 0;
};

/** One JSON object per line. */
class JsonlAuditSink : public AuditSink {
public:
    explicit JsonlAuditSink(const std::string& path);
    void append(const AuditEntry& entry) override;

private:
    std::string path;
    std::mutex mtx;
};
