#ifndef REGCALC_AUDIT_TRAIL_HPP
#define REGCALC_AUDIT_TRAIL_HPP

#include "numeric.hpp"
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace regcalc {

// One append-only record per top-level engine invocation
struct AuditRecord {
    std::string timestamp;              // ISO-8601 UTC
    std::string operation;              // e.g. "credit.classify_and_quantify_ecl"
    std::string input_digest;           // SHA-256 of canonical input JSON
    std::string result_digest;          // SHA-256 of canonical result JSON
    std::string regulatory_reference;   // Standard / rule the calculation follows
};

// Receives audit records. Engines only append; retention and export belong
// to whoever owns the sink. Implementations must tolerate concurrent append.
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void append(const AuditRecord& record) = 0;
};

// Keeps records in memory (tests, CLI report)
class InMemoryAuditTrail : public AuditSink {
public:
    void append(const AuditRecord& record) override;

    std::vector<AuditRecord> records() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<AuditRecord> records_;
};

// Writes each record as one JSON line
class StreamAuditSink : public AuditSink {
public:
    explicit StreamAuditSink(std::ostream& os);

    void append(const AuditRecord& record) override;

private:
    std::mutex mutex_;
    std::ostream& os_;
};

class NullAuditSink : public AuditSink {
public:
    void append(const AuditRecord&) override {}
};

// Lowercase hex SHA-256
std::string sha256_hex(const std::string& data);

// Copy of the document with every floating-point number replaced by a
// fixed-decimal string, so digests do not depend on binary float printing
nlohmann::json canonical_json(const nlohmann::json& document, int decimals);

// SHA-256 of the compact dump of the canonical form at rounding.digest_decimals
std::string digest_json(const nlohmann::json& document, const RoundingConfig& rounding);

std::string utc_timestamp();

AuditRecord make_audit_record(
    const std::string& operation,
    const nlohmann::json& inputs,
    const nlohmann::json& result,
    const std::string& regulatory_reference,
    const RoundingConfig& rounding
);

nlohmann::json audit_record_to_json(const AuditRecord& record);

} // namespace regcalc

#endif // REGCALC_AUDIT_TRAIL_HPP
