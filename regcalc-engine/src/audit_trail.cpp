#include "audit_trail.hpp"
#include "numeric.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <openssl/sha.h>
#include <sstream>

namespace regcalc {

// ============================================================================
// Sinks
// ============================================================================

void InMemoryAuditTrail::append(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

std::vector<AuditRecord> InMemoryAuditTrail::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

size_t InMemoryAuditTrail::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

StreamAuditSink::StreamAuditSink(std::ostream& os) : os_(os) {}

void StreamAuditSink::append(const AuditRecord& record) {
    std::string line = audit_record_to_json(record).dump();
    std::lock_guard<std::mutex> lock(mutex_);
    os_ << line << '\n';
    os_.flush();
}

// ============================================================================
// Digests
// ============================================================================

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    char hex[SHA256_DIGEST_LENGTH * 2 + 1];
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        std::snprintf(hex + i * 2, 3, "%02x", hash[i]);
    }
    return std::string(hex, SHA256_DIGEST_LENGTH * 2);
}

nlohmann::json canonical_json(const nlohmann::json& document, int decimals) {
    if (document.is_number_float()) {
        return format_fixed(document.get<double>(), decimals);
    }
    if (document.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = document.begin(); it != document.end(); ++it) {
            out[it.key()] = canonical_json(it.value(), decimals);
        }
        return out;
    }
    if (document.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& element : document) {
            out.push_back(canonical_json(element, decimals));
        }
        return out;
    }
    return document;
}

std::string digest_json(const nlohmann::json& document, const RoundingConfig& rounding) {
    // Objects are std::map backed, so dump() emits sorted keys
    return sha256_hex(canonical_json(document, rounding.digest_decimals).dump());
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

AuditRecord make_audit_record(
    const std::string& operation,
    const nlohmann::json& inputs,
    const nlohmann::json& result,
    const std::string& regulatory_reference,
    const RoundingConfig& rounding)
{
    AuditRecord record;
    record.timestamp = utc_timestamp();
    record.operation = operation;
    record.input_digest = digest_json(inputs, rounding);
    record.result_digest = digest_json(result, rounding);
    record.regulatory_reference = regulatory_reference;
    return record;
}

nlohmann::json audit_record_to_json(const AuditRecord& record) {
    nlohmann::json j;
    j["timestamp"] = record.timestamp;
    j["operation"] = record.operation;
    j["input_digest"] = record.input_digest;
    j["result_digest"] = record.result_digest;
    j["regulatory_reference"] = record.regulatory_reference;
    return j;
}

} // namespace regcalc
