#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "audit_trail.hpp"
#include "serialization.hpp"

using namespace regcalc;
using json = nlohmann::json;

TEST_CASE("SHA-256 produces lowercase hex", "[audit][digest]") {
    REQUIRE(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Canonical JSON fixes float formatting", "[audit][digest]") {
    json doc = {{"amount", 0.1 + 0.2}, {"count", 3}, {"name", "x"}, {"items", {1.5, 2}}};
    json canonical = canonical_json(doc, 9);

    REQUIRE(canonical["amount"] == "0.300000000");
    REQUIRE(canonical["count"] == 3);
    REQUIRE(canonical["name"] == "x");
    REQUIRE(canonical["items"][0] == "1.500000000");
    REQUIRE(canonical["items"][1] == 2);
}

TEST_CASE("Digest ignores key order and float noise", "[audit][digest]") {
    RoundingConfig rounding;
    json a = {{"bel", 100.0}, {"ra", 5.25}};
    json b = {{"ra", 5.25000000000001}, {"bel", 100.0}};
    REQUIRE(digest_json(a, rounding) == digest_json(b, rounding));

    json c = {{"bel", 100.0}, {"ra", 5.26}};
    REQUIRE(digest_json(a, rounding) != digest_json(c, rounding));
}

TEST_CASE("Digest precision follows the rounding configuration", "[audit][digest]") {
    RoundingConfig rounding;
    REQUIRE(rounding.digest_decimals == 9);

    json a = {{"ratio", 1.0000001}};
    json b = {{"ratio", 1.0000002}};
    REQUIRE(digest_json(a, rounding) != digest_json(b, rounding));

    rounding.digest_decimals = 6;
    REQUIRE(canonical_json(a, rounding.digest_decimals)["ratio"] == "1.000000");
    REQUIRE(digest_json(a, rounding) == digest_json(b, rounding));
}

TEST_CASE("strip_digests removes digests at any depth", "[audit][digest]") {
    json doc = {
        {"input_digest", "abc"},
        {"result_digest", "def"},
        {"value", 1},
        {"items", json::array({json{{"result_digest", "x"}, {"ecl", 2.0}}})}
    };
    json stripped = strip_digests(doc);

    REQUIRE_FALSE(stripped.contains("input_digest"));
    REQUIRE_FALSE(stripped.contains("result_digest"));
    REQUIRE(stripped["value"] == 1);
    REQUIRE_FALSE(stripped["items"][0].contains("result_digest"));
    REQUIRE(stripped["items"][0]["ecl"] == 2.0);
}

TEST_CASE("Audit records carry digests and a UTC timestamp", "[audit]") {
    json inputs = {{"premium", 100.0}};
    json result = {{"csm", 10.0}};
    RoundingConfig rounding;
    AuditRecord record = make_audit_record("liability.measure_liability", inputs, result, "IFRS 17", rounding);

    REQUIRE(record.operation == "liability.measure_liability");
    REQUIRE(record.input_digest == digest_json(inputs, rounding));
    REQUIRE(record.result_digest == digest_json(result, rounding));
    REQUIRE(record.regulatory_reference == "IFRS 17");
    REQUIRE(record.timestamp.size() == 24);
    REQUIRE(record.timestamp.back() == 'Z');
    REQUIRE(record.timestamp[10] == 'T');

    json j = audit_record_to_json(record);
    REQUIRE(j["operation"] == "liability.measure_liability");
    REQUIRE(j["input_digest"] == record.input_digest);
}

TEST_CASE("In-memory audit trail is append-only and thread safe", "[audit]") {
    InMemoryAuditTrail trail;
    REQUIRE(trail.size() == 0);

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&trail, t]() {
            for (int i = 0; i < 50; ++i) {
                AuditRecord record;
                record.operation = "worker." + std::to_string(t);
                trail.append(record);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    REQUIRE(trail.size() == 200);
    REQUIRE(trail.records().size() == 200);
}

TEST_CASE("Stream audit sink writes JSON lines", "[audit]") {
    std::ostringstream out;
    StreamAuditSink sink(out);

    RoundingConfig rounding;
    AuditRecord first = make_audit_record("credit.stress_test", json{{"a", 1}}, json{{"b", 2}}, "IFRS 9", rounding);
    AuditRecord second = make_audit_record("solvency.calculate_scr", json{{"c", 3}}, json{{"d", 4}}, "Solvency",
                                           rounding);
    sink.append(first);
    sink.append(second);

    std::istringstream in(out.str());
    std::string line;
    std::vector<json> lines;
    while (std::getline(in, line)) {
        lines.push_back(json::parse(line));
    }

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0]["operation"] == "credit.stress_test");
    REQUIRE(lines[1]["operation"] == "solvency.calculate_scr");
    REQUIRE(lines[1]["result_digest"] == second.result_digest);
}

TEST_CASE("Null audit sink discards records", "[audit]") {
    NullAuditSink sink;
    REQUIRE_NOTHROW(sink.append(AuditRecord()));
}
