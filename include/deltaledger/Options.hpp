#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace deltaledger {

// What reconciliation does with a segment that fails to parse.
enum class DeltaPolicy {
    Skip,   // log it, record it in the LoadReport, keep going
    Strict  // rethrow MalformedDeltaError and abort the load
};

struct Options {
    DeltaPolicy deltaPolicy = DeltaPolicy::Skip;
    // Re-derive global knowledge just before writing a segment and refuse
    // the commit if it moved since minting.
    bool verifyBeforeWrite = true;
    std::string formatVersion = "1";

    // Unknown keys are ignored; wrong types throw std::invalid_argument.
    // The single-argument forms start from the defaults.
    static Options fromJson(const nlohmann::json& j);
    static Options fromJson(const nlohmann::json& j, Options base);
    static Options fromFile(const std::string& path);
    static Options fromFile(const std::string& path, Options base);

    // Applies DELTALEDGER_STRICT_DELTAS and DELTALEDGER_VERIFY_WRITES on top
    // of base.
    static Options fromEnvironment();
    static Options fromEnvironment(Options base);

    nlohmann::json toJson() const;
};

const char* deltaPolicyName(DeltaPolicy policy);

} // namespace deltaledger
