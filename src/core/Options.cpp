#include "deltaledger/Options.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>

using json = nlohmann::json;

namespace deltaledger {

namespace {

std::optional<bool> envFlag(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw) return std::nullopt;
    std::string v(raw);
    if (v == "1" || v == "true" || v == "on") return true;
    if (v == "0" || v == "false" || v == "off") return false;
    std::cerr << "Options: ignoring " << name << "=" << v << "\n";
    return std::nullopt;
}

DeltaPolicy parseDeltaPolicy(const std::string& name) {
    if (name == "skip") return DeltaPolicy::Skip;
    if (name == "strict") return DeltaPolicy::Strict;
    throw std::invalid_argument("unknown delta policy '" + name + "'");
}

bool boolField(const json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (!it->is_boolean()) throw std::invalid_argument(std::string("option '") + key + "' must be a boolean");
    return it->get<bool>();
}

} // namespace

const char* deltaPolicyName(DeltaPolicy policy) {
    return policy == DeltaPolicy::Strict ? "strict" : "skip";
}

Options Options::fromJson(const json& j) {
    return fromJson(j, Options());
}

Options Options::fromJson(const json& j, Options base) {
    if (!j.is_object()) throw std::invalid_argument("options must be a JSON object");
    Options out = base;
    if (auto it = j.find("deltaPolicy"); it != j.end()) {
        if (!it->is_string()) throw std::invalid_argument("option 'deltaPolicy' must be a string");
        out.deltaPolicy = parseDeltaPolicy(it->get<std::string>());
    }
    out.verifyBeforeWrite = boolField(j, "verifyBeforeWrite", out.verifyBeforeWrite);
    if (auto it = j.find("formatVersion"); it != j.end()) {
        if (!it->is_string()) throw std::invalid_argument("option 'formatVersion' must be a string");
        out.formatVersion = it->get<std::string>();
    }
    return out;
}

Options Options::fromFile(const std::string& path) {
    return fromFile(path, Options());
}

Options Options::fromFile(const std::string& path, Options base) {
    std::ifstream in(path);
    if (!in) throw std::invalid_argument("cannot open options file " + path);
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) throw std::invalid_argument("options file " + path + " is not valid JSON");
    return fromJson(j, base);
}

Options Options::fromEnvironment() {
    return fromEnvironment(Options());
}

Options Options::fromEnvironment(Options base) {
    Options out = base;
    if (auto strict = envFlag("DELTALEDGER_STRICT_DELTAS")) {
        out.deltaPolicy = *strict ? DeltaPolicy::Strict : DeltaPolicy::Skip;
    }
    if (auto verify = envFlag("DELTALEDGER_VERIFY_WRITES")) out.verifyBeforeWrite = *verify;
    return out;
}

json Options::toJson() const {
    return json{
        {"deltaPolicy", deltaPolicyName(deltaPolicy)},
        {"verifyBeforeWrite", verifyBeforeWrite},
        {"formatVersion", formatVersion}
    };
}

} // namespace deltaledger
