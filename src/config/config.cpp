#include "fcorr/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <sstream>

namespace fcorr {

namespace {

const std::set<std::string>& known_keys() {
    static const std::set<std::string> keys = {
        "timeout_ms", "install_timeout_ms", "scoring_policy", "auto_install", "run_build", "test_dir",
        "min_confidence", "isolate_python_env", "max_output_bytes", "expect_manifest", "jobs",
    };
    return keys;
}

// Reads a positive integer member; returns false and sets error on a bad value
bool read_positive(const nlohmann::json& j, const std::string& key, long long& out, std::string& error) {
    if (!j.contains(key)) return true;
    const auto& v = j[key];
    if (!v.is_number_integer()) {
        error = key + " must be an integer";
        return false;
    }
    long long n = v.get<long long>();
    if (n <= 0) {
        error = key + " must be positive";
        return false;
    }
    out = n;
    return true;
}

bool read_bool(const nlohmann::json& j, const std::string& key, bool& out, std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_boolean()) {
        error = key + " must be a boolean";
        return false;
    }
    out = j[key].get<bool>();
    return true;
}

} // namespace

ConfigParseResult parse_verifier_config(const std::string& json_str) {
    ConfigParseResult result;
    VerifierConfig& config = result.config;

    try {
        auto j = nlohmann::json::parse(json_str);
        if (!j.is_object()) {
            result.error = "config must be a JSON object";
            return result;
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!known_keys().count(it.key())) {
                result.warnings.push_back("unknown config key: " + it.key());
            }
        }

        long long n = 0;
        if (!read_positive(j, "timeout_ms", config.timeout_ms, result.error)) return result;
        if (!read_positive(j, "install_timeout_ms", config.install_timeout_ms, result.error)) return result;

        n = static_cast<long long>(config.max_output_bytes);
        if (!read_positive(j, "max_output_bytes", n, result.error)) return result;
        config.max_output_bytes = static_cast<std::size_t>(n);

        n = config.jobs;
        if (!read_positive(j, "jobs", n, result.error)) return result;
        if (n > 256) {
            result.error = "jobs must be at most 256";
            return result;
        }
        config.jobs = static_cast<int>(n);

        if (!read_bool(j, "auto_install", config.auto_install, result.error)) return result;
        if (!read_bool(j, "run_build", config.run_build, result.error)) return result;
        if (!read_bool(j, "isolate_python_env", config.isolate_python_env, result.error)) return result;
        if (!read_bool(j, "expect_manifest", config.expect_manifest, result.error)) return result;

        if (j.contains("scoring_policy")) {
            if (!j["scoring_policy"].is_string()) {
                result.error = "scoring_policy must be a string";
                return result;
            }
            std::string name = j["scoring_policy"].get<std::string>();
            auto policy = parse_scoring_policy(name);
            if (!policy) {
                result.error = "unknown scoring_policy: " + name;
                return result;
            }
            config.scoring_policy = *policy;
        }

        if (j.contains("test_dir")) {
            const auto& v = j["test_dir"];
            if (v.is_null()) {
                config.test_dir.reset();
            } else if (v.is_string() && !v.get<std::string>().empty()) {
                config.test_dir = v.get<std::string>();
            } else {
                result.error = "test_dir must be a non-empty string or null";
                return result;
            }
        }

        if (j.contains("min_confidence")) {
            const auto& v = j["min_confidence"];
            if (!v.is_number()) {
                result.error = "min_confidence must be a number";
                return result;
            }
            double c = v.get<double>();
            if (c < 0.0 || c > 1.0) {
                result.error = "min_confidence must be within [0, 1]";
                return result;
            }
            config.min_confidence = c;
        }

        result.ok = true;
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }
    return result;
}

ConfigParseResult load_verifier_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        ConfigParseResult result;
        result.error = "cannot read config file: " + path;
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse_verifier_config(ss.str());
}

} // namespace fcorr
