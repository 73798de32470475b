#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    // Scalars keep their literal spelling so "0755" or "1e3" stay untouched.
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (node.IsMap()) {
                for (auto sub = node.begin(); sub != node.end(); ++sub) {
                    const std::string subkey = sub->first.as<std::string>();
                    std::string s;
                    if (!to_string_value(sub->second, s)) {
                        error = "Unsupported value for " + key_name + "." + subkey;
                        return false;
                    }
                    opts["--" + subkey] = s;
                }
                continue;
            }
            std::string s;
            if (!to_string_value(node, s)) {
                error = "Unsupported value for " + key_name;
                return false;
            }
            opts["--" + key_name] = s;
        }
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            if (val.is_object()) {
                for (auto sub = val.begin(); sub != val.end(); ++sub) {
                    std::string s;
                    if (!to_string_value(sub.value(), s)) {
                        error = "Unsupported value for " + it.key() + "." + sub.key();
                        return false;
                    }
                    opts["--" + sub.key()] = s;
                }
                continue;
            }
            std::string s;
            if (!to_string_value(val, s)) {
                error = "Unsupported value for " + it.key();
                return false;
            }
            opts["--" + it.key()] = s;
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}

fs::path find_auto_config(const fs::path& dir) {
    if (dir.empty())
        return {};
    std::error_code ec;
    fs::path y = dir / ".repo-bootstrap.yaml";
    if (fs::is_regular_file(y, ec))
        return y;
    fs::path j = dir / ".repo-bootstrap.json";
    if (fs::is_regular_file(j, ec))
        return j;
    return {};
}
