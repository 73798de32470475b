#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <filesystem>
#include <map>
#include <string>

/**
 * @brief Load option values from a YAML file.
 *
 * Top-level scalar keys become `--key` entries in @p opts. A top-level map is
 * treated as a category (`Logging:`, `Remote:` ...) and its scalar members are
 * flattened into @p opts the same way. Values already present in @p opts are
 * overwritten.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by `--name`.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load option values from a JSON file.
 *
 * Same layout rules as load_yaml_config(): scalars at the root or one level
 * deep inside a category object.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Look for `.repo-bootstrap.yaml` then `.repo-bootstrap.json` in @p dir.
 *
 * @return Path of the first file found or an empty path.
 */
std::filesystem::path find_auto_config(const std::filesystem::path& dir);

#endif // CONFIG_UTILS_HPP
