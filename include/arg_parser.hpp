#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Simple command line argument parser.
 *
 * Recognizes long options (`--flag`, `--opt value`, `--opt=value`) and short
 * aliases mapped to their long form (`-h`, `-b gh`, `-bgh`, `-b=gh`). Only
 * options listed in @a value_flags consume a value; every other option is a
 * boolean switch, so `--private acme demo` leaves both names positional. A
 * bare `--` ends option parsing.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::vector<std::string> missing_values_;    ///< Value options given without a value
    std::set<std::string> known_flags_;          ///< List of accepted flags
    std::set<std::string> value_flags_;          ///< Flags that take a value
    std::map<char, std::string> short_map_;      ///< Mapping of short to long flags

    bool accept(const std::string& key) {
        if (!known_flags_.empty() && !known_flags_.count(key)) {
            unknown_flags_.push_back(key);
            return false;
        }
        flags_.insert(key);
        return true;
    }

    void store(const std::string& key, const std::string& val) {
        if (accept(key))
            options_[key] = val;
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Flags that are considered valid. If empty, all flags
     *        are treated as known.
     * @param short_map Mapping from single character options (e.g. '-h') to
     *        their long form (e.g. '--help').
     * @param value_flags Flags that take a value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {})
        : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
        bool options_done = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (options_done || arg == "-" || arg.empty() || arg[0] != '-') {
                positional_.push_back(arg);
            } else if (arg == "--") {
                options_done = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    store(arg.substr(0, eq), arg.substr(eq + 1));
                } else if (value_flags_.count(arg)) {
                    if (i + 1 < argc) {
                        store(arg, argv[++i]);
                    } else {
                        missing_values_.push_back(arg);
                        accept(arg);
                    }
                } else {
                    accept(arg);
                }
            } else {
                // Cluster of short options such as -sC or -bgh.
                for (size_t j = 1; j < arg.size(); ++j) {
                    char c = arg[j];
                    auto it = short_map_.find(c);
                    if (it == short_map_.end()) {
                        unknown_flags_.push_back(std::string("-") + c);
                        break;
                    }
                    const std::string& key = it->second;
                    if (!value_flags_.count(key)) {
                        accept(key);
                        continue;
                    }
                    std::string rest = arg.substr(j + 1);
                    if (!rest.empty() && rest[0] == '=')
                        rest.erase(0, 1);
                    if (!rest.empty()) {
                        store(key, rest);
                    } else if (i + 1 < argc) {
                        store(key, argv[++i]);
                    } else {
                        missing_values_.push_back(key);
                        accept(key);
                    }
                    break;
                }
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * @param opt Option name including the leading `--`.
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @return `true` when @p opt was given with an explicit value. */
    bool has_value(const std::string& opt) const { return options_.count(opt) > 0; }

    const std::set<std::string>& flags() const { return flags_; }

    const std::map<std::string, std::string>& options() const { return options_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value options that appeared last on the line with nothing after them. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
