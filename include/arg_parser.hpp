#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Small command line parser.
 *
 * Long options use `--flag`, `--opt value` or `--opt=value`. Only options
 * listed in @a value_flags consume the following argument, so boolean flags
 * may precede positional arguments. Single character options (e.g. `-h`)
 * are mapped to their long form through @a short_map. Anything after a bare
 * `--` is positional.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::vector<std::string> missing_values_;    ///< Value options given without a value
    std::set<std::string> known_flags_;
    std::set<std::string> value_flags_;
    std::map<char, std::string> short_map_;

    void add(const std::string& key, const std::string* value);

  public:
    /**
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Accepted long flags; if empty every flag is accepted.
     * @param short_map Mapping from single character options to long flags.
     * @param value_flags Long flags that take a value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {});

    /// @return `true` if @p flag (including the leading `--`) was present.
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /// @return Value of @p opt, or an empty string if it was not given.
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
