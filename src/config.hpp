#ifndef GRPSIG_CONFIG_HPP
#define GRPSIG_CONFIG_HPP

#include <stdexcept>
#include <string>

namespace grpsig {

class Scheme;

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// -----------------------------------------------------------------------------
// Config - scheme selection, log level and the key envelopes a party holds
// -----------------------------------------------------------------------------
struct Config {
    std::string scheme = "cpy06";
    std::string log_level;             // empty: leave the logging level alone

    // Envelopes; empty when the party does not hold the key
    std::string group_key;
    std::string manager_key;
    std::string revocation_key;
    std::string member_key;

    // KEY=value lines:
    //   GRPSIG_SCHEME, GRPSIG_LOG_LEVEL, GRPSIG_GROUP_KEY, GRPSIG_MANAGER_KEY,
    //   GRPSIG_REVOCATION_KEY, GRPSIG_MEMBER_KEY
    std::string to_env_string() const;

    // Blank lines and '#' comments are skipped; unknown keys are ignored.
    // Throws ConfigError on a line without '='.
    static Config from_env_string(const std::string& env_content);

    // Applies the log level and imports every key present. Throws ConfigError
    // if the scheme does not match, ecgroup::DecodeError on a bad envelope.
    // Nothing is applied unless every envelope decodes.
    void apply(Scheme& scheme) const;
};

} // namespace grpsig

#endif // GRPSIG_CONFIG_HPP
