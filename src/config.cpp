#include "config.hpp"
#include "logging.hpp"
#include "groupsig/scheme.hpp"

#include <memory>
#include <sstream>

namespace grpsig {

namespace {

logging::Logger& logger() {
    static logging::Logger l = logging::get_logger("grpsig.config");
    return l;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

void put(std::ostringstream& os, const char* key, const std::string& value) {
    if (!value.empty()) os << key << "=" << value << "\n";
}

} // namespace

std::string Config::to_env_string() const {
    std::ostringstream os;
    put(os, "GRPSIG_SCHEME", scheme);
    put(os, "GRPSIG_LOG_LEVEL", log_level);
    put(os, "GRPSIG_GROUP_KEY", group_key);
    put(os, "GRPSIG_MANAGER_KEY", manager_key);
    put(os, "GRPSIG_REVOCATION_KEY", revocation_key);
    put(os, "GRPSIG_MEMBER_KEY", member_key);
    return os.str();
}

Config Config::from_env_string(const std::string& env_content) {
    Config cfg;
    std::istringstream in(env_content);
    std::string line;
    std::size_t lineno = 0;

    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("config line " + std::to_string(lineno) + ": expected KEY=value");
        }
        std::string key   = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "GRPSIG_SCHEME")              cfg.scheme = value;
        else if (key == "GRPSIG_LOG_LEVEL")      cfg.log_level = value;
        else if (key == "GRPSIG_GROUP_KEY")      cfg.group_key = value;
        else if (key == "GRPSIG_MANAGER_KEY")    cfg.manager_key = value;
        else if (key == "GRPSIG_REVOCATION_KEY") cfg.revocation_key = value;
        else if (key == "GRPSIG_MEMBER_KEY")     cfg.member_key = value;
        else LOG_WARN(logger(), "ignoring unknown config key " << key);
    }
    return cfg;
}

void Config::apply(Scheme& target) const {
    if (target.name() != scheme) {
        throw ConfigError("config is for scheme " + scheme + ", not " + target.name());
    }

    // Every envelope must decode before the target changes.
    const std::string* envelopes[] = {&group_key, &manager_key, &revocation_key, &member_key};
    std::unique_ptr<Scheme> staging = make_scheme(scheme_from_name(scheme));
    for (const std::string* env : envelopes) {
        if (!env->empty()) staging->import_key(*env);
    }

    if (!log_level.empty()) {
        try {
            logging::set_log_level(log_level);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    }

    for (const std::string* env : envelopes) {
        if (!env->empty()) target.import_key(*env);
    }
    LOG_DEBUG(logger(), "config applied to " << scheme);
}

} // namespace grpsig
