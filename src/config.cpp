#include "config.hpp"

namespace pyexec {
using namespace std;
using namespace nlohmann;

template <typename T>
static void assign_optional(const json &j, const char *key, T &value) {
    if (j.count(key) && !j.at(key).is_null())
        j.at(key).get_to(value);
}

static void assign_optional_path(const json &j, const char *key, filesystem::path &value) {
    if (j.count(key) && !j.at(key).is_null())
        value = j.at(key).get<string>();
}

void from_json(const json &j, configuration &config) {
    assign_optional_path(j, "script_dir", config.script_dir);
    assign_optional_path(j, "sandbox_config_dir", config.sandbox_config_dir);
    assign_optional(j, "preferred_profile", config.preferred_profile);
    assign_optional(j, "fallback_profile", config.fallback_profile);
    assign_optional_path(j, "nsjail", config.nsjail);
    assign_optional_path(j, "python", config.python);
    assign_optional(j, "grace", config.grace_seconds);
    assign_optional(j, "fallback_signatures", config.fallback_signatures);
    assign_optional(j, "host", config.host);
    assign_optional(j, "port", config.port);
    assign_optional(j, "debug", config.debug);
}

}  // namespace pyexec
