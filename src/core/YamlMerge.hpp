#pragma once

#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace herald {

// Deep merge: overlay values override base values.
// Mappings recurse, sequences and scalars override entirely,
// missing keys in overlay keep the base defaults.
inline YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);

    if (!base.IsDefined() || base.IsNull() || !base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(base);
    for (const auto& kv : overlay) {
        const std::string key = kv.first.as<std::string>();
        merged[key] = merged[key] ? mergeYaml(merged[key], kv.second) : YAML::Clone(kv.second);
    }
    return merged;
}

// Dotted paths present in overlay but absent from schema, e.g. "limits.max_trackd".
inline void collectUnknownKeys(const YAML::Node& schema, const YAML::Node& overlay,
                               const std::string& prefix, std::vector<std::string>& out)
{
    if (!overlay.IsMap()) return;

    for (const auto& kv : overlay) {
        const std::string key = kv.first.as<std::string>();
        const std::string path = prefix.empty() ? key : prefix + "." + key;
        const YAML::Node known = schema.IsMap() ? schema[key] : YAML::Node();
        if (!known) {
            out.push_back(path);
            continue;
        }
        if (known.IsMap())
            collectUnknownKeys(known, kv.second, path, out);
    }
}

} // namespace herald
