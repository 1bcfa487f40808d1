#pragma once

/**
 * @file ModelOptions.hpp
 * @brief Per-node option bag with typed accessors
 *
 * Populated by the YAML model loader (or by hand) and read by models in
 * their constructors or stage hooks.
 */

#include <cadence/core/Error.hpp>

#include <string>
#include <unordered_map>

namespace cadence {

/**
 * @brief Options attached to a model or connection
 *
 * Example usage in a stage hook:
 * @code
 * void DefineObjects(DefinitionContext& ctx) override {
 *     axis_ = Options().Get<std::string>("axis", "y");
 *     actuated_ = Options().Get<bool>("actuated", false);
 * }
 * @endcode
 */
struct ModelOptions {
    std::string name; ///< Node name
    std::string type; ///< Registered type name

    std::unordered_map<std::string, double> scalars;
    std::unordered_map<std::string, std::string> strings;
    std::unordered_map<std::string, bool> booleans;

    /**
     * @brief Get a required option (throws if missing)
     * @throws ConfigError if key is missing
     */
    template <typename T> T Require(const std::string &key) const;

    /// Get an optional value, @p default_value when missing
    template <typename T> T Get(const std::string &key, const T &default_value) const;

    template <typename T> [[nodiscard]] bool Has(const std::string &key) const;

    [[nodiscard]] bool Empty() const {
        return scalars.empty() && strings.empty() && booleans.empty();
    }

  private:
    [[nodiscard]] std::string Owner() const {
        return name.empty() ? std::string("<unnamed>") : "'" + name + "'";
    }
};

// =============================================================================
// Template Specializations - double
// =============================================================================

template <>
inline double ModelOptions::Get<double>(const std::string &key, const double &def) const {
    auto it = scalars.find(key);
    return (it != scalars.end()) ? it->second : def;
}

template <> inline double ModelOptions::Require<double>(const std::string &key) const {
    auto it = scalars.find(key);
    if (it == scalars.end()) {
        throw ConfigError("Model " + Owner() + " missing required scalar option: " + key);
    }
    return it->second;
}

template <> inline bool ModelOptions::Has<double>(const std::string &key) const {
    return scalars.count(key) > 0;
}

// =============================================================================
// Template Specializations - bool
// =============================================================================

template <> inline bool ModelOptions::Get<bool>(const std::string &key, const bool &def) const {
    auto it = booleans.find(key);
    return (it != booleans.end()) ? it->second : def;
}

template <> inline bool ModelOptions::Require<bool>(const std::string &key) const {
    auto it = booleans.find(key);
    if (it == booleans.end()) {
        throw ConfigError("Model " + Owner() + " missing required boolean option: " + key);
    }
    return it->second;
}

template <> inline bool ModelOptions::Has<bool>(const std::string &key) const {
    return booleans.count(key) > 0;
}

// =============================================================================
// Template Specializations - std::string
// =============================================================================

template <>
inline std::string ModelOptions::Get<std::string>(const std::string &key,
                                                  const std::string &def) const {
    auto it = strings.find(key);
    return (it != strings.end()) ? it->second : def;
}

template <> inline std::string ModelOptions::Require<std::string>(const std::string &key) const {
    auto it = strings.find(key);
    if (it == strings.end()) {
        throw ConfigError("Model " + Owner() + " missing required string option: " + key);
    }
    return it->second;
}

template <> inline bool ModelOptions::Has<std::string>(const std::string &key) const {
    return strings.count(key) > 0;
}

} // namespace cadence
