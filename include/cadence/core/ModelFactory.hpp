#pragma once

/**
 * @file ModelFactory.hpp
 * @brief Registry of model and connection types
 *
 * Maps type names to creators and family tags so trees can be built from
 * YAML and requirements can be answered with the types able to fill them.
 */

#include <cadence/core/ConnectionBase.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/core/ModelBase.hpp>
#include <cadence/core/ModelOptions.hpp>
#include <cadence/core/Requirement.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cadence {

/**
 * @brief Singleton factory for models and connections
 *
 * Abstract families (names ending in "Base") are registered without a
 * creator; they only take part in requirement lookups.
 *
 * Example usage:
 * @code
 * auto& factory = ModelFactory::Instance();
 * auto wheel = factory.CreateModel(options); // options.type == "KnifeEdgeWheel"
 * auto wheels = factory.GetFromRequirement(Requirement("wheel", {"WheelBase"}));
 * @endcode
 */
class ModelFactory {
  public:
    using ModelCreator = std::function<std::unique_ptr<ModelBase>(const ModelOptions &)>;
    using ConnectionCreator = std::function<std::unique_ptr<ConnectionBase>(
        const ModelOptions &, std::vector<Interface *>)>;

    /// Registered type
    struct Entry {
        std::string type_name;
        RequirementKind kind = RequirementKind::Model;
        std::vector<std::string> families; ///< Includes type_name itself
        ModelCreator model_creator;
        ConnectionCreator connection_creator;

        [[nodiscard]] bool IsAbstract() const { return IsAbstractName(type_name); }
    };

    void RegisterModel(const std::string &type_name, std::vector<std::string> families,
                       ModelCreator creator) {
        Entry entry;
        entry.type_name = type_name;
        entry.kind = RequirementKind::Model;
        entry.families = WithSelf(type_name, std::move(families));
        entry.model_creator = std::move(creator);
        entries_[type_name] = std::move(entry);
    }

    void RegisterConnection(const std::string &type_name, std::vector<std::string> families,
                            ConnectionCreator creator) {
        Entry entry;
        entry.type_name = type_name;
        entry.kind = RequirementKind::Connection;
        entry.families = WithSelf(type_name, std::move(families));
        entry.connection_creator = std::move(creator);
        entries_[type_name] = std::move(entry);
    }

    /// Register a family that cannot be instantiated (e.g. "WheelBase")
    void RegisterAbstract(const std::string &type_name, RequirementKind kind) {
        Entry entry;
        entry.type_name = type_name;
        entry.kind = kind;
        entry.families = {type_name};
        entries_[type_name] = std::move(entry);
    }

    /**
     * @brief Create a model from options
     * @throws ConfigError if the type is unknown, abstract or a connection
     */
    [[nodiscard]] std::unique_ptr<ModelBase> CreateModel(const ModelOptions &options) const {
        const Entry &entry = Lookup(options.type);
        if (entry.kind != RequirementKind::Model || !entry.model_creator) {
            throw ConfigError("Type '" + options.type + "' cannot be instantiated as a model");
        }
        return entry.model_creator(options);
    }

    /**
     * @brief Create a connection joining @p interfaces
     * @throws ConfigError if the type is unknown, abstract or a model
     */
    [[nodiscard]] std::unique_ptr<ConnectionBase>
    CreateConnection(const ModelOptions &options, std::vector<Interface *> interfaces) const {
        const Entry &entry = Lookup(options.type);
        if (entry.kind != RequirementKind::Connection || !entry.connection_creator) {
            throw ConfigError("Type '" + options.type +
                              "' cannot be instantiated as a connection");
        }
        return entry.connection_creator(options, std::move(interfaces));
    }

    [[nodiscard]] bool HasType(const std::string &type_name) const {
        return entries_.count(type_name) > 0;
    }

    /// @throws ConfigError if the type is unknown
    [[nodiscard]] const Entry &Lookup(const std::string &type_name) const {
        auto it = entries_.find(type_name);
        if (it == entries_.end()) {
            throw ConfigError("Unknown model type: '" + type_name +
                              "'. Registered types: " + ListTypesString());
        }
        return it->second;
    }

    /// Registered type names in alphabetical order
    [[nodiscard]] std::vector<std::string> GetRegisteredTypes() const {
        std::vector<std::string> types;
        types.reserve(entries_.size());
        for (const auto &pair : entries_) {
            types.push_back(pair.first);
        }
        return types;
    }

    [[nodiscard]] std::size_t NumRegistered() const { return entries_.size(); }

    /**
     * @brief Types able to fill @p requirement
     * @param drop_abstract Leave out abstract families
     */
    [[nodiscard]] std::vector<std::string> GetFromRequirement(const Requirement &requirement,
                                                              bool drop_abstract = true) const {
        std::vector<std::string> result;
        for (const auto &[name, entry] : entries_) {
            if (entry.kind != requirement.Kind()) {
                continue;
            }
            if (drop_abstract && entry.IsAbstract()) {
                continue;
            }
            if (requirement.IsSatisfiedBy(entry.families)) {
                result.push_back(name);
            }
        }
        return result;
    }

    /**
     * @brief Types able to fill the role @p attribute_name of @p model
     * @throws ConfigError if the model declares no such requirement
     */
    [[nodiscard]] std::vector<std::string> GetFromProperty(const ModelBase &model,
                                                           const std::string &attribute_name,
                                                           bool drop_abstract = true) const {
        for (const auto &requirement : model.Requirements()) {
            if (requirement.AttributeName() == attribute_name) {
                return GetFromRequirement(requirement, drop_abstract);
            }
        }
        throw ConfigError("Model '" + model.Path() + "' has no requirement '" + attribute_name +
                          "'");
    }

    static ModelFactory &Instance() {
        static ModelFactory instance;
        return instance;
    }

    /// Clear all registrations (for testing)
    void Clear() { entries_.clear(); }

    /// Abstract families follow the "...Base" naming convention
    [[nodiscard]] static bool IsAbstractName(const std::string &type_name) {
        return type_name.size() >= 4 && type_name.compare(type_name.size() - 4, 4, "Base") == 0;
    }

  private:
    ModelFactory() = default;

    static std::vector<std::string> WithSelf(const std::string &type_name,
                                             std::vector<std::string> families) {
        bool has_self = false;
        for (const auto &f : families) {
            has_self = has_self || f == type_name;
        }
        if (!has_self) {
            families.insert(families.begin(), type_name);
        }
        return families;
    }

    [[nodiscard]] std::string ListTypesString() const {
        std::string result;
        for (const auto &pair : entries_) {
            if (!result.empty())
                result += ", ";
            result += pair.first;
        }
        return result.empty() ? "(none)" : result;
    }

    std::map<std::string, Entry> entries_;
};

// =============================================================================
// Registration Macros
// =============================================================================

/**
 * @brief Register a model type with the factory
 *
 * The model needs a constructor taking its name and a static
 * `TypeFamilies()` listing its abstract families.
 *
 * Usage (at namespace scope):
 * @code
 * CADENCE_REGISTER_MODEL_AS(::cadence::models::KnifeEdgeWheel, "KnifeEdgeWheel")
 * @endcode
 */
#define CADENCE_REGISTER_MODEL_IMPL2(ModelType, TypeName, Counter)                                 \
    namespace {                                                                                    \
    static const bool _cadence_reg_##Counter = []() {                                              \
        ::cadence::ModelFactory::Instance().RegisterModel(                                         \
            TypeName, ModelType::TypeFamilies(), [](const ::cadence::ModelOptions &options) {     \
                auto model = std::make_unique<ModelType>(options.name);                            \
                model->SetOptions(options);                                                        \
                return model;                                                                      \
            });                                                                                    \
        return true;                                                                               \
    }();                                                                                           \
    }

#define CADENCE_REGISTER_MODEL_IMPL(ModelType, TypeName, Counter)                                  \
    CADENCE_REGISTER_MODEL_IMPL2(ModelType, TypeName, Counter)

#define CADENCE_REGISTER_MODEL_AS(ModelType, TypeName)                                             \
    CADENCE_REGISTER_MODEL_IMPL(ModelType, TypeName, __COUNTER__)

/**
 * @brief Register a connection type with the factory
 *
 * The connection needs a constructor taking (name, interfaces).
 */
#define CADENCE_REGISTER_CONNECTION_IMPL2(ConnectionType, TypeName, Counter)                       \
    namespace {                                                                                    \
    static const bool _cadence_reg_##Counter = []() {                                              \
        ::cadence::ModelFactory::Instance().RegisterConnection(                                    \
            TypeName, ConnectionType::TypeFamilies(),                                              \
            [](const ::cadence::ModelOptions &options,                                             \
               std::vector<::cadence::Interface *> interfaces) {                                   \
                auto connection =                                                                  \
                    std::make_unique<ConnectionType>(options.name, std::move(interfaces));         \
                connection->SetOptions(options);                                                   \
                return connection;                                                                 \
            });                                                                                    \
        return true;                                                                               \
    }();                                                                                           \
    }

#define CADENCE_REGISTER_CONNECTION_IMPL(ConnectionType, TypeName, Counter)                        \
    CADENCE_REGISTER_CONNECTION_IMPL2(ConnectionType, TypeName, Counter)

#define CADENCE_REGISTER_CONNECTION_AS(ConnectionType, TypeName)                                   \
    CADENCE_REGISTER_CONNECTION_IMPL(ConnectionType, TypeName, __COUNTER__)

} // namespace cadence
