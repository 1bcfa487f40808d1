#pragma once

/**
 * @file ModelLoader.hpp
 * @brief Builds model trees from YAML descriptions
 *
 * Uses Vulcan's YAML infrastructure for parsing and type-safe value
 * extraction. Types are resolved through the ModelFactory, so every type
 * named in the file must be registered (see models::RegisterModels()).
 *
 * Format:
 * @code
 * model:
 *   type: RollingDisc
 *   name: rolling_disc
 *   children:
 *     - role: disc
 *       type: KnifeEdgeWheel
 *       name: disc
 *   connections:
 *     - type: NonHolonomicTyre
 *       name: tyre
 *       interfaces: [ground.surface, disc.hub]
 *   options:
 *     scalars: { ... }
 *     strings: { ... }
 *     booleans: { ... }
 * @endcode
 */

#include <cadence/core/Error.hpp>
#include <cadence/core/ModelBase.hpp>
#include <cadence/core/ModelFactory.hpp>
#include <cadence/core/ModelOptions.hpp>
#include <cadence/io/LogService.hpp>

#include <vulcan/io/YamlNode.hpp>

#include <memory>
#include <string>
#include <vector>

namespace cadence::io {

/// Parsed connection entry
struct ConnectionDescription {
    ModelOptions options;
    std::string role;                    ///< Defaults to the connection name
    std::vector<std::string> interfaces; ///< "<child role>.<interface role>" paths
};

/// Parsed model entry (recursive)
struct ModelDescription {
    ModelOptions options;
    std::string role; ///< Empty for the root
    std::vector<ModelDescription> children;
    std::vector<ConnectionDescription> connections;
};

class ModelLoader {
  public:
    /**
     * @brief Load a model description from file
     * @throws ConfigError on parsing or validation errors
     */
    static ModelDescription Load(const std::string &path) {
        try {
            auto root = vulcan::io::YamlNode::LoadFile(path);
            return ParseRoot(root);
        } catch (const vulcan::io::YamlError &e) {
            throw ConfigError(e.what(), path);
        }
    }

    /// Parse a model description from a YAML string
    static ModelDescription Parse(const std::string &yaml_content) {
        try {
            auto root = vulcan::io::YamlNode::Parse(yaml_content);
            return ParseRoot(root);
        } catch (const vulcan::io::YamlError &e) {
            throw ConfigError(e.what());
        }
    }

    /**
     * @brief Instantiate a tree from a description
     *
     * @throws ConfigError for unknown types or unresolvable interface paths
     * @throws StructuralError / InterfaceConflictError from tree construction
     */
    static std::unique_ptr<ModelBase> Build(const ModelDescription &description) {
        const auto &factory = ModelFactory::Instance();
        std::unique_ptr<ModelBase> model = factory.CreateModel(description.options);

        for (const auto &child : description.children) {
            model->AttachSubModel(child.role, Build(child));
        }
        for (const auto &conn : description.connections) {
            std::vector<Interface *> interfaces;
            interfaces.reserve(conn.interfaces.size());
            for (const auto &path : conn.interfaces) {
                interfaces.push_back(&ResolveInterface(*model, path));
            }
            auto connection = factory.CreateConnection(conn.options, std::move(interfaces));
            model->AddConnection(conn.role, std::move(connection));
        }

        CADENCE_LOG_DEBUG("Built '" + model->Name() + "' (" + model->TypeName() + ") with " +
                          std::to_string(description.children.size()) + " children and " +
                          std::to_string(description.connections.size()) + " connections");
        return model;
    }

    /// Load and build in one step
    static std::unique_ptr<ModelBase> LoadModel(const std::string &path) {
        return Build(Load(path));
    }

    /**
     * @brief Find an interface by "<role>.<role>...<interface>" below @p model
     * @throws ConfigError if a segment cannot be resolved
     */
    static Interface &ResolveInterface(ModelBase &model, const std::string &path) {
        std::vector<std::string> segments;
        std::size_t start = 0;
        while (true) {
            std::size_t dot = path.find('.', start);
            segments.push_back(path.substr(start, dot == std::string::npos ? std::string::npos
                                                                            : dot - start));
            if (dot == std::string::npos) {
                break;
            }
            start = dot + 1;
        }

        ModelBase *current = &model;
        for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
            if (!current->HasSubModel(segments[i])) {
                throw ConfigError("Interface path '" + path + "': '" + current->Path() +
                                  "' has no sub-model '" + segments[i] + "'");
            }
            current = &current->GetSubModel(segments[i]);
        }
        if (!current->HasInterface(segments.back())) {
            throw ConfigError("Interface path '" + path + "': '" + current->Path() +
                              "' declares no interface '" + segments.back() + "'");
        }
        return current->GetInterface(segments.back());
    }

  private:
    static ModelDescription ParseRoot(const vulcan::io::YamlNode &root) {
        if (!root.Has("model")) {
            throw ConfigError("Model description must have a 'model' section");
        }
        return ParseModel(root["model"]);
    }

    static ModelDescription ParseModel(const vulcan::io::YamlNode &node) {
        ModelDescription desc;
        desc.options = ParseOptions(node);
        desc.role = node.Get<std::string>("role", "");

        if (node.Has("children")) {
            node["children"].ForEach([&](const vulcan::io::YamlNode &child_node) {
                ModelDescription child = ParseModel(child_node);
                if (child.role.empty()) {
                    child.role = child.options.name;
                }
                desc.children.push_back(std::move(child));
            });
        }

        if (node.Has("connections")) {
            node["connections"].ForEach([&](const vulcan::io::YamlNode &conn_node) {
                ConnectionDescription conn;
                conn.options = ParseOptions(conn_node);
                conn.role = conn_node.Get<std::string>("role", conn.options.name);
                conn_node["interfaces"].ForEach([&](const vulcan::io::YamlNode &path) {
                    conn.interfaces.push_back(path.As<std::string>());
                });
                desc.connections.push_back(std::move(conn));
            });
        }
        return desc;
    }

    static ModelOptions ParseOptions(const vulcan::io::YamlNode &node) {
        ModelOptions options;
        options.type = node.Require<std::string>("type");
        options.name = node.Require<std::string>("name");

        if (!node.Has("options")) {
            return options;
        }
        const auto opts = node["options"];
        if (opts.Has("scalars")) {
            opts["scalars"].ForEachEntry(
                [&](const std::string &key, const vulcan::io::YamlNode &val) {
                    options.scalars[key] = val.As<double>();
                });
        }
        if (opts.Has("strings")) {
            opts["strings"].ForEachEntry(
                [&](const std::string &key, const vulcan::io::YamlNode &val) {
                    options.strings[key] = val.As<std::string>();
                });
        }
        if (opts.Has("booleans")) {
            opts["booleans"].ForEachEntry(
                [&](const std::string &key, const vulcan::io::YamlNode &val) {
                    options.booleans[key] = val.As<bool>();
                });
        }
        return options;
    }
};

} // namespace cadence::io
