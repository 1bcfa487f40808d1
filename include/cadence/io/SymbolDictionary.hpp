#pragma once

/**
 * @file SymbolDictionary.hpp
 * @brief Catalog of the symbols generated by one definition run
 *
 * Groups every registered symbol by the node that created it and exports
 * the catalog to YAML or JSON for documentation and parametrization.
 */

#include <cadence/core/ConnectionBase.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/core/ModelBase.hpp>
#include <cadence/symbolic/SymbolRegistry.hpp>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace cadence {

struct SymbolDictionary {
    /// One symbol
    struct SymbolEntry {
        std::string identifier;  ///< e.g. "rolling_disc.q1[q]"
        std::string name;        ///< Logical name ("q1")
        std::string description; ///< Human readable meaning
    };

    /// Symbols created by one node
    struct NodeEntry {
        std::string path; ///< Node path (e.g. "rolling_disc.disc")
        std::string type; ///< Node type (e.g. "KnifeEdgeWheel"), empty if unknown

        std::vector<SymbolEntry> coordinates;
        std::vector<SymbolEntry> speeds;
        std::vector<SymbolEntry> constants;
        std::vector<SymbolEntry> auxiliaries;
    };

    /// Nodes in order of their first symbol
    std::vector<NodeEntry> nodes;

    std::size_t total_coordinates = 0;
    std::size_t total_speeds = 0;
    std::size_t total_constants = 0;
    std::size_t total_auxiliaries = 0;

    /**
     * @brief Build from a registry, taking node types from @p root when given
     */
    static SymbolDictionary Build(const SymbolRegistry &registry,
                                  const ModelBase *root = nullptr) {
        std::map<std::string, std::string> types;
        if (root != nullptr) {
            CollectTypes(*root, types);
        }

        SymbolDictionary dict;
        std::map<std::string, std::size_t> index;
        for (const Symbol *symbol : registry.Symbols()) {
            auto it = index.find(symbol->owner_path);
            if (it == index.end()) {
                NodeEntry entry;
                entry.path = symbol->owner_path;
                auto type = types.find(symbol->owner_path);
                if (type != types.end()) {
                    entry.type = type->second;
                }
                it = index.emplace(symbol->owner_path, dict.nodes.size()).first;
                dict.nodes.push_back(std::move(entry));
            }
            NodeEntry &node = dict.nodes[it->second];
            SymbolEntry item{symbol->identifier, symbol->logical_name, symbol->description};
            switch (symbol->kind) {
            case SymbolKind::Coordinate:
                node.coordinates.push_back(std::move(item));
                break;
            case SymbolKind::Speed:
                node.speeds.push_back(std::move(item));
                break;
            case SymbolKind::Constant:
                node.constants.push_back(std::move(item));
                break;
            case SymbolKind::Auxiliary:
                node.auxiliaries.push_back(std::move(item));
                break;
            }
        }
        dict.ComputeStats();
        return dict;
    }

    void ComputeStats() {
        total_coordinates = 0;
        total_speeds = 0;
        total_constants = 0;
        total_auxiliaries = 0;
        for (const auto &node : nodes) {
            total_coordinates += node.coordinates.size();
            total_speeds += node.speeds.size();
            total_constants += node.constants.size();
            total_auxiliaries += node.auxiliaries.size();
        }
    }

    /// Entry for @p path, nullptr if the node created no symbols
    [[nodiscard]] const NodeEntry *Find(const std::string &path) const {
        for (const auto &node : nodes) {
            if (node.path == path) {
                return &node;
            }
        }
        return nullptr;
    }

    [[nodiscard]] nlohmann::json ToJSONValue() const {
        nlohmann::json j;
        j["summary"]["coordinates"] = total_coordinates;
        j["summary"]["speeds"] = total_speeds;
        j["summary"]["constants"] = total_constants;
        j["summary"]["auxiliaries"] = total_auxiliaries;

        auto to_json_symbols = [](const std::vector<SymbolEntry> &symbols) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &s : symbols) {
                arr.push_back({{"identifier", s.identifier},
                               {"name", s.name},
                               {"description", s.description}});
            }
            return arr;
        };

        j["nodes"] = nlohmann::json::array();
        for (const auto &node : nodes) {
            nlohmann::json jnode;
            jnode["path"] = node.path;
            jnode["type"] = node.type;
            jnode["coordinates"] = to_json_symbols(node.coordinates);
            jnode["speeds"] = to_json_symbols(node.speeds);
            jnode["constants"] = to_json_symbols(node.constants);
            jnode["auxiliaries"] = to_json_symbols(node.auxiliaries);
            j["nodes"].push_back(jnode);
        }
        return j;
    }

    /**
     * @brief Export to YAML file
     * @throws IOError if the file cannot be written
     */
    void ToYAML(const std::string &path) const {
        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "summary" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "coordinates" << YAML::Value << total_coordinates;
        out << YAML::Key << "speeds" << YAML::Value << total_speeds;
        out << YAML::Key << "constants" << YAML::Value << total_constants;
        out << YAML::Key << "auxiliaries" << YAML::Value << total_auxiliaries;
        out << YAML::EndMap;

        out << YAML::Key << "nodes" << YAML::Value << YAML::BeginSeq;
        for (const auto &node : nodes) {
            out << YAML::BeginMap;
            out << YAML::Key << "path" << YAML::Value << node.path;
            if (!node.type.empty()) {
                out << YAML::Key << "type" << YAML::Value << node.type;
            }

            auto emit_symbols = [&out](const std::string &key,
                                       const std::vector<SymbolEntry> &symbols) {
                if (symbols.empty()) {
                    return;
                }
                out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
                for (const auto &s : symbols) {
                    out << YAML::BeginMap;
                    out << YAML::Key << "identifier" << YAML::Value << s.identifier;
                    out << YAML::Key << "name" << YAML::Value << s.name;
                    out << YAML::Key << "description" << YAML::Value << s.description;
                    out << YAML::EndMap;
                }
                out << YAML::EndSeq;
            };

            emit_symbols("coordinates", node.coordinates);
            emit_symbols("speeds", node.speeds);
            emit_symbols("constants", node.constants);
            emit_symbols("auxiliaries", node.auxiliaries);

            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;

        WriteFile(path, out.c_str());
    }

    /**
     * @brief Export to JSON file
     * @throws IOError if the file cannot be written
     */
    void ToJSON(const std::string &path) const { WriteFile(path, ToJSONValue().dump(2)); }

  private:
    static void CollectTypes(const ModelBase &model, std::map<std::string, std::string> &types) {
        types[model.Path()] = model.TypeName();
        for (const auto &child : model.Children()) {
            CollectTypes(*child.model, types);
        }
        for (const auto &slot : model.Connections()) {
            types[slot.connection->Path()] = slot.connection->TypeName();
        }
    }

    static void WriteFile(const std::string &path, const std::string &content) {
        std::ofstream file(path);
        if (!file.is_open()) {
            throw IOError("open", path, std::strerror(errno));
        }

        file << content;

        if (file.fail()) {
            throw IOError("write", path, std::strerror(errno));
        }
    }
};

} // namespace cadence
