#pragma once

/**
 * @file ModelTreeReport.hpp
 * @brief ASCII rendering of a model tree and its symbol catalog
 *
 * Draws the hierarchy with TreeChars: models with their roles, types and
 * stages, followed by the connections each model registered and the
 * interfaces they join.
 */

#include <cadence/core/ConnectionBase.hpp>
#include <cadence/core/CoreTypes.hpp>
#include <cadence/core/ModelBase.hpp>
#include <cadence/io/Console.hpp>
#include <cadence/io/SymbolDictionary.hpp>

#include <iomanip>
#include <sstream>
#include <string>

namespace cadence {

class ModelTreeReport {
  public:
    explicit ModelTreeReport(const Console &console) : console_(console) {}

    /**
     * @brief Render the tree below @p root
     *
     * Example:
     * @code
     * rolling_disc (RollingDisc) [constraints]
     * ├── disc: disc (KnifeEdgeWheel) [constraints]
     * ├── ground: ground (FlatGround) [constraints]
     * └── ~ tyre: tyre (NonHolonomicTyre) [constraints] -> ground.surface, disc.hub
     * @endcode
     */
    [[nodiscard]] std::string FormatTree(const ModelBase &root) const {
        std::ostringstream oss;
        oss << console_.Colorize(root.Name(), AnsiColor::Bold) << " (" << root.TypeName()
            << ") [" << StageName(root.Stage()) << "]\n";
        FormatChildren(oss, root, "");
        return oss.str();
    }

    /// Counts per symbol kind and the per-node listing
    [[nodiscard]] std::string FormatSymbols(const SymbolDictionary &dict) const {
        std::ostringstream oss;
        oss << "[ SYMBOLS ]\n";
        oss << "  Coordinates: " << std::setw(4) << dict.total_coordinates
            << "        Speeds:      " << std::setw(4) << dict.total_speeds << "\n";
        oss << "  Constants:   " << std::setw(4) << dict.total_constants
            << "        Auxiliaries: " << std::setw(4) << dict.total_auxiliaries << "\n";

        for (const auto &node : dict.nodes) {
            oss << "\n  " << console_.Colorize(node.path, AnsiColor::Cyan);
            if (!node.type.empty()) {
                oss << " (" << node.type << ")";
            }
            oss << "\n";
            auto list = [&oss](const char *label,
                               const std::vector<SymbolDictionary::SymbolEntry> &symbols) {
                for (const auto &s : symbols) {
                    oss << "    " << Console::PadRight(label, 12)
                        << Console::PadRight(s.identifier, 32) << s.description << "\n";
                }
            };
            list("coordinate", node.coordinates);
            list("speed", node.speeds);
            list("constant", node.constants);
            list("auxiliary", node.auxiliaries);
        }
        return oss.str();
    }

    void PrintTree(const ModelBase &root) const { std::cout << FormatTree(root); }

  private:
    void FormatChildren(std::ostringstream &oss, const ModelBase &model,
                        const std::string &prefix) const {
        const auto &children = model.Children();
        const auto &connections = model.Connections();
        const std::size_t total = children.size() + connections.size();
        std::size_t index = 0;

        for (const auto &child : children) {
            const bool last = ++index == total;
            oss << prefix << (last ? TreeChars::Last : TreeChars::Branch) << child.role << ": "
                << child.model->Name() << " (" << child.model->TypeName() << ") ["
                << StageName(child.model->Stage()) << "]\n";
            FormatChildren(oss, *child.model, prefix + (last ? TreeChars::Blank : TreeChars::Pipe));
        }

        for (const auto &slot : connections) {
            const bool last = ++index == total;
            const ConnectionBase &connection = *slot.connection;
            oss << prefix << (last ? TreeChars::Last : TreeChars::Branch)
                << console_.Colorize("~ ", AnsiColor::Gray) << slot.role << ": "
                << connection.Name() << " (" << connection.TypeName() << ") ["
                << StageName(connection.Stage()) << "] -> ";
            for (std::size_t i = 0; i < connection.Interfaces().size(); ++i) {
                const Interface *interface = connection.Interfaces()[i];
                oss << (i > 0 ? ", " : "") << RelativePath(model, *interface);
            }
            oss << "\n";
        }
    }

    /// Interface path relative to the registering model
    static std::string RelativePath(const ModelBase &model, const Interface &interface) {
        const std::string base = model.Path() + ".";
        std::string path = interface.Path();
        if (path.compare(0, base.size(), base) == 0) {
            path = path.substr(base.size());
        }
        return path;
    }

    const Console &console_;
};

} // namespace cadence
