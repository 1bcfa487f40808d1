#pragma once

/**
 * @file SymbolRegistry.hpp
 * @brief Collision-free symbol generation scoped by owner path
 *
 * One registry exists per DefineAll() run. It is owned by the root model
 * during definition, handed to the aggregated system, and discarded with it.
 */

#include <cadence/symbolic/Symbol.hpp>

#include <deque>
#include <map>
#include <string>
#include <tuple>
#include <unordered_set>
#include <vector>

namespace cadence {

/**
 * @brief Registry of generated symbols keyed by (owner path, logical name, kind)
 *
 * Example:
 * @code
 * SymbolRegistry registry;
 * const Symbol& r = registry.Generate("bicycle.front_wheel", "r", SymbolKind::Constant);
 * const Symbol& r2 = registry.Generate("bicycle.front_wheel", "r", SymbolKind::Constant);
 * // &r == &r2, r.identifier == "bicycle.front_wheel.r"
 * @endcode
 */
class SymbolRegistry {
  public:
    SymbolRegistry() = default;

    SymbolRegistry(const SymbolRegistry &) = delete;
    SymbolRegistry &operator=(const SymbolRegistry &) = delete;

    /**
     * @brief Generate (or look up) a symbol
     *
     * Idempotent: identical triples return the same Symbol object. A
     * non-empty description fills in a previously empty one.
     *
     * @throws DefinitionError if a path segment or the logical name is not an identifier
     */
    const Symbol &Generate(const std::string &owner_path, const std::string &logical_name,
                           SymbolKind kind, const std::string &description = "");

    [[nodiscard]] bool Has(const std::string &owner_path, const std::string &logical_name,
                           SymbolKind kind) const;

    /// @throws DefinitionError if the triple was never generated
    [[nodiscard]] const Symbol &Get(const std::string &owner_path,
                                    const std::string &logical_name, SymbolKind kind) const;

    [[nodiscard]] std::size_t Size() const { return symbols_.size(); }

    /// All symbols in creation order
    [[nodiscard]] std::vector<const Symbol *> Symbols() const;

    /// Symbols of one kind in creation order
    [[nodiscard]] std::vector<const Symbol *> OfKind(SymbolKind kind) const;

    [[nodiscard]] const TimeDerivative &Derivatives() const { return derivatives_; }

    /// Build the identifier string for a triple (no registration)
    [[nodiscard]] static std::string MakeIdentifier(const std::string &owner_path,
                                                    const std::string &logical_name,
                                                    SymbolKind kind);

  private:
    using Key = std::tuple<std::string, std::string, SymbolKind>;

    static void ValidatePath(const std::string &owner_path);

    std::deque<Symbol> symbols_; ///< Stable addresses
    std::map<Key, std::size_t> index_;
    std::unordered_set<std::string> identifiers_;
    TimeDerivative derivatives_;
};

} // namespace cadence
