/**
 * @file SymbolRegistry.cpp
 * @brief Symbol registry and time differentiation
 */

#include <cadence/symbolic/SymbolRegistry.hpp>

#include <cadence/core/Error.hpp>
#include <cadence/symbolic/Algebra.hpp>

namespace cadence {

// =============================================================================
// TimeDerivative
// =============================================================================

void TimeDerivative::Add(const SymbolicScalar &value, const SymbolicScalar &rate) {
    values_.push_back(value);
    rates_.push_back(rate);
}

SymbolicScalar TimeDerivative::Dt(const SymbolicScalar &expr) const {
    const auto rows = static_cast<int>(expr.size1());
    const auto cols = static_cast<int>(expr.size2());
    if (values_.empty() || expr.is_empty()) {
        return algebra::Zeros(rows, cols);
    }
    // Column-major flatten, differentiate, fold back
    SymbolicScalar flat = SymbolicScalar::reshape(expr, rows * cols, 1);
    SymbolicScalar jac = algebra::Jacobian(flat, algebra::Stack(values_));
    SymbolicScalar rate = algebra::Mul(jac, algebra::Stack(rates_));
    return SymbolicScalar::reshape(rate, rows, cols);
}

// =============================================================================
// SymbolRegistry
// =============================================================================

std::string SymbolRegistry::MakeIdentifier(const std::string &owner_path,
                                           const std::string &logical_name, SymbolKind kind) {
    std::string id = MakeFullPath(owner_path, logical_name);
    switch (kind) {
    case SymbolKind::Constant:
        break;
    case SymbolKind::Coordinate:
        id += "[q]";
        break;
    case SymbolKind::Speed:
        id += "[u]";
        break;
    case SymbolKind::Auxiliary:
        id += "[aux]";
        break;
    }
    return id;
}

void SymbolRegistry::ValidatePath(const std::string &owner_path) {
    std::size_t start = 0;
    while (true) {
        std::size_t dot = owner_path.find('.', start);
        std::string segment = owner_path.substr(start, dot == std::string::npos ? std::string::npos
                                                                                 : dot - start);
        if (!IsIdentifier(segment)) {
            throw DefinitionError("invalid owner path '" + owner_path + "' (segment '" + segment +
                                  "' is not an identifier)");
        }
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
}

const Symbol &SymbolRegistry::Generate(const std::string &owner_path,
                                       const std::string &logical_name, SymbolKind kind,
                                       const std::string &description) {
    Key key{owner_path, logical_name, kind};
    auto it = index_.find(key);
    if (it != index_.end()) {
        Symbol &existing = symbols_[it->second];
        if (existing.description.empty() && !description.empty()) {
            existing.description = description;
        }
        return existing;
    }

    ValidatePath(owner_path);
    if (!IsIdentifier(logical_name)) {
        throw DefinitionError("invalid symbol name '" + logical_name + "' for '" + owner_path +
                              "'");
    }

    std::string identifier = MakeIdentifier(owner_path, logical_name, kind);
    if (!identifiers_.insert(identifier).second) {
        throw DefinitionError("symbol identifier collision: '" + identifier + "'");
    }

    Symbol symbol;
    symbol.identifier = identifier;
    symbol.owner_path = owner_path;
    symbol.logical_name = logical_name;
    symbol.kind = kind;
    symbol.description = description;
    symbol.value = algebra::NewSymbol(identifier);
    if (symbol.IsTimeVarying()) {
        symbol.rate = algebra::NewSymbol(identifier + "'");
        derivatives_.Add(symbol.value, symbol.rate);
    }

    index_.emplace(std::move(key), symbols_.size());
    symbols_.push_back(std::move(symbol));
    return symbols_.back();
}

bool SymbolRegistry::Has(const std::string &owner_path, const std::string &logical_name,
                         SymbolKind kind) const {
    return index_.count(Key{owner_path, logical_name, kind}) > 0;
}

const Symbol &SymbolRegistry::Get(const std::string &owner_path, const std::string &logical_name,
                                  SymbolKind kind) const {
    auto it = index_.find(Key{owner_path, logical_name, kind});
    if (it == index_.end()) {
        throw DefinitionError("unknown " + std::string(SymbolKindName(kind)) + " '" +
                              MakeIdentifier(owner_path, logical_name, kind) + "'");
    }
    return symbols_[it->second];
}

std::vector<const Symbol *> SymbolRegistry::Symbols() const {
    std::vector<const Symbol *> result;
    result.reserve(symbols_.size());
    for (const auto &symbol : symbols_) {
        result.push_back(&symbol);
    }
    return result;
}

std::vector<const Symbol *> SymbolRegistry::OfKind(SymbolKind kind) const {
    std::vector<const Symbol *> result;
    for (const auto &symbol : symbols_) {
        if (symbol.kind == kind) {
            result.push_back(&symbol);
        }
    }
    return result;
}

} // namespace cadence
