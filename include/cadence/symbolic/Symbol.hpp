#pragma once

/**
 * @file Symbol.hpp
 * @brief Generated symbolic quantities and their time derivatives
 */

#include <cadence/core/CoreTypes.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace cadence {

/**
 * @brief Symbol categories
 *
 * Coordinates and speeds vary with time and get a companion derivative
 * symbol; constants and auxiliaries do not.
 */
enum class SymbolKind : uint8_t {
    Constant,   ///< Parameter (mass, radius, gravity)
    Coordinate, ///< Generalized coordinate q
    Speed,      ///< Generalized speed u
    Auxiliary   ///< Specified input (actuator torque) or helper quantity
};

inline const char *SymbolKindName(SymbolKind kind) {
    switch (kind) {
    case SymbolKind::Constant:
        return "constant";
    case SymbolKind::Coordinate:
        return "coordinate";
    case SymbolKind::Speed:
        return "speed";
    case SymbolKind::Auxiliary:
        return "auxiliary";
    }
    return "unknown";
}

/**
 * @brief A registered symbol
 *
 * The identifier is unique within one definition run; `value` is the
 * algebra-engine symbol and `rate` its time derivative (time-varying kinds
 * only, empty otherwise).
 */
struct Symbol {
    std::string identifier;   ///< e.g. "rolling_disc.disc.r" or "bicycle.steer.q[q]"
    std::string owner_path;   ///< Path of the node that generated it
    std::string logical_name; ///< Local token ("r", "q", "mass")
    SymbolKind kind = SymbolKind::Constant;
    std::string description;
    SymbolicScalar value;
    SymbolicScalar rate;

    [[nodiscard]] bool IsTimeVarying() const {
        return kind == SymbolKind::Coordinate || kind == SymbolKind::Speed;
    }
};

/**
 * @brief Time differentiation over the registered time-varying symbols
 *
 * d/dt expr = d(expr)/d(values) * rates, applied element-wise to matrices.
 */
class TimeDerivative {
  public:
    void Add(const SymbolicScalar &value, const SymbolicScalar &rate);

    /// Time derivative of @p expr (same shape as @p expr)
    [[nodiscard]] SymbolicScalar Dt(const SymbolicScalar &expr) const;

    [[nodiscard]] const std::vector<SymbolicScalar> &Values() const { return values_; }
    [[nodiscard]] const std::vector<SymbolicScalar> &Rates() const { return rates_; }
    [[nodiscard]] std::size_t Size() const { return values_.size(); }

  private:
    std::vector<SymbolicScalar> values_;
    std::vector<SymbolicScalar> rates_;
};

} // namespace cadence
