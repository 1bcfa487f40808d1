#pragma once

/**
 * @file ConnectionBase.hpp
 * @brief Abstract unit linking interfaces of different sub-models
 */

#include <cadence/core/Definable.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/core/Interface.hpp>

#include <string>
#include <vector>

namespace cadence {

/**
 * @brief Base class for joints, tyres and other inter-model connections
 *
 * A connection is constructed with the interfaces it joins and validated
 * when registered with a parent model. Its stage hooks run right after the
 * registering parent's hook for the same stage.
 */
class ConnectionBase : public Definable {
  public:
    ConnectionBase(std::string name, std::vector<Interface *> interfaces)
        : Definable(std::move(name), NodeKind::Connection), interfaces_(std::move(interfaces)) {}

    [[nodiscard]] const std::vector<Interface *> &Interfaces() const { return interfaces_; }

    /// @throws StructuralError if @p index is out of range
    [[nodiscard]] Interface &GetInterface(std::size_t index) const {
        if (index >= interfaces_.size()) {
            throw StructuralError("connection '" + Name() + "' has no interface #" +
                                  std::to_string(index));
        }
        return *interfaces_[index];
    }

  protected:
    /**
     * @brief Writable point of interface @p index
     * @throws StructuralError unless this connection claimed the interface
     */
    [[nodiscard]] Point &MutablePoint(std::size_t index) const {
        return RequireClaim(index).MutablePoint();
    }

    /// Writable frame of interface @p index
    [[nodiscard]] ReferenceFrame &MutableFrame(std::size_t index) const {
        return RequireClaim(index).MutableFrame();
    }

  private:
    Interface &RequireClaim(std::size_t index) const {
        Interface &interface = GetInterface(index);
        if (!interface.IsClaimed() || &interface.Connection() != this) {
            throw StructuralError("connection '" + Name() + "' cannot modify interface '" +
                                  interface.Path() + "' it has not claimed");
        }
        return interface;
    }

    std::vector<Interface *> interfaces_;
};

} // namespace cadence
