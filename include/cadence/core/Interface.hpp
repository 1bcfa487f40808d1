#pragma once

/**
 * @file Interface.hpp
 * @brief Named attachment point (point + frame) exposed by a sub-model
 */

#include <cadence/symbolic/Point.hpp>
#include <cadence/symbolic/ReferenceFrame.hpp>

#include <string>

namespace cadence {

class ModelBase;
class ConnectionBase;

/**
 * @brief Attachment point declared by a model and bound in its objects stage
 *
 * Outside its owner an interface is read-only. A single connection may
 * claim it; the claim is made when the connection is registered.
 */
class Interface {
  public:
    Interface(ModelBase &owner, std::string role) : owner_(&owner), role_(std::move(role)) {}

    Interface(const Interface &) = delete;
    Interface &operator=(const Interface &) = delete;

    [[nodiscard]] const std::string &Role() const { return role_; }
    [[nodiscard]] ModelBase &Owner() const { return *owner_; }

    /// "<owner path>.<role>"
    [[nodiscard]] std::string Path() const;

    /**
     * @brief Reference point (read-only)
     * @throws NotReadyError before the owner completed its objects stage
     */
    [[nodiscard]] const Point &GetPoint() const;

    /**
     * @brief Reference frame (read-only)
     * @throws NotReadyError before the owner completed its objects stage
     */
    [[nodiscard]] const ReferenceFrame &GetFrame() const;

    [[nodiscard]] bool IsBound() const { return point_ != nullptr && frame_ != nullptr; }
    [[nodiscard]] bool IsClaimed() const { return connection_ != nullptr; }

    /// @throws NotReadyError if no connection claimed this interface
    [[nodiscard]] ConnectionBase &Connection() const;

  private:
    friend class DefinitionContext;
    friend class ModelBase;
    friend class ConnectionBase;

    // Write access for the owner (DefinitionContext) and the claiming connection
    [[nodiscard]] Point &MutablePoint() const;
    [[nodiscard]] ReferenceFrame &MutableFrame() const;

    void Bind(Point &point, ReferenceFrame &frame) {
        point_ = &point;
        frame_ = &frame;
    }
    void Claim(ConnectionBase &connection) { connection_ = &connection; }

    void RequireReady(const char *what) const;

    ModelBase *owner_;
    std::string role_;
    Point *point_ = nullptr;
    ReferenceFrame *frame_ = nullptr;
    ConnectionBase *connection_ = nullptr;
};

} // namespace cadence
