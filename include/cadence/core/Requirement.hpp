#pragma once

/**
 * @file Requirement.hpp
 * @brief Role requirements a model places on its sub-models and connections
 */

#include <cadence/core/CoreTypes.hpp>
#include <cadence/core/Error.hpp>

#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

namespace cadence {

/// Whether a requirement is filled by a sub-model or by a connection
enum class RequirementKind : uint8_t { Model, Connection };

/**
 * @brief A named role that must (or may) be filled by a node of given types
 *
 * `types` lists type or family names (e.g. "WheelBase"); a node satisfies
 * the requirement if any of its families is listed.
 *
 * Example:
 * @code
 * Requirement req("front_wheel", {"WheelBase"}, "Front wheel of the bicycle.");
 * req.FullName(); // "Front wheel"
 * req.TypeName(); // "WheelBase"
 * @endcode
 */
class Requirement {
  public:
    /**
     * @param attribute_name Role name, must be an identifier
     * @param types Accepted type or family names (at least one)
     * @param description Empty picks "<TypeName> model."
     * @param hard_requirement Whether DefineAll() refuses to run without it
     * @param full_name Empty picks the capitalized role with spaces
     * @param type_name Empty joins @p types with " or "
     * @throws DefinitionError for an invalid attribute name or empty type list
     */
    Requirement(std::string attribute_name, std::vector<std::string> types,
                std::string description = "", bool hard_requirement = false,
                std::string full_name = "", std::string type_name = "",
                RequirementKind kind = RequirementKind::Model)
        : attribute_name_(std::move(attribute_name)), types_(std::move(types)),
          description_(std::move(description)), hard_(hard_requirement),
          full_name_(std::move(full_name)), type_name_(std::move(type_name)), kind_(kind) {
        if (!IsIdentifier(attribute_name_)) {
            throw DefinitionError("'" + attribute_name_ +
                                  "' is not a valid attribute name for a requirement");
        }
        if (types_.empty()) {
            throw DefinitionError("requirement '" + attribute_name_ + "' lists no types");
        }
        if (full_name_.empty()) {
            full_name_ = DefaultFullName(attribute_name_);
        }
        if (type_name_.empty()) {
            for (const auto &type : types_) {
                if (!type_name_.empty()) {
                    type_name_ += " or ";
                }
                type_name_ += type;
            }
        }
        if (description_.empty()) {
            description_ = types_.front() + " model.";
        }
    }

    /// Connection requirement shorthand
    [[nodiscard]] static Requirement Connection(std::string attribute_name,
                                                std::vector<std::string> types,
                                                std::string description = "",
                                                bool hard_requirement = false) {
        return Requirement(std::move(attribute_name), std::move(types), std::move(description),
                           hard_requirement, "", "", RequirementKind::Connection);
    }

    [[nodiscard]] const std::string &AttributeName() const { return attribute_name_; }
    [[nodiscard]] const std::vector<std::string> &Types() const { return types_; }
    [[nodiscard]] const std::string &Description() const { return description_; }
    [[nodiscard]] bool Hard() const { return hard_; }
    [[nodiscard]] const std::string &FullName() const { return full_name_; }
    [[nodiscard]] const std::string &TypeName() const { return type_name_; }
    [[nodiscard]] RequirementKind Kind() const { return kind_; }

    /// Whether a node belonging to @p families fills this requirement
    [[nodiscard]] bool IsSatisfiedBy(const std::vector<std::string> &families) const {
        for (const auto &family : families) {
            for (const auto &type : types_) {
                if (family == type) {
                    return true;
                }
            }
        }
        return false;
    }

    /// "front_wheel" -> "Front wheel"
    [[nodiscard]] static std::string DefaultFullName(const std::string &attribute_name) {
        std::string result = attribute_name;
        for (std::size_t i = 0; i < result.size(); ++i) {
            char c = result[i];
            if (c == '_') {
                result[i] = ' ';
            } else if (i == 0) {
                result[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            } else {
                result[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
        }
        return result;
    }

  private:
    std::string attribute_name_;
    std::vector<std::string> types_;
    std::string description_;
    bool hard_;
    std::string full_name_;
    std::string type_name_;
    RequirementKind kind_;
};

} // namespace cadence
