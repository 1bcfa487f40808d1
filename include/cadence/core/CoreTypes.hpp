#pragma once

/**
 * @file CoreTypes.hpp
 * @brief Core type definitions and configuration for Cadence
 *
 * Re-exports the Janus symbolic types used throughout the composition engine
 * and defines the staged definition lifecycle shared by models and connections.
 */

#include <cstdint>
#include <string>

// Re-export Janus types
#include <janus/core/JanusTypes.hpp>

namespace cadence {

// =============================================================================
// Build Mode Detection
// =============================================================================

/// Check if we're in debug mode at compile time
#ifdef CADENCE_DEBUG
constexpr bool kDebugMode = true;
#else
constexpr bool kDebugMode = false;
#endif

// =============================================================================
// Janus Type Re-exports
// =============================================================================

using janus::NumericMatrix;
using janus::NumericScalar;
using janus::NumericVector;
using janus::SymbolicScalar;

using janus::sym;

// =============================================================================
// Definition Lifecycle
// =============================================================================

/**
 * @brief Definition stages of a model or connection
 *
 * Stages are strictly ordered. A node's marker records the last stage it
 * completed; the assembler advances every node one stage at a time.
 */
enum class DefinitionStage : uint8_t {
    Uninitialized,      ///< Structure only, nothing defined
    ConnectionsDefined, ///< Connections declared
    ObjectsDefined,     ///< Bodies, frames, points and symbols created
    KinematicsDefined,  ///< Orientations, positions and KDEs established
    LoadsDefined,       ///< Forces and torques applied
    ConstraintsDefined  ///< Constraint equations added, node fully defined
};

/// Human readable stage name (used in error messages and log context)
inline const char *StageName(DefinitionStage stage) {
    switch (stage) {
    case DefinitionStage::Uninitialized:
        return "uninitialized";
    case DefinitionStage::ConnectionsDefined:
        return "connections";
    case DefinitionStage::ObjectsDefined:
        return "objects";
    case DefinitionStage::KinematicsDefined:
        return "kinematics";
    case DefinitionStage::LoadsDefined:
        return "loads";
    case DefinitionStage::ConstraintsDefined:
        return "constraints";
    }
    return "unknown";
}

/// Stage that must be completed before @p stage may run
inline DefinitionStage PreviousStage(DefinitionStage stage) {
    if (stage == DefinitionStage::Uninitialized) {
        return stage;
    }
    return static_cast<DefinitionStage>(static_cast<uint8_t>(stage) - 1);
}

// =============================================================================
// Version Information
// =============================================================================

#define CADENCE_VERSION_MAJOR 0
#define CADENCE_VERSION_MINOR 3
#define CADENCE_VERSION_PATCH 0

#define CADENCE_STRINGIFY(x) #x
#define CADENCE_VERSION_STR(major, minor, patch)                                                   \
    CADENCE_STRINGIFY(major) "." CADENCE_STRINGIFY(minor) "." CADENCE_STRINGIFY(patch)

constexpr int VersionMajor() { return CADENCE_VERSION_MAJOR; }
constexpr int VersionMinor() { return CADENCE_VERSION_MINOR; }
constexpr int VersionPatch() { return CADENCE_VERSION_PATCH; }

/// Version string (derived from components)
constexpr const char *Version() {
    return CADENCE_VERSION_STR(CADENCE_VERSION_MAJOR, CADENCE_VERSION_MINOR,
                               CADENCE_VERSION_PATCH);
}

// =============================================================================
// Naming Utilities
// =============================================================================

/**
 * @brief Build a tree path from a parent path and a node name
 *
 * Returns "parent.name" if parent is non-empty, otherwise just "name".
 * Used for model paths, symbol identifiers and log context.
 */
inline std::string MakeFullPath(const std::string &parent, const std::string &name) {
    if (parent.empty())
        return name;
    return parent + "." + name;
}

/**
 * @brief Check that a token can be used as a path segment or symbol name
 *
 * Accepts [A-Za-z_][A-Za-z0-9_]*. Dots are reserved as path separators.
 */
inline bool IsIdentifier(const std::string &token) {
    if (token.empty()) {
        return false;
    }
    auto is_alpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); };
    if (!is_alpha(token[0]) && token[0] != '_') {
        return false;
    }
    for (char c : token) {
        if (!is_alpha(c) && !(c >= '0' && c <= '9') && c != '_') {
            return false;
        }
    }
    return true;
}

} // namespace cadence

// =============================================================================
// Debug Assertion Macros
// =============================================================================

#ifdef CADENCE_DEBUG

/**
 * @brief Assert a condition in debug builds, throw if false
 * @param cond Condition to check
 * @param msg Error message if condition fails
 *
 * In release builds, this macro compiles to nothing.
 */
#define CADENCE_ASSERT(cond, msg)                                                                  \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            throw std::runtime_error(std::string("CADENCE_ASSERT failed: ") + (msg));              \
        }                                                                                          \
    } while (0)

/**
 * @brief Assert a pointer is non-null in debug builds
 */
#define CADENCE_ASSERT_PTR(ptr, context)                                                           \
    CADENCE_ASSERT((ptr) != nullptr, "Null pointer in " context)

#else // Release builds

#define CADENCE_ASSERT(cond, msg) ((void)0)
#define CADENCE_ASSERT_PTR(ptr, context) ((void)0)

#endif // CADENCE_DEBUG
