#pragma once

/**
 * @file Error.hpp
 * @brief Consolidated error handling for Cadence
 *
 * Flat exception hierarchy: one class per failure category, each carrying
 * a severity and a category string. Errors raised while a node is being
 * defined are annotated with the node's tree path and the stage name.
 */

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cadence {

// =============================================================================
// Error Severity
// =============================================================================

enum class Severity : uint8_t {
    INFO,    ///< Informational (logged, no action)
    WARNING, ///< Warning
    ERROR,   ///< Error (operation aborted)
    FATAL    ///< Fatal (programming error)
};

// =============================================================================
// Base Exception
// =============================================================================

/**
 * @brief Base class for all Cadence exceptions
 *
 * All Cadence exceptions carry:
 * - A severity level (defaults to ERROR)
 * - A category string for logging context
 * - Optionally, the tree path and stage of the node that was being defined
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg, Severity severity = Severity::ERROR,
                   std::string category = "general")
        : std::runtime_error("[cadence] " + msg), severity_(severity),
          category_(std::move(category)), message_("[cadence] " + msg), full_message_(message_) {}

    [[nodiscard]] const char *what() const noexcept override { return full_message_.c_str(); }

    [[nodiscard]] Severity severity() const { return severity_; }
    [[nodiscard]] const std::string &category() const { return category_; }

    /// Message without the node annotation
    [[nodiscard]] const std::string &message() const { return message_; }

    /// Tree path of the node being defined when the error was raised (may be empty)
    [[nodiscard]] const std::string &node_path() const { return node_path_; }

    /// Stage name at the time of the error (may be empty)
    [[nodiscard]] const std::string &stage_name() const { return stage_name_; }

    [[nodiscard]] bool has_node() const { return !node_path_.empty(); }

    /**
     * @brief Attach the offending node's path and stage
     *
     * The innermost annotation wins: an error already carrying a node is left
     * untouched when it propagates through enclosing nodes.
     */
    void AnnotateNode(const std::string &path, const std::string &stage) {
        if (has_node()) {
            return;
        }
        node_path_ = path;
        stage_name_ = stage;
        full_message_ = message_ + " [node '" + path + "', stage '" + stage + "']";
    }

  protected:
    Severity severity_;
    std::string category_;

  private:
    std::string message_;
    std::string full_message_;
    std::string node_path_;
    std::string stage_name_;
};

// =============================================================================
// Structural Errors
// =============================================================================

/**
 * @brief Malformed composition tree
 *
 * Raised at construction time for cycles, duplicate names, self-connections,
 * reparenting, unmet hard requirements and closed kinematic loops.
 */
class StructuralError : public Error {
  public:
    explicit StructuralError(const std::string &msg)
        : Error("Structure: " + msg, Severity::ERROR, "structure") {}

    static StructuralError DuplicateName(const std::string &parent, const std::string &name) {
        return StructuralError("'" + parent + "' already has a child named '" + name + "'");
    }

    static StructuralError Cycle(const std::string &parent, const std::string &child) {
        return StructuralError("attaching '" + child + "' below '" + parent +
                               "' would create a cycle");
    }

    static StructuralError SelfConnection(const std::string &connection,
                                          const std::string &model) {
        return StructuralError("connection '" + connection +
                               "' joins two interfaces of the same model '" + model + "'");
    }
};

// =============================================================================
// Interface Conflicts
// =============================================================================

/**
 * @brief An interface was claimed by a second connection
 */
class InterfaceConflictError : public Error {
  public:
    InterfaceConflictError(const std::string &interface_path, const std::string &existing,
                           const std::string &incoming)
        : Error("Interface '" + interface_path + "' already claimed by '" + existing +
                    "', conflict from '" + incoming + "'",
                Severity::ERROR, "interface"),
          interface_path_(interface_path) {}

    [[nodiscard]] const std::string &interface_path() const { return interface_path_; }

  private:
    std::string interface_path_;
};

// =============================================================================
// Readiness Errors
// =============================================================================

/**
 * @brief State read before the stage that produces it has run
 */
class NotReadyError : public Error {
  public:
    explicit NotReadyError(const std::string &msg)
        : Error("Not ready: " + msg, Severity::ERROR, "lifecycle") {}
};

/**
 * @brief Single-shot lifecycle violated (define twice, modify after define)
 */
class AlreadyDefinedError : public Error {
  public:
    explicit AlreadyDefinedError(const std::string &msg)
        : Error("Already defined: " + msg, Severity::ERROR, "lifecycle") {}
};

/**
 * @brief Stage protocol violation inside a definition method
 *
 * Covers wrong-stage operations, invalid identifiers and foreign exceptions
 * escaping a stage method.
 */
class DefinitionError : public Error {
  public:
    explicit DefinitionError(const std::string &msg)
        : Error("Definition: " + msg, Severity::ERROR, "definition") {}

    /// Wrap a foreign exception raised inside a node's stage method
    DefinitionError(const std::string &path, const std::string &stage, const std::string &what)
        : Error("Definition: unexpected failure: " + what, Severity::ERROR, "definition") {
        AnnotateNode(path, stage);
    }
};

// =============================================================================
// Solver Errors
// =============================================================================

/**
 * @brief Equations-of-motion derivation rejected the aggregated system
 *
 * Carries the ownership table (symbol -> contributing node) so inconsistent
 * degrees of freedom can be traced back to sub-models.
 */
class SolverError : public Error {
  public:
    using Ownership = std::vector<std::pair<std::string, std::string>>;

    explicit SolverError(const std::string &msg)
        : Error("Solver: " + msg, Severity::ERROR, "solver") {}

    SolverError(const std::string &msg, Ownership ownership)
        : Error(FormatMessage(msg, ownership), Severity::ERROR, "solver"),
          ownership_(std::move(ownership)) {}

    /// (symbol identifier, owner path) for every coordinate and speed
    [[nodiscard]] const Ownership &ownership() const { return ownership_; }

  private:
    static std::string FormatMessage(const std::string &msg, const Ownership &ownership) {
        std::string result = "Solver: " + msg;
        for (const auto &[symbol, owner] : ownership) {
            result += "\n  " + symbol + " <- " + owner;
        }
        return result;
    }

    Ownership ownership_;
};

// =============================================================================
// Configuration Errors
// =============================================================================

/**
 * @brief Configuration/parsing errors with optional file context
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg)
        : Error("Config: " + msg, Severity::ERROR, "config") {}

    ConfigError(const std::string &message, const std::string &file, int line = -1,
                const std::string &hint = "")
        : Error(FormatMessage(message, file, line, hint), Severity::ERROR, "config"), file_(file),
          line_(line), hint_(hint) {}

    [[nodiscard]] const std::string &file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }
    [[nodiscard]] const std::string &hint() const { return hint_; }

  private:
    static std::string FormatMessage(const std::string &msg, const std::string &file, int line,
                                     const std::string &hint) {
        std::string result = "Config: " + msg;
        if (!file.empty()) {
            result += "\n  at: " + file;
            if (line >= 0) {
                result += ":" + std::to_string(line);
            }
        }
        if (!hint.empty()) {
            result += "\n  hint: " + hint;
        }
        return result;
    }

    std::string file_;
    int line_ = -1;
    std::string hint_;
};

// =============================================================================
// I/O Errors
// =============================================================================

/**
 * @brief File and I/O operation errors
 */
class IOError : public Error {
  public:
    explicit IOError(const std::string &msg) : Error("IO: " + msg, Severity::ERROR, "io") {}

    IOError(const std::string &operation, const std::string &path, const std::string &reason)
        : Error("IO: " + operation + " '" + path + "': " + reason, Severity::ERROR, "io"),
          path_(path) {}

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

} // namespace cadence

// =============================================================================
// Error Throwing Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @brief Throw an error (simple version, no logging)
 */
#define CADENCE_THROW(error) throw(error)

// NOLINTEND(cppcoreguidelines-macro-usage)
