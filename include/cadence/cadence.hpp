#pragma once

/**
 * @file cadence.hpp
 * @brief Umbrella header for the Cadence multibody composition engine
 *
 * Include this header to get access to all Cadence public APIs,
 * including the Janus symbolic types they are built on.
 */

// Dependencies
#include <janus/janus.hpp>

// Core
#include <cadence/core/ConnectionBase.hpp>
#include <cadence/core/CoreTypes.hpp>
#include <cadence/core/DefinitionContext.hpp>
#include <cadence/core/Error.hpp>
#include <cadence/core/ErrorLogging.hpp>
#include <cadence/core/Interface.hpp>
#include <cadence/core/ModelBase.hpp>
#include <cadence/core/ModelFactory.hpp>
#include <cadence/core/ModelOptions.hpp>
#include <cadence/core/Requirement.hpp>

// Symbolic mechanics
#include <cadence/symbolic/Algebra.hpp>
#include <cadence/symbolic/Point.hpp>
#include <cadence/symbolic/ReferenceFrame.hpp>
#include <cadence/symbolic/RigidBody.hpp>
#include <cadence/symbolic/SymbolRegistry.hpp>
#include <cadence/symbolic/Vector.hpp>

// Assembly
#include <cadence/assembly/AggregatedSystem.hpp>
#include <cadence/assembly/EquationsSolver.hpp>
#include <cadence/assembly/KanesMethodSolver.hpp>
#include <cadence/assembly/TreeAssembler.hpp>

// I/O
#include <cadence/io/Console.hpp>
#include <cadence/io/LogService.hpp>
#include <cadence/io/ModelLoader.hpp>
#include <cadence/io/SymbolDictionary.hpp>
#include <cadence/io/report/ModelTreeReport.hpp>
