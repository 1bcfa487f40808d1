#pragma once

/**
 * @file Registration.hpp
 * @brief Factory registration of the built-in model library
 */

namespace cadence {
namespace models {

/**
 * @brief Register every built-in model and connection type with the ModelFactory
 *
 * Runs once at static initialization when the model library is linked in;
 * call it explicitly after ModelFactory::Clear() or when the linker dropped
 * the registration unit. Registering again replaces the entries.
 */
void RegisterModels();

} // namespace models
} // namespace cadence
