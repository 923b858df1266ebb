/**
 * @file FunctionRegistry.hpp
 * @brief Named, deterministic query functions over a session handle.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "application/SessionHandle.hpp"

namespace notedrift::application {

using SessionFunction = std::vector<std::string> (*)(const SessionHandle&, const std::vector<std::string>&);

/**
 * @class FunctionRegistry
 * @brief Maps function names to typed function pointers.
 *
 * Every function is deterministic given the session date, so two calls with
 * the same handle date and arguments return the same list.
 */
class FunctionRegistry {
public:
    /** @throws std::invalid_argument for an empty name, a null function or a duplicate name. */
    void add(const std::string& name, SessionFunction fn);

    bool contains(const std::string& name) const { return m_functions.count(name) > 0; }

    /** @throws std::invalid_argument for unknown names and malformed arguments. */
    std::vector<std::string> call(const std::string& name,
                                  const SessionHandle& handle,
                                  const std::vector<std::string>& args = {}) const;

    std::vector<std::string> names() const;

private:
    std::map<std::string, SessionFunction> m_functions;
};

/**
 * @brief Registers sample_notes, old_notes, recent_notes, hubs, orphans,
 *        neighbours and cluster_labels.
 */
void RegisterBuiltinFunctions(FunctionRegistry& registry);

} // namespace notedrift::application
