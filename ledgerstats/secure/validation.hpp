#pragma once

#include <ledgerstats/secure/graph.hpp>

#include <boost/optional.hpp>

namespace ledgerstats
{
/**
 * Walk the reverse references from Root.
 * @return true if every transaction is reachable from Root and no cycle was found,
 * false as soon as a cycle is found, none if some transaction is unreachable.
 */
boost::optional<bool> is_connected_acyclic (ledgerstats::graph const &);

/**
 * Two-colour the reverse references starting from Root.
 * Only meaningful once is_connected_acyclic returned true.
 */
bool is_bipartite (ledgerstats::graph const &);

/**
 * Map the outcome of is_connected_acyclic to error_validation::cyclic or error_validation::disconnected
 */
std::error_code validation_error (boost::optional<bool> const &);
}
