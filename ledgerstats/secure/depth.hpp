#pragma once

#include <ledgerstats/secure/graph.hpp>

#include <boost/optional.hpp>

#include <vector>

namespace ledgerstats
{
/**
 * Shortest distance to Root: depth (Root) = 0 and
 * depth (t) = 1 + min (depth (t.left), depth (t.right)).
 * Results are cached so ancestors shared by many descendants are computed once; keep one
 * calculator alive for a whole pass over the graph.
 */
class depth_calculator final
{
public:
	depth_calculator (ledgerstats::graph const &);
	/** None if the computation runs into a cycle or a reference outside the graph */
	boost::optional<uint64_t> depth (ledgerstats::identifier const &);
	size_t cached () const;

private:
	enum class state : uint8_t
	{
		unvisited,
		expanded,
		computed
	};
	uint64_t known_depth (ledgerstats::identifier const &) const;
	ledgerstats::graph const & graph;
	// Indexed by identifier number
	std::vector<uint64_t> depths;
	std::vector<state> states;
	std::vector<ledgerstats::transaction_id> stack;
	size_t cached_m{ 0 };
};
}
