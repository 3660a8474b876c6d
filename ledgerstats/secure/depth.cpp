#include <ledgerstats/secure/depth.hpp>

#include <algorithm>

ledgerstats::depth_calculator::depth_calculator (ledgerstats::graph const & graph_a) :
graph (graph_a),
depths (graph_a.max_identifier () + 1, 0),
states (graph_a.max_identifier () + 1, state::unvisited)
{
	states[ledgerstats::root_number] = state::computed;
}

boost::optional<uint64_t> ledgerstats::depth_calculator::depth (ledgerstats::identifier const & id_a)
{
	boost::optional<uint64_t> result;
	if (graph.contains (id_a))
	{
		auto error (false);
		if (states[id_a.number ()] != state::computed)
		{
			stack.clear ();
			stack.push_back (id_a.transaction ());
		}
		while (!error && !stack.empty ())
		{
			auto current (stack.back ());
			auto & current_state (states[current.number ()]);
			if (current_state == state::computed)
			{
				// Pushed more than once through a shared ancestor
				stack.pop_back ();
			}
			else
			{
				auto const & transaction (graph.get (current));
				auto pending (false);
				for (auto const & reference : { transaction.left (), transaction.right () })
				{
					if (!graph.contains (reference))
					{
						error = true;
					}
					else
					{
						switch (states[reference.number ()])
						{
							case state::unvisited:
								stack.push_back (reference.transaction ());
								pending = true;
								break;
							case state::expanded:
								// Still waiting on its own references, so this one is reachable from itself
								error = true;
								break;
							case state::computed:
								break;
						}
					}
				}
				if (!error)
				{
					if (pending)
					{
						current_state = state::expanded;
					}
					else
					{
						depths[current.number ()] = 1 + std::min (known_depth (transaction.left ()), known_depth (transaction.right ()));
						current_state = state::computed;
						++cached_m;
						stack.pop_back ();
					}
				}
			}
		}
		if (!error)
		{
			result = known_depth (id_a);
		}
		else
		{
			stack.clear ();
		}
	}
	return result;
}

size_t ledgerstats::depth_calculator::cached () const
{
	return cached_m;
}

uint64_t ledgerstats::depth_calculator::known_depth (ledgerstats::identifier const & id_a) const
{
	return depths[id_a.number ()];
}
