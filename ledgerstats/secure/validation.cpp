#include <ledgerstats/secure/validation.hpp>

#include <vector>

namespace
{
enum class mark : uint8_t
{
	unvisited,
	in_progress,
	done
};

enum class colour : uint8_t
{
	none,
	red,
	blue
};

using sources = std::unordered_set<ledgerstats::transaction_id>;
using source_iterator = sources::const_iterator;

sources const & sources_of (ledgerstats::references const * references_a)
{
	static sources const none;
	return references_a != nullptr ? references_a->sources () : none;
}

/** A vertex on the explicit DFS stack and the position in its list of referrers */
class frame final
{
public:
	frame (ledgerstats::identifier const & vertex_a, ledgerstats::references const * references_a) :
	vertex (vertex_a),
	next (sources_of (references_a).begin ()),
	end (sources_of (references_a).end ())
	{
	}
	ledgerstats::identifier vertex;
	source_iterator next;
	source_iterator end;
};
}

boost::optional<bool> ledgerstats::is_connected_acyclic (ledgerstats::graph const & graph_a)
{
	// Vertices on the current path are in_progress, reaching one again closes a cycle
	std::vector<mark> marks (graph_a.max_identifier () + 1, mark::unvisited);
	std::vector<frame> stack;
	uint64_t visited (0);
	auto acyclic (true);
	auto enter = [&graph_a, &marks, &stack, &visited](ledgerstats::identifier const & vertex_a) {
		marks[vertex_a.number ()] = mark::in_progress;
		++visited;
		stack.emplace_back (vertex_a, graph_a.references (vertex_a));
	};
	enter (ledgerstats::identifier::root ());
	while (acyclic && !stack.empty ())
	{
		auto & top (stack.back ());
		if (top.next != top.end)
		{
			ledgerstats::identifier next (*top.next);
			++top.next;
			switch (marks[next.number ()])
			{
				case mark::unvisited:
					enter (next);
					break;
				case mark::in_progress:
					acyclic = false;
					break;
				case mark::done:
					break;
			}
		}
		else
		{
			marks[top.vertex.number ()] = mark::done;
			stack.pop_back ();
		}
	}
	boost::optional<bool> result;
	if (!acyclic)
	{
		result = false;
	}
	else if (visited == graph_a.max_identifier ())
	{
		result = true;
	}
	return result;
}

bool ledgerstats::is_bipartite (ledgerstats::graph const & graph_a)
{
	std::vector<colour> colours (graph_a.max_identifier () + 1, colour::none);
	std::vector<ledgerstats::identifier> pending;
	auto result (true);
	colours[ledgerstats::root_number] = colour::red;
	pending.push_back (ledgerstats::identifier::root ());
	while (result && !pending.empty ())
	{
		auto vertex (pending.back ());
		pending.pop_back ();
		auto current (colours[vertex.number ()]);
		auto opposite (current == colour::red ? colour::blue : colour::red);
		auto references (graph_a.references (vertex));
		if (references != nullptr)
		{
			for (auto i (references->sources ().begin ()), n (references->sources ().end ()); i != n && result; ++i)
			{
				auto & existing (colours[i->number ()]);
				if (existing == colour::none)
				{
					existing = opposite;
					pending.push_back (ledgerstats::identifier (*i));
				}
				else if (existing != opposite)
				{
					result = false;
				}
			}
		}
	}
	return result;
}

std::error_code ledgerstats::validation_error (boost::optional<bool> const & connected_acyclic_a)
{
	std::error_code result;
	if (!connected_acyclic_a)
	{
		result = ledgerstats::error_validation::disconnected;
	}
	else if (!*connected_acyclic_a)
	{
		result = ledgerstats::error_validation::cyclic;
	}
	return result;
}
