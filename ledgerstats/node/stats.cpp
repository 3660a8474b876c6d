#include <ledgerstats/lib/numbers.hpp>
#include <ledgerstats/node/stats.hpp>

#include <boost/format.hpp>

#include <algorithm>
#include <sstream>

namespace
{
/** Quotient of two exactly representable counts, 0 when nothing was counted */
double average (double numerator_a, double denominator_a)
{
	return denominator_a == 0.0 ? 0.0 : numerator_a / denominator_a;
}

std::string format_average (char const * label_a, double value_a)
{
	return (boost::format ("> %s: %.2f") % label_a % value_a).str ();
}
}

std::string ledgerstats::stat_result::to_string () const
{
	std::ostringstream stream;
	write (stream);
	return stream.str ();
}

std::ostream & ledgerstats::operator<< (std::ostream & stream_a, ledgerstats::stat_result const & result_a)
{
	result_a.write (stream_a);
	return stream_a;
}

ledgerstats::depths_result::depths_result (double average_depth_a, double average_transactions_per_depth_a) :
average_depth (average_depth_a),
average_transactions_per_depth (average_transactions_per_depth_a)
{
}

void ledgerstats::depths_result::write (std::ostream & stream_a) const
{
	stream_a << format_average ("AVG DAG DEPTH", average_depth) << '\n'
	         << format_average ("AVG TXS PER DEPTH", average_transactions_per_depth);
}

ledgerstats::depths::depths (ledgerstats::graph const & graph_a) :
calculator (graph_a)
{
}

void ledgerstats::depths::accumulate (ledgerstats::transaction const & transaction_a)
{
	auto depth_l (calculator.depth (transaction_a.id ()));
	if (depth_l)
	{
		sum_of_depths += *depth_l;
		unique_depths.insert (*depth_l);
	}
	else
	{
		unresolved = true;
	}
}

ledgerstats::error ledgerstats::depths::result (double transaction_count_a, std::unique_ptr<ledgerstats::stat_result> & result_a) const
{
	ledgerstats::error result;
	if (unresolved)
	{
		result.set ("Depth is undefined for a cyclic graph", ledgerstats::error_validation::cyclic);
	}
	double sum_l (0.0);
	double unique_l (0.0);
	if (!result)
	{
		result = ledgerstats::to_double (sum_of_depths, sum_l);
	}
	if (!result)
	{
		result = ledgerstats::to_double (unique_depths.size (), unique_l);
	}
	if (!result)
	{
		result_a.reset (new ledgerstats::depths_result (average (sum_l, transaction_count_a + 1.0), average (transaction_count_a, unique_l)));
	}
	return result;
}

ledgerstats::in_references_result::in_references_result (double average_references_a) :
average_references (average_references_a)
{
}

void ledgerstats::in_references_result::write (std::ostream & stream_a) const
{
	stream_a << format_average ("AVG REF", average_references);
}

ledgerstats::in_references::in_references (ledgerstats::graph const & graph_a) :
graph (graph_a)
{
}

void ledgerstats::in_references::accumulate (ledgerstats::transaction const & transaction_a)
{
	if (!root_counted)
	{
		auto root_l (graph.references (ledgerstats::identifier::root ()));
		total_references += root_l != nullptr ? root_l->count () : 0;
		root_counted = true;
	}
	auto references_l (graph.references (transaction_a.id ()));
	if (references_l != nullptr)
	{
		total_references += references_l->count ();
	}
}

ledgerstats::error ledgerstats::in_references::result (double transaction_count_a, std::unique_ptr<ledgerstats::stat_result> & result_a) const
{
	double total_l (0.0);
	ledgerstats::error result (ledgerstats::to_double (total_references, total_l));
	if (!result)
	{
		result_a.reset (new ledgerstats::in_references_result (average (total_l, transaction_count_a + 1.0)));
	}
	return result;
}

ledgerstats::time_units_result::time_units_result (double average_transactions_per_time_unit_a) :
average_transactions_per_time_unit (average_transactions_per_time_unit_a)
{
}

void ledgerstats::time_units_result::write (std::ostream & stream_a) const
{
	stream_a << format_average ("AVG TXS PER TIME UNIT", average_transactions_per_time_unit);
}

void ledgerstats::time_units::accumulate (ledgerstats::transaction const & transaction_a)
{
	max_timestamp = std::max (max_timestamp, transaction_a.timestamp ());
}

ledgerstats::error ledgerstats::time_units::result (double transaction_count_a, std::unique_ptr<ledgerstats::stat_result> & result_a) const
{
	double max_l (0.0);
	ledgerstats::error result (ledgerstats::to_double (max_timestamp, max_l));
	if (!result)
	{
		result_a.reset (new ledgerstats::time_units_result (average (max_l, transaction_count_a)));
	}
	return result;
}

ledgerstats::timestamps_result::timestamps_result (double average_transactions_per_timestamp_a) :
average_transactions_per_timestamp (average_transactions_per_timestamp_a)
{
}

void ledgerstats::timestamps_result::write (std::ostream & stream_a) const
{
	stream_a << format_average ("AVG TXS PER TIMESTAMP", average_transactions_per_timestamp);
}

void ledgerstats::timestamps::accumulate (ledgerstats::transaction const & transaction_a)
{
	unique_timestamps.insert (transaction_a.timestamp ());
}

ledgerstats::error ledgerstats::timestamps::result (double transaction_count_a, std::unique_ptr<ledgerstats::stat_result> & result_a) const
{
	double unique_l (0.0);
	ledgerstats::error result (ledgerstats::to_double (unique_timestamps.size (), unique_l));
	if (!result)
	{
		result_a.reset (new ledgerstats::timestamps_result (average (transaction_count_a, unique_l)));
	}
	return result;
}

ledgerstats::stat::stat (ledgerstats::graph const & graph_a) :
graph (graph_a)
{
}

ledgerstats::stat ledgerstats::stat::make_default (ledgerstats::graph const & graph_a)
{
	ledgerstats::stat result (graph_a);
	result.add (std::make_unique<ledgerstats::depths> (graph_a));
	result.add (std::make_unique<ledgerstats::in_references> (graph_a));
	result.add (std::make_unique<ledgerstats::time_units> ());
	result.add (std::make_unique<ledgerstats::timestamps> ());
	return result;
}

void ledgerstats::stat::add (std::unique_ptr<ledgerstats::stat_accumulator> accumulator_a)
{
	accumulators_m.push_back (std::move (accumulator_a));
}

void ledgerstats::stat::collect ()
{
	for (auto const & transaction : graph.transactions ())
	{
		for (auto & accumulator : accumulators_m)
		{
			accumulator->accumulate (transaction);
		}
	}
}

ledgerstats::error ledgerstats::stat::write (std::ostream & stream_a) const
{
	double count_l (0.0);
	ledgerstats::error result (ledgerstats::to_double (graph.size (), count_l));
	for (auto i (accumulators_m.begin ()), n (accumulators_m.end ()); !result && i != n; ++i)
	{
		std::unique_ptr<ledgerstats::stat_result> result_l;
		result = (*i)->result (count_l, result_l);
		if (!result)
		{
			stream_a << *result_l << '\n';
		}
	}
	return result;
}

std::vector<std::unique_ptr<ledgerstats::stat_accumulator>> const & ledgerstats::stat::accumulators () const
{
	return accumulators_m;
}
