#include <ledgerstats/secure/graph.hpp>

#include <boost/format.hpp>

#include <algorithm>
#include <cassert>
#include <limits>
#include <string>

namespace
{
// Don't trust the declared count for preallocation beyond this
size_t const max_reserve = 1 << 20;

/** Read one line without its terminator, false at end of stream */
bool read_line (std::istream & stream_a, std::string & line_a)
{
	auto result (!std::getline (stream_a, line_a).fail ());
	if (result && !line_a.empty () && line_a.back () == '\r')
	{
		line_a.pop_back ();
	}
	return result;
}
}

void ledgerstats::references::add (ledgerstats::transaction_id const & id_a)
{
	sources_m.insert (id_a);
	++count_m;
}

uint64_t ledgerstats::references::count () const
{
	return count_m;
}

std::unordered_set<ledgerstats::transaction_id> const & ledgerstats::references::sources () const
{
	return sources_m;
}

ledgerstats::graph::graph (std::vector<ledgerstats::transaction> const & transactions_a)
{
	transactions_m.reserve (transactions_a.size ());
	for (auto const & transaction : transactions_a)
	{
		assert (transaction.id ().number () == transactions_m.size () + 2);
		add (transaction);
	}
}

ledgerstats::graph::graph (ledgerstats::error & error_a, std::istream & stream_a)
{
	std::string line;
	if (read_line (stream_a, line))
	{
		uint64_t count (0);
		auto ec (ledgerstats::decode_dec (line, count));
		if (!ec)
		{
			transactions_m.reserve (std::min<uint64_t> (count, max_reserve));
			reverse.reserve (std::min<uint64_t> (count, max_reserve) + 1);
			// Root plus every declared transaction
			auto max (count == std::numeric_limits<uint64_t>::max () ? count : count + 1);
			for (uint64_t i (0); !error_a && read_line (stream_a, line); ++i)
			{
				if (i + 1 > count)
				{
					error_a = ledgerstats::error_graph::too_many_transactions;
				}
				else
				{
					auto id (i + 2);
					ledgerstats::transaction transaction (error_a, id, line);
					if (!error_a)
					{
						if (transaction.left ().number () > max)
						{
							error_a.set (boost::str (boost::format ("Invalid left ref to %1% on Tx:%2% max=%3%") % transaction.left () % id % max), ledgerstats::error_graph::invalid_left_reference);
						}
						else if (transaction.right ().number () > max)
						{
							error_a.set (boost::str (boost::format ("Invalid right ref to %1% on Tx:%2% max=%3%") % transaction.right () % id % max), ledgerstats::error_graph::invalid_right_reference);
						}
						else
						{
							add (transaction);
						}
					}
					else
					{
						error_a.wrap (boost::str (boost::format ("Invalid transaction on line %1%") % (i + 2)));
					}
				}
			}
			if (!error_a)
			{
				if (stream_a.bad ())
				{
					error_a = ledgerstats::error_graph::io;
				}
				else if (transactions_m.size () < count)
				{
					error_a = ledgerstats::error_graph::too_little_transactions;
				}
			}
		}
		else
		{
			error_a = ledgerstats::error_graph::invalid_count;
			error_a.set_message (error_a.get_message () + ": " + ec.message ());
		}
	}
	else if (stream_a.bad ())
	{
		error_a = ledgerstats::error_graph::io;
	}
	else
	{
		error_a = ledgerstats::error_graph::missing_count;
	}
}

void ledgerstats::graph::add (ledgerstats::transaction const & transaction_a)
{
	reverse[transaction_a.left ()].add (transaction_a.id ());
	reverse[transaction_a.right ()].add (transaction_a.id ());
	transactions_m.push_back (transaction_a);
}

size_t ledgerstats::graph::size () const
{
	return transactions_m.size ();
}

bool ledgerstats::graph::empty () const
{
	return transactions_m.empty ();
}

std::vector<ledgerstats::transaction> const & ledgerstats::graph::transactions () const
{
	return transactions_m;
}

bool ledgerstats::graph::contains (ledgerstats::identifier const & id_a) const
{
	return id_a.number () <= max_identifier ();
}

ledgerstats::transaction const & ledgerstats::graph::get (ledgerstats::transaction_id const & id_a) const
{
	assert (id_a.number () >= 2 && id_a.number () - 2 < transactions_m.size ());
	return transactions_m[id_a.number () - 2];
}

ledgerstats::references const * ledgerstats::graph::references (ledgerstats::identifier const & id_a) const
{
	ledgerstats::references const * result (nullptr);
	auto existing (reverse.find (id_a));
	if (existing != reverse.end ())
	{
		result = &existing->second;
	}
	return result;
}

uint64_t ledgerstats::graph::max_identifier () const
{
	return transactions_m.size () + 1;
}

bool ledgerstats::graph::operator== (ledgerstats::graph const & other_a) const
{
	return transactions_m == other_a.transactions_m;
}

bool ledgerstats::graph::operator!= (ledgerstats::graph const & other_a) const
{
	return !(*this == other_a);
}
