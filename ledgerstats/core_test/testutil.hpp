#pragma once

#include <ledgerstats/secure/graph.hpp>

#include <array>
#include <ios>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace ledgerstats
{
/** Graph with transactions numbered from 2, each given as { left, right, timestamp } */
inline ledgerstats::graph make_graph (std::vector<std::array<uint64_t, 3>> const & entries_a)
{
	std::vector<ledgerstats::transaction> transactions;
	uint64_t number (2);
	for (auto const & entry : entries_a)
	{
		std::error_code ec;
		ledgerstats::transaction_id id (ec, number++);
		ledgerstats::identifier left (ec, entry[0]);
		ledgerstats::identifier right (ec, entry[1]);
		transactions.emplace_back (id, left, right, entry[2]);
	}
	return ledgerstats::graph (transactions);
}

inline ledgerstats::graph read_graph (ledgerstats::error & error_a, std::string const & text_a)
{
	std::istringstream stream (text_a);
	return ledgerstats::graph (error_a, stream);
}

/** Serves \p text_a, then fails every further read */
class failing_buffer final : public std::streambuf
{
public:
	failing_buffer (std::string const & text_a) :
	text (text_a)
	{
		setg (&text[0], &text[0], &text[0] + text.size ());
	}

protected:
	int_type underflow () override
	{
		throw std::ios_base::failure ("Device read failed");
	}

private:
	std::string text;
};

// The five transaction ledger used throughout the documentation
char const * const example_ledger = "5\n1 1 0\n1 2 0\n2 2 1\n3 6 3\n3 3 2\n";
}
