#pragma once

#include <ledgerstats/lib/errors.hpp>
#include <ledgerstats/lib/numbers.hpp>

#include <string>

namespace ledgerstats
{
/** One ledger entry with its two backward references and a logical timestamp */
class transaction final
{
public:
	transaction () = default;
	transaction (ledgerstats::transaction_id const &, ledgerstats::identifier const &, ledgerstats::identifier const &, uint64_t);
	/**
	 * Parse "<left> <right> <timestamp>" for the transaction numbered \p id_a.
	 * Tokens past the timestamp are ignored. No upper bound is enforced on the references.
	 */
	transaction (ledgerstats::error &, uint64_t id_a, std::string const &);
	ledgerstats::transaction_id id () const;
	ledgerstats::identifier left () const;
	ledgerstats::identifier right () const;
	uint64_t timestamp () const;
	bool operator== (ledgerstats::transaction const &) const;
	bool operator!= (ledgerstats::transaction const &) const;
	// Tx<Tx:2, Root, Root, 0>
	std::string to_string () const;

private:
	ledgerstats::transaction_id id_m;
	ledgerstats::identifier left_m;
	ledgerstats::identifier right_m;
	uint64_t timestamp_m{ 0 };
};

std::ostream & operator<< (std::ostream &, ledgerstats::transaction const &);
}
