#pragma once

#include <ledgerstats/lib/errors.hpp>
#include <ledgerstats/lib/transactions.hpp>

#include <istream>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ledgerstats
{
/** Transactions referencing one identifier */
class references final
{
public:
	void add (ledgerstats::transaction_id const &);
	/** Number of left and right references, a transaction referencing twice counts twice */
	uint64_t count () const;
	std::unordered_set<ledgerstats::transaction_id> const & sources () const;

private:
	std::unordered_set<ledgerstats::transaction_id> sources_m;
	uint64_t count_m{ 0 };
};

/**
 * The ledger DAG: Root plus transactions numbered 2, 3, ... in input order, and the reverse
 * index from every referenced identifier to the transactions referencing it.
 * Immutable once constructed.
 */
class graph final
{
public:
	graph () = default;
	/** Transaction ids must be contiguous starting at 2 */
	graph (std::vector<ledgerstats::transaction> const &);
	/**
	 * Read a declared count line followed by that many transaction lines.
	 * References are checked against the declared count, so a reference may point to a
	 * transaction which appears later in the stream.
	 */
	graph (ledgerstats::error &, std::istream &);
	size_t size () const;
	bool empty () const;
	std::vector<ledgerstats::transaction> const & transactions () const;
	/** True for Root and for ids of transactions in this graph */
	bool contains (ledgerstats::identifier const &) const;
	/** Precondition: contains (id) */
	ledgerstats::transaction const & get (ledgerstats::transaction_id const &) const;
	/** Null if nothing references the identifier */
	ledgerstats::references const * references (ledgerstats::identifier const &) const;
	/** Largest identifier in use, Root counts as 1 */
	uint64_t max_identifier () const;
	bool operator== (ledgerstats::graph const &) const;
	bool operator!= (ledgerstats::graph const &) const;

private:
	void add (ledgerstats::transaction const &);
	std::vector<ledgerstats::transaction> transactions_m;
	std::unordered_map<ledgerstats::identifier, ledgerstats::references> reverse;
};
}
