#pragma once

#include <ledgerstats/lib/errors.hpp>
#include <ledgerstats/secure/depth.hpp>
#include <ledgerstats/secure/graph.hpp>

#include <memory>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace ledgerstats
{
/** Printable outcome of a statistic */
class stat_result
{
public:
	virtual ~stat_result () = default;
	virtual void write (std::ostream &) const = 0;
	std::string to_string () const;
};

std::ostream & operator<< (std::ostream &, ledgerstats::stat_result const &);

/**
 * A statistic about the graph. Every transaction is passed once to accumulate, in id order,
 * after which result can be called.
 */
class stat_accumulator
{
public:
	virtual ~stat_accumulator () = default;
	virtual void accumulate (ledgerstats::transaction const &) = 0;
	/**
	 * Finalize into \p result_a. Fails with error_common::numeric_conversion if a count
	 * can't be represented exactly as a double.
	 */
	virtual ledgerstats::error result (double transaction_count_a, std::unique_ptr<ledgerstats::stat_result> & result_a) const = 0;
};

class depths_result final : public stat_result
{
public:
	depths_result (double, double);
	void write (std::ostream &) const override;
	double average_depth;
	double average_transactions_per_depth;
};

/** Average depth and number of transactions per distinct depth */
class depths final : public stat_accumulator
{
public:
	depths (ledgerstats::graph const &);
	void accumulate (ledgerstats::transaction const &) override;
	ledgerstats::error result (double, std::unique_ptr<ledgerstats::stat_result> &) const override;

private:
	ledgerstats::depth_calculator calculator;
	uint64_t sum_of_depths{ 0 };
	std::set<uint64_t> unique_depths;
	bool unresolved{ false };
};

class in_references_result final : public stat_result
{
public:
	in_references_result (double);
	void write (std::ostream &) const override;
	double average_references;
};

/** Average number of references to a vertex, Root included */
class in_references final : public stat_accumulator
{
public:
	in_references (ledgerstats::graph const &);
	void accumulate (ledgerstats::transaction const &) override;
	ledgerstats::error result (double, std::unique_ptr<ledgerstats::stat_result> &) const override;

private:
	ledgerstats::graph const & graph;
	uint64_t total_references{ 0 };
	// Root's references are added with the first transaction
	bool root_counted{ false };
};

class time_units_result final : public stat_result
{
public:
	time_units_result (double);
	void write (std::ostream &) const override;
	double average_transactions_per_time_unit;
};

class time_units final : public stat_accumulator
{
public:
	void accumulate (ledgerstats::transaction const &) override;
	ledgerstats::error result (double, std::unique_ptr<ledgerstats::stat_result> &) const override;

private:
	uint64_t max_timestamp{ 0 };
};

class timestamps_result final : public stat_result
{
public:
	timestamps_result (double);
	void write (std::ostream &) const override;
	double average_transactions_per_timestamp;
};

class timestamps final : public stat_accumulator
{
public:
	void accumulate (ledgerstats::transaction const &) override;
	ledgerstats::error result (double, std::unique_ptr<ledgerstats::stat_result> &) const override;

private:
	std::set<uint64_t> unique_timestamps;
};

/** Runs a set of accumulators over a graph in a single pass */
class stat
{
public:
	stat (ledgerstats::graph const &);
	/** Depths, InReferences, TimeUnits and Timestamps, in that order */
	static stat make_default (ledgerstats::graph const &);
	void add (std::unique_ptr<ledgerstats::stat_accumulator>);
	void collect ();
	/** Write every result on its own line, stops at the first failing statistic */
	ledgerstats::error write (std::ostream &) const;
	std::vector<std::unique_ptr<ledgerstats::stat_accumulator>> const & accumulators () const;

private:
	ledgerstats::graph const & graph;
	std::vector<std::unique_ptr<ledgerstats::stat_accumulator>> accumulators_m;
};
}
