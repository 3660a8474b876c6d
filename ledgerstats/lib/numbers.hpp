#pragma once

#include <ledgerstats/lib/errors.hpp>

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace ledgerstats
{
/**
 * Decode a non-negative decimal integer. The whole of \p text must be digits, optionally preceded by a '+'.
 * @return error_number::empty, error_number::invalid_digit or error_number::overflow on failure
 */
std::error_code decode_dec (std::string const & text, uint64_t & value_a);

/**
 * Convert \p value_a to a double, failing with error_common::numeric_conversion
 * if the value cannot be represented exactly.
 */
std::error_code to_double (uint64_t value_a, double & result_a);

// Identifier of Root
uint64_t const root_number = 1;

/** Identifier of a transaction other than Root, always >= 2 */
class transaction_id final
{
public:
	transaction_id () = default;
	/** Sets \p ec_a to error_identifier::invalid for 0 and error_identifier::reserved for 1 */
	transaction_id (std::error_code & ec_a, uint64_t);
	bool operator== (ledgerstats::transaction_id const &) const;
	bool operator!= (ledgerstats::transaction_id const &) const;
	bool operator< (ledgerstats::transaction_id const &) const;
	uint64_t number () const;
	// Id(n)
	std::string to_string () const;

private:
	uint64_t value{ 0 };
};

/** Either Root or the identifier of a transaction */
class identifier final
{
public:
	/** Root */
	identifier () = default;
	identifier (ledgerstats::transaction_id const &);
	/** 1 decodes as Root, 0 sets \p ec_a to error_identifier::invalid */
	identifier (std::error_code & ec_a, uint64_t);
	static ledgerstats::identifier root ();
	bool is_root () const;
	/** Only valid if !is_root () */
	ledgerstats::transaction_id transaction () const;
	bool operator== (ledgerstats::identifier const &) const;
	bool operator!= (ledgerstats::identifier const &) const;
	bool operator< (ledgerstats::identifier const &) const;
	uint64_t number () const;
	// Root or Tx:n
	std::string to_string () const;

private:
	uint64_t value{ root_number };
};

std::ostream & operator<< (std::ostream &, ledgerstats::transaction_id const &);
std::ostream & operator<< (std::ostream &, ledgerstats::identifier const &);
}

namespace std
{
template <>
struct hash<::ledgerstats::transaction_id>
{
	size_t operator() (::ledgerstats::transaction_id const & id_a) const
	{
		return std::hash<uint64_t> () (id_a.number ());
	}
};
template <>
struct hash<::ledgerstats::identifier>
{
	size_t operator() (::ledgerstats::identifier const & id_a) const
	{
		return std::hash<uint64_t> () (id_a.number ());
	}
};
}
