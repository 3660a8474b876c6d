#include <ledgerstats/lib/numbers.hpp>

#include <boost/lexical_cast.hpp>

#include <cassert>
#include <limits>

std::error_code ledgerstats::decode_dec (std::string const & text, uint64_t & value_a)
{
	std::error_code result;
	if (text.empty ())
	{
		result = ledgerstats::error_number::empty;
	}
	else
	{
		uint64_t value_l (0);
		auto i (text.begin ());
		// A single leading sign is allowed, but not on its own
		if (*i == '+')
		{
			++i;
			if (i == text.end ())
			{
				result = ledgerstats::error_number::invalid_digit;
			}
		}
		for (auto n (text.end ()); i != n && !result; ++i)
		{
			auto digit (*i);
			if (digit >= '0' && digit <= '9')
			{
				uint64_t decimal (digit - '0');
				if (value_l > (std::numeric_limits<uint64_t>::max () - decimal) / 10)
				{
					result = ledgerstats::error_number::overflow;
				}
				else
				{
					value_l = value_l * 10 + decimal;
				}
			}
			else
			{
				result = ledgerstats::error_number::invalid_digit;
			}
		}
		if (!result)
		{
			value_a = value_l;
		}
	}
	return result;
}

std::error_code ledgerstats::to_double (uint64_t value_a, double & result_a)
{
	std::error_code result;
	// Every integer up to 2^digits is exactly representable
	uint64_t const max_exact (uint64_t (1) << std::numeric_limits<double>::digits);
	if (value_a > max_exact)
	{
		result = ledgerstats::error_common::numeric_conversion;
	}
	else
	{
		result_a = static_cast<double> (value_a);
	}
	return result;
}

ledgerstats::transaction_id::transaction_id (std::error_code & ec_a, uint64_t value_a)
{
	if (value_a == 0)
	{
		ec_a = ledgerstats::error_identifier::invalid;
	}
	else if (value_a == ledgerstats::root_number)
	{
		ec_a = ledgerstats::error_identifier::reserved;
	}
	else
	{
		value = value_a;
	}
}

bool ledgerstats::transaction_id::operator== (ledgerstats::transaction_id const & other_a) const
{
	return value == other_a.value;
}

bool ledgerstats::transaction_id::operator!= (ledgerstats::transaction_id const & other_a) const
{
	return !(*this == other_a);
}

bool ledgerstats::transaction_id::operator< (ledgerstats::transaction_id const & other_a) const
{
	return value < other_a.value;
}

uint64_t ledgerstats::transaction_id::number () const
{
	return value;
}

std::string ledgerstats::transaction_id::to_string () const
{
	return "Id(" + boost::lexical_cast<std::string> (value) + ")";
}

ledgerstats::identifier::identifier (ledgerstats::transaction_id const & id_a) :
value (id_a.number ())
{
	assert (value != ledgerstats::root_number);
}

ledgerstats::identifier::identifier (std::error_code & ec_a, uint64_t value_a)
{
	if (value_a != ledgerstats::root_number)
	{
		ledgerstats::transaction_id id (ec_a, value_a);
		if (!ec_a)
		{
			value = id.number ();
		}
	}
}

ledgerstats::identifier ledgerstats::identifier::root ()
{
	return ledgerstats::identifier ();
}

bool ledgerstats::identifier::is_root () const
{
	return value == ledgerstats::root_number;
}

ledgerstats::transaction_id ledgerstats::identifier::transaction () const
{
	assert (!is_root ());
	std::error_code ec;
	ledgerstats::transaction_id result (ec, value);
	assert (!ec);
	return result;
}

bool ledgerstats::identifier::operator== (ledgerstats::identifier const & other_a) const
{
	return value == other_a.value;
}

bool ledgerstats::identifier::operator!= (ledgerstats::identifier const & other_a) const
{
	return !(*this == other_a);
}

bool ledgerstats::identifier::operator< (ledgerstats::identifier const & other_a) const
{
	return value < other_a.value;
}

uint64_t ledgerstats::identifier::number () const
{
	return value;
}

std::string ledgerstats::identifier::to_string () const
{
	std::string result;
	if (is_root ())
	{
		result = "Root";
	}
	else
	{
		result = "Tx:" + boost::lexical_cast<std::string> (value);
	}
	return result;
}

std::ostream & ledgerstats::operator<< (std::ostream & stream_a, ledgerstats::transaction_id const & id_a)
{
	return stream_a << id_a.to_string ();
}

std::ostream & ledgerstats::operator<< (std::ostream & stream_a, ledgerstats::identifier const & id_a)
{
	return stream_a << id_a.to_string ();
}
