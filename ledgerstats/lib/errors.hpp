#pragma once

#include <boost/system/error_code.hpp>

#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <type_traits>

namespace ledgerstats
{
/** Common error codes */
enum class error_common
{
	generic = 1,
	exception,
	io,
	numeric_conversion
};

/** Decimal number parsing errors */
enum class error_number
{
	generic = 1,
	empty,
	invalid_digit,
	overflow
};

/** Identifier construction errors */
enum class error_identifier
{
	generic = 1,
	invalid,
	reserved
};

/** Transaction line parsing errors */
enum class error_transaction
{
	generic = 1,
	invalid_id,
	missing_left,
	missing_right,
	missing_timestamp,
	invalid_left,
	invalid_right,
	invalid_timestamp,
	invalid_left_id,
	invalid_right_id
};

/** Graph building errors */
enum class error_graph
{
	generic = 1,
	missing_count,
	invalid_count,
	too_many_transactions,
	too_little_transactions,
	invalid_left_reference,
	invalid_right_reference,
	io
};

/** Structural errors found after a graph is built */
enum class error_validation
{
	generic = 1,
	cyclic,
	disconnected,
	not_bipartite
};

enum class error_config
{
	generic = 1,
	invalid_value,
	missing_value,
};
}

// Convenience macro to implement the standard boilerplate for using std::error_code with enums
// Use this at the end of any header defining one or more error code enums.
#define REGISTER_ERROR_CODES(namespace_name, enum_type)                                                \
	namespace namespace_name                                                                           \
	{                                                                                                  \
		static_assert (static_cast<int> (enum_type::generic) > 0, #enum_type "::generic must be > 0"); \
		class enum_type##_messages : public std::error_category                                        \
		{                                                                                              \
		public:                                                                                        \
			const char * name () const noexcept override                                               \
			{                                                                                          \
				return #enum_type;                                                                     \
			}                                                                                          \
                                                                                                       \
			std::string message (int ev) const override;                                               \
		};                                                                                             \
                                                                                                       \
		inline const std::error_category & enum_type##_category ()                                     \
		{                                                                                              \
			static enum_type##_messages instance;                                                      \
			return instance;                                                                           \
		}                                                                                              \
                                                                                                       \
		inline std::error_code make_error_code (::namespace_name::enum_type err)                       \
		{                                                                                              \
			return std::error_code (static_cast<int> (err), enum_type##_category ());                  \
		}                                                                                              \
	}                                                                                                  \
	namespace std                                                                                      \
	{                                                                                                  \
		template <>                                                                                    \
		struct is_error_code_enum<::namespace_name::enum_type> : public std::true_type                 \
		{                                                                                              \
		};                                                                                             \
	}

REGISTER_ERROR_CODES (ledgerstats, error_common);
REGISTER_ERROR_CODES (ledgerstats, error_number);
REGISTER_ERROR_CODES (ledgerstats, error_identifier);
REGISTER_ERROR_CODES (ledgerstats, error_transaction);
REGISTER_ERROR_CODES (ledgerstats, error_graph);
REGISTER_ERROR_CODES (ledgerstats, error_validation);
REGISTER_ERROR_CODES (ledgerstats, error_config);

namespace ledgerstats
{
/** Adapter for std/boost::error_code carrying an optional contextual message */
class error final
{
public:
	error () = default;
	error (ledgerstats::error const & error_a) = default;
	error (ledgerstats::error && error_a) = default;

	error (std::error_code code_a) :
	code (code_a)
	{
	}

	error (std::error_code code_a, std::string message_a) :
	code (code_a),
	message (std::move (message_a))
	{
	}

	error (std::string message_a) :
	code (ledgerstats::error_common::generic),
	message (std::move (message_a))
	{
	}

	error (std::exception const & exception_a) :
	code (ledgerstats::error_common::exception),
	message (exception_a.what ())
	{
	}

	error & operator= (ledgerstats::error const & err_a) = default;
	error & operator= (ledgerstats::error && err_a) = default;

	/** Assign error code */
	error & operator= (const std::error_code code_a)
	{
		code = code_a;
		message.clear ();
		return *this;
	}

	/** Assign boost error code (as converted to std::error_code) */
	error & operator= (const boost::system::error_code & code_a)
	{
		code = std::make_error_code (static_cast<std::errc> (code_a.value ()));
		message.clear ();
		return *this;
	}

	/** Set the error to error_common::generic and the error message to \p message_a */
	error & operator= (const std::string message_a)
	{
		code = ledgerstats::error_common::generic;
		message = std::move (message_a);
		return *this;
	}

	/** Sets the error to error_common::exception and adopts the exception error message. */
	error & operator= (std::exception const & exception_a)
	{
		code = ledgerstats::error_common::exception;
		message = exception_a.what ();
		return *this;
	}

	bool operator== (const std::error_code code_a) const
	{
		return code == code_a;
	}

	bool operator!= (const std::error_code code_a) const
	{
		return code != code_a;
	}

	/** Call the function iff the current error is zero */
	error & then (std::function<ledgerstats::error &()> next)
	{
		return code ? *this : next ();
	}

	/** If the current error is one of the listed codes, reset the error code */
	template <typename... ErrorCode>
	error & accept (ErrorCode... err)
	{
		// Convert variadic arguments to std::error_code
		auto codes = { std::error_code (err)... };
		for (auto & code_l : codes)
		{
			if (code == code_l)
			{
				code.clear ();
				message.clear ();
				break;
			}
		}
		return *this;
	}

	std::error_code error_code () const
	{
		return code;
	}

	explicit operator bool () const
	{
		return code.value () != 0;
	}

	explicit operator std::string () const
	{
		return get_message ();
	}

	/**
	 * Get error message, or an empty string if there's no error. If a custom error message is set,
	 * that will be returned, otherwise the error_code#message() is returned.
	 */
	std::string get_message () const
	{
		std::string res = message;
		if (code && res.empty ())
		{
			res = code.message ();
		}
		return res;
	}

	/** Set an error message, but only if the error code is already set */
	error & on_error (std::string message_a)
	{
		if (code)
		{
			message = std::move (message_a);
		}
		return *this;
	}

	/** Set an error message if the current error code matches \p code_a */
	error & on_error (std::error_code code_a, std::string message_a)
	{
		if (code == code_a)
		{
			message = std::move (message_a);
		}
		return *this;
	}

	/** Set an error message and an error code */
	error & set (std::string message_a, std::error_code code_a = ledgerstats::error_common::generic)
	{
		message = message_a;
		code = code_a;
		return *this;
	}

	/** Set a custom error message. If the error code is not set, it will be set to error_common::generic. */
	error & set_message (std::string message_a)
	{
		if (!code)
		{
			code = ledgerstats::error_common::generic;
		}
		message = std::move (message_a);
		return *this;
	}

	/** Prefix the current message with \p context_a, keeping the error code */
	error & wrap (std::string const & context_a)
	{
		if (code)
		{
			message = context_a + ": " + get_message ();
		}
		return *this;
	}

	/** Clear an errors */
	error & clear ()
	{
		code.clear ();
		message.clear ();
		return *this;
	}

private:
	std::error_code code;
	std::string message;
};

/**
 * A type that manages a ledgerstats::error.
 * The default return type is ledgerstats::error&, though shared_ptr<ledgerstats::error> is a good option in cases
 * where shared error state is desirable.
 */
template <typename RET_TYPE = ledgerstats::error &>
class error_aware
{
	static_assert (std::is_same<RET_TYPE, ledgerstats::error &>::value || std::is_same<RET_TYPE, std::shared_ptr<ledgerstats::error>>::value, "Must be ledgerstats::error& or shared_ptr<ledgerstats::error>");

public:
	/** Returns the error object managed by this object */
	virtual RET_TYPE get_error () = 0;
};
}
