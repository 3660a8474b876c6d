#pragma once

#include <ledgerstats/lib/errors.hpp>

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>
#include <memory>
#include <string>

namespace ledgerstats
{
/** Manages a node in a boost configuration tree. */
class jsonconfig : public ledgerstats::error_aware<>
{
public:
	jsonconfig () :
	tree (tree_default)
	{
		error = std::make_shared<ledgerstats::error> ();
	}

	jsonconfig (boost::property_tree::ptree & tree_a, std::shared_ptr<ledgerstats::error> error_a = nullptr) :
	tree (tree_a),
	error (error_a)
	{
		if (!error)
		{
			error = std::make_shared<ledgerstats::error> ();
		}
	}

	/**
	 * Reads a json object from the stream and if it was changed, write the object back to the stream.
	 * Missing files are created from the defaults of \p object.
	 * @return ledgerstats::error&, including a descriptive error message if the config file is malformed.
	 */
	template <typename T>
	ledgerstats::error & read_and_update (T & object, boost::filesystem::path const & path_a)
	{
		auto file_exists (boost::filesystem::exists (path_a));
		read (path_a);
		if (!*error)
		{
			auto updated (false);
			*error = object.deserialize_json (updated, *this);
			if (!*error && updated)
			{
				write (path_a);
			}
			else if (!*error && !file_exists)
			{
				write (path_a);
			}
		}
		return *error;
	}

	void write (boost::filesystem::path const & path_a)
	{
		std::fstream stream;
		open_or_create (stream, path_a.string ());
		if (stream.is_open ())
		{
			write (stream);
		}
		else
		{
			error->set ("Could not write configuration file: " + path_a.string (), ledgerstats::error_common::io);
		}
	}

	void write (std::ostream & stream_a) const
	{
		boost::property_tree::write_json (stream_a, tree);
	}

	void read (std::istream & stream_a)
	{
		boost::property_tree::read_json (stream_a, tree);
	}

	/** Open configuration file, create if necessary */
	void open_or_create (std::fstream & stream_a, std::string const & path_a)
	{
		if (!boost::filesystem::exists (path_a))
		{
			// Create temp stream to first create the file
			std::ofstream stream (path_a);

			// Set permissions before opening otherwise Windows only has read permissions
			boost::system::error_code ec;
			boost::filesystem::permissions (path_a, boost::filesystem::perms::owner_read | boost::filesystem::perms::owner_write, ec);
		}
		stream_a.open (path_a, std::ios::out | std::ios::trunc);
	}

	/** Returns true if the property tree node is empty */
	bool empty () const
	{
		return tree.empty ();
	}

	boost::optional<jsonconfig> get_optional_child (std::string const & key_a)
	{
		boost::optional<jsonconfig> child_config;
		auto child = tree.get_child_optional (key_a);
		if (child)
		{
			return jsonconfig (child.get (), error);
		}
		return child_config;
	}

	jsonconfig get_required_child (std::string const & key_a)
	{
		auto child = tree.get_child_optional (key_a);
		if (!child)
		{
			*error = ledgerstats::error_config::missing_value;
			error->set_message ("Missing configuration node: " + key_a);
		}
		return child ? jsonconfig (child.get (), error) : *this;
	}

	jsonconfig & put_child (std::string const & key_a, ledgerstats::jsonconfig & conf_a)
	{
		tree.add_child (key_a, conf_a.tree);
		return *this;
	}

	/** Set value for the given key. Any existing value will be overwritten. */
	template <typename T>
	jsonconfig & put (std::string const & key, T const & value)
	{
		tree.put (key, value);
		return *this;
	}

	/** Returns true if \p key_a is present */
	bool has_key (std::string const & key_a)
	{
		return tree.find (key_a) != tree.not_found ();
	}

	/** Erase the property of given key */
	jsonconfig & erase (std::string const & key_a)
	{
		tree.erase (key_a);
		return *this;
	}

	/** Get optional, using \p default_value if \p key is missing. */
	template <typename T>
	jsonconfig & get_optional (std::string const & key, T & target, T default_value)
	{
		get_config<T> (true, key, target, default_value);
		return *this;
	}

	/**
	 * Get optional value, using the current value of \p target as the default if \p key is missing.
	 * @return May return ledgerstats::error_config::invalid_value
	 */
	template <typename T>
	jsonconfig & get_optional (std::string const & key, T & target)
	{
		get_config<T> (true, key, target, target);
		return *this;
	}

	/** Return a boost::optional<T> for the given key */
	template <typename T>
	boost::optional<T> get_optional (std::string const & key)
	{
		boost::optional<T> res;
		if (has_key (key))
		{
			T target{};
			get_config<T> (true, key, target, target);
			res = target;
		}
		return res;
	}

	/** Get value, using the current value of \p target as the default if \p key is missing. */
	template <typename T>
	jsonconfig & get (std::string const & key, T & target)
	{
		get_config<T> (true, key, target, target);
		return *this;
	}

	/**
	 * Get required value.
	 * @note May set ledgerstats::error_config::missing_value if \p key is missing, ledgerstats::error_config::invalid_value if value is invalid.
	 */
	template <typename T>
	jsonconfig & get_required (std::string const & key, T & target)
	{
		get_config<T> (false, key, target);
		return *this;
	}

	ledgerstats::error & get_error () override
	{
		return *error;
	}

protected:
	template <typename T>
	void construct_error_message (bool optional, std::string const & key)
	{
		if (*error)
		{
			if (optional)
			{
				error->set_message (key + " is not of type " + get_type_name<T> ());
			}
			else
			{
				error->set_message (key + " is required and must be of type " + get_type_name<T> ());
			}
		}
	}

	/** Set error if not already set. That is, first error remains until get_error().clear() is called. */
	template <typename T, typename V>
	void conditionally_set_error (V error_a, bool optional, std::string const & key)
	{
		if (!*error)
		{
			*error = error_a;
			construct_error_message<T> (optional, key);
		}
	}

	template <typename T>
	jsonconfig & get_config (bool optional, std::string key, T & target, T default_value = T ())
	{
		try
		{
			auto val (tree.get<std::string> (key));
			if (!boost::conversion::try_lexical_convert<T> (val, target))
			{
				conditionally_set_error<T> (ledgerstats::error_config::invalid_value, optional, key);
			}
		}
		catch (boost::property_tree::ptree_bad_path const &)
		{
			if (!optional)
			{
				conditionally_set_error<T> (ledgerstats::error_config::missing_value, optional, key);
			}
			else
			{
				target = default_value;
			}
		}
		catch (std::runtime_error & ex)
		{
			conditionally_set_error<T> (ex, optional, key);
		}
		return *this;
	}

private:
	/** The property node being managed */
	boost::property_tree::ptree & tree;
	boost::property_tree::ptree tree_default;
	std::shared_ptr<ledgerstats::error> error;

	template <typename T>
	std::string get_type_name () const
	{
		std::string type_l;
		if (std::is_same<T, bool>::value)
		{
			type_l = "a boolean";
		}
		else if (std::is_same<T, std::string>::value)
		{
			type_l = "a string";
		}
		else if (std::is_unsigned<T>::value)
		{
			type_l = "an unsigned integer";
		}
		else if (std::is_integral<T>::value)
		{
			type_l = "an integer";
		}
		else
		{
			type_l = "a value";
		}
		return type_l;
	}

	/** Read from a file, reporting malformed json as an error */
	void read (boost::filesystem::path const & path_a)
	{
		std::fstream stream;
		if (boost::filesystem::exists (path_a))
		{
			stream.open (path_a.string (), std::ios_base::in);
			if (stream.fail ())
			{
				error->set ("Could not read configuration file: " + path_a.string (), ledgerstats::error_common::io);
			}
			else
			{
				try
				{
					read (stream);
				}
				catch (std::runtime_error const & ex)
				{
					auto pos (stream.tellg ());
					if (pos != std::streampos (0))
					{
						*error = ex;
					}
				}
			}
		}
	}
};

/** Boolean values are read as "true"/"false" rather than 1/0 */
template <>
inline jsonconfig & jsonconfig::get_config<bool> (bool optional, std::string key, bool & target, bool default_value)
{
	auto bool_conv = [this, &target, &key, optional](std::string val) {
		if (val == "true")
		{
			target = true;
		}
		else if (val == "false")
		{
			target = false;
		}
		else if (!*error)
		{
			conditionally_set_error<bool> (ledgerstats::error_config::invalid_value, optional, key);
		}
	};
	try
	{
		auto val (tree.get<std::string> (key));
		bool_conv (val);
	}
	catch (boost::property_tree::ptree_bad_path const &)
	{
		if (!optional)
		{
			conditionally_set_error<bool> (ledgerstats::error_config::missing_value, optional, key);
		}
		else
		{
			target = default_value;
		}
	}
	catch (std::runtime_error & ex)
	{
		conditionally_set_error<bool> (ex, optional, key);
	}
	return *this;
}
}
