#pragma once

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <utility>

namespace ledgerstats
{
using severity_level = boost::log::trivial::severity_level;

class logger_mt
{
public:
	/**
	 * Write \p log_items as a single info record
	 */
	template <typename... LogItems>
	void always_log (LogItems &&... log_items)
	{
		log (ledgerstats::severity_level::info, std::forward<LogItems> (log_items)...);
	}

	template <typename... LogItems>
	void log (ledgerstats::severity_level severity_a, LogItems &&... log_items)
	{
		auto record (boost_logger_mt.open_record (boost::log::keywords::severity = severity_a));
		if (record)
		{
			boost::log::record_ostream stream (record);
			output (stream, std::forward<LogItems> (log_items)...);
			stream.flush ();
			boost_logger_mt.push_record (std::move (record));
		}
	}

private:
	void output (boost::log::record_ostream &)
	{
	}

	template <typename LogItem, typename... LogItems>
	void output (boost::log::record_ostream & stream_a, LogItem && log_item, LogItems &&... log_items)
	{
		stream_a << std::forward<LogItem> (log_item);
		output (stream_a, std::forward<LogItems> (log_items)...);
	}

	boost::log::sources::severity_logger_mt<ledgerstats::severity_level> boost_logger_mt;
};
}
