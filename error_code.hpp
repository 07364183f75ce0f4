#ifndef __ERROR_CODE_HPP__
#define __ERROR_CODE_HPP__

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace rangeio {
	namespace errors {
		enum error_code_enum {
			no_error = 0,
			failed_to_open,
			// requested range lies outside a fixed-size buffer
			range_out_of_bounds,
			// negative offset or length
			invalid_range,
			// the channel cannot be positioned explicitly
			positioning_unsupported,
			// forward skip stalled on zero-byte reads
			no_progress,
			// source exhausted before the requested bytes
			end_of_data,
			writer_closed,

			error_code_max
		}; // enum error_code_enum

		boost::system::error_code make_error_code(error_code_enum e);
		boost::system::error_category& category();

		// throws boost::system::system_error carrying ec
		[[noreturn]] void throw_error(boost::system::error_code const& ec, std::string const& what);
	}; // namespace errors
}; // namespace rangeio

namespace boost { namespace system {
	template<> struct is_error_code_enum<rangeio::errors::error_code_enum>
	{ static const bool value = true; };
} }; // namespace boost::system

#endif // ifndef __ERROR_CODE_HPP__
