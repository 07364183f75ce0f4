#include "error_code.hpp"

namespace rangeio {
	namespace errors {
		struct rangeio_error_category : boost::system::error_category {
			const char* name() const BOOST_SYSTEM_NOEXCEPT override { return "rangeio"; }

			std::string message(int ev) const BOOST_SYSTEM_NOEXCEPT override
			{
				static char const* msgs[] = {
					"no error",
					"cannot open resource",
					"range exceeds buffer bounds",
					"invalid range",
					"positioning not supported",
					"no progress made while skipping",
					"unexpected end of data",
					"range writer is closed",
				};

				if (ev < 0 || ev >= int(sizeof(msgs) / sizeof(msgs[0])))
					return "Unknown error";

				return msgs[ev];
			}
			boost::system::error_condition default_error_condition(int ev) const BOOST_SYSTEM_NOEXCEPT override
			{ return boost::system::error_condition(ev, *this); }
		}; // struct rangeio_error_category

		boost::system::error_code make_error_code(error_code_enum e)
		{
			return boost::system::error_code(e, category());
		}

		boost::system::error_category& category()
		{
			static rangeio_error_category rangeio_category;
			return rangeio_category;
		}

		void throw_error(boost::system::error_code const& ec, std::string const& what)
		{
			throw boost::system::system_error(ec, what);
		}
	}; // namespace errors
}; // namespace rangeio
