#include <exception>

#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>

#include "content.hpp"
#include "core_ext.hpp"
#include "range_service.hpp"
#include "rangecat.hpp"

namespace rangeio
{

int serve_file(config const &cfg, byte_sink &body, std::ostream &header_out)
{
	try {
		auto c = content::from_file(cfg.file, cfg.in_memory, cfg.gzip);
		c.content_type = cfg.content_type;

		range_service service(cfg.buffer_size_kb * 1_KiB);
		auto response = service.serve(c, cfg.ranges, cfg.request_range, body);

		if (cfg.print_headers) {
			header_out << "HTTP/1.1 " << response.status << "\r\n";
			for (auto const &h : response.headers) {
				header_out << h.first << ": " << h.second << "\r\n";
			}
			header_out << "\r\n" << std::flush;
		}

		spdlog::info("{} {} bytes of {} ({} bytes)", response.status,
			response.content_length, cfg.file, c.length);

		return response.status == 416 ? 1 : 0;
	} catch (boost::system::system_error const &e) {
		spdlog::error("{}: {}", cfg.file, e.what());
		return 1;
	} catch (std::exception const &e) {
		spdlog::error("{}: unexpected failure: {}", cfg.file, e.what());
		return 1;
	}
}

}  // namespace rangeio
