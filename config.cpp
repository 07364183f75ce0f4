#include <cstdlib>

#include "config.hpp"
#include "version.hpp"

namespace rangeio
{

void config::parse_from_argv(int argc, char **argv)
{
	// clang-format off
	bpo::options_description desc("Allowed Options");
	desc.add_options()
		("help,h", "some help")
		("file,f", bpo::value<std::string>(&file), "file to serve, also accepted as the positional argument")
		("range,r", bpo::value<std::vector<std::string>>(&ranges)->composing(), "Range header value such as bytes=0-99,200-, may repeat")
		("request-range", bpo::bool_switch(&request_range)->default_value(false), "use multipart/x-byteranges for several ranges")
		("in-memory,m", bpo::bool_switch(&in_memory)->default_value(false), "load the file into memory before serving")
		("gzip,z", bpo::bool_switch(&gzip)->default_value(false), "serve the decompressed content of a gzip file")
		("content-type,t", bpo::value<std::string>(&content_type)->default_value("application/octet-stream"), "content type of the file")
		("buffer-size", bpo::value<int>(&buffer_size_kb)->default_value(64), "copy buffer size in KiB, default is 64")
		("headers,H", bpo::bool_switch(&print_headers)->default_value(false), "print status line and headers to stderr")
		("version,v", "show version")
	;
	// clang-format on

	bpo::positional_options_description pos;
	pos.add("file", 1);

	// clang-format off
	bpo::variables_map vmap;
	bpo::store(bpo::command_line_parser(argc, argv)
		.options(desc)
		.positional(pos)
		.run(),
		vmap);
	bpo::notify(vmap);
	// clang-format on

	if (vmap.count("help")) {
		std::cout << desc << std::endl;
		exit(0);
	}

	if (vmap.count("version")) {
		std::cout << "rangecat " << RANGEIO_VERSION << std::endl;
		exit(0);
	}

	if (file.empty()) {
		throw bpo::required_option("file");
	}

	if (buffer_size_kb <= 0) {
		throw bpo::validation_error(bpo::validation_error::invalid_option_value,
			"buffer-size", std::to_string(buffer_size_kb));
	}
}

}  // namespace rangeio
