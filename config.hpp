#ifndef __CONFIG_HPP__
#define __CONFIG_HPP__

#define BOOST_PROGRAM_OPTIONS_DYN_LINK 1
#include <boost/program_options.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace bpo = boost::program_options;

namespace rangeio
{

class config
{
public:
	void parse_from_argv(int argc, char **argv);

	// file to serve
	std::string file;
	// Range header values, "bytes=..."
	std::vector<std::string> ranges;
	// answer as if the request carried Request-Range
	bool request_range = false;
	// load the whole file before serving
	bool in_memory = false;
	// serve as gzip archive regardless of suffix
	bool gzip = false;
	std::string content_type = "application/octet-stream";
	// scratch buffer size in KiB
	int buffer_size_kb = 64;
	// print status line and headers to stderr
	bool print_headers = false;
};

}  // namespace rangeio

#endif
