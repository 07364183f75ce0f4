#include <iostream>
#include <unistd.h>
#include "spdlog/cfg/env.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "config.hpp"
#include "rangecat.hpp"
#include "version.hpp"
#include "writer.hpp"

int main(int argc, char **argv)
{
	// stdout carries the response body
	spdlog::set_default_logger(spdlog::stderr_color_mt("rangecat"));
	spdlog::cfg::load_env_levels();

	rangeio::config current_config;
	try {
		current_config.parse_from_argv(argc, argv);
	} catch (bpo::error const &e) {
		std::cerr << "rangecat: " << e.what() << std::endl;
		return 2;
	}

	spdlog::debug("rangecat {} serving {}", RANGEIO_VERSION, current_config.file);

	rangeio::fd_sink out(STDOUT_FILENO);
	return rangeio::serve_file(current_config, out, std::cerr);
}
