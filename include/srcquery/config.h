#pragma once

#include "srcquery/net/packet_reassembler.h"
#include "srcquery/util/json_config.h"

namespace SQ
{
	struct Config
	{
		Net::ReassemblerOptions reassembly;
	};

	// Reads the "reassembly" section and applies the "logging" section to the
	// global log levels. Missing values keep their defaults.
	Config LoadConfig(const JsonConfigFile &file);
}
