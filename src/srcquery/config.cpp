#include "srcquery/config.h"
#include "srcquery/logging.h"

SQ::Config SQ::LoadConfig(const JsonConfigFile &file)
{
	InitLoggingFromJson(file.RawHandle());

	Config config;
	config.reassembly.max_uncompressed_size = file.GetVariableUInt("reassembly", "max_uncompressed_size",
		config.reassembly.max_uncompressed_size);

	LOG_DEBUG(MOD_CONFIG, "reassembly.max_uncompressed_size={}", config.reassembly.max_uncompressed_size);
	return config;
}
