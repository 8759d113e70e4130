#pragma once

#include <cstddef>
#include <cstdint>

namespace SQ
{
	// Standard reflected CRC-32 (polynomial 0xEDB88320), as used by the
	// checksum field of compressed split packets.
	uint32_t Crc32(const void *data, size_t size);

	// Continues a running checksum. Crc32Update(0, ...) equals Crc32(...),
	// and feeding the data in pieces yields the same value as one call.
	uint32_t Crc32Update(uint32_t crc, const void *data, size_t size);
}
