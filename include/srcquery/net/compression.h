#pragma once

#include "srcquery/net/packet_buffer.h"

#include <cstddef>

namespace SQ
{
	namespace Net
	{
		// Decompresses a bzip2 stream that must expand to exactly expected_size
		// bytes. Throws DecompressionError otherwise.
		Bytes Bzip2Decompress(const Bytes &compressed, size_t expected_size);

		// Worst case output size of Bzip2Compress() for input_size bytes.
		size_t EstimateBzip2Buffer(size_t input_size);

		// Compresses data as one bzip2 stream (block size 9). Throws
		// std::runtime_error if the codec reports a failure.
		Bytes Bzip2Compress(const Bytes &data);
	}
}
