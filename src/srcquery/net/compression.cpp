#include "srcquery/net/compression.h"
#include "srcquery/net/packet_error.h"
#include "srcquery/logging.h"

#include <bzlib.h>
#include <climits>
#include <fmt/format.h>
#include <stdexcept>

static const char *Bzip2ErrorName(int code) {
	switch (code) {
		case BZ_CONFIG_ERROR:     return "BZ_CONFIG_ERROR";
		case BZ_PARAM_ERROR:      return "BZ_PARAM_ERROR";
		case BZ_MEM_ERROR:        return "BZ_MEM_ERROR";
		case BZ_OUTBUFF_FULL:     return "BZ_OUTBUFF_FULL";
		case BZ_DATA_ERROR:       return "BZ_DATA_ERROR";
		case BZ_DATA_ERROR_MAGIC: return "BZ_DATA_ERROR_MAGIC";
		case BZ_UNEXPECTED_EOF:   return "BZ_UNEXPECTED_EOF";
		default:                  return "unknown bzip2 error";
	}
}

SQ::Bytes SQ::Net::Bzip2Decompress(const Bytes &compressed, size_t expected_size)
{
	if (expected_size == 0) {
		throw DecompressionError("Compressed split packet declares an empty payload");
	}
	if (compressed.size() > UINT_MAX || expected_size > UINT_MAX) {
		throw DecompressionError("Compressed split packet exceeds codec limits");
	}

	// Exactly expected_size bytes of room: longer output fails with
	// BZ_OUTBUFF_FULL, shorter output is caught below.
	Bytes out(expected_size);
	unsigned int out_len = static_cast<unsigned int>(expected_size);
	int result = BZ2_bzBuffToBuffDecompress(
		reinterpret_cast<char *>(out.data()), &out_len,
		const_cast<char *>(reinterpret_cast<const char *>(compressed.data())),
		static_cast<unsigned int>(compressed.size()),
		0, 0);

	if (result != BZ_OK) {
		LOG_WARN(MOD_REASSEMBLY, "DECOMPRESS_FAIL: bzip2 returned {} ({}), input_len={} expected={}",
			result, Bzip2ErrorName(result), compressed.size(), expected_size);
		throw DecompressionError(fmt::format("bzip2 decompression failed: {}", Bzip2ErrorName(result)));
	}

	if (out_len != expected_size) {
		LOG_WARN(MOD_REASSEMBLY, "DECOMPRESS_SHORT: bzip2 produced {} of {} byte(s)", out_len, expected_size);
		throw DecompressionError(fmt::format("bzip2 produced {} byte(s), expected {}", out_len, expected_size));
	}

	LOG_TRACE(MOD_REASSEMBLY, "Bzip2Decompress: {} -> {} bytes", compressed.size(), out_len);
	return out;
}

size_t SQ::Net::EstimateBzip2Buffer(size_t input_size)
{
	// bzip2 documents 1% + 600 bytes as the worst case expansion.
	return input_size + input_size / 100 + 601;
}

SQ::Bytes SQ::Net::Bzip2Compress(const Bytes &data)
{
	Bytes out(EstimateBzip2Buffer(data.size()));
	unsigned int out_len = static_cast<unsigned int>(out.size());
	int result = BZ2_bzBuffToBuffCompress(
		reinterpret_cast<char *>(out.data()), &out_len,
		const_cast<char *>(reinterpret_cast<const char *>(data.data())),
		static_cast<unsigned int>(data.size()),
		9, 0, 0);

	if (result != BZ_OK) {
		throw std::runtime_error(fmt::format("bzip2 compression failed: {}", Bzip2ErrorName(result)));
	}

	out.resize(out_len);
	return out;
}
