#include "srcquery/net/crc32.h"
#include <cstring>

namespace
{
	constexpr uint32_t Crc32Polynomial = 0xEDB88320u;

	// Four lookup tables so the main loop can consume a 32-bit word per
	// step. Table 0 is the classic byte-at-a-time table; table n advances a
	// byte through n further zero bytes.
	struct Crc32Tables
	{
		uint32_t t[4][256];

		Crc32Tables()
		{
			for (uint32_t n = 0; n < 256; ++n) {
				uint32_t c = n;
				for (int bit = 0; bit < 8; ++bit) {
					c = (c & 1) ? (c >> 1) ^ Crc32Polynomial : c >> 1;
				}
				t[0][n] = c;
			}

			for (int k = 1; k < 4; ++k) {
				for (uint32_t n = 0; n < 256; ++n) {
					uint32_t prev = t[k - 1][n];
					t[k][n] = t[0][prev & 0xFF] ^ (prev >> 8);
				}
			}
		}
	};

	const Crc32Tables &Tables()
	{
		static const Crc32Tables tables;
		return tables;
	}

	// Operates on the inverted register; the word load assumes a
	// little-endian host.
	uint32_t UpdateRaw(uint32_t reg, const uint8_t *p, size_t size)
	{
		const auto &tab = Tables().t;

		for (; size >= 4; size -= 4, p += 4) {
			uint32_t word;
			memcpy(&word, p, sizeof(word));
			reg ^= word;
			reg = tab[3][reg & 0xFF]
				^ tab[2][(reg >> 8) & 0xFF]
				^ tab[1][(reg >> 16) & 0xFF]
				^ tab[0][reg >> 24];
		}

		while (size--) {
			reg = tab[0][(reg ^ *p++) & 0xFF] ^ (reg >> 8);
		}

		return reg;
	}
}

uint32_t SQ::Crc32(const void *data, size_t size)
{
	return Crc32Update(0, data, size);
}

uint32_t SQ::Crc32Update(uint32_t crc, const void *data, size_t size)
{
	if (size == 0) {
		return crc;
	}

	return ~UpdateRaw(~crc, static_cast<const uint8_t *>(data), size);
}
