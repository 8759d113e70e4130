#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

class Strings {
public:
	// "ff ff ff ff 49", at most max_bytes bytes followed by "..." when cut.
	static std::string ToHex(const std::vector<uint8_t> &data, size_t max_bytes = SIZE_MAX);
	// Classic 16 bytes per line dump with offsets and printable characters.
	static std::string HexDump(const std::vector<uint8_t> &data);
	// Parses hex digit pairs, ignoring whitespace and an optional 0x prefix per
	// pair. Returns false on odd digit counts or non-hex characters.
	static bool FromHex(std::string_view text, std::vector<uint8_t> &out);
	static bool BeginsWith(std::string_view subject, std::string_view search);
};
