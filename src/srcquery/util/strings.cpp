#include "srcquery/util/strings.h"

#include <cctype>
#include <fmt/format.h>
#include <utility>

static int HexValue(char c)
{
	if (c >= '0' && c <= '9') return c - '0';
	if (c >= 'a' && c <= 'f') return c - 'a' + 10;
	if (c >= 'A' && c <= 'F') return c - 'A' + 10;
	return -1;
}

std::string Strings::ToHex(const std::vector<uint8_t> &data, size_t max_bytes)
{
	std::string out;
	size_t count = data.size() < max_bytes ? data.size() : max_bytes;
	out.reserve(count * 3);
	for (size_t i = 0; i < count; ++i) {
		if (i > 0) {
			out += ' ';
		}
		out += fmt::format("{:02x}", data[i]);
	}
	if (count < data.size()) {
		out += " ...";
	}
	return out;
}

std::string Strings::HexDump(const std::vector<uint8_t> &data)
{
	std::string out;
	for (size_t line = 0; line < data.size(); line += 16) {
		out += fmt::format("{:04x}: ", line);

		std::string ascii;
		for (size_t i = line; i < line + 16; ++i) {
			if (i < data.size()) {
				out += fmt::format("{:02x} ", data[i]);
				ascii += std::isprint(data[i]) ? static_cast<char>(data[i]) : '.';
			}
			else {
				out += "   ";
			}
		}

		out += ' ';
		out += ascii;
		out += '\n';
	}
	return out;
}

bool Strings::FromHex(std::string_view text, std::vector<uint8_t> &out)
{
	std::vector<uint8_t> result;
	size_t i = 0;
	while (i < text.size()) {
		if (std::isspace(static_cast<unsigned char>(text[i])) || text[i] == ',') {
			++i;
			continue;
		}

		if (text[i] == '0' && i + 1 < text.size() && (text[i + 1] == 'x' || text[i + 1] == 'X')) {
			i += 2;
		}

		if (i + 1 >= text.size()) {
			return false;
		}

		int high = HexValue(text[i]);
		int low = HexValue(text[i + 1]);
		if (high < 0 || low < 0) {
			return false;
		}

		result.push_back(static_cast<uint8_t>((high << 4) | low));
		i += 2;
	}

	out = std::move(result);
	return true;
}

bool Strings::BeginsWith(std::string_view subject, std::string_view search)
{
	return subject.size() >= search.size() && subject.compare(0, search.size(), search) == 0;
}
