#include "srcquery/util/file.h"

#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <utility>

bool File::Exists(const std::string &name)
{
	struct stat sb{};
	return stat(name.c_str(), &sb) == 0;
}

FileContentsResult File::GetContents(const std::string &file_name)
{
	std::ifstream f(file_name, std::ios::in | std::ios::binary);
	if (!f) {
		return { {}, fmt::format("Couldn't open file [{}]", file_name) };
	}

	std::string contents{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
	if (f.bad()) {
		return { {}, fmt::format("Error reading file [{}]", file_name) };
	}

	return { std::move(contents), {} };
}
