#pragma once

#include <string>

struct FileContentsResult {
	std::string contents;
	std::string error;
};

class File {
public:
	static bool Exists(const std::string &name);
	static FileContentsResult GetContents(const std::string &file_name);
};
