#pragma once

#include <json/json.h>
#include <string>

namespace SQ
{
	/*
	 * Read-only view of a JSON configuration file. Sections are top level
	 * objects; a missing section or parameter yields the supplied default.
	 */
	class JsonConfigFile
	{
	public:
		JsonConfigFile();
		explicit JsonConfigFile(const Json::Value &value);

		// A missing or unparsable file yields an empty object, with a warning.
		static JsonConfigFile Load(const std::string &file_name);
		static JsonConfigFile Parse(const std::string &text);

		unsigned int GetVariableUInt(const std::string &title, const std::string &parameter, unsigned int default_value) const;

		const Json::Value &RawHandle() const { return m_root; }
	private:
		const Json::Value *Find(const std::string &title, const std::string &parameter) const;

		Json::Value m_root;
	};
}
