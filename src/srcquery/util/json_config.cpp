#include "srcquery/util/json_config.h"
#include "srcquery/util/file.h"
#include "srcquery/logging.h"

#include <memory>

SQ::JsonConfigFile::JsonConfigFile()
	: m_root(Json::objectValue)
{
}

SQ::JsonConfigFile::JsonConfigFile(const Json::Value &value)
	: m_root(value)
{
}

SQ::JsonConfigFile SQ::JsonConfigFile::Load(const std::string &file_name)
{
	if (!File::Exists(file_name)) {
		LOG_DEBUG(MOD_CONFIG, "Config file [{}] not found, using defaults", file_name);
		return JsonConfigFile();
	}

	auto result = File::GetContents(file_name);
	if (!result.error.empty()) {
		LOG_WARN(MOD_CONFIG, "{}", result.error);
		return JsonConfigFile();
	}

	LOG_INFO(MOD_CONFIG, "Loaded config file [{}] ({} bytes)", file_name, result.contents.size());
	return Parse(result.contents);
}

SQ::JsonConfigFile SQ::JsonConfigFile::Parse(const std::string &text)
{
	Json::CharReaderBuilder builder;
	std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

	Json::Value root;
	std::string errors;
	if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
		LOG_WARN(MOD_CONFIG, "Failed to parse config: {}", errors);
		return JsonConfigFile();
	}

	if (!root.isObject()) {
		LOG_WARN(MOD_CONFIG, "Config root is not an object, ignoring it");
		return JsonConfigFile();
	}

	return JsonConfigFile(root);
}

const Json::Value *SQ::JsonConfigFile::Find(const std::string &title, const std::string &parameter) const
{
	if (!m_root.isMember(title) || !m_root[title].isObject()) {
		return nullptr;
	}

	const Json::Value &section = m_root[title];
	if (!section.isMember(parameter)) {
		return nullptr;
	}

	return &section[parameter];
}

unsigned int SQ::JsonConfigFile::GetVariableUInt(const std::string &title, const std::string &parameter, unsigned int default_value) const
{
	const Json::Value *value = Find(title, parameter);
	if (!value || !value->isUInt()) {
		if (value) {
			LOG_WARN(MOD_CONFIG, "{}.{} is not an unsigned integer, using {}", title, parameter, default_value);
		}
		return default_value;
	}
	return value->asUInt();
}
