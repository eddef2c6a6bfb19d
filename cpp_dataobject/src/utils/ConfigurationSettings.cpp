#include "cpp_dataobject/src/utils/ConfigurationSettings.hpp"

#include <boost/property_tree/ini_parser.hpp>

#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"

namespace cpp_dataobject
{

ConfigurationSettings::ConfigurationSettings(const std::filesystem::path& file)
{
  setConfigFile(file);
}

void ConfigurationSettings::setConfigFile(const std::filesystem::path& file)
{
  if (!std::filesystem::exists(file))
  {
    throw ArgumentError("Configuration file not found: " + file.string());
  }

  configFile_ = file;
  parsedIni_.reset();
}

void ConfigurationSettings::parseIni()
{
  if (parsedIni_)
  {
    return;
  }

  if (configFile_.empty())
  {
    throw ConfigurationError("Configuration file not set");
  }

  boost::property_tree::ptree tree;
  try
  {
    boost::property_tree::ini_parser::read_ini(configFile_.string(), tree);
  }
  catch (const boost::property_tree::ini_parser_error& ex)
  {
    throw ConfigurationError("Configuration file could not be loaded: " +
                             std::string(ex.what()));
  }

  parsedIni_ = std::move(tree);
}

std::optional<std::map<std::string, std::string>>
ConfigurationSettings::getSection(const std::string& name)
{
  parseIni();

  auto section = parsedIni_->get_child_optional(
    boost::property_tree::ptree::path_type{name, '\0'});
  // A key outside any section is a leaf of the root, not a section
  if (!section || (section->empty() && !section->data().empty()))
  {
    return std::nullopt;
  }

  std::map<std::string, std::string> values;
  for (const auto& [key, node] : *section)
  {
    values.emplace(key, node.data());
  }
  return values;
}

std::optional<std::string> ConfigurationSettings::getValue(
  const std::string& section,
  const std::string& key)
{
  auto values = getSection(section);
  if (!values)
  {
    return std::nullopt;
  }

  auto it = values->find(key);
  if (it == values->end())
  {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace cpp_dataobject
