#ifndef CONFIGURATION_SETTINGS_HPP
#define CONFIGURATION_SETTINGS_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include <boost/property_tree/ptree.hpp>

namespace cpp_dataobject
{

/*!
 * \brief Read access to the sections and keys of an .ini file
 *
 * \code
 * [database]
 * hostname = localhost
 * database = :memory:
 * \endcode
 *
 * The file is located with setConfigFile() and parsed on the first
 * lookup.
 */
class ConfigurationSettings
{
public:
  ConfigurationSettings() = default;

  //! Shorthand for default construction followed by setConfigFile()
  explicit ConfigurationSettings(const std::filesystem::path& file);

  /*!
   * \brief Point this instance at an .ini file
   * \throws ArgumentError if the file does not exist
   */
  void setConfigFile(const std::filesystem::path& file);

  const std::filesystem::path& getConfigFile() const
  {
    return configFile_;
  }

  /*!
   * \brief Every key/value pair in a section
   * \return Nothing if the section does not exist
   * \throws ConfigurationError if no file is set or it cannot be parsed
   */
  std::optional<std::map<std::string, std::string>> getSection(
    const std::string& name);

  /*!
   * \brief A single value from a section
   * \return Nothing if the section or key does not exist
   * \throws ConfigurationError if no file is set or it cannot be parsed
   */
  std::optional<std::string> getValue(const std::string& section,
                                      const std::string& key);

private:
  void parseIni();

  //! The .ini file backing these settings
  std::filesystem::path configFile_;

  //! The parsed file; empty until the first lookup
  std::optional<boost::property_tree::ptree> parsedIni_;
};

}  // namespace cpp_dataobject

#endif  // CONFIGURATION_SETTINGS_HPP
