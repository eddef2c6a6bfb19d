#ifndef DB_CREDENTIALS_HPP
#define DB_CREDENTIALS_HPP

#include <string>

namespace cpp_dataobject
{

class ConfigurationSettings;

/*!
 * \brief What a driver needs to open a connection
 */
struct Credentials
{
  std::string hostname;
  std::string username;
  std::string password;
  //! The schema to select, or the database URL for file based drivers
  std::string database;

  //! True when no field has been supplied at all
  bool empty() const
  {
    return hostname.empty() && username.empty() && password.empty() &&
           database.empty();
  }

  /*!
   * \brief Read credentials from the keys hostname, username, password
   *        and database of an .ini section
   * \throws ArgumentError if the section does not exist
   */
  static Credentials fromConfig(ConfigurationSettings& settings,
                                const std::string& section = "database");
};

}  // namespace cpp_dataobject

#endif  // DB_CREDENTIALS_HPP
