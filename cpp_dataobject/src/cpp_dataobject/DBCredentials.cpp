#include "cpp_dataobject/src/cpp_dataobject/DBCredentials.hpp"

#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"
#include "cpp_dataobject/src/utils/ConfigurationSettings.hpp"

namespace cpp_dataobject
{

Credentials Credentials::fromConfig(ConfigurationSettings& settings,
                                    const std::string& section)
{
  auto values = settings.getSection(section);
  if (!values)
  {
    throw ArgumentError("Missing configuration section [" + section + "]");
  }

  auto lookup = [&values](const std::string& key) -> std::string
  {
    auto it = values->find(key);
    return it == values->end() ? std::string{} : it->second;
  };

  Credentials credentials;
  credentials.hostname = lookup("hostname");
  credentials.username = lookup("username");
  credentials.password = lookup("password");
  credentials.database = lookup("database");
  return credentials;
}

}  // namespace cpp_dataobject
