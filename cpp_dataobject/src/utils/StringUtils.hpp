#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace cpp_dataobject
{

/*!
 * \brief Strip namespace prefix from a type name
 *
 * Converts "namespace::TypeName" to "TypeName"
 * Handles nested namespaces: "outer::inner::TypeName" -> "TypeName"
 * If no namespace exists, returns the original name unchanged
 *
 * \param fullTypeName The full type name (e.g., from boost::typeindex)
 * \return Type name without namespace prefix
 */
inline std::string stripNamespace(std::string_view fullTypeName)
{
  auto pos = fullTypeName.rfind("::");

  if (pos == std::string_view::npos)
  {
    return std::string(fullTypeName);
  }

  return std::string(fullTypeName.substr(pos + 2));
}

/*!
 * \brief Remove anything enclosed in a "<...>" pair
 *
 * An unterminated '<' removes the rest of the text.
 *
 * \example
 * stripMarkup("<b>bold</b> text") -> "bold text"
 */
inline std::string stripMarkup(std::string_view text)
{
  std::string result;
  result.reserve(text.size());

  bool inTag = false;
  for (char c : text)
  {
    if (inTag)
    {
      inTag = c != '>';
    }
    else if (c == '<')
    {
      inTag = true;
    }
    else
    {
      result += c;
    }
  }

  return result;
}

/*!
 * \brief Replace every occurrence of a character
 * \return The number of characters replaced
 */
inline std::size_t replaceAll(std::string& text, char from, char to)
{
  std::size_t count = 0;
  for (char& c : text)
  {
    if (c == from)
    {
      c = to;
      ++count;
    }
  }
  return count;
}

//! Wrap an identifier in SQL back ticks: Name -> `Name`
inline std::string backtick(std::string_view identifier)
{
  return "`" + std::string(identifier) + "`";
}

inline std::string joinStrings(const std::vector<std::string>& parts,
                               std::string_view separator)
{
  std::string joined;
  bool first = true;
  for (const auto& part : parts)
  {
    if (!first)
      joined += separator;
    joined += part;
    first = false;
  }
  return joined;
}

}  // namespace cpp_dataobject

#endif  // STRING_UTILS_HPP
