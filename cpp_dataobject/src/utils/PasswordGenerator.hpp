#ifndef PASSWORD_GENERATOR_HPP
#define PASSWORD_GENERATOR_HPP

#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace cpp_dataobject
{

/*!
 * \brief Generates pronounceable passwords
 *
 * A word is assembled from a prefix, a vowel or diphthong, a consonant
 * or consonant pair and a postfix. The result reads like a word without
 * being one. It is not meant to be cryptographically strong.
 */
class PasswordGenerator
{
public:
  //! Seeded from std::random_device
  PasswordGenerator();

  //! Reproducible output for a fixed seed
  explicit PasswordGenerator(std::uint32_t seed);

  /*!
   * \brief Generate a new password
   *
   * \param length Exact length of the word part, 0 for any length
   * \param caps If set, consonants may be upper case
   * \param number If set, a number from 10 to 99 is appended after the
   *        word part (in addition to \p length)
   */
  std::string generate(std::size_t length = 0,
                       bool caps = false,
                       bool number = false);

private:
  std::string makeWord(bool caps);

  std::size_t getRandom(std::size_t max);

  //! Odds of roughly 1 in 4
  bool isGoodChance();

  std::string getConsonant(bool single, bool caps);

  std::string getVowel();

  std::string getPrefix(bool caps);

  std::mt19937 engine_;
};

}  // namespace cpp_dataobject

#endif  // PASSWORD_GENERATOR_HPP
