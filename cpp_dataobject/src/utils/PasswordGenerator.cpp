#include "cpp_dataobject/src/utils/PasswordGenerator.hpp"

#include <array>
#include <cctype>
#include <string_view>

namespace cpp_dataobject
{

namespace
{

constexpr std::array<std::string_view, 36> kPrefixes = {
  "ab", "ac", "acr", "acl", "ad", "adr", "ah", "ar", "aw",  "ay", "br", "bl",
  "cl", "cr", "ch",  "dr",  "dw", "en",  "ey", "in", "im",  "iy", "oy", "och",
  "on", "qu", "sl",  "sh",  "sw", "tr",  "th", "thr", "un", "st", "str", "kn"};

constexpr std::array<std::string_view, 11> kDiphthongs = {
  "ae", "au", "ea", "ou", "ei", "ie", "ia", "ee", "oo", "eo", "io"};

constexpr std::array<std::string_view, 37> kConsonantPairs = {
  "bb", "bl", "br", "ck",  "cr", "ch", "dd",  "dr", "gh", "gr",
  "gn", "gg", "lb", "ld",  "lk", "lp", "mb",  "mm", "nc", "nch",
  "nd", "ng", "nn", "nt",  "pp", "pl", "pr",  "rr", "rch", "rs",
  "rsh", "rt", "sh", "th", "tt", "st", "str"};

constexpr std::array<std::string_view, 28> kPostfixes = {
  "able", "act", "am",  "ams",  "ect", "ed",  "edge", "en",  "er",  "ful",
  "ia",   "ier", "ies", "illy", "im",  "ing", "ium",  "is",  "less", "or",
  "up",   "ups", "y",   "igle", "ogle", "agle", "ist", "est"};

constexpr std::array<char, 5> kVowels = {'a', 'e', 'i', 'o', 'u'};

constexpr std::array<char, 20> kConsonants = {'b', 'c', 'd', 'f', 'g', 'h', 'j',
                                              'k', 'l', 'm', 'n', 'p', 'r', 's',
                                              't', 'v', 'w', 'x', 'y', 'z'};

}  // namespace

PasswordGenerator::PasswordGenerator() : engine_{std::random_device{}()}
{
}

PasswordGenerator::PasswordGenerator(std::uint32_t seed) : engine_{seed}
{
}

std::string PasswordGenerator::generate(std::size_t length,
                                        bool caps,
                                        bool number)
{
  std::string word = makeWord(caps);

  if (length > 0)
  {
    while (word.size() < length)
    {
      word += makeWord(caps);
    }
    word.resize(length);
  }

  if (number)
  {
    std::uniform_int_distribution<int> twoDigits{10, 99};
    word += std::to_string(twoDigits(engine_));
  }

  return word;
}

std::string PasswordGenerator::makeWord(bool caps)
{
  std::string word = getPrefix(caps);
  word += getVowel();
  word += getConsonant(false, caps);
  word += kPostfixes[getRandom(kPostfixes.size() - 1)];
  return word;
}

std::size_t PasswordGenerator::getRandom(std::size_t max)
{
  std::uniform_int_distribution<std::size_t> distribution{0, max};
  return distribution(engine_);
}

bool PasswordGenerator::isGoodChance()
{
  return getRandom(10) > 7;
}

std::string PasswordGenerator::getConsonant(bool single, bool caps)
{
  if (caps)
  {
    char letter = kConsonants[getRandom(kConsonants.size() - 1)];
    return std::string(
      1, static_cast<char>(std::toupper(static_cast<unsigned char>(letter))));
  }

  if (isGoodChance() && !single)
  {
    return std::string(kConsonantPairs[getRandom(kConsonantPairs.size() - 1)]);
  }
  return std::string(1, kConsonants[getRandom(kConsonants.size() - 1)]);
}

std::string PasswordGenerator::getVowel()
{
  if (isGoodChance())
  {
    return std::string(kDiphthongs[getRandom(kDiphthongs.size() - 1)]);
  }
  return std::string(1, kVowels[getRandom(kVowels.size() - 1)]);
}

std::string PasswordGenerator::getPrefix(bool caps)
{
  if (isGoodChance())
  {
    return std::string(kPrefixes[getRandom(kPrefixes.size() - 1)]);
  }
  return getConsonant(true, caps);
}

}  // namespace cpp_dataobject
