#ifndef DATABASE_TEST_HPP
#define DATABASE_TEST_HPP

#include <gtest/gtest.h>
#include <string>

#include "cpp_dataobject/src/cpp_dataobject/DBCredentials.hpp"
#include "cpp_dataobject/src/utils/Logger.hpp"


class DatabaseTest : public ::testing::Test
{
public:
  ~DatabaseTest() = default;

protected:
  void SetUp() override;

  //! Credentials for a fresh in-memory SQLite database
  static cpp_dataobject::Credentials memoryCredentials();

  std::shared_ptr<spdlog::logger> pLogger_;

private:
  const static inline std::string testLogFile = "test_database.log";
};

#endif  // DATABASE_TEST_HPP
