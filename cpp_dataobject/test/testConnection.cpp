#include <limits>
#include <memory>
#include <string>

#include "cpp_dataobject/src/cpp_dataobject/DBConnection.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBValueFormatter.hpp"
#include "cpp_dataobject/test/MockDriver.hpp"
#include "cpp_dataobject/test/testDatabase.hpp"

using namespace cpp_dataobject;

namespace
{

Credentials mockCredentials()
{
  Credentials credentials;
  credentials.hostname = "localhost";
  credentials.username = "user";
  credentials.password = "secret";
  credentials.database = "shop";
  return credentials;
}

}  // namespace

class ConnectionTest : public DatabaseTest
{
protected:
  void SetUp() override
  {
    DatabaseTest::SetUp();
    auto driver = std::make_unique<MockDriver>();
    driver_ = driver.get();
    connection_ = std::make_unique<Connection>(
      mockCredentials(), std::move(driver), pLogger_);
  }

  //! Owned by connection_
  MockDriver* driver_{nullptr};
  std::unique_ptr<Connection> connection_;
};

TEST_F(ConnectionTest, EmptyCredentialsAreRejected)
{
  EXPECT_THROW(Connection(Credentials{}, std::make_unique<MockDriver>()),
               ArgumentError);
}

TEST_F(ConnectionTest, OpenIsIdempotentAndSetsCharset)
{
  EXPECT_FALSE(connection_->hasConnection());

  connection_->open();
  connection_->open();

  EXPECT_TRUE(connection_->hasConnection());
  EXPECT_EQ(driver_->openCount, 1);
  EXPECT_EQ(driver_->charset, "utf8");
  ASSERT_TRUE(driver_->openedWith.has_value());
  EXPECT_EQ(driver_->openedWith->database, "shop");

  connection_->close();
  connection_->close();
  EXPECT_FALSE(connection_->hasConnection());
}

TEST_F(ConnectionTest, OpenFailureIsSqlError)
{
  driver_->failOpen = true;
  try
  {
    connection_->open();
    FAIL() << "Expected SqlError";
  }
  catch (const SqlError& ex)
  {
    EXPECT_EQ(ex.getCode(), 1045);
    EXPECT_EQ(ex.describe(), "Access denied (\?\?\?)");
  }
}

TEST_F(ConnectionTest, QueryOpensAndSubstitutesInOrder)
{
  connection_->addParameter(SqlDataType::String, std::string("foo"));
  connection_->addParameter(SqlDataType::Integer, std::int64_t{12345});
  connection_->query("select * from Users where Username=? and Type=?");

  EXPECT_TRUE(connection_->hasConnection());
  ASSERT_EQ(driver_->executed.size(), 1u);
  EXPECT_EQ(driver_->executed[0],
            "select * from Users where Username='foo' and Type=12345");
  EXPECT_TRUE(connection_->getParameters().empty());
}

TEST_F(ConnectionTest, FormatsEveryType)
{
  connection_->addParameter(SqlDataType::Float, 2.5);
  connection_->addParameter(SqlDataType::Bool, true);
  connection_->addParameter(SqlDataType::Bool, std::string("no"));
  connection_->addParameter(SqlDataType::Timestamp, std::int64_t{1000000000});
  connection_->addParameter(SqlDataType::Timestamp, std::int64_t{0});
  connection_->addParameter(SqlDataType::Text, std::string("<p>it's</p>"));
  connection_->addParameter(SqlDataType::Data, toBlob("raw"));
  connection_->addParameter(SqlDataType::Integer, DataValue{});
  connection_->query("? ? ? ? ? ? ? ?");

  ASSERT_EQ(driver_->executed.size(), 1u);
  EXPECT_EQ(driver_->executed[0],
            "2.500000 '1' '0' '2001-09-09 01:46:40' NULL '<p>it\\'s</p>' "
            "X'726177' NULL");
}

TEST_F(ConnectionTest, StringParametersAreCoerced)
{
  connection_->addParameter(SqlDataType::String, std::string(" <b>bold</b> "));
  connection_->addParameter(SqlDataType::Integer, std::string("42abc"));
  connection_->addParameter(SqlDataType::Float, std::string("x"));

  const auto& parameters = connection_->getParameters();
  ASSERT_EQ(parameters.size(), 3u);
  EXPECT_EQ(std::get<std::string>(parameters[0].second), "bold");
  EXPECT_EQ(std::get<std::int64_t>(parameters[1].second), 42);
  EXPECT_DOUBLE_EQ(std::get<double>(parameters[2].second), 0.0);
}

TEST_F(ConnectionTest, InvalidParameterTypeIsRejected)
{
  EXPECT_THROW(connection_->addParameter(static_cast<SqlDataType>(99),
                                         std::int64_t{1}),
               ArgumentError);
}

TEST_F(ConnectionTest, PlaceholderInsideValueSurvives)
{
  connection_->addParameter(SqlDataType::String, std::string("what?"));
  connection_->addParameter(SqlDataType::Integer, std::int64_t{7});
  connection_->query("insert into t (a, b) values (?, ?)");

  ASSERT_EQ(driver_->executed.size(), 1u);
  EXPECT_EQ(driver_->executed[0], "insert into t (a, b) values ('what?', 7)");
}

TEST_F(ConnectionTest, MissingParameterIsCountError)
{
  connection_->addParameter(SqlDataType::Integer, std::int64_t{1});

  try
  {
    connection_->query("select ? , ?");
    FAIL() << "Expected ParameterCountError";
  }
  catch (const ParameterCountError& ex)
  {
    EXPECT_STREQ(ex.what(), "Too many parameters passed in query");
    EXPECT_EQ(ex.getQuery(), "select ? , ?");
  }

  EXPECT_TRUE(driver_->executed.empty());
  EXPECT_TRUE(connection_->getParameters().empty());
}

TEST_F(ConnectionTest, LeftoverParameterIsCountError)
{
  connection_->addParameter(SqlDataType::Integer, std::int64_t{1});
  connection_->addParameter(SqlDataType::Integer, std::int64_t{2});

  try
  {
    connection_->query("select ?");
    FAIL() << "Expected ParameterCountError";
  }
  catch (const ParameterCountError& ex)
  {
    EXPECT_STREQ(ex.what(),
                 "Not enough parameters passed to query (expecting 2, got 1)");
  }

  EXPECT_TRUE(driver_->executed.empty());
}

TEST_F(ConnectionTest, MatchingCountsAlwaysSucceed)
{
  for (int n = 0; n < 5; ++n)
  {
    std::string sql = "select 1";
    for (int i = 0; i < n; ++i)
    {
      connection_->addParameter(SqlDataType::Integer, std::int64_t{i});
      sql += ", ?";
    }
    EXPECT_NO_THROW(connection_->query(sql)) << n;

    for (int i = 0; i <= n; ++i)
    {
      connection_->addParameter(SqlDataType::Integer, std::int64_t{i});
    }
    EXPECT_THROW(connection_->query(sql), ParameterCountError) << n;

    for (int i = 0; i + 1 < n; ++i)
    {
      connection_->addParameter(SqlDataType::Integer, std::int64_t{i});
    }
    if (n > 0)
    {
      EXPECT_THROW(connection_->query(sql), ParameterCountError) << n;
    }
  }
}

TEST_F(ConnectionTest, SkipSubstitutionLeavesTokens)
{
  connection_->addParameter(SqlDataType::Integer, std::int64_t{1});
  connection_->query("select '?'", true);

  ASSERT_EQ(driver_->executed.size(), 1u);
  EXPECT_EQ(driver_->executed[0], "select '?'");
  EXPECT_TRUE(connection_->getParameters().empty());
}

TEST_F(ConnectionTest, NewQueryIsIdempotent)
{
  connection_->addParameter(SqlDataType::Integer, std::int64_t{1});
  connection_->newQuery();
  connection_->newQuery();

  EXPECT_TRUE(connection_->getParameters().empty());
  EXPECT_EQ(connection_->getAffectedRowCount(), 0);
  EXPECT_NO_THROW(connection_->query("select 1"));
}

TEST_F(ConnectionTest, RowCountTracksRowsOrAffected)
{
  driver_->queueRows({Row{{"Id", std::int64_t{1}}}, Row{{"Id", std::int64_t{2}}}});
  auto rows = connection_->query("select Id from t");
  EXPECT_EQ(rows.size(), 2u);
  EXPECT_EQ(connection_->getAffectedRowCount(), 2);

  driver_->queueAffected(5);
  rows = connection_->query("delete from t");
  EXPECT_TRUE(rows.empty());
  EXPECT_EQ(connection_->getAffectedRowCount(), 5);
}

TEST_F(ConnectionTest, ExecutionFailureCarriesQuery)
{
  driver_->failExecute = true;
  connection_->addParameter(SqlDataType::Integer, std::int64_t{3});

  try
  {
    connection_->query("selec ?");
    FAIL() << "Expected SqlError";
  }
  catch (const SqlError& ex)
  {
    EXPECT_EQ(ex.getQuery(), "selec 3");
    EXPECT_EQ(ex.getCode(), 1064);
    EXPECT_EQ(ex.describe(), "Syntax error (selec 3)");
  }

  EXPECT_TRUE(connection_->getParameters().empty());
}

TEST_F(ConnectionTest, BeginQueryYieldsRowsOneAtATime)
{
  driver_->queueRows({Row{{"Name", std::string("a")}},
                      Row{{"Name", std::string("b")}}});
  connection_->beginQuery("select Name from t");

  auto first = connection_->nextRow();
  auto second = connection_->nextRow();
  auto third = connection_->nextRow();

  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(std::get<std::string>(first->at("Name")), "a");
  EXPECT_EQ(std::get<std::string>(second->at("Name")), "b");
  EXPECT_FALSE(third.has_value());
  EXPECT_FALSE(connection_->nextRow().has_value());
}

TEST_F(ConnectionTest, NextRowWithoutQueryIsEmpty)
{
  EXPECT_FALSE(connection_->nextRow().has_value());
}

TEST_F(ConnectionTest, NewQueryReleasesCursor)
{
  driver_->queueRows({Row{{"Name", std::string("a")}}});
  connection_->beginQuery("select Name from t");
  connection_->newQuery();

  EXPECT_FALSE(connection_->nextRow().has_value());
}

TEST_F(ConnectionTest, ProcedureBuildsCall)
{
  connection_->addParameter(SqlDataType::String, std::string("who?"));
  connection_->addParameter(SqlDataType::Integer, std::int64_t{3});
  connection_->procedure("FindUsers");

  ASSERT_EQ(driver_->executed.size(), 1u);
  EXPECT_EQ(driver_->executed[0], "call `FindUsers`('who?', 3)");
  EXPECT_TRUE(connection_->getParameters().empty());

  connection_->beginProcedure("Cleanup");
  ASSERT_EQ(driver_->executed.size(), 2u);
  EXPECT_EQ(driver_->executed[1], "call `Cleanup`()");
}

TEST_F(ConnectionTest, LastIdAndEscapeNeedConnection)
{
  EXPECT_THROW(connection_->lastId(), ConfigurationError);
  EXPECT_THROW(connection_->escapeVariable("x"), ConfigurationError);

  driver_->nextInsertId = 17;
  connection_->open();
  EXPECT_EQ(connection_->lastId(), 17);
  EXPECT_EQ(connection_->escapeVariable("it's"), "it\\'s");
}

TEST_F(ConnectionTest, NonFiniteFloatIsRejected)
{
  connection_->addParameter(SqlDataType::Float, std::string("1e999"));
  EXPECT_THROW(connection_->query("insert into f values (?)"), ArgumentError);
  EXPECT_TRUE(driver_->executed.empty());
  EXPECT_TRUE(connection_->getParameters().empty());

  connection_->addParameter(SqlDataType::Float,
                            std::numeric_limits<double>::quiet_NaN());
  EXPECT_THROW(connection_->procedure("Store"), ArgumentError);
  EXPECT_TRUE(driver_->executed.empty());
  EXPECT_TRUE(connection_->getParameters().empty());

  connection_->addParameter(SqlDataType::Float, 1.0);
  EXPECT_NO_THROW(connection_->query("insert into f values (?)"));
}

TEST_F(ConnectionTest, OutOfRangeTimestampIsNull)
{
  connection_->addParameter(SqlDataType::Timestamp,
                            std::int64_t{400000000000});
  connection_->addParameter(SqlDataType::Timestamp,
                            std::numeric_limits<std::int64_t>::min());
  connection_->query("insert into t values (?, ?)");

  ASSERT_EQ(driver_->executed.size(), 1u);
  EXPECT_EQ(driver_->executed[0], "insert into t values (NULL, NULL)");
}

TEST_F(ConnectionTest, BinaryDataKeepsEveryByte)
{
  connection_->addParameter(SqlDataType::Data, Blob{'a', '\'', 0, '?', 0xFF});
  connection_->query("insert into t values (?)");

  ASSERT_EQ(driver_->executed.size(), 1u);
  EXPECT_EQ(driver_->executed[0], "insert into t values (X'6127003FFF')");
}

TEST(ValueFormatterTest, RejectsUnknownType)
{
  MockDriver driver;
  ValueFormatter formatter{driver};
  bool changed = true;

  EXPECT_THROW(formatter.format(static_cast<SqlDataType>(0),
                                std::int64_t{1},
                                changed),
               ConfigurationError);
}

TEST(ValueFormatterTest, MarksReplacedPlaceholders)
{
  MockDriver driver;
  ValueFormatter formatter{driver};
  bool changed = false;

  std::string literal =
    formatter.format(SqlDataType::Text, std::string("a?b"), changed);
  EXPECT_TRUE(changed);
  EXPECT_EQ(literal.find('?'), std::string::npos);

  ValueFormatter::restorePlaceholders(literal);
  EXPECT_EQ(literal, "'a?b'");

  formatter.format(SqlDataType::String, std::string("ab"), changed);
  EXPECT_FALSE(changed);
}

//
// SQLite end to end
//

TEST_F(DatabaseTest, SqliteQueryRoundTrip)
{
  Connection connection{memoryCredentials(), nullptr, pLogger_};

  connection.query(
    "create table notes (Id integer primary key autoincrement, "
    "Body text, Score real, Created text, Raw blob)");

  connection.addParameter(SqlDataType::Text, std::string("why? because"));
  connection.addParameter(SqlDataType::Float, 4.25);
  connection.addParameter(SqlDataType::Timestamp,
                          std::string("2001-09-09 01:46:40"));
  connection.addParameter(SqlDataType::Data, DataValue{});
  connection.query(
    "insert into notes (Body, Score, Created, Raw) values (?, ?, ?, ?)");

  EXPECT_EQ(connection.getAffectedRowCount(), 1);
  EXPECT_EQ(connection.lastId(), 1);

  connection.addParameter(SqlDataType::Integer, std::int64_t{1});
  auto rows = connection.query("select * from notes where Id=?");

  ASSERT_EQ(rows.size(), 1u);
  const Row& row = rows.front();
  EXPECT_EQ(std::get<std::string>(row.at("Body")), "why? because");
  EXPECT_DOUBLE_EQ(std::get<double>(row.at("Score")), 4.25);
  EXPECT_EQ(std::get<std::string>(row.at("Created")), "2001-09-09 01:46:40");
  EXPECT_TRUE(isNull(row.at("Raw")));
}

TEST_F(DatabaseTest, SqliteCursorAndErrors)
{
  Connection connection{memoryCredentials(), nullptr, pLogger_};

  connection.query(
    "create table numbers (Value integer); "
    "insert into numbers values (1); insert into numbers values (2);");

  connection.beginQuery("select Value from numbers order by Value");
  std::int64_t sum = 0;
  while (auto row = connection.nextRow())
  {
    sum += std::get<std::int64_t>(row->at("Value"));
  }
  EXPECT_EQ(sum, 3);

  EXPECT_THROW(connection.query("select * from missing_table"), SqlError);

  // SQLite has no stored procedures
  EXPECT_THROW(connection.procedure("Anything"), SqlError);

  EXPECT_EQ(connection.escapeVariable("it's"), "it''s");
}

TEST_F(DatabaseTest, SqliteBinaryDataRoundTrip)
{
  Connection connection{memoryCredentials(), nullptr, pLogger_};
  connection.query("create table files (Raw blob, Name text)");

  const Blob bytes{'a', 'b', 0, 'c', 'd'};
  connection.addParameter(SqlDataType::Data, bytes);
  connection.addParameter(SqlDataType::String, std::string("it's"));
  connection.query("insert into files (Raw, Name) values (?, ?)");

  auto rows =
    connection.query("select length(Raw) as Size, Raw, Name from files");
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(std::get<std::int64_t>(rows[0].at("Size")), 5);
  EXPECT_EQ(std::get<Blob>(rows[0].at("Raw")), bytes);
  EXPECT_EQ(std::get<std::string>(rows[0].at("Name")), "it's");
}

TEST_F(DatabaseTest, SqliteCursorRunsOneStatement)
{
  Connection connection{memoryCredentials(), nullptr, pLogger_};

  EXPECT_THROW(connection.beginQuery("select 1; select 2"), SqlError);

  connection.beginQuery("select 1 as One; -- trailing comment");
  auto row = connection.nextRow();
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(std::get<std::int64_t>(row->at("One")), 1);
  EXPECT_FALSE(connection.nextRow().has_value());
}
