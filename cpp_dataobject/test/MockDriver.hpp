#ifndef MOCK_DRIVER_HPP
#define MOCK_DRIVER_HPP

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "cpp_dataobject/src/cpp_dataobject/DBDriver.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"

/*!
 * A scripted driver that records every statement it is given.
 * Queued results are returned in order; when none are queued a
 * statement affects no rows.
 */
class MockDriver : public cpp_dataobject::Driver
{
public:
  void open(const cpp_dataobject::Credentials& credentials) override
  {
    if (failOpen)
    {
      throw cpp_dataobject::SqlError("Access denied", {}, 1045);
    }
    ++openCount;
    openedWith = credentials;
    isOpen_ = true;
  }

  void setCharset(const std::string& charset) override
  {
    this->charset = charset;
  }

  void close() override
  {
    isOpen_ = false;
  }

  bool isOpen() const override
  {
    return isOpen_;
  }

  Result execute(const std::string& sql) override
  {
    executed.push_back(sql);
    if (failExecute)
    {
      throw cpp_dataobject::SqlError("Syntax error", sql, 1064);
    }
    if (results.empty())
    {
      return Result{};
    }
    Result result = std::move(results.front());
    results.pop_front();
    return result;
  }

  std::unique_ptr<Cursor> openCursor(const std::string& sql) override
  {
    Result result = execute(sql);
    return std::make_unique<MockCursor>(std::move(result.rows));
  }

  // Escapes quotes the way MySQL does
  std::string escape(std::string_view value) const override
  {
    std::string escaped;
    for (char c : value)
    {
      if (c == '\'' || c == '\\')
      {
        escaped += '\\';
      }
      escaped += c;
    }
    return escaped;
  }

  std::string blobLiteral(const cpp_dataobject::Blob& value) const override
  {
    std::string literal = "X'";
    for (std::uint8_t byte : value)
    {
      literal += fmt::format("{:02X}", byte);
    }
    return literal + "'";
  }

  std::int64_t lastInsertId() const override
  {
    return nextInsertId;
  }

  void queueRows(std::vector<cpp_dataobject::Row> rows)
  {
    Result result;
    result.rows = std::move(rows);
    result.hasRows = true;
    results.push_back(std::move(result));
  }

  void queueAffected(std::int64_t count)
  {
    Result result;
    result.affectedRows = count;
    results.push_back(std::move(result));
  }

  std::vector<std::string> executed;
  std::deque<Result> results;
  std::optional<cpp_dataobject::Credentials> openedWith;
  std::string charset;
  std::int64_t nextInsertId{0};
  int openCount{0};
  bool failOpen{false};
  bool failExecute{false};

private:
  class MockCursor : public Cursor
  {
  public:
    explicit MockCursor(std::vector<cpp_dataobject::Row> rows)
      : rows_{rows.begin(), rows.end()}
    {
    }

    std::optional<cpp_dataobject::Row> next() override
    {
      if (rows_.empty())
      {
        return std::nullopt;
      }
      cpp_dataobject::Row row = std::move(rows_.front());
      rows_.pop_front();
      return row;
    }

  private:
    std::deque<cpp_dataobject::Row> rows_;
  };

  bool isOpen_{false};
};

#endif  // MOCK_DRIVER_HPP
