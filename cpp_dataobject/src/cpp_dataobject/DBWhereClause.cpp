#include "cpp_dataobject/src/cpp_dataobject/DBWhereClause.hpp"

#include <algorithm>

#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"

namespace cpp_dataobject
{

WhereClauses::WhereClauses(std::vector<WhereClause> clauses,
                           WhereOperator groupOperator)
  : clauses_{std::move(clauses)}, groupOperator_{groupOperator}
{
}

WhereClauses::WhereClauses(
  std::initializer_list<std::pair<std::string, DataValue>> pairs)
{
  for (const auto& [column, value] : pairs)
  {
    add(column, value);
  }
}

WhereClauses WhereClauses::fromAlternating(
  const std::vector<DataValue>& sequence)
{
  if (sequence.size() % 2 != 0)
  {
    throw ArgumentError("Missing value for the last where key");
  }

  WhereClauses where;
  for (std::size_t index = 0; index < sequence.size(); index += 2)
  {
    const auto* key = std::get_if<std::string>(&sequence[index]);
    if (key == nullptr)
    {
      throw ArgumentError("Where key at position " + std::to_string(index) +
                          " is not a string");
    }
    where.add(*key, sequence[index + 1]);
  }
  return where;
}

WhereClauses& WhereClauses::add(const std::string& column,
                                const DataValue& value)
{
  if (column == kWhereControlKey)
  {
    applyControlValue(value);
    return *this;
  }

  auto it = std::find_if(clauses_.begin(),
                         clauses_.end(),
                         [&column](const WhereClause& clause)
                         { return clause.column == column; });
  if (it == clauses_.end())
  {
    clauses_.push_back(WhereClause{column, {value}});
  }
  else
  {
    it->values.push_back(value);
  }
  return *this;
}

void WhereClauses::applyControlValue(const DataValue& value)
{
  if (hasControlKey_)
  {
    throw ArgumentError("Where clause comparison given more than once");
  }

  const auto* text = std::get_if<std::string>(&value);
  if (text != nullptr && *text == kWhereControlAnd)
  {
    groupOperator_ = WhereOperator::And;
  }
  else if (text != nullptr && *text == kWhereControlOr)
  {
    groupOperator_ = WhereOperator::Or;
  }
  else
  {
    throw ArgumentError("Unsupported where clause comparison");
  }
  hasControlKey_ = true;
}

}  // namespace cpp_dataobject
