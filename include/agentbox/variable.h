#ifndef INCLUDE_AGENTBOX_VARIABLE_H_
#define INCLUDE_AGENTBOX_VARIABLE_H_

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#define ENUM_VARIABLE_KIND_ \
  X(GENERIC) /* anything representable as json */ \
  X(TABLE)
enum class VariableKind {
#define X(name) name,
  ENUM_VARIABLE_KIND_
#undef X
};

#define ENUM_COLUMN_TYPE_ \
  X(INT64, "int64") \
  X(FLOAT64, "float64") \
  X(BOOL, "bool") \
  X(STRING, "string")
enum class ColumnType {
#define X(name, dtype) name,
  ENUM_COLUMN_TYPE_
#undef X
};

struct Column {
  std::string name;
  ColumnType type;
  nlohmann::json values; // array; null entries are missing cells

  Column() : type(ColumnType::INT64), values(nlohmann::json::array()) {}
  Column(std::string name, ColumnType type, nlohmann::json values) :
      name(std::move(name)), type(type), values(std::move(values)) {}
};

class Table {
 public:
  std::vector<Column> columns;

  Table() {}
  Table(std::vector<Column> columns) : columns(std::move(columns)) {}
  // number of rows of the first column; 0 if there are no columns
  size_t NumRows() const;
};

class Variable {
 public:
  VariableKind kind;
  nlohmann::json value; // GENERIC only
  Table table; // TABLE only

  Variable() : kind(VariableKind::GENERIC) {}
  Variable(nlohmann::json value) : kind(VariableKind::GENERIC), value(std::move(value)) {}
  Variable(Table table) : kind(VariableKind::TABLE), table(std::move(table)) {}
};

// sorted by name so that everything derived from it is deterministic
using Namespace = std::map<std::string, Variable>;

// {"name": value, ...}; a value of the form {"$table": [{"name", "dtype", "values"}, ...]}
// becomes a table. Throws std::invalid_argument on malformed input.
Namespace NamespaceFromJson(const nlohmann::json&);

#endif  // INCLUDE_AGENTBOX_VARIABLE_H_
