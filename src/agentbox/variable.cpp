#include <agentbox/variable.h>

#include <stdexcept>

#include "utils.h"

namespace {

Table TableFromJson(const std::string& name, const nlohmann::json& data) {
  if (!data.is_array()) {
    throw std::invalid_argument("variable " + name + ": $table must be an array of columns");
  }
  Table table;
  for (auto& col : data) {
    if (!col.is_object() || !col.contains("name") || !col["name"].is_string() ||
        !col.contains("values") || !col["values"].is_array()) {
      throw std::invalid_argument("variable " + name + ": column needs a name and a values array");
    }
    ColumnType type = ColumnType::STRING;
    std::string dtype = col.value("dtype", "string");
    if (!GetColumnType(dtype, type)) {
      throw std::invalid_argument("variable " + name + ": unknown dtype " + dtype);
    }
    table.columns.emplace_back(col["name"].get<std::string>(), type, col["values"]);
  }
  return table;
}

} // namespace

size_t Table::NumRows() const {
  return columns.empty() ? 0 : columns[0].values.size();
}

Namespace NamespaceFromJson(const nlohmann::json& data) {
  if (!data.is_object()) throw std::invalid_argument("variables must be a json object");
  Namespace ns;
  for (auto& item : data.items()) {
    const std::string& name = item.key();
    const nlohmann::json& value = item.value();
    if (value.is_object() && value.size() == 1 && value.contains("$table")) {
      ns.emplace(name, Variable(TableFromJson(name, value["$table"])));
    } else {
      ns.emplace(name, Variable(value));
    }
  }
  return ns;
}
