#include <agentbox/marshal.h>

#include <memory>
#include <cstdint>

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <arrow/ipc/writer.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <agentbox/errors.h>
#include "utils.h"

const char kVariableExtension[] = ".var";

namespace {

inline bool IsWordChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

inline void CheckStatus(const arrow::Status& status, const fs::path& dest) {
  if (!status.ok()) {
    throw MarshalError(fmt::format("failed writing table {}: {}", dest.c_str(), status.ToString()));
  }
}

template <class Builder, class Check, class Get>
std::shared_ptr<arrow::Array> BuildArray(const Column& col, const fs::path& dest, Check check, Get get) {
  Builder builder;
  CheckStatus(builder.Reserve(col.values.size()), dest);
  for (auto& val : col.values) {
    if (val.is_null()) {
      CheckStatus(builder.AppendNull(), dest);
      continue;
    }
    if (!check(val)) {
      throw MarshalError(fmt::format("column {} of type {} cannot hold {}",
                                     col.name, ColumnTypeName(col.type), val.dump()));
    }
    CheckStatus(builder.Append(get(val)), dest);
  }
  std::shared_ptr<arrow::Array> ret;
  CheckStatus(builder.Finish(&ret), dest);
  return ret;
}

std::shared_ptr<arrow::Array> BuildColumn(const Column& col, const fs::path& dest) {
  using nlohmann::json;
  switch (col.type) {
    case ColumnType::INT64:
      return BuildArray<arrow::Int64Builder>(col, dest,
          [](const json& v) {
            return v.is_number_integer() &&
                (!v.is_number_unsigned() || v.get<uint64_t>() <= (uint64_t)INT64_MAX);
          },
          [](const json& v) { return v.get<int64_t>(); });
    case ColumnType::FLOAT64:
      return BuildArray<arrow::DoubleBuilder>(col, dest,
          [](const json& v) { return v.is_number(); },
          [](const json& v) { return v.get<double>(); });
    case ColumnType::BOOL:
      return BuildArray<arrow::BooleanBuilder>(col, dest,
          [](const json& v) { return v.is_boolean(); },
          [](const json& v) { return v.get<bool>(); });
    case ColumnType::STRING:
      return BuildArray<arrow::StringBuilder>(col, dest,
          [](const json& v) { return v.is_string(); },
          [](const json& v) { return v.get<std::string>(); });
  }
  __builtin_unreachable();
}

std::shared_ptr<arrow::DataType> ArrowType(ColumnType type) {
  switch (type) {
    case ColumnType::INT64: return arrow::int64();
    case ColumnType::FLOAT64: return arrow::float64();
    case ColumnType::BOOL: return arrow::boolean();
    case ColumnType::STRING: return arrow::utf8();
  }
  __builtin_unreachable();
}

// Arrow IPC file format; readable by pandas.read_feather / pyarrow.ipc
void WriteTable(const Table& table, const fs::path& dest) {
  size_t rows = table.NumRows();
  arrow::FieldVector fields;
  arrow::ArrayVector arrays;
  for (auto& col : table.columns) {
    if (!col.values.is_array()) {
      throw MarshalError(fmt::format("column {}: values must be an array", col.name));
    }
    if (col.values.size() != rows) {
      throw MarshalError(fmt::format("column {} has {} rows, expected {}",
                                     col.name, col.values.size(), rows));
    }
    fields.push_back(arrow::field(col.name, ArrowType(col.type)));
    arrays.push_back(BuildColumn(col, dest));
  }
  auto schema = arrow::schema(fields);
  auto arrow_table = arrow::Table::Make(schema, arrays, rows);

  auto stream = arrow::io::FileOutputStream::Open(dest.string());
  CheckStatus(stream.status(), dest);
  auto writer = arrow::ipc::MakeFileWriter(*stream, schema);
  CheckStatus(writer.status(), dest);
  CheckStatus((*writer)->WriteTable(*arrow_table), dest);
  CheckStatus((*writer)->Close(), dest);
  CheckStatus((*stream)->Close(), dest);
}

} // namespace

std::set<std::string> ScanIdentifiers(const std::string& code) {
  // maximal runs of word characters; a run is a token unless it starts with a digit
  std::set<std::string> ret;
  for (size_t i = 0; i < code.size();) {
    if (!IsWordChar(code[i])) {
      i++;
      continue;
    }
    size_t j = i;
    while (j < code.size() && IsWordChar(code[j])) j++;
    if (code[i] < '0' || code[i] > '9') ret.insert(code.substr(i, j - i));
    i = j;
  }
  return ret;
}

Namespace SelectUsedVariables(const std::string& code, const Namespace& ns) {
  std::set<std::string> tokens = ScanIdentifiers(code);
  Namespace ret;
  for (auto& [name, value] : ns) {
    if (tokens.count(name)) ret.emplace(name, value);
  }
  return ret;
}

void SerializeVariable(const Variable& var, const fs::path& dest) {
  spdlog::debug("Serialize {} variable to {}", VariableKindName(var.kind), dest.c_str());
  switch (var.kind) {
    case VariableKind::TABLE: {
      WriteTable(var.table, dest);
      return;
    }
    case VariableKind::GENERIC: {
      std::vector<std::uint8_t> bytes = nlohmann::json::to_cbor(var.value);
      if (!WriteFile(dest, std::string(bytes.begin(), bytes.end()))) {
        throw MarshalError(fmt::format("failed writing {}", dest.c_str()));
      }
      return;
    }
  }
  __builtin_unreachable();
}

std::vector<std::string> MarshalVariables(
    const std::string& code, const Namespace& ns, const fs::path& inputs_dir) {
  std::set<std::string> tokens = ScanIdentifiers(code);
  std::vector<std::string> written;
  for (auto& [name, value] : ns) {
    if (!tokens.count(name)) continue;
    SerializeVariable(value, inputs_dir / (name + kVariableExtension));
    written.push_back(name);
  }
  spdlog::info("Marshaled {} of {} variables into {}", written.size(), ns.size(), inputs_dir.c_str());
  return written;
}
