#include <cstdint>

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <arrow/ipc/reader.h>
#include <nlohmann/json.hpp>
#include <agentbox/errors.h>
#include <agentbox/marshal.h>
#include "src/agentbox/utils.h"

#include "utils.h"

namespace {

std::shared_ptr<arrow::Table> ReadTable(const fs::path& path) {
  auto file = arrow::io::ReadableFile::Open(path.string());
  EXPECT_TRUE(file.ok()) << file.status().ToString();
  auto reader = arrow::ipc::RecordBatchFileReader::Open(*file);
  EXPECT_TRUE(reader.ok()) << reader.status().ToString();
  std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
  for (int i = 0; i < (*reader)->num_record_batches(); i++) {
    auto batch = (*reader)->ReadRecordBatch(i);
    EXPECT_TRUE(batch.ok());
    batches.push_back(*batch);
  }
  auto table = arrow::Table::FromRecordBatches((*reader)->schema(), batches);
  EXPECT_TRUE(table.ok());
  return *table;
}

Table SampleTable() {
  Table table;
  table.columns.emplace_back("id", ColumnType::INT64, nlohmann::json{1, 2, 3});
  table.columns.emplace_back("score", ColumnType::FLOAT64, nlohmann::json{0.5, 1, nullptr});
  table.columns.emplace_back("ok", ColumnType::BOOL, nlohmann::json{true, false, true});
  table.columns.emplace_back("name", ColumnType::STRING, nlohmann::json{"a", "b", "c"});
  return table;
}

} // namespace

TEST(ScanIdentifiers, Tokens) {
  auto tokens = ScanIdentifiers("x = df.head(3)\nprint(_y1, 'str' + z2)");
  std::set<std::string> expected = {"x", "df", "head", "print", "_y1", "str", "z2"};
  EXPECT_EQ(tokens, expected);
  EXPECT_TRUE(ScanIdentifiers("").empty());
  // digits cannot start an identifier
  EXPECT_EQ(ScanIdentifiers("3abc"), std::set<std::string>());
}

TEST(SelectUsedVariables, SubsetOfNamespace) {
  Namespace ns = {{"df", Variable(nlohmann::json(1))}, {"x", Variable(nlohmann::json("s"))},
                  {"unused", Variable(nlohmann::json::array())}};
  std::string code = "print(df)\nx + 1";
  Namespace used = SelectUsedVariables(code, ns);
  std::set<std::string> tokens = ScanIdentifiers(code);
  for (auto& [name, value] : used) {
    EXPECT_TRUE(ns.count(name));
    EXPECT_TRUE(tokens.count(name));
  }
  EXPECT_EQ(used.size(), 2u);
  EXPECT_FALSE(used.count("unused"));
}

TEST(SelectUsedVariables, WholeWordOnly) {
  Namespace ns = {{"df", Variable(nlohmann::json(1))}, {"d", Variable(nlohmann::json(2))}};
  Namespace used = SelectUsedVariables("print(df2, dff)", ns);
  EXPECT_TRUE(used.empty());
  // mentions inside strings and comments still count
  used = SelectUsedVariables("# uses d\nprint('df')", ns);
  EXPECT_EQ(used.size(), 2u);
}

TEST(SerializeVariable, GenericIsCbor) {
  TempDir dir;
  nlohmann::json value = {{"a", {1, 2, 3}}, {"b", "text"}, {"c", nullptr}, {"d", 2.5}};
  fs::path dest = dir.path() / "v.var";
  SerializeVariable(Variable(value), dest);
  std::string content;
  ASSERT_TRUE(ReadFile(dest, content));
  EXPECT_EQ(nlohmann::json::from_cbor(content).dump(), value.dump());
}

TEST(SerializeVariable, TableIsArrowIpc) {
  TempDir dir;
  fs::path dest = dir.path() / "t.var";
  SerializeVariable(Variable(SampleTable()), dest);
  auto table = ReadTable(dest);
  ASSERT_TRUE(table);
  EXPECT_EQ(table->num_rows(), 3);
  ASSERT_EQ(table->num_columns(), 4);
  EXPECT_EQ(table->schema()->field(0)->name(), "id");
  EXPECT_TRUE(table->schema()->field(0)->type()->Equals(arrow::int64()));
  EXPECT_TRUE(table->schema()->field(1)->type()->Equals(arrow::float64()));
  EXPECT_TRUE(table->schema()->field(2)->type()->Equals(arrow::boolean()));
  EXPECT_TRUE(table->schema()->field(3)->type()->Equals(arrow::utf8()));
  EXPECT_EQ(table->column(1)->null_count(), 1);
}

TEST(SerializeVariable, TableTypeMismatch) {
  TempDir dir;
  Table table;
  table.columns.emplace_back("id", ColumnType::INT64, nlohmann::json{1, "two"});
  EXPECT_THROW(SerializeVariable(Variable(table), dir.path() / "t.var"), MarshalError);

  // unsigned values beyond int64 would wrap around
  Table big;
  big.columns.emplace_back("id", ColumnType::INT64, nlohmann::json::parse("[1, 18446744073709551615]"));
  EXPECT_THROW(SerializeVariable(Variable(big), dir.path() / "big.var"), MarshalError);
  big.columns[0].values = nlohmann::json::parse("[9223372036854775808]");
  EXPECT_THROW(SerializeVariable(Variable(big), dir.path() / "big.var"), MarshalError);

  Table flt;
  flt.columns.emplace_back("id", ColumnType::INT64, nlohmann::json{1.5});
  EXPECT_THROW(SerializeVariable(Variable(flt), dir.path() / "flt.var"), MarshalError);
}

TEST(SerializeVariable, Int64Limits) {
  TempDir dir;
  Table table;
  table.columns.emplace_back("id", ColumnType::INT64,
      nlohmann::json::parse("[9223372036854775807, -9223372036854775808, 0]"));
  fs::path dest = dir.path() / "t.var";
  SerializeVariable(Variable(table), dest);
  auto read = ReadTable(dest);
  ASSERT_TRUE(read);
  auto ints = std::static_pointer_cast<arrow::Int64Array>(read->column(0)->chunk(0));
  EXPECT_EQ(ints->Value(0), INT64_MAX);
  EXPECT_EQ(ints->Value(1), INT64_MIN);
}

TEST(SerializeVariable, RaggedTable) {
  TempDir dir;
  Table table;
  table.columns.emplace_back("a", ColumnType::INT64, nlohmann::json{1, 2});
  table.columns.emplace_back("b", ColumnType::INT64, nlohmann::json{1});
  EXPECT_THROW(SerializeVariable(Variable(table), dir.path() / "t.var"), MarshalError);
}

TEST(SerializeVariable, UnwritableDestination) {
  TempDir dir;
  EXPECT_THROW(SerializeVariable(Variable(nlohmann::json(1)), dir.path() / "missing" / "v.var"),
               MarshalError);
}

TEST(ScanIdentifiers, VeryLongToken) {
  std::string code = "blob = \"" + std::string(1 << 20, 'a') + "\"\nprint(df)\n";
  auto tokens = ScanIdentifiers(code);
  EXPECT_EQ(tokens.size(), 4u);
  EXPECT_TRUE(tokens.count("df"));
  EXPECT_TRUE(tokens.count("blob"));
  EXPECT_TRUE(tokens.count(std::string(1 << 20, 'a')));
}

TEST(ScanIdentifiers, BoundariesAtEnds) {
  EXPECT_EQ(ScanIdentifiers("df"), std::set<std::string>{"df"});
  EXPECT_EQ(ScanIdentifiers("9x x9 _1"), (std::set<std::string>{"x9", "_1"}));
  EXPECT_EQ(ScanIdentifiers("a.b-c+d"), (std::set<std::string>{"a", "b", "c", "d"}));
}

TEST(MarshalVariables, WritesOnlyReferenced) {
  TempDir dir;
  Namespace ns = {
    {"df", Variable(SampleTable())},
    {"x", Variable(nlohmann::json(42))},
    {"secret", Variable(nlohmann::json("hidden"))},
  };
  auto written = MarshalVariables("print(df.shape, x)", ns, dir.path());
  EXPECT_EQ(written, (std::vector<std::string>{"df", "x"}));
  EXPECT_TRUE(fs::exists(dir.path() / "df.var"));
  EXPECT_TRUE(fs::exists(dir.path() / "x.var"));
  EXPECT_FALSE(fs::exists(dir.path() / "secret.var"));
  size_t files = std::distance(fs::directory_iterator(dir.path()), fs::directory_iterator());
  EXPECT_EQ(files, 2u);
}

TEST(MarshalVariables, EmptyNamespace) {
  TempDir dir;
  EXPECT_TRUE(MarshalVariables("print(1)", {}, dir.path()).empty());
  EXPECT_TRUE(fs::is_empty(dir.path()));
}
