#include "evaluation_store.hpp"

#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/file.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace transcription::evaluation {

using storage::common::Unwrap;

namespace {

const std::vector<std::string> kColumns = {"sample_id", "reference", "hypothesis", "metric_value", "processing_time"};

std::shared_ptr<arrow::Schema> ResultsSchema() {
  return arrow::schema({
      arrow::field("sample_id", arrow::int64(), false),
      arrow::field("reference", arrow::utf8(), false),
      arrow::field("hypothesis", arrow::utf8(), false),
      arrow::field("metric_value", arrow::float64(), false),
      arrow::field("processing_time", arrow::float64(), false),
  });
}

std::shared_ptr<arrow::Table> ReadCsv(const std::filesystem::path& path, const arrow::csv::ParseOptions& parse, arrow::csv::ConvertOptions convert) {
  auto input = Unwrap(arrow::io::ReadableFile::Open(path.string()), path.string());

  convert.strings_can_be_null = false;
  auto reader                 = Unwrap(arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, arrow::csv::ReadOptions::Defaults(), parse, convert));
  auto table                  = Unwrap(reader->Read(), path.string());
  Unwrap(input->Close(), path.string());
  return table;
}

std::shared_ptr<arrow::ChunkedArray> Column(const arrow::Table& table, const std::string& name, const std::filesystem::path& path) {
  auto column = table.GetColumnByName(name);
  if (!column) {
    throw util::ParseError(path.string() + ": missing column '" + name + "'");
  }
  return column;
}

// flattens a column into one array of the requested type
template <typename ArrayType>
std::shared_ptr<ArrayType> Flatten(const std::shared_ptr<arrow::ChunkedArray>& column) {
  std::shared_ptr<arrow::Array> array;
  if (column->num_chunks() == 1) {
    array = column->chunk(0);
  } else {
    array = Unwrap(arrow::Concatenate(column->chunks(), arrow::default_memory_pool()));
  }
  return std::static_pointer_cast<ArrayType>(array);
}

} // namespace

std::vector<EvaluationRecord> EvaluationStore::Load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    return {};
  }

  auto parse               = arrow::csv::ParseOptions::Defaults();
  parse.newlines_in_values = true;

  auto convert    = arrow::csv::ConvertOptions::Defaults();
  auto schema     = ResultsSchema();
  for (const auto& f : schema->fields()) {
    convert.column_types[f->name()] = f->type();
  }
  convert.include_columns = kColumns;

  auto table = ReadCsv(path, parse, convert);
  if (table->num_rows() == 0) {
    return {};
  }

  auto ids        = Flatten<arrow::Int64Array>(Column(*table, "sample_id", path));
  auto references = Flatten<arrow::StringArray>(Column(*table, "reference", path));
  auto hypotheses = Flatten<arrow::StringArray>(Column(*table, "hypothesis", path));
  auto metrics    = Flatten<arrow::DoubleArray>(Column(*table, "metric_value", path));
  auto times      = Flatten<arrow::DoubleArray>(Column(*table, "processing_time", path));

  std::vector<EvaluationRecord> records;
  records.reserve(static_cast<std::size_t>(table->num_rows()));
  for (int64_t i = 0; i < table->num_rows(); ++i) {
    if (ids->IsNull(i)) {
      throw util::ParseError(path.string() + ": row " + std::to_string(i) + " has no sample_id");
    }
    EvaluationRecord r;
    r.sample_id       = ids->Value(i);
    r.reference       = references->GetString(i);
    r.hypothesis      = hypotheses->GetString(i);
    r.metric_value    = metrics->IsNull(i) ? 0.0 : metrics->Value(i);
    r.processing_time = times->IsNull(i) ? 0.0 : times->Value(i);
    records.push_back(std::move(r));
  }
  return records;
}

/*
  Full rewrite:
      build table -> write tmp -> rename
*/
void EvaluationStore::Save(const std::filesystem::path& path, const std::vector<EvaluationRecord>& records) {
  arrow::Int64Builder  ids;
  arrow::StringBuilder references;
  arrow::StringBuilder hypotheses;
  arrow::DoubleBuilder metrics;
  arrow::DoubleBuilder times;

  for (const auto& r : records) {
    Unwrap(ids.Append(r.sample_id));
    Unwrap(references.Append(r.reference));
    Unwrap(hypotheses.Append(r.hypothesis));
    Unwrap(metrics.Append(r.metric_value));
    Unwrap(times.Append(r.processing_time));
  }

  auto table = arrow::Table::Make(ResultsSchema(), {Unwrap(ids.Finish()), Unwrap(references.Finish()), Unwrap(hypotheses.Finish()),
                                                    Unwrap(metrics.Finish()), Unwrap(times.Finish())});

  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  const auto tmp_path = path.string() + ".tmp";
  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path), tmp_path);
    Unwrap(arrow::csv::WriteCSV(*table, arrow::csv::WriteOptions::Defaults(), out.get()), tmp_path);
    Unwrap(out->Close(), tmp_path);
  }
  std::filesystem::rename(tmp_path, path);
}

std::vector<std::map<std::string, std::string>> ReadDelimited(const std::filesystem::path& path, char delimiter, const std::vector<std::string>& columns) {
  if (!std::filesystem::exists(path)) {
    throw util::NotFound(path.string() + " does not exist");
  }

  auto parse      = arrow::csv::ParseOptions::Defaults();
  parse.delimiter = delimiter;
  // Common Voice sentences carry bare quotes
  parse.quoting = false;

  auto convert = arrow::csv::ConvertOptions::Defaults();
  for (const auto& name : columns) {
    convert.column_types[name] = arrow::utf8();
  }

  auto table = ReadCsv(path, parse, convert);

  std::vector<std::shared_ptr<arrow::ChunkedArray>> chunked;
  for (const auto& name : columns) {
    auto column = Column(*table, name, path);
    if (column->type()->id() != arrow::Type::STRING) {
      throw util::ParseError(path.string() + ": column '" + name + "' is not text");
    }
    chunked.push_back(std::move(column));
  }
  if (table->num_rows() == 0) {
    return {};
  }

  std::vector<std::shared_ptr<arrow::StringArray>> arrays;
  for (const auto& column : chunked) {
    arrays.push_back(Flatten<arrow::StringArray>(column));
  }

  std::vector<std::map<std::string, std::string>> rows(static_cast<std::size_t>(table->num_rows()));
  for (std::size_t c = 0; c < columns.size(); ++c) {
    for (int64_t i = 0; i < table->num_rows(); ++i) {
      rows[static_cast<std::size_t>(i)][columns[c]] = arrays[c]->GetString(i);
    }
  }
  return rows;
}

} // namespace transcription::evaluation
