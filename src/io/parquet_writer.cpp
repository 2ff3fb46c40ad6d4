#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace optimach {
namespace io {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + column + " array");
    return array;
}

} // anonymous namespace

void ParquetWriter::write_cashflows(const EvaluationResult& result, const std::string& filepath) {
    size_t row_count = 0;
    for (const StrategyResult& strategy : result.ranked) {
        row_count += strategy.cashflows.size();
    }
    if (row_count == 0) {
        throw std::runtime_error("EvaluationResult has no cash flows to write. Evaluate with EvaluationConfig.detailed_cashflows set.");
    }

    // Build Arrow schema
    auto schema = arrow::schema({
        arrow::field("k", arrow::int32()),
        arrow::field("year", arrow::int32()),
        arrow::field("existing_operating_cost", arrow::float64()),
        arrow::field("new_operating_cost", arrow::float64()),
        arrow::field("purchase_cost", arrow::float64()),
        arrow::field("salvage_recovery", arrow::float64()),
        arrow::field("amount", arrow::float64()),
        arrow::field("discount_factor", arrow::float64()),
        arrow::field("discounted_amount", arrow::float64())
    });

    arrow::Int32Builder k_builder;
    arrow::Int32Builder year_builder;
    arrow::DoubleBuilder existing_op_builder;
    arrow::DoubleBuilder new_op_builder;
    arrow::DoubleBuilder purchase_builder;
    arrow::DoubleBuilder salvage_builder;
    arrow::DoubleBuilder amount_builder;
    arrow::DoubleBuilder factor_builder;
    arrow::DoubleBuilder discounted_builder;

    const auto rows = static_cast<int64_t>(row_count);
    check(k_builder.Reserve(rows), "reserve k column");
    check(year_builder.Reserve(rows), "reserve year column");
    check(existing_op_builder.Reserve(rows), "reserve existing_operating_cost column");
    check(new_op_builder.Reserve(rows), "reserve new_operating_cost column");
    check(purchase_builder.Reserve(rows), "reserve purchase_cost column");
    check(salvage_builder.Reserve(rows), "reserve salvage_recovery column");
    check(amount_builder.Reserve(rows), "reserve amount column");
    check(factor_builder.Reserve(rows), "reserve discount_factor column");
    check(discounted_builder.Reserve(rows), "reserve discounted_amount column");

    for (const StrategyResult* strategy : result.by_keep_years()) {
        for (const CashFlowEntry& cf : strategy->cashflows) {
            check(k_builder.Append(strategy->k), "append k");
            check(year_builder.Append(cf.year), "append year");
            check(existing_op_builder.Append(cf.existing_operating_cost), "append existing_operating_cost");
            check(new_op_builder.Append(cf.new_operating_cost), "append new_operating_cost");
            check(purchase_builder.Append(cf.purchase_cost), "append purchase_cost");
            check(salvage_builder.Append(cf.salvage_recovery), "append salvage_recovery");
            check(amount_builder.Append(cf.amount), "append amount");
            check(factor_builder.Append(cf.discount_factor), "append discount_factor");
            check(discounted_builder.Append(cf.discounted_amount), "append discounted_amount");
        }
    }

    auto table = arrow::Table::Make(schema, {
        finish(k_builder, "k"),
        finish(year_builder, "year"),
        finish(existing_op_builder, "existing_operating_cost"),
        finish(new_op_builder, "new_operating_cost"),
        finish(purchase_builder, "purchase_cost"),
        finish(salvage_builder, "salvage_recovery"),
        finish(amount_builder, "amount"),
        finish(factor_builder, "discount_factor"),
        finish(discounted_builder, "discounted_amount")
    });

    // Open output file
    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_cashflows(const EvaluationResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with Arrow and Parquet installed to enable Parquet export.");
}

#endif // HAVE_ARROW

} // namespace io
} // namespace optimach
