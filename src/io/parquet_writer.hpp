#ifndef OPTIMACH_PARQUET_WRITER_HPP
#define OPTIMACH_PARQUET_WRITER_HPP

#include "../strategy_evaluator.hpp"
#include <string>

namespace optimach {
namespace io {

class ParquetWriter {
public:
    /**
     * Write the cash flows of every evaluated strategy to a Parquet file,
     * one row per (k, year), strategies in k order.
     *
     * Output schema:
     *   - k: int32 (years the existing machine is kept)
     *   - year: int32
     *   - existing_operating_cost, new_operating_cost, purchase_cost,
     *     salvage_recovery, amount, discount_factor, discounted_amount: float64
     *
     * Strategies evaluated without cash flows are skipped.
     *
     * @param result EvaluationResult with cash flows
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if no strategy has cash flows, the file
     *         cannot be written, or the build has no Arrow support
     */
    static void write_cashflows(const EvaluationResult& result, const std::string& filepath);
};

} // namespace io
} // namespace optimach

#endif // OPTIMACH_PARQUET_WRITER_HPP
