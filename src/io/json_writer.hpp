#ifndef OPTIMACH_IO_JSON_WRITER_HPP
#define OPTIMACH_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../strategy_evaluator.hpp"

namespace optimach {
namespace io {

// Write EvaluationResult to JSON format
// The output holds the ranked summary, the recommended strategy and the cash
// flows of the recommended strategy, or of every strategy when all_strategies
// is set (strategies evaluated without cash flows are written with an empty list)
void write_evaluation_json(std::ostream& os, const EvaluationResult& result,
                           bool all_strategies = false, bool pretty_print = true);

// Write EvaluationResult to JSON file
void write_evaluation_json(const std::string& filepath, const EvaluationResult& result,
                           bool all_strategies = false, bool pretty_print = true);

} // namespace io
} // namespace optimach

#endif // OPTIMACH_IO_JSON_WRITER_HPP
