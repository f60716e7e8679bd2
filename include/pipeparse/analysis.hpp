#pragma once
#include <pipeparse/pipeline.hpp>

namespace pipeparse {

// Node and edge counts are the raw input sizes; is_dag is computed over the
// edges whose endpoints both exist.
PipelineSummary parse_pipeline(const Pipeline &p);

} // namespace pipeparse
