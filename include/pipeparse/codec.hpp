#pragma once
#include <pipeparse/pipeline.hpp>

#include <boost/json/value.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace pipeparse {

// Request body does not have the pipeline shape. what() names the offending
// location, e.g. "nodes[2].id: expected string".
class DecodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

Pipeline decode_pipeline(std::string_view body);
Pipeline pipeline_from_json(const boost::json::value &v);

std::string encode_summary(const PipelineSummary &s);
std::string encode_detail(const std::string &detail);

} // namespace pipeparse
