#pragma once

#include "types.h"
#include "stemscan.pb.h"

#include <string>
#include <utility>
#include <vector>

namespace stemscan {

using FileResult = std::pair<std::string, AnalysisResult>;

// AnalysisResult <-> wire message
void to_proto(const AnalysisResult& r, pb::AnalysisResult* out);
AnalysisResult from_proto(const pb::AnalysisResult& msg);

pb::Report build_report(const std::vector<FileResult>& results);

// Serialize the report to a file. Returns false on I/O or serialization failure.
bool write_report(const pb::Report& report, const std::string& path);

// Parse a report file. Returns false if it cannot be opened or parsed.
bool read_report(pb::Report& report, const std::string& path);

} // namespace stemscan
