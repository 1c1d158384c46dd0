#pragma once

#include "pipeline.h"
#include "types.h"

#include <string>
#include <vector>

namespace cifra {

// "--- TABLE 1 ---" then "<fieldId> : <value>" per field with a value.
std::string render_toon(const std::vector<ResolutionResult>& results);

// What was decided for every field and why.
std::string render_report(const std::vector<ResolutionResult>& results);

std::string results_to_json(const DocumentResolution& resolution);

} // namespace cifra
