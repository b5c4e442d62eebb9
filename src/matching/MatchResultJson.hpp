#pragma once

#include "MatchTypes.hpp"

#include <nlohmann/json.hpp>

namespace matching
{

// JSON rendering used by the command-line tool and by log consumers
nlohmann::json toJson(const MatchEvidence& evidence);
nlohmann::json toJson(const extract::LocationIntent& intent);
nlohmann::json toJson(const MatchResult& result);

} // namespace matching
