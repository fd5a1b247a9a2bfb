#pragma once

/// @file report_json.h
/// @brief JSON rendering of analysis and sanitization results

#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "detection/signal.h"
#include "detection/types.h"
#include "sanitize/sanitization_engine.h"

namespace ipishield {

nlohmann::json ToJson(const detection::FlaggedSegment& segment);
nlohmann::json ToJson(const detection::SignalResult& result);
nlohmann::json ToJson(const detection::CompositeScore& score);
nlohmann::json ToJson(const detection::AnalysisReport& report);

/// @brief Sanitization outcome; the embedded reports are summarised by score
nlohmann::json ToJson(const sanitize::SanitizationResult& result);

nlohmann::json HealthToJson(const std::map<std::string, detection::Availability>& health);

}  // namespace ipishield
