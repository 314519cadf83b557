// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <ember/core/types/document.hpp>
#include <ember/core/types/timestamp.hpp>
#include <ember/core/types/value.hpp>

// Proto3 JSON mapping of values and documents, used for fixtures and tool output.
// Malformed input raises StatusException with INVALID_ARGUMENT.
namespace ember {

void to_json(nlohmann::json& json, const Timestamp& ts);
void from_json(const nlohmann::json& json, Timestamp& ts);

void to_json(nlohmann::json& json, const Value& value);
void from_json(const nlohmann::json& json, Value& value);

void to_json(nlohmann::json& json, const MapValue& map);
void from_json(const nlohmann::json& json, MapValue& map);

void to_json(nlohmann::json& json, const Document& document);
void from_json(const nlohmann::json& json, Document& document);

}  // namespace ember
