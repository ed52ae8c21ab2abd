#pragma once

#include "core/Error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace GS {

// One compact JSON document per line, '\n' terminated.
auto writeJsonLines(std::filesystem::path const& path, std::vector<nlohmann::json> const& records) -> Expected<void>;
auto readJsonLines(std::filesystem::path const& path) -> Expected<std::vector<nlohmann::json>>;

// Pretty-printed with two-space indent and a trailing newline.
auto writeJsonFile(std::filesystem::path const& path, nlohmann::json const& document) -> Expected<void>;
auto readJsonFile(std::filesystem::path const& path) -> Expected<nlohmann::json>;

// Typed member lookups. A missing member yields `fallback`, a member of any
// other JSON type is reported with `code` and never thrown.
auto readStringField(nlohmann::json const& node, std::string const& key, std::string fallback, Error::Code code)
        -> Expected<std::string>;
auto readBoolField(nlohmann::json const& node, std::string const& key, bool fallback, Error::Code code) -> Expected<bool>;

// nullopt for non-integers and for integers that do not fit in an int.
auto jsonToInt(nlohmann::json const& value) -> std::optional<int>;

} // namespace GS
