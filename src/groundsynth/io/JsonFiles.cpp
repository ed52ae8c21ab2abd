#include "io/JsonFiles.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <string>

namespace GS {
namespace {

auto openForWrite(std::filesystem::path const& path, std::ofstream& out) -> Expected<void> {
    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
        return std::unexpected(makeError(Error::Code::IoError, "cannot create " + path.parent_path().string() + ": " + ec.message()));
    out.open(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return std::unexpected(makeError(Error::Code::IoError, "cannot open " + path.string() + " for writing"));
    return {};
}

} // namespace

auto writeJsonLines(std::filesystem::path const& path, std::vector<nlohmann::json> const& records) -> Expected<void> {
    std::ofstream out;
    if (auto opened = openForWrite(path, out); !opened)
        return opened;
    for (auto const& record : records)
        out << record.dump() << '\n';
    out.flush();
    if (!out)
        return std::unexpected(makeError(Error::Code::IoError, "failed writing " + path.string()));
    return {};
}

auto readJsonLines(std::filesystem::path const& path) -> Expected<std::vector<nlohmann::json>> {
    std::ifstream input(path, std::ios::binary);
    if (!input)
        return std::unexpected(makeError(Error::Code::NotFound, "cannot open " + path.string()));

    std::vector<nlohmann::json> records;
    std::string                 line;
    std::size_t                 lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (line.empty())
            continue;
        auto json = nlohmann::json::parse(line, nullptr, false);
        if (json.is_discarded()) {
            return std::unexpected(makeError(Error::Code::MalformedInput,
                                             path.string() + ":" + std::to_string(lineNumber) + " is not valid JSON"));
        }
        records.push_back(std::move(json));
    }
    return records;
}

auto writeJsonFile(std::filesystem::path const& path, nlohmann::json const& document) -> Expected<void> {
    std::ofstream out;
    if (auto opened = openForWrite(path, out); !opened)
        return opened;
    out << document.dump(2) << '\n';
    out.flush();
    if (!out)
        return std::unexpected(makeError(Error::Code::IoError, "failed writing " + path.string()));
    return {};
}

auto readJsonFile(std::filesystem::path const& path) -> Expected<nlohmann::json> {
    std::ifstream input(path, std::ios::binary);
    if (!input)
        return std::unexpected(makeError(Error::Code::NotFound, "cannot open " + path.string()));
    std::string payload{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    auto        json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded())
        return std::unexpected(makeError(Error::Code::MalformedInput, path.string() + " is not valid JSON"));
    return json;
}

auto readStringField(nlohmann::json const& node, std::string const& key, std::string fallback, Error::Code code)
        -> Expected<std::string> {
    auto it = node.find(key);
    if (it == node.end())
        return fallback;
    if (!it->is_string())
        return std::unexpected(makeError(code, "'" + key + "' must be a string, not " + it->type_name()));
    return it->get<std::string>();
}

auto readBoolField(nlohmann::json const& node, std::string const& key, bool fallback, Error::Code code) -> Expected<bool> {
    auto it = node.find(key);
    if (it == node.end())
        return fallback;
    if (!it->is_boolean())
        return std::unexpected(makeError(code, "'" + key + "' must be a boolean, not " + it->type_name()));
    return it->get<bool>();
}

auto jsonToInt(nlohmann::json const& value) -> std::optional<int> {
    if (value.is_number_unsigned()) {
        auto wide = value.get<std::uint64_t>();
        if (wide > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            return std::nullopt;
        return static_cast<int>(wide);
    }
    if (!value.is_number_integer())
        return std::nullopt;
    auto wide = value.get<std::int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max())
        return std::nullopt;
    return static_cast<int>(wide);
}

} // namespace GS
