#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <limits>
#include <map>
#include <utility>

namespace replaylab {
namespace backtest {

namespace {
constexpr long long MS_PER_DAY = 86400000LL;

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

bool isNullToken(const std::string& cell) {
    if (cell.empty()) return true;
    const std::string lower = toLower(cell);
    return lower == "nan" || lower == "null" || lower == "na" || lower == "none";
}

std::optional<double> parseNumber(const std::string& cell) {
    if (isNullToken(cell)) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        const double value = std::stod(cell, &consumed);
        if (consumed != cell.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Canonical column name for a header cell, empty when not a bar field
std::string canonicalColumn(const std::string& header) {
    const std::string h = toLower(header);
    if (h == "timestamp" || h == "time" || h == "date" || h == "datetime" || h == "open_time") {
        return "timestamp";
    }
    if (h == "open" || h == "o") return "open";
    if (h == "high" || h == "h") return "high";
    if (h == "low" || h == "l") return "low";
    if (h == "close" || h == "c") return "close";
    if (h == "volume" || h == "v") return "volume";
    return std::string();
}

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::stringstream ss(line);
    std::string cell;
    std::vector<std::string> row;
    while (std::getline(ss, cell, ',')) {
        row.push_back(normalizeCell(cell));
    }
    // A trailing comma means one more, empty, cell
    if (!line.empty() && line.back() == ',') {
        row.emplace_back();
    }
    return row;
}

std::optional<double> jsonNumber(const nlohmann::json& item, const char* key, const char* alias) {
    const nlohmann::json* value = nullptr;
    if (item.contains(key)) value = &item[key];
    else if (item.contains(alias)) value = &item[alias];
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (value->is_number()) {
        return value->get<double>();
    }
    if (value->is_string()) {
        return parseNumber(trim(value->get<std::string>()));
    }
    return std::nullopt;
}

std::optional<TimestampMs> jsonTimestamp(const nlohmann::json& item) {
    const nlohmann::json* value = nullptr;
    if (item.contains("timestamp")) value = &item["timestamp"];
    else if (item.contains("t")) value = &item["t"];
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (value->is_number_integer()) {
        return utils::TimeUtils::toMsTimestamp(value->get<long long>());
    }
    if (value->is_number()) {
        return utils::TimeUtils::toMsTimestamp(static_cast<long long>(value->get<double>()));
    }
    if (value->is_string()) {
        return utils::TimeUtils::parseTimestamp(trim(value->get<std::string>()));
    }
    return std::nullopt;
}

bool jsonHasField(const nlohmann::json& item, const char* key, const char* alias) {
    return item.contains(key) || item.contains(alias);
}
} // namespace

BarTable DataHistory::loadCSV(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        throw DataIoError("failed to open CSV file: " + file_path);
    }

    BarTable table;
    // column name -> cell index
    std::map<std::string, size_t> layout;
    bool layout_known = false;
    std::string line;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) continue;

        const auto row = splitCsvLine(line);

        if (!layout_known) {
            layout_known = true;
            const std::string first = row.empty() ? std::string() : row[0];
            const bool header = !first.empty() &&
                !std::isdigit(static_cast<unsigned char>(first[0])) && first[0] != '-';
            if (header) {
                for (size_t i = 0; i < row.size(); ++i) {
                    const std::string name = canonicalColumn(row[i]);
                    if (!name.empty() && layout.count(name) == 0) {
                        layout[name] = i;
                    }
                }
                for (const auto& kv : layout) {
                    if (kv.first != "timestamp") {
                        table.columns[kv.first];
                    }
                }
                continue;
            }
            // No header: timestamp, open, high, low, close, volume
            layout = {{"timestamp", 0}, {"open", 1}, {"high", 2}, {"low", 3}, {"close", 4}, {"volume", 5}};
            for (const auto& name : BarTable::requiredColumns()) {
                table.columns[name];
            }
        }

        auto cellAt = [&](size_t index) -> std::string {
            return index < row.size() ? row[index] : std::string();
        };

        const auto ts_it = layout.find("timestamp");
        if (ts_it == layout.end()) {
            table.timestamps.push_back(std::nullopt);
        } else {
            const std::string ts_cell = cellAt(ts_it->second);
            std::optional<TimestampMs> ts;
            if (!isNullToken(ts_cell)) {
                ts = utils::TimeUtils::parseTimestamp(ts_cell);
            }
            if (!ts && !isNullToken(ts_cell)) {
                LOG_WARN("Unparseable timestamp '{}' at line {} of {}", ts_cell, line_no, file_path);
            }
            table.timestamps.push_back(ts);
        }

        for (auto& column : table.columns) {
            const std::string cell = cellAt(layout.at(column.first));
            auto value = parseNumber(cell);
            if (!value && !isNullToken(cell)) {
                LOG_WARN("Unparseable {} value '{}' at line {} of {}", column.first, cell, line_no, file_path);
            }
            column.second.push_back(value);
        }
    }

    LOG_INFO("Loaded {} bars from {}", table.rows(), file_path);
    return table;
}

BarTable DataHistory::loadJSON(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        throw DataIoError("failed to open JSON file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        throw DataIoError("malformed JSON file " + file_path + ": " + e.what());
    }
    if (!j.is_array()) {
        throw DataIoError("JSON bar file must hold an array: " + file_path);
    }

    struct FieldSpec {
        const char* name;
        const char* alias;
    };
    static const FieldSpec fields[] = {
        {"open", "o"}, {"high", "h"}, {"low", "l"}, {"close", "c"}, {"volume", "v"}
    };

    BarTable table;
    std::map<std::string, bool> seen;
    std::map<std::string, std::vector<std::optional<double>>> values;

    for (const auto& item : j) {
        if (!item.is_object()) {
            throw DataIoError("JSON bar entries must be objects: " + file_path);
        }
        table.timestamps.push_back(jsonTimestamp(item));
        for (const auto& f : fields) {
            if (jsonHasField(item, f.name, f.alias)) {
                seen[f.name] = true;
            }
            values[f.name].push_back(jsonNumber(item, f.name, f.alias));
        }
    }

    // A field no object carries is a missing column, not a column of gaps
    for (const auto& f : fields) {
        if (seen[f.name] || table.rows() == 0) {
            table.columns[f.name] = std::move(values[f.name]);
        }
    }

    LOG_INFO("Loaded {} bars from {}", table.rows(), file_path);
    return table;
}

BarTable DataHistory::load(const std::string& file_path) {
    const std::string lower = toLower(file_path);
    if (lower.size() >= 5 && lower.compare(lower.size() - 5, 5, ".json") == 0) {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

BarTable DataHistory::filterByDate(const BarTable& table,
                                   const std::string& start_date,
                                   const std::string& end_date) {
    TimestampMs lower = std::numeric_limits<TimestampMs>::min();
    TimestampMs upper = std::numeric_limits<TimestampMs>::max();

    if (!trim(start_date).empty()) {
        const auto parsed = utils::TimeUtils::parseIso8601(trim(start_date));
        if (!parsed) {
            throw ConfigurationError("start", "invalid start date: " + start_date);
        }
        lower = *parsed;
    }
    if (!trim(end_date).empty()) {
        const std::string end = trim(end_date);
        const auto parsed = utils::TimeUtils::parseIso8601(end);
        if (!parsed) {
            throw ConfigurationError("end", "invalid end date: " + end_date);
        }
        upper = (end.size() == 10) ? (*parsed + MS_PER_DAY - 1) : *parsed;
    }

    BarTable out;
    for (const auto& column : table.columns) {
        out.columns[column.first];
    }

    for (size_t row = 0; row < table.rows(); ++row) {
        const auto& ts = table.timestamps[row];
        // Rows without a timestamp are kept so validation can report them
        if (ts && (*ts < lower || *ts > upper)) {
            continue;
        }
        out.timestamps.push_back(ts);
        for (const auto& column : table.columns) {
            const auto& cells = column.second;
            out.columns[column.first].push_back(row < cells.size() ? cells[row] : std::nullopt);
        }
    }

    LOG_INFO("Date filter [{}, {}] kept {} of {} bars",
             start_date.empty() ? "-" : start_date, end_date.empty() ? "-" : end_date,
             out.rows(), table.rows());
    return out;
}

} // namespace backtest
} // namespace replaylab
