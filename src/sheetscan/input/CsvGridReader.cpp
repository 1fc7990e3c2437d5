#include "sheetscan/input/CsvGridReader.hpp"
#include "sheetscan/input/GridNormalizer.hpp"
#include "sheetscan/core/Exception.hpp"
#include "sheetscan/utils/CommonUtils.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace sheetscan {
namespace input {

std::vector<std::vector<std::string>> CsvGridReader::parseString(const std::string& content) const {
    std::vector<std::vector<std::string>> result;
    if (content.empty()) {
        return result;
    }

    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool row_has_content = false;

    auto finish_field = [&]() {
        row.push_back(options_.trim_whitespace ? utils::CommonUtils::trim(field) : field);
        field.clear();
    };
    auto finish_row = [&]() {
        finish_field();
        result.push_back(std::move(row));
        row.clear();
        row_has_content = false;
    };

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];

        if (in_quotes) {
            if (c == options_.quote_char) {
                if (i + 1 < content.size() && content[i + 1] == options_.quote_char) {
                    field += c;  // "" 转义
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == options_.quote_char) {
            in_quotes = true;
            row_has_content = true;
        } else if (c == options_.delimiter) {
            finish_field();
            row_has_content = true;
        } else if (c == '\r') {
            // 与后面的 \n 一起作为行结束
            if (i + 1 < content.size() && content[i + 1] == '\n') {
                ++i;
            }
            finish_row();
        } else if (c == '\n') {
            finish_row();
        } else {
            field += c;
            row_has_content = true;
        }
    }

    if (in_quotes) {
        INPUT_WARN("Unterminated quoted field at end of input");
    }
    // 最后一行没有换行符
    if (row_has_content || !field.empty() || !row.empty()) {
        finish_row();
    }

    return result;
}

core::CellValue CsvGridReader::inferValue(const std::string& field) const {
    if (!options_.infer_types) {
        return core::CellValue(field);
    }

    std::string trimmed = utils::CommonUtils::trim(field);
    if (trimmed.empty()) {
        return core::CellValue();
    }

    if (auto i = utils::CommonUtils::parseInteger(trimmed)) {
        return core::CellValue(static_cast<int64_t>(*i));
    }
    if (auto d = utils::CommonUtils::parseDouble(trimmed)) {
        return core::CellValue(*d);
    }

    std::string lower = utils::CommonUtils::toLower(trimmed);
    if (lower == "true") {
        return core::CellValue(true);
    }
    if (lower == "false") {
        return core::CellValue(false);
    }
    return core::CellValue(field);
}

core::Grid CsvGridReader::readString(const std::string& content, const std::string& sheet_name) const {
    auto fields = parseString(content);

    std::vector<std::vector<core::CellValue>> values;
    values.reserve(fields.size());
    for (const auto& row : fields) {
        std::vector<core::CellValue> value_row;
        value_row.reserve(row.size());
        for (const auto& f : row) {
            value_row.push_back(inferValue(f));
        }
        values.push_back(std::move(value_row));
    }

    SheetMeta meta;
    meta.name = sheet_name;
    // 空行同样占行号，所以边界按数据推导，行号与文件行一致
    return GridNormalizer::fromRows(values, meta);
}

core::Grid CsvGridReader::readFile(const std::string& path) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw core::FileException("CSV file does not exist", path,
                                  core::ErrorCode::FileNotFound, __FILE__, __LINE__);
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw core::FileException("Cannot open CSV file", path,
                                  core::ErrorCode::FileReadError, __FILE__, __LINE__);
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw core::FileException("Error while reading CSV file", path,
                                  core::ErrorCode::FileReadError, __FILE__, __LINE__);
    }

    std::string content = buffer.str();
    // UTF-8 BOM
    if (content.size() >= 3 && static_cast<unsigned char>(content[0]) == 0xEF &&
        static_cast<unsigned char>(content[1]) == 0xBB && static_cast<unsigned char>(content[2]) == 0xBF) {
        content.erase(0, 3);
    }

    std::string name = std::filesystem::path(path).stem().string();
    INPUT_INFO("Read {} bytes from {}", content.size(), path);
    return readString(content, name.empty() ? "Sheet1" : name);
}

}} // namespace sheetscan::input
