//
// Created by Andrea on 18/10/2026.
//

#include "core/ingest/CsvReader.hpp"
#include "core/types/Error.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace core::ingest {
    namespace {
        std::string trim(const std::string &value) {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) return "";
            const auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, last - first + 1);
        }
    }

    void CsvHeader::assign(std::vector<std::string> columns) {
        names.clear();
        index.clear();
        for (auto &column: columns) {
            std::string name = trim(column);
            // First occurrence wins when an export repeats a column name
            index.emplace(name, names.size());
            names.push_back(std::move(name));
        }
    }

    std::optional<size_t> CsvHeader::columnOf(const std::string &name) const {
        auto it = index.find(name);
        if (it == index.end()) return std::nullopt;
        return it->second;
    }

    bool CsvRecord::hasColumn(const std::string &column) const {
        return header_.columnOf(column).has_value();
    }

    std::optional<std::string> CsvRecord::get(const std::string &column) const {
        auto position = header_.columnOf(column);
        if (!position) return std::nullopt;
        if (*position >= fields_.size()) return std::string();
        return fields_[*position];
    }

    CsvTable CsvReader::readFile(const std::string &filePath) {
        std::ifstream file(filePath, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            throw types::FileAccessException(filePath, std::strerror(errno));
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            throw types::FileAccessException(filePath, "read interrupted");
        }

        return parse(buffer.str());
    }

    CsvTable CsvReader::parse(const std::string &content) {
        CsvTable table;

        size_t pos = 0;
        if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            pos = 3;
        }

        std::vector<std::string> record;
        std::string field;
        bool inQuotes = false;
        bool recordOpen = false;

        auto finishRecord = [&]() {
            record.push_back(std::move(field));
            field.clear();
            if (!isBlankRecord(record)) {
                if (table.header.empty()) {
                    table.header.assign(std::move(record));
                } else {
                    table.rows.push_back(std::move(record));
                }
            }
            record.clear();
            recordOpen = false;
        };

        for (; pos < content.size(); ++pos) {
            const char c = content[pos];

            if (inQuotes) {
                if (c == '"') {
                    if (pos + 1 < content.size() && content[pos + 1] == '"') {
                        field.push_back('"');
                        ++pos;
                    } else {
                        inQuotes = false;
                    }
                } else {
                    field.push_back(c);
                }
                continue;
            }

            switch (c) {
                case '"':
                    inQuotes = true;
                    recordOpen = true;
                    break;
                case ',':
                    record.push_back(std::move(field));
                    field.clear();
                    recordOpen = true;
                    break;
                case '\r':
                    if (pos + 1 < content.size() && content[pos + 1] == '\n') {
                        break;
                    }
                    finishRecord();
                    break;
                case '\n':
                    finishRecord();
                    break;
                default:
                    field.push_back(c);
                    recordOpen = true;
                    break;
            }
        }

        if (inQuotes) {
            table.partialTail = true;
            return table;
        }

        if (recordOpen) {
            record.push_back(std::move(field));
            // No terminating newline yet: the writer may still be inside the last field
            if (!isBlankRecord(record)) {
                table.partialTail = true;
            }
        }

        return table;
    }

    bool CsvReader::isBlankRecord(const std::vector<std::string> &record) {
        for (const auto &value: record) {
            if (value.find_first_not_of(" \t") != std::string::npos) {
                return false;
            }
        }
        return true;
    }
} // namespace core::ingest
