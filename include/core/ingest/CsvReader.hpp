//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace core::ingest {
    struct CsvHeader {
        std::vector<std::string> names;
        std::unordered_map<std::string, size_t> index;

        void assign(std::vector<std::string> columns);

        std::optional<size_t> columnOf(const std::string &name) const;

        bool empty() const { return names.empty(); }
    };

    /**
     * @brief Read-only view of one data record, addressed by header column name
     */
    class CsvRecord {
    public:
        CsvRecord(const CsvHeader &header, const std::vector<std::string> &fields)
            : header_(header), fields_(fields) {
        }

        bool hasColumn(const std::string &column) const;

        /**
         * @brief Field value, empty string when the record is shorter than the header,
         * nullopt when the header has no such column
         */
        std::optional<std::string> get(const std::string &column) const;

        size_t fieldCount() const { return fields_.size(); }

    private:
        const CsvHeader &header_;
        const std::vector<std::string> &fields_;
    };

    struct CsvTable {
        CsvHeader header;
        std::vector<std::vector<std::string> > rows;
        bool partialTail = false; // trailing record without newline, not included in rows

        size_t rowCount() const { return rows.size(); }

        CsvRecord record(size_t row) const { return CsvRecord(header, rows.at(row)); }
    };

    class CsvReader {
    public:
        /**
         * @brief Read and parse a whole export file
         * @throws core::types::FileAccessException when the file cannot be opened or read
         */
        static CsvTable readFile(const std::string &filePath);

        static CsvTable parse(const std::string &content);

    private:
        static bool isBlankRecord(const std::vector<std::string> &record);
    };
} // namespace core::ingest
