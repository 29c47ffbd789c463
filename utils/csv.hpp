// utils/csv.hpp
#pragma once
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace utils
{

    // Splits one CSV line. Quoted fields may hold commas and "" escapes.
    inline std::vector<std::string> split_csv_line(const std::string &line)
    {
        std::vector<std::string> fields(1);
        bool quoted = false;

        for (size_t i = 0; i < line.size(); ++i)
        {
            const char c = line[i];
            std::string &cur = fields.back();

            if (c == '"' && quoted && i + 1 < line.size() && line[i + 1] == '"')
            {
                cur.push_back('"');
                ++i;
            }
            else if (c == '"')
            {
                quoted = !quoted;
            }
            else if (c == ',' && !quoted)
            {
                fields.emplace_back();
            }
            else
            {
                cur.push_back(c);
            }
        }
        return fields;
    }

    // Always quotes; embedded quotes are doubled
    inline std::string csv_quote(const std::string &s)
    {
        std::string out;
        out.reserve(s.size() + 2);
        out.push_back('"');
        for (char c : s)
        {
            if (c == '"')
                out.push_back('"');
            out.push_back(c);
        }
        out.push_back('"');
        return out;
    }

    // Empty, "n/a" or non-numeric cell = unknown
    inline std::optional<int> parse_opt_int(const std::string &s)
    {
        if (s.empty() || s == "n/a")
            return std::nullopt;
        errno = 0;
        char *end = nullptr;
        const long v = std::strtol(s.c_str(), &end, 10);
        if (errno != 0 || end == s.c_str() || *end != '\0')
            return std::nullopt;
        return static_cast<int>(v);
    }

    struct CsvRow
    {
        size_t line_no = 0;               // 1-based line in the file
        std::vector<std::string> cells;   // trimmed, padded to the header width
    };

    /**
     * CsvReader - Header-addressed reader for recorded telemetry.
     *
     * The first non-blank, non-'#' line is the header. Later lines are
     * returned as CsvRow; cells are looked up by column name.
     */
    class CsvReader
    {
    public:
        CsvReader() = default;

        bool open(const std::string &path)
        {
            file_.open(path);
            if (!file_.is_open())
                return false;

            line_no_ = 0;
            columns_.clear();

            std::string line;
            if (!next_line_(line))
                return false;

            const auto names = split_csv_line(line);
            for (size_t i = 0; i < names.size(); ++i)
                columns_[trimmed_(names[i])] = i;
            width_ = names.size();
            return true;
        }

        bool next(CsvRow &row)
        {
            std::string line;
            if (!file_.is_open() || !next_line_(line))
                return false;

            row.line_no = line_no_;
            row.cells = split_csv_line(line);
            for (auto &cell : row.cells)
                cell = trimmed_(cell);
            if (row.cells.size() < width_)
                row.cells.resize(width_);
            return true;
        }

        bool has_column(const std::string &name) const
        {
            return columns_.count(name) != 0;
        }

        // Missing column or short row reads as an empty cell
        std::string cell(const CsvRow &row, const std::string &name) const
        {
            auto it = columns_.find(name);
            if (it == columns_.end() || it->second >= row.cells.size())
                return "";
            return row.cells[it->second];
        }

        std::optional<int> int_cell(const CsvRow &row, const std::string &name) const
        {
            return parse_opt_int(cell(row, name));
        }

    private:
        bool next_line_(std::string &line)
        {
            while (std::getline(file_, line))
            {
                ++line_no_;
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                const std::string t = trimmed_(line);
                if (t.empty() || t[0] == '#')
                    continue;
                return true;
            }
            return false;
        }

        static std::string trimmed_(const std::string &s)
        {
            size_t b = 0;
            size_t e = s.size();
            while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
                ++b;
            while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
                --e;
            return s.substr(b, e - b);
        }

        std::ifstream file_;
        std::unordered_map<std::string, size_t> columns_;
        size_t width_ = 0;
        size_t line_no_ = 0;
    };

} // namespace utils
