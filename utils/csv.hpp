// utils/csv.hpp
#pragma once
#include <cctype>
#include <fstream>
#include <iomanip>
#include <string>
#include <unordered_map>
#include <vector>

namespace utils
{

    // Minimal CSV reader with:
    // - header → column index
    // - quoted fields
    // - comment / blank skipping
    class CsvReader
    {
    public:
        CsvReader() = default;

        bool open(const std::string &path)
        {
            file_.open(path);
            if (!file_.is_open())
                return false;

            header_.clear();
            col_index_.clear();

            line_no_ = 0;
            std::string line;
            while (std::getline(file_, line))
            {
                ++line_no_;
                if (is_blank(line) || line[0] == '#')
                    continue;
                header_ = parse_line(line);
                break;
            }
            if (header_.empty())
                return false;

            for (size_t i = 0; i < header_.size(); ++i)
            {
                trim_inplace(header_[i]);
                col_index_[header_[i]] = static_cast<int>(i);
            }
            return true;
        }

        // Line number of the last row returned by read_row() (1-based).
        size_t line_number() const { return line_no_; }

        bool read_row(std::vector<std::string> &out)
        {
            out.clear();
            if (!file_.is_open())
                return false;

            std::string line;
            while (std::getline(file_, line))
            {
                ++line_no_;
                if (is_blank(line))
                    continue;
                if (line[0] == '#')
                    continue;

                out = parse_line(line);
                if (out.size() < header_.size())
                    out.resize(header_.size());

                for (auto &cell : out)
                    trim_inplace(cell);

                return true;
            }
            return false;
        }

        int col(const std::string &name) const
        {
            auto it = col_index_.find(name);
            if (it == col_index_.end())
                return -1;
            return it->second;
        }

        std::string get(const std::vector<std::string> &row,
                        const std::string &col_name) const
        {
            int idx = col(col_name);
            if (idx < 0 || static_cast<size_t>(idx) >= row.size())
                return "";
            return row[static_cast<size_t>(idx)];
        }

        static long to_long(const std::string &s, long default_val = 0)
        {
            if (s.empty())
                return default_val;
            return std::stol(s);
        }

        static double to_double(const std::string &s, double default_val = 0.0)
        {
            if (s.empty())
                return default_val;
            return std::stod(s);
        }

    private:
        static bool is_blank(const std::string &s)
        {
            for (char c : s)
                if (!std::isspace(static_cast<unsigned char>(c)))
                    return false;
            return true;
        }

        static void trim_inplace(std::string &s)
        {
            size_t b = 0;
            while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
                b++;
            size_t e = s.size();
            while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
                e--;
            s = s.substr(b, e - b);
        }

        static std::vector<std::string> parse_line(const std::string &line)
        {
            std::vector<std::string> fields;
            std::string cur;
            cur.reserve(line.size());

            bool in_quotes = false;
            for (size_t i = 0; i < line.size(); ++i)
            {
                char c = line[i];

                if (in_quotes)
                {
                    if (c == '"')
                    {
                        if (i + 1 < line.size() && line[i + 1] == '"')
                        {
                            cur.push_back('"');
                            ++i;
                        }
                        else
                        {
                            in_quotes = false;
                        }
                    }
                    else
                    {
                        cur.push_back(c);
                    }
                }
                else if (c == '"')
                {
                    in_quotes = true;
                }
                else if (c == ',')
                {
                    fields.push_back(cur);
                    cur.clear();
                }
                else
                {
                    cur.push_back(c);
                }
            }
            fields.push_back(cur);
            return fields;
        }

    private:
        std::ifstream file_;
        std::vector<std::string> header_;
        std::unordered_map<std::string, int> col_index_;
        size_t line_no_ = 0;
    };

    // Row-at-a-time CSV writer. Numbers are written fixed with 6 decimals,
    // strings are quoted only when they contain a separator or quote.
    class CsvWriter
    {
    public:
        CsvWriter() = default;

        bool open(const std::string &path, const std::vector<std::string> &header)
        {
            file_.open(path, std::ios::out | std::ios::trunc);
            if (!file_.is_open())
                return false;

            file_ << std::fixed << std::setprecision(6);
            for (const auto &h : header)
                cell(h);
            end_row();
            return true;
        }

        bool is_open() const { return file_.is_open(); }

        CsvWriter &cell(double v)
        {
            sep();
            file_ << v;
            return *this;
        }

        CsvWriter &cell(long v)
        {
            sep();
            file_ << v;
            return *this;
        }

        CsvWriter &cell(const std::string &v)
        {
            sep();
            if (v.find_first_of(",\"\n") == std::string::npos)
            {
                file_ << v;
                return *this;
            }
            file_ << '"';
            for (char c : v)
            {
                if (c == '"')
                    file_ << '"';
                file_ << c;
            }
            file_ << '"';
            return *this;
        }

        void end_row()
        {
            file_ << '\n';
            first_ = true;
        }

        void flush() { file_.flush(); }

        void close()
        {
            if (file_.is_open())
                file_.close();
        }

    private:
        void sep()
        {
            if (!first_)
                file_ << ',';
            first_ = false;
        }

        std::ofstream file_;
        bool first_ = true;
    };

} // namespace utils
