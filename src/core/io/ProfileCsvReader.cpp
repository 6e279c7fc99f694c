#include "ProfileCsvReader.hpp"
#include "mentor_match/errors.hpp"
#include "mentor_match/logging.hpp"
#include <boost/filesystem.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_map>

namespace mentor_match::io {

namespace {

std::string normalizeHeader(const std::string& header) {
    std::string out;
    bool pendingSpace = false;
    for (unsigned char c : header) {
        if (std::isspace(c) || c == '_' || c == '-') {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool isBlankRow(const std::vector<std::string>& row) {
    return std::all_of(row.begin(), row.end(), [](const std::string& cell) {
        return std::all_of(cell.begin(), cell.end(), [](unsigned char c) { return std::isspace(c); });
    });
}

} // namespace

const std::string& ProfileRecord::get(const std::string& field) const {
    static const std::string empty;
    const auto it = values.find(field);
    return it == values.end() ? empty : it->second;
}

std::string ProfileCsvReader::canonicalField(const std::string& header) {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"email", fields::EMAIL},
        {"email address", fields::EMAIL},
        {"e mail", fields::EMAIL},
        {"name", fields::NAME},
        {"full name", fields::NAME},
        {"pronouns", fields::PRONOUNS},
        {"program", fields::PROGRAM},
        {"term", fields::TERM},
        {"location", fields::LOCATION},
        {"city", fields::LOCATION},
        {"meeting preference", fields::MEETING_PREFERENCE},
        {"topics", fields::TOPICS},
        {"mentorship topics", fields::TOPICS},
        {"career topics", fields::CAREER_TOPICS},
        {"max mentees", fields::MAX_MENTEES},
        {"maximum mentees", fields::MAX_MENTEES},
        {"maximum number of mentees", fields::MAX_MENTEES},
        {"capacity", fields::MAX_MENTEES},
        {"tags", fields::TAGS},
        {"priority tags", fields::TAGS}
    };
    const auto it = aliases.find(normalizeHeader(header));
    return it == aliases.end() ? std::string() : it->second;
}

std::vector<std::string> ProfileCsvReader::requiredFields(ProfileRole role) {
    std::vector<std::string> required = {
        fields::EMAIL, fields::NAME, fields::PROGRAM, fields::TERM,
        fields::LOCATION, fields::MEETING_PREFERENCE, fields::TOPICS, fields::CAREER_TOPICS
    };
    if (role == ProfileRole::MENTOR) {
        required.push_back(fields::MAX_MENTEES);
    }
    return required;
}

CsvTable ProfileCsvReader::parseCsv(std::istream& input) {
    CsvTable table;
    std::vector<std::string> row;
    std::string cell;
    bool inQuotes = false;
    bool cellWasQuoted = false;
    int line = 1;
    int rowStart = 1;

    auto finishRow = [&]() {
        row.push_back(cell);
        cell.clear();
        cellWasQuoted = false;
        if (table.header.empty() && table.rows.empty()) {
            if (!isBlankRow(row)) {
                table.header = std::move(row);
            }
        } else if (!isBlankRow(row)) {
            table.rows.push_back(std::move(row));
            table.line_numbers.push_back(rowStart);
        }
        row.clear();
        rowStart = line;
    };

    char c;
    while (input.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (input.peek() == '"') {
                    input.get(c);
                    cell.push_back('"');
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') ++line;
                cell.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                if (cell.empty() && !cellWasQuoted) {
                    inQuotes = true;
                    cellWasQuoted = true;
                } else {
                    cell.push_back(c);
                }
                break;
            case ',':
                row.push_back(cell);
                cell.clear();
                cellWasQuoted = false;
                break;
            case '\r':
                break;
            case '\n':
                ++line;
                finishRow();
                break;
            default:
                cell.push_back(c);
                break;
        }
    }
    if (!cell.empty() || !row.empty() || cellWasQuoted) {
        finishRow();
    }

    // UTF-8 byte order mark from spreadsheet exports
    if (!table.header.empty() && table.header.front().rfind("\xEF\xBB\xBF", 0) == 0) {
        table.header.front().erase(0, 3);
    }
    return table;
}

std::vector<ProfileRecord> ProfileCsvReader::read(std::istream& input, const std::string& source, ProfileRole role) {
    const CsvTable table = parseCsv(input);
    if (table.header.empty()) {
        throw MalformedProfileError(source, 0, "", "file has no header row");
    }

    // Column index per canonical field; the first matching column wins
    std::map<std::string, size_t> columns;
    for (size_t c = 0; c < table.header.size(); ++c) {
        const auto field = canonicalField(table.header[c]);
        if (field.empty()) {
            continue;
        }
        if (field == fields::MAX_MENTEES && role == ProfileRole::MENTEE) {
            continue;
        }
        columns.emplace(field, c);
    }

    for (const auto& field : requiredFields(role)) {
        if (columns.count(field) == 0) {
            throw MalformedProfileError(source, 1, field, "missing required column");
        }
    }

    std::vector<ProfileRecord> records;
    records.reserve(table.rows.size());
    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        ProfileRecord record;
        record.source = source;
        record.row = table.line_numbers[r];
        for (const auto& [field, column] : columns) {
            record.values[field] = column < row.size() ? row[column] : std::string();
        }
        records.push_back(std::move(record));
    }

    LOG_DEBUG("Read " + std::to_string(records.size()) + " " + toString(role) + " rows from " + source);
    return records;
}

std::vector<ProfileRecord> ProfileCsvReader::readFile(const std::string& path, ProfileRole role) {
    namespace fs = boost::filesystem;

    if (!fs::exists(path) || !fs::is_regular_file(path)) {
        throw MalformedProfileError(path, 0, "", "CSV file does not exist");
    }

    std::ifstream file(path);
    if (!file) {
        throw MalformedProfileError(path, 0, "", "CSV file cannot be opened");
    }

    const std::string source = fs::path(path).filename().string();
    return read(file, source, role);
}

} // namespace mentor_match::io
