#include "csv.hpp"

namespace fenrom {

std::optional<std::vector<std::string>> CsvReader::next()
{
    std::string line;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        std::vector<std::string> fields;
        std::string field;
        bool quoted = false;
        size_t i = 0;

        while (true) {
            if (i >= line.size()) {
                if (!quoted) break;
                // Quoted field continues on the next physical line
                std::string continuation;
                if (!std::getline(input, continuation)) break;
                ++lineNumber;
                if (!continuation.empty() && continuation.back() == '\r') continuation.pop_back();
                field.push_back('\n');
                line = std::move(continuation);
                i = 0;
                continue;
            }

            char c = line[i++];
            if (quoted) {
                if (c == '"') {
                    if (i < line.size() && line[i] == '"') {
                        field.push_back('"');
                        ++i;
                    } else {
                        quoted = false;
                    }
                } else {
                    field.push_back(c);
                }
            } else if (c == '"') {
                quoted = true;
            } else if (c == ',') {
                fields.push_back(std::move(field));
                field.clear();
            } else {
                field.push_back(c);
            }
        }
        fields.push_back(std::move(field));
        return fields;
    }
    return std::nullopt;
}

} // namespace fenrom
