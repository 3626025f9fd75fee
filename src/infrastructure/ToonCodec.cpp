#include "infrastructure/ToonCodec.hpp"

#include <cctype>
#include <set>
#include <sstream>

namespace casegraph::infrastructure {

namespace {

bool isValidTableName(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        const auto u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '_' && c != '.' && c != '-') return false;
    }
    return true;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : text) {
        if (c == '\n') {
            if (!current.empty() && current.back() == '\r') current.pop_back();
            lines.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        if (current.back() == '\r') current.pop_back();
        lines.push_back(current);
    }
    return lines;
}

} // namespace

std::string ToonCodec::EscapeValue(const ToonValue& value) {
    if (!value) return std::string(1, kNullToken);
    std::string out;
    out.reserve(value->size() + 2);
    for (size_t i = 0; i < value->size(); ++i) {
        const char c = (*value)[i];
        switch (c) {
            case '\\': out += "\\\\"; break;
            case kDelimiter: out += "\\,"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case kNullToken:
                if (i == 0) out += "\\~";
                else out.push_back(c);
                break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string ToonCodec::escapeName(const std::string& name) {
    std::string out;
    for (char c : name) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case kDelimiter: out += "\\,"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case ':': out += "\\:"; break;
            case '{': out += "\\{"; break;
            case '}': out += "\\}"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string ToonCodec::unescape(const std::string& token, size_t line) {
    std::string out;
    out.reserve(token.size());
    for (size_t i = 0; i < token.size(); ++i) {
        const char c = token[i];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (i + 1 >= token.size()) {
            throw ToonParseError(line, "dangling escape");
        }
        const char next = token[++i];
        switch (next) {
            case '\\': out.push_back('\\'); break;
            case ',': out.push_back(','); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case ':': out.push_back(':'); break;
            case '{': out.push_back('{'); break;
            case '}': out.push_back('}'); break;
            case '~': out.push_back('~'); break;
            default:
                throw ToonParseError(line, std::string("unknown escape \\") + next);
        }
    }
    return out;
}

ToonValue ToonCodec::UnescapeValue(const std::string& token, size_t line) {
    if (token.size() == 1 && token[0] == kNullToken) return std::nullopt;
    return unescape(token, line);
}

std::vector<std::string> ToonCodec::splitUnescaped(const std::string& line, char separator, size_t maxParts) {
    std::vector<std::string> parts;
    std::string current;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            current.push_back(c);
            current.push_back(line[++i]);
            continue;
        }
        if (c == separator && (maxParts == 0 || parts.size() + 1 < maxParts)) {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    parts.push_back(current);
    return parts;
}

std::string ToonCodec::JoinList(const std::vector<std::string>& items) {
    std::string out;
    bool first = true;
    for (const auto& item : items) {
        if (item.empty()) continue;
        if (!first) out.push_back(kListSeparator);
        first = false;
        for (char c : item) {
            if (c == '\\' || c == kListSeparator) out.push_back('\\');
            out.push_back(c);
        }
    }
    return out;
}

std::vector<std::string> ToonCodec::SplitList(const std::string& joined) {
    std::vector<std::string> items;
    if (joined.empty()) return items;
    std::string current;
    for (size_t i = 0; i < joined.size(); ++i) {
        const char c = joined[i];
        if (c == '\\' && i + 1 < joined.size()) {
            current.push_back(joined[++i]);
            continue;
        }
        if (c == kListSeparator) {
            if (!current.empty()) items.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) items.push_back(current);
    return items;
}

const ToonValue* ToonCodec::Find(const ToonRecord& record, const std::string& name) {
    for (const auto& field : record) {
        if (field.name == name) return &field.value;
    }
    return nullptr;
}

bool ToonCodec::HasUniformSchema(const ToonTable& table) {
    if (table.records.empty()) return true;
    const auto& first = table.records.front();
    for (const auto& record : table.records) {
        if (record.size() != first.size()) return false;
        for (size_t i = 0; i < record.size(); ++i) {
            if (record[i].name != first[i].name) return false;
        }
    }
    return true;
}

void ToonCodec::validate(const ToonTable& table) {
    if (!isValidTableName(table.name)) {
        throw std::invalid_argument("invalid TOON table name: '" + table.name + "'");
    }
    for (const auto& record : table.records) {
        std::set<std::string> names;
        for (const auto& field : record) {
            if (field.name.empty()) {
                throw std::invalid_argument("empty field name in table " + table.name);
            }
            if (!names.insert(field.name).second) {
                throw std::invalid_argument("duplicate field '" + field.name + "' in table " + table.name);
            }
        }
    }
}

std::string ToonCodec::EncodeTable(const ToonTable& table) {
    validate(table);
    std::ostringstream out;
    out << table.name << '[' << table.records.size() << ']';

    if (HasUniformSchema(table)) {
        out << '{';
        if (!table.records.empty()) {
            const auto& first = table.records.front();
            for (size_t i = 0; i < first.size(); ++i) {
                if (i) out << kDelimiter;
                out << escapeName(first[i].name);
            }
        }
        out << "}\n";
        for (const auto& record : table.records) {
            for (size_t i = 0; i < record.size(); ++i) {
                if (i) out << kDelimiter;
                out << EscapeValue(record[i].value);
            }
            out << '\n';
        }
        return out.str();
    }

    out << ":\n";
    for (const auto& record : table.records) {
        out << '-';
        if (!record.empty()) out << ' ';
        for (size_t i = 0; i < record.size(); ++i) {
            if (i) out << kDelimiter;
            out << escapeName(record[i].name) << ':' << EscapeValue(record[i].value);
        }
        out << '\n';
    }
    return out.str();
}

std::string ToonCodec::Encode(const std::vector<ToonTable>& tables, const std::string& headerComment) {
    std::string out;
    if (!headerComment.empty()) {
        std::string comment = headerComment;
        for (char& c : comment) {
            if (c == '\n' || c == '\r') c = ' ';
        }
        out += "# " + comment + "\n";
    }
    for (size_t i = 0; i < tables.size(); ++i) {
        if (i || !headerComment.empty()) out += "\n";
        out += EncodeTable(tables[i]);
    }
    return out;
}

std::vector<ToonTable> ToonCodec::Decode(const std::string& text) {
    const auto lines = splitLines(text);
    std::vector<ToonTable> tables;

    size_t i = 0;
    while (i < lines.size()) {
        const std::string& header = lines[i];
        const size_t headerLine = i + 1;
        ++i;
        if (header.empty() || header[0] == '#') continue;

        const auto open = header.find('[');
        const auto close = header.find(']', open == std::string::npos ? 0 : open);
        if (open == std::string::npos || close == std::string::npos) {
            throw ToonParseError(headerLine, "expected table header, got '" + header + "'");
        }

        ToonTable table;
        table.name = header.substr(0, open);
        if (!isValidTableName(table.name)) {
            throw ToonParseError(headerLine, "invalid table name '" + table.name + "'");
        }

        const std::string countText = header.substr(open + 1, close - open - 1);
        if (countText.empty() || countText.size() > 18) {
            throw ToonParseError(headerLine, "invalid record count '" + countText + "'");
        }
        for (char c : countText) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw ToonParseError(headerLine, "invalid record count '" + countText + "'");
            }
        }
        const size_t count = static_cast<size_t>(std::stoull(countText));
        const std::string rest = header.substr(close + 1);

        if (i + count > lines.size()) {
            throw ToonParseError(headerLine, "table " + table.name + " is truncated");
        }

        if (rest == ":") {
            for (size_t r = 0; r < count; ++r, ++i) {
                const std::string& row = lines[i];
                const size_t rowLine = i + 1;
                ToonRecord record;
                if (row == "-") {
                    table.records.push_back(record);
                    continue;
                }
                if (row.size() < 2 || row[0] != '-' || row[1] != ' ') {
                    throw ToonParseError(rowLine, "expected verbose record");
                }
                for (const auto& part : splitUnescaped(row.substr(2), kDelimiter)) {
                    const auto kv = splitUnescaped(part, ':', 2);
                    if (kv.size() != 2) {
                        throw ToonParseError(rowLine, "field without ':' separator");
                    }
                    record.push_back({unescape(kv[0], rowLine), UnescapeValue(kv[1], rowLine)});
                }
                table.records.push_back(std::move(record));
            }
        } else if (rest.size() >= 2 && rest.front() == '{' && rest.back() == '}') {
            const std::string fieldList = rest.substr(1, rest.size() - 2);
            std::vector<std::string> names;
            if (!fieldList.empty()) {
                for (const auto& token : splitUnescaped(fieldList, kDelimiter)) {
                    names.push_back(unescape(token, headerLine));
                }
            }
            for (size_t r = 0; r < count; ++r, ++i) {
                const std::string& row = lines[i];
                const size_t rowLine = i + 1;
                ToonRecord record;
                if (names.empty()) {
                    if (!row.empty()) throw ToonParseError(rowLine, "values in a table without fields");
                    table.records.push_back(record);
                    continue;
                }
                const auto values = splitUnescaped(row, kDelimiter);
                if (values.size() != names.size()) {
                    throw ToonParseError(rowLine, "expected " + std::to_string(names.size()) +
                                                      " values, got " + std::to_string(values.size()));
                }
                for (size_t f = 0; f < names.size(); ++f) {
                    record.push_back({names[f], UnescapeValue(values[f], rowLine)});
                }
                table.records.push_back(std::move(record));
            }
        } else {
            throw ToonParseError(headerLine, "malformed table header '" + header + "'");
        }

        tables.push_back(std::move(table));
    }
    return tables;
}

} // namespace casegraph::infrastructure
