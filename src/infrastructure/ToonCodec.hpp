/**
 * @file ToonCodec.hpp
 * @brief Deterministic tabular encoding (TOON) for sequences of flat records.
 *
 * Tabular form, used when every record shares the same ordered field list:
 * @code
 * Actors[2]{id,name,roles}
 * E1,John Smith,husband|applicant
 * E2,~,
 * @endcode
 * Verbose form, used otherwise, one record per line:
 * @code
 * Actors[2]:
 * - id:E1,name:John Smith
 * - id:E2,aliases:J. Smith
 * @endcode
 * A backslash escapes the delimiter, the record separator and itself; `~` is the
 * absent-value token, so an empty field is always the empty string.
 */

#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace casegraph::infrastructure {

/** @brief Absent values are nullopt. */
using ToonValue = std::optional<std::string>;

/** @brief One named field of a flat record. */
struct ToonField {
    std::string name;
    ToonValue value;

    bool operator==(const ToonField& o) const { return name == o.name && value == o.value; }
    bool operator!=(const ToonField& o) const { return !(*this == o); }
};

/** @brief Ordered fields; names are unique within a record. */
using ToonRecord = std::vector<ToonField>;

/** @brief A named sequence of records. */
struct ToonTable {
    std::string name;
    std::vector<ToonRecord> records;

    bool operator==(const ToonTable& o) const { return name == o.name && records == o.records; }
    bool operator!=(const ToonTable& o) const { return !(*this == o); }
};

/** @brief Malformed TOON input. */
class ToonParseError : public std::runtime_error {
public:
    ToonParseError(size_t line, const std::string& what)
        : std::runtime_error("line " + std::to_string(line) + ": " + what), m_line(line) {}
    size_t line() const { return m_line; }

private:
    size_t m_line;
};

/**
 * @class ToonCodec
 * @brief Pure encode/decode functions; no state, same input gives byte-identical output.
 */
class ToonCodec {
public:
    static constexpr char kDelimiter = ',';
    static constexpr char kListSeparator = '|';
    static constexpr char kNullToken = '~';

    /**
     * @brief Encodes tables in order, separated by a blank line.
     * @param headerComment Optional first line, emitted as "# <comment>".
     * @throws std::invalid_argument on an invalid table name or duplicate field names.
     */
    static std::string Encode(const std::vector<ToonTable>& tables, const std::string& headerComment = "");

    /** @brief Encodes a single table block (no trailing blank line). */
    static std::string EncodeTable(const ToonTable& table);

    /**
     * @brief Parses a document produced by Encode. Comment and blank lines between tables are skipped.
     * @throws ToonParseError on malformed input.
     */
    static std::vector<ToonTable> Decode(const std::string& text);

    /** @brief True if all records share one identical ordered field list. */
    static bool HasUniformSchema(const ToonTable& table);

    /** @brief Joins list items with '|', escaping separators inside items. Empty items are skipped. */
    static std::string JoinList(const std::vector<std::string>& items);

    /** @brief Inverse of JoinList. */
    static std::vector<std::string> SplitList(const std::string& joined);

    static std::string EscapeValue(const ToonValue& value);
    static ToonValue UnescapeValue(const std::string& token, size_t line = 0);

    /** @brief Looks up a field by name. */
    static const ToonValue* Find(const ToonRecord& record, const std::string& name);

private:
    static std::string escapeName(const std::string& name);
    static std::string unescape(const std::string& token, size_t line);
    static std::vector<std::string> splitUnescaped(const std::string& line, char separator, size_t maxParts = 0);
    static void validate(const ToonTable& table);
};

} // namespace casegraph::infrastructure
