/**
 * @file FuzzyDate.hpp
 * @brief Free-text date as extracted, with an optional parsed day number.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace casegraph::domain {

/**
 * @struct FuzzyDate
 * @brief Keeps the raw text of a date and, when recognizable, a sortable day number.
 *
 * Parsing never fails ingestion: text that is not a recognized date stays raw-only.
 */
struct FuzzyDate {
    std::string rawText;
    std::optional<int64_t> parsedDay; ///< Days since 1970-01-01 (first day of the period for partial dates).

    FuzzyDate() = default;

    /** @brief Builds a FuzzyDate from raw text, parsing it when possible. */
    static FuzzyDate FromText(const std::string& text);

    /**
     * @brief Parses YYYY-MM-DD, YYYY-MM, YYYY, "D Month YYYY" and "Month D, YYYY".
     * @return Day number, or nullopt if the text is not a recognized date.
     */
    static std::optional<int64_t> Parse(const std::string& text);

    bool empty() const { return rawText.empty(); }
    bool hasParsed() const { return parsedDay.has_value(); }

    bool operator==(const FuzzyDate& other) const {
        return rawText == other.rawText && parsedDay == other.parsedDay;
    }
    bool operator!=(const FuzzyDate& other) const { return !(*this == other); }
};

/** @brief Converts a civil date to days since the Unix epoch. */
int64_t DaysFromCivil(int year, unsigned month, unsigned day);

} // namespace casegraph::domain
