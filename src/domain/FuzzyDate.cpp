/**
 * @file FuzzyDate.cpp
 * @brief Implementation of FuzzyDate parsing.
 */

#include "domain/FuzzyDate.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <vector>

namespace casegraph::domain {

namespace {

const std::array<const char*, 12> kMonthNames = {
    "january", "february", "march", "april", "may", "june",
    "july", "august", "september", "october", "november", "december"
};

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool AllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Accepts full names and 3-letter abbreviations ("Mar", "Mar.").
std::optional<unsigned> MonthFromName(std::string token) {
    token = ToLower(token);
    while (!token.empty() && (token.back() == '.' || token.back() == ',')) token.pop_back();
    if (token.size() < 3) return std::nullopt;
    for (size_t i = 0; i < kMonthNames.size(); ++i) {
        std::string name = kMonthNames[i];
        if (token == name || (token.size() == 3 && name.compare(0, 3, token) == 0)) {
            return static_cast<unsigned>(i + 1);
        }
    }
    return std::nullopt;
}

bool IsLeap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool ValidDay(int year, unsigned month, unsigned day) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12 || day < 1) return false;
    unsigned limit = kDays[month - 1] + ((month == 2 && IsLeap(year)) ? 1 : 0);
    return day <= limit;
}

std::optional<int64_t> Make(int year, unsigned month, unsigned day) {
    if (year < 1 || year > 9999 || !ValidDay(year, month, day)) return std::nullopt;
    return DaysFromCivil(year, month, day);
}

std::optional<int64_t> ParseIso(const std::string& text) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, '-')) parts.push_back(part);

    if (parts.empty() || parts.size() > 3) return std::nullopt;
    for (const auto& p : parts) {
        if (!AllDigits(p)) return std::nullopt;
    }
    if (parts[0].size() != 4) return std::nullopt;

    int year = std::stoi(parts[0]);
    unsigned month = parts.size() > 1 ? static_cast<unsigned>(std::stoi(parts[1])) : 1;
    unsigned day = parts.size() > 2 ? static_cast<unsigned>(std::stoi(parts[2])) : 1;
    if (parts.size() > 1 && parts[1].size() > 2) return std::nullopt;
    if (parts.size() > 2 && parts[2].size() > 2) return std::nullopt;
    return Make(year, month, day);
}

std::optional<int64_t> ParseWords(const std::string& text) {
    std::vector<std::string> tokens;
    std::stringstream ss(text);
    std::string token;
    while (ss >> token) tokens.push_back(token);
    if (tokens.size() != 3) return std::nullopt;

    auto stripComma = [](std::string t) {
        while (!t.empty() && t.back() == ',') t.pop_back();
        return t;
    };

    // "1 March 2020"
    std::string d = stripComma(tokens[0]);
    std::string y = stripComma(tokens[2]);
    if (AllDigits(d) && d.size() <= 2 && AllDigits(y) && y.size() == 4) {
        if (auto month = MonthFromName(tokens[1])) {
            return Make(std::stoi(y), *month, static_cast<unsigned>(std::stoi(d)));
        }
    }

    // "March 1, 2020"
    d = stripComma(tokens[1]);
    if (AllDigits(d) && d.size() <= 2 && AllDigits(y) && y.size() == 4) {
        if (auto month = MonthFromName(tokens[0])) {
            return Make(std::stoi(y), *month, static_cast<unsigned>(std::stoi(d)));
        }
    }
    return std::nullopt;
}

} // namespace

int64_t DaysFromCivil(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

std::optional<int64_t> FuzzyDate::Parse(const std::string& text) {
    std::string trimmed = text;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
    size_t end = trimmed.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return std::nullopt;
    trimmed.erase(end + 1);

    if (auto iso = ParseIso(trimmed)) return iso;
    return ParseWords(trimmed);
}

FuzzyDate FuzzyDate::FromText(const std::string& text) {
    FuzzyDate date;
    date.rawText = text;
    date.parsedDay = Parse(text);
    return date;
}

} // namespace casegraph::domain
