/**
 * @file Question.hpp
 * @brief Open question about an entity, answered in a later batch or dropped.
 */

#pragma once
#include <optional>
#include <string>

namespace casegraph::domain {

/**
 * @struct Question
 * @brief answered == true implies a non-empty answer.
 */
struct Question {
    std::string id;
    std::optional<std::string> subjectId;
    std::string text;
    bool answered = false;
    std::optional<std::string> answer;
    std::string sourceCaseId;
    std::optional<std::string> answeredInCaseId;

    bool operator==(const Question& o) const {
        return id == o.id && subjectId == o.subjectId && text == o.text && answered == o.answered &&
               answer == o.answer && sourceCaseId == o.sourceCaseId && answeredInCaseId == o.answeredInCaseId;
    }
    bool operator!=(const Question& o) const { return !(*this == o); }
};

} // namespace casegraph::domain
