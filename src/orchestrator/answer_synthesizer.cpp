#include "orchestrator/answer_synthesizer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlrag {

std::string AnswerSynthesizer::subject_for(const Query& query) {
    const auto it = query.entities.find(entity::kTableHint);
    if (it == query.entities.end() || it->second.empty()) {
        return "matching records";
    }
    auto subject = it->second.front();
    std::replace(subject.begin(), subject.end(), '_', ' ');
    return subject;
}

std::string AnswerSynthesizer::humanize(const std::string& column) {
    auto name = utils::to_lower(column);
    std::replace(name.begin(), name.end(), '_', ' ');
    if (name == "count" || name == "?column?") {
        return "result";
    }
    return name;
}

std::string AnswerSynthesizer::synthesize(const Query& query,
                                          const ExecutionResult& result,
                                          const std::vector<std::string>& warnings) {
    std::string answer;
    const bool scalar = result.rows.size() == 1 && result.column_names.size() == 1 &&
                        !result.rows.front().empty();

    if (result.rows.empty()) {
        answer = "No matching records were found.";
    } else if (scalar && query.intent == IntentKind::COUNT) {
        const auto& value = result.rows.front().front();
        answer = value == "1"
            ? std::format("There is 1 {}.", subject_for(query))
            : std::format("There are {} {}.", value, subject_for(query));
    } else if (scalar) {
        answer = std::format("The {} is {}.",
            humanize(result.column_names.front()), result.rows.front().front());
    } else {
        answer = result.rows.size() == 1
            ? std::string("Found 1 row.")
            : std::format("Found {} rows.", result.rows.size());
        if (!result.complete) {
            if (result.estimated_total_rows) {
                answer += std::format(" Showing the first {} of about {}.",
                    result.rows.size(), *result.estimated_total_rows);
            } else {
                answer += std::format(" Showing the first {}; more rows exist.", result.rows.size());
            }
        }
    }

    for (const auto& w : warnings) {
        answer += std::format("\nNote: {}", w);
    }
    return answer;
}

} // namespace sqlrag
