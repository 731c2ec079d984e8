#include "intent/intent_analyzer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace sqlrag {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::optimize;

constexpr int kNoPatternPoints = 20;
constexpr int kDatePoints = 15;
constexpr int kScopePoints = 10;
constexpr int kQuestionPoints = 5;
constexpr int kLengthPoints = 5;
constexpr int kReferencePoints = 10;
constexpr size_t kMinWordsForLength = 4;

const std::regex& anaphora_regex() {
    static const std::regex re(R"(\b(those|them|these|that|same|their|they)\b)", kFlags);
    return re;
}

void add_entity(EntityMap& entities, const char* kind, std::string value) {
    auto& values = entities[kind];
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(std::move(value));
    }
}

void collect_matches(const std::string& text, const std::regex& re,
                     EntityMap& entities, const char* kind) {
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re);
         it != std::sregex_iterator(); ++it) {
        add_entity(entities, kind, it->str());
    }
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool contains_word(const std::string& text, const std::string& word) {
    size_t pos = text.find(word);
    while (pos != std::string::npos) {
        const bool left_ok = pos == 0 || !is_word_char(text[pos - 1]);
        const size_t end = pos + word.size();
        const bool right_ok = end >= text.size() || !is_word_char(text[end]);
        if (left_ok && right_ok) return true;
        pos = text.find(word, pos + 1);
    }
    return false;
}

bool ends_with(const std::string& s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string singular(const std::string& word) {
    if (ends_with(word, "ies") && word.size() > 3) return word.substr(0, word.size() - 3) + "y";
    if (ends_with(word, "ses") || ends_with(word, "xes") ||
        ends_with(word, "ches") || ends_with(word, "shes")) {
        return word.substr(0, word.size() - 2);
    }
    if (ends_with(word, "s") && !ends_with(word, "ss")) return word.substr(0, word.size() - 1);
    return word;
}

std::string plural(const std::string& word) {
    if (ends_with(word, "s") || ends_with(word, "x") ||
        ends_with(word, "ch") || ends_with(word, "sh")) {
        return word + "es";
    }
    if (ends_with(word, "y") && word.size() > 1 &&
        std::string_view("aeiou").find(word[word.size() - 2]) == std::string_view::npos) {
        return word.substr(0, word.size() - 1) + "ies";
    }
    return word + "s";
}

std::vector<std::string> word_forms(const std::string& table) {
    std::vector<std::string> forms;
    const auto add = [&forms](std::string f) {
        if (!f.empty() && std::find(forms.begin(), forms.end(), f) == forms.end()) {
            forms.push_back(std::move(f));
        }
    };

    const std::string lower = utils::to_lower(table);
    std::string spaced = lower;
    std::replace(spaced.begin(), spaced.end(), '_', ' ');

    for (const auto& base : {lower, spaced}) {
        add(base);
        if (const auto s = singular(base); s != base) {
            add(s);
        } else {
            add(plural(base));
        }
    }
    return forms;
}

} // anonymous namespace

IntentAnalyzer::IntentAnalyzer(Config config, std::vector<std::string> table_vocabulary)
    : config_(config),
      number_pattern_(R"(\b\d+(?:\.\d+)?\b)", kFlags),
      metric_pattern_(
          R"(\b(revenue|cost|costs|amount|price|prices|sales|income|spend|balance|salary|salaries|)"
          R"(quantity|duration|length of stay|rate|score|scores|count|total|average|volume)\b)",
          kFlags) {

    const auto intent = [this](IntentKind kind, int strength, const char* pattern) {
        intent_patterns_.push_back(IntentPattern{kind, strength, std::regex(pattern, kFlags)});
    };

    // Registration order breaks ties between equal strengths
    intent(IntentKind::COUNT, 60, R"(\bhow many\b|\bcount of\b|\bnumber of\b)");
    intent(IntentKind::COUNT, 50, R"(\bcount\b)");
    intent(IntentKind::COMPARISON, 60,
           R"(\bcompare\b|\bcompared\b|\bversus\b|\bvs\b|\bdifference between\b)");
    intent(IntentKind::TREND, 60, R"(\btrends?\b|\bover time\b)");
    intent(IntentKind::TREND, 50,
           R"(\b(by|per) (day|week|month|quarter|year)\b|\b(daily|weekly|monthly|quarterly|yearly)\b)");
    intent(IntentKind::AGGREGATE, 60, R"(\baverage\b|\bavg\b|\btotal\b|\bsum of\b)");
    intent(IntentKind::AGGREGATE, 50,
           R"(\bsum\b|\bmean\b|\b(maximum|minimum|highest|lowest|max|min)\b)");
    intent(IntentKind::LIST, 50, R"(^list\b|\blist (all|the|of)\b|\bwhich\b|\bwhat are\b|\btop \d+\b)");
    intent(IntentKind::LIST, 40, R"(\bshow me\b|\bgive me\b|\bdisplay\b)");
    intent(IntentKind::LOOKUP, 50, R"(\bwhat is\b|\bwho is\b|\bdetails (of|for)\b)");
    intent(IntentKind::LOOKUP, 40, R"(\bfind\b|\bget\b|\blook up\b)");

    for (const char* pattern : {
             R"(\b(today|yesterday|tomorrow|tonight)\b)",
             R"(\b(this|last|next|past|previous|current) (day|week|month|quarter|year)\b)",
             R"(\b(last|past|previous|next) \d+ (days?|weeks?|months?|quarters?|years?)\b)",
             R"(\b\d{4}-\d{2}-\d{2}\b)",
             R"(\b(19|20)\d{2}\b)",
             R"(\b(january|february|march|april|may|june|july|august|september|october|november|december)\b)",
             R"(\b(ytd|mtd|year to date|month to date)\b)"}) {
        date_patterns_.emplace_back(pattern, kFlags);
    }

    for (const auto& [pattern, op] : std::vector<std::pair<const char*, const char*>>{
             {R"(>=)", ">="}, {R"(<=)", "<="}, {R"(!=|<>)", "!="},
             {R"((^|[^<>!=])>([^=]|$))", ">"}, {R"((^|[^<>!=])<([^=>]|$))", "<"},
             {R"(\b(more|greater|higher|larger) than\b)", ">"},
             {R"(\b(less|fewer|lower|smaller) than\b)", "<"},
             {R"(\bat least\b)", ">="}, {R"(\bat most\b)", "<="},
             {R"(\b(over|above|exceeding) \d)", ">"}, {R"(\b(under|below) \d)", "<"},
             {R"(\bequal to\b|\bequals\b)", "="},
             {R"(\bbetween \S+ and\b)", "between"}}) {
        comparator_patterns_.emplace_back(std::regex(pattern, kFlags), op);
    }

    set_vocabulary(std::move(table_vocabulary));
}

void IntentAnalyzer::set_vocabulary(std::vector<std::string> table_names) {
    std::vector<VocabularyEntry> entries;
    entries.reserve(table_names.size());
    for (auto& name : table_names) {
        auto forms = word_forms(name);
        entries.push_back(VocabularyEntry{std::move(name), std::move(forms)});
    }

    std::unique_lock lock(vocab_mutex_);
    vocabulary_ = std::move(entries);
}

bool IntentAnalyzer::has_anaphora(const std::string& normalized_text) {
    return std::regex_search(normalized_text, anaphora_regex());
}

// ============================================================================
// Analysis
// ============================================================================

Query IntentAnalyzer::analyze(const std::string& text, const std::vector<Turn>& history) const {
    Query query;
    query.id = utils::generate_uuid();
    query.text = text;
    query.normalized_text = utils::normalize_text(text);
    query.timestamp = utils::now();

    const std::string& norm = query.normalized_text;

    int points = 0;
    classify(norm, query, points);

    extract_dates(norm, query.entities);
    extract_numbers(norm, query.entities);
    extract_comparators(norm, query.entities);
    extract_table_hints(norm, query.entities);
    extract_metrics(norm, query.entities);

    // Follow-up: inherit what the previous turn established
    bool resolved_reference = false;
    if (!history.empty() && has_anaphora(norm)) {
        const Query& previous = history.back().query;
        for (const char* kind : {entity::kDate, entity::kTableHint}) {
            if (!query.has_entity(kind) && previous.has_entity(kind)) {
                query.entities[kind] = previous.entities.at(kind);
            }
        }
        if (query.intent == IntentKind::UNKNOWN) {
            query.intent = previous.intent;
        }
        resolved_reference = true;
    }

    if (query.has_entity(entity::kDate)) points += kDatePoints;
    if (query.has_entity(entity::kTableHint) || query.has_entity(entity::kComparator)) {
        points += kScopePoints;
    }

    static const std::regex question_start(
        R"(^(how|what|which|who|when|where|why|is|are|do|does|did|can|could)\b)", kFlags);
    if (text.find('?') != std::string::npos || std::regex_search(norm, question_start)) {
        points += kQuestionPoints;
    }

    if (utils::split(norm, ' ').size() >= kMinWordsForLength) {
        points += kLengthPoints;
    }
    if (resolved_reference) {
        points += kReferencePoints;
    }

    query.confidence = static_cast<double>(std::clamp(points, 0, 100)) / 100.0;

    utils::log::debug(std::format("Intent: '{}' -> {} ({:.2f})",
        norm, intent_kind_to_string(query.intent), query.confidence));
    return query;
}

void IntentAnalyzer::classify(const std::string& text, Query& query, int& points) const {
    const IntentPattern* best = nullptr;
    for (const auto& pattern : intent_patterns_) {
        if ((!best || pattern.strength > best->strength) &&
            std::regex_search(text, pattern.regex)) {
            best = &pattern;
        }
    }

    if (best) {
        query.intent = best->kind;
        points += best->strength;
    } else {
        query.intent = IntentKind::UNKNOWN;
        points += kNoPatternPoints;
    }
}

void IntentAnalyzer::extract_dates(const std::string& text, EntityMap& entities) const {
    for (const auto& re : date_patterns_) {
        collect_matches(text, re, entities, entity::kDate);
    }
}

void IntentAnalyzer::extract_numbers(const std::string& text, EntityMap& entities) const {
    collect_matches(text, number_pattern_, entities, entity::kNumber);
}

void IntentAnalyzer::extract_comparators(const std::string& text, EntityMap& entities) const {
    for (const auto& [re, op] : comparator_patterns_) {
        if (std::regex_search(text, re)) {
            add_entity(entities, entity::kComparator, op);
        }
    }
}

void IntentAnalyzer::extract_table_hints(const std::string& text, EntityMap& entities) const {
    std::shared_lock lock(vocab_mutex_);
    for (const auto& entry : vocabulary_) {
        for (const auto& form : entry.forms) {
            if (contains_word(text, form)) {
                add_entity(entities, entity::kTableHint, entry.table);
                break;
            }
        }
    }
}

void IntentAnalyzer::extract_metrics(const std::string& text, EntityMap& entities) const {
    collect_matches(text, metric_pattern_, entities, entity::kMetric);
}

// ============================================================================
// Clarification
// ============================================================================

std::vector<std::string> IntentAnalyzer::clarification_questions(const Query& query) const {
    std::vector<std::string> questions;

    if (!query.has_entity(entity::kDate)) {
        questions.emplace_back(
            "What time period should this cover (for example, yesterday, the last 30 days or 2024)?");
    }

    if (!query.has_entity(entity::kTableHint)) {
        std::vector<std::string> examples;
        {
            std::shared_lock lock(vocab_mutex_);
            for (size_t i = 0; i < vocabulary_.size() && i < 3; ++i) {
                examples.push_back(vocabulary_[i].table);
            }
        }
        if (examples.empty()) {
            questions.emplace_back("Which records are you asking about?");
        } else {
            questions.push_back(std::format(
                "Which records are you asking about (for example: {})?", utils::join(examples, ", ")));
        }
    }

    const bool needs_metric = query.intent == IntentKind::UNKNOWN ||
                              query.intent == IntentKind::AGGREGATE ||
                              query.intent == IntentKind::COMPARISON ||
                              query.intent == IntentKind::TREND;
    if (needs_metric && !query.has_entity(entity::kMetric)) {
        questions.emplace_back("Which measure do you want, such as a count, a total or an average?");
    }

    if (questions.empty()) {
        questions.emplace_back("Could you rephrase the question with more detail about what to include?");
    }
    return questions;
}

} // namespace sqlrag
