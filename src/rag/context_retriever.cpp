#include "rag/context_retriever.hpp"
#include "intent/intent_analyzer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <deque>
#include <format>
#include <regex>
#include <set>
#include <unordered_set>

namespace sqlrag {

namespace {

const std::regex& join_indicator_regex() {
    static const std::regex re(
        R"(\b(and|by|per|with|for each|compared|versus|vs|across|along with|together with|join)\b)",
        std::regex::ECMAScript | std::regex::optimize);
    return re;
}

constexpr size_t kSimpleMaxWords = 8;

std::string table_of(const VectorHit& hit) {
    return std::visit([](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, TablePayload> || std::is_same_v<T, ColumnPayload>) {
            return utils::to_lower(p.table);
        } else {
            return {};
        }
    }, hit.payload);
}

ContextElement to_element(const VectorHit& hit) {
    return ContextElement{hit.id, hit.content, hit.payload, hit.score};
}

bool example_matches(const VectorHit& hit, IntentKind intent) {
    const auto* p = std::get_if<ExamplePayload>(&hit.payload);
    return p && p->intent == intent;
}

bool rule_applies(const VectorHit& hit, IntentKind intent) {
    const auto* p = std::get_if<RulePayload>(&hit.payload);
    if (!p) return false;
    return p->intents.empty() ||
           std::find(p->intents.begin(), p->intents.end(), intent) != p->intents.end();
}

} // anonymous namespace

ContextRetriever::ContextRetriever(std::shared_ptr<IEmbeddingService> embeddings,
                                   std::shared_ptr<IVectorStore> store,
                                   std::shared_ptr<ITokenEstimator> estimator,
                                   Config config)
    : embeddings_(std::move(embeddings)),
      store_(std::move(store)),
      estimator_(estimator ? std::move(estimator) : std::make_shared<CharRatioTokenEstimator>()),
      config_(config) {}

size_t ContextRetriever::choose_top_k(const std::string& text,
                                      const std::vector<Turn>& history) const {
    const auto norm = utils::normalize_text(text);
    if (std::regex_search(norm, join_indicator_regex())) {
        return config_.top_k_complex;
    }
    if (history.empty() && utils::split(norm, ' ').size() <= kSimpleMaxWords) {
        return config_.top_k_simple;
    }
    return config_.top_k_default;
}

// ============================================================================
// I/O stage
// ============================================================================

Result<Embedding> ContextRetriever::embed_cached(const std::string& key, const std::string& text,
                                                 const Deadline& deadline) {
    {
        std::lock_guard lock(cache_mutex_);
        const auto it = cache_map_.find(key);
        if (it != cache_map_.end()) {
            cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
            embedding_cache_hits_.fetch_add(1, std::memory_order_relaxed);
            return Result<Embedding>::ok(it->second->second);
        }
    }

    auto result = embeddings_->embed(text, deadline);
    if (result.is_error() || config_.embedding_cache_size == 0) {
        return result;
    }

    std::lock_guard lock(cache_mutex_);
    if (!cache_map_.contains(key)) {
        while (cache_map_.size() >= config_.embedding_cache_size && !cache_list_.empty()) {
            cache_map_.erase(cache_list_.back().first);
            cache_list_.pop_back();
        }
        cache_list_.emplace_front(key, result.value());
        cache_map_[key] = cache_list_.begin();
    }
    return result;
}

RetrievalCandidates ContextRetriever::fetch_candidates(const std::string& text,
                                                       const std::vector<Turn>& history,
                                                       const Deadline& deadline) {
    RetrievalCandidates out;
    out.query_text = text;

    // A follow-up is embedded together with the question it refers to
    std::string search_text = text;
    const auto norm = utils::normalize_text(text);
    if (!history.empty() && IntentAnalyzer::has_anaphora(norm)) {
        search_text = history.back().query.text + " " + text;
    }

    auto embedding = embed_cached(utils::normalize_text(search_text), search_text, deadline);
    if (embedding.is_error()) {
        utils::log::warn(std::format("Retrieval degraded: embedding failed ({}): {}",
            error_kind_to_string(embedding.error_kind()), embedding.error_message()));
        out.degraded = true;
        return out;
    }

    const size_t top_k = choose_top_k(text, history);
    auto hits = store_->search(embedding.value(), top_k, std::nullopt, deadline);
    if (hits.is_error()) {
        utils::log::warn(std::format("Retrieval degraded: vector search failed ({}): {}",
            error_kind_to_string(hits.error_kind()), hits.error_message()));
        out.degraded = true;
        return out;
    }
    out.hits = std::move(hits.value());

    // Over-fetch typed candidates so the intent filter in assemble() has a choice
    auto examples = store_->search(embedding.value(), config_.max_examples * 3,
                                   ContextKind::EXAMPLE, deadline);
    if (examples.is_ok()) {
        out.examples = std::move(examples.value());
    } else {
        utils::log::warn(std::format("Example search failed: {}", examples.error_message()));
    }

    auto rules = store_->search(embedding.value(), config_.max_rules * 2,
                                ContextKind::RULE, deadline);
    if (rules.is_ok()) {
        out.rules = std::move(rules.value());
    } else {
        utils::log::warn(std::format("Rule search failed: {}", rules.error_message()));
    }

    utils::log::debug(std::format("Retrieval: k={} hits={} examples={} rules={}",
        top_k, out.hits.size(), out.examples.size(), out.rules.size()));
    return out;
}

// ============================================================================
// Assembly stage
// ============================================================================

std::vector<std::string> ContextRetriever::select_tables(
    const std::vector<const VectorHit*>& tables,
    const std::vector<const VectorHit*>& relationships) const {

    if (tables.empty() || config_.max_tables == 0) {
        return {};
    }

    // tables arrive best first; keep the best score per name
    std::vector<std::string> ranked;
    std::unordered_set<std::string> candidate_set;
    for (const auto* hit : tables) {
        const auto name = table_of(*hit);
        if (candidate_set.insert(name).second) {
            ranked.push_back(name);
        }
    }

    std::unordered_map<std::string, std::set<std::string>> edges;
    const auto connect = [&edges](const std::string& a, const std::string& b) {
        if (a.empty() || b.empty() || a == b) return;
        edges[a].insert(b);
        edges[b].insert(a);
    };
    for (const auto* hit : relationships) {
        const auto& rel = std::get<RelationshipPayload>(hit->payload);
        connect(utils::to_lower(rel.from_table), utils::to_lower(rel.to_table));
    }
    for (const auto* hit : tables) {
        const auto& tbl = std::get<TablePayload>(hit->payload);
        for (const auto& related : tbl.related_tables) {
            connect(utils::to_lower(tbl.table), utils::to_lower(related));
        }
    }

    const auto rank_of = [&ranked](const std::string& name) {
        return std::find(ranked.begin(), ranked.end(), name) - ranked.begin();
    };

    // Bounded BFS from the best table over candidate tables only
    std::vector<std::string> selected{ranked.front()};
    std::unordered_set<std::string> visited{ranked.front()};
    std::deque<std::pair<std::string, size_t>> frontier{{ranked.front(), 0}};

    while (!frontier.empty() && selected.size() < config_.max_tables) {
        const auto [current, depth] = frontier.front();
        frontier.pop_front();
        if (depth >= config_.max_hops) continue;

        std::vector<std::string> neighbours;
        for (const auto& n : edges[current]) {
            if (candidate_set.contains(n) && !visited.contains(n)) {
                neighbours.push_back(n);
            }
        }
        std::sort(neighbours.begin(), neighbours.end(),
            [&rank_of](const auto& a, const auto& b) { return rank_of(a) < rank_of(b); });

        for (const auto& n : neighbours) {
            if (selected.size() >= config_.max_tables) break;
            visited.insert(n);
            selected.push_back(n);
            frontier.emplace_back(n, depth + 1);
        }
    }

    // Fill up in similarity order
    for (const auto& name : ranked) {
        if (selected.size() >= config_.max_tables) break;
        if (visited.insert(name).second) {
            selected.push_back(name);
        }
    }
    return selected;
}

RetrievalContext ContextRetriever::assemble(const RetrievalCandidates& candidates,
                                            const Query& query) const {
    RetrievalContext ctx;
    ctx.query_text = candidates.query_text;
    ctx.degraded = candidates.degraded;

    std::vector<const VectorHit*> tables;
    std::vector<const VectorHit*> columns;
    std::vector<const VectorHit*> relationships;
    for (const auto& hit : candidates.hits) {
        if (hit.score < config_.similarity_threshold) continue;
        switch (hit.kind()) {
            case ContextKind::TABLE:        tables.push_back(&hit); break;
            case ContextKind::COLUMN:       columns.push_back(&hit); break;
            case ContextKind::RELATIONSHIP: relationships.push_back(&hit); break;
            default: break;   // examples and rules come from their own searches
        }
    }

    const auto selected_list = select_tables(tables, relationships);
    const std::unordered_set<std::string> selected(selected_list.begin(), selected_list.end());

    std::vector<const VectorHit*> chosen;
    for (const auto* hit : tables) {
        if (selected.contains(table_of(*hit))) chosen.push_back(hit);
    }
    for (const auto* hit : columns) {
        if (selected.contains(table_of(*hit))) chosen.push_back(hit);
    }
    for (const auto* hit : relationships) {
        const auto& rel = std::get<RelationshipPayload>(hit->payload);
        if (selected.contains(utils::to_lower(rel.from_table)) &&
            selected.contains(utils::to_lower(rel.to_table))) {
            chosen.push_back(hit);
        }
    }

    // Examples: same intent first, then the closest others
    size_t example_count = 0;
    for (const bool want_match : {true, false}) {
        for (const auto& hit : candidates.examples) {
            if (example_count >= config_.max_examples) break;
            if (hit.score < config_.similarity_threshold) continue;
            if (example_matches(hit, query.intent) != want_match) continue;
            chosen.push_back(&hit);
            ++example_count;
        }
    }

    size_t rule_count = 0;
    for (const auto& hit : candidates.rules) {
        if (rule_count >= config_.max_rules) break;
        if (!rule_applies(hit, query.intent)) continue;
        chosen.push_back(&hit);
        ++rule_count;
    }

    // Greedy fill in descending score order
    std::stable_sort(chosen.begin(), chosen.end(),
        [](const VectorHit* a, const VectorHit* b) { return a->score > b->score; });

    const size_t budget = available_tokens();
    std::unordered_set<std::string> included_tables;
    std::vector<ContextElement> fitted;
    size_t used = 0;
    for (const auto* hit : chosen) {
        const size_t cost = estimator_->estimate(hit->content);
        if (used + cost > budget) continue;
        used += cost;
        if (hit->kind() == ContextKind::TABLE) included_tables.insert(table_of(*hit));
        fitted.push_back(to_element(*hit));
    }

    // Columns and relationships whose table did not fit are orphans
    for (auto& element : fitted) {
        bool keep = true;
        if (const auto* col = std::get_if<ColumnPayload>(&element.payload)) {
            keep = included_tables.contains(utils::to_lower(col->table));
        } else if (const auto* rel = std::get_if<RelationshipPayload>(&element.payload)) {
            keep = included_tables.contains(utils::to_lower(rel->from_table)) &&
                   included_tables.contains(utils::to_lower(rel->to_table));
        }
        if (keep) {
            ctx.total_tokens += estimator_->estimate(element.content);
            ctx.elements.push_back(std::move(element));
        }
    }

    return ctx;
}

RetrievalContext ContextRetriever::retrieve(const Query& query,
                                            const std::vector<Turn>& history,
                                            const Deadline& deadline) {
    return assemble(fetch_candidates(query.text, history, deadline), query);
}

} // namespace sqlrag
