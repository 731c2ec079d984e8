#include "orchestrator/orchestrator.hpp"
#include "orchestrator/answer_synthesizer.hpp"
#include "core/utils.hpp"

#include <format>
#include <future>
#include <stdexcept>
#include <thread>

namespace sqlrag {

Orchestrator::Orchestrator(Dependencies deps, Config config)
    : deps_(std::move(deps)), config_(config) {
    if (!deps_.intent || !deps_.retriever || !deps_.generator || !deps_.executor ||
        !deps_.cache || !deps_.sessions || !deps_.schema) {
        throw std::invalid_argument("Orchestrator: every dependency must be provided");
    }
}

Outcome Orchestrator::process(const std::string& text, const std::string& session_id) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    const auto trace_id = utils::generate_trace_id();

    try {
        return run(text, session_id, trace_id);
    } catch (const std::exception& e) {
        utils::log::error(std::format("[{}] Unhandled error: {}", trace_id, e.what()));
        return error(ErrorKind::INTERNAL_ERROR,
            "Something went wrong while answering the question",
            {std::format("Try again; quote trace id {} if the problem persists", trace_id)},
            trace_id);
    }
}

ErrorResult Orchestrator::error(ErrorKind kind, std::string message,
                                std::vector<std::string> suggestions,
                                const std::string& trace_id) {
    errors_.fetch_add(1, std::memory_order_relaxed);
    utils::log::info(std::format("[{}] {}: {}", trace_id, error_kind_to_string(kind), message));
    return ErrorResult{kind, std::move(message), std::move(suggestions), trace_id};
}

std::vector<std::string> Orchestrator::execution_suggestions(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CIRCUIT_OPEN:
            return {"The database is recovering; try again shortly"};
        case ErrorKind::TRANSIENT_EXHAUSTED:
            return {"The database is busy; try again in a moment"};
        case ErrorKind::TIMEOUT:
            return {"Narrow the question with a date range or filter", "Try again"};
        default:
            return {"Rephrase the question", "Check that the referenced data exists"};
    }
}

Outcome Orchestrator::from_cache(Response cached, const std::string& text,
                                 const std::string& normalized, const std::string& session_id,
                                 std::chrono::microseconds latency) {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);

    Query query;
    query.id = utils::generate_uuid();
    query.session_id = session_id;
    query.text = text;
    query.normalized_text = normalized;
    query.timestamp = utils::now();
    query.intent = cached.intent;

    cached.query_id = query.id;
    cached.cache_hit = true;
    cached.latency = latency;
    cached.timings = StageTimings{};

    deps_.sessions->append(session_id, Turn{std::move(query), cached});
    return cached;
}

Outcome Orchestrator::run(const std::string& text, const std::string& session_id,
                          const std::string& trace_id) {
    utils::Timer total;

    // ---- input ----
    const std::string question = utils::trim(text);
    if (question.empty()) {
        return error(ErrorKind::INVALID_INPUT, "The question is empty",
            {"Type a question about the data"}, trace_id);
    }
    if (question.size() > config_.max_query_length) {
        return error(ErrorKind::INVALID_INPUT,
            std::format("The question is longer than {} characters", config_.max_query_length),
            {"Shorten the question"}, trace_id);
    }

    const std::string normalized = utils::normalize_text(question);
    const auto history = deps_.sessions->window(session_id, config_.history_window);
    // A reference word only makes a follow-up when there is a turn to refer to
    const bool follow_up = !history.empty() && IntentAnalyzer::has_anaphora(normalized);
    const std::string schema_version = deps_.schema->version();

    // ---- cache ----
    if (!follow_up && deps_.cache->is_enabled()) {
        if (auto cached = deps_.cache->get(normalized, schema_version)) {
            utils::log::debug(std::format("[{}] cache hit", trace_id));
            return from_cache(std::move(*cached), question, normalized, session_id,
                              total.elapsed_us());
        }
    }

    Deadline deadline = Deadline::after(config_.request_timeout);
    StageTimings timings;

    // ---- retrieval I/O runs while intent is analyzed ----
    utils::Timer retrieval_timer;
    auto retriever = deps_.retriever;
    auto task = std::make_shared<std::packaged_task<RetrievalCandidates()>>(
        [retriever, question, history, deadline]() {
            return retriever->fetch_candidates(question, history, deadline);
        });
    auto pending = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    utils::Timer intent_timer;
    Query query = deps_.intent->analyze(question, history);
    query.session_id = session_id;
    timings.intent = intent_timer.elapsed_us();

    utils::log::debug(std::format("[{}] intent={} confidence={:.2f}", trace_id,
        intent_kind_to_string(query.intent), query.confidence));

    // ---- ambiguity gate ----
    if (deps_.intent->is_ambiguous(query)) {
        deadline.cancel();
        clarifications_.fetch_add(1, std::memory_order_relaxed);
        return ClarificationRequest{query.id, query.confidence,
                                    deps_.intent->clarification_questions(query)};
    }

    if (pending.wait_for(deadline.remaining()) != std::future_status::ready) {
        deadline.cancel();
        return error(ErrorKind::TIMEOUT, "Looking up schema context took too long",
            {"Try again", "Check that the embedding service is responsive"}, trace_id);
    }
    const RetrievalContext context = deps_.retriever->assemble(pending.get(), query);
    timings.retrieval = retrieval_timer.elapsed_us();

    utils::log::debug(std::format("[{}] context: {} elements, {} tokens{}", trace_id,
        context.elements.size(), context.total_tokens, context.degraded ? " (degraded)" : ""));

    // ---- generation + validation ----
    utils::Timer generation_timer;
    auto generated = deps_.generator->generate(query, context, history, deadline);
    timings.generation = generation_timer.elapsed_us();
    if (generated.is_error()) {
        return error(generated.error_kind(), generated.error_message(),
                     generated.suggestions(), trace_id);
    }
    const auto& statement = generated.value().statement;

    // ---- execution ----
    utils::Timer execution_timer;
    ExecutionResult execution = deps_.executor->execute(statement.text, deadline);
    timings.execution = execution_timer.elapsed_us();
    if (!execution.success) {
        return error(execution.error_kind, execution.error_message,
                     execution_suggestions(execution.error_kind), trace_id);
    }

    // ---- answer ----
    Response response;
    response.query_id = query.id;
    response.statement = statement.text;
    response.intent = query.intent;
    response.warnings = generated.value().validation.warnings();
    response.warnings.insert(response.warnings.end(),
                             execution.warnings.begin(), execution.warnings.end());
    response.answer = AnswerSynthesizer::synthesize(query, execution, response.warnings);
    response.execution = std::move(execution);
    response.timings = timings;
    response.latency = total.elapsed_us();

    // Follow-ups depend on history, so only self-contained questions are cached
    if (!follow_up && deps_.cache->is_enabled()) {
        deps_.cache->put(normalized, schema_version, response);
    }
    deps_.sessions->append(session_id, Turn{query, response});

    utils::log::info(std::format("[{}] answered in {}ms (attempt {}, {} rows)", trace_id,
        response.latency.count() / 1000, statement.attempt, response.execution.row_count));
    return response;
}

Orchestrator::Stats Orchestrator::get_stats() const {
    return Stats{
        .requests = requests_.load(std::memory_order_relaxed),
        .cache_hits = cache_hits_.load(std::memory_order_relaxed),
        .clarifications = clarifications_.load(std::memory_order_relaxed),
        .errors = errors_.load(std::memory_order_relaxed),
    };
}

} // namespace sqlrag
