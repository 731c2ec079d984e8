#include "rag/in_memory_vector_store.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <mutex>

namespace sqlrag {

bool InMemoryVectorStore::normalize(Embedding& v) {
    double norm = 0.0;
    for (const float x : v) {
        norm += static_cast<double>(x) * static_cast<double>(x);
    }
    norm = std::sqrt(norm);
    if (norm == 0.0) {
        return false;
    }
    for (float& x : v) {
        x = static_cast<float>(static_cast<double>(x) / norm);
    }
    return true;
}

Result<size_t> InMemoryVectorStore::add(std::vector<VectorDocument> documents) {
    std::unique_lock lock(mutex_);

    size_t stored = 0;
    for (auto& doc : documents) {
        if (doc.embedding.empty() || !normalize(doc.embedding)) {
            utils::log::warn(std::format("VectorStore: skipping '{}' (empty or zero vector)", doc.id));
            continue;
        }
        if (dimension_ == 0) {
            dimension_ = doc.embedding.size();
        } else if (doc.embedding.size() != dimension_) {
            return Result<size_t>::error(ErrorKind::INVALID_INPUT, std::format(
                "Document '{}' has dimension {}, index has {}", doc.id, doc.embedding.size(), dimension_));
        }

        const auto it = index_.find(doc.id);
        if (it != index_.end()) {
            documents_[it->second] = std::move(doc);
        } else {
            index_.emplace(doc.id, documents_.size());
            documents_.push_back(std::move(doc));
        }
        ++stored;
    }
    return Result<size_t>::ok(stored);
}

Result<std::vector<VectorHit>> InMemoryVectorStore::search(
    const Embedding& query, size_t top_k,
    std::optional<ContextKind> filter, const Deadline& deadline) {

    if (deadline.expired()) {
        return Result<std::vector<VectorHit>>::error(ErrorKind::TIMEOUT, "Vector search deadline expired");
    }

    Embedding q = query;
    if (!normalize(q)) {
        return Result<std::vector<VectorHit>>::error(ErrorKind::INVALID_INPUT, "Query vector is zero");
    }

    std::shared_lock lock(mutex_);
    if (!documents_.empty() && q.size() != dimension_) {
        return Result<std::vector<VectorHit>>::error(ErrorKind::INVALID_INPUT, std::format(
            "Query dimension {} does not match index dimension {}", q.size(), dimension_));
    }

    std::vector<std::pair<double, size_t>> scored;
    scored.reserve(documents_.size());
    for (size_t i = 0; i < documents_.size(); ++i) {
        const auto& doc = documents_[i];
        if (filter && doc.kind() != *filter) continue;

        double dot = 0.0;
        for (size_t d = 0; d < dimension_; ++d) {
            dot += static_cast<double>(doc.embedding[d]) * static_cast<double>(q[d]);
        }
        scored.emplace_back(dot, i);
    }

    const size_t k = std::min(top_k, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(k), scored.end(),
        [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<VectorHit> hits;
    hits.reserve(k);
    for (size_t i = 0; i < k; ++i) {
        const auto& doc = documents_[scored[i].second];
        hits.push_back(VectorHit{doc.id, doc.content, doc.payload, scored[i].first});
    }
    lock.unlock();

    if (deadline.expired()) {
        return Result<std::vector<VectorHit>>::error(ErrorKind::TIMEOUT, "Vector search deadline expired");
    }
    return Result<std::vector<VectorHit>>::ok(std::move(hits));
}

void InMemoryVectorStore::clear() {
    std::unique_lock lock(mutex_);
    documents_.clear();
    index_.clear();
    dimension_ = 0;
}

size_t InMemoryVectorStore::size() const {
    std::shared_lock lock(mutex_);
    return documents_.size();
}

} // namespace sqlrag
