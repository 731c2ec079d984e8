#pragma once

#include "rag/ivector_store.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <vector>

namespace sqlrag::testing {

/**
 * @brief Vector store returning preset hits regardless of the query vector
 */
class MockVectorStore : public IVectorStore {
public:
    void add_hit(std::string id, std::string content, ContextPayload payload, double score) {
        std::lock_guard lock(mutex_);
        hits_.push_back(VectorHit{std::move(id), std::move(content), std::move(payload), score});
    }

    Result<std::vector<VectorHit>> search(const Embedding& /*query*/, size_t top_k,
                                          std::optional<ContextKind> filter,
                                          const Deadline& /*deadline*/) override {
        searches_.fetch_add(1);
        if (failing_.load()) {
            return Result<std::vector<VectorHit>>::error(ErrorKind::BACKEND_UNAVAILABLE, "index offline");
        }
        std::lock_guard lock(mutex_);
        if (!filter) {
            last_top_k_ = top_k;
        }
        std::vector<VectorHit> out;
        for (const auto& h : hits_) {
            if (!filter || h.kind() == *filter) out.push_back(h);
        }
        std::stable_sort(out.begin(), out.end(),
            [](const VectorHit& a, const VectorHit& b) { return a.score > b.score; });
        if (out.size() > top_k) out.resize(top_k);
        return Result<std::vector<VectorHit>>::ok(std::move(out));
    }

    Result<size_t> add(std::vector<VectorDocument> documents) override {
        std::lock_guard lock(mutex_);
        added_ += documents.size();
        return Result<size_t>::ok(documents.size());
    }

    void clear() override {
        std::lock_guard lock(mutex_);
        hits_.clear();
    }

    size_t size() const override {
        std::lock_guard lock(mutex_);
        return hits_.size();
    }

    void set_failing(bool failing) { failing_.store(failing); }

    [[nodiscard]] size_t last_top_k() const {
        std::lock_guard lock(mutex_);
        return last_top_k_;
    }

    [[nodiscard]] int search_count() const { return searches_.load(); }

private:
    mutable std::mutex mutex_;
    std::vector<VectorHit> hits_;
    size_t added_ = 0;
    size_t last_top_k_ = 0;
    std::atomic<bool> failing_{false};
    std::atomic<int> searches_{0};
};

} // namespace sqlrag::testing
