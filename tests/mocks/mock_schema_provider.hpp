#pragma once

#include "core/utils.hpp"
#include "db/ischema_provider.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace sqlrag::testing {

/**
 * @brief In-memory schema with a settable version token
 */
class MockSchemaProvider : public ISchemaProvider {
public:
    MockSchemaProvider& add_table(const std::string& name,
                                  const std::vector<std::pair<std::string, std::string>>& columns,
                                  uint64_t rows = 1000,
                                  std::vector<ForeignKey> fks = {},
                                  std::string description = {}) {
        auto table = std::make_shared<TableMetadata>();
        table->name = name;
        table->row_count_estimate = rows;
        table->description = std::move(description);
        for (const auto& [col, type] : columns) {
            table->add_column(ColumnMetadata(col, type));
        }
        table->foreign_keys = std::move(fks);
        std::lock_guard lock(mutex_);
        auto next = std::make_shared<SchemaMap>(*schema_);
        (*next)[utils::to_lower(name)] = std::move(table);
        schema_ = std::move(next);
        return *this;
    }

    MockSchemaProvider& remove_table(const std::string& name) {
        std::lock_guard lock(mutex_);
        auto next = std::make_shared<SchemaMap>(*schema_);
        next->erase(utils::to_lower(name));
        schema_ = std::move(next);
        return *this;
    }

    void set_version(std::string v) {
        std::lock_guard lock(mutex_);
        version_ = std::move(v);
    }

    bool table_exists(const std::string& name) override {
        std::lock_guard lock(mutex_);
        return schema_->contains(utils::to_lower(name));
    }

    std::vector<std::string> suggest_similar(const std::string& name, size_t limit = 5) override {
        std::vector<std::string> names;
        {
            std::lock_guard lock(mutex_);
            for (const auto& [key, _] : *schema_) names.push_back(key);
        }
        return utils::rank_similar(name, names, limit);
    }

    std::string schema_version() override {
        std::lock_guard lock(mutex_);
        return version_;
    }

    std::shared_ptr<const SchemaMap> load_snapshot() override {
        loads_.fetch_add(1);
        std::lock_guard lock(mutex_);
        return schema_;
    }

    [[nodiscard]] int load_count() const { return loads_.load(); }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<SchemaMap> schema_ = std::make_shared<SchemaMap>();
    std::string version_ = "v1";
    std::atomic<int> loads_{0};
};

/**
 * @brief The hospital schema used across the tests
 *
 * admissions -> patients, admissions -> departments; staff is large.
 */
inline std::shared_ptr<MockSchemaProvider> make_hospital_schema() {
    auto provider = std::make_shared<MockSchemaProvider>();
    provider->add_table("patients",
        {{"id", "integer"}, {"name", "text"}, {"birth_date", "date"}}, 50'000, {},
        "Registered patients");
    provider->add_table("departments",
        {{"id", "integer"}, {"name", "text"}}, 20, {}, "Hospital departments");
    provider->add_table("admissions",
        {{"id", "integer"}, {"patient_id", "integer"}, {"department_id", "integer"},
         {"admitted_at", "timestamptz"}, {"discharged_at", "timestamptz"}},
        200'000,
        {ForeignKey{"patient_id", "patients", "id"}, ForeignKey{"department_id", "departments", "id"}},
        "Patient admissions and discharges");
    provider->add_table("lab_results",
        {{"id", "integer"}, {"admission_id", "integer"}, {"test", "text"}, {"value", "numeric"}},
        5'000'000, {ForeignKey{"admission_id", "admissions", "id"}}, "Laboratory results");
    return provider;
}

} // namespace sqlrag::testing
