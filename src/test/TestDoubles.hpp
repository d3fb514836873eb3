/**
 * @file TestDoubles.hpp
 * @brief Mock collaborators and Java fixtures shared by the test executables.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/EmbeddingProvider.hpp"
#include "domain/SourceUnit.hpp"
#include "domain/Transformer.hpp"
#include "infrastructure/ContentHasher.hpp"

using TestChatMessage = archmend::domain::Transformer::ChatMessage;

/** Serialises a verdict the way a well-behaved model would. */
inline std::string VerdictJson(bool violation, const std::string& reason, const std::string& fix) {
    nlohmann::json j;
    j["violation"] = violation;
    j["reason"] = reason;
    j["suggestedFix"] = fix;
    return j.dump();
}

/**
 * Scripted model. Each rule matches a needle against the first user message
 * and replays its responses in order; the last response repeats.
 */
class ScriptedTransformer : public archmend::domain::Transformer {
public:
    using Response = std::optional<std::string>;

    void addRule(const std::string& needle, std::vector<Response> responses) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_rules.push_back({needle, std::move(responses), 0});
    }

    void setDefault(Response response) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_default = std::move(response);
    }

    void setDelay(std::chrono::milliseconds delay) { m_delayMs = delay.count(); }

    std::optional<std::string> generate(const std::vector<ChatMessage>& history) override {
        ++m_calls;
        if (m_delayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(m_delayMs.load()));
        }

        std::string prompt;
        for (const auto& message : history) {
            if (message.role == ChatMessage::Role::User) {
                prompt = message.content;
                break;
            }
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_histories.push_back(history);
        for (auto& rule : m_rules) {
            if (prompt.find(rule.needle) == std::string::npos || rule.responses.empty()) continue;
            size_t index = std::min(rule.next, rule.responses.size() - 1);
            ++rule.next;
            return rule.responses[index];
        }
        return m_default;
    }

    std::string getCurrentModel() const override { return "scripted"; }

    int calls() const { return m_calls.load(); }

    std::vector<std::vector<ChatMessage>> histories() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_histories;
    }

private:
    struct Rule {
        std::string needle;
        std::vector<Response> responses;
        size_t next;
    };

    mutable std::mutex m_mutex;
    std::vector<Rule> m_rules;
    Response m_default = VerdictJson(false, "looks fine", "");
    std::vector<std::vector<ChatMessage>> m_histories;
    std::atomic<int> m_calls{0};
    std::atomic<long long> m_delayMs{0};
};

/** Deterministic hashed bag-of-words embedding, L2-normalised. */
class BagOfWordsEmbedder : public archmend::domain::EmbeddingProvider {
public:
    explicit BagOfWordsEmbedder(size_t dimension = 64) : m_dimension(dimension) {}

    std::vector<float> embed(const std::string& text) override {
        ++m_calls;
        if (!m_available) return {};

        std::vector<float> v(m_dimension, 0.0f);
        std::string word;
        auto flushWord = [&]() {
            if (word.empty()) return;
            v[std::hash<std::string>{}(word) % m_dimension] += 1.0f;
            word.clear();
        };
        for (char c : text) {
            if (std::isalnum(static_cast<unsigned char>(c))) {
                word.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            } else {
                flushWord();
            }
        }
        flushWord();

        float norm = 0.0f;
        for (float x : v) norm += x * x;
        if (norm > 0.0f) {
            norm = std::sqrt(norm);
            for (float& x : v) x /= norm;
        }
        return v;
    }

    size_t dimension() const override { return m_dimension; }
    bool available() const override { return m_available; }

    void setAvailable(bool available) { m_available = available; }
    int calls() const { return m_calls.load(); }

private:
    size_t m_dimension;
    std::atomic<bool> m_available{true};
    std::atomic<int> m_calls{0};
};

inline archmend::domain::SourceUnit MakeUnit(const std::string& id, const std::string& text,
                                             archmend::domain::ContentType type = archmend::domain::ContentType::Java) {
    archmend::domain::SourceUnit unit;
    unit.id = id;
    unit.path = id;
    unit.text = text;
    unit.contentHash = archmend::infrastructure::ContentHasher::Sha256Hex(text);
    unit.type = type;
    return unit;
}

inline const char* InventoryRepositorySource() {
    return R"(package com.example.legacy;

/**
 * JPA repository that also includes domain logic.
 */
public class InventoryRepository {

    public SomeDomainAggregate loadAggregate(String id) {
        SomeDomainAggregate agg = new SomeDomainAggregate(id, 50);
        if (agg.getStock() > 1000) {
            System.out.println("Huge stock!");
        }
        return agg;
    }

    public void saveAggregate(SomeDomainAggregate agg) {
        if (agg.getStock() < 0) {
            throw new RuntimeException("Cannot have negative stock");
        }
        System.out.println("Saving aggregate id=" + agg.getId());
    }
}
)";
}

inline const char* DomainAggregateSource() {
    return R"JAVA(package com.example.legacy;

public class SomeDomainAggregate {

    private final String id;
    private int stock;

    public SomeDomainAggregate(String id, int stock) {
        this.id = id;
        this.stock = stock;
    }

    public String getId() { return id; }
    public int getStock() { return stock; }

    public void directDbCall() {
        System.out.println("entityManager.persist(this)");
    }
}
)JAVA";
}
