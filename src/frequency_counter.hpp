#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// String -> count map that remembers first-seen order, so top-N lists break
// count ties deterministically.
class FrequencyCounter
{
public:
    void add(const std::string& key, long long amount = 1)
    {
        auto it = m_index.find(key);
        if (it == m_index.end())
        {
            m_index.emplace(key, m_entries.size());
            m_entries.emplace_back(key, amount);
            return;
        }
        m_entries[it->second].second += amount;
    }

    long long countOf(const std::string& key) const
    {
        auto it = m_index.find(key);
        return it == m_index.end() ? 0 : m_entries[it->second].second;
    }

    std::size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    // Entries in first-seen order.
    const std::vector<std::pair<std::string, long long>>& entries() const { return m_entries; }

    // Highest counts first; ties keep first-seen order.
    std::vector<std::pair<std::string, long long>> topN(std::size_t n) const
    {
        std::vector<std::pair<std::string, long long>> sorted = m_entries;
        std::stable_sort(
            sorted.begin(), sorted.end(),
            [](const auto& a, const auto& b) {
                return a.second > b.second;
            }
        );
        if (sorted.size() > n)
            sorted.resize(n);
        return sorted;
    }

private:
    std::unordered_map<std::string, std::size_t>   m_index;
    std::vector<std::pair<std::string, long long>> m_entries;
};
