#include "TagDatabase.h"
#include "StringUtils.h"

#include <algorithm>

void TagDatabase::add(Entry entry) {
    entries_.push_back(std::move(entry));
}

std::vector<std::pair<int, int32_t>> TagDatabase::rank(const TagQuery& query) const {
    std::vector<std::pair<int, int32_t>> ranked;

    for (const auto& entry : entries_) {
        bool matches = true;
        int score = 0;
        for (const auto& item : query) {
            auto it = entry.tags.find(item.key);
            bool hit = it != entry.tags.end() && it->second == item.value;
            if (hit) {
                ++score;
            } else if (!item.optional) {
                matches = false;
                break;
            }
        }
        if (!matches) continue;

        bool seen = std::any_of(ranked.begin(), ranked.end(),
                                [&](const auto& r) { return r.second == entry.dataId; });
        if (!seen) {
            ranked.emplace_back(score, entry.dataId);
        }
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });
    return ranked;
}

std::vector<int32_t> TagDatabase::queryMatchAll(const TagQuery& query) const {
    std::vector<std::pair<int, int32_t>> ranked = rank(query);
    std::vector<int32_t> ids;
    ids.reserve(ranked.size());
    for (const auto& r : ranked) {
        ids.push_back(r.second);
    }
    return ids;
}

std::vector<int32_t> TagDatabase::queryBestMatches(const TagQuery& query) const {
    std::vector<std::pair<int, int32_t>> ranked = rank(query);
    std::vector<int32_t> ids;
    for (const auto& r : ranked) {
        if (r.first != ranked.front().first) break;
        ids.push_back(r.second);
    }
    return ids;
}

std::vector<int32_t> TagDatabase::collectAllDataIds() const {
    std::vector<int32_t> ids;
    for (const auto& entry : entries_) {
        if (std::find(ids.begin(), ids.end(), entry.dataId) == ids.end()) {
            ids.push_back(entry.dataId);
        }
    }
    return ids;
}

TagQuery tagQueryFromPairs(const std::vector<std::pair<std::string, std::string>>& pairs) {
    TagQuery query;
    query.reserve(pairs.size());
    for (const auto& [key, value] : pairs) {
        query.push_back({StringUtils::toLower(key), StringUtils::toLower(value), false});
    }
    return query;
}
