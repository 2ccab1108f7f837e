#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

// (key, value) condition of a tag lookup. Keys and values are lowercase.
struct TagQueryItem {
    std::string key;
    std::string value;
    bool optional = false;
};

using TagQuery = std::vector<TagQueryItem>;

// Flat list of tagged records, each pointing at a data id (a sound schema)
class TagDatabase {
public:
    struct Entry {
        std::map<std::string, std::string> tags;
        int32_t dataId = 0;
    };

    void add(Entry entry);

    // Ids of entries satisfying every required item, in insertion order, without duplicates.
    // Entries that satisfy more optional items rank first.
    std::vector<int32_t> queryMatchAll(const TagQuery& query) const;

    // Only the matching ids that satisfy the most optional items
    std::vector<int32_t> queryBestMatches(const TagQuery& query) const;

    std::vector<int32_t> collectAllDataIds() const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<std::pair<int, int32_t>> rank(const TagQuery& query) const;

    std::vector<Entry> entries_;
};

// Lowercases both halves of each pair into required query items
TagQuery tagQueryFromPairs(const std::vector<std::pair<std::string, std::string>>& pairs);
