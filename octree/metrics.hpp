#pragma once
#include <vector>
#include <unordered_set>
#include <cassert>

// fraction of the exact ids that show up in 'got'. order is ignored.
// an empty exact list counts as fully recalled only when 'got' is empty too
inline float recall_at_k(const std::vector<int>& exact, const std::vector<int>& got) {
    if (exact.empty()) return got.empty() ? 1.0f : 0.0f;
    std::unordered_set<int> wanted(exact.begin(), exact.end());
    int hit = 0;
    for (int id : got) hit += (int)wanted.count(id);
    return (float)hit / (float)wanted.size();
}

// recall@k averaged over all queries. the octree search is exact, so
// anything below 1.0 is a bug
inline float compute_average_recall_at_k(
    const std::vector<std::vector<int>>& exact,
    const std::vector<std::vector<int>>& got)
{
    assert(exact.size() == got.size());
    if (exact.empty()) return 1.0f;

    float sum = 0.0f;
    for (size_t qi = 0; qi < exact.size(); ++qi) sum += recall_at_k(exact[qi], got[qi]);
    return sum / (float)exact.size();
}

// ids of a list of results, in result order
template <typename Result, typename IdFn>
std::vector<std::vector<int>> resultIds(const std::vector<std::vector<Result>>& results, IdFn idOf) {
    std::vector<std::vector<int>> ids(results.size());
    for (size_t qi = 0; qi < results.size(); ++qi) {
        ids[qi].reserve(results[qi].size());
        for (const auto& r : results[qi]) ids[qi].push_back(idOf(r));
    }
    return ids;
}
