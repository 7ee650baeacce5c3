#ifndef KASINO_COMBINATORICS_HPP
#define KASINO_COMBINATORICS_HPP

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <span>
#include <vector>

// Set/number search over value-bearing items. Nothing in here knows about
// cards or players: callers supply a projection from item to integer value
// (and, for disjointness, from item to a comparable key).
namespace kasino::core::search
{
    template <typename F, typename T>
    concept ValueProjection = std::regular_invocable<F&, T const&> &&
        std::convertible_to<std::invoke_result_t<F&, T const&>, int>;

    template <typename F, typename T>
    concept KeyProjection = std::regular_invocable<F&, T const&> &&
        std::totally_ordered<std::remove_cvref_t<std::invoke_result_t<F&, T const&>>>;

    template <typename T>
    using Group = std::vector<T>;

    template <typename T>
    using GroupList = std::vector<Group<T>>;

    namespace detail
    {
        template <typename T, typename Proj>
        auto SortedDescending(std::span<T const> items, Proj& value) -> std::vector<T>
        {
            std::vector<T> sorted(items.begin(), items.end());
            std::ranges::stable_sort(sorted, std::greater<>{},
                                     [&value](T const& t) { return static_cast<int>(std::invoke(value, t)); });
            return sorted;
        }

        template <typename T, typename Proj>
        auto CollectSubsets(std::vector<T> const& items,
                            std::vector<int> const& suffix,
                            Proj& value,
                            int remaining,
                            size_t start,
                            Group<T>& current,
                            GroupList<T>& out) -> void
        {
            if (remaining == 0 && !current.empty())
            {
                out.push_back(current);
                return;
            }
            if (start >= items.size()) return;
            // Everything left, taken together, still falls short
            if (suffix[start] < remaining) return;

            for (size_t i{start}; i < items.size(); ++i)
            {
                int const v = std::invoke(value, items[i]);
                if (v > remaining) continue;
                current.push_back(items[i]);
                CollectSubsets(items, suffix, value, remaining - v, i + 1, current, out);
                current.pop_back();
            }
        }

        template <typename T, typename Proj>
        auto PlaceItems(std::vector<T> const& items,
                        Proj& value,
                        int target,
                        size_t index,
                        GroupList<T>& groups,
                        std::vector<int>& sums) -> bool
        {
            if (index == items.size()) return true;

            int const v = std::invoke(value, items[index]);
            std::vector<int> tried;
            tried.reserve(groups.size());

            for (size_t g{}; g < groups.size(); ++g)
            {
                if (sums[g] + v > target) continue;
                // Two groups at the same running sum are interchangeable here
                if (std::ranges::find(tried, sums[g]) != tried.end()) continue;
                tried.push_back(sums[g]);

                groups[g].push_back(items[index]);
                sums[g] += v;
                if (PlaceItems(items, value, target, index + 1, groups, sums)) return true;
                groups[g].pop_back();
                sums[g] -= v;
            }
            return false;
        }

        template <typename T, typename KeyProj, typename Key>
        auto SearchDisjoint(GroupList<T> const& combos,
                            KeyProj& key,
                            size_t start,
                            std::vector<size_t>& chosen,
                            std::set<Key>& used,
                            size_t chosen_items,
                            size_t& best,
                            std::vector<std::vector<size_t>>& results) -> void
        {
            if (chosen_items > best)
            {
                best = chosen_items;
                results.clear();
                results.push_back(chosen);
            }
            else if (chosen_items == best && !chosen.empty())
            {
                results.push_back(chosen);
            }

            for (size_t i{start}; i < combos.size(); ++i)
            {
                Group<T> const& combo = combos[i];
                bool const overlaps = std::ranges::any_of(combo, [&](T const& t)
                {
                    return used.contains(std::invoke(key, t));
                });
                if (overlaps) continue;

                for (T const& t : combo) used.insert(std::invoke(key, t));
                chosen.push_back(i);
                SearchDisjoint(combos, key, i + 1, chosen, used, chosen_items + combo.size(), best, results);
                chosen.pop_back();
                for (T const& t : combo) used.erase(std::invoke(key, t));
            }
        }
    }

    // Every subset of at least min_size items whose values sum to target.
    // Items are tried largest first; a branch is cut once the remaining items
    // cannot reach the target, and an item larger than what is left is skipped.
    template <typename T, ValueProjection<T> Proj>
    auto FindSumCombinations(std::span<T const> items, int target, Proj value, size_t min_size = 2)
        -> GroupList<T>
    {
        if (items.empty() || target <= 0) return {};

        std::vector<T> const sorted = detail::SortedDescending(items, value);
        std::vector<int> suffix(sorted.size() + 1, 0);
        for (size_t i = sorted.size(); i-- > 0;)
        {
            suffix[i] = suffix[i + 1] + static_cast<int>(std::invoke(value, sorted[i]));
        }

        GroupList<T> found;
        Group<T> current;
        detail::CollectSubsets(sorted, suffix, value, target, 0, current, found);

        std::erase_if(found, [min_size](Group<T> const& g) { return g.size() < min_size; });
        return found;
    }

    // Splits items into exactly total/target groups, each summing to target.
    // Returns the first assignment found, or nullopt when none exists. An
    // empty input partitions into zero groups.
    template <typename T, ValueProjection<T> Proj>
    auto FindExactPartition(std::span<T const> items, int target, Proj value)
        -> std::optional<GroupList<T>>
    {
        if (items.empty()) return GroupList<T>{};
        if (target <= 0) return std::nullopt;

        int total{};
        for (T const& t : items)
        {
            int const v = std::invoke(value, t);
            if (v > target || v <= 0) return std::nullopt;
            total += v;
        }
        if (total % target != 0) return std::nullopt;

        std::vector<T> const sorted = detail::SortedDescending(items, value);
        auto const n_groups = static_cast<size_t>(total / target);
        GroupList<T> groups(n_groups);
        std::vector<int> sums(n_groups, 0);

        if (!detail::PlaceItems(sorted, value, target, 0, groups, sums)) return std::nullopt;
        return groups;
    }

    // Among combos, picks every selection of pairwise-disjoint combos whose
    // total item count is maximal. Each selection is a list of combos, in the
    // order they appear in the input.
    template <typename T, KeyProjection<T> KeyProj>
    auto FindMaxDisjointSets(GroupList<T> const& combos, KeyProj key) -> std::vector<GroupList<T>>
    {
        if (combos.empty()) return {};
        if (combos.size() == 1) return {combos};

        using Key = std::remove_cvref_t<std::invoke_result_t<KeyProj&, T const&>>;
        std::vector<size_t> chosen;
        std::set<Key> used;
        size_t best{};
        std::vector<std::vector<size_t>> picks;
        detail::SearchDisjoint(combos, key, 0, chosen, used, 0, best, picks);

        std::vector<GroupList<T>> out;
        out.reserve(picks.size());
        for (std::vector<size_t> const& pick : picks)
        {
            GroupList<T> selection;
            selection.reserve(pick.size());
            for (size_t i : pick) selection.push_back(combos[i]);
            out.push_back(std::move(selection));
        }
        if (out.empty()) out.push_back({combos.front()});
        return out;
    }
}

#endif //KASINO_COMBINATORICS_HPP
