// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file set_differ.cpp
/// @brief Hash-identified diff of unordered collections.
///
/// Elements present on both sides (same structural hash and equal content)
/// produce nothing. The leftovers of each side are taken in hash-rank order
/// and paired by position: the k-th removed and the k-th added element form
/// one Update at the synthetic index [k]. Surplus added elements are Adds and
/// surplus removed elements are Deletes at their own synthetic indices.
///
/// A changed set with an element holding an Unknown has no element identity
/// and produces one Update at the set's own path.
///
/// Synthetic indices only make the diff addressable; they do not identify
/// elements.

#include <provbridge/differ.h>
#include <provbridge/value_hash.h>

#include <algorithm>
#include <optional>

namespace provbridge {

namespace {

/// Canonical element order: hash first, then content
int compare_elements(const HashedElement& a, const HashedElement& b)
{
    if (a.hash != b.hash) {
        return a.hash < b.hash ? -1 : 1;
    }
    const auto c = compare_values(*a.value, *b.value);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

/// Elements in canonical order, or nullopt if one of them has no identity
std::optional<std::vector<HashedElement>> identities(const ValueSet& set)
{
    auto hashed = hashed_elements(set);
    if (!hashed) {
        return std::nullopt;
    }
    // Canonical sets are already sorted; sort anyway for sets built by hand
    std::sort(hashed->begin(), hashed->end(), [](const HashedElement& a, const HashedElement& b) {
        return compare_elements(a, b) < 0;
    });
    return hashed;
}

} // anonymous namespace

void DetailedDiffer::diff_set(const ValueSet& old_set, const ValueSet& new_set,
                              const PropertyPath& path, DiffEntryMap& out) const
{
    if (old_set == new_set) {
        return;
    }

    const auto old_hashed = identities(old_set);
    const auto new_hashed = identities(new_set);
    if (!old_hashed || !new_hashed) {
        // Elements holding unknowns cannot be matched; the set changes as a whole
        detail::log_access_error("diff_set", "set element without identity at " + path.to_string());
        emit(out, path, DiffKind::Update, Value{old_set}, Value{new_set});
        return;
    }
    const auto& old_ids = *old_hashed;
    const auto& new_ids = *new_hashed;

    std::vector<const HashedElement*> removed;
    std::vector<const HashedElement*> added;

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < old_ids.size() || j < new_ids.size()) {
        if (j == new_ids.size()) {
            removed.push_back(&old_ids[i++]);
        } else if (i == old_ids.size()) {
            added.push_back(&new_ids[j++]);
        } else {
            const int c = compare_elements(old_ids[i], new_ids[j]);
            if (c == 0) {
                ++i;
                ++j;
            } else if (c < 0) {
                removed.push_back(&old_ids[i++]);
            } else {
                added.push_back(&new_ids[j++]);
            }
        }
    }

    const std::size_t pairs = std::min(removed.size(), added.size());
    for (std::size_t k = 0; k < pairs; ++k) {
        emit(out, path.index(k), DiffKind::Update, *removed[k]->value, *added[k]->value);
    }
    for (std::size_t k = pairs; k < added.size(); ++k) {
        emit(out, path.index(k), DiffKind::Add, Value{}, *added[k]->value);
    }
    for (std::size_t k = pairs; k < removed.size(); ++k) {
        emit(out, path.index(k), DiffKind::Delete, *removed[k]->value, Value{});
    }
}

} // namespace provbridge
