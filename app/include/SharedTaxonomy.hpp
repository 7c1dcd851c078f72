#ifndef SHARED_TAXONOMY_HPP
#define SHARED_TAXONOMY_HPP

#include "TaxonomyTree.hpp"

#include <mutex>
#include <shared_mutex>
#include <utility>

// Single-writer guard around a TaxonomyTree. Readers share the lock; every structural
// mutation from refinement, the scheduler or the gatekeeper runs under the exclusive lock.
class SharedTaxonomy {
public:
    explicit SharedTaxonomy(TaxonomyTree tree)
        : tree_(std::move(tree)) {}

    SharedTaxonomy(const SharedTaxonomy&) = delete;
    SharedTaxonomy& operator=(const SharedTaxonomy&) = delete;

    template <typename Fn>
    auto read(Fn&& fn) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return std::forward<Fn>(fn)(static_cast<const TaxonomyTree&>(tree_));
    }

    template <typename Fn>
    auto write(Fn&& fn) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return std::forward<Fn>(fn)(tree_);
    }

    TaxonomyTree snapshot() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return tree_;
    }

    void replace(TaxonomyTree tree) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        tree_ = std::move(tree);
    }

private:
    mutable std::shared_mutex mutex_;
    TaxonomyTree tree_;
};

#endif
