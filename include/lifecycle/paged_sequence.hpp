#pragma once

#include "backend/secret_backend.hpp"
#include "core/error.hpp"

#include <cstddef>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kvault {

/**
 * @brief Lazy, finite, restartable sequence over a paginated listing
 *
 * Nothing is fetched until the first pull. The first pull walks every page
 * of every source in order; if any page fails the items gathered so far are
 * discarded and the error is returned, so callers never see a truncated
 * listing as complete. reset() forgets everything and the next pull fetches
 * afresh.
 */
template<typename T>
class PagedSequence {
public:
    using PageFetcher = std::function<Result<Page<T>>(const std::optional<std::string>& cursor)>;
    using Finalizer = std::function<void(std::vector<T>&)>;

    static constexpr size_t kMaxPages = 10000;

    explicit PagedSequence(PageFetcher fetch, Finalizer finalize = {})
        : finalize_(std::move(finalize)) {
        sources_.push_back(std::move(fetch));
    }

    PagedSequence(std::vector<PageFetcher> sources, Finalizer finalize)
        : sources_(std::move(sources)), finalize_(std::move(finalize)) {}

    PagedSequence(PagedSequence&&) = default;
    PagedSequence& operator=(PagedSequence&&) = default;

    /// Next item, std::nullopt once exhausted.
    [[nodiscard]] Result<std::optional<T>> next() {
        if (!loaded_) {
            auto loaded = load();
            if (loaded.is_error()) {
                return Result<std::optional<T>>::error(loaded.error());
            }
        }
        if (position_ >= items_.size()) {
            return Result<std::optional<T>>::ok(std::nullopt);
        }
        return Result<std::optional<T>>::ok(std::optional<T>(std::move(items_[position_++])));
    }

    /// All items not yet pulled.
    [[nodiscard]] Result<std::vector<T>> collect() {
        if (!loaded_) {
            auto loaded = load();
            if (loaded.is_error()) {
                return Result<std::vector<T>>::error(loaded.error());
            }
        }
        std::vector<T> out;
        out.reserve(items_.size() - position_);
        for (; position_ < items_.size(); ++position_) {
            out.push_back(std::move(items_[position_]));
        }
        return Result<std::vector<T>>::ok(std::move(out));
    }

    void reset() {
        items_.clear();
        position_ = 0;
        loaded_ = false;
        pages_fetched_ = 0;
    }

    [[nodiscard]] bool is_loaded() const { return loaded_; }
    [[nodiscard]] size_t pages_fetched() const { return pages_fetched_; }

private:
    Result<void> load() {
        std::vector<T> gathered;
        size_t pages = 0;

        for (const auto& fetch : sources_) {
            std::optional<std::string> cursor;
            do {
                if (++pages > kMaxPages) {
                    return Result<void>::error(ErrorCode::INTERNAL, std::format(
                        "Listing exceeded {} pages", kMaxPages));
                }

                auto page = fetch(cursor);
                if (page.is_error()) {
                    return Result<void>::error(page.error());
                }

                for (auto& item : page.value().items) {
                    gathered.push_back(std::move(item));
                }

                if (page.value().next_cursor && cursor == page.value().next_cursor) {
                    return Result<void>::error(ErrorCode::INTERNAL,
                        "Backend returned the same continuation cursor twice");
                }
                cursor = std::move(page.value().next_cursor);
            } while (cursor);
        }

        if (finalize_) {
            finalize_(gathered);
        }

        items_ = std::move(gathered);
        position_ = 0;
        pages_fetched_ = pages;
        loaded_ = true;
        return Result<void>::ok();
    }

    std::vector<PageFetcher> sources_;
    Finalizer finalize_;

    std::vector<T> items_;
    size_t position_ = 0;
    size_t pages_fetched_ = 0;
    bool loaded_ = false;
};

} // namespace kvault
