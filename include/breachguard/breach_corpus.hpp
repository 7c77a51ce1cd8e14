// breach_corpus.hpp
#ifndef BREACHGUARD_BREACH_CORPUS_HPP
#define BREACHGUARD_BREACH_CORPUS_HPP

#include <filesystem>  // For std::filesystem::path
#include <istream>     // For std::istream
#include <memory>      // For std::shared_ptr
#include <mutex>       // For std::once_flag
#include <span>        // For std::span
#include <string_view> // For std::string_view
#include <vector>      // For std::vector

#include "breachguard/types.hpp"

namespace breachguard {

/**
 * @brief Immutable membership set of known-leaked passwords, keyed by lowercase form.
 * @intuition Exact-match hash lookup keeps per-call cost O(1) regardless of corpus size.
 * @approach Entries are trimmed and lowercased on insert; blank lines and `#` comments are
 * skipped. Missing or unreadable sources contribute nothing and only log a warning.
 */
class BreachCorpus final {
private:
    TransparentStringSet entries_;

public:
    BreachCorpus() = default;

    /// @brief Builds a corpus from in-memory entries (normalized the same way as file lines).
    [[nodiscard]] static auto from_entries(std::span<const std::string_view> entries) -> BreachCorpus;

    /// @brief Builds a corpus by streaming every readable file in `paths`.
    [[nodiscard]] static auto from_files(std::span<const std::filesystem::path> paths) -> BreachCorpus;

    /// @brief Streams one line-delimited source into the set; returns the number of lines inserted.
    auto load_stream(std::istream& input) -> std::size_t;

    /// @brief Exact membership test of an already lowercased entry.
    [[nodiscard]] auto contains(std::string_view lowercase) const noexcept -> bool {
        return entries_.contains(lowercase);
    }

    /// @brief True if either comparison form of the password is a known leaked password.
    [[nodiscard]] auto is_breached_offline(const NormalizedForms& normalized) const noexcept -> bool {
        return contains(normalized.lowercase) || contains(normalized.desubstituted);
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

private:
    void insert_line(std::string_view line);
};

/**
 * @brief Lazily loads a corpus once, then hands out the frozen instance to every caller.
 * @approach `std::call_once` is the single initialization barrier; after it the corpus is only
 * read, so concurrent analyses share it without further locking.
 */
class CorpusLoader final {
private:
    std::vector<std::filesystem::path> paths_;
    mutable std::once_flag once_;
    mutable std::shared_ptr<const BreachCorpus> corpus_;

public:
    explicit CorpusLoader(std::vector<std::filesystem::path> paths);

    /// @brief Wraps an already built corpus; `get()` never touches the filesystem.
    explicit CorpusLoader(std::shared_ptr<const BreachCorpus> corpus);

    CorpusLoader(const CorpusLoader&) = delete;
    auto operator=(const CorpusLoader&) -> CorpusLoader& = delete;

    /// @brief Loads on first call; later calls return the cached corpus.
    [[nodiscard]] auto get() const -> std::shared_ptr<const BreachCorpus>;

    /// @brief Process-wide loader; the paths given by the first caller win.
    [[nodiscard]] static auto process_wide(std::vector<std::filesystem::path> paths)
        -> std::shared_ptr<const CorpusLoader>;
};

} // namespace breachguard

#endif // BREACHGUARD_BREACH_CORPUS_HPP
