// breach_corpus.cpp
#include "breachguard/breach_corpus.hpp"

#include <fstream>      // For std::ifstream
#include <string>       // For std::string, std::getline
#include <system_error> // For std::error_code
#include <utility>      // For std::move

#include "breachguard/log.hpp"
#include "breachguard/normalizer.hpp"

namespace breachguard {

namespace {

[[nodiscard]] auto trim(std::string_view text) noexcept -> std::string_view {
    constexpr std::string_view whitespace{" \t\r\n\v\f"};
    const auto first{text.find_first_not_of(whitespace)};
    if (first == std::string_view::npos) return {};
    const auto last{text.find_last_not_of(whitespace)};
    return text.substr(first, last - first + 1);
}

} // namespace

auto BreachCorpus::from_entries(std::span<const std::string_view> entries) -> BreachCorpus {
    BreachCorpus corpus;
    for (const auto entry : entries) {
        corpus.insert_line(entry);
    }
    return corpus;
}

auto BreachCorpus::from_files(std::span<const std::filesystem::path> paths) -> BreachCorpus {
    BreachCorpus corpus;

    for (const auto& path : paths) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            log_warn("Breach corpus {} not found, skipping", path.string());
            continue;
        }

        std::ifstream input{path};
        if (!input) {
            log_warn("Breach corpus {} is not readable, skipping", path.string());
            continue;
        }

        const auto loaded{corpus.load_stream(input)};
        log_info("Loaded {} entries from breach corpus {}", loaded, path.string());
    }

    if (corpus.empty()) {
        log_warn("No breach corpus entries loaded, offline matching is disabled");
    }

    return corpus;
}

auto BreachCorpus::load_stream(std::istream& input) -> std::size_t {
    const auto before{entries_.size()};

    // A truncated or failing stream keeps whatever was read before the failure
    std::string line;
    while (std::getline(input, line)) {
        insert_line(line);
    }
    if (input.bad()) {
        log_warn("Breach corpus read failed after {} entries", entries_.size() - before);
    }

    return entries_.size() - before;
}

void BreachCorpus::insert_line(std::string_view line) {
    const auto entry{trim(line)};
    if (entry.empty() || entry.starts_with('#')) return;
    entries_.insert(to_lower_ascii(entry));
}

CorpusLoader::CorpusLoader(std::vector<std::filesystem::path> paths)
    : paths_{std::move(paths)} {}

CorpusLoader::CorpusLoader(std::shared_ptr<const BreachCorpus> corpus)
    : corpus_{corpus ? std::move(corpus) : std::make_shared<const BreachCorpus>()} {
    std::call_once(once_, [] {});
}

auto CorpusLoader::get() const -> std::shared_ptr<const BreachCorpus> {
    std::call_once(once_, [this] {
        corpus_ = std::make_shared<const BreachCorpus>(BreachCorpus::from_files(paths_));
    });
    return corpus_;
}

auto CorpusLoader::process_wide(std::vector<std::filesystem::path> paths) -> std::shared_ptr<const CorpusLoader> {
    static const auto loader{std::make_shared<const CorpusLoader>(std::move(paths))};
    return loader;
}

} // namespace breachguard
