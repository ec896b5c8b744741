#include <eonsim/core/spectrum_ledger.hpp>
#include <eonsim/core/config.hpp>
#include <eonsim/core/error.hpp>
#include <eonsim/core/topology.hpp>

#include <algorithm>
#include <bit>
#include <tuple>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace eonsim::core {

namespace {

constexpr std::size_t BITS = 64;

// Calls fn(word_index, mask) for each word overlapped by [start, start + count)
template<typename Fn>
void for_each_word_mask(std::size_t start, std::size_t count, Fn&& fn) {
    const std::size_t end = start + count;
    while (start < end) {
        std::size_t word = start / BITS;
        std::size_t bit = start % BITS;
        std::size_t width = std::min(BITS - bit, end - start);
        uint64_t mask = width == BITS ? ~uint64_t{0} : ((uint64_t{1} << width) - 1) << bit;
        fn(word, mask);
        start += width;
    }
}

// First set bit at or after `from`, or `limit` if there is none below it
std::size_t next_set(std::span<const uint64_t> words, std::size_t from, std::size_t limit) {
    std::size_t word = from / BITS;
    if (word >= words.size()) {
        return limit;
    }
    uint64_t current = words[word] & (~uint64_t{0} << (from % BITS));
    while (true) {
        if (current != 0) {
            return std::min(limit, word * BITS + static_cast<std::size_t>(std::countr_zero(current)));
        }
        if (++word == words.size()) {
            return limit;
        }
        current = words[word];
    }
}

// First clear bit at or after `from`, or `limit` if there is none below it
std::size_t next_clear(std::span<const uint64_t> words, std::size_t from, std::size_t limit) {
    std::size_t word = from / BITS;
    if (word >= words.size()) {
        return limit;
    }
    uint64_t current = ~words[word] & (~uint64_t{0} << (from % BITS));
    while (true) {
        if (current != 0) {
            return std::min(limit, word * BITS + static_cast<std::size_t>(std::countr_zero(current)));
        }
        if (++word == words.size()) {
            return limit;
        }
        current = ~words[word];
    }
}

} // anonymous namespace

SpectrumLedger::SpectrumLedger(std::size_t link_count, std::size_t slot_capacity)
    : link_count_(link_count)
    , slot_capacity_(slot_capacity)
    , words_per_link_((slot_capacity + WORD_BITS - 1) / WORD_BITS) {
    if (slot_capacity_ == 0) {
        throw ConfigError("slot_capacity must be positive");
    }
    bits_.assign(link_count_ * words_per_link_, Word{0});
}

SpectrumLedger::SpectrumLedger(const Topology& topology, const EonConfig& config)
    : SpectrumLedger(topology.link_count(), config.slot_capacity) {}

template<typename Fn>
void SpectrumLedger::for_each_free_start(std::span<const Word> merged, std::size_t slots_needed,
                                         Fn&& fn) const {
    std::size_t pos = 0;
    while (pos < slot_capacity_) {
        pos = next_clear(merged, pos, slot_capacity_);
        if (pos >= slot_capacity_ || slot_capacity_ - pos < slots_needed) {
            return;
        }
        std::size_t run_end = next_set(merged, pos, slot_capacity_);
        for (std::size_t start = pos; start + slots_needed <= run_end; ++start) {
            if (!fn(start)) {
                return;
            }
        }
        pos = run_end;
    }
}

std::optional<std::size_t> SpectrumLedger::find_first_fit(std::span<const LinkIndex> links,
                                                          std::size_t slots_needed) const {
    if (!valid_window(links, 0, slots_needed)) {
        return std::nullopt;
    }

    std::optional<std::size_t> result;
    auto merged = merged_rows(links);
    for_each_free_start(merged, slots_needed, [&result](std::size_t start) {
        result = start;
        return false;
    });
    return result;
}

std::vector<std::size_t> SpectrumLedger::find_best_fit_positions(std::span<const LinkIndex> links,
                                                                 std::size_t slots_needed,
                                                                 std::size_t max_positions) const {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif

    if (max_positions == 0 || !valid_window(links, 0, slots_needed)) {
        return {};
    }

    const std::size_t current = max_link_watermark(links);

    // (increase, resulting watermark, offset)
    using Ranked = std::tuple<std::size_t, std::size_t, std::size_t>;
    std::vector<std::size_t> no_increase;
    std::vector<Ranked> increase;

    auto merged = merged_rows(links);
    for_each_free_start(merged, slots_needed, [&](std::size_t start) {
        std::size_t end = start + slots_needed;
        if (end <= current) {
            no_increase.push_back(start);
        } else {
            increase.emplace_back(end - current, end, start);
        }
        return true;
    });

    // Starts arrive in ascending order, so no_increase is already sorted
    std::vector<std::size_t> result;
    result.reserve(max_positions);
    for (std::size_t start : no_increase) {
        if (result.size() == max_positions) {
            return result;
        }
        result.push_back(start);
    }

    std::sort(increase.begin(), increase.end());
    for (const auto& [delta, resulting, start] : increase) {
        if (result.size() == max_positions) {
            break;
        }
        result.push_back(start);
    }
    return result;
}

bool SpectrumLedger::commit(std::span<const LinkIndex> links, std::size_t start,
                            std::size_t slots_needed) {
    if (!valid_window(links, start, slots_needed)) {
        return false;
    }

    for (LinkIndex link : links) {
        auto words = row(link);
        bool clash = false;
        for_each_word_mask(start, slots_needed, [&](std::size_t word, Word mask) {
            clash = clash || (words[word] & mask) != 0;
        });
        if (clash) {
            return false;
        }
    }

    for (LinkIndex link : links) {
        auto words = row(link);
        for_each_word_mask(start, slots_needed, [&](std::size_t word, Word mask) {
            words[word] |= mask;
        });
    }
    watermark_ = std::max(watermark_, start + slots_needed);
    return true;
}

bool SpectrumLedger::release(std::span<const LinkIndex> links, std::size_t start,
                             std::size_t slots_needed) {
    if (!valid_window(links, start, slots_needed)) {
        return false;
    }

    for (LinkIndex link : links) {
        auto words = row(link);
        for_each_word_mask(start, slots_needed, [&](std::size_t word, Word mask) {
            words[word] &= ~mask;
        });
    }
    recompute_watermark();
    return true;
}

void SpectrumLedger::reset() noexcept {
    std::fill(bits_.begin(), bits_.end(), Word{0});
    watermark_ = 0;
}

double SpectrumLedger::watermark_ratio() const noexcept {
    return static_cast<double>(watermark_) / static_cast<double>(slot_capacity_);
}

std::size_t SpectrumLedger::link_watermark(LinkIndex link) const noexcept {
    if (link >= link_count_) {
        return 0;
    }
    return row_watermark(row(link));
}

bool SpectrumLedger::is_occupied(LinkIndex link, std::size_t slot) const noexcept {
    if (link >= link_count_ || slot >= slot_capacity_) {
        return false;
    }
    return (row(link)[slot / WORD_BITS] >> (slot % WORD_BITS)) & Word{1};
}

std::size_t SpectrumLedger::occupied_cells() const noexcept {
    std::size_t count = 0;
    for (Word word : bits_) {
        count += static_cast<std::size_t>(std::popcount(word));
    }
    return count;
}

double SpectrumLedger::utilization() const noexcept {
    const std::size_t total = link_count_ * slot_capacity_;
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(occupied_cells()) / static_cast<double>(total);
}

double SpectrumLedger::link_utilization(LinkIndex link) const noexcept {
    if (link >= link_count_) {
        return 0.0;
    }
    std::size_t count = 0;
    for (Word word : row(link)) {
        count += static_cast<std::size_t>(std::popcount(word));
    }
    return static_cast<double>(count) / static_cast<double>(slot_capacity_);
}

bool SpectrumLedger::valid_window(std::span<const LinkIndex> links, std::size_t start,
                                  std::size_t slots_needed) const noexcept {
    if (links.empty() || slots_needed == 0) {
        return false;
    }
    if (start > slot_capacity_ || slots_needed > slot_capacity_ - start) {
        return false;
    }
    return std::all_of(links.begin(), links.end(),
                       [this](LinkIndex link) { return link < link_count_; });
}

std::span<SpectrumLedger::Word> SpectrumLedger::row(LinkIndex link) noexcept {
    return std::span<Word>(bits_).subspan(link * words_per_link_, words_per_link_);
}

std::span<const SpectrumLedger::Word> SpectrumLedger::row(LinkIndex link) const noexcept {
    return std::span<const Word>(bits_).subspan(link * words_per_link_, words_per_link_);
}

std::vector<SpectrumLedger::Word> SpectrumLedger::merged_rows(std::span<const LinkIndex> links) const {
    std::vector<Word> merged(words_per_link_, Word{0});
    for (LinkIndex link : links) {
        auto words = row(link);
        for (std::size_t i = 0; i < words_per_link_; ++i) {
            merged[i] |= words[i];
        }
    }
    return merged;
}

std::size_t SpectrumLedger::max_link_watermark(std::span<const LinkIndex> links) const noexcept {
    std::size_t result = 0;
    for (LinkIndex link : links) {
        result = std::max(result, link_watermark(link));
    }
    return result;
}

std::size_t SpectrumLedger::row_watermark(std::span<const Word> words) const noexcept {
    for (std::size_t i = words.size(); i > 0; --i) {
        Word word = words[i - 1];
        if (word != 0) {
            return (i - 1) * WORD_BITS + (WORD_BITS - static_cast<std::size_t>(std::countl_zero(word)));
        }
    }
    return 0;
}

void SpectrumLedger::recompute_watermark() noexcept {
    watermark_ = 0;
    for (LinkIndex link = 0; link < link_count_; ++link) {
        watermark_ = std::max(watermark_, row_watermark(row(link)));
    }
}

} // namespace eonsim::core
