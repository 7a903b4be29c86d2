#include "audio/RateController.hpp"
#include <algorithm>
#include <charconv>

namespace coda::audio {

uint32_t resolve_bit_perfect_rate(uint32_t song_rate, const std::vector<uint32_t>& supported) {
    if (supported.empty() || song_rate == 0) {
        return song_rate;
    }

    if (std::find(supported.begin(), supported.end(), song_rate) != supported.end()) {
        return song_rate;
    }

    // 44.1k material on a 48k-family device still gets an exact multiple
    // when one is available (88.2k, 176.4k)
    uint32_t best_multiple = 0;
    for (uint32_t rate : supported) {
        if (rate > song_rate && rate % song_rate == 0) {
            if (best_multiple == 0 || rate < best_multiple) {
                best_multiple = rate;
            }
        }
    }
    if (best_multiple != 0) {
        return best_multiple;
    }

    return *std::max_element(supported.begin(), supported.end());
}

std::vector<uint32_t> parse_rate_list(const std::string& text) {
    std::vector<uint32_t> rates;

    size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] < '0' || text[pos] > '9') {
            ++pos;
            continue;
        }

        uint32_t rate = 0;
        auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + text.size(), rate);
        size_t consumed = static_cast<size_t>(ptr - (text.data() + pos));
        if (ec == std::errc() && rate > 0) {
            rates.push_back(rate);
        }
        pos += consumed > 0 ? consumed : 1;
    }

    std::sort(rates.begin(), rates.end());
    rates.erase(std::unique(rates.begin(), rates.end()), rates.end());
    return rates;
}

}  // namespace coda::audio
