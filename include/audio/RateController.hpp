#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace coda::audio {

// Graph sample-rate control of the local audio server. Calls block on a
// server round-trip; callers run them off the UI thread.
class RateController {
public:
    virtual ~RateController() = default;

    // Rates the graph may be forced to; empty if unknown
    virtual std::vector<uint32_t> supported_rates() = 0;

    virtual bool set_rate(uint32_t rate) = 0;

    // Lets the server pick its default rate again
    virtual bool reset_rate() = 0;
};

// Rate to force for a song: the song's own rate if supported, else the
// smallest supported integer multiple of it, else the highest supported
// rate. An empty set returns the song rate unchanged.
uint32_t resolve_bit_perfect_rate(uint32_t song_rate, const std::vector<uint32_t>& supported);

// Parses the "[ 44100 48000 ]" array form used by clock.allowed-rates.
// Unparsable items are skipped; result is sorted and unique.
std::vector<uint32_t> parse_rate_list(const std::string& text);

}  // namespace coda::audio
