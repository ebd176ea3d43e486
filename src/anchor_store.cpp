#include "anchor_store.hpp"
#include "corpus_text.hpp"
#include "edge.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <vector>

namespace tei_standoff {

AnchorStore::AnchorStore() {
    reset({}, 0);
}

AnchorStore::AnchorStore(std::string prefix, std::size_t max_identifiers)
    : prefix_(strip_separators(prefix)) {
    reset(prefix, max_identifiers);
}

void AnchorStore::reset(std::string_view seed, std::size_t max_identifiers) {
    std::vector<std::uint32_t> seed_data;
    seed_data.reserve(seed.size());
    for (unsigned char c : seed) {
        seed_data.push_back(c);
    }
    std::seed_seq sequence(seed_data.begin(), seed_data.end());
    generator_.seed(sequence);

    if (max_identifiers > 0) {
        // one hex digit per 4 bits: log16(n) digits, plus slack against birthday collisions
        const double digits = std::log(static_cast<double>(max_identifiers)) / std::log(16.0) + 1.5;
        identifier_length_ = std::max<std::size_t>(1, static_cast<std::size_t>(digits));
    } else {
        identifier_length_ = kDefaultIdentifierLength;
    }
}

const std::string& AnchorStore::anchor_at(std::size_t position) {
    const auto found = position_to_anchor_.find(position);
    if (found != position_to_anchor_.end()) {
        return found->second;
    }

    std::string anchor = new_identifier(prefix_, anchor_to_position_);
    anchor_to_position_.emplace(anchor, position);
    return position_to_anchor_.emplace(position, std::move(anchor)).first->second;
}

void AnchorStore::adopt(PositionToAnchor position_to_anchor, AnchorToPosition anchor_to_position) {
    position_to_anchor_ = std::move(position_to_anchor);
    anchor_to_position_ = std::move(anchor_to_position);
}

bool AnchorStore::find_position(const std::string& anchor, std::size_t& out_position) const {
    const auto found = anchor_to_position_.find(anchor);
    if (found == anchor_to_position_.end()) {
        return false;
    }
    out_position = found->second;
    return true;
}

std::string AnchorStore::strip_separators(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    // anchors end at the next delimiter or whitespace in corpus text and edges
    for (char c : text) {
        if (c != kEdgeSeparator && c != kSpanSeparator && c != kAnchorDelimiter &&
            !std::isspace(static_cast<unsigned char>(c))) {
            out.push_back(c);
        }
    }
    return out;
}

std::string AnchorStore::random_hex() {
    static constexpr char kDigits[] = "0123456789abcdef";

    std::string out;
    out.reserve(identifier_length_);
    while (out.size() < identifier_length_) {
        std::uint64_t bits = generator_();
        const std::size_t take = std::min<std::size_t>(16, identifier_length_ - out.size());
        for (std::size_t i = 0; i < take; ++i) {
            out.push_back(kDigits[bits & 0xf]);
            bits >>= 4;
        }
    }
    return out;
}

}  // namespace tei_standoff
