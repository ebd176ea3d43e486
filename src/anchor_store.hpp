#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tei_standoff {

using PositionToAnchor = std::map<std::size_t, std::string>;
using AnchorToPosition = std::unordered_map<std::string, std::size_t>;

// Owns the identifier generator and the position<->anchor maps of one document.
// Never share an instance between documents: uniqueness holds per document only.
class AnchorStore {
public:
    static constexpr std::size_t kDefaultIdentifierLength = 10;

    AnchorStore();
    AnchorStore(std::string prefix, std::size_t max_identifiers);

    // Reseeds the generator and resizes identifiers so that max_identifiers
    // random draws are unlikely to collide. Does not touch the maps.
    void reset(std::string_view seed, std::size_t max_identifiers);

    template <class Set>
    std::string new_identifier(std::string_view prefix, const Set& existing) {
        const std::string clean = strip_separators(prefix);
        while (true) {
            std::string ident = clean + random_hex();
            if (!existing.contains(ident)) {
                return ident;
            }
        }
    }

    // Returns the anchor at position, creating it on first reference.
    const std::string& anchor_at(std::size_t position);

    // Loads maps read back from a corpus text file.
    void adopt(PositionToAnchor position_to_anchor, AnchorToPosition anchor_to_position);

    bool has_anchor(std::size_t position) const { return position_to_anchor_.contains(position); }
    bool find_position(const std::string& anchor, std::size_t& out_position) const;

    const PositionToAnchor& position_to_anchor() const { return position_to_anchor_; }
    const AnchorToPosition& anchor_to_position() const { return anchor_to_position_; }
    std::size_t identifier_length() const { return identifier_length_; }
    const std::string& prefix() const { return prefix_; }

private:
    static std::string strip_separators(std::string_view text);
    std::string random_hex();

    std::string prefix_;
    std::size_t identifier_length_ = kDefaultIdentifierLength;
    std::mt19937_64 generator_;
    PositionToAnchor position_to_anchor_;
    AnchorToPosition anchor_to_position_;
};

}  // namespace tei_standoff
