//
// History.hpp
//

#ifndef BLACKJACKSIM_HISTORY_HPP
#define BLACKJACKSIM_HISTORY_HPP

#include <expected>
#include <fstream>
#include <string>
#include <vector>

#include "../core/State.hpp"
#include "../net/codec.hpp"

namespace blackjack::analysis
{
    // Appends every round as a size-prefixed RoundRecordMsg envelope.
    class HistoryWriter
    {
    public:
        // Throws SerializationError when the file cannot be opened
        explicit HistoryWriter(std::string const& path);

        HistoryWriter(HistoryWriter const&) = delete;
        auto operator=(HistoryWriter const&) -> HistoryWriter& = delete;

        auto Append(core::RoundRecord const& rec) -> void;
        auto Written() const noexcept -> std::size_t { return written_; }
        auto Flush() -> void { out_.flush(); }

    private:
        std::ofstream out_;
        std::size_t written_{0};
    };

    auto ReadHistory(std::string const& path)
        -> std::expected<std::vector<core::RoundRecord>, core::net::ParseError>;
}

#endif //BLACKJACKSIM_HISTORY_HPP
