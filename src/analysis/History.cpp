//
// History.cpp
//

#include "History.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <span>

#include "../core/Exception.hpp"

namespace blackjack::analysis
{
    using namespace blackjack::core;

    HistoryWriter::HistoryWriter(std::string const& path)
        : out_(path, std::ios::out | std::ios::binary | std::ios::trunc)
    {
        if (!out_.is_open())
            BJ_THROW(error::Code::Serialization, std::format("cannot open history file '{}'", path));
    }

    auto HistoryWriter::Append(RoundRecord const& rec) -> void
    {
        flatbuffers::DetachedBuffer const buf = net::BuildRoundRecord(rec, rec.round_number, /*size_prefixed*/ true);
        out_.write(reinterpret_cast<char const*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        if (!out_)
            BJ_THROW(error::Code::Serialization, "history write failed");
        ++written_;
    }

    auto ReadHistory(std::string const& path) -> std::expected<std::vector<RoundRecord>, net::ParseError>
    {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in.is_open())
            return std::unexpected(net::ParseError{std::format("cannot open '{}'", path)});

        std::vector<std::uint8_t> const data{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

        std::vector<RoundRecord> out;
        std::size_t pos = 0;
        while (pos < data.size())
        {
            if (data.size() - pos < sizeof(flatbuffers::uoffset_t))
                return std::unexpected(net::ParseError{std::format("truncated size prefix at byte {}", pos)});

            auto const body = flatbuffers::ReadScalar<flatbuffers::uoffset_t>(data.data() + pos);
            std::size_t const frame = sizeof(flatbuffers::uoffset_t) + body;
            if (data.size() - pos < frame)
                return std::unexpected(net::ParseError{std::format("truncated record at byte {}", pos)});

            std::span<std::byte const> bytes{reinterpret_cast<std::byte const*>(data.data() + pos), frame};
            auto rec = net::DecodeRoundRecord(bytes, /*size_prefixed*/ true);
            if (!rec)
                return std::unexpected(net::ParseError{std::format("record {}: {}", out.size(), rec.error().message)});

            out.push_back(std::move(*rec));
            pos += frame;
        }
        return out;
    }
}
