#include <gtest/gtest.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "../analysis/History.hpp"
#include "../analysis/Simulation.hpp"
#include "../core/BasicStrategy.hpp"
#include "../core/NaiveProvider.hpp"

using namespace blackjack::core;
using blackjack::analysis::HistoryWriter;
using blackjack::analysis::ReadHistory;
using blackjack::analysis::Simulation;
using blackjack::analysis::SimulationOptions;

namespace
{
    namespace fs = std::filesystem;

    auto ArtifactPath(std::string const& name) -> std::string
    {
        fs::create_directories("_artifacts");
        return (fs::path("_artifacts") / name).string();
    }

    auto TwoSeats(uint64_t seed) -> std::vector<SeatSpec>
    {
        std::vector<SeatSpec> seats;
        seats.push_back(SeatSpec{"basic", 1000, std::make_unique<BasicStrategyProvider>()});
        seats.push_back(SeatSpec{"naive", 1000, std::make_unique<NaiveProvider>(seed)});
        return seats;
    }

    auto SeededConfig(uint64_t seed) -> Config
    {
        Config cfg{};
        cfg.seed = seed;
        return cfg;
    }
}

TEST(History, SimulationWritesEveryRound)
{
    std::string const path = ArtifactPath("history_sim.bin");
    std::string const log = ArtifactPath("history_sim.log");
    uint64_t played{};
    std::vector<RoundRecord> played_records;
    {
        Simulation sim(SeededConfig(77), TwoSeats(77), SimulationOptions{.history_path = path, .log_path = log});
        played = sim.Run(40);
        played_records = sim.Records();
        EXPECT_EQ(sim.Analyzer().Rounds(), played);
    }
    ASSERT_EQ(played, 40u);

    auto const read = ReadHistory(path);
    ASSERT_TRUE(read.has_value()) << read.error().message;
    ASSERT_EQ(read->size(), played_records.size());
    for (std::size_t i{}; i < read->size(); ++i)
    {
        RoundRecord const& a = (*read)[i];
        RoundRecord const& b = played_records[i];
        EXPECT_EQ(a.round_number, i + 1);
        EXPECT_EQ(a.dealer.final_hand, b.dealer.final_hand);
        ASSERT_EQ(a.participants.size(), b.participants.size());
        for (std::size_t p{}; p < a.participants.size(); ++p)
        {
            EXPECT_EQ(a.participants[p].chips_after, b.participants[p].chips_after);
            EXPECT_EQ(a.participants[p].hands.size(), b.participants[p].hands.size());
        }
    }
    EXPECT_GT(fs::file_size(log), 0u);
}

TEST(History, WriterCountsAndReaderRejectsTruncation)
{
    std::string const path = ArtifactPath("history_trunc.bin");
    {
        Simulation sim(SeededConfig(5), TwoSeats(5));
        sim.Run(3);

        HistoryWriter w(path);
        for (RoundRecord const& r : sim.Records()) w.Append(r);
        w.Flush();
        EXPECT_EQ(w.Written(), 3u);
    }
    auto const whole = ReadHistory(path);
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(whole->size(), 3u);

    // chop the last record in half
    auto const size = fs::file_size(path);
    fs::resize_file(path, size - 10);
    auto const cut = ReadHistory(path);
    ASSERT_FALSE(cut.has_value());
    EXPECT_NE(cut.error().message.find("truncated"), std::string::npos);
}

TEST(History, EmptyFileHoldsNoRounds)
{
    std::string const path = ArtifactPath("history_empty.bin");
    {
        HistoryWriter w(path);
    }
    auto const read = ReadHistory(path);
    ASSERT_TRUE(read.has_value());
    EXPECT_TRUE(read->empty());
}

TEST(History, MissingFileAndBadPath)
{
    auto const read = ReadHistory("_artifacts/does_not_exist.bin");
    ASSERT_FALSE(read.has_value());
    EXPECT_NE(read.error().message.find("cannot open"), std::string::npos);

    EXPECT_THROW(HistoryWriter{"_artifacts/no_such_dir/x/history.bin"}, error::SerializationError);
}

TEST(History, CorruptRecordIsReported)
{
    std::string const path = ArtifactPath("history_corrupt.bin");
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        // claims 8 bytes of body, all garbage
        char const bytes[12] = {8, 0, 0, 0, 1, 2, 3, 4, 5, 6, 7, 8};
        out.write(bytes, sizeof(bytes));
    }
    auto const read = ReadHistory(path);
    ASSERT_FALSE(read.has_value());
    EXPECT_NE(read.error().message.find("record 0"), std::string::npos);
}

TEST(Simulation, RoundByRoundSessionHasOneFooter)
{
    std::string const log = ArtifactPath("round_by_round.log");
    {
        Simulation sim(SeededConfig(21), TwoSeats(21), SimulationOptions{.log_path = log});
        for (int r{}; r < 4; ++r) ASSERT_EQ(sim.Run(1), 1u);
        sim.Finish();
        sim.Finish();
        EXPECT_EQ(sim.Records().size(), 4u);
    }

    std::ifstream in(log);
    std::stringstream buf;
    buf << in.rdbuf();
    std::string const text = buf.str();
    auto count = [&](std::string const& needle)
    {
        std::size_t n{};
        for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) ++n;
        return n;
    };
    EXPECT_EQ(count("Seed=21"), 1u);
    EXPECT_EQ(count("Round "), 4u);
    EXPECT_EQ(count("Final chips="), 1u);
    EXPECT_GT(text.rfind("Final chips="), text.rfind("Deal:"));
}

TEST(Simulation, InteractiveStopsWhenDeclined)
{
    std::istringstream in{"y\nY\nn\n"};
    std::ostringstream out;
    Simulation sim(SeededConfig(11), TwoSeats(11));
    EXPECT_EQ(sim.RunInteractive(in, out), 3u);
    EXPECT_EQ(sim.Records().size(), 3u);
    EXPECT_NE(out.str().find("Play another round? (y/n): "), std::string::npos);
    EXPECT_NE(out.str().find("Round 3 done."), std::string::npos);
}

TEST(Simulation, StopsWhenNobodyCanBet)
{
    Config cfg = SeededConfig(3);
    cfg.bet_sizes = {100};
    std::vector<SeatSpec> seats;
    seats.push_back(SeatSpec{"naive", 300, std::make_unique<NaiveProvider>(3)});
    Simulation sim(cfg, std::move(seats));

    uint64_t const played = sim.Run(100000);
    EXPECT_LT(played, 100000u);
    EXPECT_FALSE(sim.TableNow().CanAnySeatBet());
    EXPECT_EQ(sim.Records().size(), played);
    EXPECT_NE(sim.Report().find("Rounds played:   " + std::to_string(played)), std::string::npos);
}
