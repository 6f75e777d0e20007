#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../sender/transfer_orchestrator.hpp"
#include "../sender/udp_socket.hpp"
#include "scripted_peer.hpp"
#include "test_files.hpp"

namespace
{
    transfer_options options_for(const scripted_peer &peer, std::vector<std::string> files)
    {
        transfer_options o;
        o.dest_host = "127.0.0.1";
        o.dest_port = peer.port();
        o.timeout_s = 0.5;
        o.bind_host = "127.0.0.1";
        o.files = std::move(files);
        return o;
    }
}

TEST(TransferOrchestratorTest, TransfersSeventyKilobyteFileAsThreePackets)
{
    scripted_peer peer;
    temp_file f(70000);

    auto options = options_for(peer, {f.path()});
    options.chunk_size = 32768;
    std::vector<file_outcome> outcomes = transfer_orchestrator(options).run();

    ASSERT_EQ(outcomes.size(), 1u);
    const file_outcome &o = outcomes[0];
    EXPECT_EQ(o.status, file_status::DELIVERED);
    EXPECT_EQ(o.packets, 3u);
    EXPECT_EQ(o.stats.acknowledged, 3u);
    EXPECT_NE(o.local_port, 0);

    std::vector<packet> arrivals = peer.arrivals();
    ASSERT_EQ(arrivals.size(), 3u);
    EXPECT_EQ(arrivals[0].type(), packet_type::DATA);
    EXPECT_EQ(arrivals[1].type(), packet_type::DATA);
    EXPECT_EQ(arrivals[2].type(), packet_type::FIN);
    EXPECT_EQ(arrivals[0].length(), 32768u);
    EXPECT_EQ(arrivals[1].length(), 32768u);
    EXPECT_EQ(arrivals[2].length(), 4464u);
    for (size_t i = 0; i < arrivals.size(); ++i)
    {
        EXPECT_EQ(arrivals[i].seq(), i);
        EXPECT_EQ(arrivals[i].id(), o.id);
    }

    EXPECT_EQ(peer.reassemble(o.id), f.contents());
}

TEST(TransferOrchestratorTest, MissingFileDoesNotAbortTheBatch)
{
    scripted_peer peer;
    temp_file a(50000), b(1234);
    std::string missing = "/nonexistent/udp_file_sender/missing.bin";

    auto outcomes = transfer_orchestrator(options_for(peer, {a.path(), missing, b.path()})).run();

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(outcomes[0].status, file_status::DELIVERED);
    EXPECT_EQ(outcomes[1].status, file_status::OPEN_FAILED);
    EXPECT_EQ(outcomes[2].status, file_status::DELIVERED);
    EXPECT_EQ(outcomes[1].path, missing);
    EXPECT_FALSE(outcomes[1].error.empty());

    EXPECT_NE(outcomes[0].id, outcomes[2].id);
    EXPECT_NE(outcomes[0].local_port, outcomes[2].local_port);
    EXPECT_EQ(peer.reassemble(outcomes[0].id), a.contents());
    EXPECT_EQ(peer.reassemble(outcomes[2].id), b.contents());
}

TEST(TransferOrchestratorTest, DirectoryIsReportedAsOpenFailure)
{
    scripted_peer peer;
    temp_dir dir;
    temp_file f(100);

    auto outcomes = transfer_orchestrator(options_for(peer, {dir.path(), f.path()})).run();

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].status, file_status::OPEN_FAILED);
    EXPECT_FALSE(outcomes[0].ok());
    EXPECT_FALSE(outcomes[0].error.empty());
    EXPECT_EQ(outcomes[0].packets, 0u);
    EXPECT_EQ(outcomes[1].status, file_status::DELIVERED);
    EXPECT_EQ(peer.arrivals().size(), 1u);
}

TEST(TransferOrchestratorTest, EmptyFileStartsNoConnection)
{
    scripted_peer peer;
    temp_file empty(0), small(10);

    auto outcomes = transfer_orchestrator(options_for(peer, {empty.path(), small.path()})).run();

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].status, file_status::EMPTY);
    EXPECT_EQ(outcomes[0].packets, 0u);
    EXPECT_TRUE(outcomes[0].ok());
    EXPECT_EQ(outcomes[1].status, file_status::DELIVERED);
    EXPECT_EQ(peer.arrivals().size(), 1u);
}

TEST(TransferOrchestratorTest, ManyFilesRunConcurrently)
{
    scripted_peer peer;
    std::vector<std::unique_ptr<temp_file>> files;
    std::vector<std::string> paths;
    for (size_t i = 0; i < 6; ++i)
    {
        files.push_back(std::make_unique<temp_file>(1000 * (i + 1) + 40000 * i));
        paths.push_back(files.back()->path());
    }

    auto outcomes = transfer_orchestrator(options_for(peer, paths)).run();

    ASSERT_EQ(outcomes.size(), files.size());
    for (size_t i = 0; i < files.size(); ++i)
    {
        EXPECT_EQ(outcomes[i].status, file_status::DELIVERED) << outcomes[i].path;
        EXPECT_EQ(peer.reassemble(outcomes[i].id), files[i]->contents());
    }
}

TEST(TransferOrchestratorTest, PortCollisionFailsOnlyThatFile)
{
    scripted_peer peer;
    temp_file a(100);

    // hold a port so the connection for file 0 cannot bind it
    udp_socket holder("127.0.0.1", 0, "127.0.0.1", peer.port());

    auto options = options_for(peer, {a.path(), "/nonexistent/other.bin"});
    options.base_port = holder.local_port();
    auto outcomes = transfer_orchestrator(options).run();

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].status, file_status::BIND_FAILED);
    EXPECT_FALSE(outcomes[0].error.empty());
    EXPECT_EQ(outcomes[1].status, file_status::OPEN_FAILED);
    EXPECT_TRUE(peer.arrivals().empty());
}

TEST(TransferOrchestratorTest, UnansweredConnectionGivesUpWhenCapped)
{
    scripted_peer peer([](const packet &, size_t)
                       {
        peer_action a;
        a.ack = false;
        return a; });
    temp_file a(100);

    auto options = options_for(peer, {a.path()});
    options.timeout_s = 0.05;
    options.max_retransmits = 3;
    auto outcomes = transfer_orchestrator(options).run();

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, file_status::GAVE_UP);
    EXPECT_EQ(outcomes[0].stats.retransmissions, 3u);
    EXPECT_FALSE(outcomes[0].ok());
}

TEST(TransferOrchestratorTest, RejectsBadOptions)
{
    transfer_options o;
    o.dest_port = 9000;
    o.timeout_s = 0;
    EXPECT_THROW(transfer_orchestrator{o}, std::invalid_argument);

    o.timeout_s = 1;
    o.dest_port = 0;
    EXPECT_THROW(transfer_orchestrator{o}, std::invalid_argument);

    o.dest_port = 9000;
    o.chunk_size = MAX_DATA_SIZE + 1;
    EXPECT_THROW(transfer_orchestrator{o}, std::invalid_argument);
}

TEST(TransferOrchestratorTest, TimeoutConversion)
{
    EXPECT_EQ(timeout_from_seconds(1.5), duration_ms(1500));
    EXPECT_EQ(timeout_from_seconds(0.0001), duration_ms(1));
    EXPECT_THROW(timeout_from_seconds(-1), std::invalid_argument);
}

TEST(TransferOrchestratorTest, TimeoutConversionRejectsOutOfRangeValues)
{
    EXPECT_EQ(timeout_from_seconds(86400), MAX_RETRANSMISSION_TIMEOUT);
    EXPECT_THROW(timeout_from_seconds(std::numeric_limits<double>::infinity()), std::invalid_argument);
    EXPECT_THROW(timeout_from_seconds(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    EXPECT_THROW(timeout_from_seconds(1e10), std::invalid_argument);
    EXPECT_THROW(timeout_from_seconds(1e16), std::invalid_argument);

    transfer_options o;
    o.dest_port = 9000;
    o.timeout_s = 1e10;
    EXPECT_THROW(transfer_orchestrator{o}, std::invalid_argument);
}
