// tests/test_assembler.cpp
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "app/assembler.hpp"
#include "app/project_registry.hpp"
#include "crypto/fingerprint.hpp"
#include "store/chunk_store.hpp"

using namespace app;
using chunkyard::Errc;

static Bytes bytes_of(const std::string &s)
{
    return Bytes(s.begin(), s.end());
}

struct AssemblerFixture : public ::testing::Test
{
    crypto::Sha256Fingerprinter fp;
    store::ChunkStore           chunks;
    ProjectRegistry             registry;
    Assembler                   asmb{chunks, registry, fp};

    Errc submit(const std::string &file, std::uint32_t idx, std::uint32_t total,
                const std::string &payload, AssembleOutcome &out)
    {
        return asmb.on_chunk_received({"demo", file}, idx, total, bytes_of(payload), out);
    }
};

TEST_F(AssemblerFixture, DemoOutOfOrder)
{
    AssembleOutcome out;
    ASSERT_EQ(submit("a.txt", 1, 3, "efgh", out), Errc::Ok);
    EXPECT_EQ(out.status, AssembleStatus::StoredIncomplete);
    EXPECT_EQ(out.file, nullptr);
    ASSERT_EQ(submit("a.txt", 0, 3, "abcd", out), Errc::Ok);
    EXPECT_EQ(out.status, AssembleStatus::StoredIncomplete);
    ASSERT_EQ(submit("a.txt", 2, 3, "ij", out), Errc::Ok);
    ASSERT_EQ(out.status, AssembleStatus::AssembledNow);
    ASSERT_NE(out.file, nullptr);

    const Bytes want = bytes_of("abcdefghij");
    EXPECT_EQ(out.file->content, want);
    EXPECT_EQ(out.file->size(), 10u);
    EXPECT_EQ(out.file->fingerprint, fp.compute(want));
    EXPECT_EQ(out.file->fingerprint.size(), crypto::SHA256_SIZE);

    auto files = registry.list_files("demo");
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0]->filename, "a.txt");
    EXPECT_EQ(chunks.pending_bytes(), 0u);
}

TEST_F(AssemblerFixture, EmptyFileIsOneEmptyChunk)
{
    AssembleOutcome out;
    ASSERT_EQ(submit("empty", 0, 1, "", out), Errc::Ok);
    ASSERT_EQ(out.status, AssembleStatus::AssembledNow);
    EXPECT_TRUE(out.file->content.empty());
    EXPECT_EQ(out.file->fingerprint, fp.compute(Bytes{}));
}

TEST_F(AssemblerFixture, InvalidInputIsReported)
{
    AssembleOutcome out;
    EXPECT_EQ(submit("f", 0, 0, "x", out), Errc::InvalidChunkCount);
    EXPECT_EQ(submit("f", 5, 2, "x", out), Errc::InvalidChunkIndex);
    ASSERT_EQ(submit("f", 0, 2, "x", out), Errc::Ok);
    EXPECT_EQ(submit("f", 1, 3, "y", out), Errc::InconsistentTotalChunks);
    EXPECT_TRUE(registry.list_files("demo").empty());
}

TEST_F(AssemblerFixture, LateDuplicateReturnsExistingFile)
{
    AssembleOutcome first;
    ASSERT_EQ(submit("b.txt", 0, 2, "he", first), Errc::Ok);
    ASSERT_EQ(submit("b.txt", 1, 2, "llo", first), Errc::Ok);
    ASSERT_EQ(first.status, AssembleStatus::AssembledNow);

    AssembleOutcome late;
    ASSERT_EQ(submit("b.txt", 1, 2, "llo", late), Errc::Ok);
    EXPECT_EQ(late.status, AssembleStatus::AlreadyAssembled);
    EXPECT_EQ(late.file, first.file);
    EXPECT_EQ(registry.list_files("demo").size(), 1u);
}

TEST_F(AssemblerFixture, ReuploadReplacesEntry)
{
    AssembleOutcome out;
    ASSERT_EQ(submit("x", 0, 1, "v1", out), Errc::Ok);
    ASSERT_EQ(submit("y", 0, 1, "other", out), Errc::Ok);
    ASSERT_EQ(submit("x", 0, 2, "v", out), Errc::Ok);
    ASSERT_EQ(submit("x", 1, 2, "2!", out), Errc::Ok);
    ASSERT_EQ(out.status, AssembleStatus::AssembledNow);

    auto files = registry.list_files("demo");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0]->filename, "y");
    EXPECT_EQ(files[1]->filename, "x");
    EXPECT_EQ(files[1]->content, bytes_of("v2!"));
}

TEST_F(AssemblerFixture, RemovedFileCanBeUploadedAgain)
{
    AssembleOutcome out;
    ASSERT_EQ(submit("r.txt", 0, 2, "ab", out), Errc::Ok);
    ASSERT_EQ(submit("r.txt", 1, 2, "cd", out), Errc::Ok);
    ASSERT_EQ(out.status, AssembleStatus::AssembledNow);
    ASSERT_TRUE(registry.remove_file("demo", "r.txt"));

    // same bytes again: a new upload, not a duplicate of a file that is gone
    ASSERT_EQ(submit("r.txt", 0, 2, "ab", out), Errc::Ok);
    EXPECT_EQ(out.status, AssembleStatus::StoredIncomplete);
    ASSERT_EQ(submit("r.txt", 1, 2, "cd", out), Errc::Ok);
    ASSERT_EQ(out.status, AssembleStatus::AssembledNow);
    EXPECT_EQ(out.file->content, bytes_of("abcd"));
    EXPECT_EQ(registry.list_files("demo").size(), 1u);
}

// Digest backend that can be made to fail on demand
class FailingFingerprinter : public crypto::Fingerprinter
{
  public:
    using Fingerprinter::compute;

    Bytes compute(const std::uint8_t *data, std::size_t len) const override
    {
        if (fail)
            throw std::runtime_error("digest backend unavailable");
        return inner.compute(data, len);
    }
    std::size_t size() const override { return inner.size(); }
    const char *name() const override { return "failing"; }

    bool                        fail = true;
    crypto::Sha256Fingerprinter inner;
};

TEST(Assembler, FailedAssemblyReleasesClaim)
{
    FailingFingerprinter fp;
    store::ChunkStore    chunks;
    ProjectRegistry      registry;
    Assembler            asmb(chunks, registry, fp);
    AssembleOutcome      out;

    ASSERT_EQ(asmb.on_chunk_received({"p", "f"}, 0, 2, bytes_of("he"), out), Errc::Ok);
    EXPECT_THROW(asmb.on_chunk_received({"p", "f"}, 1, 2, bytes_of("llo"), out),
                 std::runtime_error);
    EXPECT_TRUE(registry.list_files("p").empty());
    EXPECT_EQ(chunks.pending_count(), 0u);
    EXPECT_EQ(chunks.pending_bytes(), 0u);

    // not stuck in progress: a full resend assembles
    fp.fail = false;
    ASSERT_EQ(asmb.on_chunk_received({"p", "f"}, 1, 2, bytes_of("llo"), out), Errc::Ok);
    EXPECT_EQ(out.status, AssembleStatus::StoredIncomplete);
    ASSERT_EQ(asmb.on_chunk_received({"p", "f"}, 0, 2, bytes_of("he"), out), Errc::Ok);
    ASSERT_EQ(out.status, AssembleStatus::AssembledNow);
    EXPECT_EQ(out.file->content, bytes_of("hello"));
}

TEST(Assembler, OrderIndependence)
{
    const std::vector<std::string> pieces = {"The ", "quick ", "brown ", "fox"};
    crypto::Sha256Fingerprinter    fp;
    const Bytes                    want = bytes_of("The quick brown fox");

    std::vector<std::uint32_t> order = {0, 1, 2, 3};
    int                        runs  = 0;
    do
    {
        store::ChunkStore chunks;
        ProjectRegistry   registry;
        Assembler         asmb(chunks, registry, fp);
        AssembleOutcome   out;
        for (std::size_t i = 0; i < order.size(); ++i)
        {
            const std::uint32_t idx = order[i];
            ASSERT_EQ(asmb.on_chunk_received({"p", "f"}, idx, 4, bytes_of(pieces[idx]), out),
                      Errc::Ok);
            if (i + 1 < order.size())
                EXPECT_EQ(out.status, AssembleStatus::StoredIncomplete);
        }
        ASSERT_EQ(out.status, AssembleStatus::AssembledNow);
        EXPECT_EQ(out.file->content, want);
        EXPECT_EQ(out.file->fingerprint, fp.compute(want));
        runs++;
    } while (std::next_permutation(order.begin(), order.end()));
    EXPECT_EQ(runs, 24);
}

TEST(Assembler, FingerprintIndependentOfChunking)
{
    crypto::Blake2bFingerprinter fp;
    const std::string            text = "0123456789abcdefghijklmnopqrstuvwxyz";

    Bytes first_fp;
    for (std::size_t chunk = 1; chunk <= text.size(); chunk += 5)
    {
        store::ChunkStore chunks;
        ProjectRegistry   registry;
        Assembler         asmb(chunks, registry, fp);
        AssembleOutcome   out;

        const auto total = static_cast<std::uint32_t>((text.size() + chunk - 1) / chunk);
        for (std::uint32_t i = 0; i < total; ++i)
            ASSERT_EQ(asmb.on_chunk_received({"p", "f"}, i, total,
                                             bytes_of(text.substr(i * chunk, chunk)), out),
                      Errc::Ok);
        ASSERT_EQ(out.status, AssembleStatus::AssembledNow);
        if (first_fp.empty())
            first_fp = out.file->fingerprint;
        EXPECT_EQ(out.file->fingerprint, first_fp) << "chunk size " << chunk;
    }
}

TEST(Assembler, WallClockStampsAssembly)
{
    const auto                  t0 = std::chrono::system_clock::time_point(std::chrono::hours(1));
    crypto::Sha256Fingerprinter fp;
    store::ChunkStore           chunks;
    ProjectRegistry             registry;
    Assembler                   asmb(chunks, registry, fp, [t0] { return t0; });

    AssembleOutcome out;
    ASSERT_EQ(asmb.on_chunk_received({"p", "f"}, 0, 1, bytes_of("z"), out), Errc::Ok);
    EXPECT_EQ(out.file->assembled_at, t0);
}

TEST(Assembler, ConcurrentFinalChunkRecordsOnce)
{
    crypto::Sha256Fingerprinter fp;
    for (int round = 0; round < 30; ++round)
    {
        store::ChunkStore chunks;
        ProjectRegistry   registry;
        Assembler         asmb(chunks, registry, fp);
        AssembleOutcome   out;
        ASSERT_EQ(asmb.on_chunk_received({"p", "f"}, 0, 2, bytes_of("left-"), out), Errc::Ok);

        constexpr int    N = 8;
        std::atomic<int> go{0};
        std::atomic<int> assembled{0};
        std::atomic<int> other{0};
        std::vector<std::thread> ths;
        for (int i = 0; i < N; ++i)
        {
            ths.emplace_back([&] {
                while (go.load() == 0)
                    std::this_thread::yield();
                AssembleOutcome o;
                Errc rc = asmb.on_chunk_received({"p", "f"}, 1, 2, bytes_of("right"), o);
                if (rc == Errc::Ok && o.status == AssembleStatus::AssembledNow)
                    assembled.fetch_add(1);
                else if (rc == Errc::AssemblyInProgress ||
                         (rc == Errc::Ok && o.status == AssembleStatus::AlreadyAssembled))
                    other.fetch_add(1);
            });
        }
        go.store(1);
        for (auto &t : ths)
            t.join();

        EXPECT_EQ(assembled.load(), 1);
        EXPECT_EQ(other.load(), N - 1);
        auto files = registry.list_files("p");
        ASSERT_EQ(files.size(), 1u);
        EXPECT_EQ(files[0]->content, bytes_of("left-right"));
    }
}

TEST(Assembler, MergeKeepsOrder)
{
    std::vector<Bytes> parts = {bytes_of("a"), Bytes{}, bytes_of("bc")};
    EXPECT_EQ(Assembler::merge(std::move(parts)), bytes_of("abc"));
}
