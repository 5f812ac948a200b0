// tests/test_summary.cpp
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <string>

#include "app/project_registry.hpp"
#include "app/summarizer.hpp"
#include "app/summary_lifecycle.hpp"
#include "crypto/fingerprint.hpp"

using namespace app;
using chunkyard::Errc;

namespace
{
struct SummaryFixture : public ::testing::Test
{
    std::chrono::system_clock::time_point now{std::chrono::seconds(1700000000)};
    ProjectRegistry                       registry;
    TruncatingSummarizer                  summarizer{8};
    SummaryLifecycle                      lifecycle{registry, summarizer, [this] { return now; }};

    void add_file(const std::string &project, const std::string &name, const std::string &body)
    {
        auto f      = std::make_shared<AssembledFile>();
        f->project  = project;
        f->filename = name;
        f->content.assign(body.begin(), body.end());
        f->fingerprint  = crypto::Sha256Fingerprinter().compute(f->content);
        f->assembled_at = now;
        registry.record_file(f);
    }
};
}  // namespace

TEST_F(SummaryFixture, PushBeforeGenerateFails)
{
    add_file("p", "a.txt", "hello");
    SummaryRecord rec;
    EXPECT_EQ(lifecycle.push("p", rec), Errc::NoSummaryToPush);
    EXPECT_EQ(lifecycle.push("unknown", rec), Errc::NoSummaryToPush);
    EXPECT_FALSE(registry.has_project("unknown"));
}

TEST_F(SummaryFixture, GenerateNeedsFiles)
{
    SummaryRecord rec;
    EXPECT_EQ(lifecycle.generate("p", rec), Errc::NoFilesForProject);
    EXPECT_FALSE(registry.has_project("p"));
}

TEST_F(SummaryFixture, GeneratePushPushKeepsDeliveredAt)
{
    add_file("p", "a.txt", "hello");

    SummaryRecord gen;
    ASSERT_EQ(lifecycle.generate("p", gen), Errc::Ok);
    EXPECT_EQ(gen.state, SummaryState::Generated);
    EXPECT_EQ(gen.generated_at, now);
    EXPECT_FALSE(gen.delivered_at.has_value());

    now += std::chrono::minutes(5);
    SummaryRecord first;
    ASSERT_EQ(lifecycle.push("p", first), Errc::Ok);
    EXPECT_EQ(first.state, SummaryState::Delivered);
    ASSERT_TRUE(first.delivered_at.has_value());
    EXPECT_EQ(*first.delivered_at, now);

    now += std::chrono::minutes(5);
    SummaryRecord second;
    ASSERT_EQ(lifecycle.push("p", second), Errc::Ok);
    EXPECT_EQ(second.state, SummaryState::Delivered);
    EXPECT_EQ(second.delivered_at, first.delivered_at);
    EXPECT_EQ(second.admin_text, first.admin_text);
}

TEST_F(SummaryFixture, RegenerateAfterDelivery)
{
    add_file("p", "a.txt", "hello");
    SummaryRecord rec;
    ASSERT_EQ(lifecycle.generate("p", rec), Errc::Ok);
    ASSERT_EQ(lifecycle.push("p", rec), Errc::Ok);

    add_file("p", "b.txt", "world");
    ASSERT_EQ(lifecycle.generate("p", rec), Errc::Ok);
    EXPECT_EQ(rec.state, SummaryState::Generated);
    EXPECT_FALSE(rec.delivered_at.has_value());
    EXPECT_NE(rec.client_text.find("b.txt"), std::string::npos);

    std::optional<SummaryRecord> st;
    ASSERT_EQ(lifecycle.status("p", st), Errc::Ok);
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->state, SummaryState::Generated);
}

TEST_F(SummaryFixture, StatusOfUnknownProject)
{
    std::optional<SummaryRecord> st;
    EXPECT_EQ(lifecycle.status("nobody", st), Errc::UnknownProject);

    add_file("p", "a.txt", "hello");
    ASSERT_EQ(lifecycle.status("p", st), Errc::Ok);
    EXPECT_FALSE(st.has_value());
}

TEST_F(SummaryFixture, AdminAndClientTexts)
{
    add_file("p", "a.txt", "hello world, long body");
    SummaryRecord rec;
    ASSERT_EQ(lifecycle.generate("p", rec), Errc::Ok);

    const std::string hex = crypto::to_hex(registry.find_file("p", "a.txt")->fingerprint);
    EXPECT_NE(rec.admin_text.find("a.txt"), std::string::npos);
    EXPECT_NE(rec.admin_text.find(hex), std::string::npos);
    EXPECT_NE(rec.admin_text.find("22 bytes"), std::string::npos);
    // no fingerprints leave through the client text
    EXPECT_EQ(rec.client_text.find(hex), std::string::npos);
    EXPECT_NE(rec.client_text.find("a.txt (22 bytes)"), std::string::npos);
    EXPECT_NE(rec.client_text.find("hello wo..."), std::string::npos);
}

TEST(Summarizer, PreviewMasksAndTruncates)
{
    TruncatingSummarizer s(4);
    EXPECT_EQ(s.preview(Bytes{'a', '\n', 'b'}), "a.b");
    EXPECT_EQ(s.preview(Bytes{'a', 'b', 'c', 'd', 'e'}), "abcd...");
    EXPECT_EQ(s.preview(Bytes{}), "");

    TruncatingSummarizer none(0);
    EXPECT_EQ(none.preview(Bytes{'a'}), "...");
}
