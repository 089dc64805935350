#include "../adapter/HarAdapter.hpp"
#include "../include/Errors.hpp"
#include "TestEntries.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace {

Capture captureOf(std::vector<Entry> entries, std::string creator = "Firefox", std::string version = "120.0") {
    Capture capture;
    capture.creator_name = std::move(creator);
    capture.creator_version = std::move(version);
    capture.entries = std::move(entries);
    return capture;
}

ReplayConfig config(const bool strict, const bool deleteAfterMatch) {
    ReplayConfig c;
    c.strict_matching = strict;
    c.delete_after_match = deleteAfterMatch;
    return c;
}

}

TEST(HarAdapterTest, DefaultsAreStrictAndOneShot) {
    HarAdapter adapter(captureOf({}));
    EXPECT_TRUE(adapter.strictMatching());
    EXPECT_TRUE(adapter.deleteAfterMatch());

    adapter.setStrictMatching(false);
    adapter.setDeleteAfterMatch(false);
    EXPECT_FALSE(adapter.strictMatching());
    EXPECT_FALSE(adapter.deleteAfterMatch());
}

TEST(HarAdapterTest, LooseMatchIgnoresHeadersAndBody) {
    std::vector<Entry> entries;
    entries.push_back(makeEntry(makeRequest("POST", "https://host.test/api", browserHeaders(), "a=1"), 201, "done"));
    HarAdapter adapter(captureOf(std::move(entries)), config(false, false));

    for (int i = 0; i < 3; ++i) {
        const ResponseSnapshot response =
            adapter.send(makeRequest("POST", "https://host.test/api", {{"X-Anything", std::to_string(i)}}, "zzz"));
        EXPECT_EQ(response.status, 201);
        EXPECT_EQ(response.body, "done");
    }
}

TEST(HarAdapterTest, OneShotConsumesMatchedEntry) {
    std::vector<Entry> entries;
    entries.push_back(makeEntry(makeRequest("GET", "https://host.test/poll", browserHeaders()), 200, "first"));
    entries.push_back(makeEntry(makeRequest("GET", "https://host.test/other"), 200, "other"));
    entries.push_back(makeEntry(makeRequest("GET", "https://host.test/poll", browserHeaders()), 200, "second"));
    HarAdapter adapter(captureOf(std::move(entries)));

    const RequestSnapshot live = makeRequest("GET", "https://host.test/poll", browserHeaders());
    EXPECT_EQ(adapter.send(live).body, "first");
    EXPECT_EQ(adapter.remaining(), 2u);
    EXPECT_EQ(adapter.send(live).body, "second");
    EXPECT_EQ(adapter.remaining(), 1u);
    EXPECT_THROW(adapter.send(live), NoMatchFound);
    EXPECT_EQ(adapter.remaining(), 1u);
}

TEST(HarAdapterTest, ReusableEntriesAreNeverRemoved) {
    std::vector<Entry> entries;
    entries.push_back(makeEntry(makeRequest("GET", "https://host.test/poll"), 200, "first"));
    entries.push_back(makeEntry(makeRequest("GET", "https://host.test/poll"), 200, "second"));
    HarAdapter adapter(captureOf(std::move(entries)), config(true, false));

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(adapter.send(makeRequest("GET", "https://host.test/poll")).body, "first");
    }
    EXPECT_EQ(adapter.remaining(), 2u);
}

TEST(HarAdapterTest, MismatchingCandidatesDoNotStopTheScan) {
    std::vector<Entry> entries;
    entries.push_back(
        makeEntry(makeRequest("POST", "https://host.test/form", {{"Host", "host.test"}}, "x=1"), 200, "x1"));
    entries.push_back(
        makeEntry(makeRequest("POST", "https://host.test/form", {{"Host", "host.test"}}, "x=2"), 200, "x2"));
    HarAdapter adapter(captureOf(std::move(entries)));

    EXPECT_EQ(adapter.send(makeRequest("POST", "https://host.test/form", {{"Host", "host.test"}}, "x=2")).body, "x2");
    EXPECT_EQ(adapter.remaining(), 1u);
    EXPECT_EQ(adapter.send(makeRequest("POST", "https://host.test/form", {{"Host", "host.test"}}, "x=1")).body, "x1");
}

TEST(HarAdapterTest, StrictModeRejectsReorderedHeaders) {
    std::vector<Entry> entries;
    entries.push_back(makeEntry(makeRequest("GET", "https://host.test/", {{"A", "1"}, {"B", "2"}}), 200, "ok"));
    HarAdapter adapter(captureOf(std::move(entries)));

    EXPECT_THROW(adapter.send(makeRequest("GET", "https://host.test/", {{"B", "2"}, {"A", "1"}})), NoMatchFound);
    EXPECT_EQ(adapter.remaining(), 1u);

    adapter.setStrictMatching(false);
    EXPECT_EQ(adapter.send(makeRequest("GET", "https://host.test/", {{"B", "2"}, {"A", "1"}})).body, "ok");
}

TEST(HarAdapterTest, CookieOrderInsideHeaderIsIrrelevant) {
    std::vector<Entry> entries;
    entries.push_back(
        makeEntry(makeRequest("GET", "https://host.test/", {{"Host", "host.test"}, {"Cookie", "a=1; b=2"}}), 200, "ok"));
    HarAdapter adapter(captureOf(std::move(entries)));

    EXPECT_EQ(adapter.send(makeRequest("GET", "https://host.test/", {{"Host", "host.test"}, {"Cookie", "b=2; a=1"}}))
                  .body,
              "ok");
}

TEST(HarAdapterTest, RedirectIsResolvedAgainstLiveOrigin) {
    std::vector<Entry> entries;
    entries.push_back(makeEntry(makeRequest("GET", "https://host.test/a"), 302, "", "/next"));
    entries.push_back(makeEntry(makeRequest("GET", "https://host.test/b"), 301, "", "https://other.test/y"));
    HarAdapter adapter(captureOf(std::move(entries)));

    EXPECT_EQ(adapter.send(makeRequest("GET", "https://host.test/a")).redirect_url, "https://host.test/next");
    EXPECT_EQ(adapter.send(makeRequest("GET", "https://host.test/b")).redirect_url, "https://other.test/y");
}

TEST(HarAdapterTest, RedirectHookIsApplied) {
    std::vector<Entry> entries;
    entries.push_back(makeEntry(makeRequest("GET", "https://host.test/a"), 302, "", "/next"));
    HarAdapter adapter(captureOf(std::move(entries)));
    adapter.setRedirectHook([](const RequestSnapshot &, ResponseSnapshot &response) {
        response.headers.push_back({"Location", response.redirect_url});
    });

    const ResponseSnapshot response = adapter.send(makeRequest("GET", "https://host.test/a"));
    ASSERT_EQ(response.headers.size(), 1u);
    EXPECT_EQ(response.headers[0].value, "https://host.test/next");
}

TEST(HarAdapterTest, EmptyStoreThrowsNoMatchFound) {
    HarAdapter adapter(captureOf({}));
    EXPECT_THROW(adapter.send(makeRequest("GET", "https://x/y")), NoMatchFound);
}

TEST(HarAdapterTest, UnmatchedRequestThrowsNoMatchFound) {
    std::vector<Entry> entries;
    entries.push_back(makeEntry(makeRequest("GET", "https://x/z"), 200, "z"));
    entries.push_back(makeEntry(makeRequest("POST", "https://x/y"), 200, "post"));
    HarAdapter adapter(captureOf(std::move(entries)), config(false, true));

    try {
        adapter.send(makeRequest("GET", "https://x/y"));
        FAIL() << "expected NoMatchFound";
    } catch (const NoMatchFound &e) {
        EXPECT_NE(std::string(e.what()).find("GET https://x/y"), std::string::npos);
    }
    EXPECT_EQ(adapter.remaining(), 2u);
}

TEST(HarAdapterTest, DescribeIncludesCreatorAndCount) {
    std::vector<Entry> entries;
    entries.push_back(makeEntry(makeRequest("GET", "https://x/1"), 200, ""));
    entries.push_back(makeEntry(makeRequest("GET", "https://x/2"), 200, ""));

    HarAdapter withVersion(captureOf(entries, "Firefox", "120.0"));
    EXPECT_EQ(withVersion.describe(), "Firefox 120.0, 2 Requests");
    EXPECT_EQ(withVersion.creator(), "Firefox");
    EXPECT_EQ(withVersion.creatorVersion(), "120.0");

    HarAdapter withoutVersion(captureOf(entries, "mitmproxy", ""));
    EXPECT_EQ(withoutVersion.describe(), "mitmproxy, 2 Requests");
}

TEST(HarAdapterTest, ConcurrentSendsConsumeEachEntryOnce) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;

    std::vector<Entry> entries;
    for (int i = 0; i < kThreads * kPerThread; ++i) {
        entries.push_back(makeEntry(makeRequest("GET", "https://host.test/tick"), 200, std::to_string(i)));
    }
    HarAdapter adapter(captureOf(std::move(entries)));

    std::vector<std::vector<std::string>> seen(kThreads);
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                try {
                    seen[t].push_back(adapter.send(makeRequest("GET", "https://host.test/tick")).body);
                } catch (const NoMatchFound &) {
                    ++failures;
                }
            }
        });
    }
    for (auto &thread : threads) thread.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(adapter.remaining(), 0u);

    std::vector<bool> used(kThreads * kPerThread, false);
    for (const auto &bodies : seen) {
        for (const auto &body : bodies) {
            const int index = std::stoi(body);
            EXPECT_FALSE(used[index]) << "entry " << index << " served twice";
            used[index] = true;
        }
    }
    EXPECT_THROW(adapter.send(makeRequest("GET", "https://host.test/tick")), NoMatchFound);
}
