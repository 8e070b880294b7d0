/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/filter_engine.h"

#include <cstdint>
#include <limits>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include "shield_engine/engine_errors.h"
#include "test/fake_list_fetcher.h"

namespace sse {

namespace {

constexpr const char kEasyListURL[] = "https://lists.test/easylist.txt";
constexpr const char kEasyPrivacyURL[] = "https://lists.test/easyprivacy.txt";

EngineConfig TestConfig()
{
    EngineConfig config = DefaultEngineConfig();
    config.filter_lists = {
        { "easylist", "EasyList", kEasyListURL, true },
        { "easyprivacy", "EasyPrivacy", kEasyPrivacyURL, true }
    };
    return config;
}

class FilterEngineTest : public ::testing::Test {
protected:
    FilterEngineTest()
    {
        auto fetcher = std::make_unique<FakeListFetcher>();
        fetcher_ = fetcher.get();
        fetcher_->SetContent(kEasyListURL,
                             "! Title: EasyList\n"
                             "@@allowlisted.com\n"
                             "ads.example.com\n"
                             "/banner/ads/\n"
                             "tracker.io##.banner\n");
        fetcher_->SetContent(kEasyPrivacyURL,
                             "! Title: EasyPrivacy\n"
                             "tracker.example\n");
        engine_ = std::make_unique<FilterEngine>(TestConfig(), std::move(fetcher));
    }

    FilterEngine& engine()
    {
        return *engine_;
    }

    FilterListStatus ListStatus(const std::string& list_id) const
    {
        for (const auto& status : engine_->GetFilterLists()) {
            if (status.id == list_id) {
                return status;
            }
        }

        ADD_FAILURE() << "no list " << list_id;
        return FilterListStatus();
    }

    FakeListFetcher* fetcher_ = nullptr;   // Owned by the engine.
    std::unique_ptr<FilterEngine> engine_;
};

}   // namespace

TEST_F(FilterEngineTest, ListsInInitialOrder)
{
    auto lists = engine().GetFilterLists();
    ASSERT_EQ(3u, lists.size());
    EXPECT_EQ(kUserRulesListId, lists[0].id);
    EXPECT_TRUE(lists[0].source_url.empty());
    EXPECT_EQ("easylist", lists[1].id);
    EXPECT_EQ("easyprivacy", lists[2].id);
    for (const auto& list : lists) {
        EXPECT_EQ(0u, list.rule_count);
        EXPECT_TRUE(list.enabled);
    }
}

TEST_F(FilterEngineTest, NothingBlockedBeforeRefresh)
{
    EXPECT_FALSE(engine().ShouldBlockRequest("https://ads.example.com/banner.js", "script",
                                             "news.example"));
}

TEST_F(FilterEngineTest, BlockByRefreshedList)
{
    auto report = engine().RefreshFilterLists();
    ASSERT_EQ(2u, report.size());
    EXPECT_TRUE(report[0].succeeded);
    EXPECT_EQ(4u, report[0].rule_count);
    EXPECT_TRUE(report[1].succeeded);
    EXPECT_EQ(1u, report[1].rule_count);

    EXPECT_TRUE(engine().ShouldBlockRequest("https://ads.example.com/banner.js", "script",
                                            "news.example"));
    EXPECT_TRUE(engine().ShouldBlockRequest("https://cdn.example/banner/ads/1.png", "image",
                                            "news.example"));
    EXPECT_TRUE(engine().ShouldBlockRequest("https://tracker.example/pixel.gif", "image",
                                            "news.example"));
    EXPECT_FALSE(engine().ShouldBlockRequest("https://allowlisted.com/banner/ads/1.png",
                                             "image", "news.example"));
    EXPECT_FALSE(engine().ShouldBlockRequest("https://tracker.io/lib.js", "script",
                                             "news.example"));
    EXPECT_FALSE(engine().ShouldBlockRequest("https://news.example/app.js", "script",
                                             "news.example"));

    EXPECT_EQ("EasyList", ListStatus("easylist").info.title);
}

TEST_F(FilterEngineTest, MalformedURLNeverBlocked)
{
    engine().AddCustomRule("url");
    EXPECT_TRUE(engine().ShouldBlockRequest("https://cdn.example/url.js", "script",
                                            "news.example"));
    EXPECT_FALSE(engine().ShouldBlockRequest("not a url", "script", "news.example"));
    EXPECT_FALSE(engine().ShouldBlockRequest("https:///url", "script", "news.example"));
}

TEST_F(FilterEngineTest, VeryLongURLs)
{
    engine().RefreshFilterLists();

    std::string long_userinfo = "https://" + std::string(150000, 'u') + "@cdn.example/lib.js";
    EXPECT_FALSE(engine().ShouldBlockRequest(long_userinfo, "script", "news.example"));

    std::string long_blocked = "https://ads.example.com/" + std::string(150000, 'p');
    EXPECT_TRUE(engine().ShouldBlockRequest(long_blocked, "script", "news.example"));

    EXPECT_FALSE(engine().ShouldBlockRequest(std::string(150000, 'a'), "script",
                                             "news.example"));
}

TEST_F(FilterEngineTest, DecisionReasons)
{
    engine().RefreshFilterLists();

    auto decision = engine().CheckRequest("https://ads.example.com/banner.js", "script",
                                          "news.example");
    EXPECT_TRUE(decision.blocked);
    EXPECT_EQ(DecisionReason::BLOCKING_RULE, decision.reason);
    EXPECT_EQ("easylist", decision.list_id);
    EXPECT_EQ("ads.example.com", decision.rule_text);

    decision = engine().CheckRequest("https://allowlisted.com/banner/ads/1.png", "image",
                                     "news.example");
    EXPECT_FALSE(decision.blocked);
    EXPECT_EQ(DecisionReason::EXCEPTION_RULE, decision.reason);
    EXPECT_EQ("@@allowlisted.com", decision.rule_text);

    decision = engine().CheckRequest("https://news.example/app.js", "script", "news.example");
    EXPECT_FALSE(decision.blocked);
    EXPECT_EQ(DecisionReason::NO_MATCHING_RULE, decision.reason);
    EXPECT_TRUE(decision.list_id.empty());

    EXPECT_EQ(DecisionReason::MALFORMED_URL,
              engine().CheckRequest("not a url", "script", "news.example").reason);

    SiteShields shields("news.example");
    shields.third_party_cookies = true;
    engine().UpdateSiteShields("news.example", shields);
    decision = engine().CheckRequest("https://cdn.other.example/lib.js", "script",
                                     "news.example");
    EXPECT_TRUE(decision.blocked);
    EXPECT_EQ(DecisionReason::THIRD_PARTY_REQUEST, decision.reason);

    shields.ad_blocking = false;
    shields.tracker_blocking = false;
    engine().UpdateSiteShields("news.example", shields);
    decision = engine().CheckRequest("https://ads.example.com/banner.js", "script",
                                     "news.example");
    EXPECT_FALSE(decision.blocked);
    EXPECT_EQ(DecisionReason::SHIELDS_DOWN, decision.reason);
    EXPECT_STREQ("shields-down", DecisionReasonName(decision.reason));
}

TEST_F(FilterEngineTest, ShieldsOverrideRules)
{
    engine().RefreshFilterLists();

    SiteShields shields("news.example");
    shields.ad_blocking = false;
    shields.tracker_blocking = false;
    engine().UpdateSiteShields("news.example", shields);

    EXPECT_FALSE(engine().ShouldBlockRequest("https://ads.example.com/banner.js", "script",
                                             "news.example"));
    EXPECT_TRUE(engine().ShouldBlockRequest("https://ads.example.com/banner.js", "script",
                                            "blog.example"));

    // Disabling only one of them keeps the rules in effect.
    shields.tracker_blocking = true;
    engine().UpdateSiteShields("news.example", shields);
    EXPECT_TRUE(engine().ShouldBlockRequest("https://ads.example.com/banner.js", "script",
                                            "news.example"));
}

TEST_F(FilterEngineTest, ThirdPartyCookiesBlocksCrossDomainRequests)
{
    SiteShields shields("news.example");
    shields.third_party_cookies = true;
    engine().UpdateSiteShields("news.example", shields);

    EXPECT_TRUE(engine().ShouldBlockRequest("https://cdn.other.example/lib.js", "script",
                                            "news.example"));
    EXPECT_FALSE(engine().ShouldBlockRequest("https://News.Example/app.js", "script",
                                             "news.example"));

    shields.ad_blocking = false;
    shields.tracker_blocking = false;
    engine().UpdateSiteShields("news.example", shields);
    EXPECT_FALSE(engine().ShouldBlockRequest("https://cdn.other.example/lib.js", "script",
                                             "news.example"));
}

TEST_F(FilterEngineTest, SiteShieldsLifecycle)
{
    EXPECT_TRUE(engine().GetSiteShields("news.example").ad_blocking);
    EXPECT_TRUE(engine().GetAllSiteShields().empty());

    SiteShields shields;
    shields.https_only = false;
    engine().UpdateSiteShields("news.example", shields);
    engine().UpdateSiteShields("blog.example", SiteShields());

    auto stored = engine().GetSiteShields("news.example");
    EXPECT_EQ("news.example", stored.domain);
    EXPECT_FALSE(stored.https_only);

    auto all = engine().GetAllSiteShields();
    ASSERT_EQ(2u, all.size());
    EXPECT_EQ("blog.example", all[0].domain);

    auto defaults = engine().ResetSiteShields("news.example");
    EXPECT_TRUE(defaults.https_only);
    EXPECT_EQ(1u, engine().GetAllSiteShields().size());
}

TEST_F(FilterEngineTest, BlockedCounters)
{
    engine().UpdateSiteShields("a.com", SiteShields("a.com"));

    for (int i = 0; i < 3; ++i) {
        engine().IncrementBlockedCount("a.com", "ad");
    }

    engine().IncrementBlockedCount("a.com", "tracker", 1000, 120);
    engine().IncrementBlockedCount("a.com", "tracker", 500, 30);

    auto shields = engine().GetSiteShields("a.com");
    EXPECT_EQ(3u, shields.ads_blocked);
    EXPECT_EQ(2u, shields.trackers_blocked);

    auto stats = engine().GetGlobalStats();
    EXPECT_EQ(3u, stats.total_ads_blocked);
    EXPECT_EQ(2u, stats.total_trackers_blocked);
    EXPECT_EQ(0u, stats.total_scripts_blocked);
    EXPECT_EQ(1500u, stats.bandwidth_saved);
    EXPECT_EQ(150u, stats.time_saved_ms);

    engine().ResetGlobalStats();
    stats = engine().GetGlobalStats();
    EXPECT_EQ(0u, stats.total_ads_blocked);
    EXPECT_EQ(0u, stats.bandwidth_saved);
    EXPECT_EQ(0u, stats.time_saved_ms);
    EXPECT_EQ(3u, engine().GetSiteShields("a.com").ads_blocked);
}

TEST_F(FilterEngineTest, IgnoredIncrements)
{
    engine().UpdateSiteShields("a.com", SiteShields("a.com"));

    engine().IncrementBlockedCount("a.com", "popup");
    engine().IncrementBlockedCount("unknown.example", "ad");

    EXPECT_EQ(0u, engine().GetSiteShields("a.com").ads_blocked);
    EXPECT_EQ(1u, engine().GetAllSiteShields().size());
    EXPECT_EQ(0u, engine().GetGlobalStats().total_ads_blocked);
}

TEST_F(FilterEngineTest, FailedRefreshKeepsPreviousRules)
{
    engine().RefreshFilterLists();
    auto before = ListStatus("easylist");

    fetcher_->SetFailure(kEasyListURL);
    auto outcome = engine().RefreshFilterList("easylist");
    EXPECT_FALSE(outcome.succeeded);
    EXPECT_EQ(ErrorKind::FETCH, outcome.error_kind);
    EXPECT_FALSE(outcome.error_message.empty());

    auto after = ListStatus("easylist");
    EXPECT_EQ(before.rule_count, after.rule_count);
    EXPECT_EQ(before.last_updated, after.last_updated);
    EXPECT_TRUE(engine().ShouldBlockRequest("https://ads.example.com/banner.js", "script",
                                            "news.example"));

    // Empty content is a parse failure and leaves the rules alone as well.
    fetcher_->SetContent(kEasyListURL, std::string());
    outcome = engine().RefreshFilterList("easylist");
    EXPECT_FALSE(outcome.succeeded);
    EXPECT_EQ(ErrorKind::PARSE, outcome.error_kind);
    EXPECT_EQ(before.rule_count, ListStatus("easylist").rule_count);
}

TEST_F(FilterEngineTest, PartialRefreshFailure)
{
    fetcher_->SetFailure(kEasyListURL);

    auto report = engine().RefreshFilterLists();
    ASSERT_EQ(2u, report.size());
    EXPECT_EQ("easylist", report[0].list_id);
    EXPECT_FALSE(report[0].succeeded);
    EXPECT_EQ("easyprivacy", report[1].list_id);
    EXPECT_TRUE(report[1].succeeded);

    EXPECT_EQ(0u, ListStatus("easylist").rule_count);
    EXPECT_EQ(1u, ListStatus("easyprivacy").rule_count);
}

TEST_F(FilterEngineTest, ForeignFetcherErrorDoesntAbortRefresh)
{
    fetcher_->SetBroken(kEasyListURL);

    auto report = engine().RefreshFilterLists();
    ASSERT_EQ(2u, report.size());
    EXPECT_FALSE(report[0].succeeded);
    EXPECT_EQ(ErrorKind::FETCH, report[0].error_kind);
    EXPECT_TRUE(report[1].succeeded);
    EXPECT_TRUE(engine().ShouldBlockRequest("https://tracker.example/pixel.gif", "image",
                                            "news.example"));
}

TEST_F(FilterEngineTest, DisabledListsNotRefreshed)
{
    engine().SetFilterListEnabled("easyprivacy", false);

    auto report = engine().RefreshFilterLists();
    ASSERT_EQ(1u, report.size());
    EXPECT_EQ("easylist", report[0].list_id);
    EXPECT_EQ(0, fetcher_->fetch_count(kEasyPrivacyURL));
    EXPECT_FALSE(ListStatus("easyprivacy").enabled);

    // Refreshing it explicitly is still allowed.
    EXPECT_TRUE(engine().RefreshFilterList("easyprivacy").succeeded);
    EXPECT_EQ(1, fetcher_->fetch_count(kEasyPrivacyURL));
    EXPECT_FALSE(engine().ShouldBlockRequest("https://tracker.example/pixel.gif", "image",
                                             "news.example"));

    EXPECT_THROW(engine().SetFilterListEnabled("missing", true), NotFoundError);
}

TEST_F(FilterEngineTest, RefreshSingleListErrors)
{
    EXPECT_THROW(engine().RefreshFilterList("missing"), NotFoundError);
    EXPECT_THROW(engine().RefreshFilterList(kUserRulesListId), InvalidArgumentError);
}

TEST_F(FilterEngineTest, AsyncRefresh)
{
    auto future = engine().RefreshFilterListsAsync();
    auto report = future.get();
    ASSERT_EQ(2u, report.size());
    EXPECT_TRUE(report[0].succeeded);
    EXPECT_TRUE(engine().ShouldBlockRequest("https://ads.example.com/banner.js", "script",
                                            "news.example"));
}

TEST_F(FilterEngineTest, CustomRules)
{
    engine().RefreshFilterLists();

    engine().AddCustomRule("@@ads.example.com/ok");
    engine().AddCustomRule("@@ads.example.com/ok");
    engine().AddCustomRule("beacon.example$image");

    std::vector<std::string> expected_rules {"@@ads.example.com/ok", "beacon.example"};
    EXPECT_EQ(expected_rules, engine().GetCustomRules());

    // User rules are scanned ahead of every other list.
    EXPECT_FALSE(engine().ShouldBlockRequest("https://ads.example.com/ok.js", "script",
                                             "news.example"));
    EXPECT_TRUE(engine().ShouldBlockRequest("https://ads.example.com/banner.js", "script",
                                            "news.example"));
    EXPECT_TRUE(engine().ShouldBlockRequest("https://beacon.example/b.gif", "image",
                                            "news.example"));

    engine().RemoveCustomRule("@@ads.example.com/ok");
    EXPECT_TRUE(engine().ShouldBlockRequest("https://ads.example.com/ok.js", "script",
                                            "news.example"));
    EXPECT_THROW(engine().RemoveCustomRule("@@ads.example.com/ok"), NotFoundError);
    EXPECT_THROW(engine().RemoveCustomRule("! not a rule"), NotFoundError);
    EXPECT_THROW(engine().AddCustomRule("! not a rule"), InvalidArgumentError);
    EXPECT_THROW(engine().AddCustomRule(std::string()), InvalidArgumentError);

    EXPECT_EQ(1u, ListStatus(kUserRulesListId).rule_count);
}

TEST_F(FilterEngineTest, ScopedCustomRule)
{
    Rule rule(RuleKind::BLOCK, "widget.js");
    rule.domains = DomainScope(std::set<std::string> {"news.example"});
    rule.resource_flags = ResourceFlag::SCRIPT;
    engine().AddCustomRule(rule);

    EXPECT_TRUE(engine().ShouldBlockRequest("https://cdn.example/widget.js", "script",
                                            "news.example"));
    EXPECT_FALSE(engine().ShouldBlockRequest("https://cdn.example/widget.js", "script",
                                             "blog.example"));
    EXPECT_FALSE(engine().ShouldBlockRequest("https://cdn.example/widget.js", "image",
                                             "news.example"));

    EXPECT_THROW(engine().RemoveCustomRule(Rule(RuleKind::BLOCK, "widget.js")), NotFoundError);
    engine().RemoveCustomRule(rule);
    EXPECT_TRUE(engine().GetCustomRules().empty());
}

TEST_F(FilterEngineTest, AddAndRemoveFilterLists)
{
    const std::string regional_url = "https://lists.test/regional.txt";
    fetcher_->SetContent(regional_url, "regional-ads.example\n");

    auto status = engine().AddFilterList("Regional", regional_url);
    EXPECT_EQ("custom-1", status.id);
    EXPECT_EQ("Regional", status.name);
    EXPECT_TRUE(status.enabled);
    EXPECT_EQ(0u, status.rule_count);
    EXPECT_EQ(4u, engine().GetFilterLists().size());

    auto outcome = engine().RefreshFilterList(status.id);
    EXPECT_TRUE(outcome.succeeded);
    EXPECT_TRUE(engine().ShouldBlockRequest("https://regional-ads.example/a.js", "script",
                                            "news.example"));

    EXPECT_EQ("custom-2", engine().AddFilterList(std::string(), "https://lists.test/2.txt").id);
    EXPECT_THROW(engine().AddFilterList("Nowhere", std::string()), InvalidArgumentError);

    engine().RemoveFilterList(status.id);
    EXPECT_FALSE(engine().ShouldBlockRequest("https://regional-ads.example/a.js", "script",
                                             "news.example"));
    EXPECT_THROW(engine().RemoveFilterList(status.id), NotFoundError);
    EXPECT_THROW(engine().RemoveFilterList(kUserRulesListId), InvalidArgumentError);
    EXPECT_EQ(4u, engine().GetFilterLists().size());
}

TEST_F(FilterEngineTest, ExportAndImportState)
{
    engine().RefreshFilterLists();
    engine().AddCustomRule("@@ads.example.com/ok");
    engine().SetFilterListEnabled("easyprivacy", false);
    engine().UpdateSiteShields("a.com", SiteShields("a.com"));
    engine().IncrementBlockedCount("a.com", "script", 256, 80);

    auto snapshot = engine().ExportState();

    FilterEngine restored(TestConfig(), std::make_unique<FakeListFetcher>());
    restored.ImportState(snapshot.data(), snapshot.size());

    auto lists = restored.GetFilterLists();
    ASSERT_EQ(3u, lists.size());
    EXPECT_EQ(kUserRulesListId, lists[0].id);
    EXPECT_EQ(4u, lists[1].rule_count);
    EXPECT_EQ("EasyList", lists[1].info.title);
    EXPECT_FALSE(lists[2].enabled);

    std::vector<std::string> custom_rules {"@@ads.example.com/ok"};
    EXPECT_EQ(custom_rules, restored.GetCustomRules());
    EXPECT_EQ(1u, restored.GetSiteShields("a.com").scripts_blocked);
    EXPECT_EQ(256u, restored.GetGlobalStats().bandwidth_saved);
    EXPECT_EQ(80u, restored.GetGlobalStats().time_saved_ms);

    EXPECT_TRUE(restored.ShouldBlockRequest("https://ads.example.com/banner.js", "script",
                                            "news.example"));
    EXPECT_FALSE(restored.ShouldBlockRequest("https://ads.example.com/ok.js", "script",
                                             "news.example"));
}

TEST_F(FilterEngineTest, ImportRejectsForeignData)
{
    engine().AddCustomRule("ads.example.com");

    kbase::Pickle foreign;
    foreign << std::string("NOT-A-SNAPSHOT") << static_cast<uint32_t>(1);
    EXPECT_THROW(engine().ImportState(foreign.data(), foreign.size()), SnapshotError);
    EXPECT_THROW(engine().ImportState(nullptr, 0), SnapshotError);

    std::vector<std::string> custom_rules {"ads.example.com"};
    EXPECT_EQ(custom_rules, engine().GetCustomRules());
}

TEST_F(FilterEngineTest, ImportRejectsOversizedCounts)
{
    engine().AddCustomRule("ads.example.com");

    kbase::Pickle too_many_lists;
    too_many_lists << std::string("KSHIELD-STATE") << static_cast<uint32_t>(2)
                   << static_cast<uint32_t>(0xFFFFFFFF);
    EXPECT_THROW(engine().ImportState(too_many_lists.data(), too_many_lists.size()),
                 SnapshotError);

    kbase::Pickle too_many_rules;
    too_many_rules << std::string("KSHIELD-STATE") << static_cast<uint32_t>(2)
                   << static_cast<uint32_t>(1)
                   << std::string("easylist") << std::string("EasyList") << std::string()
                   << true << static_cast<int64_t>(0)
                   << std::string() << std::string() << std::string()
                   << static_cast<uint32_t>(0xFFFFFFFF)
                   << static_cast<unsigned int>(99) << std::string("ads.example.com");
    EXPECT_THROW(engine().ImportState(too_many_rules.data(), too_many_rules.size()),
                 SnapshotError);

    kbase::Pickle too_many_shields;
    too_many_shields << std::string("KSHIELD-STATE") << static_cast<uint32_t>(2)
                     << static_cast<uint32_t>(0) << static_cast<uint32_t>(0xFFFFFFFF);
    EXPECT_THROW(engine().ImportState(too_many_shields.data(), too_many_shields.size()),
                 SnapshotError);

    kbase::Pickle bad_timestamp;
    bad_timestamp << std::string("KSHIELD-STATE") << static_cast<uint32_t>(2)
                  << static_cast<uint32_t>(1)
                  << std::string("easylist") << std::string("EasyList") << std::string()
                  << true << std::numeric_limits<int64_t>::max();
    EXPECT_THROW(engine().ImportState(bad_timestamp.data(), bad_timestamp.size()),
                 SnapshotError);

    std::vector<std::string> custom_rules {"ads.example.com"};
    EXPECT_EQ(custom_rules, engine().GetCustomRules());
    EXPECT_EQ(3u, engine().GetFilterLists().size());
}

TEST_F(FilterEngineTest, ConcurrentQueriesAndUpdates)
{
    engine().RefreshFilterLists();
    engine().UpdateSiteShields("a.com", SiteShields("a.com"));

    constexpr int kThreads = 4;
    constexpr int kIterations = 200;

    std::vector<std::thread> workers;
    for (int i = 0; i < kThreads; ++i) {
        workers.emplace_back([this] {
            for (int n = 0; n < kIterations; ++n) {
                EXPECT_TRUE(engine().ShouldBlockRequest("https://ads.example.com/banner.js",
                                                        "script", "a.com"));
                engine().IncrementBlockedCount("a.com", "ad");
            }
        });
    }

    workers.emplace_back([this] {
        for (int n = 0; n < 20; ++n) {
            engine().RefreshFilterLists();
        }
    });

    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(static_cast<uint32_t>(kThreads * kIterations),
              engine().GetSiteShields("a.com").ads_blocked);
    EXPECT_EQ(static_cast<uint64_t>(kThreads * kIterations),
              engine().GetGlobalStats().total_ads_blocked);
}

}   // namespace sse
