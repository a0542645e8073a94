#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "kb_errors.hpp"
#include "kb_test_util.hpp"

class DedupTest : public KbTestBase {};

TEST_F(DedupTest, VarFilterIsIdempotent) {
    Info i1 = make_info("http://h/a.php", "id");
    i1.set_dc(make_dc({{"id", "1"}, {"sort", "asc"}}));
    Info i2 = make_info("http://h/a.php", "id");
    i2.set_dc(make_dc({{"sort", "desc"}, {"id", "9"}}));

    EXPECT_TRUE(kb->append_uniq("sqli", "vulns", i1, FilterKind::Var));
    EXPECT_FALSE(kb->append_uniq("sqli", "vulns", i2, FilterKind::Var));
    EXPECT_EQ(kb->get("sqli", "vulns").size(), 1u);
}

TEST_F(DedupTest, VarFilterDiscriminatesByToken) {
    EXPECT_TRUE(kb->append_uniq("sqli", "vulns", make_info("http://h/a.php", "id")));
    EXPECT_TRUE(kb->append_uniq("sqli", "vulns", make_info("http://h/a.php", "name")));
    EXPECT_EQ(kb->get("sqli", "vulns").size(), 2u);
}

TEST_F(DedupTest, VarFilterDataContainerPresenceMustAgree) {
    Info with_dc = make_info("http://h/a.php", "id");
    with_dc.set_dc(make_dc({{"id", "1"}}));
    Info without_dc = make_info("http://h/a.php", "id");
    Info other_keys = make_info("http://h/a.php", "id");
    other_keys.set_dc(make_dc({{"id", "1"}, {"page", "2"}}));

    EXPECT_TRUE(kb->append_uniq("xss", "xss", with_dc));
    EXPECT_TRUE(kb->append_uniq("xss", "xss", without_dc));
    EXPECT_TRUE(kb->append_uniq("xss", "xss", other_keys));
    EXPECT_FALSE(kb->append_uniq("xss", "xss", make_info("http://h/a.php", "id")));
    EXPECT_EQ(kb->get("xss", "xss").size(), 3u);
}

TEST_F(DedupTest, UrlFilterCollapsesAcrossTokens) {
    EXPECT_TRUE(kb->append_uniq("dav", "dav", make_info("http://h/a.php", "id"), FilterKind::Url));
    EXPECT_FALSE(kb->append_uniq("dav", "dav", make_info("http://h/a.php", "name"), FilterKind::Url));
    EXPECT_TRUE(kb->append_uniq("dav", "dav", make_info("http://h/b.php", "name"), "URL"));
    EXPECT_EQ(kb->get("dav", "dav").size(), 2u);
}

TEST_F(DedupTest, DedupIsScopedToAddress) {
    EXPECT_TRUE(kb->append_uniq("sqli", "vulns", make_info("http://h/a.php", "id")));
    EXPECT_TRUE(kb->append_uniq("sqli", "other", make_info("http://h/a.php", "id")));
    EXPECT_TRUE(kb->append_uniq("xss", "vulns", make_info("http://h/a.php", "id")));
}

TEST_F(DedupTest, VulnIsAcceptedAndMatchedLikeInfo) {
    EXPECT_TRUE(kb->append_uniq("sqli", "vulns", make_vuln("http://h/a.php", "id")));
    EXPECT_FALSE(kb->append_uniq("sqli", "vulns", make_info("http://h/a.php", "id")));
}

TEST_F(DedupTest, RejectsWrongCandidates) {
    Shell shell(make_vuln("http://h/a", "cmd"), "os_commanding");
    InfoSet set(std::vector<GroupMember>{make_info("http://h/a", "id")});

    EXPECT_THROW(kb->append_uniq("p", "b", shell), KbTypeError);
    EXPECT_THROW(kb->append_uniq("p", "b", set), KbTypeError);
    EXPECT_THROW(kb->append_uniq("p", "b", make_info("http://h/a", "id"), "PARAM"), KbTypeError);
    EXPECT_THROW(kb->append_uniq_group("p", "b", shell), KbTypeError);
    EXPECT_TRUE(kb->get("p", "b").empty());
}

TEST_F(DedupTest, GroupCreatesThenMerges) {
    Info first = make_info("http://h/a", "", Severity::Low, "Missing X-Frame-Options");
    Info second = make_info("http://h/b", "", Severity::Low, "Missing X-Frame-Options");

    auto [created_set, created] = kb->append_uniq_group("headers", "xfo", first);
    EXPECT_TRUE(created);
    EXPECT_EQ(created_set.size(), 1u);

    auto [merged_set, created_again] = kb->append_uniq_group("headers", "xfo", second);
    EXPECT_FALSE(created_again);
    EXPECT_EQ(merged_set.size(), 2u);

    auto stored = kb->get("headers", "xfo");
    ASSERT_EQ(stored.size(), 1u);
    ASSERT_EQ(finding_kind(stored[0]), FindingKind::InfoSet);
    const InfoSet& s = std::get<InfoSet>(stored[0]);
    EXPECT_EQ(s.size(), 2u);
    EXPECT_EQ(s.get_uniq_id(), merged_set.get_uniq_id());
    EXPECT_EQ(as_info(s.infos()[1]).get_url()->str(), "http://h/b");
}

TEST_F(DedupTest, GroupWithoutMatchCreatesSecondSet) {
    kb->append_uniq_group("headers", "h", make_info("http://h/a", "", Severity::Low, "A"));
    auto [s, created] = kb->append_uniq_group("headers", "h", make_info("http://h/a", "", Severity::Low, "B"));
    EXPECT_TRUE(created);
    EXPECT_EQ(kb->get("headers", "h").size(), 2u);
}

TEST_F(DedupTest, GroupUsesCustomConstructor) {
    GroupCtor by_cookie = [](std::vector<GroupMember> infos) {
        return InfoSet(std::move(infos), "cookie");
    };

    Info a = make_info("http://h/a", "", Severity::Low, "Insecure cookie");
    a.set_attr("cookie", "SESSID");
    Info b = make_info("http://h/b", "", Severity::Low, "Insecure cookie");
    b.set_attr("cookie", "lang");
    Info c = make_info("http://h/c", "", Severity::Low, "Insecure cookie");
    c.set_attr("cookie", "SESSID");

    EXPECT_TRUE(kb->append_uniq_group("cookies", "insecure", a, by_cookie).second);
    EXPECT_TRUE(kb->append_uniq_group("cookies", "insecure", b, by_cookie).second);
    auto merged = kb->append_uniq_group("cookies", "insecure", c, by_cookie);
    EXPECT_FALSE(merged.second);
    EXPECT_EQ(merged.first.size(), 2u);
    EXPECT_EQ(merged.first.get_itag(), "cookie");
}

TEST_F(DedupTest, GroupMergeTouchesOnlyItsAddress) {
    Info a = make_info("http://h/a", "", Severity::Low, "Directory listing");
    Info b = make_info("http://h/b", "", Severity::Low, "Directory listing");

    // одинаковые группы под двумя адресами: один и тот же uniq_id
    auto in_x = kb->append_uniq_group("dirlist", "x", a);
    auto in_y = kb->append_uniq_group("dirlist", "y", a);
    ASSERT_TRUE(in_x.second);
    ASSERT_TRUE(in_y.second);
    ASSERT_EQ(in_x.first.get_uniq_id(), in_y.first.get_uniq_id());

    auto merged = kb->append_uniq_group("dirlist", "x", b);
    EXPECT_FALSE(merged.second);
    EXPECT_EQ(merged.first.size(), 2u);

    auto x = kb->get("dirlist", "x");
    ASSERT_EQ(x.size(), 1u);
    EXPECT_EQ(std::get<InfoSet>(x[0]).size(), 2u);

    auto y = kb->get("dirlist", "y");
    ASSERT_EQ(y.size(), 1u);
    EXPECT_EQ(std::get<InfoSet>(y[0]).size(), 1u);
    EXPECT_EQ(finding_uniq_id(y[0]), in_y.first.get_uniq_id());
}

TEST_F(DedupTest, ConcurrentAppendUniqStoresOnce) {
    constexpr int kThreads = 16;
    std::atomic<int> added{0};
    std::atomic<int> rejected{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            while (!go.load()) std::this_thread::yield();
            Info i = make_info("http://h/race.php", "id");
            i.set_dc(make_dc({{"id", "1"}}));
            if (kb->append_uniq("sqli", "vulns", i)) ++added;
            else ++rejected;
        });
    }
    go.store(true);
    for (auto& th : threads) th.join();

    EXPECT_EQ(added.load(), 1);
    EXPECT_EQ(rejected.load(), kThreads - 1);
    EXPECT_EQ(kb->get("sqli", "vulns").size(), 1u);
}

TEST_F(DedupTest, ConcurrentGroupingNeverSplits) {
    constexpr int kThreads = 12;
    std::atomic<int> created{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            while (!go.load()) std::this_thread::yield();
            Info i = make_info("http://h/p" + std::to_string(t), "", Severity::Low, "Directory listing");
            if (kb->append_uniq_group("dirlist", "dirs", i).second) ++created;
        });
    }
    go.store(true);
    for (auto& th : threads) th.join();

    EXPECT_EQ(created.load(), 1);
    auto stored = kb->get("dirlist", "dirs");
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(std::get<InfoSet>(stored[0]).size(), static_cast<std::size_t>(kThreads));
}
