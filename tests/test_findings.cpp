#include <gtest/gtest.h>

#include "finding.hpp"
#include "kb_errors.hpp"
#include "kb_test_util.hpp"

TEST(UrlTest, NormalizesSchemeHostAndFragment) {
    Url u("  HTTPS://Example.COM/Path?a=1#frag ");
    EXPECT_EQ(u.str(), "https://example.com/Path?a=1");
    EXPECT_EQ(u.host(), "example.com");
    EXPECT_EQ(Url("http://example.com").str(), "http://example.com/");
    EXPECT_EQ(Url("http://example.com?x=1").str(), "http://example.com/?x=1");
}

TEST(UrlTest, RejectsNonUrl) {
    EXPECT_THROW(Url("example.com/index.php"), KbTypeError);
    EXPECT_THROW(Url("http:///nohost"), KbTypeError);
}

TEST(DataContainerTest, KeySetIgnoresOrderAndValues) {
    auto a = make_dc({{"id", "1"}, {"name", "x"}});
    auto b = make_dc({{"name", "y"}, {"id", "2"}});
    EXPECT_EQ(a.key_set(), b.key_set());
    EXPECT_FALSE(a == b);

    a.set("id", "3");
    EXPECT_EQ(a.params().size(), 2u);
    EXPECT_EQ(a.params()[0].second, "3");
}

TEST(FuzzableRequestTest, ShapeKeyUsesMethodPathAndParamNames) {
    FuzzableRequest r1(Url("http://h/a.php?id=1&x=2"), "get");
    FuzzableRequest r2(Url("http://h/a.php?x=9&id=7"), "GET");
    FuzzableRequest r3(Url("http://h/a.php?id=1&x=2"), "POST");
    FuzzableRequest r4(Url("http://h/a.php"), "POST", make_dc({{"user", "a"}}));

    EXPECT_EQ(r1.get_method(), "GET");
    EXPECT_EQ(r1.shape_key(), r2.shape_key());
    EXPECT_NE(r1.shape_key(), r3.shape_key());
    EXPECT_NE(r3.shape_key(), r4.shape_key());
}

TEST(FindingTest, VulnRejectsInformationSeverity) {
    EXPECT_THROW(Vuln("x", "d", Severity::Information, "p"), KbTypeError);
    EXPECT_THROW(Vuln(make_info("http://h/", "a")), KbTypeError);

    Vuln v = make_vuln("http://h/", "a", Severity::Low);
    EXPECT_THROW(v.set_severity(Severity::Information), KbTypeError);
    v.set_severity(Severity::Medium);
    EXPECT_EQ(v.get_severity(), Severity::Medium);

    Info& as_base = v;
    EXPECT_THROW(as_base.set_severity(Severity::Information), KbTypeError);
    EXPECT_EQ(v.get_severity(), Severity::Medium);
}

TEST(FindingTest, UniqIdIsContentDerived) {
    Info a = make_info("http://h/a", "id");
    Info b = make_info("http://h/a", "id");
    Info c = make_info("http://h/a", "name");
    EXPECT_EQ(a.get_uniq_id(), b.get_uniq_id());
    EXPECT_NE(a.get_uniq_id(), c.get_uniq_id());

    Info high = make_info("http://h/a", "id", Severity::High);
    Vuln v(high);
    EXPECT_NE(high.get_uniq_id(), v.get_uniq_id());
}

TEST(FindingTest, InfoSetRequiresMembers) {
    EXPECT_THROW(InfoSet(std::vector<GroupMember>{}), KbTypeError);
}

TEST(FindingTest, InfoSetMatchByNameAndTag) {
    Info first = make_info("http://h/a", "id", Severity::Low, "Cookie without HttpOnly");
    first.set_attr("cookie", "SESSID");

    InfoSet by_name(std::vector<GroupMember>{first});
    Info other = make_info("http://h/b", "q", Severity::Low, "Cookie without HttpOnly");
    other.set_attr("cookie", "lang");
    EXPECT_TRUE(by_name.match(other));
    EXPECT_FALSE(by_name.match(make_info("http://h/a", "id", Severity::Low, "Other")));

    InfoSet by_tag(std::vector<GroupMember>{first}, "cookie");
    EXPECT_FALSE(by_tag.match(other));
    other.set_attr("cookie", "SESSID");
    EXPECT_TRUE(by_tag.match(other));
}

TEST(FindingTest, InfoSetIdentityChangesOnAdd) {
    InfoSet s(std::vector<GroupMember>{make_info("http://h/a", "id")});
    const std::string before = s.get_uniq_id();
    s.add(make_vuln("http://h/b", "id"));
    EXPECT_EQ(s.size(), 2u);
    EXPECT_NE(before, s.get_uniq_id());
    EXPECT_TRUE(std::holds_alternative<Vuln>(s.infos()[1]));
    EXPECT_EQ(s.get_url()->str(), "http://h/a");
}

TEST(FindingTest, CapabilitySurface) {
    Finding info = make_info("http://h/a", "id", Severity::Information);
    Finding vuln = make_vuln("http://h/a", "id", Severity::High);
    Finding shell = Shell(make_vuln("http://h/x", "cmd"), "os_commanding");

    EXPECT_EQ(finding_kind(info), FindingKind::Info);
    EXPECT_EQ(finding_kind(vuln), FindingKind::Vuln);
    EXPECT_EQ(finding_kind(shell), FindingKind::Shell);

    EXPECT_EQ(*finding_severity(info), Severity::Information);
    EXPECT_EQ(*finding_severity(vuln), Severity::High);
    EXPECT_FALSE(finding_severity(shell).has_value());

    EXPECT_EQ(finding_url(shell)->str(), "http://h/x");
    EXPECT_EQ(finding_token_name(shell), "cmd");
    EXPECT_FALSE(finding_dc(info).has_value());
}

TEST(FindingTest, SeverityNames) {
    for (auto s : {Severity::Information, Severity::Low, Severity::Medium, Severity::High}) {
        EXPECT_EQ(severity_from_string(severity_to_string(s)), s);
    }
    EXPECT_THROW(severity_from_string("Critical"), KbTypeError);
}
