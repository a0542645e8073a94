#include <gtest/gtest.h>

#include <stdexcept>

#include "kb_test_util.hpp"

namespace {

class Recorder : public KbObserver {
public:
    void append(const std::string& location_a, const std::string& location_b,
                const KbValue& value, bool ignore_type) override {
        ++appends;
        last_address = location_a + "/" + location_b;
        last_ignore_type = ignore_type;
        last_value_id = value_uniq_id(value);
    }
    void update(const Finding& old_value, const Finding& new_value) override {
        ++updates;
        old_id = finding_uniq_id(old_value);
        new_id = finding_uniq_id(new_value);
    }
    void add_url(const Url& url) override {
        ++urls;
        last_url = url.str();
    }

    int appends = 0;
    int updates = 0;
    int urls = 0;
    std::string last_address;
    bool last_ignore_type = false;
    std::string last_value_id;
    std::string old_id;
    std::string new_id;
    std::string last_url;
};

// Снимает себя с регистрации из обработчика.
class OneShot : public KbObserver {
public:
    explicit OneShot(KnowledgeBase& kb) : kb_(kb) {}
    void append(const std::string&, const std::string&, const KbValue&, bool) override {
        ++calls;
        kb_.remove_observer(handle);
    }
    int handle = 0;
    int calls = 0;
private:
    KnowledgeBase& kb_;
};

class Throwing : public KbObserver {
public:
    void append(const std::string&, const std::string&, const KbValue&, bool) override {
        throw std::runtime_error("observer failed");
    }
};

}  // namespace

class ObserverTest : public KbTestBase {};

TEST_F(ObserverTest, HandlesAreMonotonic) {
    Recorder a, b;
    int h1 = kb->add_observer(a);
    int h2 = kb->add_observer(b);
    EXPECT_LT(h1, h2);
    EXPECT_TRUE(kb->remove_observer(h1));
    EXPECT_FALSE(kb->remove_observer(h1));
    Recorder c;
    EXPECT_GT(kb->add_observer(c), h2);
    EXPECT_EQ(kb->observer_count(), 2u);
}

TEST_F(ObserverTest, AppendUpdateAndUrlEventsReachEveryObserver) {
    Recorder a, b;
    kb->add_observer(a);
    kb->add_observer(b);

    Info info = make_info("http://h/a", "id");
    kb->append("p", "vulns", info);
    EXPECT_EQ(a.appends, 1);
    EXPECT_EQ(b.appends, 1);
    EXPECT_EQ(a.last_address, "p/vulns");
    EXPECT_FALSE(a.last_ignore_type);
    EXPECT_EQ(a.last_value_id, info.get_uniq_id());

    Info updated = info;
    updated.add_id(5);
    kb->update(info, updated);
    EXPECT_EQ(a.updates, 1);
    EXPECT_EQ(a.old_id, info.get_uniq_id());
    EXPECT_EQ(a.new_id, updated.get_uniq_id());

    kb->add_url(Url("http://h/new"));
    EXPECT_EQ(b.urls, 1);
    EXPECT_EQ(b.last_url, "http://h/new");

    kb->raw_write("p", "conf", raw_value(RawValue(1)));
    EXPECT_EQ(a.appends, 2);
    EXPECT_TRUE(a.last_ignore_type);
}

TEST_F(ObserverTest, DuplicateAppendUniqDoesNotNotify) {
    Recorder r;
    kb->add_observer(r);
    kb->append_uniq("p", "v", make_info("http://h/a", "id"));
    kb->append_uniq("p", "v", make_info("http://h/a", "id"));
    EXPECT_EQ(r.appends, 1);
}

TEST_F(ObserverTest, GroupMergeReportsBeforeAndAfter) {
    Recorder r;
    kb->add_observer(r);

    auto first = kb->append_uniq_group("p", "g", make_info("http://h/a", "", Severity::Low, "Same"));
    auto merged = kb->append_uniq_group("p", "g", make_info("http://h/b", "", Severity::Low, "Same"));

    EXPECT_EQ(r.appends, 1);
    EXPECT_EQ(r.updates, 1);
    EXPECT_EQ(r.old_id, first.first.get_uniq_id());
    EXPECT_EQ(r.new_id, merged.first.get_uniq_id());
}

TEST_F(ObserverTest, RemovedObserverIsNotCalled) {
    Recorder r;
    int h = kb->add_observer(r);
    kb->remove_observer(h);
    kb->append("p", "v", make_info("http://h/a", "id"));
    EXPECT_EQ(r.appends, 0);
}

TEST_F(ObserverTest, DeregistrationDuringNotifyIsSafe) {
    OneShot once(*kb);
    Recorder r;
    once.handle = kb->add_observer(once);
    kb->add_observer(r);

    kb->append("p", "v", make_info("http://h/a", "id"));
    kb->append("p", "v", make_info("http://h/b", "id"));

    EXPECT_EQ(once.calls, 1);
    EXPECT_EQ(r.appends, 2);
    EXPECT_EQ(kb->observer_count(), 1u);
}

TEST_F(ObserverTest, ObserverErrorsPropagate) {
    Throwing bad;
    kb->add_observer(bad);
    EXPECT_THROW(kb->append("p", "v", make_info("http://h/a", "id")), std::runtime_error);
    // запись уже сделана до уведомления
    EXPECT_EQ(kb->get("p", "v").size(), 1u);
}

TEST_F(ObserverTest, CleanupDropsRegistry) {
    Recorder r;
    kb->add_observer(r);
    kb->cleanup();
    EXPECT_EQ(kb->observer_count(), 0u);
    kb->append("p", "v", make_info("http://h/a", "id"));
    EXPECT_EQ(r.appends, 0);
}
