#include <lifecycle-core/managed.hh>

#include <nexus/test.hh>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
struct test_resource
{
    bool is_torn_down = false;

    void teardown() { is_torn_down = true; }
};

// counts setups and teardowns of independent builds
struct connection_counter
{
    int opened = 0;
    int closed = 0;

    lc::managed<int> connection()
    {
        return lc::make_managed([this] { return ++opened; }, [this](int&) { ++closed; });
    }
};
} // namespace

TEST("managed - make_managed is lazy")
{
    auto tr = std::make_shared<test_resource>();
    int setups = 0;

    auto m = lc::make_managed(
        [&]
        {
            ++setups;
            return tr;
        },
        [](std::shared_ptr<test_resource>& r) { r->teardown(); });

    CHECK(m.is_valid());
    CHECK(setups == 0);
    CHECK(!tr->is_torn_down);

    auto r = m.build();
    CHECK(setups == 1);
    CHECK(r.get() == tr);
    CHECK(!tr->is_torn_down);

    r.teardown();
    CHECK(tr->is_torn_down);
}

TEST("managed - every build is independent")
{
    connection_counter c;
    auto m = c.connection();

    auto r1 = m.build();
    auto r2 = m.build();

    CHECK(r1.get() == 1);
    CHECK(r2.get() == 2);
    CHECK(c.opened == 2);
    CHECK(c.closed == 0);

    r2.teardown();
    CHECK(c.closed == 1);
    r1.teardown();
    CHECK(c.closed == 2);
}

TEST("managed - copies share the recipe")
{
    connection_counter c;
    auto m1 = c.connection();
    auto m2 = m1;

    m1.use([](int& id) { CHECK(id == 1); });
    m2.use([](int& id) { CHECK(id == 2); });

    CHECK(c.opened == 2);
    CHECK(c.closed == 2);
}

TEST("managed - move-only setup and teardown")
{
    auto value = std::make_unique<int>(3);
    auto sink = std::make_unique<std::vector<int>>();
    auto* sink_ptr = sink.get();

    auto m = lc::make_managed([v = lc::move(value)] { return *v; },
                              [s = lc::move(sink)](int& v) { s->push_back(v); });

    m.use([](int& v) { CHECK(v == 3); });
    m.use([](int& v) { CHECK(v == 3); });

    CHECK(*sink_ptr == (std::vector<int>{3, 3}));
}

TEST("managed - setup_only")
{
    int setups = 0;
    auto m = lc::setup_only(
        [&]
        {
            ++setups;
            return std::string("config");
        });

    auto r = m.build();
    CHECK(r.get() == "config");
    r.teardown();
    CHECK(setups == 1);
}

TEST("managed - constant")
{
    auto m = lc::constant(42);
    static_assert(std::is_same_v<decltype(m), lc::managed<int>>);

    CHECK(m.use([](int& v) { return v; }) == 42);
    CHECK(m.use([](int& v) { return v + 1; }) == 43);
}

TEST("managed - eval")
{
    SECTION("setup and teardown")
    {
        std::vector<std::string> events;
        auto m = lc::eval([&] { events.push_back("setup"); }, [&] { events.push_back("teardown"); });
        CHECK(events.empty());

        auto r = m.build();
        CHECK(r.get() == lc::unit{});
        CHECK(events == (std::vector<std::string>{"setup"}));

        r.teardown();
        CHECK(events == (std::vector<std::string>{"setup", "teardown"}));
    }

    SECTION("eval_setup")
    {
        std::vector<std::string> events;
        auto m = lc::eval_setup([&] { events.push_back("setup"); });
        m.run();
        CHECK(events == (std::vector<std::string>{"setup"}));
    }

    SECTION("eval_teardown")
    {
        std::vector<std::string> events;
        auto m = lc::eval_teardown([&] { events.push_back("teardown"); });

        auto r = m.build();
        CHECK(events.empty());
        r.teardown();
        CHECK(events == (std::vector<std::string>{"teardown"}));
    }
}

TEST("managed - singleton hands out the same resource")
{
    int releases = 0;
    auto shared = lc::resource<int>::create(7, [&](int&) { ++releases; });

    auto m = lc::singleton(shared);

    auto r1 = m.build();
    auto r2 = m.build();

    r1.get() = 8;
    CHECK(r2.get() == 8);

    r1.teardown();
    CHECK(releases == 1);
}

TEST("managed - from_builder")
{
    int builds = 0;
    auto m = lc::managed<int>::from_builder(
        [&]
        {
            ++builds;
            return lc::resource<int>::constant(builds * 10);
        });

    CHECK(builds == 0);
    CHECK(m.use([](int& v) { return v; }) == 10);
    CHECK(m.use([](int& v) { return v; }) == 20);
}

TEST("managed - failing setup propagates unchanged")
{
    auto m = lc::setup_only([]() -> int { throw std::runtime_error("cannot connect"); });

    bool caught = false;
    try
    {
        (void)m.build();
    }
    catch (std::runtime_error const& e)
    {
        caught = true;
        CHECK(std::string(e.what()) == "cannot connect");
    }
    CHECK(caught);
}

TEST("managed - default constructed is empty")
{
    lc::managed<int> m;
    CHECK(!m.is_valid());
}
