#include <lifecycle-core/sequence.hh>

#include <nexus/test.hh>

#include <list>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
struct worker_pool
{
    std::vector<std::string> events;

    lc::managed<int> worker(int id)
    {
        return lc::make_managed(
            [this, id]
            {
                events.push_back("start " + std::to_string(id));
                return id;
            },
            [this](int& i) { events.push_back("stop " + std::to_string(i)); });
    }
};
} // namespace

TEST("sequence - collects values in order and tears down in reverse")
{
    worker_pool pool;
    auto workers = std::vector<lc::managed<int>>{pool.worker(1), pool.worker(2), pool.worker(3)};

    auto all = lc::sequence(workers);
    static_assert(std::is_same_v<decltype(all), lc::managed<std::vector<int>>>);

    CHECK(pool.events.empty());

    auto r = all.build();
    CHECK(r.get() == (std::vector<int>{1, 2, 3}));
    CHECK(pool.events == (std::vector<std::string>{"start 1", "start 2", "start 3"}));

    r.teardown();
    CHECK(pool.events
          == (std::vector<std::string>{"start 1", "start 2", "start 3", "stop 3", "stop 2", "stop 1"}));
}

TEST("sequence - every build collects into a fresh collection")
{
    worker_pool pool;
    auto all = lc::sequence(std::vector<lc::managed<int>>{pool.worker(1), pool.worker(2)});

    all.use([](std::vector<int>& ids) { CHECK(ids.size() == 2u); });
    all.use([](std::vector<int>& ids) { CHECK(ids.size() == 2u); });
}

TEST("sequence - empty input")
{
    auto all = lc::sequence(std::vector<lc::managed<int>>{});

    all.use([](std::vector<int>& ids) { CHECK(ids.empty()); });
}

TEST("sequence - keeps the container kind")
{
    worker_pool pool;
    auto workers = std::list<lc::managed<int>>{pool.worker(4), pool.worker(5)};

    auto all = lc::sequence(workers);
    static_assert(std::is_same_v<decltype(all), lc::managed<std::list<int>>>);

    all.use([](std::list<int>& ids) { CHECK(ids == (std::list<int>{4, 5})); });
    CHECK(pool.events == (std::vector<std::string>{"start 4", "start 5", "stop 5", "stop 4"}));
}

TEST("sequence - failing setup tears down the started elements")
{
    worker_pool pool;
    auto broken = lc::setup_only([]() -> int { throw std::runtime_error("worker 3 failed to start"); });
    auto workers = std::vector<lc::managed<int>>{pool.worker(1), pool.worker(2), broken, pool.worker(4)};

    bool caught = false;
    try
    {
        (void)lc::sequence(workers).build();
    }
    catch (std::runtime_error const& e)
    {
        caught = true;
        CHECK(std::string(e.what()) == "worker 3 failed to start");
    }

    CHECK(caught);
    CHECK(pool.events == (std::vector<std::string>{"start 1", "start 2", "stop 2", "stop 1"}));
}

TEST("sequence - failing teardown still stops the other elements")
{
    worker_pool pool;
    auto stuck = lc::make_managed([] { return 0; }, [](int&) { throw std::runtime_error("worker 0 is stuck"); });
    auto workers = std::vector<lc::managed<int>>{pool.worker(1), stuck, pool.worker(2)};

    auto r = lc::sequence(workers).build();
    CHECK(r.get() == (std::vector<int>{1, 0, 2}));

    bool caught = false;
    try
    {
        r.teardown();
    }
    catch (std::runtime_error const& e)
    {
        caught = true;
        CHECK(std::string(e.what()) == "worker 0 is stuck");
    }

    CHECK(caught);
    CHECK(pool.events == (std::vector<std::string>{"start 1", "start 2", "stop 2", "stop 1"}));
}
