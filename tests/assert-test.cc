#include <lifecycle-core/assert-handler.hh>
#include <lifecycle-core/assert.hh>
#include <lifecycle-core/error.hh>
#include <lifecycle-core/managed.hh>
#include <lifecycle-core/shutdown.hh>
#include <lifecycle-core/unique_function.hh>

#include <nexus/test.hh>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
// message of the contract violation raised by f, empty if f kept the contract
template <class F>
std::string violation_of(F&& f)
{
    try
    {
        f();
    }
    catch (lc::impl::contract_violation const& v)
    {
        return v.what();
    }
    return {};
}
} // namespace

TEST("contracts - violation report")
{
    auto guard = lc::impl::scoped_assertion_handler(lc::impl::throw_contract_violation);

    int const line = __LINE__ + 4;
    std::optional<lc::impl::assertion_info> info;
    try
    {
        LC_ASSERT_ALWAYS(1 + 1 == 3, "resource was already torn down");
    }
    catch (lc::impl::contract_violation const& v)
    {
        info = v.info;
    }

    REQUIRE(info.has_value());
    CHECK(info->message == "resource was already torn down");
    CHECK(info->expression == "1 + 1 == 3");
    CHECK(std::string(info->location.file_name()).ends_with("assert-test.cc"));
    CHECK(info->location.line() == line);
}

TEST("contracts - kept contracts report nothing")
{
    int reports = 0;
    auto guard = lc::impl::scoped_assertion_handler([&](lc::impl::assertion_info const&) { ++reports; });

    auto r = lc::make_managed([] { return 1; }, [](int&) {}).build();
    CHECK(r.get() == 1);
    r.teardown();

    lc::unique_function<int()> f = [] { return 2; };
    CHECK(f() == 2);

    LC_ASSERT_ALWAYS(r.is_valid(), "torn down handles stay valid");

    CHECK(reports == 0);
}

#if LC_ASSERT_ENABLED

TEST("contracts - a built resource is torn down exactly once")
{
    auto guard = lc::impl::scoped_assertion_handler(lc::impl::throw_contract_violation);

    int releases = 0;
    auto m = lc::make_managed([] { return 7; }, [&](int&) { ++releases; });

    SECTION("twice through the same handle")
    {
        auto r = m.build();
        r.teardown();
        CHECK(violation_of([&] { r.teardown(); }) == "resource was already torn down");
        CHECK(releases == 1);
    }

    SECTION("twice through a copy of the handle")
    {
        auto r = m.build();
        auto copy = r;
        copy.teardown();
        CHECK(violation_of([&] { r.teardown(); }) == "resource was already torn down");
        CHECK(releases == 1);
    }

    SECTION("composed resources")
    {
        auto r = m.map([](int& v) { return v + 1; }).build();
        CHECK(r.get() == 8);
        r.teardown();
        CHECK(violation_of([&] { r.teardown(); }) == "resource was already torn down");
        CHECK(releases == 1);
    }

    SECTION("separate builds are independent")
    {
        auto a = m.build();
        auto b = m.build();
        a.teardown();
        CHECK(violation_of([&] { b.teardown(); }).empty());
        CHECK(releases == 2);
    }
}

TEST("contracts - empty managed and resource")
{
    auto guard = lc::impl::scoped_assertion_handler(lc::impl::throw_contract_violation);

    SECTION("building a default-constructed managed")
    {
        lc::managed<int> m;
        CHECK(!m.is_valid());
        CHECK(violation_of([&] { (void)m.build(); }) == "cannot build an empty lc::managed");
    }

    SECTION("building a moved-from managed")
    {
        auto m = lc::constant(3);
        auto moved = lc::move(m);
        CHECK(moved.use([](int& v) { return v; }) == 3);
        CHECK(violation_of([&] { (void)m.build(); }) == "cannot build an empty lc::managed");
    }

    SECTION("accessing an empty resource")
    {
        lc::resource<int> r;
        CHECK(violation_of([&] { (void)r.get(); }) == "cannot access an empty lc::resource");
        CHECK(violation_of([&] { r.teardown(); }) == "cannot tear down an empty lc::resource");
    }

    SECTION("wrapping an empty resource")
    {
        CHECK(violation_of([] { (void)lc::singleton(lc::resource<int>()); })
              == "cannot create lc::managed from an empty lc::resource");
    }
}

TEST("contracts - empty callbacks")
{
    auto guard = lc::impl::scoped_assertion_handler(lc::impl::throw_contract_violation);

    SECTION("calling an empty unique_function")
    {
        lc::unique_function<void()> f;
        CHECK(violation_of([&] { f(); }) == "cannot call in invalid lc::unique_function");
    }

    SECTION("registering an empty shutdown hook")
    {
        auto const pending = lc::pending_shutdown_hook_count();
        CHECK(violation_of([] { lc::add_shutdown_hook(lc::shutdown_hook()); }) == "cannot register an empty shutdown hook");
        CHECK(lc::pending_shutdown_hook_count() == pending);
    }
}

TEST("contracts - empty failures cannot be aggregated")
{
    auto guard = lc::impl::scoped_assertion_handler(lc::impl::throw_contract_violation);

    auto const failure = std::make_exception_ptr(std::runtime_error("teardown failed"));

    SECTION("suppressing nothing")
    {
        auto e = lc::error("setup failed");
        CHECK(violation_of([&] { e.add_suppressed(nullptr); }) == "cannot suppress an empty exception_ptr");
        CHECK(e.suppressed().empty());
    }

    SECTION("suppressing into nothing")
    {
        CHECK(violation_of([&] { (void)lc::with_suppressed(nullptr, failure); }) == "primary failure must not be empty");
        CHECK(violation_of([&] { (void)lc::with_suppressed(failure, nullptr); }) == "suppressed failure must not be empty");
    }
}

TEST("contracts - innermost handler receives the violation")
{
    std::vector<std::string> seen;

    auto outer = lc::impl::scoped_assertion_handler(
        [&](lc::impl::assertion_info const& info)
        {
            seen.push_back("outer: " + info.message);
            lc::impl::throw_contract_violation(info);
        });

    auto r = lc::resource<int>();
    {
        auto inner = lc::impl::scoped_assertion_handler(
            [&](lc::impl::assertion_info const& info)
            {
                seen.push_back("inner: " + info.message);
                lc::impl::throw_contract_violation(info);
            });

        (void)violation_of([&] { (void)r.get(); });
    }
    (void)violation_of([&] { r.teardown(); });

    CHECK(seen
          == (std::vector<std::string>{
              "inner: cannot access an empty lc::resource",
              "outer: cannot tear down an empty lc::resource",
          }));
}

#endif
