#include <lifecycle-core/managed.hh>
#include <lifecycle-core/shutdown.hh>
#include <lifecycle-core/teardown.hh>

#include <iostream>
#include <memory>

// A small service stack that is set up once and torn down when the process is asked to stop.
// Run it and press Ctrl+C (or send SIGTERM) to see the teardown in reverse order.

namespace
{
struct settings
{
    int health_check_port = 8080;
    int api_port = 7070;
};

struct health_check_server
{
    explicit health_check_server(settings const& s)
    {
        std::cout << "Started HealthCheckServer on port " << s.health_check_port << std::endl;
    }

    void stop() { std::cout << "Stopped HealthCheckServer" << std::endl; }
    void mark_ready() { std::cout << "Marked HealthCheckServer Ready" << std::endl; }
    void mark_unready() { std::cout << "Marked HealthCheckServer Unready" << std::endl; }
};

// closeable, so lc::from knows how to tear it down
struct api_server
{
    explicit api_server(settings const& s) { std::cout << "Started ApiServer on port " << s.api_port << std::endl; }

    void close() { std::cout << "Stopped ApiServer" << std::endl; }
};

// the value of the stack is the api server, owned by the stack
lc::managed<api_server*> make_server_stack()
{
    // side effects only
    auto const banner = lc::eval([] { std::cout << "Starting setup..." << std::endl; },
                                 [] { std::cout << "Finished teardown" << std::endl; });

    return banner.flat_map(
        [](lc::unit&)
        {
            // no teardown required
            return lc::setup_only([] { return settings{}; })
                .flat_map(
                    [](settings& s)
                    {
                        auto health_check = lc::make_managed([s] { return std::make_shared<health_check_server>(s); },
                                                             [](std::shared_ptr<health_check_server>& hc) { hc->stop(); });

                        return health_check.flat_map(
                            [s](std::shared_ptr<health_check_server>& hc)
                            {
                                // teardown looked up via lc::teardown_traits
                                auto api = lc::from([s] { return std::make_unique<api_server>(s); });

                                return api.flat_map(
                                    [hc](std::unique_ptr<api_server>& server)
                                    {
                                        // once the api server is up the health check can report ready
                                        auto readiness = lc::eval([hc] { hc->mark_ready(); }, [hc] { hc->mark_unready(); });
                                        auto done = lc::eval_setup([] { std::cout << "Startup is finished!" << std::endl; });

                                        return readiness.flat_map([done](lc::unit&) { return done; })
                                            .map([&server](lc::unit&) { return server.get(); });
                                    });
                            });
                    });
        });
}
} // namespace

int main()
{
    make_server_stack().use_until_shutdown();

    auto const sig = lc::wait_for_termination_signal();
    std::cout << "Received signal " << sig << ", shutting down" << std::endl;

    // the registered teardown runs at exit
    return 0;
}
