#include "scopegraph/tools/cli/DemoCli.hpp"
#include "scopegraph/tools/cli/DemoScenario.hpp"

#include <scopegraph/graph/RuntimeOptions.hpp>

#include "scopegraph/log/TaggedLogger.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    using SG::Tools::DemoCli;
    SG::Tools::DemoSettings settings{};

    DemoCli cli;
    cli.set_program_name("scopegraph_demo");
    cli.set_error_logger([](std::string const& message) { std::cerr << message << "\n"; });
    SG::Tools::register_demo_options(cli, settings);

    if (!cli.parse(argc, argv)) {
        std::cerr << SG::Tools::demo_usage("scopegraph_demo");
        return 1;
    }
    if (settings.show_help) {
        std::cout << SG::Tools::demo_usage("scopegraph_demo");
        return 0;
    }

#ifdef SG_LOG_DEBUG
    SG::set_thread_name("Demo");
    SG::set_logging_enabled(settings.enable_log || SG::envFlagEnabled("SCOPEGRAPH_LOG"));
#else
    if (settings.enable_log) {
        std::cerr << "scopegraph_demo: built without SG_LOG_DEBUG, --log has no effect\n";
    }
#endif

    return SG::Tools::run_demo(settings, std::cout, std::cerr);
}
