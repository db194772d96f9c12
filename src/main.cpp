#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "SignalManager.hpp"
#include "CancellationToken.hpp"
#include "DockerCliRuntime.hpp"
#include "TaskLister.hpp"
#include "TaskRunner.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    int result = 0;

    // Signals only request cancellation; the runner tears down and exits on its own
    CancellationToken cancellation;
    SignalManager::bind_cancellation(cancellation);

    try {
        // 1. Parse command line, environment and configuration file
        ParameterContext context;
        if (!context.init(argc, argv)) {
            goto end;
        }

        const ConfigData& config = context.get_config_data();
        LogUtils::init(config.global.verbose ? LogUtils::Level::Debug : LogUtils::Level::Info,
                       config.global.log_file);

        // 2. List tasks
        if (config.global.list_tasks) {
            TaskLister::print(config, std::cout);
            goto end;
        }

        // 3. Run the requested task
        try {
            DockerCliRuntime runtime(config.global.docker_binary);
            TaskRunner runner(config, runtime, cancellation);

            TaskResult task_result = runner.run(config.global.task_name);
            result = task_result.exit_code;
            goto end;

        } catch (const std::exception& e) {
            LogUtils::error("Error during task execution: {}", e.what());
            result = TaskRunner::ORCHESTRATION_FAILURE_EXIT_CODE;
            goto end;
        }

    } catch (const std::exception& e) {
        LogUtils::error("Error: {}", e.what());
        LogUtils::error("Use --help or -? to show usage information");
        result = TaskRunner::ORCHESTRATION_FAILURE_EXIT_CODE;
        goto end;
    }

end:
    LogUtils::shutdown();
    return result;
}
