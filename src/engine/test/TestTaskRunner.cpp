#include "TaskRunner.hpp"
#include "MockContainerRuntime.hpp"
#include "SampleConfigs.hpp"
#include <cassert>
#include <csignal>
#include <functional>
#include <iostream>
#include <thread>

namespace {

ReadinessPolicy fast_policy() {
    ReadinessPolicy policy;
    policy.timeout = std::chrono::seconds(5);
    policy.poll_interval = std::chrono::milliseconds(10);
    return policy;
}

bool contains(const std::optional<std::string>& text, const std::string& part) {
    return text && text->find(part) != std::string::npos;
}

// Every container that was created was also removed
bool nothing_leaked(const MockContainerRuntime& runtime) {
    return runtime.requests().size() == runtime.count("remove") &&
           runtime.networks_created() == runtime.networks_removed();
}

void cancel_later(CancellationToken& token, std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
    token.cancel(SIGINT);
}

}

void test_hello_world() {
    ConfigData config = hello_world_config();
    MockContainerRuntime runtime;
    runtime.output["build-env"] = "Hello world!\n";
    CancellationToken token;
    TaskRunner runner(config, runtime, token);

    std::string out;
    runner.set_output([&out](const std::string& chunk) { out += chunk; }, nullptr);
    TaskResult result = runner.run("hello-world");

    assert(result.succeeded());
    assert(result.exit_code == 0);
    assert(result.final_state == RunState::Completed);
    assert(!result.error);
    assert(result.cleanup_errors.empty());
    assert(runner.state() == RunState::Completed);
    assert((runner.history() == std::vector<RunState>{
        RunState::Planning, RunState::ProvisioningDependencies, RunState::RunningMainTask,
        RunState::TearingDown, RunState::Completed}));

    assert(runtime.count("create") == 1);
    assert(runtime.count("start") == 1);
    assert(runtime.count("wait") == 1);
    assert(runtime.count("remove") == 1);
    assert(runtime.networks_created() == 1);
    assert(runtime.networks_removed() == 1);
    assert((runtime.request_for("build-env")->command == std::vector<std::string>{"echo", "Hello world!"}));
    assert(runtime.request_for("build-env")->image == "node:14.3.0");
    assert(out == "Hello world!\n");
    std::cout << "test_hello_world passed" << std::endl;
}

void test_prerequisite_then_dependencies() {
    ConfigData config = joke_service_config();
    MockContainerRuntime runtime;
    CancellationToken token;
    TaskRunner runner(config, runtime, token);
    runner.set_readiness_policy(fast_policy());

    TaskResult result = runner.run("run");
    assert(result.succeeded());
    assert((runner.history() == std::vector<RunState>{
        RunState::Planning, RunState::RunningPrerequisites, RunState::ProvisioningDependencies,
        RunState::RunningMainTask, RunState::TearingDown, RunState::Completed}));

    assert((runtime.subjects("create") == std::vector<std::string>{"build-env", "joke-service", "build-env"}));
    // build finished and was cleaned up before run's stage began
    const auto calls = runtime.calls();
    size_t first_remove = runtime.index_of("remove:build-env");
    size_t joke_created = runtime.index_of("create:joke-service");
    size_t joke_ready = runtime.index_of("inspect:joke-service");
    assert(first_remove < joke_created);
    assert(joke_ready < calls.size());
    assert(calls[calls.size() - 1].rfind("network_remove:", 0) == 0);

    // The main container is created only after joke-service reported ready
    size_t main_created = calls.size();
    for (size_t i = joke_created + 1; i < calls.size(); ++i) {
        if (calls[i] == "create:build-env") {
            main_created = i;
            break;
        }
    }
    assert(joke_ready < main_created && main_created < calls.size());

    // One network shared by both stages
    assert(runtime.networks_created() == 1);
    for (const auto& request : runtime.requests()) {
        assert(request.network == "net-1");
    }
    assert(nothing_leaked(runtime));
    (void)first_remove;
    (void)joke_ready;
    (void)main_created;
    std::cout << "test_prerequisite_then_dependencies passed" << std::endl;
}

void test_failing_prerequisite_stops_invocation() {
    ConfigData config = joke_service_config();
    MockContainerRuntime runtime;
    runtime.exit_codes["build-env"] = 2;
    CancellationToken token;
    TaskRunner runner(config, runtime, token);

    TaskResult result = runner.run("run");
    assert(!result.succeeded());
    assert(result.final_state == RunState::Failed);
    assert(result.exit_code == 2);
    assert(!result.error);
    assert((runtime.subjects("create") == std::vector<std::string>{"build-env"}));
    assert(!runtime.called("create:joke-service"));
    assert(runtime.networks_created() == 1);
    assert(nothing_leaked(runtime));
    assert((runner.history() == std::vector<RunState>{
        RunState::Planning, RunState::RunningPrerequisites, RunState::TearingDown, RunState::Failed}));
    std::cout << "test_failing_prerequisite_stops_invocation passed" << std::endl;
}

void test_main_task_exit_code() {
    ConfigData config = hello_world_config();
    MockContainerRuntime runtime;
    runtime.exit_codes["build-env"] = 42;
    CancellationToken token;
    TaskRunner runner(config, runtime, token);

    TaskResult result = runner.run("hello-world");
    assert(result.exit_code == 42);
    assert(result.final_state == RunState::Failed);
    assert(!result.error);
    assert(nothing_leaked(runtime));
    std::cout << "test_main_task_exit_code passed" << std::endl;
}

void test_cycle_creates_nothing() {
    ConfigData config = hello_world_config();
    config.tasks.push_back(make_task("a", "build-env", "true", {}, {"b"}));
    config.tasks.push_back(make_task("b", "build-env", "true", {}, {"a"}));
    MockContainerRuntime runtime;
    CancellationToken token;
    TaskRunner runner(config, runtime, token);

    TaskResult result = runner.run("a");
    assert(result.exit_code == TaskRunner::ORCHESTRATION_FAILURE_EXIT_CODE);
    assert(result.final_state == RunState::Failed);
    assert(contains(result.error, "a -> b -> a"));
    assert(runtime.calls().empty());
    assert((runner.history() == std::vector<RunState>{RunState::Planning, RunState::Failed}));

    // An unrelated task in the same configuration fails as well
    assert(runner.run("hello-world").exit_code == TaskRunner::ORCHESTRATION_FAILURE_EXIT_CODE);
    assert(runtime.calls().empty());
    std::cout << "test_cycle_creates_nothing passed" << std::endl;
}

void test_unknown_task() {
    ConfigData config = hello_world_config();
    MockContainerRuntime runtime;
    CancellationToken token;
    TaskRunner runner(config, runtime, token);

    TaskResult result = runner.run("deploy");
    assert(result.exit_code == TaskRunner::ORCHESTRATION_FAILURE_EXIT_CODE);
    assert(contains(result.error, "Unknown task 'deploy'"));
    assert(runtime.calls().empty());
    std::cout << "test_unknown_task passed" << std::endl;
}

void test_failing_dependency_prevents_main_container() {
    ConfigData config = joke_service_config();
    config.global.skip_prerequisites = true;
    MockContainerRuntime runtime;
    runtime.fail_start.insert("joke-service");
    CancellationToken token;
    TaskRunner runner(config, runtime, token);

    TaskResult result = runner.run("run");
    assert(result.exit_code == TaskRunner::ORCHESTRATION_FAILURE_EXIT_CODE);
    assert(contains(result.error, "joke-service"));
    assert((runtime.subjects("create") == std::vector<std::string>{"joke-service"}));
    assert(nothing_leaked(runtime));
    assert((runner.history() == std::vector<RunState>{
        RunState::Planning, RunState::ProvisioningDependencies, RunState::TearingDown, RunState::Failed}));
    std::cout << "test_failing_dependency_prevents_main_container passed" << std::endl;
}

void test_unhealthy_dependency() {
    ConfigData config = joke_service_config();
    config.global.skip_prerequisites = true;
    MockContainerRuntime runtime;
    runtime.unhealthy.insert("joke-service");
    CancellationToken token;
    TaskRunner runner(config, runtime, token);
    runner.set_readiness_policy(fast_policy());

    TaskResult result = runner.run("run");
    assert(result.exit_code == TaskRunner::ORCHESTRATION_FAILURE_EXIT_CODE);
    assert(contains(result.error, "health check"));
    assert(!runtime.called("wait:build-env"));
    assert(runtime.count("create") == 1);
    assert(nothing_leaked(runtime));
    std::cout << "test_unhealthy_dependency passed" << std::endl;
}

void test_partial_startup_is_cleaned_up() {
    ConfigData config = make_config();
    config.containers.push_back(make_container("app", "node:14.3.0"));
    config.containers.push_back(make_container("db", "postgres:13"));
    config.containers.push_back(make_container("cache", "redis:6"));
    config.containers.push_back(make_container("queue", "rabbitmq:3"));
    config.containers.push_back(make_container("api", "api:1", {"db", "cache", "queue"}));
    config.tasks.push_back(make_task("e2e", "app", "npm test", {"api"}));
    MockContainerRuntime runtime;
    runtime.fail_create.insert("queue");
    runtime.health_checked.insert("db");
    CancellationToken token;
    TaskRunner runner(config, runtime, token);
    runner.set_readiness_policy(fast_policy());

    TaskResult result = runner.run("e2e");
    assert(result.exit_code == TaskRunner::ORCHESTRATION_FAILURE_EXIT_CODE);
    assert(contains(result.error, "queue"));
    assert(!runtime.called("create:api"));
    assert(!runtime.called("create:app"));
    assert(nothing_leaked(runtime));
    std::cout << "test_partial_startup_is_cleaned_up passed" << std::endl;
}

void test_run_overrides_and_extra_args() {
    ConfigData config = make_config();
    ContainerConfig build_env = make_container("build-env", "openjdk:11");
    build_env.command = Command("./gradlew --version");
    ContainerConfig app_env = make_container("app-env", "node:14.3.0");
    app_env.environment = {{"NODE_ENV", "production"}, {"PORT", "8080"}};
    app_env.ports.push_back(PortMapping::parse("8080:8080"));
    app_env.working_directory = "/code";
    config.containers.push_back(build_env);
    config.containers.push_back(app_env);

    config.tasks.push_back(make_task("build", "build-env", ""));
    TaskConfig start = make_task("start", "app-env", "npm start", {}, {"build"});
    start.run->environment = {{"NODE_ENV", "development"}, {"DEBUG", "app:*"}};
    start.run->ports.push_back(PortMapping::parse("9229:9229"));
    start.run->working_directory = "/code/app";
    start.run->entrypoint = "/bin/sh -c";
    config.tasks.push_back(start);
    config.global.extra_args = {"--", "--inspect"};

    MockContainerRuntime runtime;
    CancellationToken token;
    TaskRunner runner(config, runtime, token);
    assert(runner.run("start").succeeded());

    const ContainerCreateRequest* build = runtime.request_for("build-env");
    assert((build->command == std::vector<std::string>{"./gradlew", "--version"}));

    const ContainerCreateRequest* app = runtime.request_for("app-env");
    assert((app->command == std::vector<std::string>{"npm", "start", "--", "--inspect"}));
    assert(app->environment.at("NODE_ENV") == "development");
    assert(app->environment.at("PORT") == "8080");
    assert(app->environment.at("DEBUG") == "app:*");
    assert(app->ports.size() == 2);
    assert(app->ports[1].local_port == 9229);
    assert(app->working_directory == std::string("/code/app"));
    assert(app->entrypoint == std::string("/bin/sh -c"));
    (void)build;
    (void)app;
    std::cout << "test_run_overrides_and_extra_args passed" << std::endl;
}

void test_prerequisite_only_task() {
    ConfigData config = joke_service_config();
    config.tasks.push_back(make_task("lint", "build-env", "./gradlew check"));
    config.tasks.push_back(make_prerequisite_task("ci", {"lint", "build"}));
    MockContainerRuntime runtime;
    CancellationToken token;
    TaskRunner runner(config, runtime, token);

    TaskResult result = runner.run("ci");
    assert(result.succeeded());
    assert(runtime.count("create") == 2);
    assert(runtime.networks_created() == 1);
    assert(nothing_leaked(runtime));
    assert((runner.history() == std::vector<RunState>{
        RunState::Planning, RunState::RunningPrerequisites, RunState::TearingDown, RunState::Completed}));
    std::cout << "test_prerequisite_only_task passed" << std::endl;
}

void test_cleanup_failures_are_reported() {
    ConfigData config = hello_world_config();
    MockContainerRuntime runtime;
    runtime.fail_remove.insert("build-env");
    runtime.fail_network_remove = true;
    CancellationToken token;
    TaskRunner runner(config, runtime, token);

    TaskResult result = runner.run("hello-world");
    assert(result.final_state == RunState::Failed);
    assert(result.exit_code == TaskRunner::ORCHESTRATION_FAILURE_EXIT_CODE);
    assert(result.cleanup_errors.size() == 2);
    assert(contains(result.error, "2 resource(s) could not be cleaned up"));
    assert(runtime.count("remove") == 1);
    assert(runtime.count("network_remove") == 1);
    std::cout << "test_cleanup_failures_are_reported passed" << std::endl;
}

void test_interrupt_during_main_task() {
    ConfigData config = hello_world_config();
    MockContainerRuntime runtime;
    runtime.blocking.insert("build-env");
    CancellationToken token;
    TaskRunner runner(config, runtime, token);

    std::thread interrupter(cancel_later, std::ref(token), std::chrono::milliseconds(200));
    TaskResult result = runner.run("hello-world");
    interrupter.join();

    assert(result.exit_code == TaskRunner::INTERRUPTED_EXIT_CODE);
    assert(result.final_state == RunState::Failed);
    assert(runtime.called("stop:build-env"));
    assert(nothing_leaked(runtime));
    std::cout << "test_interrupt_during_main_task passed" << std::endl;
}

void test_interrupt_during_readiness() {
    ConfigData config = joke_service_config();
    config.global.skip_prerequisites = true;
    MockContainerRuntime runtime;
    runtime.never_ready.insert("joke-service");
    CancellationToken token;
    TaskRunner runner(config, runtime, token);
    runner.set_readiness_policy(fast_policy());

    std::thread interrupter(cancel_later, std::ref(token), std::chrono::milliseconds(100));
    TaskResult result = runner.run("run");
    interrupter.join();

    assert(result.exit_code == TaskRunner::INTERRUPTED_EXIT_CODE);
    assert(!runtime.called("create:build-env"));
    assert(nothing_leaked(runtime));
    std::cout << "test_interrupt_during_readiness passed" << std::endl;
}

void test_interrupt_while_pulling_image() {
    ConfigData config = hello_world_config();
    MockContainerRuntime runtime;
    CancellationToken token;
    runtime.on_pull = [&token](const std::string&) { token.cancel(SIGINT); };
    TaskRunner runner(config, runtime, token);

    TaskResult result = runner.run("hello-world");
    assert(result.exit_code == TaskRunner::INTERRUPTED_EXIT_CODE);
    assert(result.final_state == RunState::Failed);
    assert(runtime.called("create:build-env"));
    assert(!runtime.called("start:build-env"));
    assert(!runtime.called("wait:build-env"));
    assert(nothing_leaked(runtime));
    std::cout << "test_interrupt_while_pulling_image passed" << std::endl;
}

void test_interrupt_while_pulling_dependency() {
    ConfigData config = joke_service_config();
    config.global.skip_prerequisites = true;
    MockContainerRuntime runtime;
    CancellationToken token;
    runtime.on_pull = [&token](const std::string& image) {
        if (image == "jokes:1.0") {
            token.cancel(SIGTERM);
        }
    };
    TaskRunner runner(config, runtime, token);
    runner.set_readiness_policy(fast_policy());

    TaskResult result = runner.run("run");
    assert(result.exit_code == TaskRunner::INTERRUPTED_EXIT_CODE);
    assert(runtime.called("create:joke-service"));
    assert(!runtime.called("start:joke-service"));
    assert(!runtime.called("create:build-env"));
    assert(nothing_leaked(runtime));
    std::cout << "test_interrupt_while_pulling_dependency passed" << std::endl;
}

void test_interrupt_as_main_task_exits() {
    ConfigData config = hello_world_config();
    MockContainerRuntime runtime;
    CancellationToken token;
    runtime.on_exit = [&token](const std::string&) { token.cancel(SIGINT); };
    TaskRunner runner(config, runtime, token);

    TaskResult result = runner.run("hello-world");
    assert(result.exit_code == TaskRunner::INTERRUPTED_EXIT_CODE);
    assert(result.final_state == RunState::Failed);
    assert(runtime.called("wait:build-env"));
    assert(nothing_leaked(runtime));
    std::cout << "test_interrupt_as_main_task_exits passed" << std::endl;
}

void test_interrupt_before_start() {
    ConfigData config = hello_world_config();
    MockContainerRuntime runtime;
    CancellationToken token;
    token.cancel(SIGTERM);
    TaskRunner runner(config, runtime, token);

    TaskResult result = runner.run("hello-world");
    assert(result.exit_code == TaskRunner::INTERRUPTED_EXIT_CODE);
    assert(runtime.calls().empty());
    std::cout << "test_interrupt_before_start passed" << std::endl;
}

void test_volume_error_creates_nothing() {
    ConfigData config = hello_world_config();
    config.containers[0].volumes.push_back(VolumeMount::parse("./taskbox-missing-dir:/code"));
    MockContainerRuntime runtime;
    CancellationToken token;
    TaskRunner runner(config, runtime, token);

    TaskResult result = runner.run("hello-world");
    assert(result.exit_code == TaskRunner::ORCHESTRATION_FAILURE_EXIT_CODE);
    assert(contains(result.error, "does not exist"));
    assert(runtime.calls().empty());
    std::cout << "test_volume_error_creates_nothing passed" << std::endl;
}

int main() {
    test_hello_world();
    test_prerequisite_then_dependencies();
    test_failing_prerequisite_stops_invocation();
    test_main_task_exit_code();
    test_cycle_creates_nothing();
    test_unknown_task();
    test_failing_dependency_prevents_main_container();
    test_unhealthy_dependency();
    test_partial_startup_is_cleaned_up();
    test_run_overrides_and_extra_args();
    test_prerequisite_only_task();
    test_cleanup_failures_are_reported();
    test_interrupt_during_main_task();
    test_interrupt_during_readiness();
    test_interrupt_while_pulling_image();
    test_interrupt_while_pulling_dependency();
    test_interrupt_as_main_task_exits();
    test_interrupt_before_start();
    test_volume_error_creates_nothing();

    std::cout << "All TaskRunner tests passed!" << std::endl;
    return 0;
}
