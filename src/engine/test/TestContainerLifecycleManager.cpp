#include "ContainerLifecycleManager.hpp"
#include "MockContainerRuntime.hpp"
#include "OrchestrationErrors.hpp"
#include "SampleConfigs.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace {

ReadinessPolicy fast_policy(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    ReadinessPolicy policy;
    policy.timeout = timeout;
    policy.poll_interval = std::chrono::milliseconds(10);
    return policy;
}

// Message of the ContainerLifecycleError thrown by await_ready, empty if none
std::string readiness_error(ContainerLifecycleManager& lifecycle, const ContainerHandle& handle,
                            const ReadinessPolicy& policy) {
    try {
        lifecycle.await_ready(handle, policy, [] { return false; });
    } catch (const ContainerLifecycleError& e) {
        assert(e.container() == handle.name);
        return e.what();
    }
    return "";
}

}

void test_create_registers_container() {
    MockContainerRuntime runtime;
    ResourceRegistry registry;
    RunContext context("sample", "abc123", fs::temp_directory_path());
    ContainerLifecycleManager lifecycle(runtime, registry, context);

    ContainerConfig database = make_container("database", "postgres:13");
    database.command = Command("postgres -c fsync=off");
    database.environment["POSTGRES_PASSWORD"] = "secret";
    database.ports.push_back(PortMapping::parse("5432:5432"));
    database.working_directory = "/var/lib/postgresql";

    ContainerHandle handle = lifecycle.create(database, "net-1");
    assert(handle.id == "id-1");
    assert(handle.name == "database");
    assert(handle.runtime_name == "sample-database-abc123");
    assert(registry.size() == 1);
    assert(registry.containers()[0] == handle);

    assert(runtime.called("pull:postgres:13"));
    assert(runtime.index_of("pull:postgres:13") < runtime.index_of("create:database"));

    const ContainerCreateRequest* request = runtime.request_for("database");
    assert(request != nullptr);
    assert(request->name == "sample-database-abc123");
    assert(request->image == "postgres:13");
    assert(request->network == "net-1");
    assert(request->network_alias == "database");
    assert((request->command == std::vector<std::string>{"postgres", "-c", "fsync=off"}));
    assert(request->environment.at("POSTGRES_PASSWORD") == "secret");
    assert(request->ports.size() == 1);
    assert(request->working_directory == std::string("/var/lib/postgresql"));
    assert(request->labels.at("taskbox.run-id") == "abc123");
    assert(request->labels.at("taskbox.container") == "database");
    (void)request;
    std::cout << "test_create_registers_container passed" << std::endl;
}

void test_create_builds_image() {
    const fs::path dir = fs::temp_directory_path() / "taskbox-lifecycle-build";
    fs::remove_all(dir);
    fs::create_directories(dir / ".taskbox" / "build-env");
    std::ofstream(dir / ".taskbox" / "build-env" / "Dockerfile.dev") << "FROM alpine:3.18\n";

    MockContainerRuntime runtime;
    ResourceRegistry registry;
    RunContext context("sample", "abc123", dir);
    ContainerLifecycleManager lifecycle(runtime, registry, context);

    ContainerConfig container;
    container.name = "build-env";
    container.build_directory = ".taskbox/build-env";
    container.dockerfile = "Dockerfile.dev";
    lifecycle.create(container, "net-1");

    const auto builds = runtime.builds();
    assert(builds.size() == 1);
    assert(builds[0].context_directory == (dir / ".taskbox" / "build-env").string());
    assert(builds[0].dockerfile == (dir / ".taskbox" / "build-env" / "Dockerfile.dev").string());
    assert(builds[0].tag == "taskbox-sample-build-env");
    assert(runtime.request_for("build-env")->image == "taskbox-sample-build-env");
    assert(runtime.count("pull") == 0);

    ContainerConfig missing;
    missing.name = "ghost";
    missing.build_directory = "does/not/exist";
    bool thrown = false;
    try {
        lifecycle.create(missing, "net-1");
    } catch (const ContainerLifecycleError& e) {
        thrown = e.container() == "ghost";
    }
    assert(thrown);
    assert(registry.size() == 1);

    fs::remove_all(dir);
    (void)thrown;
    std::cout << "test_create_builds_image passed" << std::endl;
}

void test_create_failures() {
    MockContainerRuntime runtime;
    runtime.fail_pull.insert("private/image:1");
    runtime.fail_create.insert("web");
    ResourceRegistry registry;
    RunContext context("sample", "abc123", fs::temp_directory_path());
    ContainerLifecycleManager lifecycle(runtime, registry, context);

    bool pull_failed = false;
    try {
        lifecycle.create(make_container("private", "private/image:1"), "net-1");
    } catch (const ContainerLifecycleError& e) {
        pull_failed = e.container() == "private" &&
                      std::string(e.what()).find("manifest unknown") != std::string::npos;
    }
    assert(pull_failed);

    bool create_failed = false;
    try {
        lifecycle.create(make_container("web", "nginx:1.19"), "net-1");
    } catch (const ContainerLifecycleError& e) {
        create_failed = e.container() == "web";
    }
    assert(create_failed);

    // Nothing was created, nothing to clean up
    assert(registry.empty());
    assert(!runtime.called("create:private"));
    (void)pull_failed;
    (void)create_failed;
    std::cout << "test_create_failures passed" << std::endl;
}

void test_create_rejects_bad_volumes() {
    MockContainerRuntime runtime;
    ResourceRegistry registry;
    RunContext context("sample", "abc123", fs::temp_directory_path());
    ContainerLifecycleManager lifecycle(runtime, registry, context);

    ContainerConfig container = make_container("app", "node:14.3.0");
    container.volumes.push_back(VolumeMount::parse("./taskbox-no-such-dir:/code"));

    bool thrown = false;
    try {
        lifecycle.create(container, "net-1");
    } catch (const VolumeResolutionError&) {
        thrown = true;
    }
    assert(thrown);
    assert(runtime.calls().empty());
    (void)thrown;
    std::cout << "test_create_rejects_bad_volumes passed" << std::endl;
}

void test_await_ready() {
    MockContainerRuntime runtime;
    runtime.health_checked.insert("database");
    runtime.unhealthy.insert("broken");
    runtime.exit_before_ready.insert("crashing");
    runtime.never_ready.insert("slow");
    ResourceRegistry registry;
    RunContext context("sample", "abc123", fs::temp_directory_path());
    ContainerLifecycleManager lifecycle(runtime, registry, context);

    // No health check: running is enough
    ContainerHandle plain = lifecycle.create(make_container("plain", "alpine:3.18"), "net-1");
    lifecycle.start(plain);
    lifecycle.await_ready(plain, fast_policy(), [] { return false; });
    assert(runtime.count("inspect") == 1);

    // Health check: waits for healthy
    ContainerHandle database = lifecycle.create(make_container("database", "postgres:13"), "net-1");
    lifecycle.start(database);
    lifecycle.await_ready(database, fast_policy(), [] { return false; });
    assert(runtime.count("inspect") == 3);

    ContainerHandle broken = lifecycle.create(make_container("broken", "alpine:3.18"), "net-1");
    const std::string unhealthy = readiness_error(lifecycle, broken, fast_policy());
    assert(unhealthy.find("health check") != std::string::npos);
    assert(unhealthy.find("connection refused") != std::string::npos);

    ContainerHandle crashing = lifecycle.create(make_container("crashing", "alpine:3.18"), "net-1");
    assert(readiness_error(lifecycle, crashing, fast_policy()).find("exited with code 1") != std::string::npos);

    ContainerHandle slow = lifecycle.create(make_container("slow", "alpine:3.18"), "net-1");
    const auto started = std::chrono::steady_clock::now();
    const std::string timeout = readiness_error(lifecycle, slow, fast_policy(std::chrono::milliseconds(100)));
    assert(timeout.find("did not become ready within 100ms") != std::string::npos);
    assert(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(100));

    bool cancelled = false;
    try {
        lifecycle.await_ready(slow, fast_policy(), [] { return true; });
    } catch (const OperationCancelledError&) {
        cancelled = true;
    }
    assert(cancelled);
    (void)unhealthy;
    (void)timeout;
    (void)cancelled;
    std::cout << "test_await_ready passed" << std::endl;
}

void test_remove_all_is_exhaustive() {
    MockContainerRuntime runtime;
    runtime.fail_remove.insert("cache");
    ResourceRegistry registry;
    RunContext context("sample", "abc123", fs::temp_directory_path());
    ContainerLifecycleManager lifecycle(runtime, registry, context);

    lifecycle.create(make_container("database", "postgres:13"), "net-1");
    lifecycle.create(make_container("cache", "redis:6"), "net-1");
    lifecycle.create(make_container("app", "node:14.3.0"), "net-1");

    bool thrown = false;
    try {
        lifecycle.remove_all(std::chrono::seconds(1));
    } catch (const CleanupError& e) {
        thrown = e.failures().size() == 1 &&
                 e.failures()[0].find("sample-cache-abc123") != std::string::npos;
    }
    assert(thrown);

    // Reverse creation order, and the failure did not stop the rest
    assert((runtime.subjects("remove") == std::vector<std::string>{"app", "cache", "database"}));
    assert((runtime.subjects("stop") == std::vector<std::string>{"app", "cache", "database"}));
    assert(registry.size() == 1);
    assert(registry.containers()[0].name == "cache");

    // Once the runtime cooperates the remaining container goes away
    runtime.fail_remove.clear();
    lifecycle.remove_all(std::chrono::seconds(1));
    assert(registry.empty());
    (void)thrown;
    std::cout << "test_remove_all_is_exhaustive passed" << std::endl;
}

int main() {
    test_create_registers_container();
    test_create_builds_image();
    test_create_failures();
    test_create_rejects_bad_volumes();
    test_await_ready();
    test_remove_all_is_exhaustive();

    std::cout << "All ContainerLifecycleManager tests passed!" << std::endl;
    return 0;
}
