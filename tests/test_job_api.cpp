#include "chaosbox/api/job_api.hpp"
#include "chaosbox/core/errors.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace chaosbox;
using api::ApiResponse;
using api::JobApi;
using api::json;
using chaosbox::testing::FakeClock;
using chaosbox::testing::FakeContainerRuntime;
using chaosbox::testing::FakeProxyApi;
using chaosbox::testing::TestDirectory;

class JobApiTest : public ::testing::Test {
protected:
    TestDirectory temp_{"chaosbox_api_test"};
    FakeClock clock_;
    core::JobRegistry registry_{clock_};
    FakeContainerRuntime runtime_;
    FakeProxyApi proxy_api_;
    network::NetworkFaultController faults_{proxy_api_};
    sandbox::ContainerExecutor executor_{runtime_, &faults_, MakeConfig(temp_.Path())};
    core::JobLifecycleController controller_{registry_, executor_};
    JobApi api_{registry_, controller_};

    static sandbox::ExecutorConfig MakeConfig(const std::filesystem::path& root) {
        sandbox::ExecutorConfig config;
        config.temp_root = root;
        return config;
    }

    std::string SubmitAndWait(const json& request) {
        ApiResponse response = api_.SubmitJob(request);
        EXPECT_EQ(response.status_code, 200) << response.body.dump();
        std::string id = response.body.at("jobId").get<std::string>();
        EXPECT_TRUE(controller_.Wait(id, std::chrono::seconds(10)));
        return id;
    }
};

TEST_F(JobApiTest, SubmitReturnsQueuedJobId) {
    ApiResponse response = api_.SubmitJob(json{
        {"language", "python"}, {"code", "print(1+1)"}, {"scenario", json::object()}});

    ASSERT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body.at("status"), "queued");
    EXPECT_FALSE(response.body.at("jobId").get<std::string>().empty());
}

TEST_F(JobApiTest, SubmitRejectsMissingOrIllTypedFields) {
    EXPECT_EQ(api_.SubmitJob(json{{"code", "x"}, {"scenario", json::object()}}).status_code, 400);
    EXPECT_EQ(api_.SubmitJob(json{{"language", "python"}, {"scenario", json::object()}})
                  .status_code, 400);
    EXPECT_EQ(api_.SubmitJob(json{{"language", "python"}, {"code", "x"}}).status_code, 400);
    EXPECT_EQ(api_.SubmitJob(json{{"language", 7}, {"code", "x"}, {"scenario", json::object()}})
                  .status_code, 400);
    EXPECT_EQ(api_.SubmitJob(json{{"language", "python"}, {"code", "x"},
                                  {"scenario", {{"networkLatencyMs", "slow"}}}})
                  .status_code, 400);
    EXPECT_EQ(api_.SubmitJob(json{{"language", "python"}, {"code", "x"},
                                  {"scenario", {{"simulateCrash", 1}}}})
                  .status_code, 400);
    EXPECT_EQ(api_.SubmitJob(json::array()).status_code, 400);

    ApiResponse malformed = api_.SubmitJob(std::string("{\"language\": "));
    EXPECT_EQ(malformed.status_code, 400);
    EXPECT_TRUE(malformed.body.contains("error"));

    EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(JobApiTest, UnsupportedLanguageIsAcceptedThenFails) {
    std::string id = SubmitAndWait(json{
        {"language", "ruby"}, {"code", "puts 1"}, {"scenario", json::object()}});

    ApiResponse logs = api_.GetLogs(id);
    ASSERT_EQ(logs.status_code, 200);
    EXPECT_EQ(logs.body.at("status"), "failed");
    EXPECT_EQ(logs.body.at("result").at("error"), "Unsupported language: ruby");
}

TEST_F(JobApiTest, LogsCarryResultAfterCompletion) {
    runtime_.output_chunks = {"2\n"};

    std::string id = SubmitAndWait(json::parse(R"json({
        "language": "python",
        "code": "print(1+1)",
        "scenario": {"networkLatencyMs": null, "simulateCrash": false}
    })json"));

    ApiResponse response = api_.GetLogs(id);
    ASSERT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body.at("jobId"), id);
    EXPECT_EQ(response.body.at("status"), "completed");
    EXPECT_EQ(response.body.at("result").at("output"), "2");
    EXPECT_EQ(response.body.at("result").at("success"), true);
    EXPECT_EQ(response.body.at("result").at("exitCode"), 0);
    EXPECT_FALSE(response.body.at("result").contains("error"));
    EXPECT_GE(response.body.at("logs").size(), 3u);
}

TEST_F(JobApiTest, StatusShowsNullCompletionUntilTerminal) {
    core::Job job = registry_.Create("python", "print(1)", core::Scenario{});

    ApiResponse queued = api_.GetStatus(job.id);
    ASSERT_EQ(queued.status_code, 200);
    EXPECT_EQ(queued.body.at("status"), "queued");
    EXPECT_EQ(queued.body.at("createdAt"), "2026-10-18T09:15:02.000Z");
    EXPECT_TRUE(queued.body.at("completedAt").is_null());

    EXPECT_TRUE(api_.GetLogs(job.id).body.at("result").is_null());

    clock_.Advance(std::chrono::seconds(3));
    ASSERT_EQ(api_.CancelJob(job.id).status_code, 200);

    ApiResponse cancelled = api_.GetStatus(job.id);
    EXPECT_EQ(cancelled.body.at("status"), "cancelled");
    EXPECT_EQ(cancelled.body.at("completedAt"), "2026-10-18T09:15:05.000Z");
}

TEST_F(JobApiTest, UnknownIdsAre404) {
    EXPECT_EQ(api_.GetLogs("nope").status_code, 404);
    EXPECT_EQ(api_.GetStatus("nope").status_code, 404);
    EXPECT_EQ(api_.CancelJob("nope").status_code, 404);
}

TEST_F(JobApiTest, CancelQueuedThenTerminalJob) {
    core::Job job = registry_.Create("python", "print(1)", core::Scenario{});

    ApiResponse first = api_.CancelJob(job.id);
    ASSERT_EQ(first.status_code, 200);
    EXPECT_EQ(first.body.at("status"), "cancelled");

    auto logs = api_.GetLogs(job.id).body.at("logs");
    EXPECT_NE(logs.back().get<std::string>().find("Job was cancelled by user."),
              std::string::npos);
    EXPECT_EQ(api_.GetLogs(job.id).body.at("result").at("error"), "Job was cancelled by user.");

    ApiResponse second = api_.CancelJob(job.id);
    EXPECT_EQ(second.status_code, 400);
    EXPECT_TRUE(second.body.contains("error"));
}

TEST_F(JobApiTest, ListJobsFiltersByStatus) {
    core::Job queued = registry_.Create("python", "1", core::Scenario{});
    clock_.Advance(std::chrono::seconds(1));
    core::Job cancelled = registry_.Create("javascript", "2", core::Scenario{});
    registry_.Cancel(cancelled.id);

    ApiResponse all = api_.ListJobs();
    ASSERT_EQ(all.status_code, 200);
    ASSERT_EQ(all.body.size(), 2u);
    EXPECT_EQ(all.body[0].at("jobId"), queued.id);
    EXPECT_EQ(all.body[1].at("jobId"), cancelled.id);

    ApiResponse only_cancelled = api_.ListJobs(std::string("CANCELLED"));
    ASSERT_EQ(only_cancelled.status_code, 200);
    ASSERT_EQ(only_cancelled.body.size(), 1u);
    EXPECT_EQ(only_cancelled.body[0].at("jobId"), cancelled.id);

    EXPECT_TRUE(api_.ListJobs(std::string("running")).body.empty());
    EXPECT_EQ(api_.ListJobs(std::string("paused")).status_code, 400);
}

TEST(ScenarioJsonTest, ParsesCamelCaseKeys) {
    core::Scenario scenario = api::ScenarioFromJson(json::parse(R"({
        "networkLatencyMs": 300,
        "bandwidthKbps": 64,
        "timeoutMs": 1000,
        "upstream": "example.com:443",
        "artificialDelayMs": 20,
        "simulateCrash": true,
        "simulateHighCpu": true,
        "simulateMemoryLeak": false,
        "somethingElse": "ignored"
    })"));

    EXPECT_EQ(scenario.network_latency_ms, std::optional<std::int64_t>(300));
    EXPECT_EQ(scenario.bandwidth_kbps, std::optional<std::int64_t>(64));
    EXPECT_EQ(scenario.timeout_ms, std::optional<std::int64_t>(1000));
    EXPECT_EQ(scenario.upstream, std::optional<std::string>("example.com:443"));
    EXPECT_EQ(scenario.artificial_delay_ms, std::optional<std::int64_t>(20));
    EXPECT_TRUE(scenario.simulate_crash);
    EXPECT_TRUE(scenario.simulate_high_cpu);
    EXPECT_FALSE(scenario.simulate_memory_leak);

    json back = api::ScenarioToJson(scenario);
    EXPECT_EQ(back.at("upstream"), "example.com:443");
    EXPECT_FALSE(back.contains("simulateMemoryLeak"));
}

TEST(ScenarioJsonTest, RejectsWrongTypes) {
    EXPECT_THROW(api::ScenarioFromJson(json::array()), core::ValidationError);
    EXPECT_THROW(api::ScenarioFromJson(json{{"upstream", 80}}), core::ValidationError);
    EXPECT_TRUE(api::ScenarioFromJson(json(nullptr)).Empty());
}

TEST(ScenarioJsonTest, IntegerFieldsRejectFloatsOverflowAndNegatives) {
    EXPECT_THROW(api::ScenarioFromJson(json::parse(R"({"artificialDelayMs": 1.5})")),
                 core::ValidationError);
    EXPECT_THROW(api::ScenarioFromJson(json::parse(R"({"artificialDelayMs": 1e300})")),
                 core::ValidationError);
    EXPECT_THROW(api::ScenarioFromJson(json::parse(R"({"bandwidthKbps": 18446744073709551615})")),
                 core::ValidationError);
    EXPECT_THROW(api::ScenarioFromJson(json::parse(R"({"networkLatencyMs": -5})")),
                 core::ValidationError);

    core::Scenario max = api::ScenarioFromJson(
        json::parse(R"({"timeoutMs": 9223372036854775807, "networkLatencyMs": 0})"));
    EXPECT_EQ(max.timeout_ms, std::optional<std::int64_t>(9223372036854775807LL));
    EXPECT_EQ(max.network_latency_ms, std::optional<std::int64_t>(0));
}

TEST_F(JobApiTest, FloatDelayIsABadRequest) {
    ApiResponse response = api_.SubmitJob(std::string(
        R"json({"language": "python", "code": "print(1)", "scenario": {"artificialDelayMs": 1e300}})json"));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_EQ(registry_.Size(), 0u);
}
