#include <gtest/gtest.h>
#include <future>
#include "core/action_dispatcher.hpp"
#include "core/trigger_registry.hpp"
#include "core/exceptions.hpp"
#include "mocks/mock_function_executor.hpp"

using ::testing::_;
using ::testing::Eq;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

neo::Trigger make_alert(const nlohmann::json& parameters = nlohmann::json::object()) {
    neo::TriggerRegistry registry;
    neo::TriggerDefinition definition;
    definition.id = "gas-low";
    definition.owner_id = "owner";
    definition.type = "price_alert";
    definition.condition = "GAS below 5";
    definition.function_id = "notify";
    definition.parameters = parameters;
    return registry.create(definition);
}

class ActionDispatcherTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<neo::testing::MockFunctionExecutor>> executor =
        std::make_shared<NiceMock<neo::testing::MockFunctionExecutor>>();
    std::shared_ptr<neo::MetricsRegistry> metrics = std::make_shared<neo::MetricsRegistry>();
};

} // namespace

TEST_F(ActionDispatcherTest, SuccessfulExecutionIsCounted) {
    EXPECT_CALL(*executor, execute(Eq("notify"), _))
        .WillOnce(Return(neo::ExecutionResult{"exec-1", "completed", nlohmann::json::object()}));

    neo::ActionDispatcher dispatcher(executor, 2, 16, metrics);
    EXPECT_TRUE(dispatcher.dispatch(make_alert(), {{"price", 4.2}}));
    dispatcher.wait_for_idle();

    EXPECT_DOUBLE_EQ(metrics->counter("dispatch_total", {{"status", "queued"}}), 1.0);
    EXPECT_DOUBLE_EQ(metrics->counter("dispatch_total", {{"status", "succeeded"}}), 1.0);
    EXPECT_DOUBLE_EQ(metrics->counter("dispatch_total", {{"status", "failed"}}), 0.0);
}

TEST_F(ActionDispatcherTest, ExecutorFailureIsRecordedNotRethrown) {
    EXPECT_CALL(*executor, execute(_, _))
        .WillOnce(Throw(neo::ExecutionError("function crashed")));

    neo::ActionDispatcher dispatcher(executor, 1, 16, metrics);
    EXPECT_TRUE(dispatcher.dispatch(make_alert(), nlohmann::json::object()));
    dispatcher.wait_for_idle();

    EXPECT_DOUBLE_EQ(metrics->counter("dispatch_total", {{"status", "failed"}}), 1.0);
    EXPECT_DOUBLE_EQ(metrics->counter("dispatch_total", {{"status", "succeeded"}}), 0.0);
}

TEST_F(ActionDispatcherTest, DispatchDoesNotWaitForExecution) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    EXPECT_CALL(*executor, execute(_, _)).WillOnce(Invoke([gate](const std::string&, const nlohmann::json&) {
        gate.wait();
        return neo::ExecutionResult{"exec-1", "completed", nlohmann::json::object()};
    }));

    neo::ActionDispatcher dispatcher(executor, 1, 16, metrics);
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(dispatcher.dispatch(make_alert(), nlohmann::json::object()));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));

    release.set_value();
    dispatcher.wait_for_idle();
    EXPECT_DOUBLE_EQ(metrics->counter("dispatch_total", {{"status", "succeeded"}}), 1.0);
}

TEST_F(ActionDispatcherTest, FullQueueRejectsDispatch) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;
    ON_CALL(*executor, execute(_, _)).WillByDefault(Invoke([&started, gate](const std::string&, const nlohmann::json&) {
        try {
            started.set_value();
        } catch (const std::future_error&) {
            // only the first call signals
        }
        gate.wait();
        return neo::ExecutionResult{"exec", "completed", nlohmann::json::object()};
    }));

    neo::ActionDispatcher dispatcher(executor, 1, 1, metrics);
    auto trigger = make_alert();

    EXPECT_TRUE(dispatcher.dispatch(trigger, nlohmann::json::object()));
    started.get_future().wait();
    EXPECT_TRUE(dispatcher.dispatch(trigger, nlohmann::json::object()));
    EXPECT_FALSE(dispatcher.dispatch(trigger, nlohmann::json::object()));

    release.set_value();
    dispatcher.wait_for_idle();
    EXPECT_DOUBLE_EQ(metrics->counter("dispatch_total", {{"status", "rejected"}}), 1.0);
    EXPECT_DOUBLE_EQ(metrics->counter("dispatch_total", {{"status", "succeeded"}}), 2.0);
}

TEST_F(ActionDispatcherTest, DispatchAfterShutdownIsRejected) {
    neo::ActionDispatcher dispatcher(executor, 1, 4, metrics);
    dispatcher.shutdown();

    EXPECT_CALL(*executor, execute(_, _)).Times(0);
    EXPECT_FALSE(dispatcher.dispatch(make_alert(), nlohmann::json::object()));
}

TEST(ActionDispatcherParametersTest, AddsTriggerMetadataToObjectParameters) {
    auto trigger = make_alert({{"channel", "ops"}});
    auto parameters = neo::ActionDispatcher::build_parameters(trigger, {{"price", 4.2}});

    EXPECT_EQ(parameters.at("channel"), "ops");
    const auto& metadata = parameters.at("trigger");
    EXPECT_EQ(metadata.at("id"), "gas-low");
    EXPECT_EQ(metadata.at("type"), "price_alert");
    EXPECT_EQ(metadata.at("symbol"), "GAS");
    EXPECT_EQ(metadata.at("comparison"), "below");
    EXPECT_DOUBLE_EQ(metadata.at("threshold").get<double>(), 5.0);
    EXPECT_DOUBLE_EQ(metadata.at("price").get<double>(), 4.2);
    EXPECT_TRUE(metadata.at("fired_at").is_number_integer());
}

TEST(ActionDispatcherParametersTest, OwnerSuppliedTriggerKeyIsPreserved) {
    auto trigger = make_alert({{"trigger", "custom"}});
    auto parameters = neo::ActionDispatcher::build_parameters(trigger, {{"price", 4.2}});
    EXPECT_EQ(parameters.at("trigger"), "custom");
}

TEST(ActionDispatcherParametersTest, NonObjectParametersPassThrough) {
    auto trigger = make_alert(nlohmann::json::array({1, 2, 3}));
    auto parameters = neo::ActionDispatcher::build_parameters(trigger, nlohmann::json::object());
    EXPECT_EQ(parameters, nlohmann::json::array({1, 2, 3}));
}
