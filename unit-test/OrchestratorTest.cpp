#include "exec/orchestrator.hpp"
#include "exec/wrapper.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/assertions.hpp"
#include "test/environment.hpp"
#include "test/mock_sandbox.hpp"

using namespace std;
using namespace pyexec;
using namespace nlohmann;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::StrictMock;
namespace fs = std::filesystem;

static const char *VALID_SCRIPT = "def main():\n    return {'x': 1}\n";
static const char *SECUREBITS_FAILURE = "[E][2024-05-01T12:00:00+0000] prctl(PR_SET_SECUREBITS, SECBIT_KEEP_CAPS): Operation not permitted\n";

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = make_test_configuration();
        config.script_dir = test_root() / "orchestrator";
        fs::remove_all(config.script_dir);
        fs::create_directories(config.script_dir);
    }

    void TearDown() override {
        fs::remove_all(config.script_dir);
    }

    /**
     * @brief 记录 sandbox 收到的 artifact，并检查调用时文件确实存在
     */
    auto record_artifact(outcome<execution_outcome> result) {
        return Invoke([this, result](const fs::path &artifact, int, int) -> outcome<execution_outcome> {
            seen_artifact = artifact;
            EXPECT_TRUE(fs::is_regular_file(artifact));
            EXPECT_NE(read_file_content(artifact).find(VALID_SCRIPT), string::npos);
            return result;
        });
    }

    configuration config;
    fs::path seen_artifact;
};

TEST_F(OrchestratorTest, SandboxedSuccess) {
    StrictMock<mock::mock_sandbox> box;
    orchestrator executor(config, box);

    EXPECT_CALL(box, run_sandboxed(_, 10, 256))
        .WillOnce(record_artifact(make_outcome(0, "{\"result\": {\"x\": 1}, \"stdout\": \"hi\\n\"}\n")));

    auto report = executor.execute({VALID_SCRIPT, 10, 256});
    ASSERT_TRUE(succeeded(report));
    auto &success = get<execution_report>(report);
    EXPECT_JSON_EQ(success.result, json({{"x", 1}}));
    EXPECT_EQ(success.stdout_text, "hi\n");
    EXPECT_EQ(success.method, execution_method::SANDBOXED);
    EXPECT_FALSE(success.timestamp.empty());

    EXPECT_EQ(seen_artifact.parent_path(), config.script_dir);
    EXPECT_FALSE(fs::exists(seen_artifact));
    EXPECT_EQ(count_artifacts(config.script_dir), 0u);
}

TEST_F(OrchestratorTest, ValidationFailureSpawnsNothing) {
    StrictMock<mock::mock_sandbox> box;
    orchestrator executor(config, box);

    auto report = executor.execute({"def main():\n    print('no return')\n"});
    ASSERT_FAILURE(report, error_type::VALIDATION_ERROR);
    EXPECT_EQ(get<failure>(report).message, "main() function must contain a return statement");
    EXPECT_EQ(count_artifacts(config.script_dir), 0u);
}

TEST_F(OrchestratorTest, HarnessErrorIsNotRetried) {
    StrictMock<mock::mock_sandbox> box;
    orchestrator executor(config, box);

    EXPECT_CALL(box, run_sandboxed(_, _, _))
        .WillOnce(record_artifact(make_outcome(1, "{\"error\": \"division by zero\", \"type\": \"ZeroDivisionError\", \"trace\": \"\"}\n")));

    auto report = executor.execute({VALID_SCRIPT});
    ASSERT_FAILURE(report, error_type::EXECUTION_ERROR);
    EXPECT_EQ(get<failure>(report).message, "Script execution failed: division by zero");
    EXPECT_FALSE(fs::exists(seen_artifact));
}

TEST_F(OrchestratorTest, FailureWithoutSignatureIsNotRetried) {
    StrictMock<mock::mock_sandbox> box;
    orchestrator executor(config, box);

    EXPECT_CALL(box, run_sandboxed(_, _, _))
        .WillOnce(record_artifact(make_outcome(137, "Killed\n")));

    auto report = executor.execute({VALID_SCRIPT});
    ASSERT_FAILURE(report, error_type::EXECUTION_ERROR);
    EXPECT_EQ(get<failure>(report).message, "Script execution failed: Killed\n");
    EXPECT_FALSE(fs::exists(seen_artifact));
}

TEST_F(OrchestratorTest, TimeoutIsReported) {
    StrictMock<mock::mock_sandbox> box;
    orchestrator executor(config, box);

    auto timed_out = make_outcome(143, "");
    timed_out.timed_out = true;
    EXPECT_CALL(box, run_sandboxed(_, 2, _))
        .WillOnce(record_artifact(timed_out));

    auto report = executor.execute({VALID_SCRIPT, 2});
    ASSERT_FAILURE(report, error_type::EXECUTION_ERROR);
    EXPECT_EQ(get<failure>(report).message, "Script execution timed out after 2 seconds");
}

TEST_F(OrchestratorTest, FallsBackOnceWhenIsolationUnavailable) {
    StrictMock<mock::mock_sandbox> box;
    orchestrator executor(config, box);

    EXPECT_CALL(box, run_sandboxed(_, 5, 64))
        .WillOnce(record_artifact(make_outcome(255, SECUREBITS_FAILURE)));
    EXPECT_CALL(box, run_direct(_, 5, 64))
        .WillOnce(Invoke([this](const fs::path &artifact, int, int) {
            // 直接执行使用同一个 artifact
            EXPECT_EQ(artifact, seen_artifact);
            EXPECT_TRUE(fs::is_regular_file(artifact));
            return make_outcome(0, "{\"result\": 42, \"stdout\": \"\"}\n");
        }));

    auto report = executor.execute({VALID_SCRIPT, 5, 64});
    ASSERT_TRUE(succeeded(report));
    auto &success = get<execution_report>(report);
    EXPECT_JSON_EQ(success.result, json(42));
    EXPECT_EQ(success.method, execution_method::DIRECT);
    EXPECT_FALSE(fs::exists(seen_artifact));
}

TEST_F(OrchestratorTest, FallbackFailureIsNotRetriedAgain) {
    StrictMock<mock::mock_sandbox> box;
    orchestrator executor(config, box);

    EXPECT_CALL(box, run_sandboxed(_, _, _))
        .WillOnce(record_artifact(make_outcome(255, SECUREBITS_FAILURE)));
    EXPECT_CALL(box, run_direct(_, _, _))
        .WillOnce(Return(make_outcome(1, "{\"error\": \"name 'x' is not defined\", \"type\": \"NameError\", \"trace\": \"\"}\n")));

    auto report = executor.execute({VALID_SCRIPT});
    ASSERT_FAILURE(report, error_type::EXECUTION_ERROR);
    EXPECT_EQ(get<failure>(report).message, "Script execution failed: name 'x' is not defined");
    EXPECT_FALSE(fs::exists(seen_artifact));
}

TEST_F(OrchestratorTest, MissingProfileIsExecutionError) {
    StrictMock<mock::mock_sandbox> box;
    orchestrator executor(config, box);

    EXPECT_CALL(box, run_sandboxed(_, _, _))
        .WillOnce(record_artifact(failure{error_type::EXECUTION_ERROR, "NSJail configuration file not found"}));

    auto report = executor.execute({VALID_SCRIPT});
    ASSERT_FAILURE(report, error_type::EXECUTION_ERROR);
    EXPECT_EQ(get<failure>(report).message, "NSJail configuration file not found");
    EXPECT_FALSE(fs::exists(seen_artifact));
}

TEST_F(OrchestratorTest, SilentSuccessIsInternalError) {
    StrictMock<mock::mock_sandbox> box;
    orchestrator executor(config, box);

    EXPECT_CALL(box, run_sandboxed(_, _, _))
        .WillOnce(record_artifact(make_outcome(0, "")));

    auto report = executor.execute({VALID_SCRIPT});
    ASSERT_FAILURE(report, error_type::INTERNAL_ERROR);
    EXPECT_EQ(get<failure>(report).message, "No JSON output found in script execution");
}

TEST_F(OrchestratorTest, ExceptionBecomesInternalError) {
    StrictMock<mock::mock_sandbox> box;
    orchestrator executor(config, box);

    EXPECT_CALL(box, run_sandboxed(_, _, _))
        .WillOnce(Invoke([this](const fs::path &artifact, int, int) -> outcome<execution_outcome> {
            seen_artifact = artifact;
            throw system_error(EAGAIN, system_category(), "unable to fork");
        }));

    auto report = executor.execute({VALID_SCRIPT});
    ASSERT_FAILURE(report, error_type::INTERNAL_ERROR);
    EXPECT_EQ(get<failure>(report).message, "Internal server error");
    EXPECT_FALSE(seen_artifact.empty());
    EXPECT_FALSE(fs::exists(seen_artifact));
}

TEST_F(OrchestratorTest, PyexecExceptionBecomesInternalError) {
    StrictMock<mock::mock_sandbox> box;
    orchestrator executor(config, box);

    EXPECT_CALL(box, run_sandboxed(_, _, _))
        .WillOnce(Invoke([](const fs::path &, int, int) -> outcome<execution_outcome> {
            throw internal_error("sandbox exploded");
        }));

    auto report = executor.execute({VALID_SCRIPT});
    ASSERT_FAILURE(report, error_type::INTERNAL_ERROR);
    EXPECT_EQ(count_artifacts(config.script_dir), 0u);
}

TEST_F(OrchestratorTest, UnwritableScriptDirIsInternalError) {
    StrictMock<mock::mock_sandbox> box;
    config.script_dir = test_root() / "orchestrator" / "missing";
    orchestrator executor(config, box);

    // 创建 artifact 失败时抛出 internal_error
    EXPECT_THROW(wrapper_artifact(config.script_dir, "x"), internal_error);

    auto report = executor.execute({VALID_SCRIPT});
    ASSERT_FAILURE(report, error_type::INTERNAL_ERROR);
    EXPECT_EQ(get<failure>(report).message, "Internal server error");
}
