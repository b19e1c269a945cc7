#include "exec/sandbox.hpp"
#include <algorithm>
#include <fstream>
#include "gtest/gtest.h"
#include "test/environment.hpp"

using namespace std;
using namespace pyexec;
namespace fs = std::filesystem;

/**
 * @brief 命令行中 flag 之后紧跟的参数
 */
static string argument_of(const vector<string> &command, const string &flag) {
    auto it = find(command.begin(), command.end(), flag);
    if (it == command.end() || next(it) == command.end()) return "";
    return *next(it);
}

class SandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = make_test_configuration();
        config.sandbox_config_dir = test_root() / "sandbox-configs";
        fs::remove_all(config.sandbox_config_dir);
        fs::create_directories(config.sandbox_config_dir);
    }

    void TearDown() override {
        fs::remove_all(config.sandbox_config_dir);
    }

    void create_profile(const string &name) {
        ofstream(config.sandbox_config_dir / name) << "mode: ONCE\n";
    }

    configuration config;
};

TEST_F(SandboxTest, CommandLineCarriesRequestLimits) {
    nsjail_sandbox box(config);
    fs::path artifact = config.script_dir / "script_20240501_123045_123456_0.py";
    auto command = box.sandboxed_command("/etc/pyexec/python_secure.cfg", artifact, 120, 256);

    ASSERT_FALSE(command.empty());
    EXPECT_EQ(command.front(), config.nsjail.string());
    EXPECT_EQ(argument_of(command, "--config"), "/etc/pyexec/python_secure.cfg");
    EXPECT_EQ(argument_of(command, "--time_limit"), "120");
    // 配置文件中的 CPU 时间限制不能短于请求的 timeout
    EXPECT_EQ(argument_of(command, "--rlimit_cpu"), "120");
    EXPECT_EQ(argument_of(command, "--rlimit_as"), "256");
    EXPECT_EQ(argument_of(command, "--bindmount_ro"), fs::absolute(artifact).parent_path().string());

    auto separator = find(command.begin(), command.end(), "--");
    ASSERT_NE(separator, command.end());
    vector<string> inner(next(separator), command.end());
    EXPECT_EQ(inner, (vector<string>{config.python.string(), fs::absolute(artifact).string()}));
}

TEST_F(SandboxTest, PrefersRestrictedHostProfile) {
    nsjail_sandbox box(config);
    EXPECT_FALSE(box.select_profile());
    EXPECT_FALSE(box.config_present());

    create_profile(config.fallback_profile);
    ASSERT_TRUE(box.select_profile());
    EXPECT_EQ(*box.select_profile(), config.sandbox_config_dir / config.fallback_profile);

    create_profile(config.preferred_profile);
    ASSERT_TRUE(box.select_profile());
    EXPECT_EQ(*box.select_profile(), config.sandbox_config_dir / config.preferred_profile);
    EXPECT_TRUE(box.config_present());
}

TEST_F(SandboxTest, MissingProfileIsExecutionError) {
    nsjail_sandbox box(config);
    auto result = box.run_sandboxed(config.script_dir / "missing.py", 1, 16);
    auto *error = get_if<failure>(&result);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->type, error_type::EXECUTION_ERROR);
    EXPECT_EQ(error->message, "NSJail configuration file not found");
}
