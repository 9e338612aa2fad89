#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>

#ifndef MCPGEN_BINARY
#error "MCPGEN_BINARY must point at the mcpgen executable"
#endif

namespace fs = std::filesystem;

namespace {

constexpr const char* kPetsYaml = R"(openapi: 3.0.3
info:
  title: Pets
  version: 1.0.0
servers:
  - url: https://pets.example/v1
paths:
  /pets:
    get:
      tags: [pets]
      parameters:
        - name: limit
          in: query
          schema:
            type: integer
    post:
      tags: [admin]
      requestBody:
        content:
          application/json:
            schema:
              $ref: '#/components/schemas/Pet'
components:
  schemas:
    Pet:
      type: object
      properties:
        name:
          type: string
)";

struct run_result {
    int exit_code;
    std::string output;
};

std::string slurp(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("mcpgen_cli_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        spec_ = dir_ / "pets.yaml";
        std::ofstream(spec_) << kPetsYaml;
    }

    void TearDown() override { fs::remove_all(dir_); }

    // Runs the binary with stdout and stderr captured together.
    run_result run(const std::string& args) const {
        auto log = dir_ / "out.log";
        std::string cmd = std::string(MCPGEN_BINARY) + " " + args + " > " + log.string() + " 2>&1";
        int status = std::system(cmd.c_str());
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return {code, slurp(log)};
    }

    fs::path dir_;
    fs::path spec_;
};

} // namespace

TEST_F(CliTest, CreateWritesBundle) {
    auto out = dir_ / "server";
    auto r = run("create " + spec_.string() + " -o " + out.string() + " -n 'Pet Store'");
    ASSERT_EQ(r.exit_code, 0) << r.output;
    EXPECT_NE(r.output.find("[create] OK: server=Pet_Store operations=2 schemas=1"),
              std::string::npos);
    EXPECT_TRUE(fs::exists(out / "mcp_ir.json"));
    EXPECT_TRUE(fs::exists(out / "server_config.json"));
    EXPECT_NE(slurp(out / "server_config.json").find("\"base_url\": \"https://pets.example/v1\""),
              std::string::npos);
}

TEST_F(CliTest, CreateRefusesNonEmptyDirectoryWithoutForce) {
    auto out = dir_ / "server";
    fs::create_directories(out);
    std::ofstream(out / "keep.txt") << "x";

    auto refused = run("create " + spec_.string() + " -o " + out.string());
    EXPECT_EQ(refused.exit_code, 1);
    EXPECT_NE(refused.output.find("not empty"), std::string::npos);
    EXPECT_FALSE(fs::exists(out / "mcp_ir.json"));

    auto forced = run("create " + spec_.string() + " -o " + out.string() + " --force");
    ASSERT_EQ(forced.exit_code, 0) << forced.output;
    EXPECT_TRUE(fs::exists(out / "mcp_ir.json"));
    EXPECT_TRUE(fs::exists(out / "keep.txt"));
}

TEST_F(CliTest, CreateAppliesFilters) {
    auto out = dir_ / "server";
    auto r = run("create " + spec_.string() + " -o " + out.string() + " -T pets --prune-schemas");
    ASSERT_EQ(r.exit_code, 0) << r.output;
    EXPECT_NE(r.output.find("operations=1 schemas=0"), std::string::npos);

    auto over = run("create " + spec_.string() + " -o " + (dir_ / "other").string() +
                    " --max-operations 1");
    EXPECT_EQ(over.exit_code, 1);
    EXPECT_NE(over.output.find("[spec] operation count exceeds"), std::string::npos);
}

TEST_F(CliTest, CreateRejectsBadTransport) {
    auto r = run("create " + spec_.string() + " -o " + (dir_ / "server").string() + " -t http");
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_NE(r.output.find("unknown transport"), std::string::npos);
}

TEST_F(CliTest, ValidateAndInfo) {
    auto v = run("validate-spec " + spec_.string());
    ASSERT_EQ(v.exit_code, 0) << v.output;
    EXPECT_NE(v.output.find("[spec] OK: dialect=openapi_3_0 version=3.0.3"), std::string::npos);

    auto i = run("info " + spec_.string());
    ASSERT_EQ(i.exit_code, 0) << i.output;
    EXPECT_NE(i.output.find("  [pets]\n    GET /pets  get_pets"), std::string::npos);
}

TEST_F(CliTest, ErrorsExitWithOne) {
    auto missing = run("validate-spec " + (dir_ / "absent.json").string());
    EXPECT_EQ(missing.exit_code, 1);
    EXPECT_NE(missing.output.find("[spec] failed to read document"), std::string::npos);

    std::ofstream(dir_ / "old.json") << R"({"swagger": "1.2", "paths": {}})";
    auto old = run("info " + (dir_ / "old.json").string());
    EXPECT_EQ(old.exit_code, 1);
    EXPECT_NE(old.output.find("unsupported"), std::string::npos);

    auto remote = run("info https://example.com/openapi.json");
    EXPECT_EQ(remote.exit_code, 1);

    auto unknown = run("frobnicate");
    EXPECT_EQ(unknown.exit_code, 1);
    EXPECT_NE(unknown.output.find("Unknown subcommand"), std::string::npos);
}
