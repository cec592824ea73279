#include <gtest/gtest.h>
#include "api_router.hpp"
#include "executors/puffing_executor.hpp"

using json = nlohmann::json;

class ApiRouterTest : public ::testing::Test {
protected:
    ApiResponse post(const std::string& path, const json& body) const {
        return router_.handle("POST", path, body.dump());
    }

    PuffingExecutor executor_;
    ApiRouter router_{executor_, false};
};

TEST_F(ApiRouterTest, RootAndHealth) {
    ApiResponse root = router_.handle("GET", "/", "");
    EXPECT_EQ(root.status, 200u);
    EXPECT_EQ(root.body["message"], "Puffing Language API");
    EXPECT_EQ(root.body["version"], ApiRouter::kVersion);

    ApiResponse health = router_.handle("GET", "/health?probe=1", "");
    EXPECT_EQ(health.status, 200u);
    EXPECT_EQ(health.body["status"], "ok");
    EXPECT_EQ(health.body["language"], "Puffing");
}

TEST_F(ApiRouterTest, ExecuteHello) {
    ApiResponse r = post("/execute", {{"code", "print(\"hello\");"}});
    ASSERT_EQ(r.status, 200u);
    EXPECT_EQ(r.body["success"], true);
    EXPECT_EQ(r.body["output"], "hello\n");
    EXPECT_TRUE(r.body["error"].is_null());
    EXPECT_TRUE(r.body["error_type"].is_null());
    EXPECT_TRUE(r.body["traceback"].is_null());
    EXPECT_TRUE(r.body["execution_time"].is_number());
}

TEST_F(ApiRouterTest, ExecuteWithInputs) {
    ApiResponse r = post("/execute", {{"code", "print(input(), input());"}, {"input_values", json::array({"a", 2})}});
    ASSERT_EQ(r.status, 200u);
    EXPECT_EQ(r.body["output"], "a 2\n");
}

TEST_F(ApiRouterTest, ExecuteLanguageErrorIsStillOk) {
    ApiResponse r = post("/execute", {{"code", "print(nope);"}});
    ASSERT_EQ(r.status, 200u);
    EXPECT_EQ(r.body["success"], false);
    EXPECT_EQ(r.body["error_type"], "NameError");
    EXPECT_TRUE(r.body["output"].is_null());
}

TEST_F(ApiRouterTest, ExecuteTimeout) {
    ApiResponse r = post("/execute", {{"code", "while (true) {}"}, {"timeout", 1}});
    ASSERT_EQ(r.status, 200u);
    EXPECT_EQ(r.body["error_type"], "TimeoutError");
}

TEST_F(ApiRouterTest, BlankCodeIsBadRequest) {
    ApiResponse r = post("/execute", {{"code", "  \n\t "}});
    EXPECT_EQ(r.status, 400u);
    EXPECT_EQ(r.body["detail"], "Code cannot be empty");
}

TEST_F(ApiRouterTest, RequestShapeErrorsAre422) {
    EXPECT_EQ(router_.handle("POST", "/execute", "not json").status, 422u);
    EXPECT_EQ(router_.handle("POST", "/execute", "[1, 2]").status, 422u);
    EXPECT_EQ(post("/execute", json::object()).status, 422u);
    EXPECT_EQ(post("/execute", {{"code", 5}}).status, 422u);
    EXPECT_EQ(post("/execute", {{"code", "print(1);"}, {"timeout", "fast"}}).status, 422u);
    EXPECT_EQ(post("/execute", {{"code", "print(1);"}, {"timeout", 1.5}}).status, 422u);
    EXPECT_EQ(post("/execute", {{"code", "print(1);"}, {"input_values", "x"}}).status, 422u);
}

TEST_F(ApiRouterTest, TimeoutBounds) {
    ApiResponse low = post("/execute", {{"code", "print(1);"}, {"timeout", 0}});
    EXPECT_EQ(low.status, 422u);
    EXPECT_EQ(low.body["detail"], "Field 'timeout' must be between 1 and 30");
    EXPECT_EQ(post("/execute", {{"code", "print(1);"}, {"timeout", 31}}).status, 422u);
    EXPECT_EQ(post("/execute", {{"code", "print(1);"}, {"timeout", 30}}).status, 200u);
    EXPECT_EQ(post("/execute", {{"code", "print(1);"}, {"timeout", 2.0}}).status, 200u);
}

TEST_F(ApiRouterTest, ValidateValidAndInvalid) {
    ApiResponse ok = post("/validate", {{"code", "let x = 1;"}});
    ASSERT_EQ(ok.status, 200u);
    EXPECT_EQ(ok.body["valid"], true);
    EXPECT_TRUE(ok.body["error"].is_null());
    EXPECT_TRUE(ok.body["tokens"].is_array());

    ApiResponse bad = post("/validate", {{"code", "let x = ;"}});
    ASSERT_EQ(bad.status, 200u);
    EXPECT_EQ(bad.body["valid"], false);
    EXPECT_TRUE(bad.body["error"].is_string());
    EXPECT_TRUE(bad.body["tokens"].is_null());
}

TEST_F(ApiRouterTest, ValidateBlankCode) {
    ApiResponse r = post("/validate", {{"code", ""}});
    ASSERT_EQ(r.status, 200u);
    EXPECT_EQ(r.body["valid"], false);
    EXPECT_EQ(r.body["error"], "Code cannot be empty");
    EXPECT_TRUE(r.body["tokens"].is_null());
}

TEST_F(ApiRouterTest, RoutingErrors) {
    EXPECT_EQ(router_.handle("GET", "/missing", "").status, 404u);
    EXPECT_EQ(router_.handle("GET", "/execute", "").status, 405u);
    EXPECT_EQ(router_.handle("DELETE", "/health", "").status, 405u);

    ApiResponse preflight = router_.handle("OPTIONS", "/execute", "");
    EXPECT_EQ(preflight.status, 204u);
    EXPECT_TRUE(preflight.body.is_null());
}

TEST(CorsTest, OriginsDependOnEnvironment) {
    auto prod = allowed_origins("production");
    auto dev = allowed_origins("development");
    EXPECT_TRUE(origin_allowed(prod, "https://puffingmanual.web.app"));
    EXPECT_FALSE(origin_allowed(prod, "http://localhost:5173"));
    EXPECT_TRUE(origin_allowed(dev, "http://localhost:5173"));
    EXPECT_FALSE(origin_allowed(dev, "https://evil.example"));
    EXPECT_FALSE(origin_allowed(dev, ""));
}
