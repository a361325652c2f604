#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "api/router.h"

namespace {

HttpRequest make_request(const std::string& method, const std::string& path) {
    HttpRequest req;
    req.method = method;
    req.target = path;
    req.path = path;
    return req;
}

} // namespace

class RouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        router_.get("/items", [](const HttpRequest&) {
            return HttpResponse::html(200, "list");
        });
        router_.get("/items/:id", [](const HttpRequest& req) {
            return HttpResponse::html(200, "item " + req.params.at("id"));
        });
        router_.post("/items", [](const HttpRequest&) {
            return HttpResponse::html(201, "created");
        });
        router_.get("/boom", [](const HttpRequest&) -> HttpResponse {
            throw std::runtime_error("secret internal detail");
        });
    }

    Router router_;
};

TEST_F(RouterTest, MatchesLiteralRoutes) {
    auto resp = router_.dispatch(make_request("GET", "/items"));
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "list");
}

TEST_F(RouterTest, CapturesPathParameters) {
    auto resp = router_.dispatch(make_request("GET", "/items/42"));
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "item 42");
}

TEST_F(RouterTest, DecodesPathParameters) {
    EXPECT_EQ(router_.dispatch(make_request("GET", "/items/%34%32")).body, "item 42");
    EXPECT_EQ(router_.dispatch(make_request("GET", "/items/a%20b")).body, "item a b");
}

TEST_F(RouterTest, BadEscapeInParameterMatchesNothing) {
    EXPECT_EQ(router_.dispatch(make_request("GET", "/items/%zz")).status, 404);
}

TEST_F(RouterTest, SelectsByMethod) {
    auto resp = router_.dispatch(make_request("POST", "/items"));
    EXPECT_EQ(resp.status, 201);
}

TEST_F(RouterTest, IgnoresTrailingSlashAndCase) {
    EXPECT_EQ(router_.dispatch(make_request("GET", "/items/")).body, "list");
    EXPECT_EQ(router_.dispatch(make_request("GET", "/ITEMS")).body, "list");
}

TEST_F(RouterTest, UnmatchedRequestsGetPlain404) {
    auto resp = router_.dispatch(make_request("GET", "/nothing"));
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(resp.body, "Cannot GET /nothing");

    resp = router_.dispatch(make_request("DELETE", "/items/1"));
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(resp.body, "Cannot DELETE /items/1");

    resp = router_.dispatch(make_request("GET", "/items/1/extra"));
    EXPECT_EQ(resp.status, 404);
}

TEST_F(RouterTest, HandlerExceptionsBecomeGeneric500) {
    auto resp = router_.dispatch(make_request("GET", "/boom"));
    EXPECT_EQ(resp.status, 500);
    auto body = nlohmann::json::parse(resp.body);
    EXPECT_EQ(body["error"], "An unexpected error occurred on the server.");
    EXPECT_EQ(resp.body.find("secret"), std::string::npos);
}

TEST_F(RouterTest, RouterKeepsServingAfterAFault) {
    EXPECT_EQ(router_.dispatch(make_request("GET", "/boom")).status, 500);
    EXPECT_EQ(router_.dispatch(make_request("GET", "/items")).status, 200);
}

TEST_F(RouterTest, OptionsIsAPreflight) {
    auto req = make_request("OPTIONS", "/items");
    req.headers["access-control-request-headers"] = "content-type";
    auto resp = router_.dispatch(req);
    EXPECT_EQ(resp.status, 204);
    EXPECT_TRUE(resp.body.empty());
    EXPECT_EQ(resp.headers["Access-Control-Allow-Methods"], "GET,HEAD,PUT,PATCH,POST,DELETE");
    EXPECT_EQ(resp.headers["Access-Control-Allow-Headers"], "content-type");
}

TEST_F(RouterTest, HeadRunsGetWithoutBody) {
    auto resp = router_.dispatch(make_request("HEAD", "/items/7"));
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "item 7");
    EXPECT_TRUE(resp.omit_body);
}

TEST_F(RouterTest, MiddlewareRunsFirstAndCanFallThrough) {
    router_.use([](const HttpRequest& req) -> std::optional<HttpResponse> {
        if (req.path == "/items/1") {
            return HttpResponse::html(200, "from middleware");
        }
        return std::nullopt;
    });
    EXPECT_EQ(router_.dispatch(make_request("GET", "/items/1")).body, "from middleware");
    EXPECT_EQ(router_.dispatch(make_request("GET", "/items/2")).body, "item 2");
}

TEST_F(RouterTest, MiddlewareExceptionsAreContained) {
    router_.use([](const HttpRequest&) -> std::optional<HttpResponse> {
        throw std::runtime_error("disk on fire");
    });
    EXPECT_EQ(router_.dispatch(make_request("GET", "/items")).status, 500);
}
