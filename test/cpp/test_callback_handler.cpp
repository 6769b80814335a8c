#include <catch2/catch.hpp>
#include "oauth2_callback_handler.hpp"
#include "result_coordinator.hpp"

#include <httplib.h>

using namespace oauth2_loopback;

namespace {

httplib::Request MakeRequest(const OAuth2CallbackHandler::QueryParams& params) {
    httplib::Request req;
    req.method = "GET";
    req.path = "/callback";
    req.params = params;
    return req;
}

} // namespace

TEST_CASE("Callback parameter parsing", "[callback_handler]") {
    SECTION("Code yields an authorized result") {
        auto result = OAuth2CallbackHandler::ParseCallback({{"code", "abc123"}, {"state", "xyz"}});
        REQUIRE(result.has_value());
        REQUIRE(result->IsAuthorized());
        REQUIRE(result->code == "abc123");
        REQUIRE(result->state == "xyz");
    }

    SECTION("Error yields a denied result") {
        auto result = OAuth2CallbackHandler::ParseCallback(
            {{"error", "access_denied"}, {"error_description", "user cancelled"}});
        REQUIRE(result.has_value());
        REQUIRE_FALSE(result->IsAuthorized());
        REQUIRE(result->error_code == "access_denied");
        REQUIRE(result->error_description == "user cancelled");
    }

    SECTION("Error takes precedence over code") {
        auto result = OAuth2CallbackHandler::ParseCallback({{"code", "abc"}, {"error", "server_error"}});
        REQUIRE(result.has_value());
        REQUIRE_FALSE(result->IsAuthorized());
        REQUIRE(result->error_code == "server_error");
    }

    SECTION("Neither code nor error") {
        REQUIRE_FALSE(OAuth2CallbackHandler::ParseCallback({}).has_value());
        REQUIRE_FALSE(OAuth2CallbackHandler::ParseCallback({{"state", "xyz"}}).has_value());
    }

    SECTION("Empty values count as absent") {
        REQUIRE_FALSE(OAuth2CallbackHandler::ParseCallback({{"code", ""}}).has_value());
        auto result = OAuth2CallbackHandler::ParseCallback({{"error", ""}, {"code", "abc"}});
        REQUIRE(result.has_value());
        REQUIRE(result->IsAuthorized());
    }
}

TEST_CASE("Callback request handling", "[callback_handler]") {
    auto coordinator = std::make_shared<ResultCoordinator>();
    OAuth2CallbackHandler handler(coordinator, "<html>done</html>");

    SECTION("Well-formed callback is published and answered with the body") {
        httplib::Response res;
        handler.HandleRequest(MakeRequest({{"code", "abc123"}}), res);

        REQUIRE(res.status == 200);
        REQUIRE(res.body == "<html>done</html>");
        REQUIRE(res.get_header_value("Content-Type") == "text/html");
        REQUIRE(handler.CallbackCount() == 1);
        REQUIRE(coordinator->PeekResult()->code == "abc123");
    }

    SECTION("Denied callback gets the same body") {
        httplib::Response res;
        handler.HandleRequest(MakeRequest({{"error", "access_denied"}}), res);

        REQUIRE(res.status == 200);
        REQUIRE(res.body == "<html>done</html>");
        REQUIRE(coordinator->PeekResult()->error_code == "access_denied");
    }

    SECTION("Malformed callback is rejected without publishing") {
        httplib::Response res;
        handler.HandleRequest(MakeRequest({{"foo", "bar"}}), res);

        REQUIRE(res.status == 400);
        REQUIRE(res.get_header_value("Content-Type") == "text/plain");
        REQUIRE(handler.CallbackCount() == 0);
        REQUIRE_FALSE(coordinator->IsDecided());
    }

    SECTION("Later callbacks are answered but do not change the outcome") {
        httplib::Response first;
        httplib::Response second;
        handler.HandleRequest(MakeRequest({{"code", "X"}}), first);
        handler.HandleRequest(MakeRequest({{"code", "Y"}}), second);

        REQUIRE(first.status == 200);
        REQUIRE(second.status == 200);
        REQUIRE(second.body == "<html>done</html>");
        REQUIRE(handler.CallbackCount() == 2);
        REQUIRE(coordinator->PeekResult()->code == "X");
    }
}
