#include "segmux/core/route_node.h"
#include "segmux/core/http_request.h"
#include "segmux/core/http_response.h"
#include "segmux/core/request_context.h"

#include <gtest/gtest.h>

#include <string>

namespace segmux::core {

namespace {

Handler body_handler(std::string body) {
    return [body = std::move(body)](HttpRequest&, HttpResponse& response, RequestContext&) {
        response.set_body(body);
    };
}

std::string run(const Handler& handler) {
    HttpRequest request;
    HttpResponse response;
    RequestContext context;
    handler(request, response, context);
    return response.body();
}

} // namespace

TEST(RouteNodeTest, AddChildIsIdempotent) {
    RouteNode node;
    auto& first = node.add_child("posts");
    auto& second = node.add_child("posts");

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(node.child("posts"), &first);
    EXPECT_EQ(node.child("comments"), nullptr);
}

TEST(RouteNodeTest, WildcardSegmentUsesWildcardSlot) {
    RouteNode node;
    EXPECT_EQ(node.wildcard_child(), nullptr);

    auto& wildcard = node.add_child("*");

    EXPECT_EQ(node.wildcard_child(), &wildcard);
    EXPECT_EQ(&node.add_child("*"), &wildcard);
    EXPECT_EQ(node.child("*"), nullptr);
}

TEST(RouteNodeTest, NotTerminalUntilAHandlerIsSet) {
    RouteNode node;
    EXPECT_FALSE(node.is_terminal());
    EXPECT_EQ(node.find_handler("GET"), nullptr);

    node.set_handler("GET", body_handler("get"));

    EXPECT_TRUE(node.is_terminal());
    EXPECT_TRUE(node.has_handler("GET"));
    EXPECT_FALSE(node.has_handler("POST"));
    EXPECT_FALSE(node.has_handler("*"));
    ASSERT_NE(node.find_handler("GET"), nullptr);
    EXPECT_EQ(run(*node.find_handler("GET")), "get");
    EXPECT_EQ(node.find_handler("POST"), nullptr);
}

TEST(RouteNodeTest, WildcardMethodWinsOverLiteral) {
    RouteNode node;
    node.set_handler("GET", body_handler("get"));
    node.set_handler("*", body_handler("any"));

    EXPECT_TRUE(node.has_handler("*"));
    ASSERT_NE(node.find_handler("GET"), nullptr);
    EXPECT_EQ(run(*node.find_handler("GET")), "any");
    ASSERT_NE(node.find_handler("BREW"), nullptr);
    EXPECT_EQ(run(*node.find_handler("BREW")), "any");
}

TEST(RouteNodeTest, MethodKeysAreCaseSensitive) {
    RouteNode node;
    node.set_handler("GET", body_handler("get"));

    EXPECT_EQ(node.find_handler("get"), nullptr);
    EXPECT_EQ(node.find_handler(""), nullptr);
}

TEST(RouteNodeTest, DefaultFallbacks) {
    RouteNode node;
    EXPECT_EQ(&node.not_found_handler(), &not_found_handler());
    EXPECT_EQ(&node.method_not_allowed_handler(), &method_not_allowed_handler());
}

TEST(RouteNodeTest, ChildrenCopyFallbacksAtCreation) {
    RouteNode node;
    auto& before = node.add_child("before");

    node.set_not_found_handler(body_handler("custom 404"));
    node.set_method_not_allowed_handler(body_handler("custom 405"));
    auto& after = node.add_child("after");
    auto& wildcard = node.add_child("*");

    EXPECT_EQ(run(node.not_found_handler()), "custom 404");
    EXPECT_EQ(run(after.not_found_handler()), "custom 404");
    EXPECT_EQ(run(after.method_not_allowed_handler()), "custom 405");
    EXPECT_EQ(run(wildcard.not_found_handler()), "custom 404");

    EXPECT_EQ(&before.not_found_handler(), &not_found_handler());
    EXPECT_EQ(&before.method_not_allowed_handler(), &method_not_allowed_handler());
}

TEST(RouteNodeTest, ParentOverrideChangesDoNotPropagate) {
    RouteNode node;
    node.set_not_found_handler(body_handler("first"));
    auto& child = node.add_child("child");

    node.set_not_found_handler(body_handler("second"));

    EXPECT_EQ(run(node.not_found_handler()), "second");
    EXPECT_EQ(run(child.not_found_handler()), "first");
}

} // namespace segmux::core
