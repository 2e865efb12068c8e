#include <drogon/drogon_test.h>
#include <drogon/drogon.h>
#include "test_support.hpp"

using namespace drogon;
using namespace atelier::test_support;

namespace {

struct Reply {
    HttpStatusCode status = k500InternalServerError;
    Json::Value json;
};

Reply call(HttpMethod method, const std::string& path, const std::string& token = "",
           const Json::Value* body = nullptr) {
    static auto client = HttpClient::newHttpClient("http://127.0.0.1:" + std::to_string(kTestPort));
    auto req = body ? HttpRequest::newHttpJsonRequest(*body) : HttpRequest::newHttpRequest();
    req->setMethod(method);
    req->setPath(path);
    if (!token.empty()) {
        req->addHeader("Authorization", "Bearer " + token);
    }

    Reply reply;
    auto [result, resp] = client->sendRequest(req, 10.0);
    if (result != ReqResult::Ok || !resp) return reply;
    reply.status = resp->statusCode();
    if (auto json = resp->getJsonObject()) reply.json = *json;
    return reply;
}

Reply call(HttpMethod method, const std::string& path, const std::string& token, const Json::Value& body) {
    return call(method, path, token, &body);
}

std::string login() {
    Json::Value body;
    body["password"] = kAdminPassword;
    return call(Post, "/api/auth/login", "", body).json["token"].asString();
}

Json::Value registerPhoto(const std::string& token, const std::string& blobRef, int width, int height) {
    Json::Value body;
    body["blobRef"] = blobRef;
    body["originalName"] = blobRef.substr(blobRef.find('/') + 1) + ".jpg";
    body["width"] = width;
    body["height"] = height;
    return call(Post, "/api/admin/photos/register", token, body).json;
}

}

DROGON_TEST(LoginAndBearerFilter)
{
    Json::Value wrong;
    wrong["password"] = "guess";
    auto rejected = call(Post, "/api/auth/login", "", wrong);
    CHECK(rejected.status == k401Unauthorized);
    CHECK(rejected.json["error"].isString());

    auto token = login();
    REQUIRE(!token.empty());

    CHECK(call(Get, "/api/admin/photos").status == k401Unauthorized);
    CHECK(call(Get, "/api/admin/photos", "not-a-token").status == k401Unauthorized);
    CHECK(call(Get, "/api/admin/photos", token).status == k200OK);

    // public routes need no token
    CHECK(call(Get, "/api/photos").status == k200OK);
    CHECK(call(Get, "/api/health").status == k200OK);
}

DROGON_TEST(PhotoLifecycleOverHttp)
{
    auto token = login();
    REQUIRE(!token.empty());
    CHECK(call(Delete, "/api/admin/photos", token).status == k200OK);

    // register
    Json::Value missing;
    missing["originalName"] = "x.jpg";
    CHECK(call(Post, "/api/admin/photos/register", token, missing).status == k400BadRequest);

    auto first = registerPhoto(token, "photos/first", 1920, 1080);
    auto second = registerPhoto(token, "photos/second", 1080, 1920);
    auto third = registerPhoto(token, "photos/third", 1000, 1000);
    CHECK(first["orientation"].asString() == "landscape");
    CHECK(second["orientation"].asString() == "portrait");
    CHECK(third["orientation"].asString() == "square");
    CHECK(first["name"].asString() == "first");
    CHECK(first["published"].asBool() == false);
    CHECK(first["url"].asString() == "https://cdn.example.test/photos/first");
    CHECK(first["thumbUrl"].asString() == "https://cdn.example.test/photos/first?width=400&fit=scale-down");
    CHECK(third["order"].asInt() == 2);

    // nothing is public yet
    auto visible = call(Get, "/api/photos");
    REQUIRE(visible.json.isArray());
    CHECK(visible.json.size() == 0);

    // publish a subset in a chosen order
    Json::Value publish;
    publish["ids"].append(third["id"]);
    publish["ids"].append(first["id"]);
    auto published = call(Post, "/api/admin/publish", token, publish);
    CHECK(published.status == k200OK);
    CHECK(published.json["published"].asInt() == 2);

    visible = call(Get, "/api/photos");
    REQUIRE(visible.json.size() == 2);
    CHECK(visible.json[0]["id"] == third["id"]);
    CHECK(visible.json[1]["id"] == first["id"]);
    CHECK(!visible.json[0].isMember("blobRef"));

    // reorder needs a list
    Json::Value badReorder;
    badReorder["ids"] = "nope";
    CHECK(call(Post, "/api/admin/reorder", token, badReorder).status == k400BadRequest);

    Json::Value reorder;
    reorder["ids"].append(second["id"]);
    reorder["ids"].append(first["id"]);
    reorder["ids"].append(third["id"]);
    CHECK(call(Post, "/api/admin/reorder", token, reorder).status == k200OK);
    auto all = call(Get, "/api/admin/photos", token);
    REQUIRE(all.json.size() == 3);
    CHECK(all.json[0]["id"] == second["id"]);
    CHECK(all.json[1]["id"] == first["id"]);
    CHECK(all.json[2]["id"] == third["id"]);

    // partial update
    Json::Value rename;
    rename["name"] = "Quay";
    CHECK(call(Put, "/api/admin/photos/" + first["id"].asString(), token, rename).status == k200OK);
    CHECK(call(Put, "/api/admin/photos/unknown-id", token, rename).status == k404NotFound);
    Json::Value badOrder;
    badOrder["order"] = "first";
    CHECK(call(Put, "/api/admin/photos/" + first["id"].asString(), token, badOrder).status == k400BadRequest);

    all = call(Get, "/api/admin/photos", token);
    bool renamed = false;
    for (const auto& photo : all.json) {
        if (photo["id"] == first["id"]) renamed = photo["name"].asString() == "Quay";
    }
    CHECK(renamed);

    // delete, then delete again
    auto path = "/api/admin/photos/" + second["id"].asString();
    CHECK(call(Delete, path, token).status == k200OK);
    CHECK(call(Delete, path, token).status == k404NotFound);

    auto health = call(Get, "/api/health");
    CHECK(health.json["status"].asString() == "ok");
    CHECK(health.json["photos"].asInt() == 2);

    // upload signing needs the blob store, which the test server does not have
    CHECK(call(Get, "/api/admin/sign", token).status == k503ServiceUnavailable);

    auto cleared = call(Delete, "/api/admin/photos", token);
    CHECK(cleared.status == k200OK);
    CHECK(cleared.json["removed"].asInt() == 2);
    CHECK(call(Get, "/api/health").json["photos"].asInt() == 0);
}

DROGON_TEST(PublishWithoutIdsPublishesAll)
{
    auto token = login();
    REQUIRE(!token.empty());
    CHECK(call(Delete, "/api/admin/photos", token).status == k200OK);

    registerPhoto(token, "photos/one", 800, 600);
    registerPhoto(token, "photos/two", 600, 800);

    Json::Value empty(Json::objectValue);
    auto published = call(Post, "/api/admin/publish", token, empty);
    CHECK(published.json["published"].asInt() == 2);
    CHECK(call(Get, "/api/photos").json.size() == 2);

    CHECK(call(Delete, "/api/admin/photos", token).status == k200OK);
}

DROGON_TEST(PublishWithNonListIdsPublishesAll)
{
    auto token = login();
    REQUIRE(!token.empty());
    CHECK(call(Delete, "/api/admin/photos", token).status == k200OK);

    registerPhoto(token, "photos/one", 800, 600);
    registerPhoto(token, "photos/two", 600, 800);

    Json::Value scalar;
    scalar["ids"] = "photos/one";
    auto published = call(Post, "/api/admin/publish", token, scalar);
    CHECK(published.status == k200OK);
    CHECK(published.json["published"].asInt() == 2);
    CHECK(call(Get, "/api/photos").json.size() == 2);

    CHECK(call(Delete, "/api/admin/photos", token).status == k200OK);
}

DROGON_TEST(RegisterTreatsOutOfRangeSizeAsUnknown)
{
    auto token = login();
    REQUIRE(!token.empty());
    CHECK(call(Delete, "/api/admin/photos", token).status == k200OK);

    Json::Value huge;
    huge["blobRef"] = "photos/huge";
    huge["width"] = 1e300;
    huge["height"] = -5;
    auto reply = call(Post, "/api/admin/photos/register", token, huge);
    CHECK(reply.status == k200OK);
    CHECK(reply.json["width"].asInt() == 0);
    CHECK(reply.json["height"].asInt() == 0);
    CHECK(reply.json["orientation"].asString() == "square");

    Json::Value wide;
    wide["blobRef"] = "photos/wide";
    wide["width"] = static_cast<Json::UInt64>(1) << 40;
    wide["height"] = "1080";
    reply = call(Post, "/api/admin/photos/register", token, wide);
    CHECK(reply.status == k200OK);
    CHECK(reply.json["width"].asInt() == 0);
    CHECK(reply.json["height"].asInt() == 1080);

    CHECK(call(Delete, "/api/admin/photos", token).status == k200OK);
}
