#include <catch2/catch_test_macros.hpp>
#include "http/RequestBuilder.hpp"
#include "http/MultipartForm.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace langcloud::http;

TEST_CASE("RequestBuilder - method and path", "[http][builder]") {
    REQUIRE(RequestBuilder::get("/a").build().method == Method::Get);
    REQUIRE(RequestBuilder::post("/a").build().method == Method::Post);
    REQUIRE(RequestBuilder::put("/a").build().method == Method::Put);
    REQUIRE(RequestBuilder::del("/a").build().method == Method::Delete);
    REQUIRE(std::string(method_name(Method::Delete)) == "DELETE");

    auto req = RequestBuilder::get("/v2/models").build();
    REQUIRE(req.url == "/v2/models");
    REQUIRE(req.body_kind == HttpRequest::BodyKind::None);
}

TEST_CASE("RequestBuilder - query parameters", "[http][builder]") {
    auto req = RequestBuilder::get("http://host/v2/models")
                   .withQuery("source", "en")
                   .withQuery("default", true)
                   .withQuery("name", std::string("my model&co"))
                   .build();

    REQUIRE(req.query.size() == 3);
    REQUIRE(req.queryValue("default") == std::optional<std::string>("true"));
    REQUIRE(req.fullUrl() == "http://host/v2/models?source=en&default=true&name=my%20model%26co");

    SECTION("A URL without query stays untouched") {
        REQUIRE(RequestBuilder::get("http://host/x").build().fullUrl() == "http://host/x");
    }
}

TEST_CASE("RequestBuilder - headers", "[http][builder]") {
    auto req = RequestBuilder::post("/x")
                   .withHeader("Accept", "text/plain")
                   .withHeader("accept", "application/json")
                   .build();

    REQUIRE(req.headers.size() == 1);
    REQUIRE(req.headerValue("ACCEPT") == std::optional<std::string>("application/json"));
    REQUIRE_FALSE(req.headerValue("Content-Type").has_value());
}

TEST_CASE("RequestBuilder - bodies", "[http][builder]") {
    SECTION("Raw content") {
        auto req = RequestBuilder::post("/x").withBodyContent("hello", "text/plain").build();
        REQUIRE(req.body_kind == HttpRequest::BodyKind::Content);
        REQUIRE(req.body == "hello");
        REQUIRE(req.content_type == "text/plain");
    }

    SECTION("JSON") {
        auto req = RequestBuilder::post("/x").withBodyJson({ { "text", { "a" } } }).build();
        REQUIRE(req.content_type == "application/json");
        REQUIRE(nlohmann::json::parse(req.body)["text"][0].get<std::string>() == "a");
    }

    SECTION("Multipart") {
        MultipartForm form;
        form.addData("parallel_corpus", "corpus.tmx", "data", "application/octet-stream");
        form.addField("note", "value");
        auto req = RequestBuilder::post("/x").withForm(std::move(form)).build();
        REQUIRE(req.body_kind == HttpRequest::BodyKind::Multipart);
        REQUIRE(req.form.parts().size() == 2);
        REQUIRE(req.form.find("note")->filename.empty());
        REQUIRE(req.form.find("parallel_corpus")->filename == "corpus.tmx");
    }
}

TEST_CASE("MultipartForm - files", "[http][multipart]") {
    const auto path = std::filesystem::temp_directory_path() / "langcloud_multipart.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out.write("\x00\x01\x02", 3);
    }

    MultipartForm form;
    form.addFile("forced_glossary", path, "application/octet-stream");
    const auto* part = form.find("forced_glossary");
    REQUIRE(part != nullptr);
    REQUIRE(part->filename == "langcloud_multipart.bin");
    REQUIRE(part->data.size() == 3);
    REQUIRE(part->data[2] == '\x02');

    std::filesystem::remove(path);
    REQUIRE_THROWS_AS(form.addFile("x", path, "application/octet-stream"), std::invalid_argument);
    REQUIRE(form.parts().size() == 1);
}

TEST_CASE("format_path and url_escape", "[http][builder]") {
    REQUIRE(format_path("/v2/models/{}", "en-es") == "/v2/models/en-es");
    REQUIRE(format_path("/v1/voices/{}", "a b/c") == "/v1/voices/a%20b%2Fc");
    REQUIRE(url_escape("audio/ogg; codecs=opus") == "audio%2Fogg%3B%20codecs%3Dopus");
    REQUIRE(url_escape("~-_.") == "~-_.");
    REQUIRE(iequals("Content-Type", "content-type"));
    REQUIRE_FALSE(iequals("Accept", "Accepts"));
}
