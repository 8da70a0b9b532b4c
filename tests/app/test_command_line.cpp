#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "app/CommandLine.hpp"
#include "translation/LanguageTranslation.hpp"
#include "tts/TextToSpeech.hpp"
#include "../utils/mock_http.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace langcloud;
using namespace langcloud::app;
using Catch::Matchers::ContainsSubstring;
using test_utils::MockResponses;
using test_utils::MockTransport;

namespace {

struct Fixture {
    std::shared_ptr<MockTransport> transport = std::make_shared<MockTransport>();
    translation::LanguageTranslation translation{ transport };
    tts::TextToSpeech speech{ transport };
    std::ostringstream out;
    std::ostringstream err;

    Fixture() {
        translation.setEndPoint("http://lt.test");
        speech.setEndPoint("http://tts.test");
    }

    int run(const std::vector<std::string>& args) {
        return run_command(parse_command_line(args), { translation, speech }, out, err);
    }
};

}  // namespace

TEST_CASE("parse_command_line - accepted forms", "[app][cli]") {
    auto cmd = parse_command_line({ "--config", "my.toml", "translate", "hello", "--source", "en", "--target", "es" });
    REQUIRE(cmd.config_path == "my.toml");
    REQUIRE(cmd.command == "translate");
    REQUIRE(cmd.positional == std::vector<std::string>{ "hello" });
    REQUIRE(cmd.options.at("source") == "en");
    REQUIRE(cmd.options.at("target") == "es");
    REQUIRE(cmd.options.count("config") == 0);

    REQUIRE(parse_command_line({ "models" }).config_path == "config.toml");
}

TEST_CASE("parse_command_line - usage errors", "[app][cli]") {
    REQUIRE_THROWS_AS(parse_command_line({}), UsageError);
    REQUIRE_THROWS_AS(parse_command_line({ "frobnicate" }), UsageError);
    REQUIRE_THROWS_AS(parse_command_line({ "identify" }), UsageError);
    REQUIRE_THROWS_AS(parse_command_line({ "models", "extra" }), UsageError);
    REQUIRE_THROWS_WITH(parse_command_line({ "voices", "--config" }), ContainsSubstring("--config"));
}

TEST_CASE("parse_command_line - options must belong to the command", "[app][cli]") {
    REQUIRE_THROWS_WITH(parse_command_line({ "identify", "hi", "--modle", "x" }), ContainsSubstring("--modle"));
    REQUIRE_THROWS_AS(parse_command_line({ "translate", "hi", "--model", "en-es", "--out", "f" }), UsageError);
    REQUIRE_THROWS_AS(parse_command_line({ "voices", "--voice", "x" }), UsageError);

    REQUIRE_NOTHROW(parse_command_line({ "synthesize", "hi", "--out", "a.ogg", "--voice", "v", "--format", "ogg" }));
    REQUIRE_NOTHROW(parse_command_line({ "create-model", "--base", "en-fr", "--name", "n", "--glossary", "g",
                                         "--monolingual", "m", "--parallel", "p" }));
    REQUIRE_NOTHROW(parse_command_line({ "--config", "c.toml", "languages" }));
}

TEST_CASE("run_command - translation commands", "[app][cli]") {
    Fixture f;

    SECTION("help") {
        REQUIRE(f.run({ "help" }) == 0);
        REQUIRE_THAT(f.out.str(), ContainsSubstring("usage: langcloud-cli"));
        REQUIRE(f.transport->requestCount() == 0);
    }

    SECTION("translate by language pair") {
        f.transport->setResponse("http://lt.test/v2/translate", MockResponses::translate_success("hola"));
        REQUIRE(f.run({ "translate", "hello", "--source", "en", "--target", "es" }) == 0);
        auto printed = nlohmann::json::parse(f.out.str());
        REQUIRE(printed["translations"][0]["translation"].get<std::string>() == "hola");

        auto body = nlohmann::json::parse(f.transport->lastRequest().body);
        REQUIRE(body["source"].get<std::string>() == "en");
        REQUIRE(body["target"].get<std::string>() == "es");
    }

    SECTION("translate by model") {
        f.transport->setResponse("http://lt.test/v2/translate", MockResponses::translate_success("hola"));
        REQUIRE(f.run({ "translate", "hello", "--model", "en-es" }) == 0);
        auto body = nlohmann::json::parse(f.transport->lastRequest().body);
        REQUIRE(body["model_id"].get<std::string>() == "en-es");
        REQUIRE_FALSE(body.contains("source"));
    }

    SECTION("translate without a model or languages") {
        REQUIRE(f.run({ "translate", "hello" }) == 2);
        REQUIRE_THAT(f.err.str(), ContainsSubstring("--source"));
        REQUIRE(f.transport->requestCount() == 0);
    }

    SECTION("unsupported language code") {
        REQUIRE(f.run({ "translate", "hello", "--source", "xx", "--target", "es" }) == 2);
    }

    SECTION("models with filters") {
        f.transport->setResponse("http://lt.test/v2/models", MockResponses::models_list());
        REQUIRE(f.run({ "models", "--default", "true", "--target", "es" }) == 0);
        auto req = f.transport->lastRequest();
        REQUIRE(req.queryValue("default") == std::optional<std::string>("true"));
        REQUIRE(req.queryValue("target") == std::optional<std::string>("es"));
        REQUIRE_FALSE(req.queryValue("source").has_value());
        REQUIRE(nlohmann::json::parse(f.out.str()).size() == 2);
    }

    SECTION("bad boolean filter") {
        REQUIRE(f.run({ "models", "--default", "yes" }) == 2);
    }

    SECTION("delete-model") {
        f.transport->setResponse("http://lt.test/v2/models/custom-1", MockResponses::no_content());
        REQUIRE(f.run({ "delete-model", "custom-1" }) == 0);
        REQUIRE(f.transport->lastRequest().method == http::Method::Delete);
        REQUIRE_THAT(f.out.str(), ContainsSubstring("deleted custom-1"));
    }

    SECTION("service failures exit with 1") {
        REQUIRE(f.run({ "model", "missing" }) == 1);
        REQUIRE_THAT(f.err.str(), ContainsSubstring("Model not found"));
    }

    SECTION("transport failures exit with 1") {
        f.transport->simulateNetworkError("Could not resolve host");
        REQUIRE(f.run({ "languages" }) == 1);
        REQUIRE_THAT(f.err.str(), ContainsSubstring("Network error"));
    }

    SECTION("create-model requires a base model") {
        REQUIRE(f.run({ "create-model", "--name", "mine" }) == 2);
        REQUIRE(f.transport->requestCount() == 0);
    }
}

TEST_CASE("run_command - speech commands", "[app][cli]") {
    Fixture f;

    SECTION("voices") {
        f.transport->setResponse("http://tts.test/v1/voices", MockResponses::voices_list());
        REQUIRE(f.run({ "voices" }) == 0);
        auto printed = nlohmann::json::parse(f.out.str());
        REQUIRE(printed[1]["name"].get<std::string>() == "es-ES_LauraVoice");
    }

    SECTION("synthesize writes the audio file") {
        const auto path = std::filesystem::temp_directory_path() / "langcloud_cli_test.flac";
        f.transport->setResponse("http://tts.test/v1/synthesize", MockResponses::audio("audio/flac", "fLaC1234"));

        REQUIRE(f.run({ "synthesize", "hi", "--out", path.string(), "--format", "flac" }) == 0);
        REQUIRE(f.transport->lastRequest().queryValue("accept") == std::optional<std::string>("audio/flac"));

        std::ifstream in(path, std::ios::binary);
        std::string written((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        REQUIRE(written == "fLaC1234");
        in.close();
        std::filesystem::remove(path);
    }

    SECTION("synthesize rejects unknown formats") {
        REQUIRE(f.run({ "synthesize", "hi", "--out", "x.mp3", "--format", "mp3" }) == 2);
        REQUIRE(f.transport->requestCount() == 0);
    }

    SECTION("synthesize requires an output path") {
        REQUIRE(f.run({ "synthesize", "hi" }) == 2);
    }
}
