#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/RenderService.hpp"
#include "domain/ItemEncoder.hpp"
#include "infrastructure/Base64.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PassthroughComposer.hpp"

using namespace dobdecoder::domain;
using namespace dobdecoder::application;
using namespace dobdecoder::infrastructure;

// Mock composer recording every call
class RecordingComposer : public ImageComposer {
public:
    std::vector<std::vector<std::uint8_t>> calls;
    bool failing = false;

    std::optional<std::vector<std::uint8_t>> compose(const std::vector<std::uint8_t>& itemBytes) override {
        calls.push_back(itemBytes);
        if (failing) return std::nullopt;
        return std::vector<std::uint8_t>{'P', 'N', 'G'};
    }
};

namespace {

const std::string kTraits =
    "[{\"name\":\"Name\",\"traits\":[{\"String\":\"Ethan\"}]},{\"name\":\"Age\",\"traits\":[{\"Number\":23}]}]";
const std::string kSchema =
    "[[\"0\",\"color\",\"Name\",\"options\",[[\"Alice\",\"#0000FF\"],[\"Ethan\",\"#FF0000\"],[[\"*\"],\"#FFFFFF\"]]],"
    "[\"1\",\"uri\",\"Missing\",\"raw\"]]";

void TestBase64() {
    assert(Base64Encode({}) == "");
    assert(Base64Encode({'f'}) == "Zg==");
    assert(Base64Encode({'f', 'o'}) == "Zm8=");
    assert(Base64Encode({'f', 'o', 'o'}) == "Zm9v");
    assert(Base64Encode({'f', 'o', 'o', 'b', 'a', 'r'}) == "Zm9vYmFy");
    assert(Base64Encode({0xFF, 0xFE}) == "//4=");
}

void TestRenderDocument() {
    auto composer = std::make_shared<RecordingComposer>();
    RenderService service(composer, "image/png;base64");

    auto report = service.render({kTraits, kSchema});
    assert(!report.error);
    assert(report.code == 0);

    // One compose call per image, in group order.
    assert(composer->calls.size() == 2);
    auto first = ItemEncoder::DecodeItemList(composer->calls[0]);
    assert(first && first->size() == 1);
    assert((*first)[0].tag == ItemTag::ColorCode && (*first)[0].payload == "#FF0000");
    auto second = ItemEncoder::DecodeItemList(composer->calls[1]);
    assert(second && second->empty());

    const auto& doc = report.document;
    assert(doc["traits"] == nlohmann::json::parse(kTraits));
    assert(doc["images"].size() == 2);
    assert(doc["images"][0]["name"] == "0");
    assert(doc["images"][0]["type"] == "image/png;base64");
    assert(doc["images"][0]["content"] == "UE5H");
    assert(doc["images"][1]["name"] == "1");
}

void TestRenderReportsDecodeErrors() {
    auto composer = std::make_shared<RecordingComposer>();
    RenderService service(composer, "image/png;base64");

    auto badCount = service.render({kTraits});
    assert(badCount.error && *badCount.error == DecodeError::ParseInvalidArgCount);
    assert(badCount.code == 1);

    auto badSchema = service.render({kTraits, "[[\"0\",\"image\",\"Name\",\"options\"]]"});
    assert(badSchema.code == ErrorCode(DecodeError::SchemaPatternMismatch));
    assert(badSchema.code == 10);

    auto rawNumber = service.render({kTraits, "[[\"0\",\"uri\",\"Age\",\"raw\"]]"});
    assert(rawNumber.code == ErrorCode(DecodeError::DecodeInvalidRawValue));
    assert(rawNumber.document.is_null());

    assert(composer->calls.empty());
}

void TestComposeFailure() {
    auto composer = std::make_shared<RecordingComposer>();
    composer->failing = true;
    RenderService service(composer, "image/png;base64");

    auto report = service.render({kTraits, kSchema});
    assert(report.error && *report.error == DecodeError::ComposeFailed);
    assert(report.code == 18);
    assert(composer->calls.size() == 1);
}

void TestPassthroughComposer() {
    PassthroughComposer composer;
    ItemList items = {ItemEncoder::Wrap(ImageKind::URI, "btcfs://a")};
    auto bytes = ItemEncoder::EncodeItemList(items);

    auto composed = composer.compose(bytes);
    assert(composed && *composed == bytes);
    assert(!composer.compose({0x01, 0x02}));

    RenderService service(std::make_shared<PassthroughComposer>(), "application/octet-stream;base64");
    auto report = service.render({kTraits, kSchema});
    assert(report.code == 0);
    const auto expected = ItemEncoder::EncodeItemList({ItemEncoder::Wrap(ImageKind::ColorCode, "#FF0000")});
    assert(report.document["images"][0]["content"] == Base64Encode(expected));
    assert(report.document["images"][1]["content"] == "BAAAAA==");
}

void TestConfigLoader() {
    const std::string testRoot = "test_config_root";
    std::filesystem::remove_all(testRoot);

    // Missing directory and file: defaults.
    DecoderSettings defaults = ConfigLoader::Load(testRoot);
    assert(defaults.imageType == "image/png;base64");
    assert(!defaults.verbose);

    std::filesystem::create_directories(testRoot);
    {
        std::ofstream f(std::filesystem::path(testRoot) / "settings.json");
        f << "{\"image_type\":\"image/svg+xml;base64\",\"verbose\":true,\"owner\":\"ops\"}";
    }
    DecoderSettings loaded = ConfigLoader::Load(testRoot);
    assert(loaded.imageType == "image/svg+xml;base64");
    assert(loaded.verbose);

    loaded.verbose = false;
    assert(ConfigLoader::Save(testRoot, loaded));
    DecoderSettings reloaded = ConfigLoader::Load(testRoot);
    assert(reloaded.imageType == "image/svg+xml;base64");
    assert(!reloaded.verbose);

    // Unrelated keys survive a save.
    std::ifstream in(std::filesystem::path(testRoot) / "settings.json");
    nlohmann::json saved;
    in >> saved;
    assert(saved["owner"] == "ops");
    in.close();

    // Malformed file: defaults, no throw.
    {
        std::ofstream f(std::filesystem::path(testRoot) / "settings.json");
        f << "{ not json";
    }
    DecoderSettings fallback = ConfigLoader::Load(testRoot);
    assert(fallback.imageType == "image/png;base64");

    std::filesystem::remove_all(testRoot);
}

} // namespace

int main() {
    std::cout << "[Test] Starting RenderService Test..." << std::endl;

    TestBase64();
    TestRenderDocument();
    TestRenderReportsDecodeErrors();
    TestComposeFailure();
    TestPassthroughComposer();
    TestConfigLoader();

    std::cout << "[PASS] RenderService Test." << std::endl;
    return 0;
}
