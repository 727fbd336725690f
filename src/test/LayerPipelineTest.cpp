#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/LayerPipeline.hpp"
#include "application/ParameterParser.hpp"

using namespace dobdecoder::domain;
using namespace dobdecoder::application;

namespace {

std::vector<ImageLayers> BuildOk(const std::string& traits, const std::string& schema) {
    auto parameters = ParameterParser::ParseParameters({traits, schema});
    assert(parameters.ok() && "Parameters should parse.");
    auto layers = LayerPipeline::BuildLayers(parameters.value());
    assert(layers.ok() && "Pipeline should succeed.");
    return layers.value();
}

DecodeError BuildFailure(const std::string& traits, const std::string& schema) {
    auto parameters = ParameterParser::ParseParameters({traits, schema});
    assert(parameters.ok() && "Parameters should parse.");
    auto layers = LayerPipeline::BuildLayers(parameters.value());
    assert(!layers.ok() && "Pipeline was expected to fail.");
    return layers.error();
}

SchemaEntry Entry(const std::string& name) {
    return SchemaEntry{name, ImageKind::URI, "T", MatchPattern::Raw, std::nullopt};
}

void TestSelectsMatchingColour() {
    auto images = BuildOk(
        "[{\"name\":\"Name\",\"traits\":[{\"String\":\"Ethan\"}]}]",
        "[[\"0\",\"color\",\"Name\",\"options\",[[\"Alice\",\"#0000FF\"],[\"Ethan\",\"#FF0000\"],[[\"*\"],\"#FFFFFF\"]]]]");

    assert(images.size() == 1);
    assert(images[0].name == "0");
    assert(images[0].items.size() == 1);
    assert(images[0].items[0].tag == ItemTag::ColorCode);
    assert(images[0].items[0].payload == "#FF0000");
}

void TestUnmatchedValueYieldsEmptyImage() {
    auto images = BuildOk(
        "[{\"name\":\"Name\",\"traits\":[{\"String\":\"Zed\"}]}]",
        "[[\"0\",\"color\",\"Name\",\"options\",[[\"Alice\",\"#0000FF\"],[\"Ethan\",\"#FF0000\"]]]]");

    assert(images.size() == 1);
    assert(images[0].name == "0");
    assert(images[0].items.empty());
}

void TestMissingTraitTruncatesGroup() {
    auto images = BuildOk(
        "[{\"name\":\"Avatar\",\"traits\":[{\"String\":\"btcfs://avatar\"}]}]",
        "[[\"1\",\"uri\",\"Avatar\",\"raw\"],"
        "[\"1\",\"color\",\"Mood\",\"options\",[[[\"*\"],\"#000000\"]]],"
        "[\"1\",\"uri\",\"Avatar\",\"raw\"]]");

    assert(images.size() == 1);
    assert(images[0].name == "1");
    assert(images[0].items.size() == 1);
    assert(images[0].items[0].tag == ItemTag::URI);
    assert(images[0].items[0].payload == "btcfs://avatar");
}

void TestMissingFirstTraitGivesEmptyList() {
    auto images = BuildOk(
        "[{\"name\":\"Age\",\"traits\":[{\"Number\":3}]}]",
        "[[\"0\",\"color\",\"Name\",\"options\",[[[\"*\"],\"#FFFFFF\"]]],"
        "[\"0\",\"uri\",\"Age\",\"range\",[[[0,9],\"btcfs://young\"]]],"
        "[\"1\",\"uri\",\"Age\",\"range\",[[[0,9],\"btcfs://young\"]]]]");

    assert(images.size() == 2);
    assert(images[0].name == "0" && images[0].items.empty());
    assert(images[1].name == "1" && images[1].items.size() == 1);
}

void TestTraitWithoutValuesTruncates() {
    auto images = BuildOk(
        "[{\"name\":\"Name\",\"traits\":[]}]",
        "[[\"0\",\"color\",\"Name\",\"options\",[[[\"*\"],\"#FFFFFF\"]]]]");
    assert(images.size() == 1 && images[0].items.empty());
}

void TestStacksLayersInOrder() {
    const std::string traits =
        "[{\"name\":\"Name\",\"traits\":[{\"String\":\"Ethan\"}]},{\"name\":\"Age\",\"traits\":[{\"Number\":23}]},"
        "{\"name\":\"Score\",\"traits\":[{\"Number\":136}]},{\"name\":\"Value\",\"traits\":[{\"Number\":13417386}]}]";
    const std::string schema =
        "[[\"0\",\"color\",\"Name\",\"options\",[[\"Alice\",\"#0000FF\"],[\"Bob\",\"#00FF00\"],[\"Ethan\",\"#FF0000\"],[[\"*\"],\"#FFFFFF\"]]],"
        "[\"0\",\"uri\",\"Age\",\"range\",[[[0,50],\"btcfs://age-low\"],[[51,100],\"btcfs://age-high\"],[[\"*\"],\"btcfs://age-any\"]]],"
        "[\"0\",\"uri\",\"Score\",\"range\",[[[0,1000],\"btcfs://score-low\"],[[\"*\"],\"btcfs://score-any\"]]],"
        "[\"1\",\"uri\",\"Value\",\"range\",[[[0,100000],\"btcfs://value-low\"],[[\"*\"],\"btcfs://value-any\"]]]]";

    auto images = BuildOk(traits, schema);
    assert(images.size() == 2);

    const auto& first = images[0];
    assert(first.name == "0");
    assert(first.items.size() == 3);
    assert(first.items[0] == (EncodedItem{ItemTag::ColorCode, "#FF0000"}));
    assert(first.items[1] == (EncodedItem{ItemTag::URI, "btcfs://age-low"}));
    assert(first.items[2] == (EncodedItem{ItemTag::URI, "btcfs://score-low"}));

    const auto& second = images[1];
    assert(second.name == "1");
    assert(second.items.size() == 1);
    assert(second.items[0] == (EncodedItem{ItemTag::URI, "btcfs://value-any"}));
}

void TestNonAdjacentNamesFormSeparateGroups() {
    auto images = BuildOk(
        "[{\"name\":\"Link\",\"traits\":[{\"String\":\"btcfs://x\"}]}]",
        "[[\"a\",\"uri\",\"Link\",\"raw\"],[\"b\",\"uri\",\"Link\",\"raw\"],[\"a\",\"uri\",\"Link\",\"raw\"]]");

    assert(images.size() == 3);
    assert(images[0].name == "a" && images[1].name == "b" && images[2].name == "a");
    for (const auto& image : images) {
        assert(image.items.size() == 1);
    }
}

void TestGroupByImage() {
    assert(LayerPipeline::GroupByImage({}).empty());

    std::vector<SchemaEntry> schema = {Entry("x"), Entry("x"), Entry("y"), Entry("x")};
    auto runs = LayerPipeline::GroupByImage(schema);
    assert(runs.size() == 3);
    assert((runs[0] == std::pair<size_t, size_t>(0, 2)));
    assert((runs[1] == std::pair<size_t, size_t>(2, 3)));
    assert((runs[2] == std::pair<size_t, size_t>(3, 4)));
}

void TestMatchErrorsAbortWholeRun() {
    // Image "0" would succeed, but the raw layer of image "1" sees a number.
    assert(BuildFailure(
        "[{\"name\":\"Name\",\"traits\":[{\"String\":\"Ethan\"}]},{\"name\":\"Age\",\"traits\":[{\"Number\":3}]}]",
        "[[\"0\",\"color\",\"Name\",\"options\",[[[\"*\"],\"#FFFFFF\"]]],[\"1\",\"uri\",\"Age\",\"raw\"]]")
        == DecodeError::DecodeInvalidRawValue);

    assert(BuildFailure(
        "[{\"name\":\"Name\",\"traits\":[{\"String\":\"Ethan\"}]}]",
        "[[\"0\",\"color\",\"Name\",\"options\"]]")
        == DecodeError::DecodeInvalidOptionArgs);

    assert(BuildFailure(
        "[{\"name\":\"Age\",\"traits\":[{\"Number\":30}]}]",
        "[[\"0\",\"color\",\"Age\",\"options\",[[\"thirty\",\"#333333\"]]]]")
        == DecodeError::SchemaInvalidParsedTraitType);
}

void TestErrorsAfterTruncationAreNotReached() {
    // The missing trait stops group "0" before the misconfigured entry runs.
    auto images = BuildOk(
        "[{\"name\":\"Age\",\"traits\":[{\"Number\":3}]}]",
        "[[\"0\",\"color\",\"Missing\",\"options\",[]],[\"0\",\"uri\",\"Age\",\"raw\"]]");
    assert(images.size() == 1 && images[0].items.empty());
}

} // namespace

int main() {
    std::cout << "[Test] Starting LayerPipeline Test..." << std::endl;

    TestSelectsMatchingColour();
    TestUnmatchedValueYieldsEmptyImage();
    TestMissingTraitTruncatesGroup();
    TestMissingFirstTraitGivesEmptyList();
    TestTraitWithoutValuesTruncates();
    TestStacksLayersInOrder();
    TestNonAdjacentNamesFormSeparateGroups();
    TestGroupByImage();
    TestMatchErrorsAbortWholeRun();
    TestErrorsAfterTruncationAreNotReached();

    std::cout << "[PASS] LayerPipeline Test." << std::endl;
    return 0;
}
