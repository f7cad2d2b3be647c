#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

#include "arxml/document/errors.hpp"
#include "arxml/document/query.hpp"

using namespace arxml::document;
using ::testing::ElementsAre;

namespace {
auto ids(const NodeList& nodes) -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const Node* node : nodes) {
        const char* id = node->Attribute("id");
        result.emplace_back(id != nullptr ? id : node->Name());
    }
    return result;
}
}  // namespace

class TreeQueryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::off);
        document = Document::parse(
            "<AUTOSAR id=\"root\">"
            "  <AR-PACKAGES id=\"pkgs\">"
            "    <AR-PACKAGE id=\"p1\">"
            "      <SHORT-NAME id=\"n1\">Com</SHORT-NAME>"
            "      <ELEMENTS id=\"e1\">"
            "        <ECUC-MODULE-CONFIGURATION-VALUES id=\"m1\" version=\"1\">"
            "          <SHORT-NAME id=\"n2\">ComConfig</SHORT-NAME>"
            "        </ECUC-MODULE-CONFIGURATION-VALUES>"
            "      </ELEMENTS>"
            "    </AR-PACKAGE>"
            "    <AR-PACKAGE id=\"p2\">"
            "      <SHORT-NAME id=\"n3\">PduR</SHORT-NAME>"
            "      <ELEMENTS id=\"e2\">"
            "        <ECUC-MODULE-CONFIGURATION-VALUES id=\"m2\" version=\"1.0\"/>"
            "        <ECUC-MODULE-CONFIGURATION-VALUES id=\"m3\" version=\"1\"/>"
            "      </ELEMENTS>"
            "    </AR-PACKAGE>"
            "  </AR-PACKAGES>"
            "</AUTOSAR>");
    }

    std::unique_ptr<Document> document;
    TreeQueryEngine engine;
};

TEST_F(TreeQueryEngineTest, FindByTagReturnsAllDepthsInDocumentOrder) {
    EXPECT_THAT(ids(engine.findByTag(*document, "SHORT-NAME")),
                ElementsAre("n1", "n2", "n3"));
    EXPECT_THAT(
        ids(engine.findByTag(*document, "ECUC-MODULE-CONFIGURATION-VALUES")),
        ElementsAre("m1", "m2", "m3"));
}

TEST_F(TreeQueryEngineTest, FindByTagIncludesRoot) {
    EXPECT_THAT(ids(engine.findByTag(*document, "AUTOSAR")),
                ElementsAre("root"));
}

TEST_F(TreeQueryEngineTest, FindByTagIsExact) {
    EXPECT_TRUE(engine.findByTag(*document, "SHORT").empty());
    EXPECT_TRUE(engine.findByTag(*document, "short-name").empty());
    EXPECT_TRUE(engine.findByTag(*document, "").empty());
}

TEST_F(TreeQueryEngineTest, FindByTagFindsNestedSameTag) {
    auto nested = Document::parse(
        "<A id=\"a1\"><B id=\"b1\"/><A id=\"a2\"><B id=\"b2\"/></A></A>");
    EXPECT_THAT(ids(engine.findByTag(*nested, "B")), ElementsAre("b1", "b2"));
    EXPECT_THAT(ids(engine.findByTag(*nested, "A")), ElementsAre("a1", "a2"));
}

TEST_F(TreeQueryEngineTest, FindByTagUsesStoredPrefix) {
    auto prefixed = Document::parse(
        "<ar:AUTOSAR xmlns:ar=\"urn:x\"><ar:ITEM id=\"i1\"/><ITEM id=\"i2\"/>"
        "</ar:AUTOSAR>");
    EXPECT_THAT(ids(engine.findByTag(*prefixed, "ar:ITEM")),
                ElementsAre("i1"));
    EXPECT_THAT(ids(engine.findByTag(*prefixed, "ITEM")), ElementsAre("i2"));
}

TEST_F(TreeQueryEngineTest, FindByAttributeIsExactStringMatch) {
    EXPECT_THAT(ids(engine.findByAttribute(*document, "version", "1")),
                ElementsAre("m1", "m3"));
    EXPECT_THAT(ids(engine.findByAttribute(*document, "version", "1.0")),
                ElementsAre("m2"));
    EXPECT_TRUE(engine.findByAttribute(*document, "version", "01").empty());
    EXPECT_TRUE(engine.findByAttribute(*document, "Version", "1").empty());
    EXPECT_TRUE(engine.findByAttribute(*document, "missing", "1").empty());
}

TEST_F(TreeQueryEngineTest, FindByAttributeNeverCoercesNumbers) {
    auto numbers = Document::parse(
        "<R><X id=\"42\"/><X id=\"042\"/><X id=\"42.0\"/><X id=\" 42\"/></R>");
    const auto matches = engine.findByAttribute(*numbers, "id", "42");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_STREQ(matches[0]->Attribute("id"), "42");
}

TEST_F(TreeQueryEngineTest, FindByAttributeMatchesEmptyValue) {
    auto empty = Document::parse("<R><X flag=\"\"/><X/></R>");
    EXPECT_EQ(engine.findByAttribute(*empty, "flag", "").size(), 1u);
}

TEST_F(TreeQueryEngineTest, FindByPathChildSteps) {
    EXPECT_THAT(ids(engine.findByPath(*document, "AR-PACKAGES/AR-PACKAGE")),
                ElementsAre("p1", "p2"));
    EXPECT_THAT(
        ids(engine.findByPath(*document, "./AR-PACKAGES/AR-PACKAGE/SHORT-NAME")),
        ElementsAre("n1", "n3"));
    EXPECT_TRUE(engine.findByPath(*document, "AR-PACKAGE").empty());
}

TEST_F(TreeQueryEngineTest, FindByPathDescendantSteps) {
    EXPECT_THAT(ids(engine.findByPath(*document, ".//SHORT-NAME")),
                ElementsAre("n1", "n2", "n3"));
    EXPECT_THAT(ids(engine.findByPath(*document, "AR-PACKAGES//ELEMENTS/*")),
                ElementsAre("m1", "m2", "m3"));
    EXPECT_THAT(
        ids(engine.findByPath(*document,
                              ".//ECUC-MODULE-CONFIGURATION-VALUES/SHORT-NAME")),
        ElementsAre("n2"));
}

TEST_F(TreeQueryEngineTest, FindByPathDescendantExcludesRootButAnywhereIncludesIt) {
    EXPECT_TRUE(engine.findByPath(*document, ".//AUTOSAR").empty());
    EXPECT_THAT(ids(engine.findByPath(*document, "//AUTOSAR")),
                ElementsAre("root"));
    EXPECT_THAT(ids(engine.findByPath(*document, "//SHORT-NAME")),
                ElementsAre("n1", "n2", "n3"));
}

TEST_F(TreeQueryEngineTest, FindByPathAbsolute) {
    EXPECT_THAT(ids(engine.findByPath(*document, "/AUTOSAR/AR-PACKAGES")),
                ElementsAre("pkgs"));
    EXPECT_TRUE(engine.findByPath(*document, "/AR-PACKAGES").empty());
}

TEST_F(TreeQueryEngineTest, FindByPathWildcardAndDot) {
    EXPECT_THAT(ids(engine.findByPath(*document, "*")), ElementsAre("pkgs"));
    EXPECT_THAT(ids(engine.findByPath(*document, "AR-PACKAGES/*/SHORT-NAME")),
                ElementsAre("n1", "n3"));
    EXPECT_THAT(ids(engine.findByPath(*document, ".")), ElementsAre("root"));
}

TEST_F(TreeQueryEngineTest, FindByPathHasNoDuplicates) {
    auto nested = Document::parse(
        "<R id=\"r\"><A id=\"a1\"><A id=\"a2\"><B id=\"b1\"/></A></A></R>");
    EXPECT_THAT(ids(engine.findByPath(*nested, "//A//B")), ElementsAre("b1"));
    EXPECT_THAT(ids(engine.findByPath(*nested, "//*")),
                ElementsAre("r", "a1", "a2", "b1"));
}

TEST_F(TreeQueryEngineTest, FindByPathRejectsUnsupportedSyntax) {
    EXPECT_THROW(engine.findByPath(*document, "AR-PACKAGE[@id='p1']"),
                 InvalidQueryError);
    EXPECT_THROW(engine.findByPath(*document, "../AUTOSAR"), InvalidQueryError);
    EXPECT_THROW(engine.findByPath(*document, ""), InvalidQueryError);
}
